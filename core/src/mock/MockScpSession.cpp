#include "quickscp/MockScpSession.hpp"

#include <utility>

namespace quickscp {

class MockScpChannel : public ScpChannel {
public:
    MockScpChannel(std::shared_ptr<MockChannelLog> log,
                   MockFailPoint failPoint,
                   std::size_t failOnWrite,
                   std::function<void(std::size_t)> hook)
        : log_(std::move(log)), failPoint_(failPoint), failOnWrite_(failOnWrite),
          hook_(std::move(hook)) {}

    std::int64_t write(const char* data, std::size_t len, std::string& err) override {
        log_->ops.push_back("write");
        ++writes_;
        if (writes_ == failOnWrite_) {
            if (failPoint_ == MockFailPoint::Write) {
                err = "Mock: write failed";
                return -1;
            }
            if (failPoint_ == MockFailPoint::ShortWrite && len > 0) {
                len -= 1;
            }
        }
        log_->writeSizes.push_back(len);
        log_->data.append(data, len);
        if (hook_) hook_(writes_);
        return static_cast<std::int64_t>(len);
    }

    bool sendEof(std::string& err) override { return step("send_eof", MockFailPoint::SendEof, err); }
    bool waitEof(std::string& err) override { return step("wait_eof", MockFailPoint::WaitEof, err); }
    bool close(std::string& err) override { return step("close", MockFailPoint::Close, err); }
    bool waitClosed(std::string& err) override { return step("wait_closed", MockFailPoint::WaitClosed, err); }

private:
    std::shared_ptr<MockChannelLog> log_;
    MockFailPoint failPoint_;
    std::size_t failOnWrite_;
    std::function<void(std::size_t)> hook_;
    std::size_t writes_ = 0;

    bool step(const char* name, MockFailPoint point, std::string& err) {
        log_->ops.push_back(name);
        if (failPoint_ == point) {
            err = std::string("Mock: ") + name + " failed";
            return false;
        }
        return true;
    }
};

bool MockScpSession::connect(const std::string& host, std::uint16_t port,
                             std::string& err) {
    if (host.empty()) {
        err = "Host is required";
        return false;
    }
    host_ = host;
    port_ = port;
    connected_ = true;
    authenticated_ = false;
    return true;
}

void MockScpSession::disconnect() {
    connected_ = false;
    authenticated_ = false;
}

AuthStatus MockScpSession::authPublicKeyFile(const std::string& username,
                                             const std::string& privateKeyPath,
                                             const std::string& passphrase,
                                             std::string& err) {
    authCalls_.push_back((passphrase.empty() ? "pubkey:" : "pubkey+pass:") + privateKeyPath);
    if (!connected_) {
        err = "Not connected";
        return AuthStatus::TransportError;
    }
    if (brokenKeys_.count(privateKeyPath)) {
        connected_ = false;
        err = "Mock: connection reset during publickey auth";
        return AuthStatus::TransportError;
    }
    auto it = acceptedKeys_.find(privateKeyPath);
    if (username.empty() || it == acceptedKeys_.end() || it->second != passphrase) {
        err = "Mock: publickey rejected";
        return AuthStatus::Rejected;
    }
    authenticated_ = true;
    return AuthStatus::Authenticated;
}

AuthStatus MockScpSession::authPassword(const std::string& username,
                                        const std::string& password,
                                        std::string& err) {
    authCalls_.push_back("password");
    if (!connected_) {
        err = "Not connected";
        return AuthStatus::TransportError;
    }
    if (brokenPassword_) {
        connected_ = false;
        err = "Mock: connection reset during password auth";
        return AuthStatus::TransportError;
    }
    if (username.empty() || !acceptedPassword_ || *acceptedPassword_ != password) {
        err = "Mock: password rejected";
        return AuthStatus::Rejected;
    }
    authenticated_ = true;
    return AuthStatus::Authenticated;
}

std::unique_ptr<ScpChannel> MockScpSession::openScpWrite(const std::string& remotePath,
                                                         int mode,
                                                         std::uint64_t size,
                                                         std::string& err) {
    if (!connected_ || !authenticated_) {
        err = "Not authenticated";
        return nullptr;
    }
    if (failPoint_ == MockFailPoint::Open) {
        err = "Mock: scp_send failed";
        return nullptr;
    }
    *log_ = MockChannelLog{};
    log_->opened = true;
    log_->remotePath = remotePath;
    log_->mode = mode;
    log_->declaredSize = size;
    return std::make_unique<MockScpChannel>(log_, failPoint_, failOnWrite_, writeHook_);
}

} // namespace quickscp
