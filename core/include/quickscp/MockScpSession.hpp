// In-memory ScpSession for tests: scripted credentials, recorded channel
// traffic and failure injection on every channel step.
#pragma once
#include "ScpSession.hpp"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace quickscp {

// Channel steps where a failure can be injected.
enum class MockFailPoint {
    None,
    Open,
    Write,      // the Nth write fails (see failOnWrite)
    ShortWrite, // the Nth write accepts one byte less
    SendEof,
    WaitEof,
    Close,
    WaitClosed
};

// What the remote side saw.
struct MockChannelLog {
    bool opened = false;
    std::string remotePath;
    int mode = 0;
    std::uint64_t declaredSize = 0;
    std::vector<std::size_t> writeSizes;
    std::string data;
    std::vector<std::string> ops; // "write", "send_eof", "wait_eof", "close", "wait_closed"
};

class MockScpSession : public ScpSession {
public:
    bool connect(const std::string& host, std::uint16_t port,
                 std::string& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }
    bool isAuthenticated() const override { return authenticated_; }

    AuthStatus authPublicKeyFile(const std::string& username,
                                 const std::string& privateKeyPath,
                                 const std::string& passphrase,
                                 std::string& err) override;
    AuthStatus authPassword(const std::string& username,
                            const std::string& password,
                            std::string& err) override;

    std::unique_ptr<ScpChannel> openScpWrite(const std::string& remotePath,
                                             int mode,
                                             std::uint64_t size,
                                             std::string& err) override;

    // Script: key path -> passphrase the server accepts ("" = unencrypted key).
    void acceptKey(const std::string& keyPath, const std::string& passphrase = {}) {
        acceptedKeys_[keyPath] = passphrase;
    }
    void acceptPassword(const std::string& password) { acceptedPassword_ = password; }
    // Key attempts against this path fail at transport level.
    void breakTransportOnKey(const std::string& keyPath) { brokenKeys_.insert(keyPath); }
    void breakTransportOnPassword() { brokenPassword_ = true; }

    // Called after each accepted write with its 1-based index.
    void onWrite(std::function<void(std::size_t)> hook) { writeHook_ = std::move(hook); }

    void failAt(MockFailPoint p, std::size_t writeIndex = 1) {
        failPoint_ = p;
        failOnWrite_ = writeIndex;
    }

    // "pubkey:<path>", "pubkey+pass:<path>", "password"
    const std::vector<std::string>& authCalls() const { return authCalls_; }
    const MockChannelLog& channelLog() const { return *log_; }
    const std::string& lastHost() const { return host_; }
    std::uint16_t lastPort() const { return port_; }

private:
    bool connected_ = false;
    bool authenticated_ = false;
    std::string host_;
    std::uint16_t port_ = 0;

    std::map<std::string, std::string> acceptedKeys_;
    std::optional<std::string> acceptedPassword_;
    std::set<std::string> brokenKeys_;
    bool brokenPassword_ = false;
    std::vector<std::string> authCalls_;

    MockFailPoint failPoint_ = MockFailPoint::None;
    std::size_t failOnWrite_ = 1;
    std::function<void(std::size_t)> writeHook_;
    std::shared_ptr<MockChannelLog> log_ = std::make_shared<MockChannelLog>();
};

} // namespace quickscp
