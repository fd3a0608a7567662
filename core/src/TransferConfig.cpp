#include "quickscp/TransferConfig.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace quickscp {

bool validateLocalFile(const std::string& path, std::string& err) {
    if (path.empty()) {
        err = "Local file path is empty";
        return false;
    }
    std::error_code ec;
    const fs::file_status st = fs::status(path, ec);
    if (ec || !fs::exists(st)) {
        err = "Local file does not exist: " + path;
        return false;
    }
    if (!fs::is_regular_file(st)) {
        err = "Local path is not a regular file: " + path;
        return false;
    }
    return true;
}

std::uint16_t parsePort(const std::string& raw, bool& invalid) {
    invalid = false;
    if (raw.empty()) return kDefaultPort;

    std::size_t i = 0;
    if (raw[0] == '+') i = 1;
    if (i >= raw.size()) {
        invalid = true;
        return kDefaultPort;
    }
    unsigned long value = 0;
    for (; i < raw.size(); ++i) {
        const char c = raw[i];
        if (c < '0' || c > '9') {
            invalid = true;
            return kDefaultPort;
        }
        value = value * 10 + static_cast<unsigned long>(c - '0');
        if (value > 65535) {
            invalid = true;
            return kDefaultPort;
        }
    }
    return static_cast<std::uint16_t>(value);
}

std::string defaultRemotePath(const std::string& username,
                              const std::string& localFilePath) {
    const std::string base = fs::path(localFilePath).filename().string();
    return "/home/" + username + "/" + base;
}

bool buildTransferConfig(const RawTransferInput& in,
                         TransferConfig& out,
                         std::string& err,
                         std::vector<std::string>& warnings) {
    if (!validateLocalFile(in.localFilePath, err)) return false;
    if (in.remoteHost.empty()) {
        err = "Remote host is required";
        return false;
    }
    if (in.username.empty()) {
        err = "Username is required";
        return false;
    }

    bool badPort = false;
    const std::uint16_t port = parsePort(in.port, badPort);
    if (badPort) {
        warnings.push_back("Invalid port number '" + in.port +
                           "', using default " + std::to_string(kDefaultPort));
    }

    TransferConfig cfg;
    cfg.localFilePath = in.localFilePath;
    cfg.remoteHost = in.remoteHost;
    cfg.port = port;
    cfg.username = in.username;
    cfg.remotePath = in.remotePath.empty()
                         ? defaultRemotePath(in.username, in.localFilePath)
                         : in.remotePath;
    out = cfg;
    return true;
}

} // namespace quickscp
