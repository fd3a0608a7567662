// Integration test for the real libssh2 backend against a test SSH server.
// The test is skipped (exit code 77) unless the QUICKSCP_IT_* env vars exist.
// It checks the upload status, the progress sequence and completion; the
// remote file content is not read back.
#include "quickscp/Authenticator.hpp"
#include "quickscp/Libssh2ScpSession.hpp"
#include "quickscp/TransferConfig.hpp"
#include "quickscp/Transferer.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr int kSkipExitCode = 77;

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

std::optional<std::string> envValue(const char *key) {
    const char *raw = std::getenv(key);
    if (!raw || !*raw)
        return std::nullopt;
    return std::string(raw);
}

std::string uniqueToken() {
    const auto now =
        std::chrono::steady_clock::now().time_since_epoch().count();
    return std::to_string(static_cast<long long>(now));
}

std::string joinRemotePath(const std::string &base, const std::string &name) {
    if (base.empty())
        return std::string("/") + name;
    if (base.back() == '/')
        return base + name;
    return base + "/" + name;
}

} // namespace

int main() {
    const auto host = envValue("QUICKSCP_IT_HOST");
    const auto user = envValue("QUICKSCP_IT_USER");
    const auto pass = envValue("QUICKSCP_IT_PASS");
    const std::string remoteBase =
        envValue("QUICKSCP_IT_REMOTE_BASE").value_or("/tmp");

    if (!host.has_value() || !user.has_value() || !pass.has_value()) {
        std::cout << "[SKIP] quickscp_libssh2_integration_tests requires env "
                     "vars: QUICKSCP_IT_HOST, QUICKSCP_IT_USER and "
                     "QUICKSCP_IT_PASS\n";
        return kSkipExitCode;
    }

    bool badPort = false;
    const std::uint16_t port =
        quickscp::parsePort(envValue("QUICKSCP_IT_PORT").value_or(""), badPort);
    if (badPort) {
        std::cerr << "[FAIL] QUICKSCP_IT_PORT is invalid\n";
        return EXIT_FAILURE;
    }

    const std::string token = uniqueToken();
    const fs::path localTmpRoot =
        fs::temp_directory_path() / ("quickscp-it-" + token);
    std::error_code ec;
    fs::create_directories(localTmpRoot, ec);
    if (ec) {
        std::cerr << "[FAIL] could not create temp dir: " << ec.message()
                  << "\n";
        return EXIT_FAILURE;
    }
    const fs::path localSrc = localTmpRoot / "payload.bin";
    {
        std::ofstream out(localSrc, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            std::cerr << "[FAIL] could not create source file\n";
            fs::remove_all(localTmpRoot, ec);
            return EXIT_FAILURE;
        }
        for (int i = 0; i < 20000; ++i)
            out.put(static_cast<char>(i % 251));
    }

    TestContext t;
    quickscp::RawTransferInput in;
    in.localFilePath = localSrc.string();
    in.remoteHost = *host;
    in.port = std::to_string(port);
    in.username = *user;
    in.remotePath = joinRemotePath(remoteBase, "quickscp-it-" + token + ".bin");

    quickscp::TransferConfig cfg;
    std::string err;
    std::vector<std::string> warnings;
    t.check(quickscp::buildTransferConfig(in, cfg, err, warnings),
            "config should build: " + err);

    quickscp::Libssh2ScpSession session;
    if (t.failures == 0) {
        err.clear();
        t.check(session.connect(cfg.remoteHost, cfg.port, err),
                "connect should succeed: " + err);
    }
    if (t.failures == 0) {
        // Empty home: key candidates are skipped, password is used.
        quickscp::AuthCallbacks cb;
        cb.askPassword = [&pass](std::string &out) {
            out = *pass;
            return true;
        };
        quickscp::Authenticator auth("", cb);
        err.clear();
        t.check(auth.authenticate(session, cfg, err) ==
                    quickscp::AuthStatus::Authenticated,
                "password authentication should succeed: " + err);
    }
    if (t.failures == 0) {
        std::vector<std::uint64_t> seen;
        bool finished = false;
        quickscp::Transferer xfer;
        err.clear();
        const auto st = xfer.transfer(
            session, cfg, err,
            [&](std::uint64_t done, std::uint64_t) { seen.push_back(done); },
            [&]() { finished = true; });
        t.check(st == quickscp::TransferStatus::Completed,
                "upload should succeed: " + err);
        t.check(seen == std::vector<std::uint64_t>({8192, 16384, 20000}),
                "progress should follow the chunk boundaries");
        t.check(finished, "completion should be signalled");
    }

    session.disconnect();
    fs::remove_all(localTmpRoot, ec);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] quickscp_libssh2_integration_tests\n";
    return EXIT_SUCCESS;
}
