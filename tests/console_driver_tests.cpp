// Console layer tests: scripted stdin drives TransferDriver against the mock
// session. No framework, run via CTest.
#include "ConsolePrompter.hpp"
#include "TransferDriver.hpp"
#include "TransferProgressBar.hpp"
#include "quickscp/MockScpSession.hpp"

#include <QCoreApplication>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace fs = std::filesystem;

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

struct TempDir {
    fs::path path;

    TempDir() {
        static int counter = 0;
        const auto now =
            std::chrono::steady_clock::now().time_since_epoch().count();
        path = fs::temp_directory_path() /
               ("quickscp-console-" + std::to_string(static_cast<long long>(now)) +
                "-" + std::to_string(++counter));
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

struct FileCloser {
    void operator()(FILE *f) const {
        if (f)
            std::fclose(f);
    }
};

// Writes the answers, one per line, and reopens them for reading.
std::unique_ptr<FILE, FileCloser> scriptedInput(const fs::path &p,
                                                const std::string &lines) {
    {
        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        out << lines;
    }
    return std::unique_ptr<FILE, FileCloser>(std::fopen(p.string().c_str(), "rb"));
}

void writePayload(const fs::path &p, std::size_t size) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    for (std::size_t i = 0; i < size; ++i)
        out.put(static_cast<char>(i % 97));
}

// Outcome plus a snapshot of the mock taken before the driver releases it.
struct Run {
    int exitCode = -1;
    quickscp::ErrorKind kind = quickscp::ErrorKind::None;
    std::string error;
    std::string host;
    std::uint16_t port = 0;
    bool stillConnected = false;
    quickscp::MockChannelLog log;
};

Run runDriver(const TempDir &dir, const std::string &answers,
              std::unique_ptr<quickscp::MockScpSession> session,
              const QString &home) {
    auto input = scriptedInput(dir.path / "answers.txt", answers);
    quickscpapp::ConsolePrompter prompter(input.get());
    const quickscp::MockScpSession *mock = session.get();
    quickscpapp::TransferDriver driver(prompter, std::move(session), home);
    Run r;
    r.exitCode = driver.run();
    r.kind = driver.lastErrorKind();
    r.error = driver.lastError().toStdString();
    r.host = mock->lastHost();
    r.port = mock->lastPort();
    r.stillConnected = mock->isConnected();
    r.log = mock->channelLog();
    return r;
}

void test_password_upload_with_defaults(TestContext &t) {
    TempDir dir;
    const fs::path local = dir.path / "report.pdf";
    writePayload(local, 20000);

    auto session = std::make_unique<quickscp::MockScpSession>();
    session->acceptPassword("pw");

    // local, host, port (empty), username, remote path (empty), password
    const std::string answers =
        local.string() + "\nexample.test\n\nalice\n\npw\n";
    const Run r = runDriver(dir, answers, std::move(session),
                            QString::fromStdString(dir.path.string()));
    t.check(r.exitCode == 0, "driver should succeed: " + r.error);
    t.check(r.kind == quickscp::ErrorKind::None, "no error kind on success");
    t.check(r.port == 22, "empty port should connect to 22");
    t.check(r.host == "example.test", "host should be passed through");
    t.check(r.log.remotePath == "/home/alice/report.pdf",
            "default remote path should be used");
    t.check(r.log.declaredSize == 20000, "declared size should match");
    t.check(!r.stillConnected, "driver should disconnect at the end");
}

void test_bad_port_and_explicit_remote(TestContext &t) {
    TempDir dir;
    const fs::path local = dir.path / "data.bin";
    writePayload(local, 10);

    auto session = std::make_unique<quickscp::MockScpSession>();
    session->acceptPassword("pw");

    const std::string answers =
        local.string() + "\nexample.test\nssh\nalice\n/srv/in/data.bin\npw\n";
    const Run r = runDriver(dir, answers, std::move(session), QString());
    t.check(r.exitCode == 0, "bad port only warns: " + r.error);
    t.check(r.port == 22, "bad port should fall back to 22");
    t.check(r.log.remotePath == "/srv/in/data.bin",
            "explicit remote path should be used");
}

void test_wrong_password_exits_nonzero(TestContext &t) {
    TempDir dir;
    const fs::path local = dir.path / "data.bin";
    writePayload(local, 10);

    auto session = std::make_unique<quickscp::MockScpSession>();
    session->acceptPassword("right");

    const std::string answers =
        local.string() + "\nexample.test\n2222\nalice\n\nwrong\n";
    const Run r = runDriver(dir, answers, std::move(session),
                            QString::fromStdString(dir.path.string()));
    t.check(r.exitCode != 0, "wrong password should exit non-zero");
    t.check(r.kind == quickscp::ErrorKind::AuthFailure, "error kind is AuthFailure");
    t.check(r.port == 2222, "numeric port should be used");
    t.check(!r.log.opened, "no transfer after failed auth");
}

void test_missing_local_file(TestContext &t) {
    TempDir dir;
    auto session = std::make_unique<quickscp::MockScpSession>();
    const std::string answers = (dir.path / "nope.bin").string() + "\n";
    const Run r = runDriver(dir, answers, std::move(session), QString());
    t.check(r.exitCode != 0, "missing local file should exit non-zero");
    t.check(r.kind == quickscp::ErrorKind::Configuration,
            "error kind is Configuration");
    t.check(r.host.empty(), "no connection attempt");
}

void test_closed_input(TestContext &t) {
    TempDir dir;
    const fs::path local = dir.path / "data.bin";
    writePayload(local, 10);
    auto session = std::make_unique<quickscp::MockScpSession>();
    const Run r = runDriver(dir, local.string() + "\nexample.test\n",
                            std::move(session), QString());
    t.check(r.exitCode != 0, "EOF during prompts should exit non-zero");
}

void test_transfer_failure_exits_nonzero(TestContext &t) {
    TempDir dir;
    const fs::path local = dir.path / "data.bin";
    writePayload(local, 100);
    auto session = std::make_unique<quickscp::MockScpSession>();
    session->acceptPassword("pw");
    session->failAt(quickscp::MockFailPoint::WaitClosed);
    const std::string answers = local.string() + "\nexample.test\n\nalice\n\npw\n";
    const Run r = runDriver(dir, answers, std::move(session), QString());
    t.check(r.exitCode != 0, "shutdown failure should exit non-zero");
    t.check(r.kind == quickscp::ErrorKind::Transfer, "error kind is Transfer");
}

void test_formatting_helpers(TestContext &t) {
    using quickscpapp::TransferProgressBar;
    t.check(TransferProgressBar::formatDuration(0) == QStringLiteral("00:00:00"),
            "zero duration");
    t.check(TransferProgressBar::formatDuration(3725) == QStringLiteral("01:02:05"),
            "hours, minutes and seconds");
    t.check(quickscpapp::friendlyHint(QStringLiteral("Could not connect (Connection refused)")) ==
                QStringLiteral("Connection refused by the server."),
            "connection refused hint");
    t.check(quickscpapp::friendlyHint(QStringLiteral("something odd")).isEmpty(),
            "unknown errors have no hint");
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    TestContext t;
    test_password_upload_with_defaults(t);
    test_bad_port_and_explicit_remote(t);
    test_wrong_password_exits_nonzero(t);
    test_missing_local_file(t);
    test_closed_input(t);
    test_transfer_failure_exits_nonzero(t);
    test_formatting_helpers(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] quickscp_console_tests\n";
    return EXIT_SUCCESS;
}
