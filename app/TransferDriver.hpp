// Runs one interactive upload: collect input, connect, authenticate, transfer.
#pragma once
#include "quickscp/ScpSession.hpp"
#include "quickscp/ScpTypes.hpp"

#include <QString>
#include <memory>

namespace quickscpapp {

class ConsolePrompter;

class TransferDriver {
public:
    // The session is owned by the driver for the whole run.
    TransferDriver(ConsolePrompter &prompter,
                   std::unique_ptr<quickscp::ScpSession> session,
                   QString homeDir);

    // Returns the process exit code.
    int run();

    quickscp::ErrorKind lastErrorKind() const { return errorKind_; }
    const QString &lastError() const { return error_; }

private:
    ConsolePrompter &prompter_;
    std::unique_ptr<quickscp::ScpSession> session_;
    QString homeDir_;
    quickscp::ErrorKind errorKind_ = quickscp::ErrorKind::None;
    QString error_;

    bool collectConfig(quickscp::TransferConfig &cfg);
    bool connectSession(const quickscp::TransferConfig &cfg);
    bool authenticate(const quickscp::TransferConfig &cfg);
    bool transfer(const quickscp::TransferConfig &cfg);
    void fail(quickscp::ErrorKind kind, const QString &message);
    void report() const;
};

// Short user-facing hint for common transport errors. Empty when unknown.
QString friendlyHint(const QString &raw);

} // namespace quickscpapp
