// Driver of the interactive upload; owns the session and maps every failure
// to a single fatal ErrorKind.
#include "TransferDriver.hpp"
#include "AppLogging.hpp"
#include "ConsolePrompter.hpp"
#include "ConsoleStyle.hpp"
#include "TransferProgressBar.hpp"
#include "quickscp/Authenticator.hpp"
#include "quickscp/TransferConfig.hpp"
#include "quickscp/Transferer.hpp"

#include <QCoreApplication>
#include <utility>

#include <string>
#include <vector>

using quickscp::AuthEvent;
using quickscp::AuthStatus;
using quickscp::ErrorKind;
using quickscp::TransferStatus;

namespace quickscpapp {

static QString q(const std::string &s) { return QString::fromStdString(s); }

QString friendlyHint(const QString &raw) {
    const QString lower = raw.trimmed().toLower();
    if (lower.isEmpty())
        return {};
    if (lower.contains("permission denied"))
        return QCoreApplication::translate("TransferDriver", "Permission denied.");
    if (lower.contains("no such file") || lower.contains("not found"))
        return QCoreApplication::translate("TransferDriver",
                                           "File or folder does not exist.");
    if (lower.contains("timed out") || lower.contains("timeout"))
        return QCoreApplication::translate("TransferDriver", "Connection timed out.");
    if (lower.contains("could not resolve") ||
        lower.contains("name or service not known") ||
        lower.contains("nodename nor servname"))
        return QCoreApplication::translate(
            "TransferDriver", "Could not resolve the server hostname.");
    if (lower.contains("connection refused"))
        return QCoreApplication::translate("TransferDriver",
                                           "Connection refused by the server.");
    if (lower.contains("connection reset") || lower.contains("disconnect"))
        return QCoreApplication::translate("TransferDriver",
                                           "The server closed the connection.");
    return {};
}

TransferDriver::TransferDriver(ConsolePrompter &prompter,
                               std::unique_ptr<quickscp::ScpSession> session,
                               QString homeDir)
    : prompter_(prompter), session_(std::move(session)),
      homeDir_(std::move(homeDir)) {}

void TransferDriver::fail(ErrorKind kind, const QString &message) {
    errorKind_ = kind;
    error_ = message;
}

bool TransferDriver::collectConfig(quickscp::TransferConfig &cfg) {
    quickscp::RawTransferInput in;
    QString answer;

    if (!prompter_.askLine(QStringLiteral("Local file path"), answer)) {
        fail(ErrorKind::Configuration, QStringLiteral("Input closed"));
        return false;
    }
    in.localFilePath = answer.toStdString();
    std::string err;
    if (!quickscp::validateLocalFile(in.localFilePath, err)) {
        fail(ErrorKind::Configuration, q(err));
        return false;
    }

    if (!prompter_.askLine(
            QStringLiteral("Remote host (e.g., example.com or 192.168.1.100)"),
            answer)) {
        fail(ErrorKind::Configuration, QStringLiteral("Input closed"));
        return false;
    }
    in.remoteHost = answer.toStdString();

    if (!prompter_.askLine(
            QStringLiteral("Port (optional, press Enter for default %1)")
                .arg(quickscp::kDefaultPort),
            answer, true)) {
        fail(ErrorKind::Configuration, QStringLiteral("Input closed"));
        return false;
    }
    in.port = answer.toStdString();

    if (!prompter_.askLine(QStringLiteral("Username"), answer)) {
        fail(ErrorKind::Configuration, QStringLiteral("Input closed"));
        return false;
    }
    in.username = answer.toStdString();

    const QString def =
        q(quickscp::defaultRemotePath(in.username, in.localFilePath));
    if (!prompter_.askLine(
            QStringLiteral("Remote path (optional, press Enter for default: %1)")
                .arg(def),
            answer, true)) {
        fail(ErrorKind::Configuration, QStringLiteral("Input closed"));
        return false;
    }
    in.remotePath = answer.toStdString();

    std::vector<std::string> warnings;
    if (!quickscp::buildTransferConfig(in, cfg, err, warnings)) {
        fail(ErrorKind::Configuration, q(err));
        return false;
    }
    for (const std::string &w : warnings) {
        qCWarning(qsSession) << w.c_str();
        status(Tone::Warning, q(w));
    }
    qCDebug(qsSession) << "config host=" << cfg.remoteHost.c_str()
                       << "port=" << cfg.port << "user=" << cfg.username.c_str()
                       << "remote=" << cfg.remotePath.c_str();
    return true;
}

bool TransferDriver::connectSession(const quickscp::TransferConfig &cfg) {
    out() << Qt::endl;
    status(Tone::Info, QStringLiteral("Connecting to remote host..."));
    std::string err;
    if (!session_->connect(cfg.remoteHost, cfg.port, err)) {
        qCWarning(qsSession) << "connect failed:" << err.c_str();
        fail(ErrorKind::Transport, q(err));
        return false;
    }
    qCInfo(qsSession) << "connected and handshaken" << cfg.remoteHost.c_str()
                      << cfg.port;
    return true;
}

bool TransferDriver::authenticate(const quickscp::TransferConfig &cfg) {
    quickscp::AuthCallbacks cb;
    cb.askPassphrase = [this](const std::string &, std::string &passphrase) {
        QString answer;
        if (!prompter_.askSecret(QStringLiteral("SSH key passphrase"), answer))
            return false;
        passphrase = answer.toStdString();
        secureClear(answer);
        return true;
    };
    cb.askPassword = [this](std::string &password) {
        QString answer;
        if (!prompter_.askSecret(QStringLiteral("Password"), answer))
            return false;
        password = answer.toStdString();
        secureClear(answer);
        return true;
    };
    cb.onEvent = [](AuthEvent ev, const std::string &detail) {
        switch (ev) {
        case AuthEvent::TryingKey:
            qCInfo(qsAuth) << "trying key" << detail.c_str();
            status(Tone::Info, QStringLiteral("Trying SSH key: %1").arg(q(detail)));
            break;
        case AuthEvent::KeyAccepted:
            status(Tone::Success,
                   QStringLiteral("Authenticated with SSH key (no passphrase)"));
            break;
        case AuthEvent::KeyNeedsPassphrase:
            status(Tone::Warning, QStringLiteral("SSH key requires passphrase"));
            break;
        case AuthEvent::KeyAcceptedWithPassphrase:
            status(Tone::Success,
                   QStringLiteral("Authenticated with SSH key (with passphrase)"));
            break;
        case AuthEvent::KeyRejected:
            qCInfo(qsAuth) << "key rejected" << detail.c_str();
            break;
        case AuthEvent::FallbackToPassword:
            status(Tone::Warning,
                   QStringLiteral("SSH key authentication failed, trying "
                                  "password authentication"));
            break;
        case AuthEvent::PasswordAccepted:
            status(Tone::Success, QStringLiteral("Authenticated with password"));
            break;
        case AuthEvent::PasswordRejected:
            status(Tone::Error, QStringLiteral("Password authentication failed"));
            break;
        }
    };

    if (homeDir_.isEmpty())
        qCInfo(qsAuth) << "no home directory, skipping key authentication";

    quickscp::Authenticator auth(homeDir_.toStdString(), cb);
    std::string err;
    const AuthStatus st = auth.authenticate(*session_, cfg, err);
    switch (st) {
    case AuthStatus::Authenticated:
        qCInfo(qsAuth) << "authenticated via" << auth.acceptedMethod().c_str();
        status(Tone::Success,
               QStringLiteral("Connected and authenticated successfully!"));
        return true;
    case AuthStatus::Rejected:
        qCWarning(qsAuth) << "rejected:" << err.c_str();
        fail(ErrorKind::AuthFailure, q(err));
        return false;
    case AuthStatus::TransportError:
        qCWarning(qsAuth) << "transport error:" << err.c_str();
        fail(ErrorKind::Transport, q(err));
        return false;
    case AuthStatus::Aborted:
        fail(ErrorKind::AuthFailure, q(err));
        return false;
    }
    return false;
}

bool TransferDriver::transfer(const quickscp::TransferConfig &cfg) {
    status(Tone::Info, QStringLiteral("Starting file transfer..."));

    TransferProgressBar bar;
    bool started = false;
    quickscp::Transferer xfer;
    std::string err;
    const TransferStatus st = xfer.transfer(
        *session_, cfg, err,
        [&](std::uint64_t done, std::uint64_t total) {
            if (!started) {
                bar.start(total);
                started = true;
            }
            bar.update(done);
        },
        [&]() {
            if (!started) {
                bar.start(0);
                started = true;
            }
            bar.finish(QStringLiteral("Transfer completed!"));
        });

    if (st == TransferStatus::Completed) {
        qCInfo(qsXfer) << "uploaded" << xfer.transferred() << "bytes to"
                       << cfg.remotePath.c_str();
        return true;
    }
    bar.abandon();
    qCWarning(qsXfer) << "transfer failed after" << xfer.transferred()
                      << "bytes:" << err.c_str();
    fail(st == TransferStatus::LocalFileError ? ErrorKind::LocalFile
                                              : ErrorKind::Transfer,
         q(err));
    return false;
}

void TransferDriver::report() const {
    err() << Qt::endl;
    if (errorKind_ == ErrorKind::Configuration) {
        failure(error_, true);
        return;
    }
    failure(QStringLiteral("Transfer failed:"), true);
    failure(QStringLiteral("%1: %2")
                .arg(QString::fromLatin1(quickscp::errorKindName(errorKind_)),
                     error_));
    const QString hint = friendlyHint(error_);
    if (!hint.isEmpty())
        err() << styled(hint, Tone::Warning, false, stderrIsTty()) << Qt::endl;
}

int TransferDriver::run() {
    printBanner();

    quickscp::TransferConfig cfg;
    bool ok = collectConfig(cfg) && connectSession(cfg) && authenticate(cfg) &&
              transfer(cfg);
    session_->disconnect();

    if (!ok) {
        report();
        return 1;
    }
    out() << Qt::endl;
    status(Tone::Success, QStringLiteral("File transfer completed successfully!"),
           true);
    return 0;
}

} // namespace quickscpapp
