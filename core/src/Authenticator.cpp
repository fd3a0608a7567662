// Ordered fallback: each candidate key is a strategy, password is the last one.
#include "quickscp/Authenticator.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace quickscp {

// Best-effort scrubbing of secrets once they were handed to the transport.
static void secureClear(std::string& s) {
    volatile char* p = s.empty() ? nullptr : &s[0];
    for (std::size_t i = 0; i < s.size(); ++i) p[i] = '\0';
    s.clear();
}

std::vector<std::string> candidateKeyPaths(const std::string& homeDir) {
    std::vector<std::string> out;
    if (homeDir.empty()) return out;
    const fs::path sshDir = fs::path(homeDir) / ".ssh";
    for (const char* name : {"id_rsa", "id_ed25519", "id_ecdsa"}) {
        out.push_back((sshDir / name).string());
    }
    return out;
}

Authenticator::Authenticator(std::string homeDir, AuthCallbacks callbacks)
    : homeDir_(std::move(homeDir)), cb_(std::move(callbacks)) {}

void Authenticator::emit(AuthEvent ev, const std::string& detail) const {
    if (cb_.onEvent) cb_.onEvent(ev, detail);
}

std::vector<AuthStrategy> Authenticator::strategies() const {
    std::vector<AuthStrategy> list;
    for (const std::string& keyPath : candidateKeyPaths(homeDir_)) {
        list.push_back({"publickey:" + keyPath,
                        [this, keyPath](ScpSession& s, const TransferConfig& c, std::string& e) {
                            return tryKeyFile(s, c, keyPath, e);
                        }});
    }
    list.push_back({"password",
                    [this](ScpSession& s, const TransferConfig& c, std::string& e) {
                        return tryPassword(s, c, e);
                    }});
    return list;
}

AuthStatus Authenticator::authenticate(ScpSession& session,
                                       const TransferConfig& config,
                                       std::string& err) {
    acceptedMethod_.clear();
    if (!session.isConnected()) {
        err = "Not connected";
        return AuthStatus::TransportError;
    }

    std::string lastReason;
    for (const AuthStrategy& strategy : strategies()) {
        std::string stepErr;
        const AuthStatus st = strategy.attempt(session, config, stepErr);
        switch (st) {
            case AuthStatus::Authenticated:
                acceptedMethod_ = strategy.name;
                err.clear();
                return st;
            case AuthStatus::Rejected:
                if (!stepErr.empty()) lastReason = stepErr;
                continue;
            case AuthStatus::TransportError:
            case AuthStatus::Aborted:
                err = stepErr;
                return st;
        }
    }

    err = "Authentication failed";
    if (!lastReason.empty()) err += ": " + lastReason;
    return AuthStatus::Rejected;
}

AuthStatus Authenticator::tryKeyFile(ScpSession& session,
                                     const TransferConfig& config,
                                     const std::string& keyPath,
                                     std::string& err) const {
    // Checked lazily: the file may appear or vanish between runs.
    std::error_code ec;
    if (!fs::exists(keyPath, ec)) return AuthStatus::Rejected;

    emit(AuthEvent::TryingKey, keyPath);

    AuthStatus st = session.authPublicKeyFile(config.username, keyPath, {}, err);
    if (st == AuthStatus::Authenticated) {
        emit(AuthEvent::KeyAccepted, keyPath);
        return st;
    }
    if (st != AuthStatus::Rejected) return st;

    emit(AuthEvent::KeyNeedsPassphrase, keyPath);
    if (!cb_.askPassphrase) return AuthStatus::Rejected;

    std::string passphrase;
    if (!cb_.askPassphrase(keyPath, passphrase)) {
        err = "Input closed while reading the key passphrase";
        return AuthStatus::Aborted;
    }
    err.clear();
    st = session.authPublicKeyFile(config.username, keyPath, passphrase, err);
    secureClear(passphrase);

    if (st == AuthStatus::Authenticated) {
        emit(AuthEvent::KeyAcceptedWithPassphrase, keyPath);
    } else if (st == AuthStatus::Rejected) {
        emit(AuthEvent::KeyRejected, keyPath);
    }
    return st;
}

AuthStatus Authenticator::tryPassword(ScpSession& session,
                                      const TransferConfig& config,
                                      std::string& err) const {
    emit(AuthEvent::FallbackToPassword);
    if (!cb_.askPassword) {
        err = "No password prompt available";
        return AuthStatus::Rejected;
    }

    std::string password;
    if (!cb_.askPassword(password)) {
        err = "Input closed while reading the password";
        return AuthStatus::Aborted;
    }
    const AuthStatus st = session.authPassword(config.username, password, err);
    secureClear(password);

    if (st == AuthStatus::Authenticated) {
        emit(AuthEvent::PasswordAccepted);
    } else if (st == AuthStatus::Rejected) {
        emit(AuthEvent::PasswordRejected);
    }
    return st;
}

} // namespace quickscp
