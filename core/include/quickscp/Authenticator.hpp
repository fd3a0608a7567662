// Opportunistic SSH authentication: private keys from ~/.ssh first (without
// and then with a passphrase), password as the last resort.
#pragma once
#include "ScpSession.hpp"
#include "ScpTypes.hpp"
#include <functional>
#include <string>
#include <vector>

namespace quickscp {

// Narration emitted while negotiating. Informational only.
enum class AuthEvent {
    TryingKey,                 // detail: key path
    KeyAccepted,               // detail: key path
    KeyNeedsPassphrase,        // detail: key path
    KeyAcceptedWithPassphrase, // detail: key path
    KeyRejected,               // detail: key path
    FallbackToPassword,
    PasswordAccepted,
    PasswordRejected
};

// Interactive collaborators. Prompt callbacks return false when input is
// no longer available (EOF on stdin).
struct AuthCallbacks {
    std::function<bool(const std::string& keyPath, std::string& passphrase)> askPassphrase;
    std::function<bool(std::string& password)> askPassword;
    std::function<void(AuthEvent event, const std::string& detail)> onEvent;
};

// One step of the ordered fallback.
struct AuthStrategy {
    std::string name;
    std::function<AuthStatus(ScpSession&, const TransferConfig&, std::string& err)> attempt;
};

// ~/.ssh/id_rsa, ~/.ssh/id_ed25519, ~/.ssh/id_ecdsa in that order. Empty when
// homeDir is empty.
std::vector<std::string> candidateKeyPaths(const std::string& homeDir);

class Authenticator {
public:
    Authenticator(std::string homeDir, AuthCallbacks callbacks);

    // Runs strategies() in order until one authenticates. Rejected moves on;
    // TransportError and Aborted stop immediately. Returns Rejected when the
    // list is exhausted.
    AuthStatus authenticate(ScpSession& session,
                            const TransferConfig& config,
                            std::string& err);

    // Key strategies for each candidate, then the password strategy.
    std::vector<AuthStrategy> strategies() const;

    // Name of the strategy that succeeded in the last authenticate() call.
    const std::string& acceptedMethod() const { return acceptedMethod_; }

private:
    std::string homeDir_;
    AuthCallbacks cb_;
    std::string acceptedMethod_;

    AuthStatus tryKeyFile(ScpSession& session, const TransferConfig& config,
                          const std::string& keyPath, std::string& err) const;
    AuthStatus tryPassword(ScpSession& session, const TransferConfig& config,
                           std::string& err) const;
    void emit(AuthEvent ev, const std::string& detail = {}) const;
};

} // namespace quickscp
