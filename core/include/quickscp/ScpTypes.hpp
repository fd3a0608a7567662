// Basic types shared between the app and the core for a single-file SCP upload.
// Keep these structures plain so the console layer can build and print them.
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace quickscp {

// Tunables for the upload session.
constexpr std::uint16_t kDefaultPort = 22;
constexpr std::size_t kChunkSize = 8192;     // bytes per read/write iteration
constexpr int kRemoteFileMode = 0644;        // POSIX mode sent with the SCP header
constexpr long kSessionTimeoutMs = 20000;
constexpr int kKeepaliveIntervalSec = 30;

// Failure families reported to the user. Every failure is fatal for the run.
enum class ErrorKind {
    None,
    Configuration, // local file missing or invalid input at config time
    AuthFailure,   // no key or password was accepted
    Transport,     // connect/handshake/channel failure not caused by credentials
    LocalFile,     // local file unreadable after the initial check
    Transfer       // chunk write or shutdown sequence failed
};

// Result of an authentication attempt or of the whole negotiation.
enum class AuthStatus {
    Authenticated,
    Rejected,       // credentials refused (or key unusable); try the next method
    TransportError, // the session itself failed; stop immediately
    Aborted         // input stream closed while prompting
};

enum class TransferStatus {
    Completed,
    LocalFileError,
    TransferError
};

// Immutable once built by buildTransferConfig().
struct TransferConfig {
    std::string localFilePath;
    std::string remoteHost;
    std::uint16_t port = kDefaultPort;
    std::string remotePath;
    std::string username;
};

inline const char* errorKindName(ErrorKind k) {
    switch (k) {
        case ErrorKind::None: return "none";
        case ErrorKind::Configuration: return "configuration error";
        case ErrorKind::AuthFailure: return "authentication failed";
        case ErrorKind::Transport: return "transport error";
        case ErrorKind::LocalFile: return "local file error";
        case ErrorKind::Transfer: return "transfer error";
    }
    return "unknown error";
}

} // namespace quickscp
