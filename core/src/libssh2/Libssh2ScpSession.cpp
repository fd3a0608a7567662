// libssh2 backend: owns the TCP socket and the SSH session, and opens SCP
// upload channels on it.
#include "quickscp/Libssh2ScpSession.hpp"
#include <libssh2.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <thread>

// POSIX sockets
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>

namespace quickscp {

// Global libssh2 initialisation (once per process)
static bool g_libssh2_inited = false;

// The session runs in blocking mode; EAGAIN is only a guard for servers or
// builds that still report it.
template <typename Fn>
static auto callBlocking(Fn fn) -> decltype(fn()) {
    for (;;) {
        auto rc = fn();
        if (rc != LIBSSH2_ERROR_EAGAIN) return rc;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

static bool isTransportFailure(int rc) {
    switch (rc) {
        case LIBSSH2_ERROR_SOCKET_NONE:
        case LIBSSH2_ERROR_BANNER_RECV:
        case LIBSSH2_ERROR_BANNER_SEND:
        case LIBSSH2_ERROR_SOCKET_SEND:
        case LIBSSH2_ERROR_SOCKET_DISCONNECT:
        case LIBSSH2_ERROR_SOCKET_TIMEOUT:
        case LIBSSH2_ERROR_TIMEOUT:
        case LIBSSH2_ERROR_SOCKET_RECV:
        case LIBSSH2_ERROR_KEX_FAILURE:
        case LIBSSH2_ERROR_DECRYPT:
        case LIBSSH2_ERROR_PROTO:
        case LIBSSH2_ERROR_ALLOC:
            return true;
        default:
            return false;
    }
}

static std::string sessionError(LIBSSH2_SESSION* s) {
    if (!s) return {};
    char* msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(s, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, (size_t)len) : std::string();
}

class Libssh2ScpChannel : public ScpChannel {
public:
    Libssh2ScpChannel(LIBSSH2_SESSION* session, LIBSSH2_CHANNEL* channel)
        : session_(session), channel_(channel) {}

    ~Libssh2ScpChannel() override {
        if (channel_) libssh2_channel_free(channel_);
    }

    // libssh2 may accept less than requested per call; keep feeding until the
    // chunk is fully queued or an error occurs.
    std::int64_t write(const char* data, std::size_t len, std::string& err) override {
        const char* p = data;
        std::size_t remain = len;
        while (remain > 0) {
            ssize_t w = callBlocking([&] { return libssh2_channel_write(channel_, p, remain); });
            if (w < 0) {
                err = "libssh2_channel_write failed (rc=" + std::to_string(w) + ")" + detail();
                return -1;
            }
            if (w == 0 || (std::size_t)w > remain) {
                err = "libssh2_channel_write returned an unexpected count";
                return static_cast<std::int64_t>(len - remain);
            }
            remain -= (std::size_t)w;
            p += w;
        }
        return static_cast<std::int64_t>(len);
    }

    bool sendEof(std::string& err) override {
        return check(callBlocking([&] { return libssh2_channel_send_eof(channel_); }),
                     "libssh2_channel_send_eof", err);
    }
    bool waitEof(std::string& err) override {
        return check(callBlocking([&] { return libssh2_channel_wait_eof(channel_); }),
                     "libssh2_channel_wait_eof", err);
    }
    bool close(std::string& err) override {
        return check(callBlocking([&] { return libssh2_channel_close(channel_); }),
                     "libssh2_channel_close", err);
    }
    bool waitClosed(std::string& err) override {
        return check(callBlocking([&] { return libssh2_channel_wait_closed(channel_); }),
                     "libssh2_channel_wait_closed", err);
    }

private:
    LIBSSH2_SESSION* session_;
    LIBSSH2_CHANNEL* channel_;

    std::string detail() const {
        const std::string e = sessionError(session_);
        return e.empty() ? std::string() : std::string(": ") + e;
    }

    bool check(int rc, const char* what, std::string& err) const {
        if (rc == 0) return true;
        err = std::string(what) + " failed (rc=" + std::to_string(rc) + ")" + detail();
        return false;
    }
};

Libssh2ScpSession::Libssh2ScpSession() {
    if (!g_libssh2_inited) {
        int rc = libssh2_init(0);
        (void)rc;
        g_libssh2_inited = true;
    }
}

Libssh2ScpSession::~Libssh2ScpSession() {
    disconnect();
}

std::string Libssh2ScpSession::lastError() const {
    return sessionError(session_);
}

namespace {

struct AddrInfoFree {
    void operator()(addrinfo* ai) const {
        if (ai) freeaddrinfo(ai);
    }
};
using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoFree>;

// Detect a silent peer during long uploads.
void enableKeepalive(int fd) {
    int on = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
#if defined(__linux__)
    const int idle = 60, intvl = 10, cnt = 3;
    ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
    ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
    ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#elif defined(__APPLE__)
    const int idle = 60;
    ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#endif
}

// Returns a connected socket for the first usable address, or -1 with errno
// of the last failure in lastErrno.
int connectFirst(const addrinfo* list, int& lastErrno) {
    for (const addrinfo* ai = list; ai; ai = ai->ai_next) {
        const int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            lastErrno = errno;
            continue;
        }
        enableKeepalive(fd);
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) return fd;
        lastErrno = errno;
        ::close(fd);
    }
    return -1;
}

} // namespace

bool Libssh2ScpSession::tcpConnect(const std::string& host, std::uint16_t port, std::string& err) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    const std::string service = std::to_string(port);
    addrinfo* raw = nullptr;
    const int gai = getaddrinfo(host.c_str(), service.c_str(), &hints, &raw);
    AddrInfoPtr addrs(raw);
    if (gai != 0) {
        err = "Could not resolve " + host + ": " + gai_strerror(gai);
        return false;
    }

    int lastErrno = 0;
    sock_ = connectFirst(addrs.get(), lastErrno);
    if (sock_ >= 0) return true;

    err = "Could not connect to " + host + ":" + service;
    if (lastErrno != 0) err += std::string(" (") + std::strerror(lastErrno) + ")";
    return false;
}

bool Libssh2ScpSession::sshHandshake(std::string& err) {
    session_ = libssh2_session_init();
    if (!session_) {
        err = "libssh2_session_init failed";
        return false;
    }

    libssh2_session_set_blocking(session_, 1);
#if LIBSSH2_VERSION_NUM >= 0x010209
    libssh2_session_set_timeout(session_, kSessionTimeoutMs);
#endif

    int rc = callBlocking([&] { return libssh2_session_handshake(session_, sock_); });
    if (rc != 0) {
        err = "SSH handshake failed";
        const std::string e = lastError();
        if (!e.empty()) err += ": " + e;
        return false;
    }

    // Ask libssh2 to send keepalives when the peer allows it
    libssh2_keepalive_config(session_, 1, kKeepaliveIntervalSec);
    return true;
}

bool Libssh2ScpSession::connect(const std::string& host, std::uint16_t port,
                                std::string& err) {
    if (connected_) {
        err = "Already connected";
        return false;
    }
    if (!tcpConnect(host, port, err)) return false;
    if (!sshHandshake(err)) {
        disconnect();
        return false;
    }
    connected_ = true;
    return true;
}

void Libssh2ScpSession::disconnect() {
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
    authenticated_ = false;
}

AuthStatus Libssh2ScpSession::classifyAuth(int rc, const char* what, std::string& err) {
    if (rc == 0) {
        authenticated_ = true;
        return AuthStatus::Authenticated;
    }
    const std::string e = lastError();
    err = std::string(what) + " failed (rc=" + std::to_string(rc) + ")" +
          (e.empty() ? std::string() : ": " + e);
    if (isTransportFailure(rc)) {
        connected_ = false;
        return AuthStatus::TransportError;
    }
    return AuthStatus::Rejected;
}

AuthStatus Libssh2ScpSession::authPublicKeyFile(const std::string& username,
                                                const std::string& privateKeyPath,
                                                const std::string& passphrase,
                                                std::string& err) {
    if (!connected_ || !session_) {
        err = "Not connected";
        return AuthStatus::TransportError;
    }
    const char* pass = passphrase.empty() ? nullptr : passphrase.c_str();
    int rc = callBlocking([&] {
        return libssh2_userauth_publickey_fromfile(session_,
                                                   username.c_str(),
                                                   nullptr, // public key derived from the private one
                                                   privateKeyPath.c_str(),
                                                   pass);
    });
    return classifyAuth(rc, "publickey auth", err);
}

AuthStatus Libssh2ScpSession::authPassword(const std::string& username,
                                           const std::string& password,
                                           std::string& err) {
    if (!connected_ || !session_) {
        err = "Not connected";
        return AuthStatus::TransportError;
    }
    int rc = callBlocking([&] {
        return libssh2_userauth_password(session_, username.c_str(), password.c_str());
    });
    return classifyAuth(rc, "password auth", err);
}

std::unique_ptr<ScpChannel> Libssh2ScpSession::openScpWrite(const std::string& remotePath,
                                                            int mode,
                                                            std::uint64_t size,
                                                            std::string& err) {
    if (!connected_ || !session_) {
        err = "Not connected";
        return nullptr;
    }
    if (!authenticated_) {
        err = "Session is not authenticated";
        return nullptr;
    }

    LIBSSH2_CHANNEL* ch = nullptr;
    for (;;) {
        ch = libssh2_scp_send64(session_, remotePath.c_str(), mode,
                                (libssh2_int64_t)size, 0, 0);
        if (ch || libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    if (!ch) {
        err = "Could not open SCP channel for " + remotePath;
        const std::string e = lastError();
        if (!e.empty()) err += ": " + e;
        return nullptr;
    }
    return std::make_unique<Libssh2ScpChannel>(session_, ch);
}

} // namespace quickscp
