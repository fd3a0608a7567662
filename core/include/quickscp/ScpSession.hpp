// Abstract interface over the secure transport. Concrete implementations
// (libssh2, mock) must honour this API so the auth/transfer logic stays
// decoupled from the backend.
#pragma once
#include "ScpTypes.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace quickscp {

// Write side of a remote-copy channel. Destroying it releases the channel.
class ScpChannel {
public:
    virtual ~ScpChannel() = default;

    // Returns the number of bytes accepted (== len on success) or -1 on error.
    virtual std::int64_t write(const char* data, std::size_t len,
                               std::string& err) = 0;

    // Orderly shutdown, to be called in this order.
    virtual bool sendEof(std::string& err) = 0;
    virtual bool waitEof(std::string& err) = 0;
    virtual bool close(std::string& err) = 0;
    virtual bool waitClosed(std::string& err) = 0;
};

class ScpSession {
public:
    virtual ~ScpSession() = default;

    // TCP connect plus SSH handshake.
    virtual bool connect(const std::string& host, std::uint16_t port,
                         std::string& err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;
    virtual bool isAuthenticated() const = 0;

    // Public key auth from a private key file. Empty passphrase means none.
    virtual AuthStatus authPublicKeyFile(const std::string& username,
                                         const std::string& privateKeyPath,
                                         const std::string& passphrase,
                                         std::string& err) = 0;

    virtual AuthStatus authPassword(const std::string& username,
                                    const std::string& password,
                                    std::string& err) = 0;

    // Opens an SCP upload for exactly `size` bytes. Requires authentication.
    virtual std::unique_ptr<ScpChannel> openScpWrite(const std::string& remotePath,
                                                     int mode,
                                                     std::uint64_t size,
                                                     std::string& err) = 0;
};

} // namespace quickscp
