#pragma once
#include "ScpSession.hpp"
#include <string>

// Forward declarations of libssh2's internal types (underscore names)
struct _LIBSSH2_SESSION;

namespace quickscp {

class Libssh2ScpSession : public ScpSession {
public:
  Libssh2ScpSession();
  ~Libssh2ScpSession() override;

  Libssh2ScpSession(const Libssh2ScpSession&) = delete;
  Libssh2ScpSession& operator=(const Libssh2ScpSession&) = delete;

  bool connect(const std::string& host, std::uint16_t port,
               std::string& err) override;
  void disconnect() override;
  bool isConnected() const override { return connected_; }
  bool isAuthenticated() const override { return authenticated_; }

  AuthStatus authPublicKeyFile(const std::string& username,
                               const std::string& privateKeyPath,
                               const std::string& passphrase,
                               std::string& err) override;
  AuthStatus authPassword(const std::string& username,
                          const std::string& password,
                          std::string& err) override;

  std::unique_ptr<ScpChannel> openScpWrite(const std::string& remotePath,
                                           int mode,
                                           std::uint64_t size,
                                           std::string& err) override;

private:
  bool connected_ = false;
  bool authenticated_ = false;
  int  sock_ = -1;
  _LIBSSH2_SESSION* session_ = nullptr;

  bool tcpConnect(const std::string& host, std::uint16_t port, std::string& err);
  bool sshHandshake(std::string& err);
  AuthStatus classifyAuth(int rc, const char* what, std::string& err);
  std::string lastError() const;
};

} // namespace quickscp
