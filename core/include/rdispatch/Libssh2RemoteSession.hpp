#pragma once
#include "RemoteSession.hpp"
#include <cstdint>
#include <string>
#include <vector>

// Forward declarations of the libssh2 internal types (leading underscore)
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace rdispatch {

class Libssh2RemoteSession : public RemoteSession {
public:
  Libssh2RemoteSession();
  ~Libssh2RemoteSession() override;

  Libssh2RemoteSession(const Libssh2RemoteSession&) = delete;
  Libssh2RemoteSession& operator=(const Libssh2RemoteSession&) = delete;

  bool connect(const SessionOptions& opt, DispatchError& err) override;
  void disconnect() override;
  bool isConnected() const override;

  bool openFileChannel(std::string& err) override;
  void closeFileChannel() override;
  bool fileChannelOpen() const override { return sftp_ != nullptr; }

  bool probe(const std::string& remote_path,
             RemoteEntryState& state,
             std::string& err) override;

  bool createDirectory(const std::string& remote_dir,
                       std::string& err,
                       unsigned int mode = 0755) override;

  bool uploadFile(const std::string& local,
                  const std::string& remote,
                  std::string& err,
                  ProgressCB progress = {}) override;

  bool runCommand(const std::string& command,
                  CommandResult& result,
                  std::string& err) override;

  // Default identities looked up when neither a key nor a password is given.
  static std::vector<std::string> defaultIdentityFiles(const std::string& username);

  // Exit status reported for a command killed by the named signal (SSH
  // signal names carry no "SIG" prefix). Unknown names give 255.
  static int exitStatusForSignal(const std::string& name);

private:
  bool connected_ = false;
  int  sock_ = -1;
  _LIBSSH2_SESSION* session_ = nullptr;
  _LIBSSH2_SFTP*    sftp_    = nullptr;

  bool tcpConnect(const std::string& host, std::uint16_t port, DispatchError& err);
  bool verifyHostKey(const SessionOptions& opt, DispatchError& err);
  bool authenticate(const SessionOptions& opt, DispatchError& err);
  bool authWithKeyFile(const SessionOptions& opt, const std::string& keyPath,
                       const char* passphrase, DispatchError& err);
  bool authWithAgent(const std::string& username);
  std::string lastSessionError() const;
  bool sendKeepalive(std::string& err);
};

} // namespace rdispatch
