#pragma once
#include "RemoteSession.hpp"
#include "TransferPlan.hpp"
#include <map>
#include <optional>
#include <set>
#include <utility>
#include <string>
#include <vector>

namespace rdispatch {

// In-memory remote filesystem. mkdir/upload follow SFTP rules (parent must
// exist, no overwriting a directory) and every call is recorded so tests can
// count round trips.
class MockRemoteSession : public RemoteSession {
public:
  MockRemoteSession();

  bool connect(const SessionOptions& opt, DispatchError& err) override;
  void disconnect() override;
  bool isConnected() const override { return connected_; }

  bool openFileChannel(std::string& err) override;
  void closeFileChannel() override;
  bool fileChannelOpen() const override { return channelOpen_; }

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

  // Remote tree setup (parents are created as needed)
  void seedDirectory(const std::string& path);
  void seedFile(const std::string& path, const std::string& data = {});

  bool hasDirectory(const std::string& path) const;
  bool hasFile(const std::string& path) const;
  std::optional<std::string> fileData(const std::string& path) const;

  // Failure injection
  void failProbeOn(const std::string& path) { probeFailures_.insert(path); }
  void failMkdirOn(const std::string& path) { mkdirFailures_.insert(path); }
  void failUploadOn(const std::string& path) { uploadFailures_.insert(path); }
  void failConnectWith(ErrorKind kind, const std::string& msg) {
    connectFailure_ = DispatchError{kind, msg};
  }
  void setCommandResult(const std::string& command, CommandResult r) {
    commands_[command] = std::move(r);
  }

  // Call log
  int connectCount() const { return connectCount_; }
  int channelOpens() const { return channelOpens_; }
  int channelCloses() const { return channelCloses_; }
  int probeCount() const { return static_cast<int>(probed_.size()); }
  int probeCountFor(const std::string& path) const;
  const std::vector<std::string>& probedPaths() const { return probed_; }
  const std::vector<std::string>& createdDirectories() const { return mkdirs_; }
  const std::vector<FileMapping>& uploads() const { return uploads_; }
  const std::vector<std::string>& commandsRun() const { return commandsRun_; }
  const SessionOptions& lastOptions() const { return lastOpt_; }
  void resetCallLog();

private:
  struct Node {
    bool is_dir = false;
    std::string data;
  };

  bool ready(std::string& err) const;
  static std::string parentOf(const std::string& path);

  bool connected_ = false;
  bool channelOpen_ = false;
  SessionOptions lastOpt_{};
  std::optional<DispatchError> connectFailure_;

  std::map<std::string, Node> fs_;
  std::set<std::string> probeFailures_;
  std::set<std::string> mkdirFailures_;
  std::set<std::string> uploadFailures_;
  std::map<std::string, CommandResult> commands_;

  int connectCount_ = 0;
  int channelOpens_ = 0;
  int channelCloses_ = 0;
  std::vector<std::string> probed_;
  std::vector<std::string> mkdirs_;
  std::vector<FileMapping> uploads_;
  std::vector<std::string> commandsRun_;
};

} // namespace rdispatch
