#include "rdispatch/MockRemoteSession.hpp"
#include "rdispatch/PathUtils.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>

namespace rdispatch {

MockRemoteSession::MockRemoteSession() {
  fs_["/"] = Node{true, {}};
}

bool MockRemoteSession::connect(const SessionOptions& opt, DispatchError& err) {
  ++connectCount_;
  if (opt.host.empty() || opt.username.empty()) {
    err.set(ErrorKind::InvalidArgument, "Host and username are required");
    return false;
  }
  if (connectFailure_) {
    err = *connectFailure_;
    return false;
  }
  connected_ = true;
  lastOpt_ = opt;
  return true;
}

void MockRemoteSession::disconnect() {
  if (channelOpen_)
    closeFileChannel();
  connected_ = false;
}

bool MockRemoteSession::openFileChannel(std::string& err) {
  if (!connected_) {
    err = "Not connected";
    return false;
  }
  ++channelOpens_;
  channelOpen_ = true;
  return true;
}

void MockRemoteSession::closeFileChannel() {
  if (!channelOpen_)
    return;
  ++channelCloses_;
  channelOpen_ = false;
}

bool MockRemoteSession::ready(std::string& err) const {
  if (!connected_) {
    err = "Not connected";
    return false;
  }
  if (!channelOpen_) {
    err = "File channel not open";
    return false;
  }
  return true;
}

std::string MockRemoteSession::parentOf(const std::string& path) {
  const auto pos = path.find_last_of('/');
  if (pos == std::string::npos || pos == 0)
    return "/";
  return path.substr(0, pos);
}

bool MockRemoteSession::probe(const std::string& remote_path,
                              RemoteEntryState& state,
                              std::string& err) {
  state = RemoteEntryState::Absent;
  if (!ready(err))
    return false;
  probed_.push_back(remote_path);
  if (probeFailures_.count(remote_path)) {
    err = "Simulated connection drop";
    return false;
  }
  auto it = fs_.find(normalizeRemotePath(remote_path));
  if (it != fs_.end())
    state = it->second.is_dir ? RemoteEntryState::Directory : RemoteEntryState::Other;
  return true;
}

bool MockRemoteSession::createDirectory(const std::string& remote_dir,
                                        std::string& err,
                                        unsigned int) {
  if (!ready(err))
    return false;
  mkdirs_.push_back(remote_dir);
  const std::string path = normalizeRemotePath(remote_dir);
  if (mkdirFailures_.count(remote_dir)) {
    err = "Permission denied";
    return false;
  }
  if (fs_.count(path)) {
    err = "File exists";
    return false;
  }
  auto parent = fs_.find(parentOf(path));
  if (parent == fs_.end() || !parent->second.is_dir) {
    err = "No such file";
    return false;
  }
  fs_[path] = Node{true, {}};
  return true;
}

bool MockRemoteSession::uploadFile(const std::string& local,
                                   const std::string& remote,
                                   std::string& err,
                                   ProgressCB progress) {
  if (!ready(err))
    return false;
  uploads_.push_back(FileMapping{local, remote});
  if (uploadFailures_.count(remote)) {
    err = "Simulated write failure";
    return false;
  }
  const std::string path = normalizeRemotePath(remote);
  auto parent = fs_.find(parentOf(path));
  if (parent == fs_.end() || !parent->second.is_dir) {
    err = "No such file";
    return false;
  }
  auto existing = fs_.find(path);
  if (existing != fs_.end() && existing->second.is_dir) {
    err = "Is a directory";
    return false;
  }
  std::ifstream in(local, std::ios::binary);
  if (!in.is_open()) {
    err = "Could not open local file for reading";
    return false;
  }
  std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (progress)
    progress(data.size(), data.size());
  fs_[path] = Node{false, std::move(data)};
  return true;
}

bool MockRemoteSession::runCommand(const std::string& command,
                                   CommandResult& result,
                                   std::string& err) {
  if (!connected_) {
    err = "Not connected";
    return false;
  }
  commandsRun_.push_back(command);
  auto it = commands_.find(command);
  if (it == commands_.end()) {
    result.exit_status = 127;
    result.output = "sh: " + command + ": command not found\n";
    return true;
  }
  result = it->second;
  return true;
}

void MockRemoteSession::seedDirectory(const std::string& path) {
  const std::string p = normalizeRemotePath(path);
  if (p == "/" || p.empty())
    return;
  seedDirectory(parentOf(p));
  fs_[p] = Node{true, {}};
}

void MockRemoteSession::seedFile(const std::string& path, const std::string& data) {
  const std::string p = normalizeRemotePath(path);
  seedDirectory(parentOf(p));
  fs_[p] = Node{false, data};
}

bool MockRemoteSession::hasDirectory(const std::string& path) const {
  auto it = fs_.find(normalizeRemotePath(path));
  return it != fs_.end() && it->second.is_dir;
}

bool MockRemoteSession::hasFile(const std::string& path) const {
  auto it = fs_.find(normalizeRemotePath(path));
  return it != fs_.end() && !it->second.is_dir;
}

std::optional<std::string> MockRemoteSession::fileData(const std::string& path) const {
  auto it = fs_.find(normalizeRemotePath(path));
  if (it == fs_.end() || it->second.is_dir)
    return std::nullopt;
  return it->second.data;
}

int MockRemoteSession::probeCountFor(const std::string& path) const {
  return static_cast<int>(std::count(probed_.begin(), probed_.end(), path));
}

void MockRemoteSession::resetCallLog() {
  connectCount_ = 0;
  channelOpens_ = 0;
  channelCloses_ = 0;
  probed_.clear();
  mkdirs_.clear();
  uploads_.clear();
  commandsRun_.clear();
}

} // namespace rdispatch
