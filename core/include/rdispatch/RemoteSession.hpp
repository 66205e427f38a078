// Abstract SSH session. Concrete backends (libssh2, mock) implement this API
// so the dispatcher and the CLI stay decoupled from the transport.
#pragma once
#include "DispatchError.hpp"
#include "RemoteFilesystemProbe.hpp"
#include "RemoteTypes.hpp"
#include "TransferExecutor.hpp"

namespace rdispatch {

class RemoteSession : public RemoteFilesystemProbe, public TransferExecutor {
public:
    ~RemoteSession() override = default;

    // Connect and authenticate / tear everything down.
    virtual bool connect(const SessionOptions& opt, DispatchError& err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // File channel (SFTP subsystem) used by probe/createDirectory/uploadFile.
    virtual bool openFileChannel(std::string& err) = 0;
    virtual void closeFileChannel() = 0;
    virtual bool fileChannelOpen() const = 0;

    // Runs a command on a fresh channel with stderr merged into stdout and
    // waits for it to exit.
    virtual bool runCommand(const std::string& command,
                            CommandResult& result,
                            std::string& err) = 0;
};

// Holds the file channel open for one scope; closes it on every exit path
// unless it was already open when the scope started.
class ScopedFileChannel {
public:
    explicit ScopedFileChannel(RemoteSession& session) : session_(session) {}
    ~ScopedFileChannel() {
        if (owned_)
            session_.closeFileChannel();
    }

    ScopedFileChannel(const ScopedFileChannel&) = delete;
    ScopedFileChannel& operator=(const ScopedFileChannel&) = delete;

    bool acquire(std::string& err) {
        if (session_.fileChannelOpen())
            return true;
        if (!session_.openFileChannel(err))
            return false;
        owned_ = true;
        return true;
    }

private:
    RemoteSession& session_;
    bool owned_ = false;
};

} // namespace rdispatch
