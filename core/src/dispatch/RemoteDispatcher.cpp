#include "rdispatch/RemoteDispatcher.hpp"
#include "rdispatch/PathUtils.hpp"
#include "rdispatch/TransferPlanner.hpp"

namespace rdispatch {

RemoteDispatcher::RemoteDispatcher(std::unique_ptr<RemoteSession> session, SessionOptions opt)
    : session_(std::move(session)), opt_(std::move(opt)) {}

RemoteDispatcher::~RemoteDispatcher() {
    close();
}

bool RemoteDispatcher::open(DispatchError& err) {
    if (!session_) {
        err.set(ErrorKind::NotConnected, "No session backend");
        return false;
    }
    if (session_->isConnected())
        return true;
    // Drop whatever is left of a previous session before reconnecting
    session_->disconnect();
    emitLog(log_, LogLevel::Debug,
            "connecting to " + opt_.username + "@" + opt_.host + ":" + std::to_string(opt_.port));
    if (!session_->connect(opt_, err)) {
        emitLog(log_, LogLevel::Error, err.describe());
        return false;
    }
    return true;
}

bool RemoteDispatcher::resolveLocal(const std::string& source,
                                    const std::string& destination,
                                    bool recursive,
                                    SourceSpec& spec,
                                    std::string& dest,
                                    DispatchError& err) {
    if (destination.empty()) {
        err.set(ErrorKind::InvalidArgument, "Empty remote destination");
        return false;
    }
    dest = normalizeRemotePath(destination);
    if (!resolveSource(source, spec, err)) {
        emitLog(log_, LogLevel::Error, err.message);
        return false;
    }
    if (!recursive && requiresRecursive(spec)) {
        err.set(ErrorKind::RecursiveFlagRequired,
                "Please enable recursive argument to copy recursively: " + spec.path);
        emitLog(log_, LogLevel::Error, err.message);
        return false;
    }
    return true;
}

bool RemoteDispatcher::planWithChannel(const SourceSpec& spec,
                                       const std::string& dest,
                                       TransferPlan& out,
                                       DispatchError& err) {
    TransferPlanner planner(*session_, log_);
    if (!planner.buildPlan(spec, dest, out, err)) {
        emitLog(log_, LogLevel::Error, err.message);
        return false;
    }
    return true;
}

bool RemoteDispatcher::plan(const std::string& source,
                            const std::string& destination,
                            bool recursive,
                            TransferPlan& out,
                            DispatchError& err) {
    SourceSpec spec;
    std::string dest;
    if (!resolveLocal(source, destination, recursive, spec, dest, err))
        return false;
    if (!open(err))
        return false;

    ScopedFileChannel channel(*session_);
    std::string cerr;
    if (!channel.acquire(cerr)) {
        err.set(ErrorKind::Connection, cerr);
        return false;
    }
    return planWithChannel(spec, dest, out, err);
}

bool RemoteDispatcher::scp(const std::string& source,
                           const std::string& destination,
                           bool recursive,
                           DispatchError& err) {
    SourceSpec spec;
    std::string dest;
    if (!resolveLocal(source, destination, recursive, spec, dest, err))
        return false;
    if (!open(err))
        return false;

    // Released on every return below
    ScopedFileChannel channel(*session_);
    std::string cerr;
    if (!channel.acquire(cerr)) {
        err.set(ErrorKind::Connection, cerr);
        emitLog(log_, LogLevel::Error, err.message);
        return false;
    }

    TransferPlan p;
    if (!planWithChannel(spec, dest, p, err))
        return false;
    // Create directory skeleton, then upload the files
    return executePlan(p, *session_, err, log_);
}

bool RemoteDispatcher::execute(const std::string& command,
                               CommandResult& result,
                               DispatchError& err) {
    if (command.empty()) {
        err.set(ErrorKind::InvalidArgument, "Empty command");
        return false;
    }
    if (!open(err))
        return false;

    emitLog(log_, LogLevel::Info, "'" + command + "'");
    std::string cerr;
    if (!session_->runCommand(command, result, cerr)) {
        err.set(ErrorKind::Command, cerr);
        emitLog(log_, LogLevel::Error, err.message);
        return false;
    }
    if (!result.output.empty()) {
        emitLog(log_, sensitiveLoggingEnabled() ? LogLevel::Info : LogLevel::Debug,
                "\n\n" + result.output);
    }
    if (!result.exit_signal.empty()) {
        emitLog(log_, LogLevel::Warning,
                "'" + command + "' killed by signal " + result.exit_signal);
    }
    emitLog(log_, LogLevel::Debug, "exit status " + std::to_string(result.exit_status));
    return true;
}

void RemoteDispatcher::close() {
    if (!session_)
        return;
    session_->closeFileChannel();
    session_->disconnect();
}

} // namespace rdispatch
