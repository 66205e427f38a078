// Secure copy and command execution on one remote host. Owns the session for
// its lifetime; the file channel is held only for the duration of a copy.
#pragma once
#include "DispatchError.hpp"
#include "LocalSource.hpp"
#include "RemoteSession.hpp"
#include "RuntimeLogging.hpp"
#include "TransferPlan.hpp"

#include <memory>
#include <string>
#include <utility>

namespace rdispatch {

class RemoteDispatcher {
public:
    RemoteDispatcher(std::unique_ptr<RemoteSession> session, SessionOptions opt);
    ~RemoteDispatcher();

    RemoteDispatcher(const RemoteDispatcher&) = delete;
    RemoteDispatcher& operator=(const RemoteDispatcher&) = delete;

    void setLogger(LogCB log) { log_ = std::move(log); }

    // Establishes the session; reconnects if it was dropped.
    bool open(DispatchError& err);

    // Copies a file, a directory (recursive) or the matches of a glob
    // pattern to `destination`. The recursive flag is checked before any
    // remote contact.
    bool scp(const std::string& source,
             const std::string& destination,
             bool recursive,
             DispatchError& err);

    // Plan only; nothing is created or uploaded.
    bool plan(const std::string& source,
              const std::string& destination,
              bool recursive,
              TransferPlan& out,
              DispatchError& err);

    bool execute(const std::string& command, CommandResult& result, DispatchError& err);

    void close();

    RemoteSession& session() { return *session_; }

private:
    // Local-only checks: source resolution and the recursive flag.
    bool resolveLocal(const std::string& source, const std::string& destination,
                      bool recursive, SourceSpec& spec, std::string& dest,
                      DispatchError& err);
    bool planWithChannel(const SourceSpec& spec, const std::string& dest,
                         TransferPlan& out, DispatchError& err);

    std::unique_ptr<RemoteSession> session_;
    SessionOptions opt_;
    LogCB log_;
};

} // namespace rdispatch
