// Error kinds reported by the planner, the executor and the session.
#pragma once
#include <string>
#include <utility>

namespace rdispatch {

enum class ErrorKind {
    None,
    InvalidArgument,
    SourceNotFound,        // source path or pattern matched nothing
    RecursiveFlagRequired, // multi-item source without the recursive flag
    LocalAccess,           // local tree could not be read
    TypeMismatch,          // remote path exists with the wrong type
    Probe,                 // remote stat failed (not "does not exist")
    DirectoryCreation,
    Upload,
    NotConnected,
    Connection,
    HostKey,
    KeyLoad,
    Authentication,
    Command
};

const char* errorKindName(ErrorKind kind);

struct DispatchError {
    ErrorKind   kind = ErrorKind::None;
    std::string message;

    void set(ErrorKind k, std::string msg) {
        kind = k;
        message = std::move(msg);
    }
    void clear() {
        kind = ErrorKind::None;
        message.clear();
    }
    bool empty() const { return kind == ErrorKind::None; }

    // "<Kind>: <message>", used by the CLI and the log.
    std::string describe() const;
};

} // namespace rdispatch
