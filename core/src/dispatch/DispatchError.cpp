#include "rdispatch/DispatchError.hpp"

namespace rdispatch {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::InvalidArgument:
        return "InvalidArgument";
    case ErrorKind::SourceNotFound:
        return "SourceNotFound";
    case ErrorKind::RecursiveFlagRequired:
        return "RecursiveFlagRequired";
    case ErrorKind::LocalAccess:
        return "LocalAccess";
    case ErrorKind::TypeMismatch:
        return "TypeMismatch";
    case ErrorKind::Probe:
        return "Probe";
    case ErrorKind::DirectoryCreation:
        return "DirectoryCreation";
    case ErrorKind::Upload:
        return "Upload";
    case ErrorKind::NotConnected:
        return "NotConnected";
    case ErrorKind::Connection:
        return "Connection";
    case ErrorKind::HostKey:
        return "HostKey";
    case ErrorKind::KeyLoad:
        return "KeyLoad";
    case ErrorKind::Authentication:
        return "Authentication";
    case ErrorKind::Command:
        return "Command";
    }
    return "Unknown";
}

std::string DispatchError::describe() const {
    if (message.empty())
        return errorKindName(kind);
    return std::string(errorKindName(kind)) + ": " + message;
}

} // namespace rdispatch
