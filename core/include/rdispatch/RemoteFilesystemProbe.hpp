// Existence/type queries against the remote filesystem. The planner only
// depends on this interface, so a live session and a test double plug in the
// same way.
#pragma once
#include "RemoteTypes.hpp"
#include <string>

namespace rdispatch {

class RemoteFilesystemProbe {
public:
    virtual ~RemoteFilesystemProbe() = default;

    // One blocking round trip. A missing path is a normal answer reported
    // through `state` with `err` left empty; false means the query itself
    // failed and `err` says why.
    virtual bool probe(const std::string& remote_path,
                       RemoteEntryState& state,
                       std::string& err) = 0;

    bool exists(const std::string& remote_path, std::string& err) {
        RemoteEntryState st = RemoteEntryState::Absent;
        if (!probe(remote_path, st, err))
            return false;
        return st != RemoteEntryState::Absent;
    }

    // False (and no error) for missing paths.
    bool isDirectory(const std::string& remote_path, std::string& err) {
        RemoteEntryState st = RemoteEntryState::Absent;
        if (!probe(remote_path, st, err))
            return false;
        return st == RemoteEntryState::Directory;
    }
};

} // namespace rdispatch
