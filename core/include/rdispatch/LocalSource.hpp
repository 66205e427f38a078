// Resolution of the literal source argument into a single file, a directory
// or a set of glob matches. Purely local: never touches the remote side.
#pragma once
#include "DispatchError.hpp"
#include <string>
#include <vector>

namespace rdispatch {

enum class SourceKind { SingleFile, Directory, Pattern };

struct SourceSpec {
    SourceKind kind = SourceKind::SingleFile;
    std::string path;                 // normalised literal (file, dir or pattern)
    std::vector<std::string> matches; // Pattern only, sorted
};

// Existing regular file -> SingleFile, existing directory -> Directory,
// anything else is expanded as a glob pattern. An empty expansion fails with
// ErrorKind::SourceNotFound.
bool resolveSource(const std::string& source, SourceSpec& out, DispatchError& err);

// True unless the source is exactly one regular file.
bool requiresRecursive(const SourceSpec& spec);

} // namespace rdispatch
