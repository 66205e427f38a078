// Path helpers. Remote paths are always POSIX ('/'-separated) strings.
#pragma once
#include <string>

namespace rdispatch {

// Lexical normalisation: collapses repeated separators, "." and ".."
// components and drops any trailing '/'. "" stays "", "/" stays "/".
std::string normalizeRemotePath(const std::string& path);

std::string joinRemotePath(const std::string& base, const std::string& name);

// Lexically normalised local path without a trailing separator.
std::string normalizeLocalPath(const std::string& path);

// Last component of a normalised local path ("a/b" -> "b").
std::string localBaseName(const std::string& path);

// True if the string contains glob(3) metacharacters.
bool hasGlobMagic(const std::string& pattern);

} // namespace rdispatch
