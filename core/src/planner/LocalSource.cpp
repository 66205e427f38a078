#include "rdispatch/LocalSource.hpp"
#include "rdispatch/PathUtils.hpp"

#include <glob.h>

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace rdispatch {

namespace {

bool expandPattern(const std::string& pattern,
                   std::vector<std::string>& out,
                   DispatchError& err) {
    glob_t result{};
    const int rc = ::glob(pattern.c_str(), 0, nullptr, &result);
    if (rc == GLOB_NOMATCH) {
        globfree(&result);
        err.set(ErrorKind::SourceNotFound,
                "File or directory not found: " + pattern);
        return false;
    }
    if (rc != 0) {
        globfree(&result);
        err.set(ErrorKind::LocalAccess,
                "Glob pattern '" + pattern + "' failed" +
                    (rc == GLOB_NOSPACE ? " (out of memory)" : " (read error)"));
        return false;
    }
    out.clear();
    out.reserve(result.gl_pathc);
    for (std::size_t i = 0; i < result.gl_pathc; ++i)
        out.push_back(normalizeLocalPath(result.gl_pathv[i]));
    globfree(&result);
    return true;
}

} // namespace

bool resolveSource(const std::string& source, SourceSpec& out, DispatchError& err) {
    if (source.empty()) {
        err.set(ErrorKind::InvalidArgument, "Empty source path");
        return false;
    }
    SourceSpec spec;
    spec.path = normalizeLocalPath(source);

    std::error_code ec;
    const fs::file_status st = fs::status(spec.path, ec);
    if (!ec && fs::is_regular_file(st)) {
        spec.kind = SourceKind::SingleFile;
    } else if (!ec && fs::is_directory(st)) {
        spec.kind = SourceKind::Directory;
    } else if (!hasGlobMagic(spec.path)) {
        err.set(ErrorKind::SourceNotFound,
                "File or directory not found: " + spec.path);
        return false;
    } else {
        spec.kind = SourceKind::Pattern;
        if (!expandPattern(spec.path, spec.matches, err))
            return false;
    }
    out = std::move(spec);
    return true;
}

bool requiresRecursive(const SourceSpec& spec) {
    switch (spec.kind) {
    case SourceKind::SingleFile:
        return false;
    case SourceKind::Directory:
        return true;
    case SourceKind::Pattern: {
        if (spec.matches.size() != 1)
            return true;
        std::error_code ec;
        return !fs::is_regular_file(spec.matches.front(), ec);
    }
    }
    return true;
}

} // namespace rdispatch
