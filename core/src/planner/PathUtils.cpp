#include "rdispatch/PathUtils.hpp"

#include <filesystem>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace rdispatch {

std::string normalizeRemotePath(const std::string& path) {
    if (path.empty())
        return path;
    const bool absolute = path.front() == '/';

    std::vector<std::string> parts;
    std::size_t pos = 0;
    while (pos <= path.size()) {
        std::size_t next = path.find('/', pos);
        if (next == std::string::npos)
            next = path.size();
        std::string comp = path.substr(pos, next - pos);
        pos = next + 1;
        if (comp.empty() || comp == ".")
            continue;
        if (comp == "..") {
            if (!parts.empty() && parts.back() != "..") {
                parts.pop_back();
                continue;
            }
            if (absolute)
                continue; // "/.." is "/"
        }
        parts.push_back(std::move(comp));
    }

    std::string out = absolute ? "/" : "";
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i)
            out += '/';
        out += parts[i];
    }
    if (out.empty())
        out = ".";
    return out;
}

std::string joinRemotePath(const std::string& base, const std::string& name) {
    if (base.empty())
        return std::string("/") + name;
    if (base.back() == '/')
        return base + name;
    return base + "/" + name;
}

std::string normalizeLocalPath(const std::string& path) {
    if (path.empty())
        return path;
    std::string out = fs::path(path).lexically_normal().string();
    while (out.size() > 1 && out.back() == '/')
        out.pop_back();
    if (out.empty())
        out = ".";
    return out;
}

// "." and ".." name the directory they resolve to, never themselves.
std::string localBaseName(const std::string& path) {
    const fs::path p(normalizeLocalPath(path));
    const std::string name = p.filename().string();
    if (name != "." && name != "..")
        return name;
    std::error_code ec;
    const fs::path abs = fs::absolute(p, ec);
    if (ec)
        return name;
    return fs::path(normalizeLocalPath(abs.lexically_normal().string())).filename().string();
}

bool hasGlobMagic(const std::string& pattern) {
    return pattern.find_first_of("*?[") != std::string::npos;
}

} // namespace rdispatch
