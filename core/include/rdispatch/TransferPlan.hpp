// Ordered directory skeleton and file list computed before any remote
// mutation. Built per transfer, consumed by executePlan, then dropped.
#pragma once
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace rdispatch {

struct FileMapping {
    std::string local_path;
    std::string remote_path;

    bool operator==(const FileMapping& o) const {
        return local_path == o.local_path && remote_path == o.remote_path;
    }
};

struct TransferPlan {
    std::vector<std::string> directories; // creation order, parents first
    std::vector<FileMapping> files;       // upload order

    // Keeps the first occurrence; the skeleton never lists a directory twice.
    void addDirectory(const std::string& remote_dir) {
        if (scheduled_.insert(remote_dir).second)
            directories.push_back(remote_dir);
    }

    void addFile(std::string local, std::string remote) {
        files.push_back(FileMapping{std::move(local), std::move(remote)});
    }

    bool empty() const { return directories.empty() && files.empty(); }

private:
    std::unordered_set<std::string> scheduled_; // index over `directories`
};

} // namespace rdispatch
