// Transfer planning: source-kind dispatch and directory skeleton
// reconciliation. The only remote calls made here are probes.
#include "rdispatch/TransferPlanner.hpp"
#include "rdispatch/PathUtils.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace rdispatch {

namespace {

struct DirEntries {
    std::vector<std::string> files;
    std::vector<std::string> dirs;
    std::vector<std::string> linkedDirs; // symlinks to directories: created, not descended
    std::vector<std::string> skipped;
};

bool listLocalDir(const std::string& dir, DirEntries& out, DispatchError& err) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        err.set(ErrorKind::LocalAccess,
                "Cannot read local directory '" + dir + "': " + ec.message());
        return false;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec)
            break;
        const std::string name = it->path().filename().string();
        std::error_code sec;
        const bool isLink = it->is_symlink(sec);
        const fs::file_status st = it->status(sec); // follows links
        if (sec) {
            out.skipped.push_back(name);
            continue;
        }
        if (fs::is_directory(st)) {
            (isLink ? out.linkedDirs : out.dirs).push_back(name);
        } else if (fs::is_regular_file(st)) {
            out.files.push_back(name);
        } else {
            out.skipped.push_back(name);
        }
    }
    if (ec) {
        err.set(ErrorKind::LocalAccess,
                "Error while reading local directory '" + dir + "': " + ec.message());
        return false;
    }
    std::sort(out.files.begin(), out.files.end());
    std::sort(out.dirs.begin(), out.dirs.end());
    std::sort(out.linkedDirs.begin(), out.linkedDirs.end());
    return true;
}

std::string mismatchMessage(const std::string& local, const std::string& remote) {
    return "Copy aborted. Mismatch in file type Local: '" + local +
           "' Remote: '" + remote + "'";
}

} // namespace

bool TransferPlanner::probeRemote(const std::string& remote_path,
                                  RemoteEntryState& state,
                                  DispatchError& err) {
    std::string perr;
    if (!probe_.probe(remote_path, state, perr)) {
        err.set(ErrorKind::Probe,
                "Error checking file status for " + remote_path + " on remote host" +
                    (perr.empty() ? std::string() : ": " + perr));
        return false;
    }
    return true;
}

bool TransferPlanner::buildPlan(const SourceSpec& source,
                                const std::string& destination,
                                TransferPlan& out,
                                DispatchError& err) {
    if (destination.empty()) {
        err.set(ErrorKind::InvalidArgument, "Empty remote destination");
        return false;
    }
    TransferPlan plan;
    bool ok = false;
    switch (source.kind) {
    case SourceKind::SingleFile:
        ok = planSingleFile(source, destination, plan, err);
        break;
    case SourceKind::Directory:
        ok = planDirectory(source, destination, plan, err);
        break;
    case SourceKind::Pattern:
        ok = planPattern(source, destination, plan, err);
        break;
    }
    if (!ok)
        return false;
    emitLog(log_, LogLevel::Debug,
            "plan: " + std::to_string(plan.directories.size()) + " directories, " +
                std::to_string(plan.files.size()) + " files");
    out = std::move(plan);
    return true;
}

bool TransferPlanner::planSingleFile(const SourceSpec& source,
                                     const std::string& destination,
                                     TransferPlan& plan,
                                     DispatchError& err) {
    RemoteEntryState st = RemoteEntryState::Absent;
    if (!probeRemote(destination, st, err))
        return false;
    const std::string target = (st == RemoteEntryState::Directory)
                                   ? joinRemotePath(destination, localBaseName(source.path))
                                   : destination;
    plan.addFile(source.path, target);
    return true;
}

bool TransferPlanner::planDirectory(const SourceSpec& source,
                                    const std::string& destination,
                                    TransferPlan& plan,
                                    DispatchError& err) {
    RemoteEntryState st = RemoteEntryState::Absent;
    if (!probeRemote(destination, st, err))
        return false;
    if (st == RemoteEntryState::Directory) {
        const std::string root = joinRemotePath(destination, localBaseName(source.path));
        return reconcileDirectory(source.path, root, plan, err);
    }
    // destination becomes the new subtree root; its state is already known
    return reconcileDirectory(source.path, destination, st, plan, err);
}

bool TransferPlanner::planPattern(const SourceSpec& source,
                                  const std::string& destination,
                                  TransferPlan& plan,
                                  DispatchError& err) {
    if (source.matches.empty()) {
        err.set(ErrorKind::SourceNotFound, "File or directory not found: " + source.path);
        return false;
    }

    RemoteEntryState destState = RemoteEntryState::Absent;
    if (!probeRemote(destination, destState, err))
        return false;
    if (destState == RemoteEntryState::Other) {
        err.set(ErrorKind::TypeMismatch, mismatchMessage(source.path, destination));
        return false;
    }
    const bool destScheduled = (destState == RemoteEntryState::Absent);
    if (destScheduled)
        plan.addDirectory(destination);

    for (const std::string& match : source.matches) {
        std::error_code ec;
        const fs::file_status st = fs::status(match, ec);
        const std::string target = joinRemotePath(destination, localBaseName(match));
        if (!ec && fs::is_directory(st)) {
            const bool ok = destScheduled
                                ? reconcileDirectory(match, target, RemoteEntryState::Absent, plan, err)
                                : reconcileDirectory(match, target, plan, err);
            if (!ok)
                return false;
        } else if (!ec && fs::is_regular_file(st)) {
            plan.addFile(match, target);
        } else {
            emitLog(log_, LogLevel::Warning,
                    "Skipping '" + match + "': not a regular file or directory");
        }
    }
    return true;
}

bool TransferPlanner::reconcileDirectory(const std::string& local_root,
                                         const std::string& remote_root,
                                         TransferPlan& plan,
                                         DispatchError& err) {
    RemoteEntryState st = RemoteEntryState::Absent;
    if (!probeRemote(remote_root, st, err))
        return false;
    return reconcileDirectory(local_root, remote_root, st, plan, err);
}

bool TransferPlanner::reconcileDirectory(const std::string& local_root,
                                         const std::string& remote_root,
                                         RemoteEntryState root_state,
                                         TransferPlan& plan,
                                         DispatchError& err) {
    if (root_state == RemoteEntryState::Other) {
        err.set(ErrorKind::TypeMismatch, mismatchMessage(local_root, remote_root));
        return false;
    }
    ParentState root{local_root, root_state == RemoteEntryState::Directory};
    if (!root.knownToExist)
        plan.addDirectory(remote_root);
    return walk(local_root, remote_root, root, plan, err);
}

// Top-down: the files of `local_dir` are mapped first, then each
// subdirectory is decided and descended into. Once a directory is scheduled
// for creation everything below it is absent too, so no probe is issued for
// its children. Siblings under an existing directory are each probed once:
// an absent sibling says nothing about the next one.
bool TransferPlanner::walk(const std::string& local_dir,
                           const std::string& remote_dir,
                           const ParentState& parent,
                           TransferPlan& plan,
                           DispatchError& err) {
    DirEntries entries;
    if (!listLocalDir(local_dir, entries, err))
        return false;

    for (const std::string& name : entries.files)
        plan.addFile((fs::path(local_dir) / name).string(), joinRemotePath(remote_dir, name));
    for (const std::string& name : entries.skipped) {
        emitLog(log_, LogLevel::Warning,
                "Skipping '" + (fs::path(local_dir) / name).string() +
                    "': not a regular file or directory");
    }

    auto decide = [&](const std::string& localChild, const std::string& remoteChild,
                      ParentState& childState) -> bool {
        childState.parentPath = localChild;
        if (!parent.knownToExist) {
            emitLog(log_, LogLevel::Debug,
                    remoteChild + ": parent " + parent.parentPath + " is scheduled, not probing");
            plan.addDirectory(remoteChild);
            childState.knownToExist = false;
            return true;
        }
        RemoteEntryState st = RemoteEntryState::Absent;
        if (!probeRemote(remoteChild, st, err))
            return false;
        switch (st) {
        case RemoteEntryState::Absent:
            plan.addDirectory(remoteChild);
            childState.knownToExist = false;
            return true;
        case RemoteEntryState::Directory:
            childState.knownToExist = true;
            return true;
        case RemoteEntryState::Other:
            break;
        }
        err.set(ErrorKind::TypeMismatch, mismatchMessage(localChild, remoteChild));
        return false;
    };

    for (const std::string& name : entries.dirs) {
        const std::string localChild = (fs::path(local_dir) / name).string();
        const std::string remoteChild = joinRemotePath(remote_dir, name);
        ParentState childState;
        if (!decide(localChild, remoteChild, childState))
            return false;
        if (!walk(localChild, remoteChild, childState, plan, err))
            return false;
    }
    for (const std::string& name : entries.linkedDirs) {
        const std::string localChild = (fs::path(local_dir) / name).string();
        ParentState childState;
        if (!decide(localChild, joinRemotePath(remote_dir, name), childState))
            return false;
        emitLog(log_, LogLevel::Debug, "Not descending into symlinked directory " + localChild);
    }
    return true;
}

bool executePlan(const TransferPlan& plan,
                 TransferExecutor& executor,
                 DispatchError& err,
                 const LogCB& log) {
    for (const std::string& dir : plan.directories) {
        emitLog(log, LogLevel::Debug, dir);
        std::string e;
        if (!executor.createDirectory(dir, e)) {
            err.set(ErrorKind::DirectoryCreation,
                    "Couldn't create dest directory: '" + dir + "'" +
                        (e.empty() ? std::string() : " (" + e + ")"));
            emitLog(log, LogLevel::Error, err.message);
            return false;
        }
    }

    for (const FileMapping& f : plan.files) {
        std::error_code ec;
        const auto size = fs::file_size(f.local_path, ec);
        char kb[32];
        std::snprintf(kb, sizeof(kb), "%0.3f", ec ? 0.0 : static_cast<double>(size) / 1024.0);
        emitLog(log, LogLevel::Info, localBaseName(f.local_path) + " [" + kb + " KB]");

        std::string e;
        if (!executor.uploadFile(f.local_path, f.remote_path, e)) {
            err.set(ErrorKind::Upload,
                    "Couldn't copy from local: '" + f.local_path + "' to remote: '" +
                        f.remote_path + "'" + (e.empty() ? std::string() : " (" + e + ")"));
            emitLog(log, LogLevel::Error, err.message);
            return false;
        }
    }
    return true;
}

} // namespace rdispatch
