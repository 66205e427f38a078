// Reconciles a local source against the remote destination and produces the
// transfer plan. Probes are the only remote calls made here.
#pragma once
#include "DispatchError.hpp"
#include "LocalSource.hpp"
#include "RemoteFilesystemProbe.hpp"
#include "RuntimeLogging.hpp"
#include "TransferExecutor.hpp"
#include "TransferPlan.hpp"

#include <string>
#include <utility>

namespace rdispatch {

class TransferPlanner {
public:
    explicit TransferPlanner(RemoteFilesystemProbe& probe, LogCB log = {})
        : probe_(probe), log_(std::move(log)) {}

    // Dispatches on the source kind. `out` is only assigned on success; on
    // failure any partially built plan is discarded.
    bool buildPlan(const SourceSpec& source,
                   const std::string& destination,
                   TransferPlan& out,
                   DispatchError& err);

    // Directory skeleton + file list for `local_root` mirrored at
    // `remote_root`. Probes the remote root once before walking.
    bool reconcileDirectory(const std::string& local_root,
                            const std::string& remote_root,
                            TransferPlan& plan,
                            DispatchError& err);

    // Same, with the remote root state already known by the caller.
    bool reconcileDirectory(const std::string& local_root,
                            const std::string& remote_root,
                            RemoteEntryState root_state,
                            TransferPlan& plan,
                            DispatchError& err);

private:
    // Existence judgement for the local directory whose children are being
    // visited. Passed down the walk by value, one per level.
    struct ParentState {
        std::string parentPath;
        bool knownToExist = false;
    };

    bool planSingleFile(const SourceSpec& source, const std::string& destination,
                        TransferPlan& plan, DispatchError& err);
    bool planDirectory(const SourceSpec& source, const std::string& destination,
                       TransferPlan& plan, DispatchError& err);
    bool planPattern(const SourceSpec& source, const std::string& destination,
                     TransferPlan& plan, DispatchError& err);

    bool walk(const std::string& local_dir, const std::string& remote_dir,
              const ParentState& parent, TransferPlan& plan, DispatchError& err);

    bool probeRemote(const std::string& remote_path, RemoteEntryState& state,
                     DispatchError& err);

    RemoteFilesystemProbe& probe_;
    LogCB log_;
};

// Creates every directory of the plan in order, then uploads every file in
// order. Stops at the first failure (DirectoryCreation / Upload).
bool executePlan(const TransferPlan& plan,
                 TransferExecutor& executor,
                 DispatchError& err,
                 const LogCB& log = {});

} // namespace rdispatch
