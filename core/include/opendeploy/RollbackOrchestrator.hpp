// Restore-then-rollback sequencing from the retained snapshot.
#pragma once
#include "BackupStore.hpp"
#include "ConnectionManager.hpp"
#include "DeployTypes.hpp"
#include "ProgressReporter.hpp"

namespace opendeploy {

class RollbackOrchestrator {
public:
    RollbackOrchestrator(ConnectionManager& conn, const BackupStore& store, ProgressSink* sink = nullptr);

    // Connect, require a snapshot for project+environment, upload
    // <local_path>/version.json first, then the whole snapshot tree to
    // target.remote_path with one progress event per file.
    bool rollback(const DeploymentTarget& target, const ProjectContext& project, OperationError& err);

private:
    ConnectionManager& conn_;
    const BackupStore& store_;
    ProgressSink* sink_;
};

} // namespace opendeploy
