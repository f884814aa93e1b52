// Backup-then-deploy sequencing, plus the standalone remote backup.
#pragma once
#include "BackupStore.hpp"
#include "ConnectionManager.hpp"
#include "DeployTypes.hpp"
#include "ProgressReporter.hpp"

namespace opendeploy {

class DeployOrchestrator {
public:
    // sink may be null; conn and store must outlive the orchestrator.
    DeployOrchestrator(ConnectionManager& conn, const BackupStore& store, ProgressSink* sink = nullptr);

    // Local checks, connect, snapshot target.remote_path into the backup
    // store, then upload project.local_path with one progress event per file.
    // A failed upload leaves the snapshot in place.
    bool deploy(const DeploymentTarget& target, const ProjectContext& project, OperationError& err);

    // Connect and snapshot target.remote_path; project.local_path is unused.
    bool backup(const DeploymentTarget& target, const ProjectContext& project, OperationError& err);

private:
    ConnectionManager& conn_;
    const BackupStore& store_;
    ProgressSink* sink_;

    bool captureSnapshot(SftpClient& client,
                         const DeploymentTarget& target,
                         const ProjectContext& project,
                         OperationError& err);
};

// Checks shared by every command before any network I/O.
bool validateProject(const ProjectContext& project, OperationError& err);
bool validateRemotePath(const DeploymentTarget& target, OperationError& err);

} // namespace opendeploy
