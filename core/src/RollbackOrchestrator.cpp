#include "opendeploy/RollbackOrchestrator.hpp"
#include "opendeploy/DeployOrchestrator.hpp"
#include "opendeploy/Log.hpp"
#include "opendeploy/TransferEngine.hpp"
#include "opendeploy/TreeWalker.hpp"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace opendeploy {

RollbackOrchestrator::RollbackOrchestrator(ConnectionManager& conn, const BackupStore& store, ProgressSink* sink)
    : conn_(conn), store_(store), sink_(sink) {}

bool RollbackOrchestrator::rollback(const DeploymentTarget& target,
                                    const ProjectContext& project,
                                    OperationError& err) {
    err.clear();
    if (!validateProject(project, err) || !validateRemotePath(target, err)) return false;

    const fs::path marker = fs::path(project.local_path) / kVersionMarker;
    std::error_code ec;
    if (project.local_path.empty() || !fs::is_regular_file(marker, ec)) {
        return err.set(ErrorKind::Path, "Version file not found: " + marker.string());
    }

    // Same retry policy as deploy
    ScopedSession session;
    if (!conn_.connect(target, session, err)) return false;

    if (!store_.exists(project.project_name, project.environment)) {
        LOGE("No backup for %s/%s", project.project_name.c_str(), project.environment.c_str());
        return err.set(ErrorKind::BackupMissing,
                       "No backup available for project '" + project.project_name +
                       "' in environment '" + project.environment + "'");
    }
    std::string snapshot, e;
    if (!store_.locationFor(project.project_name, project.environment, snapshot, e)) {
        return err.set(ErrorKind::Transfer, e);
    }
    std::size_t total = 0;
    if (!countFiles(snapshot, total, e)) {
        return err.set(ErrorKind::Transfer, e);
    }
    if (total == 0) {
        return err.set(ErrorKind::Path, "Backup for project '" + project.project_name +
                                        "' in environment '" + project.environment + "' is empty");
    }

    TransferEngine engine(session.client());
    if (!engine.ensureRemoteDir(target.remote_path, err)) return false;
    const std::string remoteMarker = TransferEngine::joinRemote(target.remote_path, kVersionMarker);
    if (!engine.uploadFile(marker.string(), remoteMarker, err)) {
        err.message = "Uploading version file failed: " + err.message;
        return false;
    }
    LOGI("Uploaded %s to %s", marker.string().c_str(), remoteMarker.c_str());

    ProgressReporter reporter(total, sink_);
    std::size_t done = 0;
    if (!engine.uploadTree(snapshot, target.remote_path, &reporter, done, err)) {
        err.message = "Rollback failed after " + std::to_string(done) + "/" + std::to_string(total) +
                      " file(s): " + err.message;
        LOGE("%s", err.message.c_str());
        return false;
    }
    LOGI("Rolled back %s/%s: %zu file(s) to %s", project.project_name.c_str(),
         project.environment.c_str(), done, target.remote_path.c_str());
    return true;
}

} // namespace opendeploy
