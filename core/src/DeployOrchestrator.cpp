// deploy: local checks -> connect -> snapshot remote -> upload local tree.
#include "opendeploy/DeployOrchestrator.hpp"
#include "opendeploy/Log.hpp"
#include "opendeploy/TransferEngine.hpp"
#include "opendeploy/TreeWalker.hpp"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace opendeploy {

bool validateProject(const ProjectContext& project, OperationError& err) {
    if (!BackupStore::validName(project.project_name)) {
        return err.set(ErrorKind::Path, "Invalid project name: '" + project.project_name + "'");
    }
    if (!BackupStore::validName(project.environment)) {
        return err.set(ErrorKind::Path, "Invalid environment name: '" + project.environment + "'");
    }
    return true;
}

bool validateRemotePath(const DeploymentTarget& target, OperationError& err) {
    if (target.remote_path.empty()) {
        return err.set(ErrorKind::Path, "Remote path is required");
    }
    return true;
}

DeployOrchestrator::DeployOrchestrator(ConnectionManager& conn, const BackupStore& store, ProgressSink* sink)
    : conn_(conn), store_(store), sink_(sink) {}

bool DeployOrchestrator::captureSnapshot(SftpClient& client,
                                         const DeploymentTarget& target,
                                         const ProjectContext& project,
                                         OperationError& err) {
    std::string dir, e;
    if (!store_.locationFor(project.project_name, project.environment, dir, e)) {
        return err.set(ErrorKind::Transfer, e);
    }

    bool isDir = false;
    if (!client.exists(target.remote_path, isDir, e)) {
        if (!e.empty()) return err.set(ErrorKind::Transfer, e);
        // First deploy to a fresh path: nothing to capture, keep any older snapshot
        LOGI("Remote %s absent; snapshot %s left unchanged", target.remote_path.c_str(), dir.c_str());
        return true;
    }
    if (!isDir) {
        return err.set(ErrorKind::Transfer, "Remote path is not a directory: " + target.remote_path);
    }

    // Single generation: download beside the live snapshot, swap on success
    std::string staging;
    if (!store_.beginStaging(project.project_name, project.environment, staging, e)) {
        return err.set(ErrorKind::Transfer, e);
    }
    TransferEngine engine(client);
    std::size_t n = 0;
    if (!engine.downloadTree(target.remote_path, staging, n, err)) {
        LOGE("Backup of %s failed: %s", target.remote_path.c_str(), err.message.c_str());
        store_.discardStaging(project.project_name, project.environment);
        return false;
    }
    if (!store_.commitStaging(project.project_name, project.environment, e)) {
        store_.discardStaging(project.project_name, project.environment);
        return err.set(ErrorKind::Transfer, e);
    }
    LOGI("Backup of %s: %zu file(s) in %s", target.remote_path.c_str(), n, dir.c_str());
    return true;
}

bool DeployOrchestrator::deploy(const DeploymentTarget& target,
                                const ProjectContext& project,
                                OperationError& err) {
    err.clear();
    if (!validateProject(project, err) || !validateRemotePath(target, err)) return false;

    std::error_code ec;
    if (project.local_path.empty() || !fs::exists(project.local_path, ec)) {
        return err.set(ErrorKind::Path, "Local path does not exist: " + project.local_path);
    }
    if (!fs::is_directory(project.local_path, ec)) {
        return err.set(ErrorKind::Path, "Local path is not a directory: " + project.local_path);
    }
    std::size_t total = 0;
    std::string e;
    if (!countFiles(project.local_path, total, e)) {
        return err.set(ErrorKind::Transfer, e);
    }
    if (total == 0) {
        return err.set(ErrorKind::Path, "No files to deploy in " + project.local_path);
    }

    ScopedSession session;
    if (!conn_.connect(target, session, err)) return false;

    if (!captureSnapshot(session.client(), target, project, err)) {
        err.message = "Backup before deploy failed: " + err.message;
        return false;
    }

    ProgressReporter reporter(total, sink_);
    TransferEngine engine(session.client());
    std::size_t done = 0;
    if (!engine.uploadTree(project.local_path, target.remote_path, &reporter, done, err)) {
        err.message = "Upload failed after " + std::to_string(done) + "/" + std::to_string(total) +
                      " file(s): " + err.message;
        LOGE("%s", err.message.c_str());
        return false;
    }
    LOGI("Deployed %s/%s: %zu file(s) to %s", project.project_name.c_str(),
         project.environment.c_str(), done, target.remote_path.c_str());
    return true;
}

bool DeployOrchestrator::backup(const DeploymentTarget& target,
                                const ProjectContext& project,
                                OperationError& err) {
    err.clear();
    if (!validateProject(project, err) || !validateRemotePath(target, err)) return false;

    ScopedSession session;
    if (!conn_.connect(target, session, err)) return false;
    return captureSnapshot(session.client(), target, project, err);
}

} // namespace opendeploy
