// Wires the core orchestrators to Qt signals for the front end.
#include "DeployController.hpp"
#include "opendeploy/BackupStore.hpp"
#include "opendeploy/ConnectionManager.hpp"
#include "opendeploy/DeployOrchestrator.hpp"
#include "opendeploy/Log.hpp"
#include "opendeploy/RollbackOrchestrator.hpp"
#include <QCoreApplication>
#include <QDir>

using namespace opendeploy;

static DeploymentTarget makeTarget(const QString& host, const QString& username,
                                   const QString& password, const QString& remotePath) {
    DeploymentTarget t;
    t.host = host.trimmed().toStdString();
    t.username = username.toStdString();
    t.password = password.toStdString();
    t.remote_path = remotePath.toStdString();
    return t;
}

static ProjectContext makeProject(const QString& projectName, const QString& environment,
                                  const QString& localPath) {
    ProjectContext p;
    p.project_name = projectName.toStdString();
    p.environment = environment.toStdString();
    p.local_path = localPath.toStdString();
    return p;
}

DeployController::DeployController(QObject* parent)
    : DeployController([] { return ConnectionManager(); }, getAppDir(), parent) {}

DeployController::DeployController(ManagerFactory factory, const QString& appDir, QObject* parent)
    : QObject(parent), managerFactory_(std::move(factory)), appDir_(appDir) {}

DeployController::~DeployController() {
    std::map<std::uint64_t, std::thread> workers;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        workers.swap(workers_);
        done_.clear();
    }
    // Joined outside the lock: a finishing worker takes it to report itself
    for (auto& kv : workers) {
        if (kv.second.joinable()) kv.second.join();
    }
}

std::size_t DeployController::workerCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return workers_.size();
}

void DeployController::reapFinishedLocked() {
    std::vector<std::uint64_t> pending;
    for (std::uint64_t id : done_) {
        auto it = workers_.find(id);
        if (it == workers_.end()) continue;
        // A slot running on that worker may start the next command
        if (it->second.get_id() == std::this_thread::get_id()) {
            pending.push_back(id);
            continue;
        }
        if (it->second.joinable()) it->second.join();
        workers_.erase(it);
    }
    done_.swap(pending);
}

QString DeployController::getAppDir() {
#ifdef NDEBUG
    return QCoreApplication::applicationDirPath();
#else
    return QDir::currentPath();
#endif
}

bool DeployController::getBackupDir(const QString& projectName, const QString& environment,
                                    QString& out, QString& err) const {
    BackupStore store(appDir_.toStdString());
    std::string dir, e;
    if (!store.locationFor(projectName.toStdString(), environment.toStdString(), dir, e)) {
        err = QString::fromStdString(e);
        return false;
    }
    out = QString::fromStdString(dir);
    return true;
}

void DeployController::onProgress(const TransferProgress& p) {
    emit progress(int(p.current), int(p.total), p.percentage);
}

void DeployController::runAsync(const QString& label, Operation op) {
    std::lock_guard<std::mutex> lk(mtx_);
    reapFinishedLocked();
    const std::uint64_t id = ++nextId_;
    workers_[id] = std::thread([this, id, label, op = std::move(op)]() {
        OperationError err;
        const bool ok = op(err);
        if (!ok) {
            LOGE("%s failed (%s): %s", label.toStdString().c_str(),
                 errorKindName(err.kind), err.message.c_str());
        }
        {
            std::lock_guard<std::mutex> lk(mtx_);
            done_.push_back(id);
        }
        if (ok) emit finished(true, tr("%1 completed").arg(label));
        else emit finished(false, QString::fromStdString(err.message));
    });
}

void DeployController::deploy(const QString& projectName, const QString& localPath,
                              const QString& environment, const QString& host,
                              const QString& username, const QString& password,
                              const QString& remotePath) {
    const DeploymentTarget target = makeTarget(host, username, password, remotePath);
    const ProjectContext project = makeProject(projectName, environment, localPath);
    const std::string appDir = appDir_.toStdString();
    runAsync(tr("Deploy"), [this, factory = managerFactory_, target, project, appDir](OperationError& err) {
        ConnectionManager conn = factory();
        BackupStore store(appDir);
        DeployOrchestrator orch(conn, store, this);
        return orch.deploy(target, project, err);
    });
}

void DeployController::rollback(const QString& projectName, const QString& localPath,
                                const QString& environment, const QString& host,
                                const QString& username, const QString& password,
                                const QString& remotePath) {
    const DeploymentTarget target = makeTarget(host, username, password, remotePath);
    const ProjectContext project = makeProject(projectName, environment, localPath);
    const std::string appDir = appDir_.toStdString();
    runAsync(tr("Rollback"), [this, factory = managerFactory_, target, project, appDir](OperationError& err) {
        ConnectionManager conn = factory();
        BackupStore store(appDir);
        RollbackOrchestrator orch(conn, store, this);
        return orch.rollback(target, project, err);
    });
}

void DeployController::backupRemoteFiles(const QString& projectName, const QString& environment,
                                         const QString& host, const QString& username,
                                         const QString& password, const QString& remotePath) {
    const DeploymentTarget target = makeTarget(host, username, password, remotePath);
    const ProjectContext project = makeProject(projectName, environment, QString());
    const std::string appDir = appDir_.toStdString();
    runAsync(tr("Backup"), [this, factory = managerFactory_, target, project, appDir](OperationError& err) {
        ConnectionManager conn = factory();
        BackupStore store(appDir);
        DeployOrchestrator orch(conn, store, this);
        return orch.backup(target, project, err);
    });
}
