// Commands exposed to the front end. Each long operation runs on its own
// worker thread and ends with exactly one finished() signal.
#pragma once
#include <QObject>
#include <QString>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <vector>
#include "opendeploy/ConnectionManager.hpp"
#include "opendeploy/DeployTypes.hpp"
#include "opendeploy/ProgressReporter.hpp"

class DeployController : public QObject, public opendeploy::ProgressSink {
    Q_OBJECT
public:
    using ManagerFactory = std::function<opendeploy::ConnectionManager()>;

    explicit DeployController(QObject* parent = nullptr);
    // Custom session source and backup root (the default uses libssh2 and getAppDir()).
    DeployController(ManagerFactory factory, const QString& appDir, QObject* parent = nullptr);
    ~DeployController() override;

    void deploy(const QString& projectName, const QString& localPath, const QString& environment,
                const QString& host, const QString& username, const QString& password,
                const QString& remotePath);

    void rollback(const QString& projectName, const QString& localPath, const QString& environment,
                  const QString& host, const QString& username, const QString& password,
                  const QString& remotePath);

    void backupRemoteFiles(const QString& projectName, const QString& environment,
                           const QString& host, const QString& username, const QString& password,
                           const QString& remotePath);

    // Synchronous; creates the directory.
    bool getBackupDir(const QString& projectName, const QString& environment,
                      QString& out, QString& err) const;

    // Working directory in development builds, executable directory when installed.
    static QString getAppDir();

    // Called on the worker thread; re-emitted as progress().
    void onProgress(const opendeploy::TransferProgress& p) override;

    // Worker threads not yet joined.
    std::size_t workerCount() const;

signals:
    void progress(int current, int total, double percentage);
    void finished(bool ok, const QString& message);

private:
    using Operation = std::function<bool(opendeploy::OperationError&)>;
    void runAsync(const QString& label, Operation op);
    void reapFinishedLocked();

    ManagerFactory managerFactory_;
    QString appDir_;

    mutable std::mutex mtx_; // protects workers_, done_ and nextId_
    std::map<std::uint64_t, std::thread> workers_;
    std::vector<std::uint64_t> done_; // workers that have returned but are not joined yet
    std::uint64_t nextId_ = 0;
};
