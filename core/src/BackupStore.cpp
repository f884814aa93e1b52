// Snapshot directory management on local disk.
#include "opendeploy/BackupStore.hpp"
#include "opendeploy/DeployTypes.hpp"
#include "opendeploy/Log.hpp"
#include <filesystem>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace opendeploy {

BackupStore::BackupStore(std::string appDir) : appDir_(std::move(appDir)) {}

bool BackupStore::validName(const std::string& name) {
    return isPlainName(name) && name.front() != '.';
}

bool BackupStore::checkNames(const std::string& project, const std::string& env, std::string& err) const {
    if (!validName(project)) {
        err = "Invalid project name: '" + project + "'";
        return false;
    }
    if (!validName(env)) {
        err = "Invalid environment name: '" + env + "'";
        return false;
    }
    return true;
}

std::string BackupStore::pathFor(const std::string& project, const std::string& env) const {
    return (fs::path(appDir_) / kBackupsDirName / project / env).string();
}

bool BackupStore::locationFor(const std::string& project,
                              const std::string& env,
                              std::string& out,
                              std::string& err) const {
    if (!checkNames(project, env, err)) return false;
    const std::string dir = pathFor(project, env);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        err = "Could not create backup directory " + dir + ": " + ec.message();
        LOGE("%s", err.c_str());
        return false;
    }
    if (!fs::is_directory(dir, ec)) {
        err = "Backup location is not a directory: " + dir;
        return false;
    }
    out = dir;
    return true;
}

bool BackupStore::exists(const std::string& project, const std::string& env) const {
    if (!validName(project) || !validName(env)) return false;
    std::error_code ec;
    return fs::is_directory(pathFor(project, env), ec);
}

std::string BackupStore::siblingFor(const std::string& project,
                                    const std::string& env,
                                    const char* suffix) const {
    return (fs::path(appDir_) / kBackupsDirName / project / ("." + env + suffix)).string();
}

bool BackupStore::beginStaging(const std::string& project,
                               const std::string& env,
                               std::string& out,
                               std::string& err) const {
    if (!checkNames(project, env, err)) return false;
    const std::string dir = siblingFor(project, env, ".staging");
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (!ec) fs::create_directories(dir, ec);
    if (ec) {
        err = "Could not prepare staging directory " + dir + ": " + ec.message();
        LOGE("%s", err.c_str());
        return false;
    }
    out = dir;
    return true;
}

bool BackupStore::commitStaging(const std::string& project, const std::string& env, std::string& err) const {
    if (!checkNames(project, env, err)) return false;
    const std::string live = pathFor(project, env);
    const std::string staging = siblingFor(project, env, ".staging");
    const std::string old = siblingFor(project, env, ".old");

    std::error_code ec;
    fs::remove_all(old, ec);
    if (ec) {
        err = "Could not remove " + old + ": " + ec.message();
        return false;
    }
    const bool hadLive = fs::exists(live, ec);
    if (hadLive) {
        fs::rename(live, old, ec);
        if (ec) {
            err = "Could not move snapshot " + live + " aside: " + ec.message();
            LOGE("%s", err.c_str());
            return false;
        }
    }
    fs::rename(staging, live, ec);
    if (ec) {
        err = "Could not install snapshot " + live + ": " + ec.message();
        LOGE("%s", err.c_str());
        std::error_code rec;
        if (hadLive) fs::rename(old, live, rec);
        return false;
    }
    fs::remove_all(old, ec);
    if (ec) LOGW("Could not remove previous snapshot %s: %s", old.c_str(), ec.message().c_str());
    return true;
}

void BackupStore::discardStaging(const std::string& project, const std::string& env) const {
    if (!validName(project) || !validName(env)) return;
    const std::string dir = siblingFor(project, env, ".staging");
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) LOGW("Could not remove staging directory %s: %s", dir.c_str(), ec.message().c_str());
}

} // namespace opendeploy
