// Types shared by the deploy/backup/rollback orchestration and its front end.
#pragma once
#include <string>
#include <cstddef>
#include <cstdint>
#include <utility>

namespace opendeploy {

// Distinguished file uploaded ahead of the bulk tree during rollback.
inline constexpr const char* kVersionMarker = "version.json";
// Directory under the application directory that holds every snapshot.
inline constexpr const char* kBackupsDirName = "backups";
inline constexpr std::uint16_t kDefaultSshPort = 22;

// Remote end of one operation. The password is never persisted.
struct DeploymentTarget {
    std::string   host;            // "host" or "host:port"
    std::uint16_t port = kDefaultSshPort; // used when host carries no port
    std::string   username;
    std::string   password;
    std::string   remote_path;
};

// Identifies the backup namespace and the local source tree.
struct ProjectContext {
    std::string project_name;
    std::string environment;
    std::string local_path;
};

struct TransferProgress {
    std::size_t current = 0;
    std::size_t total = 0;
    double percentage = 0.0; // current / total * 100
};

enum class ErrorKind {
    None,
    Connection,    // TCP connect (after retries) or SFTP subsystem start
    Auth,          // handshake or credential rejection
    Transfer,      // remote/local mkdir, list, open, read or write
    Path,          // missing source, bad name, missing marker, empty tree
    BackupMissing  // rollback without a prior snapshot
};

const char* errorKindName(ErrorKind kind);

// A single path component: non-empty, not "." or "..", no separators.
bool isPlainName(const std::string& name);

// Failure of one operation: a kind for callers that branch on it and a
// human-readable message for the operator.
struct OperationError {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    bool failed() const { return kind != ErrorKind::None; }
    bool set(ErrorKind k, std::string msg) {
        kind = k;
        message = std::move(msg);
        return false;
    }
    void clear() {
        kind = ErrorKind::None;
        message.clear();
    }
};

} // namespace opendeploy
