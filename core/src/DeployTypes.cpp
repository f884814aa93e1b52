#include "opendeploy/DeployTypes.hpp"

namespace opendeploy {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:          return "none";
        case ErrorKind::Connection:    return "connection";
        case ErrorKind::Auth:          return "auth";
        case ErrorKind::Transfer:      return "transfer";
        case ErrorKind::Path:          return "path";
        case ErrorKind::BackupMissing: return "backup-missing";
    }
    return "unknown";
}

bool isPlainName(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

} // namespace opendeploy
