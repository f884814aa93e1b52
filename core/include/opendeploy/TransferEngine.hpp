// Recursive whole-file tree transfer between the local disk and an SFTP session.
#pragma once
#include "DeployTypes.hpp"
#include "ProgressReporter.hpp"
#include "SftpClient.hpp"
#include <cstddef>
#include <filesystem>
#include <string>

namespace opendeploy {

class TransferEngine {
public:
    explicit TransferEngine(SftpClient& client) : client_(client) {}

    // Mirror localRoot into remoteRoot, depth-first, one entry at a time.
    // `done` is the running file counter; observer (may be null) is notified
    // with its new value after each file.
    bool uploadTree(const std::string& localRoot,
                    const std::string& remoteRoot,
                    TransferObserver* observer,
                    std::size_t& done,
                    OperationError& err);

    // Mirror remoteRoot into localRoot. A missing remoteRoot is a successful
    // no-op; `downloaded` receives the number of files written.
    bool downloadTree(const std::string& remoteRoot,
                      const std::string& localRoot,
                      std::size_t& downloaded,
                      OperationError& err);

    // Single file, local to remote.
    bool uploadFile(const std::string& localFile,
                    const std::string& remoteFile,
                    OperationError& err);

    // Create remoteDir; an already existing directory is accepted.
    bool ensureRemoteDir(const std::string& remoteDir, OperationError& err);

    static std::string joinRemote(const std::string& base, const std::string& name);
    static bool isValidUtf8(const std::string& s);

private:
    SftpClient& client_;

    bool uploadDir(const std::filesystem::path& localDir,
                   const std::string& remoteDir,
                   TransferObserver* observer,
                   std::size_t& done,
                   OperationError& err);
    bool downloadDir(const std::string& remoteDir,
                     const std::filesystem::path& localDir,
                     std::size_t& downloaded,
                     OperationError& err);
};

} // namespace opendeploy
