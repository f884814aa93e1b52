// Abstract interface for SFTP operations. Concrete implementations (libssh2, mock)
// must follow this API to keep the orchestration decoupled from the backend.
#pragma once
#include "SftpTypes.hpp"
#include <string>
#include <vector>

namespace opendeploy {

class SftpClient {
public:
    virtual ~SftpClient() = default;

    // Connection phases, in order. Only tcpConnect may be retried by callers;
    // a failed handshake/auth or SFTP start leaves the client unusable.
    virtual bool tcpConnect(const SessionOptions& opt, std::string& err) = 0;
    virtual bool sshHandshakeAuth(const SessionOptions& opt, std::string& err) = 0;
    virtual bool sftpInit(std::string& err) = 0;

    // Run the three phases without retry.
    bool connect(const SessionOptions& opt, std::string& err) {
        return tcpConnect(opt, err) && sshHandshakeAuth(opt, err) && sftpInit(err);
    }

    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Remote directory listing ("." and ".." excluded)
    virtual bool list(const std::string& remote_path,
                      std::vector<FileInfo>& out,
                      std::string& err) = 0;

    // Whole-file transfers: the full content is held in memory.
    virtual bool readFile(const std::string& remote_path,
                          std::vector<char>& out,
                          std::string& err) = 0;

    // Create or truncate the remote file and write data to it.
    virtual bool writeFile(const std::string& remote_path,
                           const std::vector<char>& data,
                           std::string& err) = 0;

    // Check existence (leave err empty if "does not exist")
    virtual bool exists(const std::string& remote_path,
                        bool& isDir,
                        std::string& err) = 0;

    virtual bool mkdir(const std::string& remote_dir,
                       std::string& err,
                       unsigned int mode = 0755) = 0;
};

} // namespace opendeploy
