// SftpClient implementation using libssh2 for SSH/SFTP.
// Encapsulates the SSH session, SFTP channel, and TCP socket.
#pragma once
#include "SftpClient.hpp"
#include <string>
#include <vector>

// Forward declarations of libssh2 internal types (with leading underscore)
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace opendeploy {

class Libssh2SftpClient : public SftpClient {
public:
    Libssh2SftpClient();
    ~Libssh2SftpClient() override;

    bool tcpConnect(const SessionOptions& opt, std::string& err) override;
    bool sshHandshakeAuth(const SessionOptions& opt, std::string& err) override;
    bool sftpInit(std::string& err) override;

    void disconnect() override;
    bool isConnected() const override { return connected_; }

    bool list(const std::string& remote_path,
              std::vector<FileInfo>& out,
              std::string& err) override;

    bool readFile(const std::string& remote_path,
                  std::vector<char>& out,
                  std::string& err) override;

    bool writeFile(const std::string& remote_path,
                   const std::vector<char>& data,
                   std::string& err) override;

    bool exists(const std::string& remote_path,
                bool& isDir,
                std::string& err) override;

    bool mkdir(const std::string& remote_dir,
               std::string& err,
               unsigned int mode = 0755) override;

private:
    bool connected_ = false;
    int  sock_ = -1;
    _LIBSSH2_SESSION* session_ = nullptr; // <- uses internal libssh2 types
    _LIBSSH2_SFTP*    sftp_    = nullptr; // <- same

    // Last libssh2 session error as text ("" if none).
    std::string lastSessionError() const;
    // Last SFTP status code as text.
    std::string lastSftpError() const;
};

} // namespace opendeploy
