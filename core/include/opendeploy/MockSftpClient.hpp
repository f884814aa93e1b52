// Simulated SFTP backend: an in-memory remote file system with scriptable
// failures, for exercising the orchestration without a network.
#pragma once
#include "SftpClient.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace opendeploy {

// Remote state shared by every MockSftpClient created for one test, so that
// separate sessions observe each other's writes.
struct MockRemoteFs {
    std::set<std::string> dirs{"/"};
    std::map<std::string, std::vector<char>> files;

    // Credentials the mock server accepts.
    std::string user = "deploy";
    std::string password = "secret";

    // Failure scripting
    int  tcpFailuresLeft = 0;      // next N tcpConnect calls fail
    bool failHandshake = false;
    bool failSftpInit = false;
    std::set<std::string> failWrites; // remote paths whose writeFile fails
    std::set<std::string> failReads;
    std::set<std::string> failLists;

    // Observations
    int tcpAttempts = 0;
    std::string lastHost;
    std::uint16_t lastPort = 0;
    int sessionsOpened = 0;
    int disconnects = 0;
    // Every remote operation after authentication, in order ("write /a.txt").
    std::vector<std::string> ops;

    void addDir(const std::string& path);
    void addFile(const std::string& path, const std::string& content);
    bool hasFile(const std::string& path) const { return files.count(path) > 0; }
    std::string fileText(const std::string& path) const;
    // Number of operations that touched the remote file system.
    std::size_t ioCount() const { return ops.size(); }
};

class MockSftpClient : public SftpClient {
public:
    explicit MockSftpClient(std::shared_ptr<MockRemoteFs> fs);
    ~MockSftpClient() override;

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

    // Canonical form used as map key: leading "/", no trailing "/".
    static std::string normalize(const std::string& path);
    static std::string parentOf(const std::string& path);

private:
    std::shared_ptr<MockRemoteFs> fs_;
    bool tcp_ = false;
    bool authed_ = false;
    bool connected_ = false;
};

} // namespace opendeploy
