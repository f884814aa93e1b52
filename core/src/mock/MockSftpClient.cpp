// Mock implementation: paths live in MockRemoteFs; every operation is recorded.
#include "opendeploy/MockSftpClient.hpp"
#include <algorithm>

namespace opendeploy {

std::string MockSftpClient::normalize(const std::string& path) {
    std::string out = "/";
    for (char c : path) {
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(c);
    }
    if (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

std::string MockSftpClient::parentOf(const std::string& path) {
    const std::string p = normalize(path);
    const auto slash = p.rfind('/');
    if (slash == 0 || slash == std::string::npos) return "/";
    return p.substr(0, slash);
}

void MockRemoteFs::addDir(const std::string& path) {
    std::string p = MockSftpClient::normalize(path);
    while (true) {
        dirs.insert(p);
        if (p == "/") break;
        p = MockSftpClient::parentOf(p);
    }
}

void MockRemoteFs::addFile(const std::string& path, const std::string& content) {
    const std::string p = MockSftpClient::normalize(path);
    addDir(MockSftpClient::parentOf(p));
    files[p] = std::vector<char>(content.begin(), content.end());
}

std::string MockRemoteFs::fileText(const std::string& path) const {
    auto it = files.find(MockSftpClient::normalize(path));
    if (it == files.end()) return std::string();
    return std::string(it->second.begin(), it->second.end());
}

MockSftpClient::MockSftpClient(std::shared_ptr<MockRemoteFs> fs) : fs_(std::move(fs)) {}

MockSftpClient::~MockSftpClient() {
    disconnect();
}

bool MockSftpClient::tcpConnect(const SessionOptions& opt, std::string& err) {
    fs_->tcpAttempts++;
    fs_->lastHost = opt.host;
    fs_->lastPort = opt.port;
    if (opt.host.empty()) {
        err = "Host is required";
        return false;
    }
    if (fs_->tcpFailuresLeft > 0) {
        fs_->tcpFailuresLeft--;
        err = "Connection refused";
        return false;
    }
    tcp_ = true;
    return true;
}

bool MockSftpClient::sshHandshakeAuth(const SessionOptions& opt, std::string& err) {
    if (!tcp_) {
        err = "No TCP connection";
        return false;
    }
    if (fs_->failHandshake) {
        err = "SSH handshake failed";
        return false;
    }
    if (opt.username != fs_->user || opt.password != fs_->password) {
        err = "Authentication failed for user '" + opt.username + "'";
        return false;
    }
    authed_ = true;
    return true;
}

bool MockSftpClient::sftpInit(std::string& err) {
    if (!authed_) {
        err = "No SSH session";
        return false;
    }
    if (fs_->failSftpInit) {
        err = "Could not start SFTP subsystem";
        return false;
    }
    connected_ = true;
    fs_->sessionsOpened++;
    return true;
}

void MockSftpClient::disconnect() {
    if (tcp_) fs_->disconnects++;
    tcp_ = false;
    authed_ = false;
    connected_ = false;
}

bool MockSftpClient::list(const std::string& remote_path,
                          std::vector<FileInfo>& out,
                          std::string& err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    const std::string path = normalize(remote_path);
    fs_->ops.push_back("list " + path);
    if (fs_->failLists.count(path) || !fs_->dirs.count(path)) {
        err = "sftp_opendir failed for " + path;
        return false;
    }

    out.clear();
    for (const auto& d : fs_->dirs) {
        if (d != "/" && parentOf(d) == path) {
            FileInfo fi{};
            fi.name = d.substr(d.rfind('/') + 1);
            fi.is_dir = true;
            fi.mode = 040755;
            out.push_back(fi);
        }
    }
    for (const auto& kv : fs_->files) {
        if (parentOf(kv.first) == path) {
            FileInfo fi{};
            fi.name = kv.first.substr(kv.first.rfind('/') + 1);
            fi.size = kv.second.size();
            fi.mode = 0100644;
            out.push_back(fi);
        }
    }
    std::sort(out.begin(), out.end(), [](const FileInfo& a, const FileInfo& b) {
        if (a.is_dir != b.is_dir) return a.is_dir > b.is_dir; // directories first
        return a.name < b.name;
    });
    return true;
}

bool MockSftpClient::readFile(const std::string& remote_path,
                              std::vector<char>& out,
                              std::string& err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    const std::string path = normalize(remote_path);
    fs_->ops.push_back("read " + path);
    auto it = fs_->files.find(path);
    if (fs_->failReads.count(path) || it == fs_->files.end()) {
        err = "Could not open remote file " + path;
        return false;
    }
    out = it->second;
    return true;
}

bool MockSftpClient::writeFile(const std::string& remote_path,
                               const std::vector<char>& data,
                               std::string& err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    const std::string path = normalize(remote_path);
    fs_->ops.push_back("write " + path);
    if (fs_->failWrites.count(path)) {
        err = "Remote write failed for " + path;
        return false;
    }
    if (!fs_->dirs.count(parentOf(path)) || fs_->dirs.count(path)) {
        err = "Could not create remote file " + path + ": no such path";
        return false;
    }
    fs_->files[path] = data;
    return true;
}

bool MockSftpClient::exists(const std::string& remote_path,
                            bool& isDir,
                            std::string& err) {
    isDir = false;
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    const std::string path = normalize(remote_path);
    fs_->ops.push_back("stat " + path);
    err.clear();
    if (fs_->dirs.count(path)) {
        isDir = true;
        return true;
    }
    return fs_->files.count(path) > 0;
}

bool MockSftpClient::mkdir(const std::string& remote_dir,
                           std::string& err,
                           unsigned int mode) {
    (void)mode;
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    const std::string path = normalize(remote_dir);
    fs_->ops.push_back("mkdir " + path);
    if (fs_->dirs.count(path) || fs_->files.count(path)) {
        err = "sftp_mkdir failed for " + path + ": file already exists";
        return false;
    }
    if (!fs_->dirs.count(parentOf(path))) {
        err = "sftp_mkdir failed for " + path + ": no such path";
        return false;
    }
    fs_->dirs.insert(path);
    return true;
}

} // namespace opendeploy
