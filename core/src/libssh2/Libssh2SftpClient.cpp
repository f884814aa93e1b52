// libssh2 backend: manages TCP socket, SSH session, and SFTP channel.
// Password authentication only; whole-file reads and writes.
#include "opendeploy/Libssh2SftpClient.hpp"
#include "opendeploy/Log.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cstring>
#include <string>
#include <vector>
#include <chrono>
#include <thread>
#include <mutex>
#include <cstdio>
#include <cerrno>

// POSIX sockets
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>

namespace opendeploy {

// Global libssh2 initialization (once per process; operations may run on several threads)
static std::once_flag g_libssh2_once;

Libssh2SftpClient::Libssh2SftpClient() {
    std::call_once(g_libssh2_once, [] {
        int rc = libssh2_init(0);
        if (rc != 0) LOGE("libssh2_init failed (rc=%d)", rc);
    });
}

Libssh2SftpClient::~Libssh2SftpClient() {
    disconnect();
}

std::string Libssh2SftpClient::lastSessionError() const {
    if (!session_) return std::string();
    char* emsgPtr = nullptr;
    int emlen = 0;
    (void)libssh2_session_last_error(session_, &emsgPtr, &emlen, 0);
    return (emsgPtr && emlen > 0) ? std::string(emsgPtr, (size_t)emlen) : std::string();
}

std::string Libssh2SftpClient::lastSftpError() const {
    if (!sftp_) return std::string();
    unsigned long code = libssh2_sftp_last_error(sftp_);
    switch (code) {
        case LIBSSH2_FX_NO_SUCH_FILE:       return "no such file";
        case LIBSSH2_FX_PERMISSION_DENIED:  return "permission denied";
        case LIBSSH2_FX_FAILURE:            return "failure";
        case LIBSSH2_FX_NO_SUCH_PATH:       return "no such path";
        case LIBSSH2_FX_FILE_ALREADY_EXISTS: return "file already exists";
        case LIBSSH2_FX_WRITE_PROTECT:      return "write protected";
        case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM: return "no space on filesystem";
        case LIBSSH2_FX_QUOTA_EXCEEDED:     return "quota exceeded";
        case LIBSSH2_FX_NOT_A_DIRECTORY:    return "not a directory";
        case LIBSSH2_FX_DIR_NOT_EMPTY:      return "directory not empty";
        default: break;
    }
    std::string s = lastSessionError();
    return s.empty() ? ("sftp status " + std::to_string(code)) : s;
}

bool Libssh2SftpClient::tcpConnect(const SessionOptions& opt, std::string& err) {
    if (sock_ != -1) {
        err = "Already connected";
        return false;
    }
    struct addrinfo hints{};
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(opt.port));

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(opt.host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return false;
    }

    int s = -1;
    int lastErrno = 0;
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) {
            lastErrno = errno;
            continue;
        }
        // Timeouts are left to libssh2_session_set_timeout; SO_RCVTIMEO may
        // interfere with userauth on some servers.
        int on = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
#ifdef __APPLE__
        int idle = 60;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        lastErrno = errno;
        ::close(s);
        s = -1;
    }
    freeaddrinfo(res);
    err = "Could not connect to " + opt.host + ":" + portStr +
          (lastErrno ? (std::string(": ") + std::strerror(lastErrno)) : std::string());
    return false;
}

bool Libssh2SftpClient::sshHandshakeAuth(const SessionOptions& opt, std::string& err) {
    if (sock_ == -1) {
        err = "No TCP connection";
        return false;
    }
    session_ = libssh2_session_init();
    if (!session_) {
        err = "libssh2_session_init failed";
        return false;
    }

    if (libssh2_session_handshake(session_, sock_) != 0) {
        std::string cause = lastSessionError();
        err = "SSH handshake failed" + (cause.empty() ? std::string() : (": " + cause));
        return false;
    }

    // Blocking mode plus a session-wide timeout so slow networks cannot hang forever
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, opt.timeout_ms);

    // SSH keepalive every 30s if the peer allows it
    libssh2_keepalive_config(session_, 1, 30);

    int rc = -1;
    for (;;) {
        rc = libssh2_userauth_password(session_, opt.username.c_str(), opt.password.c_str());
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    if (rc != 0) {
        std::string cause = lastSessionError();
        err = "Authentication failed for user '" + opt.username + "'" +
              (cause.empty() ? std::string() : (": " + cause)) +
              " [rc=" + std::to_string(rc) + "]";
        return false;
    }
    return true;
}

bool Libssh2SftpClient::sftpInit(std::string& err) {
    if (!session_) {
        err = "No SSH session";
        return false;
    }
    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        std::string cause = lastSessionError();
        err = "Could not start SFTP subsystem" + (cause.empty() ? std::string() : (": " + cause));
        return false;
    }
    connected_ = true;
    return true;
}

void Libssh2SftpClient::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

bool Libssh2SftpClient::list(const std::string& remote_path,
                             std::vector<FileInfo>& out,
                             std::string& err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }

    std::string path = remote_path.empty() ? "/" : remote_path;

    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        err = "sftp_opendir failed for " + path + ": " + lastSftpError();
        return false;
    }

    out.clear();
    out.reserve(64);

    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    while (true) {
        memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir,
                                         filename, sizeof(filename),
                                         longentry, sizeof(longentry),
                                         &attrs);
        if (rc > 0) {
            // rc = name length
            FileInfo fi{};
            fi.name = std::string(filename, rc);
            fi.is_dir = (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
                            ? ((attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR)
                            : false;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) fi.size = attrs.filesize;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) fi.mtime = attrs.mtime;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) fi.mode = attrs.permissions;
            if (fi.name == "." || fi.name == "..") continue;
            out.push_back(std::move(fi));
        } else if (rc == 0) {
            // end of directory
            break;
        } else {
            err = "sftp_readdir_ex failed for " + path + ": " + lastSftpError();
            libssh2_sftp_closedir(dir);
            return false;
        }
    }

    libssh2_sftp_closedir(dir);
    return true;
}

bool Libssh2SftpClient::readFile(const std::string& remote_path,
                                 std::vector<char>& out,
                                 std::string& err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }

    LIBSSH2_SFTP_HANDLE* rh = libssh2_sftp_open_ex(
        sftp_, remote_path.c_str(), (unsigned)remote_path.size(),
        LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        err = "Could not open remote file " + remote_path + ": " + lastSftpError();
        return false;
    }

    out.clear();
    const std::size_t CHUNK = 64 * 1024;
    std::vector<char> buf(CHUNK);
    while (true) {
        ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n > 0) {
            out.insert(out.end(), buf.data(), buf.data() + n);
        } else if (n == 0) {
            break; // EOF
        } else {
            err = "Remote read failed for " + remote_path + ": " + lastSftpError();
            libssh2_sftp_close(rh);
            return false;
        }
    }

    libssh2_sftp_close(rh);
    return true;
}

bool Libssh2SftpClient::writeFile(const std::string& remote_path,
                                  const std::vector<char>& data,
                                  std::string& err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }

    LIBSSH2_SFTP_HANDLE* wh = libssh2_sftp_open_ex(
        sftp_, remote_path.c_str(), (unsigned)remote_path.size(),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
        0644, LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        err = "Could not create remote file " + remote_path + ": " + lastSftpError();
        return false;
    }

    // libssh2_sftp_write may accept fewer bytes than requested
    const char* p = data.data();
    std::size_t remain = data.size();
    while (remain > 0) {
        ssize_t w = libssh2_sftp_write(wh, p, remain);
        if (w < 0) {
            err = "Remote write failed for " + remote_path + ": " + lastSftpError();
            libssh2_sftp_close(wh);
            return false;
        }
        remain = remain - (std::size_t)w;
        p = p + w;
    }

    if (libssh2_sftp_close(wh) != 0) {
        err = "Closing remote file failed for " + remote_path + ": " + lastSftpError();
        return false;
    }
    return true;
}

// Lightweight existence check using sftp_stat.
bool Libssh2SftpClient::exists(const std::string& remote_path,
                               bool& isDir,
                               std::string& err) {
    isDir = false;
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }

    LIBSSH2_SFTP_ATTRIBUTES st{};
    int rc = libssh2_sftp_stat_ex(
        sftp_, remote_path.c_str(), (unsigned)remote_path.size(),
        LIBSSH2_SFTP_STAT, &st);

    if (rc == 0) {
        if (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
            isDir = ((st.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR);
        }
        err.clear();
        return true;
    }

    unsigned long sftp_err = libssh2_sftp_last_error(sftp_);
    if (sftp_err == LIBSSH2_FX_NO_SUCH_FILE || sftp_err == LIBSSH2_FX_NO_SUCH_PATH) {
        err.clear();
        return false; // does not exist
    }

    err = "Remote stat failed for " + remote_path + ": " + lastSftpError();
    return false;
}

bool Libssh2SftpClient::mkdir(const std::string& remote_dir,
                              std::string& err,
                              unsigned int mode) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    int rc = libssh2_sftp_mkdir(sftp_, remote_dir.c_str(), mode);
    if (rc != 0) {
        err = "sftp_mkdir failed for " + remote_dir + ": " + lastSftpError();
        return false;
    }
    return true;
}

} // namespace opendeploy
