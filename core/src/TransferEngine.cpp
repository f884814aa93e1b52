// Upload/download of directory trees. Every failure aborts the whole tree;
// the only tolerated conditions are an existing remote directory on mkdir and
// a missing remote root on download.
#include "opendeploy/TransferEngine.hpp"
#include "opendeploy/Log.hpp"
#include <cstdint>
#include <fstream>
#include <iterator>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace opendeploy {

namespace {

bool readLocalFile(const fs::path& p, std::vector<char>& out, std::string& err) {
    std::ifstream in(p, std::ios::binary);
    if (!in) {
        err = "Could not open local file " + p.string();
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        err = "Could not read local file " + p.string();
        return false;
    }
    return true;
}

bool writeLocalFile(const fs::path& p, const std::vector<char>& data, std::string& err) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    if (!out) {
        err = "Could not create local file " + p.string();
        return false;
    }
    out.write(data.data(), (std::streamsize)data.size());
    out.close();
    if (!out) {
        err = "Could not write local file " + p.string();
        return false;
    }
    return true;
}

} // namespace

std::string TransferEngine::joinRemote(const std::string& base, const std::string& name) {
    if (base.empty()) return name;
    if (base.back() == '/') return base + name;
    return base + "/" + name;
}

bool TransferEngine::isValidUtf8(const std::string& s) {
    std::size_t i = 0;
    const std::size_t n = s.size();
    while (i < n) {
        const unsigned char c = (unsigned char)s[i];
        std::size_t len = 0;
        std::uint32_t cp = 0;
        if (c < 0x80) { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;
        if (i + len > n) return false;
        for (std::size_t k = 1; k < len; ++k) {
            const unsigned char cc = (unsigned char)s[i + k];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates and out-of-range code points
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

bool TransferEngine::ensureRemoteDir(const std::string& remoteDir, OperationError& err) {
    std::string e;
    if (client_.mkdir(remoteDir, e, 0755)) return true;

    // mkdir failure is fine when the directory is already there
    bool isDir = false;
    std::string se;
    if (client_.exists(remoteDir, isDir, se) && isDir) return true;

    // Missing parents: create them, then retry once
    std::string parent = remoteDir;
    while (parent.size() > 1 && parent.back() == '/') parent.pop_back();
    const auto slash = parent.rfind('/');
    parent = (slash == std::string::npos || slash == 0) ? std::string() : parent.substr(0, slash);
    if (!parent.empty() && se.empty()) {
        bool parentIsDir = false;
        std::string pe;
        if (!client_.exists(parent, parentIsDir, pe) && pe.empty()) {
            if (!ensureRemoteDir(parent, err)) return false;
            if (client_.mkdir(remoteDir, e, 0755)) return true;
        }
    }

    LOGE("%s", e.c_str());
    return err.set(ErrorKind::Transfer, "Could not create remote directory " + remoteDir + ": " + e);
}

bool TransferEngine::uploadFile(const std::string& localFile,
                                const std::string& remoteFile,
                                OperationError& err) {
    std::vector<char> contents;
    std::string e;
    if (!readLocalFile(localFile, contents, e)) return err.set(ErrorKind::Transfer, e);
    if (!client_.writeFile(remoteFile, contents, e)) {
        LOGE("%s", e.c_str());
        return err.set(ErrorKind::Transfer, e);
    }
    return true;
}

bool TransferEngine::uploadTree(const std::string& localRoot,
                                const std::string& remoteRoot,
                                TransferObserver* observer,
                                std::size_t& done,
                                OperationError& err) {
    const std::size_t before = done;
    if (!ensureRemoteDir(remoteRoot, err)) return false;
    if (!uploadDir(localRoot, remoteRoot, observer, done, err)) return false;
    LOGI("Uploaded %zu file(s) from %s to %s", done - before, localRoot.c_str(), remoteRoot.c_str());
    return true;
}

bool TransferEngine::uploadDir(const fs::path& localDir,
                               const std::string& remoteDir,
                               TransferObserver* observer,
                               std::size_t& done,
                               OperationError& err) {
    std::error_code ec;
    fs::directory_iterator it(localDir, ec);
    if (ec) {
        return err.set(ErrorKind::Transfer,
                       "Could not read local directory " + localDir.string() + ": " + ec.message());
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        const fs::directory_entry& entry = *it;
        const std::string name = entry.path().filename().string();
        if (!isValidUtf8(name)) {
            return err.set(ErrorKind::Path, "File name is not valid UTF-8: " + entry.path().string());
        }
        const std::string remote = joinRemote(remoteDir, name);

        std::error_code tec;
        if (entry.is_directory(tec)) {
            if (!ensureRemoteDir(remote, err)) return false;
            if (!uploadDir(entry.path(), remote, observer, done, err)) return false;
        } else if (entry.is_regular_file(tec)) {
            if (!uploadFile(entry.path().string(), remote, err)) return false;
            ++done;
            if (observer) observer->fileTransferred(done);
        } else if (tec) {
            return err.set(ErrorKind::Transfer,
                           "Could not inspect " + entry.path().string() + ": " + tec.message());
        } else {
            LOGW("Skipping special file %s", entry.path().string().c_str());
        }
    }
    if (ec) {
        return err.set(ErrorKind::Transfer,
                       "Could not read directory entry in " + localDir.string() + ": " + ec.message());
    }
    return true;
}

bool TransferEngine::downloadTree(const std::string& remoteRoot,
                                  const std::string& localRoot,
                                  std::size_t& downloaded,
                                  OperationError& err) {
    downloaded = 0;
    bool isDir = false;
    std::string e;
    if (!client_.exists(remoteRoot, isDir, e)) {
        if (!e.empty()) return err.set(ErrorKind::Transfer, e);
        LOGI("Remote %s does not exist; nothing to download", remoteRoot.c_str());
        return true;
    }
    if (!isDir) {
        return err.set(ErrorKind::Transfer, "Remote path is not a directory: " + remoteRoot);
    }
    if (!downloadDir(remoteRoot, localRoot, downloaded, err)) return false;
    LOGI("Downloaded %zu file(s) from %s to %s", downloaded, remoteRoot.c_str(), localRoot.c_str());
    return true;
}

bool TransferEngine::downloadDir(const std::string& remoteDir,
                                 const fs::path& localDir,
                                 std::size_t& downloaded,
                                 OperationError& err) {
    std::error_code ec;
    fs::create_directories(localDir, ec);
    if (ec) {
        return err.set(ErrorKind::Transfer,
                       "Could not create local directory " + localDir.string() + ": " + ec.message());
    }

    std::vector<FileInfo> entries;
    std::string e;
    if (!client_.list(remoteDir, entries, e)) {
        LOGE("%s", e.c_str());
        return err.set(ErrorKind::Transfer, e);
    }

    for (const FileInfo& fi : entries) {
        if (!isValidUtf8(fi.name)) {
            return err.set(ErrorKind::Path, "Remote file name is not valid UTF-8 in " + remoteDir);
        }
        if (!isPlainName(fi.name)) {
            LOGE("Refusing remote entry '%s' in %s", fi.name.c_str(), remoteDir.c_str());
            return err.set(ErrorKind::Path, "Unsafe remote file name '" + fi.name + "' in " + remoteDir);
        }
        const std::string remote = joinRemote(remoteDir, fi.name);
        const fs::path local = localDir / fi.name;
        if (fi.is_dir) {
            if (!downloadDir(remote, local, downloaded, err)) return false;
        } else {
            std::vector<char> contents;
            if (!client_.readFile(remote, contents, e)) {
                LOGE("%s", e.c_str());
                return err.set(ErrorKind::Transfer, e);
            }
            if (!writeLocalFile(local, contents, e)) return err.set(ErrorKind::Transfer, e);
            ++downloaded;
        }
    }
    return true;
}

} // namespace opendeploy
