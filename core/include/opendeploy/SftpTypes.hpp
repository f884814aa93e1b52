// Basic types shared by the SFTP backends: session options and remote metadata.
#pragma once
#include <string>
#include <cstdint>

namespace opendeploy {

struct FileInfo {
    std::string   name;     // base name
    bool          is_dir = false;
    std::uint64_t size  = 0;  // bytes (if applicable)
    std::uint64_t mtime = 0;  // epoch (seconds)
    std::uint32_t mode  = 0;  // POSIX bits (permissions/type)
};

struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;
    std::string password;

    // Session-wide I/O timeout; bounds hangs on slow networks.
    long timeout_ms = 30000;
};

} // namespace opendeploy
