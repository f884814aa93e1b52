// Recursive regular-file count over a local directory.
#include "opendeploy/TreeWalker.hpp"
#include "opendeploy/Log.hpp"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace opendeploy {

static bool countDir(const fs::path& dir, std::size_t& count, std::string& err) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        err = "Could not read local directory " + dir.string() + ": " + ec.message();
        return false;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        const fs::directory_entry& entry = *it;
        std::error_code tec;
        if (entry.is_directory(tec)) {
            if (!countDir(entry.path(), count, err)) return false;
        } else if (entry.is_regular_file(tec)) {
            ++count;
        } else if (tec) {
            err = "Could not inspect " + entry.path().string() + ": " + tec.message();
            return false;
        }
    }
    if (ec) {
        err = "Could not read directory entry in " + dir.string() + ": " + ec.message();
        return false;
    }
    return true;
}

bool countFiles(const std::string& root, std::size_t& count, std::string& err) {
    count = 0;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        err = ec ? ("Could not inspect " + root + ": " + ec.message())
                 : ("Not a directory: " + root);
        return false;
    }
    if (!countDir(root, count, err)) {
        LOGE("countFiles(%s): %s", root.c_str(), err.c_str());
        return false;
    }
    LOGI("countFiles(%s) = %zu", root.c_str(), count);
    return true;
}

} // namespace opendeploy
