// Local tree inspection used to size a transfer before it starts.
#pragma once
#include <string>
#include <cstddef>

namespace opendeploy {

// Recursively count regular files under root. Directories are traversed but
// not counted; entries of any other type are ignored. Any unreadable
// directory or entry aborts the count and returns false with err filled.
bool countFiles(const std::string& root, std::size_t& count, std::string& err);

} // namespace opendeploy
