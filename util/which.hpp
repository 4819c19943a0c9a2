#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which, searching the directories of
// the given colon-separated search path instead of the PATH of this process.
// Only executable regular files match. Uses caching to speed up lookups,
// unless explicitly disabled; the cache is keyed by command and search path
// and is safe to use from several threads.
std::string which(const std::string& cmd, const std::string& search_path,
                  bool use_cache = true);

}  // namespace util

#endif
