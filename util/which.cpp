#include "util/which.hpp"
#include <sys/stat.h>
#include <unistd.h>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "util/file.hpp"
#include "util/misc.hpp"

namespace {
std::mutex cmd_cache_mutex;
std::map<std::pair<std::string, std::string>, std::string> cmd_cache;

bool IsExecutable(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) return false;
  return access(path.c_str(), X_OK) == 0;
}
}  // namespace

namespace util {

std::string which(const std::string& cmd, const std::string& search_path,
                  bool use_cache) {
  auto key = std::make_pair(cmd, search_path);
  if (use_cache) {
    std::lock_guard<std::mutex> lck(cmd_cache_mutex);
    auto it = cmd_cache.find(key);
    if (it != cmd_cache.end()) return it->second;
  }

  std::string found;
  for (const std::string& dir : split(search_path, ':')) {
    std::string fullpath = util::File::JoinPath(dir, cmd);
    if (IsExecutable(fullpath)) {
      found = fullpath;
      break;
    }
  }

  // Misses are not cached, so an interpreter installed later is picked up.
  if (!found.empty()) {
    std::lock_guard<std::mutex> lck(cmd_cache_mutex);
    cmd_cache[key] = found;
  }
  return found;
}

}  // namespace util
