#ifndef ENGINE_COLLECTOR_HPP
#define ENGINE_COLLECTOR_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace engine {

// A file written by executed code to its output directory.
struct OutputFile {
  std::string name;
  // Base64 of the contents.
  std::string data;
  uint32_t size = 0;
};

// Collects the regular files that are immediate children of dir and are
// smaller than max_bytes, sorted by name. Subdirectories, symbolic links and
// files that cannot be read are skipped; a missing or unreadable dir yields
// no files.
std::vector<OutputFile> CollectOutputFiles(const std::string& dir,
                                           int64_t max_bytes);

}  // namespace engine

#endif
