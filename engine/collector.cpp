#include "engine/collector.hpp"

#include <sys/stat.h>

#include <system_error>

#include <kj/debug.h>
#include <kj/encoding.h>

#include "util/file.hpp"

namespace engine {

namespace {
// Returns false if the file reached max_bytes while reading.
bool ReadBelow(const std::string& path, int64_t max_bytes, std::string* data) {
  auto producer = util::File::Read(path, max_bytes);
  for (auto chunk = producer(); chunk.size() > 0; chunk = producer()) {
    data->append(reinterpret_cast<const char*>(chunk.begin()),  // NOLINT
                 chunk.size());
  }
  return static_cast<int64_t>(data->size()) < max_bytes;
}
}  // namespace

std::vector<OutputFile> CollectOutputFiles(const std::string& dir,
                                           int64_t max_bytes) {
  std::vector<OutputFile> files;
  // The executed code may have replaced the directory with a symlink.
  struct stat dir_stat = {};
  if (lstat(dir.c_str(), &dir_stat) == -1 || !S_ISDIR(dir_stat.st_mode)) {
    KJ_LOG(WARNING, "Output directory is missing or not a directory", dir);
    return files;
  }
  std::vector<std::string> names;
  try {
    names = util::File::ListDir(dir);
  } catch (const std::system_error& e) {
    KJ_LOG(WARNING, "Cannot list output directory", dir, e.what());
    return files;
  }
  for (const std::string& name : names) {
    std::string path = util::File::JoinPath(dir, name);
    int64_t size = util::File::RegularFileSize(path);
    if (size < 0) {
      KJ_LOG(INFO, "Skipping output entry that is not a regular file", name);
      continue;
    }
    if (size >= max_bytes) {
      KJ_LOG(INFO, "Skipping oversized output file", name, size);
      continue;
    }
    std::string contents;
    try {
      if (!ReadBelow(path, max_bytes, &contents)) {
        KJ_LOG(INFO, "Skipping output file that grew past the limit", name);
        continue;
      }
    } catch (const std::system_error& e) {
      KJ_LOG(WARNING, "Cannot read output file", name, e.what());
      continue;
    }
    OutputFile file;
    file.name = name;
    file.size = static_cast<uint32_t>(contents.size());
    file.data = kj::encodeBase64(
                    kj::arrayPtr(reinterpret_cast<const kj::byte*>(  // NOLINT
                                     contents.data()),
                                 contents.size()))
                    .cStr();
    files.push_back(std::move(file));
  }
  return files;
}

}  // namespace engine
