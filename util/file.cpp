#include "util/file.hpp"

#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/io.h>
#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <system_error>

#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemove(const std::string& path) { return remove(path.c_str()) != -1; }

std::vector<std::string> OsListDir(const std::string& path) {
  DIR* dir = opendir(path.c_str());
  if (dir == nullptr) {
    throw std::system_error(errno, std::system_category(), "opendir " + path);
  }
  KJ_DEFER(closedir(dir));
  std::vector<std::string> names;
  errno = 0;
  while (struct dirent* entry = readdir(dir)) {  // NOLINT
    if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0)
      continue;
    names.emplace_back(entry->d_name);
  }
  if (errno != 0) {
    throw std::system_error(errno, std::system_category(), "readdir " + path);
  }
  std::sort(names.begin(), names.end());
  return names;
}

bool OsMakeTreeAccessible(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* /*ftwbuf*/) {
                if (typeflags == FTW_D || typeflags == FTW_DNR) {
                  chmod(fpath, (sb->st_mode & 07777) | S_IRWXU);
                }
                return 0;
              },
              64, FTW_PHYS) != -1;
}

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* /*sb*/,
                 int /*typeflags*/,
                 struct FTW* /*ftwbuf*/) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS) != -1;
}

const size_t max_path_len = 1 << 15;
std::string OsTempDir(const std::string& path, const std::string& prefix) {
  std::string tmp = util::File::JoinPath(path, prefix + "XXXXXX");
  KJ_REQUIRE(tmp.size() < max_path_len, tmp.size(), max_path_len,
             "Path too long");
  char data[max_path_len + 1];
  data[0] = 0;
  strncat(data, tmp.c_str(), max_path_len - 1);  // NOLINT
  if (mkdtemp(data) == nullptr)                  // NOLINT
    return "";
  return data;  // NOLINT
}

kj::AutoCloseFd OsTempFile(const std::string& path, std::string* tmp) {
  *tmp = path + ".XXXXXX";
  char data[max_path_len];
  data[0] = 0;
  strncat(data, tmp->c_str(), max_path_len - 1);  // NOLINT
  int fd = mkostemp(data, O_CLOEXEC);             // NOLINT
  *tmp = data;                                    // NOLINT
  return kj::AutoCloseFd(fd);
}

// Returns errno, or 0 on success.
int OsAtomicMove(const std::string& src, const std::string& dst,
                 bool overwrite = false, bool exist_ok = true) {
  if (overwrite) {
    if (rename(src.c_str(), dst.c_str()) == -1) return errno;
    return 0;
  }
  if (link(src.c_str(), dst.c_str()) == -1) {
    if (!exist_ok || errno != EEXIST) return errno;
    return 0;
  }
  if (remove(src.c_str()) == -1) return errno != ENOENT ? errno : 0;
  return 0;
}

util::File::ChunkProducer OsRead(const std::string& path, uint64_t limit) {
  kj::AutoCloseFd fd{
      open(path.c_str(),
           O_CLOEXEC | O_RDONLY | O_NOFOLLOW | O_NONBLOCK)};  // NOLINT
  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Read " + path);
  }
  std::unique_ptr<uint64_t> alreadyRead = std::make_unique<uint64_t>(0);
  return [fd = std::move(fd), path, alreadyRead = std::move(alreadyRead), limit,
          buf = std::array<kj::byte, util::kChunkSize>()]() mutable {
    if (fd.get() == -1) return util::File::Chunk();
    ssize_t amount;
    size_t toRead = util::kChunkSize;
    if (*alreadyRead + toRead > limit) toRead = limit - *alreadyRead;
    if (toRead == 0) return util::File::Chunk();
    while ((amount = read(fd, buf.data(), toRead))) {  // NOLINT
      if (amount == -1 && errno == EINTR) continue;
      if (amount == -1) break;
      *alreadyRead += amount;
      return util::File::Chunk(buf.data(), amount);
    }
    if (amount == -1) {
      int error = errno;
      fd = nullptr;
      throw std::system_error(error, std::system_category(), "Read " + path);
    }
    return util::File::Chunk();
  };
}

util::File::ChunkReceiver OsWrite(const std::string& path, bool overwrite,
                                  bool exist_ok) {
  std::string temp_file;
  auto fd = OsTempFile(path, &temp_file);

  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Write " + path);
  }
  auto done = kj::heap<bool>();
  auto pos = kj::heap<size_t>();
  auto finalize = [done = done.get(), pos = pos.get(), temp_file]() {
    if (!*done) {
      kj::UnwindDetector detector;
      detector.catchExceptionsIfUnwinding(
          [temp_file]() { util::File::Remove(temp_file); });
      if (*pos > 0) {
        KJ_LOG(WARNING, "File never finalized!", temp_file);
      }
    }
  };
  return [fd = std::move(fd), temp_file, path, overwrite, exist_ok,
          done = std::move(done), pos = std::move(pos),
          _ = kj::defer(std::move(finalize))](util::File::Chunk chunk) mutable {
    if (fd.get() == -1) return;
    if (chunk.size() == 0) {
      *done = true;
      if (fsync(fd) == -1 ||
          OsAtomicMove(temp_file, path, overwrite, exist_ok)) {
        throw std::system_error(errno, std::system_category(), "Write " + path);
      }
      fd = kj::AutoCloseFd();
      return;
    }
    *pos = 0;
    while (*pos < chunk.size()) {
      ssize_t written = write(fd, chunk.begin() + *pos,  // NOLINT
                              chunk.size() - *pos);
      if (written == -1 && errno == EINTR) continue;
      if (written == -1) {
        fd = nullptr;
        throw std::system_error(errno, std::system_category(),
                                "write " + temp_file);
      }
      *pos += written;
    }
  };
}

}  // namespace

namespace util {
std::vector<std::string> File::ListDir(const std::string& path) {
  return OsListDir(path);
}

File::ChunkProducer File::Read(const std::string& path, uint64_t limit) {
  return OsRead(path, limit);
}

File::ChunkReceiver File::Write(const std::string& path, bool overwrite,
                                bool exist_ok) {
  MakeDirs(BaseDir(path));
  KJ_ASSERT(!(overwrite && !exist_ok));
  if (!overwrite && Size(path) >= 0) {
    if (exist_ok) return [](Chunk chunk) {};
    throw std::system_error(EEXIST, std::system_category(), "Write " + path);
  }
  return OsWrite(path, overwrite, exist_ok);
}

void File::WriteAll(const std::string& path, const std::string& content,
                    bool overwrite) {
  auto receiver = Write(path, overwrite, /*exist_ok=*/overwrite);
  // NOLINTNEXTLINE
  auto data = reinterpret_cast<const kj::byte*>(content.data());
  for (size_t pos = 0; pos < content.size(); pos += kChunkSize) {
    receiver(Chunk(data + pos, std::min<size_t>(kChunkSize,
                                                content.size() - pos)));
  }
  receiver(Chunk());
}

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir");
    }
  }
}

void File::Remove(const std::string& path) {
  if (!OsRemove(path)) {
    throw std::system_error(errno, std::system_category(), "remove");
  }
}

void File::RemoveTree(const std::string& path) {
  OsMakeTreeAccessible(path);
  if (!OsRemoveTree(path)) {
    throw std::system_error(errno, std::system_category(), "removetree");
  }
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (strchr(kPathSeparators, second[0]) != nullptr) return second;
  return first + kPathSeparators[0] + second;  // NOLINT
}

std::string File::BaseDir(const std::string& path) {
  if (path.find_last_of(kPathSeparators) == std::string::npos) return "";
  return path.substr(0, path.find_last_of(kPathSeparators));
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) {
    return -1;
  }
  return st.st_size;
}

int64_t File::RegularFileSize(const std::string& path) {
  struct stat st {};
  if (lstat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
    return -1;
  }
  return st.st_size;
}

TempDir::TempDir(const std::string& base, const std::string& prefix) {
  File::MakeDirs(base);
  path_ = OsTempDir(base, prefix);
  if (path_.empty()) {
    throw std::system_error(errno, std::system_category(), "mkdtemp");
  }
}
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {  // NOLINT
  if (!moved_) {
    KJ_IF_MAYBE(exc, kj::runCatchingExceptions(
                         [this]() { File::RemoveTree(path_); })) {
      KJ_LOG(WARNING, "Failed to remove temporary directory", path_,
             exc->getDescription());
    }
  }
}

}  // namespace util
