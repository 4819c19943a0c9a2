#include "util/flags.hpp"

#include <cstdlib>

namespace {
std::string DefaultTempDirectory() {
  const char* tmpdir = getenv("TMPDIR");  // NOLINT
  return tmpdir != nullptr && *tmpdir != '\0' ? tmpdir : "/tmp";
}
}  // namespace

std::string Flags::log_file;
bool Flags::verbose = false;
bool Flags::quiet = false;
std::string Flags::temp_directory = DefaultTempDirectory();

std::string Flags::listen_address = "0.0.0.0";
int32_t Flags::port = 8888;

std::string Flags::language = "python";
int32_t Flags::timeout = 30;
