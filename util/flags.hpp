#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>

struct Flags {
  // Common flags
  static std::string log_file;
  static bool verbose;
  static bool quiet;
  static std::string temp_directory;

  // Server-only flags
  static std::string listen_address;
  static int32_t port;

  // Run-only flags
  static std::string language;
  static int32_t timeout;
};

#endif
