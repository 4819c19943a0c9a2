#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP
#include <cstdint>
#include <functional>
#include <sstream>
#include <string>
#include <vector>

#include <kj/main.h>
#include <kj/string.h>

namespace util {

template <typename Out>
void split(const std::string& s, char delim, Out result) {
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    if (!item.empty()) *(result++) = item;
  }
}
std::vector<std::string> split(const std::string& s, char delim);

// Returns true if s contains only whitespace.
bool isBlank(const std::string& s);

// Parses a base-10 integer that must span the whole string.
bool parseInt(const std::string& s, int32_t* out);

// Option setters for kj::MainBuilder.
std::function<bool()> setBool(bool* var);
std::function<kj::MainBuilder::Validity(kj::StringPtr)> setString(
    std::string* var);
std::function<kj::MainBuilder::Validity(kj::StringPtr)> setInt(int32_t* var);

// Replaces invalid UTF-8 sequences in bytes with U+FFFD.
std::string toValidUtf8(const std::string& bytes);

// Cuts s to at most max_bytes bytes without splitting a UTF-8 sequence.
void truncateUtf8(std::string* s, size_t max_bytes);

}  // namespace util
#endif
