#include "util/misc.hpp"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>

#include <kj/encoding.h>

namespace util {

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

bool isBlank(const std::string& s) {
  for (char c : s) {
    if (!isspace(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

bool parseInt(const std::string& s, int32_t* out) {
  if (s.empty()) return false;
  char* end = nullptr;
  errno = 0;
  long value = strtol(s.c_str(), &end, 10);  // NOLINT
  if (errno != 0 || *end != '\0' || value < INT32_MIN || value > INT32_MAX) {
    return false;
  }
  *out = static_cast<int32_t>(value);
  return true;
}

std::function<bool()> setBool(bool* var) {
  return [var]() {
    *var = true;
    return true;
  };
}

std::function<kj::MainBuilder::Validity(kj::StringPtr)> setString(
    std::string* var) {
  return [var](kj::StringPtr p) -> kj::MainBuilder::Validity {
    *var = p.cStr();
    return true;
  };
}

std::function<kj::MainBuilder::Validity(kj::StringPtr)> setInt(int32_t* var) {
  return [var](kj::StringPtr p) -> kj::MainBuilder::Validity {
    if (!parseInt(p.cStr(), var)) return kj::str("not an integer: ", p);
    return true;
  };
}

std::string toValidUtf8(const std::string& bytes) {
  auto utf16 = kj::encodeUtf16(kj::arrayPtr(bytes.data(), bytes.size()));
  if (!utf16.hadErrors) return bytes;
  kj::String text = kj::decodeUtf16(utf16);
  return std::string(text.begin(), text.size());
}

void truncateUtf8(std::string* s, size_t max_bytes) {
  if (s->size() <= max_bytes) return;
  size_t cut = max_bytes;
  // Back off to the start of the sequence the cut would split.
  while (cut > 0 && (static_cast<unsigned char>((*s)[cut]) & 0xC0) == 0x80) {
    cut--;
  }
  s->resize(cut);
}

}  // namespace util
