#include "util/log_manager.hpp"
#include <unistd.h>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <kj/debug.h>
#include "backward.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace util {
namespace {
std::ostream& ChooseOut() {
  if (Flags::log_file != "") {
    static std::ofstream of(Flags::log_file, std::ios::app);
    return of;
  } else {
    return std::cerr;
  }
}

std::mutex& OutMutex() {
  static std::mutex mutex;
  return mutex;
}

bool UseColors(const std::ostream& out) {
  return &out == &std::cerr && isatty(STDERR_FILENO);
}

static const constexpr char* log_msg[] = {"INFO", "WARNING", "ERROR", "FATAL",
                                          "DBG"};
static const constexpr char* colors[] = {"\e[0;32m", "\e[0;33m", "\e[0;31m",
                                         "\e[7;31m", "\e[0;35m"};
const constexpr char* reset_color = "\e[m";
const constexpr char* file_color = "\e[0;34m";
const constexpr char* date_color = "\e[0;36m";

constexpr bool strings_equal(char const* a, char const* b) {
  return *a == *b && (*a == '\0' || strings_equal(a + 1, b + 1));
}

#define CHECK_MSG(lvl)                                                   \
  static_assert(strings_equal(#lvl, log_msg[(int)kj::LogSeverity::lvl]), \
                #lvl " has a wrong log message!");

CHECK_MSG(INFO);
CHECK_MSG(WARNING);
CHECK_MSG(ERROR);
CHECK_MSG(FATAL);
CHECK_MSG(DBG);

}  // namespace

void LogManager::ConfigureLevel() {
  kj::_::Debug::setLogLevel(Flags::quiet ? kj::LogSeverity::WARNING
                                         : kj::LogSeverity::INFO);
}

void LogManager::PrintStackTrace() {
  if (!Flags::verbose) return;
  backward::StackTrace s;
  s.load_here();
  backward::Printer p;
  p.color_mode = UseColors(out) ? backward::ColorMode::always
                                : backward::ColorMode::never;
  std::lock_guard<std::mutex> lck(OutMutex());
  p.print(s, out);
}

void LogManager::onRecoverableException(kj::Exception&& exception) {
  logMessage(kj::LogSeverity::WARNING, exception.getFile(), exception.getLine(),
             0, kj::heapString(exception.getDescription()));
  PrintStackTrace();
  next.onRecoverableException(kj::mv(exception));
}

void LogManager::onFatalException(kj::Exception&& exception) {
  logMessage(kj::LogSeverity::FATAL, exception.getFile(), exception.getLine(),
             0, kj::heapString(exception.getDescription()));
  PrintStackTrace();
  next.onFatalException(kj::mv(exception));
}

LogManager::LogManager(kj::ProcessContext* context) : out(ChooseOut()) {
  if (!out && context != nullptr) {
    context->exitError("Invalid log file provided!");
  }
}

void LogManager::logMessage(kj::LogSeverity severity, const char* file,
                            int line, int contextDepth, kj::String&& text) {
  bool color = UseColors(out);
  auto paint = [color](const char* code, const std::string& s) {
    return color ? code + s + reset_color : s;
  };
  auto t = std::time(nullptr);
  struct tm tm {};
  localtime_r(&t, &tm);
  std::ostringstream date;
  date << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");

  std::ostringstream line_out;
  line_out << paint(date_color, date.str()) << " ";
  line_out << paint(colors[(int)severity],
                    std::string(1, log_msg[(int)severity][0]))
           << " ";
  line_out << std::left << std::setw(color ? 35 : 25)
           << paint(file_color, util::File::BaseName(file) + ":" +
                                    std::to_string(line));
  line_out << std::string(contextDepth * 2, ' ') << text.cStr() << "\n";

  std::lock_guard<std::mutex> lck(OutMutex());
  out << line_out.str() << std::flush;
}
}  // namespace util
