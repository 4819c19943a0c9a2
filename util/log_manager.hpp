#ifndef UTIL_LOG_MANAGER_HPP
#define UTIL_LOG_MANAGER_HPP
#include <kj/exception.h>
#include <kj/main.h>
#include <ostream>

namespace util {

// Formats kj log lines and exceptions for the current thread. kj exception
// callbacks are thread-local: every thread that logs must own a LogManager.
// All instances share one sink, chosen by Flags::log_file.
class LogManager : public kj::ExceptionCallback {
 public:
  // If context is given and the log file cannot be opened, the process exits
  // with an error.
  explicit LogManager(kj::ProcessContext* context = nullptr);
  void logMessage(kj::LogSeverity severity, const char* file, int line,
                  int contextDepth, kj::String&& text) override;
  void onRecoverableException(kj::Exception&& exception) override;
  void onFatalException(kj::Exception&& exception) override;
  StackTraceMode stackTraceMode() override { return StackTraceMode::NONE; }

  // Applies Flags::verbose and Flags::quiet to the kj log level.
  static void ConfigureLevel();

 private:
  void PrintStackTrace();

  std::ostream& out;
};
}  // namespace util

#endif
