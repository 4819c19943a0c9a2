#ifndef ENGINE_ENGINE_HPP
#define ENGINE_ENGINE_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "engine/collector.hpp"
#include "engine/language.hpp"
#include "engine/limits.hpp"

namespace engine {

struct ExecutionRequest {
  Language language = Language::PYTHON;
  std::string code;
  int32_t timeout_seconds = kDefaultTimeoutSeconds;
};

struct ExecutionResult {
  std::string stdout_data;
  std::string stderr_data;
  int32_t exit_code = 0;
  std::vector<OutputFile> files;
};

struct EngineOptions {
  // Directory in which work roots are created.
  std::string temp_directory = "/tmp";
  // PATH of the executed code, also used to find the interpreters.
  std::string search_path = kSandboxPath;
  size_t max_output_bytes = kMaxOutputBytes;
  int64_t max_file_bytes = kMaxFileBytes;
  int64_t drain_millis = kDrainMillis;
};

// Clamps a requested timeout to the supported range.
int32_t ClampTimeout(int32_t timeout_seconds);

// Runs code snippets: every call to Run stages a fresh workspace, runs the
// interpreter in its own process group under a wall-clock limit, collects the
// output files and removes the workspace. Calls are independent and may run
// concurrently.
class Engine {
 public:
  explicit Engine(EngineOptions options) : options_(std::move(options)) {}

  // Never throws: staging, launch and internal failures are reported as a
  // result with exit code 1 and the reason in stderr.
  ExecutionResult Run(const ExecutionRequest& request) const;

 private:
  ExecutionResult RunInternal(const ExecutionRequest& request) const;

  EngineOptions options_;
};

}  // namespace engine

#endif
