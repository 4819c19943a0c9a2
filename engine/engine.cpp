#include "engine/engine.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <system_error>

#include <kj/debug.h>

#include "engine/workspace.hpp"
#include "sandbox/sandbox.hpp"
#include "util/misc.hpp"
#include "util/which.hpp"

namespace engine {

namespace {
ExecutionResult Failure(const std::string& message) {
  ExecutionResult result;
  result.exit_code = 1;
  result.stderr_data = message;
  return result;
}

std::vector<std::string> Environment(const Workspace& workspace,
                                     const std::string& search_path) {
  return {
      "PATH=" + search_path,
      "HOME=" + workspace.Root(),
      "LANG=C.UTF-8",
      "LC_ALL=C.UTF-8",
      "OUTPUT_DIR=" + workspace.OutputDir(),
      "MPLBACKEND=Agg",
      "PYTHONUNBUFFERED=1",
      "PYTHONDONTWRITEBYTECODE=1",
      "TMPDIR=" + workspace.Root(),
  };
}
}  // namespace

int32_t ClampTimeout(int32_t timeout_seconds) {
  return std::max(kMinTimeoutSeconds,
                  std::min(kMaxTimeoutSeconds, timeout_seconds));
}

ExecutionResult Engine::Run(const ExecutionRequest& request) const {
  ExecutionResult result;
  KJ_IF_MAYBE(exc, kj::runCatchingExceptions(
                       [&]() { result = RunInternal(request); })) {
    KJ_LOG(ERROR, "Execution failed", exc->getDescription());
    return Failure("Internal error: " +
                   std::string(exc->getDescription().cStr()));
  }
  return result;
}

ExecutionResult Engine::RunInternal(const ExecutionRequest& request) const {
  auto start = std::chrono::steady_clock::now();
  const LanguageSpec& language = GetLanguage(request.language);
  int32_t timeout = ClampTimeout(request.timeout_seconds);

  std::unique_ptr<Workspace> workspace;
  try {
    workspace = std::make_unique<Workspace>(options_.temp_directory, language,
                                            request.code);
  } catch (const std::system_error& e) {
    KJ_LOG(WARNING, "Failed to prepare workspace", e.what());
    return Failure(std::string("Failed to prepare workspace: ") + e.what());
  }

  ExecutionResult result;
  std::string interpreter =
      util::which(language.interpreter, options_.search_path);
  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  sandbox::ExecutionInfo info;
  std::string error_msg;
  if (interpreter.empty()) {
    KJ_LOG(WARNING, "Interpreter not found", language.interpreter);
    result = Failure(std::string("Cannot find interpreter: ") +
                     language.interpreter);
  } else if (!sb) {
    result = Failure("No sandbox available");
  } else {
    sandbox::ExecutionOptions options(workspace->Root(), interpreter);
    options.args = {workspace->ScriptPath()};
    options.env = Environment(*workspace, options_.search_path);
    options.wall_limit_millis = timeout * 1000LL;
    options.drain_limit_millis = options_.drain_millis;
    options.max_output_bytes = options_.max_output_bytes;
    if (!sb->Execute(options, &info, &error_msg)) {
      KJ_LOG(WARNING, "Launch failed", interpreter, error_msg);
      result = Failure(error_msg);
    } else {
      result.stdout_data = util::toValidUtf8(info.stdout_data);
      result.stderr_data = util::toValidUtf8(info.stderr_data);
      if (info.killed) {
        KJ_LOG(INFO, "Execution timed out", timeout, workspace->Root());
        std::string message = "Execution timed out after " +
                              std::to_string(timeout) + " seconds";
        if (!result.stderr_data.empty()) {
          message += "\n" + result.stderr_data;
        }
        result.stderr_data = std::move(message);
        result.exit_code = kTimeoutExitCode;
      } else if (info.signal != 0) {
        result.exit_code = -info.signal;
      } else {
        result.exit_code = info.status_code;
      }
    }
  }
  util::truncateUtf8(&result.stdout_data, options_.max_output_bytes);
  util::truncateUtf8(&result.stderr_data, options_.max_output_bytes);

  result.files =
      CollectOutputFiles(workspace->OutputDir(), options_.max_file_bytes);
  workspace.reset();

  KJ_LOG(INFO, "Execution finished", language.name, result.exit_code,
         result.stdout_data.size(), result.stderr_data.size(),
         result.files.size(), info.cpu_time_millis, info.sys_time_millis,
         std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
             .count());
  return result;
}

}  // namespace engine
