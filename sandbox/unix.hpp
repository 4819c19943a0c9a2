#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP

#include <sys/types.h>

#include <chrono>
#include <string>
#include <vector>

#include <kj/io.h>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Sandbox for UNIX-like systems. The child is started as the leader of a new
// session, so that the whole process tree it spawns can be killed at once.
class Unix : public Sandbox {
 public:
  static Sandbox* Create() { return new Unix(); }
  static int Score() { return 2; }

 protected:
  Unix() = default;

  bool ExecuteInternal(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) override;
  bool Launch(const ExecutionOptions& options,
              std::string* error_msg) override;
  void TerminateGroup() override;

  // Creates the pipes and prepares argv and envp. Nothing may be allocated
  // between fork and exec, so everything the child needs is built here.
  bool Setup(std::string* error_msg);

  // Function that is executed in the child process.
  [[noreturn]] void Child();

  // Reads the error pipe until exec succeeds or the child reports a failure.
  bool WaitForExec(std::string* error_msg);

  // Collects output until the leader exits or the wall limit expires, then
  // kills the group, drains the pipes and reaps the leader.
  void Supervise(ExecutionInfo* info);

  // Waits at most timeout_millis for output and appends what is available.
  void Pump(int timeout_millis, ExecutionInfo* info);

  // Waits for the leader until deadline. Returns false if it could not be
  // reaped in time.
  bool Reap(std::chrono::steady_clock::time_point deadline,
            ExecutionInfo* info);

  kj::AutoCloseFd error_read_;
  kj::AutoCloseFd error_write_;
  kj::AutoCloseFd stdout_read_;
  kj::AutoCloseFd stdout_write_;
  kj::AutoCloseFd stderr_read_;
  kj::AutoCloseFd stderr_write_;
  kj::AutoCloseFd null_fd_;

  std::vector<std::vector<char>> arg_storage_;
  std::vector<std::vector<char>> env_storage_;
  std::vector<char*> argv_;
  std::vector<char*> envp_;

  pid_t child_pid_ = 0;
  const ExecutionOptions* options_ = nullptr;
};

}  // namespace sandbox
#endif
