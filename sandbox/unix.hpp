#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP

#include <sys/types.h>

#include <vector>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Base class for sandboxes for UNIX-like systems. On its own it only applies
// resource limits and runs the program in its own session; it does not
// isolate the network or the filesystem.
class Unix : public Sandbox {
 public:
  static constexpr const char* kName = "unix";

  const char* Name() const override { return kName; }
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) override;
  static Sandbox* Create() { return new Unix(); }
  static int Score() { return 2; }

 protected:
  Unix() = default;

  // Executed before creating the child process. Returns false and sets
  // error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Hook that is executed at the end of Setup.
  virtual bool OnSetup(std::string* error_msg) { return true; }

  // Creates a child process and saves its PID in child_pid_. The child process
  // should execute Child and must not return.
  virtual bool DoFork(std::string* error_msg);

  // Function that is executed in the child process.
  [[noreturn]] void Child();

  // Hook that is executed just before dropping privileges and calling exec.
  // Returns false if something went wrong and exec should not be called. The
  // error_msg string must not be longer then buflen characters. This function
  // must not use dynamic memory allocation.
  virtual bool OnChild(char* error_msg, size_t buflen) { return true; }

  // Whether Wait should poll the resident memory of the child and kill it
  // when it goes over the limit.
  virtual bool WatchMemory() const { return true; }

  // Waits for the termination of the child, possibly killing it if it exceeds
  // the provided wall time or memory limits.
  bool Wait(ExecutionInfo* info, std::string* error_msg);

  // Executed when the child program exits. May change the execution info with
  // "better" values, or perform clean up.
  virtual void OnFinish(ExecutionInfo* info) {}

  // Sends SIGKILL to every process in the session of the child.
  void KillChild();

  int pipe_fds_[2] = {};
  // Null-terminated argv and envp of the program, backed by arg_storage_.
  std::vector<std::vector<char>> arg_storage_;
  std::vector<char*> argv_;
  std::vector<char*> envp_;
  pid_t child_pid_ = 0;
  const ExecutionOptions* options_ = nullptr;
};

}  // namespace sandbox
#endif
