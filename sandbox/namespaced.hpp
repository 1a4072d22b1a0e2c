#ifndef SANDBOX_NAMESPACED_HPP
#define SANDBOX_NAMESPACED_HPP

#include <limits.h>

#include <memory>

#include "sandbox/cgroup.hpp"
#include "sandbox/unix.hpp"

namespace sandbox {

// Linux sandbox that runs the program in new pid, mount, network, ipc and uts
// namespaces, with a read-only view of the filesystem except for the root of
// the execution, and enforces memory, cpu and process limits through a cgroup.
// Requires root and a writable cgroup v2 hierarchy.
//
// The first process in the namespace acts as init: it forks the program,
// waits for it and reports its exit status through a pipe, since init itself
// cannot be killed by the signals the program may raise.
class Namespaced : public Unix {
 public:
  static constexpr const char* kName = "namespaced";

  const char* Name() const override { return kName; }
  bool IsIsolated() const override { return true; }
  static Sandbox* Create() { return new Namespaced(); }
  static int Score();
  ~Namespaced() override;

 protected:
  Namespaced() = default;

  bool OnSetup(std::string* error_msg) override;
  bool DoFork(std::string* error_msg) override;
  bool OnChild(char* error_msg, size_t buflen) override;
  bool WatchMemory() const override { return false; }
  void OnFinish(ExecutionInfo* info) override;

 private:
  static int CloneEntry(void* self);

  std::unique_ptr<Cgroup> cgroup_;
  std::unique_ptr<char[]> stack_;
  char cgroup_procs_[PATH_MAX] = {};
  int status_fds_[2] = {-1, -1};
};

}  // namespace sandbox

#endif
