#include "sandbox/namespaced.hpp"

#include <fcntl.h>
#include <sched.h>
#include <sys/mount.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <system_error>

#include "absl/memory/memory.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "util/flags.hpp"

namespace sandbox {

constexpr const char* Namespaced::kName;

namespace {
const constexpr size_t kStackSize = 1 << 20;
const constexpr int64_t kCpuPeriodMicros = 100000;

// Mount points that are commonly writable and separate from the root.
const char* const kWritableMounts[] = {"/tmp", "/var/tmp", "/dev/shm", "/run",
                                       "/home"};

void CloseIfOpen(int* fd) {
  if (*fd != -1) close(*fd);
  *fd = -1;
}
}  // namespace

Namespaced::~Namespaced() {
  CloseIfOpen(&status_fds_[0]);
  CloseIfOpen(&status_fds_[1]);
}

int Namespaced::Score() {
  if (geteuid() != 0) return -1;
  if (!Cgroup::Usable(FLAGS_cgroup_root)) return -1;
  return 3;
}

bool Namespaced::OnSetup(std::string* error_msg) {
  if (!stack_) stack_.reset(new char[kStackSize]);
  CloseIfOpen(&status_fds_[0]);
  CloseIfOpen(&status_fds_[1]);
  if (pipe2(status_fds_, O_CLOEXEC) == -1) {
    *error_msg = absl::StrCat("pipe2: ", strerror(errno));
    return false;
  }
  try {
    cgroup_.reset();
    cgroup_ = absl::make_unique<Cgroup>(FLAGS_cgroup_root);
    if (options_->memory_limit_kb != 0) {
      cgroup_->Write("memory.max",
                     std::to_string(options_->memory_limit_kb * 1024));
      if (cgroup_->Has("memory.swap.max")) {
        cgroup_->Write("memory.swap.max", "0");
      }
    }
    if (options_->cpu_share > 0) {
      if (cgroup_->Has("cpu.max")) {
        int64_t quota = options_->cpu_share * kCpuPeriodMicros;
        cgroup_->Write("cpu.max", absl::StrCat(quota, " ", kCpuPeriodMicros));
      } else {
        LOG_FIRST_N(WARNING, 1) << "The cpu controller is not available, "
                                   "cpu share will not be enforced";
      }
    }
    if (options_->max_procs != 0) {
      cgroup_->Write("pids.max", std::to_string(options_->max_procs));
    }
  } catch (const std::system_error& e) {
    *error_msg = absl::StrCat("cgroup: ", e.what());
    CloseIfOpen(&status_fds_[0]);
    CloseIfOpen(&status_fds_[1]);
    return false;
  }
  snprintf(cgroup_procs_, sizeof(cgroup_procs_), "%s/cgroup.procs",
           cgroup_->Path().c_str());
  return true;
}

int Namespaced::CloneEntry(void* self) {
  static_cast<Namespaced*>(self)->Child();
}

bool Namespaced::DoFork(std::string* error_msg) {
  int flags = CLONE_NEWPID | CLONE_NEWNS | CLONE_NEWNET | CLONE_NEWIPC |
              CLONE_NEWUTS | SIGCHLD;
  pid_t pid = clone(&Namespaced::CloneEntry, stack_.get() + kStackSize, flags,
                    this);
  if (pid == -1) {
    *error_msg = absl::StrCat("clone: ", strerror(errno));
    CloseIfOpen(&status_fds_[0]);
    CloseIfOpen(&status_fds_[1]);
    return false;
  }
  CloseIfOpen(&status_fds_[1]);
  child_pid_ = pid;
  return true;
}

bool Namespaced::OnChild(char* error_msg, size_t buflen) {
  auto fail = [error_msg, buflen](const char* what, const char* arg) {
    char buf[256] = {};
    snprintf(error_msg, buflen, "%s %s: %s", what, arg,
             strerror_r(errno, buf, sizeof(buf)));
    return false;
  };

  int fd = open(cgroup_procs_, O_WRONLY | O_CLOEXEC);
  if (fd == -1) return fail("open", cgroup_procs_);
  if (write(fd, "0", 1) != 1) return fail("write", cgroup_procs_);
  close(fd);

  const char* root = options_->root.c_str();
  if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) == -1) {
    return fail("mount", "/");
  }
  if (mount(root, root, nullptr, MS_BIND | MS_REC, nullptr) == -1) {
    return fail("bind", root);
  }
  // Only the per-mount flag changes, so the bind mount of root stays
  // writable.
  if (mount(nullptr, "/", nullptr, MS_REMOUNT | MS_BIND | MS_RDONLY,
            nullptr) == -1) {
    return fail("remount", "/");
  }
  for (const char* path : kWritableMounts) {
    if (mount(nullptr, path, nullptr, MS_REMOUNT | MS_BIND | MS_RDONLY,
              nullptr) == -1 &&
        errno != EINVAL && errno != ENOENT) {
      return fail("remount", path);
    }
  }
  if (mount("proc", "/proc", "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC,
            nullptr) == -1) {
    return fail("mount", "/proc");
  }
  if (sethostname(kName, strlen(kName)) == -1) {
    return fail("sethostname", kName);
  }
  // The working directory still refers to root as it was before the bind
  // mount.
  if (chdir(root) == -1) return fail("chdir", root);

  pid_t program = fork();
  if (program == -1) return fail("fork", "");
  if (program == 0) {
    close(status_fds_[0]);
    return true;
  }

  // Only the program reports exec errors to the parent.
  close(pipe_fds_[1]);
  close(status_fds_[0]);
  int status = 0;
  while (true) {
    pid_t ret = wait(&status);
    if (ret == -1 && errno == EINTR) continue;
    if (ret == -1) _Exit(1);
    if (ret == program) break;
  }
  if (write(status_fds_[1], &status, sizeof(status)) != sizeof(status)) {
    _Exit(1);
  }
  _Exit(WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status));
}

void Namespaced::OnFinish(ExecutionInfo* info) {
  int status = 0;
  if (read(status_fds_[0], &status, sizeof(status)) == sizeof(status)) {
    info->status_code = WIFEXITED(status) ? WEXITSTATUS(status) : 0;
    info->signal = WIFSIGNALED(status) ? WTERMSIG(status) : 0;
  } else {
    // Init was killed before the program terminated.
    info->status_code = 0;
    info->signal = SIGKILL;
  }
  CloseIfOpen(&status_fds_[0]);
  try {
    int64_t peak = 0;
    if (cgroup_->Has("memory.peak") &&
        absl::SimpleAtoi(cgroup_->Read("memory.peak"), &peak)) {
      info->memory_usage_kb = peak / 1024;
    }
    if (cgroup_->ReadKey("memory.events", "oom_kill") > 0) {
      info->memory_limit_exceeded = true;
    }
  } catch (const std::system_error& e) {
    LOG(WARNING) << "Could not read the usage of " << cgroup_->Path() << ": "
                 << e.what();
  }
  cgroup_.reset();
}

namespace {
Sandbox::Register<Namespaced> r;  // NOLINT
}  // namespace

}  // namespace sandbox
