#include "sandbox/unix.hpp"

#include <fcntl.h>
#include <grp.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cinttypes>
#include <climits>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <thread>
#include <utility>

#include "glog/logging.h"

extern char** environ;

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

// Resident set size of the given process, from /proc.
int GetProcessMemoryUsage(pid_t pid, int64_t* memory_usage_kb) {
  char path[64] = {};
  snprintf(path, sizeof(path), "/proc/%d/statm", static_cast<int>(pid));
  int fd = open(path, O_RDONLY | O_CLOEXEC);
  if (fd == -1) return -1;
  char buf[256] = {};
  ssize_t num_read = read(fd, buf, sizeof(buf) - 1);
  close(fd);
  if (num_read <= 0) return -1;
  int64_t size_pages = 0;
  int64_t resident_pages = 0;
  if (sscanf(buf, "%" SCNd64 " %" SCNd64, &size_pages, &resident_pages) != 2) {
    return -1;
  }
  static const int64_t page_kb = sysconf(_SC_PAGESIZE) / 1024;
  *memory_usage_kb = resident_pages * page_kb;
  return 0;
}
}  // namespace

namespace sandbox {

constexpr const char* Unix::kName;

static const constexpr size_t kStrErrorBufSize = 2048;

bool Unix::Execute(const ExecutionOptions& options, ExecutionInfo* info,
                   std::string* error_msg) {
  options_ = &options;
  if (!Setup(error_msg)) return false;
  if (!DoFork(error_msg)) {
    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
    return false;
  }
  if (!Wait(info, error_msg)) return false;
  return true;
}

bool Unix::Setup(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  if (pipe2(pipe_fds_, O_CLOEXEC) == -1) {
    *error_msg = "pipe2: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  // Arguments and environment are prepared here, as the child must not
  // allocate memory.
  arg_storage_.clear();
  auto store = [this](const std::string& s) {
    arg_storage_.emplace_back(s.begin(), s.end());
    arg_storage_.back().push_back('\0');
  };
  store(options_->executable);
  for (const std::string& arg : options_->args) store(arg);
  for (const std::string& var : options_->env) store(var);
  argv_.clear();
  envp_.clear();
  size_t num_args = options_->args.size() + 1;
  for (size_t i = 0; i < arg_storage_.size(); i++) {
    (i < num_args ? argv_ : envp_).push_back(arg_storage_[i].data());
  }
  argv_.push_back(nullptr);
  envp_.push_back(nullptr);
  if (!OnSetup(error_msg)) {
    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
    return false;
  }
  return true;
}

bool Unix::DoFork(std::string* error_msg) {
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    char buf[kStrErrorBufSize] = {};
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  if (fork_result != 0) {
    child_pid_ = fork_result;
    return true;
  }
  Child();
}

void Unix::Child() {
  close(pipe_fds_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 3 + 1] = {};
    strncat(buf, prefix, 64);
    strncat(buf, ": ", 3);
    strncat(buf, err, kStrErrorBufSize);
    int len = strlen(buf);
    if (write(pipe_fds_[1], &len, sizeof(len)) == sizeof(len)) {
      if (write(pipe_fds_[1], buf, len) != len) _Exit(1);
    }
    close(pipe_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));
  };

  // New session and process group, so that the whole tree can be killed at
  // once and we do not receive Ctrl-Cs in the terminal.
  if (setsid() == -1) die("setsid", errno);

  int stdin_fd = -1;
  int stdout_fd = -1;
  int stderr_fd = -1;
  const char* stdin_file =
      options_->stdin_file.empty() ? "/dev/null" : options_->stdin_file.c_str();
  stdin_fd = open(stdin_file, O_RDONLY | O_CLOEXEC);
  if (stdin_fd == -1) die("open", errno);
  if (!options_->stdout_file.empty()) {
    stdout_fd = open(options_->stdout_file.c_str(),
                     O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (stdout_fd == -1) die("open", errno);
  }
  if (!options_->stderr_file.empty()) {
    stderr_fd = open(options_->stderr_file.c_str(),
                     O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (stderr_fd == -1) die("open", errno);
  }

  if (chdir(options_->root.c_str()) == -1) {
    die("chdir", errno);
  }

  // Handle I/O redirection.
#define DUP(field, fd)                          \
  if (field##_fd != -1) {                       \
    int ret = dup2(field##_fd, fd);             \
    if (ret == -1) die("redir " #field, errno); \
  }
  DUP(stdin, STDIN_FILENO);
  DUP(stdout, STDOUT_FILENO);
  DUP(stderr, STDERR_FILENO);
#undef DUP

  // Set resource limits.
  struct rlimit rlim {};
#define SET_RLIM(res, value)                    \
  {                                             \
    rlim_t lim = value;                         \
    if (lim) {                                  \
      rlim.rlim_cur = lim;                      \
      rlim.rlim_max = lim;                      \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) { \
        die("setrlim " #res, errno);            \
      }                                         \
    }                                           \
  }

  SET_RLIM(CPU, (options_->cpu_limit_millis + 999) / 1000);
  SET_RLIM(FSIZE, options_->max_file_size_kb * 1024);
  SET_RLIM(NOFILE, options_->max_files);
  // RLIMIT_NPROC counts every process of the user, so it is only applied
  // when running as a dedicated identity.
  if (options_->uid >= 0) SET_RLIM(NPROC, options_->max_procs);
  SET_RLIM(STACK, options_->max_stack_kb * 1024);
  rlim.rlim_cur = rlim.rlim_max = 0;
  if (setrlimit(RLIMIT_CORE, &rlim) < 0) die("setrlim CORE", errno);
#undef SET_RLIM

  char buf[kStrErrorBufSize] = {};
  if (!OnChild(buf, kStrErrorBufSize)) {
    die2("OnChild", buf);
  }

  // Drop privileges.
  if (options_->gid >= 0) {
    if (setgroups(0, nullptr) == -1) die("setgroups", errno);
    if (setgid(options_->gid) == -1) die("setgid", errno);
  }
  if (options_->uid >= 0 && setuid(options_->uid) == -1) die("setuid", errno);
  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) == -1) die("prctl", errno);

  char* const* envp = options_->env.empty() ? environ : envp_.data();
  int err = 0;
  for (int count = 0; count < 16; count++) {
    execve(options_->executable.c_str(), argv_.data(), envp);
    err = errno;
    // A freshly written executable may still be open for writing in another
    // process for a short while.
    if (err != ETXTBSY) break;
    usleep(100);
  }
  die("exec", err);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

void Unix::KillChild() {
  // The child is the leader of its own process group.
  if (kill(-child_pid_, SIGKILL) == -1 && errno != ESRCH) {
    PLOG(WARNING) << "kill " << child_pid_;
  }
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  close(pipe_fds_[1]);
  int error_len = 0;
  if (read(pipe_fds_[0], &error_len, sizeof(error_len)) == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    if (error_len < 0 || error_len >= PIPE_BUF) error_len = PIPE_BUF - 1;
    if (read(pipe_fds_[0], error, error_len) < 0) {
      *error_msg = "Unknown error in the child process";
    } else {
      *error_msg = error;
    }
    close(pipe_fds_[0]);
    waitpid(child_pid_, nullptr, 0);
    return false;
  }
  close(pipe_fds_[0]);

  std::atomic<int64_t> memory_usage{0};
  std::atomic<bool> done{false};
  std::thread memory_watcher;
  if (WatchMemory() && options_->memory_limit_kb != 0) {
    memory_watcher = std::thread(
        [&memory_usage, &done](pid_t pid) {
          while (!done) {
            int64_t mem = 0;
            if (GetProcessMemoryUsage(pid, &mem) == 0) {
              if (mem > memory_usage) memory_usage = mem;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
          }
        },
        child_pid_);
  }
  auto stop_watcher = [&done, &memory_watcher]() {
    done = true;
    if (memory_watcher.joinable()) memory_watcher.join();
  };

  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  // wait4 is used instead of waitpid so that the resource usage only refers
  // to this child, even if other threads are running programs.
  int child_status = 0;
  bool has_exited = false;
  struct rusage rusage {};
  while (!options_->wall_limit_millis ||
         elapsed_millis() < options_->wall_limit_millis) {
    if (options_->memory_limit_kb != 0 &&
        memory_usage > options_->memory_limit_kb) {
      info->memory_limit_exceeded = true;
      break;
    }
    int ret = wait4(child_pid_, &child_status, WNOHANG, &rusage);
    if (ret == -1 && errno == EINTR) continue;
    if (ret == -1) {
      char buf[kStrErrorBufSize] = {};
      *error_msg = "wait4: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      KillChild();
      stop_watcher();
      return false;
    }
    if (ret == child_pid_) {
      has_exited = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  if (!has_exited) {
    if (!info->memory_limit_exceeded) info->time_limit_exceeded = true;
    KillChild();
    int ret = 0;
    while ((ret = wait4(child_pid_, &child_status, 0, &rusage)) == -1 &&
           errno == EINTR) {
    }
    if (ret != child_pid_) {
      char buf[kStrErrorBufSize] = {};
      *error_msg = "wait4: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      stop_watcher();
      return false;
    }
  }
  // Processes the program left behind in its session.
  KillChild();
  stop_watcher();

  info->memory_usage_kb = std::max<int64_t>(memory_usage, rusage.ru_maxrss);
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->wall_time_millis = elapsed_millis();
  info->cpu_time_millis =
      rusage.ru_utime.tv_sec * 1000LL + rusage.ru_utime.tv_usec / 1000;
  info->sys_time_millis =
      rusage.ru_stime.tv_sec * 1000LL + rusage.ru_stime.tv_usec / 1000;
  OnFinish(info);
  if (options_->memory_limit_kb != 0 &&
      info->memory_usage_kb > options_->memory_limit_kb) {
    info->memory_limit_exceeded = true;
  }
  if (info->signal == SIGXCPU) info->time_limit_exceeded = true;
  if (info->signal == SIGXFSZ) info->output_limit_exceeded = true;
  info->killed = info->time_limit_exceeded || info->memory_limit_exceeded ||
                 info->output_limit_exceeded;
  if (info->memory_limit_exceeded) {
    info->message = "Memory limit exceeded";
  } else if (info->time_limit_exceeded) {
    info->message = "Time limit exceeded";
  } else if (info->output_limit_exceeded) {
    info->message = "Output limit exceeded";
  } else if (info->signal != 0) {
    info->message = strsignal(info->signal);
  } else if (info->status_code != 0) {
    info->message = "Non-zero return code";
  }
  return true;
}

namespace {
Sandbox::Register<Unix> r;  // NOLINT
}  // namespace

}  // namespace sandbox
