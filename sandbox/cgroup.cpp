#include "sandbox/cgroup.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <set>
#include <system_error>
#include <thread>

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "glog/logging.h"
#include "util/file.hpp"

namespace {
const constexpr char* kCgroupFsRoot = "/sys/fs/cgroup";
const constexpr int kRemoveAttempts = 200;

void WriteControlFile(const std::string& path, const std::string& value) {
  int fd = open(path.c_str(), O_WRONLY | O_CLOEXEC);
  if (fd == -1) {
    throw std::system_error(errno, std::system_category(), "open " + path);
  }
  ssize_t written = write(fd, value.data(), value.size());
  int error = errno;
  close(fd);
  if (written != static_cast<ssize_t>(value.size())) {
    throw std::system_error(error, std::system_category(),
                            "write " + value + " to " + path);
  }
}
}  // namespace

namespace sandbox {

Cgroup::Cgroup(const std::string& parent) {
  static std::atomic<uint64_t> counter{0};
  path_ = util::File::JoinPath(
      parent, absl::StrCat("box_", getpid(), "_", counter++));
  if (mkdir(path_.c_str(), S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH) ==
      -1) {
    throw std::system_error(errno, std::system_category(), "mkdir " + path_);
  }
  VLOG(1) << "Created cgroup " << path_;
}

Cgroup::~Cgroup() {
  if (Has("cgroup.kill")) {
    try {
      Write("cgroup.kill", "1");
    } catch (const std::system_error& e) {
      LOG(WARNING) << "Could not kill the processes of " << path_ << ": "
                   << e.what();
    }
  }
  // Killed processes leave the cgroup asynchronously.
  for (int i = 0; i < kRemoveAttempts; i++) {
    if (rmdir(path_.c_str()) == 0 || errno == ENOENT) return;
    if (errno != EBUSY) break;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  PLOG(WARNING) << "Could not remove cgroup " << path_;
}

bool Cgroup::Has(const std::string& file) const {
  return util::File::Exists(util::File::JoinPath(path_, file));
}

void Cgroup::Write(const std::string& file, const std::string& value) const {
  WriteControlFile(util::File::JoinPath(path_, file), value);
}

std::string Cgroup::Read(const std::string& file) const {
  return util::File::Read(util::File::JoinPath(path_, file));
}

int64_t Cgroup::ReadKey(const std::string& file, const std::string& key) const {
  for (absl::string_view line : absl::StrSplit(Read(file), '\n')) {
    std::vector<absl::string_view> fields =
        absl::StrSplit(line, ' ', absl::SkipEmpty());
    int64_t value = 0;
    if (fields.size() == 2 && fields[0] == key &&
        absl::SimpleAtoi(fields[1], &value)) {
      return value;
    }
  }
  return 0;
}

bool Cgroup::Usable(const std::string& parent) {
  if (!util::File::Exists(
          util::File::JoinPath(kCgroupFsRoot, "cgroup.controllers"))) {
    VLOG(1) << "No cgroup v2 hierarchy at " << kCgroupFsRoot;
    return false;
  }
  auto controllers_in = [&parent](const std::string& file) {
    std::vector<std::string> controllers =
        absl::StrSplit(util::File::Read(util::File::JoinPath(parent, file)),
                       absl::ByAnyChar(" \n"), absl::SkipEmpty());
    return std::set<std::string>(controllers.begin(), controllers.end());
  };
  try {
    util::File::MakeDirs(parent);
    std::set<std::string> available = controllers_in("cgroup.controllers");
    if (!available.count("memory") || !available.count("pids")) {
      VLOG(1) << "Missing cgroup controllers in " << parent;
      return false;
    }
    std::set<std::string> enabled = controllers_in("cgroup.subtree_control");
    std::vector<std::string> enable;
    for (const char* controller : {"cpu", "memory", "pids"}) {
      if (available.count(controller) && !enabled.count(controller)) {
        enable.push_back(absl::StrCat("+", controller));
      }
    }
    if (!enable.empty()) {
      WriteControlFile(util::File::JoinPath(parent, "cgroup.subtree_control"),
                       absl::StrJoin(enable, " "));
    }
  } catch (const std::system_error& e) {
    VLOG(1) << "Cannot use " << parent << ": " << e.what();
    return false;
  }
  return true;
}

}  // namespace sandbox
