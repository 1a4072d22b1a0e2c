#include "util/file.hpp"

#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <ftw.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <memory>
#include <utility>

#include "glog/logging.h"

namespace {

static const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH) !=
             -1 ||
         errno == EEXIST;
}

bool OsRemove(const std::string& path) { return remove(path.c_str()) != -1; }

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

bool CanSearch(const struct stat& st, int32_t uid, int32_t gid) {
  if (uid == 0) {
    return S_ISDIR(st.st_mode) || (st.st_mode & (S_IXUSR | S_IXGRP | S_IXOTH));
  }
  if (st.st_uid == static_cast<uid_t>(uid)) return st.st_mode & S_IXUSR;
  if (st.st_gid == static_cast<gid_t>(gid)) return st.st_mode & S_IXGRP;
  return st.st_mode & S_IXOTH;
}

std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  std::unique_ptr<char[]> data{strdup(tmp.c_str())};
  if (mkdtemp(data.get()) == nullptr) {
    return "";
  }
  return data.get();
}

int OsTempFile(const std::string& path, std::string* tmp) {
  *tmp = path + ".XXXXXX";
  std::unique_ptr<char[]> data{strdup(tmp->c_str())};
  int fd = mkostemp(data.get(), O_CLOEXEC);
  *tmp = data.get();
  return fd;
}

// Returns errno, or 0 on success.
int OsAtomicMove(const std::string& src, const std::string& dst,
                 bool overwrite) {
  if (overwrite) {
    if (rename(src.c_str(), dst.c_str()) == -1) return errno;
    return 0;
  }
  if (link(src.c_str(), dst.c_str()) == -1) return errno;
  return remove(src.c_str()) != -1 ? 0 : errno;
}

int OsRead(const std::string& path, int64_t limit, std::string* contents) {
  int fd = open(path.c_str(), O_CLOEXEC | O_RDONLY);
  if (fd == -1) return errno;
  char buf[util::kChunkSize] = {};
  ssize_t amount = 0;
  while (true) {
    size_t want = util::kChunkSize;
    if (limit > 0) {
      int64_t left = limit - static_cast<int64_t>(contents->size());
      if (left <= 0) break;
      if (left < static_cast<int64_t>(want)) want = left;
    }
    amount = read(fd, buf, want);
    if (amount == -1 && errno == EINTR) continue;
    if (amount <= 0) break;
    contents->append(buf, amount);
  }
  if (amount == -1) {
    int error = errno;
    close(fd);
    return error;
  }
  return close(fd) == -1 ? errno : 0;
}

int OsWrite(const std::string& path, const std::string& contents,
            bool overwrite) {
  std::string temp_file;
  int fd = OsTempFile(path, &temp_file);
  if (fd == -1) return errno;
  size_t pos = 0;
  while (pos < contents.size()) {
    ssize_t written = write(fd, contents.data() + pos, contents.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) {
      int error = errno;
      close(fd);
      remove(temp_file.c_str());
      return error;
    }
    pos += written;
  }
  if (close(fd) == -1) return errno;
  int error = OsAtomicMove(temp_file, path, overwrite);
  if (error) remove(temp_file.c_str());
  return error;
}

}  // namespace

namespace util {

std::string File::Read(const std::string& path, int64_t limit) {
  std::string contents;
  int err = OsRead(path, limit, &contents);
  if (err == ENOENT) throw file_not_found("Read " + path);
  if (err) throw std::system_error(err, std::system_category(), "Read " + path);
  return contents;
}

void File::Write(const std::string& path, const std::string& contents,
                 bool overwrite) {
  MakeDirs(BaseDir(path));
  if (!overwrite && Exists(path)) throw file_exists("Write " + path);
  int err = OsWrite(path, contents, overwrite);
  if (err == EEXIST) throw file_exists("Write " + path);
  if (err) throw std::system_error(err, std::system_category(), "Write " + path);
}

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir " + path);
    }
  }
}

void File::Remove(const std::string& path) {
  if (!OsRemove(path))
    throw std::system_error(errno, std::system_category(), "remove " + path);
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path))
    throw std::system_error(errno, std::system_category(),
                            "removetree " + path);
}

std::vector<std::string> File::ListDir(const std::string& path) {
  std::unique_ptr<DIR, int (*)(DIR*)> dir(opendir(path.c_str()), closedir);
  if (!dir)
    throw std::system_error(errno, std::system_category(), "opendir " + path);
  std::vector<std::string> names;
  errno = 0;
  while (struct dirent* entry = readdir(dir.get())) {
    std::string name = entry->d_name;
    if (name != "." && name != "..") names.push_back(std::move(name));
  }
  if (errno != 0)
    throw std::system_error(errno, std::system_category(), "readdir " + path);
  std::sort(names.begin(), names.end());
  return names;
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (!second.empty() && strchr(kPathSeparators, second[0])) return second;
  if (!first.empty() && first.back() == kPathSeparators[0])
    return first + second;
  return first + kPathSeparators[0] + second;
}

std::string File::BaseDir(const std::string& path) {
  size_t pos = path.find_last_of(kPathSeparators);
  if (pos == std::string::npos) return ".";
  if (pos == 0) return kPathSeparators;
  return path.substr(0, pos);
}

std::string File::BaseName(const std::string& path) {
  size_t pos = path.find_last_of(kPathSeparators);
  if (pos == std::string::npos) return path;
  return path.substr(pos + 1);
}

bool File::Exists(const std::string& path) {
  struct stat buffer {};
  return stat(path.c_str(), &buffer) == 0;
}

bool File::IsExecutableBy(const std::string& path, int32_t uid,
                          int32_t gid) {
  std::unique_ptr<char, decltype(&free)> real(realpath(path.c_str(), nullptr),
                                               free);
  if (!real) return false;
  std::string resolved = real.get();
  // Every directory on the way has to be searchable as well.
  size_t pos = 0;
  while (true) {
    pos = resolved.find_first_of(kPathSeparators, pos + 1);
    std::string prefix =
        pos == std::string::npos ? resolved : resolved.substr(0, pos);
    struct stat buffer {};
    if (stat(prefix.c_str(), &buffer) == -1) return false;
    if (!CanSearch(buffer, uid, gid)) return false;
    if (pos == std::string::npos) return S_ISREG(buffer.st_mode);
  }
}

bool File::IsPlainName(const std::string& name) {
  if (name.empty() || name == "." || name == "..") return false;
  if (name.find('\0') != std::string::npos) return false;
  return name.find_first_of(kPathSeparators) == std::string::npos;
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_.empty())
    throw std::system_error(errno, std::system_category(), "mkdtemp " + base);
}
void TempDir::Keep() { keep_ = true; }
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {
  if (keep_) return;
  if (!OsRemoveTree(path_)) {
    LOG(WARNING) << "Could not remove " << path_ << ": " << strerror(errno);
  }
}

}  // namespace util
