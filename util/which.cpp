#include "util/which.hpp"

#include <cstdlib>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <unistd.h>

#include "absl/strings/str_split.h"
#include "util/file.hpp"

namespace {
std::mutex cache_mutex;
std::unordered_map<std::string, std::string> cmd_cache;

bool IsExecutable(const std::string& path) {
  return util::File::Exists(path) && access(path.c_str(), X_OK) == 0;
}

std::string Search(const std::string& cmd, const std::string& search_path) {
  std::vector<std::string> dirs =
      absl::StrSplit(search_path, ':', absl::SkipEmpty());
  for (const std::string& dir : dirs) {
    std::string fullpath = util::File::JoinPath(dir, cmd);
    if (IsExecutable(fullpath)) return fullpath;
  }
  return "";
}
}  // namespace

namespace util {

std::string which(const std::string& cmd, bool use_cache) {
  if (cmd.find('/') != std::string::npos) {
    return IsExecutable(cmd) ? cmd : "";
  }
  std::lock_guard<std::mutex> lck(cache_mutex);
  if (use_cache && cmd_cache.count(cmd) > 0) return cmd_cache[cmd];

  const char* path = std::getenv("PATH");
  if (path == nullptr) return cmd_cache[cmd] = "";
  return cmd_cache[cmd] = Search(cmd, path);
}

std::string which_in(const std::string& cmd, const std::string& search_path) {
  if (cmd.find('/') != std::string::npos) {
    return IsExecutable(cmd) ? cmd : "";
  }
  return Search(cmd, search_path);
}

}  // namespace util
