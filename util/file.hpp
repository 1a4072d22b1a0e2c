#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP

#include <stdint.h>

#include <string>
#include <system_error>
#include <vector>

namespace util {

class file_exists : public std::system_error {
 public:
  explicit file_exists(const std::string& msg)
      : std::system_error(EEXIST, std::system_category(), msg) {}
};

class file_not_found : public std::system_error {
 public:
  explicit file_not_found(const std::string& msg)
      : std::system_error(ENOENT, std::system_category(), msg) {}
};

static const constexpr uint32_t kChunkSize = 32 * 1024;

class File {
 public:
  // Reads the whole file specified by path. If limit is positive, at most
  // limit bytes are read and the rest of the file is ignored.
  static std::string Read(const std::string& path, int64_t limit = 0);

  // Writes contents to the file specified by path, atomically replacing it.
  // Throws file_exists if the file is already present and overwrite is false.
  static void Write(const std::string& path, const std::string& contents,
                    bool overwrite = false);

  // Creates all the folder that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Removes a file.
  static void Remove(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Names of the entries of a directory, without "." and "..", sorted.
  static std::vector<std::string> ListDir(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes the last component of a path.
  static std::string BaseName(const std::string& path);

  static bool Exists(const std::string& path);

  // Returns true if the user uid with primary group gid, and no
  // supplementary groups, could execute the regular file at path.
  static bool IsExecutableBy(const std::string& path, int32_t uid,
                             int32_t gid);

  // Returns true if name is usable as a plain file name inside a directory:
  // not empty, no path separators, no NUL bytes, not "." or "..".
  static bool IsPlainName(const std::string& name);
};

class TempDir {
 public:
  explicit TempDir(const std::string& base);
  const std::string& Path() const;
  void Keep();
  ~TempDir();

  TempDir(TempDir&&) = delete;
  TempDir& operator=(TempDir&&) = delete;
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

 private:
  std::string path_;
  bool keep_ = false;
};

}  // namespace util

#endif
