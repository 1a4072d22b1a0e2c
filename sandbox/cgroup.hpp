#ifndef SANDBOX_CGROUP_HPP
#define SANDBOX_CGROUP_HPP

#include <stdint.h>

#include <string>
#include <vector>

namespace sandbox {

// A cgroup (v2) created below a parent cgroup and removed, together with any
// process still inside it, on destruction.
class Cgroup {
 public:
  // Creates a cgroup with a unique name inside parent. Throws
  // std::system_error on failure.
  explicit Cgroup(const std::string& parent);
  ~Cgroup();

  Cgroup(const Cgroup&) = delete;
  Cgroup& operator=(const Cgroup&) = delete;
  Cgroup(Cgroup&&) = delete;
  Cgroup& operator=(Cgroup&&) = delete;

  const std::string& Path() const { return path_; }

  // Whether the given control file exists, i.e. whether its controller is
  // enabled for this cgroup.
  bool Has(const std::string& file) const;

  void Write(const std::string& file, const std::string& value) const;
  std::string Read(const std::string& file) const;

  // Reads a key from a flat keyed file such as memory.events. Returns 0 if
  // the key is not present.
  int64_t ReadKey(const std::string& file, const std::string& key) const;

  // Returns true if parent can be used to create cgroups with the memory and
  // pids controllers, creating it and enabling the controllers if needed.
  static bool Usable(const std::string& parent);

 private:
  std::string path_;
};

}  // namespace sandbox

#endif
