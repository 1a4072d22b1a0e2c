#ifndef EXECUTOR_ENVIRONMENT_HPP
#define EXECUTOR_ENVIRONMENT_HPP

#include <string>
#include <utility>

#include "proto/evalbox.pb.h"

namespace executor {

// PATH of the commands run inside an environment.
static const constexpr char* kSearchPath = "/usr/local/bin:/usr/bin:/bin";

// An isolated, disposable context in which the commands of exactly one
// submission run. Environments are created and destroyed by a Provisioner.
class Environment {
 public:
  Environment(std::string id, std::string dir, proto::ResourceConfig config)
      : id_(std::move(id)), dir_(std::move(dir)), config_(std::move(config)) {}
  virtual ~Environment() = default;

  Environment(const Environment&) = delete;
  Environment& operator=(const Environment&) = delete;
  Environment(Environment&&) = delete;
  Environment& operator=(Environment&&) = delete;

  // A string that identifies this environment in logs and reports.
  const std::string& Id() const { return id_; }

  // The writable directory commands run in, as seen by the commands.
  const std::string& Dir() const { return dir_; }

  const proto::ResourceConfig& Config() const { return config_; }

  bool Destroyed() const { return destroyed_; }
  void SetDestroyed() { destroyed_ = true; }

 private:
  std::string id_;
  std::string dir_;
  proto::ResourceConfig config_;
  bool destroyed_ = false;
};

}  // namespace executor

#endif
