#ifndef EXECUTOR_PROVISIONER_HPP
#define EXECUTOR_PROVISIONER_HPP

#include <stdint.h>

#include <memory>
#include <string>
#include <vector>

#include "executor/environment.hpp"
#include "executor/errors.hpp"
#include "proto/evalbox.pb.h"

namespace executor {

// Outcome of a command that ran to completion inside an environment.
struct CommandResult {
  int32_t exit_code = 0;
  int32_t signal = 0;
  std::string stdout_text;
  std::string stderr_text;
  int64_t duration_millis = 0;
  int64_t memory_usage_kb = 0;

  bool Succeeded() const { return exit_code == 0 && signal == 0; }

  // How the command terminated, e.g. "Process exited with code 1".
  std::string Describe() const;
};

// Creates isolated environments and runs commands inside them.
class Provisioner {
 public:
  // Creates a new environment with the given resource limits. Throws
  // provisioning_error if that is not possible.
  virtual std::unique_ptr<Environment> Create(
      const proto::ResourceConfig& config) = 0;

  // Throws provisioning_error if commands run inside the environments would
  // not be allowed to execute the program at the given full path.
  virtual void CheckExecutable(const std::string& program) const = 0;

  // Places a file with the given contents in the directory of the
  // environment. The name must be a plain file name.
  virtual void WriteFile(Environment* env, const std::string& name,
                         const std::string& contents) = 0;

  // Records the files currently in the directory of the environment, i.e.
  // the program and what its build produced.
  virtual void Checkpoint(Environment* env) = 0;

  // Removes everything that was added to the directory of the environment
  // since the last Checkpoint. Throws provisioning_error if that fails or
  // if no checkpoint was taken.
  virtual void Restore(Environment* env) = 0;

  // Runs argv inside the environment, with stdin_data as its standard input.
  // Throws execution_timeout if the command does not terminate within
  // timeout_millis, resource_exceeded if it is killed for using too much
  // memory or output, and provisioning_error if it cannot be started.
  virtual CommandResult Run(Environment* env,
                            const std::vector<std::string>& argv,
                            const std::string& stdin_data,
                            int64_t timeout_millis) = 0;

  // Releases everything the environment holds. Destroying an environment
  // twice has no effect.
  virtual void Destroy(Environment* env) = 0;

  Provisioner() = default;
  virtual ~Provisioner() = default;
  Provisioner(const Provisioner&) = delete;
  Provisioner& operator=(const Provisioner&) = delete;
  Provisioner(Provisioner&&) = delete;
  Provisioner& operator=(Provisioner&&) = delete;
};

// Owns an environment for the duration of a scope: the constructor creates
// it, the destructor destroys it.
class EnvironmentLease {
 public:
  EnvironmentLease(Provisioner* provisioner,
                   const proto::ResourceConfig& config);
  ~EnvironmentLease();

  EnvironmentLease(const EnvironmentLease&) = delete;
  EnvironmentLease& operator=(const EnvironmentLease&) = delete;
  EnvironmentLease(EnvironmentLease&&) = delete;
  EnvironmentLease& operator=(EnvironmentLease&&) = delete;

  Environment* Get() const { return env_.get(); }
  Environment* operator->() const { return env_.get(); }

  // Destroys the environment before the end of the scope.
  void Release();

 private:
  Provisioner* provisioner_;
  std::unique_ptr<Environment> env_;
};

}  // namespace executor

#endif
