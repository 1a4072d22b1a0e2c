#ifndef EXECUTOR_SANDBOX_PROVISIONER_HPP
#define EXECUTOR_SANDBOX_PROVISIONER_HPP

#include <stddef.h>

#include <mutex>

#include "executor/provisioner.hpp"
#include "sandbox/sandbox.hpp"

namespace executor {

// Provisioner whose environments are temporary directories on the local
// machine, with commands run by a sandbox::Sandbox backend.
//
// Each environment is laid out as
//   <temp_directory>/XXXXXX/box  the working directory of the commands
//   <temp_directory>/XXXXXX/io   stdin, stdout and stderr of the last command
class SandboxProvisioner : public Provisioner {
 public:
  struct Options {
    std::string temp_directory;
    // Backend to use. If empty, the best available one, which must isolate
    // the commands.
    std::string sandbox;
    size_t max_environments = 1;
    bool keep_sandboxes = false;
    // Identity for the commands when running as root.
    int32_t uid = 65534;
    int32_t gid = 65534;
  };

  // Options taken from the command line flags.
  static Options OptionsFromFlags();

  explicit SandboxProvisioner(Options options);
  SandboxProvisioner() : SandboxProvisioner(OptionsFromFlags()) {}
  ~SandboxProvisioner() override = default;

  std::unique_ptr<Environment> Create(
      const proto::ResourceConfig& config) override;
  void CheckExecutable(const std::string& program) const override;
  void WriteFile(Environment* env, const std::string& name,
                 const std::string& contents) override;
  void Checkpoint(Environment* env) override;
  void Restore(Environment* env) override;
  CommandResult Run(Environment* env, const std::vector<std::string>& argv,
                    const std::string& stdin_data,
                    int64_t timeout_millis) override;
  void Destroy(Environment* env) override;

  // Number of environments that are currently alive.
  size_t AliveEnvironments() const;

 private:
  class SandboxEnvironment;

  // Reserves one of the max_environments slots for as long as it lives.
  class EnvironmentSlot {
   public:
    explicit EnvironmentSlot(SandboxProvisioner* provisioner);
    ~EnvironmentSlot();
    EnvironmentSlot(const EnvironmentSlot&) = delete;
    EnvironmentSlot& operator=(const EnvironmentSlot&) = delete;
    EnvironmentSlot(EnvironmentSlot&&) = delete;
    EnvironmentSlot& operator=(EnvironmentSlot&&) = delete;

   private:
    SandboxProvisioner* provisioner_;
  };

  static const constexpr char* kBoxDir = "box";
  static const constexpr char* kIoDir = "io";

  SandboxEnvironment* Get(Environment* env) const;

  Options options_;
  bool drop_privileges_;
  mutable std::mutex mutex_;
  size_t alive_ = 0;
};

}  // namespace executor

#endif
