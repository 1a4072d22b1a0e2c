#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <stdint.h>

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sandbox {

// Settings to execute the program in the sandbox.
struct ExecutionOptions {
  // Optional values, 0 means unlimited.
  int64_t cpu_limit_millis = 0;
  int64_t wall_limit_millis = 0;
  int64_t memory_limit_kb = 0;
  // Fraction of a core the program may use.
  double cpu_share = 0;
  int32_t max_procs = 0;
  int32_t max_files = 0;
  int64_t max_file_size_kb = 0;
  int64_t max_stack_kb = 0;

  // Identity the program runs as; negative values keep the current one.
  int32_t uid = -1;
  int32_t gid = -1;

  std::string stdin_file = "";
  std::string stdout_file = "";
  std::string stderr_file = "";
  std::vector<std::string> args;
  // Full environment of the program, as NAME=value strings.
  std::vector<std::string> env;

  // Required values. root is both the working directory and the only
  // location the program may write to.
  std::string root = "";
  std::string executable = "";
  ExecutionOptions(std::string root, std::string executable)
      : root(std::move(root)), executable(std::move(executable)) {}
};

// Results of the execution.
struct ExecutionInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int64_t memory_usage_kb = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  // True if the program was killed by the sandbox.
  bool killed = false;
  // Wall clock or CPU time limit.
  bool time_limit_exceeded = false;
  bool memory_limit_exceeded = false;
  bool output_limit_exceeded = false;
  std::string message;
};

// Sandbox interface. Implementations need to register themselves by creating a
// global object of type Sandbox::Register<SandboxImpl> and should define the
// Create, Score and Name static functions. Create should return a pointer to
// a newly allocated instance of the given implementation, while Score should
// return a value that defines how "good" that sandbox is: negative if the
// sandbox should not/cannot be used in the current configuration, positive
// otherwise (a bigger value means a better sandbox).
// Registering a sandbox is not thread-safe and should be done before any
// threads are created.
class Sandbox {
 public:
  using create_t = std::function<Sandbox*()>;
  using score_t = std::function<int()>;

  // Creates the best usable sandbox or, if name is not empty, the sandbox
  // with the given name. Returns nullptr if no such sandbox can be used.
  static std::unique_ptr<Sandbox> Create(const std::string& name = "");

  // Names of all the registered sandboxes.
  static std::vector<std::string> Names();

  virtual const char* Name() const = 0;

  // Returns true if the sandbox isolates the program from the network and
  // from the rest of the filesystem.
  virtual bool IsIsolated() const { return false; }

  // Runs the specified command. Returns true if the program was started,
  // and sets fields in info. Otherwise, returns false and sets error_msg.
  // Implementations of this function may not be thread safe.
  virtual bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) = 0;

  // Constructor and destructors
  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { Sandbox::Register_(T::kName, &T::Create, &T::Score); }
  };

 private:
  struct Entry {
    std::string name;
    create_t create;
    score_t score;
  };
  using store_t = std::vector<Entry>;
  static store_t* Boxes_();
  static void Register_(const std::string& name, create_t create,
                        score_t score);
  template <typename T>
  friend class Register;
};

}  // namespace sandbox

#endif
