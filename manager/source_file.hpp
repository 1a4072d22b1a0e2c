#ifndef MANAGER_SOURCE_FILE_HPP
#define MANAGER_SOURCE_FILE_HPP

#include <stdint.h>

#include <memory>
#include <string>

#include "executor/provisioner.hpp"
#include "language/registry.hpp"

namespace manager {

// Result of placing a program in its environment and compiling it.
struct BuildResult {
  bool succeeded = true;
  std::string stdout_text;
  std::string stderr_text;
  // Diagnostic of a failed build.
  std::string error;
  int64_t duration_millis = 0;
};

// The submitted program inside an environment. The environment must outlive
// the SourceFile.
class SourceFile {
 public:
  static std::unique_ptr<SourceFile> Create(
      const language::Registry& registry, const language::LanguageSpec& spec,
      executor::Provisioner* provisioner, executor::Environment* env);

  // Writes code under the canonical name of the language and builds it.
  // Throws executor::provisioning_error if the environment cannot be used.
  virtual BuildResult Build(const std::string& code,
                            int64_t timeout_millis) = 0;

  // Runs the built program once, after removing whatever earlier runs left
  // in the environment. Throws like Provisioner::Run.
  executor::CommandResult Run(const std::string& stdin_data,
                              int64_t timeout_millis);

  const std::string& Name() const { return spec_.source_name; }

  virtual ~SourceFile() = default;
  SourceFile(const SourceFile&) = delete;
  SourceFile(SourceFile&&) = delete;
  SourceFile& operator=(const SourceFile&) = delete;
  SourceFile& operator=(SourceFile&&) = delete;

 protected:
  SourceFile(const language::Registry& registry,
             const language::LanguageSpec& spec,
             executor::Provisioner* provisioner, executor::Environment* env)
      : registry_(registry),
        spec_(spec),
        provisioner_(provisioner),
        env_(env) {}

  const language::Registry& registry_;
  const language::LanguageSpec& spec_;
  executor::Provisioner* provisioner_;
  executor::Environment* env_;
};

}  // namespace manager

#endif
