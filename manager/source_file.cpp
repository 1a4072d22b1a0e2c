#include "manager/source_file.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>
#include <vector>

#include "absl/memory/memory.h"
#include "glog/logging.h"

namespace manager {

namespace {

int64_t MillisSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

class CompiledSourceFile : public SourceFile {
 public:
  CompiledSourceFile(const language::Registry& registry,
                     const language::LanguageSpec& spec,
                     executor::Provisioner* provisioner,
                     executor::Environment* env)
      : SourceFile(registry, spec, provisioner, env) {}

  BuildResult Build(const std::string& code, int64_t timeout_millis) override;
};

class NotCompiledSourceFile : public SourceFile {
 public:
  NotCompiledSourceFile(const language::Registry& registry,
                        const language::LanguageSpec& spec,
                        executor::Provisioner* provisioner,
                        executor::Environment* env)
      : SourceFile(registry, spec, provisioner, env) {}

  BuildResult Build(const std::string& code,
                    int64_t /*timeout_millis*/) override {
    provisioner_->WriteFile(env_, Name(), code);
    return BuildResult();
  }
};

BuildResult CompiledSourceFile::Build(const std::string& code,
                                      int64_t timeout_millis) {
  provisioner_->WriteFile(env_, Name(), code);
  std::vector<std::string> argv = registry_.CompileCommand(spec_, env_->Dir());

  BuildResult build;
  auto start = std::chrono::steady_clock::now();
  try {
    executor::CommandResult result =
        provisioner_->Run(env_, argv, "", timeout_millis);
    build.stdout_text = std::move(result.stdout_text);
    build.stderr_text = std::move(result.stderr_text);
    build.duration_millis = result.duration_millis;
    if (!result.Succeeded()) {
      build.succeeded = false;
      build.error =
          build.stderr_text.empty() ? result.Describe() : build.stderr_text;
    }
  } catch (const executor::execution_timeout& e) {
    build.succeeded = false;
    build.error = "Compilation timed out after " +
                  std::to_string(e.timeout_millis()) + "ms";
    build.duration_millis = MillisSince(start);
  } catch (const executor::resource_exceeded& e) {
    build.succeeded = false;
    build.error = e.what();
    build.duration_millis = MillisSince(start);
  }
  VLOG(1) << "Compilation of " << Name() << " in " << env_->Id()
          << (build.succeeded ? " succeeded" : " failed") << " after "
          << build.duration_millis << "ms";
  return build;
}

}  // namespace

// static
std::unique_ptr<SourceFile> SourceFile::Create(
    const language::Registry& registry, const language::LanguageSpec& spec,
    executor::Provisioner* provisioner, executor::Environment* env) {
  switch (spec.mode) {
    case language::RunMode::COMPILE_THEN_RUN:
      return absl::make_unique<CompiledSourceFile>(registry, spec, provisioner,
                                                   env);
    case language::RunMode::INTERPRET:
      return absl::make_unique<NotCompiledSourceFile>(registry, spec,
                                                      provisioner, env);
  }
  throw std::logic_error("Unknown run mode for " + spec.id);
}

executor::CommandResult SourceFile::Run(const std::string& stdin_data,
                                        int64_t timeout_millis) {
  provisioner_->Restore(env_);
  return provisioner_->Run(env_, registry_.RunCommand(spec_, env_->Dir()),
                           stdin_data, timeout_millis);
}

}  // namespace manager
