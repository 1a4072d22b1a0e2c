#ifndef LANGUAGE_REGISTRY_HPP
#define LANGUAGE_REGISTRY_HPP

#include <stdint.h>

#include <map>
#include <string>
#include <vector>

#include "executor/environment.hpp"
#include "proto/evalbox.pb.h"

namespace language {

enum class RunMode { INTERPRET, COMPILE_THEN_RUN };

// How to build and run programs of one language. Command templates may
// contain the placeholders {source}, {binary} and {dir}, replaced by the
// source file name, the name of the built program and the directory of the
// environment.
struct LanguageSpec {
  std::string id;
  RunMode mode = RunMode::INTERPRET;
  std::string source_name;
  std::string binary_name;
  // Empty for interpreted languages.
  std::vector<std::string> compile_command;
  std::vector<std::string> run_command;
  // Multiplies the memory limit of the environment.
  double memory_multiplier = 1;
  // Added to the process limit of the environment.
  int32_t extra_processes = 0;
};

// The languages built into evalbox.
std::vector<LanguageSpec> BuiltinLanguages();

// Immutable table of the supported languages. The first token of every
// command is looked up in search_path, the PATH the commands get inside an
// environment, when the registry is built.
class Registry {
 public:
  explicit Registry(const std::vector<LanguageSpec>& languages,
                    const std::string& search_path = executor::kSearchPath);

  // The registry of the built-in languages.
  static const Registry& Default();

  // Finds the LanguageSpec of language, ignoring surrounding whitespace. Throws
  // executor::unsupported_language if there is none.
  const LanguageSpec& Resolve(const std::string& language) const;

  // Sorted identifiers of the supported languages.
  std::vector<std::string> Languages() const;

  // Throws executor::provisioning_error if a program needed by spec is not
  // installed. Returns the full paths of the programs that were looked up.
  std::vector<std::string> CheckToolchain(const LanguageSpec& spec) const;

  // Commands with placeholders replaced and the program resolved. Throw
  // executor::provisioning_error if the program is not installed.
  std::vector<std::string> CompileCommand(const LanguageSpec& spec,
                                          const std::string& dir) const;
  std::vector<std::string> RunCommand(const LanguageSpec& spec,
                                      const std::string& dir) const;

  // Resource limits for running programs of the given language.
  proto::ResourceConfig ConfigFor(const LanguageSpec& spec,
                                  const proto::ResourceConfig& base) const;

 private:
  std::vector<std::string> Expand(const LanguageSpec& spec,
                                  const std::vector<std::string>& command,
                                  const std::string& dir) const;
  const std::string& Program(const std::string& name) const;

  std::map<std::string, LanguageSpec> languages_;
  // Command names to their full path, empty if not found.
  std::map<std::string, std::string> programs_;
};

}  // namespace language

#endif
