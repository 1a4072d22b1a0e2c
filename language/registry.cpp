#include "language/registry.hpp"

#include "absl/strings/str_replace.h"
#include "absl/strings/strip.h"
#include "executor/errors.hpp"
#include "glog/logging.h"
#include "util/which.hpp"

namespace language {

std::vector<LanguageSpec> BuiltinLanguages() {
  std::vector<LanguageSpec> languages;

  LanguageSpec python;
  python.id = "python";
  python.mode = RunMode::INTERPRET;
  python.source_name = "script.py";
  python.run_command = {"python3", "-B", "{source}"};
  languages.push_back(python);

  LanguageSpec c;
  c.id = "c";
  c.mode = RunMode::COMPILE_THEN_RUN;
  c.source_name = "program.c";
  c.binary_name = "program";
  c.compile_command = {"gcc",       "-O2",      "-std=gnu11", "-o",
                       "{binary}", "{source}", "-lm"};
  c.run_command = {"./{binary}"};
  languages.push_back(c);

  LanguageSpec cpp;
  cpp.id = "cpp";
  cpp.mode = RunMode::COMPILE_THEN_RUN;
  cpp.source_name = "program.cpp";
  cpp.binary_name = "program";
  cpp.compile_command = {"g++", "-O2", "-std=gnu++17", "-o", "{binary}",
                         "{source}"};
  cpp.run_command = {"./{binary}"};
  languages.push_back(cpp);

  // The JVM needs more memory and threads than native programs.
  LanguageSpec java;
  java.id = "java";
  java.mode = RunMode::COMPILE_THEN_RUN;
  java.source_name = "Main.java";
  java.binary_name = "Main";
  java.compile_command = {"javac", "-encoding", "UTF-8", "{source}"};
  java.run_command = {"java", "-Xss64m", "-cp", "{dir}", "{binary}"};
  java.memory_multiplier = 2;
  java.extra_processes = 32;
  languages.push_back(java);

  return languages;
}

Registry::Registry(const std::vector<LanguageSpec>& languages,
                   const std::string& search_path) {
  for (const LanguageSpec& spec : languages) {
    languages_[spec.id] = spec;
    for (const auto* command : {&spec.compile_command, &spec.run_command}) {
      if (command->empty()) continue;
      const std::string& program = command->front();
      // Programs given by path are looked up in the environment.
      if (program.find('/') != std::string::npos) continue;
      if (programs_.count(program)) continue;
      programs_[program] = util::which_in(program, search_path);
      if (programs_[program].empty()) {
        LOG(WARNING) << "Toolchain for " << spec.id << " not found: "
                     << program;
      } else {
        VLOG(1) << "Using " << programs_[program] << " for " << spec.id;
      }
    }
  }
}

const Registry& Registry::Default() {
  static const Registry* registry = new Registry(BuiltinLanguages());
  return *registry;
}

const LanguageSpec& Registry::Resolve(const std::string& language) const {
  auto it = languages_.find(
      std::string(absl::StripAsciiWhitespace(language)));
  if (it == languages_.end()) throw executor::unsupported_language(language);
  return it->second;
}

std::vector<std::string> Registry::Languages() const {
  std::vector<std::string> ids;
  for (const auto& language : languages_) ids.push_back(language.first);
  return ids;
}

const std::string& Registry::Program(const std::string& name) const {
  static const std::string empty;
  auto it = programs_.find(name);
  return it == programs_.end() ? empty : it->second;
}

std::vector<std::string> Registry::CheckToolchain(
    const LanguageSpec& spec) const {
  std::vector<std::string> programs;
  for (const auto* command : {&spec.compile_command, &spec.run_command}) {
    if (command->empty()) continue;
    const std::string& program = command->front();
    if (program.find('/') != std::string::npos) continue;
    if (Program(program).empty()) {
      throw executor::provisioning_error("Toolchain not found for " + spec.id +
                                         ": " + program);
    }
    programs.push_back(Program(program));
  }
  return programs;
}

std::vector<std::string> Registry::Expand(
    const LanguageSpec& spec, const std::vector<std::string>& command,
    const std::string& dir) const {
  std::vector<std::string> argv;
  for (const std::string& token : command) {
    argv.push_back(absl::StrReplaceAll(token, {{"{source}", spec.source_name},
                                               {"{binary}", spec.binary_name},
                                               {"{dir}", dir}}));
  }
  if (!argv.empty() && argv[0].find('/') == std::string::npos) {
    const std::string& program = Program(argv[0]);
    if (program.empty()) {
      throw executor::provisioning_error("Toolchain not found for " + spec.id +
                                         ": " + argv[0]);
    }
    argv[0] = program;
  }
  return argv;
}

std::vector<std::string> Registry::CompileCommand(
    const LanguageSpec& spec, const std::string& dir) const {
  return Expand(spec, spec.compile_command, dir);
}

std::vector<std::string> Registry::RunCommand(const LanguageSpec& spec,
                                              const std::string& dir) const {
  return Expand(spec, spec.run_command, dir);
}

proto::ResourceConfig Registry::ConfigFor(
    const LanguageSpec& spec, const proto::ResourceConfig& base) const {
  proto::ResourceConfig config = base;
  config.set_memory_limit_mb(base.memory_limit_mb() * spec.memory_multiplier);
  if (base.max_processes() != 0) {
    config.set_max_processes(base.max_processes() + spec.extra_processes);
  }
  return config;
}

}  // namespace language
