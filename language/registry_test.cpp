#include "language/registry.hpp"

#include <stdlib.h>
#include <sys/stat.h>

#include "executor/errors.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

using language::LanguageSpec;
using language::Registry;
using language::RunMode;

LanguageSpec FakeCompiled(const std::string& compiler) {
  LanguageSpec spec;
  spec.id = "fake";
  spec.mode = RunMode::COMPILE_THEN_RUN;
  spec.source_name = "fake.src";
  spec.binary_name = "fake";
  spec.compile_command = {compiler, "-o", "{binary}", "{dir}/{source}"};
  spec.run_command = {"./{binary}", "--flag"};
  return spec;
}

// NOLINTNEXTLINE
TEST(Registry, BuiltinLanguages) {
  Registry registry(language::BuiltinLanguages());
  EXPECT_THAT(registry.Languages(), ElementsAre("c", "cpp", "java", "python"));

  EXPECT_EQ(registry.Resolve("python").mode, RunMode::INTERPRET);
  EXPECT_TRUE(registry.Resolve("python").compile_command.empty());
  EXPECT_EQ(registry.Resolve("python").source_name, "script.py");
  EXPECT_EQ(registry.Resolve("c").mode, RunMode::COMPILE_THEN_RUN);
  EXPECT_EQ(registry.Resolve("c").source_name, "program.c");
  EXPECT_EQ(registry.Resolve("cpp").source_name, "program.cpp");
  EXPECT_EQ(registry.Resolve("java").source_name, "Main.java");
  EXPECT_THAT(registry.Resolve("java").run_command,
              ElementsAre("java", "-Xss64m", "-cp", "{dir}", "{binary}"));
}

// NOLINTNEXTLINE
TEST(Registry, Unsupported) {
  Registry registry(language::BuiltinLanguages());
  try {
    registry.Resolve("ruby");
    FAIL() << "ruby resolved";
  } catch (const executor::unsupported_language& e) {
    EXPECT_STREQ(e.what(), "Unsupported language: ruby");
    EXPECT_EQ(e.language(), "ruby");
  }
  EXPECT_THROW(registry.Resolve(""),  // NOLINT
               executor::unsupported_language);
}

// NOLINTNEXTLINE
TEST(Registry, IdentifiersAreTrimmedAndCaseSensitive) {
  Registry registry(language::BuiltinLanguages());
  EXPECT_EQ(registry.Resolve("  cpp\n").id, "cpp");
  EXPECT_THROW(registry.Resolve("Python"),  // NOLINT
               executor::unsupported_language);
  EXPECT_THROW(registry.Resolve("CPP"),  // NOLINT
               executor::unsupported_language);
}

// NOLINTNEXTLINE
TEST(Registry, ExpandsPlaceholders) {
  Registry registry({FakeCompiled("sh")});
  const LanguageSpec& spec = registry.Resolve("fake");
  std::vector<std::string> compile = registry.CompileCommand(spec, "/box");
  ASSERT_EQ(compile.size(), 4);
  EXPECT_EQ(compile[0].front(), '/');
  EXPECT_THAT(compile[0], HasSubstr("sh"));
  EXPECT_EQ(compile[1], "-o");
  EXPECT_EQ(compile[2], "fake");
  EXPECT_EQ(compile[3], "/box/fake.src");
  EXPECT_THAT(registry.RunCommand(spec, "/box"),
              ElementsAre("./fake", "--flag"));
}

// NOLINTNEXTLINE
TEST(Registry, MissingToolchain) {
  Registry registry({FakeCompiled("evalbox-no-such-compiler")});
  const LanguageSpec& spec = registry.Resolve("fake");
  EXPECT_THROW(registry.CheckToolchain(spec),  // NOLINT
               executor::provisioning_error);
  try {
    registry.CompileCommand(spec, "/box");
    FAIL() << "Missing compiler resolved";
  } catch (const executor::provisioning_error& e) {
    EXPECT_THAT(e.what(), HasSubstr("Toolchain not found"));
    EXPECT_THAT(e.what(), HasSubstr("evalbox-no-such-compiler"));
  }
  // Programs given by path are not looked up.
  EXPECT_THAT(registry.RunCommand(spec, "/box"),
              ElementsAre("./fake", "--flag"));
}

// NOLINTNEXTLINE
TEST(Registry, ToolchainIsLookedUpInTheSearchPath) {
  util::TempDir tools("/tmp/evalbox_testdir/registry");
  std::string compiler = tools.Path() + "/evalbox-test-cc";
  util::File::Write(compiler, "#!/bin/sh\n");
  chmod(compiler.c_str(), S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH);

  // The PATH of this process does not matter.
  setenv("PATH", tools.Path().c_str(), 1);
  Registry hidden({FakeCompiled("evalbox-test-cc")}, "/nonexistent");
  EXPECT_THROW(hidden.CheckToolchain(hidden.Resolve("fake")),  // NOLINT
               executor::provisioning_error);

  Registry visible({FakeCompiled("evalbox-test-cc")}, "/nonexistent:" +
                                                          tools.Path());
  EXPECT_THAT(visible.CheckToolchain(visible.Resolve("fake")),
              ElementsAre(compiler));
  EXPECT_EQ(visible.CompileCommand(visible.Resolve("fake"), "/box")[0],
            compiler);
}

// NOLINTNEXTLINE
TEST(Registry, ConfigFor) {
  Registry registry(language::BuiltinLanguages());
  proto::ResourceConfig base;
  base.set_memory_limit_mb(128);
  base.set_max_processes(64);
  base.set_timeout_millis(5000);

  proto::ResourceConfig cpp = registry.ConfigFor(registry.Resolve("cpp"), base);
  EXPECT_EQ(cpp.memory_limit_mb(), 128);
  EXPECT_EQ(cpp.max_processes(), 64);
  EXPECT_EQ(cpp.timeout_millis(), 5000);

  proto::ResourceConfig java =
      registry.ConfigFor(registry.Resolve("java"), base);
  EXPECT_EQ(java.memory_limit_mb(), 256);
  EXPECT_EQ(java.max_processes(), 96);
}

}  // namespace
