#include "sandbox/namespaced.hpp"

#include <signal.h>
#include <unistd.h>

#include <memory>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

#ifndef EVALBOX_SANDBOX_TEST_DIR
#define EVALBOX_SANDBOX_TEST_DIR "sandbox/test"
#endif

namespace {

using namespace sandbox;

const std::string test_tmpdir = "/tmp/evalbox_testdir/namespaced";

std::string Helper(const std::string& name) {
  return util::File::JoinPath(EVALBOX_SANDBOX_TEST_DIR, name);
}

class NamespacedTest : public ::testing::Test {
 protected:
  void SetUp() override {
    if (Namespaced::Score() < 0) {
      GTEST_SKIP() << "namespaced sandbox needs root and cgroup v2";
    }
    util::File::MakeDirs(test_tmpdir);
    sandbox_ = Sandbox::Create(Namespaced::kName);
    ASSERT_TRUE(sandbox_);
  }

  ExecutionOptions Options(const std::string& helper) {
    return ExecutionOptions(test_tmpdir, Helper(helper));
  }

  std::unique_ptr<Sandbox> sandbox_;
};

// NOLINTNEXTLINE
TEST_F(NamespacedTest, TestReturnArg1) {
  ExecutionOptions options = Options("return_arg1");
  options.args.push_back("15");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox_->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.status_code, 15);
  EXPECT_EQ(info.signal, 0);
  EXPECT_TRUE(sandbox_->IsIsolated());
}

// NOLINTNEXTLINE
TEST_F(NamespacedTest, TestSignalArg1) {
  ExecutionOptions options = Options("signal_arg1");
  options.args.push_back("6");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox_->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 6);
  EXPECT_EQ(info.status_code, 0);
}

// NOLINTNEXTLINE
TEST_F(NamespacedTest, TestNoFile) {
  ExecutionOptions options = Options("foo");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_FALSE(sandbox_->Execute(options, &info, &error_msg));
  EXPECT_THAT(error_msg, ::testing::StartsWith("exec:"));
}

// NOLINTNEXTLINE
TEST_F(NamespacedTest, TestWallLimitNotOk) {
  ExecutionOptions options = Options("wait_arg1");
  options.args.push_back("5");
  options.wall_limit_millis = 200;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox_->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_TRUE(info.time_limit_exceeded);
  EXPECT_EQ(info.signal, SIGKILL);
  EXPECT_LE(info.wall_time_millis, 1500);
}

// NOLINTNEXTLINE
TEST_F(NamespacedTest, TestMemoryLimitNotOk) {
  ExecutionOptions options = Options("malloc_arg1");
  options.args.push_back("100");
  options.memory_limit_kb = 20 * 1024;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox_->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_TRUE(info.memory_limit_exceeded);
  EXPECT_EQ(info.message, "Memory limit exceeded");
}

// NOLINTNEXTLINE
TEST_F(NamespacedTest, TestOnlyRootIsWritable) {
  ExecutionOptions inside = Options("write_file");
  inside.args = {util::File::JoinPath(test_tmpdir, "inside"), "ok"};
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox_->Execute(inside, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.status_code, 0);
  EXPECT_EQ(util::File::Read(util::File::JoinPath(test_tmpdir, "inside")),
            "ok");

  ExecutionOptions outside = Options("write_file");
  outside.args = {"/evalbox_namespaced_test", "nope"};
  ExecutionInfo outside_info;
  EXPECT_TRUE(sandbox_->Execute(outside, &outside_info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(outside_info.status_code, 1);
  EXPECT_FALSE(util::File::Exists("/evalbox_namespaced_test"));
}

// NOLINTNEXTLINE
TEST_F(NamespacedTest, TestIORedirect) {
  ExecutionOptions options = Options("copy_int");
  options.stdin_file = test_tmpdir + "/in";
  options.stdout_file = test_tmpdir + "/out";
  options.stderr_file = test_tmpdir + "/err";
  util::File::Write(options.stdin_file, "21", /*overwrite=*/true);
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox_->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.status_code, 0);
  EXPECT_EQ(util::File::Read(options.stdout_file), "21\n");
  EXPECT_EQ(util::File::Read(options.stderr_file), "42\n");
}

}  // namespace
