#include "util/file.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cstdio>
#include <fstream>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::StartsWith;

const std::string test_tmpdir = "/tmp/evalbox_testdir";

int unlink_cb(const char* fpath, const struct stat* /*unused*/, int /*unused*/,
              struct FTW* /*unused*/) {
  int rv = remove(fpath);
  if (rv) perror(fpath);
  return rv;
}

int rmrf(const char* path) {
  return nftw(path, unlink_cb, 64, FTW_DEPTH | FTW_PHYS);
}

void writeFile(const std::string& path, const std::string& content) {
  std::ofstream of(path);
  of << content;
}

std::string readFile(const std::string& path) {
  std::ifstream t(path);
  std::string str((std::istreambuf_iterator<char>(t)),
                  std::istreambuf_iterator<char>());
  return str;
}

bool dirExists(const std::string& path) {
  auto dir = opendir(path.c_str());
  if (!dir) return false;
  closedir(dir);
  return true;
}

std::string makeTestDir(const std::string& name) {
  mkdir(test_tmpdir.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
  std::string testdir = test_tmpdir + "/" + name;
  rmrf(testdir.c_str());
  mkdir(testdir.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
  return testdir;
}

/*
 * Read
 */

// NOLINTNEXTLINE
TEST(File, Read) {
  std::string testdir = makeTestDir("read");
  std::string filepath = testdir + "/file";
  std::string content = "lallabalalla\n";
  writeFile(filepath, content);
  EXPECT_EQ(util::File::Read(filepath), content);
}

// NOLINTNEXTLINE
TEST(File, ReadBigFile) {
  std::string testdir = makeTestDir("read");
  std::string filepath = testdir + "/bigfile";
  std::string content(util::kChunkSize * 2 + 1, 'x');
  writeFile(filepath, content);
  EXPECT_EQ(util::File::Read(filepath), content);
}

// NOLINTNEXTLINE
TEST(File, ReadWithLimit) {
  std::string testdir = makeTestDir("read");
  std::string filepath = testdir + "/bigfile";
  std::string content(util::kChunkSize * 2 + 1, 'x');
  writeFile(filepath, content);
  EXPECT_EQ(util::File::Read(filepath, 10), std::string(10, 'x'));
  EXPECT_EQ(util::File::Read(filepath, util::kChunkSize + 3).size(),
            util::kChunkSize + 3);
}

// NOLINTNEXTLINE
TEST(File, ReadNoSuchFile) {
  std::string filepath = "/no/such/file";
  EXPECT_THROW(util::File::Read(filepath), util::file_not_found);  // NOLINT
}

/*
 * Write
 */

// NOLINTNEXTLINE
TEST(File, Write) {
  std::string testdir = makeTestDir("write");
  std::string filepath = testdir + "/file";
  std::string content = "wowowow\n";
  util::File::Write(filepath, content);
  ASSERT_EQ(content, readFile(filepath));
}

// NOLINTNEXTLINE
TEST(File, WriteCreatesDirs) {
  std::string testdir = makeTestDir("write");
  std::string filepath = testdir + "/a/b/file";
  util::File::Write(filepath, "x");
  ASSERT_EQ("x", readFile(filepath));
}

// NOLINTNEXTLINE
TEST(File, WriteNotOverwrite) {
  std::string testdir = makeTestDir("write");
  std::string filepath = testdir + "/file";
  std::string content{"alsdasdl"};
  writeFile(filepath, content);
  EXPECT_THROW(util::File::Write(filepath, "nope"),  // NOLINT
               util::file_exists);
  ASSERT_EQ(content, readFile(filepath));
}

// NOLINTNEXTLINE
TEST(File, WriteOverwrite) {
  std::string testdir = makeTestDir("write");
  std::string filepath = testdir + "/file";
  writeFile(filepath, "old");
  util::File::Write(filepath, "new", true);
  ASSERT_EQ("new", readFile(filepath));
}

/*
 * MakeDirs / RemoveTree
 */

// NOLINTNEXTLINE
TEST(File, MakeDirs) {
  std::string testdir = makeTestDir("makedirs");
  util::File::MakeDirs(testdir + "/a/b/c");
  EXPECT_TRUE(dirExists(testdir + "/a/b/c"));
  util::File::MakeDirs(testdir + "/a/b/c");
  EXPECT_TRUE(dirExists(testdir + "/a/b/c"));
}

// NOLINTNEXTLINE
TEST(File, RemoveTree) {
  std::string testdir = makeTestDir("removetree");
  util::File::MakeDirs(testdir + "/a/b");
  writeFile(testdir + "/a/b/file", "x");
  writeFile(testdir + "/a/file", "x");
  util::File::RemoveTree(testdir + "/a");
  EXPECT_FALSE(dirExists(testdir + "/a"));
}

// NOLINTNEXTLINE
TEST(File, RemoveNoSuchFile) {
  EXPECT_THROW(util::File::Remove(test_tmpdir + "/lolnope"),  // NOLINT
               std::system_error);
}

/*
 * Paths
 */

// NOLINTNEXTLINE
TEST(File, JoinPath) {
  EXPECT_EQ(util::File::JoinPath("/tmp", "file"), "/tmp/file");
  EXPECT_EQ(util::File::JoinPath("/tmp/", "file"), "/tmp/file");
  EXPECT_EQ(util::File::JoinPath("/tmp", "/file"), "/file");
}

// NOLINTNEXTLINE
TEST(File, BaseDirAndName) {
  EXPECT_EQ(util::File::BaseDir("/tmp/dir/file"), "/tmp/dir");
  EXPECT_EQ(util::File::BaseDir("/file"), "/");
  EXPECT_EQ(util::File::BaseDir("file"), ".");
  EXPECT_EQ(util::File::BaseName("/tmp/dir/file"), "file");
  EXPECT_EQ(util::File::BaseName("file"), "file");
}

// NOLINTNEXTLINE
TEST(File, IsPlainName) {
  EXPECT_TRUE(util::File::IsPlainName("program.cpp"));
  EXPECT_TRUE(util::File::IsPlainName("Main.java"));
  EXPECT_FALSE(util::File::IsPlainName(""));
  EXPECT_FALSE(util::File::IsPlainName("."));
  EXPECT_FALSE(util::File::IsPlainName(".."));
  EXPECT_FALSE(util::File::IsPlainName("../etc/passwd"));
  EXPECT_FALSE(util::File::IsPlainName("dir/file"));
  EXPECT_FALSE(util::File::IsPlainName(std::string("a\0b", 3)));
}

/*
 * ListDir
 */

// NOLINTNEXTLINE
TEST(File, ListDir) {
  std::string testdir = makeTestDir("list_dir");
  writeFile(testdir + "/file42", "fooo");
  writeFile(testdir + "/file12", "fooo");
  mkdir((testdir + "/sub").c_str(), S_IRWXU);
  writeFile(testdir + "/sub/nested", "fooo");
  EXPECT_THAT(util::File::ListDir(testdir),
              ElementsAre("file12", "file42", "sub"));
}

// NOLINTNEXTLINE
TEST(File, ListDirEmpty) {
  std::string testdir = makeTestDir("list_dir");
  EXPECT_THAT(util::File::ListDir(testdir), IsEmpty());
}

// NOLINTNEXTLINE
TEST(File, ListDirMissing) {
  std::string testdir = makeTestDir("list_dir");
  EXPECT_THROW(util::File::ListDir(testdir + "/nope"), std::system_error);
}

/*
 * IsExecutableBy
 */

// NOLINTNEXTLINE
TEST(File, IsExecutableBy) {
  std::string testdir = makeTestDir("executable_by");
  chmod(testdir.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
  const int32_t other = getuid() + 1000;
  const int32_t other_group = getgid() + 1000;

  std::string world = testdir + "/world";
  writeFile(world, "");
  chmod(world.c_str(), S_IRWXU | S_IXGRP | S_IXOTH);
  EXPECT_TRUE(util::File::IsExecutableBy(world, getuid(), getgid()));
  EXPECT_TRUE(util::File::IsExecutableBy(world, other, other_group));

  std::string owner_only = testdir + "/owner_only";
  writeFile(owner_only, "");
  chmod(owner_only.c_str(), S_IRWXU);
  EXPECT_TRUE(util::File::IsExecutableBy(owner_only, getuid(), getgid()));
  EXPECT_FALSE(util::File::IsExecutableBy(owner_only, other, other_group));

  std::string group_only = testdir + "/group_only";
  writeFile(group_only, "");
  chmod(group_only.c_str(), S_IRUSR | S_IXGRP);
  EXPECT_TRUE(util::File::IsExecutableBy(group_only, other, getgid()));
  EXPECT_FALSE(util::File::IsExecutableBy(group_only, other, other_group));

  EXPECT_FALSE(util::File::IsExecutableBy(testdir, getuid(), getgid()));
  EXPECT_FALSE(util::File::IsExecutableBy(testdir + "/nope", getuid(),
                                          getgid()));
}

// NOLINTNEXTLINE
TEST(File, IsExecutableByNeedsSearchableDirectories) {
  std::string testdir = makeTestDir("executable_by_dir");
  std::string hidden = testdir + "/hidden";
  mkdir(hidden.c_str(), S_IRWXU);
  std::string program = hidden + "/program";
  writeFile(program, "");
  chmod(program.c_str(), S_IRWXU | S_IXGRP | S_IXOTH);
  const int32_t other = getuid() + 1000;
  const int32_t other_group = getgid() + 1000;
  EXPECT_TRUE(util::File::IsExecutableBy(program, getuid(), getgid()));
  EXPECT_FALSE(util::File::IsExecutableBy(program, other, other_group));

  // Symbolic links are followed to the real program.
  std::string link = testdir + "/link";
  ASSERT_EQ(symlink(program.c_str(), link.c_str()), 0);
  EXPECT_FALSE(util::File::IsExecutableBy(link, other, other_group));
}

/*
 * TempDir
 */

// NOLINTNEXTLINE
TEST(TempDir, RemovedOnDestruction) {
  std::string testdir = makeTestDir("tempdir");
  std::string path;
  {
    util::TempDir tmp(testdir);
    path = tmp.Path();
    EXPECT_THAT(path, StartsWith(testdir + "/"));
    EXPECT_TRUE(dirExists(path));
    writeFile(path + "/file", "x");
  }
  EXPECT_FALSE(dirExists(path));
}

// NOLINTNEXTLINE
TEST(TempDir, Keep) {
  std::string testdir = makeTestDir("tempdir");
  std::string path;
  {
    util::TempDir tmp(testdir);
    path = tmp.Path();
    tmp.Keep();
  }
  EXPECT_TRUE(dirExists(path));
}

}  // namespace
