#include "util/which.hpp"

#include <sys/stat.h>
#include <cstdlib>
#include <fstream>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

const std::string test_tmpdir = "/tmp/claw_testdir";

void createExecutable(const std::string& path) {
  { std::ofstream os(path); }
  chmod(path.c_str(), S_IRWXU);
}

void createFile(const std::string& path) { std::ofstream os(path); }

class WhichTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const char* path = std::getenv("PATH");
    if (path != nullptr) old_path_ = path;
  }
  void TearDown() override { setenv("PATH", old_path_.c_str(), 1); }

 private:
  std::string old_path_;
};

// NOLINTNEXTLINE
TEST_F(WhichTest, Which) {
  util::TempDir tmpdir1(test_tmpdir + "/which");
  util::TempDir tmpdir2(test_tmpdir + "/which");
  createExecutable(tmpdir1.Path() + "/cmd");
  createExecutable(tmpdir2.Path() + "/cmd");
  createExecutable(tmpdir2.Path() + "/cmd2");
  std::string path = tmpdir1.Path() + ":" + tmpdir2.Path();
  setenv("PATH", path.c_str(), 1);

  EXPECT_EQ(util::which("cmd", false), tmpdir1.Path() + "/cmd");
  EXPECT_EQ(util::which("cmd2", false), tmpdir2.Path() + "/cmd2");
}

// NOLINTNEXTLINE
TEST_F(WhichTest, WhichSkipsNonExecutable) {
  util::TempDir tmpdir1(test_tmpdir + "/which");
  util::TempDir tmpdir2(test_tmpdir + "/which");
  createFile(tmpdir1.Path() + "/tool");
  createExecutable(tmpdir2.Path() + "/tool");
  std::string path = tmpdir1.Path() + "::" + tmpdir2.Path();
  setenv("PATH", path.c_str(), 1);

  EXPECT_EQ(util::which("tool", false), tmpdir2.Path() + "/tool");
}

// NOLINTNEXTLINE
TEST_F(WhichTest, WhichNotFound) {
  util::TempDir tmpdir(test_tmpdir + "/which");
  setenv("PATH", tmpdir.Path().c_str(), 1);
  EXPECT_EQ(util::which("surely_not_here", false), "");
}

// NOLINTNEXTLINE
TEST_F(WhichTest, WhichEmptyPath) {
  unsetenv("PATH");
  EXPECT_THROW(util::which("cmd"), std::exception);  // NOLINT
}

// NOLINTNEXTLINE
TEST_F(WhichTest, WhichExplicitPath) {
  util::TempDir tmpdir(test_tmpdir + "/which");
  createExecutable(tmpdir.Path() + "/runme");
  createFile(tmpdir.Path() + "/readme");
  unsetenv("PATH");

  EXPECT_EQ(util::which(tmpdir.Path() + "/runme"), tmpdir.Path() + "/runme");
  EXPECT_EQ(util::which(tmpdir.Path() + "/readme"), "");
  EXPECT_EQ(util::which(tmpdir.Path() + "/missing"), "");
}

// NOLINTNEXTLINE
TEST_F(WhichTest, WhichUsesCache) {
  std::string path;
  {
    util::TempDir tmpdir1(test_tmpdir + "/which");
    createExecutable(tmpdir1.Path() + "/cached_cmd");
    setenv("PATH", tmpdir1.Path().c_str(), 1);
    path = util::which("cached_cmd");
    EXPECT_EQ(path, tmpdir1.Path() + "/cached_cmd");
  }
  EXPECT_EQ(util::which("cached_cmd"), path);
}

// NOLINTNEXTLINE
TEST_F(WhichTest, WhichCacheDisabled) {
  std::string path;
  {
    util::TempDir tmpdir1(test_tmpdir + "/which");
    createExecutable(tmpdir1.Path() + "/uncached_cmd");
    setenv("PATH", tmpdir1.Path().c_str(), 1);
    path = util::which("uncached_cmd");
    EXPECT_EQ(path, tmpdir1.Path() + "/uncached_cmd");
  }
  EXPECT_EQ(util::which("uncached_cmd", false), "");
}

}  // namespace
