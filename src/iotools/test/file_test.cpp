#include "file.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

#include <filesystem>
#include <string>
#include <system_error>

#include "sysx_exception.hpp"
#include "sysx_invalid_argument_exception.hpp"
#include "sysx_string.hpp"

namespace sysx {

namespace fs = std::filesystem;

class FileTest : public ::testing::Test {
 protected:
  FileTest() : testDir(fs::temp_directory_path() / ("sysx_file_test_" + std::to_string(::getpid()))) {
    fs::create_directories(testDir);
  }

  ~FileTest() override {
    std::error_code ec;
    fs::remove_all(testDir, ec);
  }

  fs::path testDir;
};

TEST(NormalizePath, Components) {
  EXPECT_EQ(NormalizePath("/a/./b/../c"), fs::path("/a/c"));
  EXPECT_EQ(NormalizePath("/a/b/c/../../d"), fs::path("/a/d"));
  EXPECT_EQ(NormalizePath("/.."), fs::path("/"));
  EXPECT_EQ(NormalizePath("a/./b/"), fs::path("a/b"));
}

TEST_F(FileTest, RelativePathIsAbsolute) {
  File file("some/./relative/../file.txt");
  EXPECT_TRUE(file.path().is_absolute());
  EXPECT_EQ(file.path(), fs::current_path() / "some" / "file.txt");
}

TEST_F(FileTest, WriteCreatesParents) {
  File file(testDir / "nested" / "dir" / "file.txt");
  EXPECT_FALSE(file.exists());
  file.write("hello");
  EXPECT_TRUE(file.exists());
  EXPECT_EQ(file.readAll(), "hello");
  EXPECT_EQ(file.size(), 5U);

  file.write("bye");
  EXPECT_EQ(file.readAll(), "bye");
}

TEST_F(FileTest, Append) {
  File file(testDir / "append.txt");
  file.append("line1\n");
  file.append("line2\n");
  EXPECT_EQ(file.readAll(), "line1\nline2\n");
}

TEST_F(FileTest, ReadMissing) {
  EXPECT_THROW(File(testDir / "missing.txt").readAll(), exception);
  EXPECT_EQ(File(testDir / "missing.txt", File::IfError::kNoThrow).readAll(), "");
}

TEST_F(FileTest, Remove) {
  File file(testDir / "remove.txt");
  file.write("data");
  file.remove();
  EXPECT_FALSE(file.exists());
  EXPECT_NO_THROW(file.remove());
}

TEST_F(FileTest, RenameRelativeToParent) {
  File file(testDir / "original.txt");
  file.write("content");
  file.rename("sub/renamed.txt");
  EXPECT_EQ(file.path(), testDir / "sub" / "renamed.txt");
  EXPECT_TRUE(file.exists());
  EXPECT_FALSE(fs::exists(testDir / "original.txt"));
  EXPECT_EQ(file.readAll(), "content");
}

TEST_F(FileTest, Permissions) {
  File file(testDir / "perms.txt");
  file.write("x");
  file.setPermissions("640");
  EXPECT_EQ(file.permissions(), "640");
  file.setPermissions("755");
  EXPECT_EQ(file.permissions(), "755");

  EXPECT_THROW(file.setPermissions("999"), invalid_argument);
  EXPECT_THROW(file.setPermissions("rwx"), invalid_argument);
  EXPECT_THROW(file.setPermissions(""), invalid_argument);
}

TEST_F(FileTest, LastWriteTime) {
  File file(testDir / "time.txt");
  EXPECT_THROW(file.lastWriteTime(), exception);
  file.write("x");
  EXPECT_LE(file.lastWriteTime(), fs::file_time_type::clock::now());
}

TEST_F(FileTest, DirectorySize) {
  File(testDir / "a.txt").write("12345");
  File(testDir / "d1" / "b.txt").write("123");
  File(testDir / "d1" / "d2" / "c.txt").write("12");
  EXPECT_EQ(DirectorySize(testDir), 10U);
  EXPECT_THROW(DirectorySize(testDir / "missing"), exception);
}

}  // namespace sysx
