#include "util/file.hpp"

#include "gtest/gtest.h"

namespace {

const constexpr char* kTmpDir = "/tmp/judgebox_file_test";

// NOLINTNEXTLINE
TEST(FileTest, WriteAndRead) {
  util::TempDir tmp(kTmpDir);
  std::string path = util::File::JoinPath(tmp.Path(), "a/b/c.txt");
  util::File::Write(path, "hello world");
  EXPECT_TRUE(util::File::Exists(path));
  EXPECT_EQ(util::File::Size(path), 11);
  bool truncated = true;
  EXPECT_EQ(util::File::Read(path, 1024, &truncated), "hello world");
  EXPECT_FALSE(truncated);
  EXPECT_EQ(util::File::Read(path, 5, &truncated), "hello");
  EXPECT_TRUE(truncated);
}

// NOLINTNEXTLINE
TEST(FileTest, ReadMissingFile) {
  EXPECT_THROW(util::File::Read("/nonexistent/file", 10), util::file_not_found);
}

// NOLINTNEXTLINE
TEST(FileTest, Paths) {
  EXPECT_EQ(util::File::JoinPath("/a", "b"), "/a/b");
  EXPECT_EQ(util::File::JoinPath("/a", "/b"), "/b");
  EXPECT_EQ(util::File::BaseDir("/a/b/c"), "/a/b");
}

// NOLINTNEXTLINE
TEST(FileTest, TempDirIsRemoved) {
  std::string path;
  {
    util::TempDir tmp(kTmpDir);
    path = tmp.Path();
    util::File::Write(util::File::JoinPath(path, "x/y"), "data");
    util::TempDir moved = std::move(tmp);
    EXPECT_EQ(moved.Path(), path);
  }
  EXPECT_FALSE(util::File::Exists(util::File::JoinPath(path, "x/y")));
}

}  // namespace
