#include "statik/file.hpp"

#include <gtest/gtest.h>
#include <sys/stat.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

#include "statik/temp-file.hpp"
#include "statik/timedef.hpp"

using namespace statik;

using test::ScopedTempDir;
using test::ScopedTempFile;

TEST(FileTest, DefaultConstructedIsClosed) {
  File file;
  EXPECT_FALSE(file);
}

TEST(FileTest, OpenMissingPreservesErrno) {
  ScopedTempDir tmpDir;
  errno = 0;
  File file((tmpDir.dirPath() / "missing").string());
  EXPECT_FALSE(file);
  EXPECT_EQ(errno, ENOENT);
}

TEST(FileTest, SizeAndPositionalReads) {
  ScopedTempDir tmpDir;
  ScopedTempFile tmp(tmpDir, "data.txt", std::string_view("0123456789"));
  File file(tmp.filePath().string());
  ASSERT_TRUE(file);
  EXPECT_EQ(file.size(), 10U);

  std::array<char, 4> buf{};
  ASSERT_EQ(file.readAt(buf, 3), 4U);
  EXPECT_EQ(std::string_view(buf.data(), 4), "3456");

  // positional reads do not depend on each other
  ASSERT_EQ(file.readAt(buf, 0), 4U);
  EXPECT_EQ(std::string_view(buf.data(), 4), "0123");

  ASSERT_EQ(file.readAt(buf, 8), 2U);
  EXPECT_EQ(std::string_view(buf.data(), 2), "89");

  EXPECT_EQ(file.readAt(buf, 10), 0U);
  EXPECT_EQ(file.readAt(buf, 1000), 0U);
}

TEST(FileTest, ReadAfterCloseFails) {
  ScopedTempDir tmpDir;
  ScopedTempFile tmp(tmpDir, "data.txt", std::string_view("abc"));
  File file(tmp.filePath().string());
  ASSERT_TRUE(file);
  file.close();
  EXPECT_FALSE(file);
  std::array<char, 3> buf{};
  EXPECT_EQ(file.readAt(buf, 0), File::kError);
}

TEST(FileTest, FileStatKinds) {
  ScopedTempDir tmpDir;
  ScopedTempFile tmp(tmpDir, "data.txt", std::size_t{1234});
  const SysTimePoint mtime = SysTimePoint(std::chrono::seconds(1700000000)) + std::chrono::nanoseconds(123456789);
  tmp.setModificationTime(mtime);

  FileStatus status;
  ASSERT_EQ(FileStat(tmp.filePath().string(), status), 0);
  EXPECT_EQ(status.kind, FileStatus::Kind::Regular);
  EXPECT_EQ(status.size, 1234U);
  EXPECT_EQ(status.mtime, mtime);

  ASSERT_EQ(FileStat(tmpDir.dirPath().string(), status), 0);
  EXPECT_EQ(status.kind, FileStatus::Kind::Directory);

  const auto fifoPath = tmpDir.dirPath() / "fifo";
  ASSERT_EQ(::mkfifo(fifoPath.c_str(), 0600), 0);
  ASSERT_EQ(FileStat(fifoPath.string(), status), 0);
  EXPECT_EQ(status.kind, FileStatus::Kind::Other);

  EXPECT_EQ(FileStat((tmpDir.dirPath() / "missing").string(), status), ENOENT);
  EXPECT_EQ(FileStat((tmp.filePath() / "child").string(), status), ENOTDIR);
}

TEST(FileTest, CheckReadable) {
  ScopedTempDir tmpDir;
  ScopedTempFile tmp(tmpDir, "data.txt", std::string_view("abc"));
  EXPECT_EQ(CheckReadable(tmp.filePath().string()), 0);
  EXPECT_EQ(CheckReadable((tmpDir.dirPath() / "missing").string()), ENOENT);
}
