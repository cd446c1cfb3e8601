#include "statik/resource-resolver.hpp"

#include <gtest/gtest.h>
#include <sys/stat.h>
#include <unistd.h>

#include <filesystem>
#include <stdexcept>
#include <string>

#include "statik/temp-file.hpp"

namespace statik {

class ResourceResolverTest : public ::testing::Test {
 protected:
  test::ScopedTempDir tmpDir;
  test::ScopedTempFile index{tmpDir, "index.html", "<html>root</html>"};
  test::ScopedTempFile style{tmpDir, "css/site.css", "body{}"};
  test::ScopedTempFile nestedIndex{tmpDir, "docs/index.html", "<html>docs</html>"};
  ResourceResolver resolver{tmpDir.dirPath().string(), "index.html"};
};

TEST_F(ResourceResolverTest, ResolvesRegularFile) {
  const auto res = resolver.resolve("/css/site.css");
  ASSERT_EQ(res.status, ResourceResolver::Status::Ok);
  EXPECT_EQ(res.err, 0);
  EXPECT_EQ(res.resource.size, style.content().size());
  EXPECT_EQ(res.resource.contentType, "text/css; charset=utf-8");
  EXPECT_EQ(std::filesystem::path(res.resource.path), std::filesystem::canonical(style.filePath()));
}

TEST_F(ResourceResolverTest, RootResolvesToDefaultIndex) {
  const auto res = resolver.resolve("/");
  ASSERT_EQ(res.status, ResourceResolver::Status::Ok);
  EXPECT_EQ(res.resource.size, index.content().size());
  EXPECT_EQ(res.resource.contentType, "text/html; charset=utf-8");
}

TEST_F(ResourceResolverTest, DirectoryResolvesToItsIndex) {
  for (const char* path : {"/docs", "/docs/"}) {
    const auto res = resolver.resolve(path);
    ASSERT_EQ(res.status, ResourceResolver::Status::Ok) << path;
    EXPECT_EQ(res.resource.size, nestedIndex.content().size());
  }
}

TEST_F(ResourceResolverTest, DirectoryWithoutIndexIsNotFound) {
  EXPECT_EQ(resolver.resolve("/css").status, ResourceResolver::Status::NotFound);
}

TEST_F(ResourceResolverTest, MissingFileIsNotFound) {
  EXPECT_EQ(resolver.resolve("/missing.txt").status, ResourceResolver::Status::NotFound);
  EXPECT_EQ(resolver.resolve("/index.html/child").status, ResourceResolver::Status::NotFound);
}

TEST_F(ResourceResolverTest, NonRegularFileIsNotFound) {
  const auto fifoPath = tmpDir.dirPath() / "pipe";
  ASSERT_EQ(::mkfifo(fifoPath.c_str(), 0600), 0);
  EXPECT_EQ(resolver.resolve("/pipe").status, ResourceResolver::Status::NotFound);
}

TEST_F(ResourceResolverTest, SymlinkEscapingRootIsNotFound) {
  test::ScopedTempDir outside;
  test::ScopedTempFile secret(outside, "secret.txt", "top secret");
  std::filesystem::create_symlink(secret.filePath(), tmpDir.dirPath() / "link.txt");
  EXPECT_EQ(resolver.resolve("/link.txt").status, ResourceResolver::Status::NotFound);
}

TEST_F(ResourceResolverTest, SymlinkInsideRootIsFollowed) {
  std::filesystem::create_symlink(style.filePath(), tmpDir.dirPath() / "alias.txt");
  const auto res = resolver.resolve("/alias.txt");
  ASSERT_EQ(res.status, ResourceResolver::Status::Ok);
  EXPECT_EQ(res.resource.size, style.content().size());
  // MIME type of the requested name
  EXPECT_EQ(res.resource.contentType, "text/plain; charset=utf-8");
}

TEST_F(ResourceResolverTest, UnreadableFileIsPermissionDenied) {
  if (::geteuid() == 0) {
    GTEST_SKIP() << "permission checks are bypassed for root";
  }
  test::ScopedTempFile locked(tmpDir, "locked.txt", "no access");
  std::filesystem::permissions(locked.filePath(), std::filesystem::perms::none);
  const auto res = resolver.resolve("/locked.txt");
  EXPECT_EQ(res.status, ResourceResolver::Status::PermissionDenied);
  EXPECT_NE(res.err, 0);
  std::filesystem::permissions(locked.filePath(), std::filesystem::perms::owner_all);
}

TEST(ResourceResolverCtorTest, InvalidRootOrIndexThrows) {
  test::ScopedTempDir tmpDir;
  test::ScopedTempFile file(tmpDir, "file.txt", "x");
  EXPECT_THROW(ResourceResolver((tmpDir.dirPath() / "nope").string(), "index.html"), std::invalid_argument);
  EXPECT_THROW(ResourceResolver(file.filePath().string(), "index.html"), std::invalid_argument);
  EXPECT_THROW(ResourceResolver(tmpDir.dirPath().string(), "sub/index.html"), std::invalid_argument);
  EXPECT_THROW(ResourceResolver(tmpDir.dirPath().string(), ""), std::invalid_argument);
  EXPECT_NO_THROW(ResourceResolver(tmpDir.dirPath().string(), "default.htm"));
}

}  // namespace statik
