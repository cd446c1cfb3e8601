#include "statik/file-server.hpp"

#include <gtest/gtest.h>
#include <sys/socket.h>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "statik/http-constants.hpp"
#include "statik/http-status-code.hpp"
#include "statik/server-config.hpp"
#include "statik/static-file-config.hpp"
#include "statik/temp-file.hpp"
#include "statik/test-http-client.hpp"
#include "statik/test-server.hpp"

using namespace statik;

namespace {

std::vector<std::pair<std::string, std::string>> HeadersWithoutDate(const test::ParsedResponse& resp) {
  std::vector<std::pair<std::string, std::string>> headers;
  for (const auto& header : resp.headers) {
    if (header.first != "Date") {
      headers.push_back(header);
    }
  }
  return headers;
}

test::RequestOptions Get(std::string_view target) {
  test::RequestOptions opt;
  opt.target = target;
  return opt;
}

}  // namespace

class FileServerTest : public ::testing::Test {
 protected:
  ServerConfig makeConfig() const {
    return ServerConfig{}.withPort(0).withStaticFiles(
        StaticFileConfig{}.withRootDirectory(tmpDir.dirPath().string()).withFileChunkBytes(4096));
  }

  test::ScopedTempDir tmpDir;
  test::ScopedTempFile index{tmpDir, "index.html", "<html><body>statik</body></html>"};
  test::ScopedTempFile page{tmpDir, "docs/page.html", std::size_t{20000}};
  test::ScopedTempFile data{tmpDir, "data.bin", std::size_t{100}};
  test::ScopedTempFile image{tmpDir, "logo.png", std::size_t{5000}};
};

TEST_F(FileServerTest, EphemeralPortIsReported) {
  test::TestServer ts(makeConfig());
  EXPECT_NE(ts.port(), 0);
}

TEST_F(FileServerTest, InvalidConfigurationThrows) {
  EXPECT_THROW(FileServer(makeConfig().withReadChunkBytes(0)), std::invalid_argument);
  EXPECT_THROW(FileServer(makeConfig().withStaticFiles(StaticFileConfig{}.withRootDirectory(
                   (tmpDir.dirPath() / "missing").string()))),
               std::invalid_argument);
}

TEST_F(FileServerTest, GetServesFileContent) {
  test::TestServer ts(makeConfig());
  const auto resp = test::requestOrThrow(ts.port(), Get("/data.bin"));
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.reason, "OK");
  EXPECT_EQ(resp.body, data.content());
  EXPECT_EQ(resp.header("Content-Length"), "100");
  EXPECT_EQ(resp.header("Content-Type"), "application/octet-stream");
  EXPECT_EQ(resp.header("Accept-Ranges"), "bytes");
  EXPECT_EQ(resp.header("Connection"), "close");
  EXPECT_TRUE(resp.hasHeader("ETag"));
  EXPECT_TRUE(resp.hasHeader("Last-Modified"));
  EXPECT_TRUE(resp.hasHeader("Date"));
  EXPECT_EQ(resp.headerCount("Date"), 1U);
}

TEST_F(FileServerTest, HeadCarriesSameHeadersAsGet) {
  test::TestServer ts(makeConfig());
  const auto get = test::requestOrThrow(ts.port(), Get("/docs/page.html"));

  auto headOpt = Get("/docs/page.html");
  headOpt.method = "HEAD";
  const auto raw = test::request(ts.port(), headOpt);
  const auto head = test::parseResponse(raw, true);
  ASSERT_TRUE(head.has_value());
  EXPECT_EQ(head->statusCode, http::StatusCodeOK);
  EXPECT_TRUE(head->body.empty());
  EXPECT_EQ(head->consumed, raw.size());
  EXPECT_EQ(HeadersWithoutDate(*head), HeadersWithoutDate(get));
  EXPECT_EQ(get.body, page.content());
}

TEST_F(FileServerTest, RootServesDefaultIndex) {
  test::TestServer ts(makeConfig());
  const auto resp = test::requestOrThrow(ts.port(), Get("/"));
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.body, index.content());
  EXPECT_EQ(resp.header("Content-Type"), "text/html; charset=utf-8");
}

TEST_F(FileServerTest, SingleRange) {
  test::TestServer ts(makeConfig());
  auto opt = Get("/data.bin");
  opt.headers.emplace_back("Range", "bytes=10-19");
  const auto resp = test::requestOrThrow(ts.port(), opt);
  EXPECT_EQ(resp.statusCode, http::StatusCodePartialContent);
  EXPECT_EQ(resp.header("Content-Range"), "bytes 10-19/100");
  EXPECT_EQ(resp.header("Content-Length"), "10");
  EXPECT_EQ(resp.body, data.content().substr(10, 10));
}

TEST_F(FileServerTest, MultipartRanges) {
  test::TestServer ts(makeConfig());
  auto opt = Get("/data.bin");
  opt.headers.emplace_back("Range", "bytes=0-4, 90-");
  const auto resp = test::requestOrThrow(ts.port(), opt);
  EXPECT_EQ(resp.statusCode, http::StatusCodePartialContent);
  EXPECT_TRUE(resp.chunked);
  EXPECT_FALSE(resp.hasHeader("Content-Length"));

  const auto contentType = resp.header("Content-Type");
  ASSERT_TRUE(contentType.has_value());
  constexpr std::string_view kPrefix = "multipart/byteranges; boundary=";
  ASSERT_TRUE(contentType->starts_with(kPrefix));
  const std::string boundary(contentType->substr(kPrefix.size()));

  std::string expected;
  expected.append("--").append(boundary).append("\r\n");
  expected.append("Content-Type: application/octet-stream\r\nContent-Range: bytes 0-4/100\r\n\r\n");
  expected.append(data.content().substr(0, 5)).append("\r\n");
  expected.append("--").append(boundary).append("\r\n");
  expected.append("Content-Type: application/octet-stream\r\nContent-Range: bytes 90-99/100\r\n\r\n");
  expected.append(data.content().substr(90)).append("\r\n");
  expected.append("--").append(boundary).append("--");
  EXPECT_EQ(resp.body, expected);
  EXPECT_EQ(test::countOccurrences(resp.body, "--" + boundary), 3U);
}

TEST_F(FileServerTest, UnsatisfiableRange) {
  test::TestServer ts(makeConfig());
  auto opt = Get("/data.bin");
  opt.headers.emplace_back("Range", "bytes=999999-1000000");
  const auto resp = test::requestOrThrow(ts.port(), opt);
  EXPECT_EQ(resp.statusCode, http::StatusCodeRangeNotSatisfiable);
  EXPECT_EQ(resp.header("Content-Range"), "bytes */100");
  EXPECT_EQ(resp.header("Content-Type"), "application/json");
  EXPECT_TRUE(resp.body.starts_with(R"({"status":416,)"));
}

TEST_F(FileServerTest, IfNoneMatchGivesNotModified) {
  test::TestServer ts(makeConfig());
  const auto first = test::requestOrThrow(ts.port(), Get("/data.bin"));
  const auto etag = first.header("ETag");
  ASSERT_TRUE(etag.has_value());

  auto opt = Get("/data.bin");
  opt.headers.emplace_back("If-None-Match", std::string(*etag));
  const auto raw = test::request(ts.port(), opt);
  const auto resp = test::parseResponse(raw, true);
  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->statusCode, http::StatusCodeNotModified);
  EXPECT_EQ(resp->consumed, raw.size());
  EXPECT_EQ(resp->header("ETag"), etag);
  EXPECT_FALSE(resp->hasHeader("Content-Type"));
  EXPECT_FALSE(resp->hasHeader("Content-Length"));
  EXPECT_FALSE(resp->hasHeader("Content-Range"));
  EXPECT_FALSE(resp->hasHeader("Content-Encoding"));
}

TEST_F(FileServerTest, TraversalAttemptsAreRejected) {
  test::TestServer ts(makeConfig());
  for (std::string_view target : {"/../etc/passwd", "/docs/./page.html", "/docs//page.html", "/docs/../data.bin"}) {
    const auto resp = test::requestOrThrow(ts.port(), Get(target));
    EXPECT_EQ(resp.statusCode, http::StatusCodeBadRequest) << target;
    EXPECT_EQ(resp.header("Content-Type"), "application/json") << target;
  }
}

TEST_F(FileServerTest, MissingFile) {
  test::TestServer ts(makeConfig());
  const auto resp = test::requestOrThrow(ts.port(), Get("/nothing.txt"));
  EXPECT_EQ(resp.statusCode, http::StatusCodeNotFound);
  EXPECT_TRUE(resp.body.starts_with(R"({"status":404,"statusMessage":"Not Found",)"));
  EXPECT_EQ(resp.header("Content-Length"), std::to_string(resp.body.size()));
}

TEST_F(FileServerTest, GzipForTextButNotForImages) {
  test::TestServer ts(makeConfig());
  auto opt = Get("/docs/page.html");
  opt.headers.emplace_back("Accept-Encoding", "deflate, gzip");
  const auto html = test::requestOrThrow(ts.port(), opt);
  EXPECT_EQ(html.statusCode, http::StatusCodeOK);
  EXPECT_EQ(html.header("Content-Encoding"), "gzip");
  EXPECT_FALSE(html.hasHeader("Content-Length"));
  EXPECT_TRUE(html.chunked);
  EXPECT_EQ(test::gunzip(html.body), page.content());

  opt.target = "/logo.png";
  const auto png = test::requestOrThrow(ts.port(), opt);
  EXPECT_EQ(png.statusCode, http::StatusCodeOK);
  EXPECT_FALSE(png.hasHeader("Content-Encoding"));
  EXPECT_EQ(png.header("Content-Length"), "5000");
  EXPECT_EQ(png.body, image.content());
}

TEST_F(FileServerTest, KeepAliveServesSeveralRequests) {
  test::TestServer ts(makeConfig());
  test::ClientConnection cnx(ts.port());
  std::string buffer;
  for (int requestPos = 0; requestPos < 3; ++requestPos) {
    auto opt = Get("/data.bin");
    opt.connection.clear();
    test::sendAll(cnx.fd(), test::buildRequest(opt));
    const auto resp = test::recvResponse(cnx.fd(), buffer);
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->statusCode, http::StatusCodeOK);
    EXPECT_FALSE(resp->hasHeader("Connection"));
    EXPECT_EQ(resp->body, data.content());
  }
}

TEST_F(FileServerTest, PipelinedRequestsAreAnsweredInOrder) {
  test::TestServer ts(makeConfig());
  test::ClientConnection cnx(ts.port());

  auto first = Get("/data.bin");
  first.connection.clear();
  first.headers.emplace_back("Range", "bytes=0-9");
  auto second = Get("/docs/page.html");
  second.connection.clear();
  auto third = Get("/index.html");
  third.method = "HEAD";
  test::sendAll(cnx.fd(), test::buildRequest(first) + test::buildRequest(second) + test::buildRequest(third));

  std::string buffer;
  const auto resp1 = test::recvResponse(cnx.fd(), buffer);
  ASSERT_TRUE(resp1.has_value());
  EXPECT_EQ(resp1->statusCode, http::StatusCodePartialContent);
  EXPECT_EQ(resp1->body, data.content().substr(0, 10));

  const auto resp2 = test::recvResponse(cnx.fd(), buffer);
  ASSERT_TRUE(resp2.has_value());
  EXPECT_EQ(resp2->statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp2->body, page.content());

  const auto resp3 = test::recvResponse(cnx.fd(), buffer, true);
  ASSERT_TRUE(resp3.has_value());
  EXPECT_EQ(resp3->statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp3->header("Connection"), "close");
  EXPECT_TRUE(resp3->body.empty());

  // the server closes after the last response
  EXPECT_TRUE(test::recvUntilClosed(cnx.fd()).empty());
}

TEST_F(FileServerTest, PipelinedRequestsAfterHalfCloseAreAnswered) {
  test::ScopedTempFile big(tmpDir, "big.bin", std::size_t{4} << 20);
  test::TestServer ts(makeConfig().withOutboundHighWaterMark(64UL * 1024UL));
  test::ClientConnection cnx(ts.port());

  auto first = Get("/big.bin");
  first.connection.clear();
  auto second = Get("/data.bin");
  second.connection.clear();
  test::sendAll(cnx.fd(), test::buildRequest(first) + test::buildRequest(second));
  ASSERT_EQ(::shutdown(cnx.fd(), SHUT_WR), 0);

  const auto raw = test::recvUntilClosed(cnx.fd());
  const auto resp1 = test::parseResponse(raw);
  ASSERT_TRUE(resp1.has_value());
  EXPECT_EQ(resp1->statusCode, http::StatusCodeOK);
  EXPECT_TRUE(resp1->body == big.content());

  const auto resp2 = test::parseResponse(std::string_view(raw).substr(resp1->consumed));
  ASSERT_TRUE(resp2.has_value());
  EXPECT_EQ(resp2->statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp2->body, data.content());
  EXPECT_EQ(resp1->consumed + resp2->consumed, raw.size());
}

TEST_F(FileServerTest, InputIsHeldBackWhileResponseIsInFlight) {
  test::ScopedTempFile big(tmpDir, "big.bin", std::size_t{4} << 20);
  test::TestServer ts(makeConfig().withMaxHeaderBytes(1024).withOutboundHighWaterMark(64UL * 1024UL));
  test::ClientConnection cnx(ts.port());

  auto opt = Get("/big.bin");
  opt.connection.clear();
  test::sendAll(cnx.fd(), test::buildRequest(opt));

  // Keeps sending garbage while the response is read. It can only get through once the server reads again.
  std::jthread flooder([fd = cnx.fd()] {
    const std::string junk(64UL * 1024UL, 'x');
    for (int chunkPos = 0; chunkPos < 64; ++chunkPos) {
      std::string_view remaining(junk);
      while (!remaining.empty()) {
        const auto sent = ::send(fd, remaining.data(), remaining.size(), MSG_NOSIGNAL);
        if (sent == -1) {
          if (errno == EINTR) {
            continue;
          }
          return;
        }
        remaining.remove_prefix(static_cast<std::size_t>(sent));
      }
    }
  });

  std::string buffer;
  const auto resp = test::recvResponse(cnx.fd(), buffer);
  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->statusCode, http::StatusCodeOK);
  EXPECT_TRUE(resp->body == big.content());

  // reading resumes after the response, and the garbage is rejected as an oversized head
  const auto rejected = test::recvResponse(cnx.fd(), buffer);
  ASSERT_TRUE(rejected.has_value());
  EXPECT_EQ(rejected->statusCode, http::StatusCodeRequestHeaderFieldsTooLarge);
  EXPECT_EQ(rejected->header("Connection"), "close");

  ::shutdown(cnx.fd(), SHUT_RDWR);
}

TEST_F(FileServerTest, KeepAliveDisabledClosesAfterFirstResponse) {
  test::TestServer ts(makeConfig().withKeepAliveMode(false));
  test::ClientConnection cnx(ts.port());
  auto opt = Get("/data.bin");
  opt.connection.clear();
  test::sendAll(cnx.fd(), test::buildRequest(opt) + test::buildRequest(opt));
  const auto raw = test::recvUntilClosed(cnx.fd());
  const auto resp = test::parseResponse(raw);
  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->header("Connection"), "close");
  EXPECT_EQ(resp->consumed, raw.size());
}

TEST_F(FileServerTest, MethodNotAllowedClosesConnection) {
  test::TestServer ts(makeConfig());
  test::ClientConnection cnx(ts.port());
  auto opt = Get("/data.bin");
  opt.method = "DELETE";
  opt.connection.clear();
  test::sendAll(cnx.fd(), test::buildRequest(opt));
  const auto raw = test::recvUntilClosed(cnx.fd());
  const auto resp = test::parseResponse(raw);
  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->statusCode, http::StatusCodeMethodNotAllowed);
  EXPECT_EQ(resp->header("Connection"), "close");
  EXPECT_TRUE(resp->body.starts_with(R"({"status":405,)"));
}

TEST_F(FileServerTest, UnsupportedVersion) {
  test::TestServer ts(makeConfig());
  auto opt = Get("/data.bin");
  opt.version = "HTTP/1.0";
  const auto resp = test::requestOrThrow(ts.port(), opt);
  EXPECT_EQ(resp.statusCode, http::StatusCodeHTTPVersionNotSupported);
  EXPECT_EQ(resp.header("Connection"), "close");
}

TEST_F(FileServerTest, MalformedRequestHead) {
  test::TestServer ts(makeConfig());
  test::ClientConnection cnx(ts.port());
  test::sendAll(cnx.fd(), "NOT A VALID REQUEST LINE\r\n\r\n");
  const auto resp = test::parseResponse(test::recvUntilClosed(cnx.fd()));
  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->statusCode, http::StatusCodeBadRequest);
  EXPECT_EQ(resp->header("Connection"), "close");
}

TEST_F(FileServerTest, OversizedHeadGives431) {
  test::TestServer ts(makeConfig().withMaxHeaderBytes(1024));
  auto opt = Get("/data.bin");
  opt.headers.emplace_back("X-Padding", std::string(4096, 'a'));
  const auto resp = test::requestOrThrow(ts.port(), opt);
  EXPECT_EQ(resp.statusCode, http::StatusCodeRequestHeaderFieldsTooLarge);
  EXPECT_EQ(resp.header("Connection"), "close");
}

TEST_F(FileServerTest, RequestWithBodyClosesConnection) {
  test::TestServer ts(makeConfig());
  test::ClientConnection cnx(ts.port());
  auto opt = Get("/data.bin");
  opt.connection.clear();
  opt.headers.emplace_back("Content-Length", "5");
  test::sendAll(cnx.fd(), test::buildRequest(opt) + "hello");
  const auto raw = test::recvUntilClosed(cnx.fd());
  const auto resp = test::parseResponse(raw);
  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp->header("Connection"), "close");
  EXPECT_EQ(resp->consumed, raw.size());
}

TEST_F(FileServerTest, LargeFileIsStreamedUnderBackpressure) {
  test::ScopedTempFile big(tmpDir, "big.bin", std::size_t{8} << 20);
  test::TestServer ts(makeConfig().withOutboundHighWaterMark(64UL * 1024UL));

  const auto resp = test::requestOrThrow(ts.port(), Get("/big.bin"));
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.header("Content-Length"), std::to_string(big.content().size()));
  EXPECT_EQ(resp.body.size(), big.content().size());
  EXPECT_TRUE(resp.body == big.content());
}

TEST_F(FileServerTest, FileTruncatedWhileStreamingAbortsConnection) {
  test::ScopedTempFile big(tmpDir, "big.bin", std::size_t{16} << 20);
  test::TestServer ts(makeConfig().withOutboundHighWaterMark(64UL * 1024UL));
  test::ClientConnection cnx(ts.port());
  const int rcvBufBytes = 16 * 1024;
  ASSERT_EQ(::setsockopt(cnx.fd(), SOL_SOCKET, SO_RCVBUF, &rcvBufBytes, sizeof(rcvBufBytes)), 0);

  test::sendAll(cnx.fd(), test::buildRequest(Get("/big.bin")));
  // the server fills the socket buffers, then waits for the client to read
  std::this_thread::sleep_for(std::chrono::milliseconds{200});
  std::filesystem::resize_file(big.filePath(), std::size_t{1} << 20);

  const auto raw = test::recvUntilClosed(cnx.fd());
  const auto headEnd = raw.find(http::DoubleCRLF);
  ASSERT_NE(headEnd, std::string::npos);
  EXPECT_TRUE(raw.starts_with("HTTP/1.1 200 OK\r\n"));
  EXPECT_NE(raw.find("Content-Length: " + std::to_string(big.content().size()) + "\r\n"), std::string::npos);

  const std::string_view body = std::string_view(raw).substr(headEnd + http::DoubleCRLF.size());
  EXPECT_FALSE(body.empty());
  EXPECT_LT(body.size(), big.content().size());
  EXPECT_TRUE(body == std::string_view(big.content()).substr(0, body.size()));

  // closed by the server: end of stream right away instead of a receive timeout
  char byte{};
  EXPECT_EQ(::recv(cnx.fd(), &byte, 1, 0), 0);
}

// sysfs attributes are regular files announcing 4096 bytes while holding only a few.
TEST(FileServerReadFailureTest, FirstChunkFailureBecomesServerError) {
  const std::filesystem::path cpuDir("/sys/devices/system/cpu");
  if (!std::filesystem::is_regular_file(cpuDir / "online")) {
    GTEST_SKIP() << "sysfs not available";
  }
  test::TestServer ts(ServerConfig{}.withPort(0).withStaticFiles(
      StaticFileConfig{}.withRootDirectory(cpuDir.string()).withFileChunkBytes(8192)));

  const auto resp = test::requestOrThrow(ts.port(), Get("/online"));
  EXPECT_EQ(resp.statusCode, http::StatusCodeInternalServerError);
  EXPECT_EQ(resp.header("Content-Type"), http::ContentTypeApplicationJson);
  EXPECT_TRUE(resp.body.starts_with(R"({"status":500,)"));
  EXPECT_FALSE(resp.hasHeader("ETag"));
  EXPECT_FALSE(resp.hasHeader("Last-Modified"));
  EXPECT_EQ(resp.header("Content-Length"), std::to_string(resp.body.size()));
}

TEST_F(FileServerTest, ConcurrentClients) {
  test::TestServer ts(makeConfig());
  std::vector<std::jthread> clients;
  std::vector<std::string> bodies(8);
  for (std::size_t clientPos = 0; clientPos < bodies.size(); ++clientPos) {
    clients.emplace_back([&, clientPos] {
      const auto raw = test::request(ts.port(), Get("/docs/page.html"));
      const auto resp = test::parseResponse(raw);
      if (resp) {
        bodies[clientPos] = resp->body;
      }
    });
  }
  clients.clear();
  for (const auto& body : bodies) {
    EXPECT_EQ(body, page.content());
  }
}

TEST_F(FileServerTest, StopReturnsFromRun) {
  FileServer server(makeConfig().withPollInterval(std::chrono::milliseconds{5}));
  std::jthread loop([&server] { server.run(); });
  const auto resp = test::requestOrThrow(server.port(), Get("/data.bin"));
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  server.stop();
  loop.join();
}
