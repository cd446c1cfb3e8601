#include "statik/test-http-client.hpp"

#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <zlib.h>

#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>

#include "statik/errno-throw.hpp"
#include "statik/http-constants.hpp"
#include "statik/http-status-code.hpp"
#include "statik/log.hpp"
#include "statik/simple-charconv.hpp"
#include "statik/socket.hpp"
#include "statik/string-equal-ignore-case.hpp"

namespace statik::test {

namespace {

constexpr std::size_t kChunkSize = 4096;

Socket connectLoop(uint16_t port, std::chrono::milliseconds timeout) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

  for (const auto deadline = std::chrono::steady_clock::now() + timeout; std::chrono::steady_clock::now() < deadline;
       std::this_thread::sleep_for(1ms)) {
    Socket sock(Socket::Type::Stream);
    if (::connect(sock.fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0) {
      return sock;
    }
    log::debug("connect failed for fd # {}: {}", sock.fd(), std::strerror(errno));
  }
  throw std::runtime_error("Unable to connect to loopback port " + std::to_string(port));
}

// Parses a chunked body starting at raw[pos]. Returns the position past the last chunk (and trailers),
// or std::string_view::npos if incomplete.
std::size_t dechunk(std::string_view raw, std::size_t pos, std::string& out) {
  while (true) {
    const auto lineEnd = raw.find(http::CRLF, pos);
    if (lineEnd == std::string_view::npos) {
      return std::string_view::npos;
    }
    std::string_view sizeLine = raw.substr(pos, lineEnd - pos);
    sizeLine = sizeLine.substr(0, sizeLine.find(';'));
    std::size_t chunkLen = 0;
    const auto [ptr, ec] = std::from_chars(sizeLine.data(), sizeLine.data() + sizeLine.size(), chunkLen, 16);
    if (ec != std::errc{} || ptr != sizeLine.data() + sizeLine.size()) {
      throw std::runtime_error("Invalid chunk size line");
    }
    pos = lineEnd + http::CRLF.size();
    if (chunkLen == 0) {
      // optional trailers, ended by an empty line
      while (true) {
        const auto trailerEnd = raw.find(http::CRLF, pos);
        if (trailerEnd == std::string_view::npos) {
          return std::string_view::npos;
        }
        const bool emptyLine = trailerEnd == pos;
        pos = trailerEnd + http::CRLF.size();
        if (emptyLine) {
          return pos;
        }
      }
    }
    if (raw.size() < pos + chunkLen + http::CRLF.size()) {
      return std::string_view::npos;
    }
    out.append(raw.substr(pos, chunkLen));
    pos += chunkLen + http::CRLF.size();
  }
}

}  // namespace

ClientConnection::ClientConnection(uint16_t port, std::chrono::milliseconds timeout)
    : _socket(connectLoop(port, timeout)) {
  setRecvTimeout(_socket.fd(), 2000ms);
}

std::optional<std::string_view> ParsedResponse::header(std::string_view name) const {
  for (const auto& [key, value] : headers) {
    if (CaseInsensitiveEqual(key, name)) {
      return std::string_view(value);
    }
  }
  return std::nullopt;
}

std::size_t ParsedResponse::headerCount(std::string_view name) const {
  std::size_t count = 0;
  for (const auto& [key, value] : headers) {
    count += static_cast<std::size_t>(CaseInsensitiveEqual(key, name));
  }
  return count;
}

std::string buildRequest(const RequestOptions& opt) {
  std::string req;
  req.append(opt.method).append(" ").append(opt.target).append(" ").append(opt.version).append(http::CRLF);
  req.append("Host: localhost").append(http::CRLF);
  if (!opt.connection.empty()) {
    req.append(http::Connection).append(http::HeaderSep).append(opt.connection).append(http::CRLF);
  }
  for (const auto& [name, value] : opt.headers) {
    req.append(name).append(http::HeaderSep).append(value).append(http::CRLF);
  }
  req.append(http::CRLF);
  return req;
}

void sendAll(int fd, std::string_view data) {
  while (!data.empty()) {
    const auto sent = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
    if (sent == -1) {
      if (errno == EINTR) {
        continue;
      }
      throw_errno("send failed on fd # {}", fd);
    }
    data.remove_prefix(static_cast<std::size_t>(sent));
  }
}

void setRecvTimeout(int fd, std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == -1) {
    throw_errno("setsockopt(SO_RCVTIMEO) failed on fd # {}", fd);
  }
}

std::string recvUntilClosed(int fd) {
  std::string out;
  char buf[kChunkSize];
  while (true) {
    const auto nbRecv = ::recv(fd, buf, sizeof(buf), 0);
    if (nbRecv == -1) {
      if (errno == EINTR) {
        continue;
      }
      // EAGAIN: receive timeout expired. ECONNRESET: peer aborted. Return what we have in both cases.
      break;
    }
    if (nbRecv == 0) {
      break;
    }
    out.append(buf, static_cast<std::size_t>(nbRecv));
  }
  return out;
}

std::optional<ParsedResponse> parseResponse(std::string_view raw, bool noBody) {
  const auto headEnd = raw.find(http::DoubleCRLF);
  if (headEnd == std::string_view::npos) {
    return std::nullopt;
  }
  ParsedResponse pr;

  const auto statusLineEnd = raw.find(http::CRLF);
  const std::string_view statusLine = raw.substr(0, statusLineEnd);
  // HTTP/1.1 <3 digits code> <reason>
  if (statusLine.size() < 12 || !statusLine.starts_with("HTTP/1.1 ")) {
    throw std::runtime_error("Invalid status line: " + std::string(statusLine));
  }
  pr.statusCode = static_cast<http::StatusCode>(read3(statusLine.data() + 9));
  if (statusLine.size() > 13) {
    pr.reason = statusLine.substr(13);
  }

  std::size_t cursor = statusLineEnd + http::CRLF.size();
  while (cursor < headEnd + http::CRLF.size()) {
    const auto lineEnd = raw.find(http::CRLF, cursor);
    const std::string_view line = raw.substr(cursor, lineEnd - cursor);
    cursor = lineEnd + http::CRLF.size();
    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
      throw std::runtime_error("Invalid header line: " + std::string(line));
    }
    std::string_view value = line.substr(colon + 1);
    while (!value.empty() && value.front() == ' ') {
      value.remove_prefix(1);
    }
    pr.headers.emplace_back(line.substr(0, colon), value);
  }

  const std::size_t bodyStart = headEnd + http::DoubleCRLF.size();
  pr.consumed = bodyStart;
  if (noBody || pr.statusCode == http::StatusCodeNotModified) {
    return pr;
  }

  const auto transferEncoding = pr.header(http::TransferEncoding);
  if (transferEncoding && CaseInsensitiveEqual(*transferEncoding, http::chunked)) {
    pr.chunked = true;
    const std::size_t endPos = dechunk(raw, bodyStart, pr.body);
    if (endPos == std::string_view::npos) {
      return std::nullopt;
    }
    pr.consumed = endPos;
    return pr;
  }

  std::size_t contentLength = 0;
  if (const auto contentLengthStr = pr.header(http::ContentLength)) {
    const auto [ptr, ec] =
        std::from_chars(contentLengthStr->data(), contentLengthStr->data() + contentLengthStr->size(), contentLength);
    if (ec != std::errc{}) {
      throw std::runtime_error("Invalid Content-Length");
    }
  }
  if (raw.size() < bodyStart + contentLength) {
    return std::nullopt;
  }
  pr.body = raw.substr(bodyStart, contentLength);
  pr.consumed = bodyStart + contentLength;
  return pr;
}

std::optional<ParsedResponse> recvResponse(int fd, std::string& buffer, bool noBody) {
  char buf[kChunkSize];
  while (true) {
    auto parsed = parseResponse(buffer, noBody);
    if (parsed) {
      buffer.erase(0, parsed->consumed);
      return parsed;
    }
    const auto nbRecv = ::recv(fd, buf, sizeof(buf), 0);
    if (nbRecv == -1 && errno == EINTR) {
      continue;
    }
    if (nbRecv <= 0) {
      return std::nullopt;
    }
    buffer.append(buf, static_cast<std::size_t>(nbRecv));
  }
}

std::string request(uint16_t port, const RequestOptions& opt) {
  ClientConnection cnx(port);
  sendAll(cnx.fd(), buildRequest(opt));
  return recvUntilClosed(cnx.fd());
}

ParsedResponse requestOrThrow(uint16_t port, const RequestOptions& opt) {
  const std::string raw = request(port, opt);
  auto parsed = parseResponse(raw, opt.method == http::HEAD);
  if (!parsed) {
    throw std::runtime_error("Incomplete response: " + raw);
  }
  return std::move(*parsed);
}

std::size_t countOccurrences(std::string_view haystack, std::string_view needle) {
  if (needle.empty()) {
    return 0;
  }
  std::size_t count = 0;
  for (auto pos = haystack.find(needle); pos != std::string_view::npos; pos = haystack.find(needle, pos)) {
    ++count;
    pos += needle.size();
  }
  return count;
}

std::string gunzip(std::string_view compressed) {
  z_stream stream{};
  // 32 + MAX_WBITS: automatic zlib / gzip header detection
  if (::inflateInit2(&stream, 32 + MAX_WBITS) != Z_OK) {
    throw std::runtime_error("inflateInit2 failed");
  }
  std::string out;
  stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));
  stream.avail_in = static_cast<uInt>(compressed.size());
  int ret = Z_OK;
  char buf[kChunkSize];
  while (ret != Z_STREAM_END) {
    stream.next_out = reinterpret_cast<Bytef*>(buf);
    stream.avail_out = sizeof(buf);
    ret = ::inflate(&stream, Z_NO_FLUSH);
    if (ret != Z_OK && ret != Z_STREAM_END) {
      ::inflateEnd(&stream);
      throw std::runtime_error("inflate failed");
    }
    out.append(buf, sizeof(buf) - stream.avail_out);
    if (ret == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
      ::inflateEnd(&stream);
      throw std::runtime_error("truncated gzip stream");
    }
  }
  ::inflateEnd(&stream);
  return out;
}

}  // namespace statik::test
