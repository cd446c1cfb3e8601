#include "statik/http-request.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "statik/cctype.hpp"
#include "statik/http-constants.hpp"
#include "statik/string-equal-ignore-case.hpp"
#include "statik/string-trim.hpp"

namespace statik {

namespace {

// tchar per RFC 9110 section 5.6.2
constexpr bool IsTokenChar(char ch) {
  if (isdigit(ch) || isalpha(ch)) {
    return true;
  }
  static constexpr std::string_view kSpecials = "!#$%&'*+-.^_`|~";
  return kSpecials.contains(ch);
}

constexpr bool IsToken(std::string_view sv) { return !sv.empty() && std::ranges::all_of(sv, IsTokenChar); }

// Visible ASCII, no whitespace, no controls.
constexpr bool IsTargetChar(char ch) { return ch > 0x20 && ch < 0x7F; }

}  // namespace

void HttpRequest::reset() noexcept {
  _head.clear();
  _method = {};
  _target = {};
  _path = {};
  _query = {};
  _headers.clear();
  _headLength = 0;
  _versionMajor = 0;
  _versionMinor = 0;
}

HttpRequest::ParseStatus HttpRequest::parse(std::string_view buffer, std::size_t maxHeaderBytes) {
  reset();

  std::size_t skipped = 0;
  while (buffer.substr(skipped).starts_with(http::CRLF)) {
    skipped += http::CRLF.size();
  }

  const std::string_view data = buffer.substr(skipped);
  const auto endPos = data.find(http::DoubleCRLF);
  if (endPos == std::string_view::npos) {
    // leading blank lines count towards the limit, so that a buffer over it always makes progress
    return buffer.size() > maxHeaderBytes ? ParseStatus::HeadersTooLarge : ParseStatus::NeedMore;
  }
  const std::size_t headSize = endPos + http::DoubleCRLF.size();
  if (headSize > maxHeaderBytes) {
    return ParseStatus::HeadersTooLarge;
  }

  // keep the CRLF ending the last line so that each line is CRLF terminated
  _head.assign(data.substr(0, endPos + http::CRLF.size()));
  const ParseStatus status = parseHead(_head);
  if (status == ParseStatus::Ok) {
    _headLength = skipped + headSize;
  }
  return status;
}

HttpRequest::ParseStatus HttpRequest::parseHead(std::string_view head) {
  // Request line: method SP request-target SP HTTP-version
  const auto lineEnd = head.find(http::CRLF);
  const std::string_view requestLine = head.substr(0, lineEnd);

  const auto firstSp = requestLine.find(' ');
  if (firstSp == std::string_view::npos) {
    return ParseStatus::BadRequest;
  }
  const auto secondSp = requestLine.find(' ', firstSp + 1);
  if (secondSp == std::string_view::npos) {
    return ParseStatus::BadRequest;
  }
  _method = requestLine.substr(0, firstSp);
  _target = requestLine.substr(firstSp + 1, secondSp - firstSp - 1);
  const std::string_view version = requestLine.substr(secondSp + 1);

  if (!IsToken(_method) || _target.empty() || !std::ranges::all_of(_target, IsTargetChar)) {
    return ParseStatus::BadRequest;
  }

  // HTTP-version = "HTTP/" DIGIT "." DIGIT
  if (version.size() != 8 || !version.starts_with("HTTP/") || !isdigit(version[5]) || version[6] != '.' ||
      !isdigit(version[7])) {
    return ParseStatus::BadRequest;
  }
  _versionMajor = static_cast<uint8_t>(version[5] - '0');
  _versionMinor = static_cast<uint8_t>(version[7] - '0');

  const auto queryPos = _target.find('?');
  _path = _target.substr(0, queryPos);
  if (queryPos != std::string_view::npos) {
    _query = _target.substr(queryPos + 1);
  }

  // Header fields: field-name ":" OWS field-value OWS CRLF
  for (std::size_t pos = lineEnd + http::CRLF.size(); pos < head.size();) {
    const auto fieldEnd = head.find(http::CRLF, pos);
    const std::string_view line = head.substr(pos, fieldEnd - pos);
    pos = fieldEnd + http::CRLF.size();

    const auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos) {
      return ParseStatus::BadRequest;
    }
    // no whitespace allowed between the field name and the colon, obsolete line folding rejected as well
    const std::string_view name = line.substr(0, colonPos);
    if (!IsToken(name)) {
      return ParseStatus::BadRequest;
    }
    const std::string_view value = TrimOws(line.substr(colonPos + 1));
    if (std::ranges::any_of(value, [](char ch) { return ch == '\r' || ch == '\n' || ch == '\0'; })) {
      return ParseStatus::BadRequest;
    }
    _headers.emplace_back(name, value);
  }

  return ParseStatus::Ok;
}

std::optional<std::string_view> HttpRequest::headerValue(std::string_view name) const noexcept {
  const auto it =
      std::ranges::find_if(_headers, [name](const auto& field) { return CaseInsensitiveEqual(field.first, name); });
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool HttpRequest::wantsClose() const noexcept {
  const auto connection = headerValue(http::Connection);
  if (!connection) {
    return false;
  }
  std::string_view remaining = *connection;
  while (!remaining.empty()) {
    const auto commaPos = remaining.find(',');
    if (CaseInsensitiveEqual(TrimOws(remaining.substr(0, commaPos)), http::close)) {
      return true;
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    remaining.remove_prefix(commaPos + 1);
  }
  return false;
}

bool HttpRequest::hasBody() const noexcept {
  if (headerValue(http::TransferEncoding)) {
    return true;
  }
  const auto contentLength = headerValue(http::ContentLength);
  return contentLength && std::ranges::any_of(*contentLength, [](char ch) { return ch != '0'; });
}

}  // namespace statik
