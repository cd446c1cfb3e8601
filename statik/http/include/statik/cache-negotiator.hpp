#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "statik/http-header-map.hpp"
#include "statik/http-request.hpp"
#include "statik/resource.hpp"
#include "statik/timedef.hpp"

namespace statik {

// Strong entity tag derived from file size and modification time (millisecond precision):
// "\"<hex size>-<hex mtime ms>\"".
[[nodiscard]] std::string MakeStrongEtag(std::size_t fileSize, SysTimePoint mtime);

// RFC 7231 IMF-fixdate of given time point, truncated to seconds.
[[nodiscard]] std::string MakeHttpDate(SysTimePoint tp);

class CacheNegotiator {
 public:
  enum class Outcome : uint8_t { Full, NotModified };

  explicit CacheNegotiator(std::chrono::seconds maxAge);

  // Sets ETag, Last-Modified and Cache-Control in headers, then evaluates If-None-Match and If-Modified-Since.
  // On NotModified, header fields describing a body are removed from headers.
  [[nodiscard]] Outcome negotiate(const Resource& resource, const HttpRequest& request, HeaderMap& headers) const;

 private:
  std::string _cacheControl;
};

}  // namespace statik
