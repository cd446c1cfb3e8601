#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "statik/http-constants.hpp"
#include "statik/http-header-map.hpp"

namespace statik {

/// Configuration knobs for serving a filesystem tree.
struct StaticFileConfig {
  // Throws std::invalid_argument if the configuration is inconsistent.
  void validate() const;

  StaticFileConfig& withRootDirectory(std::string_view dir) {
    rootDirectory.assign(dir);
    return *this;
  }

  StaticFileConfig& withDefaultIndex(std::string_view indexFile) {
    defaultIndex.assign(indexFile);
    return *this;
  }

  StaticFileConfig& withCacheMaxAge(std::chrono::seconds maxAge) {
    cacheMaxAge = maxAge;
    return *this;
  }

  // Adds (or replaces) a header sent with every response.
  StaticFileConfig& withDefaultHeader(std::string_view name, std::string_view value) {
    defaultHeaders.set(name, value);
    return *this;
  }

  StaticFileConfig& withFileChunkBytes(std::size_t chunkBytes) {
    fileChunkBytes = chunkBytes;
    return *this;
  }

  StaticFileConfig& withGzipLevel(int8_t level) {
    gzipLevel = level;
    return *this;
  }

  // Directory served. Canonicalized once when the handler is constructed.
  std::string rootDirectory{"public"};

  // Name of the file served when the target path resolves to a directory.
  std::string defaultIndex{"index.html"};

  // Value of max-age in 'Cache-Control: public, max-age=<ttl>' for successful responses.
  std::chrono::seconds cacheMaxAge{600};

  // Base header set copied into every response, success and errors alike.
  HeaderMap defaultHeaders{{std::string(http::AcceptRanges), std::string(http::bytes)},
                           {std::string(http::AccessControlAllowOrigin), "*"},
                           {std::string(http::AccessControlAllowMethods), std::string(http::AllowedMethods)},
                           {std::string(http::XContentTypeOptions), "nosniff"},
                           {std::string(http::Vary), std::string(http::AcceptEncoding)}};

  // Maximum number of file bytes read (and compressed if needed) per production step.
  std::size_t fileChunkBytes{64UL * 1024UL};

  // zlib compression level for gzip bodies, -1 (zlib default) to 9.
  int8_t gzipLevel{-1};
};

}  // namespace statik
