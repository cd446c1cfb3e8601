#pragma once

#include <string_view>

#include "statik/cache-negotiator.hpp"
#include "statik/http-request.hpp"
#include "statik/http-status-code.hpp"
#include "statik/resource-resolver.hpp"
#include "statik/response-intent.hpp"
#include "statik/static-file-config.hpp"

namespace statik {

// Serves files from a fixed root directory with RFC 7232 (conditional) and RFC 7233 (range) semantics.
// Runs the response decision pipeline:
//   validation -> resolution -> cache validation -> range selection or content coding selection
// Any stage may short-circuit to a JSON error or to a 304. The returned intent is not committed yet.
class StaticFileHandler {
 public:
  // Throws std::invalid_argument if config is invalid or if its root directory does not exist.
  explicit StaticFileHandler(StaticFileConfig config);

  /// Build the response decision for the given request.
  [[nodiscard]] ResponseIntent operator()(const HttpRequest& request) const;

  // JSON error response carrying the default headers, for failures detected before the pipeline runs
  // (malformed or too large request heads).
  [[nodiscard]] ResponseIntent makeError(http::StatusCode status, std::string_view message) const;

  [[nodiscard]] const StaticFileConfig& config() const noexcept { return _config; }

 private:
  StaticFileConfig _config;
  ResourceResolver _resolver;
  CacheNegotiator _cacheNegotiator;
};

}  // namespace statik
