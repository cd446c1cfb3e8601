#include "statik/static-file-handler.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <cstring>
#include <string>
#include <string_view>
#include <utility>

#include "statik/cache-negotiator.hpp"
#include "statik/content-encoder.hpp"
#include "statik/error-reporter.hpp"
#include "statik/http-constants.hpp"
#include "statik/http-request.hpp"
#include "statik/http-status-code.hpp"
#include "statik/log.hpp"
#include "statik/range-negotiator.hpp"
#include "statik/request-validator.hpp"
#include "statik/resource-resolver.hpp"
#include "statik/response-intent.hpp"
#include "statik/static-file-config.hpp"
#include "statik/stringconv.hpp"

namespace statik {

namespace {

StaticFileConfig Validated(StaticFileConfig config) {
  config.validate();
  return config;
}

std::string BuildContentRange(std::size_t start, std::size_t end, std::size_t total) {
  std::string ret(http::bytes);
  ret.push_back(' ');
  ret.append(std::string_view(IntegralToCharVector(start)));
  ret.push_back('-');
  ret.append(std::string_view(IntegralToCharVector(end)));
  ret.push_back('/');
  ret.append(std::string_view(IntegralToCharVector(total)));
  return ret;
}

std::string BuildUnsatisfiedContentRange(std::size_t total) {
  std::string ret(http::bytes);
  ret.append(" */");
  ret.append(std::string_view(IntegralToCharVector(total)));
  return ret;
}

}  // namespace

StaticFileHandler::StaticFileHandler(StaticFileConfig config)
    : _config(Validated(std::move(config))),
      _resolver(_config.rootDirectory, _config.defaultIndex),
      _cacheNegotiator(_config.cacheMaxAge) {}

ResponseIntent StaticFileHandler::makeError(http::StatusCode status, std::string_view message) const {
  ResponseIntent intent;
  intent.headers = _config.defaultHeaders;
  ReportError(intent, status, message);
  return intent;
}

ResponseIntent StaticFileHandler::operator()(const HttpRequest& request) const {
  ResponseIntent intent;
  intent.headers = _config.defaultHeaders;
  intent.headRequest = request.method() == http::HEAD;

  const std::string_view path = request.path();

  switch (ValidateRequest(request.versionMajor(), request.versionMinor(), request.method(), path)) {
    case ValidationFailure::VersionUnsupported:
      ReportError(intent, http::StatusCodeHTTPVersionNotSupported, "Only HTTP/1.1 is supported");
      return intent;
    case ValidationFailure::MethodNotAllowed:
      ReportError(intent, http::StatusCodeMethodNotAllowed, "Only GET and HEAD methods are allowed",
                  {{std::string(http::Allow), std::string(http::AllowedMethods)}});
      return intent;
    case ValidationFailure::InvalidPath:
      ReportError(intent, http::StatusCodeBadRequest, fmt::format("Invalid pathname: {}", path));
      return intent;
    default:
      break;
  }

  auto resolved = _resolver.resolve(path);
  switch (resolved.status) {
    case ResourceResolver::Status::Ok:
      break;
    case ResourceResolver::Status::NotFound:
      ReportError(intent, http::StatusCodeNotFound, fmt::format("Not found: {}", path));
      return intent;
    case ResourceResolver::Status::PermissionDenied:
      ReportError(intent, http::StatusCodeForbidden, fmt::format("Permission denied: {}", path));
      return intent;
    default:
      log::error("Unexpected error while resolving '{}': {}", path, std::strerror(resolved.err));
      ReportError(intent, http::StatusCodeInternalServerError, fmt::format("Unable to access: {}", path));
      return intent;
  }

  const Resource& resource = intent.resource.emplace(std::move(resolved.resource));

  intent.headers.set(http::ContentType, resource.contentType);
  intent.headers.set(http::ContentLength, std::string_view(IntegralToCharVector(resource.size)));

  if (_cacheNegotiator.negotiate(resource, request, intent.headers) == CacheNegotiator::Outcome::NotModified) {
    intent.status = http::StatusCodeNotModified;
    intent.body = BodyStrategy::None;
    return intent;
  }

  const std::string etag(*intent.headers.get(http::ETag));
  RangeSelection selection = NegotiateRange(resource, etag, request);
  switch (selection.kind) {
    case RangeSelection::Kind::NotSatisfiable:
      ReportError(intent, http::StatusCodeRangeNotSatisfiable,
                  fmt::format("Invalid range {}", request.headerValue(http::Range).value_or("")),
                  {{std::string(http::ContentRange), BuildUnsatisfiedContentRange(resource.size)}});
      return intent;
    case RangeSelection::Kind::Single: {
      const ByteRange range = selection.ranges.front();
      intent.status = http::StatusCodePartialContent;
      intent.body = BodyStrategy::SingleRange;
      intent.headers.set(http::ContentRange, BuildContentRange(range.start, range.end, resource.size));
      intent.headers.set(http::ContentLength, std::string_view(IntegralToCharVector(range.length())));
      intent.ranges = std::move(selection.ranges);
      return intent;
    }
    case RangeSelection::Kind::Multipart:
      intent.status = http::StatusCodePartialContent;
      intent.body = BodyStrategy::Multipart;
      intent.boundary = MakeMultipartBoundary();
      intent.headers.set(http::ContentType, std::string(http::MultipartByteRangesPrefix) + intent.boundary);
      intent.headers.erase(http::ContentLength);
      intent.headers.set(http::TransferEncoding, http::chunked);
      intent.ranges = std::move(selection.ranges);
      return intent;
    default:
      break;
  }

  intent.status = http::StatusCodeOK;
  if (SelectContentCoding(request.headerValue(http::AcceptEncoding), resource.contentType) == ContentCoding::Gzip) {
    intent.body = BodyStrategy::FullGzip;
    intent.headers.set(http::ContentEncoding, http::gzip);
    intent.headers.erase(http::ContentLength);
    intent.headers.set(http::TransferEncoding, http::chunked);
  } else {
    intent.body = BodyStrategy::Full;
  }
  return intent;
}

}  // namespace statik
