#include "statik/cache-negotiator.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "statik/http-constants.hpp"
#include "statik/http-header-map.hpp"
#include "statik/http-request.hpp"
#include "statik/resource.hpp"
#include "statik/stringconv.hpp"
#include "statik/timedef.hpp"
#include "statik/timestring.hpp"

namespace statik {

std::string MakeStrongEtag(std::size_t fileSize, SysTimePoint mtime) {
  const auto millis = std::chrono::floor<std::chrono::milliseconds>(mtime).time_since_epoch().count();

  const auto sizeHex = IntegralToHexCharVector(static_cast<uint64_t>(fileSize));
  const auto millisHex = IntegralToHexCharVector(static_cast<uint64_t>(millis));

  std::string etag;
  etag.reserve(sizeHex.size() + millisHex.size() + 3U);
  etag.push_back('"');
  etag.append(std::string_view(sizeHex));
  etag.push_back('-');
  etag.append(std::string_view(millisHex));
  etag.push_back('"');
  return etag;
}

std::string MakeHttpDate(SysTimePoint tp) {
  std::string ret(kRFC7231DateStrLen, '\0');
  TimeToStringRFC7231(tp, ret.data());
  return ret;
}

CacheNegotiator::CacheNegotiator(std::chrono::seconds maxAge) : _cacheControl("public, max-age=") {
  _cacheControl.append(std::string_view(IntegralToCharVector(maxAge.count())));
}

CacheNegotiator::Outcome CacheNegotiator::negotiate(const Resource& resource, const HttpRequest& request,
                                                    HeaderMap& headers) const {
  const std::string etag = MakeStrongEtag(resource.size, resource.mtime);

  headers.set(http::ETag, etag);
  headers.set(http::LastModified, MakeHttpDate(resource.mtime));
  headers.set(http::CacheControl, _cacheControl);

  bool notModified = false;
  if (auto ifNoneMatch = request.headerValue(http::IfNoneMatch); ifNoneMatch && *ifNoneMatch == etag) {
    notModified = true;
  }
  if (!notModified) {
    if (auto ifModifiedSince = request.headerValue(http::IfModifiedSince); ifModifiedSince) {
      // an unparsable date is ignored
      const auto since = TryParseTimeRFC7231(*ifModifiedSince);
      notModified = since && *since >= std::chrono::floor<std::chrono::seconds>(resource.mtime);
    }
  }
  if (!notModified) {
    return Outcome::Full;
  }

  headers.erase(http::ContentType);
  headers.erase(http::ContentLength);
  headers.erase(http::ContentEncoding);
  headers.erase(http::ContentRange);
  headers.erase(http::TransferEncoding);
  return Outcome::NotModified;
}

}  // namespace statik
