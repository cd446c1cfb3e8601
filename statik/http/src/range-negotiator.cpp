#include "statik/range-negotiator.hpp"

#include <fmt/format.h>

#include <chrono>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>
#include <utility>

#include "statik/byte-range.hpp"
#include "statik/http-constants.hpp"
#include "statik/http-request.hpp"
#include "statik/resource.hpp"
#include "statik/string-trim.hpp"
#include "statik/timedef.hpp"
#include "statik/timestring.hpp"

namespace statik {

bool IfRangeMatches(std::string_view ifRange, std::string_view etag, SysTimePoint mtime) {
  ifRange = TrimOws(ifRange);
  const auto date = TryParseTimeRFC7231(ifRange);
  if (date) {
    return *date >= std::chrono::floor<std::chrono::seconds>(mtime);
  }
  return ifRange == etag;
}

RangeSelection NegotiateRange(const Resource& resource, std::string_view etag, const HttpRequest& request) {
  RangeSelection selection;

  const auto rangeHeader = request.headerValue(http::Range);
  if (!rangeHeader) {
    return selection;
  }

  auto parsed = ParseByteRanges(resource.size, *rangeHeader);
  if (parsed.kind != ByteRangeParseResult::Kind::Ranges) {
    selection.kind = RangeSelection::Kind::NotSatisfiable;
    return selection;
  }

  if (auto ifRange = request.headerValue(http::IfRange); ifRange && !IfRangeMatches(*ifRange, etag, resource.mtime)) {
    return selection;
  }

  selection.kind = parsed.ranges.size() == 1U ? RangeSelection::Kind::Single : RangeSelection::Kind::Multipart;
  selection.ranges = std::move(parsed.ranges);
  return selection;
}

std::string MakeMultipartBoundary() {
  static std::mt19937_64 engine{std::random_device{}()};
  static uint64_t counter = 0;

  return fmt::format("{:016x}{}", engine(), ++counter);
}

}  // namespace statik
