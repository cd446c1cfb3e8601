#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "statik/byte-range.hpp"
#include "statik/http-request.hpp"
#include "statik/resource.hpp"
#include "statik/timedef.hpp"

namespace statik {

struct RangeSelection {
  enum class Kind : uint8_t { Full, Single, Multipart, NotSatisfiable };

  Kind kind{Kind::Full};
  std::vector<ByteRange> ranges;
};

// Selects the byte ranges to send for a resource, from the Range and If-Range request headers.
//  - no Range header: Full
//  - malformed or unsatisfiable Range: NotSatisfiable (checked before If-Range)
//  - If-Range not matching the current representation (an older date, or a different entity tag): Full
//  - otherwise Single or Multipart depending on the number of satisfiable ranges
[[nodiscard]] RangeSelection NegotiateRange(const Resource& resource, std::string_view etag,
                                            const HttpRequest& request);

// Whether an If-Range value designates the current representation.
[[nodiscard]] bool IfRangeMatches(std::string_view ifRange, std::string_view etag, SysTimePoint mtime);

// Returns a new boundary for a multipart/byteranges body: 16 random hex digits followed by a per-process counter.
[[nodiscard]] std::string MakeMultipartBoundary();

}  // namespace statik
