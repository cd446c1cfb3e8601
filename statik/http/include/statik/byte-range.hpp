#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace statik {

// Inclusive byte window [start, end] of a resource, with start <= end < size.
struct ByteRange {
  [[nodiscard]] std::size_t length() const noexcept { return end - start + 1U; }

  bool operator==(const ByteRange&) const noexcept = default;

  std::size_t start;
  std::size_t end;
};

struct ByteRangeParseResult {
  enum class Kind : uint8_t { Ranges, Unsatisfiable, Malformed };

  Kind kind{Kind::Malformed};
  std::vector<ByteRange> ranges;  // in request order, only for Kind::Ranges
};

// Parses a Range header value against a resource of totalSize bytes.
//  - the unit must be 'bytes' (case-insensitive), otherwise the value is Malformed
//  - each comma separated spec is one of "a-b", "a-" or "-n" (suffix), anything else is Malformed
//  - end is clamped to totalSize - 1, a suffix longer than the resource selects all of it
//  - specs with start > end or start >= totalSize are skipped
//  - if no spec remains, the value is Unsatisfiable
// Overlapping ranges are neither merged nor reordered.
[[nodiscard]] ByteRangeParseResult ParseByteRanges(std::size_t totalSize, std::string_view headerValue);

}  // namespace statik
