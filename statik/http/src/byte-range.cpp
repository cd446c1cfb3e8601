#include "statik/byte-range.hpp"

#include <charconv>
#include <cstddef>
#include <limits>
#include <optional>
#include <string_view>
#include <system_error>

#include "statik/cctype.hpp"
#include "statik/http-constants.hpp"
#include "statik/string-equal-ignore-case.hpp"
#include "statik/string-trim.hpp"

namespace statik {

namespace {

// Parses a non-empty string of digits. Values too large saturate, which is enough for range comparisons.
std::optional<std::size_t> ParsePosition(std::string_view digits) {
  if (digits.empty() || !isdigit(digits.front())) {
    return std::nullopt;
  }
  std::size_t value = 0;
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (ec == std::errc::result_out_of_range) {
    for (const char* it = ptr; it != digits.data() + digits.size(); ++it) {
      if (!isdigit(*it)) {
        return std::nullopt;
      }
    }
    return std::numeric_limits<std::size_t>::max();
  }
  if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

ByteRangeParseResult ParseByteRanges(std::size_t totalSize, std::string_view headerValue) {
  ByteRangeParseResult result;

  headerValue = TrimOws(headerValue);
  const auto eqPos = headerValue.find('=');
  if (eqPos == std::string_view::npos || !CaseInsensitiveEqual(TrimOws(headerValue.substr(0, eqPos)), http::bytes)) {
    return result;
  }

  std::string_view specs = headerValue.substr(eqPos + 1);
  bool hasSpec = false;
  while (true) {
    const auto commaPos = specs.find(',');
    const std::string_view spec = TrimOws(specs.substr(0, commaPos));

    // empty list elements are allowed (RFC 9110 section 5.6.1)
    if (!spec.empty()) {
      hasSpec = true;
      const auto dashPos = spec.find('-');
      if (dashPos == std::string_view::npos) {
        return result;
      }
      const std::string_view first = spec.substr(0, dashPos);
      const std::string_view last = spec.substr(dashPos + 1);

      ByteRange range{};
      bool satisfiable = totalSize != 0;
      if (first.empty()) {
        // suffix-range: last 'n' bytes
        const auto suffixLength = ParsePosition(last);
        if (!suffixLength) {
          return result;
        }
        satisfiable = satisfiable && *suffixLength != 0;
        range.start = *suffixLength >= totalSize ? 0 : totalSize - *suffixLength;
        range.end = totalSize == 0 ? 0 : totalSize - 1U;
      } else {
        const auto start = ParsePosition(first);
        if (!start) {
          return result;
        }
        range.start = *start;
        if (last.empty()) {
          range.end = totalSize == 0 ? 0 : totalSize - 1U;
        } else {
          const auto end = ParsePosition(last);
          if (!end) {
            return result;
          }
          range.end = *end;
          if (*end < *start) {
            // syntactically invalid per RFC 9110, ignored as an unsatisfiable spec
            satisfiable = false;
          }
          if (totalSize != 0 && range.end > totalSize - 1U) {
            range.end = totalSize - 1U;
          }
        }
        satisfiable = satisfiable && range.start < totalSize && range.start <= range.end;
      }

      if (satisfiable) {
        result.ranges.push_back(range);
      }
    }

    if (commaPos == std::string_view::npos) {
      break;
    }
    specs.remove_prefix(commaPos + 1);
  }

  if (!hasSpec) {
    return result;  // "bytes=" alone is malformed
  }
  result.kind = result.ranges.empty() ? ByteRangeParseResult::Kind::Unsatisfiable : ByteRangeParseResult::Kind::Ranges;
  return result;
}

}  // namespace statik
