#include "statik/timestring.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string_view>
#include <utility>

#include "statik/cctype.hpp"
#include "statik/simple-charconv.hpp"
#include "statik/timedef.hpp"

namespace statik {

namespace {

constexpr std::string_view kMonths[]{"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                     "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
constexpr std::string_view kWeekdays[]{"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
constexpr std::string_view kLongWeekdays[]{"Sunday",   "Monday", "Tuesday", "Wednesday",
                                           "Thursday", "Friday", "Saturday"};

constexpr std::size_t kAsctimeDateStrLen = 24;      // Sun Nov  6 08:49:37 1994
constexpr std::size_t kRfc850DateTailStrLen = 22;  // 06-Nov-94 08:49:37 GMT

struct DateFields {
  int year;
  int month;    // 0 == Jan
  int weekday;  // 0 == Sun
  int day;
  int hour;
  int minute;
  int second;
};

template <std::size_t N>
int IndexOf(const std::string_view (&names)[N], std::string_view name) {
  const auto it = std::ranges::find(names, name);
  return it == std::end(names) ? -1 : static_cast<int>(std::distance(std::begin(names), it));
}

bool AllDigits(const char* ptr, std::size_t len) {
  return std::all_of(ptr, ptr + len, [](char ch) { return isdigit(ch); });
}

// HH:MM:SS
bool ParseClock(const char* ptr, DateFields& fields) {
  if (ptr[2] != ':' || ptr[5] != ':' || !AllDigits(ptr, 2) || !AllDigits(ptr + 3, 2) || !AllDigits(ptr + 6, 2)) {
    return false;
  }
  fields.hour = read2(ptr);
  fields.minute = read2(ptr + 3);
  fields.second = read2(ptr + 6);
  return true;
}

std::optional<SysTimePoint> ToTimePoint(const DateFields& fields) {
  if (fields.month < 0 || fields.weekday < 0 || fields.day == 0 || fields.hour > 23 || fields.minute > 59 ||
      fields.second > 60) {
    return std::nullopt;
  }
  const std::chrono::year_month_day ymd{std::chrono::year{fields.year},
                                        std::chrono::month{static_cast<unsigned>(fields.month) + 1U},
                                        std::chrono::day{static_cast<unsigned>(fields.day)}};
  if (!ymd.ok()) {
    return std::nullopt;
  }

  const std::chrono::sys_days dayPoint{ymd};
  const std::chrono::weekday wd{dayPoint};
  if (std::cmp_not_equal(fields.weekday, wd.c_encoding())) {
    return std::nullopt;
  }

  return dayPoint + std::chrono::hours{fields.hour} + std::chrono::minutes{fields.minute} +
         std::chrono::seconds{fields.second};
}

// Sun, 06 Nov 1994 08:49:37 GMT
std::optional<SysTimePoint> ParseImfFixdate(const char* ptr) {
  if (ptr[3] != ',' || ptr[4] != ' ' || ptr[7] != ' ' || ptr[11] != ' ' || ptr[16] != ' ' || ptr[25] != ' ' ||
      !AllDigits(ptr + 5, 2) || !AllDigits(ptr + 12, 4) || std::string_view(ptr + 26, 3) != "GMT") {
    return std::nullopt;
  }
  DateFields fields{};
  if (!ParseClock(ptr + 17, fields)) {
    return std::nullopt;
  }
  fields.weekday = IndexOf(kWeekdays, std::string_view(ptr, 3));
  fields.day = read2(ptr + 5);
  fields.month = IndexOf(kMonths, std::string_view(ptr + 8, 3));
  fields.year = read4(ptr + 12);
  return ToTimePoint(fields);
}

// Sunday, 06-Nov-94 08:49:37 GMT
std::optional<SysTimePoint> ParseRfc850Date(std::string_view value) {
  const auto commaPos = value.find(',');
  if (commaPos == std::string_view::npos || value.size() != commaPos + 2U + kRfc850DateTailStrLen ||
      value[commaPos + 1U] != ' ') {
    return std::nullopt;
  }
  const char* ptr = value.data() + commaPos + 2U;
  if (ptr[2] != '-' || ptr[6] != '-' || ptr[9] != ' ' || ptr[18] != ' ' || !AllDigits(ptr, 2) ||
      !AllDigits(ptr + 7, 2) || std::string_view(ptr + 19, 3) != "GMT") {
    return std::nullopt;
  }
  DateFields fields{};
  if (!ParseClock(ptr + 10, fields)) {
    return std::nullopt;
  }
  fields.weekday = IndexOf(kLongWeekdays, value.substr(0, commaPos));
  fields.day = read2(ptr);
  fields.month = IndexOf(kMonths, std::string_view(ptr + 3, 3));

  // RFC 7231 7.1.1.1: a two digit year more than 50 years in the future denotes the most recent past year
  // with the same last two digits.
  const std::chrono::year_month_day today{std::chrono::floor<std::chrono::days>(SysClock::now())};
  const int currentYear = static_cast<int>(today.year());
  fields.year = (currentYear / 100 * 100) + read2(ptr + 7);
  if (fields.year > currentYear + 50) {
    fields.year -= 100;
  } else if (fields.year <= currentYear - 50) {
    fields.year += 100;
  }
  return ToTimePoint(fields);
}

// Sun Nov  6 08:49:37 1994
std::optional<SysTimePoint> ParseAsctimeDate(const char* ptr) {
  if (ptr[3] != ' ' || ptr[7] != ' ' || ptr[10] != ' ' || ptr[19] != ' ' || !isdigit(ptr[9]) ||
      (ptr[8] != ' ' && !isdigit(ptr[8])) || !AllDigits(ptr + 20, 4)) {
    return std::nullopt;
  }
  DateFields fields{};
  if (!ParseClock(ptr + 11, fields)) {
    return std::nullopt;
  }
  fields.weekday = IndexOf(kWeekdays, std::string_view(ptr, 3));
  fields.month = IndexOf(kMonths, std::string_view(ptr + 4, 3));
  fields.day = ptr[8] == ' ' ? ptr[9] - '0' : read2(ptr + 8);
  fields.year = read4(ptr + 20);
  return ToTimePoint(fields);
}

}  // namespace

std::optional<SysTimePoint> TryParseTimeRFC7231(std::string_view value) {
  while (!value.empty() && isspace(value.front())) {
    value.remove_prefix(1);
  }
  while (!value.empty() && isspace(value.back())) {
    value.remove_suffix(1);
  }

  if (value.size() == kRFC7231DateStrLen && value[3] == ',') {
    return ParseImfFixdate(value.data());
  }
  if (value.size() == kAsctimeDateStrLen && value[3] == ' ') {
    return ParseAsctimeDate(value.data());
  }
  return ParseRfc850Date(value);
}

}  // namespace statik
