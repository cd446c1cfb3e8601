#include "statik/timestring.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string_view>

#include "statik/timedef.hpp"

namespace statik {

namespace {

std::string_view Format(SysTimePoint tp, char (&buf)[kRFC7231DateStrLen]) {
  char* end = TimeToStringRFC7231(tp, buf);
  return {buf, static_cast<std::size_t>(end - buf)};
}

constexpr SysTimePoint kRfcExample =
    std::chrono::sys_days{std::chrono::year{1994} / 11 / 6} + std::chrono::hours{8} + std::chrono::minutes{49} +
    std::chrono::seconds{37};

}  // namespace

TEST(TimeStringRFC7231Test, FormatsImfFixdate) {
  char buf[kRFC7231DateStrLen];
  EXPECT_EQ(Format(kRfcExample, buf), "Sun, 06 Nov 1994 08:49:37 GMT");
}

TEST(TimeStringRFC7231Test, TruncatesSubSeconds) {
  char buf[kRFC7231DateStrLen];
  EXPECT_EQ(Format(kRfcExample + std::chrono::milliseconds{999}, buf), "Sun, 06 Nov 1994 08:49:37 GMT");
}

TEST(TimeStringRFC7231Test, LeapDay) {
  char buf[kRFC7231DateStrLen];
  SysTimePoint tp = std::chrono::sys_days{std::chrono::year{2024} / 2 / 29} + std::chrono::hours{23} +
                    std::chrono::minutes{59} + std::chrono::seconds{59};
  EXPECT_EQ(Format(tp, buf), "Thu, 29 Feb 2024 23:59:59 GMT");
}

TEST(TimeStringRFC7231Test, ParseValid) {
  auto parsed = TryParseTimeRFC7231("Sun, 06 Nov 1994 08:49:37 GMT");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, kRfcExample);
}

TEST(TimeStringRFC7231Test, ParseIgnoresSurroundingWhitespace) {
  auto parsed = TryParseTimeRFC7231("  Sun, 06 Nov 1994 08:49:37 GMT \t");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, kRfcExample);
}

TEST(TimeStringRFC7231Test, ParseRoundTripsFormattedValue) {
  char buf[kRFC7231DateStrLen];
  SysTimePoint tp = std::chrono::sys_days{std::chrono::year{2031} / 1 / 1} + std::chrono::seconds{1};
  EXPECT_EQ(TryParseTimeRFC7231(Format(tp, buf)), std::optional<SysTimePoint>{tp});
}

TEST(TimeStringRFC7231Test, ParseRejectsInvalid) {
  EXPECT_FALSE(TryParseTimeRFC7231(""));
  EXPECT_FALSE(TryParseTimeRFC7231("not a date"));
  EXPECT_FALSE(TryParseTimeRFC7231("\"abc-123\""));
  EXPECT_FALSE(TryParseTimeRFC7231("Sun, 06 Nov 1994 08:49:37 UTC"));
  EXPECT_FALSE(TryParseTimeRFC7231("Sun, 06 Foo 1994 08:49:37 GMT"));
  EXPECT_FALSE(TryParseTimeRFC7231("Sun, 31 Feb 1994 08:49:37 GMT"));
  EXPECT_FALSE(TryParseTimeRFC7231("Sun, 06 Nov 1994 24:49:37 GMT"));
  EXPECT_FALSE(TryParseTimeRFC7231("Sun, 0a Nov 1994 08:49:37 GMT"));
}

TEST(TimeStringRFC7231Test, ParseRejectsInconsistentWeekday) {
  EXPECT_FALSE(TryParseTimeRFC7231("Mon, 06 Nov 1994 08:49:37 GMT"));
  EXPECT_FALSE(TryParseTimeRFC7231("Monday, 06-Nov-94 08:49:37 GMT"));
  EXPECT_FALSE(TryParseTimeRFC7231("Mon Nov  6 08:49:37 1994"));
}

TEST(TimeStringRFC7231Test, ParseRfc850Date) {
  auto parsed = TryParseTimeRFC7231("Sunday, 06-Nov-94 08:49:37 GMT");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, kRfcExample);

  parsed = TryParseTimeRFC7231("Thursday, 29-Feb-24 23:59:59 GMT");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, std::chrono::sys_days{std::chrono::year{2024} / 2 / 29} + std::chrono::hours{23} +
                         std::chrono::minutes{59} + std::chrono::seconds{59});

  EXPECT_FALSE(TryParseTimeRFC7231("Sun, 06-Nov-94 08:49:37 GMT"));
  EXPECT_FALSE(TryParseTimeRFC7231("Sunday, 06-Nov-94 08:49:37 UTC"));
  EXPECT_FALSE(TryParseTimeRFC7231("Sunday, 06 Nov 94 08:49:37 GMT"));
  EXPECT_FALSE(TryParseTimeRFC7231("Sunday, 06-Nov-1994 08:49:37 GMT"));
}

TEST(TimeStringRFC7231Test, ParseAsctimeDate) {
  auto parsed = TryParseTimeRFC7231("Sun Nov  6 08:49:37 1994");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, kRfcExample);

  parsed = TryParseTimeRFC7231("Thu Feb 29 23:59:59 2024");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, std::chrono::sys_days{std::chrono::year{2024} / 2 / 29} + std::chrono::hours{23} +
                         std::chrono::minutes{59} + std::chrono::seconds{59});

  EXPECT_FALSE(TryParseTimeRFC7231("Sun Nov 6 08:49:37 1994"));
  EXPECT_FALSE(TryParseTimeRFC7231("Sun Nov  6 08:49:37 94"));
  EXPECT_FALSE(TryParseTimeRFC7231("Sun Nov  6 08-49-37 1994"));
}

}  // namespace statik
