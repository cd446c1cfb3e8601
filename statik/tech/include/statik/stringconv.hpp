#pragma once

#include <array>
#include <charconv>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>
#include <type_traits>

namespace statik {

// Small fixed-capacity char buffer holding the textual representation of an integral.
template <std::size_t N>
struct IntegralChars {
  [[nodiscard]] const char* data() const noexcept { return buf.data(); }
  [[nodiscard]] std::size_t size() const noexcept { return len; }

  operator std::string_view() const noexcept { return {buf.data(), len}; }

  std::array<char, N> buf;
  std::uint8_t len{0};
};

// Converts an integral into its decimal representation without any allocation.
inline auto IntegralToCharVector(std::integral auto val) {
  using Int = decltype(val);

  // +1 for minus, +1 for additional partial ranges coverage
  static constexpr std::size_t kMaxSize =
      static_cast<std::size_t>(std::numeric_limits<Int>::digits10) + 1U + static_cast<std::size_t>(std::is_signed_v<Int>);

  IntegralChars<kMaxSize> ret;

  // cannot fail, the buffer is sized for the largest value
  const auto res = std::to_chars(ret.buf.data(), ret.buf.data() + kMaxSize, val);
  ret.len = static_cast<std::uint8_t>(res.ptr - ret.buf.data());
  return ret;
}

// Converts an unsigned integral into its minimal lowercase hexadecimal representation.
inline auto IntegralToHexCharVector(std::unsigned_integral auto val) {
  using Int = decltype(val);

  static constexpr std::size_t kMaxSize = sizeof(Int) * 2U;

  IntegralChars<kMaxSize> ret;

  const auto res = std::to_chars(ret.buf.data(), ret.buf.data() + kMaxSize, val, 16);
  ret.len = static_cast<std::uint8_t>(res.ptr - ret.buf.data());
  return ret;
}

}  // namespace statik
