#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace statik {

enum class ContentCoding : uint8_t { Identity, Gzip };

// Whether an Accept-Encoding value lists the gzip coding with a non zero quality.
[[nodiscard]] bool AcceptsGzip(std::string_view acceptEncoding) noexcept;

// Coding to apply to a full response body. Audio, image and video types are never compressed.
[[nodiscard]] ContentCoding SelectContentCoding(std::optional<std::string_view> acceptEncoding,
                                                std::string_view mimeType) noexcept;

}  // namespace statik
