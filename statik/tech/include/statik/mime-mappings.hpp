#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace statik {

struct MimeMapping {
  std::string_view extension;
  std::string_view mimeType;
};

using MimeTypeIdx = uint8_t;

inline constexpr MimeTypeIdx kUnknownMimeTypeIdx = static_cast<MimeTypeIdx>(~0);

inline constexpr std::string_view kFallbackMimeType = "application/octet-stream";

// Sorted by extension (checked at compile time), extensions stored lower case.
inline constexpr MimeMapping kMimeMappings[] = {
    {"aac", "audio/aac"},
    {"apng", "image/apng"},
    {"avif", "image/avif"},
    {"bin", "application/octet-stream"},
    {"bmp", "image/bmp"},
    {"css", "text/css"},
    {"csv", "text/csv"},
    {"eot", "application/vnd.ms-fontobject"},
    {"flac", "audio/flac"},
    {"gif", "image/gif"},
    {"gz", "application/gzip"},
    {"htm", "text/html"},
    {"html", "text/html"},
    {"ico", "image/x-icon"},
    {"ics", "text/calendar"},
    {"jpeg", "image/jpeg"},
    {"jpg", "image/jpeg"},
    {"js", "text/javascript"},
    {"json", "application/json"},
    {"jsonld", "application/ld+json"},
    {"m4a", "audio/mp4"},
    {"manifest", "text/cache-manifest"},
    {"map", "application/json"},
    {"md", "text/markdown"},
    {"mjs", "text/javascript"},
    {"mov", "video/quicktime"},
    {"mp3", "audio/mpeg"},
    {"mp4", "video/mp4"},
    {"mpeg", "video/mpeg"},
    {"oga", "audio/ogg"},
    {"ogg", "audio/ogg"},
    {"ogv", "video/ogg"},
    {"otf", "font/otf"},
    {"pdf", "application/pdf"},
    {"png", "image/png"},
    {"svg", "image/svg+xml"},
    {"tar", "application/x-tar"},
    {"tif", "image/tiff"},
    {"tiff", "image/tiff"},
    {"ttf", "font/ttf"},
    {"txt", "text/plain"},
    {"wasm", "application/wasm"},
    {"wav", "audio/wav"},
    {"webm", "video/webm"},
    {"webmanifest", "application/manifest+json"},
    {"webp", "image/webp"},
    {"woff", "font/woff"},
    {"woff2", "font/woff2"},
    {"xhtml", "application/xhtml+xml"},
    {"xml", "application/xml"},
    {"yaml", "text/yaml"},
    {"yml", "text/yaml"},
    {"zip", "application/zip"},
};

// Index in kMimeMappings of the extension of the last path segment, case insensitive.
// Returns kUnknownMimeTypeIdx if the path has no known extension. Never allocates.
MimeTypeIdx DetermineMimeTypeIdx(std::string_view path) noexcept;

// MIME type for the extension of given path, or an empty string_view if unknown.
std::string_view DetermineMimeTypeStr(std::string_view path) noexcept;

// Value suitable for a Content-Type header: text types get "; charset=utf-8" appended,
// unknown extensions map to application/octet-stream.
std::string ContentTypeForPath(std::string_view path);

// Whether given MIME type designates audio, image or video content.
constexpr bool IsAudioImageOrVideo(std::string_view mimeType) noexcept {
  return mimeType.starts_with("audio") || mimeType.starts_with("image") || mimeType.starts_with("video");
}

}  // namespace statik
