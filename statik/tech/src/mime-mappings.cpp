#include "statik/mime-mappings.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <limits>
#include <string>
#include <string_view>

#include "statik/toupperlower.hpp"

namespace statik {

static_assert(std::ranges::is_sorted(kMimeMappings, {}, &MimeMapping::extension),
              "kMimeMappings must be sorted by extension");

static_assert(std::size(kMimeMappings) < std::numeric_limits<MimeTypeIdx>::max(),
              "kMimeMappings size exceeds MimeTypeIdx capacity");

namespace {

constexpr std::size_t kLongestExtension =
    std::ranges::max_element(kMimeMappings, {}, [](const MimeMapping &mapping) { return mapping.extension.size(); })
        ->extension.size();

constexpr std::string_view kCharsetSuffix = "; charset=utf-8";

}  // namespace

MimeTypeIdx DetermineMimeTypeIdx(std::string_view path) noexcept {
  const auto slashPos = path.rfind('/');
  if (slashPos != std::string_view::npos) {
    path.remove_prefix(slashPos + 1U);
  }
  const auto dotPos = path.rfind('.');
  if (dotPos == std::string_view::npos) {
    return kUnknownMimeTypeIdx;
  }
  const std::size_t extLen = path.size() - dotPos - 1U;
  if (extLen == 0 || extLen > kLongestExtension) {
    return kUnknownMimeTypeIdx;
  }

  char extBuf[kLongestExtension];
  const auto endIt = std::transform(path.begin() + static_cast<std::ptrdiff_t>(dotPos) + 1, path.end(), extBuf,
                                    [](char ch) { return tolower(ch); });
  const std::string_view ext(extBuf, endIt);

  const auto it = std::ranges::lower_bound(kMimeMappings, ext, {}, &MimeMapping::extension);
  if (it == std::end(kMimeMappings) || it->extension != ext) {
    return kUnknownMimeTypeIdx;
  }
  return static_cast<MimeTypeIdx>(std::distance(std::begin(kMimeMappings), it));
}

std::string_view DetermineMimeTypeStr(std::string_view path) noexcept {
  const MimeTypeIdx idx = DetermineMimeTypeIdx(path);
  return idx == kUnknownMimeTypeIdx ? std::string_view{} : kMimeMappings[idx].mimeType;
}

std::string ContentTypeForPath(std::string_view path) {
  std::string_view mimeType = DetermineMimeTypeStr(path);
  if (mimeType.empty()) {
    mimeType = kFallbackMimeType;
  }
  std::string ret(mimeType);
  if (mimeType.starts_with("text/")) {
    ret.append(kCharsetSuffix);
  }
  return ret;
}

}  // namespace statik
