#include "statik/content-encoder.hpp"

#include <optional>
#include <string_view>

#include "statik/http-constants.hpp"
#include "statik/mime-mappings.hpp"
#include "statik/string-equal-ignore-case.hpp"
#include "statik/string-trim.hpp"

namespace statik {

namespace {

// "q=0", "q=0.", "q=0.0", "q=0.00", "q=0.000"
bool IsZeroQuality(std::string_view params) noexcept {
  while (!params.empty()) {
    const auto semiPos = params.find(';');
    std::string_view param = TrimOws(params.substr(0, semiPos));
    params = semiPos == std::string_view::npos ? std::string_view{} : params.substr(semiPos + 1);

    const auto eqPos = param.find('=');
    if (eqPos == std::string_view::npos || !CaseInsensitiveEqual(TrimOws(param.substr(0, eqPos)), "q")) {
      continue;
    }
    std::string_view qvalue = TrimOws(param.substr(eqPos + 1));
    if (qvalue.empty() || qvalue.front() != '0') {
      return false;
    }
    qvalue.remove_prefix(1);
    if (qvalue.empty()) {
      return true;
    }
    if (qvalue.front() != '.' || qvalue.size() > 4U) {
      return false;
    }
    return qvalue.find_first_not_of('0', 1) == std::string_view::npos;
  }
  return false;
}

}  // namespace

bool AcceptsGzip(std::string_view acceptEncoding) noexcept {
  while (true) {
    const auto commaPos = acceptEncoding.find(',');
    const std::string_view element = acceptEncoding.substr(0, commaPos);
    const auto semiPos = element.find(';');
    const std::string_view coding = TrimOws(element.substr(0, semiPos));
    if (CaseInsensitiveEqual(coding, http::gzip)) {
      return semiPos == std::string_view::npos || !IsZeroQuality(element.substr(semiPos + 1));
    }
    if (commaPos == std::string_view::npos) {
      return false;
    }
    acceptEncoding.remove_prefix(commaPos + 1);
  }
}

ContentCoding SelectContentCoding(std::optional<std::string_view> acceptEncoding, std::string_view mimeType) noexcept {
  if (!acceptEncoding || IsAudioImageOrVideo(mimeType) || !AcceptsGzip(*acceptEncoding)) {
    return ContentCoding::Identity;
  }
  return ContentCoding::Gzip;
}

}  // namespace statik
