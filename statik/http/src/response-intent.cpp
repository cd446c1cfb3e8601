#include "statik/response-intent.hpp"

#include <string_view>

#include "statik/http-constants.hpp"
#include "statik/raw-chars.hpp"
#include "statik/stringconv.hpp"

namespace statik {

void ResponseIntent::serializeHead(RawChars& out) const {
  out.append(http::HTTP11Sv);
  out.push_back(' ');
  out.append(std::string_view(IntegralToCharVector(status)));
  out.push_back(' ');
  out.append(http::ReasonPhraseFor(status));
  out.append(http::CRLF);
  for (const auto& [name, value] : headers) {
    out.append(name);
    out.append(http::HeaderSep);
    out.append(value);
    out.append(http::CRLF);
  }
  out.append(http::CRLF);
}

}  // namespace statik
