#include "statik/error-reporter.hpp"

#include <initializer_list>
#include <string>
#include <string_view>

#include "statik/http-constants.hpp"
#include "statik/http-header-map.hpp"
#include "statik/http-status-code.hpp"
#include "statik/response-intent.hpp"
#include "statik/stringconv.hpp"

namespace statik {

namespace {

void AppendJsonEscaped(std::string_view value, std::string& out) {
  static constexpr char kHexits[] = "0123456789abcdef";
  for (char ch : value) {
    switch (ch) {
      case '"':
        out.append("\\\"");
        break;
      case '\\':
        out.append("\\\\");
        break;
      case '\n':
        out.append("\\n");
        break;
      case '\r':
        out.append("\\r");
        break;
      case '\t':
        out.append("\\t");
        break;
      case '\b':
        out.append("\\b");
        break;
      case '\f':
        out.append("\\f");
        break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20U) {
          out.append("\\u00");
          out.push_back(kHexits[static_cast<unsigned char>(ch) >> 4U]);
          out.push_back(kHexits[static_cast<unsigned char>(ch) & 0xFU]);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
}

}  // namespace

std::string MakeErrorJson(http::StatusCode status, std::string_view message) {
  std::string body;
  body.reserve(48U + message.size());
  body.append(R"({"status":)");
  body.append(std::string_view(IntegralToCharVector(status)));
  body.append(R"(,"statusMessage":")");
  AppendJsonEscaped(http::ReasonPhraseFor(status), body);
  body.append(R"(","message":")");
  AppendJsonEscaped(message, body);
  body.append(R"("})");
  return body;
}

void ReportError(ResponseIntent& intent, http::StatusCode status, std::string_view message,
                 std::initializer_list<HeaderMap::Field> extraHeaders) {
  if (intent.committed) {
    return;
  }

  static constexpr std::string_view kRepresentationHeaders[] = {
      http::ETag,          http::LastModified, http::Vary,        http::ContentEncoding,
      http::ContentRange,  http::ContentLength, http::ContentType, http::TransferEncoding};
  for (std::string_view name : kRepresentationHeaders) {
    intent.headers.erase(name);
  }
  for (const auto& field : extraHeaders) {
    intent.headers.set(field.name, field.value);
  }

  intent.status = status;
  intent.body = BodyStrategy::ErrorJson;
  intent.errorBody = MakeErrorJson(status, message);
  intent.resource.reset();
  intent.ranges.clear();
  intent.boundary.clear();

  intent.headers.set(http::ContentType, http::ContentTypeApplicationJson);
  intent.headers.set(http::CacheControl, http::NoCache);
  intent.headers.set(http::ContentLength, std::string_view(IntegralToCharVector(intent.errorBody.size())));
}

}  // namespace statik
