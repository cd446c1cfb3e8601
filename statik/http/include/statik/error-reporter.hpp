#pragma once

#include <initializer_list>
#include <string>
#include <string_view>

#include "statik/http-header-map.hpp"
#include "statik/http-status-code.hpp"
#include "statik/response-intent.hpp"

namespace statik {

// {"status":N,"statusMessage":"<reason>","message":"<message>"}, strings JSON escaped.
[[nodiscard]] std::string MakeErrorJson(http::StatusCode status, std::string_view message);

// Turns intent into a JSON error response. Header fields describing the original representation are removed,
// then extraHeaders are set (Allow for 405, Content-Range for 416 for instance).
// Does nothing once the head of intent has been committed to the connection.
void ReportError(ResponseIntent& intent, http::StatusCode status, std::string_view message,
                 std::initializer_list<HeaderMap::Field> extraHeaders = {});

}  // namespace statik
