#pragma once

#include "mortcalc/core/result.h"

#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mortcalc::server {

namespace http = boost::beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

// JsonReply is what route handlers produce; the server turns it into an
// HttpResponse with to_http_response().
struct JsonReply {
  int status{200};                                           // NOLINT(readability-identifier-naming)
  nlohmann::json body;                                       // NOLINT(readability-identifier-naming)
  std::vector<std::pair<std::string, std::string>> headers;  // NOLINT(readability-identifier-naming)
};

// Convenience for {"error": message} replies.
[[nodiscard]] JsonReply make_error_reply(int status, const std::string& message);

// Request body problems detected before the payload reaches the pipeline.
enum class BodyError {
  kWrongContentType,
  kMalformedJson,
  kEmpty,
  kNotAnObject,
};

// Client-facing message for a BodyError.
[[nodiscard]] std::string body_error_message(BodyError error);

// is_json_content_type accepts "application/json" with optional parameters,
// compared case-insensitively ("Application/JSON; charset=utf-8").
[[nodiscard]] bool is_json_content_type(std::string_view content_type);

// parse_json_object_body enforces the JSON envelope of a POST body:
// JSON content type, well-formed JSON, non-empty, and a JSON object.
// Empty means no bytes, null, {} or [].
[[nodiscard]] core::Result<nlohmann::json, BodyError> parse_json_object_body(
    const HttpRequest& request);

// request_path returns the target without its query string.
[[nodiscard]] std::string_view request_path(const HttpRequest& request);

// to_http_response serialises reply with JSON content type and the server
// identification header, mirroring the request's HTTP version and keep-alive.
[[nodiscard]] HttpResponse to_http_response(const JsonReply& reply, const HttpRequest& request);

}  // namespace mortcalc::server
