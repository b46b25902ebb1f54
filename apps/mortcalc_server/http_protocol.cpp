#include "http_protocol.h"

#include "mortcalc/core/normalization.h"
#include "mortcalc/core/version.h"

#include <string>
#include <utility>

namespace mortcalc::server {

using json = nlohmann::json;

namespace {

std::string ascii_lower(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char ch : text) {
    out.push_back((ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch + ('a' - 'A')) : ch);
  }
  return out;
}

}  // namespace

JsonReply make_error_reply(int status, const std::string& message) {
  return JsonReply{status, json{{"error", message}}, {}};
}

std::string body_error_message(BodyError error) {
  switch (error) {
    case BodyError::kWrongContentType:
      return "Content-Type must be application/json";
    case BodyError::kMalformedJson:
      return "Request body must be valid JSON";
    case BodyError::kEmpty:
      return "Request body cannot be empty";
    case BodyError::kNotAnObject:
      return "Request body must be a JSON object";
  }
  return "Bad request";
}

bool is_json_content_type(std::string_view content_type) {
  const auto semicolon = content_type.find(';');
  const std::string media_type = ascii_lower(core::trim(content_type.substr(0, semicolon)));
  return media_type == "application/json";
}

core::Result<json, BodyError> parse_json_object_body(const HttpRequest& request) {
  using BodyResult = core::Result<json, BodyError>;

  const auto content_type = request.find(http::field::content_type);
  if (content_type == request.end() ||
      !is_json_content_type(std::string_view{content_type->value().data(),
                                             content_type->value().size()})) {
    return BodyResult::err(BodyError::kWrongContentType);
  }

  if (core::trim(request.body()).empty()) {
    return BodyResult::err(BodyError::kEmpty);
  }

  json payload = json::parse(request.body(), nullptr, /*allow_exceptions=*/false);
  if (payload.is_discarded()) {
    return BodyResult::err(BodyError::kMalformedJson);
  }

  if (payload.is_null() || ((payload.is_object() || payload.is_array()) && payload.empty())) {
    return BodyResult::err(BodyError::kEmpty);
  }

  if (!payload.is_object()) {
    return BodyResult::err(BodyError::kNotAnObject);
  }

  return BodyResult::ok(std::move(payload));
}

std::string_view request_path(const HttpRequest& request) {
  const std::string_view target{request.target().data(), request.target().size()};
  return target.substr(0, target.find('?'));
}

HttpResponse to_http_response(const JsonReply& reply, const HttpRequest& request) {
  HttpResponse response{static_cast<http::status>(reply.status), request.version()};
  response.set(http::field::server, std::string{"mortcalc/"} + core::kBuildVersion);
  response.set(http::field::content_type, "application/json");
  for (const auto& [name, value] : reply.headers) {
    response.set(name, value);
  }
  response.keep_alive(request.keep_alive());
  response.body() = reply.body.dump(-1, ' ', false, json::error_handler_t::replace);
  response.prepare_payload();
  return response;
}

}  // namespace mortcalc::server
