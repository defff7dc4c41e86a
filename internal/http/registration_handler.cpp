#include "registration_handler.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>
#include <string>
#include <string_view>

#include "internal/http/http_error.hpp"
#include "internal/observability/logging.hpp"

namespace registry::http {

namespace beast_http = boost::beast::http;

using registry::observability::StringField;

namespace {

constexpr const char* kJsonContentType = "application/json";

std::string_view PathOf(std::string_view target) {
  const auto query = target.find('?');
  return query == std::string_view::npos ? target : target.substr(0, query);
}

void ApplyCors(RegistrationHandler::Response& res) {
  res.set(beast_http::field::access_control_allow_origin, "*");
}

RegistrationHandler::Response MakeResponse(const RegistrationHandler::Request& req, beast_http::status status, std::string body,
                                           const char* content_type) {
  RegistrationHandler::Response res{status, req.version()};
  res.set(beast_http::field::content_type, content_type);
  res.keep_alive(req.keep_alive());
  ApplyCors(res);
  res.body() = std::move(body);
  res.prepare_payload();
  return res;
}

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("render json: " + std::string(status.message()));
  }
  return json;
}

// Record ids are int64, which the proto3 JSON mapping renders as strings.
// Clients receive them as JSON numbers.
google::protobuf::Struct ListBody(const registry::v1::ListRegistrationsResponse& list) {
  google::protobuf::Struct body;
  auto                     status = google::protobuf::util::JsonStringToMessage(ToJson(list), &body);
  if (!status.ok()) {
    throw std::runtime_error("reshape registrations: " + std::string(status.message()));
  }

  auto data = body.mutable_fields()->find("data");
  if (data == body.mutable_fields()->end()) {
    return body;
  }
  for (auto& row : *data->second.mutable_list_value()->mutable_values()) {
    auto& fields = *row.mutable_struct_value()->mutable_fields();
    auto  id     = fields.find("id");
    if (id != fields.end() && id->second.kind_case() == google::protobuf::Value::kStringValue) {
      const auto value = std::stoll(id->second.string_value());
      id->second.set_number_value(static_cast<double>(value));
    }
  }
  return body;
}

RegistrationHandler::Response JsonResponse(const RegistrationHandler::Request& req, beast_http::status status,
                                           const google::protobuf::Message& message) {
  return MakeResponse(req, status, ToJson(message), kJsonContentType);
}

// HEAD gets the GET headers, Content-Length included, and no body.
RegistrationHandler::Response WithoutBodyForHead(const RegistrationHandler::Request& req, RegistrationHandler::Response res) {
  if (req.method() == beast_http::verb::head) {
    res.body().clear();
  }
  return res;
}

RegistrationHandler::Response ErrorJson(const RegistrationHandler::Request& req, beast_http::status status, const std::string& error) {
  registry::v1::ErrorResponse body;
  body.set_error(error);
  return JsonResponse(req, status, body);
}

} // namespace

RegistrationHandler::RegistrationHandler(std::shared_ptr<registry::service::RegistrationService> service) : service_(std::move(service)) {
}

RegistrationHandler::Response RegistrationHandler::Handle(const Request& req) const {
  try {
    const auto path = PathOf(std::string_view(req.target().data(), req.target().size()));

    if (req.method() == beast_http::verb::options) {
      Response res{beast_http::status::no_content, req.version()};
      res.keep_alive(req.keep_alive());
      ApplyCors(res);
      res.set(beast_http::field::access_control_allow_methods, "GET,HEAD,PUT,PATCH,POST,DELETE");
      res.set(beast_http::field::access_control_allow_headers, "Content-Type");
      res.prepare_payload();
      return res;
    }

    const bool  read    = req.method() == beast_http::verb::get || req.method() == beast_http::verb::head;
    const char* allowed = nullptr;
    if (path == "/ping") {
      if (read) return WithoutBodyForHead(req, Ping(req));
      allowed = "GET, HEAD";
    } else if (path == "/registrations") {
      if (read) return WithoutBodyForHead(req, ListRegistrations(req));
      allowed = "GET, HEAD";
    } else if (path == "/submit") {
      if (req.method() == beast_http::verb::post) return Submit(req);
      allowed = "POST";
    }

    if (allowed) {
      auto res = ErrorJson(req, beast_http::status::method_not_allowed, "Method not allowed");
      res.set(beast_http::field::allow, allowed);
      return res;
    }
    return ErrorJson(req, beast_http::status::not_found, "Not found");
  } catch (const std::exception& e) {
    REGISTRY_LOG_ERROR("HTTP request failed", {StringField("target", std::string(req.target().data(), req.target().size())), StringField("error", e.what())});
    return MakeResponse(req, beast_http::status::internal_server_error, R"({"error":"Internal server error"})", kJsonContentType);
  }
}

RegistrationHandler::Response RegistrationHandler::PayloadTooLarge(unsigned version) {
  Response res{beast_http::status::payload_too_large, version};
  res.set(beast_http::field::content_type, kJsonContentType);
  res.keep_alive(false);
  ApplyCors(res);
  res.body() = R"({"error":"Request body too large"})";
  res.prepare_payload();
  return res;
}

RegistrationHandler::Response RegistrationHandler::BadRequest(unsigned version) {
  Response res{beast_http::status::bad_request, version};
  res.set(beast_http::field::content_type, kJsonContentType);
  res.keep_alive(false);
  ApplyCors(res);
  res.body() = R"({"error":"Malformed HTTP request"})";
  res.prepare_payload();
  return res;
}

RegistrationHandler::Response RegistrationHandler::Ping(const Request& req) const {
  return MakeResponse(req, beast_http::status::ok, service_->Ping({}).message(), "text/plain; charset=utf-8");
}

RegistrationHandler::Response RegistrationHandler::ListRegistrations(const Request& req) const {
  try {
    return JsonResponse(req, beast_http::status::ok, ListBody(service_->List({})));
  } catch (const std::exception&) {
    // already logged by the service
    registry::v1::ErrorResponse body;
    body.set_success(false);
    body.set_error("Failed to fetch registrations");
    return JsonResponse(req, beast_http::status::internal_server_error, body);
  }
}

RegistrationHandler::Response RegistrationHandler::Submit(const Request& req) const {
  registry::v1::SubmitRequest submit;

  // an absent body is an empty object: every field reads as missing
  const std::string& body = req.body();
  if (body.find_first_not_of(" \t\r\n") != std::string::npos) {
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    auto status = google::protobuf::util::JsonStringToMessage(body, &submit, options);
    if (!status.ok()) {
      REGISTRY_LOG_INFO("Registration rejected", {StringField("reason", "invalid_json"), StringField("error", std::string(status.message()))});
      return ErrorJson(req, beast_http::status::bad_request, "Invalid JSON body");
    }
  }

  try {
    return JsonResponse(req, beast_http::status::ok, service_->Submit(submit));
  } catch (const std::exception& e) {
    return ErrorJson(req, ToHttpStatus(e), PublicMessage(e));
  }
}

} // namespace registry::http
