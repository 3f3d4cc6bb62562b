#include "mcp_protocol.h"

namespace ftr::server {

using json = nlohmann::json;

std::optional<JsonRpcRequest> parse_request(const std::string& json_str) {
  const json parsed = json::parse(json_str, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return std::nullopt;
  }

  JsonRpcRequest request;
  if (const auto it = parsed.find("jsonrpc"); it != parsed.end() && it->is_string()) {
    request.jsonrpc = it->get<std::string>();
  }
  if (const auto it = parsed.find("id"); it != parsed.end() && (it->is_string() || it->is_number())) {
    request.id = *it;
  }
  if (const auto it = parsed.find("method"); it != parsed.end() && it->is_string()) {
    request.method = it->get<std::string>();
  }
  if (const auto it = parsed.find("params"); it != parsed.end() && it->is_object()) {
    request.params = *it;
  } else {
    request.params = json::object();
  }
  return request;
}

std::string make_response(const std::optional<json>& id, const json& result) {
  json response;
  response["jsonrpc"] = "2.0";
  response["id"] = id.has_value() ? id.value() : json(nullptr);
  response["result"] = result;
  return response.dump();
}

std::string make_error_response(const std::optional<json>& id, int code,
                                const std::string& message, const json& data) {
  json response;
  response["jsonrpc"] = "2.0";
  response["id"] = id.has_value() ? id.value() : json(nullptr);
  response["error"] = {
      {"code", code},
      {"message", message},
      {"data", data},
  };
  return response.dump();
}

}  // namespace ftr::server
