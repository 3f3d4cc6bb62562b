#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace ftr::server {

// JSON-RPC 2.0 message types
struct JsonRpcRequest {
  std::string jsonrpc{"2.0"};  // NOLINT(readability-identifier-naming)
  // The request id exactly as sent (string or number); absent for notifications.
  std::optional<nlohmann::json> id;  // NOLINT(readability-identifier-naming)
  std::string method;                // NOLINT(readability-identifier-naming)
  nlohmann::json params;             // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool is_notification() const { return !id.has_value(); }
};

// JSON-RPC 2.0 error codes
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

// Parse JSON-RPC request from one line. nullopt for malformed JSON or a non-object.
std::optional<JsonRpcRequest> parse_request(const std::string& json_str);

// Create JSON-RPC success response
std::string make_response(const std::optional<nlohmann::json>& id, const nlohmann::json& result);

// Create JSON-RPC error response
std::string make_error_response(const std::optional<nlohmann::json>& id, int code,
                                const std::string& message,
                                const nlohmann::json& data = nlohmann::json::object());

}  // namespace ftr::server
