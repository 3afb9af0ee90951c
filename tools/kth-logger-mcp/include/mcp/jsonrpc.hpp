#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace kth::mcp {

constexpr const char* kJsonRpcVersion = "2.0";

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

struct JsonRpcError {
  int code;
  std::string message;
};

struct JsonRpcRequest {
  std::string method;
  nlohmann::json params;
  std::optional<nlohmann::json> id;

  [[nodiscard]] bool is_notification() const { return !id.has_value(); }
};

// Throws std::invalid_argument when the envelope is not a JSON-RPC 2.0 request.
JsonRpcRequest parse_request(const nlohmann::json& request);

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error);

}  // namespace kth::mcp
