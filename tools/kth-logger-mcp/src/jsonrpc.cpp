#include "mcp/jsonrpc.hpp"

#include <stdexcept>

namespace kth::mcp {

namespace {

nlohmann::json require_valid_id(const nlohmann::json& id) {
  if (id.is_null() || id.is_string() || id.is_number_integer() || id.is_number_unsigned()) {
    return id;
  }
  throw std::invalid_argument("id must be a string, an integer or null");
}

}  // namespace

JsonRpcRequest parse_request(const nlohmann::json& request) {
  if (!request.is_object()) {
    throw std::invalid_argument("request must be a JSON object");
  }

  const auto version_it = request.find("jsonrpc");
  if (version_it == request.end() || !version_it->is_string() ||
      version_it->get_ref<const std::string&>() != kJsonRpcVersion) {
    throw std::invalid_argument("jsonrpc must be \"2.0\"");
  }

  const auto method_it = request.find("method");
  if (method_it == request.end() || !method_it->is_string() || method_it->get_ref<const std::string&>().empty()) {
    throw std::invalid_argument("method must be a non-empty string");
  }

  JsonRpcRequest parsed{.method = method_it->get<std::string>(), .params = nlohmann::json::object(), .id = std::nullopt};

  if (const auto params_it = request.find("params"); params_it != request.end()) {
    if (!params_it->is_object()) {
      throw std::invalid_argument("params must be an object");
    }
    parsed.params = *params_it;
  }

  if (const auto id_it = request.find("id"); id_it != request.end()) {
    parsed.id = require_valid_id(*id_it);
  }

  return parsed;
}

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion},
                        {"id", id},
                        {"error", {{"code", error.code}, {"message", error.message}}}};
}

}  // namespace kth::mcp
