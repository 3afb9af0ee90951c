#include "mcp/server.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "device/registers.hpp"
#include "sinks/csv_log.hpp"

namespace kth::mcp {

namespace {

constexpr const char* kRegistersUri = "kth://registers";
constexpr const char* kLogSchemaUri = "kth://log/schema";

class MethodNotFound : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

nlohmann::json register_table() {
  nlohmann::json registers = nlohmann::json::array();
  for (const auto& spec : kth_logger::device::kSensorSpecs) {
    registers.push_back({{"id", std::string(kth_logger::device::sensor_name(spec.id))},
                         {"command", spec.command},
                         {"width", spec.width},
                         {"scale", spec.scale},
                         {"unit", std::string(spec.unit)},
                         {"signed", spec.is_signed}});
  }
  return registers;
}

}  // namespace

Server::Server(ToolRegistry tools) : tools_(std::move(tools)) {}

int Server::run(std::istream& in, std::ostream& out, std::ostream& err) const {
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }

    const auto response = handle_line(line, err);
    if (!response.is_null()) {
      out << response.dump() << '\n';
      out.flush();
    }
  }

  return 0;
}

nlohmann::json Server::handle_line(const std::string& line, std::ostream& err) const {
  nlohmann::json request;
  try {
    request = nlohmann::json::parse(line);
  } catch (const nlohmann::json::parse_error& ex) {
    err << "kth-logger-mcp: unparsable request: " << ex.what() << '\n';
    return make_error_response(nullptr, JsonRpcError{.code = kParseError, .message = "parse error"});
  }

  JsonRpcRequest parsed;
  try {
    parsed = parse_request(request);
  } catch (const std::invalid_argument& ex) {
    const nlohmann::json id = request.is_object() && request.contains("id") ? request["id"] : nlohmann::json();
    return make_error_response(id, JsonRpcError{.code = kInvalidRequest, .message = ex.what()});
  }

  const nlohmann::json id = parsed.id.value_or(nullptr);
  try {
    auto result = dispatch(parsed);
    if (parsed.is_notification()) {
      return nullptr;
    }
    return make_result_response(id, result);
  } catch (const MethodNotFound& ex) {
    if (parsed.is_notification()) {
      return nullptr;
    }
    return make_error_response(id, JsonRpcError{.code = kMethodNotFound, .message = ex.what()});
  } catch (const std::invalid_argument& ex) {
    if (parsed.is_notification()) {
      return nullptr;
    }
    return make_error_response(id, JsonRpcError{.code = kInvalidParams, .message = ex.what()});
  } catch (const std::exception& ex) {
    err << "kth-logger-mcp: " << parsed.method << " failed: " << ex.what() << '\n';
    if (parsed.is_notification()) {
      return nullptr;
    }
    return make_error_response(id, JsonRpcError{.code = kInternalError, .message = ex.what()});
  }
}

nlohmann::json Server::dispatch(const JsonRpcRequest& request) const {
  if (request.method == "initialize") {
    return handle_initialize(request.params);
  }
  if (request.method == "notifications/initialized" || request.method == "ping") {
    return nlohmann::json::object();
  }
  if (request.method == "tools/list") {
    return handle_tools_list();
  }
  if (request.method == "tools/call") {
    return handle_tools_call(request.params);
  }
  if (request.method == "resources/list") {
    return handle_resources_list();
  }
  if (request.method == "resources/read") {
    return handle_resources_read(request.params);
  }
  throw MethodNotFound("method not found: " + request.method);
}

nlohmann::json Server::handle_initialize(const nlohmann::json& params) const {
  const auto version = params.value("protocolVersion", std::string("2024-11-05"));
  return nlohmann::json{{"protocolVersion", version},
                        {"serverInfo", {{"name", "kth-logger-mcp"}, {"version", "0.1.0"}}},
                        {"capabilities",
                         {{"tools", nlohmann::json::object()}, {"resources", nlohmann::json::object()}}}};
}

nlohmann::json Server::handle_tools_list() const {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto& [_, tool] : tools_) {
    tools.push_back({{"name", tool.name}, {"description", tool.description}, {"inputSchema", tool.input_schema}});
  }
  return nlohmann::json{{"tools", tools}};
}

nlohmann::json Server::handle_tools_call(const nlohmann::json& params) const {
  const auto name_it = params.find("name");
  if (name_it == params.end() || !name_it->is_string()) {
    throw std::invalid_argument("name must be a string");
  }

  nlohmann::json arguments = nlohmann::json::object();
  if (const auto args_it = params.find("arguments"); args_it != params.end()) {
    if (!args_it->is_object()) {
      throw std::invalid_argument("arguments must be an object");
    }
    arguments = *args_it;
  }

  const auto tool_it = tools_.find(name_it->get<std::string>());
  if (tool_it == tools_.end()) {
    throw std::invalid_argument("unknown tool: " + name_it->get<std::string>());
  }

  const auto result = tool_it->second.handler(arguments);
  return nlohmann::json{{"content", nlohmann::json::array({{{"type", "text"}, {"text", result.dump()}}})},
                        {"structuredContent", result}};
}

nlohmann::json Server::handle_resources_list() const {
  return nlohmann::json{
      {"resources", nlohmann::json::array({{{"uri", kRegistersUri},
                                             {"name", "KTH-USB registers"},
                                             {"description", "Command byte, width, scale and unit per sensor"},
                                             {"mimeType", "application/json"}},
                                            {{"uri", kLogSchemaUri},
                                             {"name", "Reading log schema"},
                                             {"description", "Columns of the persisted CSV log"},
                                             {"mimeType", "application/json"}}})}};
}

nlohmann::json Server::handle_resources_read(const nlohmann::json& params) const {
  const auto uri_it = params.find("uri");
  if (uri_it == params.end() || !uri_it->is_string()) {
    throw std::invalid_argument("uri must be a string");
  }

  const auto& uri = uri_it->get_ref<const std::string&>();
  nlohmann::json contents;
  if (uri == kRegistersUri) {
    contents = nlohmann::json{{"registers", register_table()}};
  } else if (uri == kLogSchemaUri) {
    contents = nlohmann::json{{"header", kth_logger::sinks::kCsvHeader},
                              {"timestamp_format", "YYYY-MM-DDTHH:MM:SS.ffffffZ"}};
  } else {
    throw std::invalid_argument("unknown resource uri: " + uri);
  }

  return nlohmann::json{
      {"contents",
       nlohmann::json::array({{{"uri", uri}, {"mimeType", "application/json"}, {"text", contents.dump()}}})}};
}

}  // namespace kth::mcp
