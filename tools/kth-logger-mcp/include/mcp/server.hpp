#pragma once

#include <iosfwd>

#include "mcp/jsonrpc.hpp"
#include "mcp/tools.hpp"

namespace kth::mcp {

// Line-delimited JSON-RPC over a pair of streams.
class Server {
 public:
  explicit Server(ToolRegistry tools);

  int run(std::istream& in, std::ostream& out, std::ostream& err) const;

  // Returns a null json for notifications, which get no response.
  nlohmann::json handle_line(const std::string& line, std::ostream& err) const;

 private:
  nlohmann::json dispatch(const JsonRpcRequest& request) const;
  nlohmann::json handle_initialize(const nlohmann::json& params) const;
  nlohmann::json handle_tools_list() const;
  nlohmann::json handle_tools_call(const nlohmann::json& params) const;
  nlohmann::json handle_resources_list() const;
  nlohmann::json handle_resources_read(const nlohmann::json& params) const;

  ToolRegistry tools_;
};

}  // namespace kth::mcp
