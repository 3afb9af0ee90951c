#include <iostream>

#include "mcp/server.hpp"
#include "mcp/tools.hpp"

int main() {
  kth::mcp::Server server(kth::mcp::build_tool_registry(kth::mcp::load_tool_settings()));
  return server.run(std::cin, std::cout, std::cerr);
}
