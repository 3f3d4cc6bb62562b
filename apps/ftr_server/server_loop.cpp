#include "server_loop.h"

#include <nlohmann/json.hpp>

#include "mcp_protocol.h"
#include "method_handlers.h"
#include <iostream>
#include <string>

namespace ftr::server {

using json = nlohmann::json;

void run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out) {
  // Method registry
  const auto method_registry = build_method_registry();

  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }

    const auto request_opt = parse_request(line);
    if (!request_opt.has_value()) {
      out << make_error_response(std::nullopt, kParseError, "Invalid JSON") << "\n" << std::flush;
      continue;
    }

    const auto& request = request_opt.value();
    std::cerr << "Received: " << request.method << "\n";

    const auto it = method_registry.find(request.method);
    if (it == method_registry.end()) {
      if (!request.is_notification()) {
        out << make_error_response(request.id, kMethodNotFound,
                                   "Unknown method: " + request.method)
            << "\n"
            << std::flush;
      }
      continue;
    }

    const json result = it->second(request, ctx);
    if (!request.is_notification()) {
      out << make_response(request.id, result) << "\n" << std::flush;
    }
  }

  std::cerr << "Server shutting down\n";
}

}  // namespace ftr::server
