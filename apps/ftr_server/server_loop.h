#pragma once

#include "server_context.h"

#include <iosfwd>

namespace ftr::server {

// run_server_loop reads one JSON-RPC request per line from `in` and writes one response per
// line to `out` until end of input. Notifications get no response.
void run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out);

}  // namespace ftr::server
