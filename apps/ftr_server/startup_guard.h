#pragma once

#include "config.h"
#include <string>

namespace ftr::server {

// validate_server_config checks startup preconditions for the server.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - if redis_uri is present, parse_redis_uri() must succeed (format valid)
// - if config_path is present, the file must exist
// - if catalog_dir is present, it must be a directory holding both transactions.json and
//   merchants.json
[[nodiscard]] std::string validate_server_config(const ServerConfig& config);

}  // namespace ftr::server
