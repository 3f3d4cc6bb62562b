#pragma once

#include "ftr/config/engine_config.h"
#include "ftr/core/error.h"
#include "ftr/core/result.h"

#include "../shared/arg_parser.h"

#include <optional>
#include <string>
#include <vector>

namespace ftr::server {

// CliOverrides are engine settings given on the command line. They are applied last, over
// the config file and the FTR_* environment.
struct CliOverrides {
  std::optional<double> amount_tolerance_percent;  // NOLINT(readability-identifier-naming)
  std::optional<int> date_tolerance_days;          // NOLINT(readability-identifier-naming)
  std::optional<int> rate_limit_rpm;               // NOLINT(readability-identifier-naming)
  std::optional<int> max_retries;                  // NOLINT(readability-identifier-naming)
  std::optional<std::string> default_user_id;      // NOLINT(readability-identifier-naming)
};

// ServerConfig holds all parsed startup flags for the server.
// Every field has an explicit default; optional fields mean "not configured".
struct ServerConfig {
  std::optional<std::string> db_path;      // NOLINT(readability-identifier-naming)
  std::optional<std::string> catalog_dir;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> config_path;  // NOLINT(readability-identifier-naming)
  // Shared rate limiter backend; the in-process bucket is used when absent.
  std::optional<std::string> redis_uri;  // NOLINT(readability-identifier-naming)
  CliOverrides overrides;                // NOLINT(readability-identifier-naming)

  // Filled by resolve_engine_config() once flags are parsed.
  config::EngineConfig engine;  // NOLINT(readability-identifier-naming)
};

[[nodiscard]] std::vector<apps::Option<ServerConfig>> build_option_registry();

[[nodiscard]] apps::ParsedOptions<ServerConfig> parse_args(
    int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// resolve_engine_config layers defaults, the --config file, the FTR_* environment and the
// command-line overrides, in that order, and validates the result.
[[nodiscard]] core::Result<config::EngineConfig, core::Error> resolve_engine_config(
    const ServerConfig& server_config, const config::EnvLookup& env);

}  // namespace ftr::server
