#include "config.h"

#include <charconv>
#include <string_view>

namespace ftr::server {

namespace {

template <typename T>
std::optional<T> parse_number(const std::string_view text) {
  T value{};
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

std::string handle_db(ServerConfig& config, const std::string& value) {
  config.db_path = value;
  return "";
}

std::string handle_catalog(ServerConfig& config, const std::string& value) {
  config.catalog_dir = value;
  return "";
}

std::string handle_config(ServerConfig& config, const std::string& value) {
  config.config_path = value;
  return "";
}

std::string handle_redis(ServerConfig& config, const std::string& value) {
  config.redis_uri = value;
  return "";
}

std::string handle_amount_tolerance(ServerConfig& config, const std::string& value) {
  const auto parsed = parse_number<double>(value);
  if (!parsed.has_value()) {
    return "Invalid --amount-tolerance: " + value + " (expected a percentage, e.g. 10)";
  }
  config.overrides.amount_tolerance_percent = parsed;
  return "";
}

std::string handle_date_tolerance(ServerConfig& config, const std::string& value) {
  const auto parsed = parse_number<int>(value);
  if (!parsed.has_value()) {
    return "Invalid --date-tolerance: " + value + " (expected whole days)";
  }
  config.overrides.date_tolerance_days = parsed;
  return "";
}

std::string handle_rate_limit(ServerConfig& config, const std::string& value) {
  const auto parsed = parse_number<int>(value);
  if (!parsed.has_value()) {
    return "Invalid --rate-limit-rpm: " + value;
  }
  config.overrides.rate_limit_rpm = parsed;
  return "";
}

std::string handle_max_retries(ServerConfig& config, const std::string& value) {
  const auto parsed = parse_number<int>(value);
  if (!parsed.has_value()) {
    return "Invalid --max-retries: " + value;
  }
  config.overrides.max_retries = parsed;
  return "";
}

std::string handle_user(ServerConfig& config, const std::string& value) {
  config.overrides.default_user_id = value;
  return "";
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<apps::Option<ServerConfig>> build_option_registry() {
  return {
      {"--db", true, "Path to SQLite database file", handle_db},
      {"--catalog", true, "Directory with transactions.json and merchants.json to seed",
       handle_catalog},
      {"--config", true, "JSON engine configuration file", handle_config},
      {"--redis", true, "Redis URI for a rate limiter shared across processes", handle_redis},
      {"--amount-tolerance", true, "Amount tolerance in percent", handle_amount_tolerance},
      {"--date-tolerance", true, "Date tolerance in days", handle_date_tolerance},
      {"--rate-limit-rpm", true, "Provider requests per minute", handle_rate_limit},
      {"--max-retries", true, "Attempts per outbound call, including the first",
       handle_max_retries},
      {"--user", true, "User id tools act for when a call names none", handle_user},
  };
}

apps::ParsedOptions<ServerConfig> parse_args(int argc, char* argv[]) {
  return apps::parse_options<ServerConfig>(argc, argv, build_option_registry());
}

core::Result<config::EngineConfig, core::Error> resolve_engine_config(
    const ServerConfig& server_config, const config::EnvLookup& env) {
  using R = core::Result<config::EngineConfig, core::Error>;

  config::EngineConfig engine;
  if (server_config.config_path.has_value()) {
    auto loaded = config::load_config_file(server_config.config_path.value());
    if (!loaded.has_value()) {
      return R::err(loaded.error());
    }
    engine = loaded.value();
  }

  if (auto applied = config::apply_env_overrides(engine, env); !applied.has_value()) {
    return R::err(applied.error());
  }

  const CliOverrides& cli = server_config.overrides;
  if (cli.amount_tolerance_percent.has_value()) {
    engine.ranker.tolerance.amount_tolerance_percent = *cli.amount_tolerance_percent;
  }
  if (cli.date_tolerance_days.has_value()) {
    engine.ranker.tolerance.date_tolerance_days = *cli.date_tolerance_days;
  }
  if (cli.rate_limit_rpm.has_value()) {
    engine.provider.bucket = resilience::TokenBucketConfig::from_requests_per_minute(
        *cli.rate_limit_rpm, engine.provider.bucket.max_wait);
  }
  if (cli.max_retries.has_value()) {
    engine.provider.retry.max_attempts = *cli.max_retries;
  }
  if (cli.default_user_id.has_value()) {
    engine.default_user_id = *cli.default_user_id;
  }

  if (auto valid = config::validate_engine_config(engine); !valid.has_value()) {
    return R::err(valid.error());
  }
  return R::ok(std::move(engine));
}

}  // namespace ftr::server
