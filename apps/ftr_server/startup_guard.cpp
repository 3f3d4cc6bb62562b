#include "startup_guard.h"

#include "ftr/resilience/redis_config.h"

#include <filesystem>
#include <system_error>

namespace ftr::server {

std::string validate_server_config(const ServerConfig& config) {
  // Validate Redis URI format before attempting to connect.
  if (config.redis_uri.has_value() &&
      !resilience::parse_redis_uri(config.redis_uri.value()).has_value()) {
    return "Error: --redis URI '" + config.redis_uri.value() +
           "' is not a valid Redis URI.\n"
           "       Accepted formats: tcp://host:port, redis://host:port, tcp://host, "
           "redis://host:port/N";
  }

  std::error_code ec;
  if (config.config_path.has_value() &&
      !std::filesystem::is_regular_file(config.config_path.value(), ec)) {
    return "Error: --config file '" + config.config_path.value() + "' does not exist.";
  }

  if (config.catalog_dir.has_value()) {
    const std::filesystem::path dir(config.catalog_dir.value());
    if (!std::filesystem::is_directory(dir, ec)) {
      return "Error: --catalog '" + config.catalog_dir.value() + "' is not a directory.";
    }
    for (const char* file : {"transactions.json", "merchants.json"}) {
      if (!std::filesystem::is_regular_file(dir / file, ec)) {
        return "Error: --catalog directory is missing " + std::string{file} + ".";
      }
    }
  }

  return "";
}

}  // namespace ftr::server
