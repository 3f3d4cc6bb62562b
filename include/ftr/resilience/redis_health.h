#pragma once

#include <string>

namespace ftr::resilience {

struct RedisHealthResult {
  bool reachable{false};  // NOLINT(readability-identifier-naming)
  std::string error;      // NOLINT(readability-identifier-naming)
};

// redis_ping opens a direct connection and sends PING; used at startup before the shared
// rate limiter is wired in. Never throws.
[[nodiscard]] RedisHealthResult redis_ping(const std::string& uri);

}  // namespace ftr::resilience
