#include "ftr/config/engine_config.h"

#include <charconv>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <string_view>
#include <type_traits>

namespace ftr::config {

namespace {

using json = nlohmann::json;
using R = core::Result<bool, core::Error>;

core::Error invalid(const std::string& message) {
  return core::make_error(core::ErrorKind::kInvalidConfig, message);
}

template <typename T>
std::optional<T> parse_number(const std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  T value{};
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

// ────────────────────────────────────────────────────────────────
// JSON overlay helpers
// ────────────────────────────────────────────────────────────────

// read_field assigns j[key] to out when present. Returns false on a type mismatch, including
// a negative value for an unsigned target.
template <typename T>
bool read_field(const json& j, const char* key, T& out) {
  const auto it = j.find(key);
  if (it == j.end()) {
    return true;
  }
  if constexpr (std::is_same_v<T, std::string>) {
    if (!it->is_string()) {
      return false;
    }
  } else if constexpr (std::is_integral_v<T>) {
    if (!it->is_number_integer()) {
      return false;
    }
    if constexpr (std::is_unsigned_v<T>) {
      // A negative integer would wrap around on conversion.
      if (!it->is_number_unsigned()) {
        return false;
      }
    }
  } else {
    if (!it->is_number()) {
      return false;
    }
  }
  out = it->get<T>();
  return true;
}

template <typename Rep, typename Period>
bool read_duration(const json& j, const char* key, std::chrono::duration<Rep, Period>& out) {
  Rep count = out.count();
  if (!read_field(j, key, count)) {
    return false;
  }
  out = std::chrono::duration<Rep, Period>{count};
  return true;
}

R apply_matching(matching::RankerConfig& ranker, const json& j) {
  std::size_t max_candidates = ranker.max_candidates;
  const bool ok = read_field(j, "acceptance_threshold", ranker.acceptance_threshold) &&
                  read_field(j, "ambiguity_epsilon", ranker.ambiguity_epsilon) &&
                  read_field(j, "amount_tolerance_percent",
                             ranker.tolerance.amount_tolerance_percent) &&
                  read_field(j, "date_tolerance_days", ranker.tolerance.date_tolerance_days) &&
                  read_field(j, "max_candidates", max_candidates);
  if (!ok) {
    return R::err(invalid("matching: field has the wrong type"));
  }
  ranker.max_candidates = max_candidates;

  if (const auto it = j.find("weights"); it != j.end()) {
    if (!it->is_object() || !read_field(*it, "amount", ranker.weights.amount) ||
        !read_field(*it, "date", ranker.weights.date) ||
        !read_field(*it, "merchant", ranker.weights.merchant)) {
      return R::err(invalid("matching.weights: field has the wrong type"));
    }
  }
  return R::ok(true);
}

R apply_resilience(resilience::ProviderSettings& provider, const json& j) {
  const bool ok = read_field(j, "circuit_failure_threshold", provider.breaker.failure_threshold) &&
                  read_duration(j, "circuit_open_ms", provider.breaker.open_duration) &&
                  read_field(j, "rate_limit_capacity", provider.bucket.capacity) &&
                  read_field(j, "rate_limit_refill_per_second", provider.bucket.refill_per_second) &&
                  read_duration(j, "rate_limit_max_wait_ms", provider.bucket.max_wait) &&
                  read_field(j, "retry_max_attempts", provider.retry.max_attempts) &&
                  read_duration(j, "retry_base_delay_ms", provider.retry.base_delay) &&
                  read_duration(j, "retry_max_jitter_ms", provider.retry.max_jitter);
  if (!ok) {
    return R::err(invalid("resilience: field has the wrong type"));
  }
  return R::ok(true);
}

R apply_disambiguation(disambiguation::DisambiguationPolicy& policy, const json& j) {
  if (!read_field(j, "max_pending_turns", policy.max_pending_turns) ||
      !read_duration(j, "max_age_seconds", policy.max_age)) {
    return R::err(invalid("disambiguation: field has the wrong type"));
  }
  return R::ok(true);
}

}  // namespace

R validate_engine_config(const EngineConfig& config) {
  if (auto valid = matching::validate_ranker_config(config.ranker); !valid.has_value()) {
    return valid;
  }
  if (auto valid = disambiguation::validate_policy(config.disambiguation); !valid.has_value()) {
    return valid;
  }
  if (auto valid = resilience::validate_breaker_config(config.provider.breaker);
      !valid.has_value()) {
    return valid;
  }
  if (auto valid = resilience::validate_bucket_config(config.provider.bucket);
      !valid.has_value()) {
    return valid;
  }
  if (auto valid = resilience::validate_retry_policy(config.provider.retry); !valid.has_value()) {
    return valid;
  }
  if (config.default_currency.size() != 3) {
    return R::err(invalid("default_currency must be a 3-letter code"));
  }
  if (config.default_user_id.empty()) {
    return R::err(invalid("default_user_id must not be empty"));
  }
  return R::ok(true);
}

json to_json(const EngineConfig& config) {
  const auto& ranker = config.ranker;
  const auto& provider = config.provider;

  json j;
  j["default_currency"] = config.default_currency;
  j["default_user_id"] = config.default_user_id;
  j["disambiguation"] = {
      {"max_age_seconds", config.disambiguation.max_age.count()},
      {"max_pending_turns", config.disambiguation.max_pending_turns},
  };
  j["matching"] = {
      {"acceptance_threshold", ranker.acceptance_threshold},
      {"ambiguity_epsilon", ranker.ambiguity_epsilon},
      {"amount_tolerance_percent", ranker.tolerance.amount_tolerance_percent},
      {"date_tolerance_days", ranker.tolerance.date_tolerance_days},
      {"max_candidates", ranker.max_candidates},
      {"weights",
       {{"amount", ranker.weights.amount},
        {"date", ranker.weights.date},
        {"merchant", ranker.weights.merchant}}},
  };
  j["resilience"] = {
      {"circuit_failure_threshold", provider.breaker.failure_threshold},
      {"circuit_open_ms", provider.breaker.open_duration.count()},
      {"rate_limit_capacity", provider.bucket.capacity},
      {"rate_limit_max_wait_ms", provider.bucket.max_wait.count()},
      {"rate_limit_refill_per_second", provider.bucket.refill_per_second},
      {"retry_base_delay_ms", provider.retry.base_delay.count()},
      {"retry_max_attempts", provider.retry.max_attempts},
      {"retry_max_jitter_ms", provider.retry.max_jitter.count()},
  };
  return j;
}

R apply_json(EngineConfig& config, const json& j) {
  if (!j.is_object()) {
    return R::err(invalid("configuration must be a JSON object"));
  }
  if (!read_field(j, "default_currency", config.default_currency) ||
      !read_field(j, "default_user_id", config.default_user_id)) {
    return R::err(invalid("default_currency and default_user_id must be strings"));
  }

  const auto section = [&j](const char* key) -> const json* {
    const auto it = j.find(key);
    return it == j.end() ? nullptr : &*it;
  };

  if (const json* matching = section("matching")) {
    if (!matching->is_object()) {
      return R::err(invalid("matching must be an object"));
    }
    if (auto applied = apply_matching(config.ranker, *matching); !applied.has_value()) {
      return applied;
    }
  }
  if (const json* resilience = section("resilience")) {
    if (!resilience->is_object()) {
      return R::err(invalid("resilience must be an object"));
    }
    if (auto applied = apply_resilience(config.provider, *resilience); !applied.has_value()) {
      return applied;
    }
  }
  if (const json* disambiguation = section("disambiguation")) {
    if (!disambiguation->is_object()) {
      return R::err(invalid("disambiguation must be an object"));
    }
    if (auto applied = apply_disambiguation(config.disambiguation, *disambiguation);
        !applied.has_value()) {
      return applied;
    }
  }
  return R::ok(true);
}

core::Result<EngineConfig, core::Error> load_config_file(const std::string& path) {
  using ConfigResult = core::Result<EngineConfig, core::Error>;

  std::ifstream in(path);
  if (!in) {
    return ConfigResult::err(invalid("cannot open config file " + path));
  }
  const json j = json::parse(in, nullptr, false);
  if (j.is_discarded()) {
    return ConfigResult::err(invalid("config file " + path + " is not valid JSON"));
  }

  EngineConfig config;
  if (auto applied = apply_json(config, j); !applied.has_value()) {
    return ConfigResult::err(applied.error());
  }
  return ConfigResult::ok(std::move(config));
}

R apply_env_overrides(EngineConfig& config, const EnvLookup& lookup) {
  // number reads an optional numeric variable; a present but malformed one is an error.
  std::optional<core::Error> failure;
  const auto number = [&]<typename T>(const char* name, T& out) {
    if (failure.has_value()) {
      return false;
    }
    const auto raw = lookup(name);
    if (!raw.has_value()) {
      return false;
    }
    const auto parsed = parse_number<T>(*raw);
    if (!parsed.has_value()) {
      failure = invalid(std::string{name} + "='" + *raw + "' is not a valid number");
      return false;
    }
    out = *parsed;
    return true;
  };

  auto& ranker = config.ranker;
  auto& provider = config.provider;

  number("FTR_AMOUNT_TOLERANCE_PERCENT", ranker.tolerance.amount_tolerance_percent);
  number("FTR_DATE_TOLERANCE_DAYS", ranker.tolerance.date_tolerance_days);
  number("FTR_ACCEPTANCE_THRESHOLD", ranker.acceptance_threshold);
  number("FTR_AMBIGUITY_EPSILON", ranker.ambiguity_epsilon);
  number("FTR_MAX_CANDIDATES", ranker.max_candidates);

  long long max_wait_ms = provider.bucket.max_wait.count();
  if (number("FTR_RATE_LIMIT_MAX_WAIT_MS", max_wait_ms)) {
    provider.bucket.max_wait = std::chrono::milliseconds{max_wait_ms};
  }
  int rpm = 0;
  if (number("FTR_RATE_LIMIT_RPM", rpm)) {
    provider.bucket =
        resilience::TokenBucketConfig::from_requests_per_minute(rpm, provider.bucket.max_wait);
  }

  number("FTR_CIRCUIT_BREAKER_THRESHOLD", provider.breaker.failure_threshold);
  long long open_seconds = 0;
  if (number("FTR_CIRCUIT_OPEN_SECONDS", open_seconds)) {
    provider.breaker.open_duration = std::chrono::seconds{open_seconds};
  }

  number("FTR_MAX_RETRIES", provider.retry.max_attempts);
  long long base_delay_ms = 0;
  if (number("FTR_RETRY_BASE_DELAY_MS", base_delay_ms)) {
    provider.retry.base_delay = std::chrono::milliseconds{base_delay_ms};
  }

  if (failure.has_value()) {
    return R::err(*failure);
  }

  if (auto currency = lookup("FTR_DEFAULT_CURRENCY")) {
    config.default_currency = *currency;
  }
  if (auto user = lookup("FTR_DEFAULT_USER_ID")) {
    config.default_user_id = *user;
  }
  return R::ok(true);
}

EnvLookup process_env() {
  return [](const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string{value};
  };
}

}  // namespace ftr::config
