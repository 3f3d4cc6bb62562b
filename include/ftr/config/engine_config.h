#pragma once

#include "ftr/core/error.h"
#include "ftr/core/result.h"
#include "ftr/disambiguation/disambiguation_session.h"
#include "ftr/matching/ranker.h"
#include "ftr/resilience/provider_registry.h"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>

namespace ftr::config {

// EngineConfig gathers every tunable of the resolution engine and of the outbound-call guards.
// Every field has an explicit default.
struct EngineConfig {
  matching::RankerConfig ranker;
  disambiguation::DisambiguationPolicy disambiguation;
  resilience::ProviderSettings provider;
  std::string default_currency{"USD"};
  std::string default_user_id{"user_001"};
};

// validate_engine_config checks every range constraint; the first violation is returned as
// ErrorKind::kInvalidConfig.
[[nodiscard]] core::Result<bool, core::Error> validate_engine_config(const EngineConfig& config);

// to_json renders the full configuration. nlohmann::json objects are std::map backed, so the
// dump is key-sorted and stable across runs.
[[nodiscard]] nlohmann::json to_json(const EngineConfig& config);

// apply_json overlays the keys present in `j` onto `config`; absent keys keep their value.
// A key of the wrong type is kInvalidConfig.
[[nodiscard]] core::Result<bool, core::Error> apply_json(EngineConfig& config,
                                                         const nlohmann::json& j);

// load_config_file reads a JSON file over the defaults.
[[nodiscard]] core::Result<EngineConfig, core::Error> load_config_file(const std::string& path);

using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

// apply_env_overrides reads the FTR_* variables:
//   FTR_AMOUNT_TOLERANCE_PERCENT  FTR_DATE_TOLERANCE_DAYS  FTR_ACCEPTANCE_THRESHOLD
//   FTR_AMBIGUITY_EPSILON         FTR_MAX_CANDIDATES       FTR_RATE_LIMIT_RPM
//   FTR_RATE_LIMIT_MAX_WAIT_MS    FTR_CIRCUIT_BREAKER_THRESHOLD
//   FTR_CIRCUIT_OPEN_SECONDS      FTR_MAX_RETRIES          FTR_RETRY_BASE_DELAY_MS
//   FTR_DEFAULT_CURRENCY          FTR_DEFAULT_USER_ID
// A variable that does not parse as the expected number is kInvalidConfig naming it.
[[nodiscard]] core::Result<bool, core::Error> apply_env_overrides(EngineConfig& config,
                                                                  const EnvLookup& lookup);

// process_env looks variables up in the process environment.
[[nodiscard]] EnvLookup process_env();

}  // namespace ftr::config
