#pragma once

#include "ftr/app/services.h"
#include "ftr/core/clock.h"
#include "ftr/core/id_generator.h"
#include "ftr/llm/reasoning_client.h"
#include "ftr/resilience/provider_registry.h"

#include "config.h"

namespace ftr::server {

// ServerContext holds all process-lifetime service references passed to every tool handler.
// All references must remain valid for the lifetime of run_server_loop().
struct ServerContext {
  app::Services& services;                 // NOLINT(readability-identifier-naming)
  llm::ReasoningClient& reasoning;         // NOLINT(readability-identifier-naming)
  resilience::ProviderRegistry& providers;  // NOLINT(readability-identifier-naming)
  core::IIdGenerator& id_gen;              // NOLINT(readability-identifier-naming)
  core::IClock& clock;                     // NOLINT(readability-identifier-naming)
  const ServerConfig& config;              // NOLINT(readability-identifier-naming)
};

}  // namespace ftr::server
