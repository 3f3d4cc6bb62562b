#include "ftr/app/app_service.h"
#include "ftr/app/services.h"
#include "ftr/config/engine_config.h"
#include "ftr/core/clock.h"
#include "ftr/core/id_generator.h"
#include "ftr/core/version.h"
#include "ftr/disambiguation/session_registry.h"
#include "ftr/llm/mock_reasoning_provider.h"
#include "ftr/llm/reasoning_client.h"
#include "ftr/matching/ranker.h"
#include "ftr/resilience/provider_registry.h"
#include "ftr/resilience/redis_config.h"
#include "ftr/resilience/redis_health.h"
#include "ftr/resilience/redis_token_bucket.h"
#include "ftr/resilience/resilient_executor.h"
#include "ftr/resilience/retry_policy.h"
#include "ftr/storage/audit_log.h"
#include "ftr/storage/audit_recorder.h"
#include "ftr/storage/catalog_loader.h"
#include "ftr/storage/inmemory_repositories.h"
#include "ftr/storage/sqlite/sqlite_audit_log.h"
#include "ftr/storage/sqlite/sqlite_db.h"
#include "ftr/storage/sqlite/sqlite_repositories.h"

#include "config.h"
#include "server_context.h"
#include "server_loop.h"
#include "startup_guard.h"
#include <iostream>
#include <memory>
#include <string>

using namespace ftr;

namespace {

// Repositories is whichever storage backend --db selected.
struct Repositories {
  std::unique_ptr<storage::ITransactionRepository> transactions;
  std::unique_ptr<storage::IMerchantRepository> merchants;
  std::unique_ptr<storage::IDisputeStore> disputes;
  std::unique_ptr<storage::IAuditLog> audit_log;
};

core::Result<Repositories, std::string> open_repositories(const server::ServerConfig& config) {
  using R = core::Result<Repositories, std::string>;

  Repositories repos;
  if (!config.db_path.has_value()) {
    repos.transactions = std::make_unique<storage::InMemoryTransactionRepository>();
    repos.merchants = std::make_unique<storage::InMemoryMerchantRepository>();
    repos.disputes = std::make_unique<storage::InMemoryDisputeStore>();
    repos.audit_log = std::make_unique<storage::InMemoryAuditLog>();
    return R::ok(std::move(repos));
  }

  auto db_result = storage::sqlite::SqliteDb::open(config.db_path.value());
  if (!db_result.has_value()) {
    return R::err("Failed to open database: " + db_result.error());
  }
  auto db = db_result.value();
  auto schema_result = db->ensure_schema_v1();
  if (!schema_result.has_value()) {
    return R::err("Failed to initialize schema: " + schema_result.error());
  }

  repos.transactions = std::make_unique<storage::sqlite::SqliteTransactionRepository>(db);
  repos.merchants = std::make_unique<storage::sqlite::SqliteMerchantRepository>(db);
  repos.disputes = std::make_unique<storage::sqlite::SqliteDisputeStore>(db);
  repos.audit_log = std::make_unique<storage::sqlite::SqliteAuditLog>(db);
  return R::ok(std::move(repos));
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Main
// ────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
  auto parsed = server::parse_args(argc, argv);
  if (parsed.help_requested) {
    std::cerr << apps::format_usage("ftr_server", server::build_option_registry());
    return 0;
  }
  if (!parsed.errors.empty()) {
    for (const auto& error : parsed.errors) {
      std::cerr << error << "\n";
    }
    return 1;
  }
  server::ServerConfig& config = parsed.config;

  // Validate config before emitting any startup output so no partial messages appear on error.
  const std::string config_error = server::validate_server_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  auto engine = server::resolve_engine_config(config, config::process_env());
  if (!engine.has_value()) {
    std::cerr << "Error: invalid engine configuration: " << engine.error().message << "\n";
    return 1;
  }
  config.engine = engine.value();

  // ── Startup diagnostic block ──────────────────────────────────────────────
  std::cerr << "fuzzy-txn-resolver server v" << core::kBuildVersion << "\n";

  if (config.db_path.has_value()) {
    std::cerr << "Storage:     SQLite -- " << config.db_path.value() << "\n";
  } else {
    std::cerr << "WARNING: No --db path specified. Running with EPHEMERAL in-memory storage.\n"
                 "         Disputes and the audit log will be LOST on process exit.\n"
                 "         Pass --db <path> to enable persistence.\n";
  }

  if (config.redis_uri.has_value()) {
    const auto redis_cfg = resilience::parse_redis_uri(config.redis_uri.value());
    std::cerr << "Rate limit:  Redis (shared) -- "
              << resilience::redis_config_to_log_string(redis_cfg.value()) << "\n";
  } else {
    std::cerr << "Rate limit:  in-process token bucket (per server process)\n";
  }

  const auto& ranker_cfg = config.engine.ranker;
  std::cerr << "Matching:    amount +/-" << ranker_cfg.tolerance.amount_tolerance_percent
            << "%, date +/-" << ranker_cfg.tolerance.date_tolerance_days
            << " days, threshold " << ranker_cfg.acceptance_threshold << ", epsilon "
            << ranker_cfg.ambiguity_epsilon << "\n";
  // ─────────────────────────────────────────────────────────────────────────

  core::SystemClock clock;
  core::SystemIdGenerator id_gen;

  auto repos_result = open_repositories(config);
  if (!repos_result.has_value()) {
    std::cerr << repos_result.error() << "\n";
    return 1;
  }
  Repositories repos = std::move(repos_result).value();

  if (config.catalog_dir.has_value()) {
    auto loaded = storage::load_catalog_dir(config.catalog_dir.value(), *repos.transactions,
                                            *repos.merchants);
    if (!loaded.has_value()) {
      std::cerr << "Error: failed to load catalog: " << loaded.error().message << "\n";
      return 1;
    }
    std::cerr << "Catalog:     " << loaded.value().merchants << " merchants, "
              << loaded.value().transactions << " transactions\n";
  } else if (!config.db_path.has_value()) {
    std::cerr << "WARNING: No --catalog given with in-memory storage. There are no transactions\n"
                 "         to resolve. Pass --catalog <dir> to seed the catalog.\n";
  }

  const matching::Ranker ranker(config.engine.ranker);
  disambiguation::SessionRegistry sessions(clock, config.engine.disambiguation);
  app::Services services{*repos.transactions, *repos.merchants, *repos.disputes,
                         *repos.audit_log,    ranker,           sessions};

  // Outbound calls: one registry of guards per provider, shared by every session.
  llm::MockReasoningProvider provider;
  resilience::ProviderRegistry providers(config.engine.provider, clock);
  if (config.redis_uri.has_value()) {
    const auto health = resilience::redis_ping(config.redis_uri.value());
    if (!health.reachable) {
      std::cerr << "Error: Redis is not reachable: " << health.error << "\n";
      return 1;
    }
    try {
      auto limiter = std::make_unique<resilience::RedisTokenBucket>(
          config.redis_uri.value(), provider.id(), config.engine.provider.bucket, clock);
      providers.configure(provider.id(), config.engine.provider, std::move(limiter));
    } catch (const std::exception& e) {
      std::cerr << "Failed to set up the Redis rate limiter: " << e.what() << "\n";
      return 1;
    }
  }

  resilience::RandomJitter jitter;
  const storage::AuditRecorder audit(repos.audit_log.get(), id_gen, clock);
  resilience::ResilientExecutor executor(providers, clock, jitter, audit);
  llm::ReasoningClient reasoning(provider, executor);

  const std::string config_trace = app::record_engine_config(config.engine, services, id_gen, clock);
  std::cerr << "Config:      recorded under trace " << config_trace << "\n";
  std::cerr << "Listening on stdio for JSON-RPC requests...\n";

  server::ServerContext ctx{services, reasoning, providers, id_gen, clock, config};
  server::run_server_loop(ctx, std::cin, std::cout);

  return 0;
}
