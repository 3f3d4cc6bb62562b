#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include "ftr/app/services.h"
#include "ftr/core/calendar.h"
#include "ftr/core/clock.h"
#include "ftr/core/id_generator.h"
#include "ftr/llm/mock_reasoning_provider.h"
#include "ftr/llm/reasoning_client.h"
#include "ftr/resilience/provider_registry.h"
#include "ftr/resilience/resilient_executor.h"
#include "ftr/storage/audit_log.h"
#include "ftr/storage/audit_recorder.h"
#include "ftr/storage/inmemory_repositories.h"

#include "mcp_protocol.h"
#include "server_context.h"
#include "server_loop.h"

#include <algorithm>
#include <sstream>

using namespace ftr;
using json = nlohmann::json;

namespace {

domain::Transaction txn(const std::string& id, const std::int64_t cents, const std::string& date,
                        const std::string& merchant_id) {
  domain::Transaction t;
  t.id = core::TransactionId{id};
  t.user_id = core::UserId{"user_001"};
  t.amount = core::Money{cents, "USD"};
  t.date = core::parse_iso_date(date).value();
  t.merchant_id = core::MerchantId{merchant_id};
  t.card_last4 = "4242";
  return t;
}

// Server wires the full tool surface over in-memory storage and a mock provider.
struct Server {
  Server() {
    REQUIRE(merchants
                .upsert(domain::Merchant{.id = core::MerchantId{"m-001"},
                                         .canonical_name = "Coffee Palace",
                                         .aliases = {"CP"}})
                .has_value());
    REQUIRE(merchants
                .upsert(domain::Merchant{.id = core::MerchantId{"m-002"},
                                         .canonical_name = "Tea House"})
                .has_value());
    REQUIRE(transactions.upsert(txn("txn-a", 1500, "2024-01-10", "m-001")).has_value());
    REQUIRE(transactions.upsert(txn("txn-b", 1500, "2024-01-12", "m-002")).has_value());
    REQUIRE(transactions.upsert(txn("txn-c", 4850, "2024-01-15", "m-001")).has_value());
  }

  core::SequentialIdGenerator ids;
  core::FixedClock clock{"2026-01-01T00:00:00Z"};
  storage::InMemoryTransactionRepository transactions;
  storage::InMemoryMerchantRepository merchants;
  storage::InMemoryDisputeStore disputes;
  storage::InMemoryAuditLog audit_log;
  matching::Ranker ranker;
  disambiguation::SessionRegistry sessions{clock};
  app::Services services{transactions, merchants, disputes, audit_log, ranker, sessions};

  resilience::NoJitter jitter;
  resilience::ProviderRegistry providers{resilience::ProviderSettings{}, clock};
  resilience::ResilientExecutor executor{providers, clock, jitter,
                                         storage::AuditRecorder(&audit_log, ids, clock)};
  llm::MockReasoningProvider provider;
  llm::ReasoningClient reasoning{provider, executor};
  server::ServerConfig config;
  server::ServerContext ctx{services, reasoning, providers, ids, clock, config};

  // run feeds the lines to the loop and returns one parsed response per output line.
  std::vector<json> run(const std::vector<std::string>& lines) {
    std::stringstream in;
    for (const auto& line : lines) {
      in << line << "\n";
    }
    std::stringstream out;
    server::run_server_loop(ctx, in, out);

    std::vector<json> responses;
    std::string line;
    while (std::getline(out, line)) {
      responses.push_back(json::parse(line));
    }
    return responses;
  }
};

std::string call(int id, const std::string& tool, const json& arguments) {
  return json{{"jsonrpc", "2.0"},
              {"id", id},
              {"method", "tools/call"},
              {"params", {{"name", tool}, {"arguments", arguments}}}}
      .dump();
}

}  // namespace

TEST_CASE("server loop: initialize and tools/list", "[server][loop]") {
  Server s;
  const auto responses = s.run({
      R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})",
      R"({"jsonrpc":"2.0","method":"notifications/initialized"})",
      R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})",
      R"({"jsonrpc":"2.0","id":"p-1","method":"ping"})",
  });
  REQUIRE(responses.size() == 3);
  CHECK(responses[2]["id"] == "p-1");
  CHECK(responses[2]["result"].empty());

  CHECK(responses[0]["id"] == 1);
  CHECK(responses[0]["result"]["serverInfo"]["name"] == "fuzzy-txn-resolver");

  const auto& tools = responses[1]["result"]["tools"];
  REQUIRE(tools.size() == 11);
  std::vector<std::string> names;
  for (const auto& tool : tools) {
    names.push_back(tool["name"].get<std::string>());
    CHECK(tool["inputSchema"]["type"] == "object");
  }
  CHECK(std::find(names.begin(), names.end(), "resolve_transaction") != names.end());
  CHECK(std::find(names.begin(), names.end(), "provider_status") != names.end());
}

TEST_CASE("server loop: resolve, clarify and dispute over JSON-RPC", "[server][loop][scenario]") {
  Server s;
  const auto responses = s.run({
      call(1, "resolve_transaction", {{"session_id", "s-1"}, {"amount", "15.00"}}),
      call(2, "answer_clarification", {{"session_id", "s-1"}, {"rank", 1}}),
      call(3, "flag_dispute", {{"transaction_id", "txn-b"}, {"complaint", "Never visited"}}),
      call(4, "flag_dispute", {{"transaction_id", "txn-b"}, {"complaint", "Again"}}),
      call(5, "list_disputes", json::object()),
  });
  REQUIRE(responses.size() == 5);

  const auto& asked = responses[0]["result"];
  CHECK(asked["outcome"] == "ambiguous");
  CHECK(asked["session_state"] == "awaiting_clarification");
  REQUIRE(asked["clarification"]["options"].size() == 2);
  CHECK(asked["clarification"]["options"][0]["transaction_id"] == "txn-b");
  CHECK(asked["candidates"][0]["card"] == "****4242");

  const auto& answered = responses[1]["result"];
  CHECK(answered["outcome"] == "unique");
  CHECK(answered["best"]["transaction_id"] == "txn-b");
  CHECK(answered["session_state"] == "idle");

  CHECK(responses[2]["result"]["dispute_id"] == "dsp-0001");
  CHECK(responses[2]["result"]["status"] == "flagged");
  CHECK(responses[3]["result"]["error"]["kind"] == "conflict");
  CHECK(responses[4]["result"]["count"] == 1);
}

TEST_CASE("server loop: tool errors are reported in-band", "[server][loop][errors]") {
  Server s;
  const auto responses = s.run({
      call(1, "resolve_transaction", {{"amount", "15.00"}}),
      call(2, "resolve_transaction", {{"session_id", "s-1"}, {"date", "2024-13-01"}}),
      call(3, "answer_clarification", {{"session_id", "s-1"}, {"rank", 1}}),
      call(4, "no_such_tool", json::object()),
      call(5, "get_merchant", {{"merchant_id", "m-404"}}),
  });
  REQUIRE(responses.size() == 5);
  CHECK(responses[0]["result"]["error"]["kind"] == "invalid_params");
  CHECK(responses[1]["result"]["error"]["kind"] == "invalid_query");
  CHECK(responses[2]["result"]["error"]["kind"] == "stale_reference");
  CHECK(responses[3]["result"]["error"]["kind"] == "unknown_tool");
  CHECK(responses[4]["result"]["error"]["kind"] == "not_found");
}

TEST_CASE("server loop: protocol errors", "[server][loop][errors]") {
  Server s;
  const auto responses = s.run({
      "{broken",
      R"({"jsonrpc":"2.0","id":9,"method":"resources/list"})",
      R"({"jsonrpc":"2.0","method":"resources/list"})",
      "",
  });
  REQUIRE(responses.size() == 2);
  CHECK(responses[0]["id"].is_null());
  CHECK(responses[0]["error"]["code"] == server::kParseError);
  CHECK(responses[1]["id"] == 9);
  CHECK(responses[1]["error"]["code"] == server::kMethodNotFound);
}

TEST_CASE("server loop: reasoning provider and status tools", "[server][loop][resilience]") {
  Server s;
  const auto responses = s.run({
      call(1, "ask_reasoning_provider",
           {{"prompt", "which charge?"}, {"purpose", "clarification"}, {"trace_id", "t-1"}}),
      call(2, "provider_status", json::object()),
      call(3, "get_audit_trace", {{"trace_id", "t-1"}}),
  });
  REQUIRE(responses.size() == 3);
  CHECK(responses[0]["result"]["text"] == "[clarification] which charge?");
  CHECK(responses[0]["result"]["trace_id"] == "t-1");

  const auto& providers = responses[1]["result"]["providers"];
  REQUIRE(providers.size() == 1);
  CHECK(providers[0]["provider"] == "reasoning");
  CHECK(providers[0]["circuit"]["state"] == "closed");
  CHECK(providers[0]["rate_limit"]["backend"] == "memory");

  const auto& events = responses[2]["result"]["events"];
  REQUIRE(events.size() == 2);
  CHECK(events[0]["event_type"] == "ProviderCallAttempted");
  CHECK(events[1]["event_type"] == "ProviderCallSucceeded");
}
