#include "ftr/core/cancellation.h"
#include "ftr/core/clock.h"
#include "ftr/core/error.h"
#include "ftr/core/id_generator.h"
#include "ftr/core/ids.h"
#include "ftr/core/normalization.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>

using namespace ftr::core;

TEST_CASE("normalize_name_key trims, lowercases and collapses whitespace", "[core][normalization]") {
  CHECK(normalize_name_key("  Coffee   PALACE ") == "coffee palace");
  CHECK(normalize_name_key("coffee\tpalace") == "coffee palace");
  CHECK(normalize_name_key("") == "");
  CHECK(normalize_name_key("   ") == "");
}

TEST_CASE("contains_name_key matches on normalized keys", "[core][normalization]") {
  CHECK(contains_name_key("SQ *COFFEE PALACE #12", "coffee palace"));
  CHECK_FALSE(contains_name_key("Coffee Palace", "tea"));
  CHECK_FALSE(contains_name_key("Coffee Palace", "  "));
}

TEST_CASE("trim leaves inner whitespace intact", "[core][normalization]") {
  CHECK(trim("  a b  ") == "a b");
  CHECK(trim("\n\r") == "");
}

TEST_CASE("SequentialIdGenerator counts each prefix separately", "[core][ids]") {
  SequentialIdGenerator gen;
  CHECK(new_dispute_id(gen).value == "dsp-0001");
  CHECK(new_trace_id(gen).value == "trace-0001");
  CHECK(new_dispute_id(gen).value == "dsp-0002");
  CHECK(new_session_id(gen).value == "session-0001");
}

TEST_CASE("SystemIdGenerator ids are prefixed and distinct", "[core][ids]") {
  SystemIdGenerator gen;
  const auto a = gen.next("trace");
  const auto b = gen.next("trace");
  CHECK(a.rfind("trace-", 0) == 0);
  CHECK(a != b);
}

TEST_CASE("FixedClock sleep_for advances the simulated timeline", "[core][clock]") {
  FixedClock clock("2026-01-01T00:00:00Z");
  const auto start = clock.now();
  clock.sleep_for(std::chrono::milliseconds(250));
  clock.advance(std::chrono::seconds(1));
  CHECK(clock.now() - start == std::chrono::milliseconds(1250));
  CHECK(clock.total_slept() == std::chrono::milliseconds(250));
  CHECK(clock.now_iso8601() == "2026-01-01T00:00:00Z");
}

TEST_CASE("CancellationToken observes its source", "[core][cancellation]") {
  CancellationSource source;
  const auto token = source.token();
  CHECK_FALSE(token.is_cancelled());
  source.cancel();
  CHECK(token.is_cancelled());
  CHECK_FALSE(CancellationToken{}.is_cancelled());
}

TEST_CASE("ErrorKind names and resilience classification", "[core][error]") {
  CHECK(to_string(ErrorKind::kStaleReference) == "stale_reference");
  CHECK(to_string(ErrorKind::kRetriesExhausted) == "retries_exhausted");
  CHECK(is_resilience_error(ErrorKind::kCircuitOpen));
  CHECK(is_resilience_error(ErrorKind::kCancelled));
  CHECK_FALSE(is_resilience_error(ErrorKind::kInvalidQuery));
  CHECK_FALSE(is_resilience_error(ErrorKind::kNotFound));
}
