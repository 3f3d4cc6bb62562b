#include "ftr/core/clock.h"
#include "ftr/disambiguation/session_registry.h"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

using namespace ftr;
using namespace std::chrono_literals;
using disambiguation::DisambiguationSession;
using disambiguation::SessionRegistry;

TEST_CASE("SessionRegistry creates a session on first use", "[disambiguation][registry]") {
  core::FixedClock clock{"2026-01-01T00:00:00Z"};
  SessionRegistry registry(clock);
  const core::SessionId id{"session-1"};
  CHECK_FALSE(registry.contains(id));

  const auto seen = registry.with_session(
      id, [](DisambiguationSession& session, const core::CancellationToken& token) {
        CHECK_FALSE(token.is_cancelled());
        return session.id().value;
      });
  CHECK(seen == "session-1");
  CHECK(registry.contains(id));
  CHECK(registry.size() == 1);
}

TEST_CASE("SessionRegistry keeps state between turns of one session",
          "[disambiguation][registry]") {
  core::FixedClock clock{"2026-01-01T00:00:00Z"};
  SessionRegistry registry(clock);
  const core::SessionId id{"session-1"};

  DisambiguationSession* first = nullptr;
  registry.with_session(id, [&first](DisambiguationSession& session, const core::CancellationToken&) {
    first = &session;
  });
  registry.with_session(id, [&first](DisambiguationSession& session, const core::CancellationToken&) {
    CHECK(&session == first);
  });
  CHECK(registry.size() == 1);
}

TEST_CASE("SessionRegistry end_session cancels and removes", "[disambiguation][registry]") {
  core::FixedClock clock{"2026-01-01T00:00:00Z"};
  SessionRegistry registry(clock);
  const core::SessionId id{"session-1"};

  core::CancellationToken captured;
  registry.with_session(id, [&captured](DisambiguationSession&, const core::CancellationToken& token) {
    captured = token;
  });
  CHECK_FALSE(captured.is_cancelled());

  CHECK(registry.end_session(id));
  CHECK(captured.is_cancelled());
  CHECK_FALSE(registry.contains(id));
  CHECK_FALSE(registry.end_session(id));

  // A new turn with the same id starts a fresh, uncancelled session.
  registry.with_session(id, [](DisambiguationSession& session, const core::CancellationToken& token) {
    CHECK_FALSE(token.is_cancelled());
    CHECK(session.state() == disambiguation::SessionState::kIdle);
  });
}

TEST_CASE("SessionRegistry end_session reaches a turn in progress", "[disambiguation][registry]") {
  core::FixedClock clock{"2026-01-01T00:00:00Z"};
  SessionRegistry registry(clock);
  const core::SessionId id{"session-1"};

  std::promise<void> started;
  auto started_future = started.get_future();
  std::atomic<bool> ended{false};

  auto turn = std::async(std::launch::async, [&] {
    return registry.with_session(
        id, [&](DisambiguationSession&, const core::CancellationToken& token) {
          started.set_value();
          while (!ended.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
          }
          return token.is_cancelled();
        });
  });

  started_future.wait();
  CHECK(registry.end_session(id));
  ended.store(true);
  CHECK(turn.get());
}

TEST_CASE("SessionRegistry serializes turns of the same session", "[disambiguation][registry]") {
  core::FixedClock clock{"2026-01-01T00:00:00Z"};
  SessionRegistry registry(clock);
  const core::SessionId id{"session-1"};

  std::atomic<int> inside{0};
  std::atomic<int> max_inside{0};
  int counter = 0;  // guarded by the session turn lock

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 50; ++i) {
        registry.with_session(id, [&](DisambiguationSession&, const core::CancellationToken&) {
          const int now_inside = ++inside;
          int observed = max_inside.load();
          while (now_inside > observed && !max_inside.compare_exchange_weak(observed, now_inside)) {
          }
          ++counter;
          --inside;
        });
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  CHECK(max_inside.load() == 1);
  CHECK(counter == 400);
}

TEST_CASE("SessionRegistry runs different sessions independently", "[disambiguation][registry]") {
  core::FixedClock clock{"2026-01-01T00:00:00Z"};
  SessionRegistry registry(clock);

  std::promise<void> holding;
  std::promise<void> release;
  auto holding_future = holding.get_future();
  auto release_future = release.get_future().share();

  auto blocked = std::async(std::launch::async, [&] {
    registry.with_session(core::SessionId{"session-a"},
                          [&](DisambiguationSession&, const core::CancellationToken&) {
                            holding.set_value();
                            release_future.wait();
                          });
  });

  holding_future.wait();
  // session-b must not wait for session-a's turn.
  const bool ran = registry.with_session(
      core::SessionId{"session-b"},
      [](DisambiguationSession&, const core::CancellationToken&) { return true; });
  CHECK(ran);
  release.set_value();
  blocked.get();
  CHECK(registry.size() == 2);
}

TEST_CASE("SessionRegistry evicts sessions idle longer than max_age",
          "[disambiguation][registry][expiry]") {
  core::FixedClock clock{"2026-01-01T00:00:00Z"};
  SessionRegistry registry(clock, disambiguation::DisambiguationPolicy{1, 600s});
  const core::SessionId stale{"session-stale"};
  const core::SessionId recent{"session-recent"};

  core::CancellationToken stale_token;
  registry.with_session(stale, [&](DisambiguationSession&, const core::CancellationToken& token) {
    stale_token = token;
  });
  clock.advance(400s);
  registry.with_session(recent, [](DisambiguationSession&, const core::CancellationToken&) {});
  CHECK(registry.size() == 2);

  // 601 s after the stale session's last turn, 201 s after the recent one's.
  clock.advance(201s);
  registry.with_session(core::SessionId{"session-new"},
                        [](DisambiguationSession&, const core::CancellationToken&) {});
  CHECK_FALSE(registry.contains(stale));
  CHECK(stale_token.is_cancelled());
  CHECK(registry.contains(recent));
  CHECK(registry.size() == 2);
}

TEST_CASE("SessionRegistry keeps an idle session that is being acquired",
          "[disambiguation][registry][expiry]") {
  core::FixedClock clock{"2026-01-01T00:00:00Z"};
  SessionRegistry registry(clock, disambiguation::DisambiguationPolicy{1, 600s});
  const core::SessionId id{"session-1"};

  DisambiguationSession* first = nullptr;
  registry.with_session(id, [&first](DisambiguationSession& session, const core::CancellationToken&) {
    first = &session;
  });
  clock.advance(3600s);
  registry.with_session(id, [&first](DisambiguationSession& session, const core::CancellationToken& token) {
    CHECK(&session == first);
    CHECK_FALSE(token.is_cancelled());
  });
  CHECK(registry.size() == 1);
}

TEST_CASE("SessionRegistry does not evict a session whose turn is running",
          "[disambiguation][registry][expiry]") {
  core::FixedClock clock{"2026-01-01T00:00:00Z"};
  SessionRegistry registry(clock, disambiguation::DisambiguationPolicy{1, 600s});
  const core::SessionId busy{"session-busy"};

  registry.with_session(busy, [&](DisambiguationSession&, const core::CancellationToken& token) {
    clock.advance(3600s);
    registry.with_session(core::SessionId{"session-other"},
                          [](DisambiguationSession&, const core::CancellationToken&) {});
    CHECK_FALSE(token.is_cancelled());
  });
  CHECK(registry.contains(busy));
}
