#pragma once

#include "ftr/core/cancellation.h"
#include "ftr/core/clock.h"
#include "ftr/core/ids.h"
#include "ftr/disambiguation/disambiguation_session.h"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

namespace ftr::disambiguation {

// SessionRegistry owns every live DisambiguationSession.
//
// Two locks with different scopes:
// - the registry mutex guards only the map (lookup, creation, teardown);
// - each slot has its own mutex held for the whole turn, so turns of one session run
//   strictly one after another while different sessions proceed in parallel.
//
// end_session() cancels the slot's CancellationSource before dropping it, so an outbound
// call still running inside that session's turn observes the cancellation.
//
// A session whose last turn is older than policy.max_age and that no turn currently holds
// is evicted the next time another session is acquired.
class SessionRegistry {
 public:
  explicit SessionRegistry(core::IClock& clock,
                           DisambiguationPolicy policy = DisambiguationPolicy{})
      : clock_(clock), policy_(policy) {}

  SessionRegistry(const SessionRegistry&) = delete;
  SessionRegistry& operator=(const SessionRegistry&) = delete;
  SessionRegistry(SessionRegistry&&) = delete;
  SessionRegistry& operator=(SessionRegistry&&) = delete;
  ~SessionRegistry() = default;

  // with_session runs fn(DisambiguationSession&, core::CancellationToken) under the session's
  // turn lock, creating the session on first use.
  template <typename Fn>
  auto with_session(const core::SessionId& id, Fn&& fn) {
    const std::shared_ptr<Slot> slot = acquire_slot(id);
    std::lock_guard<std::mutex> turn_lock(slot->turn_mutex);
    return std::forward<Fn>(fn)(slot->session, slot->cancellation.token());
  }

  // end_session cancels in-flight work and discards the session.
  // Returns false if the session did not exist.
  bool end_session(const core::SessionId& id);

  [[nodiscard]] bool contains(const core::SessionId& id) const;
  [[nodiscard]] std::size_t size() const;

 private:
  struct Slot {
    explicit Slot(core::SessionId id, DisambiguationPolicy policy)
        : session(std::move(id), policy) {}

    std::mutex turn_mutex;
    DisambiguationSession session;
    core::CancellationSource cancellation;
    core::Instant last_used;  // guarded by the registry mutex
  };

  std::shared_ptr<Slot> acquire_slot(const core::SessionId& id);
  void evict_idle_locked(const core::SessionId& keep, core::Instant now);

  core::IClock& clock_;
  DisambiguationPolicy policy_;
  mutable std::mutex mutex_;
  std::map<core::SessionId, std::shared_ptr<Slot>> slots_;
};

}  // namespace ftr::disambiguation
