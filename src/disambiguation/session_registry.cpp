#include "ftr/disambiguation/session_registry.h"

namespace ftr::disambiguation {

std::shared_ptr<SessionRegistry::Slot> SessionRegistry::acquire_slot(const core::SessionId& id) {
  const core::Instant now = clock_.now();
  std::lock_guard<std::mutex> lock(mutex_);
  evict_idle_locked(id, now);
  auto it = slots_.find(id);
  if (it == slots_.end()) {
    it = slots_.emplace(id, std::make_shared<Slot>(id, policy_)).first;
  }
  it->second->last_used = now;
  return it->second;
}

void SessionRegistry::evict_idle_locked(const core::SessionId& keep, const core::Instant now) {
  for (auto it = slots_.begin(); it != slots_.end();) {
    // use_count() == 1: only the map holds the slot, so no turn is running or waiting.
    const bool idle = it->first != keep && it->second.use_count() == 1 &&
                      now - it->second->last_used > policy_.max_age;
    if (idle) {
      it->second->cancellation.cancel();
      it = slots_.erase(it);
    } else {
      ++it;
    }
  }
}

bool SessionRegistry::end_session(const core::SessionId& id) {
  std::shared_ptr<Slot> slot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = slots_.find(id);
    if (it == slots_.end()) {
      return false;
    }
    slot = std::move(it->second);
    slots_.erase(it);
  }
  // A turn still holding the slot keeps it alive through its shared_ptr.
  slot->cancellation.cancel();
  return true;
}

bool SessionRegistry::contains(const core::SessionId& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return slots_.find(id) != slots_.end();
}

std::size_t SessionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return slots_.size();
}

}  // namespace ftr::disambiguation
