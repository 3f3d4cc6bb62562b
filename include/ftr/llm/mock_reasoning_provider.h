#pragma once

#include "ftr/llm/reasoning_provider.h"

#include <deque>
#include <functional>
#include <mutex>
#include <utility>
#include <string>

namespace ftr::llm {

// MockReasoningProvider replays scripted outcomes in order, then answers every further
// request with "[<purpose>] <prompt>". Thread-safe. Used by tests and by the server when no
// real provider is configured.
class MockReasoningProvider final : public IReasoningProvider {
 public:
  explicit MockReasoningProvider(core::ProviderId id = core::ProviderId{"reasoning"})
      : id_(std::move(id)) {}

  [[nodiscard]] core::ProviderId id() const override { return id_; }
  resilience::CallOutcome<std::string> complete(const ReasoningRequest& request) override;

  void enqueue(resilience::CallOutcome<std::string> outcome);

  // fail_next scripts `count` failures of the given kind ahead of any queued outcome.
  void fail_next(resilience::FailureKind kind, int count);

  // on_call runs inside every complete(), before the outcome is produced.
  void on_call(std::function<void()> hook);

  [[nodiscard]] int calls() const;

 private:
  core::ProviderId id_;
  mutable std::mutex mutex_;
  std::deque<resilience::CallOutcome<std::string>> script_;
  std::function<void()> hook_;
  int calls_{0};
};

}  // namespace ftr::llm
