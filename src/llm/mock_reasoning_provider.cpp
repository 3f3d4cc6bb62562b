#include "ftr/llm/mock_reasoning_provider.h"

#include <utility>

namespace ftr::llm {

resilience::CallOutcome<std::string> MockReasoningProvider::complete(
    const ReasoningRequest& request) {
  std::function<void()> hook;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++calls_;
    hook = hook_;
  }
  if (hook) {
    hook();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (!script_.empty()) {
    auto outcome = std::move(script_.front());
    script_.pop_front();
    return outcome;
  }
  return resilience::CallOutcome<std::string>::ok("[" + request.purpose + "] " + request.prompt);
}

void MockReasoningProvider::enqueue(resilience::CallOutcome<std::string> outcome) {
  std::lock_guard<std::mutex> lock(mutex_);
  script_.push_back(std::move(outcome));
}

void MockReasoningProvider::fail_next(const resilience::FailureKind kind, const int count) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (int i = 0; i < count; ++i) {
    script_.push_front(resilience::CallOutcome<std::string>::err(resilience::ProviderFailure{
        kind, "scripted " + std::string{resilience::to_string(kind)}, std::nullopt}));
  }
}

void MockReasoningProvider::on_call(std::function<void()> hook) {
  std::lock_guard<std::mutex> lock(mutex_);
  hook_ = std::move(hook);
}

int MockReasoningProvider::calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return calls_;
}

}  // namespace ftr::llm
