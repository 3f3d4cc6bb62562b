#pragma once

#include <atomic>
#include <memory>
#include <utility>

namespace ftr::core {

// CancellationToken observes a CancellationSource. A default-constructed token is never
// cancelled. Tokens are cheap to copy and safe to read from any thread.
class CancellationToken {
 public:
  CancellationToken() = default;

  [[nodiscard]] bool is_cancelled() const {
    return flag_ != nullptr && flag_->load(std::memory_order_acquire);
  }

 private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> flag)
      : flag_(std::move(flag)) {}

  std::shared_ptr<const std::atomic<bool>> flag_;
};

// CancellationSource is owned by whoever may tear a unit of work down (a session slot).
class CancellationSource {
 public:
  CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() { flag_->store(true, std::memory_order_release); }

  [[nodiscard]] bool is_cancelled() const { return flag_->load(std::memory_order_acquire); }

  [[nodiscard]] CancellationToken token() const { return CancellationToken(flag_); }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace ftr::core
