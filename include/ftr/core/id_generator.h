#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace ftr::core {

// Abstract ID generator interface for dependency injection.
// Production code mints time-ordered IDs; tests and the demo server mint sequential ones.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  // Generate next ID with given prefix.
  // Contract: returned ID is non-empty and starts with "<prefix>-".
  virtual std::string next(std::string_view prefix) = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// Production ID generator: microsecond timestamp + process-wide atomic counter.
class SystemIdGenerator final : public IIdGenerator {
 public:
  SystemIdGenerator() = default;
  ~SystemIdGenerator() override = default;

  SystemIdGenerator(const SystemIdGenerator&) = delete;
  SystemIdGenerator& operator=(const SystemIdGenerator&) = delete;
  SystemIdGenerator(SystemIdGenerator&&) = delete;
  SystemIdGenerator& operator=(SystemIdGenerator&&) = delete;

  std::string next(std::string_view prefix) override;

 private:
  std::atomic<unsigned long long> counter_{0};
};

// Sequential ID generator: one zero-padded counter per prefix ("dsp-0001", "trace-0001").
// Independent prefixes do not disturb each other, so adding an audit event never renumbers
// the disputes a test expects.
class SequentialIdGenerator final : public IIdGenerator {
 public:
  SequentialIdGenerator() = default;
  ~SequentialIdGenerator() override = default;

  SequentialIdGenerator(const SequentialIdGenerator&) = delete;
  SequentialIdGenerator& operator=(const SequentialIdGenerator&) = delete;
  SequentialIdGenerator(SequentialIdGenerator&&) = delete;
  SequentialIdGenerator& operator=(SequentialIdGenerator&&) = delete;

  std::string next(std::string_view prefix) override;

 private:
  std::mutex mutex_;
  std::map<std::string, unsigned long long, std::less<>> counters_;
};

}  // namespace ftr::core
