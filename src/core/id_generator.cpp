#include "ftr/core/id_generator.h"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace ftr::core {

std::string SystemIdGenerator::next(std::string_view prefix) {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now).count();
  const auto c = counter_.fetch_add(1, std::memory_order_relaxed);
  return std::string(prefix) + "-" + std::to_string(micros) + "-" + std::to_string(c);
}

std::string SequentialIdGenerator::next(std::string_view prefix) {
  unsigned long long n = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(prefix);
    if (it == counters_.end()) {
      it = counters_.emplace(std::string(prefix), 0ULL).first;
    }
    n = ++it->second;
  }

  std::ostringstream oss;
  oss << prefix << '-' << std::setw(4) << std::setfill('0') << n;
  return oss.str();
}

}  // namespace ftr::core
