#include "ftr/storage/inmemory_repositories.h"

namespace ftr::storage {

core::Result<bool, core::Error> InMemoryTransactionRepository::upsert(
    const domain::Transaction& txn) {
  if (auto valid = txn.validate(); !valid.has_value()) {
    return valid;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  transactions_[txn.id] = txn;
  return core::Result<bool, core::Error>::ok(true);
}

std::optional<domain::Transaction> InMemoryTransactionRepository::get(
    const core::TransactionId& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = transactions_.find(id);
  if (it != transactions_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::vector<domain::Transaction> InMemoryTransactionRepository::list_for_user(
    const core::UserId& user) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<domain::Transaction> result;
  for (const auto& [id, txn] : transactions_) {
    if (txn.user_id == user) {
      result.push_back(txn);
    }
  }
  return result;
}

core::Result<bool, core::Error> InMemoryMerchantRepository::upsert(
    const domain::Merchant& merchant) {
  if (auto valid = merchant.validate(); !valid.has_value()) {
    return valid;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  merchants_[merchant.id] = domain::normalize_merchant(merchant);
  return core::Result<bool, core::Error>::ok(true);
}

std::optional<domain::Merchant> InMemoryMerchantRepository::get(
    const core::MerchantId& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = merchants_.find(id);
  if (it != merchants_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::vector<domain::Merchant> InMemoryMerchantRepository::list_all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<domain::Merchant> result;
  result.reserve(merchants_.size());
  for (const auto& [id, merchant] : merchants_) {
    result.push_back(merchant);
  }
  return result;
}

core::Result<bool, core::Error> InMemoryDisputeStore::upsert(const domain::Dispute& dispute) {
  if (dispute.id.value.empty()) {
    return core::Result<bool, core::Error>::err(
        core::make_error(core::ErrorKind::kStorage, "dispute id must not be empty"));
  }
  std::lock_guard<std::mutex> lock(mutex_);
  disputes_[dispute.id] = dispute;
  return core::Result<bool, core::Error>::ok(true);
}

std::optional<domain::Dispute> InMemoryDisputeStore::get(const core::DisputeId& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = disputes_.find(id);
  if (it != disputes_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::vector<domain::Dispute> InMemoryDisputeStore::list_for_user(const core::UserId& user) const {
  std::vector<domain::Dispute> result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, dispute] : disputes_) {
      if (dispute.user_id == user) {
        result.push_back(dispute);
      }
    }
  }
  sort_most_recent_first(result);
  return result;
}

std::optional<domain::Dispute> InMemoryDisputeStore::find_open_for_transaction(
    const core::TransactionId& txn) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [id, dispute] : disputes_) {
    if (dispute.transaction_id == txn && dispute.is_open()) {
      return dispute;
    }
  }
  return std::nullopt;
}

}  // namespace ftr::storage
