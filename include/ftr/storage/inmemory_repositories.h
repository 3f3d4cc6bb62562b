#pragma once

#include "ftr/storage/repositories.h"

#include <map>
#include <mutex>

namespace ftr::storage {

// In-memory repositories keyed by std::map, so iteration order is deterministic (sorted by
// id). Used by tests and by the server when no database path is given.

class InMemoryTransactionRepository final : public ITransactionRepository {
 public:
  core::Result<bool, core::Error> upsert(const domain::Transaction& txn) override;
  [[nodiscard]] std::optional<domain::Transaction> get(
      const core::TransactionId& id) const override;
  [[nodiscard]] std::vector<domain::Transaction> list_for_user(
      const core::UserId& user) const override;

 private:
  mutable std::mutex mutex_;
  std::map<core::TransactionId, domain::Transaction> transactions_;
};

class InMemoryMerchantRepository final : public IMerchantRepository {
 public:
  core::Result<bool, core::Error> upsert(const domain::Merchant& merchant) override;
  [[nodiscard]] std::optional<domain::Merchant> get(const core::MerchantId& id) const override;
  [[nodiscard]] std::vector<domain::Merchant> list_all() const override;

 private:
  mutable std::mutex mutex_;
  std::map<core::MerchantId, domain::Merchant> merchants_;
};

class InMemoryDisputeStore final : public IDisputeStore {
 public:
  core::Result<bool, core::Error> upsert(const domain::Dispute& dispute) override;
  [[nodiscard]] std::optional<domain::Dispute> get(const core::DisputeId& id) const override;
  [[nodiscard]] std::vector<domain::Dispute> list_for_user(
      const core::UserId& user) const override;
  [[nodiscard]] std::optional<domain::Dispute> find_open_for_transaction(
      const core::TransactionId& txn) const override;

 private:
  mutable std::mutex mutex_;
  std::map<core::DisputeId, domain::Dispute> disputes_;
};

}  // namespace ftr::storage
