#pragma once

#include "ftr/core/error.h"
#include "ftr/core/ids.h"
#include "ftr/core/result.h"
#include "ftr/domain/dispute.h"
#include "ftr/domain/merchant.h"
#include "ftr/domain/transaction.h"

#include <optional>
#include <vector>

namespace ftr::storage {

// Repository interfaces isolate persistence for deterministic testing and auditing.
// Writes report backend failures as ErrorKind::kStorage; reads of a missing record return
// nullopt. Implementations are safe to call from several sessions at once.

class ITransactionRepository {
 public:
  virtual ~ITransactionRepository() = default;
  virtual core::Result<bool, core::Error> upsert(const domain::Transaction& txn) = 0;
  [[nodiscard]] virtual std::optional<domain::Transaction> get(
      const core::TransactionId& id) const = 0;
  // list_for_user is the user-scoped snapshot the ranker reads, ordered by id.
  [[nodiscard]] virtual std::vector<domain::Transaction> list_for_user(
      const core::UserId& user) const = 0;
};

class IMerchantRepository {
 public:
  virtual ~IMerchantRepository() = default;
  virtual core::Result<bool, core::Error> upsert(const domain::Merchant& merchant) = 0;
  [[nodiscard]] virtual std::optional<domain::Merchant> get(const core::MerchantId& id) const = 0;
  [[nodiscard]] virtual std::vector<domain::Merchant> list_all() const = 0;
};

class IDisputeStore {
 public:
  virtual ~IDisputeStore() = default;
  virtual core::Result<bool, core::Error> upsert(const domain::Dispute& dispute) = 0;
  [[nodiscard]] virtual std::optional<domain::Dispute> get(const core::DisputeId& id) const = 0;
  // list_for_user returns the user's disputes, most recent first.
  [[nodiscard]] virtual std::vector<domain::Dispute> list_for_user(
      const core::UserId& user) const = 0;
  // find_open_for_transaction returns a dispute on txn that is not yet resolved.
  [[nodiscard]] virtual std::optional<domain::Dispute> find_open_for_transaction(
      const core::TransactionId& txn) const = 0;
};

// sort_most_recent_first orders disputes by created_at descending, then id descending.
void sort_most_recent_first(std::vector<domain::Dispute>& disputes);

}  // namespace ftr::storage
