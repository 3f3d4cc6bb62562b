#pragma once

#include "ftr/storage/repositories.h"
#include "ftr/storage/sqlite/sqlite_db.h"

#include <memory>

namespace ftr::storage::sqlite {

// SQLite-backed repositories. All three share one SqliteDb; the schema must already be
// applied (SqliteDb::ensure_schema_v1).

class SqliteTransactionRepository final : public ITransactionRepository {
 public:
  explicit SqliteTransactionRepository(std::shared_ptr<SqliteDb> db);

  core::Result<bool, core::Error> upsert(const domain::Transaction& txn) override;
  [[nodiscard]] std::optional<domain::Transaction> get(
      const core::TransactionId& id) const override;
  [[nodiscard]] std::vector<domain::Transaction> list_for_user(
      const core::UserId& user) const override;

 private:
  std::shared_ptr<SqliteDb> db_;
};

// SqliteMerchantRepository keeps aliases in a child table; their order is preserved via idx.
class SqliteMerchantRepository final : public IMerchantRepository {
 public:
  explicit SqliteMerchantRepository(std::shared_ptr<SqliteDb> db);

  core::Result<bool, core::Error> upsert(const domain::Merchant& merchant) override;
  [[nodiscard]] std::optional<domain::Merchant> get(const core::MerchantId& id) const override;
  [[nodiscard]] std::vector<domain::Merchant> list_all() const override;

 private:
  std::shared_ptr<SqliteDb> db_;

  // Load aliases for a merchant (ordered by idx). Caller holds the db mutex.
  [[nodiscard]] std::vector<std::string> load_aliases(const core::MerchantId& id) const;
};

class SqliteDisputeStore final : public IDisputeStore {
 public:
  explicit SqliteDisputeStore(std::shared_ptr<SqliteDb> db);

  core::Result<bool, core::Error> upsert(const domain::Dispute& dispute) override;
  [[nodiscard]] std::optional<domain::Dispute> get(const core::DisputeId& id) const override;
  [[nodiscard]] std::vector<domain::Dispute> list_for_user(
      const core::UserId& user) const override;
  [[nodiscard]] std::optional<domain::Dispute> find_open_for_transaction(
      const core::TransactionId& txn) const override;

 private:
  std::shared_ptr<SqliteDb> db_;
};

}  // namespace ftr::storage::sqlite
