#include "ftr/storage/sqlite/sqlite_repositories.h"

#include <sqlite3.h>

namespace ftr::storage::sqlite {

namespace {

constexpr const char* kSelectColumns =
    "SELECT merchant_id, canonical_name, category, description, address, phone, website,"
    "       parent_company FROM merchants";

void bind_optional(PreparedStatement& stmt, const int index,
                   const std::optional<std::string>& value) {
  if (value.has_value()) {
    stmt.bind_text(index, *value);
  } else {
    stmt.bind_null(index);
  }
}

std::optional<std::string> optional_column(const PreparedStatement& stmt, const int column) {
  if (stmt.column_is_null(column)) {
    return std::nullopt;
  }
  return stmt.column_text(column);
}

domain::Merchant read_row(const PreparedStatement& stmt) {
  domain::Merchant merchant;
  merchant.id = core::MerchantId{stmt.column_text(0)};
  merchant.canonical_name = stmt.column_text(1);
  merchant.category = stmt.column_text(2);
  merchant.description = stmt.column_text(3);
  merchant.address = optional_column(stmt, 4);
  merchant.phone = optional_column(stmt, 5);
  merchant.website = optional_column(stmt, 6);
  merchant.parent_company = optional_column(stmt, 7);
  return merchant;
}

}  // namespace

SqliteMerchantRepository::SqliteMerchantRepository(std::shared_ptr<SqliteDb> db)
    : db_(std::move(db)) {}

core::Result<bool, core::Error> SqliteMerchantRepository::upsert(
    const domain::Merchant& merchant) {
  using R = core::Result<bool, core::Error>;

  if (auto valid = merchant.validate(); !valid.has_value()) {
    return valid;
  }
  const domain::Merchant normalized = domain::normalize_merchant(merchant);

  std::lock_guard<std::mutex> lock(db_->mutex());

  // Begin transaction for atomic upsert
  if (auto begin = db_->exec("BEGIN TRANSACTION"); !begin.has_value()) {
    return R::err(core::make_error(core::ErrorKind::kStorage, begin.error()));
  }
  const auto fail = [this](const std::string& message) {
    (void)db_->exec("ROLLBACK");
    return R::err(core::make_error(core::ErrorKind::kStorage, message));
  };

  const char* merchant_sql = R"(
    INSERT INTO merchants (merchant_id, canonical_name, category, description, address, phone,
                           website, parent_company)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(merchant_id) DO UPDATE SET
      canonical_name = excluded.canonical_name,
      category = excluded.category,
      description = excluded.description,
      address = excluded.address,
      phone = excluded.phone,
      website = excluded.website,
      parent_company = excluded.parent_company
  )";

  PreparedStatement merchant_stmt(db_->connection(), merchant_sql);
  if (!merchant_stmt.is_valid()) {
    return fail(merchant_stmt.error());
  }
  merchant_stmt.bind_text(1, normalized.id.value);
  merchant_stmt.bind_text(2, normalized.canonical_name);
  merchant_stmt.bind_text(3, normalized.category);
  merchant_stmt.bind_text(4, normalized.description);
  bind_optional(merchant_stmt, 5, normalized.address);
  bind_optional(merchant_stmt, 6, normalized.phone);
  bind_optional(merchant_stmt, 7, normalized.website);
  bind_optional(merchant_stmt, 8, normalized.parent_company);
  if (sqlite3_step(merchant_stmt.get()) != SQLITE_DONE) {
    return fail("merchant upsert failed: " + db_->last_error());
  }

  // Replace aliases
  PreparedStatement del_stmt(db_->connection(), "DELETE FROM merchant_aliases WHERE merchant_id = ?");
  if (!del_stmt.is_valid()) {
    return fail(del_stmt.error());
  }
  del_stmt.bind_text(1, normalized.id.value);
  if (sqlite3_step(del_stmt.get()) != SQLITE_DONE) {
    return fail("alias delete failed: " + db_->last_error());
  }

  PreparedStatement alias_stmt(
      db_->connection(), "INSERT INTO merchant_aliases (merchant_id, idx, alias) VALUES (?, ?, ?)");
  if (!alias_stmt.is_valid()) {
    return fail(alias_stmt.error());
  }
  for (std::size_t i = 0; i < normalized.aliases.size(); ++i) {
    alias_stmt.bind_text(1, normalized.id.value);
    alias_stmt.bind_int64(2, static_cast<long long>(i));
    alias_stmt.bind_text(3, normalized.aliases[i]);
    if (sqlite3_step(alias_stmt.get()) != SQLITE_DONE) {
      return fail("alias insert failed: " + db_->last_error());
    }
    alias_stmt.reset();
  }

  if (auto commit = db_->exec("COMMIT"); !commit.has_value()) {
    return fail(commit.error());
  }
  return R::ok(true);
}

std::optional<domain::Merchant> SqliteMerchantRepository::get(const core::MerchantId& id) const {
  std::lock_guard<std::mutex> lock(db_->mutex());
  PreparedStatement stmt(db_->connection(), std::string{kSelectColumns} + " WHERE merchant_id = ?");
  if (!stmt.is_valid()) {
    return std::nullopt;
  }

  stmt.bind_text(1, id.value);
  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    domain::Merchant merchant = read_row(stmt);
    merchant.aliases = load_aliases(merchant.id);
    return merchant;
  }
  return std::nullopt;
}

std::vector<domain::Merchant> SqliteMerchantRepository::list_all() const {
  std::lock_guard<std::mutex> lock(db_->mutex());
  PreparedStatement stmt(db_->connection(), std::string{kSelectColumns} + " ORDER BY merchant_id");
  if (!stmt.is_valid()) {
    return {};
  }

  std::vector<domain::Merchant> result;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    result.push_back(read_row(stmt));
  }
  for (auto& merchant : result) {
    merchant.aliases = load_aliases(merchant.id);
  }
  return result;
}

std::vector<std::string> SqliteMerchantRepository::load_aliases(const core::MerchantId& id) const {
  PreparedStatement stmt(db_->connection(),
                         "SELECT alias FROM merchant_aliases WHERE merchant_id = ? ORDER BY idx");
  if (!stmt.is_valid()) {
    return {};
  }

  stmt.bind_text(1, id.value);
  std::vector<std::string> aliases;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    aliases.push_back(stmt.column_text(0));
  }
  return aliases;
}

}  // namespace ftr::storage::sqlite
