#pragma once

#include "ftr/core/error.h"
#include "ftr/core/result.h"
#include "ftr/domain/merchant.h"
#include "ftr/domain/transaction.h"
#include "ftr/storage/repositories.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

namespace ftr::storage {

// Seed catalog: a directory holding transactions.json and merchants.json, each a JSON array.
//
// Transaction fields: id, user_id, amount (number or decimal string), currency (default
// "USD"), date ("YYYY-MM-DD" or an ISO timestamp), merchant_id, reason, category, card_last4,
// location (optional), status (posted|pending|refunded, default posted).
//
// Merchant fields: id, name, category, description, address, phone, website,
// known_aliases, parent_company. Unknown fields are ignored.

struct CatalogLoadSummary {
  std::size_t transactions{0};
  std::size_t merchants{0};
};

// Malformed records are ErrorKind::kInvalidConfig naming the offending record.
[[nodiscard]] core::Result<domain::Transaction, core::Error> transaction_from_json(
    const nlohmann::json& j);
[[nodiscard]] core::Result<domain::Merchant, core::Error> merchant_from_json(
    const nlohmann::json& j);

// load_* upsert every record of a JSON array and return how many were stored.
// The first bad record stops the load; records before it stay stored.
[[nodiscard]] core::Result<std::size_t, core::Error> load_transactions(
    const nlohmann::json& records, ITransactionRepository& repo);
[[nodiscard]] core::Result<std::size_t, core::Error> load_merchants(const nlohmann::json& records,
                                                                    IMerchantRepository& repo);

// load_catalog_dir reads <dir>/merchants.json then <dir>/transactions.json.
// A missing or unparseable file is ErrorKind::kStorage.
[[nodiscard]] core::Result<CatalogLoadSummary, core::Error> load_catalog_dir(
    const std::string& dir, ITransactionRepository& transactions,
    IMerchantRepository& merchants);

}  // namespace ftr::storage
