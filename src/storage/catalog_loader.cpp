#include "ftr/storage/catalog_loader.h"

#include "ftr/core/calendar.h"
#include "ftr/core/money.h"

#include <filesystem>
#include <fstream>
#include <optional>
#include <string_view>

namespace ftr::storage {

namespace {

using json = nlohmann::json;

std::optional<std::string> string_field(const json& j, const char* key) {
  const auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

std::string string_or_empty(const json& j, const char* key) {
  return string_field(j, key).value_or("");
}

core::Error bad_record(std::string_view kind, const std::string& id, const std::string& why) {
  return core::make_error(core::ErrorKind::kInvalidConfig,
                          std::string{kind} + " '" + id + "': " + why);
}

core::Result<json, core::Error> read_json_file(const std::filesystem::path& path) {
  using R = core::Result<json, core::Error>;

  std::ifstream in(path);
  if (!in) {
    return R::err(
        core::make_error(core::ErrorKind::kStorage, "cannot open " + path.string()));
  }
  json parsed = json::parse(in, nullptr, false);
  if (parsed.is_discarded()) {
    return R::err(
        core::make_error(core::ErrorKind::kStorage, "invalid JSON in " + path.string()));
  }
  return R::ok(std::move(parsed));
}

}  // namespace

core::Result<domain::Transaction, core::Error> transaction_from_json(const json& j) {
  using R = core::Result<domain::Transaction, core::Error>;

  if (!j.is_object()) {
    return R::err(bad_record("transaction", "?", "record is not an object"));
  }

  domain::Transaction txn;
  txn.id = core::TransactionId{string_or_empty(j, "id")};
  txn.user_id = core::UserId{string_or_empty(j, "user_id")};
  txn.merchant_id = core::MerchantId{string_or_empty(j, "merchant_id")};
  txn.description = string_or_empty(j, "reason");
  txn.category = string_or_empty(j, "category");
  txn.card_last4 = string_or_empty(j, "card_last4");
  txn.location = string_field(j, "location");

  const std::string currency = string_field(j, "currency").value_or("USD");
  std::optional<core::Money> amount;
  if (const auto it = j.find("amount"); it != j.end()) {
    if (it->is_number()) {
      amount = core::money_from_major(it->get<double>(), currency);
    } else if (it->is_string()) {
      amount = core::parse_money(it->get<std::string>(), currency);
    }
  }
  if (!amount.has_value()) {
    return R::err(bad_record("transaction", txn.id.value, "missing or malformed amount"));
  }
  txn.amount = *amount;

  const auto date = core::parse_iso_date(string_or_empty(j, "date"));
  if (!date.has_value()) {
    return R::err(bad_record("transaction", txn.id.value, "missing or malformed date"));
  }
  txn.date = *date;

  const auto status = domain::parse_transaction_status(string_field(j, "status").value_or("posted"));
  if (!status.has_value()) {
    return R::err(bad_record("transaction", txn.id.value, "unknown status"));
  }
  txn.status = *status;

  if (auto valid = txn.validate(); !valid.has_value()) {
    return R::err(bad_record("transaction", txn.id.value, valid.error().message));
  }
  return R::ok(std::move(txn));
}

core::Result<domain::Merchant, core::Error> merchant_from_json(const json& j) {
  using R = core::Result<domain::Merchant, core::Error>;

  if (!j.is_object()) {
    return R::err(bad_record("merchant", "?", "record is not an object"));
  }

  domain::Merchant merchant;
  merchant.id = core::MerchantId{string_or_empty(j, "id")};
  merchant.canonical_name = string_or_empty(j, "name");
  merchant.category = string_or_empty(j, "category");
  merchant.description = string_or_empty(j, "description");
  merchant.address = string_field(j, "address");
  merchant.phone = string_field(j, "phone");
  merchant.website = string_field(j, "website");
  merchant.parent_company = string_field(j, "parent_company");

  if (const auto it = j.find("known_aliases"); it != j.end() && it->is_array()) {
    for (const auto& alias : *it) {
      if (alias.is_string()) {
        merchant.aliases.push_back(alias.get<std::string>());
      }
    }
  }

  if (auto valid = merchant.validate(); !valid.has_value()) {
    return R::err(bad_record("merchant", merchant.id.value, valid.error().message));
  }
  return R::ok(domain::normalize_merchant(merchant));
}

core::Result<std::size_t, core::Error> load_transactions(const json& records,
                                                         ITransactionRepository& repo) {
  using R = core::Result<std::size_t, core::Error>;

  if (!records.is_array()) {
    return R::err(core::make_error(core::ErrorKind::kInvalidConfig,
                                   "transactions catalog must be a JSON array"));
  }

  std::size_t stored = 0;
  for (const auto& record : records) {
    auto txn = transaction_from_json(record);
    if (!txn.has_value()) {
      return R::err(txn.error());
    }
    if (auto saved = repo.upsert(txn.value()); !saved.has_value()) {
      return R::err(saved.error());
    }
    ++stored;
  }
  return R::ok(stored);
}

core::Result<std::size_t, core::Error> load_merchants(const json& records,
                                                      IMerchantRepository& repo) {
  using R = core::Result<std::size_t, core::Error>;

  if (!records.is_array()) {
    return R::err(core::make_error(core::ErrorKind::kInvalidConfig,
                                   "merchants catalog must be a JSON array"));
  }

  std::size_t stored = 0;
  for (const auto& record : records) {
    auto merchant = merchant_from_json(record);
    if (!merchant.has_value()) {
      return R::err(merchant.error());
    }
    if (auto saved = repo.upsert(merchant.value()); !saved.has_value()) {
      return R::err(saved.error());
    }
    ++stored;
  }
  return R::ok(stored);
}

core::Result<CatalogLoadSummary, core::Error> load_catalog_dir(
    const std::string& dir, ITransactionRepository& transactions,
    IMerchantRepository& merchants) {
  using R = core::Result<CatalogLoadSummary, core::Error>;

  const std::filesystem::path root(dir);
  CatalogLoadSummary summary;

  auto merchant_json = read_json_file(root / "merchants.json");
  if (!merchant_json.has_value()) {
    return R::err(merchant_json.error());
  }
  auto merchant_count = load_merchants(merchant_json.value(), merchants);
  if (!merchant_count.has_value()) {
    return R::err(merchant_count.error());
  }
  summary.merchants = merchant_count.value();

  auto txn_json = read_json_file(root / "transactions.json");
  if (!txn_json.has_value()) {
    return R::err(txn_json.error());
  }
  auto txn_count = load_transactions(txn_json.value(), transactions);
  if (!txn_count.has_value()) {
    return R::err(txn_count.error());
  }
  summary.transactions = txn_count.value();

  return R::ok(summary);
}

}  // namespace ftr::storage
