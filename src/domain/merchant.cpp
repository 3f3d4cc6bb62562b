#include "ftr/domain/merchant.h"

#include "ftr/core/normalization.h"

#include <algorithm>
#include <set>

namespace ftr::domain {

core::Result<bool, core::Error> Merchant::validate() const {
  using R = core::Result<bool, core::Error>;

  if (id.value.empty()) {
    return R::err(core::make_error(core::ErrorKind::kStorage, "merchant id must not be empty"));
  }
  if (core::normalize_name_key(canonical_name).empty()) {
    return R::err(core::make_error(core::ErrorKind::kStorage,
                                   "merchant " + id.value + ": canonical_name must not be empty"));
  }
  return R::ok(true);
}

bool Merchant::matches_exactly(const std::string_view text) const {
  const std::string key = core::normalize_name_key(text);
  if (key.empty()) {
    return false;
  }
  if (core::normalize_name_key(canonical_name) == key) {
    return true;
  }
  return std::any_of(aliases.begin(), aliases.end(), [&key](const std::string& alias) {
    return core::normalize_name_key(alias) == key;
  });
}

Merchant normalize_merchant(const Merchant& merchant) {
  Merchant normalized = merchant;
  normalized.canonical_name = core::trim(merchant.canonical_name);
  normalized.category = core::trim(merchant.category);

  std::set<std::string> seen_keys{core::normalize_name_key(normalized.canonical_name)};
  normalized.aliases.clear();
  for (const auto& alias : merchant.aliases) {
    std::string trimmed = core::trim(alias);
    const std::string key = core::normalize_name_key(trimmed);
    if (key.empty() || !seen_keys.insert(key).second) {
      continue;
    }
    normalized.aliases.push_back(std::move(trimmed));
  }
  std::sort(normalized.aliases.begin(), normalized.aliases.end());

  return normalized;
}

}  // namespace ftr::domain
