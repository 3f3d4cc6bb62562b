#pragma once

#include "ftr/core/error.h"
#include "ftr/core/ids.h"
#include "ftr/core/result.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ftr::domain {

// Merchant is an immutable catalog record.
// aliases has set semantics: normalize_merchant() removes entries whose comparison key
// duplicates the canonical name or another alias, and sorts the remainder.
struct Merchant {
  core::MerchantId id;
  std::string canonical_name;
  std::vector<std::string> aliases;
  std::string category;
  std::string description;
  std::optional<std::string> address;
  std::optional<std::string> phone;
  std::optional<std::string> website;
  std::optional<std::string> parent_company;

  [[nodiscard]] core::Result<bool, core::Error> validate() const;

  // matches_exactly is true when text equals the canonical name or an alias,
  // compared case-insensitively with whitespace normalized.
  [[nodiscard]] bool matches_exactly(std::string_view text) const;
};

// normalize_merchant trims the name and aliases and deduplicates aliases.
[[nodiscard]] Merchant normalize_merchant(const Merchant& merchant);

}  // namespace ftr::domain
