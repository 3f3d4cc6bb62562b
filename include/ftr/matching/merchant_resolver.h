#pragma once

#include "ftr/core/ids.h"
#include "ftr/domain/merchant.h"

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace ftr::matching {

// MerchantMatchTier records how a merchant was found for a piece of free text.
enum class MerchantMatchTier {
  kCanonical,  // exact match of the canonical name
  kAlias,      // exact match of one alias
  kSubstring,  // text occurs inside the canonical name or an alias (lookup only)
};

[[nodiscard]] std::string_view to_string(MerchantMatchTier tier);

struct MerchantMatch {
  domain::Merchant merchant;
  MerchantMatchTier tier{MerchantMatchTier::kCanonical};
};

// MerchantResolver maps free merchant text to catalog merchants.
// The catalog is immutable after construction, so a resolver may be shared across threads.
//
// resolve() is exact-only and is what the ranker scores against: canonical-name matches
// first, then alias matches, each group ordered by merchant id. A descriptor like "AMZN"
// resolves to Amazon through its alias. lookup() additionally falls back to substring
// matching when no exact match exists; it serves merchant search, never scoring.
class MerchantResolver {
 public:
  explicit MerchantResolver(std::vector<domain::Merchant> merchants = {});

  [[nodiscard]] std::vector<MerchantMatch> resolve(std::string_view text) const;
  [[nodiscard]] std::vector<MerchantMatch> lookup(std::string_view text) const;

  // find returns nullptr for an id the catalog does not know.
  [[nodiscard]] const domain::Merchant* find(const core::MerchantId& id) const;

  [[nodiscard]] std::size_t size() const { return by_id_.size(); }

 private:
  std::map<core::MerchantId, domain::Merchant> by_id_;
  std::map<std::string, std::vector<core::MerchantId>, std::less<>> canonical_index_;
  std::map<std::string, std::vector<core::MerchantId>, std::less<>> alias_index_;
};

}  // namespace ftr::matching
