#include "ftr/matching/merchant_resolver.h"

#include "ftr/core/normalization.h"

#include <algorithm>
#include <set>

namespace ftr::matching {

std::string_view to_string(const MerchantMatchTier tier) {
  switch (tier) {
    case MerchantMatchTier::kCanonical:
      return "canonical";
    case MerchantMatchTier::kAlias:
      return "alias";
    case MerchantMatchTier::kSubstring:
      return "substring";
  }
  return "canonical";
}

MerchantResolver::MerchantResolver(std::vector<domain::Merchant> merchants) {
  for (auto& merchant : merchants) {
    domain::Merchant normalized = domain::normalize_merchant(merchant);
    const core::MerchantId id = normalized.id;
    by_id_.insert_or_assign(id, std::move(normalized));
  }

  // Indexes are built after deduplication by id so a replaced record leaves no stale keys.
  for (const auto& [id, merchant] : by_id_) {
    canonical_index_[core::normalize_name_key(merchant.canonical_name)].push_back(id);
    for (const auto& alias : merchant.aliases) {
      alias_index_[core::normalize_name_key(alias)].push_back(id);
    }
  }
}

std::vector<MerchantMatch> MerchantResolver::resolve(const std::string_view text) const {
  std::vector<MerchantMatch> matches;
  const std::string key = core::normalize_name_key(text);
  if (key.empty()) {
    return matches;
  }

  std::set<core::MerchantId> seen;
  if (const auto it = canonical_index_.find(key); it != canonical_index_.end()) {
    for (const auto& id : it->second) {
      if (seen.insert(id).second) {
        matches.push_back(MerchantMatch{by_id_.at(id), MerchantMatchTier::kCanonical});
      }
    }
  }
  if (const auto it = alias_index_.find(key); it != alias_index_.end()) {
    for (const auto& id : it->second) {
      if (seen.insert(id).second) {
        matches.push_back(MerchantMatch{by_id_.at(id), MerchantMatchTier::kAlias});
      }
    }
  }
  return matches;
}

std::vector<MerchantMatch> MerchantResolver::lookup(const std::string_view text) const {
  std::vector<MerchantMatch> matches = resolve(text);
  if (!matches.empty()) {
    return matches;
  }

  for (const auto& [id, merchant] : by_id_) {
    const bool hit = core::contains_name_key(merchant.canonical_name, text) ||
                     std::any_of(merchant.aliases.begin(), merchant.aliases.end(),
                                 [text](const std::string& alias) {
                                   return core::contains_name_key(alias, text);
                                 });
    if (hit) {
      matches.push_back(MerchantMatch{merchant, MerchantMatchTier::kSubstring});
    }
  }
  return matches;
}

const domain::Merchant* MerchantResolver::find(const core::MerchantId& id) const {
  const auto it = by_id_.find(id);
  if (it == by_id_.end()) {
    return nullptr;
  }
  return &it->second;
}

}  // namespace ftr::matching
