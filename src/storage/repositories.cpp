#include "ftr/storage/repositories.h"

#include <algorithm>

namespace ftr::storage {

void sort_most_recent_first(std::vector<domain::Dispute>& disputes) {
  std::sort(disputes.begin(), disputes.end(),
            [](const domain::Dispute& a, const domain::Dispute& b) {
              if (a.created_at != b.created_at) {
                return a.created_at > b.created_at;
              }
              return a.id.value > b.id.value;
            });
}

}  // namespace ftr::storage
