#pragma once

#include "ftr/disambiguation/session_registry.h"
#include "ftr/matching/ranker.h"
#include "ftr/storage/audit_log.h"
#include "ftr/storage/repositories.h"

#include <mutex>

namespace ftr::app {

// Services is a composition root that bundles all system dependencies.
// It holds references (not ownership) to repositories, the ranker and the session registry.
// The server or a test creates the concrete instances and manages their lifetimes.
struct Services {
  storage::ITransactionRepository& transactions;  // NOLINT(readability-identifier-naming)
  storage::IMerchantRepository& merchants;        // NOLINT(readability-identifier-naming)
  storage::IDisputeStore& disputes;               // NOLINT(readability-identifier-naming)
  storage::IAuditLog& audit_log;                  // NOLINT(readability-identifier-naming)
  const matching::Ranker& ranker;                 // NOLINT(readability-identifier-naming)
  disambiguation::SessionRegistry& sessions;      // NOLINT(readability-identifier-naming)

  // Serializes the open-dispute check in flag_dispute with the insert that follows it.
  std::mutex dispute_mutex;  // NOLINT(readability-identifier-naming)

  Services(storage::ITransactionRepository& transactions, storage::IMerchantRepository& merchants,
           storage::IDisputeStore& disputes, storage::IAuditLog& audit_log,
           const matching::Ranker& ranker, disambiguation::SessionRegistry& sessions)
      : transactions(transactions),
        merchants(merchants),
        disputes(disputes),
        audit_log(audit_log),
        ranker(ranker),
        sessions(sessions) {}

  ~Services() = default;

  Services(const Services&) = delete;
  Services& operator=(const Services&) = delete;
  Services(Services&&) = delete;
  Services& operator=(Services&&) = delete;
};

}  // namespace ftr::app
