#pragma once

#include "ftr/core/id_generator.h"

#include <string>

namespace ftr::core {

// Strong ID types. Each wraps a string so a merchant id can never be passed where a
// transaction id is expected; ordering is lexical so std::map iteration is deterministic.

struct TransactionId {
  std::string value;
  auto operator<=>(const TransactionId&) const = default;
};

struct MerchantId {
  std::string value;
  auto operator<=>(const MerchantId&) const = default;
};

struct UserId {
  std::string value;
  auto operator<=>(const UserId&) const = default;
};

struct SessionId {
  std::string value;
  auto operator<=>(const SessionId&) const = default;
};

struct DisputeId {
  std::string value;
  auto operator<=>(const DisputeId&) const = default;
};

struct ProviderId {
  std::string value;
  auto operator<=>(const ProviderId&) const = default;
};

struct TraceId {
  std::string value;
  auto operator<=>(const TraceId&) const = default;
};

inline DisputeId new_dispute_id(IIdGenerator& gen) { return DisputeId{gen.next("dsp")}; }
inline SessionId new_session_id(IIdGenerator& gen) { return SessionId{gen.next("session")}; }
inline TraceId new_trace_id(IIdGenerator& gen) { return TraceId{gen.next("trace")}; }

}  // namespace ftr::core
