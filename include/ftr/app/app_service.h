#pragma once

#include "ftr/app/services.h"
#include "ftr/config/engine_config.h"
#include "ftr/core/clock.h"
#include "ftr/core/error.h"
#include "ftr/core/id_generator.h"
#include "ftr/core/ids.h"
#include "ftr/core/result.h"
#include "ftr/disambiguation/disambiguation_session.h"
#include "ftr/domain/dispute.h"
#include "ftr/domain/match_query.h"
#include "ftr/domain/merchant.h"
#include "ftr/llm/reasoning_client.h"
#include "ftr/matching/merchant_resolver.h"
#include "ftr/storage/audit_event.h"

#include <optional>
#include <string>
#include <vector>

namespace ftr::app {

// ────────────────────────────────────────────────────────────────
// Resolution Turn
// ────────────────────────────────────────────────────────────────

struct ResolutionRequest {
  core::SessionId session_id;           // NOLINT(readability-identifier-naming)
  core::UserId user_id;                 // NOLINT(readability-identifier-naming)
  domain::MatchQuery query;             // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;  // NOLINT(readability-identifier-naming)
};

struct ResolutionResponse {
  std::string trace_id;                   // NOLINT(readability-identifier-naming)
  core::SessionId session_id;             // NOLINT(readability-identifier-naming)
  disambiguation::TurnResult turn;        // NOLINT(readability-identifier-naming)
  disambiguation::SessionState state{};   // NOLINT(readability-identifier-naming)
};

// Rank the user's transactions against a fresh query inside the session's turn.
// Pending clarification state from an earlier query is discarded; an ambiguous result
// leaves the session awaiting clarification.
// Emits audit events: ResolutionStarted, MatchCompleted, ClarificationRequested (ambiguous
// only), ClarificationExpired (when stale state was dropped first).
// Errors: kInvalidQuery; the session is left untouched.
[[nodiscard]] core::Result<ResolutionResponse, core::Error> run_resolution_turn(
    const ResolutionRequest& req, Services& services, core::IIdGenerator& id_gen,
    core::IClock& clock);

// ────────────────────────────────────────────────────────────────
// Clarification Answer
// ────────────────────────────────────────────────────────────────

struct ClarificationAnswerRequest {
  core::SessionId session_id;                   // NOLINT(readability-identifier-naming)
  disambiguation::ClarificationAnswer answer;   // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;          // NOLINT(readability-identifier-naming)
};

// Resolve a clarification answer against the session's pending candidates.
// Emits audit events: ClarificationResolved (selection made or refined query settled),
// ClarificationRequested (refined query still ambiguous), ClarificationExpired.
// Errors: kStaleReference, kInvalidQuery (pending state kept).
[[nodiscard]] core::Result<ResolutionResponse, core::Error> answer_clarification(
    const ClarificationAnswerRequest& req, Services& services, core::IIdGenerator& id_gen,
    core::IClock& clock);

// Record a turn of the session that neither asked nor answered a clarification.
// Returns true when the turn expired pending state (ClarificationExpired is emitted).
bool note_session_turn(const core::SessionId& session_id, Services& services,
                       core::IIdGenerator& id_gen, core::IClock& clock);

// Cancel the session's in-flight outbound calls and drop its state.
bool end_session(const core::SessionId& session_id, Services& services);

// ────────────────────────────────────────────────────────────────
// Disputes
// ────────────────────────────────────────────────────────────────

struct FlagDisputeRequest {
  core::UserId user_id;                 // NOLINT(readability-identifier-naming)
  core::TransactionId transaction_id;   // NOLINT(readability-identifier-naming)
  std::string complaint;                // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;  // NOLINT(readability-identifier-naming)
};

// Persist a new dispute on one of the user's transactions.
// Emits audit event: DisputeFlagged (the complaint text stays on the dispute record).
// Errors: kNotFound (unknown transaction or another user's), kConflict (an open dispute
// already exists; the message names it), kInvalidQuery (empty complaint), kStorage.
[[nodiscard]] core::Result<domain::Dispute, core::Error> flag_dispute(
    const FlagDisputeRequest& req, Services& services, core::IIdGenerator& id_gen,
    core::IClock& clock);

// Fetch a dispute for its owner. Another user's dispute reads as kNotFound.
[[nodiscard]] core::Result<domain::Dispute, core::Error> get_dispute_status(
    const core::UserId& user_id, const core::DisputeId& dispute_id, Services& services);

// List the user's disputes, most recent first.
[[nodiscard]] std::vector<domain::Dispute> list_disputes(const core::UserId& user_id,
                                                         Services& services);

// ────────────────────────────────────────────────────────────────
// Merchants
// ────────────────────────────────────────────────────────────────

// Exact canonical and alias tiers first; substring tier only when nothing matches exactly.
[[nodiscard]] std::vector<matching::MerchantMatch> lookup_merchant(const std::string& text,
                                                                   Services& services);

[[nodiscard]] core::Result<domain::Merchant, core::Error> get_merchant(
    const core::MerchantId& merchant_id, Services& services);

// ────────────────────────────────────────────────────────────────
// Outbound Reasoning Call
// ────────────────────────────────────────────────────────────────

struct ReasoningCallRequest {
  std::optional<core::SessionId> session_id;  // NOLINT(readability-identifier-naming)
  llm::ReasoningRequest request;              // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;        // NOLINT(readability-identifier-naming)
};

struct ReasoningCallResponse {
  std::string trace_id;  // NOLINT(readability-identifier-naming)
  std::string text;      // NOLINT(readability-identifier-naming)
};

// Call the reasoning provider through the resilience wrapper. With a session id the call
// runs inside that session's turn and is cancelled when the session ends.
// Errors: the resilience kinds (kRateLimited, kCircuitOpen, kRetriesExhausted,
// kProviderRejected, kCancelled).
[[nodiscard]] core::Result<ReasoningCallResponse, core::Error> ask_reasoning_provider(
    const ReasoningCallRequest& req, llm::ReasoningClient& client, Services& services,
    core::IIdGenerator& id_gen, core::IClock& clock);

// ────────────────────────────────────────────────────────────────
// Audit Trace
// ────────────────────────────────────────────────────────────────

[[nodiscard]] std::vector<storage::AuditEvent> fetch_audit_trace(const std::string& trace_id,
                                                                 Services& services);

// Record the effective configuration under a fresh trace.
// Emits audit event: EngineConfigRecorded. Returns the trace id.
std::string record_engine_config(const config::EngineConfig& config, Services& services,
                                 core::IIdGenerator& id_gen, core::IClock& clock);

}  // namespace ftr::app
