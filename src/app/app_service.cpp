#include "ftr/app/app_service.h"

#include "ftr/core/normalization.h"
#include "ftr/storage/audit_recorder.h"

#include <nlohmann/json.hpp>

#include <mutex>
#include <string_view>

namespace ftr::app {

namespace {

using json = nlohmann::json;

std::string trace_or_new(const std::optional<std::string>& trace_id, core::IIdGenerator& id_gen) {
  if (trace_id.has_value() && !trace_id->empty()) {
    return *trace_id;
  }
  return core::new_trace_id(id_gen).value;
}

// query_shape records which dimensions a query constrained, never the user's text.
json query_shape(const domain::MatchQuery& query) {
  return {{"has_amount", query.amount.has_value()},
          {"has_date", query.date.has_value()},
          {"has_merchant", query.merchant_text.has_value()},
          {"has_transaction_id", query.transaction_id.has_value()}};
}

json candidates_json(const domain::MatchResult& result) {
  json candidates = json::array();
  for (const auto& candidate : result.candidates) {
    candidates.push_back({{"transaction_id", candidate.transaction.id.value},
                          {"composite_score", candidate.composite_score}});
  }
  return candidates;
}

std::vector<std::string> candidate_refs(const core::SessionId& session,
                                        const domain::MatchResult& result) {
  std::vector<std::string> refs{session.value};
  for (const auto& candidate : result.candidates) {
    refs.push_back(candidate.transaction.id.value);
  }
  return refs;
}

std::string_view selection_kind(const disambiguation::Selection& selection) {
  if (std::holds_alternative<disambiguation::SelectRank>(selection)) {
    return "rank";
  }
  if (std::holds_alternative<disambiguation::SelectTransaction>(selection)) {
    return "transaction_id";
  }
  return "refined_query";
}

void record_expired(const storage::AuditRecorder& audit, const std::string& trace_id,
                    const core::SessionId& session, std::string_view reason) {
  audit.record(trace_id, "ClarificationExpired",
               {{"session_id", session.value}, {"reason", std::string{reason}}},
               {session.value});
}

void record_clarification(const storage::AuditRecorder& audit, const std::string& trace_id,
                          const core::SessionId& session,
                          const disambiguation::TurnResult& turn) {
  audit.record(trace_id, "ClarificationRequested",
               {{"session_id", session.value},
                {"query_fingerprint", turn.clarification->query_fingerprint},
                {"option_count", turn.clarification->options.size()}},
               candidate_refs(session, turn.result));
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Resolution Turn
// ────────────────────────────────────────────────────────────────

core::Result<ResolutionResponse, core::Error> run_resolution_turn(const ResolutionRequest& req,
                                                                  Services& services,
                                                                  core::IIdGenerator& id_gen,
                                                                  core::IClock& clock) {
  using R = core::Result<ResolutionResponse, core::Error>;

  const std::string trace_id = trace_or_new(req.trace_id, id_gen);
  const storage::AuditRecorder audit(&services.audit_log, id_gen, clock);

  audit.record(trace_id, "ResolutionStarted",
               {{"session_id", req.session_id.value},
                {"user_id", req.user_id.value},
                {"query", query_shape(req.query)}},
               {req.session_id.value});

  // Ranking is pure; only the session update below needs the turn lock.
  const matching::MerchantResolver resolver(services.merchants.list_all());
  const auto snapshot = services.transactions.list_for_user(req.user_id);
  auto ranked = services.ranker.rank(req.query, req.user_id, snapshot, resolver);
  if (!ranked.has_value()) {
    return R::err(ranked.error());
  }

  return services.sessions.with_session(
      req.session_id,
      [&](disambiguation::DisambiguationSession& session, const core::CancellationToken&) {
        const core::Instant now = clock.now();
        if (session.pending().has_value()) {
          record_expired(audit, trace_id, req.session_id,
                         session.expire_if_stale(now) ? "max_age" : "superseded");
        }

        ResolutionResponse response{
            .trace_id = trace_id,
            .session_id = req.session_id,
            .turn = session.accept_result(req.query, std::move(ranked).value(), now),
            .state = session.state(),
        };

        const auto& result = response.turn.result;
        json payload = {{"session_id", req.session_id.value},
                        {"outcome", std::string{domain::to_string(result.outcome)}},
                        {"candidate_count", result.candidates.size()},
                        {"candidates", candidates_json(result)}};
        audit.record(trace_id, "MatchCompleted", payload, candidate_refs(req.session_id, result));

        if (response.turn.clarification.has_value()) {
          record_clarification(audit, trace_id, req.session_id, response.turn);
        }
        return R::ok(std::move(response));
      });
}

// ────────────────────────────────────────────────────────────────
// Clarification Answer
// ────────────────────────────────────────────────────────────────

core::Result<ResolutionResponse, core::Error> answer_clarification(
    const ClarificationAnswerRequest& req, Services& services, core::IIdGenerator& id_gen,
    core::IClock& clock) {
  using R = core::Result<ResolutionResponse, core::Error>;

  const std::string trace_id = trace_or_new(req.trace_id, id_gen);
  const storage::AuditRecorder audit(&services.audit_log, id_gen, clock);
  const matching::MerchantResolver resolver(services.merchants.list_all());

  return services.sessions.with_session(
      req.session_id,
      [&](disambiguation::DisambiguationSession& session, const core::CancellationToken&) {
        const core::Instant now = clock.now();
        if (session.expire_if_stale(now)) {
          record_expired(audit, trace_id, req.session_id, "max_age");
        }

        auto answered = session.answer(req.answer, services.ranker, resolver, now);
        if (!answered.has_value()) {
          return R::err(answered.error());
        }

        ResolutionResponse response{
            .trace_id = trace_id,
            .session_id = req.session_id,
            .turn = std::move(answered).value(),
            .state = session.state(),
        };

        if (response.turn.clarification.has_value()) {
          record_clarification(audit, trace_id, req.session_id, response.turn);
          return R::ok(std::move(response));
        }

        const auto& result = response.turn.result;
        json payload = {{"session_id", req.session_id.value},
                        {"selection", std::string{selection_kind(req.answer.selection)}},
                        {"outcome", std::string{domain::to_string(result.outcome)}}};
        if (result.best.has_value()) {
          payload["transaction_id"] = result.best->transaction.id.value;
        }
        audit.record(trace_id, "ClarificationResolved", payload,
                     candidate_refs(req.session_id, result));
        return R::ok(std::move(response));
      });
}

bool note_session_turn(const core::SessionId& session_id, Services& services,
                       core::IIdGenerator& id_gen, core::IClock& clock) {
  if (!services.sessions.contains(session_id)) {
    return false;
  }

  const storage::AuditRecorder audit(&services.audit_log, id_gen, clock);
  return services.sessions.with_session(
      session_id,
      [&](disambiguation::DisambiguationSession& session, const core::CancellationToken&) {
        const core::Instant now = clock.now();
        std::string_view reason;
        if (session.expire_if_stale(now)) {
          reason = "max_age";
        } else if (session.note_turn(now)) {
          reason = "turn_limit";
        } else {
          return false;
        }
        record_expired(audit, core::new_trace_id(id_gen).value, session_id, reason);
        return true;
      });
}

bool end_session(const core::SessionId& session_id, Services& services) {
  return services.sessions.end_session(session_id);
}

// ────────────────────────────────────────────────────────────────
// Disputes
// ────────────────────────────────────────────────────────────────

core::Result<domain::Dispute, core::Error> flag_dispute(const FlagDisputeRequest& req,
                                                        Services& services,
                                                        core::IIdGenerator& id_gen,
                                                        core::IClock& clock) {
  using R = core::Result<domain::Dispute, core::Error>;

  const std::string complaint = core::trim(req.complaint);
  if (complaint.empty()) {
    return R::err(core::make_error(core::ErrorKind::kInvalidQuery,
                                   "a dispute needs a complaint describing the problem"));
  }

  const auto txn = services.transactions.get(req.transaction_id);
  if (!txn.has_value() || txn->user_id != req.user_id) {
    return R::err(core::make_error(core::ErrorKind::kNotFound,
                                   "transaction " + req.transaction_id.value + " not found"));
  }

  std::lock_guard<std::mutex> lock(services.dispute_mutex);

  if (const auto existing = services.disputes.find_open_for_transaction(req.transaction_id)) {
    return R::err(core::make_error(core::ErrorKind::kConflict,
                                   "transaction " + req.transaction_id.value +
                                       " already has open dispute " + existing->id.value));
  }

  domain::Dispute dispute;
  dispute.id = core::new_dispute_id(id_gen);
  dispute.transaction_id = req.transaction_id;
  dispute.user_id = req.user_id;
  dispute.created_at = clock.now_iso8601();
  dispute.complaint = complaint;
  dispute.status = domain::DisputeStatus::kFlagged;

  if (auto saved = services.disputes.upsert(dispute); !saved.has_value()) {
    return R::err(saved.error());
  }

  const storage::AuditRecorder audit(&services.audit_log, id_gen, clock);
  audit.record(trace_or_new(req.trace_id, id_gen), "DisputeFlagged",
               {{"dispute_id", dispute.id.value},
                {"transaction_id", dispute.transaction_id.value},
                {"user_id", dispute.user_id.value},
                {"status", std::string{domain::to_string(dispute.status)}}},
               {dispute.id.value, dispute.transaction_id.value});

  return R::ok(std::move(dispute));
}

core::Result<domain::Dispute, core::Error> get_dispute_status(const core::UserId& user_id,
                                                              const core::DisputeId& dispute_id,
                                                              Services& services) {
  using R = core::Result<domain::Dispute, core::Error>;

  auto dispute = services.disputes.get(dispute_id);
  if (!dispute.has_value() || dispute->user_id != user_id) {
    return R::err(core::make_error(core::ErrorKind::kNotFound,
                                   "dispute " + dispute_id.value + " not found"));
  }
  return R::ok(std::move(*dispute));
}

std::vector<domain::Dispute> list_disputes(const core::UserId& user_id, Services& services) {
  return services.disputes.list_for_user(user_id);
}

// ────────────────────────────────────────────────────────────────
// Merchants
// ────────────────────────────────────────────────────────────────

std::vector<matching::MerchantMatch> lookup_merchant(const std::string& text,
                                                     Services& services) {
  const matching::MerchantResolver resolver(services.merchants.list_all());
  return resolver.lookup(text);
}

core::Result<domain::Merchant, core::Error> get_merchant(const core::MerchantId& merchant_id,
                                                         Services& services) {
  using R = core::Result<domain::Merchant, core::Error>;

  auto merchant = services.merchants.get(merchant_id);
  if (!merchant.has_value()) {
    return R::err(core::make_error(core::ErrorKind::kNotFound,
                                   "merchant " + merchant_id.value + " not found"));
  }
  return R::ok(std::move(*merchant));
}

// ────────────────────────────────────────────────────────────────
// Outbound Reasoning Call
// ────────────────────────────────────────────────────────────────

core::Result<ReasoningCallResponse, core::Error> ask_reasoning_provider(
    const ReasoningCallRequest& req, llm::ReasoningClient& client, Services& services,
    core::IIdGenerator& id_gen, core::IClock& /*clock*/) {
  using R = core::Result<ReasoningCallResponse, core::Error>;

  const std::string trace_id = trace_or_new(req.trace_id, id_gen);
  const auto call = [&](const core::CancellationToken& cancellation) {
    auto text = client.ask(req.request, resilience::CallContext{cancellation, trace_id});
    if (!text.has_value()) {
      return R::err(text.error());
    }
    return R::ok(ReasoningCallResponse{.trace_id = trace_id, .text = std::move(text).value()});
  };

  if (!req.session_id.has_value()) {
    return call(core::CancellationToken{});
  }
  return services.sessions.with_session(
      *req.session_id,
      [&](disambiguation::DisambiguationSession& /*session*/,
          const core::CancellationToken& cancellation) { return call(cancellation); });
}

// ────────────────────────────────────────────────────────────────
// Audit Trace
// ────────────────────────────────────────────────────────────────

std::vector<storage::AuditEvent> fetch_audit_trace(const std::string& trace_id,
                                                   Services& services) {
  return services.audit_log.query(trace_id);
}

std::string record_engine_config(const config::EngineConfig& config, Services& services,
                                 core::IIdGenerator& id_gen, core::IClock& clock) {
  const std::string trace_id = core::new_trace_id(id_gen).value;
  const storage::AuditRecorder audit(&services.audit_log, id_gen, clock);
  audit.record(trace_id, "EngineConfigRecorded", config::to_json(config));
  return trace_id;
}

}  // namespace ftr::app
