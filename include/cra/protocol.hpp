#pragma once

// cra/protocol.hpp: CARP request/resolution and TRACE event records.
//
// These are values. Nothing here holds a lock, talks to a registry or knows
// about sessions. The JSON shapes produced below are compatibility surfaces:
//   - CarpResolution / Decision: interpreted by every client.
//   - TraceEvent: replayed and re-hashed by auditors.
//
// SERIALIZATION:
//   All writers build a jsonlite::Object and render it with jsonlite::to_json,
//   which sorts keys. Readers are strict: a missing required field or a value
//   of the wrong type is a serialization_error, never a silently defaulted
//   record.

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "cra/jsonlite.hpp"
#include "cra/types.hpp"

namespace cra {

// ---------------------------------------------------------------------------
// CarpRequest
// ---------------------------------------------------------------------------

enum class Operation {
  resolve,
  execute,
  validate,
};

std::string to_string(Operation op);
std::optional<Operation> operation_from_string(const std::string& s);

struct Requester {
  std::string                agent_id;
  std::string                session_id;
  std::optional<std::string> parent_session_id;
};

struct Task {
  std::string              goal;
  std::optional<RiskTier>  risk_tier;
  std::vector<std::string> context_hints;
  std::vector<std::string> required_capabilities;
  std::vector<std::string> requested_actions;
};

struct CarpRequest {
  std::string              carp_version;
  std::string              request_id;
  uint64_t                 timestamp_unix_ms{0};
  Operation                operation{Operation::resolve};
  Requester                requester;
  Task                     task;
  std::vector<std::string> atlas_ids;
  jsonlite::Object         context;

  // Structural checks only: supported carp_version, non-empty request id,
  // agent id, session id and goal. Returns validation_error on failure.
  std::optional<Error> validate() const;
};

// Convenience constructor used by transports and tests. Fills version,
// request id and timestamp.
CarpRequest make_request(const std::string& session_id, const std::string& agent_id,
                         const std::string& goal);

// ---------------------------------------------------------------------------
// Decision: exactly one per resolution.
// Encoded as {"type":"allow"} | {"type":"deny","reason":...} |
// {"type":"requires_approval","approver":...,"timeout_seconds":...} |
// {"type":"partial","reason":...}.
// ---------------------------------------------------------------------------

struct Allow {
  bool operator==(const Allow&) const = default;
};

struct Deny {
  std::string reason;
  bool operator==(const Deny&) const = default;
};

struct RequiresApproval {
  std::string approver;
  uint64_t    timeout_seconds{0};
  bool operator==(const RequiresApproval&) const = default;
};

struct Partial {
  std::string reason;
  bool operator==(const Partial&) const = default;
};

using Decision = std::variant<Allow, Deny, RequiresApproval, Partial>;

// "allow" | "deny" | "requires_approval" | "partial"
std::string decision_type(const Decision& d);

// ---------------------------------------------------------------------------
// CarpResolution
// ---------------------------------------------------------------------------

struct ContextBlock {
  std::string block_id;      // pack id
  std::string name;
  std::string content;
  std::string content_type;
  std::string source_atlas;  // empty for ad-hoc packs
  int32_t     priority{0};
  uint32_t    score{0};
};

struct AllowedAction {
  std::string                action_id;
  std::string                name;
  std::optional<std::string> description;
  jsonlite::Value            parameters_schema;
  RiskTier                   risk_tier{RiskTier::low};
};

struct DeniedAction {
  std::string action_id;
  std::string reason;
};

struct Constraint {
  std::string id;
  std::string description;
};

struct CarpResolution {
  std::string                carp_version;
  std::string                resolution_id;
  std::string                request_id;
  std::string                session_id;
  uint64_t                   timestamp_unix_ms{0};
  Decision                   decision{Allow{}};
  std::vector<ContextBlock>  context_blocks;
  std::vector<AllowedAction> allowed_actions;
  std::vector<DeniedAction>  denied_actions;
  std::vector<Constraint>    constraints;
  uint64_t                   ttl_seconds{0};
  std::string                trace_id;

  // Advisory only. The engine never expires or revokes a resolution.
  uint64_t expires_at_unix_ms() const { return timestamp_unix_ms + ttl_seconds * 1000; }
  bool is_action_allowed(const std::string& action_id) const;
  std::optional<std::string> denial_reason(const std::string& action_id) const;
};

// ---------------------------------------------------------------------------
// TRACE events
// ---------------------------------------------------------------------------

namespace event_type {
constexpr const char* session_started       = "session.started";
constexpr const char* session_ended         = "session.ended";
constexpr const char* request_received      = "carp.request.received";
constexpr const char* resolution_completed  = "carp.resolution.completed";
constexpr const char* policy_evaluated      = "policy.evaluated";
constexpr const char* context_injected      = "context.injected";
constexpr const char* action_requested      = "action.requested";
constexpr const char* action_approved       = "action.approved";
constexpr const char* action_denied         = "action.denied";
constexpr const char* action_executed       = "action.executed";
}  // namespace event_type

// Pre-chain form produced on the hot path.
struct RawEvent {
  std::string                session_id;
  std::string                trace_id;
  std::string                event_id;
  std::string                span_id;
  std::optional<std::string> parent_span_id;
  std::string                event_type;
  jsonlite::Object           payload;
  uint64_t                   timestamp_unix_ms{0};
};

// Fills event id, span id and timestamp.
RawEvent make_raw_event(const std::string& session_id, const std::string& trace_id,
                        const std::string& event_type, jsonlite::Object payload);

// Chained form. Immutable once produced by the TRACE worker.
struct TraceEvent {
  std::string                trace_version;
  std::string                session_id;
  std::string                trace_id;
  std::string                event_id;
  std::string                span_id;
  std::optional<std::string> parent_span_id;
  uint64_t                   sequence{0};
  uint64_t                   timestamp_unix_ms{0};
  std::string                event_type;
  jsonlite::Object           payload;
  std::string                event_hash;
  std::string                previous_event_hash;
};

// ---------------------------------------------------------------------------
// JSON codecs
// ---------------------------------------------------------------------------

jsonlite::Value request_to_value(const CarpRequest& r);
std::string request_to_json(const CarpRequest& r);
CarpRequest request_from_json(const std::string& text, std::optional<Error>* error);

jsonlite::Value decision_to_value(const Decision& d);
std::string decision_to_json(const Decision& d);
Decision decision_from_value(const jsonlite::Value& v, std::optional<Error>* error);
Decision decision_from_json(const std::string& text, std::optional<Error>* error);

jsonlite::Value resolution_to_value(const CarpResolution& r);
std::string resolution_to_json(const CarpResolution& r);

jsonlite::Value event_to_value(const TraceEvent& e);
std::string event_to_json(const TraceEvent& e);
TraceEvent event_from_json(const std::string& text, std::optional<Error>* error);

}  // namespace cra
