#include "cra/protocol.hpp"

#include <algorithm>

#include "cra/version.hpp"

namespace cra {

namespace {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

// Field readers that record the first failure in *error and keep going with a
// default. Callers check *error once at the end.
std::string require_string(const Object& obj, const std::string& key, std::optional<Error>* error) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->second.is_string()) {
    if (error && !*error) *error = make_error(ErrorCode::serialization_error, "missing or non-string field: " + key);
    return {};
  }
  return std::get<std::string>(it->second.v);
}

uint64_t require_u64(const Object& obj, const std::string& key, std::optional<Error>* error) {
  auto it = obj.find(key);
  if (it != obj.end()) {
    if (const auto* u = std::get_if<std::uint64_t>(&it->second.v)) return *u;
    if (const auto* i = std::get_if<std::int64_t>(&it->second.v); i && *i >= 0) return static_cast<uint64_t>(*i);
  }
  if (error && !*error) *error = make_error(ErrorCode::serialization_error, "missing or non-integer field: " + key);
  return 0;
}

std::optional<std::string> optional_string(const Object& obj, const std::string& key, std::optional<Error>* error) {
  auto it = obj.find(key);
  if (it == obj.end() || it->second.is_null()) return std::nullopt;
  if (!it->second.is_string()) {
    if (error && !*error) *error = make_error(ErrorCode::serialization_error, "non-string field: " + key);
    return std::nullopt;
  }
  return std::get<std::string>(it->second.v);
}

std::vector<std::string> string_list(const Object& obj, const std::string& key, std::optional<Error>* error) {
  std::vector<std::string> out;
  auto it = obj.find(key);
  if (it == obj.end() || it->second.is_null()) return out;
  const auto* arr = std::get_if<Array>(&it->second.v);
  if (!arr) {
    if (error && !*error) *error = make_error(ErrorCode::serialization_error, "non-array field: " + key);
    return out;
  }
  for (const auto& item : *arr) {
    if (!item.is_string()) {
      if (error && !*error) *error = make_error(ErrorCode::serialization_error, "non-string element in " + key);
      return {};
    }
    out.push_back(std::get<std::string>(item.v));
  }
  return out;
}

Value optional_to_value(const std::optional<std::string>& s) {
  return s ? Value(*s) : Value(nullptr);
}

}  // namespace

// ---------------------------------------------------------------------------
// Operation / Decision helpers
// ---------------------------------------------------------------------------

std::string to_string(Operation op) {
  switch (op) {
    case Operation::resolve:  return "resolve";
    case Operation::execute:  return "execute";
    case Operation::validate: return "validate";
  }
  return "resolve";
}

std::optional<Operation> operation_from_string(const std::string& s) {
  if (s == "resolve")  return Operation::resolve;
  if (s == "execute")  return Operation::execute;
  if (s == "validate") return Operation::validate;
  return std::nullopt;
}

std::string decision_type(const Decision& d) {
  struct Visitor {
    std::string operator()(const Allow&) const { return "allow"; }
    std::string operator()(const Deny&) const { return "deny"; }
    std::string operator()(const RequiresApproval&) const { return "requires_approval"; }
    std::string operator()(const Partial&) const { return "partial"; }
  };
  return std::visit(Visitor{}, d);
}

// ---------------------------------------------------------------------------
// CarpRequest
// ---------------------------------------------------------------------------

std::optional<Error> CarpRequest::validate() const {
  if (carp_version != version::CARP_VERSION) {
    return make_error(ErrorCode::validation_error,
                      "unsupported carp_version '" + carp_version + "', expected " + version::CARP_VERSION);
  }
  if (request_id.empty()) return make_error(ErrorCode::validation_error, "request_id is required");
  if (requester.agent_id.empty()) return make_error(ErrorCode::validation_error, "agent_id is required");
  if (requester.session_id.empty()) return make_error(ErrorCode::validation_error, "session_id is required");
  if (task.goal.empty()) return make_error(ErrorCode::validation_error, "goal is required");
  return std::nullopt;
}

CarpRequest make_request(const std::string& session_id, const std::string& agent_id,
                         const std::string& goal) {
  CarpRequest r;
  r.carp_version = version::CARP_VERSION;
  r.request_id = generate_id();
  r.timestamp_unix_ms = now_unix_ms();
  r.requester.agent_id = agent_id;
  r.requester.session_id = session_id;
  r.task.goal = goal;
  return r;
}

Value request_to_value(const CarpRequest& r) {
  Object requester;
  requester["agent_id"] = r.requester.agent_id;
  requester["session_id"] = r.requester.session_id;
  requester["parent_session_id"] = optional_to_value(r.requester.parent_session_id);

  Object task;
  task["goal"] = r.task.goal;
  task["risk_tier"] = r.task.risk_tier ? Value(to_string(*r.task.risk_tier)) : Value(nullptr);
  task["context_hints"] = jsonlite::string_array(r.task.context_hints);
  task["required_capabilities"] = jsonlite::string_array(r.task.required_capabilities);
  task["requested_actions"] = jsonlite::string_array(r.task.requested_actions);

  Object o;
  o["carp_version"] = r.carp_version;
  o["request_id"] = r.request_id;
  o["timestamp"] = r.timestamp_unix_ms;
  o["operation"] = to_string(r.operation);
  o["requester"] = std::move(requester);
  o["task"] = std::move(task);
  o["atlas_ids"] = jsonlite::string_array(r.atlas_ids);
  o["context"] = r.context;
  return o;
}

std::string request_to_json(const CarpRequest& r) {
  return jsonlite::to_json(request_to_value(r));
}

CarpRequest request_from_json(const std::string& text, std::optional<Error>* error) {
  std::optional<Error> err;
  CarpRequest r;

  std::optional<jsonlite::JsonError> json_err;
  Object o = jsonlite::parse(text, &json_err);
  if (json_err) {
    if (error) *error = make_error(ErrorCode::serialization_error, json_err->message);
    return r;
  }

  r.carp_version = require_string(o, "carp_version", &err);
  r.request_id = require_string(o, "request_id", &err);
  r.timestamp_unix_ms = jsonlite::get_u64(o, "timestamp", 0);

  const std::string op = jsonlite::get_string(o, "operation", "resolve");
  if (auto parsed = operation_from_string(op)) {
    r.operation = *parsed;
  } else if (!err) {
    err = make_error(ErrorCode::serialization_error, "unknown operation: " + op);
  }

  const Object* requester = jsonlite::get_object(o, "requester");
  const Object* task = jsonlite::get_object(o, "task");
  if (!requester || !task) {
    if (!err) err = make_error(ErrorCode::serialization_error, "requester and task objects are required");
  } else {
    r.requester.agent_id = require_string(*requester, "agent_id", &err);
    r.requester.session_id = require_string(*requester, "session_id", &err);
    r.requester.parent_session_id = optional_string(*requester, "parent_session_id", &err);

    r.task.goal = require_string(*task, "goal", &err);
    if (auto tier = optional_string(*task, "risk_tier", &err)) {
      r.task.risk_tier = risk_tier_from_string(*tier);
      if (!r.task.risk_tier && !err) {
        err = make_error(ErrorCode::serialization_error, "unknown risk_tier: " + *tier);
      }
    }
    r.task.context_hints = string_list(*task, "context_hints", &err);
    r.task.required_capabilities = string_list(*task, "required_capabilities", &err);
    r.task.requested_actions = string_list(*task, "requested_actions", &err);
  }

  r.atlas_ids = string_list(o, "atlas_ids", &err);
  if (const Object* ctx = jsonlite::get_object(o, "context")) r.context = *ctx;

  if (err && error) *error = std::move(err);
  return r;
}

// ---------------------------------------------------------------------------
// Decision
// ---------------------------------------------------------------------------

Value decision_to_value(const Decision& d) {
  Object o;
  o["type"] = decision_type(d);
  if (const auto* deny = std::get_if<Deny>(&d)) {
    o["reason"] = deny->reason;
  } else if (const auto* approval = std::get_if<RequiresApproval>(&d)) {
    o["approver"] = approval->approver;
    o["timeout_seconds"] = approval->timeout_seconds;
  } else if (const auto* partial = std::get_if<Partial>(&d)) {
    o["reason"] = partial->reason;
  }
  return o;
}

std::string decision_to_json(const Decision& d) {
  return jsonlite::to_json(decision_to_value(d));
}

Decision decision_from_value(const Value& v, std::optional<Error>* error) {
  const auto* o = std::get_if<Object>(&v.v);
  if (!o) {
    if (error) *error = make_error(ErrorCode::serialization_error, "decision must be an object");
    return Allow{};
  }
  std::optional<Error> err;
  const std::string type = require_string(*o, "type", &err);
  Decision out = Allow{};
  if (type == "allow") {
    out = Allow{};
  } else if (type == "deny") {
    out = Deny{require_string(*o, "reason", &err)};
  } else if (type == "requires_approval") {
    RequiresApproval ra;
    ra.approver = require_string(*o, "approver", &err);
    ra.timeout_seconds = require_u64(*o, "timeout_seconds", &err);
    out = ra;
  } else if (type == "partial") {
    out = Partial{require_string(*o, "reason", &err)};
  } else if (!err) {
    err = make_error(ErrorCode::serialization_error, "unknown decision type: " + type);
  }
  if (err && error) *error = std::move(err);
  return out;
}

Decision decision_from_json(const std::string& text, std::optional<Error>* error) {
  std::optional<jsonlite::JsonError> json_err;
  Value v = jsonlite::parse_value(text, &json_err);
  if (json_err) {
    if (error) *error = make_error(ErrorCode::serialization_error, json_err->message);
    return Allow{};
  }
  return decision_from_value(v, error);
}

// ---------------------------------------------------------------------------
// CarpResolution
// ---------------------------------------------------------------------------

bool CarpResolution::is_action_allowed(const std::string& action_id) const {
  return std::any_of(allowed_actions.begin(), allowed_actions.end(),
                     [&](const AllowedAction& a) { return a.action_id == action_id; });
}

std::optional<std::string> CarpResolution::denial_reason(const std::string& action_id) const {
  for (const auto& d : denied_actions) {
    if (d.action_id == action_id) return d.reason;
  }
  return std::nullopt;
}

Value resolution_to_value(const CarpResolution& r) {
  Array blocks;
  for (const auto& b : r.context_blocks) {
    Object o;
    o["block_id"] = b.block_id;
    o["name"] = b.name;
    o["content"] = b.content;
    o["content_type"] = b.content_type;
    o["source_atlas"] = b.source_atlas;
    o["priority"] = static_cast<std::int64_t>(b.priority);
    o["score"] = static_cast<std::uint64_t>(b.score);
    blocks.push_back(std::move(o));
  }

  Array allowed;
  for (const auto& a : r.allowed_actions) {
    Object o;
    o["action_id"] = a.action_id;
    o["name"] = a.name;
    if (a.description) o["description"] = *a.description;
    o["parameters_schema"] = a.parameters_schema;
    o["risk_tier"] = to_string(a.risk_tier);
    allowed.push_back(std::move(o));
  }

  Array denied;
  for (const auto& d : r.denied_actions) {
    Object o;
    o["action_id"] = d.action_id;
    o["reason"] = d.reason;
    denied.push_back(std::move(o));
  }

  Array constraints;
  for (const auto& c : r.constraints) {
    Object o;
    o["id"] = c.id;
    o["description"] = c.description;
    constraints.push_back(std::move(o));
  }

  Object o;
  o["carp_version"] = r.carp_version;
  o["resolution_id"] = r.resolution_id;
  o["request_id"] = r.request_id;
  o["session_id"] = r.session_id;
  o["timestamp"] = r.timestamp_unix_ms;
  o["decision"] = decision_to_value(r.decision);
  o["context_blocks"] = std::move(blocks);
  o["allowed_actions"] = std::move(allowed);
  o["denied_actions"] = std::move(denied);
  o["constraints"] = std::move(constraints);
  o["ttl_seconds"] = r.ttl_seconds;
  o["trace_id"] = r.trace_id;
  return o;
}

std::string resolution_to_json(const CarpResolution& r) {
  return jsonlite::to_json(resolution_to_value(r));
}

// ---------------------------------------------------------------------------
// TRACE events
// ---------------------------------------------------------------------------

RawEvent make_raw_event(const std::string& session_id, const std::string& trace_id,
                        const std::string& event_type, Object payload) {
  RawEvent e;
  e.session_id = session_id;
  e.trace_id = trace_id;
  e.event_id = generate_id();
  e.span_id = generate_id();
  e.event_type = event_type;
  e.payload = std::move(payload);
  e.timestamp_unix_ms = now_unix_ms();
  return e;
}

Value event_to_value(const TraceEvent& e) {
  Object o;
  o["trace_version"] = e.trace_version;
  o["session_id"] = e.session_id;
  o["trace_id"] = e.trace_id;
  o["event_id"] = e.event_id;
  o["span_id"] = e.span_id;
  o["parent_span_id"] = optional_to_value(e.parent_span_id);
  o["sequence"] = e.sequence;
  o["timestamp"] = e.timestamp_unix_ms;
  o["event_type"] = e.event_type;
  o["payload"] = e.payload;
  o["event_hash"] = e.event_hash;
  o["previous_event_hash"] = e.previous_event_hash;
  return o;
}

std::string event_to_json(const TraceEvent& e) {
  return jsonlite::to_json(event_to_value(e));
}

TraceEvent event_from_json(const std::string& text, std::optional<Error>* error) {
  TraceEvent e;
  std::optional<jsonlite::JsonError> json_err;
  Object o = jsonlite::parse(text, &json_err);
  if (json_err) {
    if (error) *error = make_error(ErrorCode::serialization_error, json_err->message);
    return e;
  }

  std::optional<Error> err;
  e.trace_version = require_string(o, "trace_version", &err);
  e.session_id = require_string(o, "session_id", &err);
  e.trace_id = require_string(o, "trace_id", &err);
  e.event_id = require_string(o, "event_id", &err);
  e.span_id = require_string(o, "span_id", &err);
  e.parent_span_id = optional_string(o, "parent_span_id", &err);
  e.sequence = require_u64(o, "sequence", &err);
  e.timestamp_unix_ms = require_u64(o, "timestamp", &err);
  e.event_type = require_string(o, "event_type", &err);
  if (const Object* payload = jsonlite::get_object(o, "payload")) {
    e.payload = *payload;
  } else if (!err) {
    err = make_error(ErrorCode::serialization_error, "missing or non-object field: payload");
  }
  e.event_hash = require_string(o, "event_hash", &err);
  e.previous_event_hash = require_string(o, "previous_event_hash", &err);

  if (err && error) *error = std::move(err);
  return e;
}

}  // namespace cra
