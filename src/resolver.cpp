#include "cra/resolver.hpp"

#include <future>

#include "cra/hash.hpp"
#include "cra/observability.hpp"
#include "cra/version.hpp"

namespace cra {

namespace {

std::vector<std::string> request_files(const CarpRequest& request) {
  return jsonlite::get_string_array(request.context, "files");
}

// Drops timestamps no loaded rate-limit window can reach. With no window at all
// the ledger empties.
void prune_usage(std::vector<uint64_t>* times, uint64_t now, uint64_t retention_ms) {
  std::erase_if(*times, [&](uint64_t t) { return t <= now && now - t >= retention_ms; });
}

}  // namespace

std::string to_string(SessionState state) {
  switch (state) {
    case SessionState::created: return "created";
    case SessionState::active:  return "active";
    case SessionState::ended:   return "ended";
  }
  return "created";
}

Resolver::Resolver(ResolverConfig config)
    : cfg_(std::move(config)),
      evaluator_(cfg_.policy_config()),
      trace_(cfg_.trace_queue_capacity, cfg_.genesis_seed) {}

// ---------------------------------------------------------------------------
// Sessions
// ---------------------------------------------------------------------------

std::string Resolver::create_session(const std::string& agent_id, const std::string& goal,
                                     std::optional<Error>* error) {
  std::string id = generate_id();
  if (auto err = create_session(id, agent_id, goal)) {
    if (error) *error = std::move(err);
    return {};
  }
  return id;
}

std::optional<Error> Resolver::create_session(const std::string& session_id, const std::string& agent_id,
                                              const std::string& goal) {
  if (session_id.empty()) return make_error(ErrorCode::validation_error, "session_id is required");
  if (agent_id.empty()) return make_error(ErrorCode::validation_error, "agent_id is required");
  if (sessions_.contains(session_id)) {
    return make_error(ErrorCode::already_exists, "session already exists: " + session_id);
  }

  Session s;
  s.session_id = session_id;
  s.agent_id = agent_id;
  s.goal = goal;
  s.trace_id = generate_id();
  s.created_at_unix_ms = now_unix_ms();

  jsonlite::Object digests;
  for (const auto& id : atlases_.list()) digests[id] = atlases_.digest(id);

  jsonlite::Object payload;
  payload["agent_id"] = agent_id;
  payload["goal"] = goal;
  payload["carp_version"] = version::CARP_VERSION;
  payload["atlas_digests"] = std::move(digests);
  payload["genesis_seed"] = cfg_.genesis_seed;

  if (auto err = emit(s, event_type::session_started, std::move(payload))) return err;

  sessions_.emplace(session_id, std::move(s));
  global_resolver_stats().sessions_started.fetch_add(1, std::memory_order_relaxed);
  log(LogLevel::info, "resolver", "session started " + session_id + " for agent " + agent_id);
  return std::nullopt;
}

std::optional<Error> Resolver::end_session(const std::string& session_id) {
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) return make_error(ErrorCode::not_found, "unknown session: " + session_id);
  Session& s = it->second;
  if (s.state == SessionState::ended) {
    return make_error(ErrorCode::invalid_state, "session already ended: " + session_id);
  }

  const uint64_t now = now_unix_ms();
  jsonlite::Object payload;
  payload["resolution_count"] = s.resolution_count;
  payload["duration_ms"] = now >= s.created_at_unix_ms ? now - s.created_at_unix_ms : uint64_t{0};
  if (auto err = emit(s, event_type::session_ended, std::move(payload))) return err;

  s.state = SessionState::ended;
  s.ended_at_unix_ms = now;
  global_resolver_stats().sessions_ended.fetch_add(1, std::memory_order_relaxed);
  log(LogLevel::info, "resolver", "session ended " + session_id);
  return std::nullopt;
}

const Session* Resolver::get_session(const std::string& session_id) const {
  auto it = sessions_.find(session_id);
  return it == sessions_.end() ? nullptr : &it->second;
}

// ---------------------------------------------------------------------------
// Resolution
// ---------------------------------------------------------------------------

AtlasView Resolver::loaded_view() const {
  AtlasView view;
  for (const auto& id : atlases_.list()) view.push_back(atlases_.get(id));
  return view;
}

AtlasView Resolver::atlas_view(const CarpRequest& request, std::optional<Error>* error) const {
  if (request.atlas_ids.empty()) return loaded_view();
  AtlasView view;
  for (const auto& id : request.atlas_ids) {
    auto atlas = atlases_.get(id);
    if (!atlas) {
      if (error) *error = make_error(ErrorCode::not_found, "atlas not loaded: " + id);
      return {};
    }
    view.push_back(std::move(atlas));
  }
  return view;
}

CarpResolution Resolver::resolve(const std::string& session_id, const std::string& agent_id,
                                 const CarpRequest& request, std::optional<Error>* error) {
  ResolutionEvent ev;
  ev.session_id = session_id;
  ev.agent_id = agent_id;
  ev.request_id = request.request_id;

  CarpResolution res;
  std::optional<Error> err;
  {
    ScopeTimer timer(ev.duration_ns);
    [&] {
      auto it = sessions_.find(session_id);
      if (it == sessions_.end()) {
        err = make_error(ErrorCode::not_found, "unknown session: " + session_id);
        return;
      }
      Session& s = it->second;
      if (s.state == SessionState::ended) {
        err = make_error(ErrorCode::invalid_state, "session ended: " + session_id);
        return;
      }
      if (auto v = request.validate()) {
        err = std::move(v);
        return;
      }
      if (request.operation == Operation::execute) {
        err = make_error(ErrorCode::validation_error,
                         "execute requests are not resolved; call execute() with a resolution id");
        return;
      }
      if (agent_id != s.agent_id || request.requester.agent_id != s.agent_id) {
        err = make_error(ErrorCode::validation_error, "agent " + agent_id + " does not own session " + session_id);
        return;
      }
      if (request.requester.session_id != session_id) {
        err = make_error(ErrorCode::validation_error,
                         "request addressed to session " + request.requester.session_id);
        return;
      }
      AtlasView view = atlas_view(request, &err);
      if (err) return;

      const uint64_t now = now_unix_ms();
      std::vector<uint64_t>& agent_times = agent_usage_[agent_id];
      prune_usage(&agent_times, now, usage_retention_ms_);
      prune_usage(&s.request_times, now, usage_retention_ms_);
      UsageSnapshot usage;
      usage.now_unix_ms = now;
      usage.agent_request_times = agent_times;
      usage.session_request_times = s.request_times;

      EvalContext eval;
      eval.files = request_files(request);
      eval.capabilities = request.task.required_capabilities;
      eval.risk_tier = request.task.risk_tier;
      eval.atlas_scope = request.atlas_ids;

      // Policy evaluation and context matching share no state; both finish
      // before anything is recorded.
      EvaluationResult verdict;
      std::vector<MatchResult> matches;
      if (cfg_.parallel_evaluation) {
        auto pending = std::async(std::launch::async, [&] {
          return evaluator_.evaluate_detailed(request, view, usage);
        });
        matches = contexts_.query(request.task.goal, request.task.context_hints, eval, cfg_.max_context_blocks);
        verdict = pending.get();
      } else {
        verdict = evaluator_.evaluate_detailed(request, view, usage);
        matches = contexts_.query(request.task.goal, request.task.context_hints, eval, cfg_.max_context_blocks);
      }

      res.carp_version = version::CARP_VERSION;
      res.resolution_id = generate_id();
      res.request_id = request.request_id;
      res.session_id = session_id;
      res.timestamp_unix_ms = now;
      res.decision = verdict.decision;
      res.ttl_seconds = cfg_.default_ttl_seconds;
      res.trace_id = s.trace_id;
      for (const auto& atlas : view) {
        res.constraints.insert(res.constraints.end(), atlas->constraints.begin(), atlas->constraints.end());
      }

      std::vector<AllowedAction> allowed;
      evaluator_.partition_actions(view, &allowed, &res.denied_actions);
      if (const auto* deny = std::get_if<Deny>(&res.decision)) {
        // A denied resolution grants nothing and injects nothing.
        for (const auto& a : allowed) res.denied_actions.push_back(DeniedAction{a.action_id, deny->reason});
      } else {
        res.allowed_actions = std::move(allowed);
        for (const auto& m : matches) {
          ContextBlock b;
          b.block_id = m.pack_id;
          b.name = m.entry->name;
          b.content = m.entry->content;
          b.content_type = m.entry->content_type;
          b.source_atlas = m.entry->source_atlas;
          b.priority = m.entry->priority;
          b.score = m.score;
          res.context_blocks.push_back(std::move(b));
        }
      }

      // Events, in protocol order, recorded as one batch.
      std::vector<RawEvent> batch;
      jsonlite::Object received;
      received["request_id"] = request.request_id;
      received["agent_id"] = agent_id;
      received["goal"] = request.task.goal;
      received["operation"] = to_string(request.operation);
      received["atlas_ids"] = jsonlite::string_array(request.atlas_ids);
      received["request_digest"] = request_digest(request_to_json(request));
      batch.push_back(make_event(s, event_type::request_received, std::move(received)));
      const std::string request_span = batch.back().span_id;

      jsonlite::Object evaluated;
      evaluated["decision"] = decision_to_value(res.decision);
      evaluated["category"] = verdict.category;
      evaluated["policy_id"] = verdict.policy_id.empty() ? jsonlite::Value(nullptr) : jsonlite::Value(verdict.policy_id);
      batch.push_back(make_event(s, event_type::policy_evaluated, std::move(evaluated), request_span));

      for (const auto& b : res.context_blocks) {
        jsonlite::Object injected;
        injected["block_id"] = b.block_id;
        injected["source_atlas"] = b.source_atlas;
        injected["priority"] = static_cast<std::int64_t>(b.priority);
        injected["score"] = static_cast<std::uint64_t>(b.score);
        injected["content_digest"] = sha256_hex(b.content);
        batch.push_back(make_event(s, event_type::context_injected, std::move(injected), request_span));
      }

      jsonlite::Object completed;
      completed["resolution_id"] = res.resolution_id;
      completed["request_id"] = res.request_id;
      completed["decision"] = decision_to_value(res.decision);
      completed["context_block_count"] = static_cast<std::uint64_t>(res.context_blocks.size());
      completed["allowed_action_count"] = static_cast<std::uint64_t>(res.allowed_actions.size());
      completed["denied_action_count"] = static_cast<std::uint64_t>(res.denied_actions.size());
      completed["ttl_seconds"] = res.ttl_seconds;
      batch.push_back(make_event(s, event_type::resolution_completed, std::move(completed), request_span));
      if ((err = trace_.record_batch(std::move(batch)))) return;

      // Rate-limited resolves do not consume quota.
      if (verdict.category != "rate_limit") {
        s.request_times.push_back(now);
        agent_times.push_back(now);
      }
      s.resolution_count++;
      s.state = SessionState::active;
    }();
  }

  ev.ok = !err.has_value();
  if (err) {
    ev.error_code = to_string(err->code);
    log(LogLevel::warn, "resolver", "resolve failed for session " + session_id + ": " + err->message);
    if (error) *error = err;
    res = CarpResolution{};
  } else {
    ev.resolution_id = res.resolution_id;
    ev.decision = decision_type(res.decision);
    ev.context_blocks = res.context_blocks.size();
    ev.allowed_actions = res.allowed_actions.size();
    ev.denied_actions = res.denied_actions.size();
  }
  emit_resolution_event(ev, cfg_.event_log_path);
  return res;
}

// ---------------------------------------------------------------------------
// Execution
// ---------------------------------------------------------------------------

jsonlite::Object Resolver::execute(const std::string& session_id, const std::string& agent_id,
                                   const std::string& resolution_id, const std::string& action_id,
                                   const jsonlite::Object& parameters, std::optional<Error>* error) {
  auto fail = [&](Error e) {
    log(LogLevel::warn, "resolver", "execute " + action_id + " failed for session " + session_id + ": " + e.message);
    if (error) *error = std::move(e);
    return jsonlite::Object{};
  };

  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) return fail(make_error(ErrorCode::not_found, "unknown session: " + session_id));
  Session& s = it->second;
  if (s.state == SessionState::ended) {
    return fail(make_error(ErrorCode::invalid_state, "session ended: " + session_id));
  }
  if (agent_id != s.agent_id) {
    return fail(make_error(ErrorCode::validation_error,
                           "agent " + agent_id + " does not own session " + session_id));
  }
  if (resolution_id.empty() || action_id.empty()) {
    return fail(make_error(ErrorCode::validation_error, "resolution_id and action_id are required"));
  }

  const AtlasView view = loaded_view();
  const std::string execution_id = generate_id();

  jsonlite::Object requested;
  requested["action_id"] = action_id;
  requested["resolution_id"] = resolution_id;
  requested["execution_id"] = execution_id;
  requested["parameters_hash"] = sha256_hex(jsonlite::to_json(parameters));
  std::vector<RawEvent> batch;
  batch.push_back(make_event(s, event_type::action_requested, std::move(requested)));
  const std::string request_span = batch.back().span_id;

  auto refuse = [&](ErrorCode code, const std::string& reason, const std::string& policy_id) {
    jsonlite::Object denied;
    denied["action_id"] = action_id;
    denied["execution_id"] = execution_id;
    denied["reason"] = reason;
    denied["policy_id"] = policy_id.empty() ? jsonlite::Value(nullptr) : jsonlite::Value(policy_id);
    batch.push_back(make_event(s, event_type::action_denied, std::move(denied), request_span));
    if (auto err = trace_.record_batch(std::move(batch))) return fail(std::move(*err));
    return fail(make_error(code, reason));
  };

  std::string policy_id;
  if (auto deny = evaluator_.gate_action(view, action_id, &policy_id)) {
    return refuse(ErrorCode::action_denied, deny->reason, policy_id);
  }
  const AtlasAction* action = nullptr;
  for (const auto& atlas : view) {
    if ((action = atlas->find_action(action_id))) break;
  }
  if (!action) {
    return refuse(ErrorCode::not_found, "action '" + action_id + "' is not provided by any loaded atlas", {});
  }

  jsonlite::Object result;
  result["status"] = "success";
  result["action_id"] = action_id;
  result["execution_id"] = execution_id;
  result["message"] = "action " + action->name + " executed";

  jsonlite::Object approved;
  approved["action_id"] = action_id;
  approved["resolution_id"] = resolution_id;
  approved["execution_id"] = execution_id;
  batch.push_back(make_event(s, event_type::action_approved, std::move(approved), request_span));

  jsonlite::Object executed;
  executed["action_id"] = action_id;
  executed["execution_id"] = execution_id;
  executed["result_hash"] = sha256_hex(jsonlite::to_json(result));
  batch.push_back(make_event(s, event_type::action_executed, std::move(executed), request_span));

  if (auto err = trace_.record_batch(std::move(batch))) return fail(std::move(*err));

  s.action_count++;
  s.state = SessionState::active;
  log(LogLevel::info, "resolver", "executed " + action_id + " in session " + session_id);
  return result;
}

// ---------------------------------------------------------------------------
// TRACE access
// ---------------------------------------------------------------------------

RawEvent Resolver::make_event(const Session& s, const std::string& type, jsonlite::Object payload,
                              const std::optional<std::string>& parent_span_id) const {
  RawEvent raw = make_raw_event(s.session_id, s.trace_id, type, std::move(payload));
  raw.parent_span_id = parent_span_id;
  return raw;
}

std::optional<Error> Resolver::emit(const Session& s, const std::string& type, jsonlite::Object payload) {
  return trace_.record(make_event(s, type, std::move(payload)));
}

std::vector<TraceEvent> Resolver::get_trace(const std::string& session_id, std::optional<Error>* error) {
  if (!sessions_.contains(session_id)) {
    if (error) *error = make_error(ErrorCode::not_found, "unknown session: " + session_id);
    return {};
  }
  return trace_.get_trace(session_id, error);
}

ChainVerification Resolver::verify_chain(const std::string& session_id, std::optional<Error>* error) {
  if (!sessions_.contains(session_id)) {
    if (error) *error = make_error(ErrorCode::not_found, "unknown session: " + session_id);
    return ChainVerification{false, 0, std::nullopt, std::nullopt, "unknown session " + session_id, {}};
  }
  return trace_.verify_chain(session_id, error);
}

// ---------------------------------------------------------------------------
// Atlases and context
// ---------------------------------------------------------------------------

void Resolver::register_packs(const AtlasManifest& manifest) {
  for (const auto& pack : manifest.context_packs) {
    contexts_.add_context(context_from_pack(pack, manifest.atlas_id));
  }
}

std::optional<Error> Resolver::load_atlas(AtlasManifest manifest) {
  const std::string id = manifest.atlas_id;
  if (auto err = atlases_.load(std::move(manifest))) {
    log(LogLevel::warn, "atlas", "load rejected: " + err->message);
    return err;
  }
  register_packs(*atlases_.get(id));
  refresh_usage_retention();
  log(LogLevel::info, "atlas", "loaded " + id + " digest " + atlases_.digest(id));
  return std::nullopt;
}

std::optional<Error> Resolver::reload_atlas(AtlasManifest manifest) {
  const std::string id = manifest.atlas_id;
  if (auto err = atlases_.reload(std::move(manifest))) {
    log(LogLevel::warn, "atlas", "reload rejected: " + err->message);
    return err;
  }
  contexts_.remove_source(id);
  register_packs(*atlases_.get(id));
  refresh_usage_retention();
  log(LogLevel::info, "atlas", "reloaded " + id + " digest " + atlases_.digest(id));
  return std::nullopt;
}

std::optional<Error> Resolver::unload_atlas(const std::string& atlas_id) {
  if (auto err = atlases_.unload(atlas_id)) {
    log(LogLevel::warn, "atlas", "unload rejected: " + err->message);
    return err;
  }
  contexts_.remove_source(atlas_id);
  refresh_usage_retention();
  log(LogLevel::info, "atlas", "unloaded " + atlas_id);
  return std::nullopt;
}

void Resolver::refresh_usage_retention() {
  usage_retention_ms_ = longest_rate_window_ms(loaded_view());
}

void Resolver::add_context(LoadedContext entry) {
  entry.source_atlas.clear();
  contexts_.add_context(std::move(entry));
}

}  // namespace cra
