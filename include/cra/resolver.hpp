#pragma once

// cra/resolver.hpp: Per-session orchestration. The single entry point every
// transport (tool-protocol server, REST server, proxy, bindings) calls.
//
// SESSION STATE MACHINE:
//   created --resolve|execute--> active --end_session--> ended (terminal)
//   created --end_session--> ended
//
// EVENT ORDER for one resolve():
//   carp.request.received
//   policy.evaluated
//   context.injected            (one per injected block, rank order)
//   carp.resolution.completed
// They are built after policy evaluation and context matching have both
// finished and recorded as one TraceLog batch: all reach the chain, contiguous
// and in this order, or none does and resolve() fails with backpressure.
//
// EVENT ORDER for one execute():
//   action.requested
//   action.denied                          (refused)
//   action.approved, action.executed       (permitted)
// Also recorded as one batch.
//
// USAGE LEDGER:
//   Rate-limit history is kept per session and per agent, and pruned on every
//   resolve to the longest rate-limit window among the loaded atlases.
//
// CONCURRENCY:
//   A Resolver is NOT safe for concurrent mutation. Transports serialize access
//   (one lock around the instance) or give each caller its own Resolver. Only
//   the embedded TraceLog is internally synchronized.
//
// ERRORS:
//   Every operation reports failure through a returned std::optional<Error> or a
//   std::optional<Error>* out-parameter. See cra/types.hpp.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "cra/atlas.hpp"
#include "cra/config.hpp"
#include "cra/context.hpp"
#include "cra/policy.hpp"
#include "cra/protocol.hpp"
#include "cra/trace.hpp"
#include "cra/types.hpp"

namespace cra {

enum class SessionState {
  created,
  active,
  ended,
};

std::string to_string(SessionState state);

struct Session {
  std::string             session_id;
  std::string             agent_id;
  std::string             goal;
  std::string             trace_id;
  SessionState            state{SessionState::created};
  uint64_t                resolution_count{0};
  uint64_t                action_count{0};
  uint64_t                created_at_unix_ms{0};
  std::optional<uint64_t> ended_at_unix_ms;
  // Timestamps of counted resolves, input to session-scoped rate limits.
  std::vector<uint64_t>   request_times;
};

class Resolver {
 public:
  explicit Resolver(ResolverConfig config = {});

  Resolver(const Resolver&) = delete;
  Resolver& operator=(const Resolver&) = delete;

  // Generates the session id. Returns "" and sets *error on failure.
  std::string create_session(const std::string& agent_id, const std::string& goal,
                             std::optional<Error>* error);

  // Caller-chosen id. already_exists on duplicates.
  std::optional<Error> create_session(const std::string& session_id, const std::string& agent_id,
                                      const std::string& goal);

  CarpResolution resolve(const std::string& session_id, const std::string& agent_id,
                         const CarpRequest& request, std::optional<Error>* error);

  // resolution_id is an audit reference to a resolution issued earlier in the
  // session. Returns the execution record; action_denied when the deny gate
  // refuses, not_found for an action no loaded atlas provides.
  jsonlite::Object execute(const std::string& session_id, const std::string& agent_id,
                           const std::string& resolution_id, const std::string& action_id,
                           const jsonlite::Object& parameters, std::optional<Error>* error);

  std::optional<Error> end_session(const std::string& session_id);

  std::vector<TraceEvent> get_trace(const std::string& session_id, std::optional<Error>* error);
  ChainVerification verify_chain(const std::string& session_id, std::optional<Error>* error);

  // Registers the atlas and its context packs.
  std::optional<Error> load_atlas(AtlasManifest manifest);
  // Replaces the atlas and re-registers its packs.
  std::optional<Error> reload_atlas(AtlasManifest manifest);
  // Drops the atlas and its context packs. Sessions keep running against the
  // remaining atlases.
  std::optional<Error> unload_atlas(const std::string& atlas_id);

  // Ad-hoc pack, eligible regardless of atlas scope.
  void add_context(LoadedContext entry);

  const Session* get_session(const std::string& session_id) const;
  std::size_t session_count() const { return sessions_.size(); }

  const ResolverConfig& config() const { return cfg_; }
  const AtlasRegistry& atlases() const { return atlases_; }
  const ContextRegistry& contexts() const { return contexts_; }
  TraceLog& trace_log() { return trace_; }

 private:
  RawEvent make_event(const Session& s, const std::string& type, jsonlite::Object payload,
                      const std::optional<std::string>& parent_span_id = std::nullopt) const;
  // Records one event on the session's chain.
  std::optional<Error> emit(const Session& s, const std::string& type, jsonlite::Object payload);

  AtlasView loaded_view() const;
  AtlasView atlas_view(const CarpRequest& request, std::optional<Error>* error) const;
  void register_packs(const AtlasManifest& manifest);
  void refresh_usage_retention();

  ResolverConfig                               cfg_;
  AtlasRegistry                                atlases_;
  ContextRegistry                              contexts_;
  PolicyEvaluator                              evaluator_;
  std::map<std::string, Session>               sessions_;
  std::map<std::string, std::vector<uint64_t>> agent_usage_;
  uint64_t                                     usage_retention_ms_{0};
  TraceLog                                     trace_;
};

}  // namespace cra
