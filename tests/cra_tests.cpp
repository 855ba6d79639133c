#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "cra/atlas.hpp"
#include "cra/config.hpp"
#include "cra/context.hpp"
#include "cra/hash.hpp"
#include "cra/jsonlite.hpp"
#include "cra/observability.hpp"
#include "cra/policy.hpp"
#include "cra/protocol.hpp"
#include "cra/resolver.hpp"
#include "cra/trace.hpp"
#include "cra/version.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

// ----------------------------------------------------------------------------
// Fixtures
// ----------------------------------------------------------------------------

cra::AtlasAction action(const std::string& id, cra::RiskTier tier) {
  cra::AtlasAction a;
  a.action_id = id;
  a.name = id;
  a.description = "performs " + id;
  a.parameters_schema = cra::jsonlite::Object{{"type", "object"}};
  a.risk_tier = tier;
  return a;
}

cra::AtlasPolicy policy(const std::string& id, cra::PolicyType type, std::vector<std::string> actions,
                        cra::jsonlite::Object params = {}) {
  cra::AtlasPolicy p;
  p.policy_id = id;
  p.type = type;
  p.actions = std::move(actions);
  p.parameters = std::move(params);
  return p;
}

cra::AtlasContextPack pack(const std::string& id, int32_t priority, std::vector<std::string> keywords) {
  cra::AtlasContextPack p;
  p.pack_id = id;
  p.name = id;
  p.content = "content of " + id;
  p.priority = priority;
  p.keywords = std::move(keywords);
  return p;
}

// Ticketing atlas used across phases:
//   ticket.get    low
//   ticket.close  medium
//   ticket.delete high     (requires_approval policy, approver "security")
//   db.purge      critical (deny policy)
cra::AtlasManifest make_atlas(const std::string& id = "ops") {
  cra::AtlasManifest m;
  m.atlas_id = id;
  m.version = "1.0.0";
  m.name = "Operations";
  m.description = "ticket handling";
  m.domains = {"support"};
  m.capabilities.push_back(cra::AtlasCapability{"tickets", "Tickets", "", {"ticket.get", "ticket.close"}});
  m.actions = {action("ticket.get", cra::RiskTier::low), action("ticket.close", cra::RiskTier::medium),
               action("ticket.delete", cra::RiskTier::high), action("db.purge", cra::RiskTier::critical)};
  cra::AtlasPolicy no_purge = policy("no-purge", cra::PolicyType::deny, {"db.*"});
  no_purge.reason = "purging is forbidden";
  m.policies = {no_purge,
                policy("delete-approval", cra::PolicyType::requires_approval, {"ticket.delete"},
                       cra::jsonlite::Object{{"approver", "security"}, {"timeout_seconds", 600}})};
  m.constraints = {cra::Constraint{"c-business-hours", "no writes outside business hours"}};
  m.context_packs = {pack("trace-guide", 100, {"hash", "trace", "event"}),
                     pack("ticket-guide", 10, {"ticket", "support"})};
  return m;
}

cra::AtlasView view_of(const cra::AtlasManifest& m) {
  return cra::AtlasView{std::make_shared<const cra::AtlasManifest>(m)};
}

cra::CarpRequest request_for(const std::string& session, const std::string& agent, const std::string& goal) {
  cra::CarpRequest r = cra::make_request(session, agent, goal);
  r.atlas_ids = {"ops"};
  return r;
}

cra::RawEvent raw_event(const std::string& session, const std::string& type, int n) {
  return cra::make_raw_event(session, "trace-" + session, type, cra::jsonlite::Object{{"n", n}});
}

cra::ResolverConfig quiet_config() {
  cra::ResolverConfig cfg;
  cfg.event_log_path = "";
  return cfg;
}

// ============================================================================
// Phase 1: Hash primitives
// ============================================================================

void test_sha256_known_vectors() {
  expect(cra::sha256_hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
         "SHA-256 empty vector");
  expect(cra::sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
         "SHA-256 abc vector");
}

void test_blake3_known_vectors() {
  expect(cra::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
}

void test_domain_separation() {
  const std::string payload = "{\"a\":1}";
  expect(cra::atlas_digest(payload) != cra::request_digest(payload), "atlas and request domains must differ");
  expect(cra::atlas_digest(payload) == cra::hash_domain("atlas:", payload), "atlas digest uses atlas: domain");
  expect(cra::atlas_digest(payload) != cra::blake3_hex(payload), "domain digest differs from raw digest");
}

void test_hex_digest_shape() {
  expect(cra::is_hex_digest(cra::kZeroGenesis), "zero genesis is a hex digest");
  expect(cra::is_hex_digest(cra::sha256_hex("x")), "sha256 output is a hex digest");
  expect(!cra::is_hex_digest("ABC"), "short string rejected");
  expect(!cra::is_hex_digest(std::string(64, 'G')), "non-hex rejected");
  expect(!cra::is_hex_digest(std::string(64, 'A')), "upper-case rejected");
}

// ============================================================================
// Phase 2: JSON canonicalization
// ============================================================================

void test_json_canonicalization() {
  std::optional<cra::jsonlite::JsonError> err;
  const std::string a = cra::jsonlite::canonicalize_json("{\"b\": 1, \"a\": [true, null, \"x\"]}", &err);
  expect(!err, "canonicalize must succeed");
  expect(a == "{\"a\":[true,null,\"x\"],\"b\":1}", "keys sorted and whitespace removed: " + a);
  const std::string b = cra::jsonlite::canonicalize_json("{\"a\":[true,null,\"x\"],   \"b\":1}", &err);
  expect(a == b, "equivalent documents canonicalize identically");
}

void test_json_strictness() {
  expect(cra::jsonlite::validate_strict("{\"a\":1,\"a\":2}").has_value(), "duplicate keys rejected");
  expect(cra::jsonlite::validate_strict("{\"a\":1,\"a\":2}")->code == "json_duplicate_key", "duplicate key code");
  expect(cra::jsonlite::validate_strict("{\"a\":1} trailing").has_value(), "trailing data rejected");
  expect(cra::jsonlite::validate_strict("{\"a\":NaN}").has_value(), "NaN rejected");
  expect(!cra::jsonlite::validate_strict("{\"a\":\"\\u00e9\"}").has_value(), "unicode escape accepted");
}

void test_json_surrogate_pairs() {
  expect(!cra::jsonlite::validate_strict("{\"a\":\"\\ud83d\\ude00\"}").has_value(), "surrogate pair accepted");
  std::optional<cra::jsonlite::JsonError> err;
  auto o = cra::jsonlite::parse("{\"a\":\"\\ud83d\\ude00\"}", &err);
  expect(!err && cra::jsonlite::get_string(o, "a") == "\xF0\x9F\x98\x80", "pair decodes to one code point");
  expect(cra::jsonlite::validate_strict("{\"a\":\"\\ud800\"}").has_value(), "high surrogate at end rejected");
  expect(cra::jsonlite::validate_strict("{\"a\":\"\\ud800x\"}").has_value(), "high surrogate before text rejected");
  expect(cra::jsonlite::validate_strict("{\"a\":\"\\ud800\\u0041\"}").has_value(),
         "high surrogate before non-surrogate rejected");
  expect(cra::jsonlite::validate_strict("{\"a\":\"\\udc00\"}").has_value(), "lone low surrogate rejected");
}

void test_json_integer_accessors() {
  cra::jsonlite::Object o{{"n", 5}, {"neg", -3}, {"big", std::uint64_t{1} << 40}};
  expect(cra::jsonlite::get_u64(o, "n", 0) == 5, "non-negative int64 readable as u64");
  expect(cra::jsonlite::get_u64(o, "neg", 7) == 7, "negative int64 falls back to default");
  expect(cra::jsonlite::get_i64(o, "big", 0) == (std::int64_t{1} << 40), "u64 readable as i64");
}

// ============================================================================
// Phase 3: Protocol model
// ============================================================================

void test_request_validation() {
  cra::CarpRequest r = cra::make_request("s1", "agent-1", "close stale tickets");
  expect(!r.validate(), "well-formed request validates");

  cra::CarpRequest no_goal = r;
  no_goal.task.goal.clear();
  auto err = no_goal.validate();
  expect(err && err->code == cra::ErrorCode::validation_error, "missing goal is a validation error");

  cra::CarpRequest no_agent = r;
  no_agent.requester.agent_id.clear();
  expect(no_agent.validate().has_value(), "empty agent id rejected");

  cra::CarpRequest old_version = r;
  old_version.carp_version = "0.9";
  err = old_version.validate();
  expect(err && err->message.find("carp_version") != std::string::npos, "unsupported version rejected");
}

void test_request_json_roundtrip() {
  cra::CarpRequest r = cra::make_request("s1", "agent-1", "inspect ticket");
  r.task.risk_tier = cra::RiskTier::medium;
  r.task.context_hints = {"support"};
  r.task.requested_actions = {"ticket.get"};
  r.atlas_ids = {"ops"};
  r.context["files"] = cra::jsonlite::string_array({"src/main.cpp"});

  std::optional<cra::Error> err;
  cra::CarpRequest back = cra::request_from_json(cra::request_to_json(r), &err);
  expect(!err, "request parses back");
  expect(cra::request_to_json(back) == cra::request_to_json(r), "request JSON is stable across a round trip");
  expect(back.task.risk_tier == cra::RiskTier::medium, "risk tier preserved");
}

void test_request_parse_errors() {
  std::optional<cra::Error> err;
  cra::request_from_json("{not json", &err);
  expect(err && err->code == cra::ErrorCode::serialization_error, "malformed JSON is a serialization error");

  err.reset();
  cra::request_from_json("{\"carp_version\":\"1.0\",\"request_id\":\"r\"}", &err);
  expect(err && err->code == cra::ErrorCode::serialization_error, "missing requester/task is a serialization error");

  err.reset();
  cra::request_from_json(
      "{\"carp_version\":\"1.0\",\"request_id\":\"r\",\"requester\":{\"agent_id\":\"a\",\"session_id\":\"s\"},"
      "\"task\":{\"goal\":\"g\",\"risk_tier\":\"extreme\"}}",
      &err);
  expect(err && err->message.find("risk_tier") != std::string::npos, "unknown risk tier reported");
}

void test_decision_encoding() {
  expect(cra::decision_to_json(cra::Allow{}) == "{\"type\":\"allow\"}", "allow encoding");
  expect(cra::decision_to_json(cra::Deny{"no"}) == "{\"reason\":\"no\",\"type\":\"deny\"}", "deny encoding");
  expect(cra::decision_to_json(cra::RequiresApproval{"ops", 60}) ==
             "{\"approver\":\"ops\",\"timeout_seconds\":60,\"type\":\"requires_approval\"}",
         "approval encoding");

  std::optional<cra::Error> err;
  cra::Decision d = cra::decision_from_value(cra::decision_to_value(cra::Partial{"some"}), &err);
  expect(!err && d == cra::Decision{cra::Partial{"some"}}, "partial decodes");

  cra::decision_from_value(cra::jsonlite::Object{{"type", "maybe"}}, &err);
  expect(err && err->code == cra::ErrorCode::serialization_error, "unknown decision type rejected");

  err.reset();
  d = cra::decision_from_json("{\"approver\":\"ops\",\"timeout_seconds\":60,\"type\":\"requires_approval\"}", &err);
  expect(!err && d == cra::Decision{cra::RequiresApproval{"ops", 60}}, "approval decodes from text");
  cra::decision_from_json("[", &err);
  expect(err && err->code == cra::ErrorCode::serialization_error, "malformed decision text rejected");
}

void test_resolution_helpers() {
  cra::CarpResolution r;
  r.timestamp_unix_ms = 1000;
  r.ttl_seconds = 300;
  r.allowed_actions.push_back(cra::AllowedAction{"ticket.get", "get", std::nullopt, {}, cra::RiskTier::low});
  r.denied_actions.push_back(cra::DeniedAction{"db.purge", "forbidden"});
  expect(r.expires_at_unix_ms() == 301000, "expiry is timestamp + ttl");
  expect(r.is_action_allowed("ticket.get"), "allowed action found");
  expect(!r.is_action_allowed("db.purge"), "denied action not allowed");
  expect(r.denial_reason("db.purge") == std::optional<std::string>("forbidden"), "denial reason surfaced");
  expect(!r.denial_reason("ticket.get"), "no denial reason for allowed action");
}

// ============================================================================
// Phase 4: Atlas registry
// ============================================================================

void test_atlas_load_and_duplicate() {
  cra::AtlasRegistry reg;
  expect(!reg.load(make_atlas()), "first load succeeds");
  auto err = reg.load(make_atlas());
  expect(err && err->code == cra::ErrorCode::already_exists, "duplicate atlas id rejected");
  expect(reg.get("ops") != nullptr, "loaded atlas retrievable");
  expect(reg.get("missing") == nullptr, "unknown atlas is null");
  expect(reg.digest("ops").size() == 64, "atlas fingerprinted");
}

void test_atlas_reload() {
  cra::AtlasRegistry reg;
  auto err = reg.reload(make_atlas());
  expect(err && err->code == cra::ErrorCode::not_found, "reload of unknown atlas is not_found");

  expect(!reg.load(make_atlas()), "load succeeds");
  auto before = reg.get("ops");
  const std::string digest_before = reg.digest("ops");
  cra::AtlasManifest next = make_atlas();
  next.version = "1.1.0";
  expect(!reg.reload(next), "reload succeeds");
  expect(reg.get("ops")->version == "1.1.0", "reload replaces manifest");
  expect(before->version == "1.0.0", "previous snapshot unaffected");
  expect(reg.digest("ops") != digest_before, "digest follows content");
}

void test_atlas_validation() {
  cra::AtlasRegistry reg;
  cra::AtlasManifest m = make_atlas();
  m.name.clear();
  auto err = reg.load(m);
  expect(err && err->code == cra::ErrorCode::validation_error, "empty name rejected");

  m = make_atlas();
  m.actions.push_back(action("ticket.get", cra::RiskTier::low));
  expect(reg.load(m).has_value(), "duplicate action id rejected");

  m = make_atlas();
  m.policies.push_back(policy("rl", cra::PolicyType::rate_limit, {"*"}));
  expect(reg.load(m).has_value(), "rate limit without parameters rejected");
  expect(reg.size() == 0, "nothing stored after failures");
}

void test_atlas_list_is_restartable() {
  cra::AtlasRegistry reg;
  expect(!reg.load(make_atlas("b")), "load b");
  expect(!reg.load(make_atlas("a")), "load a");
  std::vector<std::string> first(reg.list().begin(), reg.list().end());
  std::vector<std::string> second;
  for (const auto& id : reg.list()) second.push_back(id);
  expect(first == std::vector<std::string>{"a", "b"}, "ids listed in order");
  expect(first == second, "list is restartable");
}

void test_atlas_from_json() {
  const std::string doc =
      "{\"atlas_id\":\"docs\",\"version\":\"2.0\",\"name\":\"Docs\",\"description\":\"d\","
      "\"actions\":[{\"action_id\":\"doc.read\",\"name\":\"Read\",\"risk_tier\":\"low\"}],"
      "\"policies\":[{\"policy_id\":\"p1\",\"type\":\"requires_approval\",\"actions\":[\"doc.*\"]}],"
      "\"constraints\":[{\"id\":\"c1\",\"description\":\"cite sources\"}],"
      "\"context_packs\":[{\"pack_id\":\"style\",\"priority\":5,\"keywords\":[\"doc\"],"
      "\"inject_mode\":\"always\",\"condition\":{\"risk_tiers\":[\"low\"]}}]}";
  std::optional<cra::Error> err;
  cra::AtlasManifest m = cra::atlas_from_json(doc, &err);
  expect(!err, "manifest parses");
  expect(m.actions.size() == 1 && m.actions[0].risk_tier == cra::RiskTier::low, "action parsed");
  expect(m.policies.size() == 1 && m.policies[0].type == cra::PolicyType::requires_approval, "policy parsed");
  expect(m.context_packs[0].inject_mode == cra::InjectMode::always, "inject mode parsed");
  expect(m.context_packs[0].condition && m.context_packs[0].condition->risk_tiers.size() == 1, "condition parsed");

  cra::atlas_from_json("{\"atlas_id\":\"x\",\"policies\":[{\"policy_id\":\"p\",\"type\":\"nope\"}]}", &err);
  expect(err && err->code == cra::ErrorCode::serialization_error, "unknown policy type rejected");
}

// ============================================================================
// Phase 5: Context matching
// ============================================================================

void test_matching_determinism() {
  cra::ContextRegistry reg;
  reg.add_context(cra::context_from_pack(pack("trace-guide", 100, {"hash", "trace", "event"}), "ops"));
  reg.add_context(cra::context_from_pack(pack("misc", 1, {"hash"}), "ops"));
  auto first = reg.query("hash trace event hashing", {});
  expect(!first.empty(), "query returns matches");
  expect(first[0].pack_id == "trace-guide", "highest priority entry first");
  expect(first[0].score >= 3, "score counts overlapping tokens");
  auto again = reg.query("hash trace event hashing", {});
  expect(again.size() == first.size() && again[0].pack_id == first[0].pack_id, "query is deterministic");
}

void test_empty_registry() {
  cra::ContextRegistry reg;
  expect(reg.query("anything at all", {"hint"}).empty(), "empty registry yields empty result");
}

void test_match_ordering() {
  cra::ContextRegistry reg;
  reg.add_context(cra::context_from_pack(pack("b-pack", 10, {"deploy"}), ""));
  reg.add_context(cra::context_from_pack(pack("a-pack", 10, {"deploy"}), ""));
  reg.add_context(cra::context_from_pack(pack("c-pack", 10, {"deploy", "rollback"}), ""));
  reg.add_context(cra::context_from_pack(pack("low", 1, {"deploy", "rollback"}), ""));
  auto r = reg.query("Deploy and ROLLBACK", {});
  expect(r.size() == 4, "all four match");
  expect(r[0].pack_id == "c-pack", "score breaks priority ties");
  expect(r[1].pack_id == "a-pack" && r[2].pack_id == "b-pack", "pack id breaks score ties");
  expect(r[3].pack_id == "low", "lower priority last regardless of score");
  expect(reg.query("deploy", {}, {}, 2).size() == 2, "max_results caps output");
}

void test_condition_gates_eligibility() {
  cra::ContextRegistry reg;
  cra::AtlasContextPack p = pack("cpp-style", 50, {"code"});
  p.condition = cra::ContextCondition{{"*.cpp"}, {}, {}, {}};
  reg.add_context(cra::context_from_pack(p, ""));

  cra::EvalContext no_files;
  expect(reg.query("code review", {}, no_files).empty(), "failing condition excludes despite keywords");
  cra::EvalContext cpp;
  cpp.files = {"src/resolver.cpp"};
  expect(reg.query("code review", {}, cpp).size() == 1, "matching file pattern admits entry");

  cra::AtlasContextPack tiered = pack("high-risk", 50, {"code"});
  tiered.condition = cra::ContextCondition{{}, {}, {cra::RiskTier::high}, {}};
  reg.add_context(cra::context_from_pack(tiered, ""));
  cra::EvalContext high;
  high.risk_tier = cra::RiskTier::high;
  auto r = reg.query("code", {}, high);
  expect(r.size() == 1 && r[0].pack_id == "high-risk", "risk tier condition");
}

void test_inject_modes() {
  cra::ContextRegistry reg;
  cra::AtlasContextPack always = pack("banner", 0, {});
  always.inject_mode = cra::InjectMode::always;
  cra::AtlasContextPack demand = pack("deep-dive", 0, {"ticket"});
  demand.inject_mode = cra::InjectMode::on_demand;
  reg.add_context(cra::context_from_pack(always, ""));
  reg.add_context(cra::context_from_pack(demand, ""));

  auto r = reg.query("ticket triage", {});
  expect(r.size() == 1 && r[0].pack_id == "banner", "always injects, on_demand needs explicit hint");
  r = reg.query("ticket triage", {"deep-dive"});
  expect(r.size() == 2, "on_demand injected when requested by id");
}

void test_replace_and_remove_source() {
  cra::ContextRegistry reg;
  reg.add_context(cra::context_from_pack(pack("guide", 1, {"alpha"}), "ops"));
  reg.add_context(cra::context_from_pack(pack("guide", 1, {"beta"}), "ops"));
  expect(reg.size() == 1, "duplicate pack id replaces");
  expect(reg.query("alpha", {}).empty() && reg.query("beta", {}).size() == 1, "last write wins");

  reg.add_context(cra::context_from_pack(pack("adhoc", 1, {"beta"}), ""));
  cra::EvalContext scoped;
  scoped.atlas_scope = {"other"};
  auto r = reg.query("beta", {}, scoped);
  expect(r.size() == 1 && r[0].pack_id == "adhoc", "atlas scope excludes foreign packs, keeps ad-hoc");

  expect(reg.remove_source("ops") == 1, "remove_source drops atlas packs");
  expect(reg.size() == 1, "ad-hoc pack survives");
}

void test_mixed_case_keywords() {
  cra::ContextRegistry reg;
  cra::LoadedContext entry;
  entry.pack_id = "k8s-deploy";
  entry.content = "rollout steps";
  entry.keywords = {"Deploy", "Kubernetes"};
  reg.add_context(entry);
  auto r = reg.query("deploy to kubernetes", {});
  expect(r.size() == 1 && r[0].score == 2, "keywords compared case-insensitively");

  cra::Resolver resolver(quiet_config());
  expect(!resolver.load_atlas(make_atlas()), "atlas loads");
  cra::LoadedContext note;
  note.pack_id = "operator-note";
  note.content = "escalate sev1 tickets";
  note.keywords = {"SEV1"};
  resolver.add_context(note);
  expect(!resolver.create_session("s1", "agent-1", "x"), "create");
  std::optional<cra::Error> err;
  auto res = resolver.resolve("s1", "agent-1", request_for("s1", "agent-1", "triage sev1 outage"), &err);
  expect(!err && res.context_blocks.size() == 1 && res.context_blocks[0].block_id == "operator-note",
         "ad-hoc upper-case keyword matches");
}

// ============================================================================
// Phase 6: Policy evaluation
// ============================================================================

void test_policy_determinism() {
  cra::PolicyEvaluator eval;
  cra::AtlasView view = view_of(make_atlas());
  cra::CarpRequest r = request_for("s", "a", "close ticket");
  r.task.requested_actions = {"ticket.close"};
  const cra::Decision d1 = eval.evaluate(r, view);
  const cra::Decision d2 = eval.evaluate(r, view);
  expect(d1 == d2, "identical inputs give identical decisions");
  expect(std::holds_alternative<cra::Allow>(d1), "plain request allowed");
}

void test_deny_precedes_approval() {
  cra::AtlasManifest m = make_atlas();
  cra::AtlasPolicy deny_delete = policy("no-delete", cra::PolicyType::deny, {"ticket.delete"});
  deny_delete.reason = "deletes are frozen";
  m.policies.push_back(deny_delete);
  cra::PolicyEvaluator eval;
  cra::CarpRequest r = request_for("s", "a", "delete ticket");
  r.task.requested_actions = {"ticket.delete"};
  auto result = eval.evaluate_detailed(r, view_of(m));
  expect(std::holds_alternative<cra::Deny>(result.decision), "deny wins over approval");
  expect(std::get<cra::Deny>(result.decision).reason == "deletes are frozen", "policy reason surfaced");
  expect(result.category == "deny" && result.policy_id == "no-delete", "deciding policy reported");
}

void test_approval_parameters() {
  cra::PolicyEvaluator eval;
  cra::CarpRequest r = request_for("s", "a", "delete ticket");
  r.task.requested_actions = {"ticket.delete"};
  cra::Decision d = eval.evaluate(r, view_of(make_atlas()));
  expect(std::holds_alternative<cra::RequiresApproval>(d), "approval policy triggers");
  const auto& ra = std::get<cra::RequiresApproval>(d);
  expect(ra.approver == "security" && ra.timeout_seconds == 600, "policy-declared approver and timeout");

  cra::CarpRequest risky = request_for("s", "a", "look around");
  risky.task.risk_tier = cra::RiskTier::high;
  d = eval.evaluate(risky, view_of(make_atlas()));
  expect(std::holds_alternative<cra::RequiresApproval>(d), "request tier at threshold needs approval");
  expect(std::get<cra::RequiresApproval>(d).approver == "operator", "default approver from config");
}

void test_deny_rules() {
  cra::PolicyConfig cfg;
  cfg.risk_ceiling = cra::RiskTier::medium;
  cra::PolicyEvaluator eval(cfg);
  cra::AtlasView view = view_of(make_atlas());

  cra::CarpRequest unknown = request_for("s", "a", "do it");
  unknown.task.requested_actions = {"ticket.reopen"};
  expect(std::holds_alternative<cra::Deny>(eval.evaluate(unknown, view)), "unknown action denied");

  cra::CarpRequest cap = request_for("s", "a", "do it");
  cap.task.required_capabilities = {"billing"};
  expect(std::holds_alternative<cra::Deny>(eval.evaluate(cap, view)), "missing capability denied");
  cap.task.required_capabilities = {"tickets"};
  expect(std::holds_alternative<cra::Allow>(eval.evaluate(cap, view)), "provided capability allowed");

  cra::CarpRequest high = request_for("s", "a", "do it");
  high.task.risk_tier = cra::RiskTier::high;
  expect(std::holds_alternative<cra::Deny>(eval.evaluate(high, view)), "tier above ceiling denied");

  cra::CarpRequest purge = request_for("s", "a", "purge");
  purge.task.requested_actions = {"db.purge"};
  cra::PolicyEvaluator lenient;
  cra::Decision d = lenient.evaluate(purge, view);
  expect(std::holds_alternative<cra::Deny>(d) && std::get<cra::Deny>(d).reason == "purging is forbidden",
         "wildcard deny policy applies");
}

void test_rate_limit() {
  cra::AtlasManifest m = make_atlas();
  m.policies.push_back(policy("rl-get", cra::PolicyType::rate_limit, {"ticket.get"},
                              cra::jsonlite::Object{{"max_calls", 2}, {"window_seconds", 60}}));
  cra::AtlasView view = view_of(m);
  cra::PolicyEvaluator eval;

  const uint64_t now = 10'000'000;
  const std::vector<uint64_t> recent = {now - 1000, now - 2000};
  const std::vector<uint64_t> stale = {now - 120'000, now - 130'000};
  cra::UsageSnapshot busy{now, {}, recent};
  cra::UsageSnapshot idle{now, {}, stale};

  cra::CarpRequest only_get = request_for("s", "a", "read");
  only_get.task.requested_actions = {"ticket.get"};
  auto result = eval.evaluate_detailed(only_get, view, busy);
  expect(std::holds_alternative<cra::Deny>(result.decision), "exhausted limit denies");
  expect(std::get<cra::Deny>(result.decision).reason.find("rate limit") != std::string::npos,
         "rate-limit denial carries a rate-limit reason");
  expect(result.category == "rate_limit", "rate limit category reported");

  cra::CarpRequest mixed = only_get;
  mixed.task.requested_actions = {"ticket.get", "ticket.close"};
  expect(std::holds_alternative<cra::Partial>(eval.evaluate(mixed, view, busy)), "partial when some throttled");

  cra::CarpRequest doubled = only_get;
  doubled.task.requested_actions = {"ticket.get", "ticket.get"};
  expect(std::holds_alternative<cra::Deny>(eval.evaluate(doubled, view, busy)),
         "repeated throttled action still denies");

  expect(std::holds_alternative<cra::Allow>(eval.evaluate(only_get, view, idle)), "calls outside window ignored");
}

void test_action_patterns() {
  expect(cra::action_pattern_matches("*", "anything"), "full wildcard");
  expect(cra::action_pattern_matches("ticket.get", "ticket.get"), "exact");
  expect(cra::action_pattern_matches("ticket.*", "ticket.get"), "prefix wildcard");
  expect(!cra::action_pattern_matches("ticket.*", "tickets.get"), "prefix must end at a dot");
  expect(cra::action_pattern_matches("*.delete", "ticket.delete"), "suffix wildcard");
  expect(!cra::action_pattern_matches("*.delete", "ticket.undelete"), "suffix must start at a dot");
}

void test_partition_actions() {
  cra::PolicyEvaluator eval;
  std::vector<cra::AllowedAction> allowed;
  std::vector<cra::DeniedAction> denied;
  eval.partition_actions(view_of(make_atlas()), &allowed, &denied);
  expect(allowed.size() == 2, "get and close allowed");
  expect(denied.size() == 2, "delete and purge denied");
  expect(allowed[0].description.has_value(), "description carried");
}

// ============================================================================
// Phase 7: TRACE hash chain
// ============================================================================

void test_chain_integrity() {
  cra::TraceLog log(64, cra::kZeroGenesis);
  for (int i = 0; i < 10; ++i) {
    expect(!log.record(raw_event("s1", "action.executed", i)), "record accepted");
  }
  std::optional<cra::Error> err;
  auto events = log.get_trace("s1", &err);
  expect(!err && events.size() == 10, "all events chained");
  auto v = log.verify_chain("s1", &err);
  expect(v.is_valid && v.event_count == 10, "chain verifies");
  for (size_t i = 0; i < events.size(); ++i) {
    expect(events[i].sequence == i, "sequence is position");
    expect(cra::compute_event_hash(events[i]) == events[i].event_hash, "hash recomputes");
    if (i > 0) expect(events[i].previous_event_hash == events[i - 1].event_hash, "linkage");
  }
  expect(v.last_valid_hash == events.back().event_hash, "last valid hash is the tip");
}

void test_tamper_detection() {
  cra::TraceLog log(64, cra::kZeroGenesis);
  for (int i = 0; i < 6; ++i) expect(!log.record(raw_event("s1", "action.executed", i)), "record");
  std::optional<cra::Error> err;
  auto events = log.get_trace("s1", &err);
  expect(!err, "trace readable");

  for (size_t k = 0; k < events.size(); ++k) {
    auto tampered = events;
    tampered[k].payload["n"] = 999;
    auto v = cra::verify_events(tampered, cra::kZeroGenesis);
    expect(!v.is_valid, "tampering detected");
    expect(v.first_invalid_index == k, "first invalid index is the tampered event");
    expect(v.error_type == cra::ChainErrorType::hash_mismatch, "payload tamper is a hash mismatch");
    expect(!v.error_message.empty(), "diagnostic present");
  }

  auto relinked = events;
  relinked[3].previous_event_hash = std::string(64, 'f');
  auto v = cra::verify_events(relinked, cra::kZeroGenesis);
  expect(v.error_type == cra::ChainErrorType::chain_broken && v.first_invalid_index == 3u, "broken link found");

  auto dropped = events;
  dropped.erase(dropped.begin() + 2);
  v = cra::verify_events(dropped, cra::kZeroGenesis);
  expect(!v.is_valid && v.first_invalid_index == 2u, "removed event breaks the chain");

  expect(log.verify_chain("s1", &err).is_valid, "stored chain untouched by verification");
}

void test_genesis_seeding() {
  const std::string seed = cra::sha256_hex("deployment-7");
  cra::TraceLog log(16, seed);
  expect(!log.record(raw_event("s1", "session.started", 0)), "record");
  std::optional<cra::Error> err;
  auto events = log.get_trace("s1", &err);
  expect(events.size() == 1 && events[0].previous_event_hash == seed, "first event links to configured seed");
  auto v = cra::verify_events(events, cra::kZeroGenesis);
  expect(!v.is_valid && v.error_type == cra::ChainErrorType::invalid_genesis, "wrong genesis detected");
}

void test_backpressure() {
  cra::TraceLog log(4, cra::kZeroGenesis);
  log.pause();
  for (int i = 0; i < 4; ++i) expect(!log.record(raw_event("s1", "action.executed", i)), "fills queue");
  auto err = log.record(raw_event("s1", "action.executed", 4));
  expect(err && err->code == cra::ErrorCode::backpressure, "full queue signals backpressure");
  expect(log.pending() == 4, "nothing dropped");
  log.resume();
  std::optional<cra::Error> get_err;
  expect(log.get_trace("s1", &get_err).size() == 4, "accepted events chained after resume");
  expect(!log.record(raw_event("s1", "action.executed", 5)), "capacity available again");
}

void test_batch_all_or_nothing() {
  cra::TraceLog log(4, cra::kZeroGenesis);
  log.pause();
  expect(!log.record(raw_event("s1", "session.started", 0)), "first event queued");
  std::vector<cra::RawEvent> batch;
  for (int i = 1; i <= 4; ++i) batch.push_back(raw_event("s1", "context.injected", i));
  auto err = log.record_batch(batch);
  expect(err && err->code == cra::ErrorCode::backpressure, "batch beyond remaining capacity refused");
  expect(log.pending() == 1, "refused batch leaves nothing queued");
  batch.pop_back();
  expect(!log.record_batch(batch), "batch that fits accepted");
  expect(log.pending() == 4, "whole batch queued");
  log.resume();
  std::optional<cra::Error> get_err;
  auto events = log.get_trace("s1", &get_err);
  expect(events.size() == 4, "batch chained");
  for (std::size_t i = 0; i < events.size(); ++i) {
    expect(events[i].sequence == i, "contiguous sequences");
    expect(cra::jsonlite::get_i64(events[i].payload, "n") == static_cast<int64_t>(i), "batch order kept");
  }
  expect(!log.record_batch({}), "empty batch is a no-op");
}

void test_concurrent_producers() {
  cra::TraceLog log(100000, cra::kZeroGenesis);
  constexpr int kThreads = 8;
  constexpr int kPerThread = 250;
  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        const std::string session = (i % 2 == 0) ? "shared" : "own-" + std::to_string(t);
        if (log.record(raw_event(session, "action.executed", i))) failures++;
      }
    });
  }
  for (auto& th : threads) th.join();
  expect(failures.load() == 0, "no producer rejected");

  std::optional<cra::Error> err;
  auto shared = log.get_trace("shared", &err);
  expect(shared.size() == static_cast<size_t>(kThreads * kPerThread / 2), "shared session has every event");
  for (size_t i = 0; i < shared.size(); ++i) expect(shared[i].sequence == i, "gap-free sequence");
  expect(log.verify_chain("shared", &err).is_valid, "shared chain valid");
  expect(log.verify_chain("own-3", &err).is_valid, "per-thread chain valid");
}

void test_frozen_session_rejects() {
  cra::TraceLog log(16, cra::kZeroGenesis);
  expect(!log.record(raw_event("s1", "session.started", 0)), "start");
  expect(!log.record(raw_event("s1", cra::event_type::session_ended, 1)), "end");
  expect(!log.record(raw_event("s1", "action.executed", 2)), "late event accepted at ingest");
  std::optional<cra::Error> err;
  auto events = log.get_trace("s1", &err);
  expect(events.size() == 2, "late event not chained");
  expect(events.back().event_type == cra::event_type::session_ended, "chain ends with session.ended");
  expect(log.is_frozen("s1"), "session frozen");
}

void test_trace_errors_and_ndjson() {
  cra::TraceLog log(16, cra::kZeroGenesis);
  std::optional<cra::Error> err;
  log.verify_chain("nobody", &err);
  expect(err && err->code == cra::ErrorCode::not_found, "unknown session is not_found");

  cra::RawEvent anonymous = raw_event("", "x", 0);
  auto rec = log.record(anonymous);
  expect(rec && rec->code == cra::ErrorCode::validation_error, "event without session rejected");

  expect(!log.record(raw_event("s1", "a", 0)), "record");
  expect(!log.record(raw_event("s1", "b", 1)), "record");
  err.reset();
  auto events = log.get_trace("s1", &err);
  const std::string nd = cra::trace_to_ndjson(events);
  expect(std::count(nd.begin(), nd.end(), '\n') == 2, "one line per event");

  const std::string first_line = nd.substr(0, nd.find('\n'));
  cra::TraceEvent parsed = cra::event_from_json(first_line, &err);
  expect(!err, "event line parses");
  expect(cra::compute_event_hash(parsed) == parsed.event_hash, "parsed event re-hashes to stored hash");

  log.shutdown();
  rec = log.record(raw_event("s1", "c", 2));
  expect(rec && rec->code == cra::ErrorCode::invalid_state, "record after shutdown rejected");
}

// ============================================================================
// Phase 8: Resolver
// ============================================================================

void test_resolver_flow() {
  cra::Resolver r(quiet_config());
  expect(!r.load_atlas(make_atlas()), "atlas loads");
  std::optional<cra::Error> err;
  const std::string sid = r.create_session("agent-1", "handle tickets", &err);
  expect(!err && !sid.empty(), "session created");
  expect(r.get_session(sid)->state == cra::SessionState::created, "new session is created");

  cra::CarpRequest req = request_for(sid, "agent-1", "trace event hash audit for ticket");
  req.task.requested_actions = {"ticket.get"};
  cra::CarpResolution res = r.resolve(sid, "agent-1", req, &err);
  expect(!err, "resolve succeeds");
  expect(std::holds_alternative<cra::Allow>(res.decision), "allowed");
  expect(res.request_id == req.request_id && res.session_id == sid, "resolution echoes ids");
  expect(res.ttl_seconds == 300, "default ttl");
  expect(res.context_blocks.size() == 2 && res.context_blocks[0].block_id == "trace-guide", "ranked context");
  expect(res.is_action_allowed("ticket.get") && !res.is_action_allowed("db.purge"), "actions partitioned");
  expect(res.constraints.size() == 1, "atlas constraints surfaced");
  expect(res.trace_id == r.get_session(sid)->trace_id, "trace id links to session");
  expect(r.get_session(sid)->state == cra::SessionState::active, "session active after resolve");

  auto events = r.get_trace(sid, &err);
  std::vector<std::string> types;
  for (const auto& e : events) types.push_back(e.event_type);
  const std::vector<std::string> expected = {
      cra::event_type::session_started,  cra::event_type::request_received, cra::event_type::policy_evaluated,
      cra::event_type::context_injected, cra::event_type::context_injected, cra::event_type::resolution_completed};
  expect(types == expected, "events in protocol order");
  expect(events[2].parent_span_id == events[1].span_id, "policy span nested under request span");
  expect(r.verify_chain(sid, &err).is_valid, "session chain verifies");
}

void test_session_terminality() {
  cra::Resolver r(quiet_config());
  expect(!r.load_atlas(make_atlas()), "atlas loads");
  expect(!r.create_session("s-term", "agent-1", "work"), "session created");
  std::optional<cra::Error> err;
  r.resolve("s-term", "agent-1", request_for("s-term", "agent-1", "work"), &err);
  expect(!err, "resolve before end");
  expect(!r.end_session("s-term"), "end succeeds");

  r.resolve("s-term", "agent-1", request_for("s-term", "agent-1", "more work"), &err);
  expect(err && err->code == cra::ErrorCode::invalid_state, "resolve after end is invalid_state");

  auto again = r.end_session("s-term");
  expect(again && again->code == cra::ErrorCode::invalid_state, "second end is invalid_state");

  err.reset();
  auto events = r.get_trace("s-term", &err);
  expect(!err && events.back().event_type == cra::event_type::session_ended, "frozen timeline ends with end");
  expect(r.verify_chain("s-term", &err).is_valid, "frozen chain valid");
}

void test_resolver_errors() {
  cra::Resolver r(quiet_config());
  expect(!r.load_atlas(make_atlas()), "atlas loads");
  std::optional<cra::Error> err;

  r.resolve("ghost", "agent-1", request_for("ghost", "agent-1", "x"), &err);
  expect(err && err->code == cra::ErrorCode::not_found, "unknown session");

  expect(!r.create_session("s1", "agent-1", "work"), "create");
  auto dup = r.create_session("s1", "agent-2", "work");
  expect(dup && dup->code == cra::ErrorCode::already_exists, "duplicate session id");

  err.reset();
  r.resolve("s1", "agent-2", request_for("s1", "agent-2", "x"), &err);
  expect(err && err->code == cra::ErrorCode::validation_error, "foreign agent rejected");

  err.reset();
  cra::CarpRequest no_goal = request_for("s1", "agent-1", "");
  r.resolve("s1", "agent-1", no_goal, &err);
  expect(err && err->code == cra::ErrorCode::validation_error, "missing goal rejected");

  err.reset();
  cra::CarpRequest bad_atlas = request_for("s1", "agent-1", "x");
  bad_atlas.atlas_ids = {"nope"};
  r.resolve("s1", "agent-1", bad_atlas, &err);
  expect(err && err->code == cra::ErrorCode::not_found, "unknown atlas");

  auto end_err = r.end_session("ghost");
  expect(end_err && end_err->code == cra::ErrorCode::not_found, "end unknown session");
  err.reset();
  r.get_trace("ghost", &err);
  expect(err && err->code == cra::ErrorCode::not_found, "trace of unknown session");
  expect(r.session_count() == 1, "one session tracked");
}

void test_resolver_deny_grants_nothing() {
  cra::Resolver r(quiet_config());
  expect(!r.load_atlas(make_atlas()), "atlas loads");
  expect(!r.create_session("s1", "agent-1", "cleanup"), "create");
  cra::CarpRequest req = request_for("s1", "agent-1", "purge the ticket database");
  req.task.requested_actions = {"db.purge"};
  std::optional<cra::Error> err;
  auto res = r.resolve("s1", "agent-1", req, &err);
  expect(!err && std::holds_alternative<cra::Deny>(res.decision), "denied");
  expect(res.allowed_actions.empty() && res.context_blocks.empty(), "deny grants and injects nothing");
  expect(res.denial_reason("ticket.get").has_value(), "every action listed as denied");
}

void test_resolver_rate_limit() {
  cra::AtlasManifest m = make_atlas();
  m.policies.push_back(policy("rl-all", cra::PolicyType::rate_limit, {"*"},
                              cra::jsonlite::Object{{"max_calls", 1}, {"window_seconds", 3600}, {"scope", "agent"}}));
  cra::Resolver r(quiet_config());
  expect(!r.load_atlas(m), "atlas loads");
  expect(!r.create_session("s1", "agent-1", "x"), "create s1");
  expect(!r.create_session("s2", "agent-1", "x"), "create s2");
  std::optional<cra::Error> err;
  auto first = r.resolve("s1", "agent-1", request_for("s1", "agent-1", "read"), &err);
  expect(std::holds_alternative<cra::Allow>(first.decision), "first call allowed");
  auto second = r.resolve("s2", "agent-1", request_for("s2", "agent-1", "read"), &err);
  expect(std::holds_alternative<cra::Deny>(second.decision), "agent-scoped limit spans sessions");
}

void test_resolver_atlas_reload() {
  cra::Resolver r(quiet_config());
  expect(!r.load_atlas(make_atlas()), "load");
  cra::AtlasManifest next = make_atlas();
  next.context_packs = {pack("fresh-guide", 5, {"ticket"})};
  expect(!r.reload_atlas(next), "reload");
  expect(!r.contexts().contains("trace-guide") && r.contexts().contains("fresh-guide"), "packs re-registered");

  cra::LoadedContext adhoc;
  adhoc.pack_id = "operator-note";
  adhoc.content = "be careful";
  adhoc.keywords = {"ticket"};
  r.add_context(adhoc);
  expect(!r.create_session("s1", "agent-1", "x"), "create");
  std::optional<cra::Error> err;
  auto res = r.resolve("s1", "agent-1", request_for("s1", "agent-1", "ticket work"), &err);
  expect(res.context_blocks.size() == 2, "ad-hoc and atlas packs both injected");
}

void test_resolve_events_all_or_nothing() {
  cra::ResolverConfig cfg = quiet_config();
  cfg.trace_queue_capacity = 5;
  cra::Resolver r(cfg);
  expect(!r.load_atlas(make_atlas()), "atlas loads");
  r.trace_log().pause();
  expect(!r.create_session("s1", "agent-1", "x"), "create");

  // received, evaluated, two injected, completed: five events against four free slots.
  const cra::CarpRequest req = request_for("s1", "agent-1", "trace event hash audit for ticket");
  std::optional<cra::Error> err;
  auto res = r.resolve("s1", "agent-1", req, &err);
  expect(err && err->code == cra::ErrorCode::backpressure, "resolve refused when its events do not fit");
  expect(res.resolution_id.empty(), "no resolution returned");
  expect(r.trace_log().pending() == 1, "no partial resolve queued");
  r.trace_log().resume();

  err.reset();
  auto events = r.get_trace("s1", &err);
  expect(!err && events.size() == 1 && events[0].event_type == cra::event_type::session_started,
         "chain holds only the session start");
  const cra::Session* s = r.get_session("s1");
  expect(s->resolution_count == 0 && s->state == cra::SessionState::created, "session untouched");
  expect(s->request_times.empty(), "refused resolve consumes no quota");

  res = r.resolve("s1", "agent-1", req, &err);
  expect(!err && !res.resolution_id.empty(), "resolve succeeds once the queue drained");
  events = r.get_trace("s1", &err);
  expect(events.size() == 6 && events.back().event_type == cra::event_type::resolution_completed,
         "complete resolve recorded");
  expect(r.verify_chain("s1", &err).is_valid, "chain verifies");
}

void test_usage_ledger_pruning() {
  cra::Resolver plain(quiet_config());
  expect(!plain.load_atlas(make_atlas()), "atlas loads");
  expect(!plain.create_session("s1", "agent-1", "x"), "create");
  std::optional<cra::Error> err;
  for (int i = 0; i < 5; ++i) {
    plain.resolve("s1", "agent-1", request_for("s1", "agent-1", "read"), &err);
    expect(!err, "resolve");
  }
  expect(plain.get_session("s1")->resolution_count == 5, "five resolves");
  expect(plain.get_session("s1")->request_times.size() == 1, "no rate limit keeps only the latest entry");

  cra::AtlasManifest m = make_atlas();
  m.policies.push_back(policy("rl-get", cra::PolicyType::rate_limit, {"ticket.get"},
                              cra::jsonlite::Object{{"max_calls", 2}, {"window_seconds", 1}}));
  cra::Resolver limited(quiet_config());
  expect(!limited.load_atlas(m), "atlas loads");
  expect(!limited.create_session("s1", "agent-1", "x"), "create");
  cra::CarpRequest get = request_for("s1", "agent-1", "read");
  get.task.requested_actions = {"ticket.get"};
  expect(std::holds_alternative<cra::Allow>(limited.resolve("s1", "agent-1", get, &err).decision), "first");
  expect(std::holds_alternative<cra::Allow>(limited.resolve("s1", "agent-1", get, &err).decision), "second");
  expect(std::holds_alternative<cra::Deny>(limited.resolve("s1", "agent-1", get, &err).decision),
         "third inside window denied");
  expect(limited.get_session("s1")->request_times.size() == 2, "window entries retained");

  std::this_thread::sleep_for(std::chrono::milliseconds(1100));
  expect(std::holds_alternative<cra::Allow>(limited.resolve("s1", "agent-1", get, &err).decision),
         "allowed once the window passed");
  expect(limited.get_session("s1")->request_times.size() == 1, "expired entries pruned");
}

void test_execute_action() {
  cra::Resolver r(quiet_config());
  expect(!r.load_atlas(make_atlas()), "atlas loads");
  expect(!r.create_session("s1", "agent-1", "x"), "create");
  std::optional<cra::Error> err;
  cra::CarpRequest req = request_for("s1", "agent-1", "look up a ticket");
  req.task.requested_actions = {"ticket.get"};
  auto res = r.resolve("s1", "agent-1", req, &err);
  expect(!err, "resolve");

  auto out = r.execute("s1", "agent-1", res.resolution_id, "ticket.get", cra::jsonlite::Object{{"ticket", 7}}, &err);
  expect(!err, "allowed action executes");
  expect(cra::jsonlite::get_string(out, "status") == "success", "success status");
  expect(cra::jsonlite::get_string(out, "action_id") == "ticket.get", "result names the action");
  expect(!cra::jsonlite::get_string(out, "execution_id").empty(), "execution id issued");
  expect(r.get_session("s1")->action_count == 1, "execution counted");

  auto events = r.get_trace("s1", &err);
  const std::size_t n = events.size();
  expect(n == 8, "session start, four resolve events, three action events");
  expect(events[n - 3].event_type == cra::event_type::action_requested, "requested first");
  expect(events[n - 2].event_type == cra::event_type::action_approved, "then approved");
  expect(events[n - 1].event_type == cra::event_type::action_executed, "then executed");
  expect(events[n - 1].parent_span_id == events[n - 3].span_id, "nested under the request span");
  expect(cra::jsonlite::get_string(events[n - 3].payload, "resolution_id") == res.resolution_id,
         "request references the resolution");
  expect(cra::jsonlite::get_string(events[n - 1].payload, "result_hash") ==
             cra::sha256_hex(cra::jsonlite::to_json(out)),
         "result hash covers the returned record");

  out = r.execute("s1", "agent-1", res.resolution_id, "db.purge", cra::jsonlite::Object{}, &err);
  expect(err && err->code == cra::ErrorCode::action_denied && out.empty(), "deny policy re-checked");
  events = r.get_trace("s1", &err);
  expect(events.back().event_type == cra::event_type::action_denied, "denial recorded");
  expect(cra::jsonlite::get_string(events.back().payload, "reason") == "purging is forbidden", "deny reason");
  expect(cra::jsonlite::get_string(events.back().payload, "policy_id") == "no-purge", "deny policy named");

  err.reset();
  r.execute("s1", "agent-1", res.resolution_id, "ticket.reopen", cra::jsonlite::Object{}, &err);
  expect(err && err->code == cra::ErrorCode::not_found, "unknown action");
  err.reset();
  r.execute("s1", "agent-2", res.resolution_id, "ticket.get", cra::jsonlite::Object{}, &err);
  expect(err && err->code == cra::ErrorCode::validation_error, "foreign agent rejected");
  err.reset();
  r.execute("s1", "agent-1", "", "ticket.get", cra::jsonlite::Object{}, &err);
  expect(err && err->code == cra::ErrorCode::validation_error, "resolution id required");
  err.reset();
  r.execute("ghost", "agent-1", res.resolution_id, "ticket.get", cra::jsonlite::Object{}, &err);
  expect(err && err->code == cra::ErrorCode::not_found, "unknown session");
  expect(r.get_session("s1")->action_count == 1, "refusals not counted");

  err.reset();
  cra::CarpRequest exec_req = request_for("s1", "agent-1", "run it");
  exec_req.operation = cra::Operation::execute;
  r.resolve("s1", "agent-1", exec_req, &err);
  expect(err && err->code == cra::ErrorCode::validation_error, "execute operation not resolved");

  err.reset();
  expect(r.verify_chain("s1", &err).is_valid, "chain verifies with action events");
  expect(!r.end_session("s1"), "end");
  r.execute("s1", "agent-1", res.resolution_id, "ticket.get", cra::jsonlite::Object{}, &err);
  expect(err && err->code == cra::ErrorCode::invalid_state, "execute after end is invalid_state");

  cra::ResolverConfig capped = quiet_config();
  capped.risk_ceiling = cra::RiskTier::medium;
  cra::Resolver guarded(capped);
  expect(!guarded.load_atlas(make_atlas()), "atlas loads");
  expect(!guarded.create_session("s1", "agent-1", "x"), "create");
  err.reset();
  guarded.execute("s1", "agent-1", "res-1", "ticket.delete", cra::jsonlite::Object{}, &err);
  expect(err && err->code == cra::ErrorCode::action_denied, "risk ceiling re-checked");
  err.reset();
  guarded.execute("s1", "agent-1", "res-1", "ticket.close", cra::jsonlite::Object{}, &err);
  expect(!err, "action at the ceiling executes");
}

void test_unload_atlas() {
  cra::Resolver r(quiet_config());
  expect(!r.load_atlas(make_atlas()), "load ops");
  cra::AtlasManifest billing = make_atlas("billing");
  billing.capabilities.clear();
  billing.policies.clear();
  billing.actions = {action("invoice.get", cra::RiskTier::low)};
  billing.context_packs = {pack("invoice-guide", 5, {"invoice"})};
  expect(!r.load_atlas(billing), "load billing");

  expect(!r.unload_atlas("ops"), "unload");
  expect(!r.atlases().get("ops") && r.atlases().get("billing"), "only ops removed");
  expect(!r.contexts().contains("trace-guide") && r.contexts().contains("invoice-guide"), "ops packs dropped");
  auto again = r.unload_atlas("ops");
  expect(again && again->code == cra::ErrorCode::not_found, "second unload is not_found");

  expect(!r.create_session("s1", "agent-1", "x"), "create");
  std::optional<cra::Error> err;
  r.resolve("s1", "agent-1", request_for("s1", "agent-1", "ticket work"), &err);
  expect(err && err->code == cra::ErrorCode::not_found, "unloaded atlas no longer addressable");

  err.reset();
  cra::CarpRequest any = request_for("s1", "agent-1", "invoice lookup");
  any.atlas_ids.clear();
  auto res = r.resolve("s1", "agent-1", any, &err);
  expect(!err && res.is_action_allowed("invoice.get") && !res.is_action_allowed("ticket.get"),
         "remaining atlas still serves");
  r.execute("s1", "agent-1", res.resolution_id, "ticket.get", cra::jsonlite::Object{}, &err);
  expect(err && err->code == cra::ErrorCode::not_found, "actions of an unloaded atlas are gone");
}

void test_sequential_evaluation_matches_parallel() {
  cra::ResolverConfig seq_cfg = quiet_config();
  seq_cfg.parallel_evaluation = false;
  cra::Resolver par(quiet_config());
  cra::Resolver seq(seq_cfg);
  for (cra::Resolver* r : {&par, &seq}) {
    expect(!r->load_atlas(make_atlas()), "load");
    expect(!r->create_session("s1", "agent-1", "x"), "create");
  }
  cra::CarpRequest req = request_for("s1", "agent-1", "delete ticket");
  req.task.requested_actions = {"ticket.delete"};
  std::optional<cra::Error> err;
  auto a = par.resolve("s1", "agent-1", req, &err);
  auto b = seq.resolve("s1", "agent-1", req, &err);
  expect(a.decision == b.decision, "same decision either way");
  expect(std::holds_alternative<cra::RequiresApproval>(a.decision), "approval required");
}

// ============================================================================
// Phase 9: Configuration
// ============================================================================

void test_config_defaults() {
  cra::ResolverConfig cfg;
  expect(cfg.genesis_seed == cra::kZeroGenesis, "zero genesis default");
  expect(cfg.default_ttl_seconds == 300 && cfg.trace_queue_capacity == 4096, "defaults");
  expect(cfg.max_context_blocks == 10 && cfg.risk_ceiling == cra::RiskTier::critical, "defaults");
}

void test_config_from_json() {
  auto r = cra::config_from_json(
      "{\"default_ttl_seconds\":60,\"risk_ceiling\":\"high\",\"parallel_evaluation\":false,\"colour\":\"blue\"}");
  expect(r.ok, "valid config");
  expect(r.config.default_ttl_seconds == 60 && r.config.risk_ceiling == cra::RiskTier::high, "values applied");
  expect(!r.config.parallel_evaluation, "bool applied");
  expect(r.warnings.size() == 1, "unknown key warned");

  r = cra::config_from_json("{\"risk_ceiling\":\"extreme\"}");
  expect(!r.ok && !r.errors.empty(), "bad tier is an error");
  r = cra::config_from_json("{\"genesis_seed\":\"deployment-7\"}");
  expect(r.ok && r.config.genesis_seed == "deployment-7", "any non-empty genesis seed accepted");
  r = cra::config_from_json("{\"genesis_seed\":\"\"}");
  expect(!r.ok, "empty genesis seed is an error");
  r = cra::config_from_json("{\"default_ttl_seconds\":\"300\"}");
  expect(!r.ok && r.errors.size() == 1, "string ttl is an error");
  expect(r.errors[0].find("default_ttl_seconds") != std::string::npos, "error names the key");
  r = cra::config_from_json("{\"max_context_blocks\":-1}");
  expect(!r.ok, "negative count is an error");
  r = cra::config_from_json("{\"parallel_evaluation\":\"yes\"}");
  expect(!r.ok, "string bool is an error");
  r = cra::config_from_json("[1,2]");
  expect(!r.ok, "non-object rejected");
}

void test_config_env_overrides() {
  ::setenv("CRA_DEFAULT_TTL", "42", 1);
  ::setenv("CRA_RISK_CEILING", "medium", 1);
  ::setenv("CRA_TRACE_QUEUE_CAPACITY", "zero", 1);
  auto r = cra::config_from_env();
  ::unsetenv("CRA_DEFAULT_TTL");
  ::unsetenv("CRA_RISK_CEILING");
  ::unsetenv("CRA_TRACE_QUEUE_CAPACITY");
  expect(r.config.default_ttl_seconds == 42, "ttl from env");
  expect(r.config.risk_ceiling == cra::RiskTier::medium, "ceiling from env");
  expect(!r.ok && r.config.trace_queue_capacity == 4096, "invalid capacity reported, default kept");
}

// ============================================================================
// Phase 10: Observability
// ============================================================================

std::atomic<int> g_hook_calls{0};
void counting_hook(const cra::ResolutionEvent&) { g_hook_calls++; }

void test_stats_and_hook() {
  cra::ResolverStats& stats = cra::global_resolver_stats();
  const uint64_t before = stats.resolutions_total.load();
  const uint64_t failed_before = stats.resolutions_failed.load();
  cra::set_resolution_event_hook(counting_hook);

  cra::Resolver r(quiet_config());
  expect(!r.load_atlas(make_atlas()), "load");
  expect(!r.create_session("s1", "agent-1", "x"), "create");
  std::optional<cra::Error> err;
  r.resolve("s1", "agent-1", request_for("s1", "agent-1", "ticket"), &err);
  r.resolve("nope", "agent-1", request_for("nope", "agent-1", "ticket"), &err);
  cra::set_resolution_event_hook(nullptr);

  expect(stats.resolutions_total.load() == before + 2, "both resolves counted");
  expect(stats.resolutions_failed.load() == failed_before + 1, "failure counted");
  expect(g_hook_calls.load() == 2, "hook saw both events");
  expect(stats.to_json().find("\"resolve_latency\"") != std::string::npos, "stats JSON has latency");
}

void test_event_log_file() {
  const fs::path path = fs::temp_directory_path() / ("cra_events_" + cra::generate_id() + ".jsonl");
  cra::ResolverConfig cfg = quiet_config();
  cfg.event_log_path = path.string();
  {
    cra::Resolver r(cfg);
    expect(!r.load_atlas(make_atlas()), "load");
    expect(!r.create_session("s1", "agent-1", "x"), "create");
    std::optional<cra::Error> err;
    r.resolve("s1", "agent-1", request_for("s1", "agent-1", "ticket"), &err);
  }
  std::ifstream in(path);
  std::string line;
  expect(static_cast<bool>(std::getline(in, line)), "event line written");
  expect(!cra::jsonlite::validate_strict(line).has_value(), "event line is strict JSON");
  expect(line.find("\"decision\":\"allow\"") != std::string::npos, "decision recorded");
  in.close();
  fs::remove(path);
}

void test_log_threshold() {
  const cra::LogLevel saved = cra::log_level();
  cra::set_log_level(cra::LogLevel::error);
  expect(cra::log_level() == cra::LogLevel::error, "threshold settable");
  cra::log(cra::LogLevel::debug, "test", "suppressed");
  cra::set_log_level(saved);
  expect(cra::to_string(cra::LogLevel::warn) == "warn", "level names");
}

void test_version_manifest() {
  const std::string json = cra::version::manifest_to_json(cra::version::current_manifest());
  expect(!cra::jsonlite::validate_strict(json).has_value(), "manifest is strict JSON");
  expect(json.find("\"carp_version\":\"1.0\"") != std::string::npos, "carp version present");
  expect(json.find("\"chain_hash_primitive\":\"sha256\"") != std::string::npos, "chain primitive present");
}

}  // namespace

int main() {
  std::cout << "=== CRA Resolution Engine Test Suite ===\n";

  std::cout << "\n[Phase 1] Hash primitives\n";
  run_test("SHA-256 known vectors", test_sha256_known_vectors);
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("hex digest shape", test_hex_digest_shape);

  std::cout << "\n[Phase 2] JSON\n";
  run_test("JSON canonicalization", test_json_canonicalization);
  run_test("JSON strictness", test_json_strictness);
  run_test("JSON surrogate pairs", test_json_surrogate_pairs);
  run_test("JSON integer accessors", test_json_integer_accessors);

  std::cout << "\n[Phase 3] Protocol model\n";
  run_test("request validation", test_request_validation);
  run_test("request JSON round trip", test_request_json_roundtrip);
  run_test("request parse errors", test_request_parse_errors);
  run_test("decision encoding", test_decision_encoding);
  run_test("resolution helpers", test_resolution_helpers);

  std::cout << "\n[Phase 4] Atlas registry\n";
  run_test("load and duplicate", test_atlas_load_and_duplicate);
  run_test("reload", test_atlas_reload);
  run_test("manifest validation", test_atlas_validation);
  run_test("list is restartable", test_atlas_list_is_restartable);
  run_test("atlas from JSON", test_atlas_from_json);

  std::cout << "\n[Phase 5] Context matching\n";
  run_test("matching determinism", test_matching_determinism);
  run_test("empty registry", test_empty_registry);
  run_test("ordering tie-breaks", test_match_ordering);
  run_test("conditions gate eligibility", test_condition_gates_eligibility);
  run_test("inject modes", test_inject_modes);
  run_test("replace and remove_source", test_replace_and_remove_source);
  run_test("mixed-case keywords", test_mixed_case_keywords);

  std::cout << "\n[Phase 6] Policy evaluation\n";
  run_test("determinism", test_policy_determinism);
  run_test("deny precedes approval", test_deny_precedes_approval);
  run_test("approval parameters", test_approval_parameters);
  run_test("deny rules", test_deny_rules);
  run_test("rate limit", test_rate_limit);
  run_test("action patterns", test_action_patterns);
  run_test("partition actions", test_partition_actions);

  std::cout << "\n[Phase 7] TRACE hash chain\n";
  run_test("chain integrity (10 events)", test_chain_integrity);
  run_test("tamper detection", test_tamper_detection);
  run_test("genesis seeding", test_genesis_seeding);
  run_test("backpressure", test_backpressure);
  run_test("batch all or nothing", test_batch_all_or_nothing);
  run_test("concurrent producers (8 threads)", test_concurrent_producers);
  run_test("frozen session rejects", test_frozen_session_rejects);
  run_test("errors and NDJSON export", test_trace_errors_and_ndjson);

  std::cout << "\n[Phase 8] Resolver\n";
  run_test("resolve flow and event order", test_resolver_flow);
  run_test("session terminality", test_session_terminality);
  run_test("error mapping", test_resolver_errors);
  run_test("deny grants nothing", test_resolver_deny_grants_nothing);
  run_test("agent-scoped rate limit", test_resolver_rate_limit);
  run_test("atlas reload and ad-hoc context", test_resolver_atlas_reload);
  run_test("resolve events all or nothing", test_resolve_events_all_or_nothing);
  run_test("usage ledger pruning", test_usage_ledger_pruning);
  run_test("execute action", test_execute_action);
  run_test("unload atlas", test_unload_atlas);
  run_test("sequential matches parallel", test_sequential_evaluation_matches_parallel);

  std::cout << "\n[Phase 9] Configuration\n";
  run_test("defaults", test_config_defaults);
  run_test("config from JSON", test_config_from_json);
  run_test("environment overrides", test_config_env_overrides);

  std::cout << "\n[Phase 10] Observability\n";
  run_test("stats and hook", test_stats_and_hook);
  run_test("event log file", test_event_log_file);
  run_test("log threshold", test_log_threshold);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return 0;
}
