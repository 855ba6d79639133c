#pragma once

// cra/atlas.hpp: Atlas manifests and the registry that holds them.
//
// An Atlas is the declarative policy source for one governance domain: the
// actions an agent may call, the policies that gate them, the constraints
// surfaced with every resolution, and the context packs offered for injection.
//
// DESIGN INVARIANTS:
//   1. Manifests are immutable once stored. get() hands out shared_ptr<const>,
//      so a resolution in flight keeps its snapshot even across reload().
//   2. load() never overwrites. A second load of the same atlas id is
//      already_exists; replacement is only through reload().
//   3. Discovery and file I/O are the caller's job. The registry only accepts
//      parsed manifests (atlas_from_json is offered for loaders).

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <vector>

#include "cra/jsonlite.hpp"
#include "cra/protocol.hpp"
#include "cra/types.hpp"

namespace cra {

struct AtlasCapability {
  std::string              capability_id;
  std::string              name;
  std::string              description;
  std::vector<std::string> actions;
};

struct AtlasAction {
  std::string     action_id;
  std::string     name;
  std::string     description;
  jsonlite::Value parameters_schema;
  RiskTier        risk_tier{RiskTier::low};
};

enum class PolicyType {
  deny,
  allow,
  requires_approval,
  rate_limit,
};

std::string to_string(PolicyType type);
std::optional<PolicyType> policy_type_from_string(const std::string& s);

// `actions` holds patterns: exact id, "prefix.*", "*.suffix" or "*".
// Recognized parameters by type:
//   requires_approval: approver (string), timeout_seconds (integer)
//   rate_limit:        max_calls, window_seconds (integers), scope ("session"|"agent")
struct AtlasPolicy {
  std::string              policy_id;
  PolicyType               type{PolicyType::deny};
  std::vector<std::string> actions;
  std::string              reason;
  jsonlite::Object         parameters;
};

// Every non-empty clause must hold for the pack to be eligible.
struct ContextCondition {
  std::vector<std::string> file_patterns;  // fnmatch globs against EvalContext::files
  std::vector<std::string> capabilities;   // all required
  std::vector<RiskTier>    risk_tiers;     // request tier must be one of these
  std::vector<std::string> context_hints;  // at least one must be present
};

enum class InjectMode {
  always,
  on_match,
  on_demand,
};

std::string to_string(InjectMode mode);
std::optional<InjectMode> inject_mode_from_string(const std::string& s);

struct AtlasContextPack {
  std::string                     pack_id;
  std::string                     name;
  std::string                     content;
  std::string                     content_type{"text/markdown"};
  int32_t                         priority{0};
  std::vector<std::string>        keywords;
  std::optional<ContextCondition> condition;
  InjectMode                      inject_mode{InjectMode::on_match};
};

struct AtlasManifest {
  std::string                   atlas_id;
  std::string                   version;
  std::string                   name;
  std::string                   description;
  std::vector<std::string>      domains;
  std::vector<AtlasCapability>  capabilities;
  std::vector<AtlasAction>      actions;
  std::vector<AtlasPolicy>      policies;
  std::vector<Constraint>       constraints;
  std::vector<AtlasContextPack> context_packs;

  const AtlasAction* find_action(const std::string& action_id) const;
  bool has_capability(const std::string& capability_id) const;
};

// Required fields, id uniqueness, rate-limit parameter sanity.
std::optional<Error> validate_manifest(const AtlasManifest& m);

jsonlite::Value atlas_to_value(const AtlasManifest& m);
AtlasManifest atlas_from_json(const std::string& text, std::optional<Error>* error);

class AtlasRegistry {
 public:
  std::optional<Error> load(AtlasManifest manifest);
  std::optional<Error> reload(AtlasManifest manifest);
  // not_found when absent. Snapshots already handed out stay valid.
  std::optional<Error> unload(const std::string& atlas_id);

  // nullptr when the id is not loaded.
  std::shared_ptr<const AtlasManifest> get(const std::string& atlas_id) const;

  // BLAKE3 fingerprint of the stored manifest; empty when not loaded.
  std::string digest(const std::string& atlas_id) const;

  bool contains(const std::string& atlas_id) const { return atlases_.contains(atlas_id); }
  std::size_t size() const { return atlases_.size(); }

  // Lazy view of loaded ids in lexicographic order. Restartable; invalidated by
  // load()/reload()/unload().
  auto list() const { return std::views::keys(atlases_); }

 private:
  struct Stored {
    std::shared_ptr<const AtlasManifest> manifest;
    std::string                          digest;
  };

  std::map<std::string, Stored> atlases_;
};

}  // namespace cra
