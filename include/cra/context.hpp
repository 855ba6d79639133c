#pragma once

// cra/context.hpp: Context registry and matcher.
//
// Conditions gate eligibility, keywords rank it. A pack whose condition fails is
// excluded no matter how many keywords it shares with the goal.
//
// ORDERING (total, deterministic):
//   priority desc, then score desc, then pack_id asc.
//
// No-match is an empty vector. query() never fails.

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "cra/atlas.hpp"
#include "cra/types.hpp"

namespace cra {

struct LoadedContext {
  std::string                     pack_id;
  std::string                     name;
  std::string                     source_atlas;  // empty = ad-hoc
  std::string                     content;
  std::string                     content_type{"text/markdown"};
  int32_t                         priority{0};
  std::set<std::string>           keywords;      // lower-cased
  std::optional<ContextCondition> condition;
  InjectMode                      inject_mode{InjectMode::on_match};
};

LoadedContext context_from_pack(const AtlasContextPack& pack, const std::string& atlas_id);

// What the caller knows about the request when matching.
struct EvalContext {
  std::vector<std::string> files;
  std::vector<std::string> capabilities;
  std::optional<RiskTier>  risk_tier;
  // When non-empty, atlas-sourced packs outside this set are skipped.
  std::vector<std::string> atlas_scope;
};

struct MatchResult {
  std::string                          pack_id;
  uint32_t                             score{0};
  std::shared_ptr<const LoadedContext> entry;
};

// Lower-cased tokens split on anything that is not alphanumeric or '_'.
std::vector<std::string> tokenize(const std::string& text);

bool condition_holds(const ContextCondition& cond, const EvalContext& eval,
                     const std::vector<std::string>& hints);

class ContextRegistry {
 public:
  // Last write wins on pack_id.
  void add_context(LoadedContext entry);

  // Drops every pack registered from atlas_id. Returns how many were removed.
  std::size_t remove_source(const std::string& atlas_id);

  // max_results == 0 means unbounded.
  std::vector<MatchResult> query(const std::string& goal_text,
                                 const std::vector<std::string>& hints,
                                 const EvalContext& eval = {},
                                 std::size_t max_results = 0) const;

  std::size_t size() const { return entries_.size(); }
  bool contains(const std::string& pack_id) const { return entries_.contains(pack_id); }

 private:
  std::map<std::string, std::shared_ptr<const LoadedContext>> entries_;
};

}  // namespace cra
