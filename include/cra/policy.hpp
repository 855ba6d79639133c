#pragma once

// cra/policy.hpp: Ordered policy evaluation.
//
// DESIGN INVARIANTS:
//   1. Fixed category order: Deny, Approval, RateLimit, then default Allow.
//      The first category that returns a decision wins. A request matching both
//      a deny rule and an approval rule is denied.
//   2. Evaluation is pure. Everything it reads arrives as an argument: the
//      request, the atlas snapshot and the usage snapshot. Identical inputs give
//      identical decisions. The usage ledger lives in the Resolver.
//   3. Rate-limit denials are Deny with a rate-limit reason. There is no
//      separate decision variant for them.
//
// EXTENSION_POINT: new_policy_category
//   Derive from PolicyCategory and insert it into PolicyEvaluator's list at the
//   position that matches its precedence. Categories never see each other.

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "cra/atlas.hpp"
#include "cra/protocol.hpp"
#include "cra/types.hpp"

namespace cra {

// Atlases referenced by the request, in request order.
using AtlasView = std::vector<std::shared_ptr<const AtlasManifest>>;

// Borrowed views of the Resolver's usage ledger. The ledger must outlive the
// evaluation and stay unmodified during it.
struct UsageSnapshot {
  uint64_t                  now_unix_ms{0};
  std::span<const uint64_t> agent_request_times;    // prior counted resolves by this agent
  std::span<const uint64_t> session_request_times;  // prior counted resolves in this session
};

struct PolicyConfig {
  RiskTier    risk_ceiling{RiskTier::critical};
  RiskTier    approval_threshold{RiskTier::high};
  std::string default_approver{"operator"};
  uint64_t    default_approval_timeout_seconds{3600};
};

// decision == nullopt means "pass to the next category".
struct CategoryVerdict {
  std::optional<Decision> decision;
  std::string             policy_id;  // deciding policy, empty for built-in rules

  static CategoryVerdict pass() { return {}; }
};

class PolicyCategory {
 public:
  virtual ~PolicyCategory() = default;
  virtual std::string name() const = 0;
  virtual CategoryVerdict evaluate(const CarpRequest& request, const AtlasView& atlases,
                                   const UsageSnapshot& usage) const = 0;
};

class DenyCategory final : public PolicyCategory {
 public:
  explicit DenyCategory(PolicyConfig cfg) : cfg_(std::move(cfg)) {}
  std::string name() const override { return "deny"; }
  CategoryVerdict evaluate(const CarpRequest& request, const AtlasView& atlases,
                           const UsageSnapshot& usage) const override;

 private:
  PolicyConfig cfg_;
};

class ApprovalCategory final : public PolicyCategory {
 public:
  explicit ApprovalCategory(PolicyConfig cfg) : cfg_(std::move(cfg)) {}
  std::string name() const override { return "approval"; }
  CategoryVerdict evaluate(const CarpRequest& request, const AtlasView& atlases,
                           const UsageSnapshot& usage) const override;

 private:
  PolicyConfig cfg_;
};

class RateLimitCategory final : public PolicyCategory {
 public:
  std::string name() const override { return "rate_limit"; }
  CategoryVerdict evaluate(const CarpRequest& request, const AtlasView& atlases,
                           const UsageSnapshot& usage) const override;
};

struct EvaluationResult {
  Decision    decision{Allow{}};
  std::string category{"default"};  // deciding category name
  std::string policy_id;
};

class PolicyEvaluator {
 public:
  explicit PolicyEvaluator(PolicyConfig cfg = {});

  Decision evaluate(const CarpRequest& request, const AtlasView& atlases,
                    const UsageSnapshot& usage = {}) const;

  EvaluationResult evaluate_detailed(const CarpRequest& request, const AtlasView& atlases,
                                     const UsageSnapshot& usage = {}) const;

  // Splits every action in view into allowed and denied lists for the
  // resolution body. Denied: matched by a deny policy, gated by an approval
  // policy, or above the risk ceiling.
  void partition_actions(const AtlasView& atlases, std::vector<AllowedAction>* allowed,
                         std::vector<DeniedAction>* denied) const;

  // Execution-time gate for one action: a matching deny policy or a tier above
  // the ceiling. Approval gates are settled at resolve time and not re-checked.
  // Sets *policy_id when a policy decided.
  std::optional<Deny> gate_action(const AtlasView& atlases, const std::string& action_id,
                                  std::string* policy_id) const;

  const PolicyConfig& config() const { return cfg_; }

 private:
  PolicyConfig                                 cfg_;
  std::vector<std::unique_ptr<PolicyCategory>> categories_;
};

// Exact id, "prefix.*", "*.suffix" or "*".
bool action_pattern_matches(const std::string& pattern, const std::string& action_id);

// Longest rate-limit window across the atlases, in ms; 0 when none declares one.
// Usage older than this can never influence a decision.
uint64_t longest_rate_window_ms(const AtlasView& atlases);

}  // namespace cra
