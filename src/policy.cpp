#include "cra/policy.hpp"

#include <algorithm>
#include <set>

namespace cra {

namespace {

bool matches_any(const std::vector<std::string>& patterns, const std::string& action_id) {
  return std::any_of(patterns.begin(), patterns.end(),
                     [&](const std::string& p) { return action_pattern_matches(p, action_id); });
}

const AtlasAction* find_action(const AtlasView& atlases, const std::string& action_id) {
  for (const auto& atlas : atlases) {
    if (const AtlasAction* a = atlas->find_action(action_id)) return a;
  }
  return nullptr;
}

bool capability_provided(const AtlasView& atlases, const std::string& capability) {
  for (const auto& atlas : atlases) {
    if (atlas->has_capability(capability) || atlas->find_action(capability)) return true;
  }
  return false;
}

// First policy of `type` (atlas order, then policy order) matching action_id.
const AtlasPolicy* first_policy(const AtlasView& atlases, PolicyType type, const std::string& action_id) {
  for (const auto& atlas : atlases) {
    for (const auto& p : atlas->policies) {
      if (p.type == type && matches_any(p.actions, action_id)) return &p;
    }
  }
  return nullptr;
}

RequiresApproval approval_from(const AtlasPolicy* p, const PolicyConfig& cfg) {
  RequiresApproval ra{cfg.default_approver, cfg.default_approval_timeout_seconds};
  if (p) {
    ra.approver = jsonlite::get_string(p->parameters, "approver", cfg.default_approver);
    ra.timeout_seconds = jsonlite::get_u64(p->parameters, "timeout_seconds", cfg.default_approval_timeout_seconds);
  }
  return ra;
}

bool universal(const AtlasPolicy& p) {
  return p.actions.empty() || std::find(p.actions.begin(), p.actions.end(), "*") != p.actions.end();
}

struct Exhausted {
  const AtlasPolicy* policy{nullptr};
  uint64_t           retry_after_seconds{0};
};

// Calls inside the window are those with now - t < window.
std::optional<Exhausted> check_window(const AtlasPolicy& p, const UsageSnapshot& usage) {
  const uint64_t max_calls = jsonlite::get_u64(p.parameters, "max_calls", 0);
  const uint64_t window_ms = jsonlite::get_u64(p.parameters, "window_seconds", 0) * 1000;
  if (max_calls == 0 || window_ms == 0) return std::nullopt;
  const bool agent_scope = jsonlite::get_string(p.parameters, "scope", "session") == "agent";
  const auto& times = agent_scope ? usage.agent_request_times : usage.session_request_times;

  uint64_t count = 0;
  uint64_t oldest = usage.now_unix_ms;
  for (uint64_t t : times) {
    if (t <= usage.now_unix_ms && usage.now_unix_ms - t < window_ms) {
      ++count;
      oldest = std::min(oldest, t);
    }
  }
  if (count < max_calls) return std::nullopt;
  const uint64_t reopen_ms = oldest + window_ms - usage.now_unix_ms;
  return Exhausted{&p, (reopen_ms + 999) / 1000};
}

std::string rate_limit_reason(const Exhausted& e) {
  return "rate limit exceeded by policy " + e.policy->policy_id + "; retry after " +
         std::to_string(e.retry_after_seconds) + "s";
}

}  // namespace

bool action_pattern_matches(const std::string& pattern, const std::string& action_id) {
  if (pattern == "*" || pattern == action_id) return true;
  if (pattern.size() > 2 && pattern.ends_with(".*")) {
    const std::string prefix = pattern.substr(0, pattern.size() - 1);  // keeps the '.'
    return action_id.size() > prefix.size() && action_id.starts_with(prefix);
  }
  if (pattern.size() > 2 && pattern.starts_with("*.")) {
    const std::string suffix = pattern.substr(1);  // keeps the '.'
    return action_id.size() > suffix.size() && action_id.ends_with(suffix);
  }
  return false;
}

// ---------------------------------------------------------------------------
// Categories
// ---------------------------------------------------------------------------

CategoryVerdict DenyCategory::evaluate(const CarpRequest& request, const AtlasView& atlases,
                                       const UsageSnapshot& /*usage*/) const {
  for (const auto& cap : request.task.required_capabilities) {
    if (!capability_provided(atlases, cap)) {
      return {Deny{"capability '" + cap + "' is not provided by any referenced atlas"}, {}};
    }
  }
  for (const auto& action_id : request.task.requested_actions) {
    if (!find_action(atlases, action_id)) {
      return {Deny{"action '" + action_id + "' is not provided by any referenced atlas"}, {}};
    }
  }
  if (request.task.risk_tier && *request.task.risk_tier > cfg_.risk_ceiling) {
    return {Deny{"risk tier " + to_string(*request.task.risk_tier) + " exceeds ceiling " +
                 to_string(cfg_.risk_ceiling)},
            {}};
  }
  for (const auto& action_id : request.task.requested_actions) {
    if (const AtlasPolicy* p = first_policy(atlases, PolicyType::deny, action_id)) {
      std::string reason = p->reason.empty() ? "action '" + action_id + "' denied by policy " + p->policy_id
                                             : p->reason;
      return {Deny{std::move(reason)}, p->policy_id};
    }
  }
  return CategoryVerdict::pass();
}

CategoryVerdict ApprovalCategory::evaluate(const CarpRequest& request, const AtlasView& atlases,
                                           const UsageSnapshot& /*usage*/) const {
  for (const auto& action_id : request.task.requested_actions) {
    if (const AtlasPolicy* p = first_policy(atlases, PolicyType::requires_approval, action_id)) {
      return {approval_from(p, cfg_), p->policy_id};
    }
  }
  for (const auto& action_id : request.task.requested_actions) {
    const AtlasAction* a = find_action(atlases, action_id);
    if (a && a->risk_tier >= cfg_.approval_threshold) {
      return {approval_from(nullptr, cfg_), {}};
    }
  }
  if (request.task.risk_tier && *request.task.risk_tier >= cfg_.approval_threshold) {
    return {approval_from(nullptr, cfg_), {}};
  }
  return CategoryVerdict::pass();
}

CategoryVerdict RateLimitCategory::evaluate(const CarpRequest& request, const AtlasView& atlases,
                                            const UsageSnapshot& usage) const {
  const auto& requested = request.task.requested_actions;
  std::vector<std::string> throttled;
  std::optional<Exhausted> first;

  for (const auto& atlas : atlases) {
    for (const auto& p : atlas->policies) {
      if (p.type != PolicyType::rate_limit) continue;
      const bool applies = universal(p) || std::any_of(requested.begin(), requested.end(),
                                                       [&](const std::string& a) { return matches_any(p.actions, a); });
      if (!applies) continue;
      auto exhausted = check_window(p, usage);
      if (!exhausted) continue;
      if (!first) first = exhausted;
      // A universal limit throttles the whole request.
      if (universal(p)) return {Deny{rate_limit_reason(*exhausted)}, p.policy_id};
      for (const auto& a : requested) {
        if (matches_any(p.actions, a) && std::find(throttled.begin(), throttled.end(), a) == throttled.end()) {
          throttled.push_back(a);
        }
      }
    }
  }

  if (!first) return CategoryVerdict::pass();
  const std::set<std::string> distinct(requested.begin(), requested.end());
  if (throttled.size() >= distinct.size()) {
    return {Deny{rate_limit_reason(*first)}, first->policy->policy_id};
  }
  std::string reason = rate_limit_reason(*first) + " for";
  for (const auto& a : throttled) reason += " " + a;
  return {Partial{std::move(reason)}, first->policy->policy_id};
}

// ---------------------------------------------------------------------------
// PolicyEvaluator
// ---------------------------------------------------------------------------

PolicyEvaluator::PolicyEvaluator(PolicyConfig cfg) : cfg_(std::move(cfg)) {
  categories_.push_back(std::make_unique<DenyCategory>(cfg_));
  categories_.push_back(std::make_unique<ApprovalCategory>(cfg_));
  categories_.push_back(std::make_unique<RateLimitCategory>());
}

Decision PolicyEvaluator::evaluate(const CarpRequest& request, const AtlasView& atlases,
                                   const UsageSnapshot& usage) const {
  return evaluate_detailed(request, atlases, usage).decision;
}

EvaluationResult PolicyEvaluator::evaluate_detailed(const CarpRequest& request, const AtlasView& atlases,
                                                    const UsageSnapshot& usage) const {
  for (const auto& category : categories_) {
    CategoryVerdict v = category->evaluate(request, atlases, usage);
    if (v.decision) {
      return EvaluationResult{std::move(*v.decision), category->name(), std::move(v.policy_id)};
    }
  }
  return EvaluationResult{};
}

void PolicyEvaluator::partition_actions(const AtlasView& atlases, std::vector<AllowedAction>* allowed,
                                        std::vector<DeniedAction>* denied) const {
  for (const auto& atlas : atlases) {
    for (const auto& a : atlas->actions) {
      std::optional<std::string> reason;
      if (const AtlasPolicy* p = first_policy(atlases, PolicyType::deny, a.action_id)) {
        reason = p->reason.empty() ? "denied by policy " + p->policy_id : p->reason;
      } else if (const AtlasPolicy* gate = first_policy(atlases, PolicyType::requires_approval, a.action_id)) {
        reason = "requires approval (policy " + gate->policy_id + ")";
      } else if (a.risk_tier > cfg_.risk_ceiling) {
        reason = "risk tier " + to_string(a.risk_tier) + " exceeds ceiling " + to_string(cfg_.risk_ceiling);
      }

      if (reason) {
        if (denied) denied->push_back(DeniedAction{a.action_id, std::move(*reason)});
      } else if (allowed) {
        AllowedAction out;
        out.action_id = a.action_id;
        out.name = a.name;
        if (!a.description.empty()) out.description = a.description;
        out.parameters_schema = a.parameters_schema;
        out.risk_tier = a.risk_tier;
        allowed->push_back(std::move(out));
      }
    }
  }
}

std::optional<Deny> PolicyEvaluator::gate_action(const AtlasView& atlases, const std::string& action_id,
                                                 std::string* policy_id) const {
  if (const AtlasPolicy* p = first_policy(atlases, PolicyType::deny, action_id)) {
    if (policy_id) *policy_id = p->policy_id;
    return Deny{p->reason.empty() ? "action '" + action_id + "' denied by policy " + p->policy_id : p->reason};
  }
  const AtlasAction* a = find_action(atlases, action_id);
  if (a && a->risk_tier > cfg_.risk_ceiling) {
    return Deny{"risk tier " + to_string(a->risk_tier) + " exceeds ceiling " + to_string(cfg_.risk_ceiling)};
  }
  return std::nullopt;
}

uint64_t longest_rate_window_ms(const AtlasView& atlases) {
  uint64_t longest = 0;
  for (const auto& atlas : atlases) {
    for (const auto& p : atlas->policies) {
      if (p.type != PolicyType::rate_limit) continue;
      longest = std::max(longest, jsonlite::get_u64(p.parameters, "window_seconds", 0) * 1000);
    }
  }
  return longest;
}

}  // namespace cra
