#include "cra/atlas.hpp"

#include <set>

#include "cra/hash.hpp"

namespace cra {

namespace {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

void fail(std::optional<Error>* err, const std::string& message) {
  if (err && !*err) *err = make_error(ErrorCode::serialization_error, message);
}

// Iterates an optional array-of-objects field, reporting non-object elements.
template <typename Fn>
void for_each_object(const Object& o, const std::string& key, std::optional<Error>* err, Fn&& fn) {
  const Array* arr = jsonlite::get_array(o, key);
  if (!arr) return;
  for (const auto& item : *arr) {
    const auto* obj = std::get_if<Object>(&item.v);
    if (!obj) {
      fail(err, "non-object element in " + key);
      return;
    }
    fn(*obj);
  }
}

RiskTier parse_tier(const Object& o, const std::string& key, std::optional<Error>* err) {
  const std::string s = jsonlite::get_string(o, key, "low");
  auto tier = risk_tier_from_string(s);
  if (!tier) {
    fail(err, "unknown risk tier: " + s);
    return RiskTier::low;
  }
  return *tier;
}

}  // namespace

std::string to_string(PolicyType type) {
  switch (type) {
    case PolicyType::deny:              return "deny";
    case PolicyType::allow:             return "allow";
    case PolicyType::requires_approval: return "requires_approval";
    case PolicyType::rate_limit:        return "rate_limit";
  }
  return "deny";
}

std::optional<PolicyType> policy_type_from_string(const std::string& s) {
  if (s == "deny")              return PolicyType::deny;
  if (s == "allow")             return PolicyType::allow;
  if (s == "requires_approval") return PolicyType::requires_approval;
  if (s == "rate_limit")        return PolicyType::rate_limit;
  return std::nullopt;
}

std::string to_string(InjectMode mode) {
  switch (mode) {
    case InjectMode::always:    return "always";
    case InjectMode::on_match:  return "on_match";
    case InjectMode::on_demand: return "on_demand";
  }
  return "on_match";
}

std::optional<InjectMode> inject_mode_from_string(const std::string& s) {
  if (s == "always")    return InjectMode::always;
  if (s == "on_match")  return InjectMode::on_match;
  if (s == "on_demand") return InjectMode::on_demand;
  return std::nullopt;
}

const AtlasAction* AtlasManifest::find_action(const std::string& action_id) const {
  for (const auto& a : actions) {
    if (a.action_id == action_id) return &a;
  }
  return nullptr;
}

bool AtlasManifest::has_capability(const std::string& capability_id) const {
  for (const auto& c : capabilities) {
    if (c.capability_id == capability_id) return true;
  }
  return false;
}

std::optional<Error> validate_manifest(const AtlasManifest& m) {
  auto invalid = [&](const std::string& msg) {
    return make_error(ErrorCode::validation_error, "atlas '" + m.atlas_id + "': " + msg);
  };
  if (m.atlas_id.empty()) return make_error(ErrorCode::validation_error, "atlas_id is required");
  if (m.name.empty()) return invalid("name is required");
  if (m.version.empty()) return invalid("version is required");

  std::set<std::string> seen;
  for (const auto& a : m.actions) {
    if (a.action_id.empty()) return invalid("action with empty action_id");
    if (!seen.insert(a.action_id).second) return invalid("duplicate action_id " + a.action_id);
  }
  seen.clear();
  for (const auto& c : m.capabilities) {
    if (c.capability_id.empty()) return invalid("capability with empty capability_id");
    if (!seen.insert(c.capability_id).second) return invalid("duplicate capability_id " + c.capability_id);
  }
  seen.clear();
  for (const auto& p : m.policies) {
    if (p.policy_id.empty()) return invalid("policy with empty policy_id");
    if (!seen.insert(p.policy_id).second) return invalid("duplicate policy_id " + p.policy_id);
    if (p.type == PolicyType::rate_limit) {
      if (jsonlite::get_u64(p.parameters, "max_calls", 0) == 0 ||
          jsonlite::get_u64(p.parameters, "window_seconds", 0) == 0) {
        return invalid("rate_limit policy " + p.policy_id + " needs positive max_calls and window_seconds");
      }
      const std::string scope = jsonlite::get_string(p.parameters, "scope", "session");
      if (scope != "session" && scope != "agent") {
        return invalid("rate_limit policy " + p.policy_id + " has unknown scope " + scope);
      }
    }
  }
  seen.clear();
  for (const auto& pack : m.context_packs) {
    if (pack.pack_id.empty()) return invalid("context pack with empty pack_id");
    if (!seen.insert(pack.pack_id).second) return invalid("duplicate pack_id " + pack.pack_id);
  }
  return std::nullopt;
}

Value atlas_to_value(const AtlasManifest& m) {
  Array caps;
  for (const auto& c : m.capabilities) {
    Object o;
    o["capability_id"] = c.capability_id;
    o["name"] = c.name;
    o["description"] = c.description;
    o["actions"] = jsonlite::string_array(c.actions);
    caps.push_back(std::move(o));
  }

  Array actions;
  for (const auto& a : m.actions) {
    Object o;
    o["action_id"] = a.action_id;
    o["name"] = a.name;
    o["description"] = a.description;
    o["parameters_schema"] = a.parameters_schema;
    o["risk_tier"] = to_string(a.risk_tier);
    actions.push_back(std::move(o));
  }

  Array policies;
  for (const auto& p : m.policies) {
    Object o;
    o["policy_id"] = p.policy_id;
    o["type"] = to_string(p.type);
    o["actions"] = jsonlite::string_array(p.actions);
    o["reason"] = p.reason;
    o["parameters"] = p.parameters;
    policies.push_back(std::move(o));
  }

  Array constraints;
  for (const auto& c : m.constraints) {
    Object o;
    o["id"] = c.id;
    o["description"] = c.description;
    constraints.push_back(std::move(o));
  }

  Array packs;
  for (const auto& p : m.context_packs) {
    Object o;
    o["pack_id"] = p.pack_id;
    o["name"] = p.name;
    o["content"] = p.content;
    o["content_type"] = p.content_type;
    o["priority"] = static_cast<std::int64_t>(p.priority);
    o["keywords"] = jsonlite::string_array(p.keywords);
    o["inject_mode"] = to_string(p.inject_mode);
    if (p.condition) {
      Object cond;
      cond["file_patterns"] = jsonlite::string_array(p.condition->file_patterns);
      cond["capabilities"] = jsonlite::string_array(p.condition->capabilities);
      Array tiers;
      for (auto t : p.condition->risk_tiers) tiers.push_back(to_string(t));
      cond["risk_tiers"] = std::move(tiers);
      cond["context_hints"] = jsonlite::string_array(p.condition->context_hints);
      o["condition"] = std::move(cond);
    } else {
      o["condition"] = nullptr;
    }
    packs.push_back(std::move(o));
  }

  Object o;
  o["atlas_id"] = m.atlas_id;
  o["version"] = m.version;
  o["name"] = m.name;
  o["description"] = m.description;
  o["domains"] = jsonlite::string_array(m.domains);
  o["capabilities"] = std::move(caps);
  o["actions"] = std::move(actions);
  o["policies"] = std::move(policies);
  o["constraints"] = std::move(constraints);
  o["context_packs"] = std::move(packs);
  return o;
}

AtlasManifest atlas_from_json(const std::string& text, std::optional<Error>* error) {
  AtlasManifest m;
  std::optional<jsonlite::JsonError> json_err;
  Object o = jsonlite::parse(text, &json_err);
  if (json_err) {
    if (error) *error = make_error(ErrorCode::serialization_error, json_err->message);
    return m;
  }

  std::optional<Error> err;
  m.atlas_id = jsonlite::get_string(o, "atlas_id");
  m.version = jsonlite::get_string(o, "version");
  m.name = jsonlite::get_string(o, "name");
  m.description = jsonlite::get_string(o, "description");
  m.domains = jsonlite::get_string_array(o, "domains");

  for_each_object(o, "capabilities", &err, [&](const Object& c) {
    AtlasCapability cap;
    cap.capability_id = jsonlite::get_string(c, "capability_id");
    cap.name = jsonlite::get_string(c, "name");
    cap.description = jsonlite::get_string(c, "description");
    cap.actions = jsonlite::get_string_array(c, "actions");
    m.capabilities.push_back(std::move(cap));
  });

  for_each_object(o, "actions", &err, [&](const Object& a) {
    AtlasAction action;
    action.action_id = jsonlite::get_string(a, "action_id");
    action.name = jsonlite::get_string(a, "name");
    action.description = jsonlite::get_string(a, "description");
    auto schema = a.find("parameters_schema");
    action.parameters_schema = schema != a.end() ? schema->second : Value(Object{});
    action.risk_tier = parse_tier(a, "risk_tier", &err);
    m.actions.push_back(std::move(action));
  });

  for_each_object(o, "policies", &err, [&](const Object& p) {
    AtlasPolicy policy;
    policy.policy_id = jsonlite::get_string(p, "policy_id");
    const std::string type = jsonlite::get_string(p, "type");
    if (auto parsed = policy_type_from_string(type)) {
      policy.type = *parsed;
    } else {
      fail(&err, "unknown policy type '" + type + "' in " + policy.policy_id);
    }
    policy.actions = jsonlite::get_string_array(p, "actions");
    policy.reason = jsonlite::get_string(p, "reason");
    if (const Object* params = jsonlite::get_object(p, "parameters")) policy.parameters = *params;
    m.policies.push_back(std::move(policy));
  });

  for_each_object(o, "constraints", &err, [&](const Object& c) {
    m.constraints.push_back(Constraint{jsonlite::get_string(c, "id"), jsonlite::get_string(c, "description")});
  });

  for_each_object(o, "context_packs", &err, [&](const Object& p) {
    AtlasContextPack pack;
    pack.pack_id = jsonlite::get_string(p, "pack_id");
    pack.name = jsonlite::get_string(p, "name", pack.pack_id);
    pack.content = jsonlite::get_string(p, "content");
    pack.content_type = jsonlite::get_string(p, "content_type", "text/markdown");
    pack.priority = static_cast<int32_t>(jsonlite::get_i64(p, "priority", 0));
    pack.keywords = jsonlite::get_string_array(p, "keywords");
    const std::string mode = jsonlite::get_string(p, "inject_mode", "on_match");
    if (auto parsed = inject_mode_from_string(mode)) {
      pack.inject_mode = *parsed;
    } else {
      fail(&err, "unknown inject_mode '" + mode + "' in " + pack.pack_id);
    }
    if (const Object* c = jsonlite::get_object(p, "condition")) {
      ContextCondition cond;
      cond.file_patterns = jsonlite::get_string_array(*c, "file_patterns");
      cond.capabilities = jsonlite::get_string_array(*c, "capabilities");
      cond.context_hints = jsonlite::get_string_array(*c, "context_hints");
      for (const auto& t : jsonlite::get_string_array(*c, "risk_tiers")) {
        if (auto tier = risk_tier_from_string(t)) {
          cond.risk_tiers.push_back(*tier);
        } else {
          fail(&err, "unknown risk tier '" + t + "' in condition of " + pack.pack_id);
        }
      }
      pack.condition = std::move(cond);
    }
    m.context_packs.push_back(std::move(pack));
  });

  if (err && error) *error = std::move(err);
  return m;
}

// ---------------------------------------------------------------------------
// AtlasRegistry
// ---------------------------------------------------------------------------

std::optional<Error> AtlasRegistry::load(AtlasManifest manifest) {
  if (auto err = validate_manifest(manifest)) return err;
  if (atlases_.contains(manifest.atlas_id)) {
    return make_error(ErrorCode::already_exists, "atlas already loaded: " + manifest.atlas_id);
  }
  std::string id = manifest.atlas_id;
  std::string fp = atlas_digest(jsonlite::to_json(atlas_to_value(manifest)));
  atlases_.emplace(std::move(id), Stored{std::make_shared<const AtlasManifest>(std::move(manifest)), std::move(fp)});
  return std::nullopt;
}

std::optional<Error> AtlasRegistry::reload(AtlasManifest manifest) {
  if (auto err = validate_manifest(manifest)) return err;
  auto it = atlases_.find(manifest.atlas_id);
  if (it == atlases_.end()) {
    return make_error(ErrorCode::not_found, "atlas not loaded: " + manifest.atlas_id);
  }
  it->second.digest = atlas_digest(jsonlite::to_json(atlas_to_value(manifest)));
  it->second.manifest = std::make_shared<const AtlasManifest>(std::move(manifest));
  return std::nullopt;
}

std::optional<Error> AtlasRegistry::unload(const std::string& atlas_id) {
  if (atlases_.erase(atlas_id) == 0) return make_error(ErrorCode::not_found, "atlas not loaded: " + atlas_id);
  return std::nullopt;
}

std::shared_ptr<const AtlasManifest> AtlasRegistry::get(const std::string& atlas_id) const {
  auto it = atlases_.find(atlas_id);
  if (it == atlases_.end()) return nullptr;
  return it->second.manifest;
}

std::string AtlasRegistry::digest(const std::string& atlas_id) const {
  auto it = atlases_.find(atlas_id);
  return it == atlases_.end() ? std::string{} : it->second.digest;
}

}  // namespace cra
