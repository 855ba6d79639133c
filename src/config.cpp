#include "cra/config.hpp"

#include <cstdlib>
#include <map>
#include <variant>

#include "cra/jsonlite.hpp"

namespace cra {

namespace {

enum class KeyType { string, unsigned_int, boolean };

const std::map<std::string, KeyType>& key_types() {
  static const std::map<std::string, KeyType> types = {
      {"genesis_seed", KeyType::string},
      {"default_ttl_seconds", KeyType::unsigned_int},
      {"trace_queue_capacity", KeyType::unsigned_int},
      {"max_context_blocks", KeyType::unsigned_int},
      {"risk_ceiling", KeyType::string},
      {"approval_threshold", KeyType::string},
      {"default_approver", KeyType::string},
      {"default_approval_timeout_seconds", KeyType::unsigned_int},
      {"parallel_evaluation", KeyType::boolean},
      {"event_log_path", KeyType::string},
  };
  return types;
}

bool has_type(const jsonlite::Value& value, KeyType type) {
  switch (type) {
    case KeyType::string: return value.is_string();
    case KeyType::boolean: return std::holds_alternative<bool>(value.v);
    case KeyType::unsigned_int:
      if (std::holds_alternative<std::uint64_t>(value.v)) return true;
      if (const auto* i = std::get_if<std::int64_t>(&value.v)) return *i >= 0;
      return false;
  }
  return false;
}

const char* type_name(KeyType type) {
  switch (type) {
    case KeyType::string: return "string";
    case KeyType::unsigned_int: return "unsigned integer";
    case KeyType::boolean: return "boolean";
  }
  return "value";
}

bool parse_u64(const std::string& s, uint64_t* out) {
  if (s.empty()) return false;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(s.c_str(), &end, 10);
  if (end == nullptr || *end != '\0' || s[0] == '-') return false;
  *out = static_cast<uint64_t>(v);
  return true;
}

void check_invariants(ConfigValidationResult* r) {
  const ResolverConfig& c = r->config;
  if (c.genesis_seed.empty()) r->errors.push_back("genesis_seed must not be empty");
  if (c.trace_queue_capacity == 0) r->errors.push_back("trace_queue_capacity must be positive");
  if (c.default_ttl_seconds == 0) r->warnings.push_back("default_ttl_seconds is 0; every resolution is stale on arrival");
  if (c.approval_threshold > c.risk_ceiling) {
    r->warnings.push_back("approval_threshold above risk_ceiling; approval by risk tier can never trigger");
  }
}

}  // namespace

PolicyConfig ResolverConfig::policy_config() const {
  PolicyConfig p;
  p.risk_ceiling = risk_ceiling;
  p.approval_threshold = approval_threshold;
  p.default_approver = default_approver;
  p.default_approval_timeout_seconds = default_approval_timeout_seconds;
  return p;
}

std::string ResolverConfig::to_json() const {
  jsonlite::Object o;
  o["genesis_seed"] = genesis_seed;
  o["default_ttl_seconds"] = default_ttl_seconds;
  o["trace_queue_capacity"] = static_cast<std::uint64_t>(trace_queue_capacity);
  o["max_context_blocks"] = static_cast<std::uint64_t>(max_context_blocks);
  o["risk_ceiling"] = to_string(risk_ceiling);
  o["approval_threshold"] = to_string(approval_threshold);
  o["default_approver"] = default_approver;
  o["default_approval_timeout_seconds"] = default_approval_timeout_seconds;
  o["parallel_evaluation"] = parallel_evaluation;
  o["event_log_path"] = event_log_path;
  return jsonlite::to_json(o);
}

ConfigValidationResult config_from_json(const std::string& config_json) {
  ConfigValidationResult r;
  std::optional<jsonlite::JsonError> err;
  jsonlite::Object o = jsonlite::parse(config_json, &err);
  if (err) {
    r.errors.push_back("invalid JSON: " + err->message);
    return r;
  }

  for (const auto& [key, value] : o) {
    auto known = key_types().find(key);
    if (known == key_types().end()) {
      r.warnings.push_back("unknown key: " + key);
    } else if (!has_type(value, known->second)) {
      r.errors.push_back(key + ": expected " + type_name(known->second));
    }
  }
  if (!r.errors.empty()) return r;

  ResolverConfig& c = r.config;
  c.genesis_seed = jsonlite::get_string(o, "genesis_seed", c.genesis_seed);
  c.default_ttl_seconds = jsonlite::get_u64(o, "default_ttl_seconds", c.default_ttl_seconds);
  c.trace_queue_capacity = static_cast<std::size_t>(jsonlite::get_u64(o, "trace_queue_capacity", c.trace_queue_capacity));
  c.max_context_blocks = static_cast<std::size_t>(jsonlite::get_u64(o, "max_context_blocks", c.max_context_blocks));
  c.default_approver = jsonlite::get_string(o, "default_approver", c.default_approver);
  c.default_approval_timeout_seconds =
      jsonlite::get_u64(o, "default_approval_timeout_seconds", c.default_approval_timeout_seconds);
  c.parallel_evaluation = jsonlite::get_bool(o, "parallel_evaluation", c.parallel_evaluation);
  c.event_log_path = jsonlite::get_string(o, "event_log_path", c.event_log_path);

  for (const char* key : {"risk_ceiling", "approval_threshold"}) {
    if (!o.contains(key)) continue;
    const std::string s = jsonlite::get_string(o, key);
    auto tier = risk_tier_from_string(s);
    if (!tier) {
      r.errors.push_back(std::string(key) + ": unknown risk tier '" + s + "'");
      continue;
    }
    if (std::string(key) == "risk_ceiling") {
      c.risk_ceiling = *tier;
    } else {
      c.approval_threshold = *tier;
    }
  }

  check_invariants(&r);
  r.ok = r.errors.empty();
  return r;
}

ConfigValidationResult apply_env_overrides(ResolverConfig cfg) {
  ConfigValidationResult r;
  r.config = std::move(cfg);
  ResolverConfig& c = r.config;

  if (const char* e = std::getenv("CRA_GENESIS_SEED")) {
    if (*e != '\0') {
      c.genesis_seed = e;
    } else {
      r.errors.push_back("CRA_GENESIS_SEED is set but empty");
    }
  }
  if (const char* e = std::getenv("CRA_DEFAULT_TTL")) {
    uint64_t v = 0;
    if (parse_u64(e, &v)) {
      c.default_ttl_seconds = v;
    } else {
      r.errors.push_back(std::string("CRA_DEFAULT_TTL is not an unsigned integer: ") + e);
    }
  }
  if (const char* e = std::getenv("CRA_TRACE_QUEUE_CAPACITY")) {
    uint64_t v = 0;
    if (parse_u64(e, &v) && v > 0) {
      c.trace_queue_capacity = static_cast<std::size_t>(v);
    } else {
      r.errors.push_back(std::string("CRA_TRACE_QUEUE_CAPACITY must be a positive integer: ") + e);
    }
  }
  if (const char* e = std::getenv("CRA_RISK_CEILING")) {
    if (auto tier = risk_tier_from_string(e)) {
      c.risk_ceiling = *tier;
    } else {
      r.errors.push_back(std::string("CRA_RISK_CEILING: unknown risk tier ") + e);
    }
  }
  if (const char* e = std::getenv("CRA_EVENT_LOG")) {
    c.event_log_path = e;
  }

  check_invariants(&r);
  r.ok = r.errors.empty();
  return r;
}

ConfigValidationResult config_from_env() {
  return apply_env_overrides(ResolverConfig{});
}

}  // namespace cra
