#pragma once

// cra/config.hpp: Resolver configuration.
//
// A plain value, built once before the Resolver and never mutated after. Every
// recognized option and its default is listed below. Sources, lowest first:
//   1. defaults in this struct
//   2. config_from_json()   (unknown keys are warnings, mistyped or bad values are errors)
//   3. apply_env_overrides() / config_from_env()
//
// Environment variables:
//   CRA_GENESIS_SEED          any non-empty string
//   CRA_DEFAULT_TTL           seconds
//   CRA_TRACE_QUEUE_CAPACITY  events
//   CRA_RISK_CEILING          low|medium|high|critical
//   CRA_EVENT_LOG             JSONL path for resolution events
//   CRA_LOG_LEVEL             read by cra::log, not stored here

#include <cstdint>
#include <string>
#include <vector>

#include "cra/policy.hpp"
#include "cra/types.hpp"

namespace cra {

constexpr const char* kZeroGenesis = "0000000000000000000000000000000000000000000000000000000000000000";

struct ResolverConfig {
  std::string genesis_seed{kZeroGenesis};
  uint64_t    default_ttl_seconds{300};
  std::size_t trace_queue_capacity{4096};
  std::size_t max_context_blocks{10};
  RiskTier    risk_ceiling{RiskTier::critical};
  RiskTier    approval_threshold{RiskTier::high};
  std::string default_approver{"operator"};
  uint64_t    default_approval_timeout_seconds{3600};
  bool        parallel_evaluation{true};
  std::string event_log_path;

  PolicyConfig policy_config() const;
  std::string to_json() const;
};

struct ConfigValidationResult {
  bool                     ok{false};
  ResolverConfig           config;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

ConfigValidationResult config_from_json(const std::string& config_json);

// Overlays CRA_* variables onto cfg. Invalid values are reported in the result
// and leave the field untouched.
ConfigValidationResult apply_env_overrides(ResolverConfig cfg);

// Defaults plus environment.
ConfigValidationResult config_from_env();

}  // namespace cra
