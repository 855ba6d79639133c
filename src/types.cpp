#include "cra/types.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <random>

#include "cra/jsonlite.hpp"

namespace cra {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::not_found: return "not_found";
    case ErrorCode::already_exists: return "already_exists";
    case ErrorCode::invalid_state: return "invalid_state";
    case ErrorCode::validation_error: return "validation_error";
    case ErrorCode::chain_integrity_error: return "chain_integrity_error";
    case ErrorCode::serialization_error: return "serialization_error";
    case ErrorCode::backpressure: return "backpressure";
    case ErrorCode::action_denied: return "action_denied";
  }
  return "";
}

std::string Error::to_json() const {
  return "{\"code\":\"" + to_string(code) + "\",\"message\":\"" + jsonlite::escape(message) + "\"}";
}

Error make_error(ErrorCode code, std::string message) {
  return Error{code, std::move(message)};
}

std::optional<RiskTier> risk_tier_from_string(const std::string& s) {
  std::string lower(s);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "low")      return RiskTier::low;
  if (lower == "medium")   return RiskTier::medium;
  if (lower == "high")     return RiskTier::high;
  if (lower == "critical") return RiskTier::critical;
  return std::nullopt;
}

std::string to_string(RiskTier tier) {
  switch (tier) {
    case RiskTier::low:      return "low";
    case RiskTier::medium:   return "medium";
    case RiskTier::high:     return "high";
    case RiskTier::critical: return "critical";
  }
  return "low";
}

std::string generate_id() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  uint64_t hi = dist(rng);
  uint64_t lo = dist(rng);
  // Version 4, RFC 4122 variant.
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;
  char buf[37];
  std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                static_cast<unsigned>(hi >> 32),
                static_cast<unsigned>((hi >> 16) & 0xFFFF),
                static_cast<unsigned>(hi & 0xFFFF),
                static_cast<unsigned>(lo >> 48),
                static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
  return std::string(buf, 36);
}

uint64_t now_unix_ms() {
  using SC = std::chrono::system_clock;
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(SC::now().time_since_epoch()).count());
}

}  // namespace cra
