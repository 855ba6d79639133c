#pragma once

// cra/types.hpp: Shared vocabulary for the resolution engine: error model,
// risk tiers, identifiers and clocks.
//
// ERROR MODEL:
//   Every fallible call reports failure as a value: either it returns
//   std::optional<Error> (nullopt = success) or it returns its result and writes
//   an Error through a std::optional<Error>* out-parameter. No exception crosses
//   a public API and there is no per-thread "last error" slot.
//
//   "No match" is never an error. An empty context list or a default Allow
//   decision is a normal result.
//
// STABILITY:
//   to_string(ErrorCode) values are the transport-facing error codes. Transports
//   map them 1:1 onto wire errors, so renaming one is a protocol break.

#include <cstdint>
#include <optional>
#include <string>

namespace cra {

enum class ErrorCode {
  none,
  not_found,              // unknown session, atlas or trace
  already_exists,         // duplicate session id or atlas id
  invalid_state,          // operation on an ended session
  validation_error,       // malformed request or manifest
  chain_integrity_error,  // verification detected a break
  serialization_error,    // malformed payload at the protocol boundary
  backpressure,           // TRACE ingest queue full
  action_denied,          // execute() refused by a deny policy or the risk ceiling
};

std::string to_string(ErrorCode code);

struct Error {
  ErrorCode   code{ErrorCode::none};
  std::string message;

  // {"code":"...","message":"..."}
  std::string to_json() const;
};

Error make_error(ErrorCode code, std::string message);

// ---------------------------------------------------------------------------
// RiskTier: ordered (low < medium < high < critical).
// ---------------------------------------------------------------------------
enum class RiskTier : uint8_t {
  low      = 0,
  medium   = 1,
  high     = 2,
  critical = 3,
};

// Case-insensitive. Returns nullopt on unrecognized value.
std::optional<RiskTier> risk_tier_from_string(const std::string& s);
std::string to_string(RiskTier tier);

// ---------------------------------------------------------------------------
// Identifiers and time
// ---------------------------------------------------------------------------

// Random 128-bit identifier rendered in 8-4-4-4-12 hex groups (UUIDv4 layout).
std::string generate_id();

// Wall-clock milliseconds since the Unix epoch.
uint64_t now_unix_ms();

}  // namespace cra
