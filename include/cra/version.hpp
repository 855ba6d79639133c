#pragma once

// cra/version.hpp: Explicit version manifest for every protocol surface.
//
// PURPOSE:
//   Prevent silent format drift across the CARP request/resolution protocol and
//   the TRACE event chain. Every component that reads or writes a versioned
//   format checks its constant here.
//
// INVARIANT:
//   All version constants are compile-time. A CARP request carrying a different
//   carp_version is rejected with validation_error, never coerced.

#include <cstdint>
#include <string>

namespace cra {
namespace version {

constexpr const char* ENGINE_SEMVER = "0.3.0";

// ---------------------------------------------------------------------------
// CARP_VERSION
// Request/resolution wire contract. Requests must carry exactly this value.
// ---------------------------------------------------------------------------
constexpr const char* CARP_VERSION = "1.0";

// ---------------------------------------------------------------------------
// TRACE_VERSION
// Event record shape. Part of every hashed event body, so a bump changes every
// event hash.
// ---------------------------------------------------------------------------
constexpr const char* TRACE_VERSION = "1.0";

// ---------------------------------------------------------------------------
// CHAIN_HASH_VERSION
// Version 1 = SHA-256 over (previous_event_hash ++ canonical event body),
// hex-encoded to 64 chars. Bump when the primitive or the canonical body changes.
// ---------------------------------------------------------------------------
constexpr uint32_t CHAIN_HASH_VERSION = 1;

// ---------------------------------------------------------------------------
// ATLAS_DIGEST_VERSION
// Version 1 = BLAKE3 over "atlas:" ++ canonical manifest JSON.
// ---------------------------------------------------------------------------
constexpr uint32_t ATLAS_DIGEST_VERSION = 1;

struct VersionManifest {
  std::string engine_semver{ENGINE_SEMVER};
  std::string carp_version{CARP_VERSION};
  std::string trace_version{TRACE_VERSION};
  uint32_t    chain_hash{CHAIN_HASH_VERSION};
  uint32_t    atlas_digest{ATLAS_DIGEST_VERSION};
  std::string chain_hash_primitive{"sha256"};
  std::string digest_primitive{"blake3"};
};

VersionManifest current_manifest();
std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace cra
