#pragma once

// cra/hash.hpp: Hash primitives.
//
// Two primitives with disjoint jobs:
//   sha256_hex   TRACE chain links. Fixed by version::CHAIN_HASH_VERSION = 1.
//   blake3_hex   Content fingerprints (atlas manifests, request digests),
//                always through hash_domain() so digests of different kinds of
//                payload can never collide.
//
// All outputs are lower-case hex, 64 chars.

#include <string>
#include <string_view>

namespace cra {

std::string sha256_hex(std::string_view payload);

std::string blake3_hex(std::string_view payload);

// BLAKE3(domain ++ payload). Domains in use: "atlas:", "carp:".
std::string hash_domain(std::string_view domain, std::string_view payload);

std::string atlas_digest(std::string_view canonical_manifest_json);
std::string request_digest(std::string_view canonical_request_json);

// True when s is exactly 64 lower-case hex characters.
bool is_hex_digest(std::string_view s);

}  // namespace cra
