#include "cra/hash.hpp"

// DESIGN INVARIANTS:
//   1. The chain primitive is SHA-256 and nothing else. A chain written with one
//      primitive must verify with the same one; there is no negotiation.
//   2. BLAKE3 digests are domain-separated. "atlas:" and "carp:" prefixes are
//      part of the digest contract.
//   3. Hex output is lower-case. Verification compares strings byte-for-byte.
//
// EXTENSION_POINT: chain_hash_upgrade
//   Bump version::CHAIN_HASH_VERSION, carry the version in each event, and
//   verify old events with the old primitive for a migration window.
//
// MICRO_OPT: to_hex() uses a lookup table (kHexChars) instead of snprintf.

#include <array>

#include <openssl/evp.h>

extern "C" {
#include <blake3.h>
}

namespace cra {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

}  // namespace

std::string sha256_hex(std::string_view payload) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int len = 0;
  // EVP_Digest only fails on allocation failure; an empty return makes every
  // comparison against a stored hash fail rather than silently pass.
  if (EVP_Digest(payload.data(), payload.size(), digest.data(), &len, EVP_sha256(), nullptr) != 1) {
    return {};
  }
  return to_hex(digest.data(), len);
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string atlas_digest(std::string_view canonical_manifest_json) {
  return hash_domain("atlas:", canonical_manifest_json);
}

std::string request_digest(std::string_view canonical_request_json) {
  return hash_domain("carp:", canonical_request_json);
}

bool is_hex_digest(std::string_view s) {
  if (s.size() != 64) return false;
  for (char c : s) {
    const bool digit = c >= '0' && c <= '9';
    const bool lower = c >= 'a' && c <= 'f';
    if (!digit && !lower) return false;
  }
  return true;
}

}  // namespace cra
