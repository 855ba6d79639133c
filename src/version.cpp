#include "cra/version.hpp"

#include <sstream>

namespace cra {
namespace version {

VersionManifest current_manifest() {
  return VersionManifest{};
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"engine_semver\":\"" << m.engine_semver << "\""
    << ",\"carp_version\":\"" << m.carp_version << "\""
    << ",\"trace_version\":\"" << m.trace_version << "\""
    << ",\"chain_hash\":" << m.chain_hash
    << ",\"atlas_digest\":" << m.atlas_digest
    << ",\"chain_hash_primitive\":\"" << m.chain_hash_primitive << "\""
    << ",\"digest_primitive\":\"" << m.digest_primitive << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace cra
