#include "enginecert/version.hpp"

#include <sstream>

#include "enginecert/hash.hpp"

#ifndef PROJECT_VERSION
#define PROJECT_VERSION "0.0.0-dev"
#endif

namespace enginecert {
namespace version {

std::string algorithm_version_tag() {
  return "enginecert-fp/" + std::to_string(FINGERPRINT_ALGORITHM_VERSION) +
         ";normalizer/" + std::to_string(NORMALIZER_VERSION) + ";blake3";
}

VersionManifest current_manifest() {
  VersionManifest m;
  m.algorithm_version = algorithm_version_tag();
  m.engine_semver     = PROJECT_VERSION;
  const auto info     = hash_runtime_info();
  m.hash_primitive    = info.primitive;
  m.hash_library      = info.version;
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"fingerprint_algorithm\":" << m.fingerprint_algorithm
    << ",\"normalizer\":" << m.normalizer
    << ",\"receipt_schema\":" << m.receipt_schema
    << ",\"baseline_format\":" << m.baseline_format
    << ",\"evidence_format\":" << m.evidence_format
    << ",\"ledger_record\":" << m.ledger_record
    << ",\"algorithm_version\":\"" << m.algorithm_version << "\""
    << ",\"engine_semver\":\"" << m.engine_semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"hash_library\":\"" << m.hash_library << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace enginecert
