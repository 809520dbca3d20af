#pragma once

// enginecert/version.hpp — Explicit version manifest for every persisted format.
//
// PURPOSE:
//   Fingerprints, receipts, baselines and ledger records are only comparable
//   when produced under the same algorithm. Every component that reads or
//   writes one of these formats checks its constant here first.
//
// INVARIANT:
//   The algorithm version tag is embedded in the master fingerprint hash
//   input. Bumping FINGERPRINT_ALGORITHM_VERSION or NORMALIZER_VERSION makes
//   every previously stored baseline INCOMPARABLE, never silently equal.

#include <cstdint>
#include <string>

namespace enginecert {
namespace version {

// ---------------------------------------------------------------------------
// FINGERPRINT_ALGORITHM_VERSION
// Layer and master aggregation scheme (sort order, framing, domain prefixes).
// ---------------------------------------------------------------------------
constexpr uint32_t FINGERPRINT_ALGORITHM_VERSION = 1;

// ---------------------------------------------------------------------------
// NORMALIZER_VERSION
// Canonical form produced by the semantic normalizers. Any change in what is
// stripped or how the tree is serialised requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t NORMALIZER_VERSION = 1;

// Receipt field set and canonical serialisation.
constexpr uint32_t RECEIPT_SCHEMA_VERSION = 1;

// On-disk baseline manifest layout.
constexpr uint32_t BASELINE_FORMAT_VERSION = 1;

// Evidence store layout: objects/AB/CD/<digest> + .meta sidecars.
constexpr uint32_t EVIDENCE_FORMAT_VERSION = 1;

// Local file ledger record layout (hash-chained NDJSON).
constexpr uint32_t LEDGER_RECORD_VERSION = 1;

// e.g. "enginecert-fp/1;normalizer/1;blake3"
std::string algorithm_version_tag();

struct VersionManifest {
  uint32_t fingerprint_algorithm{FINGERPRINT_ALGORITHM_VERSION};
  uint32_t normalizer{NORMALIZER_VERSION};
  uint32_t receipt_schema{RECEIPT_SCHEMA_VERSION};
  uint32_t baseline_format{BASELINE_FORMAT_VERSION};
  uint32_t evidence_format{EVIDENCE_FORMAT_VERSION};
  uint32_t ledger_record{LEDGER_RECORD_VERSION};
  std::string algorithm_version;  // algorithm_version_tag()
  std::string engine_semver;      // enginecert release
  std::string hash_primitive;     // "blake3"
  std::string hash_library;       // blake3_version()
};

VersionManifest current_manifest();

// Serialize to compact JSON.
std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace enginecert
