#pragma once

// enginecert/manifest.hpp — Layered manifest and master fingerprint.
//
// Layer hash payload, for each present member sorted by path:
//   <len(path)>:<path>=<hash>:<mode>\n
// prefixed by <len(layer)>:<layer>\n and hashed under the "layer:" domain.
// Master payload: the algorithm version tag, then <len(name)>:<name>=<hash>\n
// for every layer sorted by name, hashed under the "master:" domain.
// Both orders are fixed by sorting, never by discovery or completion order.

#include <optional>
#include <string>
#include <vector>

#include "enginecert/jsonlite.hpp"
#include "enginecert/types.hpp"

namespace enginecert {

struct ManifestBuildResult {
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  std::string error_detail;
  std::vector<MissingFile> missing_critical;  // set when error == missing_critical_file
  Manifest manifest;
  std::vector<Warning> warnings;
};

// Group fingerprints by the configured layers. A missing critical member is
// fatal: no manifest is produced. A missing non-critical member is recorded
// in manifest.missing and reported as a warning.
ManifestBuildResult build_manifest(const LayerConfig& config,
                                   const std::vector<FileFingerprint>& fingerprints,
                                   const std::vector<MissingFile>& absent);

// Same result as build_manifest() without the manifest event or the
// manifests_built counter; used when recomputing for comparison only.
ManifestBuildResult assemble_manifest(const LayerConfig& config,
                                      const std::vector<FileFingerprint>& fingerprints,
                                      const std::vector<MissingFile>& absent);

std::string compute_layer_hash(const std::string& layer,
                               std::vector<const FileFingerprint*> members);

MasterFingerprint compute_master_fingerprint(const Manifest& manifest);

// Recompute from layer hashes alone, under the current algorithm.
std::string master_hash_of(const std::string& algorithm_version,
                           const std::map<std::string, std::string>& layer_hashes);

// JSON form shared by the compute output and the baseline file.
jsonlite::Value manifest_to_value(const Manifest& manifest);
std::optional<Manifest> manifest_from_value(const jsonlite::Object& obj, std::string* error);
std::string manifest_to_json(const Manifest& manifest);

}  // namespace enginecert
