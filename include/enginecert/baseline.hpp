#pragma once

// enginecert/baseline.hpp — Persisted reference manifest for local verification.
//
// File layout (canonical JSON, keys sorted): the manifest_to_value() fields
// (algorithm_version, layers, layer_members, files, missing) plus
//   "baseline_version", "created_at", "master" and "baseline_checksum".
// baseline_checksum = hash_domain("baseline:", canonical JSON without the
// checksum field). Writes are atomic (tmp + rename). A file that fails the
// checksum, the format version or the master recomputation is rejected with
// baseline_invalid; it is never partially trusted.

#include <optional>
#include <string>

#include "enginecert/types.hpp"

namespace enginecert {

struct Baseline {
  uint32_t format_version{0};
  std::string created_at;
  Manifest manifest;
  MasterFingerprint master;
};

Baseline make_baseline(const Manifest& manifest, const MasterFingerprint& master,
                       const std::string& created_at);

std::string baseline_to_json(const Baseline& baseline);

struct BaselineLoadResult {
  std::optional<Baseline> baseline;
  ErrorCode error{ErrorCode::none};
  std::string detail;
};

BaselineLoadResult parse_baseline(const std::string& text);

class BaselineStore {
 public:
  explicit BaselineStore(std::string path);

  bool exists() const;
  bool save(const Baseline& baseline, std::string* error) const;
  BaselineLoadResult load() const;
  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

}  // namespace enginecert
