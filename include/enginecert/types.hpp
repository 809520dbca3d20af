#pragma once

// enginecert/types.hpp — Core data structures for the certification pipeline.
//
// DETERMINISM GUARANTEES:
//   - Every aggregate keyed by path or layer name uses std::map, so iteration
//     order is byte order of the key and never discovery or completion order.
//   - FileFingerprint, Manifest and MasterFingerprint are value types. A new
//     run produces new values; nothing in the pipeline mutates a finished one.
//
// MEMORY OWNERSHIP:
//   - All string members are value-owned. No borrowed references.
//   - No raw pointer members in any public API type.

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace enginecert {

enum class ErrorCode {
  none,
  parse_error,
  missing_critical_file,
  hash_mismatch,
  ledger_unavailable,
  ledger_mismatch,
  config_invalid,
  baseline_invalid,
  receipt_invalid,
  algorithm_version_mismatch,
  io_error,
  evidence_integrity_failed,
  stage_order_violation,
};

std::string to_string(ErrorCode code);

// Non-fatal condition attached to a result so consumers can decide whether
// a weaker guarantee is acceptable.
struct Warning {
  std::string code;    // raw_fallback | anchor_deferred | missing_optional_file | cosmetic_drift | validation_skipped
  std::string detail;
};

std::string warnings_to_json(const std::vector<Warning>& warnings);

// ---------------------------------------------------------------------------
// Source files
// ---------------------------------------------------------------------------
enum class FileKind {
  python,
  c_family,
  json,
  unstructured,
};

std::string to_string(FileKind kind);
std::optional<FileKind> file_kind_from_string(const std::string& s);

// Infer from the path extension. Unknown extensions are unstructured.
FileKind detect_file_kind(const std::string& path);

// Immutable once read for a given fingerprinting run.
struct SourceFile {
  std::string path;     // canonical, '/'-separated, relative to the source root
  std::string content;
  FileKind kind{FileKind::unstructured};
  std::set<std::string> layers;
  bool critical{false};  // critical in at least one layer
};

// Current file contents keyed by canonical path.
using FileSet = std::map<std::string, SourceFile>;

enum class FingerprintMode {
  semantic,
  raw_fallback,
};

std::string to_string(FingerprintMode mode);
std::optional<FingerprintMode> fingerprint_mode_from_string(const std::string& s);

struct FileFingerprint {
  std::string path;
  std::string hash;          // semantic hash, or raw hash when mode == raw_fallback
  FingerprintMode mode{FingerprintMode::semantic};
  FileKind kind{FileKind::unstructured};
  std::string raw_hash;      // always the raw-bytes hash; secondary cross-check
  std::string fallback_reason;  // parse error detail when mode == raw_fallback
};

// ---------------------------------------------------------------------------
// Layer configuration
// ---------------------------------------------------------------------------
struct LayerMember {
  std::string path;
  bool critical{false};
  std::optional<FileKind> kind;  // overrides extension detection
};

struct LayerSpec {
  std::string name;
  std::vector<LayerMember> members;
};

struct LayerConfig {
  std::map<std::string, LayerSpec> layers;  // keyed by layer name

  // Every configured path, with the kind it should be normalised as.
  std::map<std::string, FileKind> files() const;
};

// ---------------------------------------------------------------------------
// Manifest — immutable once computed
// ---------------------------------------------------------------------------
struct MissingFile {
  std::string layer;
  std::string path;
  bool critical{false};
};

struct Manifest {
  std::string algorithm_version;
  std::map<std::string, std::string> layer_hashes;       // layer name -> layer hash
  std::map<std::string, std::vector<std::string>> layer_members;  // layer -> sorted present paths
  std::map<std::string, FileFingerprint> fingerprints;   // path -> fingerprint
  std::vector<MissingFile> missing;                      // non-critical only

  bool has_raw_fallback() const;
};

struct MasterFingerprint {
  std::string algorithm_version;
  std::map<std::string, std::string> layer_hashes;
  std::string hash;

  // Comparable only under an identical algorithm version tag.
  bool comparable_with(const MasterFingerprint& other) const {
    return algorithm_version == other.algorithm_version;
  }
};

// ---------------------------------------------------------------------------
// Pipeline stages
// ---------------------------------------------------------------------------
enum class PipelineStage {
  init,
  fingerprinted,
  manifested,
  certified,
  anchored,
  verifiable,
};

std::string to_string(PipelineStage stage);

struct StageFailure {
  PipelineStage stage{PipelineStage::init};  // stage that could not be reached
  ErrorCode code{ErrorCode::none};
  std::string detail;

  std::string to_json() const;
};

}  // namespace enginecert
