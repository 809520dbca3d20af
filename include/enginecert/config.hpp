#pragma once

// enginecert/config.hpp — Certification config file + environment overrides.
//
// {
//   "engine":  {"name": "...", "version": "..."},
//   "source_root": ".",
//   "layers": {"source": [{"path": "a.py", "critical": true, "kind": "python"}, ...]},
//   "anchor": {"timeout_ms": 5000, "max_attempts": 3,
//              "initial_backoff_ms": 200, "max_backoff_ms": 2000,
//              "max_in_flight": 4},
//   "workers": 0,
//   "baseline": ".enginecert/baseline.json",
//   "evidence_dir": ".enginecert/evidence/v1",
//   "evidence_compression": "off",
//   "ledger": ".enginecert/ledger.ndjson"
// }
// Relative store paths and source_root resolve against the config file's
// directory. Present fields of the wrong JSON type are config_invalid.
// max_in_flight bounds the ledger calls left running after a timeout.
// Environment variables override the file:
//   ENGINECERT_BASELINE, ENGINECERT_EVIDENCE_DIR, ENGINECERT_LEDGER,
//   ENGINECERT_WORKERS, ENGINECERT_ANCHOR_TIMEOUT_MS,
//   ENGINECERT_ANCHOR_MAX_ATTEMPTS
// (ENGINECERT_EVENT_LOG is read by the event sink directly.)

#include <optional>
#include <string>

#include "enginecert/ledger.hpp"
#include "enginecert/receipt.hpp"
#include "enginecert/types.hpp"

namespace enginecert {

struct CertConfig {
  EngineIdentity engine;
  std::string source_root{"."};
  LayerConfig layers;
  AnchorPolicy anchor;
  unsigned workers{0};
  std::string baseline_path{".enginecert/baseline.json"};
  std::string evidence_dir{".enginecert/evidence/v1"};
  std::string evidence_compression{"off"};
  std::string ledger_path{".enginecert/ledger.ndjson"};
};

struct ConfigLoadResult {
  std::optional<CertConfig> config;
  ErrorCode error{ErrorCode::none};
  std::string detail;
};

// base_dir: directory relative paths resolve against ("" = as written).
ConfigLoadResult parse_config(const std::string& json, const std::string& base_dir);

// Read, parse and apply environment overrides.
ConfigLoadResult load_config(const std::string& path);

// Returns false (with *error set) on a malformed numeric override.
bool apply_env_overrides(CertConfig& config, std::string* error);

// Layer set validation shared by the parser and programmatic callers.
bool validate_layer_config(const LayerConfig& layers, std::string* error);

}  // namespace enginecert
