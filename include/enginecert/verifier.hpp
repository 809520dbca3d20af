#pragma once

// enginecert/verifier.hpp — Read-and-compare verification.
//
// Neither mode writes anything: not the baseline, not the ledger, not the
// evidence store.
//
// Local status precedence (first that applies):
//   INCOMPARABLE            baseline algorithm version differs from ours
//   MISSING_FILE            a baseline file, or a critical file, is absent
//   MISMATCH                at least one layer (or the aggregate) diverges
//   PARSE_FALLBACK_PRESENT  everything matches but some file was raw-hashed
//   MATCH
// Diverging layers are listed whenever they can be computed, including under
// MISSING_FILE.

#include <string>
#include <vector>

#include "enginecert/baseline.hpp"
#include "enginecert/fingerprint.hpp"
#include "enginecert/ledger.hpp"
#include "enginecert/receipt.hpp"
#include "enginecert/types.hpp"

namespace enginecert {

enum class LocalStatus {
  match,
  mismatch,
  missing_file,
  parse_fallback_present,
  incomparable,
};

std::string to_string(LocalStatus s);

struct LayerDivergence {
  std::string layer;
  std::string baseline_hash;  // empty if the layer is new
  std::string current_hash;   // empty if the layer is gone
  std::vector<std::string> changed_files;
};

struct LocalVerification {
  LocalStatus status{LocalStatus::match};
  // algorithm_version_mismatch (INCOMPARABLE), missing_critical_file or
  // hash_mismatch (MISSING_FILE, MISMATCH); none otherwise.
  ErrorCode error{ErrorCode::none};
  std::string baseline_algorithm_version;
  std::string current_algorithm_version;
  std::string baseline_master;
  std::string current_master;  // empty when no manifest could be built
  bool aggregate_match{false};
  std::vector<LayerDivergence> diverging_layers;
  std::vector<std::string> missing_files;
  std::vector<std::string> fallback_files;
  std::vector<std::string> cosmetic_drift_files;
  std::vector<Warning> warnings;

  std::string to_json() const;
};

LocalVerification verify_local(const Baseline& baseline, const LayerConfig& config,
                               const LoadedFiles& current, unsigned workers = 0);

enum class LedgerStatus {
  authentic,
  tampered,
  not_found,
  unavailable,
};

std::string to_string(LedgerStatus s);

struct LedgerVerification {
  LedgerStatus status{LedgerStatus::unavailable};
  std::string transaction_id;
  std::string recomputed_hash;  // from the local receipt's fields
  std::string stored_hash;      // the local receipt's content_hash field
  std::string on_chain_hash;
  std::vector<std::string> discrepancies;
  std::string detail;

  std::string to_json() const;
};

LedgerVerification verify_against_ledger(const AnchorService& service,
                                         const std::string& transaction_id,
                                         const CertificationReceipt& local);

}  // namespace enginecert
