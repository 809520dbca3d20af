#pragma once

// enginecert/pipeline.hpp — Certification pipeline and the compute / verify /
// status operations.
//
// STATE MACHINE:
//   INIT -> FINGERPRINTED -> MANIFESTED -> CERTIFIED -> ANCHORED -> VERIFIABLE
//
//   fingerprint()     INIT          -> FINGERPRINTED
//   build_manifest()  FINGERPRINTED -> MANIFESTED   (also computes the master)
//   certify()         MANIFESTED    -> CERTIFIED
//   anchor()          CERTIFIED     -> ANCHORED     (retryable while CERTIFIED)
//   confirm()         ANCHORED      -> VERIFIABLE   (ledger read-back is AUTHENTIC)
//
// A call made from any other stage fails with stage_order_violation and
// changes nothing. A fatal stage failure halts the pipeline: every later call
// fails with stage_order_violation naming the stage that failed. A failed
// anchor() is not fatal; the receipt stays valid, an anchor_deferred warning
// is attached and anchor() may be called again.
//
// The manifest and receipt are complete before anchor() touches the ledger,
// and the pipeline holds no lock while the ledger call is in flight.

#include <optional>
#include <string>
#include <vector>

#include "enginecert/baseline.hpp"
#include "enginecert/evidence.hpp"
#include "enginecert/fingerprint.hpp"
#include "enginecert/ledger.hpp"
#include "enginecert/receipt.hpp"
#include "enginecert/types.hpp"
#include "enginecert/verifier.hpp"

namespace enginecert {

struct StageResult {
  bool ok{false};
  PipelineStage stage{PipelineStage::init};  // stage the pipeline is in afterwards
  StageFailure failure;                      // set when !ok
  std::vector<Warning> warnings;             // warnings added by this call

  std::string to_json() const;
};

class CertificationPipeline {
 public:
  CertificationPipeline(LayerConfig layers, EngineIdentity engine, unsigned workers = 0);

  // Optional. When set, certify() stores the exported receipt and anchor()
  // records the anchor. Not owned; must outlive the pipeline.
  void set_evidence_store(EvidenceStore* store) { evidence_ = store; }
  void set_evidence_compression(const std::string& c) { compression_ = c; }

  StageResult fingerprint(const LoadedFiles& files);
  StageResult build_manifest();
  StageResult certify(const ValidationResults& validation, const std::string& timestamp);
  StageResult anchor(const AnchorService& service);
  StageResult confirm(const AnchorService& service);

  PipelineStage stage() const { return stage_; }
  bool halted() const { return halted_.has_value(); }
  const std::vector<FileFingerprint>& fingerprints() const { return fingerprints_; }
  const Manifest& manifest() const { return manifest_; }
  const MasterFingerprint& master() const { return master_; }
  const std::optional<CertificationReceipt>& receipt() const { return receipt_; }
  const std::optional<LedgerAnchor>& ledger_anchor() const { return anchor_; }
  const std::vector<Warning>& warnings() const { return warnings_; }

 private:
  std::optional<StageResult> check_order(PipelineStage from, PipelineStage to) const;
  StageResult advance(PipelineStage to, std::vector<Warning> added, uint64_t duration_ns);
  StageResult fail(PipelineStage to, ErrorCode code, const std::string& detail,
                   uint64_t duration_ns, bool fatal = true);

  LayerConfig layers_;
  EngineIdentity engine_;
  unsigned workers_;
  EvidenceStore* evidence_{nullptr};
  std::string compression_{"off"};

  PipelineStage stage_{PipelineStage::init};
  std::optional<StageFailure> halted_;

  std::vector<MissingFile> absent_;
  std::vector<FileFingerprint> fingerprints_;
  Manifest manifest_;
  MasterFingerprint master_;
  std::optional<CertificationReceipt> receipt_;
  std::optional<LedgerAnchor> anchor_;
  std::vector<Warning> warnings_;
};

// ---------------------------------------------------------------------------
// Free operations
// ---------------------------------------------------------------------------

struct ComputeResult {
  bool ok{false};
  StageFailure failure;
  Manifest manifest;
  MasterFingerprint master;
  std::vector<Warning> warnings;
  std::string baseline_path;
  std::string snapshot_digest;  // evidence object, when a store was given

  std::string to_json() const;
};

// Fingerprint, build the manifest and write it as the new baseline. A missing
// critical file fails before anything is written.
ComputeResult compute(const LayerConfig& layers, const LoadedFiles& files,
                      const BaselineStore& store, const std::string& created_at,
                      unsigned workers = 0, EvidenceStore* evidence = nullptr);

struct VerifyResult {
  bool ok{false};  // false only when the baseline could not be loaded
  ErrorCode error{ErrorCode::none};
  std::string detail;
  LocalVerification verification;

  std::string to_json() const;
};

VerifyResult verify(const BaselineStore& store, const LayerConfig& layers,
                    const LoadedFiles& files, unsigned workers = 0);

struct StatusResult {
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  std::string detail;
  std::string current_master;  // empty if the current files cannot form a manifest
  std::string baseline_master;
  bool match{false};

  std::string to_json() const;
};

StatusResult status(const BaselineStore& store, const LayerConfig& layers,
                    const LoadedFiles& files, unsigned workers = 0);

}  // namespace enginecert
