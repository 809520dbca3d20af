#include "enginecert/pipeline.hpp"

#include <sstream>

#include "enginecert/jsonlite.hpp"
#include "enginecert/manifest.hpp"
#include "enginecert/observability.hpp"

namespace enginecert {

namespace {

void emit_stage(PipelineStage stage, bool ok, ErrorCode code, const std::string& detail,
                uint64_t duration_ns) {
  PipelineEvent ev;
  ev.event = "stage";
  ev.stage = to_string(stage);
  ev.ok = ok;
  if (!ok) ev.error_code = to_string(code);
  ev.detail = detail;
  ev.duration_ns = duration_ns;
  emit_event(ev);
}

uint32_t count_fallbacks(const Manifest& m) {
  uint32_t n = 0;
  for (const auto& [path, fp] : m.fingerprints) {
    (void)path;
    if (fp.mode == FingerprintMode::raw_fallback) ++n;
  }
  return n;
}

std::string missing_detail(const std::vector<MissingFile>& missing) {
  std::string out;
  for (const auto& m : missing) {
    if (!out.empty()) out += ", ";
    out += m.layer + "/" + m.path;
  }
  return out;
}

}  // namespace

std::string StageResult::to_json() const {
  std::ostringstream o;
  o << "{\"ok\":" << (ok ? "true" : "false") << ",\"stage\":\"" << to_string(stage) << "\"";
  if (!ok) o << ",\"failure\":" << failure.to_json();
  o << ",\"warnings\":" << warnings_to_json(warnings) << "}";
  return o.str();
}

CertificationPipeline::CertificationPipeline(LayerConfig layers, EngineIdentity engine,
                                             unsigned workers)
    : layers_(std::move(layers)), engine_(std::move(engine)), workers_(workers) {}

std::optional<StageResult> CertificationPipeline::check_order(PipelineStage from,
                                                              PipelineStage to) const {
  std::string detail;
  if (halted_) {
    detail = "pipeline halted at " + to_string(halted_->stage) + " (" + to_string(halted_->code) + ")";
  } else if (stage_ != from) {
    detail = "cannot reach " + to_string(to) + " from " + to_string(stage_);
  } else {
    return std::nullopt;
  }
  StageResult r;
  r.stage = stage_;
  r.failure = StageFailure{to, ErrorCode::stage_order_violation, detail};
  global_engine_stats().record_failure(ErrorCode::stage_order_violation);
  emit_stage(to, false, ErrorCode::stage_order_violation, detail, 0);
  return r;
}

StageResult CertificationPipeline::advance(PipelineStage to, std::vector<Warning> added,
                                           uint64_t duration_ns) {
  stage_ = to;
  warnings_.insert(warnings_.end(), added.begin(), added.end());
  emit_stage(to, true, ErrorCode::none, "", duration_ns);
  StageResult r;
  r.ok = true;
  r.stage = stage_;
  r.warnings = std::move(added);
  return r;
}

StageResult CertificationPipeline::fail(PipelineStage to, ErrorCode code, const std::string& detail,
                                        uint64_t duration_ns, bool fatal) {
  StageFailure f{to, code, detail};
  if (fatal) halted_ = f;
  global_engine_stats().record_failure(code);
  emit_stage(to, false, code, detail, duration_ns);
  StageResult r;
  r.stage = stage_;
  r.failure = std::move(f);
  return r;
}

StageResult CertificationPipeline::fingerprint(const LoadedFiles& files) {
  if (auto bad = check_order(PipelineStage::init, PipelineStage::fingerprinted)) return *bad;
  uint64_t ns = 0;
  {
    ScopeTimer t(ns);
    if (files.ok()) {
      absent_ = files.absent;
      fingerprints_ = fingerprint_files(files.files, workers_);
    }
  }
  if (!files.ok()) return fail(PipelineStage::fingerprinted, files.error, files.error_detail, ns);

  std::vector<Warning> added;
  for (const auto& fp : fingerprints_) {
    if (fp.mode == FingerprintMode::raw_fallback) {
      added.push_back(Warning{"raw_fallback", fp.path + ": " + fp.fallback_reason});
    }
  }
  return advance(PipelineStage::fingerprinted, std::move(added), ns);
}

StageResult CertificationPipeline::build_manifest() {
  if (auto bad = check_order(PipelineStage::fingerprinted, PipelineStage::manifested)) return *bad;
  uint64_t ns = 0;
  ManifestBuildResult built;
  {
    ScopeTimer t(ns);
    built = enginecert::build_manifest(layers_, fingerprints_, absent_);
    if (built.ok) {
      manifest_ = built.manifest;
      master_ = compute_master_fingerprint(manifest_);
    }
  }
  if (!built.ok) return fail(PipelineStage::manifested, built.error, built.error_detail, ns);

  // raw_fallback warnings were already raised at FINGERPRINTED.
  std::vector<Warning> added;
  for (const auto& w : built.warnings) {
    if (w.code != "raw_fallback") added.push_back(w);
  }
  return advance(PipelineStage::manifested, std::move(added), ns);
}

StageResult CertificationPipeline::certify(const ValidationResults& validation,
                                           const std::string& timestamp) {
  if (auto bad = check_order(PipelineStage::manifested, PipelineStage::certified)) return *bad;
  uint64_t ns = 0;
  ReceiptBuildResult built;
  std::string stored;
  {
    ScopeTimer t(ns);
    built = ReceiptBuilder()
                .set_engine(engine_)
                .set_validation(validation)
                .set_master_fingerprint(master_, count_fallbacks(manifest_))
                .set_timestamp(timestamp)
                .build();
    if (built.receipt && evidence_) stored = evidence_->put_receipt(*built.receipt, compression_);
  }
  if (!built.receipt) return fail(PipelineStage::certified, built.error, built.detail, ns);
  if (evidence_ && stored.empty()) {
    return fail(PipelineStage::certified, ErrorCode::io_error,
                "cannot store receipt in evidence store " + evidence_->root(), ns);
  }
  receipt_ = std::move(built.receipt);
  global_engine_stats().receipts_issued.fetch_add(1, std::memory_order_relaxed);
  return advance(PipelineStage::certified, {}, ns);
}

StageResult CertificationPipeline::anchor(const AnchorService& service) {
  if (auto bad = check_order(PipelineStage::certified, PipelineStage::anchored)) return *bad;
  uint64_t ns = 0;
  AnchorResult res;
  {
    ScopeTimer t(ns);
    res = service.anchor(*receipt_);
  }
  if (!res.ok) {
    StageResult r = fail(PipelineStage::anchored, res.error, res.detail, ns, /*fatal=*/false);
    Warning w{"anchor_deferred", res.detail};
    warnings_.push_back(w);
    r.warnings.push_back(std::move(w));
    return r;
  }
  if (evidence_ && !evidence_->record_anchor(res.anchor)) {
    // The ledger already holds the record; only the local index failed.
    global_engine_stats().record_failure("anchor_index_write");
  }
  anchor_ = res.anchor;
  return advance(PipelineStage::anchored, {}, ns);
}

StageResult CertificationPipeline::confirm(const AnchorService& service) {
  if (auto bad = check_order(PipelineStage::anchored, PipelineStage::verifiable)) return *bad;
  uint64_t ns = 0;
  LedgerVerification v;
  {
    ScopeTimer t(ns);
    v = verify_against_ledger(service, anchor_->transaction_id, *receipt_);
  }
  switch (v.status) {
    case LedgerStatus::authentic:
      return advance(PipelineStage::verifiable, {}, ns);
    case LedgerStatus::unavailable:
      // Read-back can be retried; the pipeline stays ANCHORED.
      return fail(PipelineStage::verifiable, ErrorCode::ledger_unavailable, v.detail, ns, false);
    case LedgerStatus::not_found:
      return fail(PipelineStage::verifiable, ErrorCode::ledger_mismatch,
                  "transaction " + anchor_->transaction_id + " not found", ns);
    case LedgerStatus::tampered:
      break;
  }
  std::string detail;
  for (const auto& d : v.discrepancies) {
    if (!detail.empty()) detail += ",";
    detail += d;
  }
  return fail(PipelineStage::verifiable, ErrorCode::ledger_mismatch, "tampered: " + detail, ns);
}

// ---------------------------------------------------------------------------
// Free operations
// ---------------------------------------------------------------------------

std::string ComputeResult::to_json() const {
  std::ostringstream o;
  o << "{\"ok\":" << (ok ? "true" : "false");
  if (!ok) {
    o << ",\"failure\":" << failure.to_json();
  } else {
    o << ",\"baseline\":\"" << jsonlite::escape(baseline_path) << "\""
      << ",\"master\":\"" << master.hash << "\""
      << ",\"manifest\":" << manifest_to_json(manifest);
    if (!snapshot_digest.empty()) o << ",\"snapshot\":\"" << snapshot_digest << "\"";
  }
  o << ",\"warnings\":" << warnings_to_json(warnings) << "}";
  return o.str();
}

ComputeResult compute(const LayerConfig& layers, const LoadedFiles& files,
                      const BaselineStore& store, const std::string& created_at,
                      unsigned workers, EvidenceStore* evidence) {
  ComputeResult out;
  if (!files.ok()) {
    out.failure = StageFailure{PipelineStage::fingerprinted, files.error, files.error_detail};
    global_engine_stats().record_failure(files.error);
    return out;
  }
  const auto fingerprints = fingerprint_files(files.files, workers);
  auto built = build_manifest(layers, fingerprints, files.absent);
  out.warnings = built.warnings;
  if (!built.ok) {
    out.failure = StageFailure{PipelineStage::manifested, built.error,
                               built.missing_critical.empty() ? built.error_detail
                                                              : missing_detail(built.missing_critical)};
    global_engine_stats().record_failure(built.error);
    return out;
  }
  out.manifest = std::move(built.manifest);
  out.master = compute_master_fingerprint(out.manifest);

  const Baseline baseline = make_baseline(out.manifest, out.master, created_at);
  std::string err;
  if (!store.save(baseline, &err)) {
    out.failure = StageFailure{PipelineStage::manifested, ErrorCode::io_error, err};
    global_engine_stats().record_failure(ErrorCode::io_error);
    return out;
  }
  out.baseline_path = store.path();
  if (evidence) out.snapshot_digest = evidence->put(baseline_to_json(baseline));
  out.ok = true;
  return out;
}

std::string VerifyResult::to_json() const {
  if (ok) return verification.to_json();
  std::ostringstream o;
  o << "{\"error\":\"" << to_string(error) << "\",\"detail\":\"" << jsonlite::escape(detail) << "\"}";
  return o.str();
}

VerifyResult verify(const BaselineStore& store, const LayerConfig& layers,
                    const LoadedFiles& files, unsigned workers) {
  VerifyResult out;
  auto loaded = store.load();
  if (!loaded.baseline) {
    out.error = loaded.error;
    out.detail = loaded.detail;
    global_engine_stats().record_failure(loaded.error);
    return out;
  }
  if (!files.ok()) {
    out.error = files.error;
    out.detail = files.error_detail;
    global_engine_stats().record_failure(files.error);
    return out;
  }
  out.verification = verify_local(*loaded.baseline, layers, files, workers);
  out.ok = true;
  return out;
}

std::string StatusResult::to_json() const {
  std::ostringstream o;
  if (!ok) {
    o << "{\"error\":\"" << to_string(error) << "\",\"detail\":\"" << jsonlite::escape(detail) << "\"}";
    return o.str();
  }
  o << "{\"baseline_master_fingerprint\":\"" << baseline_master << "\""
    << ",\"current_master_fingerprint\":\"" << current_master << "\""
    << ",\"match\":" << (match ? "true" : "false");
  if (!detail.empty()) o << ",\"detail\":\"" << jsonlite::escape(detail) << "\"";
  o << "}";
  return o.str();
}

StatusResult status(const BaselineStore& store, const LayerConfig& layers,
                    const LoadedFiles& files, unsigned workers) {
  StatusResult out;
  auto loaded = store.load();
  if (!loaded.baseline) {
    out.error = loaded.error;
    out.detail = loaded.detail;
    return out;
  }
  if (!files.ok()) {
    out.error = files.error;
    out.detail = files.error_detail;
    return out;
  }
  out.ok = true;
  out.baseline_master = loaded.baseline->master.hash;
  auto built = assemble_manifest(layers, fingerprint_files(files.files, workers), files.absent);
  if (!built.ok) {
    out.detail = to_string(built.error) + ": " + missing_detail(built.missing_critical);
    return out;
  }
  const MasterFingerprint current = compute_master_fingerprint(built.manifest);
  out.current_master = current.hash;
  if (!loaded.baseline->master.comparable_with(current)) {
    out.detail = to_string(ErrorCode::algorithm_version_mismatch) + ": baseline " +
                 loaded.baseline->master.algorithm_version + ", running " + current.algorithm_version;
    return out;
  }
  out.match = out.current_master == out.baseline_master;
  return out;
}

}  // namespace enginecert
