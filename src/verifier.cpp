#include "enginecert/verifier.hpp"

#include <algorithm>
#include <set>

#include "enginecert/jsonlite.hpp"
#include "enginecert/manifest.hpp"
#include "enginecert/observability.hpp"
#include "enginecert/version.hpp"

namespace enginecert {

namespace {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

Value string_array(const std::vector<std::string>& v) {
  Array a;
  for (const auto& s : v) a.push_back(Value{s});
  return Value{std::move(a)};
}

const FileFingerprint* find_fp(const Manifest& m, const std::string& path) {
  auto it = m.fingerprints.find(path);
  return it == m.fingerprints.end() ? nullptr : &it->second;
}

std::vector<std::string> members_of(const Manifest& m, const std::string& layer) {
  auto it = m.layer_members.find(layer);
  return it == m.layer_members.end() ? std::vector<std::string>{} : it->second;
}

void emit_verification(const std::string& kind, const std::string& status, bool ok,
                       const std::string& detail, ErrorCode code = ErrorCode::none) {
  PipelineEvent ev;
  ev.event = kind;
  ev.stage = to_string(PipelineStage::verifiable);
  ev.ok = ok;
  ev.detail = detail;
  if (code != ErrorCode::none) ev.error_code = to_string(code);
  ev.fields["status"] = status;
  emit_event(ev);
}

}  // namespace

std::string to_string(LocalStatus s) {
  switch (s) {
    case LocalStatus::match: return "MATCH";
    case LocalStatus::mismatch: return "MISMATCH";
    case LocalStatus::missing_file: return "MISSING_FILE";
    case LocalStatus::parse_fallback_present: return "PARSE_FALLBACK_PRESENT";
    case LocalStatus::incomparable: return "INCOMPARABLE";
  }
  return "MISMATCH";
}

std::string to_string(LedgerStatus s) {
  switch (s) {
    case LedgerStatus::authentic: return "AUTHENTIC";
    case LedgerStatus::tampered: return "TAMPERED";
    case LedgerStatus::not_found: return "NOT_FOUND";
    case LedgerStatus::unavailable: return "UNAVAILABLE";
  }
  return "UNAVAILABLE";
}

std::string LocalVerification::to_json() const {
  Object o;
  o["status"] = Value{to_string(status)};
  if (error != ErrorCode::none) o["error_code"] = Value{to_string(error)};
  o["baseline_master"] = Value{baseline_master};
  o["current_master"] = Value{current_master};
  o["baseline_algorithm_version"] = Value{baseline_algorithm_version};
  o["current_algorithm_version"] = Value{current_algorithm_version};
  o["aggregate_match"] = Value{aggregate_match};
  Array layers;
  for (const auto& d : diverging_layers) {
    Object l;
    l["layer"] = Value{d.layer};
    l["baseline_hash"] = Value{d.baseline_hash};
    l["current_hash"] = Value{d.current_hash};
    l["changed_files"] = string_array(d.changed_files);
    layers.push_back(Value{std::move(l)});
  }
  o["diverging_layers"] = Value{std::move(layers)};
  o["missing_files"] = string_array(missing_files);
  o["fallback_files"] = string_array(fallback_files);
  o["cosmetic_drift_files"] = string_array(cosmetic_drift_files);
  std::optional<jsonlite::JsonError> err;
  o["warnings"] = jsonlite::parse_value(warnings_to_json(warnings), &err);
  return jsonlite::to_json(Value{std::move(o)});
}

std::string LedgerVerification::to_json() const {
  Object o;
  o["status"] = Value{to_string(status)};
  o["transaction_id"] = Value{transaction_id};
  o["recomputed_hash"] = Value{recomputed_hash};
  o["stored_hash"] = Value{stored_hash};
  o["on_chain_hash"] = Value{on_chain_hash};
  o["discrepancies"] = string_array(discrepancies);
  if (!detail.empty()) o["detail"] = Value{detail};
  return jsonlite::to_json(Value{std::move(o)});
}

LocalVerification verify_local(const Baseline& baseline, const LayerConfig& config,
                               const LoadedFiles& current, unsigned workers) {
  LocalVerification out;
  global_engine_stats().verifications.fetch_add(1, std::memory_order_relaxed);
  out.baseline_master = baseline.master.hash;
  out.baseline_algorithm_version = baseline.master.algorithm_version;
  out.current_algorithm_version = version::algorithm_version_tag();

  if (baseline.master.algorithm_version != out.current_algorithm_version) {
    out.status = LocalStatus::incomparable;
    out.error = ErrorCode::algorithm_version_mismatch;
    global_engine_stats().record_failure(out.error);
    emit_verification("verify_local", to_string(out.status), false,
                      baseline.master.algorithm_version + " vs " + out.current_algorithm_version, out.error);
    return out;
  }

  // Files the baseline covered that are gone now.
  std::set<std::string> missing;
  for (const auto& [path, fp] : baseline.manifest.fingerprints) {
    (void)fp;
    if (!current.files.count(path)) missing.insert(path);
  }
  bool critical_missing = false;
  for (const auto& m : current.absent) {
    if (m.critical) {
      missing.insert(m.path);
      critical_missing = true;
    }
  }
  out.missing_files.assign(missing.begin(), missing.end());

  const auto fingerprints = fingerprint_files(current.files, workers);
  for (const auto& fp : fingerprints) {
    if (fp.mode == FingerprintMode::raw_fallback) {
      out.fallback_files.push_back(fp.path);
      out.warnings.push_back(Warning{"raw_fallback", fp.path + ": " + fp.fallback_reason});
    }
  }

  // Secondary raw-bytes cross-check.
  for (const auto& fp : fingerprints) {
    const FileFingerprint* base = find_fp(baseline.manifest, fp.path);
    if (base && base->hash == fp.hash && base->raw_hash != fp.raw_hash &&
        fp.mode == FingerprintMode::semantic) {
      out.cosmetic_drift_files.push_back(fp.path);
      out.warnings.push_back(Warning{"cosmetic_drift", fp.path});
    }
  }

  Manifest current_manifest;
  if (!critical_missing) {
    // Non-critical absences must not abort the comparison.
    auto built = assemble_manifest(config, fingerprints, current.absent);
    if (built.ok) {
      current_manifest = std::move(built.manifest);
      out.current_master = compute_master_fingerprint(current_manifest).hash;
    }
  } else {
    // Partial manifest over what is present, so diverging layers can still be named.
    std::vector<MissingFile> relaxed = current.absent;
    for (auto& m : relaxed) m.critical = false;
    auto built = assemble_manifest(config, fingerprints, relaxed);
    if (built.ok) current_manifest = std::move(built.manifest);
  }

  std::set<std::string> layer_names;
  for (const auto& [n, h] : baseline.manifest.layer_hashes) layer_names.insert(n);
  for (const auto& [n, h] : current_manifest.layer_hashes) layer_names.insert(n);
  for (const auto& name : layer_names) {
    auto b = baseline.manifest.layer_hashes.find(name);
    auto c = current_manifest.layer_hashes.find(name);
    const std::string bh = b == baseline.manifest.layer_hashes.end() ? "" : b->second;
    const std::string ch = c == current_manifest.layer_hashes.end() ? "" : c->second;
    if (!bh.empty() && bh == ch) continue;

    LayerDivergence d;
    d.layer = name;
    d.baseline_hash = bh;
    d.current_hash = ch;
    std::set<std::string> paths;
    for (const auto& p : members_of(baseline.manifest, name)) paths.insert(p);
    for (const auto& p : members_of(current_manifest, name)) paths.insert(p);
    for (const auto& p : paths) {
      const FileFingerprint* x = find_fp(baseline.manifest, p);
      const FileFingerprint* y = find_fp(current_manifest, p);
      if (!x || !y || x->hash != y->hash || x->mode != y->mode) d.changed_files.push_back(p);
    }
    out.diverging_layers.push_back(std::move(d));
  }
  out.aggregate_match = !out.current_master.empty() && out.current_master == out.baseline_master;

  if (!out.missing_files.empty()) {
    out.status = LocalStatus::missing_file;
    out.error = critical_missing ? ErrorCode::missing_critical_file : ErrorCode::hash_mismatch;
  } else if (!out.diverging_layers.empty() || !out.aggregate_match) {
    out.status = LocalStatus::mismatch;
    out.error = ErrorCode::hash_mismatch;
  } else if (!out.fallback_files.empty()) {
    out.status = LocalStatus::parse_fallback_present;
  } else {
    out.status = LocalStatus::match;
  }

  const bool ok = out.status == LocalStatus::match || out.status == LocalStatus::parse_fallback_present;
  if (!ok) {
    global_engine_stats().verification_mismatches.fetch_add(1, std::memory_order_relaxed);
    global_engine_stats().record_failure(out.error);
  }
  std::string detail;
  for (const auto& d : out.diverging_layers) {
    if (!detail.empty()) detail += ",";
    detail += d.layer;
  }
  emit_verification("verify_local", to_string(out.status), ok, detail, out.error);
  return out;
}

LedgerVerification verify_against_ledger(const AnchorService& service,
                                         const std::string& transaction_id,
                                         const CertificationReceipt& local) {
  LedgerVerification out;
  global_engine_stats().verifications.fetch_add(1, std::memory_order_relaxed);
  out.transaction_id = transaction_id;
  out.stored_hash = local.content_hash;
  out.recomputed_hash = compute_content_hash(local);

  const LedgerFetchResult fetched = service.fetch(transaction_id);
  if (fetched.status == FetchStatus::not_found) {
    out.status = LedgerStatus::not_found;
    out.detail = fetched.detail;
  } else if (fetched.status == FetchStatus::unavailable) {
    out.status = LedgerStatus::unavailable;
    out.detail = fetched.detail;
  } else {
    out.on_chain_hash = fetched.record.content_hash;
    if (out.on_chain_hash != out.recomputed_hash) out.discrepancies.push_back("content_hash");
    if (out.stored_hash != out.recomputed_hash) out.discrepancies.push_back("receipt_self_consistency");
    if (!(fetched.record.metadata == metadata_for(local))) out.discrepancies.push_back("metadata");
    out.status = out.discrepancies.empty() ? LedgerStatus::authentic : LedgerStatus::tampered;
  }

  if (out.status == LedgerStatus::tampered) {
    global_engine_stats().tamper_detections.fetch_add(1, std::memory_order_relaxed);
    global_engine_stats().record_failure(ErrorCode::ledger_mismatch);
  }
  emit_verification("verify_ledger", to_string(out.status), out.status == LedgerStatus::authentic,
                    out.detail);
  return out;
}

}  // namespace enginecert
