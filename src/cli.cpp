#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "enginecert/baseline.hpp"
#include "enginecert/config.hpp"
#include "enginecert/evidence.hpp"
#include "enginecert/fingerprint.hpp"
#include "enginecert/hash.hpp"
#include "enginecert/jsonlite.hpp"
#include "enginecert/ledger.hpp"
#include "enginecert/observability.hpp"
#include "enginecert/pipeline.hpp"
#include "enginecert/receipt.hpp"
#include "enginecert/util.hpp"
#include "enginecert/verifier.hpp"
#include "enginecert/version.hpp"

// Exit codes:
//   0  success / MATCH / AUTHENTIC
//   1  usage, configuration or I/O error
//   2  verification negative (MISMATCH, MISSING_FILE, INCOMPARABLE, TAMPERED,
//      NOT_FOUND) or a fatal stage failure
//   3  ledger unavailable (anchoring deferred, fetch impossible)

namespace {

using namespace enginecert;

struct Args {
  std::string config;
  std::string baseline;
  std::string validation;
  std::string receipt;
  std::string tx;
  std::string ledger;
  std::string evidence;
  std::string timestamp;
};

int fail_json(ErrorCode code, const std::string& detail, int exit_code = 1) {
  std::cerr << "{\"error\":\"" << to_string(code) << "\",\"detail\":\"" << jsonlite::escape(detail)
            << "\"}\n";
  return exit_code;
}

int usage() {
  std::cerr << "{\"error\":\"usage\",\"detail\":\"enginecert compute|verify|status|certify|anchor|"
               "verify-receipt|facts|fingerprint|version [--config F] [--baseline F] "
               "[--validation F] [--receipt F] [--tx ID] [--ledger F] [--evidence DIR] "
               "[--timestamp T]\"}\n";
  return 1;
}

bool parse_args(int argc, char** argv, Args* a) {
  for (int i = 2; i < argc; ++i) {
    const std::string flag = argv[i];
    if (i + 1 >= argc) return false;
    const std::string value = argv[++i];
    if (flag == "--config") a->config = value;
    else if (flag == "--baseline") a->baseline = value;
    else if (flag == "--validation") a->validation = value;
    else if (flag == "--receipt") a->receipt = value;
    else if (flag == "--tx") a->tx = value;
    else if (flag == "--ledger") a->ledger = value;
    else if (flag == "--evidence") a->evidence = value;
    else if (flag == "--timestamp") a->timestamp = value;
    else return false;
  }
  return true;
}

// Config from --config when given; otherwise defaults plus environment.
// Command-line paths win over both.
std::optional<CertConfig> resolve_config(const Args& a, bool require_file, int* exit_code) {
  CertConfig c;
  if (!a.config.empty()) {
    auto loaded = load_config(a.config);
    if (!loaded.config) {
      *exit_code = fail_json(loaded.error, loaded.detail);
      return std::nullopt;
    }
    c = std::move(*loaded.config);
  } else if (require_file) {
    *exit_code = fail_json(ErrorCode::config_invalid, "--config is required");
    return std::nullopt;
  } else {
    std::string err;
    if (!apply_env_overrides(c, &err)) {
      *exit_code = fail_json(ErrorCode::config_invalid, err);
      return std::nullopt;
    }
  }
  if (!a.baseline.empty()) c.baseline_path = a.baseline;
  if (!a.ledger.empty()) c.ledger_path = a.ledger;
  if (!a.evidence.empty()) c.evidence_dir = a.evidence;
  return c;
}

std::optional<CertificationReceipt> load_receipt(const std::string& path, int* exit_code) {
  if (path.empty()) {
    *exit_code = fail_json(ErrorCode::receipt_invalid, "--receipt is required");
    return std::nullopt;
  }
  auto text = read_file(path);
  if (!text) {
    *exit_code = fail_json(ErrorCode::io_error, "cannot read receipt " + path);
    return std::nullopt;
  }
  auto parsed = parse_receipt(*text);
  if (!parsed.receipt) {
    *exit_code = fail_json(ErrorCode::receipt_invalid, parsed.error);
    return std::nullopt;
  }
  return parsed.receipt;
}

std::string timestamp_or_now(const Args& a) {
  return a.timestamp.empty() ? utc_now_iso8601() : a.timestamp;
}

AnchorService make_anchor_service(const CertConfig& c) {
  return AnchorService(std::make_shared<FileLedger>(c.ledger_path), c.anchor);
}

int cmd_version() {
  const auto h = hash_runtime_info();
  std::cout << "{\"version\":" << version::manifest_to_json(version::current_manifest())
            << ",\"hash_backend\":\"" << h.backend << "\""
            << ",\"compression_capabilities\":[\"identity\"";
#if defined(ENGINECERT_WITH_ZSTD)
  std::cout << ",\"zstd\"";
#endif
  std::cout << "]}\n";
  return 0;
}

int cmd_fingerprint(const CertConfig& c) {
  const auto files = load_file_set(c.source_root, c.layers);
  if (!files.ok()) return fail_json(files.error, files.error_detail);
  jsonlite::Array out;
  for (const auto& fp : fingerprint_files(files.files, c.workers)) {
    jsonlite::Object o;
    o["path"] = jsonlite::Value{fp.path};
    o["hash"] = jsonlite::Value{fp.hash};
    o["raw_hash"] = jsonlite::Value{fp.raw_hash};
    o["mode"] = jsonlite::Value{to_string(fp.mode)};
    o["kind"] = jsonlite::Value{to_string(fp.kind)};
    if (!fp.fallback_reason.empty()) o["fallback_reason"] = jsonlite::Value{fp.fallback_reason};
    out.push_back(jsonlite::Value{std::move(o)});
  }
  std::cout << "{\"files\":" << jsonlite::to_json(jsonlite::Value{std::move(out)}) << "}\n";
  return 0;
}

int cmd_compute(const CertConfig& c, const Args& a) {
  const auto files = load_file_set(c.source_root, c.layers);
  EvidenceStore evidence(c.evidence_dir);
  auto r = compute(c.layers, files, BaselineStore(c.baseline_path), timestamp_or_now(a), c.workers,
                   a.evidence.empty() ? nullptr : &evidence);
  if (!r.ok) {
    std::cerr << r.to_json() << "\n";
    return r.failure.code == ErrorCode::missing_critical_file ? 2 : 1;
  }
  std::cout << r.to_json() << "\n";
  return 0;
}

int cmd_verify(const CertConfig& c) {
  const auto files = load_file_set(c.source_root, c.layers);
  auto r = verify(BaselineStore(c.baseline_path), c.layers, files, c.workers);
  if (!r.ok) return fail_json(r.error, r.detail);
  std::cout << r.to_json() << "\n";
  const auto s = r.verification.status;
  return (s == LocalStatus::match || s == LocalStatus::parse_fallback_present) ? 0 : 2;
}

int cmd_status(const CertConfig& c) {
  const auto files = load_file_set(c.source_root, c.layers);
  auto r = status(BaselineStore(c.baseline_path), c.layers, files, c.workers);
  if (!r.ok) return fail_json(r.error, r.detail);
  std::cout << r.to_json() << "\n";
  return r.match ? 0 : 2;
}

// Runs the pipeline to CERTIFIED, and on to VERIFIABLE when --ledger is given.
int cmd_certify(const CertConfig& c, const Args& a) {
  if (a.validation.empty()) return fail_json(ErrorCode::receipt_invalid, "--validation is required");
  auto vtext = read_file(a.validation);
  if (!vtext) return fail_json(ErrorCode::io_error, "cannot read validation results " + a.validation);
  auto validation = parse_validation_results(*vtext);
  if (!validation.ok) return fail_json(validation.code, validation.error);

  EvidenceStore evidence(c.evidence_dir);
  CertificationPipeline pipeline(c.layers, c.engine, c.workers);
  pipeline.set_evidence_store(&evidence);
  pipeline.set_evidence_compression(c.evidence_compression);

  std::vector<StageResult> steps;
  steps.push_back(pipeline.fingerprint(load_file_set(c.source_root, c.layers)));
  if (steps.back().ok) steps.push_back(pipeline.build_manifest());
  if (steps.back().ok) steps.push_back(pipeline.certify(validation.results, timestamp_or_now(a)));
  if (steps.back().ok && !a.ledger.empty()) {
    auto service = make_anchor_service(c);
    steps.push_back(pipeline.anchor(service));
    if (steps.back().ok) steps.push_back(pipeline.confirm(service));
  }

  std::vector<Warning> warnings = validation.warnings;
  warnings.insert(warnings.end(), pipeline.warnings().begin(), pipeline.warnings().end());

  const StageResult& last = steps.back();
  std::cout << "{\"stage\":\"" << to_string(pipeline.stage()) << "\"";
  if (pipeline.receipt()) std::cout << ",\"receipt\":" << receipt_to_json(*pipeline.receipt());
  if (pipeline.ledger_anchor()) std::cout << ",\"anchor\":" << anchor_to_json(*pipeline.ledger_anchor());
  if (!last.ok) std::cout << ",\"failure\":" << last.failure.to_json();
  std::cout << ",\"warnings\":" << warnings_to_json(warnings) << "}\n";

  if (pipeline.receipt() && !a.receipt.empty() &&
      !atomic_write(a.receipt, receipt_to_json(*pipeline.receipt()) + "\n")) {
    return fail_json(ErrorCode::io_error, "cannot write receipt " + a.receipt);
  }
  if (last.ok) return 0;
  if (!pipeline.halted()) return 3;  // receipt valid, anchoring deferred
  return 2;
}

int cmd_anchor(const CertConfig& c, const Args& a) {
  int rc = 0;
  auto receipt = load_receipt(a.receipt, &rc);
  if (!receipt) return rc;
  auto result = make_anchor_service(c).anchor(*receipt);
  if (!result.ok) {
    std::cerr << "{\"error\":\"" << to_string(result.error) << "\",\"detail\":\""
              << jsonlite::escape(result.detail) << "\",\"attempts\":" << result.attempts
              << ",\"warnings\":"
              << warnings_to_json({Warning{"anchor_deferred", result.detail}}) << "}\n";
    return result.error == ErrorCode::ledger_unavailable ? 3 : 1;
  }
  EvidenceStore evidence(c.evidence_dir);
  if (!evidence.record_anchor(result.anchor)) {
    return fail_json(ErrorCode::io_error,
                     "anchored as " + result.anchor.transaction_id + " but the evidence index write failed");
  }
  std::cout << "{\"anchor\":" << anchor_to_json(result.anchor) << ",\"attempts\":" << result.attempts
            << "}\n";
  return 0;
}

int cmd_verify_receipt(const CertConfig& c, const Args& a) {
  int rc = 0;
  auto receipt = load_receipt(a.receipt, &rc);
  if (!receipt) return rc;
  if (a.tx.empty()) return fail_json(ErrorCode::ledger_mismatch, "--tx is required");
  auto v = verify_against_ledger(make_anchor_service(c), a.tx, *receipt);
  std::cout << v.to_json() << "\n";
  switch (v.status) {
    case LedgerStatus::authentic: return 0;
    case LedgerStatus::unavailable: return 3;
    case LedgerStatus::tampered:
    case LedgerStatus::not_found: return 2;
  }
  return 2;
}

int cmd_facts(const CertConfig& c) {
  EvidenceStore evidence(c.evidence_dir);
  std::cout << "{\"facts\":" << facts_to_json(evidence.certified_facts()) << "}\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) return usage();
  const std::string cmd = argv[1];
  Args args;
  if (!parse_args(argc, argv, &args)) return usage();

  if (cmd == "version") return cmd_version();

  const bool needs_config_file = cmd == "compute" || cmd == "verify" || cmd == "status" ||
                                 cmd == "certify" || cmd == "fingerprint";
  const bool known = needs_config_file || cmd == "anchor" || cmd == "verify-receipt" || cmd == "facts";
  if (!known) return usage();

  int rc = 0;
  auto config = resolve_config(args, needs_config_file, &rc);
  if (!config) return rc;

  if (cmd == "fingerprint") rc = cmd_fingerprint(*config);
  else if (cmd == "compute") rc = cmd_compute(*config, args);
  else if (cmd == "verify") rc = cmd_verify(*config);
  else if (cmd == "status") rc = cmd_status(*config);
  else if (cmd == "certify") rc = cmd_certify(*config, args);
  else if (cmd == "anchor") rc = cmd_anchor(*config, args);
  else if (cmd == "verify-receipt") rc = cmd_verify_receipt(*config, args);
  else rc = cmd_facts(*config);

  if (std::getenv("ENGINECERT_STATS")) std::cerr << enginecert::global_engine_stats().to_json() << "\n";
  return rc;
}
