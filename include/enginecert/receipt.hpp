#pragma once

// enginecert/receipt.hpp — Public certification receipt.
//
// The receipt is an explicit whitelist. Its canonical serialisation is the
// sorted-key compact JSON of
//   { "engine": {"name","version"},
//     "integrity": {"algorithm_version","master_fingerprint","raw_fallback_files"},
//     "schema_version": N,
//     "timestamp": "YYYY-MM-DDTHH:MM:SSZ",
//     "validation": {problem_class: bool, ...} }
// and content_hash = receipt_content_hash(canonical). content_hash is never
// part of its own input. The exported form is the same object plus
// "content_hash". The parser rejects any field outside the whitelist at every
// level, so parameters, energies, timings or source text cannot be carried.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "enginecert/types.hpp"

namespace enginecert {

struct EngineIdentity {
  std::string name;
  std::string version;
};

// problem class -> passed
using ValidationResults = std::map<std::string, bool>;

struct CertificationReceipt {
  uint32_t schema_version{0};
  EngineIdentity engine;
  ValidationResults validation;
  std::string master_fingerprint;
  std::string algorithm_version;
  uint32_t raw_fallback_files{0};
  std::string timestamp;
  std::string content_hash;

  // Non-empty and every class passed.
  bool validation_passed() const;
};

std::string canonical_serialize(const CertificationReceipt& receipt);
std::string compute_content_hash(const CertificationReceipt& receipt);
bool verify_self_consistency(const CertificationReceipt& receipt);

std::string receipt_to_json(const CertificationReceipt& receipt);

struct ReceiptParseResult {
  std::optional<CertificationReceipt> receipt;
  std::string error;  // receipt_invalid detail
};

ReceiptParseResult parse_receipt(const std::string& json);

// Problem-class keys: non-empty, at most 128 bytes, [A-Za-z0-9_.-] only.
bool is_valid_problem_class(const std::string& key);

struct ReceiptBuildResult {
  std::optional<CertificationReceipt> receipt;
  ErrorCode error{ErrorCode::none};
  std::string detail;
};

class ReceiptBuilder {
 public:
  ReceiptBuilder& set_engine(const EngineIdentity& engine);
  ReceiptBuilder& set_validation(const ValidationResults& results);
  ReceiptBuilder& set_master_fingerprint(const MasterFingerprint& master, uint32_t raw_fallback_files);
  ReceiptBuilder& set_timestamp(const std::string& utc_iso8601);

  // Validates every field, then computes content_hash.
  ReceiptBuildResult build() const;

 private:
  CertificationReceipt r_;
};

// Test-harness output in either accepted shape:
//   {"problem_class": true, ...}
//   [{"claim_id": "...", "verified": true|false|null}, ...]
struct ValidationLoadResult {
  bool ok{false};
  ValidationResults results;
  std::vector<Warning> warnings;  // validation_skipped for null verdicts
  ErrorCode code{ErrorCode::none};  // parse_error for malformed JSON, else receipt_invalid
  std::string error;
};

ValidationLoadResult parse_validation_results(const std::string& json);

}  // namespace enginecert
