#pragma once

// enginecert/ledger.hpp — Ledger anchoring boundary.
//
// The ledger is an opaque append-only publication service:
//   anchor(content_hash, metadata) -> transaction_id
//   fetch(transaction_id)          -> {content_hash, metadata, block_timestamp}
// Resubmitting the same receipt may yield a second transaction id for the
// same content_hash. Consumers deduplicate by content_hash, never by
// transaction id (dedupe_by_content_hash).
//
// FileLedger INVARIANTS (adapted from an append-only audit log):
//   1. APPEND-ONLY: records are never modified or deleted.
//   2. SEQUENTIAL: each record carries seq = previous seq + 1.
//   3. CHAINED: each record carries "prev" = transaction id of the previous
//      record (64 zeros for the first).
//   4. transaction id = ledger_record_hash(canonical record line), so an
//      edited line no longer resolves under its original id.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "enginecert/receipt.hpp"
#include "enginecert/types.hpp"

namespace enginecert {

struct LedgerMetadata {
  std::string engine_version;
  bool validation_passed{false};
  std::string fingerprint;  // master fingerprint hash

  bool operator==(const LedgerMetadata& o) const {
    return engine_version == o.engine_version && validation_passed == o.validation_passed &&
           fingerprint == o.fingerprint;
  }
};

LedgerMetadata metadata_for(const CertificationReceipt& receipt);

struct LedgerWriteResult {
  bool ok{false};
  std::string transaction_id;
  std::string block_timestamp;
  ErrorCode error{ErrorCode::none};
  std::string detail;
};

enum class FetchStatus {
  found,
  not_found,
  unavailable,
};

std::string to_string(FetchStatus s);

struct LedgerRecord {
  std::string transaction_id;
  std::string content_hash;
  LedgerMetadata metadata;
  std::string block_timestamp;
};

struct LedgerFetchResult {
  FetchStatus status{FetchStatus::unavailable};
  LedgerRecord record;
  std::string detail;
};

// Implementations must be safe for concurrent calls. A call may block; the
// core only ever invokes it through AnchorService, which bounds it.
class ILedgerClient {
 public:
  virtual ~ILedgerClient() = default;
  virtual LedgerWriteResult anchor(const std::string& content_hash, const LedgerMetadata& metadata) = 0;
  virtual LedgerFetchResult fetch(const std::string& transaction_id) const = 0;
  virtual std::string ledger_id() const = 0;
};

// ---------------------------------------------------------------------------
// FileLedger — local hash-chained NDJSON ledger
// ---------------------------------------------------------------------------
class FileLedger : public ILedgerClient {
 public:
  // Resumes seq and chain head from an existing file.
  explicit FileLedger(std::string path);
  ~FileLedger() override;

  FileLedger(const FileLedger&) = delete;
  FileLedger& operator=(const FileLedger&) = delete;

  LedgerWriteResult anchor(const std::string& content_hash, const LedgerMetadata& metadata) override;
  LedgerFetchResult fetch(const std::string& transaction_id) const override;
  std::string ledger_id() const override { return "file:" + path_; }

  // Re-walk the file: every line parses, seq is contiguous from 1, and every
  // prev equals the id of the line before it.
  bool verify_chain(std::string* error) const;

  uint64_t size() const;
  const std::string& path() const { return path_; }

 private:
  struct Impl;
  std::string path_;
  std::unique_ptr<Impl> impl_;
};

// ---------------------------------------------------------------------------
// AnchorService — bounded, retried access to any ledger client
// ---------------------------------------------------------------------------
struct AnchorPolicy {
  std::chrono::milliseconds attempt_timeout{5000};
  uint32_t max_attempts{3};
  std::chrono::milliseconds initial_backoff{200};
  std::chrono::milliseconds max_backoff{2000};
  // Timed-out calls keep their worker thread until the client returns. Once
  // this many are outstanding, further attempts fail without a new thread.
  uint32_t max_in_flight{4};
};

struct LedgerAnchor {
  std::string content_hash;
  LedgerMetadata metadata;
  std::string transaction_id;
  std::string anchor_timestamp;
};

struct AnchorResult {
  bool ok{false};
  LedgerAnchor anchor;
  uint32_t attempts{0};
  ErrorCode error{ErrorCode::none};
  std::string detail;
};

class AnchorService {
 public:
  AnchorService(std::shared_ptr<ILedgerClient> client, AnchorPolicy policy);

  // Each attempt runs under policy.attempt_timeout. A timed-out call is
  // abandoned, not cancelled: the client may still complete it, which at
  // worst anchors the same content_hash twice. No lock is held meanwhile.
  AnchorResult anchor(const CertificationReceipt& receipt) const;

  // Retries only while the ledger is unavailable; NOT_FOUND is final.
  LedgerFetchResult fetch(const std::string& transaction_id) const;

  const AnchorPolicy& policy() const { return policy_; }
  std::string ledger_id() const { return client_->ledger_id(); }

 private:
  std::chrono::milliseconds backoff_for(uint32_t attempt) const;

  std::shared_ptr<ILedgerClient> client_;
  AnchorPolicy policy_;
  std::shared_ptr<std::atomic<uint32_t>> in_flight_;  // shared with detached calls
};

// One certified fact per distinct content_hash, however many transactions
// anchored it.
struct CertifiedFact {
  std::string content_hash;
  LedgerMetadata metadata;
  std::vector<std::string> transaction_ids;  // in anchoring order
  std::string first_anchored_at;
};

std::vector<CertifiedFact> dedupe_by_content_hash(const std::vector<LedgerAnchor>& anchors);

std::string anchor_to_json(const LedgerAnchor& anchor);
std::string facts_to_json(const std::vector<CertifiedFact>& facts);

}  // namespace enginecert
