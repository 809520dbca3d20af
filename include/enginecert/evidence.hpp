#pragma once

// enginecert/evidence.hpp — Local read-only evidence store.
//
// Content-addressed layout:
//   <root>/objects/AB/CD/<digest>        blob (identity or zstd)
//   <root>/objects/AB/CD/<digest>.meta   {"digest","encoding","original_size",
//                                         "stored_size","stored_blob_hash","created_at"}
//   <root>/receipts.ndjson               {"content_hash","object"} per stored receipt
//   <root>/anchors.ndjson                one LedgerAnchor per line
//
// INVARIANTS:
//   1. digest = cas_content_hash(original bytes), never a location.
//   2. Blobs and sidecars are written tmp + rename.
//   3. Every read re-hashes the stored blob and the decoded bytes; any
//      mismatch is evidence_integrity_failed, never corrupted data.
//   4. A second put() of the same bytes returns the same digest.
//   5. Objects are never rewritten; the indexes are append-only.

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "enginecert/ledger.hpp"
#include "enginecert/receipt.hpp"
#include "enginecert/types.hpp"

namespace enginecert {

struct EvidenceObjectInfo {
  std::string digest;
  std::string encoding{"identity"};
  std::size_t original_size{0};
  std::size_t stored_size{0};
  std::string stored_blob_hash;
  uint64_t created_at_unix_ts{0};
};

struct EvidenceRead {
  std::optional<std::string> data;
  ErrorCode error{ErrorCode::none};  // io_error if absent, evidence_integrity_failed if altered
  std::string detail;
};

class EvidenceStore {
 public:
  explicit EvidenceStore(std::string root = ".enginecert/evidence/v1");

  // compression: "off" or "zstd" (identity unless built with ENGINECERT_WITH_ZSTD).
  // Returns the digest, or "" on failure.
  std::string put(const std::string& data, const std::string& compression = "off");
  EvidenceRead read(const std::string& digest) const;
  std::optional<std::string> get(const std::string& digest) const { return read(digest).data; }
  bool contains(const std::string& digest) const;
  std::optional<EvidenceObjectInfo> info(const std::string& digest) const;

  // Stores the exported receipt JSON and indexes it by content_hash.
  std::string put_receipt(const CertificationReceipt& receipt, const std::string& compression = "off");
  std::optional<CertificationReceipt> find_receipt(const std::string& content_hash) const;

  bool record_anchor(const LedgerAnchor& anchor);
  std::vector<LedgerAnchor> anchors() const;

  // anchors() deduplicated by content_hash.
  std::vector<CertifiedFact> certified_facts() const;

  const std::string& root() const { return root_; }

 private:
  std::string object_path(const std::string& digest) const;
  std::string meta_path(const std::string& digest) const;
  std::string receipts_path() const;
  std::string anchors_path() const;

  std::string root_;
  mutable std::mutex index_mu_;
};

}  // namespace enginecert
