#include "enginecert/evidence.hpp"

#include <ctime>
#include <filesystem>
#include <fstream>

#if defined(ENGINECERT_WITH_ZSTD)
#include <zstd.h>
#endif

#include "enginecert/hash.hpp"
#include "enginecert/jsonlite.hpp"
#include "enginecert/observability.hpp"
#include "enginecert/util.hpp"

namespace fs = std::filesystem;

namespace enginecert {

namespace {

using jsonlite::Object;
using jsonlite::Value;

#if defined(ENGINECERT_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

// Evidence objects are receipts and baseline snapshots; nothing legitimate
// comes close to this.
constexpr unsigned long long kMaxDecodedSize = 256ull * 1024 * 1024;

// The sidecar's original_size is only trusted when the frame header agrees.
std::optional<std::string> decompress_zstd(const std::string& data, std::size_t original_size) {
  const unsigned long long framed = ZSTD_getFrameContentSize(data.data(), data.size());
  if (framed == ZSTD_CONTENTSIZE_ERROR || framed == ZSTD_CONTENTSIZE_UNKNOWN) return std::nullopt;
  if (framed != original_size || framed > kMaxDecodedSize) return std::nullopt;
  std::string out;
  out.resize(static_cast<std::size_t>(framed));
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n) || n != out.size()) return std::nullopt;
  return out;
}
#endif

std::string meta_to_json(const EvidenceObjectInfo& info) {
  Object o;
  o["created_at"] = Value{info.created_at_unix_ts};
  o["digest"] = Value{info.digest};
  o["encoding"] = Value{info.encoding};
  o["original_size"] = Value{static_cast<std::uint64_t>(info.original_size)};
  o["stored_blob_hash"] = Value{info.stored_blob_hash};
  o["stored_size"] = Value{static_cast<std::uint64_t>(info.stored_size)};
  return jsonlite::to_json(Value{std::move(o)});
}

std::vector<Object> read_ndjson(const std::string& path) {
  std::vector<Object> out;
  std::ifstream ifs(path, std::ios::binary);
  std::string line;
  while (std::getline(ifs, line)) {
    if (line.empty()) continue;
    std::optional<jsonlite::JsonError> err;
    Object o = jsonlite::parse(line, &err);
    if (!err) out.push_back(std::move(o));
  }
  return out;
}

EvidenceRead read_error(ErrorCode code, const std::string& detail) {
  EvidenceRead r;
  r.error = code;
  r.detail = detail;
  return r;
}

}  // namespace

EvidenceStore::EvidenceStore(std::string root) : root_(std::move(root)) {}

std::string EvidenceStore::object_path(const std::string& digest) const {
  return (fs::path(root_) / "objects" / digest.substr(0, 2) / digest.substr(2, 2) / digest).string();
}

std::string EvidenceStore::meta_path(const std::string& digest) const {
  return object_path(digest) + ".meta";
}

std::string EvidenceStore::receipts_path() const {
  return (fs::path(root_) / "receipts.ndjson").string();
}

std::string EvidenceStore::anchors_path() const {
  return (fs::path(root_) / "anchors.ndjson").string();
}

std::string EvidenceStore::put(const std::string& data, const std::string& compression) {
  const std::string digest = cas_content_hash(data);
  if (!is_hex_digest(digest)) return {};

  // Dedup: already stored. Verify before trusting it.
  if (contains(digest)) {
    auto existing = read(digest);
    if (!existing.data || *existing.data != data) return {};
    global_engine_stats().evidence_hits.fetch_add(1, std::memory_order_relaxed);
    return digest;
  }

  std::string stored = data;
  std::string encoding = "identity";
#if defined(ENGINECERT_WITH_ZSTD)
  if (compression == "zstd") {
    auto c = compress_zstd(data);
    if (!c.empty()) {
      stored = std::move(c);
      encoding = "zstd";
    }
  }
#else
  (void)compression;
#endif

  if (!atomic_write(object_path(digest), stored)) return {};

  EvidenceObjectInfo info;
  info.digest = digest;
  info.encoding = encoding;
  info.original_size = data.size();
  info.stored_size = stored.size();
  info.stored_blob_hash = blake3_hex(stored);
  info.created_at_unix_ts = static_cast<uint64_t>(std::time(nullptr));
  if (!atomic_write(meta_path(digest), meta_to_json(info))) {
    // Rollback blob on meta write failure.
    std::error_code ec;
    fs::remove(object_path(digest), ec);
    return {};
  }
  global_engine_stats().evidence_puts.fetch_add(1, std::memory_order_relaxed);
  return digest;
}

std::optional<EvidenceObjectInfo> EvidenceStore::info(const std::string& digest) const {
  if (!is_hex_digest(digest)) return std::nullopt;
  auto text = read_file(meta_path(digest));
  if (!text) return std::nullopt;
  std::optional<jsonlite::JsonError> err;
  const Object o = jsonlite::parse(*text, &err);
  if (err) return std::nullopt;
  EvidenceObjectInfo info;
  info.digest = jsonlite::get_string(o, "digest");
  info.encoding = jsonlite::get_string(o, "encoding");
  info.original_size = static_cast<std::size_t>(jsonlite::get_u64(o, "original_size"));
  info.stored_size = static_cast<std::size_t>(jsonlite::get_u64(o, "stored_size"));
  info.stored_blob_hash = jsonlite::get_string(o, "stored_blob_hash");
  info.created_at_unix_ts = jsonlite::get_u64(o, "created_at");
  if (info.digest != digest) return std::nullopt;
  return info;
}

EvidenceRead EvidenceStore::read(const std::string& digest) const {
  if (!is_hex_digest(digest)) return read_error(ErrorCode::io_error, "not a digest: " + digest);
  auto stored = read_file(object_path(digest));
  if (!stored) return read_error(ErrorCode::io_error, "no evidence object " + digest);

  auto meta = info(digest);
  if (!meta) return read_error(ErrorCode::evidence_integrity_failed, "metadata missing for " + digest);
  if (blake3_hex(*stored) != meta->stored_blob_hash || stored->size() != meta->stored_size) {
    return read_error(ErrorCode::evidence_integrity_failed, "stored blob altered: " + digest);
  }

  std::string data;
  if (meta->encoding == "identity") {
    data = std::move(*stored);
  } else if (meta->encoding == "zstd") {
#if defined(ENGINECERT_WITH_ZSTD)
    auto d = decompress_zstd(*stored, meta->original_size);
    if (!d) return read_error(ErrorCode::evidence_integrity_failed, "zstd decode failed: " + digest);
    data = std::move(*d);
#else
    return read_error(ErrorCode::io_error, "built without zstd; cannot decode " + digest);
#endif
  } else {
    return read_error(ErrorCode::evidence_integrity_failed, "unknown encoding for " + digest);
  }

  if (cas_content_hash(data) != digest) {
    return read_error(ErrorCode::evidence_integrity_failed, "content does not match digest " + digest);
  }
  EvidenceRead r;
  r.data = std::move(data);
  return r;
}

bool EvidenceStore::contains(const std::string& digest) const {
  if (!is_hex_digest(digest)) return false;
  std::error_code ec;
  return fs::exists(object_path(digest), ec) && fs::exists(meta_path(digest), ec);
}

std::string EvidenceStore::put_receipt(const CertificationReceipt& receipt,
                                       const std::string& compression) {
  if (!verify_self_consistency(receipt)) return {};
  const std::string digest = put(receipt_to_json(receipt), compression);
  if (digest.empty()) return {};

  std::lock_guard<std::mutex> lk(index_mu_);
  for (const auto& o : read_ndjson(receipts_path())) {
    if (jsonlite::get_string(o, "content_hash") == receipt.content_hash) return digest;
  }
  Object entry;
  entry["content_hash"] = Value{receipt.content_hash};
  entry["object"] = Value{digest};
  if (!append_line(receipts_path(), jsonlite::to_json(Value{std::move(entry)}))) return {};
  return digest;
}

std::optional<CertificationReceipt> EvidenceStore::find_receipt(const std::string& content_hash) const {
  std::vector<Object> entries;
  {
    std::lock_guard<std::mutex> lk(index_mu_);
    entries = read_ndjson(receipts_path());
  }
  for (const auto& o : entries) {
    if (jsonlite::get_string(o, "content_hash") != content_hash) continue;
    auto data = get(jsonlite::get_string(o, "object"));
    if (!data) return std::nullopt;
    auto parsed = parse_receipt(*data);
    if (!parsed.receipt || parsed.receipt->content_hash != content_hash) return std::nullopt;
    return parsed.receipt;
  }
  return std::nullopt;
}

bool EvidenceStore::record_anchor(const LedgerAnchor& anchor) {
  std::lock_guard<std::mutex> lk(index_mu_);
  return append_line(anchors_path(), anchor_to_json(anchor));
}

std::vector<LedgerAnchor> EvidenceStore::anchors() const {
  std::vector<Object> entries;
  {
    std::lock_guard<std::mutex> lk(index_mu_);
    entries = read_ndjson(anchors_path());
  }
  std::vector<LedgerAnchor> out;
  for (const auto& o : entries) {
    LedgerAnchor a;
    a.content_hash = jsonlite::get_string(o, "content_hash");
    a.transaction_id = jsonlite::get_string(o, "transaction_id");
    a.anchor_timestamp = jsonlite::get_string(o, "anchor_timestamp");
    const Object m = jsonlite::get_object(o, "metadata");
    a.metadata.engine_version = jsonlite::get_string(m, "engine_version");
    a.metadata.fingerprint = jsonlite::get_string(m, "fingerprint");
    a.metadata.validation_passed = jsonlite::get_bool(m, "validation_passed");
    if (is_hex_digest(a.content_hash) && !a.transaction_id.empty()) out.push_back(std::move(a));
  }
  return out;
}

std::vector<CertifiedFact> EvidenceStore::certified_facts() const {
  return dedupe_by_content_hash(anchors());
}

}  // namespace enginecert
