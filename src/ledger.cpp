#include "enginecert/ledger.hpp"

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <future>
#include <map>
#include <mutex>
#include <system_error>
#include <thread>

#include "enginecert/hash.hpp"
#include "enginecert/jsonlite.hpp"
#include "enginecert/observability.hpp"
#include "enginecert/util.hpp"
#include "enginecert/version.hpp"

namespace enginecert {

namespace {

using jsonlite::Object;
using jsonlite::Value;

const std::string kGenesis(64, '0');

Value metadata_value(const LedgerMetadata& m) {
  Object o;
  o["engine_version"] = Value{m.engine_version};
  o["fingerprint"] = Value{m.fingerprint};
  o["validation_passed"] = Value{m.validation_passed};
  return Value{std::move(o)};
}

LedgerMetadata metadata_from(const Object& o) {
  LedgerMetadata m;
  m.engine_version = jsonlite::get_string(o, "engine_version");
  m.fingerprint = jsonlite::get_string(o, "fingerprint");
  m.validation_passed = jsonlite::get_bool(o, "validation_passed");
  return m;
}

struct ParsedLine {
  uint64_t seq{0};
  std::string prev;
  LedgerRecord record;
};

bool parse_line(const std::string& line, ParsedLine* out) {
  std::optional<jsonlite::JsonError> err;
  const Object o = jsonlite::parse(line, &err);
  if (err) return false;
  if (jsonlite::get_u64(o, "ledger_version", 0) != version::LEDGER_RECORD_VERSION) return false;
  out->seq = jsonlite::get_u64(o, "seq", 0);
  out->prev = jsonlite::get_string(o, "prev");
  out->record.transaction_id = ledger_record_hash(line);
  out->record.content_hash = jsonlite::get_string(o, "content_hash");
  out->record.block_timestamp = jsonlite::get_string(o, "block_timestamp");
  out->record.metadata = metadata_from(jsonlite::get_object(o, "metadata"));
  return out->seq > 0 && is_hex_digest(out->prev) && is_hex_digest(out->record.content_hash);
}

std::vector<std::string> read_lines(const std::string& path, bool* readable) {
  std::vector<std::string> lines;
  std::ifstream ifs(path, std::ios::binary);
  *readable = static_cast<bool>(ifs);
  std::string line;
  while (std::getline(ifs, line)) {
    if (!line.empty()) lines.push_back(line);
  }
  return lines;
}

// Run fn on a detached worker and wait at most timeout. The task owns what
// it captures, so an abandoned call stays memory-safe. At most limit calls
// per service may be outstanding; past that no thread is started and the
// attempt fails like an unreachable ledger.
template <typename R, typename Fn>
bool call_with_deadline(Fn fn, std::chrono::milliseconds timeout, uint32_t limit,
                        const std::shared_ptr<std::atomic<uint32_t>>& in_flight, R* out,
                        std::string* error) {
  if (in_flight->fetch_add(1) >= limit) {
    in_flight->fetch_sub(1);
    *error = std::to_string(limit) + " abandoned ledger calls still in flight";
    return false;
  }
  auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
  std::future<R> fut = task->get_future();
  try {
    std::thread([task, in_flight]() {
      (*task)();
      in_flight->fetch_sub(1);
    }).detach();
  } catch (const std::system_error& e) {
    in_flight->fetch_sub(1);
    *error = std::string("cannot start ledger call: ") + e.what();
    return false;
  }
  if (fut.wait_for(timeout) != std::future_status::ready) {
    *error = "timed out after " + std::to_string(timeout.count()) + "ms";
    return false;
  }
  try {
    *out = fut.get();
  } catch (const std::exception& e) {
    *error = std::string("ledger client threw: ") + e.what();
    return false;
  }
  return true;
}

}  // namespace

std::string to_string(FetchStatus s) {
  switch (s) {
    case FetchStatus::found: return "found";
    case FetchStatus::not_found: return "not_found";
    case FetchStatus::unavailable: return "unavailable";
  }
  return "unavailable";
}

LedgerMetadata metadata_for(const CertificationReceipt& receipt) {
  LedgerMetadata m;
  m.engine_version = receipt.engine.version;
  m.validation_passed = receipt.validation_passed();
  m.fingerprint = receipt.master_fingerprint;
  return m;
}

// ---------------------------------------------------------------------------
// FileLedger
// ---------------------------------------------------------------------------

struct FileLedger::Impl {
  std::mutex mu;
  uint64_t seq{0};
  std::string last_txid{kGenesis};
};

FileLedger::FileLedger(std::string path) : path_(std::move(path)), impl_(std::make_unique<Impl>()) {
  bool readable = false;
  for (const auto& line : read_lines(path_, &readable)) {
    ParsedLine p;
    if (!parse_line(line, &p)) continue;  // verify_chain() reports it
    impl_->seq = p.seq;
    impl_->last_txid = p.record.transaction_id;
  }
}

FileLedger::~FileLedger() = default;

LedgerWriteResult FileLedger::anchor(const std::string& content_hash, const LedgerMetadata& metadata) {
  LedgerWriteResult r;
  if (!is_hex_digest(content_hash)) {
    r.error = ErrorCode::receipt_invalid;
    r.detail = "content_hash is not a digest";
    return r;
  }

  std::lock_guard<std::mutex> lk(impl_->mu);
  Object o;
  o["block_timestamp"] = Value{utc_now_iso8601()};
  o["content_hash"] = Value{content_hash};
  o["ledger_version"] = Value{static_cast<std::uint64_t>(version::LEDGER_RECORD_VERSION)};
  o["metadata"] = metadata_value(metadata);
  o["prev"] = Value{impl_->last_txid};
  o["seq"] = Value{impl_->seq + 1};
  const std::string block_timestamp = jsonlite::get_string(o, "block_timestamp");
  const std::string line = jsonlite::to_json(Value{std::move(o)});
  const std::string final_line = line + "\n";

  const auto parent = std::filesystem::path(path_).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
  }
  FILE* f = std::fopen(path_.c_str(), "a");
  if (!f) {
    r.error = ErrorCode::ledger_unavailable;
    r.detail = "cannot open ledger " + path_;
    return r;
  }
  // Append-only check: the file must grow by exactly this line.
  std::fseek(f, 0, SEEK_END);
  const long pre = std::ftell(f);
  const bool written = std::fwrite(final_line.data(), 1, final_line.size(), f) == final_line.size();
  const bool flushed = std::fflush(f) == 0;
  const long post = std::ftell(f);
  const bool closed = std::fclose(f) == 0;
  if (!written || !flushed || !closed || pre < 0 ||
      post < pre + static_cast<long>(final_line.size())) {
    r.error = ErrorCode::ledger_unavailable;
    r.detail = "append to ledger " + path_ + " failed";
    return r;
  }

  ++impl_->seq;
  impl_->last_txid = ledger_record_hash(line);
  r.ok = true;
  r.transaction_id = impl_->last_txid;
  r.block_timestamp = block_timestamp;
  return r;
}

LedgerFetchResult FileLedger::fetch(const std::string& transaction_id) const {
  LedgerFetchResult r;
  bool readable = false;
  std::vector<std::string> lines;
  {
    std::lock_guard<std::mutex> lk(impl_->mu);
    lines = read_lines(path_, &readable);
  }
  if (!readable) {
    r.status = FetchStatus::unavailable;
    r.detail = "cannot read ledger " + path_;
    return r;
  }
  for (const auto& line : lines) {
    if (ledger_record_hash(line) != transaction_id) continue;
    ParsedLine p;
    if (!parse_line(line, &p)) {
      r.status = FetchStatus::unavailable;
      r.detail = "ledger record " + transaction_id + " is malformed";
      return r;
    }
    r.status = FetchStatus::found;
    r.record = std::move(p.record);
    return r;
  }
  r.status = FetchStatus::not_found;
  r.detail = "no record with transaction id " + transaction_id;
  return r;
}

bool FileLedger::verify_chain(std::string* error) const {
  bool readable = false;
  std::vector<std::string> lines;
  {
    std::lock_guard<std::mutex> lk(impl_->mu);
    lines = read_lines(path_, &readable);
  }
  std::string prev = kGenesis;
  uint64_t expected_seq = 1;
  for (const auto& line : lines) {
    ParsedLine p;
    if (!parse_line(line, &p)) {
      if (error) *error = "malformed record at seq " + std::to_string(expected_seq);
      return false;
    }
    if (p.seq != expected_seq) {
      if (error) {
        *error = "sequence gap: expected " + std::to_string(expected_seq) + ", found " +
                 std::to_string(p.seq);
      }
      return false;
    }
    if (p.prev != prev) {
      if (error) *error = "chain break at seq " + std::to_string(p.seq);
      return false;
    }
    prev = p.record.transaction_id;
    ++expected_seq;
  }
  return true;
}

uint64_t FileLedger::size() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->seq;
}

// ---------------------------------------------------------------------------
// AnchorService
// ---------------------------------------------------------------------------

AnchorService::AnchorService(std::shared_ptr<ILedgerClient> client, AnchorPolicy policy)
    : client_(std::move(client)), policy_(policy), in_flight_(std::make_shared<std::atomic<uint32_t>>(0)) {
  if (policy_.max_attempts == 0) policy_.max_attempts = 1;
  if (policy_.max_in_flight == 0) policy_.max_in_flight = 1;
}

std::chrono::milliseconds AnchorService::backoff_for(uint32_t attempt) const {
  // attempt is 1-based; the first retry waits initial_backoff.
  auto wait = policy_.initial_backoff;
  for (uint32_t i = 1; i < attempt && wait < policy_.max_backoff; ++i) wait *= 2;
  return std::min(wait, policy_.max_backoff);
}

AnchorResult AnchorService::anchor(const CertificationReceipt& receipt) const {
  AnchorResult out;
  if (!verify_self_consistency(receipt)) {
    out.error = ErrorCode::receipt_invalid;
    out.detail = "receipt content_hash does not match its fields";
    return out;
  }
  const std::string content_hash = receipt.content_hash;
  const LedgerMetadata metadata = metadata_for(receipt);

  for (uint32_t attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
    out.attempts = attempt;
    global_engine_stats().anchor_attempts.fetch_add(1, std::memory_order_relaxed);

    PipelineEvent ev;
    ev.event = "anchor_attempt";
    ev.stage = to_string(PipelineStage::anchored);
    ev.fields["attempt"] = std::to_string(attempt);
    ev.fields["content_hash"] = content_hash;
    ev.fields["ledger"] = client_->ledger_id();

    LedgerWriteResult wr;
    std::string error;
    bool returned = false;
    {
      ScopeTimer timer(ev.duration_ns);
      auto client = client_;
      returned = call_with_deadline<LedgerWriteResult>(
          [client, content_hash, metadata]() { return client->anchor(content_hash, metadata); },
          policy_.attempt_timeout, policy_.max_in_flight, in_flight_, &wr, &error);
    }

    if (returned && wr.ok) {
      ev.ok = true;
      ev.fields["transaction_id"] = wr.transaction_id;
      emit_event(ev);
      global_engine_stats().anchor_successes.fetch_add(1, std::memory_order_relaxed);
      out.ok = true;
      out.error = ErrorCode::none;
      out.detail.clear();
      out.anchor.content_hash = content_hash;
      out.anchor.metadata = metadata;
      out.anchor.transaction_id = wr.transaction_id;
      out.anchor.anchor_timestamp = wr.block_timestamp.empty() ? utc_now_iso8601() : wr.block_timestamp;
      return out;
    }

    out.error = ErrorCode::ledger_unavailable;
    out.detail = returned ? wr.detail : error;
    ev.error_code = to_string(out.error);
    ev.detail = out.detail;
    emit_event(ev);

    // A rejected receipt will be rejected again; only unavailability is retried.
    if (returned && wr.error != ErrorCode::ledger_unavailable && wr.error != ErrorCode::none) {
      out.error = wr.error;
      break;
    }
    if (attempt < policy_.max_attempts) std::this_thread::sleep_for(backoff_for(attempt));
  }
  global_engine_stats().anchor_failures.fetch_add(1, std::memory_order_relaxed);
  return out;
}

LedgerFetchResult AnchorService::fetch(const std::string& transaction_id) const {
  LedgerFetchResult last;
  last.status = FetchStatus::unavailable;
  for (uint32_t attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
    LedgerFetchResult r;
    std::string error;
    auto client = client_;
    const bool returned = call_with_deadline<LedgerFetchResult>(
        [client, transaction_id]() { return client->fetch(transaction_id); }, policy_.attempt_timeout,
        policy_.max_in_flight, in_flight_, &r, &error);
    if (returned && r.status != FetchStatus::unavailable) return r;
    last = returned ? r : LedgerFetchResult{FetchStatus::unavailable, {}, error};
    if (attempt < policy_.max_attempts) std::this_thread::sleep_for(backoff_for(attempt));
  }
  return last;
}

// ---------------------------------------------------------------------------
// Deduplication
// ---------------------------------------------------------------------------

std::vector<CertifiedFact> dedupe_by_content_hash(const std::vector<LedgerAnchor>& anchors) {
  std::map<std::string, CertifiedFact> by_hash;
  for (const auto& a : anchors) {
    auto [it, inserted] = by_hash.try_emplace(a.content_hash);
    CertifiedFact& fact = it->second;
    if (inserted) {
      fact.content_hash = a.content_hash;
      fact.metadata = a.metadata;
      fact.first_anchored_at = a.anchor_timestamp;
    } else if (!a.anchor_timestamp.empty() &&
               (fact.first_anchored_at.empty() || a.anchor_timestamp < fact.first_anchored_at)) {
      fact.first_anchored_at = a.anchor_timestamp;
    }
    fact.transaction_ids.push_back(a.transaction_id);
  }
  std::vector<CertifiedFact> out;
  out.reserve(by_hash.size());
  for (auto& [hash, fact] : by_hash) out.push_back(std::move(fact));
  return out;
}

std::string anchor_to_json(const LedgerAnchor& anchor) {
  Object o;
  o["anchor_timestamp"] = Value{anchor.anchor_timestamp};
  o["content_hash"] = Value{anchor.content_hash};
  o["metadata"] = metadata_value(anchor.metadata);
  o["transaction_id"] = Value{anchor.transaction_id};
  return jsonlite::to_json(Value{std::move(o)});
}

std::string facts_to_json(const std::vector<CertifiedFact>& facts) {
  jsonlite::Array arr;
  for (const auto& f : facts) {
    Object o;
    o["content_hash"] = Value{f.content_hash};
    o["metadata"] = metadata_value(f.metadata);
    o["first_anchored_at"] = Value{f.first_anchored_at};
    jsonlite::Array txs;
    for (const auto& t : f.transaction_ids) txs.push_back(Value{t});
    o["transaction_ids"] = Value{std::move(txs)};
    arr.push_back(Value{std::move(o)});
  }
  return jsonlite::to_json(Value{std::move(arr)});
}

}  // namespace enginecert
