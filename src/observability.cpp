#include "enginecert/observability.hpp"

#include <cstdio>
#include <cstdlib>

#include "enginecert/jsonlite.hpp"

namespace enginecert {

std::string event_to_json(const PipelineEvent& ev) {
  std::string line;
  line.reserve(256);
  line += "{\"event\":\"";
  line += jsonlite::escape(ev.event);
  line += "\",\"stage\":\"";
  line += jsonlite::escape(ev.stage);
  line += "\",\"ok\":";
  line += ev.ok ? "true" : "false";
  line += ",\"duration_ns\":";
  line += std::to_string(ev.duration_ns);
  if (!ev.error_code.empty()) {
    line += ",\"error_code\":\"";
    line += jsonlite::escape(ev.error_code);
    line += "\"";
  }
  if (!ev.detail.empty()) {
    line += ",\"detail\":\"";
    line += jsonlite::escape(ev.detail);
    line += "\"";
  }
  for (const auto& [k, v] : ev.fields) {
    line += ",\"";
    line += jsonlite::escape(k);
    line += "\":\"";
    line += jsonlite::escape(v);
    line += "\"";
  }
  line += "}";
  return line;
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

void EngineStats::record_failure(ErrorCode code) {
  record_failure(to_string(code));
}

void EngineStats::record_failure(const std::string& tag) {
  std::lock_guard<std::mutex> lk(failure_mu_);
  ++failures_[tag];
}

// Failures are tallied by record_failure() at the site that decides them,
// never again here.
void EngineStats::record_event(const PipelineEvent& ev) {
  total_duration_ns.fetch_add(ev.duration_ns, std::memory_order_relaxed);
}

std::map<std::string, uint64_t> EngineStats::failures_snapshot() const {
  std::lock_guard<std::mutex> lk(failure_mu_);
  return failures_;
}

std::string EngineStats::to_json() const {
  std::string out;
  out.reserve(512);
  auto field = [&out](const char* name, const std::atomic<uint64_t>& v, bool first = false) {
    if (!first) out += ',';
    out += '"';
    out += name;
    out += "\":";
    out += std::to_string(v.load(std::memory_order_relaxed));
  };
  out += "{\"fingerprint\":{";
  field("files", files_fingerprinted, true);
  field("raw_fallbacks", raw_fallbacks);
  field("manifests", manifests_built);
  out += "},\"certification\":{";
  field("receipts", receipts_issued, true);
  field("anchor_attempts", anchor_attempts);
  field("anchor_successes", anchor_successes);
  field("anchor_failures", anchor_failures);
  out += "},\"verification\":{";
  field("runs", verifications, true);
  field("mismatches", verification_mismatches);
  field("tamper_detections", tamper_detections);
  out += "},\"evidence\":{";
  field("puts", evidence_puts, true);
  field("hits", evidence_hits);
  out += "}";
  field("total_duration_ns", total_duration_ns);
  out += ",\"failures\":{";
  bool first = true;
  for (const auto& [code, n] : failures_snapshot()) {
    if (!first) out += ',';
    first = false;
    out += '"';
    out += code;
    out += "\":";
    out += std::to_string(n);
  }
  out += "}}";
  return out;
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

EngineStats& global_engine_stats() {
  static EngineStats inst;
  return inst;
}

namespace {
std::atomic<PipelineEventHook> g_event_hook{nullptr};
std::mutex g_log_mu;
}  // namespace

void set_event_hook(PipelineEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_event(const PipelineEvent& ev) {
  global_engine_stats().record_event(ev);

  PipelineEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  // Activation: set ENGINECERT_EVENT_LOG=/path/to/events.jsonl
  const char* log_path = std::getenv("ENGINECERT_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  const std::string line = event_to_json(ev) + "\n";
  std::lock_guard<std::mutex> lk(g_log_mu);
  FILE* f = std::fopen(log_path, "a");
  if (!f) {
    global_engine_stats().record_failure("event_log_write");
    return;
  }
  const bool written = std::fwrite(line.data(), 1, line.size(), f) == line.size();
  const bool closed = std::fclose(f) == 0;
  if (!written || !closed) global_engine_stats().record_failure("event_log_write");
}

}  // namespace enginecert
