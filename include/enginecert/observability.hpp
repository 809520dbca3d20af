#pragma once

// enginecert/observability.hpp — Structured pipeline observability.
//
// DESIGN:
//   PipelineEvent is the observable unit. Every stage transition, anchor
//   attempt and verification emits one PipelineEvent, which is:
//     - recorded in the global EngineStats counters (always),
//     - passed to a registered hook if one is set, otherwise
//     - appended as one JSON line to the file named by ENGINECERT_EVENT_LOG.
//   Events carry digests, paths, codes and timings only. Never file contents,
//   never validation payloads.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "enginecert/types.hpp"

namespace enginecert {

struct PipelineEvent {
  std::string event;       // e.g. "fingerprint", "manifest", "certify", "anchor_attempt"
  std::string stage;       // PipelineStage name reached (or attempted)
  bool ok{false};
  std::string error_code;  // to_string(ErrorCode) on failure
  std::string detail;
  uint64_t duration_ns{0};
  std::map<std::string, std::string> fields;  // extra flat attributes
};

std::string event_to_json(const PipelineEvent& ev);

// Thread-safe. All counters are atomic; the failure table uses a mutex.
class EngineStats {
 public:
  void record_event(const PipelineEvent& ev);
  void record_failure(ErrorCode code);
  void record_failure(const std::string& tag);
  std::string to_json() const;

  std::atomic<uint64_t> files_fingerprinted{0};
  std::atomic<uint64_t> raw_fallbacks{0};
  std::atomic<uint64_t> manifests_built{0};
  std::atomic<uint64_t> receipts_issued{0};
  std::atomic<uint64_t> anchor_attempts{0};
  std::atomic<uint64_t> anchor_successes{0};
  std::atomic<uint64_t> anchor_failures{0};
  std::atomic<uint64_t> verifications{0};
  std::atomic<uint64_t> verification_mismatches{0};
  std::atomic<uint64_t> tamper_detections{0};
  std::atomic<uint64_t> evidence_puts{0};
  std::atomic<uint64_t> evidence_hits{0};
  std::atomic<uint64_t> total_duration_ns{0};

  std::map<std::string, uint64_t> failures_snapshot() const;

 private:
  mutable std::mutex failure_mu_;
  std::map<std::string, uint64_t> failures_;
};

EngineStats& global_engine_stats();

// Emit an event (fire-and-forget). A write failure on the event log is
// counted under "event_log_write" and never propagated to the caller.
void emit_event(const PipelineEvent& ev);

using PipelineEventHook = void (*)(const PipelineEvent&);
void set_event_hook(PipelineEventHook hook);

// ScopeTimer — RAII duration capture
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace enginecert
