#pragma once

// cra/observability.hpp: Counters, latency histogram, resolution events and
// structured logging.
//
// DESIGN:
//   ResolutionEvent is the observable unit. Every Resolver::resolve() emits one,
//   successful or not. It is recorded in ResolverStats and, when an event log
//   path is configured (ResolverConfig::event_log_path or CRA_EVENT_LOG),
//   appended to that file as one JSON line. A registered hook replaces the file
//   sink.
//
//   This is not the audit trail. The TRACE chain is. Nothing here is hashed and
//   losing a line here never affects chain verification.
//
// EXTENSION_POINT: metrics_exporter
//   Current: in-process atomics, read through ResolverStats::to_json().
//   Upgrade: a scrape endpoint in the transport layer that serves to_json().
//   Invariant: emission must never block resolve().

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace cra {

// ---------------------------------------------------------------------------
// LatencyHistogram: power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // p in [0.0, 1.0]. Microseconds, bucket midpoint. 0.0 with no samples.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  // MICRO_DOCUMENTED: separate cache lines so concurrent resolvers do not
  // bounce the line holding count_ while updating buckets.
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// ResolverStats: process-wide counters
// ---------------------------------------------------------------------------
class ResolverStats {
 public:
  std::string to_json() const;

  alignas(64) std::atomic<uint64_t> resolutions_total{0};
  alignas(64) std::atomic<uint64_t> resolutions_failed{0};
  std::atomic<uint64_t> decisions_allow{0};
  std::atomic<uint64_t> decisions_deny{0};
  std::atomic<uint64_t> decisions_requires_approval{0};
  std::atomic<uint64_t> decisions_partial{0};

  alignas(64) std::atomic<uint64_t> sessions_started{0};
  std::atomic<uint64_t> sessions_ended{0};

  // TRACE pipeline. recorded = accepted at ingest, chained = appended by the
  // worker, rejected = dropped by the worker (frozen session).
  alignas(64) std::atomic<uint64_t> trace_events_recorded{0};
  alignas(64) std::atomic<uint64_t> trace_events_chained{0};
  std::atomic<uint64_t> trace_events_rejected{0};
  std::atomic<uint64_t> backpressure_rejections{0};

  std::atomic<uint64_t> chain_verifications{0};
  std::atomic<uint64_t> chain_verification_failures{0};

  LatencyHistogram resolve_latency;
};

ResolverStats& global_resolver_stats();

// ---------------------------------------------------------------------------
// ResolutionEvent
// ---------------------------------------------------------------------------
struct ResolutionEvent {
  std::string session_id;
  std::string agent_id;
  std::string request_id;
  std::string resolution_id;
  std::string decision;        // decision_type() or empty on failure
  std::string error_code;      // to_string(ErrorCode) or empty on success
  uint64_t    duration_ns{0};
  size_t      context_blocks{0};
  size_t      allowed_actions{0};
  size_t      denied_actions{0};
  bool        ok{false};

  std::string to_json() const;
};

// Records into global stats, then hands the event to the hook or, without a
// hook, appends it to log_path (CRA_EVENT_LOG when log_path is empty).
void emit_resolution_event(const ResolutionEvent& ev, const std::string& log_path = "");

using ResolutionEventHook = void (*)(const ResolutionEvent&);
void set_resolution_event_hook(ResolutionEventHook hook);

// ---------------------------------------------------------------------------
// Structured logging
// ---------------------------------------------------------------------------
// One JSON object per line on stderr:
//   {"component":"trace","level":"warn","message":"...","ts_ms":...}
// Threshold from CRA_LOG_LEVEL (debug|info|warn|error), default warn, read once.
enum class LogLevel : uint8_t { debug = 0, info = 1, warn = 2, error = 3 };

std::string to_string(LogLevel level);
void set_log_level(LogLevel level);
LogLevel log_level();
void log(LogLevel level, const std::string& component, const std::string& message);

// ---------------------------------------------------------------------------
// ScopeTimer: RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace cra
