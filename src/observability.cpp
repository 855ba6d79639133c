#include "cra/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>
#include <mutex>

#include "cra/jsonlite.hpp"
#include "cra/types.hpp"

namespace cra {

namespace {

// MICRO_OPT: bit_width gives the bucket index in O(1) (BSR/CLZ).
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::string fmt(const char* format, double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), format, v);
  return buf;
}

std::atomic<ResolutionEventHook> g_event_hook{nullptr};

// Serializes appends from concurrent resolvers so JSONL lines never interleave.
std::mutex g_event_log_mu;

LogLevel level_from_env() {
  const char* e = std::getenv("CRA_LOG_LEVEL");
  if (!e) return LogLevel::warn;
  const std::string s(e);
  if (s == "debug") return LogLevel::debug;
  if (s == "info")  return LogLevel::info;
  if (s == "error") return LogLevel::error;
  return LogLevel::warn;
}

std::atomic<uint8_t>& level_slot() {
  static std::atomic<uint8_t> slot{static_cast<uint8_t>(level_from_env())};
  return slot;
}

}  // namespace

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(160);
  out += "{\"count\":" + std::to_string(count());
  out += ",\"mean_us\":" + fmt("%.2f", mean_us());
  out += ",\"p50_us\":" + fmt("%.2f", percentile(0.50));
  out += ",\"p95_us\":" + fmt("%.2f", percentile(0.95));
  out += ",\"p99_us\":" + fmt("%.2f", percentile(0.99));
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// ResolverStats
// ---------------------------------------------------------------------------

std::string ResolverStats::to_json() const {
  auto n = [](const std::atomic<uint64_t>& a) { return std::to_string(a.load(std::memory_order_relaxed)); };
  std::string out;
  out.reserve(640);
  out += "{\"resolutions\":{\"total\":" + n(resolutions_total);
  out += ",\"failed\":" + n(resolutions_failed);
  out += ",\"allow\":" + n(decisions_allow);
  out += ",\"deny\":" + n(decisions_deny);
  out += ",\"requires_approval\":" + n(decisions_requires_approval);
  out += ",\"partial\":" + n(decisions_partial);
  out += "},\"sessions\":{\"started\":" + n(sessions_started);
  out += ",\"ended\":" + n(sessions_ended);
  out += "},\"trace\":{\"recorded\":" + n(trace_events_recorded);
  out += ",\"chained\":" + n(trace_events_chained);
  out += ",\"rejected\":" + n(trace_events_rejected);
  out += ",\"backpressure\":" + n(backpressure_rejections);
  out += ",\"verifications\":" + n(chain_verifications);
  out += ",\"verification_failures\":" + n(chain_verification_failures);
  out += "},\"resolve_latency\":" + resolve_latency.to_json();
  out += '}';
  return out;
}

ResolverStats& global_resolver_stats() {
  static ResolverStats inst;
  return inst;
}

// ---------------------------------------------------------------------------
// ResolutionEvent
// ---------------------------------------------------------------------------

std::string ResolutionEvent::to_json() const {
  jsonlite::Object o;
  o["session_id"] = session_id;
  o["agent_id"] = agent_id;
  o["request_id"] = request_id;
  o["resolution_id"] = resolution_id;
  o["decision"] = decision;
  o["error_code"] = error_code;
  o["duration_ns"] = duration_ns;
  o["context_blocks"] = static_cast<std::uint64_t>(context_blocks);
  o["allowed_actions"] = static_cast<std::uint64_t>(allowed_actions);
  o["denied_actions"] = static_cast<std::uint64_t>(denied_actions);
  o["ok"] = ok;
  return jsonlite::to_json(o);
}

void set_resolution_event_hook(ResolutionEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_resolution_event(const ResolutionEvent& ev, const std::string& log_path) {
  ResolverStats& stats = global_resolver_stats();
  stats.resolutions_total.fetch_add(1, std::memory_order_relaxed);
  if (!ev.ok) {
    stats.resolutions_failed.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.decision == "allow") {
    stats.decisions_allow.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.decision == "deny") {
    stats.decisions_deny.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.decision == "requires_approval") {
    stats.decisions_requires_approval.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.decision == "partial") {
    stats.decisions_partial.fetch_add(1, std::memory_order_relaxed);
  }
  stats.resolve_latency.record(ev.duration_ns);

  if (ResolutionEventHook hook = g_event_hook.load(std::memory_order_acquire)) {
    hook(ev);
    return;
  }

  std::string path = log_path;
  if (path.empty()) {
    const char* env = std::getenv("CRA_EVENT_LOG");
    if (!env || !env[0]) return;
    path = env;
  }

  const std::string line = ev.to_json() + "\n";
  std::lock_guard<std::mutex> lk(g_event_log_mu);
  if (FILE* f = std::fopen(path.c_str(), "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

std::string to_string(LogLevel level) {
  switch (level) {
    case LogLevel::debug: return "debug";
    case LogLevel::info:  return "info";
    case LogLevel::warn:  return "warn";
    case LogLevel::error: return "error";
  }
  return "warn";
}

void set_log_level(LogLevel level) {
  level_slot().store(static_cast<uint8_t>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
  return static_cast<LogLevel>(level_slot().load(std::memory_order_relaxed));
}

void log(LogLevel level, const std::string& component, const std::string& message) {
  if (static_cast<uint8_t>(level) < level_slot().load(std::memory_order_relaxed)) return;
  jsonlite::Object o;
  o["level"] = to_string(level);
  o["component"] = component;
  o["message"] = message;
  o["ts_ms"] = now_unix_ms();
  const std::string line = jsonlite::to_json(o) + "\n";
  std::fwrite(line.data(), 1, line.size(), stderr);
}

}  // namespace cra
