#include "cra/trace.hpp"

#include "cra/hash.hpp"
#include "cra/observability.hpp"
#include "cra/version.hpp"

namespace cra {

std::string to_string(ChainErrorType type) {
  switch (type) {
    case ChainErrorType::hash_mismatch:   return "hash_mismatch";
    case ChainErrorType::chain_broken:    return "chain_broken";
    case ChainErrorType::sequence_gap:    return "sequence_gap";
    case ChainErrorType::invalid_genesis: return "invalid_genesis";
  }
  return "hash_mismatch";
}

std::string ChainVerification::to_json() const {
  jsonlite::Object o;
  o["is_valid"] = is_valid;
  o["event_count"] = event_count;
  o["first_invalid_index"] = first_invalid_index ? jsonlite::Value(*first_invalid_index) : jsonlite::Value(nullptr);
  o["error_type"] = error_type ? jsonlite::Value(to_string(*error_type)) : jsonlite::Value(nullptr);
  o["error_message"] = error_message;
  o["last_valid_hash"] = last_valid_hash;
  return jsonlite::to_json(o);
}

jsonlite::Object hashed_body(const TraceEvent& e) {
  jsonlite::Object o;
  o["trace_version"] = e.trace_version;
  o["session_id"] = e.session_id;
  o["trace_id"] = e.trace_id;
  o["event_id"] = e.event_id;
  o["span_id"] = e.span_id;
  o["parent_span_id"] = e.parent_span_id ? jsonlite::Value(*e.parent_span_id) : jsonlite::Value(nullptr);
  o["sequence"] = e.sequence;
  o["timestamp"] = e.timestamp_unix_ms;
  o["event_type"] = e.event_type;
  o["payload"] = e.payload;
  return o;
}

std::string compute_event_hash(const TraceEvent& e) {
  return sha256_hex(e.previous_event_hash + jsonlite::to_json(hashed_body(e)));
}

ChainVerification verify_events(const std::vector<TraceEvent>& events, const std::string& genesis_seed) {
  ChainVerification v;
  v.event_count = events.size();
  v.last_valid_hash = genesis_seed;

  auto fail = [&](uint64_t index, ChainErrorType type, std::string message) {
    v.is_valid = false;
    v.first_invalid_index = index;
    v.error_type = type;
    v.error_message = std::move(message);
    return v;
  };

  for (uint64_t i = 0; i < events.size(); ++i) {
    const TraceEvent& e = events[i];
    if (i == 0 && e.previous_event_hash != genesis_seed) {
      return fail(i, ChainErrorType::invalid_genesis,
                  "event 0 links to " + e.previous_event_hash + ", expected genesis seed " + genesis_seed);
    }
    if (i > 0 && e.previous_event_hash != events[i - 1].event_hash) {
      return fail(i, ChainErrorType::chain_broken,
                  "event " + std::to_string(i) + " previous_event_hash does not match event " +
                      std::to_string(i - 1) + " event_hash");
    }
    if (e.sequence != i) {
      return fail(i, ChainErrorType::sequence_gap,
                  "event " + std::to_string(i) + " has sequence " + std::to_string(e.sequence));
    }
    const std::string expected = compute_event_hash(e);
    if (expected != e.event_hash) {
      return fail(i, ChainErrorType::hash_mismatch,
                  "event " + std::to_string(i) + " hash mismatch: stored " + e.event_hash + ", computed " + expected);
    }
    v.last_valid_hash = e.event_hash;
  }
  return v;
}

std::string trace_to_ndjson(const std::vector<TraceEvent>& events) {
  std::string out;
  for (const auto& e : events) {
    out += event_to_json(e);
    out += '\n';
  }
  return out;
}

// ---------------------------------------------------------------------------
// TraceLog
// ---------------------------------------------------------------------------

TraceLog::TraceLog(std::size_t queue_capacity, std::string genesis_seed)
    : capacity_(queue_capacity == 0 ? 1 : queue_capacity), genesis_(std::move(genesis_seed)) {
  worker_ = std::thread([this] { worker_loop(); });
}

TraceLog::~TraceLog() {
  shutdown();
}

std::optional<Error> TraceLog::record(RawEvent raw) {
  std::vector<RawEvent> one;
  one.push_back(std::move(raw));
  return record_batch(std::move(one));
}

std::optional<Error> TraceLog::record_batch(std::vector<RawEvent> batch) {
  if (batch.empty()) return std::nullopt;
  for (const auto& raw : batch) {
    if (raw.session_id.empty()) {
      return make_error(ErrorCode::validation_error, "trace event without session_id");
    }
  }
  const std::size_t n = batch.size();
  {
    std::lock_guard<std::mutex> lk(queue_mu_);
    if (stopping_) {
      return make_error(ErrorCode::invalid_state, "trace log is shut down");
    }
    if (queue_.size() + n > capacity_) {
      global_resolver_stats().backpressure_rejections.fetch_add(1, std::memory_order_relaxed);
      return make_error(ErrorCode::backpressure, "trace queue full (" + std::to_string(queue_.size()) + " of " +
                                                     std::to_string(capacity_) + " pending, " +
                                                     std::to_string(n) + " offered)");
    }
    for (auto& raw : batch) queue_.push_back(std::move(raw));
    accepted_ += n;
  }
  global_resolver_stats().trace_events_recorded.fetch_add(n, std::memory_order_relaxed);
  work_cv_.notify_one();
  return std::nullopt;
}

void TraceLog::flush() {
  std::unique_lock<std::mutex> lk(queue_mu_);
  const uint64_t target = accepted_;
  drained_cv_.wait(lk, [&] { return processed_ >= target; });
}

void TraceLog::shutdown() {
  {
    std::lock_guard<std::mutex> lk(queue_mu_);
    if (stopping_ && !worker_.joinable()) return;
    stopping_ = true;
  }
  work_cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

void TraceLog::worker_loop() {
  for (;;) {
    std::deque<RawEvent> batch;
    {
      std::unique_lock<std::mutex> lk(queue_mu_);
      work_cv_.wait(lk, [&] { return (!queue_.empty() && !paused_) || stopping_; });
      if (queue_.empty()) return;  // stopping and drained
      batch.swap(queue_);
    }
    for (auto& raw : batch) process(std::move(raw));
    {
      std::lock_guard<std::mutex> lk(queue_mu_);
      processed_ += batch.size();
    }
    drained_cv_.notify_all();
  }
}

void TraceLog::process(RawEvent&& raw) {
  std::lock_guard<std::mutex> lk(chains_mu_);
  auto [it, created] = chains_.try_emplace(raw.session_id);
  SessionChain& chain = it->second;
  if (created) chain.tip = genesis_;

  if (chain.frozen) {
    global_resolver_stats().trace_events_rejected.fetch_add(1, std::memory_order_relaxed);
    log(LogLevel::warn, "trace",
        "rejected " + raw.event_type + " for ended session " + raw.session_id);
    return;
  }

  TraceEvent e;
  e.trace_version = version::TRACE_VERSION;
  e.session_id = std::move(raw.session_id);
  e.trace_id = std::move(raw.trace_id);
  e.event_id = std::move(raw.event_id);
  e.span_id = std::move(raw.span_id);
  e.parent_span_id = std::move(raw.parent_span_id);
  e.sequence = chain.next_sequence++;
  e.timestamp_unix_ms = raw.timestamp_unix_ms;
  e.event_type = std::move(raw.event_type);
  e.payload = std::move(raw.payload);
  e.previous_event_hash = chain.tip;
  e.event_hash = compute_event_hash(e);

  chain.tip = e.event_hash;
  if (e.event_type == event_type::session_ended) chain.frozen = true;
  chain.events.push_back(std::move(e));
  global_resolver_stats().trace_events_chained.fetch_add(1, std::memory_order_relaxed);
}

std::vector<TraceEvent> TraceLog::get_trace(const std::string& session_id, std::optional<Error>* error) {
  flush();
  std::lock_guard<std::mutex> lk(chains_mu_);
  auto it = chains_.find(session_id);
  if (it == chains_.end()) {
    if (error) *error = make_error(ErrorCode::not_found, "no trace for session " + session_id);
    return {};
  }
  return it->second.events;
}

ChainVerification TraceLog::verify_chain(const std::string& session_id, std::optional<Error>* error) {
  std::optional<Error> err;
  std::vector<TraceEvent> events = get_trace(session_id, &err);
  if (err) {
    if (error) *error = std::move(err);
    return ChainVerification{false, 0, std::nullopt, std::nullopt, "unknown session " + session_id, {}};
  }

  ChainVerification v = verify_events(events, genesis_);
  ResolverStats& stats = global_resolver_stats();
  stats.chain_verifications.fetch_add(1, std::memory_order_relaxed);
  if (!v.is_valid) {
    stats.chain_verification_failures.fetch_add(1, std::memory_order_relaxed);
    log(LogLevel::error, "trace", "chain verification failed for " + session_id + ": " + v.error_message);
  }
  return v;
}

bool TraceLog::is_frozen(const std::string& session_id) const {
  std::lock_guard<std::mutex> lk(chains_mu_);
  auto it = chains_.find(session_id);
  return it != chains_.end() && it->second.frozen;
}

void TraceLog::pause() {
  std::lock_guard<std::mutex> lk(queue_mu_);
  paused_ = true;
}

void TraceLog::resume() {
  {
    std::lock_guard<std::mutex> lk(queue_mu_);
    paused_ = false;
  }
  work_cv_.notify_one();
}

std::size_t TraceLog::pending() const {
  std::lock_guard<std::mutex> lk(queue_mu_);
  return queue_.size();
}

}  // namespace cra
