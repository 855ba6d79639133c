#pragma once

// cra/trace.hpp: TRACE hash-chain log.
//
// Two-stage pipeline:
//   record()  hot path. Validates, pushes onto a bounded queue, returns. Never
//             hashes, never waits for the worker. A full queue is reported as
//             backpressure; nothing is dropped silently.
//   worker    one thread per TraceLog. Drains in arrival order, assigns the
//             per-session sequence, computes the hash, appends to the timeline.
//             It is the only writer of chain tips and timelines.
//
// DESIGN INVARIANTS:
//   1. event_hash = sha256_hex(previous_event_hash ++ to_json(hashed_body(e))).
//      hashed_body holds every field except the two hashes.
//   2. Sequence numbers start at 0 and grow by exactly 1 per session. They are
//      assigned by the worker, so producers never contend on them.
//   3. The first event of a session links to the genesis seed.
//   4. After a session.ended event is chained the session is frozen. Later
//      events for it are rejected by the worker (counted and logged).
//   5. Verification is read-only and reports breaks as data.
//
// SHUTDOWN: drain, then stop. The destructor calls shutdown().

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "cra/jsonlite.hpp"
#include "cra/protocol.hpp"
#include "cra/types.hpp"

namespace cra {

enum class ChainErrorType {
  hash_mismatch,    // recomputed hash differs from stored event_hash
  chain_broken,     // previous_event_hash differs from the prior event_hash
  sequence_gap,     // sequence != position
  invalid_genesis,  // first event does not link to the genesis seed
};

std::string to_string(ChainErrorType type);

struct ChainVerification {
  bool                          is_valid{true};
  uint64_t                      event_count{0};
  std::optional<uint64_t>       first_invalid_index;
  std::optional<ChainErrorType> error_type;
  std::string                   error_message;
  std::string                   last_valid_hash;

  std::string to_json() const;
};

jsonlite::Object hashed_body(const TraceEvent& e);
std::string compute_event_hash(const TraceEvent& e);

// Pure verifier. Used by TraceLog::verify_chain and by offline auditors.
ChainVerification verify_events(const std::vector<TraceEvent>& events, const std::string& genesis_seed);

// One event_to_json() line per event.
std::string trace_to_ndjson(const std::vector<TraceEvent>& events);

class TraceLog {
 public:
  TraceLog(std::size_t queue_capacity, std::string genesis_seed);
  ~TraceLog();

  TraceLog(const TraceLog&) = delete;
  TraceLog& operator=(const TraceLog&) = delete;

  // backpressure when the queue is full, validation_error for an event without
  // a session id, invalid_state after shutdown().
  std::optional<Error> record(RawEvent raw);

  // All or nothing: either every event is queued, contiguously and in order, or
  // none is. Capacity is checked once for the whole batch, so a batch larger
  // than the queue is always backpressure.
  std::optional<Error> record_batch(std::vector<RawEvent> batch);

  // Blocks until every event accepted so far has been processed.
  void flush();

  // While paused the worker takes no new batches and record() keeps filling the
  // queue up to capacity. Do not flush() while paused. shutdown() overrides.
  void pause();
  void resume();

  // Drains the queue, then joins the worker. Idempotent.
  void shutdown();

  // Both flush first. not_found for a session with no chained events.
  std::vector<TraceEvent> get_trace(const std::string& session_id, std::optional<Error>* error);
  ChainVerification verify_chain(const std::string& session_id, std::optional<Error>* error);

  bool is_frozen(const std::string& session_id) const;
  std::size_t pending() const;
  std::size_t capacity() const { return capacity_; }
  const std::string& genesis_seed() const { return genesis_; }

 private:
  struct SessionChain {
    std::string             tip;
    uint64_t                next_sequence{0};
    bool                    frozen{false};
    std::vector<TraceEvent> events;
  };

  void worker_loop();
  void process(RawEvent&& raw);

  const std::size_t capacity_;
  const std::string genesis_;

  mutable std::mutex      queue_mu_;
  std::condition_variable work_cv_;
  std::condition_variable drained_cv_;
  std::deque<RawEvent>    queue_;
  uint64_t                accepted_{0};
  uint64_t                processed_{0};
  bool                    stopping_{false};
  bool                    paused_{false};

  mutable std::mutex                  chains_mu_;
  std::map<std::string, SessionChain> chains_;

  std::thread worker_;
};

}  // namespace cra
