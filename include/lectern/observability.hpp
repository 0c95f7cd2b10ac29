#pragma once

// lectern/observability.hpp - Structured event stream for the windowing engine.
//
// DESIGN:
//   ReaderEvent is the canonical observable unit. Every phase transition, shift,
//   materialization outcome and chapter load emits one ReaderEvent, which is:
//     - recorded into the process-wide ReaderStats (counters, latency histogram,
//       bounded ring of recent events);
//     - forwarded to a registered ReaderEventHook if one is set; otherwise
//     - appended as one JSON line to the file named by LECTERN_EVENT_LOG.
//
// INVARIANT:
//   Emission never blocks the caller beyond a single append. Engine components
//   call emit_event() while holding their own mutex, so hooks must not call back
//   into the component that emitted the event.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "lectern/types.hpp"

namespace lectern {

// ---------------------------------------------------------------------------
// ReaderEvent
// ---------------------------------------------------------------------------
enum class EventKind {
  phase_transition,
  shift_forward,
  shift_backward,
  window_materialized,
  materialization_failed,
  materialization_discarded,
  chapter_loaded,
  chapter_evicted,
  chapter_load_failed,
  page_count_updated,
  position_restored,
};

std::string to_string(EventKind kind);

struct ReaderEvent {
  EventKind kind{EventKind::phase_transition};
  int window{-1};    // -1 when not applicable
  int chapter{-1};   // -1 when not applicable
  std::string detail;
  uint64_t duration_ns{0};
  bool ok{true};
};

std::string event_to_json(const ReaderEvent& ev);

// ---------------------------------------------------------------------------
// LatencyHistogram - power-of-two microsecond buckets
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);
  void reset();

  // p in [0.0, 1.0]. Returns microseconds, 0.0 when empty.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  uint64_t sum_us() const { return sum_us_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// ReaderStats - global aggregated statistics
// ---------------------------------------------------------------------------
// Thread-safe. Counters are atomic; the recent-event ring uses a mutex.
class ReaderStats {
 public:
  void record(const ReaderEvent& ev);
  std::string to_json() const;

  // Zeroes every counter and histogram and empties the ring. Used between CLI sessions and tests.
  void reset();

  alignas(64) std::atomic<uint64_t> phase_transitions{0};
  alignas(64) std::atomic<uint64_t> shifts_forward{0};
  alignas(64) std::atomic<uint64_t> shifts_backward{0};

  alignas(64) std::atomic<uint64_t> windows_materialized{0};
  alignas(64) std::atomic<uint64_t> materialization_failures{0};
  alignas(64) std::atomic<uint64_t> materializations_discarded{0};

  alignas(64) std::atomic<uint64_t> chapters_loaded{0};
  alignas(64) std::atomic<uint64_t> chapters_evicted{0};
  alignas(64) std::atomic<uint64_t> chapter_load_failures{0};
  alignas(64) std::atomic<uint64_t> page_count_updates{0};
  alignas(64) std::atomic<uint64_t> positions_restored{0};

  LatencyHistogram materialization_latency;
  LatencyHistogram chapter_load_latency;

  static constexpr size_t kMaxRecentEvents = 256;
  std::vector<ReaderEvent> recent_events_snapshot() const;

 private:
  mutable std::mutex ring_mu_;
  std::vector<ReaderEvent> ring_buffer_;
  size_t ring_head_{0};  // next slot to overwrite once the ring is full
};

ReaderStats& global_reader_stats();

// Record + dispatch one event (hook, else JSONL log if LECTERN_EVENT_LOG is set).
void emit_event(const ReaderEvent& ev);

using ReaderEventHook = void (*)(const ReaderEvent&);
void set_event_hook(ReaderEventHook hook);

// ---------------------------------------------------------------------------
// ScopeTimer - RAII duration capture
// ---------------------------------------------------------------------------
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

}  // namespace lectern
