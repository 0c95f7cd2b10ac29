#include "lectern/observability.hpp"

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstdio>
#include <cstdlib>

#include "lectern/jsonlite.hpp"

namespace lectern {

namespace {

// bit_width(x) == floor(log2(x)) + 1 for x > 0.
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

void append_fixed(std::string& out, const char* fmt, double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), fmt, v);
  out += buf;
}

}  // namespace

std::string to_string(EventKind kind) {
  switch (kind) {
    case EventKind::phase_transition: return "phase_transition";
    case EventKind::shift_forward: return "shift_forward";
    case EventKind::shift_backward: return "shift_backward";
    case EventKind::window_materialized: return "window_materialized";
    case EventKind::materialization_failed: return "materialization_failed";
    case EventKind::materialization_discarded: return "materialization_discarded";
    case EventKind::chapter_loaded: return "chapter_loaded";
    case EventKind::chapter_evicted: return "chapter_evicted";
    case EventKind::chapter_load_failed: return "chapter_load_failed";
    case EventKind::page_count_updated: return "page_count_updated";
    case EventKind::position_restored: return "position_restored";
  }
  return "unknown";
}

std::string event_to_json(const ReaderEvent& ev) {
  std::string line;
  line.reserve(160);
  line += "{\"kind\":\"";
  line += to_string(ev.kind);
  line += "\",\"window\":";
  line += std::to_string(ev.window);
  line += ",\"chapter\":";
  line += std::to_string(ev.chapter);
  line += ",\"ok\":";
  line += ev.ok ? "true" : "false";
  line += ",\"duration_ns\":";
  line += std::to_string(ev.duration_ns);
  line += ",\"detail\":\"";
  line += jsonlite::escape(ev.detail);
  line += "\"}";
  return line;
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

void LatencyHistogram::reset() {
  for (auto& b : buckets_) b.store(0, std::memory_order_relaxed);
  count_.store(0, std::memory_order_relaxed);
  sum_us_.store(0, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  // Rank of the sample to report, 1-based; never below the first sample.
  const uint64_t target =
      std::max<uint64_t>(1, static_cast<uint64_t>(std::ceil(p * static_cast<double>(n))));
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
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_us\":";
  append_fixed(out, "%.2f", mean_us());
  out += ",\"p50_us\":";
  append_fixed(out, "%.2f", percentile(0.50));
  out += ",\"p95_us\":";
  append_fixed(out, "%.2f", percentile(0.95));
  out += ",\"p99_us\":";
  append_fixed(out, "%.2f", percentile(0.99));
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// ReaderStats
// ---------------------------------------------------------------------------

void ReaderStats::record(const ReaderEvent& ev) {
  switch (ev.kind) {
    case EventKind::phase_transition:
      phase_transitions.fetch_add(1, std::memory_order_relaxed);
      break;
    case EventKind::shift_forward:
      shifts_forward.fetch_add(1, std::memory_order_relaxed);
      break;
    case EventKind::shift_backward:
      shifts_backward.fetch_add(1, std::memory_order_relaxed);
      break;
    case EventKind::window_materialized:
      windows_materialized.fetch_add(1, std::memory_order_relaxed);
      materialization_latency.record(ev.duration_ns);
      break;
    case EventKind::materialization_failed:
      materialization_failures.fetch_add(1, std::memory_order_relaxed);
      materialization_latency.record(ev.duration_ns);
      break;
    case EventKind::materialization_discarded:
      materializations_discarded.fetch_add(1, std::memory_order_relaxed);
      break;
    case EventKind::chapter_loaded:
      chapters_loaded.fetch_add(1, std::memory_order_relaxed);
      chapter_load_latency.record(ev.duration_ns);
      break;
    case EventKind::chapter_evicted:
      chapters_evicted.fetch_add(1, std::memory_order_relaxed);
      break;
    case EventKind::chapter_load_failed:
      chapter_load_failures.fetch_add(1, std::memory_order_relaxed);
      break;
    case EventKind::page_count_updated:
      page_count_updates.fetch_add(1, std::memory_order_relaxed);
      break;
    case EventKind::position_restored:
      positions_restored.fetch_add(1, std::memory_order_relaxed);
      break;
  }

  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
    ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
  }
}

std::vector<ReaderEvent> ReaderStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) return ring_buffer_;
  // Full ring: oldest entry sits at ring_head_.
  std::vector<ReaderEvent> out;
  out.reserve(ring_buffer_.size());
  for (size_t i = 0; i < ring_buffer_.size(); ++i) {
    out.push_back(ring_buffer_[(ring_head_ + i) % ring_buffer_.size()]);
  }
  return out;
}

void ReaderStats::reset() {
  for (auto* c : {&phase_transitions, &shifts_forward, &shifts_backward,
                  &windows_materialized, &materialization_failures,
                  &materializations_discarded, &chapters_loaded, &chapters_evicted,
                  &chapter_load_failures, &page_count_updates, &positions_restored}) {
    c->store(0, std::memory_order_relaxed);
  }
  materialization_latency.reset();
  chapter_load_latency.reset();
  std::lock_guard<std::mutex> lk(ring_mu_);
  ring_buffer_.clear();
  ring_head_ = 0;
}

std::string ReaderStats::to_json() const {
  auto load = [](const std::atomic<uint64_t>& a) {
    return std::to_string(a.load(std::memory_order_relaxed));
  };
  std::string out;
  out.reserve(768);
  out += "{\"conveyor\":{\"phase_transitions\":";
  out += load(phase_transitions);
  out += ",\"shifts_forward\":";
  out += load(shifts_forward);
  out += ",\"shifts_backward\":";
  out += load(shifts_backward);
  out += ",\"windows_materialized\":";
  out += load(windows_materialized);
  out += ",\"materialization_failures\":";
  out += load(materialization_failures);
  out += ",\"materializations_discarded\":";
  out += load(materializations_discarded);
  out += ",\"latency\":";
  out += materialization_latency.to_json();
  out += "},\"paginator\":{\"chapters_loaded\":";
  out += load(chapters_loaded);
  out += ",\"chapters_evicted\":";
  out += load(chapters_evicted);
  out += ",\"chapter_load_failures\":";
  out += load(chapter_load_failures);
  out += ",\"page_count_updates\":";
  out += load(page_count_updates);
  out += ",\"latency\":";
  out += chapter_load_latency.to_json();
  out += "},\"positions_restored\":";
  out += load(positions_restored);
  out += "}";
  return out;
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

ReaderStats& global_reader_stats() {
  static ReaderStats inst;
  return inst;
}

namespace {
std::atomic<ReaderEventHook> g_event_hook{nullptr};
}

void set_event_hook(ReaderEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_event(const ReaderEvent& ev) {
  global_reader_stats().record(ev);

  ReaderEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  const char* log_path = std::getenv("LECTERN_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  std::string line = event_to_json(ev);
  line += '\n';
  // O_APPEND keeps concurrent single-line writes intact on POSIX.
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace lectern
