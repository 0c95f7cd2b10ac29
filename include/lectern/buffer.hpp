#pragma once

// lectern/buffer.hpp - The conveyor: a bounded, sliding buffer of materialized
// windows with a two-phase lifecycle.
//
// DESIGN:
//   buffer_ holds min(5, window_count) contiguous ascending window indices.
//   cache_ maps a buffered window to its assembled WindowData. Materialization
//   runs on one background worker (MaterializationWorker, see buffer.cpp); its
//   results come back through on_materialized(), which re-checks generation and
//   buffer membership under mu_ before touching the cache.
//
//   Lifecycle: STARTUP until the reader enters the center slot (buffer_[2]),
//   then STEADY for the rest of the session. Shifts are refused in STARTUP.
//
// INVARIANTS:
//   - No window outside buffer_ is ever in cache_.
//   - A shift drops exactly one edge window and evicts its cache entry before
//     returning; the revealed window is filled in asynchronously.
//   - Every in-flight job carries the generation it was queued under. clear()
//     and initialize() bump the generation, so results of an earlier session are
//     discarded instead of being inserted into the new buffer.
//   - A window is never queued twice while a job for it is in flight.
//
//   The reading position belongs to a session: initialize() and clear() drop it.
//
// CONCURRENCY:
//   One mutex (mu_) guards buffer_, cache_, in_flight_, phase and generation.
//   Assembly itself runs outside mu_. The ready listener is invoked on the worker
//   thread after mu_ is released.

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "lectern/assembler.hpp"
#include "lectern/types.hpp"
#include "lectern/window_indexer.hpp"

namespace lectern {

enum class ConveyorPhase { startup, steady };

std::string to_string(ConveyorPhase phase);

// The single legal edge is startup -> steady when the reader enters the center
// slot. Every other input returns `current` unchanged.
ConveyorPhase next_phase(ConveyorPhase current, bool entered_center_slot);

// What a rendering surface should show for a window.
enum class WindowRenderState {
  absent,   // not in the buffer
  loading,  // buffered, materialization pending or failed (retry queued on next shift/entry)
  ready,    // cached content available
};

struct BufferConfig {
  int edge_threshold_pages{2};
  std::chrono::milliseconds backward_cooldown{300};
  // Progress through the active window at or beyond which a preload is due.
  double forward_preload_threshold{0.75};
  double backward_preload_threshold{0.25};
};

enum class NavigationDirection { forward, backward };

// Where the reader is inside the active window, as last reported.
struct ReadingPosition {
  WindowIndex window;
  ChapterIndex chapter;
  int in_page{0};       // page within the window, 0-based
  double progress{0.0}; // in_page / pages in window, clamped to [0, 1]
};

// Preloads due after a position update. Only reported in STEADY.
struct PreloadHint {
  bool forward{false};
  bool backward{false};
};

class MaterializationWorker;

class WindowBufferManager {
 public:
  static constexpr int kBufferSize = 5;
  static constexpr int kCenterSlot = 2;
  static constexpr double kForwardBoundaryProgress = 0.99;

  using ReadyListener = std::function<void(const WindowData&)>;

  WindowBufferManager(WindowIndexer indexer, std::shared_ptr<IWindowAssembler> assembler,
                      BufferConfig config = {});
  ~WindowBufferManager();

  WindowBufferManager(const WindowBufferManager&) = delete;
  WindowBufferManager& operator=(const WindowBufferManager&) = delete;

  // Clamps start_window so the buffer never runs off either end, resets the
  // phase to STARTUP, makes the first buffered window active, and queues
  // materialization of every buffered window.
  void initialize(WindowIndex start_window);

  // Records the active window and takes the STARTUP -> STEADY edge once.
  // Re-queues materialization for w if it is buffered but not cached.
  void on_entered_window(WindowIndex w);

  // false (buffer unchanged) during STARTUP, at the book boundary, or when empty.
  bool shift_forward();
  bool shift_backward();

  // Page-proximity hints from the rendering surface. They shift only when the
  // reader is within edge_threshold_pages of the window edge and the active
  // window sits on the matching side of the center slot. maybe_shift_backward is
  // also suppressed for backward_cooldown after on_entered_window.
  bool maybe_shift_forward(int current_in_page, int total_pages_in_window);
  bool maybe_shift_backward(int current_in_page);

  // Records the reading position inside the active window. progress is
  // in_page / total_pages_in_window (0 when the window has no pages yet).
  // Ignored before initialize(). Throws EngineError(invalid_index) if in_page < 0.
  PreloadHint update_position(ChapterIndex chapter, int in_page, int total_pages_in_window);
  std::optional<ReadingPosition> current_position() const;

  // forward: progress >= kForwardBoundaryProgress. backward: on the first page.
  // false with no position or while the active window is not materialized.
  bool is_at_window_boundary(NavigationDirection direction) const;

  // nullopt for anything outside the buffer or not yet materialized.
  std::optional<WindowData> get_cached_window(WindowIndex w) const;
  bool is_window_in_buffer(WindowIndex w) const;
  WindowRenderState render_state(WindowIndex w) const;

  // Back to the pre-initialize state; in-flight results become stale.
  void clear();

  // Blocks until the materialization queue is drained (true) or timeout (false).
  bool wait_until_idle(std::chrono::milliseconds timeout);

  void set_window_ready_listener(ReadyListener listener);

  ConveyorPhase phase() const;
  std::vector<WindowIndex> buffered_windows() const;
  std::optional<WindowIndex> active_window() const;
  std::optional<WindowIndex> center_window() const;
  size_t cache_size() const;
  bool has_next_window() const;
  bool has_previous_window() const;
  int window_count() const { return indexer_.window_count(); }
  uint64_t generation() const;
  std::string debug_info() const;

 private:
  bool shift_locked(bool forward);
  void enqueue_locked(WindowIndex w);
  void enqueue_missing_locked();
  bool in_buffer_locked(WindowIndex w) const;
  void on_materialized(uint64_t generation, WindowIndex w, std::optional<WindowData> data,
                       uint64_t duration_ns, const std::string& error);

  const WindowIndexer indexer_;
  std::shared_ptr<IWindowAssembler> assembler_;
  const BufferConfig config_;

  mutable std::mutex mu_;
  std::deque<WindowIndex> buffer_;
  std::map<WindowIndex, WindowData> cache_;
  std::set<WindowIndex> in_flight_;
  ConveyorPhase phase_{ConveyorPhase::startup};
  std::optional<WindowIndex> active_;
  std::optional<std::chrono::steady_clock::time_point> last_entry_;
  std::optional<ReadingPosition> position_;
  uint64_t generation_{0};
  ReadyListener ready_listener_;

  // Declared last: destroyed (thread joined) before the state it calls back into.
  std::unique_ptr<MaterializationWorker> worker_;
};

}  // namespace lectern
