#pragma once

// lectern/window_indexer.hpp - Chapter <-> window index arithmetic.
//
// A window is a contiguous run of chapters_per_window chapters. Windows partition
// [0, total_chapters) with no gaps and no overlap; only the last window may be
// partial.
//
// INVARIANTS:
//   - window_count() == ceil(total_chapters / chapters_per_window), 0 for an empty book.
//   - window_for_chapter(chapter_range_for_window(w).first) == w for every valid w.
//   - All operations are O(1), allocation-free and safe from any thread. The
//     indexer is immutable after construction.

#include <string>

#include "lectern/types.hpp"

namespace lectern {

class WindowIndexer {
 public:
  // Throws EngineError(invalid_config) if chapters_per_window <= 0 or
  // total_chapters < 0.
  WindowIndexer(int total_chapters, int chapters_per_window);

  int total_chapters() const { return total_chapters_; }
  int chapters_per_window() const { return chapters_per_window_; }

  int window_count() const;

  // Throws EngineError(invalid_index) if c < 0. Not clamped to window_count() - 1:
  // callers validate c < total_chapters themselves.
  WindowIndex window_for_chapter(ChapterIndex c) const;

  // Throws EngineError(invalid_index) if w < 0.
  ChapterRange chapter_range_for_window(WindowIndex w) const;

  bool is_valid_window(WindowIndex w) const {
    return w.value >= 0 && w.value < window_count();
  }

  // Human-readable map, e.g. "W0=[0-4](5), W1=[5-9](5)".
  std::string debug_window_map() const;

 private:
  int total_chapters_;
  int chapters_per_window_;
};

}  // namespace lectern
