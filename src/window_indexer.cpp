#include "lectern/window_indexer.hpp"

#include <algorithm>

namespace lectern {

WindowIndexer::WindowIndexer(int total_chapters, int chapters_per_window)
    : total_chapters_(total_chapters), chapters_per_window_(chapters_per_window) {
  if (chapters_per_window <= 0) {
    throw EngineError(ErrorCode::invalid_config,
                      "chapters_per_window must be positive, got " +
                          std::to_string(chapters_per_window));
  }
  if (total_chapters < 0) {
    throw EngineError(ErrorCode::invalid_config,
                      "total_chapters must not be negative, got " +
                          std::to_string(total_chapters));
  }
}

int WindowIndexer::window_count() const {
  if (total_chapters_ == 0) return 0;
  return (total_chapters_ + chapters_per_window_ - 1) / chapters_per_window_;
}

WindowIndex WindowIndexer::window_for_chapter(ChapterIndex c) const {
  if (c.value < 0) {
    throw EngineError(ErrorCode::invalid_index,
                      "chapter index must not be negative, got " + std::to_string(c.value));
  }
  return WindowIndex{c.value / chapters_per_window_};
}

ChapterRange WindowIndexer::chapter_range_for_window(WindowIndex w) const {
  if (w.value < 0) {
    throw EngineError(ErrorCode::invalid_index,
                      "window index must not be negative, got " + std::to_string(w.value));
  }
  const int first = w.value * chapters_per_window_;
  const int last = std::min(first + chapters_per_window_ - 1, total_chapters_ - 1);
  return ChapterRange{w, ChapterIndex{first}, ChapterIndex{last}};
}

std::string WindowIndexer::debug_window_map() const {
  std::string out;
  const int n = window_count();
  for (int w = 0; w < n; ++w) {
    const ChapterRange r = chapter_range_for_window(WindowIndex{w});
    if (w > 0) out += ", ";
    out += "W" + std::to_string(w) + "=[" + std::to_string(r.first.value) + "-" +
           std::to_string(r.last.value) + "](" + std::to_string(r.chapter_count()) + ")";
  }
  return out;
}

}  // namespace lectern
