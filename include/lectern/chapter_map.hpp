#pragma once

// lectern/chapter_map.hpp - Spine chapters vs. the chapters a reader sees.
//
// A book's spine often carries more items than its chapter list: a cover page,
// the navigation document, notes marked non-linear. ChapterMap keeps both views
// and maps between them:
//   - spine index: position in reading order (the ChapterIndex everything else uses)
//   - ui index:    position among visible chapters only
//
// Visibility:
//   content, front_matter  always visible
//   cover, nav             never visible
//   non_linear             visible only with include_non_linear
//
// Windows computed here partition the visible chapters. They differ from a
// WindowIndexer over the raw spine whenever anything is hidden.
//
// Immutable after construction; safe to share across threads.

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "lectern/types.hpp"
#include "lectern/window_indexer.hpp"

namespace lectern {

class ChapterMap {
 public:
  // kinds[i] classifies spine chapter i. Throws EngineError(invalid_config) if
  // chapters_per_window <= 0.
  ChapterMap(std::vector<ChapterKind> kinds, int chapters_per_window,
             bool include_non_linear = false);

  // Kinds taken from the first TOC entry naming each spine chapter; chapters the
  // TOC never mentions count as content. Entries outside [0, spine_count) are
  // ignored.
  static ChapterMap from_toc(int spine_count, const std::vector<TocEntry>& toc,
                             int chapters_per_window, bool include_non_linear = false);

  int spine_count() const { return static_cast<int>(kinds_.size()); }
  int visible_count() const { return static_cast<int>(visible_.size()); }

  // nullopt when ui_index is outside [0, visible_count).
  std::optional<ChapterIndex> ui_to_spine(int ui_index) const;
  // nullopt when the spine chapter is hidden or out of range.
  std::optional<int> spine_to_ui(ChapterIndex spine) const;
  bool is_visible(ChapterIndex spine) const { return spine_to_ui(spine).has_value(); }

  // Throws EngineError(invalid_index) outside [0, spine_count).
  ChapterKind kind(ChapterIndex spine) const;

  // Windows over visible chapters.
  const WindowIndexer& visible_indexer() const { return visible_indexer_; }
  int window_count() const { return visible_indexer_.window_count(); }
  // Windows over the whole spine, for modes that navigate every item.
  int window_count_for_spine() const { return spine_indexer_.window_count(); }

  // Window holding a visible spine chapter; nullopt when it is hidden.
  std::optional<WindowIndex> window_for_spine_chapter(ChapterIndex spine) const;

  // Spine chapters of a visible window in reading order; empty for an invalid window.
  std::vector<ChapterIndex> spine_chapters_for_window(WindowIndex w) const;

  std::map<ChapterKind, int> kind_counts() const;

  // e.g. "spine=9 visible=6 windows=2 spine_windows=2 content=5 cover=1 nav=1
  //       front_matter=1 non_linear=1 map=W0=[0-4](5), W1=[5-5](1)"
  std::string debug_info() const;

 private:
  std::vector<ChapterKind> kinds_;
  std::vector<ChapterIndex> visible_;       // ui index -> spine index
  std::vector<int> ui_of_spine_;            // spine index -> ui index, -1 if hidden
  WindowIndexer visible_indexer_;
  WindowIndexer spine_indexer_;
};

}  // namespace lectern
