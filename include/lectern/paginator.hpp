#pragma once

// lectern/paginator.hpp - Working-set paginator: a sliding set of loaded
// chapters plus a global page index across the whole book.
//
// DESIGN:
//   The working set is min(2k+1, total_chapters) contiguous chapters around the
//   reader's current chapter, shifted inward at the book's edges so its width
//   never shrinks. Chapters entering the set are loaded from the content
//   provider; chapters leaving it are dropped with their content.
//
//   The global page index linearizes every chapter of the book. A loaded chapter
//   contributes its measured page count; any other chapter contributes the
//   single-page fallback of get_chapter_page_count(). The per-chapter start
//   offsets live in one prefix table (starts_), rebuilt by rebuild_prefix_from(c)
//   whenever a page count or the working set changes. Offsets are therefore
//   only meaningful relative to the current working set.
//
// INVARIANTS:
//   - starts_[0] == 0, starts_[c + 1] == starts_[c] + page_count(c).
//   - The current chapter is always in the working set once a window is loaded.
//   - A chapter whose content failed to load stays in the set as a one-page
//     placeholder and is retried on the next re-center.
//
// CONCURRENCY:
//   Every public method takes mu_ for its whole duration, including provider I/O.
//   Callers see operations as strictly sequential.

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "lectern/content_provider.hpp"
#include "lectern/types.hpp"
#include "lectern/window_indexer.hpp"

namespace lectern {

struct PaginatorConfig {
  int working_set_radius{2};
  int chapters_per_window{5};
};

struct WorkingSetInfo {
  ChapterIndex current_chapter;
  std::vector<ChapterIndex> loaded_chapters;
  int total_chapters{0};
  int total_global_pages{0};

  std::string to_json() const;
};

class WorkingSetPaginator {
 public:
  // Same ceiling the config loader applies; keeps 2 * radius + 1 within int.
  static constexpr int kMaxWorkingSetRadius = 1000000;

  // Throws EngineError(invalid_config) for a radius outside
  // [0, kMaxWorkingSetRadius] or a non-positive chapters_per_window.
  WorkingSetPaginator(std::shared_ptr<IChapterContentProvider> provider,
                      std::string book_path, PaginatorConfig config = {});

  // Reads chapter count and titles (metadata only). Returns false with
  // *error = parse_error if the provider cannot enumerate chapters.
  bool initialize(std::optional<ErrorInfo>* error);

  // Loads the working set centered on `target` and returns the global index of
  // its first page. Throws EngineError(invalid_index) if target is outside
  // [0, total_chapters).
  int load_initial_window(ChapterIndex target);

  // nullopt when g is past the last global page. Throws for g < 0.
  std::optional<PageLocation> navigate_to_global_page(int g);

  // in_page is clamped into [0, page_count(c) - 1]. Throws for an invalid chapter.
  PageLocation navigate_to_chapter(ChapterIndex c, int in_page = 0);

  // new_count is clamped to at least 1. Returns false if the count is unchanged
  // or c is not in the working set.
  bool update_chapter_page_count(ChapterIndex c, int new_count);

  // Drops c from the working set unless it is the current chapter.
  void mark_chapter_evicted(ChapterIndex c);

  // Pure lookups: nullopt if g resolves to a chapter outside the working set.
  std::optional<ChapterContent> get_page_content(int g) const;
  std::optional<PageLocation> get_page_location(int g) const;

  // Measured count for a loaded chapter, 1 otherwise.
  int get_chapter_page_count(ChapterIndex c) const;

  int get_total_global_pages() const;
  int get_current_global_page() const;
  std::optional<int> get_global_index_for_chapter_page(ChapterIndex c, int in_page) const;

  // Reloads every chapter of the working set (page counts reset to 1 until
  // re-measured). Returns the current chapter's first global page.
  int repaginate();

  WorkingSetInfo window_info() const;
  bool is_chapter_loaded(ChapterIndex c) const;
  bool chapter_load_failed(ChapterIndex c) const;
  std::vector<std::string> chapter_titles() const;
  int total_chapters() const;
  ChapterIndex current_chapter() const;
  WindowIndex current_window() const;
  WindowIndexer indexer() const;

 private:
  struct LoadedChapter {
    ChapterIndex index;
    int page_count{1};
    ChapterContent content;
    bool load_failed{false};
  };

  void check_chapter_locked(ChapterIndex c) const;
  std::vector<ChapterIndex> target_set_locked(ChapterIndex center) const;
  void load_window_locked(ChapterIndex center, bool force_reload);
  void load_chapter_locked(ChapterIndex c);
  void rebuild_prefix_from_locked(ChapterIndex c);
  int page_count_locked(ChapterIndex c) const;
  ChapterIndex chapter_for_global_locked(int g) const;
  PageLocation location_locked(ChapterIndex c, int in_page) const;

  mutable std::mutex mu_;
  std::shared_ptr<IChapterContentProvider> provider_;
  std::string book_path_;
  PaginatorConfig config_;
  WindowIndexer indexer_;
  int total_chapters_{0};
  std::vector<std::string> titles_;
  ChapterIndex current_{0};
  std::map<ChapterIndex, LoadedChapter> loaded_;
  std::vector<int> starts_{0};
};

}  // namespace lectern
