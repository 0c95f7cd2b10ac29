#include "lectern/paginator.hpp"

#include <algorithm>

#include "lectern/observability.hpp"

namespace lectern {

namespace {

ChapterContent placeholder_content(ChapterIndex c, const std::string& reason) {
  ChapterContent content;
  content.text = "Chapter " + std::to_string(c.value + 1) + " could not be loaded.";
  content.html = "<p class=\"chapter-unavailable\">" + escape_html(content.text) + "</p>";
  if (!reason.empty()) {
    content.html += "<!-- " + escape_html(reason) + " -->";
  }
  return content;
}

}  // namespace

std::string WorkingSetInfo::to_json() const {
  std::string out = "{\"current_chapter\":" + std::to_string(current_chapter.value);
  out += ",\"loaded_chapters\":[";
  for (size_t i = 0; i < loaded_chapters.size(); ++i) {
    if (i) out += ",";
    out += std::to_string(loaded_chapters[i].value);
  }
  out += "],\"total_chapters\":" + std::to_string(total_chapters);
  out += ",\"total_global_pages\":" + std::to_string(total_global_pages);
  out += "}";
  return out;
}

WorkingSetPaginator::WorkingSetPaginator(std::shared_ptr<IChapterContentProvider> provider,
                                         std::string book_path, PaginatorConfig config)
    : provider_(std::move(provider)),
      book_path_(std::move(book_path)),
      config_(config),
      indexer_(0, config.chapters_per_window) {
  if (config_.working_set_radius < 0 || config_.working_set_radius > kMaxWorkingSetRadius) {
    throw EngineError(ErrorCode::invalid_config,
                      "working_set_radius must be within [0, " +
                          std::to_string(kMaxWorkingSetRadius) + "], got " +
                          std::to_string(config_.working_set_radius));
  }
  if (!provider_) {
    throw EngineError(ErrorCode::invalid_config, "content provider is required");
  }
}

bool WorkingSetPaginator::initialize(std::optional<ErrorInfo>* error) {
  std::lock_guard<std::mutex> lk(mu_);
  std::optional<ErrorInfo> err;
  auto count = provider_->chapter_count(book_path_, &err);
  if (!count || *count < 0) {
    if (error) {
      *error = ErrorInfo{ErrorCode::parse_error,
                         err ? err->message : "cannot enumerate chapters of " + book_path_};
    }
    return false;
  }

  total_chapters_ = *count;
  indexer_ = WindowIndexer(total_chapters_, config_.chapters_per_window);

  titles_.assign(static_cast<size_t>(total_chapters_), std::string());
  std::optional<ErrorInfo> toc_err;
  for (const auto& entry : provider_->table_of_contents(book_path_, &toc_err)) {
    if (entry.chapter.value >= 0 && entry.chapter.value < total_chapters_ &&
        titles_[static_cast<size_t>(entry.chapter.value)].empty()) {
      titles_[static_cast<size_t>(entry.chapter.value)] = entry.title;
    }
  }
  for (size_t i = 0; i < titles_.size(); ++i) {
    if (titles_[i].empty()) titles_[i] = "Chapter " + std::to_string(i + 1);
  }

  loaded_.clear();
  current_ = ChapterIndex{0};
  starts_.assign(static_cast<size_t>(total_chapters_) + 1, 0);
  rebuild_prefix_from_locked(ChapterIndex{0});
  return true;
}

int WorkingSetPaginator::load_initial_window(ChapterIndex target) {
  std::lock_guard<std::mutex> lk(mu_);
  check_chapter_locked(target);
  current_ = target;
  load_window_locked(target, false);
  return starts_[static_cast<size_t>(target.value)];
}

std::optional<PageLocation> WorkingSetPaginator::navigate_to_global_page(int g) {
  std::lock_guard<std::mutex> lk(mu_);
  if (g < 0) {
    throw EngineError(ErrorCode::invalid_index,
                      "global page must not be negative, got " + std::to_string(g));
  }
  if (g >= starts_.back()) return std::nullopt;

  const ChapterIndex c = chapter_for_global_locked(g);
  const int in_page = g - starts_[static_cast<size_t>(c.value)];
  if (c != current_ || !loaded_.contains(c)) {
    current_ = c;
    load_window_locked(c, false);
  }
  // The re-center may have changed c's page count and start offset.
  return location_locked(c, std::clamp(in_page, 0, page_count_locked(c) - 1));
}

PageLocation WorkingSetPaginator::navigate_to_chapter(ChapterIndex c, int in_page) {
  std::lock_guard<std::mutex> lk(mu_);
  check_chapter_locked(c);
  if (c != current_ || !loaded_.contains(c)) {
    current_ = c;
    load_window_locked(c, false);
  }
  return location_locked(c, std::clamp(in_page, 0, page_count_locked(c) - 1));
}

bool WorkingSetPaginator::update_chapter_page_count(ChapterIndex c, int new_count) {
  std::lock_guard<std::mutex> lk(mu_);
  check_chapter_locked(c);
  auto it = loaded_.find(c);
  if (it == loaded_.end()) return false;
  const int safe_count = std::max(new_count, 1);
  if (it->second.page_count == safe_count) return false;

  const int old_count = it->second.page_count;
  it->second.page_count = safe_count;
  rebuild_prefix_from_locked(c);

  ReaderEvent ev;
  ev.kind = EventKind::page_count_updated;
  ev.chapter = c.value;
  ev.detail = std::to_string(old_count) + "->" + std::to_string(safe_count);
  emit_event(ev);
  return true;
}

void WorkingSetPaginator::mark_chapter_evicted(ChapterIndex c) {
  std::lock_guard<std::mutex> lk(mu_);
  check_chapter_locked(c);
  if (c == current_) return;
  if (loaded_.erase(c) == 0) return;
  rebuild_prefix_from_locked(c);

  ReaderEvent ev;
  ev.kind = EventKind::chapter_evicted;
  ev.chapter = c.value;
  ev.detail = "external";
  emit_event(ev);
}

std::optional<ChapterContent> WorkingSetPaginator::get_page_content(int g) const {
  std::lock_guard<std::mutex> lk(mu_);
  if (g < 0) {
    throw EngineError(ErrorCode::invalid_index,
                      "global page must not be negative, got " + std::to_string(g));
  }
  if (g >= starts_.back()) return std::nullopt;
  auto it = loaded_.find(chapter_for_global_locked(g));
  if (it == loaded_.end()) return std::nullopt;
  return it->second.content;
}

std::optional<PageLocation> WorkingSetPaginator::get_page_location(int g) const {
  std::lock_guard<std::mutex> lk(mu_);
  if (g < 0) {
    throw EngineError(ErrorCode::invalid_index,
                      "global page must not be negative, got " + std::to_string(g));
  }
  if (g >= starts_.back()) return std::nullopt;
  const ChapterIndex c = chapter_for_global_locked(g);
  if (!loaded_.contains(c)) return std::nullopt;
  return location_locked(c, g - starts_[static_cast<size_t>(c.value)]);
}

int WorkingSetPaginator::get_chapter_page_count(ChapterIndex c) const {
  std::lock_guard<std::mutex> lk(mu_);
  check_chapter_locked(c);
  return page_count_locked(c);
}

int WorkingSetPaginator::get_total_global_pages() const {
  std::lock_guard<std::mutex> lk(mu_);
  return starts_.back();
}

int WorkingSetPaginator::get_current_global_page() const {
  std::lock_guard<std::mutex> lk(mu_);
  if (total_chapters_ == 0) return 0;
  return starts_[static_cast<size_t>(current_.value)];
}

std::optional<int> WorkingSetPaginator::get_global_index_for_chapter_page(ChapterIndex c,
                                                                          int in_page) const {
  std::lock_guard<std::mutex> lk(mu_);
  check_chapter_locked(c);
  if (!loaded_.contains(c)) return std::nullopt;
  return starts_[static_cast<size_t>(c.value)] +
         std::clamp(in_page, 0, page_count_locked(c) - 1);
}

int WorkingSetPaginator::repaginate() {
  std::lock_guard<std::mutex> lk(mu_);
  if (total_chapters_ == 0) return 0;
  load_window_locked(current_, true);
  return starts_[static_cast<size_t>(current_.value)];
}

WorkingSetInfo WorkingSetPaginator::window_info() const {
  std::lock_guard<std::mutex> lk(mu_);
  WorkingSetInfo info;
  info.current_chapter = current_;
  info.loaded_chapters.reserve(loaded_.size());
  for (const auto& [index, chapter] : loaded_) info.loaded_chapters.push_back(index);
  info.total_chapters = total_chapters_;
  info.total_global_pages = starts_.back();
  return info;
}

bool WorkingSetPaginator::is_chapter_loaded(ChapterIndex c) const {
  std::lock_guard<std::mutex> lk(mu_);
  return loaded_.contains(c);
}

bool WorkingSetPaginator::chapter_load_failed(ChapterIndex c) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = loaded_.find(c);
  return it != loaded_.end() && it->second.load_failed;
}

std::vector<std::string> WorkingSetPaginator::chapter_titles() const {
  std::lock_guard<std::mutex> lk(mu_);
  return titles_;
}

int WorkingSetPaginator::total_chapters() const {
  std::lock_guard<std::mutex> lk(mu_);
  return total_chapters_;
}

ChapterIndex WorkingSetPaginator::current_chapter() const {
  std::lock_guard<std::mutex> lk(mu_);
  return current_;
}

WindowIndex WorkingSetPaginator::current_window() const {
  std::lock_guard<std::mutex> lk(mu_);
  return indexer_.window_for_chapter(current_);
}

WindowIndexer WorkingSetPaginator::indexer() const {
  std::lock_guard<std::mutex> lk(mu_);
  return indexer_;
}

// ---------------------------------------------------------------------------
// Internals (mu_ held)
// ---------------------------------------------------------------------------

void WorkingSetPaginator::check_chapter_locked(ChapterIndex c) const {
  if (c.value < 0 || c.value >= total_chapters_) {
    throw EngineError(ErrorCode::invalid_index,
                      "chapter " + std::to_string(c.value) + " outside [0, " +
                          std::to_string(total_chapters_) + ")");
  }
}

std::vector<ChapterIndex> WorkingSetPaginator::target_set_locked(ChapterIndex center) const {
  std::vector<ChapterIndex> out;
  if (total_chapters_ == 0) return out;
  const int width = 2 * config_.working_set_radius + 1;
  const int max_width = std::min(width, total_chapters_);
  int start = std::max(center.value - config_.working_set_radius, 0);
  const int end = std::min(start + max_width - 1, total_chapters_ - 1);
  start = std::max(end - max_width + 1, 0);
  out.reserve(static_cast<size_t>(end - start + 1));
  for (int c = start; c <= end; ++c) out.emplace_back(c);
  return out;
}

void WorkingSetPaginator::load_window_locked(ChapterIndex center, bool force_reload) {
  const auto target = target_set_locked(center);
  if (target.empty()) return;

  for (auto it = loaded_.begin(); it != loaded_.end();) {
    if (it->first < target.front() || it->first > target.back()) {
      ReaderEvent ev;
      ev.kind = EventKind::chapter_evicted;
      ev.chapter = it->first.value;
      ev.detail = "recenter";
      emit_event(ev);
      it = loaded_.erase(it);
    } else {
      ++it;
    }
  }

  for (ChapterIndex c : target) {
    auto it = loaded_.find(c);
    if (it == loaded_.end() || force_reload || it->second.load_failed) {
      load_chapter_locked(c);
    }
  }
  rebuild_prefix_from_locked(ChapterIndex{0});
}

void WorkingSetPaginator::load_chapter_locked(ChapterIndex c) {
  std::optional<ErrorInfo> err;
  std::optional<ChapterContent> content;
  uint64_t duration_ns = 0;
  {
    ScopeTimer timer(duration_ns);
    content = provider_->chapter_content(book_path_, c, &err);
  }

  ReaderEvent ev;
  ev.chapter = c.value;
  ev.duration_ns = duration_ns;
  if (content) {
    loaded_[c] = LoadedChapter{c, 1, std::move(*content), false};
    ev.kind = EventKind::chapter_loaded;
  } else {
    // Isolate the failure to this chapter: keep a visible one-page placeholder.
    const std::string reason = err ? err->message : "provider returned no content";
    loaded_[c] = LoadedChapter{c, 1, placeholder_content(c, reason), true};
    ev.kind = EventKind::chapter_load_failed;
    ev.ok = false;
    ev.detail = reason;
  }
  emit_event(ev);
}

void WorkingSetPaginator::rebuild_prefix_from_locked(ChapterIndex c) {
  starts_.resize(static_cast<size_t>(total_chapters_) + 1);
  starts_[0] = 0;
  for (int i = std::max(c.value, 0); i < total_chapters_; ++i) {
    starts_[static_cast<size_t>(i) + 1] =
        starts_[static_cast<size_t>(i)] + page_count_locked(ChapterIndex{i});
  }
}

int WorkingSetPaginator::page_count_locked(ChapterIndex c) const {
  auto it = loaded_.find(c);
  return it == loaded_.end() ? 1 : it->second.page_count;
}

ChapterIndex WorkingSetPaginator::chapter_for_global_locked(int g) const {
  // starts_ is strictly increasing (every chapter has >= 1 page).
  auto it = std::upper_bound(starts_.begin(), starts_.end(), g);
  return ChapterIndex{static_cast<int>(it - starts_.begin()) - 1};
}

PageLocation WorkingSetPaginator::location_locked(ChapterIndex c, int in_page) const {
  PageLocation loc;
  loc.chapter = c;
  loc.in_page = in_page;
  loc.global_page = starts_[static_cast<size_t>(c.value)] + in_page;
  // Offset estimate assuming evenly filled pages; the rendering surface refines it.
  auto it = loaded_.find(c);
  if (it != loaded_.end() && it->second.page_count > 0) {
    const long long len = static_cast<long long>(it->second.content.text.size());
    loc.character_offset = static_cast<int>(len * in_page / it->second.page_count);
  }
  return loc;
}

}  // namespace lectern
