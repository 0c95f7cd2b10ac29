#include "lectern/chapter_map.hpp"

#include <utility>

namespace lectern {

namespace {

bool visible_kind(ChapterKind kind, bool include_non_linear) {
  switch (kind) {
    case ChapterKind::content:
    case ChapterKind::front_matter: return true;
    case ChapterKind::cover:
    case ChapterKind::nav: return false;
    case ChapterKind::non_linear: return include_non_linear;
  }
  return true;
}

int count_visible(const std::vector<ChapterKind>& kinds, bool include_non_linear) {
  int n = 0;
  for (ChapterKind k : kinds) {
    if (visible_kind(k, include_non_linear)) ++n;
  }
  return n;
}

}  // namespace

ChapterMap::ChapterMap(std::vector<ChapterKind> kinds, int chapters_per_window,
                       bool include_non_linear)
    : kinds_(std::move(kinds)),
      visible_indexer_(count_visible(kinds_, include_non_linear), chapters_per_window),
      spine_indexer_(static_cast<int>(kinds_.size()), chapters_per_window) {
  ui_of_spine_.assign(kinds_.size(), -1);
  visible_.reserve(static_cast<size_t>(visible_indexer_.total_chapters()));
  for (size_t i = 0; i < kinds_.size(); ++i) {
    if (!visible_kind(kinds_[i], include_non_linear)) continue;
    ui_of_spine_[i] = static_cast<int>(visible_.size());
    visible_.emplace_back(static_cast<int>(i));
  }
}

ChapterMap ChapterMap::from_toc(int spine_count, const std::vector<TocEntry>& toc,
                                int chapters_per_window, bool include_non_linear) {
  if (spine_count < 0) {
    throw EngineError(ErrorCode::invalid_config,
                      "spine_count must not be negative, got " + std::to_string(spine_count));
  }
  std::vector<ChapterKind> kinds(static_cast<size_t>(spine_count), ChapterKind::content);
  std::vector<bool> seen(kinds.size(), false);
  for (const TocEntry& e : toc) {
    if (e.chapter.value < 0 || e.chapter.value >= spine_count) continue;
    const auto i = static_cast<size_t>(e.chapter.value);
    if (seen[i]) continue;
    seen[i] = true;
    kinds[i] = e.kind;
  }
  return ChapterMap(std::move(kinds), chapters_per_window, include_non_linear);
}

std::optional<ChapterIndex> ChapterMap::ui_to_spine(int ui_index) const {
  if (ui_index < 0 || ui_index >= visible_count()) return std::nullopt;
  return visible_[static_cast<size_t>(ui_index)];
}

std::optional<int> ChapterMap::spine_to_ui(ChapterIndex spine) const {
  if (spine.value < 0 || spine.value >= spine_count()) return std::nullopt;
  const int ui = ui_of_spine_[static_cast<size_t>(spine.value)];
  if (ui < 0) return std::nullopt;
  return ui;
}

ChapterKind ChapterMap::kind(ChapterIndex spine) const {
  if (spine.value < 0 || spine.value >= spine_count()) {
    throw EngineError(ErrorCode::invalid_index,
                      "spine chapter " + std::to_string(spine.value) + " out of range");
  }
  return kinds_[static_cast<size_t>(spine.value)];
}

std::optional<WindowIndex> ChapterMap::window_for_spine_chapter(ChapterIndex spine) const {
  const auto ui = spine_to_ui(spine);
  if (!ui) return std::nullopt;
  return visible_indexer_.window_for_chapter(ChapterIndex{*ui});
}

std::vector<ChapterIndex> ChapterMap::spine_chapters_for_window(WindowIndex w) const {
  std::vector<ChapterIndex> out;
  if (!visible_indexer_.is_valid_window(w)) return out;
  const ChapterRange r = visible_indexer_.chapter_range_for_window(w);
  out.reserve(static_cast<size_t>(r.chapter_count()));
  for (int ui = r.first.value; ui <= r.last.value; ++ui) {
    out.push_back(visible_[static_cast<size_t>(ui)]);
  }
  return out;
}

std::map<ChapterKind, int> ChapterMap::kind_counts() const {
  std::map<ChapterKind, int> counts;
  for (ChapterKind k : kinds_) ++counts[k];
  return counts;
}

std::string ChapterMap::debug_info() const {
  std::string out = "spine=" + std::to_string(spine_count());
  out += " visible=" + std::to_string(visible_count());
  out += " windows=" + std::to_string(window_count());
  out += " spine_windows=" + std::to_string(window_count_for_spine());
  const auto counts = kind_counts();
  for (ChapterKind k : {ChapterKind::content, ChapterKind::cover, ChapterKind::nav,
                        ChapterKind::front_matter, ChapterKind::non_linear}) {
    auto it = counts.find(k);
    out += " " + to_string(k) + "=" + std::to_string(it == counts.end() ? 0 : it->second);
  }
  out += " map=" + visible_indexer_.debug_window_map();
  return out;
}

}  // namespace lectern
