#include "lectern/position.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

#include "lectern/content_provider.hpp"
#include "lectern/jsonlite.hpp"
#include "lectern/observability.hpp"

namespace lectern {

namespace {

bool is_blank(const std::string& s) {
  return std::all_of(s.begin(), s.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

bool is_utf8_continuation(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Moves a byte position off a UTF-8 continuation byte (forward or backward).
size_t align_forward(const std::string& s, size_t pos) {
  while (pos < s.size() && is_utf8_continuation(s[pos])) ++pos;
  return pos;
}

size_t align_backward(const std::string& s, size_t pos) {
  while (pos > 0 && pos < s.size() && is_utf8_continuation(s[pos])) --pos;
  return pos;
}

std::string collapse_whitespace(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  bool in_space = false;
  for (unsigned char c : s) {
    if (std::isspace(c)) {
      in_space = true;
      continue;
    }
    if (in_space && !out.empty()) out += ' ';
    in_space = false;
    out += static_cast<char>(c);
  }
  return out;
}

std::string plain_text(const ChapterContent& content) {
  if (!is_blank(content.text)) return content.text;
  if (content.html.empty()) return {};
  return html_to_text(content.html);
}

std::string truncate_utf8(const std::string& s, size_t max_bytes) {
  if (s.size() <= max_bytes) return s;
  return s.substr(0, align_backward(s, max_bytes));
}

}  // namespace

std::string to_string(RestoreStrategy strategy) {
  switch (strategy) {
    case RestoreStrategy::in_page: return "in_page";
    case RestoreStrategy::character_offset: return "character_offset";
  }
  return "unknown";
}

RestoreStrategy choose_restore_strategy(const SavedPosition& saved, double current_font_size,
                                        double tolerance) {
  const double delta = std::fabs(current_font_size - saved.font_size_at_save);
  return delta < tolerance ? RestoreStrategy::in_page : RestoreStrategy::character_offset;
}

RestoreStrategy restore_position(const SavedPosition& saved, double current_font_size,
                                 const RestoreCallbacks& callbacks, double tolerance) {
  if (!callbacks.navigate_to_chapter || !callbacks.navigate_to_in_page ||
      !callbacks.scroll_to_character_offset) {
    throw EngineError(ErrorCode::invalid_config, "restore_position requires all three callbacks");
  }
  const RestoreStrategy strategy = choose_restore_strategy(saved, current_font_size, tolerance);

  callbacks.navigate_to_chapter(saved.chapter);
  if (strategy == RestoreStrategy::in_page) {
    callbacks.navigate_to_in_page(saved.in_page);
  } else {
    callbacks.scroll_to_character_offset(saved.character_offset);
  }

  ReaderEvent ev;
  ev.kind = EventKind::position_restored;
  ev.chapter = saved.chapter.value;
  ev.detail = to_string(strategy);
  emit_event(ev);
  return strategy;
}

// ---------------------------------------------------------------------------
// Preview extraction
// ---------------------------------------------------------------------------

std::optional<std::string> extract_preview(const ChapterContent& content, int character_offset,
                                           const PreviewOptions& options) {
  const std::string text = plain_text(content);
  if (is_blank(text)) return std::nullopt;

  const int n = static_cast<int>(text.size());
  const int safe = std::clamp(character_offset, 0, n - 1);
  const size_t start = align_forward(text, static_cast<size_t>(std::max(safe - options.context_chars, 0)));
  const size_t end =
      align_backward(text, static_cast<size_t>(std::min(safe + options.context_chars, n)));
  if (end <= start) return std::nullopt;

  const std::string body = collapse_whitespace(text.substr(start, end - start));
  if (body.empty()) return std::nullopt;

  std::string preview;
  if (start > 0) preview += "...";
  preview += body;
  if (end < text.size()) preview += "...";
  return truncate_utf8(preview, static_cast<size_t>(options.max_length) + 6);
}

std::optional<std::string> extract_preview_from_start(const ChapterContent& content,
                                                      const PreviewOptions& options) {
  const std::string text = plain_text(content);
  if (is_blank(text)) return std::nullopt;

  const std::string head = truncate_utf8(text, static_cast<size_t>(options.max_length));
  std::string preview = collapse_whitespace(head);
  if (preview.empty()) return std::nullopt;
  if (text.size() > static_cast<size_t>(options.max_length)) preview += "...";
  return preview;
}

std::string preview_or_placeholder(const ChapterContent& content, int character_offset,
                                   const PreviewOptions& options) {
  if (auto p = extract_preview(content, character_offset, options)) return *p;
  if (auto p = extract_preview_from_start(content, options)) return *p;
  return kNoPreviewAvailable;
}

double percent_complete(ChapterIndex chapter, int in_page, int chapter_page_count,
                        int total_chapters) {
  if (total_chapters <= 0) return 0.0;
  const int pages = std::max(chapter_page_count, 1);
  const double within = static_cast<double>(std::clamp(in_page, 0, pages - 1)) / pages;
  const double p = (static_cast<double>(chapter.value) + within) / total_chapters;
  return std::clamp(p, 0.0, 1.0);
}

// ---------------------------------------------------------------------------
// PositionRecord
// ---------------------------------------------------------------------------

SavedPosition PositionRecord::saved_position() const {
  return SavedPosition{chapter, in_page, character_offset, font_size};
}

std::string PositionRecord::to_json() const {
  std::string out = "{";
  out += "\"chapter\":" + std::to_string(chapter.value);
  out += ",\"character_offset\":" + std::to_string(character_offset);
  out += ",\"document_key\":\"" + jsonlite::escape(document_key) + "\"";
  out += ",\"font_size\":" + jsonlite::format_double(font_size);
  out += ",\"in_page\":" + std::to_string(in_page);
  out += ",\"percent_complete\":" + jsonlite::format_double(percent_complete);
  out += ",\"preview_text\":\"" + jsonlite::escape(preview_text) + "\"";
  out += ",\"timestamp_ms\":" + std::to_string(timestamp_ms);
  out += "}";
  return out;
}

PositionRecord make_position_record(const std::string& document_key,
                                    const PageLocation& location,
                                    const ChapterContent& content, int chapter_page_count,
                                    int total_chapters, double font_size,
                                    uint64_t timestamp_ms, const PreviewOptions& options) {
  PositionRecord r;
  r.document_key = document_key;
  r.chapter = location.chapter;
  r.in_page = location.in_page;
  r.character_offset = location.character_offset;
  r.preview_text = preview_or_placeholder(content, location.character_offset, options);
  r.percent_complete =
      lectern::percent_complete(location.chapter, location.in_page, chapter_page_count,
                                total_chapters);
  r.timestamp_ms = timestamp_ms;
  r.font_size = font_size;
  return r;
}

std::optional<PositionRecord> position_record_from_json(const std::string& text,
                                                        std::optional<ErrorInfo>* error) {
  std::optional<jsonlite::JsonError> json_err;
  const auto obj = jsonlite::parse(text, &json_err);
  if (json_err) {
    if (error) *error = ErrorInfo{ErrorCode::parse_error, json_err->code + ": " + json_err->message};
    return std::nullopt;
  }
  const std::string key = jsonlite::get_string(obj, "document_key", "");
  constexpr unsigned long long kMissing = ~0ULL;
  const unsigned long long chapter = jsonlite::get_u64(obj, "chapter", kMissing);
  if (key.empty() || chapter == kMissing || chapter > 1000000000ULL) {
    if (error) {
      *error = ErrorInfo{ErrorCode::parse_error,
                         "position record needs document_key and a non-negative chapter"};
    }
    return std::nullopt;
  }

  PositionRecord r;
  r.document_key = key;
  r.chapter = ChapterIndex{static_cast<int>(chapter)};
  r.in_page = static_cast<int>(std::min(jsonlite::get_u64(obj, "in_page", 0), 1000000000ULL));
  r.character_offset =
      static_cast<int>(std::min(jsonlite::get_u64(obj, "character_offset", 0), 2000000000ULL));
  r.preview_text = jsonlite::get_string(obj, "preview_text", "");
  r.percent_complete = jsonlite::get_double(obj, "percent_complete", 0.0);
  r.timestamp_ms = jsonlite::get_u64(obj, "timestamp_ms", 0);
  r.font_size = jsonlite::get_double(obj, "font_size", 0.0);
  return r;
}

}  // namespace lectern
