#pragma once

// lectern/position.hpp - Reading-position restoration and position records.
//
// restore_position() is a pure decision procedure: it always navigates to the
// saved chapter, then issues exactly one of the in-page or character-offset
// callbacks depending on how far the font size moved since the save. The
// preview helpers produce the short excerpt stored with a position record and
// never fail: empty content yields the "No preview available" sentinel.
//
// This module computes records; persisting them belongs to the caller.

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "lectern/types.hpp"

namespace lectern {

enum class RestoreStrategy { in_page, character_offset };

std::string to_string(RestoreStrategy strategy);

constexpr double kDefaultFontSizeTolerance = 0.1;

// |current - saved| < tolerance -> in_page, otherwise character_offset.
RestoreStrategy choose_restore_strategy(const SavedPosition& saved, double current_font_size,
                                        double tolerance = kDefaultFontSizeTolerance);

struct RestoreCallbacks {
  std::function<void(ChapterIndex)> navigate_to_chapter;
  std::function<void(int)> navigate_to_in_page;
  std::function<void(int)> scroll_to_character_offset;
};

// Throws EngineError(invalid_config) if any callback is empty.
RestoreStrategy restore_position(const SavedPosition& saved, double current_font_size,
                                 const RestoreCallbacks& callbacks,
                                 double tolerance = kDefaultFontSizeTolerance);

// ---------------------------------------------------------------------------
// Preview extraction
// ---------------------------------------------------------------------------
inline constexpr const char* kNoPreviewAvailable = "No preview available";

struct PreviewOptions {
  int context_chars{50};
  int max_length{100};
};

// Excerpt of up to 2 * context_chars around the offset (clamped into the text),
// whitespace runs collapsed, "..." on each truncated side. Uses text, or the
// tag-stripped html when text is blank. nullopt when there is nothing to show.
std::optional<std::string> extract_preview(const ChapterContent& content, int character_offset,
                                           const PreviewOptions& options = {});

// First max_length characters, "..." appended when truncated.
std::optional<std::string> extract_preview_from_start(const ChapterContent& content,
                                                      const PreviewOptions& options = {});

// extract_preview, else extract_preview_from_start, else kNoPreviewAvailable.
std::string preview_or_placeholder(const ChapterContent& content, int character_offset,
                                   const PreviewOptions& options = {});

// Fraction of the book before the given page, in [0, 1].
double percent_complete(ChapterIndex chapter, int in_page, int chapter_page_count,
                        int total_chapters);

// ---------------------------------------------------------------------------
// PositionRecord - what an external store persists per document
// ---------------------------------------------------------------------------
struct PositionRecord {
  std::string document_key;
  ChapterIndex chapter;
  int in_page{0};
  int character_offset{0};
  std::string preview_text;
  double percent_complete{0.0};
  uint64_t timestamp_ms{0};
  double font_size{0.0};

  SavedPosition saved_position() const;
  std::string to_json() const;
};

PositionRecord make_position_record(const std::string& document_key,
                                    const PageLocation& location,
                                    const ChapterContent& content, int chapter_page_count,
                                    int total_chapters, double font_size,
                                    uint64_t timestamp_ms, const PreviewOptions& options = {});

// document_key and chapter are required; other fields default. Returns nullopt
// with *error = parse_error on malformed input.
std::optional<PositionRecord> position_record_from_json(const std::string& text,
                                                        std::optional<ErrorInfo>* error);

}  // namespace lectern
