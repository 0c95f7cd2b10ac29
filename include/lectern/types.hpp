#pragma once

// lectern/types.hpp - Core value types for the lectern windowing engine.
//
// INDEX SPACES:
//   Two integer index spaces coexist at runtime: chapters (content residency in the
//   paginator) and windows (prefetch units in the conveyor). They are deliberately
//   separate types. Neither converts implicitly to the other or to int; crossing
//   between them goes through WindowIndexer.
//
// ERROR MODEL:
//   - invalid_index / invalid_config: programmer errors, thrown as EngineError.
//   - not_loaded: expected during window transitions, surfaced as std::optional.
//   - parse_error: content provider failure, reported via ErrorInfo out-params and
//     isolated to the chapter that failed.
//
// MEMORY OWNERSHIP:
//   All types here are value types. Content strings are owned, never borrowed.

#include <compare>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace lectern {

enum class ErrorCode {
  none,
  invalid_index,
  invalid_config,
  not_loaded,
  parse_error,
};

std::string to_string(ErrorCode code);

struct ErrorInfo {
  ErrorCode code{ErrorCode::none};
  std::string message;
};

// Thrown for fail-fast conditions only (invalid_index, invalid_config).
class EngineError : public std::runtime_error {
 public:
  EngineError(ErrorCode code, const std::string& message);
  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

// ---------------------------------------------------------------------------
// Strong index types
// ---------------------------------------------------------------------------
struct ChapterIndex {
  int value{0};

  constexpr ChapterIndex() = default;
  constexpr explicit ChapterIndex(int v) : value(v) {}

  constexpr ChapterIndex next() const { return ChapterIndex{value + 1}; }
  constexpr ChapterIndex prev() const { return ChapterIndex{value - 1}; }

  friend constexpr bool operator==(ChapterIndex, ChapterIndex) = default;
  friend constexpr auto operator<=>(ChapterIndex, ChapterIndex) = default;
};

struct WindowIndex {
  int value{0};

  constexpr WindowIndex() = default;
  constexpr explicit WindowIndex(int v) : value(v) {}

  constexpr WindowIndex next() const { return WindowIndex{value + 1}; }
  constexpr WindowIndex prev() const { return WindowIndex{value - 1}; }

  friend constexpr bool operator==(WindowIndex, WindowIndex) = default;
  friend constexpr auto operator<=>(WindowIndex, WindowIndex) = default;
};

// ---------------------------------------------------------------------------
// ChapterRange - the chapters covered by one window (derived, never stored)
// ---------------------------------------------------------------------------
struct ChapterRange {
  WindowIndex window;
  ChapterIndex first;
  ChapterIndex last;

  int chapter_count() const { return last.value - first.value + 1; }
  bool contains(ChapterIndex c) const { return c >= first && c <= last; }
};

// ---------------------------------------------------------------------------
// Content exchanged with the chapter content provider
// ---------------------------------------------------------------------------
struct ChapterContent {
  std::string text;
  std::string html;  // Empty when the source has no markup.

  bool empty() const { return text.empty() && html.empty(); }
};

// Spine classification. Cover, navigation and non-linear chapters are hidden
// from the reader-facing chapter list unless asked for.
enum class ChapterKind {
  content,
  front_matter,
  cover,
  nav,
  non_linear,
};

std::string to_string(ChapterKind kind);

struct TocEntry {
  std::string title;
  ChapterIndex chapter;
  int level{0};
  ChapterKind kind{ChapterKind::content};
};

// ---------------------------------------------------------------------------
// PageLocation - produced on demand by the paginator, never persisted here.
// ---------------------------------------------------------------------------
struct PageLocation {
  int global_page{0};
  ChapterIndex chapter;
  int in_page{0};
  int character_offset{0};

  friend bool operator==(const PageLocation&, const PageLocation&) = default;
};

// ---------------------------------------------------------------------------
// WindowData - a materialized window as produced by the assembler.
// ---------------------------------------------------------------------------
struct WindowData {
  WindowIndex window;
  ChapterIndex first_chapter;
  ChapterIndex last_chapter;
  std::string html;
  std::string content_digest;  // BLAKE3 of html; empty when not computed.

  int chapter_count() const { return last_chapter.value - first_chapter.value + 1; }
  bool contains_chapter(ChapterIndex c) const {
    return c >= first_chapter && c <= last_chapter;
  }
};

// ---------------------------------------------------------------------------
// SavedPosition - created externally, consumed once by position restoration.
// ---------------------------------------------------------------------------
struct SavedPosition {
  ChapterIndex chapter;
  int in_page{0};
  int character_offset{0};
  double font_size_at_save{0.0};
};

}  // namespace lectern
