#pragma once

// lectern/content_provider.hpp - Chapter content source consumed by the
// paginator and the window assembler.
//
// CONTRACT:
//   - Every call may fail; failures are reported through the ErrorInfo
//     out-parameter (parse_error for unreadable content, invalid_index for a
//     chapter outside [0, chapter_count)). Nothing here throws.
//   - Implementations must tolerate concurrent calls: the paginator and the
//     conveyor's materialization worker read content from different threads.
//
// EXTENSION_POINT: format_providers
//   DirectoryContentProvider treats a directory of .html/.htm/.xhtml/.txt files
//   as a book, one chapter per file. Container formats (EPUB, FB2) plug in as
//   further IChapterContentProvider implementations.

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lectern/types.hpp"

namespace lectern {

class IChapterContentProvider {
 public:
  virtual ~IChapterContentProvider() = default;

  virtual bool can_handle(const std::string& path) = 0;
  virtual std::optional<int> chapter_count(const std::string& path,
                                           std::optional<ErrorInfo>* error) = 0;
  virtual std::optional<ChapterContent> chapter_content(const std::string& path,
                                                        ChapterIndex index,
                                                        std::optional<ErrorInfo>* error) = 0;
  virtual std::vector<TocEntry> table_of_contents(const std::string& path,
                                                  std::optional<ErrorInfo>* error) = 0;
};

class DirectoryContentProvider : public IChapterContentProvider {
 public:
  bool can_handle(const std::string& path) override;
  std::optional<int> chapter_count(const std::string& path,
                                   std::optional<ErrorInfo>* error) override;
  std::optional<ChapterContent> chapter_content(const std::string& path, ChapterIndex index,
                                                std::optional<ErrorInfo>* error) override;
  std::vector<TocEntry> table_of_contents(const std::string& path,
                                          std::optional<ErrorInfo>* error) override;

  // Chapter files of a directory book in chapter order (lexicographic by name).
  static std::vector<std::string> chapter_files(const std::string& dir);

 private:
  // Cached file listing per book path. Returns nullopt if `path` is not a directory.
  std::optional<std::vector<std::string>> files_for(const std::string& path);

  std::mutex mu_;
  std::map<std::string, std::vector<std::string>> listing_cache_;
};

// ---------------------------------------------------------------------------
// Markup helpers shared with the assembler and preview extraction
// ---------------------------------------------------------------------------

// Drops tags (and <script>/<style> bodies), decodes the common named and numeric
// entities, and turns block boundaries into newlines.
std::string html_to_text(std::string_view html);

// Escapes &, <, >, " for safe embedding in markup.
std::string escape_html(std::string_view text);

// Plain text -> one <p> per blank-line separated paragraph.
std::string text_to_html(std::string_view text);

// <title>, else first <h1>, else empty.
std::string extract_html_title(std::string_view html);

// Spine kind of a chapter file from its name (extension already stripped).
// Leading numbering is ignored; unrecognised names are content.
ChapterKind classify_chapter_name(std::string_view stem);

}  // namespace lectern
