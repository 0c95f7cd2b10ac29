#include "lectern/assembler.hpp"

#include "lectern/hash.hpp"

namespace lectern {

ProviderWindowAssembler::ProviderWindowAssembler(
    std::shared_ptr<IChapterContentProvider> provider, std::string book_path,
    int total_chapters)
    : provider_(std::move(provider)),
      book_path_(std::move(book_path)),
      total_chapters_(total_chapters) {}

bool ProviderWindowAssembler::can_assemble(WindowIndex window, ChapterIndex first,
                                           ChapterIndex last) const {
  if (window.value < 0) return false;
  if (first.value < 0 || last < first) return false;
  return last.value < total_chapters_;
}

std::optional<WindowData> ProviderWindowAssembler::assemble_window(WindowIndex window,
                                                                   ChapterIndex first,
                                                                   ChapterIndex last) {
  if (!can_assemble(window, first, last)) return std::nullopt;

  const std::string w = std::to_string(window.value);
  std::string html;
  html.reserve(4096);
  html += "<div id=\"window-root\" data-window-index=\"" + w + "\">\n";
  for (ChapterIndex c = first; c <= last; c = c.next()) {
    const std::string ci = std::to_string(c.value);
    std::optional<ErrorInfo> err;
    auto content = provider_->chapter_content(book_path_, c, &err);
    if (content) {
      html += "<section id=\"chapter-" + ci + "\" data-chapter-index=\"" + ci +
              "\" class=\"chapter-section\">\n";
      html += content->html.empty() ? text_to_html(content->text) : content->html;
    } else {
      html += "<section id=\"chapter-" + ci + "\" data-chapter-index=\"" + ci +
              "\" class=\"chapter-section chapter-unavailable\">\n";
      html += "<p>Chapter " + std::to_string(c.value + 1) + " is unavailable";
      if (err) html += ": " + escape_html(err->message);
      html += "</p>";
    }
    html += "\n</section>\n";
  }
  html += "</div>\n";

  WindowData data;
  data.window = window;
  data.first_chapter = first;
  data.last_chapter = last;
  data.content_digest = window_content_digest(html);
  data.html = std::move(html);
  return data;
}

}  // namespace lectern
