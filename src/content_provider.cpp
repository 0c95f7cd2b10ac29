#include "lectern/content_provider.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace lectern {

namespace fs = std::filesystem;

namespace {

std::string lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool is_html_extension(const std::string& ext) {
  return ext == ".html" || ext == ".htm" || ext == ".xhtml";
}

bool is_chapter_extension(const std::string& ext) {
  return is_html_extension(ext) || ext == ".txt";
}

std::optional<std::string> read_file(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return std::nullopt;
  std::string data((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  if (ifs.bad()) return std::nullopt;
  return data;
}

std::string trim(std::string_view s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return std::string(s.substr(b, e - b));
}

// Inner markup of <body>, or the whole document when there is no body element.
std::string body_of(const std::string& html) {
  const std::string lc = lower(html);
  const size_t open = lc.find("<body");
  if (open == std::string::npos) return html;
  const size_t open_end = lc.find('>', open);
  if (open_end == std::string::npos) return html;
  const size_t close = lc.find("</body", open_end);
  return html.substr(open_end + 1,
                     (close == std::string::npos ? html.size() : close) - open_end - 1);
}

std::string first_nonempty_line(std::string_view text) {
  std::istringstream in{std::string(text)};
  std::string line;
  while (std::getline(in, line)) {
    std::string t = trim(line);
    if (!t.empty()) return t;
  }
  return {};
}

void append_utf8(std::string& out, unsigned long cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

// Decodes the entity starting at html[i] == '&'. On success appends the decoded
// text and returns the index after ';'. Otherwise appends '&' and returns i + 1.
size_t decode_entity(std::string_view html, size_t i, std::string& out) {
  const size_t semi = html.find(';', i);
  if (semi == std::string_view::npos || semi - i > 10) {
    out += '&';
    return i + 1;
  }
  const std::string_view name = html.substr(i + 1, semi - i - 1);
  static const std::array<std::pair<std::string_view, std::string_view>, 6> kNamed{{
      {"amp", "&"}, {"lt", "<"}, {"gt", ">"}, {"quot", "\""}, {"apos", "'"}, {"nbsp", " "},
  }};
  for (const auto& [n, v] : kNamed) {
    if (name == n) {
      out += v;
      return semi + 1;
    }
  }
  if (name.size() > 1 && name[0] == '#') {
    const bool hex = name[1] == 'x' || name[1] == 'X';
    const std::string digits(name.substr(hex ? 2 : 1));
    if (!digits.empty()) {
      char* end = nullptr;
      const unsigned long cp = std::strtoul(digits.c_str(), &end, hex ? 16 : 10);
      if (end && *end == '\0' && cp > 0 && cp <= 0x10FFFF) {
        append_utf8(out, cp);
        return semi + 1;
      }
    }
  }
  out += '&';
  return i + 1;
}

bool is_block_tag(const std::string& name) {
  static const std::array<std::string_view, 16> kBlock{
      "p", "br", "div", "li", "ul", "ol", "h1", "h2", "h3", "h4", "h5", "h6",
      "tr", "blockquote", "section", "hr"};
  return std::find(kBlock.begin(), kBlock.end(), name) != kBlock.end();
}

}  // namespace

// ---------------------------------------------------------------------------
// Markup helpers
// ---------------------------------------------------------------------------

std::string html_to_text(std::string_view html) {
  std::string out;
  out.reserve(html.size());
  size_t i = 0;
  while (i < html.size()) {
    const char c = html[i];
    if (c == '&') {
      i = decode_entity(html, i, out);
      continue;
    }
    if (c != '<') {
      out += c;
      ++i;
      continue;
    }
    const size_t close = html.find('>', i);
    if (close == std::string_view::npos) break;  // unterminated tag: drop the tail
    std::string_view tag = html.substr(i + 1, close - i - 1);
    const bool closing = !tag.empty() && tag[0] == '/';
    if (closing) tag.remove_prefix(1);
    size_t name_len = 0;
    while (name_len < tag.size() && std::isalnum(static_cast<unsigned char>(tag[name_len]))) {
      ++name_len;
    }
    const std::string name = lower(tag.substr(0, name_len));
    i = close + 1;

    if (!closing && (name == "script" || name == "style")) {
      const std::string lc = lower(html.substr(i));
      const size_t end_tag = lc.find("</" + name);
      if (end_tag == std::string::npos) break;
      const size_t end_close = html.find('>', i + end_tag);
      i = (end_close == std::string_view::npos) ? html.size() : end_close + 1;
      continue;
    }
    if (is_block_tag(name)) out += '\n';
  }
  return out;
}

std::string escape_html(std::string_view text) {
  std::string out;
  out.reserve(text.size() + text.size() / 8);
  for (char c : text) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      default: out += c;
    }
  }
  return out;
}

std::string text_to_html(std::string_view text) {
  std::string out;
  std::string paragraph;
  auto flush = [&] {
    const std::string t = trim(paragraph);
    if (!t.empty()) out += "<p>" + escape_html(t) + "</p>\n";
    paragraph.clear();
  };
  std::istringstream in{std::string(text)};
  std::string line;
  while (std::getline(in, line)) {
    if (trim(line).empty()) {
      flush();
    } else {
      if (!paragraph.empty()) paragraph += ' ';
      paragraph += line;
    }
  }
  flush();
  return out;
}

std::string extract_html_title(std::string_view html) {
  const std::string lc = lower(html);
  for (const char* tag : {"title", "h1"}) {
    const std::string open = std::string("<") + tag;
    size_t pos = lc.find(open);
    // Skip prefixes of longer tag names ("<h1x", "<titlebar").
    while (pos != std::string::npos) {
      const char after = pos + open.size() < lc.size() ? lc[pos + open.size()] : '\0';
      if (after == '>' || std::isspace(static_cast<unsigned char>(after))) break;
      pos = lc.find(open, pos + 1);
    }
    if (pos == std::string::npos) continue;
    const size_t start = lc.find('>', pos);
    if (start == std::string::npos) continue;
    const size_t end = lc.find(std::string("</") + tag, start);
    if (end == std::string::npos) continue;
    std::string title = trim(html_to_text(html.substr(start + 1, end - start - 1)));
    if (!title.empty()) return title;
  }
  return {};
}

// ---------------------------------------------------------------------------
// DirectoryContentProvider
// ---------------------------------------------------------------------------

std::vector<std::string> DirectoryContentProvider::chapter_files(const std::string& dir) {
  std::vector<std::string> files;
  std::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file(ec)) continue;
    if (is_chapter_extension(lower(it->path().extension().string()))) {
      files.push_back(it->path().string());
    }
  }
  // directory_iterator order is filesystem-dependent; chapter order must not be.
  std::sort(files.begin(), files.end());
  return files;
}

std::optional<std::vector<std::string>> DirectoryContentProvider::files_for(
    const std::string& path) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = listing_cache_.find(path);
  if (it != listing_cache_.end()) return it->second;
  std::error_code ec;
  if (!fs::is_directory(path, ec)) return std::nullopt;
  auto files = chapter_files(path);
  listing_cache_[path] = files;
  return files;
}

bool DirectoryContentProvider::can_handle(const std::string& path) {
  auto files = files_for(path);
  return files && !files->empty();
}

std::optional<int> DirectoryContentProvider::chapter_count(const std::string& path,
                                                           std::optional<ErrorInfo>* error) {
  auto files = files_for(path);
  if (!files) {
    if (error) *error = ErrorInfo{ErrorCode::parse_error, "not a book directory: " + path};
    return std::nullopt;
  }
  return static_cast<int>(files->size());
}

std::optional<ChapterContent> DirectoryContentProvider::chapter_content(
    const std::string& path, ChapterIndex index, std::optional<ErrorInfo>* error) {
  auto files = files_for(path);
  if (!files) {
    if (error) *error = ErrorInfo{ErrorCode::parse_error, "not a book directory: " + path};
    return std::nullopt;
  }
  if (index.value < 0 || index.value >= static_cast<int>(files->size())) {
    if (error) {
      *error = ErrorInfo{ErrorCode::invalid_index,
                         "chapter " + std::to_string(index.value) + " out of range"};
    }
    return std::nullopt;
  }
  const std::string& file = (*files)[static_cast<size_t>(index.value)];
  auto data = read_file(file);
  if (!data) {
    if (error) *error = ErrorInfo{ErrorCode::parse_error, "cannot read " + file};
    return std::nullopt;
  }

  ChapterContent content;
  if (is_html_extension(lower(fs::path(file).extension().string()))) {
    content.html = body_of(*data);
    content.text = html_to_text(content.html);
  } else {
    content.text = std::move(*data);
    content.html = text_to_html(content.text);
  }
  return content;
}

ChapterKind classify_chapter_name(std::string_view stem) {
  // "03_Cover", "00-nav" and "cover" classify alike.
  const std::string name = lower(stem);
  const size_t start = name.find_first_not_of("0123456789-_. ");
  if (start == std::string::npos) return ChapterKind::content;
  const std::string_view word = std::string_view(name).substr(start);
  const auto starts = [word](std::string_view prefix) { return word.starts_with(prefix); };

  if (starts("cover")) return ChapterKind::cover;
  if (starts("nav") || starts("toc") || starts("contents")) return ChapterKind::nav;
  for (std::string_view p : {"title", "copyright", "dedication", "epigraph", "foreword",
                             "preface", "frontmatter", "front-matter", "front_matter"}) {
    if (starts(p)) return ChapterKind::front_matter;
  }
  for (std::string_view p : {"notes", "endnotes", "footnotes", "glossary"}) {
    if (starts(p)) return ChapterKind::non_linear;
  }
  return ChapterKind::content;
}

std::vector<TocEntry> DirectoryContentProvider::table_of_contents(
    const std::string& path, std::optional<ErrorInfo>* error) {
  std::vector<TocEntry> toc;
  auto files = files_for(path);
  if (!files) {
    if (error) *error = ErrorInfo{ErrorCode::parse_error, "not a book directory: " + path};
    return toc;
  }
  toc.reserve(files->size());
  for (size_t i = 0; i < files->size(); ++i) {
    const std::string& file = (*files)[i];
    std::string title;
    // An unreadable chapter still gets an entry; content errors surface on load.
    if (auto data = read_file(file)) {
      if (is_html_extension(lower(fs::path(file).extension().string()))) {
        title = extract_html_title(*data);
        if (title.empty()) title = first_nonempty_line(html_to_text(body_of(*data)));
      } else {
        title = first_nonempty_line(*data);
      }
    }
    const std::string stem = fs::path(file).stem().string();
    if (title.empty()) title = stem;
    toc.push_back(
        TocEntry{title, ChapterIndex{static_cast<int>(i)}, 0, classify_chapter_name(stem)});
  }
  return toc;
}

}  // namespace lectern
