#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "lectern/assembler.hpp"
#include "lectern/buffer.hpp"
#include "lectern/chapter_map.hpp"
#include "lectern/config.hpp"
#include "lectern/content_provider.hpp"
#include "lectern/hash.hpp"
#include "lectern/jsonlite.hpp"
#include "lectern/observability.hpp"
#include "lectern/paginator.hpp"
#include "lectern/position.hpp"
#include "lectern/version.hpp"
#include "lectern/window_indexer.hpp"

namespace {

constexpr auto kIdleTimeout = std::chrono::seconds(30);

// Rough layout estimate used by the simulator in place of a rendering surface.
constexpr size_t kCharsPerPage = 1800;

std::string read_file(const std::string &path) {
  std::ifstream ifs(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
}

int print_error(lectern::ErrorCode code, const std::string &message) {
  std::cout << "{\"error\":{\"code\":\"" << lectern::to_string(code)
            << "\",\"message\":\"" << lectern::jsonlite::escape(message) << "\"}}\n";
  return 2;
}

std::string arg_value(int argc, char **argv, const std::string &flag,
                      const std::string &def) {
  for (int i = 2; i < argc; ++i) {
    if (std::string(argv[i]) == flag && i + 1 < argc)
      return argv[i + 1];
  }
  return def;
}

std::optional<int> parse_int(const std::string &s) {
  if (s.empty())
    return std::nullopt;
  char *end = nullptr;
  const long v = std::strtol(s.c_str(), &end, 10);
  if (!end || *end != '\0' || v < -1000000000L || v > 1000000000L)
    return std::nullopt;
  return static_cast<int>(v);
}

std::string windows_json(const std::vector<lectern::WindowIndex> &windows) {
  std::string out = "[";
  for (size_t i = 0; i < windows.size(); ++i) {
    if (i)
      out += ",";
    out += std::to_string(windows[i].value);
  }
  return out + "]";
}

uint64_t now_ms() {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

std::optional<lectern::ErrorInfo> load_config(int argc, char **argv, lectern::ReaderConfig &cfg) {
  const std::string config_path = arg_value(argc, argv, "--config", "");
  if (!config_path.empty()) {
    std::optional<lectern::ErrorInfo> err;
    cfg = lectern::reader_config_from_json(read_file(config_path), &err);
    if (err)
      return err;
  }
  std::optional<lectern::ErrorInfo> env_err;
  lectern::apply_env_overrides(cfg, &env_err);
  if (env_err)
    std::cerr << "warning: " << env_err->message << "\n";
  return lectern::validate(cfg);
}

// Visible-chapter windows of a directory book.
int cmd_plan_book(int argc, char **argv, const std::string &book) {
  lectern::ReaderConfig cfg;
  if (auto err = load_config(argc, argv, cfg))
    return print_error(err->code, err->message);

  lectern::DirectoryContentProvider provider;
  std::optional<lectern::ErrorInfo> err;
  const auto count = provider.chapter_count(book, &err);
  if (!count)
    return print_error(err ? err->code : lectern::ErrorCode::parse_error, "cannot read " + book);
  const auto toc = provider.table_of_contents(book, &err);
  const auto map = lectern::ChapterMap::from_toc(*count, toc, cfg.chapters_per_window,
                                                 cfg.include_non_linear);

  std::cout << "{\"spine_chapters\":" << map.spine_count()
            << ",\"visible_chapters\":" << map.visible_count()
            << ",\"chapters_per_window\":" << cfg.chapters_per_window
            << ",\"window_count\":" << map.window_count()
            << ",\"spine_window_count\":" << map.window_count_for_spine() << ",\"chapters\":[";
  for (int c = 0; c < map.spine_count(); ++c) {
    const lectern::ChapterIndex spine{c};
    if (c)
      std::cout << ",";
    std::cout << "{\"spine\":" << c << ",\"kind\":\"" << lectern::to_string(map.kind(spine))
              << "\",\"ui\":";
    if (const auto ui = map.spine_to_ui(spine))
      std::cout << *ui;
    else
      std::cout << "null";
    std::cout << "}";
  }
  std::cout << "],\"windows\":[";
  for (int w = 0; w < map.window_count(); ++w) {
    if (w)
      std::cout << ",";
    std::cout << "{\"window\":" << w << ",\"spine\":[";
    const auto spine = map.spine_chapters_for_window(lectern::WindowIndex{w});
    for (size_t i = 0; i < spine.size(); ++i)
      std::cout << (i ? "," : "") << spine[i].value;
    std::cout << "]}";
  }
  std::cout << "],\"debug\":\"" << lectern::jsonlite::escape(map.debug_info()) << "\"}\n";
  return 0;
}

int cmd_plan(int argc, char **argv) {
  const std::string book = arg_value(argc, argv, "--book", "");
  if (!book.empty())
    return cmd_plan_book(argc, argv, book);
  auto chapters = parse_int(arg_value(argc, argv, "--chapters", ""));
  auto per_window = parse_int(arg_value(argc, argv, "--per-window", "5"));
  if (!chapters || !per_window)
    return print_error(lectern::ErrorCode::invalid_config,
                       "usage: plan --chapters N [--per-window K] | plan --book DIR [--config FILE]");
  const lectern::WindowIndexer indexer(*chapters, *per_window);
  std::cout << "{\"total_chapters\":" << indexer.total_chapters()
            << ",\"chapters_per_window\":" << indexer.chapters_per_window()
            << ",\"window_count\":" << indexer.window_count() << ",\"windows\":[";
  for (int w = 0; w < indexer.window_count(); ++w) {
    const auto r = indexer.chapter_range_for_window(lectern::WindowIndex{w});
    if (w)
      std::cout << ",";
    std::cout << "{\"window\":" << w << ",\"first\":" << r.first.value
              << ",\"last\":" << r.last.value << "}";
  }
  std::cout << "],\"map\":\"" << indexer.debug_window_map() << "\"}\n";
  return 0;
}

int cmd_simulate(int argc, char **argv) {
  const std::string book = arg_value(argc, argv, "--book", "");
  if (book.empty())
    return print_error(lectern::ErrorCode::invalid_config,
                       "usage: simulate --book DIR [--start-chapter C] [--config FILE]");

  lectern::ReaderConfig cfg;
  if (auto err = load_config(argc, argv, cfg))
    return print_error(err->code, err->message);

  auto provider = std::make_shared<lectern::DirectoryContentProvider>();
  if (!provider->can_handle(book))
    return print_error(lectern::ErrorCode::parse_error, "no chapters found in " + book);

  lectern::WorkingSetPaginator paginator(
      provider, book, lectern::PaginatorConfig{cfg.working_set_radius, cfg.chapters_per_window});
  std::optional<lectern::ErrorInfo> init_err;
  if (!paginator.initialize(&init_err))
    return print_error(init_err->code, init_err->message);

  const int total = paginator.total_chapters();
  auto start = parse_int(arg_value(argc, argv, "--start-chapter", "0"));
  if (!start || *start < 0 || *start >= total)
    return print_error(lectern::ErrorCode::invalid_index, "start chapter out of range");

  paginator.load_initial_window(lectern::ChapterIndex{*start});
  const lectern::WindowIndexer indexer = paginator.indexer();
  auto assembler = std::make_shared<lectern::ProviderWindowAssembler>(provider, book, total);
  lectern::WindowBufferManager conveyor(
      indexer, assembler,
      lectern::BufferConfig{cfg.edge_threshold_pages,
                            std::chrono::milliseconds(cfg.backward_cooldown_ms),
                            cfg.forward_preload_threshold, cfg.backward_preload_threshold});
  conveyor.initialize(paginator.current_window());
  if (!conveyor.wait_until_idle(kIdleTimeout))
    std::cerr << "warning: initial materialization still running\n";

  const std::string doc_key = lectern::document_key(book);
  const lectern::PreviewOptions preview{cfg.preview_context_chars, cfg.preview_max_length};
  std::optional<lectern::PositionRecord> last_record;

  int step = 0;
  for (int w = paginator.current_window().value; w < indexer.window_count(); ++w, ++step) {
    const lectern::WindowIndex window{w};
    conveyor.on_entered_window(window);

    // Measure every chapter in the window as a rendering surface would.
    const auto range = indexer.chapter_range_for_window(window);
    int window_pages = 0;
    for (auto c = range.first; c <= range.last; c = c.next()) {
      const auto loc = paginator.navigate_to_chapter(c);
      const auto content = paginator.get_page_content(loc.global_page);
      const size_t chars = content ? content->text.size() : 0;
      paginator.update_chapter_page_count(c, static_cast<int>(chars / kCharsPerPage) + 1);
      window_pages += paginator.get_chapter_page_count(c);
    }

    const auto last_loc = paginator.navigate_to_chapter(range.last, window_pages);
    if (const auto content = paginator.get_page_content(last_loc.global_page)) {
      last_record = lectern::make_position_record(
          doc_key, last_loc, *content, paginator.get_chapter_page_count(range.last), total,
          16.0, now_ms(), preview);
    }

    const auto hint = conveyor.update_position(range.last, window_pages - 1, window_pages);
    const bool at_end = conveyor.is_at_window_boundary(lectern::NavigationDirection::forward);
    const bool shifted = conveyor.maybe_shift_forward(window_pages - 1, window_pages);
    if (!conveyor.wait_until_idle(kIdleTimeout))
      std::cerr << "warning: materialization still running at step " << step << "\n";

    std::cout << "{\"step\":" << step << ",\"window\":" << w
              << ",\"phase\":\"" << lectern::to_string(conveyor.phase()) << "\""
              << ",\"preload_forward\":" << (hint.forward ? "true" : "false")
              << ",\"at_window_end\":" << (at_end ? "true" : "false")
              << ",\"shifted\":" << (shifted ? "true" : "false")
              << ",\"buffer\":" << windows_json(conveyor.buffered_windows())
              << ",\"cached\":" << conveyor.cache_size()
              << ",\"window_pages\":" << window_pages
              << ",\"working_set\":" << paginator.window_info().to_json() << "}\n";
  }

  std::cout << "{\"summary\":{\"document_key\":\"" << doc_key << "\""
            << ",\"conveyor\":\"" << lectern::jsonlite::escape(conveyor.debug_info()) << "\""
            << ",\"config\":" << cfg.to_json();
  if (last_record)
    std::cout << ",\"position\":" << last_record->to_json();
  std::cout << ",\"stats\":" << lectern::global_reader_stats().to_json() << "}}\n";
  return 0;
}

int cmd_restore(int argc, char **argv) {
  const std::string record_path = arg_value(argc, argv, "--record", "");
  const std::string font = arg_value(argc, argv, "--font-size", "");
  if (record_path.empty() || font.empty())
    return print_error(lectern::ErrorCode::invalid_config,
                       "usage: restore --record FILE --font-size F");
  char *end = nullptr;
  const double font_size = std::strtod(font.c_str(), &end);
  if (!end || *end != '\0')
    return print_error(lectern::ErrorCode::invalid_config, "invalid font size: " + font);

  std::optional<lectern::ErrorInfo> err;
  auto record = lectern::position_record_from_json(read_file(record_path), &err);
  if (!record)
    return print_error(err ? err->code : lectern::ErrorCode::parse_error,
                       err ? err->message : "unreadable record");

  std::string action;
  lectern::RestoreCallbacks callbacks;
  callbacks.navigate_to_chapter = [&](lectern::ChapterIndex c) {
    action = "{\"chapter\":" + std::to_string(c.value);
  };
  callbacks.navigate_to_in_page = [&](int page) {
    action += ",\"in_page\":" + std::to_string(page) + "}";
  };
  callbacks.scroll_to_character_offset = [&](int offset) {
    action += ",\"character_offset\":" + std::to_string(offset) + "}";
  };
  const auto strategy = lectern::restore_position(record->saved_position(), font_size, callbacks);
  std::cout << "{\"document_key\":\"" << lectern::jsonlite::escape(record->document_key)
            << "\",\"strategy\":\"" << lectern::to_string(strategy)
            << "\",\"target\":" << action << "}\n";
  return 0;
}

int cmd_digest(int argc, char **argv) {
  const std::string book = arg_value(argc, argv, "--book", "");
  if (book.empty())
    return print_error(lectern::ErrorCode::invalid_config, "usage: digest --book PATH");
  const std::string key = lectern::document_key(book);
  if (key.empty())
    return print_error(lectern::ErrorCode::parse_error, "cannot read " + book);
  std::cout << "{\"document_key\":\"" << key << "\"}\n";
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  std::string cmd;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]).rfind("--", 0) == 0)
      continue;
    cmd = argv[i];
    break;
  }
  if (cmd.empty()) {
    std::cerr << "usage: lectern <plan|simulate|restore|digest|version> [options]\n";
    return 1;
  }

  try {
    if (cmd == "plan")
      return cmd_plan(argc, argv);
    if (cmd == "simulate")
      return cmd_simulate(argc, argv);
    if (cmd == "restore")
      return cmd_restore(argc, argv);
    if (cmd == "digest")
      return cmd_digest(argc, argv);
    if (cmd == "version") {
      std::cout << lectern::version::manifest_to_json(lectern::version::current_manifest())
                << "\n";
      return 0;
    }
  } catch (const lectern::EngineError &e) {
    return print_error(e.code(), e.what());
  }

  std::cerr << "unknown command: " << cmd << "\n";
  return 1;
}
