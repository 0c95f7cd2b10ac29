#include <array>
#include <atomic>
#include <chrono>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include <unistd.h>

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
#include "test_doubles.hpp"

namespace fs = std::filesystem;

using lectern::ChapterIndex;
using lectern::WindowIndex;
using lectern_test::ControlledAssembler;
using lectern_test::InMemoryProvider;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

template <typename Fn>
bool throws_code(Fn&& fn, lectern::ErrorCode code) {
  try {
    fn();
  } catch (const lectern::EngineError& e) {
    return e.code() == code;
  }
  return false;
}

// Event counters fed by the process-wide hook (also keeps events off disk).
std::array<std::atomic<int>, 11> g_event_counts{};

void count_event(const lectern::ReaderEvent& ev) {
  g_event_counts[static_cast<size_t>(ev.kind)].fetch_add(1, std::memory_order_relaxed);
}

int events(lectern::EventKind kind) {
  return g_event_counts[static_cast<size_t>(kind)].load(std::memory_order_relaxed);
}

void reset_events() {
  for (auto& c : g_event_counts) c.store(0, std::memory_order_relaxed);
}

constexpr std::chrono::milliseconds kIdleTimeout{5000};

std::vector<int> values(const std::vector<WindowIndex>& windows) {
  std::vector<int> out;
  for (WindowIndex w : windows) out.push_back(w.value);
  return out;
}

std::vector<int> values(const std::vector<ChapterIndex>& chapters) {
  std::vector<int> out;
  for (ChapterIndex c : chapters) out.push_back(c.value);
  return out;
}

std::vector<int> range(int first, int last) {
  std::vector<int> out;
  for (int i = first; i <= last; ++i) out.push_back(i);
  return out;
}

struct ConveyorFixture {
  std::shared_ptr<ControlledAssembler> assembler;
  std::unique_ptr<lectern::WindowBufferManager> buffer;

  ConveyorFixture(int chapters, int per_window, lectern::BufferConfig config = {})
      : assembler(std::make_shared<ControlledAssembler>(chapters)),
        buffer(std::make_unique<lectern::WindowBufferManager>(
            lectern::WindowIndexer(chapters, per_window), assembler, config)) {}

  ~ConveyorFixture() {
    // A worker parked at a closed gate would block shutdown.
    assembler->set_open(true);
  }
};

bool buffer_is_contiguous(const std::vector<WindowIndex>& windows) {
  for (size_t i = 1; i < windows.size(); ++i) {
    if (windows[i].value != windows[i - 1].value + 1) return false;
  }
  return true;
}

// ============================================================================
// Window indexer
// ============================================================================

void test_indexer_partition() {
  for (int total : {1, 4, 5, 6, 62, 120}) {
    for (int per : {1, 3, 5, 7}) {
      lectern::WindowIndexer ix(total, per);
      int next_expected = 0;
      for (int w = 0; w < ix.window_count(); ++w) {
        const auto r = ix.chapter_range_for_window(WindowIndex{w});
        expect(r.first.value == next_expected, "windows must tile chapters without gaps");
        expect(r.chapter_count() >= 1 && r.chapter_count() <= per, "window size bounded");
        for (int c = r.first.value; c <= r.last.value; ++c) {
          expect(ix.window_for_chapter(ChapterIndex{c}).value == w,
                 "chapter must map back to its window");
        }
        next_expected = r.last.value + 1;
      }
      expect(next_expected == total, "partition must cover every chapter");
    }
  }
}

void test_indexer_example_book() {
  lectern::WindowIndexer ix(62, 5);
  expect(ix.window_count() == 13, "62 chapters / 5 per window = 13 windows");
  const auto last = ix.chapter_range_for_window(WindowIndex{12});
  expect(last.first.value == 60 && last.last.value == 61, "last window is [60, 61]");
  expect(ix.window_for_chapter(ChapterIndex{61}).value == 12, "chapter 61 in window 12");
  expect(ix.is_valid_window(WindowIndex{12}), "window 12 valid");
  expect(!ix.is_valid_window(WindowIndex{13}), "window 13 invalid");
  expect(!ix.is_valid_window(WindowIndex{-1}), "negative window invalid");

  lectern::WindowIndexer empty(0, 5);
  expect(empty.window_count() == 0, "empty book has no windows");
}

void test_indexer_rejects_bad_input() {
  expect(throws_code([] { lectern::WindowIndexer ix(10, 0); }, lectern::ErrorCode::invalid_config),
         "chapters_per_window 0 rejected");
  expect(throws_code([] { lectern::WindowIndexer ix(-1, 5); }, lectern::ErrorCode::invalid_config),
         "negative total rejected");
  lectern::WindowIndexer ix(10, 5);
  expect(throws_code([&] { (void)ix.window_for_chapter(ChapterIndex{-1}); },
                     lectern::ErrorCode::invalid_index),
         "negative chapter rejected");
  expect(throws_code([&] { (void)ix.chapter_range_for_window(WindowIndex{-2}); },
                     lectern::ErrorCode::invalid_index),
         "negative window rejected");
  // Out-of-range chapters are not clamped.
  expect(ix.window_for_chapter(ChapterIndex{12}).value == 2, "window_for_chapter is unclamped");
}

void test_indexer_debug_map() {
  lectern::WindowIndexer ix(7, 5);
  expect(ix.debug_window_map() == "W0=[0-4](5), W1=[5-6](2)", "debug map format");
}

// ============================================================================
// Working-set paginator
// ============================================================================

std::unique_ptr<lectern::WorkingSetPaginator> make_paginator(
    const std::shared_ptr<InMemoryProvider>& provider) {
  auto p = std::make_unique<lectern::WorkingSetPaginator>(provider, "mem://book");
  std::optional<lectern::ErrorInfo> err;
  expect(p->initialize(&err), "initialize must succeed");
  expect(!err, "initialize must not report an error");
  return p;
}

void test_paginator_initialize_failure() {
  auto provider = std::make_shared<InMemoryProvider>(4);
  provider->set_fail_enumeration(true);
  lectern::WorkingSetPaginator p(provider, "mem://broken");
  std::optional<lectern::ErrorInfo> err;
  expect(!p.initialize(&err), "initialize must fail when chapters cannot be enumerated");
  expect(err && err->code == lectern::ErrorCode::parse_error, "failure reported as parse_error");
  expect(err->message == "corrupt container", "provider message carried through");

  expect(throws_code([&] { lectern::WorkingSetPaginator bad(provider, "x", {-1, 5}); },
                     lectern::ErrorCode::invalid_config),
         "negative radius rejected");
  expect(throws_code(
             [&] {
               lectern::WorkingSetPaginator bad(
                   provider, "x", {lectern::WorkingSetPaginator::kMaxWorkingSetRadius + 1, 5});
             },
             lectern::ErrorCode::invalid_config),
         "radius above the ceiling rejected");
  expect(throws_code([&] { lectern::WorkingSetPaginator bad(provider, "x", {INT_MAX, 5}); },
                     lectern::ErrorCode::invalid_config),
         "INT_MAX radius rejected before 2 * radius + 1 is formed");
  lectern::WorkingSetPaginator widest(
      provider, "x", {lectern::WorkingSetPaginator::kMaxWorkingSetRadius, 5});
  expect(widest.total_chapters() == 0, "radius at the ceiling accepted");
  expect(throws_code([] { lectern::WorkingSetPaginator bad(nullptr, "x"); },
                     lectern::ErrorCode::invalid_config),
         "null provider rejected");
}

void test_paginator_titles_and_fallback_counts() {
  auto provider = std::make_shared<InMemoryProvider>(10);
  auto p = make_paginator(provider);
  const auto titles = p->chapter_titles();
  expect(titles.size() == 10 && titles[3] == "Title 3", "titles come from the TOC");
  expect(p->get_total_global_pages() == 10, "unloaded chapters count one page each");
  expect(p->get_chapter_page_count(ChapterIndex{7}) == 1, "fallback page count is 1");
  expect(p->indexer().window_count() == 2, "indexer rebuilt for the book");
}

void test_paginator_working_set_edges() {
  auto provider = std::make_shared<InMemoryProvider>(10);
  auto p = make_paginator(provider);

  p->load_initial_window(ChapterIndex{0});
  expect(values(p->window_info().loaded_chapters) == range(0, 4), "start edge loads 0..4");

  p->load_initial_window(ChapterIndex{9});
  expect(values(p->window_info().loaded_chapters) == range(5, 9), "end edge loads 5..9");

  const int first = p->load_initial_window(ChapterIndex{5});
  expect(values(p->window_info().loaded_chapters) == range(3, 7), "middle loads 3..7");
  expect(first == 5, "returns the target's first global page");
  expect(p->current_chapter().value == 5, "target becomes current");
  expect(p->current_window().value == 1, "current window derived from chapter");

  auto small = std::make_shared<InMemoryProvider>(3);
  auto q = make_paginator(small);
  q->load_initial_window(ChapterIndex{1});
  expect(values(q->window_info().loaded_chapters) == range(0, 2), "short book loads everything");

  expect(throws_code([&] { p->load_initial_window(ChapterIndex{10}); },
                     lectern::ErrorCode::invalid_index),
         "out-of-range target rejected");
}

void test_paginator_reflow_shifts_later_chapters() {
  auto provider = std::make_shared<InMemoryProvider>(10);
  auto p = make_paginator(provider);
  p->load_initial_window(ChapterIndex{2});

  const int before_total = p->get_total_global_pages();
  const int before_c3 = *p->get_global_index_for_chapter_page(ChapterIndex{3}, 0);
  expect(p->update_chapter_page_count(ChapterIndex{2}, 3), "page count change reported");
  expect(p->get_total_global_pages() == before_total + 2, "total grows by the delta");
  expect(*p->get_global_index_for_chapter_page(ChapterIndex{3}, 0) == before_c3 + 2,
         "later chapters shift by the delta");
  expect(*p->get_global_index_for_chapter_page(ChapterIndex{2}, 2) == 4, "in-chapter offset");

  expect(!p->update_chapter_page_count(ChapterIndex{2}, 3), "identical count is not a change");
  expect(!p->update_chapter_page_count(ChapterIndex{8}, 4), "unloaded chapter is not updated");
  expect(!p->update_chapter_page_count(ChapterIndex{1}, 0), "count clamps to 1 (unchanged)");
  expect(p->get_chapter_page_count(ChapterIndex{1}) == 1, "clamped count stays 1");
  expect(!p->get_global_index_for_chapter_page(ChapterIndex{8}, 0), "unloaded chapter has no index");
}

void test_paginator_global_navigation_recenters() {
  auto provider = std::make_shared<InMemoryProvider>(20);
  auto p = make_paginator(provider);
  p->load_initial_window(ChapterIndex{0});

  const auto loc = p->navigate_to_global_page(10);
  expect(loc.has_value(), "page 10 exists");
  expect(loc->chapter.value == 10 && loc->in_page == 0 && loc->global_page == 10,
         "page 10 resolves to chapter 10");
  expect(values(p->window_info().loaded_chapters) == range(8, 12), "working set re-centered");
  expect(p->get_current_global_page() == 10, "current page follows navigation");

  expect(!p->navigate_to_global_page(20), "page past the end returns nothing");
  expect(throws_code([&] { (void)p->navigate_to_global_page(-1); },
                     lectern::ErrorCode::invalid_index),
         "negative global page rejected");
  expect(throws_code([&] { (void)p->get_page_content(-1); }, lectern::ErrorCode::invalid_index),
         "negative page content lookup rejected");
}

void test_paginator_in_page_clamp_and_offset() {
  auto provider = std::make_shared<InMemoryProvider>(20);
  auto p = make_paginator(provider);
  p->load_initial_window(ChapterIndex{10});

  auto loc = p->navigate_to_chapter(ChapterIndex{10}, 99);
  expect(loc.in_page == 0, "in_page clamps to a one-page chapter");

  expect(p->update_chapter_page_count(ChapterIndex{10}, 4), "chapter 10 now has 4 pages");
  loc = p->navigate_to_chapter(ChapterIndex{10}, 99);
  expect(loc.in_page == 3, "in_page clamps to the last page");
  expect(loc.global_page == 13, "global page includes clamped offset");
  const int text_len = static_cast<int>(p->get_page_content(10)->text.size());
  expect(loc.character_offset == text_len * 3 / 4, "character offset estimated from page share");

  const auto back = p->get_page_location(12);
  expect(back && back->chapter.value == 10 && back->in_page == 2, "location lookup in chapter");
}

void test_paginator_eviction() {
  auto provider = std::make_shared<InMemoryProvider>(20);
  auto p = make_paginator(provider);
  p->load_initial_window(ChapterIndex{10});
  expect(p->update_chapter_page_count(ChapterIndex{12}, 3), "chapter 12 has 3 pages");
  const int total = p->get_total_global_pages();

  p->mark_chapter_evicted(ChapterIndex{10});
  expect(p->is_chapter_loaded(ChapterIndex{10}), "current chapter is never evicted");

  const int g12 = *p->get_global_index_for_chapter_page(ChapterIndex{12}, 0);
  p->mark_chapter_evicted(ChapterIndex{12});
  expect(!p->is_chapter_loaded(ChapterIndex{12}), "chapter 12 evicted");
  expect(p->get_chapter_page_count(ChapterIndex{12}) == 1, "evicted chapter reverts to 1 page");
  expect(p->get_total_global_pages() == total - 2, "total shrinks with eviction");
  expect(!p->get_page_content(g12), "evicted chapter has no content");
  expect(!p->get_page_location(g12), "evicted chapter has no location");

  p->mark_chapter_evicted(ChapterIndex{2});  // not loaded: no-op
  expect(throws_code([&] { p->mark_chapter_evicted(ChapterIndex{99}); },
                     lectern::ErrorCode::invalid_index),
         "out-of-range eviction rejected");
}

void test_paginator_failed_chapter_placeholder() {
  reset_events();
  auto provider = std::make_shared<InMemoryProvider>(10);
  provider->set_failing(3, true);
  auto p = make_paginator(provider);
  p->load_initial_window(ChapterIndex{3});

  expect(p->is_chapter_loaded(ChapterIndex{3}), "failed chapter still occupies its slot");
  expect(p->chapter_load_failed(ChapterIndex{3}), "failure is recorded");
  expect(p->get_chapter_page_count(ChapterIndex{3}) == 1, "placeholder has one page");
  const auto content = p->get_page_content(*p->get_global_index_for_chapter_page(ChapterIndex{3}, 0));
  expect(content && content->text == "Chapter 4 could not be loaded.", "placeholder text");
  expect(p->is_chapter_loaded(ChapterIndex{4}), "neighbours load normally");
  expect(events(lectern::EventKind::chapter_load_failed) == 1, "failure event emitted");

  provider->set_failing(3, false);
  p->navigate_to_chapter(ChapterIndex{5});
  expect(!p->chapter_load_failed(ChapterIndex{3}), "failed chapter retried on re-center");
  expect(provider->loads(3) == 2, "exactly one retry");
  expect(provider->loads(4) == 1, "healthy chapters are not reloaded");
}

void test_paginator_repaginate_and_info() {
  auto provider = std::make_shared<InMemoryProvider>(10);
  auto p = make_paginator(provider);
  p->load_initial_window(ChapterIndex{5});
  p->update_chapter_page_count(ChapterIndex{4}, 4);
  p->update_chapter_page_count(ChapterIndex{5}, 3);
  expect(p->get_total_global_pages() == 15, "counts applied");

  const int first = p->repaginate();
  expect(p->get_total_global_pages() == 10, "repaginate resets measured counts");
  expect(first == 5, "repaginate returns the current chapter's first page");
  expect(provider->loads(5) == 2, "repaginate reloads chapters");

  const std::string json = p->window_info().to_json();
  expect(json == "{\"current_chapter\":5,\"loaded_chapters\":[3,4,5,6,7],"
                 "\"total_chapters\":10,\"total_global_pages\":10}",
         "window info JSON");
}

// ============================================================================
// Chapter map (spine vs. visible chapters)
// ============================================================================

// cover, nav, copyright, five chapters, endnotes
std::vector<lectern::ChapterKind> sample_spine() {
  using K = lectern::ChapterKind;
  return {K::cover,   K::nav,     K::front_matter, K::content,   K::content,
          K::content, K::content, K::content,      K::non_linear};
}

void test_chapter_map_visibility() {
  lectern::ChapterMap map(sample_spine(), 3);
  expect(map.spine_count() == 9, "spine keeps every item");
  expect(map.visible_count() == 6, "cover, nav and notes hidden");

  expect(map.ui_to_spine(0) == ChapterIndex{2}, "first visible chapter is the copyright page");
  expect(map.ui_to_spine(5) == ChapterIndex{7}, "last visible chapter");
  expect(!map.ui_to_spine(6) && !map.ui_to_spine(-1), "ui index out of range");
  expect(!map.spine_to_ui(ChapterIndex{0}), "cover has no ui index");
  expect(!map.spine_to_ui(ChapterIndex{1}), "nav has no ui index");
  expect(!map.spine_to_ui(ChapterIndex{8}), "notes hidden by default");
  expect(!map.spine_to_ui(ChapterIndex{9}), "past the spine");
  expect(map.spine_to_ui(ChapterIndex{3}) == std::optional<int>(1), "spine 3 is ui 1");
  for (int ui = 0; ui < map.visible_count(); ++ui) {
    expect(map.spine_to_ui(*map.ui_to_spine(ui)) == std::optional<int>(ui), "mapping round-trips");
  }
  expect(map.is_visible(ChapterIndex{2}) && !map.is_visible(ChapterIndex{0}), "is_visible");
  expect(map.kind(ChapterIndex{8}) == lectern::ChapterKind::non_linear, "kind lookup");
  expect(throws_code([&] { (void)map.kind(ChapterIndex{9}); }, lectern::ErrorCode::invalid_index),
         "kind outside the spine rejected");

  expect(map.window_count() == 2, "6 visible chapters / 3 per window");
  expect(map.window_count_for_spine() == 3, "9 spine items / 3 per window");
  expect(values(map.spine_chapters_for_window(WindowIndex{0})) == range(2, 4), "window 0 spine");
  expect(values(map.spine_chapters_for_window(WindowIndex{1})) == range(5, 7), "window 1 spine");
  expect(map.spine_chapters_for_window(WindowIndex{2}).empty(), "invalid window is empty");
  expect(map.window_for_spine_chapter(ChapterIndex{6}) == WindowIndex{1}, "spine 6 in window 1");
  expect(!map.window_for_spine_chapter(ChapterIndex{0}), "hidden chapter has no window");

  const auto counts = map.kind_counts();
  expect(counts.at(lectern::ChapterKind::content) == 5 &&
             counts.at(lectern::ChapterKind::cover) == 1,
         "kind counts");
  expect(map.debug_info().find("spine=9 visible=6 windows=2 spine_windows=3") == 0,
         "debug info header");
  expect(map.debug_info().find("map=W0=[0-2](3), W1=[3-5](3)") != std::string::npos,
         "debug info window map");

  lectern::ChapterMap with_notes(sample_spine(), 3, true);
  expect(with_notes.visible_count() == 7, "notes visible on request");
  expect(with_notes.ui_to_spine(6) == ChapterIndex{8}, "notes follow the last chapter");
  expect(with_notes.window_count() == 3, "notes open a third window");
  expect(values(with_notes.spine_chapters_for_window(WindowIndex{2})) == std::vector<int>{8},
         "third window holds only the notes");
  expect(!with_notes.is_visible(ChapterIndex{0}), "cover still hidden");

  expect(throws_code([] { lectern::ChapterMap bad({}, 0); }, lectern::ErrorCode::invalid_config),
         "zero window size rejected");
}

void test_chapter_map_from_toc() {
  using K = lectern::ChapterKind;
  const std::vector<lectern::TocEntry> toc = {
      {"Cover", ChapterIndex{0}, 0, K::cover},
      {"Contents", ChapterIndex{1}, 0, K::nav},
      {"Part One", ChapterIndex{2}, 0, K::content},
      {"Part One, again", ChapterIndex{2}, 1, K::nav},
      {"Stray", ChapterIndex{40}, 0, K::cover},
  };
  const auto map = lectern::ChapterMap::from_toc(4, toc, 5);
  expect(map.kind(ChapterIndex{2}) == K::content, "first entry for a chapter wins");
  expect(map.kind(ChapterIndex{3}) == K::content, "chapter missing from the TOC is content");
  expect(map.visible_count() == 2, "two visible chapters");
  expect(map.ui_to_spine(0) == ChapterIndex{2} && map.ui_to_spine(1) == ChapterIndex{3},
         "visible chapters in spine order");

  const auto empty = lectern::ChapterMap::from_toc(0, {}, 5);
  expect(empty.visible_count() == 0 && empty.window_count() == 0, "empty book");
  expect(throws_code([] { (void)lectern::ChapterMap::from_toc(-1, {}, 5); },
                     lectern::ErrorCode::invalid_config),
         "negative spine count rejected");
}

void test_classify_chapter_name() {
  using K = lectern::ChapterKind;
  expect(lectern::classify_chapter_name("cover") == K::cover, "cover");
  expect(lectern::classify_chapter_name("00-Cover") == K::cover, "numbered cover");
  expect(lectern::classify_chapter_name("01_nav") == K::nav, "nav");
  expect(lectern::classify_chapter_name("toc") == K::nav, "toc");
  expect(lectern::classify_chapter_name("02-copyright") == K::front_matter, "copyright");
  expect(lectern::classify_chapter_name("titlepage") == K::front_matter, "title page");
  expect(lectern::classify_chapter_name("99-endnotes") == K::non_linear, "endnotes");
  expect(lectern::classify_chapter_name("03-chapter-one") == K::content, "chapter");
  expect(lectern::classify_chapter_name("2024") == K::content, "bare number");
  expect(lectern::classify_chapter_name("") == K::content, "empty name");
  expect(lectern::to_string(K::front_matter) == "front_matter", "kind name");
}

// ============================================================================
// Window buffer (conveyor)
// ============================================================================

void test_conveyor_end_to_end() {
  reset_events();
  ConveyorFixture f(120, 5);
  auto& b = *f.buffer;
  expect(b.window_count() == 24, "120 chapters make 24 windows");

  b.initialize(WindowIndex{0});
  expect(values(b.buffered_windows()) == range(0, 4), "initial buffer 0..4");
  expect(b.phase() == lectern::ConveyorPhase::startup, "starts in STARTUP");
  expect(b.active_window() == WindowIndex{0}, "active is the first buffered window");
  expect(b.wait_until_idle(kIdleTimeout), "initial materialization completes");
  expect(b.cache_size() == 5, "all five windows cached");

  expect(!b.shift_forward(), "no shifting during STARTUP");
  b.on_entered_window(WindowIndex{1});
  expect(b.phase() == lectern::ConveyorPhase::startup, "entering slot 1 keeps STARTUP");
  b.on_entered_window(WindowIndex{2});
  expect(b.phase() == lectern::ConveyorPhase::steady, "entering the center switches to STEADY");

  expect(b.shift_forward(), "shift 1");
  expect(values(b.buffered_windows()) == range(1, 5), "buffer 1..5");
  expect(!b.get_cached_window(WindowIndex{0}), "dropped window evicted immediately");
  expect(b.render_state(WindowIndex{0}) == lectern::WindowRenderState::absent, "0 absent");

  b.on_entered_window(WindowIndex{3});
  expect(b.shift_forward(), "shift 2");
  b.on_entered_window(WindowIndex{4});
  expect(b.shift_forward(), "shift 3");
  expect(values(b.buffered_windows()) == range(3, 7), "buffer 3..7");
  expect(b.center_window() == WindowIndex{5}, "center is slot 2");

  expect(b.wait_until_idle(kIdleTimeout), "revealed windows materialize");
  expect(b.cache_size() == 5, "cache holds exactly the buffer");
  for (int w = 3; w <= 7; ++w) {
    const auto data = b.get_cached_window(WindowIndex{w});
    expect(data && data->window.value == w, "cached data belongs to its window");
    expect(data->first_chapter.value == w * 5 && data->last_chapter.value == w * 5 + 4,
           "cached window spans its chapter range");
  }
  expect(events(lectern::EventKind::shift_forward) == 3, "three shift events");
  expect(events(lectern::EventKind::phase_transition) == 1, "one phase transition");
  expect(b.debug_info().find("buffer=[3,4,5,6,7]") != std::string::npos, "debug info buffer");
}

void test_conveyor_initialize_clamps() {
  ConveyorFixture f(120, 5);
  auto& b = *f.buffer;
  b.initialize(WindowIndex{22});
  expect(values(b.buffered_windows()) == range(19, 23), "start near the end clamps to 19..23");
  expect(b.active_window() == WindowIndex{19}, "active is buffer front");
  b.initialize(WindowIndex{-3});
  expect(values(b.buffered_windows()) == range(0, 4), "negative start clamps to 0..4");

  ConveyorFixture small(15, 5);
  small.buffer->initialize(WindowIndex{2});
  expect(values(small.buffer->buffered_windows()) == range(0, 2), "three-window book buffers all");

  ConveyorFixture empty(0, 5);
  empty.buffer->initialize(WindowIndex{0});
  expect(empty.buffer->buffered_windows().empty(), "empty book has an empty buffer");
  expect(!empty.buffer->active_window(), "empty book has no active window");

  const uint64_t gen = b.generation();
  b.initialize(WindowIndex{4});
  expect(b.generation() == gen + 1, "initialize bumps the generation");
}

void test_conveyor_boundaries() {
  ConveyorFixture small(15, 5);
  auto& s = *small.buffer;
  s.initialize(WindowIndex{0});
  s.on_entered_window(WindowIndex{2});
  expect(s.phase() == lectern::ConveyorPhase::steady, "three-window book reaches STEADY");
  expect(!s.shift_forward(), "no window past the end");
  expect(!s.shift_backward(), "no window before the start");
  expect(values(s.buffered_windows()) == range(0, 2), "buffer unchanged by refused shifts");
  expect(!s.has_next_window(), "active 2 is the last window");
  expect(s.has_previous_window(), "active 2 has a predecessor");

  ConveyorFixture f(120, 5);
  auto& b = *f.buffer;
  b.initialize(WindowIndex{22});
  b.on_entered_window(WindowIndex{21});
  expect(!b.shift_forward(), "end of book refuses forward shift");
  expect(b.shift_backward(), "backward shift allowed at the end");
  expect(values(b.buffered_windows()) == range(18, 22), "buffer 18..22");

  expect(throws_code([] {
           lectern::WindowBufferManager m(lectern::WindowIndexer(10, 5), nullptr);
         }, lectern::ErrorCode::invalid_config),
         "null assembler rejected");
  expect(throws_code([] {
           lectern::WindowBufferManager m(lectern::WindowIndexer(10, 5),
                                          std::make_shared<ControlledAssembler>(10),
                                          lectern::BufferConfig{0, std::chrono::milliseconds(0)});
         }, lectern::ErrorCode::invalid_config),
         "zero edge threshold rejected");
}

void test_conveyor_phase_transition_once() {
  reset_events();
  ConveyorFixture f(120, 5);
  auto& b = *f.buffer;
  b.initialize(WindowIndex{0});
  b.on_entered_window(WindowIndex{2});
  b.on_entered_window(WindowIndex{2});
  b.on_entered_window(WindowIndex{3});
  b.on_entered_window(WindowIndex{2});
  expect(events(lectern::EventKind::phase_transition) == 1, "transition fires exactly once");

  b.clear();
  expect(b.phase() == lectern::ConveyorPhase::startup, "clear returns to STARTUP");
  b.initialize(WindowIndex{0});
  b.on_entered_window(WindowIndex{2});
  expect(events(lectern::EventKind::phase_transition) == 2, "new session transitions again");

  expect(lectern::next_phase(lectern::ConveyorPhase::steady, false) ==
             lectern::ConveyorPhase::steady,
         "STEADY is terminal");
  expect(lectern::to_string(lectern::ConveyorPhase::steady) == "STEADY", "phase name");
}

void test_conveyor_loading_then_ready() {
  std::atomic<int> ready_calls{0};
  ConveyorFixture f(120, 5);
  auto& b = *f.buffer;
  b.set_window_ready_listener([&](const lectern::WindowData&) { ready_calls.fetch_add(1); });

  f.assembler->set_open(false);
  b.initialize(WindowIndex{0});
  expect(b.render_state(WindowIndex{0}) == lectern::WindowRenderState::loading,
         "buffered but not materialized reads as loading");
  expect(!b.get_cached_window(WindowIndex{0}), "no content yet");
  expect(b.render_state(WindowIndex{7}) == lectern::WindowRenderState::absent, "7 is absent");

  f.assembler->set_open(true);
  expect(b.wait_until_idle(kIdleTimeout), "materialization completes");
  expect(b.render_state(WindowIndex{0}) == lectern::WindowRenderState::ready, "0 ready");
  expect(b.get_cached_window(WindowIndex{0})->window.value == 0, "content for window 0");
  expect(ready_calls.load() == 5, "listener told about every window");
}

void test_conveyor_discards_stale_results() {
  reset_events();
  ConveyorFixture f(120, 5);
  auto& b = *f.buffer;
  f.assembler->set_open(false);
  b.initialize(WindowIndex{0});
  expect(f.assembler->wait_for_entries(1, kIdleTimeout), "worker is inside the assembler");

  b.clear();
  f.assembler->set_open(true);
  expect(b.wait_until_idle(kIdleTimeout), "worker drains");
  expect(b.cache_size() == 0, "result from before clear() is dropped");
  expect(b.buffered_windows().empty(), "buffer stays empty after clear");
  expect(events(lectern::EventKind::materialization_discarded) == 1,
         "running job discarded, queued jobs cancelled");
  expect(events(lectern::EventKind::window_materialized) == 0, "nothing materialized");
}

void test_conveyor_failed_window_retried() {
  reset_events();
  ConveyorFixture f(120, 5);
  auto& b = *f.buffer;
  f.assembler->fail_once(1);
  b.initialize(WindowIndex{0});
  expect(b.wait_until_idle(kIdleTimeout), "initial pass completes");
  expect(b.render_state(WindowIndex{1}) == lectern::WindowRenderState::loading,
         "failed window stays empty");
  expect(b.cache_size() == 4, "other windows cached");
  expect(events(lectern::EventKind::materialization_failed) == 1, "failure event emitted");

  b.on_entered_window(WindowIndex{1});
  expect(b.wait_until_idle(kIdleTimeout), "retry completes");
  expect(b.render_state(WindowIndex{1}) == lectern::WindowRenderState::ready, "retry succeeded");
  expect(f.assembler->calls(1) == 2, "window 1 assembled twice");
}

void test_conveyor_no_duplicate_materialization() {
  ConveyorFixture f(120, 5);
  auto& b = *f.buffer;
  f.assembler->set_open(false);
  b.initialize(WindowIndex{0});
  for (int i = 0; i < 5; ++i) b.on_entered_window(WindowIndex{0});
  f.assembler->set_open(true);
  expect(b.wait_until_idle(kIdleTimeout), "drained");
  expect(f.assembler->calls(0) == 1, "in-flight window is not submitted twice");
  b.on_entered_window(WindowIndex{0});
  expect(b.wait_until_idle(kIdleTimeout), "drained again");
  expect(f.assembler->calls(0) == 1, "cached window is not rebuilt");
}

void test_conveyor_shift_hints() {
  ConveyorFixture f(120, 5, lectern::BufferConfig{2, std::chrono::milliseconds(0)});
  auto& b = *f.buffer;
  b.initialize(WindowIndex{0});
  expect(!b.maybe_shift_forward(9, 10), "hint ignored during STARTUP");
  b.on_entered_window(WindowIndex{2});

  expect(!b.maybe_shift_forward(7, 10), "not near the end yet");
  expect(b.maybe_shift_forward(8, 10), "near the end of the center window");
  expect(values(b.buffered_windows()) == range(1, 5), "forward hint shifted");
  expect(!b.maybe_shift_forward(9, 10), "active behind center does not shift forward");
  expect(!b.maybe_shift_forward(0, 0), "empty window never shifts");

  expect(!b.maybe_shift_backward(5), "not near the start");
  expect(b.maybe_shift_backward(0), "near the start of a window behind center");
  expect(values(b.buffered_windows()) == range(0, 4), "backward hint shifted");
}

void test_conveyor_backward_cooldown() {
  ConveyorFixture f(120, 5, lectern::BufferConfig{2, std::chrono::milliseconds(60000)});
  auto& b = *f.buffer;
  b.initialize(WindowIndex{10});
  b.on_entered_window(WindowIndex{12});
  expect(!b.maybe_shift_backward(0), "fresh entry suppresses the backward hint");
  expect(b.shift_backward(), "explicit shift ignores the cooldown");
  expect(values(b.buffered_windows()) == range(9, 13), "explicit shift applied");

  ConveyorFixture g(120, 5, lectern::BufferConfig{2, std::chrono::milliseconds(0)});
  g.buffer->initialize(WindowIndex{10});
  g.buffer->on_entered_window(WindowIndex{12});
  expect(g.buffer->maybe_shift_backward(0), "no cooldown allows the hint");
}

void test_conveyor_random_shifts_keep_invariants() {
  ConveyorFixture f(120, 5);
  auto& b = *f.buffer;
  b.initialize(WindowIndex{8});
  b.on_entered_window(WindowIndex{10});

  std::mt19937 rng(42);
  for (int step = 0; step < 300; ++step) {
    if (rng() % 2) b.shift_forward();
    else b.shift_backward();
    const auto windows = b.buffered_windows();
    expect(windows.size() == 5, "buffer keeps five windows");
    expect(buffer_is_contiguous(windows), "buffer stays contiguous");
    expect(windows.front().value >= 0 && windows.back().value < 24, "buffer within the book");
    expect(b.cache_size() <= 5, "cache never exceeds the buffer");
  }
  expect(b.wait_until_idle(kIdleTimeout), "drained");
  expect(b.cache_size() == 5, "every buffered window materialized");
  for (WindowIndex w : b.buffered_windows()) {
    const auto data = b.get_cached_window(w);
    expect(data && data->window == w, "cached data keyed by its own window");
  }
}

void test_conveyor_reading_position() {
  using lectern::NavigationDirection;
  ConveyorFixture f(120, 5);
  auto& b = *f.buffer;
  const auto before = b.update_position(ChapterIndex{0}, 0, 10);
  expect(!before.forward && !before.backward, "no hints before initialize");
  expect(!b.current_position(), "nothing recorded before initialize");

  b.initialize(WindowIndex{0});
  expect(b.wait_until_idle(kIdleTimeout), "initial pass completes");
  auto hint = b.update_position(ChapterIndex{4}, 9, 10);
  expect(!hint.forward && !hint.backward, "no preload hints in STARTUP");
  auto pos = b.current_position();
  expect(pos && pos->window == WindowIndex{0} && pos->chapter == ChapterIndex{4},
         "position recorded against the active window");
  expect(pos->in_page == 9 && pos->progress == 0.9, "progress is in_page / pages");
  expect(!b.is_at_window_boundary(NavigationDirection::forward), "0.9 is short of the end");
  expect(!b.is_at_window_boundary(NavigationDirection::backward), "not on the first page");

  b.on_entered_window(WindowIndex{2});
  hint = b.update_position(ChapterIndex{10}, 8, 10);
  expect(hint.forward && !hint.backward, "past the forward threshold");
  hint = b.update_position(ChapterIndex{10}, 2, 10);
  expect(!hint.forward && hint.backward, "under the backward threshold");
  hint = b.update_position(ChapterIndex{10}, 5, 10);
  expect(!hint.forward && !hint.backward, "mid-window needs no preload");
  expect(b.current_position()->window == WindowIndex{2}, "position follows the active window");

  b.update_position(ChapterIndex{14}, 10, 10);
  expect(b.is_at_window_boundary(NavigationDirection::forward), "last page is the forward edge");
  b.update_position(ChapterIndex{10}, 0, 10);
  expect(b.is_at_window_boundary(NavigationDirection::backward), "first page is the backward edge");
  expect(!b.is_at_window_boundary(NavigationDirection::forward), "first page is not the end");

  b.update_position(ChapterIndex{10}, 25, 10);
  expect(b.current_position()->progress == 1.0, "progress clamps to 1");
  b.update_position(ChapterIndex{10}, 3, 0);
  expect(b.current_position()->progress == 0.0, "a window without pages has no progress");
  expect(throws_code([&] { (void)b.update_position(ChapterIndex{10}, -1, 10); },
                     lectern::ErrorCode::invalid_index),
         "negative page rejected");

  b.clear();
  expect(!b.current_position(), "clear drops the position");
  expect(!b.is_at_window_boundary(NavigationDirection::backward), "no edge without a position");

  ConveyorFixture gated(120, 5);
  gated.assembler->set_open(false);
  gated.buffer->initialize(WindowIndex{0});
  gated.buffer->update_position(ChapterIndex{0}, 0, 10);
  expect(!gated.buffer->is_at_window_boundary(NavigationDirection::backward),
         "no edge while the active window is still loading");

  expect(throws_code([] {
           lectern::WindowBufferManager m(
               lectern::WindowIndexer(10, 5), std::make_shared<ControlledAssembler>(10),
               lectern::BufferConfig{2, std::chrono::milliseconds(0), 1.5, 0.25});
         }, lectern::ErrorCode::invalid_config),
         "preload threshold above 1 rejected");
}

// ============================================================================
// Position restoration and previews
// ============================================================================

void test_restore_strategy() {
  lectern::SavedPosition saved{ChapterIndex{4}, 7, 1234, 16.0};
  expect(lectern::choose_restore_strategy(saved, 16.05) == lectern::RestoreStrategy::in_page,
         "small font change keeps in-page index");
  expect(lectern::choose_restore_strategy(saved, 16.15) ==
             lectern::RestoreStrategy::character_offset,
         "large font change uses character offset");
  lectern::SavedPosition zero{ChapterIndex{0}, 0, 0, 0.0};
  expect(lectern::choose_restore_strategy(zero, 0.1) == lectern::RestoreStrategy::character_offset,
         "delta equal to the tolerance uses character offset");

  reset_events();
  int chapter = -1;
  int in_page = -1;
  int offset = -1;
  lectern::RestoreCallbacks cb{[&](ChapterIndex c) { chapter = c.value; },
                               [&](int p) { in_page = p; }, [&](int o) { offset = o; }};
  expect(lectern::restore_position(saved, 16.05, cb) == lectern::RestoreStrategy::in_page,
         "in-page restore");
  expect(chapter == 4 && in_page == 7 && offset == -1, "navigated chapter then in-page");

  chapter = in_page = offset = -1;
  lectern::restore_position(saved, 18.0, cb);
  expect(chapter == 4 && in_page == -1 && offset == 1234, "navigated chapter then offset");
  expect(events(lectern::EventKind::position_restored) == 2, "restore events emitted");

  lectern::RestoreCallbacks missing{[](ChapterIndex) {}, nullptr, [](int) {}};
  expect(throws_code([&] { lectern::restore_position(saved, 16.0, missing); },
                     lectern::ErrorCode::invalid_config),
         "missing callback rejected");
}

void test_preview_extraction() {
  lectern::ChapterContent long_text;
  long_text.text = std::string(300, 'a');
  const auto mid = lectern::extract_preview(long_text, 150);
  expect(mid && mid->size() == 106, "context window plus two ellipses");
  expect(mid->substr(0, 3) == "..." && mid->substr(mid->size() - 3) == "...", "ellipses");

  const auto start = lectern::extract_preview(long_text, 0);
  expect(start && start->size() == 53 && start->substr(0, 3) != "...", "no leading ellipsis");

  const auto head = lectern::extract_preview_from_start(long_text);
  expect(head && head->size() == 103, "head preview capped at max length plus ellipsis");

  lectern::ChapterContent spaced;
  spaced.text = "  hello \n\n  world  ";
  expect(lectern::extract_preview(spaced, 3) == std::optional<std::string>("hello world"),
         "whitespace collapsed");

  lectern::ChapterContent html_only;
  html_only.html = "<p>Hi <b>there</b></p><script>x()</script>";
  expect(lectern::extract_preview(html_only, 0) == std::optional<std::string>("Hi there"),
         "markup stripped when there is no plain text");

  lectern::ChapterContent utf8;
  for (int i = 0; i < 100; ++i) utf8.text += "\xC3\xA9";
  const auto u = lectern::extract_preview(utf8, 51);
  expect(u && u->size() == 104, "boundaries land on character starts");

  lectern::ChapterContent empty;
  expect(!lectern::extract_preview(empty, 0), "empty chapter has no preview");
  expect(lectern::preview_or_placeholder(empty, 0) == lectern::kNoPreviewAvailable,
         "placeholder sentinel");
  lectern::ChapterContent blank;
  blank.text = " \n\t ";
  expect(lectern::preview_or_placeholder(blank, 2) == "No preview available", "blank text");
}

void test_percent_complete() {
  expect(std::fabs(lectern::percent_complete(ChapterIndex{5}, 1, 4, 10) - 0.525) < 1e-9,
         "percent within chapter");
  expect(std::fabs(lectern::percent_complete(ChapterIndex{9}, 3, 4, 10) - 0.975) < 1e-9,
         "percent in last chapter");
  expect(lectern::percent_complete(ChapterIndex{0}, 0, 1, 0) == 0.0, "empty book is 0");
  expect(lectern::percent_complete(ChapterIndex{12}, 0, 1, 10) == 1.0, "clamped to 1");
}

void test_position_record_json() {
  lectern::ChapterContent content;
  content.text = "It was a bright cold day in April, and the clocks were striking thirteen.";
  lectern::PageLocation loc{12, ChapterIndex{3}, 2, 20};
  const auto rec = lectern::make_position_record("doc-key", loc, content, 4, 10, 16.0,
                                                 1700000000000ULL);
  expect(std::fabs(rec.percent_complete - 0.35) < 1e-9, "percent from location");
  expect(rec.preview_text.find("bright cold day") != std::string::npos, "preview from offset");

  const std::string json = rec.to_json();
  expect(json.rfind("{\"chapter\":3,\"character_offset\":20,\"document_key\":\"doc-key\"", 0) == 0,
         "record keys sorted");
  std::optional<lectern::ErrorInfo> err;
  const auto back = lectern::position_record_from_json(json, &err);
  expect(back && !err, "record parses");
  expect(back->chapter.value == 3 && back->in_page == 2 && back->character_offset == 20,
         "location preserved");
  expect(back->timestamp_ms == 1700000000000ULL && back->font_size == 16.0, "metadata preserved");
  expect(back->preview_text == rec.preview_text, "preview preserved");
  expect(back->saved_position().font_size_at_save == 16.0, "saved position view");

  err.reset();
  expect(!lectern::position_record_from_json("{\"chapter\":1}", &err), "key required");
  expect(err && err->code == lectern::ErrorCode::parse_error, "missing key is a parse error");
  err.reset();
  expect(!lectern::position_record_from_json("{\"document_key\":", &err), "malformed rejected");
  expect(err && err->code == lectern::ErrorCode::parse_error, "malformed is a parse error");
}

// ============================================================================
// Configuration
// ============================================================================

void test_config_defaults_and_parsing() {
  lectern::ReaderConfig def;
  expect(!lectern::validate(def), "defaults are valid");
  expect(def.to_json() ==
             "{\"backward_cooldown_ms\":300,\"backward_preload_threshold\":0.25,"
             "\"chapters_per_window\":5,\"edge_threshold_pages\":2,"
             "\"font_size_tolerance\":0.1,\"forward_preload_threshold\":0.75,"
             "\"include_non_linear\":false,\"preview_context_chars\":50,\"preview_max_length\":100,"
             "\"working_set_radius\":2}",
         "default config JSON");

  std::optional<lectern::ErrorInfo> err;
  auto cfg = lectern::reader_config_from_json(
      "{\"chapters_per_window\":8,\"backward_cooldown_ms\":0,\"font_size_tolerance\":0.25}", &err);
  expect(!err, "valid config parses cleanly");
  expect(cfg.chapters_per_window == 8 && cfg.backward_cooldown_ms == 0, "ints read");
  expect(cfg.font_size_tolerance == 0.25, "double read");

  cfg = lectern::reader_config_from_json(
      "{\"include_non_linear\":true,\"forward_preload_threshold\":0.9}", &err);
  expect(!err, "bool and threshold parse cleanly");
  expect(cfg.include_non_linear, "bool read");
  expect(cfg.forward_preload_threshold == 0.9, "threshold read");

  cfg = lectern::reader_config_from_json("{\"include_non_linear\":1}", &err);
  expect(err && err->code == lectern::ErrorCode::invalid_config, "non-bool flag rejected");
  expect(!cfg.include_non_linear, "rejected flag keeps its default");

  err.reset();
  cfg = lectern::reader_config_from_json("{\"backward_preload_threshold\":1.5}", &err);
  expect(err && err->code == lectern::ErrorCode::invalid_config, "threshold above 1 rejected");
  expect(cfg.backward_preload_threshold == 0.25, "rejected threshold keeps its default");

  err.reset();
  cfg = lectern::reader_config_from_json("{\"chapters_per_window\":0,\"working_set_radius\":3}",
                                         &err);
  expect(err && err->code == lectern::ErrorCode::invalid_config, "zero window size rejected");
  expect(cfg.chapters_per_window == 5, "rejected key keeps its default");
  expect(cfg.working_set_radius == 3, "other keys still applied");

  err.reset();
  cfg = lectern::reader_config_from_json("{\"edge_threshold_pages\":-1}", &err);
  expect(err && err->code == lectern::ErrorCode::invalid_config, "negative threshold rejected");

  err.reset();
  cfg = lectern::reader_config_from_json("{not json", &err);
  expect(err && err->code == lectern::ErrorCode::parse_error, "malformed config");
  expect(cfg.chapters_per_window == 5, "malformed config yields defaults");
}

void test_config_env_overrides() {
  ::setenv("LECTERN_CHAPTERS_PER_WINDOW", "7", 1);
  ::setenv("LECTERN_WORKING_SET_RADIUS", "abc", 1);
  lectern::ReaderConfig cfg;
  std::optional<lectern::ErrorInfo> err;
  lectern::apply_env_overrides(cfg, &err);
  ::unsetenv("LECTERN_CHAPTERS_PER_WINDOW");
  ::unsetenv("LECTERN_WORKING_SET_RADIUS");

  expect(cfg.chapters_per_window == 7, "numeric override applied");
  expect(cfg.working_set_radius == 2, "bad override ignored");
  expect(err && err->code == lectern::ErrorCode::invalid_config, "bad override reported");
}

// ============================================================================
// JSON, hashing, content provider, assembler
// ============================================================================

void test_jsonlite_parsing() {
  std::optional<lectern::jsonlite::JsonError> err;
  auto obj = lectern::jsonlite::parse(
      "{\"a\":\"x\\u0041\\n\",\"b\":[\"p\",\"q\"],\"c\":-2.5,\"d\":true,\"e\":42}", &err);
  expect(!err, "valid JSON parses");
  expect(lectern::jsonlite::get_string(obj, "a", "") == "xA\n", "escapes decoded");
  expect(lectern::jsonlite::has_key(obj, "b"), "arrays parse");
  expect(lectern::jsonlite::get_double(obj, "c", 0.0) == -2.5, "negative double");
  expect(lectern::jsonlite::get_bool(obj, "d", false), "bool");
  expect(lectern::jsonlite::get_u64(obj, "e", 0) == 42, "u64");
  expect(lectern::jsonlite::get_u64(obj, "missing", 9) == 9, "default for missing key");

  const std::string raw = std::string("ctl\x01") + "\"q\"";
  const std::string escaped = lectern::jsonlite::escape(raw);
  expect(escaped == "ctl\\u0001\\\"q\\\"", "control characters escaped");
  obj = lectern::jsonlite::parse("{\"k\":\"" + escaped + "\"}", &err);
  expect(!err && lectern::jsonlite::get_string(obj, "k", "") == raw, "escape parses back");

  lectern::jsonlite::parse("[1,2]", &err);
  expect(err && err->code == "json_parse_error", "top-level array rejected");
  lectern::jsonlite::parse("{\"a\":1,\"a\":2}", &err);
  expect(err && err->code == "json_duplicate_key", "duplicate key rejected");
  expect(lectern::jsonlite::format_double(0.5) == "0.5", "format_double trims zeros");

  // Non-BMP characters arrive as surrogate pairs and must become one 4-byte sequence.
  obj = lectern::jsonlite::parse("{\"p\":\"a\\u00e9\\uD83D\\uDE00b\"}", &err);
  expect(!err, "surrogate pair parses");
  expect(lectern::jsonlite::get_string(obj, "p", "") == "a\xC3\xA9\xF0\x9F\x98\x80" "b",
         "surrogate pair decoded as one UTF-8 code point");
  lectern::jsonlite::parse("{\"p\":\"\\uDE00\"}", &err);
  expect(err && err->code == "json_parse_error", "lone low surrogate rejected");
  lectern::jsonlite::parse("{\"p\":\"\\uD83Dx\"}", &err);
  expect(err && err->code == "json_parse_error", "high surrogate without a pair rejected");
  lectern::jsonlite::parse("{\"p\":\"\\uD83D\\u0041\"}", &err);
  expect(err && err->code == "json_parse_error", "high surrogate followed by a BMP escape rejected");
}

void test_window_digest() {
  const std::string a = lectern::window_content_digest("<div>one</div>");
  const std::string b = lectern::window_content_digest("<div>two</div>");
  expect(a.size() == 64, "digest is 64 hex chars");
  expect(a != b, "digest depends on content");
  expect(a == lectern::window_content_digest("<div>one</div>"), "digest is deterministic");
  expect(a != lectern::blake3_hex("<div>one</div>"), "digest is domain separated");
}

struct TempBook {
  fs::path dir;

  TempBook() {
    static std::atomic<int> counter{0};
    dir = fs::temp_directory_path() /
          ("lectern_book_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
    fs::create_directories(dir);
  }
  ~TempBook() {
    std::error_code ec;
    fs::remove_all(dir, ec);
  }

  void write(const std::string& name, const std::string& data) const {
    std::ofstream ofs(dir / name, std::ios::binary);
    ofs << data;
  }
};

void test_directory_provider() {
  TempBook book;
  book.write("01-intro.html",
             "<html><head><title>Intro</title></head><body><h1>Intro</h1>"
             "<p>Hello &amp; welcome</p><script>var x = 1;</script></body></html>");
  book.write("02-notes.txt", "Notes line\n\nSecond paragraph\n");
  book.write("readme.md", "not a chapter");
  const std::string path = book.dir.string();

  lectern::DirectoryContentProvider provider;
  expect(provider.can_handle(path), "directory with chapters is handled");
  std::optional<lectern::ErrorInfo> err;
  expect(provider.chapter_count(path, &err) == std::optional<int>(2), "two chapter files");

  auto c0 = provider.chapter_content(path, ChapterIndex{0}, &err);
  expect(c0 && c0->text.find("Hello & welcome") != std::string::npos, "entities decoded");
  expect(c0->text.find("var x") == std::string::npos, "script skipped");
  expect(c0->html.find("<title>") == std::string::npos, "only body markup kept");

  auto c1 = provider.chapter_content(path, ChapterIndex{1}, &err);
  expect(c1 && c1->html == "<p>Notes line</p>\n<p>Second paragraph</p>\n", "text wrapped");

  const auto toc = provider.table_of_contents(path, &err);
  expect(toc.size() == 2 && toc[0].title == "Intro" && toc[1].title == "Notes line",
         "titles from markup and first line");
  expect(toc[0].kind == lectern::ChapterKind::content, "intro is content");
  expect(toc[1].kind == lectern::ChapterKind::non_linear, "notes file classified non-linear");

  err.reset();
  expect(!provider.chapter_content(path, ChapterIndex{5}, &err), "out of range");
  expect(err && err->code == lectern::ErrorCode::invalid_index, "out of range code");

  err.reset();
  lectern::DirectoryContentProvider other;
  expect(!other.chapter_count((book.dir / "readme.md").string(), &err), "file is not a book");
  expect(err && err->code == lectern::ErrorCode::parse_error, "not a book is a parse error");
}

void test_document_key() {
  TempBook book;
  book.write("a.txt", "alpha");
  book.write("b.txt", "beta");
  const std::string key = lectern::document_key(book.dir.string());
  expect(key.size() == 64, "document key is a BLAKE3 hex digest");
  expect(key == lectern::document_key(book.dir.string()), "key is stable");

  book.write("b.txt", "beta!");
  expect(lectern::document_key(book.dir.string()) != key, "key follows content");
  expect(lectern::document_key((book.dir / "missing").string()).empty(), "missing path");

  // A single file hashes "doc:" + name + '\0' + size + '\0' + bytes.
  const std::string framed("a.txt\0" "5\0" "alpha", 13);
  expect(lectern::document_key((book.dir / "a.txt").string()) ==
             lectern::hash_domain("doc:", framed),
         "file key covers name, size and bytes");
}

void test_assembler_markup() {
  auto provider = std::make_shared<InMemoryProvider>(7);
  provider->set_failing(6, true);
  lectern::ProviderWindowAssembler assembler(provider, "mem://book", 7);

  const auto data = assembler.assemble_window(WindowIndex{1}, ChapterIndex{5}, ChapterIndex{6});
  expect(data.has_value(), "window assembled despite a failing chapter");
  expect(data->html.find("data-window-index=\"1\"") != std::string::npos, "window root");
  expect(data->html.find("id=\"chapter-5\" data-chapter-index=\"5\" class=\"chapter-section\"") !=
             std::string::npos,
         "chapter section");
  expect(data->html.find("chapter-section chapter-unavailable") != std::string::npos,
         "failed chapter marked");
  expect(data->html.find("Chapter 7 is unavailable: bad chapter 6") != std::string::npos,
         "failure message rendered");
  expect(data->content_digest == lectern::window_content_digest(data->html), "digest attached");
  expect(data->chapter_count() == 2 && data->contains_chapter(ChapterIndex{6}), "range");

  expect(!assembler.can_assemble(WindowIndex{1}, ChapterIndex{5}, ChapterIndex{7}), "past end");
  expect(!assembler.assemble_window(WindowIndex{1}, ChapterIndex{5}, ChapterIndex{7}),
         "invalid range yields nothing");
}

// ============================================================================
// Observability and version
// ============================================================================

void test_latency_histogram() {
  lectern::LatencyHistogram h;
  for (int i = 0; i < 10; ++i) h.record(1000000);  // 1 ms
  expect(h.count() == 10, "count");
  expect(h.sum_us() == 10000, "sum in microseconds");
  expect(h.mean_us() == 1000.0, "mean");
  expect(h.to_json().find("\"count\":10") != std::string::npos, "histogram JSON");
  expect(h.percentile(0.5) == 768.0, "p50 is the midpoint of the [512, 1024) bucket");

  // A lone sample is every percentile, never the empty first bucket.
  lectern::LatencyHistogram single;
  single.record(5000);  // 5 us, bucket [4, 8)
  expect(single.percentile(0.5) == 6.0, "p50 of one sample");
  expect(single.percentile(0.0) == 6.0, "p0 of one sample");
  expect(single.percentile(0.99) == 6.0, "p99 of one sample");

  h.reset();
  expect(h.count() == 0 && h.sum_us() == 0 && h.percentile(0.5) == 0.0, "histogram reset");
}

void test_reader_stats() {
  lectern::ReaderStats stats;
  lectern::ReaderEvent ev;
  ev.kind = lectern::EventKind::shift_forward;
  ev.window = 5;
  stats.record(ev);
  ev.kind = lectern::EventKind::window_materialized;
  ev.duration_ns = 2000;
  stats.record(ev);
  expect(stats.shifts_forward.load() == 1, "shift counted");
  expect(stats.materialization_latency.count() == 1, "latency recorded");
  expect(stats.to_json().find("\"shifts_forward\":1") != std::string::npos, "stats JSON");
  expect(stats.recent_events_snapshot().size() == 2, "events kept in the ring");

  for (size_t i = 0; i < lectern::ReaderStats::kMaxRecentEvents + 10; ++i) stats.record(ev);
  expect(stats.recent_events_snapshot().size() == lectern::ReaderStats::kMaxRecentEvents,
         "ring is bounded");
  stats.reset();
  expect(stats.shifts_forward.load() == 0 && stats.recent_events_snapshot().empty(), "reset");
  expect(stats.windows_materialized.load() == 0, "materializations reset");
  expect(stats.materialization_latency.count() == 0, "materialization latency reset");
  expect(stats.materialization_latency.sum_us() == 0, "materialization latency sum reset");
  expect(stats.to_json().find("\"count\":1") == std::string::npos, "no stale latency in JSON");

  const std::string line = lectern::event_to_json(ev);
  expect(line.find("\"kind\":\"window_materialized\"") != std::string::npos, "event JSON kind");
  expect(line.find("\"window\":5") != std::string::npos, "event JSON window");
}

void test_version_manifest() {
  const auto m = lectern::version::current_manifest("9.9.9");
  expect(m.semver == "9.9.9", "semver override");
  const std::string json = lectern::version::manifest_to_json(m);
  expect(json.find("\"position_record\":1") != std::string::npos, "record version listed");
  expect(json.find("blake3") != std::string::npos, "hash primitive listed");
}

}  // namespace

int main() {
  lectern::set_event_hook(&count_event);
  std::cout << "=== Lectern Engine Test Suite ===\n";

  std::cout << "\n[Window indexer]\n";
  run_test("partition covers every chapter", test_indexer_partition);
  run_test("62-chapter book", test_indexer_example_book);
  run_test("bad input rejected", test_indexer_rejects_bad_input);
  run_test("debug window map", test_indexer_debug_map);

  std::cout << "\n[Working-set paginator]\n";
  run_test("initialize failure", test_paginator_initialize_failure);
  run_test("titles and fallback page counts", test_paginator_titles_and_fallback_counts);
  run_test("working set at book edges", test_paginator_working_set_edges);
  run_test("reflow shifts later chapters", test_paginator_reflow_shifts_later_chapters);
  run_test("global navigation re-centers", test_paginator_global_navigation_recenters);
  run_test("in-page clamp and offset estimate", test_paginator_in_page_clamp_and_offset);
  run_test("eviction", test_paginator_eviction);
  run_test("failed chapter placeholder + retry", test_paginator_failed_chapter_placeholder);
  run_test("repaginate and window info", test_paginator_repaginate_and_info);

  std::cout << "\n[Chapter map]\n";
  run_test("visible chapters and windows", test_chapter_map_visibility);
  run_test("kinds from the table of contents", test_chapter_map_from_toc);
  run_test("chapter file classification", test_classify_chapter_name);

  std::cout << "\n[Window buffer]\n";
  run_test("120-chapter conveyor walk", test_conveyor_end_to_end);
  run_test("initialize clamps", test_conveyor_initialize_clamps);
  run_test("book boundaries", test_conveyor_boundaries);
  run_test("phase transition fires once", test_conveyor_phase_transition_once);
  run_test("loading then ready", test_conveyor_loading_then_ready);
  run_test("stale results discarded", test_conveyor_discards_stale_results);
  run_test("failed window retried", test_conveyor_failed_window_retried);
  run_test("no duplicate materialization", test_conveyor_no_duplicate_materialization);
  run_test("shift hints", test_conveyor_shift_hints);
  run_test("backward cooldown", test_conveyor_backward_cooldown);
  run_test("random shifts keep invariants (300x)", test_conveyor_random_shifts_keep_invariants);
  run_test("reading position and window edges", test_conveyor_reading_position);

  std::cout << "\n[Position restoration]\n";
  run_test("restore strategy", test_restore_strategy);
  run_test("preview extraction", test_preview_extraction);
  run_test("percent complete", test_percent_complete);
  run_test("position record JSON", test_position_record_json);

  std::cout << "\n[Configuration]\n";
  run_test("defaults and parsing", test_config_defaults_and_parsing);
  run_test("environment overrides", test_config_env_overrides);

  std::cout << "\n[Content and hashing]\n";
  run_test("jsonlite parsing", test_jsonlite_parsing);
  run_test("window digest", test_window_digest);
  run_test("directory provider", test_directory_provider);
  run_test("document key", test_document_key);
  run_test("assembler markup", test_assembler_markup);

  std::cout << "\n[Observability]\n";
  run_test("latency histogram", test_latency_histogram);
  run_test("reader stats", test_reader_stats);
  run_test("version manifest", test_version_manifest);

  lectern::set_event_hook(nullptr);
  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
