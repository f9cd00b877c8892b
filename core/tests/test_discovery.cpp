#include "doctest/doctest.h"
#include "idelens/inspector.hpp"
#include "idelens/window_discovery.hpp"
#include "idelens/window_enumerator.hpp"
#include "ide_fixture.hpp"
#include <thread>

using namespace idelens;
using namespace idelens_test;

static bool contains_handle(const std::vector<Window> &ws, hwnd_u64 h) {
  for (const auto &w : ws)
    if (w.handle == h)
      return true;
  return false;
}

DOCTEST_TEST_CASE("enumeration walks the whole tree") {
  FakeBackend fb({
      {1, 0, 7, "A", "C1", {0, 0, 10, 10}, true},
      {2, 0, 7, "B", "C2", {0, 0, 10, 10}, true},
      {3, 1, 7, "A.1", "C3", {0, 0, 10, 10}, true},
      {4, 3, 7, "A.1.1", "C4", {0, 0, 10, 10}, true},
  });
  fb.set_foreground(3);
  WindowEnumerator en(fb, EnumerationConfig{});

  auto e = en.enumerate();
  DOCTEST_REQUIRE(!e.timed_out);
  DOCTEST_REQUIRE_EQ(e.windows.size(), 2u);
  DOCTEST_REQUIRE_EQ(e.windows[0].children.size(), 1u);
  const auto &child = e.windows[0].children[0];
  DOCTEST_REQUIRE_EQ(child.handle, 3u);
  DOCTEST_REQUIRE(child.active);
  DOCTEST_REQUIRE(child.parent.has_value());
  DOCTEST_REQUIRE_EQ(*child.parent, 1u);
  DOCTEST_REQUIRE_EQ(child.children.size(), 1u);
  DOCTEST_REQUIRE(!e.windows[0].parent.has_value());
  DOCTEST_REQUIRE(!e.windows[0].active);
}

DOCTEST_TEST_CASE("child depth is bounded") {
  FakeBackend fb({
      {1, 0, 7, "A", "C", {0, 0, 10, 10}, true},
      {2, 1, 7, "B", "C", {0, 0, 10, 10}, true},
      {3, 2, 7, "C", "C", {0, 0, 10, 10}, true},
  });
  EnumerationConfig cfg;
  cfg.max_child_depth = 1;
  WindowEnumerator en(fb, cfg);

  auto e = en.enumerate();
  DOCTEST_REQUIRE_EQ(e.windows[0].children.size(), 1u);
  DOCTEST_REQUIRE(e.windows[0].children[0].children.empty());
}

DOCTEST_TEST_CASE("hidden windows are skipped unless requested") {
  FakeBackend fb({
      {1, 0, 7, "A", "C", {0, 0, 10, 10}, true},
      {2, 0, 7, "B", "C", {0, 0, 10, 10}, false},
      {3, 1, 7, "A.1", "C", {0, 0, 10, 10}, false},
  });
  WindowEnumerator visible_only(fb, EnumerationConfig{});
  auto e = visible_only.enumerate();
  DOCTEST_REQUIRE_EQ(e.windows.size(), 1u);
  DOCTEST_REQUIRE(e.windows[0].children.empty());

  EnumerationConfig cfg;
  cfg.include_hidden = true;
  WindowEnumerator all(fb, cfg);
  auto e2 = all.enumerate();
  DOCTEST_REQUIRE_EQ(e2.windows.size(), 2u);
  DOCTEST_REQUIRE_EQ(e2.windows[0].children.size(), 1u);
}

DOCTEST_TEST_CASE("a window that fails to read is skipped") {
  FakeBackend fb({
      {1, 0, 7, "A", "C", {0, 0, 10, 10}, true},
      {2, 0, 7, "B", "C", {0, 0, 10, 10}, true},
      {3, 0, 7, "C", "C", {0, 0, 10, 10}, true},
  });
  fb.fail_info(2);
  WindowEnumerator en(fb, EnumerationConfig{});

  auto e = en.enumerate();
  DOCTEST_REQUIRE_EQ(e.windows.size(), 2u);
  DOCTEST_REQUIRE_EQ(e.skipped, 1u);
  DOCTEST_REQUIRE(!contains_handle(e.windows, 2));
}

DOCTEST_TEST_CASE("enumeration past its deadline returns what it has") {
  std::vector<FakeWindow> ws;
  for (hwnd_u64 h = 1; h <= 20; ++h)
    ws.push_back({h, 0, 7, "W", "C", {0, 0, 10, 10}, true});
  FakeBackend fb(ws);
  fb.set_info_delay(std::chrono::milliseconds(20));
  WindowEnumerator en(fb, EnumerationConfig{});

  Logger::get().clear_recent();
  auto e = en.enumerate(std::chrono::milliseconds(70));
  DOCTEST_REQUIRE(e.timed_out);
  DOCTEST_REQUIRE(!e.windows.empty());
  DOCTEST_REQUIRE(e.windows.size() < 20u);
  DOCTEST_REQUIRE(logged("enumerate: timed out after"));
}

DOCTEST_TEST_CASE("a blocked window read does not hold the caller past the deadline") {
  FakeBackend fb({{1, 0, 7, "W", "C", {0, 0, 10, 10}, true}});
  fb.set_info_delay(std::chrono::milliseconds(600));
  WindowEnumerator en(fb, EnumerationConfig{});

  Logger::get().clear_recent();
  auto started = std::chrono::steady_clock::now();
  auto e = en.enumerate(std::chrono::milliseconds(50));
  auto waited = std::chrono::steady_clock::now() - started;

  DOCTEST_REQUIRE(waited < std::chrono::milliseconds(400));
  DOCTEST_REQUIRE(e.timed_out);
  DOCTEST_REQUIRE(e.windows.empty());
  DOCTEST_REQUIRE(logged("enumerate: timed out after"));
}

DOCTEST_TEST_CASE("windows read before the deadline survive a timeout") {
  FakeBackend fb({
      {1, 0, 7, "A", "C", {0, 0, 10, 10}, true},
      {2, 0, 7, "B", "C", {0, 0, 10, 10}, true},
  });
  fb.set_info_delay(std::chrono::milliseconds(30));
  WindowEnumerator en(fb, EnumerationConfig{});

  // The second read ends past the deadline.
  auto e = en.enumerate(std::chrono::milliseconds(45));
  DOCTEST_REQUIRE(e.timed_out);
  DOCTEST_REQUIRE(e.windows.size() <= 1u);
}

DOCTEST_TEST_CASE("concurrent enumerations share one walk") {
  std::vector<FakeWindow> ws;
  for (hwnd_u64 h = 1; h <= 10; ++h)
    ws.push_back({h, 0, 7, "W", "C", {0, 0, 10, 10}, true});
  FakeBackend fb(ws);
  fb.set_info_delay(std::chrono::milliseconds(20));
  WindowEnumerator en(fb, EnumerationConfig{});

  auto first = std::async(std::launch::async, [&] { return en.enumerate(); });
  std::this_thread::sleep_for(std::chrono::milliseconds(40));
  auto second = en.enumerate();
  auto a = first.get();

  DOCTEST_REQUIRE_EQ(en.walks(), 1u);
  DOCTEST_REQUIRE_EQ(fb.top_walks(), 1);
  DOCTEST_REQUIRE_EQ(a.windows.size(), 10u);
  DOCTEST_REQUIRE_EQ(second.windows.size(), 10u);

  // Once the walk is over the next caller starts a new one.
  fb.set_info_delay(std::chrono::milliseconds(0));
  en.enumerate();
  DOCTEST_REQUIRE_EQ(en.walks(), 2u);
}

DOCTEST_TEST_CASE("discovery keeps only allow-listed IDE windows") {
  FakeBackend fb;
  populate_ide(fb);
  Inspector in(&fb);

  auto roots = in.discover_windows();
  DOCTEST_REQUIRE_EQ(roots.size(), 6u);
  DOCTEST_REQUIRE(!contains_handle(roots, kNotepad));
  DOCTEST_REQUIRE(!contains_handle(roots, kHiddenToolbox));
  DOCTEST_REQUIRE(!contains_handle(roots, kGoneWindow));
  for (const auto &w : roots)
    DOCTEST_REQUIRE_EQ(w.pid, kIdePid);

  DOCTEST_REQUIRE_EQ(roots[0].handle, kMain);
  DOCTEST_REQUIRE(roots[0].role == Role::MainWindow);
  // The plugin child belongs to a process that is not allow-listed.
  DOCTEST_REQUIRE_EQ(roots[0].children.size(), 1u);
  DOCTEST_REQUIRE_EQ(roots[0].children[0].handle, kMainPane);
  DOCTEST_REQUIRE(roots[0].children[0].role == Role::Unknown);
}

DOCTEST_TEST_CASE("own windows are capturable but never discovered") {
  FakeBackend fb;
  populate_ide(fb);
  fb.set_current_pid(4242);
  fb.set_process(4242, "idelens_probe.exe");
  fb.add_window({0x99, 0, 4242, "Output", "GenericPane", {0, 0, 200, 100}, true});
  Inspector in(&fb);

  auto all = flatten_windows(in.discover_windows(), true);
  DOCTEST_REQUIRE(!contains_handle(all, 0x99));
  DOCTEST_REQUIRE(in.find_windows_by_role(Role::OutputLog).size() == 1u);
  DOCTEST_REQUIRE(in.analyze_layout().all_windows.size() == 7u);
  DOCTEST_REQUIRE(in.classify_window(0x99) == Role::Unknown);

  DOCTEST_REQUIRE_EQ(in.capture_window(0x99).width, 200);
  DOCTEST_REQUIRE(!in.capture_with_annotation(0x99).empty());
}

DOCTEST_TEST_CASE("every discovered window carries its role") {
  FakeBackend fb;
  populate_ide(fb);
  Inspector in(&fb);

  auto flat = flatten_windows(in.discover_windows(), true);
  for (const auto &w : flat)
    DOCTEST_REQUIRE(w.role == classify(w.class_name, w.title));
  DOCTEST_REQUIRE(in.find_windows_by_role(Role::SolutionExplorer).size() == 1u);
  DOCTEST_REQUIRE(in.find_windows_by_role(Role::Toolbox).empty());
  DOCTEST_REQUIRE(in.find_windows_by_role_async(Role::OutputLog).get().size() ==
                  1u);
}

DOCTEST_TEST_CASE("classify_window is Unknown for rejected windows") {
  FakeBackend fb;
  populate_ide(fb);
  Inspector in(&fb);

  DOCTEST_REQUIRE(in.classify_window(kErrors) == Role::DiagnosticsList);
  DOCTEST_REQUIRE(in.classify_window(kNotepad) == Role::Unknown);
  DOCTEST_REQUIRE(in.classify_window(kGoneWindow) == Role::Unknown);
  DOCTEST_REQUIRE(in.classify_window(0xDEAD) == Role::Unknown);
  DOCTEST_REQUIRE(in.classify_window_async(kEditor).get() == Role::CodeEditor);
  DOCTEST_REQUIRE_THROWS_AS(in.classify_window(0), std::invalid_argument);
}

DOCTEST_TEST_CASE("active window follows the foreground") {
  FakeBackend fb;
  populate_ide(fb);
  Inspector in(&fb);

  auto active = in.get_active_window();
  DOCTEST_REQUIRE(active.has_value());
  DOCTEST_REQUIRE_EQ(active->handle, kEditor);
  DOCTEST_REQUIRE(active->active);
  DOCTEST_REQUIRE(active->role == Role::CodeEditor);

  fb.set_foreground(kNotepad);
  DOCTEST_REQUIRE(!in.get_active_window().has_value());
  fb.set_foreground(0);
  DOCTEST_REQUIRE(!in.get_active_window_async().get().has_value());
}

DOCTEST_TEST_CASE("flatten_windows is depth-first preorder") {
  Window a;
  a.handle = 1;
  Window b;
  b.handle = 2;
  Window c;
  c.handle = 3;
  b.children.push_back(c);
  a.children.push_back(b);
  Window d;
  d.handle = 4;

  auto flat = flatten_windows({a, d}, true);
  DOCTEST_REQUIRE_EQ(flat.size(), 4u);
  DOCTEST_REQUIRE_EQ(flat[0].handle, 1u);
  DOCTEST_REQUIRE_EQ(flat[1].handle, 2u);
  DOCTEST_REQUIRE_EQ(flat[2].handle, 3u);
  DOCTEST_REQUIRE_EQ(flat[3].handle, 4u);
  DOCTEST_REQUIRE_EQ(flatten_windows({a, d}, false).size(), 2u);
}
