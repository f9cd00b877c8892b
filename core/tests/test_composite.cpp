#include "doctest/doctest.h"
#include "idelens/inspector.hpp"
#include "idelens/report.hpp"
#include "ide_fixture.hpp"
#include <set>

using namespace idelens;
using namespace idelens_test;

static UIElementInfo button(std::string name) {
  UIElementInfo e;
  e.control_type = 50000;
  e.name = std::move(name);
  e.bounding_rect = {410, 810, 480, 830};
  e.enabled = true;
  e.visible = true;
  return e;
}

DOCTEST_TEST_CASE("full IDE capture covers every tool window role") {
  FakeBackend fb;
  populate_ide(fb);
  fb.set_grab_delay(std::chrono::milliseconds(10));
  Inspector in(&fb);

  auto cc = in.capture_full_ide();
  DOCTEST_REQUIRE(!cc.primary.empty());
  DOCTEST_REQUIRE_EQ(cc.primary.width, 1920);
  DOCTEST_REQUIRE_EQ(cc.primary.height, 1080);
  DOCTEST_REQUIRE(cc.layout.main_window.has_value());

  DOCTEST_REQUIRE_EQ(cc.windows.size(), 5u);
  std::set<Role> roles;
  for (const auto &w : cc.windows) {
    DOCTEST_REQUIRE(!w.empty());
    DOCTEST_REQUIRE_EQ(w.annotations.size(), 1u);
    roles.insert(w.role);
  }
  std::set<Role> expected = {Role::SolutionExplorer, Role::PropertiesPanel,
                             Role::DiagnosticsList, Role::OutputLog,
                             Role::CodeEditor};
  DOCTEST_REQUIRE(roles == expected);

  // primary plus one grab per panel
  DOCTEST_REQUIRE_EQ(fb.grabs(), 6);
  DOCTEST_REQUIRE_EQ(cc.metadata.at("captured_windows").as_num(), 5.0);
  DOCTEST_REQUIRE_EQ(cc.metadata.at("window_count").as_num(), 7.0);
  DOCTEST_REQUIRE_EQ(cc.metadata.at("window_roles").as_arr().size(), 6u);
  DOCTEST_REQUIRE(cc.metadata.at("failed_windows").as_arr().empty());
  DOCTEST_REQUIRE(cc.metadata.at("total_ms").is_num());
}

DOCTEST_TEST_CASE("a failed panel capture is left out and recorded") {
  FakeBackend fb;
  populate_ide(fb);
  fb.fail_grab(kErrors);
  Inspector in(&fb);

  Logger::get().clear_recent();
  auto cc = in.capture_full_ide();
  DOCTEST_REQUIRE_EQ(cc.windows.size(), 4u);
  for (const auto &w : cc.windows)
    DOCTEST_REQUIRE(w.role != Role::DiagnosticsList);
  const auto &failed = cc.metadata.at("failed_windows").as_arr();
  DOCTEST_REQUIRE_EQ(failed.size(), 1u);
  DOCTEST_REQUIRE(failed[0].as_str() == "DiagnosticsList");
  DOCTEST_REQUIRE(logged("composite: no image for DiagnosticsList"));
}

DOCTEST_TEST_CASE("full capture without a main window has an empty primary") {
  FakeBackend fb;
  populate_ide(fb);
  fb.remove_window(kMain);
  fb.remove_window(kMainPane);
  fb.remove_window(kForeignChild);
  Inspector in(&fb);

  auto cc = in.capture_full_ide();
  DOCTEST_REQUIRE(cc.primary.empty());
  DOCTEST_REQUIRE(!cc.layout.main_window.has_value());
  DOCTEST_REQUIRE_EQ(cc.windows.size(), 5u);
}

DOCTEST_TEST_CASE("full capture of a desktop without the IDE") {
  FakeBackend fb;
  fb.set_process(200, "notepad.exe");
  fb.add_window({1, 0, 200, "notes.txt - Notepad", "Notepad", {0, 0, 640, 480},
                 true});
  Inspector in(&fb);

  auto cc = in.capture_full_ide_async().get();
  DOCTEST_REQUIRE(cc.primary.empty());
  DOCTEST_REQUIRE(cc.windows.empty());
  DOCTEST_REQUIRE(cc.layout.all_windows.empty());
  DOCTEST_REQUIRE_EQ(fb.grabs(), 0);
}

DOCTEST_TEST_CASE("capture with annotation reads UI elements") {
  FakeBackend fb;
  populate_ide(fb);
  fb.add_fake_ui_element(kErrors, button("2 Errors"));
  fb.add_fake_ui_element(kErrors, button("5 Warnings"));
  Inspector in(&fb);

  auto s = in.capture_with_annotation(kErrors);
  DOCTEST_REQUIRE(!s.empty());
  DOCTEST_REQUIRE(s.role == Role::DiagnosticsList);
  DOCTEST_REQUIRE_EQ(s.ui_elements.size(), 2u);
  DOCTEST_REQUIRE_EQ(s.ui_elements[0].bounds.x, 10);
  DOCTEST_REQUIRE_EQ(s.ui_elements[0].bounds.y, 10);
  const auto &m = std::get<DiagnosticsMetadata>(s.role_metadata);
  DOCTEST_REQUIRE(m.error_count == 2);
  DOCTEST_REQUIRE(m.warning_count == 5);
  DOCTEST_REQUIRE(s.metadata.at("window_title").as_str() == "Error List");
}

DOCTEST_TEST_CASE("explicit role overrides classification") {
  FakeBackend fb;
  populate_ide(fb);
  Inspector in(&fb);

  auto s = in.capture_with_annotation(kOutput, Role::DiagnosticsList);
  DOCTEST_REQUIRE(s.role == Role::DiagnosticsList);
  DOCTEST_REQUIRE(s.annotations[0].color == "#E81123");

  auto rejected = in.capture_with_annotation_async(kNotepad, Role::CodeEditor).get();
  DOCTEST_REQUIRE(rejected.empty());
  DOCTEST_REQUIRE(rejected.role == Role::CodeEditor);
  DOCTEST_REQUIRE_THROWS_AS(in.capture_with_annotation(0), std::invalid_argument);
}

DOCTEST_TEST_CASE("capture by role prefers the active editor") {
  FakeBackend fb;
  populate_ide(fb);
  fb.add_window({0x25, 0, kIdePid, "Helpers.cs - MyApp - Microsoft Visual Studio",
                 "EditorPane", {300, 100, 1600, 800}, true});
  fb.set_foreground(0x25);
  Inspector in(&fb);

  auto s = in.capture_by_role(Role::CodeEditor);
  DOCTEST_REQUIRE(!s.empty());
  DOCTEST_REQUIRE(s.metadata.at("window_title").as_str() ==
                  "Helpers.cs - MyApp - Microsoft Visual Studio");
  const auto &m = std::get<CodeEditorMetadata>(s.role_metadata);
  DOCTEST_REQUIRE(m.file_name == "Helpers.cs");

  auto props = in.capture_by_role(Role::PropertiesPanel);
  DOCTEST_REQUIRE_EQ(props.width, 180);

  auto none = in.capture_by_role(Role::Toolbox);
  DOCTEST_REQUIRE(none.empty());
  DOCTEST_REQUIRE(none.role == Role::Toolbox);

  DOCTEST_REQUIRE_EQ(in.capture_by_role_async(Role::PropertiesPanel).get().width,
                     180);
}

DOCTEST_TEST_CASE("capture by title") {
  FakeBackend fb;
  populate_ide(fb);
  Inspector in(&fb);

  auto c = in.capture_window_by_title("error list");
  DOCTEST_REQUIRE_EQ(c.width, 1100);
  DOCTEST_REQUIRE(in.capture_window_by_title("notes.txt").empty());
  DOCTEST_REQUIRE_THROWS_AS(in.capture_window_by_title(""), std::invalid_argument);
  DOCTEST_REQUIRE_EQ(in.capture_window_by_title_async("Error List").get().width,
                     1100);
  DOCTEST_REQUIRE_THROWS_AS(in.capture_window_by_title_async(""),
                            std::invalid_argument);
}

DOCTEST_TEST_CASE("composite report") {
  FakeBackend fb;
  populate_ide(fb);
  Inspector in(&fb);

  auto o = composite_capture_to_json(in.capture_full_ide());
  DOCTEST_REQUIRE(o.at("primary").as_obj().at("encoding").as_str() == "BMP");
  DOCTEST_REQUIRE(o.at("primary").as_obj().count("data_b64") == 0);
  DOCTEST_REQUIRE_EQ(o.at("windows").as_arr().size(), 5u);
  const auto &dock = o.at("layout").as_obj().at("docking").as_obj();
  DOCTEST_REQUIRE_EQ(dock.at("right").as_arr().size(), 2u);
  DOCTEST_REQUIRE(dock.at("editor_area").as_obj().at("hwnd").as_str() == "0x23");

  auto json_text = json::dumps(o);
  DOCTEST_REQUIRE(json_text.find("\"role\":\"SolutionExplorer\"") !=
                  std::string::npos);
}
