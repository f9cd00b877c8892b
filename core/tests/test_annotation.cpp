#include "doctest/doctest.h"
#include "idelens/annotation_engine.hpp"

using namespace idelens;

static UIElementInfo element(int control_type, std::string name,
                             Rect r = {0, 0, 10, 10}) {
  UIElementInfo e;
  e.control_type = control_type;
  e.name = std::move(name);
  e.bounding_rect = r;
  e.enabled = true;
  e.visible = true;
  return e;
}

static Capture sized(int w, int h) {
  Capture c;
  c.width = w;
  c.height = h;
  c.data.assign(16, 1);
  return c;
}

DOCTEST_TEST_CASE("outline geometry per role") {
  auto se = role_annotations(Role::SolutionExplorer, 300, 800);
  DOCTEST_REQUIRE_EQ(se.size(), 1u);
  DOCTEST_REQUIRE(se[0].type == AnnotationType::Outline);
  DOCTEST_REQUIRE_EQ(se[0].bounds.x, 10);
  DOCTEST_REQUIRE_EQ(se[0].bounds.y, 50);
  DOCTEST_REQUIRE_EQ(se[0].bounds.width, 280);
  DOCTEST_REQUIRE_EQ(se[0].bounds.height, 700);
  DOCTEST_REQUIRE(se[0].color == "#0078D4");
  DOCTEST_REQUIRE(*se[0].label == "Solution Explorer Tree");
  DOCTEST_REQUIRE(se[0].properties.at("role").as_str() == "SolutionExplorer");

  auto pp = role_annotations(Role::PropertiesPanel, 300, 800);
  DOCTEST_REQUIRE_EQ(pp[0].bounds.x, 5);
  DOCTEST_REQUIRE_EQ(pp[0].bounds.y, 30);
  DOCTEST_REQUIRE_EQ(pp[0].bounds.width, 290);
  DOCTEST_REQUIRE_EQ(pp[0].bounds.height, 740);
  DOCTEST_REQUIRE(pp[0].color == "#0078D4");

  auto dl = role_annotations(Role::DiagnosticsList, 1000, 300);
  DOCTEST_REQUIRE(dl[0].color == "#E81123");
  DOCTEST_REQUIRE(*dl[0].label == "Error List");

  auto ce = role_annotations(Role::CodeEditor, 1000, 700);
  DOCTEST_REQUIRE_EQ(ce[0].bounds.x, 5);
  DOCTEST_REQUIRE_EQ(ce[0].bounds.y, 5);
  DOCTEST_REQUIRE_EQ(ce[0].bounds.width, 990);
  DOCTEST_REQUIRE_EQ(ce[0].bounds.height, 690);
  DOCTEST_REQUIRE(ce[0].color == "#569CD6");

  auto other = role_annotations(Role::OutputLog, 100, 50);
  DOCTEST_REQUIRE_EQ(other[0].bounds.x, 1);
  DOCTEST_REQUIRE_EQ(other[0].bounds.width, 98);
  DOCTEST_REQUIRE_EQ(other[0].bounds.height, 48);
  DOCTEST_REQUIRE(other[0].color == "#666666");
}

DOCTEST_TEST_CASE("outline sizes never go negative") {
  auto a = role_annotations(Role::SolutionExplorer, 0, 0);
  DOCTEST_REQUIRE_EQ(a[0].bounds.width, 0);
  DOCTEST_REQUIRE_EQ(a[0].bounds.height, 0);
}

DOCTEST_TEST_CASE("file name and language from the window title") {
  DOCTEST_REQUIRE(file_name_from_title("Program.cs - MyApp - Microsoft Visual Studio") ==
                  "Program.cs");
  DOCTEST_REQUIRE(file_name_from_title("  main.cpp  \xE2\x80\x94 Engine") ==
                  "main.cpp");
  DOCTEST_REQUIRE(!file_name_from_title("MyApp - Microsoft Visual Studio"));
  DOCTEST_REQUIRE(!file_name_from_title(""));

  DOCTEST_REQUIRE(language_for_file("Program.cs") == "C#");
  DOCTEST_REQUIRE(language_for_file("MAIN.CPP") == "C++");
  DOCTEST_REQUIRE(language_for_file("MainPage.xaml") == "XAML");
  DOCTEST_REQUIRE(!language_for_file("README"));
  DOCTEST_REQUIRE(!language_for_file("notes.txt"));
}

DOCTEST_TEST_CASE("leading counts") {
  DOCTEST_REQUIRE(leading_count("3 Errors", "Error") == 3);
  DOCTEST_REQUIRE(leading_count("1 Error", "Error") == 1);
  DOCTEST_REQUIRE(leading_count(" 12 warnings", "Warning") == 12);
  DOCTEST_REQUIRE(!leading_count("Errors", "Error"));
  DOCTEST_REQUIRE(!leading_count("3 Errorless", "Error"));
  DOCTEST_REQUIRE(!leading_count("3 Messages", "Error"));
}

DOCTEST_TEST_CASE("UI element types depend on the role") {
  auto item = element(50007, "CS0103");
  DOCTEST_REQUIRE(ui_element_type_for(item, Role::DiagnosticsList) ==
                  UiElementType::ErrorItem);
  DOCTEST_REQUIRE(ui_element_type_for(item, Role::OutputLog) ==
                  UiElementType::ListItem);
  DOCTEST_REQUIRE(ui_element_type_for(element(50029, ""), Role::PropertiesPanel) ==
                  UiElementType::PropertyItem);
  DOCTEST_REQUIRE(ui_element_type_for(element(50020, ""), Role::CodeEditor) ==
                  UiElementType::CodeLine);
  DOCTEST_REQUIRE(ui_element_type_for(element(50020, ""), Role::Toolbox) ==
                  UiElementType::Label);
  DOCTEST_REQUIRE(ui_element_type_for(element(50000, ""), Role::Toolbox) ==
                  UiElementType::Button);
  DOCTEST_REQUIRE(ui_element_type_for(element(50024, ""), Role::Toolbox) ==
                  UiElementType::TreeNode);
  DOCTEST_REQUIRE(ui_element_type_for(element(12345, ""), Role::Toolbox) ==
                  UiElementType::Label);
}

DOCTEST_TEST_CASE("UI elements are flattened relative to the window") {
  auto root = element(50024, "Solution 'MyApp' (2 of 2 projects)",
                      {110, 220, 300, 240});
  root.children.push_back(element(50024, "MyApp", {120, 240, 300, 260}));
  root.automation_id = "root";

  auto out = to_ui_elements({root}, Role::SolutionExplorer, {100, 200, 400, 800});
  DOCTEST_REQUIRE_EQ(out.size(), 2u);
  DOCTEST_REQUIRE(out[0].type == UiElementType::TreeNode);
  DOCTEST_REQUIRE_EQ(out[0].bounds.x, 10);
  DOCTEST_REQUIRE_EQ(out[0].bounds.y, 20);
  DOCTEST_REQUIRE_EQ(out[0].bounds.width, 190);
  DOCTEST_REQUIRE(*out[0].text == "Solution 'MyApp' (2 of 2 projects)");
  DOCTEST_REQUIRE(out[0].properties.at("automation_id").as_str() == "root");
  DOCTEST_REQUIRE_EQ(out[0].properties.at("control_type").as_num(), 50024.0);
  DOCTEST_REQUIRE(out[0].properties.at("enabled").as_bool());
  DOCTEST_REQUIRE_EQ(out[1].bounds.x, 20);
}

DOCTEST_TEST_CASE("solution explorer metadata") {
  auto root = element(50024, "Solution 'MyApp' (3 of 3 projects)");
  auto app = element(50024, "MyApp");
  app.children.push_back(element(50024, "Program.cs"));
  root.children.push_back(app);
  root.children.push_back(element(50024, "Tests"));

  auto m = std::get<SolutionExplorerMetadata>(
      role_metadata(Role::SolutionExplorer, std::nullopt, {root}));
  DOCTEST_REQUIRE(m.project_count == 3);
  DOCTEST_REQUIRE_EQ(m.expanded_nodes.size(), 2u);
  DOCTEST_REQUIRE(m.expanded_nodes[0] == "Solution 'MyApp' (3 of 3 projects)");
  DOCTEST_REQUIRE(m.expanded_nodes[1] == "MyApp");

  auto single = std::get<SolutionExplorerMetadata>(role_metadata(
      Role::SolutionExplorer, std::nullopt,
      {element(50024, "Solution 'Tool' (1 project)")}));
  DOCTEST_REQUIRE(single.project_count == 1);

  auto widest = std::get<SolutionExplorerMetadata>(role_metadata(
      Role::SolutionExplorer, std::nullopt,
      {element(50024, "Solution 'A' (999999999 projects)")}));
  DOCTEST_REQUIRE(widest.project_count == 999999999);

  auto overlong = std::get<SolutionExplorerMetadata>(role_metadata(
      Role::SolutionExplorer, std::nullopt,
      {element(50024, "Solution 'A' (99999999999 projects)")}));
  DOCTEST_REQUIRE(!overlong.project_count.has_value());
}

DOCTEST_TEST_CASE("diagnostics metadata reads the filter buttons") {
  std::vector<UIElementInfo> els = {
      element(50000, "3 Errors"),
      element(50000, "1 Warning"),
      element(50000, "0 Messages"),
      element(50007, "CS0103 The name 'x' does not exist"),
  };
  auto m = std::get<DiagnosticsMetadata>(
      role_metadata(Role::DiagnosticsList, std::nullopt, els));
  DOCTEST_REQUIRE(m.error_count == 3);
  DOCTEST_REQUIRE(m.warning_count == 1);
  DOCTEST_REQUIRE(m.message_count == 0);

  auto none = std::get<DiagnosticsMetadata>(
      role_metadata(Role::DiagnosticsList, std::nullopt, {}));
  DOCTEST_REQUIRE(!none.error_count);
}

DOCTEST_TEST_CASE("properties metadata lists categories") {
  auto misc = element(50029, "Misc");
  misc.children.push_back(element(50029, "Name"));
  auto m = std::get<PropertiesMetadata>(role_metadata(
      Role::PropertiesPanel, std::nullopt, {misc, element(50029, "Empty")}));
  DOCTEST_REQUIRE_EQ(m.categories.size(), 1u);
  DOCTEST_REQUIRE(m.categories[0] == "Misc");
}

DOCTEST_TEST_CASE("code editor metadata") {
  Window w;
  w.title = "Program.cs - MyApp - Microsoft Visual Studio";
  auto m = std::get<CodeEditorMetadata>(role_metadata(
      Role::CodeEditor, w, {element(50020, "Ln 42"), element(50020, "Col 7")}));
  DOCTEST_REQUIRE(m.file_name == "Program.cs");
  DOCTEST_REQUIRE(m.language == "C#");
  DOCTEST_REQUIRE(m.syntax_highlighting_active);
  DOCTEST_REQUIRE(m.current_line == 42);
  DOCTEST_REQUIRE(m.current_column == 7);

  w.title = "notes.txt - Microsoft Visual Studio";
  auto plain = std::get<CodeEditorMetadata>(role_metadata(Role::CodeEditor, w, {}));
  DOCTEST_REQUIRE(plain.file_name == "notes.txt");
  DOCTEST_REQUIRE(!plain.language);
  DOCTEST_REQUIRE(!plain.syntax_highlighting_active);

  DOCTEST_REQUIRE(std::holds_alternative<std::monostate>(
      role_metadata(Role::OutputLog, w, {})));
}

DOCTEST_TEST_CASE("annotate keeps the image and records the role") {
  AnnotationEngine engine;
  Window w;
  w.title = "Program.cs - MyApp - Microsoft Visual Studio";
  w.bounds = {300, 100, 1300, 700};

  auto s = engine.annotate(sized(1300, 700), Role::CodeEditor, w);
  DOCTEST_REQUIRE_EQ(s.data.size(), 16u);
  DOCTEST_REQUIRE_EQ(s.width, 1300);
  DOCTEST_REQUIRE(s.role == Role::CodeEditor);
  DOCTEST_REQUIRE_EQ(s.annotations.size(), 1u);
  DOCTEST_REQUIRE(s.extracted_text == w.title);
  DOCTEST_REQUIRE(s.metadata.at("role").as_str() == "CodeEditor");
  DOCTEST_REQUIRE_EQ(s.metadata.at("annotation_count").as_num(), 1.0);

  auto e = engine.annotate(Capture{}, Role::SolutionExplorer);
  DOCTEST_REQUIRE(e.empty());
  DOCTEST_REQUIRE_EQ(e.annotations.size(), 1u);
  DOCTEST_REQUIRE_EQ(e.annotations[0].bounds.width, 0);
  DOCTEST_REQUIRE(!e.extracted_text);
}
