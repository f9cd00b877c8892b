#include "doctest/doctest.h"
#include "idelens/window_classifier.hpp"

using namespace idelens;

DOCTEST_TEST_CASE("class name table wins over the title") {
  DOCTEST_REQUIRE(classify("HwndWrapper[DefaultDomain;;]", "Solution Explorer") ==
                  Role::MainWindow);
  DOCTEST_REQUIRE(classify("visualstudiomainwindow", "") == Role::MainWindow);
  // A hit that maps to Unknown is final.
  DOCTEST_REQUIRE(classify("tooltips_class32", "Solution Explorer") ==
                  Role::Unknown);
  DOCTEST_REQUIRE(classify("VsDebugUIDeadlockDialog", "Program.cs") ==
                  Role::Unknown);
}

DOCTEST_TEST_CASE("title phrases are checked in table order") {
  DOCTEST_REQUIRE(classify("GenericPane", "Solution Explorer") ==
                  Role::SolutionExplorer);
  DOCTEST_REQUIRE(classify("GenericPane", "solution explorer - search") ==
                  Role::SolutionExplorer);
  DOCTEST_REQUIRE(classify("GenericPane", "Properties") == Role::PropertiesPanel);
  DOCTEST_REQUIRE(classify("GenericPane", "Error List") == Role::DiagnosticsList);
  DOCTEST_REQUIRE(classify("GenericPane", "Output") == Role::OutputLog);
  DOCTEST_REQUIRE(classify("GenericPane", "Toolbox") == Role::Toolbox);
  DOCTEST_REQUIRE(classify("GenericPane", "Server Explorer") ==
                  Role::ResourceExplorer);
  DOCTEST_REQUIRE(classify("GenericPane", "Team Explorer - Home") ==
                  Role::VersionControlPanel);
  DOCTEST_REQUIRE(classify("GenericPane", "Package Manager Console") ==
                  Role::ConsolePanel);
  DOCTEST_REQUIRE(classify("GenericPane", "Find and Replace") == Role::FindReplace);
  DOCTEST_REQUIRE(classify("GenericPane", "Immediate Window") ==
                  Role::ImmediatePanel);
  DOCTEST_REQUIRE(classify("GenericPane", "Watch 1") == Role::WatchPanel);
  DOCTEST_REQUIRE(classify("GenericPane", "Call Stack") == Role::CallStackPanel);
  DOCTEST_REQUIRE(classify("GenericPane", "Locals") == Role::LocalsPanel);

  // Both phrases present: the earlier table entry decides.
  DOCTEST_REQUIRE(classify("GenericPane", "Output - Properties") ==
                  Role::PropertiesPanel);
  DOCTEST_REQUIRE(classify("GenericPane", "Properties - Solution Explorer") ==
                  Role::SolutionExplorer);
}

DOCTEST_TEST_CASE("source extensions mark code editors, markup marks designers") {
  DOCTEST_REQUIRE(classify("EditorPane", "Program.cs - MyApp") == Role::CodeEditor);
  DOCTEST_REQUIRE(classify("EditorPane", "main.CPP") == Role::CodeEditor);
  DOCTEST_REQUIRE(classify("EditorPane", "appsettings.json") == Role::CodeEditor);
  DOCTEST_REQUIRE(classify("EditorPane", "MainPage.xaml") == Role::DesignSurface);
  // The code-behind file name also contains ".xaml"; source wins.
  DOCTEST_REQUIRE(classify("EditorPane", "MainPage.xaml.cs") == Role::CodeEditor);
  DOCTEST_REQUIRE(classify("XamlDesignerHost", "Designer") == Role::DesignSurface);
}

DOCTEST_TEST_CASE("classification falls back to Unknown") {
  DOCTEST_REQUIRE(classify("", "") == Role::Unknown);
  DOCTEST_REQUIRE(classify("GenericPane", "") == Role::Unknown);
  // The markup class check needs a title.
  DOCTEST_REQUIRE(classify("XamlDesignerHost", "") == Role::Unknown);
  DOCTEST_REQUIRE(classify("GenericPane", "Start Page") == Role::Unknown);
}

DOCTEST_TEST_CASE("classification is pure") {
  WindowInfo wi;
  wi.class_name = "GenericPane";
  wi.title = "Error List";
  auto first = classify(wi);
  for (int i = 0; i < 10; ++i)
    DOCTEST_REQUIRE(classify(wi) == first);
}

DOCTEST_TEST_CASE("IDE signature of top-level windows") {
  DOCTEST_REQUIRE(has_ide_signature("HwndWrapper[DefaultDomain;;]", ""));
  DOCTEST_REQUIRE(has_ide_signature("Anything", "MyApp - Microsoft Visual Studio"));
  DOCTEST_REQUIRE(has_ide_signature("GenericPane", "Error List"));
  DOCTEST_REQUIRE(!has_ide_signature("Notepad", "notes.txt"));
  DOCTEST_REQUIRE(!has_ide_signature("GenericPane", ""));
}

DOCTEST_TEST_CASE("role names round-trip case-insensitively") {
  DOCTEST_REQUIRE(role_name(Role::SolutionExplorer) == "SolutionExplorer");
  DOCTEST_REQUIRE(role_from_name("solutionexplorer") == Role::SolutionExplorer);
  DOCTEST_REQUIRE(role_from_name("CODEEDITOR") == Role::CodeEditor);
  DOCTEST_REQUIRE(!role_from_name("NoSuchRole").has_value());
  DOCTEST_REQUIRE(!role_from_name("CodeEditorPane").has_value());
}
