#pragma once
#include "types.hpp"
#include <string_view>

namespace idelens {

struct ClassNameRule {
  std::string_view class_name;
  Role role;
};

struct TitleRule {
  std::string_view phrase;
  Role role;
};

// Exact (case-insensitive) class-name matches. A hit is final, even when it
// maps to Unknown.
inline constexpr ClassNameRule kClassNameRules[] = {
    {"HwndWrapper[DefaultDomain;;]", Role::MainWindow},
    {"VisualStudioMainWindow", Role::MainWindow},
    {"VsDebugUIDeadlockDialog", Role::Unknown},
    {"tooltips_class32", Role::Unknown},
    {"msctls_statusbar32", Role::Unknown},
};

// Case-insensitive title substrings. Checked in order; first match wins.
inline constexpr TitleRule kTitleRules[] = {
    {"Solution Explorer", Role::SolutionExplorer},
    {"Properties", Role::PropertiesPanel},
    {"Error List", Role::DiagnosticsList},
    {"Output", Role::OutputLog},
    {"Toolbox", Role::Toolbox},
    {"Server Explorer", Role::ResourceExplorer},
    {"Team Explorer", Role::VersionControlPanel},
    {"Package Manager Console", Role::ConsolePanel},
    {"Find and Replace", Role::FindReplace},
    {"Immediate", Role::ImmediatePanel},
    {"Watch", Role::WatchPanel},
    {"Call Stack", Role::CallStackPanel},
    {"Locals", Role::LocalsPanel},
};

inline constexpr std::string_view kSourceExtensions[] = {
    ".cs", ".vb", ".cpp", ".h", ".js", ".ts", ".html", ".css", ".json", ".xml"};

inline constexpr std::string_view kMarkupExtension = ".xaml";
inline constexpr std::string_view kMarkupClassFragment = "Xaml";
inline constexpr std::string_view kProductTitle = "Visual Studio";

// Pure and total. Never throws; Unknown is the fallback.
Role classify(std::string_view class_name, std::string_view title) noexcept;
Role classify(const WindowInfo &wi) noexcept;

// True when a top-level window looks like it belongs to the IDE: class table
// hit, product name in the title, or a known panel title.
bool has_ide_signature(std::string_view class_name,
                       std::string_view title) noexcept;

bool contains_icase(std::string_view haystack, std::string_view needle) noexcept;
bool equals_icase(std::string_view a, std::string_view b) noexcept;

} // namespace idelens
