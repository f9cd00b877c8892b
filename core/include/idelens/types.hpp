#pragma once
#include "tinyjson.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace idelens {

using hwnd_u64 = std::uint64_t;
using Clock = std::chrono::system_clock;

struct Hwnd {
  hwnd_u64 val{};
  explicit Hwnd(hwnd_u64 v) : val(v) {}
  std::string to_string() const;
};

struct Rect {
  long left{}, top{}, right{}, bottom{};
};

// Screen-space bounds. width/height are never negative.
struct Bounds {
  int x{}, y{}, width{}, height{};

  int right() const { return x + width; }
  int bottom() const { return y + height; }
  bool empty() const { return width == 0 || height == 0; }

  static Bounds from_rect(const Rect &r);
};

enum class Role : std::uint8_t {
  Unknown = 0,
  MainWindow,
  SolutionExplorer,
  PropertiesPanel,
  DiagnosticsList,
  OutputLog,
  CodeEditor,
  DesignSurface,
  Toolbox,
  ResourceExplorer,
  VersionControlPanel,
  ConsolePanel,
  FindReplace,
  ImmediatePanel,
  WatchPanel,
  CallStackPanel,
  LocalsPanel
};

std::string_view role_name(Role r);
std::optional<Role> role_from_name(std::string_view name);

// Raw per-window metadata as read from the window system.
struct WindowInfo {
  hwnd_u64 hwnd{};
  hwnd_u64 parent{};
  std::string class_name;
  std::string title;
  Rect window_rect{};
  std::uint32_t pid{};
  bool visible{};
};

// A classified window. Built once per enumeration pass and never mutated.
struct Window {
  hwnd_u64 handle{};
  std::string title;
  std::string class_name;
  Role role = Role::Unknown;
  bool visible{};
  std::uint32_t pid{};
  Bounds bounds{};
  std::optional<hwnd_u64> parent;
  std::vector<Window> children;
  bool active{};
  Clock::time_point captured_at{};
};

struct DockingLayout {
  std::vector<Window> left;
  std::vector<Window> right;
  std::vector<Window> top;
  std::vector<Window> bottom;
  std::vector<Window> floating;
  std::optional<Window> editor_area;
};

struct Layout {
  std::optional<Window> main_window;
  std::vector<Window> all_windows;
  std::map<Role, std::vector<Window>> windows_by_role;
  std::optional<Window> active_window;
  DockingLayout docking;
  Clock::time_point analyzed_at{};
};

// Top-down 32-bit BGRA pixels as produced by a grab.
struct PixelBuffer {
  int width{}, height{};
  std::vector<std::uint8_t> bgra;
};

struct Capture {
  std::vector<std::uint8_t> data;
  std::string encoding = "BMP";
  int width{}, height{};
  Clock::time_point captured_at{};
  json::Object metadata;

  bool empty() const { return data.empty(); }
};

enum class AnnotationType : std::uint8_t {
  Highlight,
  Outline,
  Label,
  Arrow,
  Circle,
  Blur
};

std::string_view annotation_type_name(AnnotationType t);

struct Annotation {
  AnnotationType type = AnnotationType::Outline;
  Bounds bounds{};
  std::string color = "#FF0000";
  std::optional<std::string> label;
  json::Object properties;
};

enum class UiElementType : std::uint8_t {
  Button,
  TextBox,
  Label,
  TreeNode,
  ListItem,
  MenuItem,
  Tab,
  PropertyItem,
  ErrorItem,
  CodeLine
};

std::string_view ui_element_type_name(UiElementType t);

// UI Automation element as reported by the backend.
struct UIElementInfo {
  std::string automation_id;
  std::string name;
  std::string class_name;
  int control_type{};
  Rect bounding_rect{};
  bool enabled = false;
  bool visible = false;
  std::vector<UIElementInfo> children;
};

struct UiElement {
  UiElementType type = UiElementType::Label;
  Bounds bounds{};
  std::optional<std::string> text;
  json::Object properties;
};

struct SolutionExplorerMetadata {
  std::vector<std::string> expanded_nodes;
  std::optional<std::string> selected_item;
  std::optional<int> project_count;
};

struct PropertiesMetadata {
  std::optional<std::string> selected_object_type;
  std::vector<std::string> categories;
  std::vector<std::string> modified_properties;
};

struct DiagnosticsMetadata {
  std::optional<int> error_count;
  std::optional<int> warning_count;
  std::optional<int> message_count;
  std::optional<std::string> active_filter;
};

struct CodeEditorMetadata {
  std::optional<std::string> file_name;
  std::optional<std::string> language;
  std::optional<int> current_line;
  std::optional<int> current_column;
  bool syntax_highlighting_active = false;
};

using RoleMetadata =
    std::variant<std::monostate, SolutionExplorerMetadata, PropertiesMetadata,
                 DiagnosticsMetadata, CodeEditorMetadata>;

struct SpecializedCapture : Capture {
  Role role = Role::Unknown;
  std::vector<Annotation> annotations;
  std::optional<std::string> extracted_text;
  std::vector<UiElement> ui_elements;
  RoleMetadata role_metadata;
};

struct CompositeCapture {
  Capture primary;
  std::vector<SpecializedCapture> windows;
  Layout layout;
  Clock::time_point captured_at{};
  json::Object metadata;
};

} // namespace idelens
