#include "idelens/result.hpp"
#include "idelens/types.hpp"
#include "idelens/window_classifier.hpp"
#include <algorithm>
#include <cstdio>

namespace idelens {

std::string Hwnd::to_string() const {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "0x%llX", (unsigned long long)val);
  return buf;
}

Bounds Bounds::from_rect(const Rect &r) {
  Bounds b;
  b.x = static_cast<int>(r.left);
  b.y = static_cast<int>(r.top);
  b.width = static_cast<int>(std::max(0L, r.right - r.left));
  b.height = static_cast<int>(std::max(0L, r.bottom - r.top));
  return b;
}

namespace {
struct RoleName {
  Role role;
  std::string_view name;
};

constexpr RoleName kRoleNames[] = {
    {Role::Unknown, "Unknown"},
    {Role::MainWindow, "MainWindow"},
    {Role::SolutionExplorer, "SolutionExplorer"},
    {Role::PropertiesPanel, "PropertiesPanel"},
    {Role::DiagnosticsList, "DiagnosticsList"},
    {Role::OutputLog, "OutputLog"},
    {Role::CodeEditor, "CodeEditor"},
    {Role::DesignSurface, "DesignSurface"},
    {Role::Toolbox, "Toolbox"},
    {Role::ResourceExplorer, "ResourceExplorer"},
    {Role::VersionControlPanel, "VersionControlPanel"},
    {Role::ConsolePanel, "ConsolePanel"},
    {Role::FindReplace, "FindReplace"},
    {Role::ImmediatePanel, "ImmediatePanel"},
    {Role::WatchPanel, "WatchPanel"},
    {Role::CallStackPanel, "CallStackPanel"},
    {Role::LocalsPanel, "LocalsPanel"},
};
} // namespace

std::string_view role_name(Role r) {
  for (const auto &e : kRoleNames)
    if (e.role == r)
      return e.name;
  return "Unknown";
}

std::optional<Role> role_from_name(std::string_view name) {
  for (const auto &e : kRoleNames)
    if (equals_icase(e.name, name))
      return e.role;
  return std::nullopt;
}

std::string_view annotation_type_name(AnnotationType t) {
  switch (t) {
  case AnnotationType::Highlight:
    return "Highlight";
  case AnnotationType::Outline:
    return "Outline";
  case AnnotationType::Label:
    return "Label";
  case AnnotationType::Arrow:
    return "Arrow";
  case AnnotationType::Circle:
    return "Circle";
  case AnnotationType::Blur:
    return "Blur";
  }
  return "Outline";
}

std::string_view ui_element_type_name(UiElementType t) {
  switch (t) {
  case UiElementType::Button:
    return "Button";
  case UiElementType::TextBox:
    return "TextBox";
  case UiElementType::Label:
    return "Label";
  case UiElementType::TreeNode:
    return "TreeNode";
  case UiElementType::ListItem:
    return "ListItem";
  case UiElementType::MenuItem:
    return "MenuItem";
  case UiElementType::Tab:
    return "Tab";
  case UiElementType::PropertyItem:
    return "PropertyItem";
  case UiElementType::ErrorItem:
    return "ErrorItem";
  case UiElementType::CodeLine:
    return "CodeLine";
  }
  return "Label";
}

std::string_view error_code(ErrorKind k) {
  switch (k) {
  case ErrorKind::NotFound:
    return "E_NOT_FOUND";
  case ErrorKind::AccessDenied:
    return "E_ACCESS_DENIED";
  case ErrorKind::Timeout:
    return "E_TIMEOUT";
  case ErrorKind::ResourceExhausted:
    return "E_RESOURCE_EXHAUSTED";
  case ErrorKind::Malformed:
    return "E_MALFORMED";
  }
  return "E_MALFORMED";
}

std::string Error::to_string() const {
  std::string s(error_code(kind));
  s += " in " + (operation.empty() ? std::string("?") : operation);
  if (hwnd)
    s += " hwnd=" + Hwnd(hwnd).to_string();
  if (os_error)
    s += " os_error=" + std::to_string(os_error);
  if (!message.empty())
    s += ": " + message;
  return s;
}

} // namespace idelens
