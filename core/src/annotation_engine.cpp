#include "idelens/annotation_engine.hpp"
#include "idelens/logger.hpp"
#include "idelens/window_classifier.hpp"
#include <algorithm>
#include <cctype>

namespace idelens {

namespace {

constexpr RoleStyle kSolutionExplorerStyle{10, 50, 20, 100, "#0078D4",
                                           "Solution Explorer Tree"};
constexpr RoleStyle kPropertiesStyle{5, 30, 10, 60, "#0078D4",
                                     "Properties Grid"};
constexpr RoleStyle kDiagnosticsStyle{5, 30, 10, 60, "#E81123", "Error List"};
constexpr RoleStyle kCodeEditorStyle{5, 5, 10, 10, "#569CD6", "Code Editor"};
constexpr RoleStyle kGenericStyle{1, 1, 2, 2, "#666666", "Window Outline"};

struct LanguageRule {
  std::string_view extension;
  std::string_view language;
};

constexpr LanguageRule kLanguages[] = {
    {".cs", "C#"},          {".vb", "Visual Basic"}, {".cpp", "C++"},
    {".cc", "C++"},         {".cxx", "C++"},         {".hpp", "C++"},
    {".h", "C++"},          {".js", "JavaScript"},   {".ts", "TypeScript"},
    {".html", "HTML"},      {".css", "CSS"},         {".json", "JSON"},
    {".xml", "XML"},        {".xaml", "XAML"},       {".py", "Python"},
    {".fs", "F#"},          {".sql", "SQL"},
};

// UI Automation control type ids.
constexpr int kButton = 50000;
constexpr int kEdit = 50004;
constexpr int kListItem = 50007;
constexpr int kMenuItem = 50011;
constexpr int kTabItem = 50019;
constexpr int kText = 50020;
constexpr int kTreeItem = 50024;
constexpr int kDataItem = 50029;
constexpr int kDocument = 50030;

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
    s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
    s.remove_suffix(1);
  return s;
}

bool starts_with_icase(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() &&
         equals_icase(s.substr(0, prefix.size()), prefix);
}

void flatten(const std::vector<UIElementInfo> &in,
             std::vector<const UIElementInfo *> &out) {
  for (const auto &el : in) {
    out.push_back(&el);
    flatten(el.children, out);
  }
}

std::optional<int> number_after(std::string_view s, std::string_view prefix) {
  s = trim(s);
  if (!starts_with_icase(s, prefix))
    return std::nullopt;
  s = trim(s.substr(prefix.size()));
  int v = 0;
  size_t n = 0;
  while (n < s.size() && std::isdigit(static_cast<unsigned char>(s[n])) &&
         n < 9) {
    v = v * 10 + (s[n] - '0');
    ++n;
  }
  if (n == 0)
    return std::nullopt;
  return v;
}

// "Solution 'App' (3 of 3 projects)" / "(1 project)"
std::optional<int> project_count_from_label(std::string_view label) {
  auto open = label.rfind('(');
  if (open == std::string_view::npos || !contains_icase(label, "project"))
    return std::nullopt;
  auto inner = label.substr(open + 1);
  auto pos = inner.find_first_of("0123456789");
  std::optional<int> last;
  while (pos != std::string_view::npos) {
    int v = 0;
    size_t n = pos;
    while (n < inner.size() && std::isdigit(static_cast<unsigned char>(inner[n]))) {
      // More than 9 digits does not fit an int.
      if (n - pos == 9)
        return std::nullopt;
      v = v * 10 + (inner[n++] - '0');
    }
    last = v;
    pos = inner.find_first_of("0123456789", n);
  }
  return last;
}

} // namespace

const RoleStyle &role_style(Role role) {
  switch (role) {
  case Role::SolutionExplorer:
    return kSolutionExplorerStyle;
  case Role::PropertiesPanel:
    return kPropertiesStyle;
  case Role::DiagnosticsList:
    return kDiagnosticsStyle;
  case Role::CodeEditor:
    return kCodeEditorStyle;
  default:
    return kGenericStyle;
  }
}

std::vector<Annotation> role_annotations(Role role, int width, int height) {
  const auto &st = role_style(role);
  Annotation a;
  a.type = AnnotationType::Outline;
  a.bounds.x = st.inset_x;
  a.bounds.y = st.inset_y;
  a.bounds.width = std::max(0, width - st.shrink_w);
  a.bounds.height = std::max(0, height - st.shrink_h);
  a.color = std::string(st.color);
  a.label = std::string(st.label);
  a.properties["role"] = std::string(role_name(role));
  return {a};
}

std::optional<std::string> file_name_from_title(std::string_view title) {
  static constexpr std::string_view kEmDash = "\xE2\x80\x94";
  size_t start = 0;
  while (start <= title.size()) {
    size_t dash = title.find('-', start);
    size_t em = title.find(kEmDash, start);
    size_t end = std::min(dash, em);
    auto part = title.substr(start, end == std::string_view::npos
                                        ? std::string_view::npos
                                        : end - start);
    if (!part.empty()) {
      auto name = trim(part);
      if (name.find('.') != std::string_view::npos)
        return std::string(name);
      return std::nullopt;
    }
    if (end == std::string_view::npos)
      break;
    start = end + (end == em ? kEmDash.size() : 1);
  }
  return std::nullopt;
}

std::optional<std::string> language_for_file(std::string_view file_name) {
  auto dot = file_name.rfind('.');
  if (dot == std::string_view::npos)
    return std::nullopt;
  auto ext = file_name.substr(dot);
  for (const auto &l : kLanguages)
    if (equals_icase(l.extension, ext))
      return std::string(l.language);
  return std::nullopt;
}

std::optional<int> leading_count(std::string_view label,
                                 std::string_view noun) {
  label = trim(label);
  int v = 0;
  size_t n = 0;
  while (n < label.size() && std::isdigit(static_cast<unsigned char>(label[n])) &&
         n < 9) {
    v = v * 10 + (label[n] - '0');
    ++n;
  }
  if (n == 0)
    return std::nullopt;
  auto rest = trim(label.substr(n));
  if (!starts_with_icase(rest, noun))
    return std::nullopt;
  rest.remove_prefix(noun.size());
  if (!rest.empty() && (rest.front() == 's' || rest.front() == 'S'))
    rest.remove_prefix(1);
  if (!rest.empty() && std::isalnum(static_cast<unsigned char>(rest.front())))
    return std::nullopt;
  return v;
}

UiElementType ui_element_type_for(const UIElementInfo &el, Role role) {
  switch (el.control_type) {
  case kButton:
    return UiElementType::Button;
  case kEdit:
    return UiElementType::TextBox;
  case kTreeItem:
    return UiElementType::TreeNode;
  case kListItem:
    return role == Role::DiagnosticsList ? UiElementType::ErrorItem
                                         : UiElementType::ListItem;
  case kDataItem:
    if (role == Role::DiagnosticsList)
      return UiElementType::ErrorItem;
    return UiElementType::PropertyItem;
  case kMenuItem:
    return UiElementType::MenuItem;
  case kTabItem:
    return UiElementType::Tab;
  case kText:
  case kDocument:
    return role == Role::CodeEditor ? UiElementType::CodeLine
                                    : UiElementType::Label;
  default:
    return UiElementType::Label;
  }
}

std::vector<UiElement> to_ui_elements(const std::vector<UIElementInfo> &elements,
                                      Role role, const Bounds &origin) {
  std::vector<const UIElementInfo *> flat;
  flatten(elements, flat);

  std::vector<UiElement> out;
  out.reserve(flat.size());
  for (const auto *el : flat) {
    UiElement u;
    u.type = ui_element_type_for(*el, role);
    auto b = Bounds::from_rect(el->bounding_rect);
    u.bounds = {b.x - origin.x, b.y - origin.y, b.width, b.height};
    if (!el->name.empty())
      u.text = el->name;
    u.properties["automation_id"] = el->automation_id;
    u.properties["class_name"] = el->class_name;
    u.properties["control_type"] = (double)el->control_type;
    u.properties["enabled"] = el->enabled;
    u.properties["visible"] = el->visible;
    out.push_back(std::move(u));
  }
  return out;
}

static SolutionExplorerMetadata
solution_explorer_metadata(const std::vector<const UIElementInfo *> &flat) {
  SolutionExplorerMetadata m;
  for (const auto *el : flat) {
    if (el->control_type != kTreeItem)
      continue;
    if (!m.project_count && starts_with_icase(trim(el->name), "Solution"))
      m.project_count = project_count_from_label(el->name);
    if (!el->children.empty() && !el->name.empty())
      m.expanded_nodes.push_back(el->name);
  }
  return m;
}

static PropertiesMetadata
properties_metadata(const std::vector<const UIElementInfo *> &flat) {
  PropertiesMetadata m;
  for (const auto *el : flat) {
    bool grouping = el->control_type == kDataItem || el->control_type == kTreeItem;
    if (grouping && !el->children.empty() && !el->name.empty())
      m.categories.push_back(el->name);
  }
  return m;
}

static DiagnosticsMetadata
diagnostics_metadata(const std::vector<const UIElementInfo *> &flat) {
  DiagnosticsMetadata m;
  for (const auto *el : flat) {
    if (!m.error_count)
      m.error_count = leading_count(el->name, "Error");
    if (!m.warning_count)
      m.warning_count = leading_count(el->name, "Warning");
    if (!m.message_count)
      m.message_count = leading_count(el->name, "Message");
  }
  return m;
}

static CodeEditorMetadata
code_editor_metadata(const std::optional<Window> &window,
                     const std::vector<const UIElementInfo *> &flat) {
  CodeEditorMetadata m;
  if (window)
    m.file_name = file_name_from_title(window->title);
  if (m.file_name)
    m.language = language_for_file(*m.file_name);
  m.syntax_highlighting_active = m.language.has_value();
  for (const auto *el : flat) {
    if (!m.current_line)
      m.current_line = number_after(el->name, "Ln");
    if (!m.current_column) {
      m.current_column = number_after(el->name, "Col");
      if (!m.current_column)
        m.current_column = number_after(el->name, "Ch");
    }
  }
  return m;
}

RoleMetadata role_metadata(Role role, const std::optional<Window> &window,
                           const std::vector<UIElementInfo> &elements) {
  std::vector<const UIElementInfo *> flat;
  flatten(elements, flat);
  switch (role) {
  case Role::SolutionExplorer:
    return solution_explorer_metadata(flat);
  case Role::PropertiesPanel:
    return properties_metadata(flat);
  case Role::DiagnosticsList:
    return diagnostics_metadata(flat);
  case Role::CodeEditor:
    return code_editor_metadata(window, flat);
  default:
    return std::monostate{};
  }
}

SpecializedCapture AnnotationEngine::annotate(
    Capture capture, Role role, const std::optional<Window> &window,
    const std::vector<UIElementInfo> &elements) const {
  SpecializedCapture s;
  static_cast<Capture &>(s) = std::move(capture);
  s.role = role;
  s.annotations = role_annotations(role, s.width, s.height);

  Bounds origin = window ? window->bounds : Bounds{};
  s.ui_elements = to_ui_elements(elements, role, origin);
  s.role_metadata = role_metadata(role, window, elements);

  if (role == Role::CodeEditor && window && !window->title.empty())
    s.extracted_text = window->title;

  s.metadata["role"] = std::string(role_name(role));
  s.metadata["annotation_count"] = (double)s.annotations.size();
  LOG_DEBUG("annotate: " + std::string(role_name(role)) + " with " +
            std::to_string(s.ui_elements.size()) + " UI elements");
  return s;
}

} // namespace idelens
