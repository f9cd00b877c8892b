#pragma once
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace idelens {

struct RoleStyle {
  int inset_x, inset_y;   // origin of the outline
  int shrink_w, shrink_h; // subtracted from the capture size
  std::string_view color;
  std::string_view label;
};

// Outline geometry and colour for a role. Total: roles without a dedicated
// style get the generic window outline.
const RoleStyle &role_style(Role role);

std::vector<Annotation> role_annotations(Role role, int width, int height);

// "Program.cs - MyApp - Visual Studio" -> "Program.cs"
std::optional<std::string> file_name_from_title(std::string_view title);
std::optional<std::string> language_for_file(std::string_view file_name);

// Leading integer of a label such as "3 Errors"; nullopt when the label does
// not start with a number followed by `noun` (singular or plural).
std::optional<int> leading_count(std::string_view label, std::string_view noun);

UiElementType ui_element_type_for(const UIElementInfo &el, Role role);

// Flattens the element tree and converts bounds to be relative to `origin`.
std::vector<UiElement> to_ui_elements(const std::vector<UIElementInfo> &elements,
                                      Role role, const Bounds &origin);

RoleMetadata role_metadata(Role role, const std::optional<Window> &window,
                           const std::vector<UIElementInfo> &elements);

class AnnotationEngine {
public:
  // Never fails: an empty capture still gets a (degenerate) outline so the
  // role is recorded.
  SpecializedCapture annotate(Capture capture, Role role,
                              const std::optional<Window> &window = std::nullopt,
                              const std::vector<UIElementInfo> &elements = {}) const;
};

} // namespace idelens
