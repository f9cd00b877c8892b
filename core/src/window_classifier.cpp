#include "idelens/window_classifier.hpp"
#include <algorithm>
#include <cctype>

namespace idelens {

static char lower(char c) noexcept {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool equals_icase(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size())
    return false;
  for (size_t i = 0; i < a.size(); ++i)
    if (lower(a[i]) != lower(b[i]))
      return false;
  return true;
}

bool contains_icase(std::string_view haystack, std::string_view needle) noexcept {
  if (needle.empty())
    return true;
  auto it = std::search(haystack.begin(), haystack.end(), needle.begin(),
                        needle.end(),
                        [](char a, char b) { return lower(a) == lower(b); });
  return it != haystack.end();
}

static const ClassNameRule *find_class_rule(std::string_view class_name) noexcept {
  for (const auto &r : kClassNameRules)
    if (equals_icase(r.class_name, class_name))
      return &r;
  return nullptr;
}

Role classify(std::string_view class_name, std::string_view title) noexcept {
  if (const auto *r = find_class_rule(class_name))
    return r->role;

  if (title.empty())
    return Role::Unknown;

  for (const auto &r : kTitleRules)
    if (contains_icase(title, r.phrase))
      return r.role;

  for (auto ext : kSourceExtensions)
    if (contains_icase(title, ext))
      return Role::CodeEditor;

  if (contains_icase(title, kMarkupExtension) ||
      contains_icase(class_name, kMarkupClassFragment))
    return Role::DesignSurface;

  return Role::Unknown;
}

Role classify(const WindowInfo &wi) noexcept {
  return classify(wi.class_name, wi.title);
}

bool has_ide_signature(std::string_view class_name,
                       std::string_view title) noexcept {
  if (find_class_rule(class_name))
    return true;
  if (title.empty())
    return false;
  if (contains_icase(title, kProductTitle))
    return true;
  for (const auto &r : kTitleRules)
    if (contains_icase(title, r.phrase))
      return true;
  return false;
}

} // namespace idelens
