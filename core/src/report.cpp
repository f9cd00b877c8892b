#include "idelens/report.hpp"
#include "idelens/image_codec.hpp"
#include <cstdio>
#include <ctime>
#include <type_traits>

namespace idelens {

std::string format_time(Clock::time_point t) {
  auto tt = Clock::to_time_t(t);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                t.time_since_epoch()) %
            1000;
  std::tm tm_buf{};
#ifdef _WIN32
  gmtime_s(&tm_buf, &tt);
#else
  gmtime_r(&tt, &tm_buf);
#endif
  char buf[40];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
  char out[48];
  std::snprintf(out, sizeof(out), "%s.%03dZ", buf, (int)ms.count());
  return out;
}

json::Object bounds_to_json(const Bounds &b) {
  json::Object o;
  o["x"] = (double)b.x;
  o["y"] = (double)b.y;
  o["width"] = (double)b.width;
  o["height"] = (double)b.height;
  return o;
}

json::Object window_to_json(const Window &w, bool with_children) {
  json::Object o;
  o["hwnd"] = Hwnd(w.handle).to_string();
  o["title"] = w.title;
  o["class_name"] = w.class_name;
  o["role"] = std::string(role_name(w.role));
  o["visible"] = w.visible;
  o["pid"] = (double)w.pid;
  o["bounds"] = bounds_to_json(w.bounds);
  if (w.parent)
    o["parent"] = Hwnd(*w.parent).to_string();
  o["active"] = w.active;
  o["captured_at"] = format_time(w.captured_at);
  if (with_children && !w.children.empty()) {
    json::Array arr;
    for (const auto &c : w.children)
      arr.push_back(window_to_json(c, true));
    o["children"] = arr;
  }
  return o;
}

static json::Array window_list(const std::vector<Window> &ws) {
  json::Array arr;
  for (const auto &w : ws)
    arr.push_back(window_to_json(w, false));
  return arr;
}

json::Object layout_to_json(const Layout &l) {
  json::Object o;
  if (l.main_window)
    o["main_window"] = window_to_json(*l.main_window, false);
  else
    o["main_window"] = json::Null{};
  if (l.active_window)
    o["active_window"] = window_to_json(*l.active_window, false);
  else
    o["active_window"] = json::Null{};

  o["all_windows"] = window_list(l.all_windows);

  json::Object by_role;
  for (const auto &[role, ws] : l.windows_by_role)
    by_role[std::string(role_name(role))] = window_list(ws);
  o["windows_by_role"] = by_role;

  json::Object dock;
  dock["left"] = window_list(l.docking.left);
  dock["right"] = window_list(l.docking.right);
  dock["top"] = window_list(l.docking.top);
  dock["bottom"] = window_list(l.docking.bottom);
  dock["floating"] = window_list(l.docking.floating);
  if (l.docking.editor_area)
    dock["editor_area"] = window_to_json(*l.docking.editor_area, false);
  o["docking"] = dock;
  o["analyzed_at"] = format_time(l.analyzed_at);
  return o;
}

json::Object annotation_to_json(const Annotation &a) {
  json::Object o;
  o["type"] = std::string(annotation_type_name(a.type));
  o["bounds"] = bounds_to_json(a.bounds);
  o["color"] = a.color;
  if (a.label)
    o["label"] = *a.label;
  if (!a.properties.empty())
    o["properties"] = a.properties;
  return o;
}

json::Object ui_element_to_json(const UiElement &e) {
  json::Object o;
  o["type"] = std::string(ui_element_type_name(e.type));
  o["bounds"] = bounds_to_json(e.bounds);
  if (e.text)
    o["text"] = *e.text;
  o["properties"] = e.properties;
  return o;
}

template <typename T> static json::Value opt(const std::optional<T> &v) {
  if (!v)
    return json::Value(json::Null{});
  if constexpr (std::is_same_v<T, std::string>)
    return json::Value(*v);
  else
    return json::Value((double)*v);
}

static json::Array strings(const std::vector<std::string> &v) {
  json::Array arr;
  for (const auto &s : v)
    arr.push_back(s);
  return arr;
}

json::Value role_metadata_to_json(const RoleMetadata &m) {
  if (const auto *se = std::get_if<SolutionExplorerMetadata>(&m)) {
    json::Object o;
    o["expanded_nodes"] = strings(se->expanded_nodes);
    o["selected_item"] = opt(se->selected_item);
    o["project_count"] = opt(se->project_count);
    return o;
  }
  if (const auto *p = std::get_if<PropertiesMetadata>(&m)) {
    json::Object o;
    o["selected_object_type"] = opt(p->selected_object_type);
    o["categories"] = strings(p->categories);
    o["modified_properties"] = strings(p->modified_properties);
    return o;
  }
  if (const auto *d = std::get_if<DiagnosticsMetadata>(&m)) {
    json::Object o;
    o["error_count"] = opt(d->error_count);
    o["warning_count"] = opt(d->warning_count);
    o["message_count"] = opt(d->message_count);
    o["active_filter"] = opt(d->active_filter);
    return o;
  }
  if (const auto *c = std::get_if<CodeEditorMetadata>(&m)) {
    json::Object o;
    o["file_name"] = opt(c->file_name);
    o["language"] = opt(c->language);
    o["current_line"] = opt(c->current_line);
    o["current_column"] = opt(c->current_column);
    o["syntax_highlighting_active"] = c->syntax_highlighting_active;
    return o;
  }
  return json::Value(json::Null{});
}

json::Object capture_to_json(const Capture &c, bool with_data) {
  json::Object o;
  o["encoding"] = c.encoding;
  o["width"] = (double)c.width;
  o["height"] = (double)c.height;
  o["bytes"] = (double)c.data.size();
  o["captured_at"] = format_time(c.captured_at);
  o["metadata"] = c.metadata;
  if (with_data)
    o["data_b64"] = base64_encode(c.data);
  return o;
}

json::Object specialized_capture_to_json(const SpecializedCapture &c,
                                         bool with_data) {
  auto o = capture_to_json(c, with_data);
  o["role"] = std::string(role_name(c.role));
  json::Array anns;
  for (const auto &a : c.annotations)
    anns.push_back(annotation_to_json(a));
  o["annotations"] = anns;
  if (c.extracted_text)
    o["extracted_text"] = *c.extracted_text;
  json::Array els;
  for (const auto &e : c.ui_elements)
    els.push_back(ui_element_to_json(e));
  o["ui_elements"] = els;
  o["role_metadata"] = role_metadata_to_json(c.role_metadata);
  return o;
}

json::Object composite_capture_to_json(const CompositeCapture &c,
                                       bool with_data) {
  json::Object o;
  o["primary"] = capture_to_json(c.primary, with_data);
  json::Array ws;
  for (const auto &w : c.windows)
    ws.push_back(specialized_capture_to_json(w, with_data));
  o["windows"] = ws;
  o["layout"] = layout_to_json(c.layout);
  o["captured_at"] = format_time(c.captured_at);
  o["metadata"] = c.metadata;
  return o;
}

} // namespace idelens
