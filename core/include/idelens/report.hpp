#pragma once
#include "tinyjson.hpp"
#include "types.hpp"

namespace idelens {

std::string format_time(Clock::time_point t);

json::Object bounds_to_json(const Bounds &b);
json::Object window_to_json(const Window &w, bool with_children = true);
json::Object layout_to_json(const Layout &l);
json::Object annotation_to_json(const Annotation &a);
json::Object ui_element_to_json(const UiElement &e);
json::Value role_metadata_to_json(const RoleMetadata &m);

// Image bytes are base64-encoded under "data_b64" only when requested.
json::Object capture_to_json(const Capture &c, bool with_data = false);
json::Object specialized_capture_to_json(const SpecializedCapture &c,
                                         bool with_data = false);
json::Object composite_capture_to_json(const CompositeCapture &c,
                                       bool with_data = false);

} // namespace idelens
