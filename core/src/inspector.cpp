#include "idelens/inspector.hpp"
#include "idelens/logger.hpp"
#include "idelens/window_classifier.hpp"
#include <stdexcept>

namespace idelens {

static IBackend &require_backend(IBackend *backend) {
  if (!backend)
    throw std::invalid_argument("Inspector: backend must not be null");
  return *backend;
}

static void require_handle(hwnd_u64 hwnd, const char *op) {
  if (hwnd == 0)
    throw std::invalid_argument(std::string(op) + ": null window handle");
}

Inspector::Inspector(IBackend *backend, InspectorConfig cfg)
    : backend_(&require_backend(backend)), cfg_(std::move(cfg)),
      validator_(*backend_, cfg_.ownership),
      discovery_(*backend_, cfg_.enumeration, validator_),
      layouts_(discovery_, cfg_.layout),
      captures_(*backend_, validator_, cfg_.capture),
      orchestrator_(*backend_, layouts_, captures_) {}

std::vector<Window> Inspector::discover_windows() {
  try {
    return discovery_.discover();
  } catch (const std::exception &e) {
    LOG_ERROR(std::string("discover_windows: ") + e.what());
    return {};
  }
}

Role Inspector::classify_window(hwnd_u64 hwnd) {
  require_handle(hwnd, "classify_window");
  try {
    auto w = discovery_.describe(hwnd);
    return w ? w->role : Role::Unknown;
  } catch (const std::exception &e) {
    LOG_WARN("classify_window: " + Hwnd(hwnd).to_string() + ": " + e.what());
    return Role::Unknown;
  }
}

Layout Inspector::analyze_layout(std::uint32_t pid) {
  return layouts_.analyze(pid);
}

std::optional<Window> Inspector::get_active_window() {
  try {
    return discovery_.active_window();
  } catch (const std::exception &e) {
    LOG_WARN(std::string("get_active_window: ") + e.what());
    return std::nullopt;
  }
}

std::vector<Window> Inspector::find_windows_by_role(Role role) {
  std::vector<Window> out;
  for (auto &w : flatten_windows(discover_windows(),
                                 cfg_.layout.include_child_windows)) {
    if (w.role == role)
      out.push_back(std::move(w));
  }
  return out;
}

Capture Inspector::capture_window(hwnd_u64 hwnd) {
  require_handle(hwnd, "capture_window");
  return captures_.capture_window(hwnd);
}

Capture Inspector::capture_window_by_title(const std::string &title_fragment) {
  if (title_fragment.empty())
    throw std::invalid_argument("capture_window_by_title: empty title");
  for (const auto &w : flatten_windows(discover_windows(),
                                       cfg_.layout.include_child_windows)) {
    if (contains_icase(w.title, title_fragment))
      return captures_.capture_window(w.handle);
  }
  LOG_WARN("capture_window_by_title: no window titled like '" +
           title_fragment + "'");
  return Capture{};
}

Capture Inspector::capture_region(int x, int y, int width, int height) {
  if (width < 0 || height < 0)
    throw std::invalid_argument("capture_region: negative size");
  return captures_.capture_region(x, y, width, height);
}

CompositeCapture Inspector::capture_full_ide(std::uint32_t pid) {
  try {
    return orchestrator_.capture_full_ide(pid);
  } catch (const std::exception &e) {
    LOG_ERROR(std::string("capture_full_ide: ") + e.what());
    return CompositeCapture{};
  }
}

SpecializedCapture Inspector::capture_with_annotation(hwnd_u64 hwnd) {
  require_handle(hwnd, "capture_with_annotation");
  auto w = discovery_.describe(hwnd, OwnershipScope::Capture);
  if (!w) {
    LOG_WARN("capture_with_annotation: " + Hwnd(hwnd).to_string() +
             " is gone or not allowed");
    SpecializedCapture empty;
    return empty;
  }
  return orchestrator_.capture_specialized(*w);
}

SpecializedCapture Inspector::capture_with_annotation(hwnd_u64 hwnd, Role role) {
  require_handle(hwnd, "capture_with_annotation");
  auto w = discovery_.describe(hwnd, OwnershipScope::Capture);
  if (!w) {
    LOG_WARN("capture_with_annotation: " + Hwnd(hwnd).to_string() +
             " is gone or not allowed");
    SpecializedCapture empty;
    empty.role = role;
    return empty;
  }
  w->role = role;
  return orchestrator_.capture_specialized(*w);
}

SpecializedCapture Inspector::capture_by_role(Role role) {
  auto layout = layouts_.analyze();
  if (role == Role::CodeEditor && layout.active_window &&
      layout.active_window->role == Role::CodeEditor)
    return orchestrator_.capture_specialized(*layout.active_window);

  auto it = layout.windows_by_role.find(role);
  if (it == layout.windows_by_role.end() || it->second.empty()) {
    LOG_WARN("capture_by_role: no " + std::string(role_name(role)) +
             " window found");
    SpecializedCapture empty;
    empty.role = role;
    return empty;
  }
  return orchestrator_.capture_specialized(it->second.front());
}

Status Inspector::try_save_capture(const Capture &capture,
                                   const std::string &path) {
  if (path.empty())
    throw std::invalid_argument("save_capture: empty path");
  try {
    return store_.save(capture, path);
  } catch (const std::exception &e) {
    return make_error(ErrorKind::AccessDenied, "save_capture", e.what());
  }
}

bool Inspector::save_capture(const Capture &capture, const std::string &path) {
  auto st = try_save_capture(capture, path);
  if (!st) {
    LOG_WARN("save_capture: " + st.error().to_string());
    return false;
  }
  return true;
}

std::future<std::vector<Window>> Inspector::discover_windows_async() {
  return std::async(std::launch::async, [this] { return discover_windows(); });
}

std::future<Role> Inspector::classify_window_async(hwnd_u64 hwnd) {
  require_handle(hwnd, "classify_window");
  return std::async(std::launch::async,
                    [this, hwnd] { return classify_window(hwnd); });
}

std::future<Layout> Inspector::analyze_layout_async(std::uint32_t pid) {
  return std::async(std::launch::async,
                    [this, pid] { return analyze_layout(pid); });
}

std::future<std::optional<Window>> Inspector::get_active_window_async() {
  return std::async(std::launch::async, [this] { return get_active_window(); });
}

std::future<std::vector<Window>> Inspector::find_windows_by_role_async(Role role) {
  return std::async(std::launch::async,
                    [this, role] { return find_windows_by_role(role); });
}

std::future<Capture> Inspector::capture_window_async(hwnd_u64 hwnd) {
  require_handle(hwnd, "capture_window");
  return std::async(std::launch::async,
                    [this, hwnd] { return capture_window(hwnd); });
}

std::future<Capture>
Inspector::capture_window_by_title_async(std::string title_fragment) {
  if (title_fragment.empty())
    throw std::invalid_argument("capture_window_by_title: empty title");
  return std::async(std::launch::async,
                    [this, title = std::move(title_fragment)] {
                      return capture_window_by_title(title);
                    });
}

std::future<Capture> Inspector::capture_region_async(int x, int y, int width,
                                                     int height) {
  if (width < 0 || height < 0)
    throw std::invalid_argument("capture_region: negative size");
  return std::async(std::launch::async, [this, x, y, width, height] {
    return capture_region(x, y, width, height);
  });
}

std::future<CompositeCapture> Inspector::capture_full_ide_async(std::uint32_t pid) {
  return std::async(std::launch::async,
                    [this, pid] { return capture_full_ide(pid); });
}

std::future<SpecializedCapture>
Inspector::capture_with_annotation_async(hwnd_u64 hwnd) {
  require_handle(hwnd, "capture_with_annotation");
  return std::async(std::launch::async,
                    [this, hwnd] { return capture_with_annotation(hwnd); });
}

std::future<SpecializedCapture>
Inspector::capture_with_annotation_async(hwnd_u64 hwnd, Role role) {
  require_handle(hwnd, "capture_with_annotation");
  return std::async(std::launch::async, [this, hwnd, role] {
    return capture_with_annotation(hwnd, role);
  });
}

std::future<SpecializedCapture> Inspector::capture_by_role_async(Role role) {
  return std::async(std::launch::async,
                    [this, role] { return capture_by_role(role); });
}

std::future<bool> Inspector::save_capture_async(Capture capture,
                                                std::string path) {
  if (path.empty())
    throw std::invalid_argument("save_capture: empty path");
  return std::async(std::launch::async,
                    [this, capture = std::move(capture), path = std::move(path)] {
                      return save_capture(capture, path);
                    });
}

} // namespace idelens
