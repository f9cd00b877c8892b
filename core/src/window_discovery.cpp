#include "idelens/window_discovery.hpp"
#include "idelens/logger.hpp"
#include "idelens/window_classifier.hpp"

namespace idelens {

WindowDiscovery::WindowDiscovery(IBackend &backend,
                                 const EnumerationConfig &cfg,
                                 const OwnershipValidator &validator)
    : backend_(backend), cfg_(cfg), validator_(validator),
      enumerator_(backend, cfg, [this](const WindowInfo &wi) {
        return accept_top_level(wi);
      }) {}

bool WindowDiscovery::accept_top_level(const WindowInfo &wi) const {
  if (cfg_.require_ide_signature &&
      !has_ide_signature(wi.class_name, wi.title))
    return false;
  return validator_.validate_process(wi.pid, OwnershipScope::Discovery);
}

void WindowDiscovery::classify_tree(std::vector<Window> &windows,
                                    std::uint32_t trusted_pid) {
  std::vector<Window> kept;
  kept.reserve(windows.size());
  for (auto &w : windows) {
    if (w.pid != trusted_pid &&
        !validator_.validate_process(w.pid, OwnershipScope::Discovery)) {
      LOG_DEBUG("discover: dropping child " + Hwnd(w.handle).to_string() +
                " of foreign pid " + std::to_string(w.pid));
      continue;
    }
    w.role = classify(w.class_name, w.title);
    classify_tree(w.children, w.pid);
    kept.push_back(std::move(w));
  }
  windows = std::move(kept);
}

std::vector<Window> WindowDiscovery::discover() {
  return discover(std::chrono::milliseconds(cfg_.timeout_ms));
}

std::vector<Window> WindowDiscovery::discover(std::chrono::milliseconds budget) {
  auto e = enumerator_.enumerate(budget);
  for (auto &w : e.windows) {
    w.role = classify(w.class_name, w.title);
    classify_tree(w.children, w.pid);
  }
  LOG_DEBUG("discover: " + std::to_string(e.windows.size()) +
            " IDE windows" + (e.timed_out ? " (partial)" : ""));
  return std::move(e.windows);
}

std::optional<Window> WindowDiscovery::describe(hwnd_u64 hwnd,
                                                OwnershipScope scope) {
  std::optional<WindowInfo> wi;
  try {
    wi = backend_.get_info(hwnd);
  } catch (const std::exception &e) {
    LOG_WARN("describe: " + Hwnd(hwnd).to_string() + ": " + e.what());
    return std::nullopt;
  }
  if (!wi)
    return std::nullopt;
  if (!validator_.validate_process(wi->pid, scope))
    return std::nullopt;

  Window w;
  w.handle = hwnd;
  w.title = wi->title;
  w.class_name = wi->class_name;
  w.role = classify(*wi);
  w.visible = wi->visible;
  w.pid = wi->pid;
  w.bounds = Bounds::from_rect(wi->window_rect);
  if (wi->parent)
    w.parent = wi->parent;
  w.captured_at = Clock::now();
  return w;
}

std::optional<Window> WindowDiscovery::active_window() {
  hwnd_u64 fg = 0;
  try {
    fg = backend_.foreground_window();
  } catch (const std::exception &e) {
    LOG_WARN(std::string("active_window: ") + e.what());
    return std::nullopt;
  }
  if (!fg)
    return std::nullopt;

  auto w = describe(fg);
  if (!w)
    return std::nullopt;
  if (cfg_.require_ide_signature && !has_ide_signature(w->class_name, w->title))
    return std::nullopt;
  w->active = true;
  return w;
}

static void flatten_into(const std::vector<Window> &ws, bool include_children,
                         std::vector<Window> &out) {
  for (const auto &w : ws) {
    out.push_back(w);
    if (include_children)
      flatten_into(w.children, true, out);
  }
}

std::vector<Window> flatten_windows(const std::vector<Window> &roots,
                                    bool include_children) {
  std::vector<Window> out;
  flatten_into(roots, include_children, out);
  return out;
}

} // namespace idelens
