#include "idelens/composite_orchestrator.hpp"
#include "idelens/logger.hpp"
#include <future>

namespace idelens {

using SteadyClock = std::chrono::steady_clock;

static double ms_since(SteadyClock::time_point t) {
  return (double)std::chrono::duration_cast<std::chrono::milliseconds>(
             SteadyClock::now() - t)
      .count();
}

CompositeOrchestrator::CompositeOrchestrator(IBackend &backend,
                                             LayoutAnalyzer &layouts,
                                             CaptureEngine &captures)
    : backend_(backend), layouts_(layouts), captures_(captures) {}

SpecializedCapture CompositeOrchestrator::capture_specialized(const Window &window) {
  auto capture = captures_.capture_window(window.handle);

  std::vector<UIElementInfo> elements;
  if (!capture.empty()) {
    try {
      elements = backend_.inspect_ui_elements(window.handle);
    } catch (const std::exception &e) {
      LOG_WARN("composite: UI elements of " + Hwnd(window.handle).to_string() +
               " unavailable: " + e.what());
    }
  }
  auto s = annotator_.annotate(std::move(capture), window.role, window, elements);
  s.metadata["window_title"] = window.title;
  return s;
}

CompositeCapture CompositeOrchestrator::capture_full_ide(std::uint32_t pid) {
  auto started = SteadyClock::now();
  CompositeCapture out;

  out.layout = layouts_.analyze(pid);
  double layout_ms = ms_since(started);

  auto primary_started = SteadyClock::now();
  if (out.layout.main_window)
    out.primary = captures_.capture_window(out.layout.main_window->handle);
  else
    LOG_WARN("composite: no main window found, primary capture skipped");
  double primary_ms = ms_since(primary_started);

  std::vector<Window> targets;
  for (const auto &[role, windows] : out.layout.windows_by_role) {
    if (role == Role::Unknown || role == Role::MainWindow || windows.empty())
      continue;
    targets.push_back(windows.front());
  }

  std::vector<std::future<SpecializedCapture>> pending;
  pending.reserve(targets.size());
  for (const auto &w : targets) {
    pending.push_back(std::async(std::launch::async, [this, w]() {
      try {
        return capture_specialized(w);
      } catch (const std::exception &e) {
        LOG_ERROR("composite: " + std::string(role_name(w.role)) + " window " +
                  Hwnd(w.handle).to_string() + " failed: " + e.what());
        SpecializedCapture empty;
        empty.role = w.role;
        return empty;
      }
    }));
  }

  json::Array failed;
  for (size_t i = 0; i < pending.size(); ++i) {
    auto s = pending[i].get();
    if (s.empty()) {
      LOG_WARN("composite: no image for " +
               std::string(role_name(targets[i].role)) + " window " +
               Hwnd(targets[i].handle).to_string());
      failed.push_back(std::string(role_name(targets[i].role)));
      continue;
    }
    out.windows.push_back(std::move(s));
  }

  json::Array roles;
  for (const auto &[role, windows] : out.layout.windows_by_role)
    roles.push_back(std::string(role_name(role)));

  out.captured_at = Clock::now();
  out.metadata["window_count"] = (double)out.layout.all_windows.size();
  out.metadata["window_roles"] = roles;
  out.metadata["captured_windows"] = (double)out.windows.size();
  out.metadata["failed_windows"] = failed;
  out.metadata["layout_ms"] = layout_ms;
  out.metadata["primary_ms"] = primary_ms;
  out.metadata["total_ms"] = ms_since(started);

  LOG_INFO("composite: captured " + std::to_string(out.windows.size()) + " of " +
           std::to_string(targets.size()) + " panels");
  return out;
}

} // namespace idelens
