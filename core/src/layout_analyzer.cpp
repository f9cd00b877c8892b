#include "idelens/layout_analyzer.hpp"
#include "idelens/logger.hpp"

namespace idelens {

std::string_view dock_position_name(DockPosition p) {
  switch (p) {
  case DockPosition::Left:
    return "Left";
  case DockPosition::Right:
    return "Right";
  case DockPosition::Top:
    return "Top";
  case DockPosition::Bottom:
    return "Bottom";
  case DockPosition::Floating:
    return "Floating";
  }
  return "Floating";
}

DockPosition dock_position(const Bounds &panel, const Bounds &main) {
  if (panel.x < main.x - kOutsideTolerance)
    return DockPosition::Left;
  if (panel.x > main.right() + kOutsideTolerance)
    return DockPosition::Right;
  if (panel.y < main.y - kOutsideTolerance)
    return DockPosition::Top;
  if (panel.y > main.bottom() + kOutsideTolerance)
    return DockPosition::Bottom;

  bool inside = panel.x >= main.x && panel.right() <= main.right() &&
                panel.y >= main.y && panel.bottom() <= main.bottom();
  if (inside) {
    if (panel.x <= main.x + kInteriorSideBand)
      return DockPosition::Left;
    if (panel.right() >= main.right() - kInteriorSideBand)
      return DockPosition::Right;
    if (panel.bottom() >= main.bottom() - kInteriorBottomBand)
      return DockPosition::Bottom;
  }
  return DockPosition::Floating;
}

DockingLayout infer_docking(const std::vector<Window> &windows,
                            const std::optional<Window> &main) {
  DockingLayout d;
  if (!main)
    return d;

  for (const auto &w : windows) {
    if (w.role == Role::MainWindow || w.role == Role::Unknown ||
        w.role == Role::CodeEditor)
      continue;
    switch (dock_position(w.bounds, main->bounds)) {
    case DockPosition::Left:
      d.left.push_back(w);
      break;
    case DockPosition::Right:
      d.right.push_back(w);
      break;
    case DockPosition::Top:
      d.top.push_back(w);
      break;
    case DockPosition::Bottom:
      d.bottom.push_back(w);
      break;
    case DockPosition::Floating:
      d.floating.push_back(w);
      break;
    }
  }

  for (const auto &w : windows) {
    if (w.role == Role::CodeEditor) {
      d.editor_area = w;
      break;
    }
  }
  return d;
}

Layout build_layout(std::vector<Window> windows) {
  Layout l;
  l.analyzed_at = Clock::now();

  for (const auto &w : windows) {
    if (!l.main_window && w.role == Role::MainWindow)
      l.main_window = w;
    if (w.role != Role::Unknown)
      l.windows_by_role[w.role].push_back(w);
    if (!l.active_window && w.active)
      l.active_window = w;
  }
  if (!l.active_window && l.main_window)
    l.active_window = l.main_window;

  if (l.main_window)
    l.docking = infer_docking(windows, l.main_window);

  l.all_windows = std::move(windows);
  return l;
}

LayoutAnalyzer::LayoutAnalyzer(WindowDiscovery &discovery, LayoutConfig cfg)
    : discovery_(discovery), cfg_(cfg) {}

std::uint64_t LayoutAnalyzer::analyses() const {
  std::lock_guard<std::mutex> lk(mu_);
  return analyses_;
}

void LayoutAnalyzer::invalidate() {
  std::lock_guard<std::mutex> lk(mu_);
  cache_.clear();
}

Layout LayoutAnalyzer::compute(std::uint32_t pid) {
  auto roots = discovery_.discover();
  if (pid != 0) {
    std::vector<Window> mine;
    for (auto &w : roots)
      if (w.pid == pid)
        mine.push_back(std::move(w));
    roots = std::move(mine);
  }
  auto layout =
      build_layout(flatten_windows(roots, cfg_.include_child_windows));
  LOG_INFO("Layout analysis complete: " +
           std::to_string(layout.all_windows.size()) + " windows, " +
           std::to_string(layout.windows_by_role.size()) + " roles");
  return layout;
}

Layout LayoutAnalyzer::analyze(std::uint32_t pid) {
  auto ttl = std::chrono::milliseconds(cfg_.cache_ttl_ms);

  std::promise<Layout> promise;
  std::shared_future<Layout> pending;
  bool owner = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto hit = cache_.find(pid);
    if (hit != cache_.end()) {
      if (SteadyClock::now() - hit->second.at < ttl) {
        LOG_TRACE("layout: cache hit for pid " + std::to_string(pid));
        return hit->second.layout;
      }
      cache_.erase(hit);
    }
    auto running = in_flight_.find(pid);
    if (running != in_flight_.end()) {
      pending = running->second;
    } else {
      in_flight_[pid] = promise.get_future().share();
      ++analyses_;
      owner = true;
    }
  }

  if (!owner)
    return pending.get();

  Layout layout;
  bool computed = false;
  try {
    layout = compute(pid);
    computed = true;
  } catch (const std::exception &e) {
    LOG_ERROR(std::string("layout: analysis failed: ") + e.what());
  } catch (...) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      in_flight_.erase(pid);
    }
    promise.set_exception(std::current_exception());
    throw;
  }

  {
    std::lock_guard<std::mutex> lk(mu_);
    in_flight_.erase(pid);
    if (computed)
      cache_[pid] = Entry{layout, SteadyClock::now()};
  }
  promise.set_value(layout);
  return layout;
}

} // namespace idelens
