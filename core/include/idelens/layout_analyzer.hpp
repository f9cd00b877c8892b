#pragma once
#include "config.hpp"
#include "window_discovery.hpp"
#include <chrono>
#include <future>
#include <map>
#include <mutex>

namespace idelens {

enum class DockPosition : std::uint8_t { Left, Right, Top, Bottom, Floating };

std::string_view dock_position_name(DockPosition p);

// Heuristic thresholds in screen units.
inline constexpr int kOutsideTolerance = 50;
inline constexpr int kInteriorSideBand = 300;
inline constexpr int kInteriorBottomBand = 200;

DockPosition dock_position(const Bounds &panel, const Bounds &main);

// Panels are every window except MainWindow, Unknown and CodeEditor; the
// editor area is the first CodeEditor. Empty when there is no main window.
DockingLayout infer_docking(const std::vector<Window> &windows,
                            const std::optional<Window> &main);

// Groups an already classified, flattened window set.
Layout build_layout(std::vector<Window> windows);

// Layout per process id (0 = every allowed process), cached for
// `cache_ttl_ms`. Concurrent misses for the same key share one analysis.
class LayoutAnalyzer {
public:
  LayoutAnalyzer(WindowDiscovery &discovery, LayoutConfig cfg);

  Layout analyze(std::uint32_t pid = 0);
  void invalidate();

  std::uint64_t analyses() const;

private:
  using SteadyClock = std::chrono::steady_clock;

  struct Entry {
    Layout layout;
    SteadyClock::time_point at;
  };

  Layout compute(std::uint32_t pid);

  WindowDiscovery &discovery_;
  LayoutConfig cfg_;

  mutable std::mutex mu_;
  std::map<std::uint32_t, Entry> cache_;
  std::map<std::uint32_t, std::shared_future<Layout>> in_flight_;
  std::uint64_t analyses_ = 0;
};

} // namespace idelens
