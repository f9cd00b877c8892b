#pragma once
#include "backend.hpp"
#include "capture_engine.hpp"
#include "capture_store.hpp"
#include "composite_orchestrator.hpp"
#include "config.hpp"
#include "layout_analyzer.hpp"
#include "ownership_validator.hpp"
#include "window_discovery.hpp"
#include <future>
#include <memory>

namespace idelens {

// Public entry points. Every operation is total: failures are logged and
// come back as empty collections, Unknown roles or zero-sized captures.
// Only invalid arguments throw (std::invalid_argument).
class Inspector {
public:
  explicit Inspector(IBackend *backend, InspectorConfig cfg = {});

  std::vector<Window> discover_windows();
  Role classify_window(hwnd_u64 hwnd);
  Layout analyze_layout(std::uint32_t pid = 0);
  std::optional<Window> get_active_window();
  std::vector<Window> find_windows_by_role(Role role);

  Capture capture_window(hwnd_u64 hwnd);
  Capture capture_window_by_title(const std::string &title_fragment);
  Capture capture_region(int x, int y, int width, int height);
  CompositeCapture capture_full_ide(std::uint32_t pid = 0);
  SpecializedCapture capture_with_annotation(hwnd_u64 hwnd);
  SpecializedCapture capture_with_annotation(hwnd_u64 hwnd, Role role);
  // First window of `role` (the active one first for code editors).
  SpecializedCapture capture_by_role(Role role);

  bool save_capture(const Capture &capture, const std::string &path);
  Status try_save_capture(const Capture &capture, const std::string &path);

  // Same operations on a worker thread.
  std::future<std::vector<Window>> discover_windows_async();
  std::future<Role> classify_window_async(hwnd_u64 hwnd);
  std::future<Layout> analyze_layout_async(std::uint32_t pid = 0);
  std::future<std::optional<Window>> get_active_window_async();
  std::future<std::vector<Window>> find_windows_by_role_async(Role role);
  std::future<Capture> capture_window_async(hwnd_u64 hwnd);
  std::future<Capture> capture_window_by_title_async(std::string title_fragment);
  std::future<Capture> capture_region_async(int x, int y, int width, int height);
  std::future<CompositeCapture> capture_full_ide_async(std::uint32_t pid = 0);
  std::future<SpecializedCapture> capture_with_annotation_async(hwnd_u64 hwnd);
  std::future<SpecializedCapture> capture_with_annotation_async(hwnd_u64 hwnd,
                                                                Role role);
  std::future<SpecializedCapture> capture_by_role_async(Role role);
  std::future<bool> save_capture_async(Capture capture, std::string path);

  const InspectorConfig &config() const { return cfg_; }
  void invalidate_layout_cache() { layouts_.invalidate(); }

  CaptureEngine &capture_engine() { return captures_; }
  LayoutAnalyzer &layout_analyzer() { return layouts_; }
  WindowDiscovery &discovery() { return discovery_; }

private:
  IBackend *backend_;
  InspectorConfig cfg_;
  OwnershipValidator validator_;
  WindowDiscovery discovery_;
  LayoutAnalyzer layouts_;
  CaptureEngine captures_;
  CompositeOrchestrator orchestrator_;
  CaptureStore store_;
};

} // namespace idelens
