#pragma once
#include "backend.hpp"

namespace idelens {

// user32 / gdi32 / psapi / UI Automation. Builds everywhere; off Windows
// every call reports nothing found.
class Win32Backend final : public IBackend {
public:
  std::vector<hwnd_u64> list_top() override;
  std::vector<hwnd_u64> list_children(hwnd_u64 parent) override;
  std::optional<WindowInfo> get_info(hwnd_u64 hwnd) override;
  hwnd_u64 foreground_window() override;

  std::uint32_t current_pid() override;
  Result<std::string> process_image_name(std::uint32_t pid) override;
  std::uint64_t process_memory_bytes() override;
  void relieve_memory_pressure() override;

  Result<PixelBuffer> grab_window(hwnd_u64 hwnd, int width, int height) override;
  Result<PixelBuffer> grab_screen(int x, int y, int width, int height) override;

  std::vector<UIElementInfo> inspect_ui_elements(hwnd_u64 parent) override;

  // Depth of the UI Automation walk below the window element.
  static constexpr int kUiaMaxDepth = 4;
};

} // namespace idelens
