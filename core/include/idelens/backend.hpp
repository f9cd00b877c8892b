#pragma once
#include "result.hpp"
#include "types.hpp"
#include <optional>
#include <vector>

namespace idelens {

// Window-system seam. Every call may block on the OS and must be safe to
// call from several worker threads at once.
class IBackend {
public:
  virtual ~IBackend() = default;

  // Window list
  virtual std::vector<hwnd_u64> list_top() = 0;
  // Direct children only, in z-order.
  virtual std::vector<hwnd_u64> list_children(hwnd_u64 parent) = 0;
  // nullopt when the handle is no longer a window. May throw when the
  // window disappears halfway through the read.
  virtual std::optional<WindowInfo> get_info(hwnd_u64 hwnd) = 0;
  virtual hwnd_u64 foreground_window() = 0;

  // Processes
  virtual std::uint32_t current_pid() = 0;
  // Image base name ("devenv.exe"). NotFound when the process is gone,
  // AccessDenied when it cannot be opened.
  virtual Result<std::string> process_image_name(std::uint32_t pid) = 0;
  virtual std::uint64_t process_memory_bytes() = 0;
  virtual void relieve_memory_pressure() = 0;

  // Pixels. Both return top-down BGRA of exactly width x height.
  virtual Result<PixelBuffer> grab_window(hwnd_u64 hwnd, int width,
                                          int height) = 0;
  virtual Result<PixelBuffer> grab_screen(int x, int y, int width,
                                          int height) = 0;

  // UI Automation
  virtual std::vector<UIElementInfo> inspect_ui_elements(hwnd_u64 parent) = 0;
};

} // namespace idelens
