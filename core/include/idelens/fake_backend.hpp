#pragma once
#include "backend.hpp"
#include <chrono>
#include <map>
#include <mutex>
#include <set>

namespace idelens {

struct FakeWindow {
  hwnd_u64 hwnd{};
  hwnd_u64 parent{};
  std::uint32_t pid{};
  std::string title;
  std::string cls;
  Rect rect{0, 0, 100, 100};
  bool visible = true;
};

// Deterministic desktop for tests. Windows are listed in ascending handle
// order; every call is thread-safe.
class FakeBackend final : public IBackend {
public:
  FakeBackend() = default;
  explicit FakeBackend(std::vector<FakeWindow> windows);

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

  // Scripting
  void add_window(const FakeWindow &w);
  void remove_window(hwnd_u64 hwnd);
  void set_process(std::uint32_t pid, const std::string &image_name);
  void set_process_gone(std::uint32_t pid);
  void set_process_denied(std::uint32_t pid);
  void set_foreground(hwnd_u64 hwnd);
  void set_current_pid(std::uint32_t pid);
  void set_memory_bytes(std::uint64_t bytes);
  void add_fake_ui_element(hwnd_u64 parent, const UIElementInfo &info);

  // Failure injection
  void fail_info(hwnd_u64 hwnd);
  void fail_grab(hwnd_u64 hwnd);
  void set_info_delay(std::chrono::milliseconds delay);
  void set_grab_delay(std::chrono::milliseconds delay);

  // Observations
  int top_walks() const;
  int grabs() const;
  int memory_reliefs() const;
  int max_concurrent_grabs() const;
  std::vector<std::string> get_injected_events() const;
  void clear_injected_events();

private:
  enum class ProcState { Running, Gone, Denied };
  struct FakeProcess {
    std::string image;
    ProcState state = ProcState::Running;
  };

  Result<PixelBuffer> make_pixels(int width, int height, std::uint8_t seed);
  void enter_grab();
  void leave_grab();

  mutable std::mutex mu_;
  std::map<hwnd_u64, FakeWindow> w_;
  std::map<std::uint32_t, FakeProcess> procs_;
  std::map<hwnd_u64, std::vector<UIElementInfo>> ui_elements_;
  std::set<hwnd_u64> fail_info_;
  std::set<hwnd_u64> fail_grab_;
  hwnd_u64 foreground_ = 0;
  std::uint32_t current_pid_ = 4242;
  std::uint64_t memory_bytes_ = 64ull * 1024 * 1024;
  std::chrono::milliseconds info_delay_{0};
  std::chrono::milliseconds grab_delay_{0};

  int top_walks_ = 0;
  int grabs_ = 0;
  int memory_reliefs_ = 0;
  int active_grabs_ = 0;
  int max_active_grabs_ = 0;
  std::vector<std::string> injected_events_;
};

} // namespace idelens
