#include "idelens/fake_backend.hpp"
#include <algorithm>
#include <stdexcept>
#include <thread>

namespace idelens {

FakeBackend::FakeBackend(std::vector<FakeWindow> windows) {
  for (auto &w : windows)
    w_.emplace(w.hwnd, std::move(w));
}

std::vector<hwnd_u64> FakeBackend::list_top() {
  std::lock_guard<std::mutex> lk(mu_);
  ++top_walks_;
  std::vector<hwnd_u64> out;
  for (const auto &[hwnd, w] : w_)
    if (w.parent == 0)
      out.push_back(hwnd);
  return out;
}

std::vector<hwnd_u64> FakeBackend::list_children(hwnd_u64 parent) {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<hwnd_u64> out;
  for (const auto &[hwnd, w] : w_)
    if (w.parent == parent)
      out.push_back(hwnd);
  return out;
}

std::optional<WindowInfo> FakeBackend::get_info(hwnd_u64 hwnd) {
  std::chrono::milliseconds delay;
  {
    std::lock_guard<std::mutex> lk(mu_);
    delay = info_delay_;
  }
  if (delay.count() > 0)
    std::this_thread::sleep_for(delay);

  std::lock_guard<std::mutex> lk(mu_);
  if (fail_info_.count(hwnd))
    throw std::runtime_error("window destroyed during read");
  auto it = w_.find(hwnd);
  if (it == w_.end())
    return std::nullopt;
  const auto &fw = it->second;

  WindowInfo wi{};
  wi.hwnd = fw.hwnd;
  wi.parent = fw.parent;
  wi.class_name = fw.cls;
  wi.title = fw.title;
  wi.window_rect = fw.rect;
  wi.pid = fw.pid;
  wi.visible = fw.visible;
  return wi;
}

hwnd_u64 FakeBackend::foreground_window() {
  std::lock_guard<std::mutex> lk(mu_);
  return foreground_;
}

std::uint32_t FakeBackend::current_pid() {
  std::lock_guard<std::mutex> lk(mu_);
  return current_pid_;
}

Result<std::string> FakeBackend::process_image_name(std::uint32_t pid) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = procs_.find(pid);
  if (it == procs_.end() || it->second.state == ProcState::Gone)
    return make_error(ErrorKind::NotFound, "process_image_name",
                      "no process " + std::to_string(pid), 0, 87);
  if (it->second.state == ProcState::Denied)
    return make_error(ErrorKind::AccessDenied, "process_image_name",
                      "cannot open process " + std::to_string(pid), 0, 5);
  return it->second.image;
}

std::uint64_t FakeBackend::process_memory_bytes() {
  std::lock_guard<std::mutex> lk(mu_);
  return memory_bytes_;
}

void FakeBackend::relieve_memory_pressure() {
  std::lock_guard<std::mutex> lk(mu_);
  ++memory_reliefs_;
  injected_events_.push_back("relieve_memory_pressure");
}

void FakeBackend::enter_grab() {
  std::lock_guard<std::mutex> lk(mu_);
  ++grabs_;
  ++active_grabs_;
  max_active_grabs_ = std::max(max_active_grabs_, active_grabs_);
}

void FakeBackend::leave_grab() {
  std::lock_guard<std::mutex> lk(mu_);
  --active_grabs_;
}

Result<PixelBuffer> FakeBackend::make_pixels(int width, int height,
                                             std::uint8_t seed) {
  PixelBuffer px;
  px.width = width;
  px.height = height;
  px.bgra.resize(std::size_t(width) * height * 4);
  for (std::size_t i = 0; i < px.bgra.size(); i += 4) {
    px.bgra[i] = seed;
    px.bgra[i + 1] = std::uint8_t(i / 4);
    px.bgra[i + 2] = 0x40;
    px.bgra[i + 3] = 0xFF;
  }
  return px;
}

Result<PixelBuffer> FakeBackend::grab_window(hwnd_u64 hwnd, int width,
                                             int height) {
  enter_grab();
  std::chrono::milliseconds delay;
  bool fail = false;
  bool exists = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    delay = grab_delay_;
    fail = fail_grab_.count(hwnd) != 0;
    exists = w_.count(hwnd) != 0;
    injected_events_.push_back("grab_window:" + std::to_string(hwnd));
  }
  if (delay.count() > 0)
    std::this_thread::sleep_for(delay);
  leave_grab();

  if (!exists)
    return make_error(ErrorKind::NotFound, "grab_window",
                      "window no longer exists", hwnd, 1400);
  if (fail)
    return make_error(ErrorKind::Malformed, "BitBlt", "block copy failed",
                      hwnd, 6);
  return make_pixels(width, height, std::uint8_t(hwnd & 0xFF));
}

Result<PixelBuffer> FakeBackend::grab_screen(int x, int y, int width,
                                             int height) {
  enter_grab();
  std::chrono::milliseconds delay;
  {
    std::lock_guard<std::mutex> lk(mu_);
    delay = grab_delay_;
    injected_events_.push_back("grab_screen:" + std::to_string(x) + "," +
                               std::to_string(y));
  }
  if (delay.count() > 0)
    std::this_thread::sleep_for(delay);
  leave_grab();
  return make_pixels(width, height, 0x20);
}

std::vector<UIElementInfo> FakeBackend::inspect_ui_elements(hwnd_u64 parent) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = ui_elements_.find(parent);
  if (it != ui_elements_.end())
    return it->second;
  return {};
}

void FakeBackend::add_window(const FakeWindow &w) {
  std::lock_guard<std::mutex> lk(mu_);
  w_[w.hwnd] = w;
}

void FakeBackend::remove_window(hwnd_u64 hwnd) {
  std::lock_guard<std::mutex> lk(mu_);
  w_.erase(hwnd);
}

void FakeBackend::set_process(std::uint32_t pid, const std::string &image_name) {
  std::lock_guard<std::mutex> lk(mu_);
  procs_[pid] = FakeProcess{image_name, ProcState::Running};
}

void FakeBackend::set_process_gone(std::uint32_t pid) {
  std::lock_guard<std::mutex> lk(mu_);
  procs_[pid].state = ProcState::Gone;
}

void FakeBackend::set_process_denied(std::uint32_t pid) {
  std::lock_guard<std::mutex> lk(mu_);
  procs_[pid].state = ProcState::Denied;
}

void FakeBackend::set_foreground(hwnd_u64 hwnd) {
  std::lock_guard<std::mutex> lk(mu_);
  foreground_ = hwnd;
}

void FakeBackend::set_current_pid(std::uint32_t pid) {
  std::lock_guard<std::mutex> lk(mu_);
  current_pid_ = pid;
}

void FakeBackend::set_memory_bytes(std::uint64_t bytes) {
  std::lock_guard<std::mutex> lk(mu_);
  memory_bytes_ = bytes;
}

void FakeBackend::add_fake_ui_element(hwnd_u64 parent,
                                      const UIElementInfo &info) {
  std::lock_guard<std::mutex> lk(mu_);
  ui_elements_[parent].push_back(info);
}

void FakeBackend::fail_info(hwnd_u64 hwnd) {
  std::lock_guard<std::mutex> lk(mu_);
  fail_info_.insert(hwnd);
}

void FakeBackend::fail_grab(hwnd_u64 hwnd) {
  std::lock_guard<std::mutex> lk(mu_);
  fail_grab_.insert(hwnd);
}

void FakeBackend::set_info_delay(std::chrono::milliseconds delay) {
  std::lock_guard<std::mutex> lk(mu_);
  info_delay_ = delay;
}

void FakeBackend::set_grab_delay(std::chrono::milliseconds delay) {
  std::lock_guard<std::mutex> lk(mu_);
  grab_delay_ = delay;
}

int FakeBackend::top_walks() const {
  std::lock_guard<std::mutex> lk(mu_);
  return top_walks_;
}

int FakeBackend::grabs() const {
  std::lock_guard<std::mutex> lk(mu_);
  return grabs_;
}

int FakeBackend::memory_reliefs() const {
  std::lock_guard<std::mutex> lk(mu_);
  return memory_reliefs_;
}

int FakeBackend::max_concurrent_grabs() const {
  std::lock_guard<std::mutex> lk(mu_);
  return max_active_grabs_;
}

std::vector<std::string> FakeBackend::get_injected_events() const {
  std::lock_guard<std::mutex> lk(mu_);
  return injected_events_;
}

void FakeBackend::clear_injected_events() {
  std::lock_guard<std::mutex> lk(mu_);
  injected_events_.clear();
}

} // namespace idelens
