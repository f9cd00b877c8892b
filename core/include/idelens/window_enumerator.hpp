#pragma once
#include "backend.hpp"
#include "config.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <mutex>

namespace idelens {

struct Enumeration {
  // Top-level windows in z-order, children nested. Roles are not assigned.
  std::vector<Window> windows;
  bool timed_out = false;
  std::size_t skipped = 0;
  std::chrono::milliseconds elapsed{0};
};

// Walks the desktop window tree. One OS walk at a time per instance: a caller
// that arrives while a walk is running waits for it and gets its own copy of
// the result. The walk runs on a worker thread and the caller stops waiting
// at the deadline, even when a single OS call is still blocked.
class WindowEnumerator {
public:
  // Decides whether a top-level window (and its subtree) is kept. Called
  // before the children are read.
  using TopLevelFilter = std::function<bool(const WindowInfo &)>;

  WindowEnumerator(IBackend &backend, EnumerationConfig cfg,
                   TopLevelFilter filter = {});
  // Waits for walks abandoned at their deadline.
  ~WindowEnumerator();

  WindowEnumerator(const WindowEnumerator &) = delete;
  WindowEnumerator &operator=(const WindowEnumerator &) = delete;

  Enumeration enumerate();
  Enumeration enumerate(std::chrono::milliseconds budget);

  // Number of OS-level walks started so far.
  std::uint64_t walks() const { return walks_.load(); }

private:
  using SteadyClock = std::chrono::steady_clock;

  // Top-level windows finished so far by a running walk.
  struct Progress {
    std::mutex mu;
    std::vector<Window> windows;
    std::size_t skipped = 0;
  };

  Enumeration walk(SteadyClock::time_point deadline, Progress &progress);
  Enumeration run_walk(SteadyClock::time_point deadline);
  std::optional<Window> read_window(hwnd_u64 hwnd, hwnd_u64 foreground,
                                    Enumeration &out);
  void read_children(Window &parent, int depth, hwnd_u64 foreground,
                     SteadyClock::time_point deadline, Enumeration &out);

  IBackend &backend_;
  EnumerationConfig cfg_;
  TopLevelFilter filter_;

  std::mutex mu_;
  std::shared_future<Enumeration> in_flight_;
  std::atomic<std::uint64_t> walks_{0};
  // Last member: destroyed first, while the state the workers use is alive.
  std::vector<std::future<Enumeration>> abandoned_;
};

} // namespace idelens
