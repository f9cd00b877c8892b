#include "idelens/window_enumerator.hpp"
#include "idelens/logger.hpp"
#include <algorithm>
#include <memory>

namespace idelens {

WindowEnumerator::WindowEnumerator(IBackend &backend, EnumerationConfig cfg,
                                   TopLevelFilter filter)
    : backend_(backend), cfg_(cfg), filter_(std::move(filter)) {}

Enumeration WindowEnumerator::enumerate() {
  return enumerate(std::chrono::milliseconds(cfg_.timeout_ms));
}

WindowEnumerator::~WindowEnumerator() {
  std::vector<std::future<Enumeration>> abandoned;
  {
    std::lock_guard<std::mutex> lk(mu_);
    abandoned.swap(abandoned_);
  }
  for (auto &f : abandoned)
    f.wait();
}

Enumeration WindowEnumerator::enumerate(std::chrono::milliseconds budget) {
  auto deadline = SteadyClock::now() + budget;

  std::promise<Enumeration> promise;
  std::shared_future<Enumeration> pending;
  bool owner = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (in_flight_.valid()) {
      pending = in_flight_;
    } else {
      in_flight_ = promise.get_future().share();
      owner = true;
    }
  }

  if (!owner) {
    LOG_TRACE("enumerate: joining in-flight walk");
    return pending.get();
  }

  Enumeration result;
  try {
    result = run_walk(deadline);
  } catch (const std::exception &e) {
    LOG_ERROR(std::string("enumerate: walk aborted: ") + e.what());
  } catch (...) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      in_flight_ = {};
    }
    promise.set_exception(std::current_exception());
    throw;
  }

  {
    std::lock_guard<std::mutex> lk(mu_);
    in_flight_ = {};
  }
  promise.set_value(result);
  return result;
}

Enumeration WindowEnumerator::run_walk(SteadyClock::time_point deadline) {
  auto started = SteadyClock::now();
  auto progress = std::make_shared<Progress>();
  auto task = std::async(std::launch::async, [this, deadline, progress] {
    return walk(deadline, *progress);
  });

  Enumeration out;
  if (task.wait_until(deadline) == std::future_status::timeout) {
    {
      std::lock_guard<std::mutex> lk(progress->mu);
      out.windows = progress->windows;
      out.skipped = progress->skipped;
    }
    out.timed_out = true;
    std::lock_guard<std::mutex> lk(mu_);
    abandoned_.erase(
        std::remove_if(abandoned_.begin(), abandoned_.end(),
                       [](const std::future<Enumeration> &f) {
                         return f.wait_for(std::chrono::seconds(0)) ==
                                std::future_status::ready;
                       }),
        abandoned_.end());
    abandoned_.push_back(std::move(task));
  } else {
    out = task.get();
  }

  out.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      SteadyClock::now() - started);
  if (out.timed_out) {
    LOG_WARN("enumerate: timed out after " +
             std::to_string(out.elapsed.count()) + " ms; returning " +
             std::to_string(out.windows.size()) + " top-level windows");
  } else {
    LOG_DEBUG("enumerate: " + std::to_string(out.windows.size()) +
              " top-level windows in " + std::to_string(out.elapsed.count()) +
              " ms");
  }
  return out;
}

static Window make_window(const WindowInfo &wi, hwnd_u64 hwnd,
                          hwnd_u64 foreground) {
  Window w;
  w.handle = wi.hwnd ? wi.hwnd : hwnd;
  w.title = wi.title;
  w.class_name = wi.class_name;
  w.visible = wi.visible;
  w.pid = wi.pid;
  w.bounds = Bounds::from_rect(wi.window_rect);
  if (wi.parent)
    w.parent = wi.parent;
  w.active = foreground != 0 && w.handle == foreground;
  w.captured_at = Clock::now();
  return w;
}

std::optional<Window> WindowEnumerator::read_window(hwnd_u64 hwnd,
                                                    hwnd_u64 foreground,
                                                    Enumeration &out) {
  std::optional<WindowInfo> wi;
  try {
    wi = backend_.get_info(hwnd);
  } catch (const std::exception &e) {
    LOG_WARN("enumerate: skipping " + Hwnd(hwnd).to_string() + ": " +
             e.what());
    ++out.skipped;
    return std::nullopt;
  }
  if (!wi) {
    LOG_DEBUG("enumerate: " + Hwnd(hwnd).to_string() + " vanished");
    ++out.skipped;
    return std::nullopt;
  }

  return make_window(*wi, hwnd, foreground);
}

void WindowEnumerator::read_children(Window &parent, int depth,
                                     hwnd_u64 foreground,
                                     SteadyClock::time_point deadline,
                                     Enumeration &out) {
  if (depth >= cfg_.max_child_depth)
    return;

  std::vector<hwnd_u64> kids;
  try {
    kids = backend_.list_children(parent.handle);
  } catch (const std::exception &e) {
    LOG_WARN("enumerate: cannot list children of " +
             Hwnd(parent.handle).to_string() + ": " + e.what());
    return;
  }

  for (auto h : kids) {
    if (SteadyClock::now() >= deadline) {
      out.timed_out = true;
      return;
    }
    auto child = read_window(h, foreground, out);
    if (!child)
      continue;
    if (!child->visible && !cfg_.include_hidden)
      continue;
    if (!child->parent)
      child->parent = parent.handle;
    read_children(*child, depth + 1, foreground, deadline, out);
    parent.children.push_back(std::move(*child));
    if (out.timed_out)
      return;
  }
}

Enumeration WindowEnumerator::walk(SteadyClock::time_point deadline,
                                   Progress &progress) {
  walks_.fetch_add(1);
  Enumeration out;

  hwnd_u64 foreground = 0;
  try {
    foreground = backend_.foreground_window();
  } catch (const std::exception &e) {
    LOG_DEBUG(std::string("enumerate: no foreground window: ") + e.what());
  }

  std::vector<hwnd_u64> top;
  try {
    top = backend_.list_top();
  } catch (const std::exception &e) {
    LOG_ERROR(std::string("enumerate: cannot list top-level windows: ") +
              e.what());
    return out;
  }

  for (auto h : top) {
    if (SteadyClock::now() >= deadline) {
      out.timed_out = true;
      break;
    }

    std::optional<WindowInfo> info;
    try {
      info = backend_.get_info(h);
    } catch (const std::exception &e) {
      LOG_WARN("enumerate: skipping " + Hwnd(h).to_string() + ": " + e.what());
      ++out.skipped;
      continue;
    }
    if (!info) {
      ++out.skipped;
      continue;
    }
    if (!info->visible && !cfg_.include_hidden)
      continue;
    if (filter_) {
      bool keep = false;
      try {
        keep = filter_(*info);
      } catch (const std::exception &e) {
        LOG_WARN("enumerate: filter failed for " + Hwnd(h).to_string() + ": " +
                 e.what());
      }
      if (!keep)
        continue;
    }

    Window w = make_window(*info, h, foreground);
    w.parent.reset();
    read_children(w, 0, foreground, deadline, out);
    out.windows.push_back(std::move(w));
    {
      std::lock_guard<std::mutex> lk(progress.mu);
      progress.windows.push_back(out.windows.back());
      progress.skipped = out.skipped;
    }
    if (out.timed_out)
      break;
  }

  // The last OS call may have run past the deadline.
  if (SteadyClock::now() >= deadline)
    out.timed_out = true;
  return out;
}

} // namespace idelens
