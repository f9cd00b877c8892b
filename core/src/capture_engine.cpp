#include "idelens/capture_engine.hpp"
#include "idelens/image_codec.hpp"
#include "idelens/logger.hpp"
#include <algorithm>

namespace idelens {

CaptureEngine::CaptureEngine(IBackend &backend,
                             const OwnershipValidator &validator,
                             CaptureConfig cfg)
    : backend_(backend), validator_(validator), cfg_(cfg) {}

CaptureEngine::~CaptureEngine() {
  std::vector<std::future<Result<PixelBuffer>>> abandoned;
  {
    std::lock_guard<std::mutex> lk(mu_);
    abandoned.swap(abandoned_);
  }
  for (auto &f : abandoned)
    f.wait();
}

std::uint64_t CaptureEngine::estimate_bytes(int width, int height) {
  if (width <= 0 || height <= 0)
    return 0;
  return std::uint64_t(width) * std::uint64_t(height) * 4;
}

Status CaptureEngine::preflight(int width, int height,
                                const std::string &operation, hwnd_u64 hwnd) {
  if (width <= 0 || height <= 0)
    return make_error(ErrorKind::Malformed, operation,
                      "invalid dimensions " + std::to_string(width) + "x" +
                          std::to_string(height),
                      hwnd);

  auto estimated = estimate_bytes(width, height);
  if (estimated > cfg_.max_bytes)
    return make_error(ErrorKind::ResourceExhausted, operation,
                      "estimated " + std::to_string(estimated) +
                          " bytes exceeds limit of " +
                          std::to_string(cfg_.max_bytes),
                      hwnd);
  if (estimated > cfg_.warning_bytes)
    LOG_WARN("capture: large capture of " + std::to_string(estimated) +
             " bytes (" + std::to_string(width) + "x" + std::to_string(height) +
             ") for " + Hwnd(hwnd).to_string());

  auto in_use = backend_.process_memory_bytes();
  if (in_use > cfg_.pressure_bytes) {
    LOG_INFO("capture: process memory at " + std::to_string(in_use) +
             " bytes, relieving pressure before capture");
    backend_.relieve_memory_pressure();
  }
  return ok_status();
}

Result<PixelBuffer>
CaptureEngine::grab_until(std::function<Result<PixelBuffer>()> grab,
                          SteadyClock::time_point deadline,
                          const std::string &operation, hwnd_u64 hwnd) {
  auto task = std::async(std::launch::async, std::move(grab));
  if (task.wait_until(deadline) != std::future_status::timeout)
    return task.get();

  std::lock_guard<std::mutex> lk(mu_);
  abandoned_.erase(
      std::remove_if(abandoned_.begin(), abandoned_.end(),
                     [](const std::future<Result<PixelBuffer>> &f) {
                       return f.wait_for(std::chrono::seconds(0)) ==
                              std::future_status::ready;
                     }),
      abandoned_.end());
  abandoned_.push_back(std::move(task));
  return make_error(ErrorKind::Timeout, operation,
                    "grab still running after " +
                        std::to_string(cfg_.time_budget_ms) + " ms budget",
                    hwnd);
}

Result<Capture> CaptureEngine::finish(Result<PixelBuffer> grabbed, int width,
                                      int height, const std::string &operation,
                                      hwnd_u64 hwnd,
                                      SteadyClock::time_point started,
                                      SteadyClock::time_point deadline) {
  if (!grabbed) {
    Error err = grabbed.error();
    if (!err.hwnd)
      err.hwnd = hwnd;
    return err;
  }
  const auto &px = grabbed.value();
  if (px.width != width || px.height != height)
    return make_error(ErrorKind::Malformed, operation,
                      "backend returned " + std::to_string(px.width) + "x" +
                          std::to_string(px.height) + ", expected " +
                          std::to_string(width) + "x" + std::to_string(height),
                      hwnd);
  if (SteadyClock::now() > deadline)
    return make_error(ErrorKind::Timeout, operation,
                      "capture exceeded " + std::to_string(cfg_.time_budget_ms) +
                          " ms budget",
                      hwnd);

  auto encoded = encode_bmp(px);
  if (!encoded) {
    Error err = encoded.error();
    err.hwnd = hwnd;
    return err;
  }

  Capture c;
  c.data = std::move(encoded).value();
  c.encoding = "BMP";
  c.width = width;
  c.height = height;
  c.captured_at = Clock::now();
  c.metadata["estimated_bytes"] = (double)estimate_bytes(width, height);
  c.metadata["resources_released"] = true;
  c.metadata["elapsed_ms"] =
      (double)std::chrono::duration_cast<std::chrono::milliseconds>(
          SteadyClock::now() - started)
          .count();
  return c;
}

Result<Capture> CaptureEngine::try_capture_window(hwnd_u64 hwnd) {
  const std::string op = "capture_window";
  auto started = SteadyClock::now();
  auto deadline = started + std::chrono::milliseconds(cfg_.time_budget_ms);

  auto owned = validator_.check(hwnd);
  if (!owned)
    return owned.error();

  std::optional<WindowInfo> wi;
  try {
    wi = backend_.get_info(hwnd);
  } catch (const std::exception &e) {
    return make_error(ErrorKind::NotFound, op, e.what(), hwnd);
  }
  if (!wi)
    return make_error(ErrorKind::NotFound, op, "window no longer exists", hwnd);

  long w = wi->window_rect.right - wi->window_rect.left;
  long h = wi->window_rect.bottom - wi->window_rect.top;
  auto gate = preflight(static_cast<int>(w), static_cast<int>(h), op, hwnd);
  if (!gate)
    return gate.error();
  if (SteadyClock::now() > deadline)
    return make_error(ErrorKind::Timeout, op, "budget spent before grab", hwnd);

  auto grabbed = grab_until(
      [this, hwnd, w, h] {
        return backend_.grab_window(hwnd, static_cast<int>(w),
                                    static_cast<int>(h));
      },
      deadline, op, hwnd);
  auto c = finish(std::move(grabbed), static_cast<int>(w), static_cast<int>(h),
                  op, hwnd, started, deadline);
  if (!c)
    return c;
  Capture out = std::move(c).value();
  out.metadata["capture_method"] = std::string("window_dc");
  out.metadata["source"] = Hwnd(hwnd).to_string();
  LOG_DEBUG("capture: " + Hwnd(hwnd).to_string() + " " + std::to_string(w) +
            "x" + std::to_string(h) + " -> " + std::to_string(out.data.size()) +
            " bytes");
  return out;
}

Result<Capture> CaptureEngine::try_capture_region(int x, int y, int width,
                                                  int height) {
  const std::string op = "capture_region";
  auto started = SteadyClock::now();
  auto deadline = started + std::chrono::milliseconds(cfg_.time_budget_ms);

  auto gate = preflight(width, height, op);
  if (!gate)
    return gate.error();

  if (SteadyClock::now() > deadline)
    return make_error(ErrorKind::Timeout, op, "budget spent before grab");

  auto grabbed = grab_until(
      [this, x, y, width, height] {
        return backend_.grab_screen(x, y, width, height);
      },
      deadline, op, 0);
  auto c = finish(std::move(grabbed), width, height, op, 0, started, deadline);
  if (!c)
    return c;
  Capture out = std::move(c).value();
  out.metadata["capture_method"] = std::string("screen_dc");
  out.metadata["source"] = std::to_string(x) + "," + std::to_string(y) + " " +
                           std::to_string(width) + "x" + std::to_string(height);
  return out;
}

Capture CaptureEngine::capture_window(hwnd_u64 hwnd) {
  try {
    auto r = try_capture_window(hwnd);
    if (r)
      return std::move(r).value();
    LOG_WARN("capture: " + r.error().to_string());
  } catch (const std::exception &e) {
    LOG_ERROR("capture: " + Hwnd(hwnd).to_string() + " failed: " + e.what());
  }
  return Capture{};
}

Capture CaptureEngine::capture_region(int x, int y, int width, int height) {
  try {
    auto r = try_capture_region(x, y, width, height);
    if (r)
      return std::move(r).value();
    LOG_WARN("capture: " + r.error().to_string());
  } catch (const std::exception &e) {
    LOG_ERROR(std::string("capture: region failed: ") + e.what());
  }
  return Capture{};
}

} // namespace idelens
