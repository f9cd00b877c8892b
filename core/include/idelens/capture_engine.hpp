#pragma once
#include "backend.hpp"
#include "config.hpp"
#include "ownership_validator.hpp"
#include "result.hpp"
#include <chrono>
#include <functional>
#include <future>
#include <mutex>

namespace idelens {

// Single-shot, memory-bounded captures. The try_* calls report why a capture
// failed; capture_window / capture_region log the failure and return an
// empty Capture (zero size, no bytes). Nothing is retried.
class CaptureEngine {
public:
  CaptureEngine(IBackend &backend, const OwnershipValidator &validator,
                CaptureConfig cfg);
  // Waits for grabs abandoned at their deadline.
  ~CaptureEngine();

  CaptureEngine(const CaptureEngine &) = delete;
  CaptureEngine &operator=(const CaptureEngine &) = delete;

  Result<Capture> try_capture_window(hwnd_u64 hwnd);
  Result<Capture> try_capture_region(int x, int y, int width, int height);

  Capture capture_window(hwnd_u64 hwnd);
  Capture capture_region(int x, int y, int width, int height);

  // width * height * 4
  static std::uint64_t estimate_bytes(int width, int height);

  // Size and memory-pressure gate run before any allocation.
  Status preflight(int width, int height, const std::string &operation,
                   hwnd_u64 hwnd = 0);

  const CaptureConfig &config() const { return cfg_; }

private:
  using SteadyClock = std::chrono::steady_clock;

  // Runs `grab` on a worker thread and stops waiting at `deadline`.
  Result<PixelBuffer> grab_until(std::function<Result<PixelBuffer>()> grab,
                                 SteadyClock::time_point deadline,
                                 const std::string &operation, hwnd_u64 hwnd);
  Result<Capture> finish(Result<PixelBuffer> grabbed, int width, int height,
                         const std::string &operation, hwnd_u64 hwnd,
                         SteadyClock::time_point started,
                         SteadyClock::time_point deadline);

  IBackend &backend_;
  const OwnershipValidator &validator_;
  CaptureConfig cfg_;

  std::mutex mu_;
  std::vector<std::future<Result<PixelBuffer>>> abandoned_;
};

} // namespace idelens
