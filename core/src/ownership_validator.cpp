#include "idelens/ownership_validator.hpp"
#include "idelens/logger.hpp"
#include "idelens/window_classifier.hpp"

namespace idelens {

static std::string_view base_name(std::string_view path) {
  auto pos = path.find_last_of("\\/");
  if (pos != std::string_view::npos)
    path.remove_prefix(pos + 1);
  return path;
}

OwnershipValidator::OwnershipValidator(IBackend &backend, OwnershipConfig cfg)
    : backend_(backend), cfg_(std::move(cfg)) {}

bool OwnershipValidator::is_allowed_image(std::string_view image_name) const {
  auto name = base_name(image_name);
  if (name.empty())
    return false;
  for (const auto &allowed : cfg_.allowed_processes)
    if (contains_icase(name, allowed))
      return true;
  return false;
}

Status OwnershipValidator::check_process(std::uint32_t pid,
                                         OwnershipScope scope) const {
  if (pid == 0)
    return make_error(ErrorKind::NotFound, "ownership.check_process",
                      "window has no owning process");
  if (scope == OwnershipScope::Capture && cfg_.allow_current_process &&
      pid == backend_.current_pid())
    return ok_status();

  auto image = backend_.process_image_name(pid);
  if (!image)
    return image.error();
  if (!is_allowed_image(image.value()))
    return make_error(ErrorKind::AccessDenied, "ownership.check_process",
                      "process " + std::to_string(pid) + " ('" +
                          image.value() + "') is not allow-listed");
  return ok_status();
}

Status OwnershipValidator::check(hwnd_u64 hwnd, OwnershipScope scope) const {
  std::optional<WindowInfo> wi;
  try {
    wi = backend_.get_info(hwnd);
  } catch (const std::exception &e) {
    return make_error(ErrorKind::NotFound, "ownership.check", e.what(), hwnd);
  }
  if (!wi)
    return make_error(ErrorKind::NotFound, "ownership.check",
                      "window no longer exists", hwnd);

  auto st = check_process(wi->pid, scope);
  if (!st) {
    Error err = st.error();
    err.hwnd = hwnd;
    return err;
  }
  return st;
}

bool OwnershipValidator::validate(hwnd_u64 hwnd,
                                  OwnershipScope scope) const noexcept {
  try {
    auto st = check(hwnd, scope);
    if (!st) {
      LOG_DEBUG("ownership: rejected " + st.error().to_string());
      return false;
    }
    return true;
  } catch (const std::exception &e) {
    LOG_WARN("ownership: validation of " + Hwnd(hwnd).to_string() +
             " failed: " + e.what());
    return false;
  }
}

bool OwnershipValidator::validate_process(std::uint32_t pid,
                                          OwnershipScope scope) const noexcept {
  try {
    auto st = check_process(pid, scope);
    if (!st) {
      LOG_DEBUG("ownership: rejected " + st.error().to_string());
      return false;
    }
    return true;
  } catch (const std::exception &e) {
    LOG_WARN("ownership: validation of pid " + std::to_string(pid) +
             " failed: " + e.what());
    return false;
  }
}

} // namespace idelens
