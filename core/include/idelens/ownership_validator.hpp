#pragma once
#include "backend.hpp"
#include "config.hpp"
#include "result.hpp"
#include <string_view>

namespace idelens {

// Discovery lists allow-listed processes only. Capture may also accept the
// inspector's own process (OwnershipConfig::allow_current_process).
enum class OwnershipScope { Discovery, Capture };

// Gate in front of every inspection: a window is trusted only when its owning
// process is allow-listed. All failure modes fail closed.
class OwnershipValidator {
public:
  OwnershipValidator(IBackend &backend, OwnershipConfig cfg);

  // NotFound: window or process gone. AccessDenied: the process cannot be
  // opened, or it is not allow-listed.
  Status check(hwnd_u64 hwnd,
               OwnershipScope scope = OwnershipScope::Capture) const;
  Status check_process(std::uint32_t pid,
                       OwnershipScope scope = OwnershipScope::Capture) const;

  // Never throw; failures are logged at DEBUG.
  bool validate(hwnd_u64 hwnd,
                OwnershipScope scope = OwnershipScope::Capture) const noexcept;
  bool validate_process(std::uint32_t pid,
                        OwnershipScope scope = OwnershipScope::Capture) const
      noexcept;

  // Case-insensitive substring match on the image base name.
  bool is_allowed_image(std::string_view image_name) const;

  const OwnershipConfig &config() const { return cfg_; }

private:
  IBackend &backend_;
  OwnershipConfig cfg_;
};

} // namespace idelens
