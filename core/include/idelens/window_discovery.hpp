#pragma once
#include "config.hpp"
#include "ownership_validator.hpp"
#include "window_enumerator.hpp"

namespace idelens {

// Enumerate -> validate ownership -> classify. Top-level windows are
// filtered before their children are read; a child owned by a different
// process is validated on its own.
class WindowDiscovery {
public:
  WindowDiscovery(IBackend &backend, const EnumerationConfig &cfg,
                  const OwnershipValidator &validator);

  std::vector<Window> discover();
  std::vector<Window> discover(std::chrono::milliseconds budget);

  // Foreground window when it passes validation (and the IDE signature
  // check when enabled), classified and flagged active.
  std::optional<Window> active_window();

  // Single window by handle, classified; nullopt when gone or rejected.
  std::optional<Window>
  describe(hwnd_u64 hwnd, OwnershipScope scope = OwnershipScope::Discovery);

  const WindowEnumerator &enumerator() const { return enumerator_; }

private:
  bool accept_top_level(const WindowInfo &wi) const;
  void classify_tree(std::vector<Window> &windows, std::uint32_t trusted_pid);

  IBackend &backend_;
  EnumerationConfig cfg_;
  const OwnershipValidator &validator_;
  WindowEnumerator enumerator_;
};

// Depth-first preorder copy of the tree; children lists are kept on the
// copies.
std::vector<Window> flatten_windows(const std::vector<Window> &roots,
                                    bool include_children);

} // namespace idelens
