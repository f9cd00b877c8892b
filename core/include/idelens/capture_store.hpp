#pragma once
#include "result.hpp"
#include "types.hpp"
#include <string>
#include <vector>

namespace idelens {

// Writes raw capture bytes to disk. Rejected with AccessDenied: paths with a
// ".." or "~" component and paths under a system directory. Rejected with
// Malformed: empty captures and empty paths. Missing parent directories are
// created.
class CaptureStore {
public:
  CaptureStore();
  explicit CaptureStore(std::vector<std::string> protected_roots);

  Status check_path(const std::string &path) const;
  Status save(const Capture &capture, const std::string &path) const;

  const std::vector<std::string> &protected_roots() const { return roots_; }

  static std::vector<std::string> default_protected_roots();

private:
  std::vector<std::string> roots_;
};

} // namespace idelens
