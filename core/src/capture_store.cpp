#include "idelens/capture_store.hpp"
#include "idelens/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace idelens {

static std::string comparable(const fs::path &p) {
  auto s = p.lexically_normal().generic_string();
  while (s.size() > 1 && s.back() == '/')
    s.pop_back();
#ifdef _WIN32
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
#endif
  return s;
}

static bool is_under(const std::string &path, const std::string &root) {
  if (root.empty() || path.size() < root.size())
    return false;
  if (path.compare(0, root.size(), root) != 0)
    return false;
  return path.size() == root.size() || path[root.size()] == '/' ||
         root.back() == '/';
}

std::vector<std::string> CaptureStore::default_protected_roots() {
  std::vector<std::string> roots;
#ifdef _WIN32
  auto add_env = [&roots](const char *name, const char *suffix) {
    if (const char *v = std::getenv(name)) {
      if (*v)
        roots.push_back(std::string(v) + suffix);
    }
  };
  add_env("SystemRoot", "");
  add_env("SystemRoot", "\\System32");
  add_env("ProgramFiles", "");
  add_env("ProgramFiles(x86)", "");
  if (roots.empty()) {
    roots = {"C:\\Windows", "C:\\Windows\\System32", "C:\\Program Files",
             "C:\\Program Files (x86)"};
  }
#else
  roots = {"/bin", "/boot", "/dev", "/etc", "/lib",
           "/proc", "/sbin", "/sys", "/usr"};
#endif
  return roots;
}

CaptureStore::CaptureStore() : roots_(default_protected_roots()) {}

CaptureStore::CaptureStore(std::vector<std::string> protected_roots)
    : roots_(std::move(protected_roots)) {}

Status CaptureStore::check_path(const std::string &path) const {
  if (path.empty())
    return make_error(ErrorKind::Malformed, "save_capture", "empty path");
  if (path.find("..") != std::string::npos ||
      path.find('~') != std::string::npos)
    return make_error(ErrorKind::AccessDenied, "save_capture",
                      "path traversal rejected: " + path);

  std::error_code ec;
  auto full = fs::absolute(fs::path(path), ec);
  if (ec)
    return make_error(ErrorKind::Malformed, "save_capture",
                      "cannot resolve '" + path + "': " + ec.message(), 0,
                      static_cast<std::uint32_t>(ec.value()));

  auto target = comparable(full);
  for (const auto &root : roots_) {
    if (is_under(target, comparable(fs::path(root))))
      return make_error(ErrorKind::AccessDenied, "save_capture",
                        "refusing to write under system directory " + root);
  }
  return ok_status();
}

Status CaptureStore::save(const Capture &capture,
                          const std::string &path) const {
  if (capture.empty())
    return make_error(ErrorKind::Malformed, "save_capture",
                      "capture has no image data");
  auto st = check_path(path);
  if (!st)
    return st;

  std::error_code ec;
  auto full = fs::absolute(fs::path(path), ec);
  auto dir = full.parent_path();
  if (!dir.empty() && !fs::exists(dir, ec)) {
    fs::create_directories(dir, ec);
    if (ec)
      return make_error(ErrorKind::AccessDenied, "save_capture",
                        "cannot create '" + dir.string() + "': " + ec.message(),
                        0, static_cast<std::uint32_t>(ec.value()));
    LOG_DEBUG("save_capture: created " + dir.string());
  }

  std::ofstream f(full, std::ios::binary | std::ios::trunc);
  if (!f)
    return make_error(ErrorKind::AccessDenied, "save_capture",
                      "cannot open '" + full.string() + "' for writing");
  f.write(reinterpret_cast<const char *>(capture.data.data()),
          static_cast<std::streamsize>(capture.data.size()));
  if (!f)
    return make_error(ErrorKind::ResourceExhausted, "save_capture",
                      "short write to '" + full.string() + "'");

  LOG_INFO("Saved capture (" + std::to_string(capture.data.size()) +
           " bytes) to " + full.string());
  return ok_status();
}

} // namespace idelens
