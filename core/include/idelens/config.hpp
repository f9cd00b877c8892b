#pragma once
#include "logger.hpp"
#include "tinyjson.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace idelens {

struct EnumerationConfig {
  int timeout_ms = 30000;
  bool include_hidden = false;
  int max_child_depth = 8;
  // Keep only top-level windows that look like the IDE (class table hit,
  // "Visual Studio" in the title, or a known panel title).
  bool require_ide_signature = true;
};

struct OwnershipConfig {
  // Case-insensitive substrings of the owning process image base name.
  std::vector<std::string> allowed_processes{"devenv", "visualstudio", "code"};
  bool allow_current_process = true;
};

struct CaptureConfig {
  std::uint64_t warning_bytes = 50'000'000;
  std::uint64_t max_bytes = 100'000'000;
  std::uint64_t pressure_bytes = 500'000'000;
  int time_budget_ms = 10000;
};

struct LayoutConfig {
  int cache_ttl_ms = 30000;
  bool include_child_windows = true;
};

struct InspectorConfig {
  EnumerationConfig enumeration;
  OwnershipConfig ownership;
  CaptureConfig capture;
  LayoutConfig layout;
  LogLevel log_level = LogLevel::INFO;
};

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Overlays the keys present in `o` onto defaults. Throws ConfigError on
// type mismatches or out-of-range values; unknown keys are logged.
InspectorConfig load_config(const json::Object &o);
InspectorConfig load_config_file(const std::string &path);

json::Object config_to_json(const InspectorConfig &cfg);

} // namespace idelens
