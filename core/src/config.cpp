#include "idelens/config.hpp"
#include <fstream>
#include <set>
#include <sstream>

namespace idelens {

static void warn_unknown_keys(const json::Object &o,
                              const std::set<std::string> &known,
                              const std::string &section) {
  for (const auto &[k, v] : o) {
    if (!known.count(k))
      LOG_WARN("config: ignoring unknown key '" + section + k + "'");
  }
}

static const json::Object *section(const json::Object &o,
                                   const std::string &name) {
  auto it = o.find(name);
  if (it == o.end())
    return nullptr;
  if (!it->second.is_obj())
    throw ConfigError("config: '" + name + "' must be an object");
  return &it->second.as_obj();
}

static void read_int(const json::Object &o, const std::string &path,
                     const std::string &k, int &out, int min_value) {
  auto it = o.find(k);
  if (it == o.end())
    return;
  if (!it->second.is_num())
    throw ConfigError("config: '" + path + k + "' must be a number");
  double v = it->second.as_num();
  if (v < min_value || v > 2147483647.0)
    throw ConfigError("config: '" + path + k + "' out of range");
  out = static_cast<int>(v);
}

static void read_u64(const json::Object &o, const std::string &path,
                     const std::string &k, std::uint64_t &out) {
  auto it = o.find(k);
  if (it == o.end())
    return;
  if (!it->second.is_num())
    throw ConfigError("config: '" + path + k + "' must be a number");
  double v = it->second.as_num();
  if (v <= 0)
    throw ConfigError("config: '" + path + k + "' must be positive");
  out = static_cast<std::uint64_t>(v);
}

static void read_bool(const json::Object &o, const std::string &path,
                      const std::string &k, bool &out) {
  auto it = o.find(k);
  if (it == o.end())
    return;
  if (!it->second.is_bool())
    throw ConfigError("config: '" + path + k + "' must be a boolean");
  out = it->second.as_bool();
}

InspectorConfig load_config(const json::Object &o) {
  InspectorConfig cfg;
  warn_unknown_keys(o, {"enumeration", "ownership", "capture", "layout",
                        "log_level"},
                    "");

  if (auto it = o.find("log_level"); it != o.end()) {
    if (!it->second.is_str())
      throw ConfigError("config: 'log_level' must be a string");
    auto lvl = parse_log_level(it->second.as_str());
    if (!lvl)
      throw ConfigError("config: unknown log level '" + it->second.as_str() +
                        "'");
    cfg.log_level = *lvl;
  }

  if (const auto *e = section(o, "enumeration")) {
    warn_unknown_keys(*e, {"timeout_ms", "include_hidden", "max_child_depth",
                           "require_ide_signature"},
                      "enumeration.");
    read_int(*e, "enumeration.", "timeout_ms", cfg.enumeration.timeout_ms, 1);
    read_bool(*e, "enumeration.", "include_hidden",
              cfg.enumeration.include_hidden);
    read_int(*e, "enumeration.", "max_child_depth",
             cfg.enumeration.max_child_depth, 0);
    read_bool(*e, "enumeration.", "require_ide_signature",
              cfg.enumeration.require_ide_signature);
  }

  if (const auto *w = section(o, "ownership")) {
    warn_unknown_keys(*w, {"allowed_processes", "allow_current_process"},
                      "ownership.");
    if (auto it = w->find("allowed_processes"); it != w->end()) {
      if (!it->second.is_arr())
        throw ConfigError("config: 'ownership.allowed_processes' must be an array");
      std::vector<std::string> names;
      for (const auto &v : it->second.as_arr()) {
        if (!v.is_str() || v.as_str().empty())
          throw ConfigError(
              "config: 'ownership.allowed_processes' entries must be non-empty strings");
        names.push_back(v.as_str());
      }
      cfg.ownership.allowed_processes = std::move(names);
    }
    read_bool(*w, "ownership.", "allow_current_process",
              cfg.ownership.allow_current_process);
  }

  if (const auto *c = section(o, "capture")) {
    warn_unknown_keys(*c, {"warning_bytes", "max_bytes", "pressure_bytes",
                           "time_budget_ms"},
                      "capture.");
    read_u64(*c, "capture.", "warning_bytes", cfg.capture.warning_bytes);
    read_u64(*c, "capture.", "max_bytes", cfg.capture.max_bytes);
    read_u64(*c, "capture.", "pressure_bytes", cfg.capture.pressure_bytes);
    read_int(*c, "capture.", "time_budget_ms", cfg.capture.time_budget_ms, 1);
    if (cfg.capture.warning_bytes > cfg.capture.max_bytes)
      throw ConfigError("config: capture.warning_bytes exceeds capture.max_bytes");
  }

  if (const auto *l = section(o, "layout")) {
    warn_unknown_keys(*l, {"cache_ttl_ms", "include_child_windows"}, "layout.");
    read_int(*l, "layout.", "cache_ttl_ms", cfg.layout.cache_ttl_ms, 0);
    read_bool(*l, "layout.", "include_child_windows",
              cfg.layout.include_child_windows);
  }

  return cfg;
}

InspectorConfig load_config_file(const std::string &path) {
  std::ifstream f(path, std::ios::binary);
  if (!f)
    throw ConfigError("config: cannot open '" + path + "'");
  std::ostringstream ss;
  ss << f.rdbuf();

  json::Value v;
  try {
    v = json::parse(ss.str());
  } catch (const json::ParseError &e) {
    throw ConfigError("config: '" + path + "' is not valid JSON: " + e.what());
  }
  if (!v.is_obj())
    throw ConfigError("config: '" + path + "' must contain a JSON object");
  LOG_DEBUG("Loaded config from " + path);
  return load_config(v.as_obj());
}

json::Object config_to_json(const InspectorConfig &cfg) {
  json::Object e;
  e["timeout_ms"] = (double)cfg.enumeration.timeout_ms;
  e["include_hidden"] = cfg.enumeration.include_hidden;
  e["max_child_depth"] = (double)cfg.enumeration.max_child_depth;
  e["require_ide_signature"] = cfg.enumeration.require_ide_signature;

  json::Object w;
  json::Array names;
  for (const auto &n : cfg.ownership.allowed_processes)
    names.push_back(n);
  w["allowed_processes"] = names;
  w["allow_current_process"] = cfg.ownership.allow_current_process;

  json::Object c;
  c["warning_bytes"] = (double)cfg.capture.warning_bytes;
  c["max_bytes"] = (double)cfg.capture.max_bytes;
  c["pressure_bytes"] = (double)cfg.capture.pressure_bytes;
  c["time_budget_ms"] = (double)cfg.capture.time_budget_ms;

  json::Object l;
  l["cache_ttl_ms"] = (double)cfg.layout.cache_ttl_ms;
  l["include_child_windows"] = cfg.layout.include_child_windows;

  json::Object o;
  o["enumeration"] = e;
  o["ownership"] = w;
  o["capture"] = c;
  o["layout"] = l;
  o["log_level"] = std::string(log_level_name(cfg.log_level));
  return o;
}

} // namespace idelens
