#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "idelens/config.hpp"
#include "idelens/inspector.hpp"
#include "idelens/logger.hpp"
#include "idelens/report.hpp"
#include "idelens/tinyjson.hpp"
#include "idelens/win32_backend.hpp"

using namespace idelens;

static std::optional<hwnd_u64> parse_hwnd(const std::string &s) {
  if (s.rfind("0x", 0) != 0)
    return std::nullopt;
  std::uint64_t v = 0;
  std::stringstream ss;
  ss << std::hex << s.substr(2);
  ss >> v;
  if (ss.fail() || v == 0)
    return std::nullopt;
  return (hwnd_u64)v;
}

static int usage() {
  std::cerr << "Usage: idelens_probe <command> [args] [--config file.json] "
               "[--log-level LEVEL] [--out file.bmp] [--data]\n"
            << "Commands:\n"
            << "  discover\n"
            << "  classify <hwnd>\n"
            << "  active\n"
            << "  find <role>\n"
            << "  layout [pid]\n"
            << "  capture <hwnd>\n"
            << "  capture-title <text>\n"
            << "  region <x> <y> <width> <height>\n"
            << "  annotate <hwnd> [role]\n"
            << "  role <role>\n"
            << "  full [pid]\n"
            << "  config\n";
  return 2;
}

static void print(const json::Value &v) {
  std::cout << json::dumps_pretty(v) << "\n";
}

static json::Array windows_json(const std::vector<Window> &ws) {
  json::Array arr;
  for (const auto &w : ws)
    arr.push_back(window_to_json(w));
  return arr;
}

int main(int argc, char **argv) {
  if (argc < 2)
    return usage();

  std::string config_path;
  std::string log_level;
  std::string out_path;
  bool with_data = false;

  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (a == "--log-level" && i + 1 < argc) {
      log_level = argv[++i];
    } else if (a == "--out" && i + 1 < argc) {
      out_path = argv[++i];
    } else if (a == "--data") {
      with_data = true;
    } else {
      args.push_back(a);
    }
  }

  if (args.empty())
    return usage();
  std::string cmd = args[0];

  InspectorConfig cfg;
  try {
    if (!config_path.empty())
      cfg = load_config_file(config_path);
  } catch (const ConfigError &e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
  if (!log_level.empty()) {
    auto lvl = parse_log_level(log_level);
    if (!lvl) {
      std::cerr << "unknown log level: " << log_level << "\n";
      return 2;
    }
    cfg.log_level = *lvl;
  }
  Logger::get().set_level(cfg.log_level);

  if (cmd == "config") {
    print(config_to_json(cfg));
    return 0;
  }

  Win32Backend backend;
  Inspector inspector(&backend, cfg);

  auto role_arg = [&](size_t i) -> std::optional<Role> {
    if (i >= args.size())
      return std::nullopt;
    auto r = role_from_name(args[i]);
    if (!r)
      std::cerr << "unknown role: " << args[i] << "\n";
    return r;
  };

  auto hwnd_arg = [&](size_t i) -> std::optional<hwnd_u64> {
    if (i >= args.size())
      return std::nullopt;
    auto h = parse_hwnd(args[i]);
    if (!h)
      std::cerr << "bad window handle (expected 0x...): " << args[i] << "\n";
    return h;
  };

  auto pid_arg = [&](size_t i) -> std::uint32_t {
    if (i >= args.size())
      return 0;
    return static_cast<std::uint32_t>(std::stoul(args[i]));
  };

  // Prints the capture and writes it to --out when given.
  auto finish_capture = [&](const Capture &c, json::Object o) {
    if (!out_path.empty()) {
      auto st = inspector.try_save_capture(c, out_path);
      o["saved"] = st.ok();
      if (!st)
        o["save_error"] = st.error().to_string();
    }
    print(o);
    return c.empty() ? 1 : 0;
  };

  try {
    if (cmd == "discover") {
      print(windows_json(inspector.discover_windows()));
      return 0;
    }

    if (cmd == "classify") {
      auto h = hwnd_arg(1);
      if (!h)
        return usage();
      json::Object o;
      o["hwnd"] = Hwnd(*h).to_string();
      o["role"] = std::string(role_name(inspector.classify_window(*h)));
      print(o);
      return 0;
    }

    if (cmd == "active") {
      auto w = inspector.get_active_window();
      if (!w) {
        print(json::Null{});
        return 1;
      }
      print(window_to_json(*w, false));
      return 0;
    }

    if (cmd == "find") {
      auto r = role_arg(1);
      if (!r)
        return usage();
      print(windows_json(inspector.find_windows_by_role(*r)));
      return 0;
    }

    if (cmd == "layout") {
      print(layout_to_json(inspector.analyze_layout(pid_arg(1))));
      return 0;
    }

    if (cmd == "capture") {
      auto h = hwnd_arg(1);
      if (!h)
        return usage();
      auto c = inspector.capture_window(*h);
      return finish_capture(c, capture_to_json(c, with_data));
    }

    if (cmd == "capture-title") {
      if (args.size() < 2)
        return usage();
      auto c = inspector.capture_window_by_title(args[1]);
      return finish_capture(c, capture_to_json(c, with_data));
    }

    if (cmd == "region") {
      if (args.size() < 5)
        return usage();
      auto c = inspector.capture_region(std::stoi(args[1]), std::stoi(args[2]),
                                        std::stoi(args[3]), std::stoi(args[4]));
      return finish_capture(c, capture_to_json(c, with_data));
    }

    if (cmd == "annotate") {
      auto h = hwnd_arg(1);
      if (!h)
        return usage();
      SpecializedCapture s;
      if (args.size() > 2) {
        auto r = role_arg(2);
        if (!r)
          return usage();
        s = inspector.capture_with_annotation(*h, *r);
      } else {
        s = inspector.capture_with_annotation(*h);
      }
      return finish_capture(s, specialized_capture_to_json(s, with_data));
    }

    if (cmd == "role") {
      auto r = role_arg(1);
      if (!r)
        return usage();
      auto s = inspector.capture_by_role(*r);
      return finish_capture(s, specialized_capture_to_json(s, with_data));
    }

    if (cmd == "full") {
      auto cc = inspector.capture_full_ide(pid_arg(1));
      if (!out_path.empty() && !cc.primary.empty()) {
        if (!inspector.save_capture(cc.primary, out_path))
          std::cerr << "could not save primary capture to " << out_path << "\n";
      }
      print(composite_capture_to_json(cc, with_data));
      return cc.primary.empty() && cc.windows.empty() ? 1 : 0;
    }
  } catch (const std::invalid_argument &e) {
    std::cerr << e.what() << "\n";
    return 2;
  } catch (const std::out_of_range &e) {
    std::cerr << "argument out of range: " << e.what() << "\n";
    return 2;
  }

  return usage();
}
