#pragma once

#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mortcalc::apps {

// Option is one flag of mortcalc_server (ServerConfig) or mortcalc_cli
// (CalculateArgs). handler stores the value into Config and returns false when
// it rejects the value; rejecting handlers also mark Config themselves, since
// parsing carries on to the next flag either way.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// parse_options walks argv[start..argc-1] and feeds each known flag to its
// handler. Unknown flags and a trailing flag without its value are printed to
// stderr and passed to on_error (the server uses it to refuse startup; the CLI
// leaves it empty and ignores them). Bare words are skipped.
template <typename Config>
Config parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                     const std::vector<Option<Config>>& options, int start = 1,
                     Config config = {},
                     const std::function<void(Config&)>& on_error = nullptr) {
  std::unordered_map<std::string, const Option<Config>*> by_name;
  for (const auto& opt : options) {
    by_name[opt.name] = &opt;
  }

  const auto report = [&](const std::string& message) {
    std::cerr << message << "\n";
    if (on_error) {
      on_error(config);
    }
  };

  for (int i = start; i < argc; ++i) {
    const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    const auto it = by_name.find(arg);
    if (it == by_name.end()) {
      if (!arg.empty() && arg[0] == '-') {
        report("Unknown option: " + arg);
      }
      continue;
    }

    const Option<Config>& opt = *it->second;
    if (!opt.requires_value) {
      opt.handler(config, "");
    } else if (i + 1 < argc) {
      opt.handler(config, argv[++i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    } else {
      report("Option " + arg + " requires a value");
    }
  }

  return config;
}

// format_usage renders "Usage: <synopsis>" followed by one entry per flag.
template <typename Config>
std::string format_usage(std::string_view synopsis, const std::vector<Option<Config>>& options) {
  std::ostringstream oss;
  oss << "Usage: " << synopsis << "\n";
  for (const auto& opt : options) {
    oss << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "\n      "
        << opt.description << "\n";
  }
  return oss.str();
}

}  // namespace mortcalc::apps
