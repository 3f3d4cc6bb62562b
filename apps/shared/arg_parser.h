#pragma once

#include <functional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace ftr::apps {

// Option describes a single command-line flag accepted by an app.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns an empty string on success, or a message describing why the value was
// rejected.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<std::string(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParsedOptions {
  Config config;                    // NOLINT(readability-identifier-naming)
  std::vector<std::string> errors;  // NOLINT(readability-identifier-naming)
  bool help_requested{false};       // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1] and dispatches each recognised flag to its
// handler. Every rejected value, missing value and unknown flag is collected in `errors`;
// parsing continues so that all problems are reported at once. "--help" and "-h" set
// help_requested.
template <typename Config>
ParsedOptions<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 1,
                                    Config default_config = {}) {
  ParsedOptions<Config> parsed{std::move(default_config), {}, false};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    if (arg == "--help" || arg == "-h") {
      parsed.help_requested = true;
      continue;
    }

    const auto it = option_map.find(arg);
    if (it == option_map.end()) {
      parsed.errors.push_back("Unknown option: " + arg);
      continue;
    }

    const Option<Config>* opt = it->second;
    std::string value;
    if (opt->requires_value) {
      if (i + 1 >= argc) {
        parsed.errors.push_back("Option " + arg + " requires a value");
        continue;
      }
      value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }
    if (std::string error = opt->handler(parsed.config, value); !error.empty()) {
      parsed.errors.push_back(std::move(error));
    }
  }

  return parsed;
}

// format_usage renders one line per option for --help output.
template <typename Config>
std::string format_usage(const std::string& program, const std::vector<Option<Config>>& options) {
  std::ostringstream out;
  out << "Usage: " << program << " [options]\n";
  for (const auto& opt : options) {
    const std::string flag = opt.requires_value ? opt.name + " <value>" : opt.name;
    out << "  " << flag;
    for (std::size_t pad = flag.size(); pad < 34; ++pad) {
      out << ' ';
    }
    out << opt.description << "\n";
  }
  return out.str();
}

}  // namespace ftr::apps
