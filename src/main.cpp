#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "ebeflow/app/Runner.hpp"
#include "ebeflow/config/IniConfig.hpp"
#include "ebeflow/io/InputFormat.hpp"
#include "ebeflow/measures/MeasureRegistry.hpp"

namespace fs = std::filesystem;

namespace {

// Used when no --config is given: event-by-event flow of every input to stdout.
constexpr const char* kDefaultConfig =
    "[general]\n"
    "profile = false\n"
    "[measure.flow]\n"
    "type = flow\n"
    "output = -\n";

struct Cli {
  fs::path config;
  std::optional<std::string> format;
  std::vector<std::string> files;
  bool list_measures = false;
  bool validate_config = false;
};

void print_usage(const char* argv0) {
  std::cerr
      << "Usage: " << argv0 << " [--config <path>] [--validate-config] [--format auto|std|urqmd] [files...]\n"
      << "       " << argv0 << " --list-measures\n"
      << "       " << argv0 << " --version\n"
      << "\n"
      << "Files ('-' = standard input) and --format override [input] of the config.\n"
      << "Without --config, event-by-event v2..v4 of the inputs (or stdin) are written to stdout.\n";
}

Cli parse_cli(int argc, char** argv) {
  Cli cli;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--help" || a == "-h") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (a == "--version") {
      std::cout << EBEFLOW_VERSION_STR << "\n";
      std::exit(0);
    } else if (a == "--config") {
      if (i + 1 >= argc) throw std::runtime_error("--config requires a value");
      cli.config = fs::path(argv[++i]);
    } else if (a == "--format") {
      if (i + 1 >= argc) throw std::runtime_error("--format requires a value");
      cli.format = argv[++i];
      (void)ebeflow::parse_input_format(*cli.format);
    } else if (a == "--list-measures") {
      cli.list_measures = true;
    } else if (a == "--validate-config") {
      cli.validate_config = true;
    } else if (a.size() > 1 && a[0] == '-') {
      throw std::runtime_error("unknown argument: " + a);
    } else {
      cli.files.push_back(a);
    }
  }
  if (cli.validate_config && cli.config.empty()) {
    throw std::runtime_error("--validate-config requires --config");
  }
  return cli;
}

// Positional files are relative to the working directory, not to the config.
std::string files_value(const std::vector<std::string>& files) {
  std::string out;
  for (const auto& f : files) {
    if (f.find(',') != std::string::npos) {
      throw std::runtime_error("input file names must not contain ',': " + f);
    }
    if (!out.empty()) out += ", ";
    out += (f == ebeflow::kStdinName) ? f : fs::absolute(f).lexically_normal().string();
  }
  return out;
}

} // namespace

int main(int argc, char** argv) {
  try {
    Cli cli = parse_cli(argc, argv);

    if (cli.list_measures) {
      const auto& reg = ebeflow::MeasureRegistry::instance();
      for (const auto& t : reg.registered_types()) {
        std::cout << t << "\t" << reg.require(t).summary << "\n";
      }
      return 0;
    }

    ebeflow::IniConfig cfg = cli.config.empty() ? ebeflow::IniConfig::from_string(kDefaultConfig, "")
                                                : ebeflow::IniConfig(cli.config);
    if (!cli.files.empty()) cfg.set("input", "files", files_value(cli.files));
    if (cli.format) cfg.set("input", "format", *cli.format);

    ebeflow::Runner runner(cfg);
    if (cli.validate_config) {
      return runner.validate_config();
    }
    return runner.run();

  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
  }
}
