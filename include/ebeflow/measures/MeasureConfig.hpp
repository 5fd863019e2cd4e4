#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "ebeflow/config/IniConfig.hpp"
#include "ebeflow/flow/Flows.hpp"
#include "ebeflow/measures/MeasureRegistry.hpp"
#include "ebeflow/output/LineWriter.hpp"

// Config helpers shared by the measure factories in src/measures/.
namespace ebeflow::measure_config {

// Keys every [measure.*] section may carry; `extra` adds the measure's own.
inline void require_keys(const IniConfig& cfg, const std::string& section, std::set<std::string> extra) {
  extra.insert({"type", "enabled", "output"});
  cfg.require_known_keys(section, extra);
}

// "output" key; "-" (the default) is standard output.
inline std::string output_spec(const IniConfig& cfg, const std::string& section) {
  std::string s = cfg.get_string(section, "output", std::optional<std::string>("-"));
  if (s.empty()) {
    throw std::runtime_error("[" + section + "] output is empty (use '-' for stdout or a file path)");
  }
  return s;
}

inline output::OutputTarget output_target(const IniConfig& cfg, const std::string& section, const MeasureBuildEnv& env) {
  output::OutputTarget t;
  t.spec = output_spec(cfg, section);
  t.console = env.console;
  t.dry_run = env.dry_run;
  if (!t.is_console()) {
    std::filesystem::path p(t.spec);
    t.path = p.is_absolute() ? p : (env.cfg_dir / p).lexically_normal();
  }
  return t;
}

struct HarmonicRange {
  int n_min = kDefaultHarmonicMin;
  int n_max = kDefaultHarmonicMax;
};

inline HarmonicRange harmonic_range(const IniConfig& cfg, const std::string& section) {
  HarmonicRange r;
  r.n_min = cfg.get_int(section, "harmonic_min", std::optional<int>(kDefaultHarmonicMin));
  r.n_max = cfg.get_int(section, "harmonic_max", std::optional<int>(kDefaultHarmonicMax));
  if (r.n_min < 1 || r.n_max < r.n_min) {
    throw std::runtime_error("[" + section + "] invalid harmonic range: harmonic_min=" + std::to_string(r.n_min) +
                             " harmonic_max=" + std::to_string(r.n_max) + " (need 1 <= harmonic_min <= harmonic_max)");
  }
  return r;
}

inline FlowOutputMode output_mode(const IniConfig& cfg, const std::string& section) {
  return parse_flow_output_mode(cfg.get_string(section, "mode", std::optional<std::string>("magnitude")));
}

// Column names for one flow line, e.g. v2 v3 or Qx2 Qy2 Qx3 Qy3.
inline std::vector<std::string> flow_columns(const HarmonicRange& r, FlowOutputMode mode) {
  std::vector<std::string> cols;
  for (int n = r.n_min; n <= r.n_max; ++n) {
    if (mode == FlowOutputMode::Vector) {
      cols.push_back("Qx" + std::to_string(n));
      cols.push_back("Qy" + std::to_string(n));
    } else {
      cols.push_back("v" + std::to_string(n));
    }
  }
  return cols;
}

} // namespace ebeflow::measure_config
