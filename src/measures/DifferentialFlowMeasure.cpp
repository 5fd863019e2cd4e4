// pT-differential flow averaged over all events. One line per pT bin, written
// at the end of the run:
//   pT_mid M v_n...            (mode = magnitude)
//   pT_mid M Qx_n Qy_n...      (mode = vector)
// Bins run from pT = 0 up to the highest populated bin; bins in between may have M = 0.

#include <cmath>
#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "ebeflow/flow/Flows.hpp"
#include "ebeflow/measures/IMeasure.hpp"
#include "ebeflow/measures/MeasureConfig.hpp"
#include "ebeflow/measures/MeasureRegistry.hpp"
#include "ebeflow/output/LineWriter.hpp"
#include "ebeflow/util/Parse.hpp"

namespace ebeflow {

namespace {

constexpr const char* kType = "flow_differential";

// Bin centres like 0.15 come out of (k + 0.5) * w as 0.15000000000000002.
double round_bin_mid(double x) {
  return std::round(x * 1e10) / 1e10;
}

class DifferentialFlowMeasure final : public IMeasure {
public:
  DifferentialFlowMeasure(std::string instance, measure_config::HarmonicRange range, FlowOutputMode mode,
                          double bin_width, output::OutputTarget target)
      : instance_(std::move(instance)),
        range_(range),
        mode_(mode),
        diff_(range.n_min, range.n_max, bin_width),
        writer_(std::move(target)) {}

  std::string type() const override { return kType; }
  std::string instance_name() const override { return instance_; }

  void on_start() override { writer_.open(); }

  void on_event(const Event& ev, std::size_t) override { diff_.add(ev); }

  void finalize() override {
    std::string line;
    for (std::size_t k = 0; k < diff_.num_bins(); ++k) {
      const Flows& f = diff_.bin(k);
      line.clear();
      append_double(line, round_bin_mid(diff_.bin_mid(k)));
      line += ' ';
      line += std::to_string(f.multiplicity());
      line += ' ';
      f.append_values(line, mode_);
      writer_.write_line(line);
    }
    writer_.commit();
  }

  output::MeasureDescriptor describe() const override {
    output::MeasureDescriptor d;
    d.instance = instance_;
    d.type = kType;
    d.output = writer_.target().display();
    d.columns = {"pT_mid", "M"};
    for (auto& c : measure_config::flow_columns(range_, mode_)) d.columns.push_back(std::move(c));
    d.params["harmonic_min"] = std::to_string(range_.n_min);
    d.params["harmonic_max"] = std::to_string(range_.n_max);
    d.params["mode"] = flow_output_mode_name(mode_);
    d.params["bin_width"] = format_double(diff_.bin_width());
    d.params["bins"] = std::to_string(diff_.num_bins());
    d.params["unbinned"] = std::to_string(diff_.unbinned());
    return d;
  }

private:
  std::string instance_;
  measure_config::HarmonicRange range_;
  FlowOutputMode mode_;
  DifferentialFlow diff_;
  output::LineWriter writer_;
};

double bin_width_from(const IniConfig& cfg, const std::string& section) {
  const double w = cfg.get_double(section, "bin_width", std::optional<double>(kDefaultPtBinWidth));
  if (!(w > 0.0) || !std::isfinite(w)) {
    throw std::runtime_error("[" + section + "] bin_width must be > 0, got " + format_double(w));
  }
  return w;
}

MeasureCapabilities caps_fn(const IniConfig& cfg, const std::string& section,
                            const std::string&, const MeasureBuildEnv&) {
  measure_config::require_keys(cfg, section, {"harmonic_min", "harmonic_max", "mode", "bin_width"});
  (void)bin_width_from(cfg, section);
  MeasureCapabilities c;
  c.outputs.push_back(measure_config::output_spec(cfg, section));
  return c;
}

std::unique_ptr<IMeasure> create_fn(const IniConfig& cfg, const std::string& section,
                                    const std::string& instance, const MeasureBuildEnv& env) {
  return std::make_unique<DifferentialFlowMeasure>(instance,
                                                   measure_config::harmonic_range(cfg, section),
                                                   measure_config::output_mode(cfg, section),
                                                   bin_width_from(cfg, section),
                                                   measure_config::output_target(cfg, section, env));
}

} // namespace

static MeasureRegistrar reg(kType, "event-averaged flow in pT bins (bin_width, default 0.1 GeV)", &caps_fn, &create_fn);

} // namespace ebeflow
