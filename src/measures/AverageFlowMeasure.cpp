// Ensemble-averaged flow. Writes one line at the end of the run:
//   M_total v_n...          (mode = magnitude)
//   M_total Qx_n Qy_n...    (mode = vector)
// Events are weighted by their multiplicity, so the result equals the flow of
// all accepted particles taken together.

#include <cstddef>
#include <memory>
#include <string>
#include <utility>

#include "ebeflow/flow/Flows.hpp"
#include "ebeflow/measures/IMeasure.hpp"
#include "ebeflow/measures/MeasureConfig.hpp"
#include "ebeflow/measures/MeasureRegistry.hpp"
#include "ebeflow/output/LineWriter.hpp"

namespace ebeflow {

namespace {

constexpr const char* kType = "flow_average";

class AverageFlowMeasure final : public IMeasure {
public:
  AverageFlowMeasure(std::string instance, measure_config::HarmonicRange range, FlowOutputMode mode,
                     output::OutputTarget target)
      : instance_(std::move(instance)),
        range_(range),
        mode_(mode),
        acc_(range.n_min, range.n_max),
        writer_(std::move(target)) {}

  std::string type() const override { return kType; }
  std::string instance_name() const override { return instance_; }

  void on_start() override { writer_.open(); }

  void on_event(const Event& ev, std::size_t) override { acc_.add(ev); }

  void finalize() override {
    std::string line = std::to_string(acc_.result().multiplicity());
    line += ' ';
    acc_.result().append_values(line, mode_);
    writer_.write_line(line);
    writer_.commit();
  }

  output::MeasureDescriptor describe() const override {
    output::MeasureDescriptor d;
    d.instance = instance_;
    d.type = kType;
    d.output = writer_.target().display();
    d.columns.push_back("M_total");
    for (auto& c : measure_config::flow_columns(range_, mode_)) d.columns.push_back(std::move(c));
    d.params["harmonic_min"] = std::to_string(range_.n_min);
    d.params["harmonic_max"] = std::to_string(range_.n_max);
    d.params["mode"] = flow_output_mode_name(mode_);
    d.params["events"] = std::to_string(acc_.events());
    return d;
  }

private:
  std::string instance_;
  measure_config::HarmonicRange range_;
  FlowOutputMode mode_;
  FlowAccumulator acc_;
  output::LineWriter writer_;
};

MeasureCapabilities caps_fn(const IniConfig& cfg, const std::string& section,
                            const std::string&, const MeasureBuildEnv&) {
  measure_config::require_keys(cfg, section, {"harmonic_min", "harmonic_max", "mode"});
  MeasureCapabilities c;
  c.outputs.push_back(measure_config::output_spec(cfg, section));
  return c;
}

std::unique_ptr<IMeasure> create_fn(const IniConfig& cfg, const std::string& section,
                                    const std::string& instance, const MeasureBuildEnv& env) {
  return std::make_unique<AverageFlowMeasure>(instance,
                                              measure_config::harmonic_range(cfg, section),
                                              measure_config::output_mode(cfg, section),
                                              measure_config::output_target(cfg, section, env));
}

} // namespace

static MeasureRegistrar reg(kType, "multiplicity-weighted flow averaged over all events", &caps_fn, &create_fn);

} // namespace ebeflow
