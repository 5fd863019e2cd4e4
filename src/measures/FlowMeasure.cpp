// Event-by-event flow: one line per event with v_n (mode = magnitude) or
// Qx_n Qy_n (mode = vector) for n = harmonic_min .. harmonic_max.
//
//   [measure.flow]
//   type = flow
//   output = -            # or a file path
//   harmonic_min = 2
//   harmonic_max = 4
//   mode = magnitude

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

constexpr const char* kType = "flow";

class FlowMeasure final : public IMeasure {
public:
  FlowMeasure(std::string instance, measure_config::HarmonicRange range, FlowOutputMode mode,
              output::OutputTarget target)
      : instance_(std::move(instance)), range_(range), mode_(mode), writer_(std::move(target)) {}

  std::string type() const override { return kType; }
  std::string instance_name() const override { return instance_; }

  void on_start() override { writer_.open(); }

  void on_event(const Event& ev, std::size_t) override {
    const Flows flows(ev, range_.n_min, range_.n_max);
    line_.clear();
    flows.append_values(line_, mode_);
    writer_.write_line(line_);
  }

  void finalize() override { writer_.commit(); }

  output::MeasureDescriptor describe() const override {
    output::MeasureDescriptor d;
    d.instance = instance_;
    d.type = kType;
    d.output = writer_.target().display();
    d.columns = measure_config::flow_columns(range_, mode_);
    d.params["harmonic_min"] = std::to_string(range_.n_min);
    d.params["harmonic_max"] = std::to_string(range_.n_max);
    d.params["mode"] = flow_output_mode_name(mode_);
    d.params["lines"] = std::to_string(writer_.lines_written());
    return d;
  }

private:
  std::string instance_;
  measure_config::HarmonicRange range_;
  FlowOutputMode mode_;
  output::LineWriter writer_;
  std::string line_;
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
  return std::make_unique<FlowMeasure>(instance,
                                       measure_config::harmonic_range(cfg, section),
                                       measure_config::output_mode(cfg, section),
                                       measure_config::output_target(cfg, section, env));
}

} // namespace

static MeasureRegistrar reg(kType, "per-event flow coefficients (v_n or Qx_n Qy_n)", &caps_fn, &create_fn);

} // namespace ebeflow
