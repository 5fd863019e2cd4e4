// Multiplicity counter: one line per event with the number of particles that
// passed the filter. With `raw = true` the pre-filter count follows on the same line.

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "ebeflow/measures/IMeasure.hpp"
#include "ebeflow/measures/MeasureConfig.hpp"
#include "ebeflow/measures/MeasureRegistry.hpp"
#include "ebeflow/output/LineWriter.hpp"

namespace ebeflow {

namespace {

constexpr const char* kType = "multiplicity";

class MultiplicityMeasure final : public IMeasure {
public:
  MultiplicityMeasure(std::string instance, bool with_raw, output::OutputTarget target)
      : instance_(std::move(instance)), with_raw_(with_raw), writer_(std::move(target)) {}

  std::string type() const override { return kType; }
  std::string instance_name() const override { return instance_; }

  void on_start() override { writer_.open(); }

  void on_event(const Event& ev, std::size_t) override {
    line_ = std::to_string(ev.multiplicity());
    if (with_raw_) {
      line_ += ' ';
      line_ += std::to_string(ev.raw_count);
    }
    writer_.write_line(line_);
    total_ += ev.multiplicity();
  }

  void finalize() override { writer_.commit(); }

  output::MeasureDescriptor describe() const override {
    output::MeasureDescriptor d;
    d.instance = instance_;
    d.type = kType;
    d.output = writer_.target().display();
    d.columns.push_back("M");
    if (with_raw_) d.columns.push_back("M_raw");
    d.params["raw"] = with_raw_ ? "true" : "false";
    d.params["total_multiplicity"] = std::to_string(total_);
    return d;
  }

private:
  std::string instance_;
  bool with_raw_ = false;
  output::LineWriter writer_;
  std::string line_;
  std::size_t total_ = 0;
};

MeasureCapabilities caps_fn(const IniConfig& cfg, const std::string& section,
                            const std::string&, const MeasureBuildEnv&) {
  measure_config::require_keys(cfg, section, {"raw"});
  MeasureCapabilities c;
  c.outputs.push_back(measure_config::output_spec(cfg, section));
  return c;
}

std::unique_ptr<IMeasure> create_fn(const IniConfig& cfg, const std::string& section,
                                    const std::string& instance, const MeasureBuildEnv& env) {
  const bool with_raw = cfg.get_bool(section, "raw", std::optional<bool>(false));
  return std::make_unique<MultiplicityMeasure>(instance, with_raw, measure_config::output_target(cfg, section, env));
}

} // namespace

static MeasureRegistrar reg(kType, "per-event particle count after filtering", &caps_fn, &create_fn);

} // namespace ebeflow
