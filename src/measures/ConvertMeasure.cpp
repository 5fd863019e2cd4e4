// Re-emits the filtered events in the standard format ("id pT phi eta" per
// particle, a blank line after every event). Reading the result back yields the
// same events, except that events left with no particles disappear.

#include <cstddef>
#include <memory>
#include <string>
#include <utility>

#include "ebeflow/measures/IMeasure.hpp"
#include "ebeflow/measures/MeasureConfig.hpp"
#include "ebeflow/measures/MeasureRegistry.hpp"
#include "ebeflow/output/LineWriter.hpp"
#include "ebeflow/util/Parse.hpp"

namespace ebeflow {

namespace {

constexpr const char* kType = "convert";

class ConvertMeasure final : public IMeasure {
public:
  ConvertMeasure(std::string instance, output::OutputTarget target)
      : instance_(std::move(instance)), writer_(std::move(target)) {}

  std::string type() const override { return kType; }
  std::string instance_name() const override { return instance_; }

  void on_start() override { writer_.open(); }

  void on_event(const Event& ev, std::size_t) override {
    for (const auto& p : ev.particles) {
      line_ = std::to_string(p.id);
      line_ += ' ';
      append_double(line_, p.pT);
      line_ += ' ';
      append_double(line_, p.phi);
      line_ += ' ';
      append_double(line_, p.eta);
      writer_.write_line(line_);
    }
    writer_.write_line("");
    particles_ += ev.particles.size();
    ++events_;
  }

  void finalize() override { writer_.commit(); }

  output::MeasureDescriptor describe() const override {
    output::MeasureDescriptor d;
    d.instance = instance_;
    d.type = kType;
    d.output = writer_.target().display();
    d.columns = {"id", "pT", "phi", "eta"};
    d.params["events"] = std::to_string(events_);
    d.params["particles"] = std::to_string(particles_);
    return d;
  }

private:
  std::string instance_;
  output::LineWriter writer_;
  std::string line_;
  std::size_t events_ = 0;
  std::size_t particles_ = 0;
};

MeasureCapabilities caps_fn(const IniConfig& cfg, const std::string& section,
                            const std::string&, const MeasureBuildEnv&) {
  measure_config::require_keys(cfg, section, {});
  MeasureCapabilities c;
  c.outputs.push_back(measure_config::output_spec(cfg, section));
  return c;
}

std::unique_ptr<IMeasure> create_fn(const IniConfig& cfg, const std::string& section,
                                    const std::string& instance, const MeasureBuildEnv& env) {
  return std::make_unique<ConvertMeasure>(instance, measure_config::output_target(cfg, section, env));
}

} // namespace

static MeasureRegistrar reg(kType, "write filtered events in the standard 'id pT phi eta' format", &caps_fn, &create_fn);

} // namespace ebeflow
