#pragma once

#include <cstddef>
#include <string>

#include "ebeflow/core/Event.hpp"
#include "ebeflow/output/RunSummary.hpp"

namespace ebeflow {

// A per-event computation driven by the Runner:
//   on_start() once, on_event() for every assembled event in order, finalize() once.
// Each measure owns its output.
class IMeasure {
public:
  virtual ~IMeasure() = default;

  // Measure type (e.g. "flow", "multiplicity").
  virtual std::string type() const = 0;

  // Instance name from config ([measure.foo] -> "foo"). Unique within a run.
  virtual std::string instance_name() const = 0;

  // Called once before the first event is read.
  virtual void on_start() = 0;

  // `event_index` equals ev.index; it is passed for symmetry with on_start/finalize logging.
  virtual void on_event(const Event& ev, std::size_t event_index) = 0;

  // Called once after the input is exhausted. Commits the output.
  virtual void finalize() = 0;

  // Descriptor for the run summary.
  virtual output::MeasureDescriptor describe() const = 0;
};

} // namespace ebeflow
