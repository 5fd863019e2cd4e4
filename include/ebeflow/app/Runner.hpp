#pragma once

#include <ostream>

#include "ebeflow/config/IniConfig.hpp"
#include "ebeflow/output/RunSummary.hpp"

namespace ebeflow {

// Runner: main() handles the CLI and the config, then calls Runner(cfg).run().
// Runner owns the pipeline:
//   sources -> EventStream (parse, filter, assemble) -> measures: on_start -> on_event -> finalize
class Runner {
public:
  explicit Runner(const IniConfig& cfg);

  // Stream behind measure output "-" (default std::cout).
  void set_console(std::ostream* os) { console_ = os; }

  // Execute the run. Returns 0 on success; errors are thrown.
  int run();

  // Perform every check run() does before reading events (config keys, filter,
  // measure instantiation, input files present) without reading or writing anything.
  int validate_config();

  // Counters, sources and measure descriptors of the last run().
  const output::RunSummary& summary() const { return summary_; }

private:
  const IniConfig& cfg_;
  std::ostream* console_ = nullptr;
  output::RunSummary summary_;

  int run_impl_(bool validate_only);
};

} // namespace ebeflow
