#pragma once

#include <cstddef>
#include <fstream>
#include <istream>
#include <memory>
#include <string>
#include <vector>

#include "ebeflow/core/Event.hpp"
#include "ebeflow/io/IParticleReader.hpp"
#include "ebeflow/io/InputFormat.hpp"
#include "ebeflow/select/ParticleFilter.hpp"

namespace ebeflow {

struct InputSource {
  std::string name;                          // file path, or "-" for standard input
  InputFormat format = InputFormat::Auto;    // resolved against `name` when opened
  std::istream* stream = nullptr;            // optional: read this instead of opening `name`
};

struct EventStreamCounters {
  std::size_t events = 0;              // events handed out
  std::size_t raw_particles = 0;       // particles read before filtering
  std::size_t accepted_particles = 0;  // particles kept by the filter
  std::size_t sources_opened = 0;
  std::size_t empty_groups_dropped = 0; // groups whose particles were all rejected
};

// Assembles filtered events from a list of sources, one event at a time.
//
// - sources are read in order; the next one is opened only when the current one is exhausted
// - a boundary closes the current group only when it holds at least one accepted
//   particle; blank runs and fully filtered groups never become events
// - groups never span two sources
// - keep_empty turns a fully filtered group into an event with M = 0 instead
//
// Reader errors propagate out of next(); the stream is unusable afterwards.
class EventStream {
public:
  EventStream(std::vector<InputSource> sources, ParticleFilter filter, bool keep_empty = false);

  EventStream(const EventStream&) = delete;
  EventStream& operator=(const EventStream&) = delete;

  // Fill `ev` with the next event. Returns false once every source is exhausted.
  bool next(Event& ev);

  const EventStreamCounters& counters() const { return counters_; }
  const std::vector<InputSource>& sources() const { return sources_; }

  // Formats the sources resolved to, in source order (filled as sources are opened).
  const std::vector<InputFormat>& resolved_formats() const { return resolved_; }

  const ParticleFilter& filter() const { return filter_; }

  // Log "[ebeflow] opening ..." for every source (default on).
  void set_verbose(bool on) { verbose_ = on; }

private:
  std::vector<InputSource> sources_;
  std::vector<InputFormat> resolved_;
  ParticleFilter filter_;
  bool keep_empty_ = false;
  bool verbose_ = true;

  std::size_t next_source_ = 0;
  std::size_t cur_source_ = 0;
  std::unique_ptr<std::ifstream> file_;
  std::unique_ptr<IParticleReader> reader_;

  EventStreamCounters counters_;

  bool open_next_source_();
  void close_source_();
};

} // namespace ebeflow
