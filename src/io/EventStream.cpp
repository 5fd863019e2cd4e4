#include "ebeflow/io/EventStream.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <utility>

#include "ebeflow/io/StdParticleReader.hpp"
#include "ebeflow/io/UrqmdReader.hpp"

namespace ebeflow {

EventStream::EventStream(std::vector<InputSource> sources, ParticleFilter filter, bool keep_empty)
: sources_(std::move(sources)), filter_(std::move(filter)), keep_empty_(keep_empty) {
  resolved_.reserve(sources_.size());
}

bool EventStream::open_next_source_() {
  if (next_source_ >= sources_.size()) return false;

  cur_source_ = next_source_++;
  const InputSource& src = sources_[cur_source_];
  const bool is_stdin = (src.name == kStdinName);

  std::optional<std::string> filename;
  if (!is_stdin) filename = src.name;
  const InputFormat fmt = resolve_input_format(src.format, filename);
  resolved_.push_back(fmt);

  std::istream* in = src.stream;
  if (!in) {
    if (is_stdin) {
      in = &std::cin;
    } else {
      file_ = std::make_unique<std::ifstream>(src.name);
      if (!*file_) {
        throw std::runtime_error("failed to open input: " + src.name);
      }
      in = file_.get();
    }
  }

  if (verbose_) {
    std::cerr << "[ebeflow] opening " << (is_stdin ? std::string("<stdin>") : src.name)
              << " (format=" << input_format_name(fmt) << ")\n";
  }

  if (fmt == InputFormat::Urqmd) {
    reader_ = std::make_unique<UrqmdReader>(*in, src.name);
  } else {
    reader_ = std::make_unique<StdParticleReader>(*in, src.name);
  }
  ++counters_.sources_opened;
  return true;
}

void EventStream::close_source_() {
  reader_.reset();
  file_.reset();
}

bool EventStream::next(Event& ev) {
  ev.clear();
  std::size_t raw = 0;
  Particle p;

  while (true) {
    if (!reader_ && !open_next_source_()) return false;

    const std::size_t source_index = cur_source_;
    const ReadStatus st = reader_->next(p);

    if (st == ReadStatus::Particle) {
      ++raw;
      ++counters_.raw_particles;
      if (filter_.accept(p)) {
        ev.particles.push_back(p);
        ++counters_.accepted_particles;
      }
      continue;
    }

    // Boundary, or End of this source which also closes its trailing group.
    if (st == ReadStatus::End) close_source_();
    if (raw == 0) continue;

    if (ev.particles.empty() && !keep_empty_) {
      ++counters_.empty_groups_dropped;
      raw = 0;
      continue;
    }

    ev.index = counters_.events++;
    ev.source_index = source_index;
    ev.raw_count = raw;
    return true;
  }
}

} // namespace ebeflow
