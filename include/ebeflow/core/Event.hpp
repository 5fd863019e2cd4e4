#pragma once

#include <cstddef>
#include <vector>

#include "ebeflow/core/Particle.hpp"

namespace ebeflow {

// One collision event after particle filtering.
// Particles keep their read order; consumers must not rely on it beyond counting.
struct Event {
  std::vector<Particle> particles;

  std::size_t index = 0;        // zero-based event index across the whole run
  std::size_t source_index = 0; // index into the input source list
  std::size_t raw_count = 0;    // particles read for this event before filtering

  std::size_t multiplicity() const { return particles.size(); }
  bool empty() const { return particles.empty(); }

  void clear() {
    particles.clear();
    index = 0;
    source_index = 0;
    raw_count = 0;
  }
};

} // namespace ebeflow
