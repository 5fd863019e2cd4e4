#pragma once

#include <cstddef>
#include <string>

#include "ebeflow/core/Particle.hpp"

namespace ebeflow {

enum class ReadStatus {
  Particle,  // `p` holds the next particle
  Boundary,  // an event boundary in the input (blank line, end of UrQMD block)
  End,       // input exhausted; no more calls are meaningful
};

// Pull interface shared by the text parsers. One reader wraps one input source.
// Malformed input raises FormatError / TruncationError / UnknownSpeciesError.
class IParticleReader {
public:
  virtual ~IParticleReader() = default;

  virtual ReadStatus next(Particle& p) = 0;

  // Source name used in diagnostics ("-" for standard input).
  virtual const std::string& source_name() const = 0;

  // 1-based number of the last line consumed.
  virtual std::size_t line_number() const = 0;
};

} // namespace ebeflow
