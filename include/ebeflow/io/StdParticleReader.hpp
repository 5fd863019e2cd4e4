#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <string_view>

#include "ebeflow/io/IParticleReader.hpp"

namespace ebeflow {

// Reader for the standard format: one particle per line,
//   id pT phi eta
// whitespace-separated. A blank (or whitespace-only) line is an event boundary.
// End of input reports one final Boundary before End so the last event of a
// source is always closed.
class StdParticleReader final : public IParticleReader {
public:
  // The stream must outlive the reader.
  StdParticleReader(std::istream& in, std::string source_name);

  ReadStatus next(Particle& p) override;

  const std::string& source_name() const override { return source_; }
  std::size_t line_number() const override { return lineno_; }

  // Parse one non-blank line. Throws FormatError naming `source`:`lineno`.
  static Particle parse_line(std::string_view line, const std::string& source, std::size_t lineno);

private:
  std::istream& in_;
  std::string source_;
  std::size_t lineno_ = 0;
  bool done_ = false;
  std::string line_;
};

} // namespace ebeflow
