#include "ebeflow/io/StdParticleReader.hpp"

#include <string>
#include <utility>

#include "ebeflow/io/ReadErrors.hpp"
#include "ebeflow/util/Parse.hpp"

namespace ebeflow {

StdParticleReader::StdParticleReader(std::istream& in, std::string source_name)
: in_(in), source_(std::move(source_name)) {}

Particle StdParticleReader::parse_line(std::string_view line, const std::string& source, std::size_t lineno) {
  std::string_view tok[4];
  std::size_t ntok = 0;

  std::size_t i = 0;
  const std::size_t n = line.size();
  while (i < n) {
    while (i < n && is_ws(line[i])) ++i;
    if (i >= n) break;
    std::size_t j = i;
    while (j < n && !is_ws(line[j])) ++j;
    if (ntok == 4) {
      throw FormatError(source, lineno, "expected 4 fields 'id pT phi eta', got more");
    }
    tok[ntok++] = line.substr(i, j - i);
    i = j;
  }
  if (ntok != 4) {
    throw FormatError(source, lineno, "expected 4 fields 'id pT phi eta', got " + std::to_string(ntok));
  }

  Particle p;
  if (!parse_int(tok[0], p.id)) {
    throw FormatError(source, lineno, "failed to parse id from '" + std::string(tok[0]) + "'");
  }
  if (!parse_double(tok[1], p.pT)) {
    throw FormatError(source, lineno, "failed to parse pT from '" + std::string(tok[1]) + "'");
  }
  if (!parse_double(tok[2], p.phi)) {
    throw FormatError(source, lineno, "failed to parse phi from '" + std::string(tok[2]) + "'");
  }
  if (!parse_double(tok[3], p.eta)) {
    throw FormatError(source, lineno, "failed to parse eta from '" + std::string(tok[3]) + "'");
  }
  return p;
}

ReadStatus StdParticleReader::next(Particle& p) {
  if (done_) return ReadStatus::End;

  if (!std::getline(in_, line_)) {
    if (in_.bad()) {
      throw ReadError("IOError", source_, lineno_ + 1, "stream failure while reading");
    }
    // Trailing boundary: closes the last event of this source.
    done_ = true;
    return ReadStatus::Boundary;
  }
  ++lineno_;

  if (is_blank(line_)) return ReadStatus::Boundary;

  p = parse_line(line_, source_, lineno_);
  return ReadStatus::Particle;
}

} // namespace ebeflow
