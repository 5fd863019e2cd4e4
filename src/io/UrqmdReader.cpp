#include "ebeflow/io/UrqmdReader.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <numbers>
#include <string>
#include <utility>
#include <vector>

#include "ebeflow/io/ReadErrors.hpp"
#include "ebeflow/pdg/SpeciesTable.hpp"
#include "ebeflow/util/Parse.hpp"

namespace ebeflow {

namespace {

constexpr std::string_view kBlockMarker = "UQMD";

inline bool is_block_start(std::string_view line) {
  return line.substr(0, kBlockMarker.size()) == kBlockMarker;
}

// Shortened copy of an offending line for error messages.
inline std::string excerpt(std::string_view line) {
  constexpr std::size_t kMax = 60;
  if (line.size() <= kMax) return std::string(line);
  return std::string(line.substr(0, kMax)) + "...";
}

// Count line: exactly two tokens "npart time"; npart is an integer.
bool parse_count_line(std::string_view line, std::int64_t& npart) {
  std::vector<std::string_view> toks;
  split_ws(line, toks);
  if (toks.size() != 2) return false;
  double t = 0.0;
  return parse_int(toks[0], npart) && parse_double(toks[1], t);
}

// Collision-counter line written after the count line by some output versions.
bool is_counter_line(std::string_view line) {
  if (line.size() >= urqmd_columns::kMinLineWidth) return false;
  std::vector<std::string_view> toks;
  split_ws(line, toks);
  if (toks.empty()) return false;
  for (auto t : toks) {
    std::int64_t v = 0;
    if (!parse_int(t, v)) return false;
  }
  return true;
}

} // namespace

UrqmdReader::UrqmdReader(std::istream& in, std::string source_name)
: in_(in), source_(std::move(source_name)) {}

double UrqmdReader::pseudorapidity(double px, double py, double pz) {
  const double pmag = std::sqrt(px * px + py * py + pz * pz);
  if (pmag == 0.0) return 0.0;
  const double r = pz / pmag;
  if (r >= 1.0) return std::numeric_limits<double>::infinity();
  if (r <= -1.0) return -std::numeric_limits<double>::infinity();
  return std::atanh(r);
}

Particle UrqmdReader::parse_particle_line(std::string_view line, const std::string& source, std::size_t lineno) {
  using namespace urqmd_columns;

  if (line.size() < kMinLineWidth) {
    throw FormatError(source, lineno,
                      "particle line has " + std::to_string(line.size()) + " columns, expected at least " +
                          std::to_string(kMinLineWidth));
  }

  static constexpr const char* kRealNames[kNumReals] = {"r0", "rx", "ry", "rz", "p0", "px", "py", "pz", "m"};
  double reals[kNumReals];
  for (std::size_t k = 0; k < kNumReals; ++k) {
    const std::string_view field = line.substr(k * kRealWidth, kRealWidth);
    if (!parse_fortran_double(field, reals[k])) {
      throw FormatError(source, lineno,
                        std::string("failed to parse ") + kRealNames[k] + " from '" + std::string(field) + "'");
    }
  }

  int ityp = 0;
  int iso3x2 = 0;
  const std::string_view ityp_field = line.substr(kItyp, kItypWidth);
  const std::string_view iso_field = line.substr(kIso, kIsoWidth);
  if (!parse_fixed_int(ityp_field, ityp)) {
    throw FormatError(source, lineno, "failed to parse ityp from '" + std::string(ityp_field) + "'");
  }
  if (!parse_fixed_int(iso_field, iso3x2)) {
    throw FormatError(source, lineno, "failed to parse 2*I3 from '" + std::string(iso_field) + "'");
  }

  const auto id = pdg::urqmd_to_pdg(ityp, iso3x2);
  if (!id) {
    throw UnknownSpeciesError(source, lineno,
                              "no Monte Carlo id for ityp=" + std::to_string(ityp) + " 2*I3=" + std::to_string(iso3x2));
  }

  const double px = reals[5];
  const double py = reals[6];
  const double pz = reals[7];

  Particle p;
  p.id = *id;
  p.pT = std::sqrt(px * px + py * py);
  p.phi = std::atan2(py, px);
  if (p.phi >= std::numbers::pi) p.phi -= 2.0 * std::numbers::pi;
  p.eta = pseudorapidity(px, py, pz);
  return p;
}

bool UrqmdReader::next_line_(std::string& out) {
  if (has_pending_) {
    out = std::move(pending_);
    has_pending_ = false;
    lineno_ = pending_lineno_;
    return true;
  }
  if (!std::getline(in_, out)) {
    if (in_.bad()) {
      throw ReadError("IOError", source_, lines_read_ + 1, "stream failure while reading");
    }
    return false;
  }
  ++lines_read_;
  lineno_ = lines_read_;
  if (!out.empty() && out.back() == '\r') out.pop_back();
  return true;
}

void UrqmdReader::unread_(std::string line) {
  pending_ = std::move(line);
  pending_lineno_ = lineno_;
  has_pending_ = true;
  lineno_ = (lineno_ > 0) ? lineno_ - 1 : 0;
}

bool UrqmdReader::read_block_() {
  block_.clear();
  pos_ = 0;

  // Block start (blank lines between blocks are tolerated).
  while (true) {
    if (!next_line_(line_)) return false;
    if (is_blank(line_)) continue;
    if (is_block_start(line_)) break;
    throw FormatError(source_, lineno_, "expected UrQMD event header 'UQMD ...', got: " + excerpt(line_));
  }
  const std::size_t header_line = lineno_;

  // Free header lines up to the count line.
  std::int64_t npart = -1;
  while (true) {
    if (!next_line_(line_)) {
      throw TruncationError(source_, lines_read_,
                            "input ends inside the event header started at line " + std::to_string(header_line));
    }
    if (is_block_start(line_)) {
      throw TruncationError(source_, lineno_,
                            "event header started at line " + std::to_string(header_line) + " has no particle count");
    }
    if (parse_count_line(line_, npart)) break;
  }
  if (npart < 0) {
    throw FormatError(source_, lineno_, "negative particle count " + std::to_string(npart));
  }
  const std::size_t count_line = lineno_;
  const auto declared = static_cast<std::size_t>(npart);

  // Optional collision-counter line.
  if (next_line_(line_)) {
    if (!is_counter_line(line_)) unread_(std::move(line_));
  }

  block_.reserve(declared);
  while (block_.size() < declared) {
    // End of input, a blank separator or the next header all end the block early.
    const bool have = next_line_(line_);
    if (!have || is_blank(line_) || is_block_start(line_)) {
      if (have) unread_(std::move(line_));
      throw TruncationError(source_, have ? lineno_ + 1 : lines_read_,
                            "count line " + std::to_string(count_line) + " declares " + std::to_string(declared) +
                                " particles but only " + std::to_string(block_.size()) + " follow");
    }
    block_.push_back(parse_particle_line(line_, source_, lineno_));
  }

  ++blocks_read_;
  return true;
}

ReadStatus UrqmdReader::next(Particle& p) {
  while (true) {
    if (pos_ < block_.size()) {
      p = block_[pos_++];
      return ReadStatus::Particle;
    }
    if (block_open_) {
      block_open_ = false;
      block_.clear();
      pos_ = 0;
      return ReadStatus::Boundary;
    }
    if (done_) return ReadStatus::End;
    if (!read_block_()) {
      done_ = true;
      return ReadStatus::End;
    }
    block_open_ = true;
  }
}

} // namespace ebeflow
