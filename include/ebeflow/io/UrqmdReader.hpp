#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include "ebeflow/io/IParticleReader.hpp"

namespace ebeflow {

// Fixed column layout of a UrQMD "f13" particle line (0-based, half-open).
// Nine reals of width 24 (r0 rx ry rz p0 px py pz m), then ityp and 2*I3.
// Columns beyond 2*I3 (charge, collision history, freeze-out data) are ignored.
namespace urqmd_columns {
inline constexpr std::size_t kRealWidth = 24;
inline constexpr std::size_t kNumReals = 9;
inline constexpr std::size_t kPx = 5 * kRealWidth;
inline constexpr std::size_t kPy = 6 * kRealWidth;
inline constexpr std::size_t kPz = 7 * kRealWidth;
inline constexpr std::size_t kItyp = kNumReals * kRealWidth; // 216
inline constexpr std::size_t kItypWidth = 5;
inline constexpr std::size_t kIso = kItyp + kItypWidth;      // 221
inline constexpr std::size_t kIsoWidth = 3;
inline constexpr std::size_t kMinLineWidth = kIso + kIsoWidth; // 224
} // namespace urqmd_columns

// Reader for UrQMD f13 output.
//
// Block layout, repeated once per event:
//   UQMD ...                    block start marker
//   <free header lines>
//   npart  time                 count line: integer count and output time
//   [n1 n2 ...]                 optional collision-counter line (integers only)
//   <npart particle lines>
//
// A whole block is parsed before any of its particles is handed out, so a
// failing block never emits a particle. Each block is followed by one Boundary.
class UrqmdReader final : public IParticleReader {
public:
  // The stream must outlive the reader.
  UrqmdReader(std::istream& in, std::string source_name);

  ReadStatus next(Particle& p) override;

  const std::string& source_name() const override { return source_; }
  std::size_t line_number() const override { return lineno_; }

  std::size_t blocks_read() const { return blocks_read_; }

  // Convert one particle line. Throws FormatError (bad columns) or
  // UnknownSpeciesError (ityp/2*I3 pair not in the species table).
  static Particle parse_particle_line(std::string_view line, const std::string& source, std::size_t lineno);

  // eta = atanh(pz/|p|); +-inf along the beam axis, 0 for a particle at rest.
  static double pseudorapidity(double px, double py, double pz);

private:
  std::istream& in_;
  std::string source_;

  std::size_t lineno_ = 0;     // last line handed out
  std::size_t lines_read_ = 0; // physical lines consumed from the stream

  std::string line_;
  bool has_pending_ = false;
  std::string pending_;
  std::size_t pending_lineno_ = 0;

  std::vector<Particle> block_;
  std::size_t pos_ = 0;
  bool block_open_ = false;
  bool done_ = false;
  std::size_t blocks_read_ = 0;

  bool read_block_();
  bool next_line_(std::string& out);
  void unread_(std::string line);
};

} // namespace ebeflow
