#include <cmath>
#include <limits>
#include <numbers>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "TestUtil.hpp"
#include "ebeflow/io/ReadErrors.hpp"
#include "ebeflow/io/UrqmdReader.hpp"

using namespace ebeflow;
using ebeflow::testing::urqmd_block;
using ebeflow::testing::urqmd_particle_line;

namespace {

struct Drained {
  std::vector<Particle> particles;
  std::vector<std::size_t> boundaries_after; // particle count at each boundary
};

Drained drain(const std::string& text) {
  std::istringstream in(text);
  UrqmdReader r(in, "mem.f13");
  Drained d;
  Particle p;
  while (true) {
    const ReadStatus st = r.next(p);
    if (st == ReadStatus::End) break;
    if (st == ReadStatus::Particle) {
      d.particles.push_back(p);
    } else {
      d.boundaries_after.push_back(d.particles.size());
    }
  }
  return d;
}

} // namespace

TEST(UrqmdReader, ColumnLayoutIsFixed) {
  EXPECT_EQ(urqmd_columns::kPx, 120u);
  EXPECT_EQ(urqmd_columns::kPy, 144u);
  EXPECT_EQ(urqmd_columns::kPz, 168u);
  EXPECT_EQ(urqmd_columns::kItyp, 216u);
  EXPECT_EQ(urqmd_columns::kIso, 221u);
  EXPECT_EQ(urqmd_columns::kMinLineWidth, 224u);
  EXPECT_GE(urqmd_particle_line(1, 0, 0, 101, 2).size(), urqmd_columns::kMinLineWidth);
}

TEST(UrqmdReader, ParsesKinematicsAndSpecies) {
  const Particle p = UrqmdReader::parse_particle_line(urqmd_particle_line(0.3, 0.4, 0.0, 101, 2, 1), "mem", 5);
  EXPECT_EQ(p.id, 211);
  EXPECT_NEAR(p.pT, 0.5, 1e-15);
  EXPECT_NEAR(p.phi, std::atan2(0.4, 0.3), 1e-15);
  EXPECT_NEAR(p.eta, 0.0, 1e-15);
}

TEST(UrqmdReader, FortranExponentsAreAccepted) {
  const Particle p =
      UrqmdReader::parse_particle_line(urqmd_particle_line(-1.0, 0.0, 1.0, 1, 1, 1, true), "mem", 1);
  EXPECT_EQ(p.id, 2212);
  EXPECT_DOUBLE_EQ(p.pT, 1.0);
  EXPECT_DOUBLE_EQ(p.eta, std::atanh(1.0 / std::sqrt(2.0)));
}

TEST(UrqmdReader, AntiparticleUsesNegatedIsospin) {
  // anti-proton: ityp -1 with 2*I3 = -1 looks up (1, +1) -> 2212, negated.
  EXPECT_EQ(UrqmdReader::parse_particle_line(urqmd_particle_line(1, 0, 0, -1, -1), "mem", 1).id, -2212);
  // anti-neutron
  EXPECT_EQ(UrqmdReader::parse_particle_line(urqmd_particle_line(1, 0, 0, -1, 1), "mem", 1).id, -2112);
  // pi-
  EXPECT_EQ(UrqmdReader::parse_particle_line(urqmd_particle_line(1, 0, 0, 101, -2), "mem", 1).id, -211);
}

TEST(UrqmdReader, PhiStaysInHalfOpenRange) {
  const Particle p = UrqmdReader::parse_particle_line(urqmd_particle_line(-1.0, 0.0, 0.0, 101, 0), "mem", 1);
  EXPECT_GE(p.phi, -std::numbers::pi);
  EXPECT_LT(p.phi, std::numbers::pi);
}

TEST(UrqmdReader, BeamAxisGivesInfiniteEta) {
  EXPECT_EQ(UrqmdReader::pseudorapidity(0, 0, 2.0), std::numeric_limits<double>::infinity());
  EXPECT_EQ(UrqmdReader::pseudorapidity(0, 0, -2.0), -std::numeric_limits<double>::infinity());
  EXPECT_EQ(UrqmdReader::pseudorapidity(0, 0, 0), 0.0);

  const Particle p = UrqmdReader::parse_particle_line(urqmd_particle_line(0.0, 0.0, 3.0, 101, 0), "mem", 1);
  EXPECT_TRUE(std::isinf(p.eta));
  EXPECT_GT(p.eta, 0.0);
  EXPECT_EQ(p.pT, 0.0);
}

TEST(UrqmdReader, ShortLineIsFormatError) {
  std::string line = urqmd_particle_line(1, 0, 0, 101, 2);
  line.resize(200);
  EXPECT_THROW(UrqmdReader::parse_particle_line(line, "mem", 1), FormatError);
}

TEST(UrqmdReader, GarbledColumnIsFormatError) {
  std::string line = urqmd_particle_line(1, 0, 0, 101, 2);
  line[urqmd_columns::kPx + 10] = 'x';
  EXPECT_THROW(UrqmdReader::parse_particle_line(line, "mem", 1), FormatError);
}

TEST(UrqmdReader, UnknownSpeciesIsFatal) {
  EXPECT_THROW(UrqmdReader::parse_particle_line(urqmd_particle_line(1, 0, 0, 101, 4), "mem", 1),
               UnknownSpeciesError);
  EXPECT_THROW(UrqmdReader::parse_particle_line(urqmd_particle_line(1, 0, 0, 999, 0), "mem", 1),
               UnknownSpeciesError);
}

TEST(UrqmdReader, OneBoundaryPerBlock) {
  const std::string text =
      urqmd_block({urqmd_particle_line(1, 0, 0, 101, 2), urqmd_particle_line(0, 1, 0, 101, -2)}) + "\n" +
      urqmd_block({urqmd_particle_line(1, 1, 1, 1, 1)}, -1, false);
  const Drained d = drain(text);
  ASSERT_EQ(d.particles.size(), 3u);
  EXPECT_EQ(d.particles[0].id, 211);
  EXPECT_EQ(d.particles[1].id, -211);
  EXPECT_EQ(d.particles[2].id, 2212);
  EXPECT_EQ(d.boundaries_after, (std::vector<std::size_t>{2, 3}));
}

TEST(UrqmdReader, EmptyBlockStillEmitsBoundary) {
  const Drained d = drain(urqmd_block({}) + urqmd_block({urqmd_particle_line(1, 0, 0, 101, 0)}));
  EXPECT_EQ(d.particles.size(), 1u);
  EXPECT_EQ(d.boundaries_after, (std::vector<std::size_t>{0, 1}));
}

TEST(UrqmdReader, TruncatedBlockAtEndOfInput) {
  // Declares 5 particles, provides 3.
  const std::string text = urqmd_block(
      {urqmd_particle_line(1, 0, 0, 101, 2), urqmd_particle_line(1, 0, 0, 101, 2), urqmd_particle_line(1, 0, 0, 101, 2)},
      5);
  std::istringstream in(text);
  UrqmdReader r(in, "mem.f13");
  Particle p;
  EXPECT_THROW(r.next(p), TruncationError);
}

TEST(UrqmdReader, TruncatedBlockBeforeNextHeaderEmitsNothing) {
  const std::string text =
      urqmd_block({urqmd_particle_line(1, 0, 0, 101, 2)}) +
      urqmd_block({urqmd_particle_line(1, 0, 0, 101, 2), urqmd_particle_line(1, 0, 0, 101, 2)}, 4) +
      urqmd_block({urqmd_particle_line(1, 0, 0, 101, 2)});
  std::istringstream in(text);
  UrqmdReader r(in, "mem.f13");
  Particle p;
  EXPECT_EQ(r.next(p), ReadStatus::Particle);
  EXPECT_EQ(r.next(p), ReadStatus::Boundary);
  EXPECT_THROW(r.next(p), TruncationError);
}

TEST(UrqmdReader, TruncatedBlockBeforeBlankSeparatorIsTruncation) {
  const std::string line = urqmd_particle_line(1, 0, 0, 101, 2);
  const std::string text = urqmd_block({line, line, line}, 5) + "\n" + urqmd_block({line});
  std::istringstream in(text);
  UrqmdReader r(in, "mem.f13");
  Particle p;
  try {
    r.next(p);
    FAIL() << "expected TruncationError";
  } catch (const TruncationError& e) {
    EXPECT_NE(std::string(e.what()).find("declares 5 particles but only 3 follow"), std::string::npos);
  }
}

TEST(UrqmdReader, BlankLineRightAfterCountLineIsTruncation) {
  const std::string text = urqmd_block({}, 2, false) + "\n";
  std::istringstream in(text);
  UrqmdReader r(in, "mem.f13");
  Particle p;
  EXPECT_THROW(r.next(p), TruncationError);
}

TEST(UrqmdReader, FailingBlockEmitsNoParticle) {
  // Third particle line of the block has an unknown species.
  const std::string text = urqmd_block(
      {urqmd_particle_line(1, 0, 0, 101, 2), urqmd_particle_line(1, 0, 0, 101, 2), urqmd_particle_line(1, 0, 0, 101, 6)});
  std::istringstream in(text);
  UrqmdReader r(in, "mem.f13");
  Particle p;
  EXPECT_THROW(r.next(p), UnknownSpeciesError);
}

TEST(UrqmdReader, StrayLineOutsideBlockIsFormatError) {
  std::istringstream in("this is not urqmd\n");
  UrqmdReader r(in, "mem.f13");
  Particle p;
  EXPECT_THROW(r.next(p), FormatError);
}

TEST(UrqmdReader, HeaderWithoutCountIsTruncation) {
  std::istringstream in("UQMD   version:  30400\nprojectile: 197 79\n");
  UrqmdReader r(in, "mem.f13");
  Particle p;
  EXPECT_THROW(r.next(p), TruncationError);
}

TEST(UrqmdReader, EmptyInputEndsImmediately) {
  std::istringstream in("\n\n");
  UrqmdReader r(in, "mem.f13");
  Particle p;
  EXPECT_EQ(r.next(p), ReadStatus::End);
  EXPECT_EQ(r.blocks_read(), 0u);
}
