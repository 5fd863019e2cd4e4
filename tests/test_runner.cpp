#include <cmath>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "TestUtil.hpp"
#include "ebeflow/app/Runner.hpp"
#include "ebeflow/config/IniConfig.hpp"

using namespace ebeflow;
using namespace ebeflow::testing;

namespace {

// Two events; every azimuth is 0 so each v_n is exactly 1.
constexpr const char* kEvents =
    "211 1.0 0 0.5\n"
    "-211 0.3 0 3.0\n"
    "\n"
    "111 2.0 0 0\n";

class RunnerTest : public ::testing::Test {
protected:
  TempDir dir;

  void SetUp() override { write_file(dir / "events.dat", kEvents); }

  // Config file in the temp dir; relative paths resolve against it.
  IniConfig config(const std::string& body) {
    const auto path = dir / "run.ini";
    write_file(path, "[general]\nprofile = false\n[input]\nfiles = events.dat\n" + body);
    return IniConfig(path);
  }
};

} // namespace

TEST_F(RunnerTest, FlowToConsole) {
  const auto cfg = config("[measure.flow]\ntype = flow\nharmonic_min = 2\nharmonic_max = 3\n");
  std::ostringstream out;
  Runner runner(cfg);
  runner.set_console(&out);
  EXPECT_EQ(runner.run(), 0);
  EXPECT_EQ(out.str(), "1 1\n1 1\n");
  EXPECT_EQ(runner.summary().events, 2u);
  EXPECT_EQ(runner.summary().raw_particles, 3u);
}

TEST_F(RunnerTest, SingleEventFlowHasClosedFormValue) {
  // phi = 0 and 1.5708: |1 + exp(2i * 1.5708)| / 2 = |cos(1.5708)|.
  write_file(dir / "events.dat", "211 1.0 0.0 0.3\n-211 0.8 1.5708 -0.1\n\n");
  const auto cfg = config("[measure.flow]\ntype = flow\nharmonic_min = 2\nharmonic_max = 2\nmode = magnitude\n");
  std::ostringstream out;
  Runner runner(cfg);
  runner.set_console(&out);
  runner.run();

  const std::string text = out.str();
  ASSERT_FALSE(text.empty());
  ASSERT_EQ(text.find('\n'), text.size() - 1) << text;
  const double v2 = std::stod(text);
  EXPECT_NEAR(v2, std::abs(std::cos(1.5708)), 1e-15);
  EXPECT_EQ(runner.summary().events, 1u);
}

TEST_F(RunnerTest, TypeDefaultsToInstanceName) {
  const auto cfg = config("[measure.multiplicity]\n");
  std::ostringstream out;
  Runner runner(cfg);
  runner.set_console(&out);
  runner.run();
  EXPECT_EQ(out.str(), "2\n1\n");
}

TEST_F(RunnerTest, FilterAndRawMultiplicityToFile) {
  const auto cfg = config(
      "[filter]\npT_min = 0.5\n"
      "[measure.mult]\ntype = multiplicity\nraw = true\noutput = out/mult.txt\n");
  Runner runner(cfg);
  runner.run();
  EXPECT_EQ(read_lines(dir / "out/mult.txt"), (std::vector<std::string>{"1 2", "1 1"}));
  EXPECT_FALSE(std::filesystem::exists(dir / "out/mult.txt.tmp"));
  EXPECT_EQ(runner.summary().accepted_particles, 2u);
}

TEST_F(RunnerTest, FullyFilteredGroupsProduceNoLines) {
  const auto cfg = config("[filter]\neta_max = 1\n[measure.mult]\ntype = multiplicity\noutput = m.txt\n");
  write_file(dir / "events.dat", "211 1 0 2\n\n211 1 0 0.5\n\n211 1 0 -3\n");
  Runner runner(cfg);
  runner.run();
  EXPECT_EQ(read_lines(dir / "m.txt"), (std::vector<std::string>{"1"}));
  EXPECT_EQ(runner.summary().events, 1u);
  EXPECT_EQ(runner.summary().empty_groups_dropped, 2u);
}

TEST_F(RunnerTest, NothingAcceptedStillCommitsEmptyOutputs) {
  const auto cfg = config("[filter]\npT_min = 5\n[measure.mult]\ntype = multiplicity\noutput = m.txt\n");
  Runner runner(cfg);
  runner.run();
  EXPECT_TRUE(std::filesystem::exists(dir / "m.txt"));
  EXPECT_TRUE(read_lines(dir / "m.txt").empty());
  EXPECT_EQ(runner.summary().events, 0u);
}

TEST_F(RunnerTest, KeepEmptyWritesZeroMultiplicityLines) {
  const auto cfg = config("[filter]\npT_min = 5\n[events]\nkeep_empty = true\n"
                          "[measure.mult]\ntype = multiplicity\noutput = m.txt\n"
                          "[measure.flow]\ntype = flow\nharmonic_min = 2\nharmonic_max = 2\noutput = f.txt\n");
  Runner(cfg).run();
  EXPECT_EQ(read_lines(dir / "m.txt"), (std::vector<std::string>{"0", "0"}));
  EXPECT_EQ(read_lines(dir / "f.txt"), (std::vector<std::string>{"0", "0"}));
}

TEST_F(RunnerTest, AverageFlow) {
  const auto cfg = config("[measure.avg]\ntype = flow_average\nharmonic_min = 2\nharmonic_max = 2\nmode = vector\n");
  std::ostringstream out;
  Runner runner(cfg);
  runner.set_console(&out);
  runner.run();
  EXPECT_EQ(out.str(), "3 1 0\n");
}

TEST_F(RunnerTest, DifferentialFlowBins) {
  const auto cfg = config("[measure.diff]\ntype = flow_differential\nharmonic_min = 2\nharmonic_max = 2\n"
                          "bin_width = 0.5\noutput = diff.txt\n");
  Runner(cfg).run();
  EXPECT_EQ(read_lines(dir / "diff.txt"),
            (std::vector<std::string>{"0.25 1 1", "0.75 0 0", "1.25 1 1", "1.75 0 0", "2.25 1 1"}));
}

TEST_F(RunnerTest, DifferentialFlowRejectsBadWidth) {
  const auto cfg = config("[measure.diff]\ntype = flow_differential\nbin_width = 0\n");
  EXPECT_THROW(Runner(cfg).run(), std::runtime_error);
}

TEST_F(RunnerTest, ConvertOutputReadsBackAsTheSameEvents) {
  const auto cfg = config("[filter]\nids = 211, 111\n[measure.convert]\ntype = convert\noutput = filtered.dat\n");
  Runner(cfg).run();
  EXPECT_EQ(read_lines(dir / "filtered.dat"),
            (std::vector<std::string>{"211 1 0 0.5", "", "111 2 0 0", ""}));

  write_file(dir / "again.ini",
             "[general]\nprofile = false\n[input]\nfiles = filtered.dat\n"
             "[measure.mult]\ntype = multiplicity\nraw = true\n");
  const IniConfig again(dir / "again.ini");
  std::ostringstream out;
  Runner runner(again);
  runner.set_console(&out);
  runner.run();
  EXPECT_EQ(out.str(), "1 1\n1 1\n");
}

TEST_F(RunnerTest, UrqmdInputIsDetectedByExtension) {
  write_file(dir / "run.f13", urqmd_block({urqmd_particle_line(1.0, 0.0, 0.0, 101, 2),
                                           urqmd_particle_line(0.0, 1.0, 0.0, 1, 1)}));
  auto cfg = config("[filter]\ncharged_only = true\n[measure.mult]\ntype = multiplicity\nraw = true\n");
  cfg.set("input", "files", "run.f13");
  std::ostringstream out;
  Runner runner(cfg);
  runner.set_console(&out);
  runner.run();
  EXPECT_EQ(out.str(), "2 2\n");
  ASSERT_EQ(runner.summary().sources.size(), 1u);
  EXPECT_EQ(runner.summary().sources[0].format, "urqmd");
}

TEST_F(RunnerTest, MultipleSourcesNeverMergeEvents) {
  write_file(dir / "more.dat", "321 1 0 0\n");
  auto cfg = config("[measure.mult]\ntype = multiplicity\n");
  cfg.set("input", "files", "events.dat, more.dat");
  std::ostringstream out;
  Runner runner(cfg);
  runner.set_console(&out);
  runner.run();
  EXPECT_EQ(out.str(), "2\n1\n1\n");
}

TEST_F(RunnerTest, RunSummaryJson) {
  const auto cfg = config("[measure.mult]\ntype = multiplicity\noutput = m.txt\n");
  auto with_summary = cfg;
  with_summary.set("general", "run_summary", "summary.json");
  Runner(with_summary).run();

  const std::string json = read_file(dir / "summary.json");
  EXPECT_NE(json.find("\"schema_version\""), std::string::npos);
  EXPECT_NE(json.find("\"events\": 2"), std::string::npos);
  EXPECT_NE(json.find("\"type\": \"multiplicity\""), std::string::npos);
  EXPECT_NE(json.find("\"format\": \"std\""), std::string::npos);
}

TEST_F(RunnerTest, TwoConsoleMeasuresConflict) {
  const auto cfg = config("[measure.a]\ntype = flow\n[measure.b]\ntype = multiplicity\n");
  EXPECT_THROW(Runner(cfg).run(), std::runtime_error);
}

TEST_F(RunnerTest, SharedOutputFileConflicts) {
  const auto cfg = config("[measure.a]\ntype = flow\noutput = x.txt\n"
                          "[measure.b]\ntype = multiplicity\noutput = ./x.txt\n");
  EXPECT_THROW(Runner(cfg).run(), std::runtime_error);
  EXPECT_FALSE(std::filesystem::exists(dir / "x.txt"));
}

TEST_F(RunnerTest, ValidateConfigWritesNothing) {
  const auto cfg = config("[measure.flow]\ntype = flow\noutput = flow.txt\n");
  Runner runner(cfg);
  EXPECT_EQ(runner.validate_config(), 0);
  EXPECT_FALSE(std::filesystem::exists(dir / "flow.txt"));
  EXPECT_FALSE(std::filesystem::exists(dir / "flow.txt.tmp"));
}

TEST_F(RunnerTest, MissingInputFailsBeforeOutput) {
  auto cfg = config("[measure.flow]\ntype = flow\noutput = flow.txt\n");
  cfg.set("input", "files", "nope.dat");
  EXPECT_THROW(Runner(cfg).run(), std::runtime_error);
  EXPECT_THROW(Runner(cfg).validate_config(), std::runtime_error);
  EXPECT_FALSE(std::filesystem::exists(dir / "flow.txt"));
}

TEST_F(RunnerTest, ConfigErrors) {
  EXPECT_THROW(Runner(config("[measure.x]\ntype = nonexistent\n")).run(), std::runtime_error);
  EXPECT_THROW(Runner(config("[measure.flow]\nharmonic_min = 0\n")).run(), std::runtime_error);
  EXPECT_THROW(Runner(config("[measure.flow]\nmode = polar\n")).run(), std::runtime_error);
  EXPECT_THROW(Runner(config("[measure.flow]\ncolour = red\n")).run(), std::runtime_error);
  EXPECT_THROW(Runner(config("[filter]\npT_min = 2\npT_max = 1\n[measure.flow]\n")).run(), std::runtime_error);
  EXPECT_THROW(Runner(config("[input]\nformat = hepmc\n[measure.flow]\n")).run(), std::runtime_error);
}

TEST_F(RunnerTest, NoEnabledMeasuresIsANoOp) {
  const auto cfg = config("[measure.flow]\ntype = flow\nenabled = false\noutput = flow.txt\n");
  Runner runner(cfg);
  EXPECT_EQ(runner.run(), 0);
  EXPECT_FALSE(std::filesystem::exists(dir / "flow.txt"));
}
