#include <optional>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "ebeflow/io/InputFormat.hpp"

using ebeflow::InputFormat;
using ebeflow::parse_input_format;
using ebeflow::resolve_input_format;

TEST(InputFormat, ParsesNamesCaseInsensitively) {
  EXPECT_EQ(parse_input_format("auto"), InputFormat::Auto);
  EXPECT_EQ(parse_input_format("STD"), InputFormat::Std);
  EXPECT_EQ(parse_input_format("UrQMD"), InputFormat::Urqmd);
}

TEST(InputFormat, RejectsUnknownName) {
  EXPECT_THROW(parse_input_format("root"), std::runtime_error);
  EXPECT_THROW(parse_input_format("f13"), std::runtime_error);
  EXPECT_THROW(parse_input_format("standard"), std::runtime_error);
}

TEST(InputFormat, ExplicitOverrideWins) {
  EXPECT_EQ(resolve_input_format(InputFormat::Std, std::string("run1.f13")), InputFormat::Std);
  EXPECT_EQ(resolve_input_format(InputFormat::Urqmd, std::string("events.dat")), InputFormat::Urqmd);
  EXPECT_EQ(resolve_input_format(InputFormat::Urqmd, std::nullopt), InputFormat::Urqmd);
}

TEST(InputFormat, AutoDetectsFromFilename) {
  EXPECT_EQ(resolve_input_format(InputFormat::Auto, std::string("data/run1.f13")), InputFormat::Urqmd);
  EXPECT_EQ(resolve_input_format(InputFormat::Auto, std::string("urqmd.f13.gz.part")), InputFormat::Urqmd);
  EXPECT_EQ(resolve_input_format(InputFormat::Auto, std::string("events.dat")), InputFormat::Std);
  EXPECT_EQ(resolve_input_format(InputFormat::Auto, std::string("f13")), InputFormat::Std);
}

TEST(InputFormat, StdinDefaultsToStandard) {
  EXPECT_EQ(resolve_input_format(InputFormat::Auto, std::nullopt), InputFormat::Std);
  EXPECT_EQ(resolve_input_format(InputFormat::Auto, std::string("-")), InputFormat::Std);
}

TEST(InputFormat, ResolvedFormatIsNeverAuto) {
  for (auto req : {InputFormat::Auto, InputFormat::Std, InputFormat::Urqmd}) {
    for (const auto& name : {std::optional<std::string>(), std::optional<std::string>("a.f13"),
                             std::optional<std::string>("b.txt")}) {
      EXPECT_NE(resolve_input_format(req, name), InputFormat::Auto);
    }
  }
}
