#include <cmath>
#include <limits>
#include <set>
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>

#include "ebeflow/config/IniConfig.hpp"
#include "ebeflow/select/ParticleFilter.hpp"

using namespace ebeflow;

namespace {

Particle make(int id, double pT, double eta) {
  Particle p;
  p.id = id;
  p.pT = pT;
  p.phi = 0.1;
  p.eta = eta;
  return p;
}

FilterSpec spec_from(const std::string& filter_section) {
  return filter_spec_from_config(IniConfig::from_string("[filter]\n" + filter_section));
}

} // namespace

TEST(ParticleFilter, EmptySpecAcceptsEverything) {
  ParticleFilter f;
  EXPECT_EQ(f.num_predicates(), 0u);
  EXPECT_TRUE(f.accept(make(22, 0.0, std::numeric_limits<double>::infinity())));
  EXPECT_TRUE(ParticleFilter(FilterSpec{}).accept(make(111, 100.0, -9.0)));
}

TEST(ParticleFilter, IdsWhitelist) {
  FilterSpec s;
  s.ids = std::set<int>{211, -211};
  ParticleFilter f(s);
  EXPECT_TRUE(f.accept(make(211, 1, 0)));
  EXPECT_TRUE(f.accept(make(-211, 1, 0)));
  EXPECT_FALSE(f.accept(make(111, 1, 0)));
}

TEST(ParticleFilter, ChargedOnly) {
  FilterSpec s;
  s.charged_only = true;
  ParticleFilter f(s);
  EXPECT_TRUE(f.accept(make(2212, 1, 0)));
  EXPECT_FALSE(f.accept(make(2112, 1, 0)));
  EXPECT_FALSE(f.accept(make(22, 1, 0)));
}

TEST(ParticleFilter, PtBoundsAreInclusive) {
  FilterSpec s;
  s.pt_min = 0.5;
  s.pt_max = 3.0;
  ParticleFilter f(s);
  EXPECT_TRUE(f.accept(make(211, 0.5, 0)));
  EXPECT_TRUE(f.accept(make(211, 3.0, 0)));
  EXPECT_FALSE(f.accept(make(211, 0.4999, 0)));
  EXPECT_FALSE(f.accept(make(211, 3.0001, 0)));
}

TEST(ParticleFilter, EtaBoundsApplyToAbsoluteValue) {
  FilterSpec s;
  s.eta_min = 0.5;
  s.eta_max = 2.5;
  ParticleFilter f(s);
  EXPECT_TRUE(f.accept(make(211, 1, -2.5)));
  EXPECT_TRUE(f.accept(make(211, 1, 0.5)));
  EXPECT_TRUE(f.accept(make(211, 1, -1.0)));
  EXPECT_FALSE(f.accept(make(211, 1, 0.2)));
  EXPECT_FALSE(f.accept(make(211, 1, -2.6)));
  EXPECT_FALSE(f.accept(make(211, 1, -std::numeric_limits<double>::infinity())));
}

TEST(ParticleFilter, CompilesOnlyPresentPredicates) {
  FilterSpec s;
  s.charged_only = true;
  s.eta_max = 1.0;
  EXPECT_EQ(ParticleFilter(s).num_predicates(), 2u);
}

TEST(ParticleFilter, FilteringIsIdempotent) {
  FilterSpec s;
  s.preset = FilterPreset::Atlas;
  s.apply_preset();
  ParticleFilter f(s);

  const std::vector<Particle> in = {make(211, 0.6, 1.0), make(111, 2.0, 0.0), make(-211, 0.3, 0.1),
                                    make(2212, 1.2, -2.4), make(321, 5.0, 3.0)};
  std::vector<Particle> once;
  for (const auto& p : in) {
    if (f.accept(p)) once.push_back(p);
  }
  std::vector<Particle> twice;
  for (const auto& p : once) {
    if (f.accept(p)) twice.push_back(p);
  }
  EXPECT_EQ(once, twice);
  EXPECT_EQ(once.size(), 2u);
}

TEST(FilterConfig, AtlasPresetExpands) {
  const FilterSpec s = spec_from("preset = atlas\n");
  EXPECT_EQ(s.preset, FilterPreset::Atlas);
  EXPECT_TRUE(s.charged_only);
  ASSERT_TRUE(s.pt_min.has_value());
  EXPECT_DOUBLE_EQ(*s.pt_min, 0.5);
  ASSERT_TRUE(s.eta_max.has_value());
  EXPECT_DOUBLE_EQ(*s.eta_max, 2.5);
  EXPECT_FALSE(s.pt_max.has_value());
  EXPECT_FALSE(s.eta_min.has_value());
  EXPECT_FALSE(s.ids.has_value());

  ParticleFilter f(s);
  EXPECT_TRUE(f.accept(make(211, 0.5, 2.5)));
  EXPECT_FALSE(f.accept(make(111, 1.0, 0.0)));
  EXPECT_FALSE(f.accept(make(211, 0.49, 0.0)));
  EXPECT_FALSE(f.accept(make(211, 1.0, 2.51)));
}

TEST(FilterConfig, ExplicitKeysOverridePreset) {
  const FilterSpec s = spec_from("preset = ATLAS\npT_min = 0.2\ncharged_only = false\n");
  ASSERT_TRUE(s.pt_min.has_value());
  EXPECT_DOUBLE_EQ(*s.pt_min, 0.2);
  EXPECT_FALSE(s.charged_only);
  ASSERT_TRUE(s.eta_max.has_value());
  EXPECT_DOUBLE_EQ(*s.eta_max, 2.5);
}

TEST(FilterConfig, ParsesIdsAndBounds) {
  const FilterSpec s = spec_from("ids = 211, -211 321\npT_max = 3\neta_min = 0\n");
  ASSERT_TRUE(s.ids.has_value());
  EXPECT_EQ(*s.ids, (std::set<int>{-211, 211, 321}));
  EXPECT_DOUBLE_EQ(*s.pt_max, 3.0);
  EXPECT_DOUBLE_EQ(*s.eta_min, 0.0);
  EXPECT_FALSE(s.charged_only);
}

TEST(FilterConfig, MissingSectionMeansNoCuts) {
  const FilterSpec s = filter_spec_from_config(IniConfig::from_string("[general]\nprofile = false\n"));
  EXPECT_TRUE(s.empty());
}

TEST(FilterConfig, RejectsInconsistentBounds) {
  EXPECT_THROW(spec_from("pT_min = 2\npT_max = 1\n"), std::runtime_error);
  EXPECT_THROW(spec_from("eta_min = 3\neta_max = 1\n"), std::runtime_error);
  EXPECT_THROW(spec_from("eta_max = -1\n"), std::runtime_error);
  EXPECT_THROW(spec_from("preset = cms\n"), std::runtime_error);
  EXPECT_THROW(spec_from("pT_min = fast\n"), std::runtime_error);
  EXPECT_THROW(spec_from("ids = pion\n"), std::runtime_error);
  EXPECT_THROW(spec_from("pt_min = 0.5\n"), std::runtime_error);
}

TEST(FilterConfig, DescribeIsStable) {
  const FilterSpec s = spec_from("preset = atlas\nids = 211\n");
  EXPECT_EQ(s.describe(), "preset=atlas ids=211 charged_only pT>=0.5 |eta|<=2.5");
}
