#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "ebeflow/config/IniConfig.hpp"
#include "ebeflow/core/Particle.hpp"

namespace ebeflow {

enum class FilterPreset {
  None = 0,
  Atlas = 1,
};

// none|atlas (case-insensitive). Throws std::runtime_error otherwise.
FilterPreset parse_filter_preset(std::string s);
std::string filter_preset_name(FilterPreset p);

// ATLAS-like acceptance: charged particles, pT >= 0.5 GeV, |eta| <= 2.5.
inline constexpr double kAtlasPtMin = 0.5;
inline constexpr double kAtlasEtaMax = 2.5;

// Selection cuts. An unset optional means "no cut".
// Bounds are inclusive; eta bounds apply to |eta|.
struct FilterSpec {
  FilterPreset preset = FilterPreset::None;
  std::optional<std::set<int>> ids;
  bool charged_only = false;
  std::optional<double> pt_min;
  std::optional<double> pt_max;
  std::optional<double> eta_min;
  std::optional<double> eta_max;

  // Fill cuts implied by `preset` that were not set explicitly.
  void apply_preset();

  // Throws std::runtime_error on inconsistent bounds.
  void validate() const;

  bool empty() const {
    return !ids && !charged_only && !pt_min && !pt_max && !eta_min && !eta_max;
  }

  // Stable one-line rendering for logs and the run summary.
  std::string describe() const;
};

// Reads [filter]: preset, ids, charged_only, pT_min, pT_max, eta_min, eta_max.
// Explicit keys override the preset. The result is validated.
FilterSpec filter_spec_from_config(const IniConfig& cfg);

// Compiled conjunction of the cuts in a FilterSpec.
// Predicates are evaluated in a fixed order (ids, charge, pT, eta); absent cuts
// add no predicate, so an empty spec accepts everything.
class ParticleFilter {
public:
  ParticleFilter() = default;
  explicit ParticleFilter(const FilterSpec& spec);

  bool accept(const Particle& p) const noexcept {
    for (const auto& pred : preds_) {
      if (!pred(p)) return false;
    }
    return true;
  }

  const FilterSpec& spec() const { return spec_; }
  std::size_t num_predicates() const { return preds_.size(); }

private:
  FilterSpec spec_;
  std::vector<std::function<bool(const Particle&)>> preds_;
};

} // namespace ebeflow
