#include "ebeflow/select/ParticleFilter.hpp"

#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include "ebeflow/pdg/SpeciesTable.hpp"
#include "ebeflow/util/Parse.hpp"

namespace ebeflow {

FilterPreset parse_filter_preset(std::string s) {
  for (auto& c : s) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
  if (s.empty() || s == "none") return FilterPreset::None;
  if (s == "atlas") return FilterPreset::Atlas;
  throw std::runtime_error("invalid filter preset: '" + s + "' (use none|atlas)");
}

std::string filter_preset_name(FilterPreset p) {
  switch (p) {
    case FilterPreset::None: return "none";
    case FilterPreset::Atlas: return "atlas";
  }
  return "none";
}

void FilterSpec::apply_preset() {
  switch (preset) {
    case FilterPreset::None:
      return;
    case FilterPreset::Atlas:
      charged_only = true;
      if (!pt_min) pt_min = kAtlasPtMin;
      if (!eta_max) eta_max = kAtlasEtaMax;
      return;
  }
}

void FilterSpec::validate() const {
  auto non_negative = [](const std::optional<double>& v, const char* key) {
    if (v && !(*v >= 0.0)) {
      throw std::runtime_error(std::string("filter: ") + key + " must be >= 0, got " + format_double(*v));
    }
  };
  non_negative(pt_min, "pT_min");
  non_negative(pt_max, "pT_max");
  non_negative(eta_min, "eta_min");
  non_negative(eta_max, "eta_max");

  if (pt_min && pt_max && *pt_min > *pt_max) {
    throw std::runtime_error("filter: pT_min (" + format_double(*pt_min) + ") > pT_max (" + format_double(*pt_max) + ")");
  }
  if (eta_min && eta_max && *eta_min > *eta_max) {
    throw std::runtime_error("filter: eta_min (" + format_double(*eta_min) + ") > eta_max (" + format_double(*eta_max) + ")");
  }
}

std::string FilterSpec::describe() const {
  std::string out = "preset=" + filter_preset_name(preset);
  if (ids) {
    out += " ids=";
    bool first = true;
    for (int id : *ids) {
      if (!first) out += ",";
      out += std::to_string(id);
      first = false;
    }
  }
  if (charged_only) out += " charged_only";
  if (pt_min) out += " pT>=" + format_double(*pt_min);
  if (pt_max) out += " pT<=" + format_double(*pt_max);
  if (eta_min) out += " |eta|>=" + format_double(*eta_min);
  if (eta_max) out += " |eta|<=" + format_double(*eta_max);
  return out;
}

FilterSpec filter_spec_from_config(const IniConfig& cfg) {
  static const char* kSection = "filter";
  cfg.require_known_keys(kSection, {"preset", "ids", "charged_only", "pT_min", "pT_max", "eta_min", "eta_max"});

  FilterSpec spec;
  spec.preset = parse_filter_preset(cfg.get_string(kSection, "preset", std::optional<std::string>("none")));

  if (cfg.is_set(kSection, "ids")) {
    const auto ids = cfg.get_int_list(kSection, "ids");
    if (ids.empty()) {
      throw std::runtime_error("filter: ids is set but lists no particle ids");
    }
    spec.ids = std::set<int>(ids.begin(), ids.end());
  }

  spec.pt_min = cfg.get_optional_double(kSection, "pT_min");
  spec.pt_max = cfg.get_optional_double(kSection, "pT_max");
  spec.eta_min = cfg.get_optional_double(kSection, "eta_min");
  spec.eta_max = cfg.get_optional_double(kSection, "eta_max");

  spec.apply_preset();

  // An explicit charged_only wins over the preset in both directions.
  if (auto charged = cfg.get_optional_bool(kSection, "charged_only")) {
    spec.charged_only = *charged;
  }

  spec.validate();
  return spec;
}

ParticleFilter::ParticleFilter(const FilterSpec& spec) : spec_(spec) {
  spec_.validate();

  if (spec_.ids) {
    preds_.emplace_back([ids = *spec_.ids](const Particle& p) { return ids.count(p.id) != 0; });
  }
  if (spec_.charged_only) {
    preds_.emplace_back([](const Particle& p) { return pdg::is_charged(p.id); });
  }
  if (spec_.pt_min) {
    preds_.emplace_back([lo = *spec_.pt_min](const Particle& p) { return p.pT >= lo; });
  }
  if (spec_.pt_max) {
    preds_.emplace_back([hi = *spec_.pt_max](const Particle& p) { return p.pT <= hi; });
  }
  if (spec_.eta_min) {
    preds_.emplace_back([lo = *spec_.eta_min](const Particle& p) { return std::fabs(p.eta) >= lo; });
  }
  if (spec_.eta_max) {
    preds_.emplace_back([hi = *spec_.eta_max](const Particle& p) { return std::fabs(p.eta) <= hi; });
  }
}

} // namespace ebeflow
