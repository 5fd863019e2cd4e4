#include "ebeflow/flow/Flows.hpp"

#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>

#include "ebeflow/util/Parse.hpp"

namespace ebeflow {

namespace {

void check_harmonic_range(int n_min, int n_max) {
  if (n_min < 1 || n_max < n_min) {
    throw std::invalid_argument("invalid harmonic range [" + std::to_string(n_min) + ", " + std::to_string(n_max) +
                                "] (need 1 <= harmonic_min <= harmonic_max)");
  }
}

} // namespace

FlowOutputMode parse_flow_output_mode(std::string s) {
  for (auto& c : s) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
  if (s == "magnitude") return FlowOutputMode::Magnitude;
  if (s == "vector") return FlowOutputMode::Vector;
  throw std::runtime_error("invalid flow output mode: '" + s + "' (use magnitude|vector)");
}

std::string flow_output_mode_name(FlowOutputMode m) {
  switch (m) {
    case FlowOutputMode::Magnitude: return "magnitude";
    case FlowOutputMode::Vector: return "vector";
  }
  return "magnitude";
}

// --- Flows ---

Flows::Flows(int n_min, int n_max) : n_min_(n_min), n_max_(n_max) {
  check_harmonic_range(n_min, n_max);
  const auto nh = static_cast<std::size_t>(n_max - n_min + 1);
  sum_cos_.assign(nh, 0.0);
  sum_sin_.assign(nh, 0.0);
  vectors_.assign(nh, FlowVector{});
}

Flows::Flows(std::span<const Particle> particles, int n_min, int n_max) : Flows(n_min, n_max) {
  add(particles);
}

void Flows::add(std::span<const Particle> particles) {
  if (particles.empty()) return;

  for (const auto& p : particles) {
    for (std::size_t k = 0; k < sum_cos_.size(); ++k) {
      const double nphi = static_cast<double>(n_min_ + static_cast<int>(k)) * p.phi;
      sum_cos_[k] += std::cos(nphi);
      sum_sin_[k] += std::sin(nphi);
    }
  }
  multiplicity_ += particles.size();

  const double inv_m = 1.0 / static_cast<double>(multiplicity_);
  for (std::size_t k = 0; k < vectors_.size(); ++k) {
    vectors_[k].x = sum_cos_[k] * inv_m;
    vectors_[k].y = sum_sin_[k] * inv_m;
  }
}

std::vector<double> Flows::magnitudes() const {
  std::vector<double> out;
  out.reserve(vectors_.size());
  for (const auto& q : vectors_) out.push_back(std::sqrt(q.x * q.x + q.y * q.y));
  return out;
}

std::vector<double> Flows::angles() const {
  std::vector<double> out;
  out.reserve(vectors_.size());
  for (const auto& q : vectors_) out.push_back(std::atan2(q.y, q.x));
  return out;
}

void Flows::append_values(std::string& out, FlowOutputMode mode) const {
  bool first = true;
  auto put = [&](double v) {
    if (!first) out.push_back(' ');
    append_double(out, v);
    first = false;
  };

  if (mode == FlowOutputMode::Vector) {
    for (const auto& q : vectors_) {
      put(q.x);
      put(q.y);
    }
    return;
  }
  for (double v : magnitudes()) put(v);
}

// --- DifferentialFlow ---

DifferentialFlow::DifferentialFlow(int n_min, int n_max, double bin_width)
: n_min_(n_min), n_max_(n_max), width_(bin_width) {
  check_harmonic_range(n_min, n_max);
  if (!(bin_width > 0.0) || !std::isfinite(bin_width)) {
    throw std::invalid_argument("pT bin width must be a positive number");
  }
}

void DifferentialFlow::add(const Event& ev) {
  ++events_;

  for (const auto& p : ev.particles) {
    if (!(p.pT >= 0.0) || !std::isfinite(p.pT)) {
      ++unbinned_;
      continue;
    }
    const double fk = std::floor(p.pT / width_);
    if (fk >= static_cast<double>(kMaxBins)) {
      ++unbinned_;
      continue;
    }
    const auto k = static_cast<std::size_t>(fk);
    if (k >= scratch_.size()) scratch_.resize(k + 1);
    scratch_[k].push_back(p);
  }

  while (bins_.size() < scratch_.size()) bins_.emplace_back(n_min_, n_max_);
  for (std::size_t k = 0; k < scratch_.size(); ++k) {
    bins_[k].add(std::span<const Particle>(scratch_[k]));
    scratch_[k].clear();
  }
}

} // namespace ebeflow
