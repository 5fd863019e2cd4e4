#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <vector>

#include "ebeflow/core/Event.hpp"
#include "ebeflow/core/Particle.hpp"

namespace ebeflow {

// Harmonics computed when a measure does not set harmonic_min/harmonic_max.
inline constexpr int kDefaultHarmonicMin = 2;
inline constexpr int kDefaultHarmonicMax = 4;

// pT bin width of differential flow, GeV.
inline constexpr double kDefaultPtBinWidth = 0.1;

enum class FlowOutputMode {
  Magnitude = 0, // v_n per harmonic
  Vector = 1,    // Qx_n Qy_n per harmonic
};

// magnitude|vector (case-insensitive). Throws std::runtime_error otherwise.
FlowOutputMode parse_flow_output_mode(std::string s);
std::string flow_output_mode_name(FlowOutputMode m);

struct FlowVector {
  double x = 0.0;
  double y = 0.0;
};

// Flow vectors Q_n = (1/M) sum_i (cos n phi_i, sin n phi_i) for n in [n_min, n_max].
//
// M = 0 gives Q_n = (0, 0) for every n. Particles can be added in several
// pieces; the result is the multiplicity-weighted average, i.e. the same as
// computing it over all particles at once.
class Flows {
public:
  // Empty result (M = 0). Throws std::invalid_argument unless 1 <= n_min <= n_max.
  Flows(int n_min, int n_max);

  Flows(const Event& ev, int n_min, int n_max) : Flows(std::span<const Particle>(ev.particles), n_min, n_max) {}
  Flows(std::span<const Particle> particles, int n_min, int n_max);

  void add(std::span<const Particle> particles);
  void add(const Event& ev) { add(std::span<const Particle>(ev.particles)); }

  int n_min() const { return n_min_; }
  int n_max() const { return n_max_; }
  std::size_t num_harmonics() const { return vectors_.size(); }
  std::size_t multiplicity() const { return multiplicity_; }

  // Ascending n.
  const std::vector<FlowVector>& vectors() const { return vectors_; }
  std::vector<double> magnitudes() const;
  std::vector<double> angles() const; // Psi_n = atan2(Qy_n, Qx_n)

  // Append the values for `mode` in ascending n, separated by single spaces.
  void append_values(std::string& out, FlowOutputMode mode) const;

private:
  int n_min_ = kDefaultHarmonicMin;
  int n_max_ = kDefaultHarmonicMax;
  std::size_t multiplicity_ = 0;
  std::vector<double> sum_cos_;
  std::vector<double> sum_sin_;
  std::vector<FlowVector> vectors_;
};

// Ensemble-averaged flow over many events, weighted by multiplicity.
class FlowAccumulator {
public:
  FlowAccumulator(int n_min, int n_max) : flows_(n_min, n_max) {}

  void add(const Event& ev) {
    flows_.add(ev);
    ++events_;
  }

  const Flows& result() const { return flows_; }
  std::size_t events() const { return events_; }

private:
  Flows flows_;
  std::size_t events_ = 0;
};

// Ensemble-averaged flow in pT bins: bin k holds particles with k*w <= pT < (k+1)*w.
// Particles with a negative or non-finite pT, or beyond kMaxBins, have no bin
// and are only counted.
class DifferentialFlow {
public:
  static constexpr std::size_t kMaxBins = 100000;

  // Throws std::invalid_argument for a bad harmonic range or a non-positive width.
  DifferentialFlow(int n_min, int n_max, double bin_width = kDefaultPtBinWidth);

  void add(const Event& ev);

  double bin_width() const { return width_; }
  std::size_t num_bins() const { return bins_.size(); }

  // Bins 0 .. num_bins()-1; bins between populated ones may have M = 0.
  const Flows& bin(std::size_t k) const { return bins_.at(k); }
  double bin_mid(std::size_t k) const { return (static_cast<double>(k) + 0.5) * width_; }

  std::size_t events() const { return events_; }
  std::size_t unbinned() const { return unbinned_; }

private:
  int n_min_;
  int n_max_;
  double width_;
  std::vector<Flows> bins_;
  std::vector<std::vector<Particle>> scratch_;
  std::size_t events_ = 0;
  std::size_t unbinned_ = 0;
};

} // namespace ebeflow
