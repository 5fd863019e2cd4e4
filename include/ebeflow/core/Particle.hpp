#pragma once

namespace ebeflow {

// Standard particle information, as stored in the standard text format:
//   id pT phi eta
// id  : Monte Carlo (PDG) particle code
// pT  : transverse momentum [GeV]
// phi : azimuthal angle [rad], [-pi, pi)
// eta : pseudorapidity; +-inf for particles moving exactly along the beam axis
struct Particle {
  int id = 0;
  double pT = 0.0;
  double phi = 0.0;
  double eta = 0.0;

  friend bool operator==(const Particle&, const Particle&) = default;
};

} // namespace ebeflow
