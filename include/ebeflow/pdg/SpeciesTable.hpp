#pragma once

#include <optional>

namespace ebeflow::pdg {

// UrQMD species code (ityp) and twice the isospin projection (2*I3) -> PDG id.
// Negative ityp denotes the antiparticle: the lookup uses |ityp| with -2*I3 and
// the returned id is negated. Returns nullopt for pairs UrQMD does not define.
// Table adapted from ityp2pdg.f of the UrQMD distribution.
std::optional<int> urqmd_to_pdg(int ityp, int iso3x2);

// Largest |ityp| covered by the table.
constexpr int kMaxUrqmdType = 132;

// Three times the electric charge of a PDG id, derived from the PDG numbering
// scheme (quark content for hadrons, fixed values for leptons and gauge bosons,
// Z for nuclei). Unknown or non-particle codes give 0.
int pdg_charge3(int id);

inline bool is_charged(int id) { return pdg_charge3(id) != 0; }

} // namespace ebeflow::pdg
