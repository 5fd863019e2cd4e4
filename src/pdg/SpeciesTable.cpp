#include "ebeflow/pdg/SpeciesTable.hpp"

#include <array>
#include <cstddef>
#include <cstdlib>

namespace ebeflow::pdg {

namespace {

struct UrqmdEntry {
  int ityp;
  int iso3x2;
  int pdg;
};

// clang-format off
constexpr UrqmdEntry kUrqmdEntries[] = {
  // nucleons
  {1, -1, 2112}, {1, 1, 2212},
  // N*
  {2, -1, 12112}, {2, 1, 12212},
  {3, -1, 1214},  {3, 1, 2124},
  {4, -1, 22112}, {4, 1, 22212},
  {5, -1, 32112}, {5, 1, 32212},
  {6, -1, 2116},  {6, 1, 2216},
  {7, -1, 12116}, {7, 1, 12216},
  {8, -1, 21214}, {8, 1, 22124},
  {9, -1, 42112}, {9, 1, 42212},
  {10, -1, 31214}, {10, 1, 32124},
  {14, -1, 1218},  {14, 1, 2128},
  // Delta
  {17, -3, 1114},  {17, -1, 2114},  {17, 1, 2214},  {17, 3, 2224},
  {18, -3, 31114}, {18, -1, 32114}, {18, 1, 32214}, {18, 3, 32224},
  {19, -3, 1112},  {19, -1, 1212},  {19, 1, 2122},  {19, 3, 2222},
  {20, -3, 11114}, {20, -1, 12114}, {20, 1, 12214}, {20, 3, 12224},
  {21, -3, 11112}, {21, -1, 11212}, {21, 1, 12122}, {21, 3, 12222},
  {22, -3, 1116},  {22, -1, 1216},  {22, 1, 2126},  {22, 3, 2226},
  {23, -3, 21112}, {23, -1, 21212}, {23, 1, 22122}, {23, 3, 22222},
  {24, -3, 21114}, {24, -1, 22114}, {24, 1, 22214}, {24, 3, 22224},
  {25, -3, 11116}, {25, -1, 11216}, {25, 1, 12126}, {25, 3, 12226},
  {26, -3, 1118},  {26, -1, 2118},  {26, 1, 2218},  {26, 3, 2228},
  // Lambda
  {27, 0, 3122},  {28, 0, 13122}, {29, 0, 3124},  {30, 0, 23122},
  {31, 0, 33122}, {32, 0, 13124}, {33, 0, 43122}, {34, 0, 53122},
  {35, 0, 3126},  {36, 0, 13126}, {37, 0, 23124}, {38, 0, 3128},
  {39, 0, 23126},
  // Sigma
  {40, -2, 3112},  {40, 0, 3212},  {40, 2, 3222},
  {41, -2, 3114},  {41, 0, 3214},  {41, 2, 3224},
  {42, -2, 13112}, {42, 0, 13212}, {42, 2, 13222},
  {43, -2, 13114}, {43, 0, 13214}, {43, 2, 13224},
  {44, -2, 23112}, {44, 0, 23212}, {44, 2, 23222},
  {45, -2, 3116},  {45, 0, 3216},  {45, 2, 3226},
  {46, -2, 13116}, {46, 0, 13216}, {46, 2, 13226},
  {47, -2, 23114}, {47, 0, 23214}, {47, 2, 23224},
  {48, -2, 3118},  {48, 0, 3218},  {48, 2, 3228},
  // Xi
  {49, -1, 3312},  {49, 1, 3322},
  {50, -1, 3314},  {50, 1, 3324},
  {52, -1, 13314}, {52, 1, 13324},
  // Omega
  {55, 0, 3334},
  // gamma
  {100, 0, 22},
  // pion
  {101, -2, -211}, {101, 0, 111}, {101, 2, 211},
  // eta
  {102, 0, 221},
  // omega
  {103, 0, 223},
  // rho
  {104, -2, -213}, {104, 0, 113}, {104, 2, 213},
  // f0(980)
  {105, 0, 10221},
  // kaon
  {106, -1, 311}, {106, 1, 321},
  // eta'
  {107, 0, 331},
  // K*(892)
  {108, -1, 313}, {108, 1, 323},
  // phi
  {109, 0, 333},
  // K0*(1430)
  {110, -1, 10313}, {110, 1, 10323},
  // a0(980)
  {111, -2, -10211}, {111, 0, 10111}, {111, 2, 10211},
  // f0(1370)
  {112, 0, 20221},
  // K1(1270)
  {113, -1, 10313}, {113, 1, 10323},
  // a1(1260)
  {114, -2, -20213}, {114, 0, 20113}, {114, 2, 20213},
  // f1(1285)
  {115, 0, 20223},
  // f1'(1510)
  {116, 0, 40223},
  // K2*(1430)
  {117, -1, 315}, {117, 1, 325},
  // a2(1320)
  {118, -2, -215}, {118, 0, 115}, {118, 2, 215},
  // f2(1270)
  {119, 0, 225},
  // f2'(1525)
  {120, 0, 335},
  // K1(1400)
  {121, -1, 20313}, {121, 1, 20323},
  // b1
  {122, -2, -10213}, {122, 0, 10113}, {122, 2, 10213},
  // h1
  {123, 0, 10223},
  // K*(1410)
  {125, -1, 30313}, {125, 1, 30323},
  // rho(1450)
  {126, -2, -40213}, {126, 0, 40113}, {126, 2, 40213},
  // omega(1420)
  {127, 0, 50223},
  // phi(1680)
  {128, 0, 10333},
  // K*(1680)
  {129, -1, 40313}, {129, 1, 40323},
  // rho(1700)
  {130, -2, -30213}, {130, 0, 30113}, {130, 2, 30213},
  // omega(1600)
  {131, 0, 60223},
  // phi(1850)
  {132, 0, 337},
};
// clang-format on

// 2*I3 ranges over [-3, 3]; 0 marks an undefined pair (no PDG id is 0).
constexpr int kIsoSlots = 7;
constexpr int kIsoOffset = 3;

using UrqmdTable = std::array<std::array<int, kIsoSlots>, kMaxUrqmdType + 1>;

constexpr UrqmdTable make_urqmd_table() {
  UrqmdTable t{};
  for (const auto& e : kUrqmdEntries) {
    t[static_cast<std::size_t>(e.ityp)][static_cast<std::size_t>(e.iso3x2 + kIsoOffset)] = e.pdg;
  }
  return t;
}

constexpr UrqmdTable kUrqmdTable = make_urqmd_table();

static_assert(kUrqmdTable[1][1 + kIsoOffset] == 2212, "proton entry");
static_assert(kUrqmdTable[101][-2 + kIsoOffset] == -211, "pi- entry");

// Quark charges in units of e/3, indexed by quark flavour code 1..8.
constexpr int kQuarkCharge3[9] = {0, -1, 2, -1, 2, -1, 2, -1, 2};

int quark_charge3(int q) {
  if (q < 1 || q > 8) return 0;
  return kQuarkCharge3[q];
}

int lepton_boson_charge3(int a) {
  switch (a) {
    case 11: case 13: case 15: case 17: return -3; // charged leptons
    case 24: case 34: case 37: return 3;          // W+, W'+, H+
    default: return 0;
  }
}

} // namespace

std::optional<int> urqmd_to_pdg(int ityp, int iso3x2) {
  if (ityp == 0) return std::nullopt;
  const int sign = (ityp > 0) ? 1 : -1;
  const int a = std::abs(ityp);
  const int iso = sign * iso3x2;
  if (a > kMaxUrqmdType || iso < -kIsoOffset || iso > kIsoOffset) return std::nullopt;
  const int id = kUrqmdTable[static_cast<std::size_t>(a)][static_cast<std::size_t>(iso + kIsoOffset)];
  if (id == 0) return std::nullopt;
  return sign * id;
}

int pdg_charge3(int id) {
  if (id == 0) return 0;
  const int sign = (id > 0) ? 1 : -1;
  const int a = std::abs(id);

  // Nuclei: 10LZZZAAAI
  if (a >= 1000000000) {
    return sign * 3 * ((a / 10000) % 1000);
  }

  if (a <= 8) return sign * quark_charge3(a);
  if (a < 100) return sign * lepton_boson_charge3(a);

  // Hadrons: only the last four digits (nq1 nq2 nq3 nJ) carry quark content;
  // higher digits label radial/orbital excitations.
  const int nq1 = (a / 1000) % 10;
  const int nq2 = (a / 100) % 10;
  const int nq3 = (a / 10) % 10;

  int c = 0;
  if (nq1 == 0) {
    if (nq3 == 0) return 0;
    // Meson q qbar: for down-type heavy quarks (s, b) the quark sits in nq3.
    if (nq2 == 3 || nq2 == 5) {
      c = quark_charge3(nq3) - quark_charge3(nq2);
    } else {
      c = quark_charge3(nq2) - quark_charge3(nq3);
    }
  } else if (nq3 == 0) {
    // Diquark
    c = quark_charge3(nq1) + quark_charge3(nq2);
  } else {
    c = quark_charge3(nq1) + quark_charge3(nq2) + quark_charge3(nq3);
  }
  return sign * c;
}

} // namespace ebeflow::pdg
