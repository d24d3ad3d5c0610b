// SPDX-License-Identifier: MIT

#include "linopt/permanent.hpp"
#include "linopt/unitary.hpp"
#include <climits>
#include <cmath>
#include <iostream>
#include <numbers>
#include <random>

using namespace linopt;

static int tests_failed = 0;
#define EXPECT_NEAR(a,b,eps) do{ if (std::abs((a)-(b))>(eps)) { std::cerr << "EXPECT_NEAR failed at " << __LINE__ << ": " << (a) << " vs " << (b) << "\n"; ++tests_failed; } }while(0)
#define EXPECT_TRUE(x) do{ if (!(x)) { std::cerr << "EXPECT_TRUE failed at " << __LINE__ << ": " #x "\n"; ++tests_failed; } }while(0)
#define EXPECT_THROW(stmt, E) do{ bool thrown=false; try { stmt; } catch (const E&) { thrown=true; } if (!thrown) { std::cerr << "EXPECT_THROW failed at " << __LINE__ << ": " #stmt "\n"; ++tests_failed; } }while(0)

int main(){
  // Small matrices by hand
  Matrix a(2, 2);
  a(0,0) = 1; a(0,1) = 2; a(1,0) = 3; a(1,1) = 4;
  for (auto m : {PermanentMethod::Ryser, PermanentMethod::Glynn, PermanentMethod::Naive})
    EXPECT_NEAR(permanent(a, m), c64(10, 0), 1e-12);
  Matrix ones(4, 4);
  for (auto& z : ones.data) z = 1.0;
  EXPECT_NEAR(permanent(ones), c64(24, 0), 1e-9); // 4!
  EXPECT_NEAR(permanent(Matrix(0, 0)), c64(1, 0), 0.0);
  EXPECT_THROW(permanent(Matrix(2, 3)), InputError);

  // Ryser, Glynn and the permutation sum agree on random complex matrices
  std::mt19937_64 gen(7);
  std::normal_distribution<double> g(0.0, 1.0);
  for (std::size_t n=1; n<=7; ++n){
    Matrix m(n, n);
    for (auto& z : m.data) z = c64(g(gen), g(gen));
    auto naive = permanent(m, PermanentMethod::Naive);
    EXPECT_NEAR(permanent(m, PermanentMethod::Ryser), naive, 1e-9 * (1.0 + std::abs(naive)));
    EXPECT_NEAR(permanent(m, PermanentMethod::Glynn), naive, 1e-9 * (1.0 + std::abs(naive)));
  }

  // Identity, single photon
  auto I = unitary_of(Circuit(3));
  EXPECT_NEAR(amplitude(I, {0,1,0}, {0,1,0}), c64(1,0), 1e-12);
  EXPECT_NEAR(amplitude(I, {0,1,0}, {1,0,0}), c64(0,0), 1e-12);
  EXPECT_NEAR(amplitude(I, {2,0,1}, {2,0,1}), c64(1,0), 1e-12);

  // Hong-Ou-Mandel on a balanced splitter
  Circuit hom(2);
  hom.add(BeamSplitter(0, 1, std::numbers::pi/4, BSConvention::H));
  auto H = unitary_of(hom);
  EXPECT_NEAR(amplitude(H, {1,1}, {1,1}), c64(0,0), 1e-12);
  EXPECT_NEAR(probability(H, {1,1}, {2,0}), 0.5, 1e-12);
  EXPECT_NEAR(probability(H, {1,1}, {0,2}), 0.5, 1e-12);
  // amplitude follows U(out, in): single photon from mode 1 to mode 0
  EXPECT_NEAR(amplitude(H, {0,1}, {1,0}), H(0,1), 1e-12);

  // Photon-number mismatch is a defined zero, not an error
  EXPECT_NEAR(amplitude(H, {1,1}, {1,0}), c64(0,0), 0.0);

  // Malformed states are errors
  EXPECT_THROW(amplitude(H, {1,-1}, {0,0}), InputError);
  EXPECT_THROW(amplitude(H, {1,0,0}, {1,0}), InputError);
  EXPECT_THROW(amplitude(H, {1,0}, {1}), InputError);

  // Completeness: every 3-photon input sums to 1 over all 3-photon outputs
  std::uniform_real_distribution<double> ang(-std::numbers::pi, std::numbers::pi);
  Circuit mix(5);
  for (int layer=0; layer<4; ++layer)
    for (int m=0; m+1<5; ++m) mix.add(BeamSplitter(m, m+1, ang(gen), BSConvention::Rx, ang(gen), 0.0, ang(gen), 0.0));
  auto U = unitary_of(mix);
  auto outs = enumerate_fock_states(5, 3);
  EXPECT_TRUE(outs.size() == 35); // C(7,3)
  for (const FockState& in : {FockState{1,1,1,0,0}, FockState{3,0,0,0,0}, FockState{0,2,0,0,1}}){
    double total = 0.0;
    for (const auto& out : outs){
      total += probability(U, in, out);
      EXPECT_NEAR(amplitude(U, in, out, PermanentMethod::Glynn), amplitude(U, in, out), 1e-12);
    }
    EXPECT_NEAR(total, 1.0, 1e-9);
  }

  // Fock helpers
  EXPECT_TRUE(fock_to_string({0,1,2}) == "|0,1,2>");
  EXPECT_TRUE(parse_fock("|0, 1,2>") == (FockState{0,1,2}));
  EXPECT_THROW(parse_fock("|0,x>"), InputError);
  EXPECT_THROW(parse_fock("|0,,1>"), InputError);
  EXPECT_THROW(parse_fock("|0,1,>"), InputError);
  EXPECT_TRUE(enumerate_fock_states(2, 2).front() == (FockState{2,0}));

  // Photon totals are summed in 64 bits and capped before any submatrix is built
  EXPECT_TRUE(total_photons({INT_MAX, 1}) == std::int64_t(INT_MAX) + 1);
  EXPECT_TRUE(total_photons({INT_MAX, INT_MAX}) == 2 * std::int64_t(INT_MAX));
  Matrix I2 = Matrix::identity(2);
  // 2*INT_MAX + 2 wraps to 0 in 32 bits; it must not match the vacuum
  EXPECT_NEAR(amplitude(Matrix::identity(3), {INT_MAX, INT_MAX, 2}, {0, 0, 0}), c64(0,0), 0.0);
  EXPECT_THROW(amplitude(I2, {INT_MAX, 1}, {1, INT_MAX}), InputError);
  EXPECT_THROW(amplitude(I2, {64, 0}, {64, 0}), InputError);
  EXPECT_THROW(amplitude(I2, {200000, 0}, {0, 200000}), InputError);
  EXPECT_THROW(enumerate_fock_states(2, std::int64_t(INT_MAX) + 1), InputError);

  PermanentMethod pm;
  EXPECT_TRUE(parse_method("Glynn", pm) && pm == PermanentMethod::Glynn);
  EXPECT_TRUE(!parse_method("sampling", pm));

  if (tests_failed==0){ std::cout << "OK\n"; }
  return tests_failed == 0 ? 0 : 1;
}
