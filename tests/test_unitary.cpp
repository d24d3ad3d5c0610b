// SPDX-License-Identifier: MIT

#include "linopt/unitary.hpp"
#include <cmath>
#include <iostream>
#include <numbers>
#include <random>

using namespace linopt;

static int tests_failed = 0;
#define EXPECT_NEAR(a,b,eps) do{ if (std::abs((a)-(b))>(eps)) { std::cerr << "EXPECT_NEAR failed at " << __LINE__ << ": " << (a) << " vs " << (b) << "\n"; ++tests_failed; } }while(0)
#define EXPECT_TRUE(x) do{ if (!(x)) { std::cerr << "EXPECT_TRUE failed at " << __LINE__ << ": " #x "\n"; ++tests_failed; } }while(0)

static Circuit random_circuit(int modes, int depth, std::mt19937_64& gen){
  std::uniform_int_distribution<int> mode(0, modes-1);
  std::uniform_real_distribution<double> angle(-std::numbers::pi, std::numbers::pi);
  std::uniform_int_distribution<int> conv(0, 2);
  Circuit c(modes);
  for (int k=0;k<depth;++k){
    int a = mode(gen), b = mode(gen);
    if (a == b) { c.add(PhaseShifter(a, angle(gen))); continue; }
    c.add(BeamSplitter(a, b, angle(gen), static_cast<BSConvention>(conv(gen)),
                       angle(gen), angle(gen), angle(gen), angle(gen)));
  }
  return c;
}

int main(){
  // Empty circuit composes to the identity
  auto I = unitary_of(Circuit(3));
  for (std::size_t i=0;i<3;++i)
    for (std::size_t j=0;j<3;++j) EXPECT_NEAR(I(i,j), c64(i==j ? 1.0 : 0.0, 0.0), 0.0);

  // Embedding leaves untouched modes alone
  Circuit one(4);
  one.add(BeamSplitter(1, 3, std::numbers::pi/4, BSConvention::H));
  auto E = unitary_of(one);
  const double s = 1.0/std::sqrt(2.0);
  EXPECT_NEAR(E(1,1), c64(s,0), 1e-12);
  EXPECT_NEAR(E(1,3), c64(s,0), 1e-12);
  EXPECT_NEAR(E(3,1), c64(s,0), 1e-12);
  EXPECT_NEAR(E(3,3), c64(-s,0), 1e-12);
  EXPECT_NEAR(E(0,0), c64(1,0), 0.0);
  EXPECT_NEAR(E(2,2), c64(1,0), 0.0);
  EXPECT_NEAR(E(0,1), c64(0,0), 0.0);

  // Later components multiply from the left: PS after BS scales row 0
  Circuit order(2);
  order.add(BeamSplitter(0, 1, std::numbers::pi/4, BSConvention::H));
  order.add(PhaseShifter(0, std::numbers::pi/2));
  auto O = unitary_of(order);
  EXPECT_NEAR(O(0,0), c64(0,s), 1e-12);
  EXPECT_NEAR(O(0,1), c64(0,s), 1e-12);
  EXPECT_NEAR(O(1,0), c64(s,0), 1e-12);
  EXPECT_NEAR(O(1,1), c64(-s,0), 1e-12);

  // Random circuits stay unitary
  std::mt19937_64 gen(1234);
  for (int trial=0; trial<20; ++trial){
    auto c = random_circuit(6, 40, gen);
    auto U = unitary_of(c);
    EXPECT_TRUE(unitarity_error(U) < 1e-9);
  }

  // A tolerance nothing can meet is reported as a validation failure
  bool thrown = false;
  try { unitary_of(one, -1.0); } catch (const ValidationError&) { thrown = true; }
  EXPECT_TRUE(thrown);

  auto text = format_unitary(E, 3);
  EXPECT_TRUE(text.find("0.707") != std::string::npos);
  EXPECT_TRUE(text.find("-0.707") != std::string::npos);

  if (tests_failed==0){ std::cout << "OK\n"; }
  return tests_failed == 0 ? 0 : 1;
}
