// SPDX-License-Identifier: MIT

#include "mpi/distributed_analyzer.hpp"
#include "linopt/gadgets.hpp"
#include "linopt/unitary.hpp"
#include <cmath>
#include <iostream>

using namespace linopt;

static int tests_failed = 0;
#define EXPECT_NEAR(a,b,eps) do{ if (std::fabs((a)-(b))>(eps)) { std::cerr << "EXPECT_NEAR failed at " << __LINE__ << ": " << (a) << " vs " << (b) << "\n"; ++tests_failed; } }while(0)
#define EXPECT_TRUE(x) do{ if (!(x)) { std::cerr << "EXPECT_TRUE failed at " << __LINE__ << ": " #x "\n"; ++tests_failed; } }while(0)

int main(){
  auto ctx = init_mpi();
#ifndef LINOPT_MPI
  EXPECT_TRUE(!ctx.has_value());
#endif
  MPIContext c = ctx.value_or(MPIContext{});

  auto prog = gadgets::order_finding_demo();
  auto U = unitary_of(prog.circuit);
  auto basis = label_qubit_states(prog.encoding, all_qubit_states(4));
  auto inputs = basis;
  inputs.push_back({"bad", {1,0}});

  auto expected = distribution(U, inputs, basis);
  auto got = distribution_mpi(U, inputs, basis, c);
  EXPECT_TRUE(got.size() == expected.size());
  EXPECT_TRUE(got.invalid_count() == basis.size());
  for (std::size_t i=0;i<got.size() && i<expected.size();++i){
    const auto& g = got.entries()[i];
    const auto& e = expected.entries()[i];
    EXPECT_TRUE(g.input == e.input && g.output == e.output && g.valid == e.valid && g.error == e.error);
    EXPECT_NEAR(g.probability, e.probability, 1e-15);
  }

  bool threw = false;
  try { distribution_mpi(U, inputs, basis, MPIContext{3, 2}); } catch (const ConfigurationError&) { threw = true; }
  EXPECT_TRUE(threw);

  finalize_mpi();
  if (tests_failed==0 && c.rank==0){ std::cout << "OK\n"; }
  return tests_failed == 0 ? 0 : 1;
}
