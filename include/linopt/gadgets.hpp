// SPDX-License-Identifier: MIT

#pragma once
#include "circuit.hpp"
#include "encoding.hpp"
#include <utility>

namespace linopt::gadgets {

using Rail = std::pair<int,int>; // (zero_mode, one_mode)

// Reflectivity of each splitter in the controlled-Z gadget.
constexpr double kCZReflectivity = 1.0 / 3.0;

// Balanced H-convention splitter on a rail: an exact Hadamard on the path qubit.
void add_hadamard(Circuit& c, Rail q);

// Post-selected controlled-Z, success probability 1/9. The one-modes of control
// and target interfere on a 1/3 splitter; each zero-mode is attenuated by a 1/3
// splitter into its vacuum auxiliary mode.
void add_cz(Circuit& c, Rail control, Rail target, int aux_control, int aux_target);

// H(target) CZ H(target)
void add_cnot(Circuit& c, Rail control, Rail target, int aux_control, int aux_target);

struct Program {
  Circuit circuit;
  Encoding encoding;
  QubitState input;
};

// Compiled order-finding circuit on qubits (x1, x2, f1, f2): Hadamards on all
// four rails, CZ(x1,f1) and CZ(x2,f2), Hadamards on f1 and f2. Twelve modes,
// rails (1,2) (3,4) (7,8) (9,10), auxiliary modes 0 5 6 11, input |0,0,0,1>.
Program order_finding_demo();

} // namespace linopt::gadgets
