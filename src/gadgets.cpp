// SPDX-License-Identifier: MIT

#include "linopt/gadgets.hpp"
#include <numbers>

namespace linopt::gadgets {

void add_hadamard(Circuit& c, Rail q){
  c.add(BeamSplitter(q.first, q.second, std::numbers::pi / 4, BSConvention::H));
}

void add_cz(Circuit& c, Rail control, Rail target, int aux_control, int aux_target){
  c.add(BeamSplitter::from_reflectivity(aux_control, control.first, kCZReflectivity));
  c.add(BeamSplitter::from_reflectivity(control.second, target.second, kCZReflectivity));
  c.add(BeamSplitter::from_reflectivity(target.first, aux_target, kCZReflectivity));
}

void add_cnot(Circuit& c, Rail control, Rail target, int aux_control, int aux_target){
  add_hadamard(c, target);
  add_cz(c, control, target, aux_control, aux_target);
  add_hadamard(c, target);
}

Program order_finding_demo(){
  const Rail x1{1, 2}, x2{3, 4}, f1{7, 8}, f2{9, 10};
  Circuit c(12);
  add_hadamard(c, x1);
  add_hadamard(c, x2);
  add_hadamard(c, f1);
  add_hadamard(c, f2);
  add_cz(c, x1, f1, 0, 6);
  add_cz(c, x2, f2, 5, 11);
  add_hadamard(c, f1);
  add_hadamard(c, f2);
  Encoding enc(12, {x1, x2, f1, f2}, {0, 5, 6, 11});
  return Program{std::move(c), std::move(enc), {false, false, false, true}};
}

} // namespace linopt::gadgets
