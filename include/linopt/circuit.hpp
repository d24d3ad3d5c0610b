// SPDX-License-Identifier: MIT

#pragma once
#include "components.hpp"
#include <string>
#include <vector>
#include <optional>

namespace linopt {

// Boundary record for circuits assembled by an external builder.
struct ComponentSpec {
  enum class Kind { BeamSplitter, PhaseShifter };
  Kind kind = Kind::BeamSplitter;
  std::vector<int> modes;
  double angle = 0.0; // theta for BeamSplitter, phi for PhaseShifter
  BSConvention convention = BSConvention::Rx;
  std::vector<double> phases; // optional phi_tl, phi_bl, phi_tr, phi_br
};

class Circuit {
  int modes_;
  std::vector<Component> components_;

public:
  explicit Circuit(int modes);
  int modes() const { return modes_; }
  std::size_t size() const { return components_.size(); }
  const std::vector<Component>& components() const { return components_; }

  // Appends in application order. Throws ConfigurationError on out-of-range modes.
  Circuit& add(const Component& c);
};

Circuit build_circuit(int modes, const std::vector<ComponentSpec>& specs);

// Parse a .lop circuit description.
// Lines:
//   MODES 4
//   BS 0 1 0.785398163397 H
//   BSR 1 2 0.333333333333
//   PS 2 1.57079632679
std::optional<Circuit> parse_circuit_string(const std::string& text, std::string& err);
std::optional<Circuit> parse_circuit_file(const std::string& path, std::string& err);

// Inverse of parse_circuit_string (full precision).
std::string to_circuit_text(const Circuit& c);

} // namespace linopt
