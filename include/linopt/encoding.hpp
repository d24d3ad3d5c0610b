// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include "errors.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace linopt {

// Dual-rail path encoding: qubit q lives in (zero_mode, one_mode); auxiliary
// modes must stay in vacuum for a Fock state to be a valid qubit state.
class Encoding {
  int modes_;
  std::vector<std::pair<int,int>> qubits_;
  std::vector<int> aux_;

public:
  // Throws ConfigurationError on out-of-range or reused modes.
  Encoding(int modes, std::vector<std::pair<int,int>> qubit_modes, std::vector<int> aux_modes);

  int modes() const { return modes_; }
  std::size_t num_qubits() const { return qubits_.size(); }
  const std::vector<std::pair<int,int>>& qubit_modes() const { return qubits_; }
  const std::vector<int>& aux_modes() const { return aux_; }

  // Throws InputError if q has the wrong number of qubits.
  FockState to_fock(const QubitState& q) const;

  // std::nullopt when f does not encode a qubit state (aux occupied or a pair
  // not holding exactly one photon). Throws InputError on malformed f.
  std::optional<QubitState> to_qubit(const FockState& f) const;
};

// Parses "pairs=1:2,3:4;aux=0,5" for an N-mode circuit. Returns nullopt with err set on failure.
std::optional<Encoding> parse_encoding(const std::string& text, int modes, std::string& err);

// |b0,b1,...>
std::string qubit_to_string(const QubitState& q);

// All 2^n computational basis states, |0,...,0> first, last qubit fastest.
// Throws InputError for n >= 64.
std::vector<QubitState> all_qubit_states(std::size_t n);

} // namespace linopt
