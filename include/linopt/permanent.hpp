// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include "fock.hpp"
#include <string>

namespace linopt {

// Strategy for evaluating permanents. Ryser and Glynn are O(K 2^K) with Gray-code
// ordering; Naive sums all K! permutations and exists for cross-checking.
enum class PermanentMethod { Ryser, Glynn, Naive };

std::string method_name(PermanentMethod m);
bool parse_method(const std::string& s, PermanentMethod& out);

// Largest matrix order accepted by the Gray-code evaluators.
constexpr std::size_t kMaxPermanentOrder = 63;

// Permanent of a square matrix; the empty matrix has permanent 1.
// Throws InputError for non-square input or order above kMaxPermanentOrder.
c64 permanent(const Matrix& M, PermanentMethod method = PermanentMethod::Ryser);

// <output| U |input> for Fock states, U from unitary_of.
// Mismatched photon totals give exactly 0. Wrong length or negative occupation
// throws InputError.
c64 amplitude(const Unitary& U, const FockState& input, const FockState& output,
              PermanentMethod method = PermanentMethod::Ryser);

double probability(const Unitary& U, const FockState& input, const FockState& output,
                   PermanentMethod method = PermanentMethod::Ryser);

} // namespace linopt
