// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include "errors.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace linopt {

// Throws InputError unless f has `modes` entries, all non-negative.
void validate_fock(const FockState& f, std::size_t modes);

// 64-bit sum: occupations are int, their total need not fit one.
std::int64_t total_photons(const FockState& f);

// |n0,n1,...>
std::string fock_to_string(const FockState& f);

// Reads "|1,0,2>" (bars and brackets optional, whitespace ignored). Throws InputError.
FockState parse_fock(const std::string& s);

// All states with `photons` photons in `modes` modes, first mode most occupied first.
// Throws InputError for a negative count or one that does not fit a single occupation.
std::vector<FockState> enumerate_fock_states(std::size_t modes, std::int64_t photons);

} // namespace linopt
