// SPDX-License-Identifier: MIT

#pragma once
#include "circuit.hpp"
#include <string>

namespace linopt {

constexpr double kDefaultTolerance = 1e-9;

// Global N x N unitary of a circuit. Components are composed in listed order,
// U = U_last * ... * U_first, so U(out, in) is the single-photon amplitude
// from mode `in` to mode `out`.
// Throws ValidationError if a local matrix or the product is not unitary within tol.
Unitary unitary_of(const Circuit& c, double tol = kDefaultTolerance);

// Largest entry of |U U^dagger - I|. Throws InputError for a non-square matrix.
double unitarity_error(const Matrix& U);

// Export unitary to CSV (a+bi per cell)
bool export_unitary_csv(const Unitary& U, const std::string& path);

// Human-readable rendering for inspection; exact 0 and 1 print plainly.
std::string format_unitary(const Unitary& U, int precision = 4);

} // namespace linopt
