// SPDX-License-Identifier: MIT

#pragma once
#include <stdexcept>
#include <string>

namespace linopt {

struct Error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Malformed circuit or encoding: bad mode index, degenerate beam splitter,
// negative mode count, out-of-domain parameter.
struct ConfigurationError : Error {
  using Error::Error;
};

// A local or composed matrix fails the unitarity check.
struct ValidationError : Error {
  using Error::Error;
};

// Fock or qubit state of the wrong shape passed to a single query.
struct InputError : Error {
  using Error::Error;
};

} // namespace linopt
