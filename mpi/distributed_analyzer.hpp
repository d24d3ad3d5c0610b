// SPDX-License-Identifier: MIT

#pragma once
#include "linopt/analyzer.hpp"
#ifdef LINOPT_MPI
#include <mpi.h>
#endif
#include <optional>

namespace linopt {

struct MPIContext {
  int rank=0, size=1;
};

// std::nullopt when built without LINOPT_MPI.
std::optional<MPIContext> init_mpi();
void finalize_mpi();

// Rank r evaluates pairs k with k % size == r; the assembled table is
// returned on every rank, in the same order as distribution().
ProbabilityTable distribution_mpi(const Unitary& U, const std::vector<LabeledState>& inputs,
                                  const std::vector<LabeledState>& outputs, const MPIContext& ctx,
                                  PermanentMethod method = PermanentMethod::Ryser);

} // namespace linopt
