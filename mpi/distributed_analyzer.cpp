// SPDX-License-Identifier: MIT

#include "mpi/distributed_analyzer.hpp"
#include <vector>

namespace linopt {

std::optional<MPIContext> init_mpi(){
#ifndef LINOPT_MPI
  return std::nullopt;
#else
  int inited=0; MPI_Initialized(&inited);
  if (!inited){ int argc=0; char** argv=nullptr; MPI_Init(&argc,&argv); }
  MPIContext ctx;
  MPI_Comm_rank(MPI_COMM_WORLD,&ctx.rank);
  MPI_Comm_size(MPI_COMM_WORLD,&ctx.size);
  return ctx;
#endif
}

void finalize_mpi(){
#ifdef LINOPT_MPI
  int finalized=0; MPI_Finalized(&finalized);
  if (!finalized) MPI_Finalize();
#endif
}

ProbabilityTable distribution_mpi(const Unitary& U, const std::vector<LabeledState>& inputs,
                                  const std::vector<LabeledState>& outputs, const MPIContext& ctx,
                                  PermanentMethod method){
  if (ctx.size < 1 || ctx.rank < 0 || ctx.rank >= ctx.size)
    throw ConfigurationError("Invalid MPI context");
  const std::size_t nout = outputs.size();
  const std::size_t total = inputs.size() * nout;
  // Slots not owned by this rank stay zero so a sum reduction assembles the table.
  std::vector<double> prob(total, 0.0), invalid(total, 0.0);
  for (std::size_t k = std::size_t(ctx.rank); k < total; k += std::size_t(ctx.size)){
    TableEntry e = evaluate_pair(U, inputs[k / nout], outputs[k % nout], method);
    prob[k] = e.probability;
    invalid[k] = e.valid ? 0.0 : 1.0;
  }
#ifdef LINOPT_MPI
  if (ctx.size > 1 && total > 0){
    MPI_Allreduce(MPI_IN_PLACE, prob.data(), int(total), MPI_DOUBLE, MPI_SUM, MPI_COMM_WORLD);
    MPI_Allreduce(MPI_IN_PLACE, invalid.data(), int(total), MPI_DOUBLE, MPI_SUM, MPI_COMM_WORLD);
  }
#endif
  std::vector<TableEntry> entries(total);
  for (std::size_t k = 0; k < total; ++k){
    TableEntry& e = entries[k];
    if (invalid[k] != 0.0) {
      // validation fails before any permanent is evaluated, so this is cheap
      e = evaluate_pair(U, inputs[k / nout], outputs[k % nout], method);
    } else {
      e.input = inputs[k / nout].label;
      e.output = outputs[k % nout].label;
      e.probability = prob[k];
    }
  }
  return ProbabilityTable(std::move(entries));
}

} // namespace linopt
