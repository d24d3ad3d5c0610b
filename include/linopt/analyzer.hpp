// SPDX-License-Identifier: MIT

#pragma once
#include "circuit.hpp"
#include "encoding.hpp"
#include "permanent.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace linopt {

struct LabeledState {
  std::string label;
  FockState state;
};

struct TableEntry {
  std::string input;
  std::string output;
  double probability = 0.0;
  bool valid = true;
  std::string error; // set when !valid
};

// Post-selected transition probabilities, input-major then output order.
// Rows are not renormalized.
class ProbabilityTable {
  std::vector<TableEntry> entries_;

public:
  ProbabilityTable() = default;
  explicit ProbabilityTable(std::vector<TableEntry> entries) : entries_(std::move(entries)) {}

  const std::vector<TableEntry>& entries() const { return entries_; }
  std::size_t size() const { return entries_.size(); }
  const TableEntry* find(const std::string& input, const std::string& output) const;
  // Sum over valid entries of one input label.
  double row_total(const std::string& input) const;
  std::size_t invalid_count() const;
};

struct AnalyzerOptions {
  PermanentMethod method = PermanentMethod::Ryser;
  int threads = 0; // 0 = runtime default
};

// One table entry; an InputError from either state is recorded, not thrown.
TableEntry evaluate_pair(const Unitary& U, const LabeledState& in, const LabeledState& out, PermanentMethod method);

// Builds the circuit unitary once (throws ConfigurationError / ValidationError),
// then evaluates every (input, output) pair. A malformed state marks only its
// own entries invalid.
ProbabilityTable distribution(const Circuit& c, const std::vector<LabeledState>& inputs,
                              const std::vector<LabeledState>& outputs, const AnalyzerOptions& opts = {});
ProbabilityTable distribution(const Unitary& U, const std::vector<LabeledState>& inputs,
                              const std::vector<LabeledState>& outputs, const AnalyzerOptions& opts = {});

std::vector<LabeledState> label_qubit_states(const Encoding& enc, const std::vector<QubitState>& states);
std::vector<LabeledState> label_fock_states(const std::vector<FockState>& states);

void write_table_text(std::ostream& os, const ProbabilityTable& t);
void write_table_csv(std::ostream& os, const ProbabilityTable& t);
void write_table_json(std::ostream& os, const ProbabilityTable& t);

} // namespace linopt
