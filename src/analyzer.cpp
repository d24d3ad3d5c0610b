// SPDX-License-Identifier: MIT

#include "linopt/analyzer.hpp"
#include "linopt/unitary.hpp"
#include <algorithm>
#include <iomanip>
#include <ostream>
#include <sstream>
#ifdef LINOPT_OPENMP
#include <omp.h>
#endif

namespace linopt {

const TableEntry* ProbabilityTable::find(const std::string& input, const std::string& output) const {
  for (const auto& e : entries_)
    if (e.input == input && e.output == output) return &e;
  return nullptr;
}

double ProbabilityTable::row_total(const std::string& input) const {
  double s = 0.0;
  for (const auto& e : entries_)
    if (e.valid && e.input == input) s += e.probability;
  return s;
}

std::size_t ProbabilityTable::invalid_count() const {
  return std::size_t(std::count_if(entries_.begin(), entries_.end(), [](const TableEntry& e){ return !e.valid; }));
}

TableEntry evaluate_pair(const Unitary& U, const LabeledState& in, const LabeledState& out, PermanentMethod method){
  TableEntry e;
  e.input = in.label;
  e.output = out.label;
  try {
    e.probability = probability(U, in.state, out.state, method);
  } catch (const InputError& err) {
    e.valid = false;
    e.error = err.what();
  }
  return e;
}

ProbabilityTable distribution(const Circuit& c, const std::vector<LabeledState>& inputs,
                              const std::vector<LabeledState>& outputs, const AnalyzerOptions& opts){
  return distribution(unitary_of(c), inputs, outputs, opts);
}

ProbabilityTable distribution(const Unitary& U, const std::vector<LabeledState>& inputs,
                              const std::vector<LabeledState>& outputs, const AnalyzerOptions& opts){
  const std::size_t nout = outputs.size();
  const long long total = static_cast<long long>(inputs.size() * nout);
  std::vector<TableEntry> entries(static_cast<std::size_t>(total));
#ifdef LINOPT_OPENMP
  const int nt = opts.threads > 0 ? opts.threads : omp_get_max_threads();
#pragma omp parallel for schedule(dynamic) num_threads(nt)
#endif
  for (long long k = 0; k < total; ++k) {
    entries[std::size_t(k)] = evaluate_pair(U, inputs[std::size_t(k) / nout], outputs[std::size_t(k) % nout], opts.method);
  }
  return ProbabilityTable(std::move(entries));
}

std::vector<LabeledState> label_qubit_states(const Encoding& enc, const std::vector<QubitState>& states){
  std::vector<LabeledState> out;
  out.reserve(states.size());
  for (const auto& q : states) out.push_back({qubit_to_string(q), enc.to_fock(q)});
  return out;
}

std::vector<LabeledState> label_fock_states(const std::vector<FockState>& states){
  std::vector<LabeledState> out;
  out.reserve(states.size());
  for (const auto& f : states) out.push_back({fock_to_string(f), f});
  return out;
}

// Each writer formats into its own buffer so the caller's stream state is left alone.
void write_table_text(std::ostream& out, const ProbabilityTable& t){
  std::ostringstream os;
  std::size_t wi = 5, wo = 6;
  for (const auto& e : t.entries()) { wi = std::max(wi, e.input.size()); wo = std::max(wo, e.output.size()); }
  os << std::left << std::setw(int(wi)) << "input" << "  " << std::setw(int(wo)) << "output" << "  probability\n";
  for (const auto& e : t.entries()){
    os << std::left << std::setw(int(wi)) << e.input << "  " << std::setw(int(wo)) << e.output << "  ";
    if (e.valid) os << std::setprecision(6) << e.probability << "\n";
    else os << "invalid (" << e.error << ")\n";
  }
  out << os.str();
}

static std::string csv_quote(const std::string& s){
  std::string q = "\"";
  for (char ch : s){ if (ch == '"') q += '"'; q += ch; }
  return q + "\"";
}

void write_table_csv(std::ostream& out, const ProbabilityTable& t){
  std::ostringstream os;
  os << "input,output,probability,error\n";
  for (const auto& e : t.entries()){
    os << csv_quote(e.input) << "," << csv_quote(e.output) << ",";
    if (e.valid) os << std::setprecision(17) << e.probability << ",\n";
    else os << "invalid," << csv_quote(e.error) << "\n";
  }
  out << os.str();
}

static std::string json_escape(const std::string& s){
  std::string o;
  for (char ch : s){
    switch (ch){
      case '"': o += "\\\""; break;
      case '\\': o += "\\\\"; break;
      case '\n': o += "\\n"; break;
      default: o += ch;
    }
  }
  return o;
}

void write_table_json(std::ostream& out, const ProbabilityTable& t){
  std::ostringstream os;
  os << "{\n  \"entries\": [\n";
  const auto& es = t.entries();
  for (std::size_t i=0;i<es.size();++i){
    const auto& e = es[i];
    os << "    {\"input\": \"" << json_escape(e.input) << "\", \"output\": \"" << json_escape(e.output) << "\", ";
    if (e.valid) os << "\"probability\": " << std::setprecision(17) << e.probability;
    else os << "\"probability\": null, \"error\": \"" << json_escape(e.error) << "\"";
    os << "}" << (i+1<es.size() ? "," : "") << "\n";
  }
  os << "  ],\n  \"invalid\": " << t.invalid_count() << "\n}\n";
  out << os.str();
}

} // namespace linopt
