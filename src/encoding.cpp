// SPDX-License-Identifier: MIT

#include "linopt/encoding.hpp"
#include "linopt/fock.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace linopt {

Encoding::Encoding(int modes, std::vector<std::pair<int,int>> qubit_modes, std::vector<int> aux_modes)
  : modes_(modes), qubits_(std::move(qubit_modes)), aux_(std::move(aux_modes)) {
  if (modes < 0) throw ConfigurationError("Negative mode count");
  std::vector<bool> used(std::size_t(modes), false);
  auto claim = [&](int m){
    if (m < 0 || m >= modes_) throw ConfigurationError("Encoding mode " + std::to_string(m) + " out of range");
    if (used[m]) throw ConfigurationError("Encoding mode " + std::to_string(m) + " used twice");
    used[m] = true;
  };
  for (auto [zero, one] : qubits_) { claim(zero); claim(one); }
  for (int m : aux_) claim(m);
}

FockState Encoding::to_fock(const QubitState& q) const {
  if (q.size() != qubits_.size())
    throw InputError("Qubit state " + qubit_to_string(q) + " has " + std::to_string(q.size()) +
                     " qubits, expected " + std::to_string(qubits_.size()));
  FockState f(std::size_t(modes_), 0);
  for (std::size_t i=0;i<q.size();++i)
    f[q[i] ? qubits_[i].second : qubits_[i].first] = 1;
  return f;
}

std::optional<QubitState> Encoding::to_qubit(const FockState& f) const {
  validate_fock(f, std::size_t(modes_));
  for (int m : aux_)
    if (f[m] != 0) return std::nullopt;
  QubitState q(qubits_.size(), false);
  for (std::size_t i=0;i<qubits_.size();++i){
    auto [zero, one] = qubits_[i];
    if (f[zero] > 1 || f[one] > 1 || f[zero] == f[one]) return std::nullopt;
    q[i] = f[one] == 1;
  }
  return q;
}

static bool parse_mode_list(const std::string& s, std::vector<int>& out){
  std::istringstream ss(s);
  std::string tok;
  while (std::getline(ss, tok, ',')){
    if (tok.empty() || tok.find_first_not_of("0123456789") != std::string::npos) return false;
    try { out.push_back(std::stoi(tok)); }
    catch (const std::out_of_range&) { return false; }
  }
  return true;
}

std::optional<Encoding> parse_encoding(const std::string& text, int modes, std::string& err){
  std::string body;
  for (char ch : text) if (!std::isspace(static_cast<unsigned char>(ch))) body.push_back(ch);
  std::vector<std::pair<int,int>> pairs;
  std::vector<int> aux;
  std::istringstream ss(body);
  std::string part;
  while (std::getline(ss, part, ';')){
    if (part.empty()) continue;
    auto eq = part.find('=');
    if (eq == std::string::npos) { err = "Expected key=value in encoding: '" + part + "'"; return std::nullopt; }
    std::string key = part.substr(0, eq), val = part.substr(eq+1);
    if (key == "pairs"){
      std::istringstream ps(val);
      std::string pr;
      while (std::getline(ps, pr, ',')){
        auto colon = pr.find(':');
        std::vector<int> zero, one;
        if (colon == std::string::npos || !parse_mode_list(pr.substr(0, colon), zero) || !parse_mode_list(pr.substr(colon+1), one)
            || zero.size() != 1 || one.size() != 1) {
          err = "Invalid qubit pair '" + pr + "'";
          return std::nullopt;
        }
        pairs.emplace_back(zero[0], one[0]);
      }
    } else if (key == "aux"){
      if (!val.empty() && !parse_mode_list(val, aux)) { err = "Invalid aux list '" + val + "'"; return std::nullopt; }
    } else {
      err = "Unknown encoding key '" + key + "'";
      return std::nullopt;
    }
  }
  try {
    return Encoding(modes, std::move(pairs), std::move(aux));
  } catch (const ConfigurationError& e) {
    err = e.what();
    return std::nullopt;
  }
}

std::string qubit_to_string(const QubitState& q){
  std::string s = "|";
  for (std::size_t i=0;i<q.size();++i){
    if (i) s += ",";
    s += q[i] ? '1' : '0';
  }
  return s + ">";
}

std::vector<QubitState> all_qubit_states(std::size_t n){
  if (n >= 64) throw InputError("Cannot enumerate 2^" + std::to_string(n) + " qubit states");
  std::vector<QubitState> out;
  const std::size_t count = std::size_t(1) << n;
  out.reserve(count);
  for (std::size_t k=0;k<count;++k){
    QubitState q(n, false);
    for (std::size_t i=0;i<n;++i) q[i] = (k >> (n - 1 - i)) & 1;
    out.push_back(q);
  }
  return out;
}

} // namespace linopt
