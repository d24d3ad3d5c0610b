// SPDX-License-Identifier: MIT

#include "linopt/fock.hpp"
#include <cctype>
#include <limits>
#include <numeric>
#include <sstream>

namespace linopt {

void validate_fock(const FockState& f, std::size_t modes){
  if (f.size() != modes)
    throw InputError("Fock state " + fock_to_string(f) + " has " + std::to_string(f.size()) +
                     " modes, expected " + std::to_string(modes));
  for (std::size_t i=0;i<f.size();++i)
    if (f[i] < 0) throw InputError("Negative occupation in mode " + std::to_string(i) + " of " + fock_to_string(f));
}

std::int64_t total_photons(const FockState& f){
  return std::accumulate(f.begin(), f.end(), std::int64_t(0));
}

std::string fock_to_string(const FockState& f){
  std::string s = "|";
  for (std::size_t i=0;i<f.size();++i){
    if (i) s += ",";
    s += std::to_string(f[i]);
  }
  return s + ">";
}

FockState parse_fock(const std::string& s){
  std::string body;
  for (char ch : s){
    if (std::isspace(static_cast<unsigned char>(ch)) || ch=='|' || ch=='>' || ch=='<') continue;
    body.push_back(ch);
  }
  FockState f;
  if (body.empty()) return f;
  std::istringstream ss(body);
  std::string tok;
  while (std::getline(ss, tok, ',')){
    if (tok.empty() || tok.find_first_not_of("0123456789") != std::string::npos)
      throw InputError("Malformed Fock state '" + s + "'");
    try {
      f.push_back(std::stoi(tok));
    } catch (const std::out_of_range&) {
      throw InputError("Occupation out of range in '" + s + "'");
    }
  }
  if (body.back() == ',') throw InputError("Malformed Fock state '" + s + "'");
  return f;
}

static void enumerate_rec(std::size_t mode, int left, FockState& cur, std::vector<FockState>& out){
  if (mode + 1 == cur.size()){
    cur[mode] = left;
    out.push_back(cur);
    return;
  }
  for (int k = left; k >= 0; --k){
    cur[mode] = k;
    enumerate_rec(mode + 1, left - k, cur, out);
  }
}

std::vector<FockState> enumerate_fock_states(std::size_t modes, std::int64_t photons){
  std::vector<FockState> out;
  if (photons < 0) throw InputError("Negative photon count");
  if (photons > std::numeric_limits<int>::max())
    throw InputError("Photon count " + std::to_string(photons) + " does not fit a mode occupation");
  if (modes == 0){
    if (photons == 0) out.push_back({});
    return out;
  }
  FockState cur(modes, 0);
  enumerate_rec(0, int(photons), cur, out);
  return out;
}

} // namespace linopt
