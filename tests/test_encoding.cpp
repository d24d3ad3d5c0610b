// SPDX-License-Identifier: MIT

#include "linopt/encoding.hpp"
#include "linopt/fock.hpp"
#include <climits>
#include <iostream>
#include <set>

using namespace linopt;

static int fails=0;
#define CHECK(x) do{ if (!(x)) { std::cerr << "CHECK failed at " << __LINE__ << ": " #x "\n"; ++fails; } }while(0)
#define CHECK_THROW(stmt, E) do{ bool thrown=false; try { stmt; } catch (const E&) { thrown=true; } if (!thrown) { std::cerr << "CHECK_THROW failed at " << __LINE__ << ": " #stmt "\n"; ++fails; } }while(0)

int main(){
  Encoding enc(12, {{1,2},{3,4},{7,8},{9,10}}, {0,5,6,11});
  CHECK(enc.num_qubits() == 4);

  CHECK(enc.to_fock({false,false,false,true}) == (FockState{0,1,0,1,0,0,0,1,0,0,1,0}));

  // Round trip over the full qubit space, and no two states share a Fock encoding
  std::set<FockState> seen;
  auto states = all_qubit_states(4);
  CHECK(states.size() == 16);
  CHECK(qubit_to_string(states.front()) == "|0,0,0,0>");
  CHECK(qubit_to_string(states[1]) == "|0,0,0,1>");
  for (const auto& q : states){
    auto f = enc.to_fock(q);
    CHECK(total_photons(f) == 4);
    auto back = enc.to_qubit(f);
    CHECK(back.has_value() && *back == q);
    CHECK(seen.insert(f).second);
  }

  // Invalid encodings are reported as nullopt
  CHECK(!enc.to_qubit({1,1,0,1,0,0,0,1,0,0,1,0}).has_value());  // aux 0 occupied
  CHECK(!enc.to_qubit({0,1,1,1,0,0,0,1,0,0,1,0}).has_value());  // x1 pair holds two photons
  CHECK(!enc.to_qubit({0,0,0,1,0,0,0,1,0,0,1,0}).has_value());  // x1 pair empty
  CHECK(!enc.to_qubit({0,2,0,0,0,0,0,1,0,0,1,0}).has_value());  // bunched in one rail

  // Large occupations are rejected without summing them
  CHECK(!enc.to_qubit({0,INT_MAX,1,1,0,0,0,1,0,0,1,0}).has_value());
  CHECK(!enc.to_qubit({0,INT_MAX,INT_MAX,1,0,0,0,1,0,0,1,0}).has_value());
  CHECK(total_photons({INT_MAX,1}) == std::int64_t(INT_MAX) + 1);

  CHECK(all_qubit_states(0).size() == 1);
  CHECK_THROW(all_qubit_states(64), InputError);
  CHECK_THROW(all_qubit_states(200), InputError);

  // Shape errors are exceptions
  CHECK_THROW(enc.to_fock({true,false}), InputError);
  CHECK_THROW(enc.to_qubit({0,1,0}), InputError);
  CHECK_THROW(enc.to_qubit({0,1,0,1,0,0,0,1,0,0,1,-1}), InputError);

  CHECK_THROW(Encoding(4, {{0,1},{1,2}}, {}), ConfigurationError);
  CHECK_THROW(Encoding(4, {{0,1}}, {4}), ConfigurationError);
  CHECK_THROW(Encoding(4, {{0,1}}, {1}), ConfigurationError);

  std::string err;
  auto parsed = parse_encoding("pairs=1:2, 3:4; aux=0,5", 6, err);
  CHECK(parsed.has_value());
  if (parsed){
    CHECK(parsed->qubit_modes().size() == 2 && parsed->qubit_modes()[1].second == 4);
    CHECK(parsed->aux_modes().size() == 2);
  }
  CHECK(!parse_encoding("pairs=1-2", 6, err).has_value());
  CHECK(!parse_encoding("pairs=1:2;aux=9", 6, err).has_value() && err.find("out of range") != std::string::npos);
  CHECK(!parse_encoding("rails=1:2", 6, err).has_value());

  if (fails==0) std::cout << "OK\n";
  return fails==0?0:1;
}
