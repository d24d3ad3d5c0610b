// SPDX-License-Identifier: MIT

#include "linopt/c_api.h"
#include "linopt/analyzer.hpp"
#include "linopt/unitary.hpp"
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>

namespace {

std::string get_kv(const std::string& js, const std::string& k){
  auto p = js.find(k);
  if (p==std::string::npos) return "";
  p = js.find(':', p);
  if (p==std::string::npos) return "";
  auto q = js.find_first_not_of(" \t\r\n", p+1);
  if (q==std::string::npos) return "";
  if (js[q]=='"'){ auto e = js.find('"', q+1); return js.substr(q+1, e-q-1); }
  auto e = js.find_first_of(",}\n", q);
  return js.substr(q, e-q);
}

char* to_c_string(const std::string& js){
  char* buf = static_cast<char*>(std::malloc(js.size()+1));
  if (!buf) return nullptr;
  std::memcpy(buf, js.data(), js.size()); buf[js.size()]='\0';
  return buf;
}

} // namespace

extern "C" {

int linopt_distribution_string(const char* circuit_text, const char* options_json, char** out_json){
  if (!circuit_text || !out_json) return 2;
  std::string err;
  auto circ = linopt::parse_circuit_string(circuit_text, err);
  if (!circ) return 3;
  std::string opts = options_json ? options_json : "";

  linopt::AnalyzerOptions ao;
  if (auto m = get_kv(opts, "\"method\""); !m.empty() && !linopt::parse_method(m, ao.method)) return 2;
  if (auto t = get_kv(opts, "\"threads\""); !t.empty()){
    char* end = nullptr;
    long v = std::strtol(t.c_str(), &end, 10);
    if (*end != '\0' || v < 0) return 2;
    ao.threads = int(v);
  }
  std::string enc_text = get_kv(opts, "\"encoding\"");
  std::string input_text = get_kv(opts, "\"input\"");
  if (enc_text.empty() && input_text.empty()) return 2;

  try {
    auto U = linopt::unitary_of(*circ);
    std::vector<linopt::LabeledState> inputs, outputs;
    if (!enc_text.empty()){
      auto enc = linopt::parse_encoding(enc_text, circ->modes(), err);
      if (!enc) return 3;
      outputs = linopt::label_qubit_states(*enc, linopt::all_qubit_states(enc->num_qubits()));
      if (input_text.empty()) inputs = outputs;
    }
    if (!input_text.empty()){
      auto f = linopt::parse_fock(input_text);
      linopt::validate_fock(f, std::size_t(circ->modes()));
      inputs = linopt::label_fock_states({f});
      if (outputs.empty()){
        const auto k = linopt::total_photons(f);
        if (k > std::int64_t(linopt::kMaxPermanentOrder))
          throw linopt::InputError("Input " + linopt::fock_to_string(f) + " has too many photons to enumerate outputs");
        outputs = linopt::label_fock_states(linopt::enumerate_fock_states(std::size_t(circ->modes()), k));
      }
    }
    auto table = linopt::distribution(U, inputs, outputs, ao);
    std::ostringstream os;
    linopt::write_table_json(os, table);
    *out_json = to_c_string(os.str());
    return *out_json ? 0 : 2;
  } catch (const linopt::InputError&) {
    return 5;
  } catch (const linopt::Error&) {
    return 3;
  }
}

int linopt_distribution_file(const char* filepath, const char* options_json, char** out_json){
  if (!filepath) return 2;
  std::ifstream in(filepath, std::ios::binary);
  if (!in) return 3;
  std::string txt((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return linopt_distribution_string(txt.c_str(), options_json, out_json);
}

void linopt_free(char* p){ if (p) std::free(p); }

const char* linopt_version(void){
#ifdef LINOPT_VERSION
  return LINOPT_VERSION;
#else
  return "unknown";
#endif
}

} // extern "C"
