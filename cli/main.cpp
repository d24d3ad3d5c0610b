// SPDX-License-Identifier: MIT

#include "linopt/analyzer.hpp"
#include "linopt/config.hpp"
#include "linopt/gadgets.hpp"
#include "linopt/unitary.hpp"
#include "mpi/distributed_analyzer.hpp"
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#ifndef LINOPT_VERSION
#define LINOPT_VERSION "unknown"
#endif

using namespace linopt;

namespace {

enum Exit { kOk = 0, kUsage = 2, kCircuit = 3, kIo = 4, kState = 5 };

void usage(){
  std::cout <<
    "linopt-sim [--version|--help] <command> [options]\n"
    "  run       --circuit <file.lop> [--input '|n0,..>'|--qubits 0101] [--encoding 'pairs=1:2;aux=0']\n"
    "            [--all-outputs] [--method ryser|glynn|naive] [--threads T] [--format text|csv|json]\n"
    "            [--out file] [--config file] [--verbose] [--mpi]\n"
    "  unitary   --circuit <file.lop> [--out unitary.csv] [--precision P]\n"
    "  amplitude --circuit <file.lop> --in '|..>' --out '|..>' [--method M]\n"
    "  gen       --order-finding [--out file.lop]\n"
    "Without --circuit, run/unitary/amplitude use the built-in order-finding demo.\n";
}

struct Loaded {
  Circuit circuit;
  std::optional<Encoding> encoding;
};

// Circuit from file, or the demo program (with its encoding) when path is empty.
std::optional<Loaded> load_circuit(const std::string& path, std::string& err){
  if (path.empty()){
    auto demo = gadgets::order_finding_demo();
    return Loaded{std::move(demo.circuit), std::move(demo.encoding)};
  }
  auto c = parse_circuit_file(path, err);
  if (!c) return std::nullopt;
  return Loaded{std::move(*c), std::nullopt};
}

int cmd_run(int argc, char** argv){
  std::string circuit_path, input, qubits, encoding_text, out_path, config_path;
  std::string method_s, format_s, threads_s;
  bool all_outputs = false, verbose = false, use_mpi = false;
  for (int i=2;i<argc;++i){
    std::string a=argv[i];
    auto nx=[&](const char* n)->std::optional<std::string>{ if(i+1>=argc){ std::cerr<<"Missing value for "<<n<<"\n"; return std::nullopt; } return std::string(argv[++i]); };
    std::optional<std::string> v;
    if(a=="--circuit") { if(!(v=nx("--circuit"))) return kUsage; circuit_path=*v; }
    else if(a=="--input") { if(!(v=nx("--input"))) return kUsage; input=*v; }
    else if(a=="--qubits") { if(!(v=nx("--qubits"))) return kUsage; qubits=*v; }
    else if(a=="--encoding") { if(!(v=nx("--encoding"))) return kUsage; encoding_text=*v; }
    else if(a=="--method") { if(!(v=nx("--method"))) return kUsage; method_s=*v; }
    else if(a=="--threads") { if(!(v=nx("--threads"))) return kUsage; threads_s=*v; }
    else if(a=="--format") { if(!(v=nx("--format"))) return kUsage; format_s=*v; }
    else if(a=="--out") { if(!(v=nx("--out"))) return kUsage; out_path=*v; }
    else if(a=="--config") { if(!(v=nx("--config"))) return kUsage; config_path=*v; }
    else if(a=="--all-outputs") all_outputs = true;
    else if(a=="--verbose") verbose = true;
    else if(a=="--mpi") use_mpi = true;
    else if(a=="--help"||a=="-h"){ usage(); return kOk; }
    else { std::cerr<<"Unknown arg: "<<a<<"\n"; return kUsage; }
  }

  // config file first, flags override
  RunConfig cfg;
  std::map<std::string,std::string> kv;
  if (!config_path.empty() && !load_config_kv(config_path, kv)) { std::cerr<<"Cannot read config: "<<config_path<<"\n"; return kIo; }
  if (!method_s.empty()) kv["method"] = method_s;
  if (!threads_s.empty()) kv["threads"] = threads_s;
  if (!format_s.empty()) kv["format"] = format_s;
  if (!encoding_text.empty()) kv["encoding"] = encoding_text;
  if (verbose) kv["verbose"] = "1";
  std::string err;
  if (!apply_config(kv, cfg, err)) { std::cerr<<err<<"\n"; return kUsage; }
  if (!input.empty() && !qubits.empty()) { std::cerr<<"Use either --input or --qubits\n"; return kUsage; }

  auto loaded = load_circuit(circuit_path, err);
  if (!loaded) { std::cerr<<err<<"\n"; return kCircuit; }
  Circuit& circ = loaded->circuit;
  if (!cfg.encoding.empty()){
    loaded->encoding = parse_encoding(cfg.encoding, circ.modes(), err);
    if (!loaded->encoding) { std::cerr<<err<<"\n"; return kCircuit; }
  }
  if (!loaded->encoding && !all_outputs) { std::cerr<<"Circuit file needs --encoding or --all-outputs\n"; return kUsage; }
  if (!loaded->encoding && input.empty()) { std::cerr<<"Without an encoding, --input is required\n"; return kUsage; }

  auto t0 = std::chrono::steady_clock::now();
  Unitary U;
  try {
    U = unitary_of(circ, cfg.tolerance);
  } catch (const Error& e) {
    std::cerr<<e.what()<<"\n"; return kCircuit;
  }
  if (cfg.verbose) std::cerr<<"modes="<<circ.modes()<<" components="<<circ.size()<<" unitarity_error="<<unitarity_error(U)<<"\n";

  std::vector<LabeledState> inputs, outputs;
  try {
    if (loaded->encoding){
      const auto& enc = *loaded->encoding;
      auto basis = label_qubit_states(enc, all_qubit_states(enc.num_qubits()));
      if (!qubits.empty()){
        QubitState q;
        for (char ch : qubits){
          if (ch!='0' && ch!='1') { std::cerr<<"--qubits expects 0/1 digits\n"; return kState; }
          q.push_back(ch=='1');
        }
        inputs = label_qubit_states(enc, {q});
      } else if (!input.empty()){
        auto f = parse_fock(input);
        auto q = enc.to_qubit(f);
        inputs.push_back({q ? qubit_to_string(*q) : fock_to_string(f), f});
      } else {
        inputs = basis;
      }
      if (!all_outputs) outputs = basis;
    } else {
      inputs = label_fock_states({parse_fock(input)});
    }
    if (all_outputs){
      // inputs of differing totals would need one enumeration each; use the first
      const auto& f = inputs.front().state;
      validate_fock(f, std::size_t(circ.modes()));
      const auto k = total_photons(f);
      if (k > std::int64_t(kMaxPermanentOrder)) { std::cerr<<"--all-outputs: "<<k<<" photons exceed the permanent order limit\n"; return kState; }
      outputs = label_fock_states(enumerate_fock_states(std::size_t(circ.modes()), k));
    }
  } catch (const InputError& e) {
    std::cerr<<e.what()<<"\n"; return kState;
  }

  AnalyzerOptions ao;
  ao.method = cfg.method;
  ao.threads = cfg.threads;
  ProbabilityTable table;
  int rank = 0;
  if (use_mpi){
    auto ctx = init_mpi();
    if (!ctx) { std::cerr<<"Built without MPI support (LINOPT_MPI)\n"; return kUsage; }
    rank = ctx->rank;
    table = distribution_mpi(U, inputs, outputs, *ctx, ao.method);
    finalize_mpi();
  } else {
    table = distribution(U, inputs, outputs, ao);
  }
  if (rank != 0) return kOk;
  auto t1 = std::chrono::steady_clock::now();
  if (cfg.verbose){
    std::chrono::duration<double> dt = t1 - t0;
    std::cerr<<"pairs="<<table.size()<<" invalid="<<table.invalid_count()<<" method="<<method_name(cfg.method)
             <<" elapsed="<<dt.count()<<"s\n";
  }

  std::ofstream file;
  if (!out_path.empty()){
    file.open(out_path);
    if (!file) { std::cerr<<"Cannot write output: "<<out_path<<"\n"; return kIo; }
  }
  std::ostream& os = out_path.empty() ? std::cout : file;
  switch (cfg.format){
    case TableFormat::Text: write_table_text(os, table); break;
    case TableFormat::Csv: write_table_csv(os, table); break;
    case TableFormat::Json: write_table_json(os, table); break;
  }
  if (!os) { std::cerr<<"Write failed\n"; return kIo; }
  return kOk;
}

int cmd_unitary(int argc, char** argv){
  std::string circuit_path, out_path;
  int precision = 4;
  for (int i=2;i<argc;++i){
    std::string a=argv[i];
    if(a=="--circuit" && i+1<argc) circuit_path=argv[++i];
    else if(a=="--out" && i+1<argc) out_path=argv[++i];
    else if(a=="--precision" && i+1<argc) {
      try { precision=std::stoi(argv[++i]); }
      catch (const std::exception&) { std::cerr<<"Invalid --precision\n"; return kUsage; }
    }
    else if(a=="--help"||a=="-h"){ std::cout<<"linopt-sim unitary --circuit <file.lop> [--out unitary.csv] [--precision P]\n"; return kOk; }
    else { std::cerr<<"Unknown or incomplete arg: "<<a<<"\n"; return kUsage; }
  }
  std::string err;
  auto loaded = load_circuit(circuit_path, err);
  if (!loaded) { std::cerr<<err<<"\n"; return kCircuit; }
  Unitary U;
  try { U = unitary_of(loaded->circuit); }
  catch (const Error& e) { std::cerr<<e.what()<<"\n"; return kCircuit; }
  if (!out_path.empty()){
    if (!export_unitary_csv(U, out_path)) { std::cerr<<"Failed to export unitary\n"; return kIo; }
    return kOk;
  }
  std::cout<<format_unitary(U, precision);
  return kOk;
}

int cmd_amplitude(int argc, char** argv){
  std::string circuit_path, in_s, out_s, method_s = "ryser";
  for (int i=2;i<argc;++i){
    std::string a=argv[i];
    if(a=="--circuit" && i+1<argc) circuit_path=argv[++i];
    else if(a=="--in" && i+1<argc) in_s=argv[++i];
    else if(a=="--out" && i+1<argc) out_s=argv[++i];
    else if(a=="--method" && i+1<argc) method_s=argv[++i];
    else if(a=="--help"||a=="-h"){ std::cout<<"linopt-sim amplitude --circuit <file.lop> --in '|..>' --out '|..>' [--method M]\n"; return kOk; }
    else { std::cerr<<"Unknown or incomplete arg: "<<a<<"\n"; return kUsage; }
  }
  if (in_s.empty() || out_s.empty()) { std::cerr<<"Missing --in or --out\n"; return kUsage; }
  PermanentMethod method;
  if (!parse_method(method_s, method)) { std::cerr<<"Unknown method '"<<method_s<<"'\n"; return kUsage; }
  std::string err;
  auto loaded = load_circuit(circuit_path, err);
  if (!loaded) { std::cerr<<err<<"\n"; return kCircuit; }
  try {
    auto U = unitary_of(loaded->circuit);
    auto a = amplitude(U, parse_fock(in_s), parse_fock(out_s), method);
    std::cout<<std::setprecision(10)<<"amplitude="<<a.real()<<(a.imag()<0?"-":"+")<<std::abs(a.imag())<<"i"
             <<" probability="<<std::norm(a)<<"\n";
  } catch (const InputError& e) {
    std::cerr<<e.what()<<"\n"; return kState;
  } catch (const Error& e) {
    std::cerr<<e.what()<<"\n"; return kCircuit;
  }
  return kOk;
}

int cmd_gen(int argc, char** argv){
  std::string out_path, kind;
  for (int i=2;i<argc;++i){
    std::string a=argv[i];
    if(a=="--order-finding") kind="order-finding";
    else if(a=="--out" && i+1<argc) out_path=argv[++i];
    else if(a=="--help"||a=="-h"){ std::cout<<"linopt-sim gen --order-finding [--out file.lop]\n"; return kOk; }
    else { std::cerr<<"Unknown arg: "<<a<<"\n"; return kUsage; }
  }
  if (kind.empty()) { std::cerr<<"Choose --order-finding\n"; return kUsage; }
  auto demo = gadgets::order_finding_demo();
  std::string text = "# Order-finding demo: qubits x1=(1,2) x2=(3,4) f1=(7,8) f2=(9,10), aux 0,5,6,11\n"
                     "# encoding: pairs=1:2,3:4,7:8,9:10;aux=0,5,6,11\n" + to_circuit_text(demo.circuit);
  if (out_path.empty()) { std::cout<<text; return kOk; }
  std::ofstream out(out_path);
  if (!out) { std::cerr<<"Cannot write output\n"; return kIo; }
  out<<text;
  return out ? kOk : kIo;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 2) { usage(); return kUsage; }
  std::string first = argv[1];
  if (first == "--version") { std::cout << LINOPT_VERSION << "\n"; return kOk; }
  if (first == "--help" || first == "-h") { usage(); return kOk; }
  if (first == "run") return cmd_run(argc, argv);
  if (first == "unitary") return cmd_unitary(argc, argv);
  if (first == "amplitude") return cmd_amplitude(argc, argv);
  if (first == "gen") return cmd_gen(argc, argv);
  std::cerr << "Unknown command: " << first << "\n";
  usage();
  return kUsage;
}
