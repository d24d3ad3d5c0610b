// SPDX-License-Identifier: MIT

#include "linopt/circuit.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace linopt {

Circuit::Circuit(int modes) : modes_(modes) {
  if (modes < 0) throw ConfigurationError("Negative mode count: " + std::to_string(modes));
}

Circuit& Circuit::add(const Component& c){
  for (int m : target_modes(c)){
    if (m < 0 || m >= modes_)
      throw ConfigurationError("Mode " + std::to_string(m) + " out of range for " + std::to_string(modes_) + "-mode circuit");
  }
  components_.push_back(c);
  return *this;
}

Circuit build_circuit(int modes, const std::vector<ComponentSpec>& specs){
  Circuit c(modes);
  for (const auto& s : specs){
    if (s.kind == ComponentSpec::Kind::PhaseShifter){
      if (s.modes.size() != 1) throw ConfigurationError("Phase shifter needs exactly one mode");
      if (!s.phases.empty()) throw ConfigurationError("Phase shifter takes no extra phases");
      c.add(PhaseShifter(s.modes[0], s.angle));
    } else {
      if (s.modes.size() != 2) throw ConfigurationError("Beam splitter needs exactly two modes");
      if (!s.phases.empty() && s.phases.size() != 4) throw ConfigurationError("Beam splitter takes 0 or 4 phases");
      double p[4] = {0.0, 0.0, 0.0, 0.0};
      for (std::size_t i=0;i<s.phases.size();++i) p[i] = s.phases[i];
      c.add(BeamSplitter(s.modes[0], s.modes[1], s.angle, s.convention, p[0], p[1], p[2], p[3]));
    }
  }
  return c;
}

static bool parse_int(const std::string& s, int& out){
  if (s.empty()) return false;
  try {
    std::size_t pos=0;
    long v = std::stol(s, &pos, 10);
    if (pos != s.size()) return false;
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return false;
    out = static_cast<int>(v);
    return true;
  } catch (const std::invalid_argument&) { return false; }
    catch (const std::out_of_range&) { return false; }
}

static bool parse_double(const std::string& s, double& out){
  if (s.empty()) return false;
  try {
    std::size_t pos=0;
    out = std::stod(s, &pos);
    return pos == s.size();
  } catch (const std::invalid_argument&) { return false; }
    catch (const std::out_of_range&) { return false; }
}

std::optional<Circuit> parse_circuit_string(const std::string& text, std::string& err){
  std::istringstream in(text);
  std::optional<Circuit> c;
  std::string line;
  std::size_t lineno = 0;
  auto fail = [&](const std::string& msg){ err = msg + " at line " + std::to_string(lineno); return std::nullopt; };
  while (std::getline(in, line)) {
    ++lineno;
    // strip comments (# ...)
    auto hash = line.find('#');
    if (hash != std::string::npos) line = line.substr(0, hash);
    auto notspace = [](unsigned char ch){ return !std::isspace(ch); };
    auto l = std::find_if(line.begin(), line.end(), notspace);
    auto r = std::find_if(line.rbegin(), line.rend(), notspace).base();
    if (l >= r) continue;
    std::istringstream ss(std::string(l, r));
    std::string op;
    ss >> op;
    std::transform(op.begin(), op.end(), op.begin(), [](unsigned char ch){ return std::toupper(ch); });
    std::vector<std::string> args;
    for (std::string a; ss >> a;) args.push_back(a);

    try {
      if (op == "MODES") {
        int n;
        if (c) return fail("Duplicate MODES");
        if (args.size() != 1 || !parse_int(args[0], n)) return fail("Invalid MODES");
        c.emplace(n);
      } else if (op == "BS" || op == "BSR") {
        if (!c) return fail("MODES must precede components");
        int a, b; double v;
        if (args.size() < 3 || !parse_int(args[0], a) || !parse_int(args[1], b) || !parse_double(args[2], v))
          return fail("Invalid " + op);
        BSConvention conv = BSConvention::Rx;
        std::size_t next = 3;
        if (args.size() > next && parse_convention(args[next], conv)) ++next;
        double p[4] = {0.0, 0.0, 0.0, 0.0};
        std::size_t nphase = args.size() - next;
        if (nphase != 0 && nphase != 4) return fail("Beam splitter takes 0 or 4 phases");
        for (std::size_t i=0;i<nphase;++i)
          if (!parse_double(args[next+i], p[i])) return fail("Invalid phase");
        if (op == "BSR") {
          if (nphase != 0) return fail("BSR takes no phases");
          c->add(BeamSplitter::from_reflectivity(a, b, v, conv));
        } else {
          c->add(BeamSplitter(a, b, v, conv, p[0], p[1], p[2], p[3]));
        }
      } else if (op == "PS") {
        if (!c) return fail("MODES must precede components");
        int m; double phi;
        if (args.size() != 2 || !parse_int(args[0], m) || !parse_double(args[1], phi)) return fail("Invalid PS");
        c->add(PhaseShifter(m, phi));
      } else {
        return fail("Unknown op '" + op + "'");
      }
    } catch (const ConfigurationError& e) {
      return fail(e.what());
    }
  }
  if (!c) { err = "Missing MODES declaration"; return std::nullopt; }
  return c;
}

std::optional<Circuit> parse_circuit_file(const std::string& path, std::string& err){
  std::ifstream in(path);
  if (!in) { err = "Cannot open circuit file: " + path; return std::nullopt; }
  std::string txt((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return parse_circuit_string(txt, err);
}

std::string to_circuit_text(const Circuit& c){
  std::ostringstream os;
  os.precision(std::numeric_limits<double>::max_digits10);
  os << "MODES " << c.modes() << "\n";
  for (const auto& comp : c.components()){
    if (auto bs = std::get_if<BeamSplitter>(&comp)){
      os << "BS " << bs->mode_a << " " << bs->mode_b << " " << bs->theta << " " << convention_name(bs->convention);
      if (bs->phi_tl != 0.0 || bs->phi_bl != 0.0 || bs->phi_tr != 0.0 || bs->phi_br != 0.0)
        os << " " << bs->phi_tl << " " << bs->phi_bl << " " << bs->phi_tr << " " << bs->phi_br;
      os << "\n";
    } else {
      const auto& ps = std::get<PhaseShifter>(comp);
      os << "PS " << ps.mode << " " << ps.phi << "\n";
    }
  }
  return os.str();
}

} // namespace linopt
