// SPDX-License-Identifier: MIT

#include "linopt/components.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace linopt {

static void check_finite(double v, const char* what){
  if (!std::isfinite(v)) throw ConfigurationError(std::string("Non-finite ") + what);
}

std::string convention_name(BSConvention c){
  switch (c){
    case BSConvention::Rx: return "Rx";
    case BSConvention::Ry: return "Ry";
    case BSConvention::H: return "H";
  }
  return "Rx";
}

bool parse_convention(const std::string& s, BSConvention& out){
  std::string l = s;
  std::transform(l.begin(), l.end(), l.begin(), [](unsigned char ch){ return std::tolower(ch); });
  if (l == "rx") { out = BSConvention::Rx; return true; }
  if (l == "ry") { out = BSConvention::Ry; return true; }
  if (l == "h")  { out = BSConvention::H;  return true; }
  return false;
}

BeamSplitter::BeamSplitter(int a, int b, double theta_, BSConvention conv,
                           double tl, double bl, double tr, double br)
  : mode_a(a), mode_b(b), theta(theta_), convention(conv), phi_tl(tl), phi_bl(bl), phi_tr(tr), phi_br(br) {
  if (a < 0 || b < 0) throw ConfigurationError("Negative beam splitter mode");
  if (a == b) throw ConfigurationError("Beam splitter modes must differ (both " + std::to_string(a) + ")");
  check_finite(theta, "beam splitter angle");
  if (std::fabs(theta) > 2*std::numbers::pi) throw ConfigurationError("Beam splitter angle outside [-2pi, 2pi]");
  check_finite(tl, "phase phi_tl"); check_finite(bl, "phase phi_bl");
  check_finite(tr, "phase phi_tr"); check_finite(br, "phase phi_br");
}

BeamSplitter BeamSplitter::from_reflectivity(int a, int b, double R, BSConvention conv){
  if (!(R >= 0.0 && R <= 1.0)) throw ConfigurationError("Reflectivity outside [0, 1]");
  return BeamSplitter(a, b, std::acos(std::sqrt(R)), conv);
}

PhaseShifter::PhaseShifter(int m, double p) : mode(m), phi(p) {
  if (m < 0) throw ConfigurationError("Negative phase shifter mode");
  check_finite(p, "phase");
}

Matrix local_unitary(const Component& comp){
  using namespace linopt::components;
  struct Visitor {
    Matrix operator()(const BeamSplitter& bs) const {
      c64 u00,u01,u10,u11;
      switch (bs.convention){
        case BSConvention::Rx: bs_rx_coeffs(bs.theta,u00,u01,u10,u11); break;
        case BSConvention::Ry: bs_ry_coeffs(bs.theta,u00,u01,u10,u11); break;
        case BSConvention::H:  bs_h_coeffs(bs.theta,u00,u01,u10,u11); break;
      }
      // output phases on rows, input phases on columns
      const c64 tl = std::polar(1.0, bs.phi_tl), bl = std::polar(1.0, bs.phi_bl);
      const c64 tr = std::polar(1.0, bs.phi_tr), br = std::polar(1.0, bs.phi_br);
      Matrix m(2, 2);
      m(0,0) = tr*u00*tl; m(0,1) = tr*u01*bl;
      m(1,0) = br*u10*tl; m(1,1) = br*u11*bl;
      return m;
    }
    Matrix operator()(const PhaseShifter& ps) const {
      Matrix m(1, 1);
      ps_coeffs(ps.phi, m(0,0));
      return m;
    }
  };
  return std::visit(Visitor{}, comp);
}

std::vector<int> target_modes(const Component& comp){
  if (auto bs = std::get_if<BeamSplitter>(&comp)) return {bs->mode_a, bs->mode_b};
  return {std::get<PhaseShifter>(comp).mode};
}

std::string describe(const Component& comp){
  std::ostringstream os;
  if (auto bs = std::get_if<BeamSplitter>(&comp)){
    os << "BS(" << bs->mode_a << "," << bs->mode_b << ") theta=" << bs->theta
       << " R=" << bs->reflectivity() << " " << convention_name(bs->convention);
  } else {
    const auto& ps = std::get<PhaseShifter>(comp);
    os << "PS(" << ps.mode << ") phi=" << ps.phi;
  }
  return os.str();
}

} // namespace linopt
