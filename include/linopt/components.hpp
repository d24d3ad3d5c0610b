// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include "errors.hpp"
#include <cmath>
#include <numbers>
#include <string>
#include <variant>

namespace linopt::components {
  // Core 2x2 matrices, c = cos(theta), s = sin(theta), reflectivity R = c^2.
  inline void bs_rx_coeffs(double theta, c64& u00, c64& u01, c64& u10, c64& u11) {
    double c = std::cos(theta), s = std::sin(theta);
    u00 = {c,0}; u01 = {0,s}; u10 = {0,s}; u11 = {c,0};
  }
  inline void bs_ry_coeffs(double theta, c64& u00, c64& u01, c64& u10, c64& u11) {
    double c = std::cos(theta), s = std::sin(theta);
    u00 = {c,0}; u01 = {-s,0}; u10 = {s,0}; u11 = {c,0};
  }
  inline void bs_h_coeffs(double theta, c64& u00, c64& u01, c64& u10, c64& u11) {
    double c = std::cos(theta), s = std::sin(theta);
    u00 = {c,0}; u01 = {s,0}; u10 = {s,0}; u11 = {-c,0};
  }
  inline void ps_coeffs(double phi, c64& u) {
    u = std::polar(1.0, phi);
  }
}

namespace linopt {

enum class BSConvention { Rx, Ry, H };

std::string convention_name(BSConvention c);
// Accepts "Rx", "RX", "rx", ... Returns false on unknown names.
bool parse_convention(const std::string& s, BSConvention& out);

// Two-mode beam splitter acting on (mode_a, mode_b). The local matrix is
//   diag(e^{i phi_tr}, e^{i phi_br}) * core(theta) * diag(e^{i phi_tl}, e^{i phi_bl})
// with row/column 0 = mode_a and 1 = mode_b.
struct BeamSplitter {
  int mode_a;
  int mode_b;
  double theta;
  BSConvention convention;
  double phi_tl, phi_bl, phi_tr, phi_br;

  BeamSplitter(int a, int b, double theta, BSConvention conv = BSConvention::Rx,
               double phi_tl = 0.0, double phi_bl = 0.0, double phi_tr = 0.0, double phi_br = 0.0);

  static BeamSplitter from_reflectivity(int a, int b, double R, BSConvention conv = BSConvention::Rx);

  double reflectivity() const { double c = std::cos(theta); return c*c; }
};

struct PhaseShifter {
  int mode;
  double phi;

  PhaseShifter(int mode, double phi);
};

using Component = std::variant<BeamSplitter, PhaseShifter>;

// Local matrix on the component's target modes: 2x2 for a beam splitter,
// 1x1 for a phase shifter.
Matrix local_unitary(const Component& c);

// Target modes in local-matrix order.
std::vector<int> target_modes(const Component& c);

std::string describe(const Component& c);

} // namespace linopt
