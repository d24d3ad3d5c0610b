// SPDX-License-Identifier: MIT

#include "linopt/unitary.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace linopt {

static Matrix matmul(const Matrix& A, const Matrix& B){
  const std::size_t d = A.rows;
  Matrix C(d, d);
  for (std::size_t i=0;i<d;i++)
    for (std::size_t k=0;k<d;k++){
      auto aik = A(i,k);
      if (aik == c64{0.0, 0.0}) continue;
      for (std::size_t j=0;j<d;j++)
        C(i,j) += aik * B(k,j);
    }
  return C;
}

// Identity outside the target modes, local matrix on the target submatrix.
static Matrix embed(const Matrix& local, const std::vector<int>& modes, std::size_t n){
  Matrix E = Matrix::identity(n);
  for (std::size_t a=0;a<modes.size();++a)
    for (std::size_t b=0;b<modes.size();++b)
      E(modes[a], modes[b]) = local(a, b);
  return E;
}

double unitarity_error(const Matrix& U){
  if (!U.square()) throw InputError("Unitarity check needs a square matrix");
  const std::size_t d = U.rows;
  double worst = 0.0;
  for (std::size_t i=0;i<d;i++)
    for (std::size_t j=0;j<d;j++){
      c64 s{0.0, 0.0};
      for (std::size_t k=0;k<d;k++) s += U(i,k) * std::conj(U(j,k));
      if (i == j) s -= 1.0;
      worst = std::max(worst, std::abs(s));
    }
  return worst;
}

Unitary unitary_of(const Circuit& c, double tol){
  const std::size_t n = static_cast<std::size_t>(c.modes());
  Unitary U = Matrix::identity(n);
  std::size_t idx = 0;
  for (const auto& comp : c.components()){
    Matrix local = local_unitary(comp);
    double e = unitarity_error(local);
    if (e > tol){
      std::ostringstream os;
      os << "Component " << idx << " (" << describe(comp) << ") is not unitary: error " << e;
      throw ValidationError(os.str());
    }
    U = matmul(embed(local, target_modes(comp), n), U);
    ++idx;
  }
  double e = unitarity_error(U);
  if (e > tol){
    std::ostringstream os;
    os << "Composed matrix is not unitary: error " << e;
    throw ValidationError(os.str());
  }
  return U;
}

bool export_unitary_csv(const Unitary& U, const std::string& path){
  std::ofstream out(path);
  if (!out) return false;
  out << std::setprecision(17);
  for (std::size_t i=0;i<U.rows;i++){
    for (std::size_t j=0;j<U.cols;j++){
      auto z = U(i,j);
      out << std::real(z) << (std::imag(z) < 0 ? "-" : "+") << std::fabs(std::imag(z)) << "i";
      if (j+1<U.cols) out << ",";
    }
    out << "\n";
  }
  return bool(out);
}

static std::string format_cell(c64 z, int precision){
  const double eps = 0.5 * std::pow(10.0, -precision);
  double re = std::fabs(z.real()) < eps ? 0.0 : z.real();
  double im = std::fabs(z.imag()) < eps ? 0.0 : z.imag();
  std::ostringstream os;
  os << std::setprecision(precision);
  if (im == 0.0) { os << re; return os.str(); }
  if (re == 0.0) { os << im << "i"; return os.str(); }
  os << re << (im < 0 ? "-" : "+") << std::fabs(im) << "i";
  return os.str();
}

std::string format_unitary(const Unitary& U, int precision){
  std::vector<std::string> cells(U.data.size());
  std::size_t width = 1;
  for (std::size_t k=0;k<cells.size();++k){
    cells[k] = format_cell(U.data[k], precision);
    width = std::max(width, cells[k].size());
  }
  std::ostringstream os;
  for (std::size_t i=0;i<U.rows;i++){
    os << "[";
    for (std::size_t j=0;j<U.cols;j++){
      os << std::setw(int(width)) << cells[i*U.cols+j];
      if (j+1<U.cols) os << "  ";
    }
    os << "]\n";
  }
  return os.str();
}

} // namespace linopt
