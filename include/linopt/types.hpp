// SPDX-License-Identifier: MIT

#pragma once
#include <complex>
#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>

namespace linopt {
  using c64 = std::complex<double>;
  using vec_c64 = std::vector<c64>;

  // Dense row-major complex matrix.
  struct Matrix {
    std::size_t rows = 0;
    std::size_t cols = 0;
    vec_c64 data;

    Matrix() = default;
    Matrix(std::size_t r, std::size_t c) : rows(r), cols(c), data(r*c, c64{0.0, 0.0}) {}

    static Matrix identity(std::size_t n){
      Matrix m(n, n);
      for (std::size_t i=0;i<n;i++) m.data[i*n+i] = {1.0, 0.0};
      return m;
    }

    c64& operator()(std::size_t r, std::size_t c) { return data[r*cols + c]; }
    const c64& operator()(std::size_t r, std::size_t c) const { return data[r*cols + c]; }
    bool square() const { return rows == cols; }
  };

  // Global mode-space unitary of a circuit (N x N).
  using Unitary = Matrix;

  using FockState = std::vector<int>;
  using QubitState = std::vector<bool>;
}
