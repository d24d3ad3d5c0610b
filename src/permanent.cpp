// SPDX-License-Identifier: MIT

#include "linopt/permanent.hpp"
#include <algorithm>
#include <bit>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <numeric>

namespace linopt {

std::string method_name(PermanentMethod m){
  switch (m){
    case PermanentMethod::Ryser: return "ryser";
    case PermanentMethod::Glynn: return "glynn";
    case PermanentMethod::Naive: return "naive";
  }
  return "ryser";
}

bool parse_method(const std::string& s, PermanentMethod& out){
  std::string l = s;
  std::transform(l.begin(), l.end(), l.begin(), [](unsigned char ch){ return std::tolower(ch); });
  if (l == "ryser") { out = PermanentMethod::Ryser; return true; }
  if (l == "glynn") { out = PermanentMethod::Glynn; return true; }
  if (l == "naive") { out = PermanentMethod::Naive; return true; }
  return false;
}

// Ryser: perm(A) = (-1)^n sum_{S} (-1)^{|S|} prod_i sum_{j in S} a_ij,
// subsets visited in Gray-code order so each step adds or removes one column.
static c64 permanent_ryser(const Matrix& A){
  const std::size_t n = A.rows;
  vec_c64 rowsum(n, c64{0.0, 0.0});
  c64 total{0.0, 0.0};
  const std::uint64_t count = std::uint64_t(1) << n;
  std::uint64_t gray = 0;
  for (std::uint64_t k = 1; k < count; ++k){
    const int j = std::countr_zero(k);
    gray ^= std::uint64_t(1) << j;
    const bool added = (gray >> j) & 1;
    for (std::size_t i=0;i<n;++i){
      if (added) rowsum[i] += A(i, j);
      else rowsum[i] -= A(i, j);
    }
    c64 prod{1.0, 0.0};
    for (std::size_t i=0;i<n && prod != c64{0.0, 0.0};++i) prod *= rowsum[i];
    if (std::popcount(gray) & 1) total -= prod;
    else total += prod;
  }
  return (n & 1) ? -total : total;
}

// Glynn: perm(A) = 2^{1-n} sum_{delta, delta_0 = +1} (prod_k delta_k) prod_j sum_i delta_i a_ij.
static c64 permanent_glynn(const Matrix& A){
  const std::size_t n = A.rows;
  vec_c64 colsum(n, c64{0.0, 0.0});
  for (std::size_t i=0;i<n;++i)
    for (std::size_t j=0;j<n;++j) colsum[j] += A(i, j);
  auto prod_all = [&]{
    c64 p{1.0, 0.0};
    for (std::size_t j=0;j<n;++j) p *= colsum[j];
    return p;
  };
  c64 total = prod_all();
  const std::uint64_t count = std::uint64_t(1) << (n - 1);
  std::uint64_t gray = 0;
  int sign = 1;
  for (std::uint64_t k = 1; k < count; ++k){
    const int b = std::countr_zero(k);
    gray ^= std::uint64_t(1) << b;
    const std::size_t row = std::size_t(b) + 1;
    const double f = ((gray >> b) & 1) ? -2.0 : 2.0;
    for (std::size_t j=0;j<n;++j) colsum[j] += f * A(row, j);
    sign = -sign;
    if (sign > 0) total += prod_all();
    else total -= prod_all();
  }
  return total / std::ldexp(1.0, int(n) - 1);
}

static c64 permanent_naive(const Matrix& A){
  const std::size_t n = A.rows;
  std::vector<std::size_t> sigma(n);
  std::iota(sigma.begin(), sigma.end(), std::size_t(0));
  c64 total{0.0, 0.0};
  do {
    c64 p{1.0, 0.0};
    for (std::size_t i=0;i<n;++i) p *= A(i, sigma[i]);
    total += p;
  } while (std::next_permutation(sigma.begin(), sigma.end()));
  return total;
}

c64 permanent(const Matrix& M, PermanentMethod method){
  if (!M.square()) throw InputError("Permanent needs a square matrix");
  if (M.rows > kMaxPermanentOrder)
    throw InputError("Permanent order " + std::to_string(M.rows) + " exceeds " + std::to_string(kMaxPermanentOrder));
  if (M.rows == 0) return {1.0, 0.0};
  switch (method){
    case PermanentMethod::Ryser: return permanent_ryser(M);
    case PermanentMethod::Glynn: return permanent_glynn(M);
    case PermanentMethod::Naive: return permanent_naive(M);
  }
  return permanent_ryser(M);
}

static double factorial(int n){
  double f = 1.0;
  for (int k=2;k<=n;++k) f *= k;
  return f;
}

c64 amplitude(const Unitary& U, const FockState& input, const FockState& output, PermanentMethod method){
  if (!U.square()) throw InputError("Amplitude needs a square unitary");
  validate_fock(input, U.rows);
  validate_fock(output, U.rows);
  const std::int64_t k = total_photons(input);
  if (k != total_photons(output)) return {0.0, 0.0};
  if (k > std::int64_t(kMaxPermanentOrder))
    throw InputError(std::to_string(k) + " photons exceed the permanent order limit of " + std::to_string(kMaxPermanentOrder));

  // rows: output modes, columns: input modes, each repeated by occupation
  std::vector<std::size_t> rows, cols;
  rows.reserve(std::size_t(k)); cols.reserve(std::size_t(k));
  double norm = 1.0;
  for (std::size_t m=0;m<U.rows;++m){
    for (int r=0;r<output[m];++r) rows.push_back(m);
    for (int c=0;c<input[m];++c) cols.push_back(m);
    norm *= factorial(output[m]) * factorial(input[m]);
  }
  Matrix sub(rows.size(), cols.size());
  for (std::size_t a=0;a<rows.size();++a)
    for (std::size_t b=0;b<cols.size();++b)
      sub(a, b) = U(rows[a], cols[b]);
  return permanent(sub, method) / std::sqrt(norm);
}

double probability(const Unitary& U, const FockState& input, const FockState& output, PermanentMethod method){
  return std::norm(amplitude(U, input, output, method));
}

} // namespace linopt
