// SPDX-License-Identifier: MIT

#include "linopt/permanent.hpp"
#include <chrono>
#include <cmath>
#include <iostream>

using namespace linopt;

int main(){
  for (std::size_t n : {8, 12, 16, 20}){
    Matrix m(n, n);
    for (std::size_t i=0;i<n;++i)
      for (std::size_t j=0;j<n;++j) m(i,j) = std::polar(1.0/std::sqrt(double(n)), 0.37*double(i*j+1));
    for (auto method : {PermanentMethod::Ryser, PermanentMethod::Glynn}){
      auto t0 = std::chrono::steady_clock::now();
      auto p = permanent(m, method);
      auto t1 = std::chrono::steady_clock::now();
      std::chrono::duration<double> dt = t1 - t0;
      std::cout << "n=" << n << " " << method_name(method) << " |perm|=" << std::abs(p)
                << " elapsed seconds: " << dt.count() << "\n";
    }
  }
  return 0;
}
