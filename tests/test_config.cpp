// SPDX-License-Identifier: MIT

#include "linopt/config.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace linopt;

static int fails=0;
#define CHECK(x) do{ if (!(x)) { std::cerr << "CHECK failed at " << __LINE__ << ": " #x "\n"; ++fails; } }while(0)

int main(){
  const auto path = (std::filesystem::temp_directory_path() / "linopt_test_config.kv").string();
  {
    std::ofstream out(path);
    out << "# analyzer settings\n"
        << "method = glynn\n"
        << "threads=4\n"
        << "\n"
        << "format= json\n"
        << "tolerance = 1e-7\n"
        << "verbose = yes\n"
        << "encoding = pairs=0:1;aux=2\n";
  }
  std::map<std::string,std::string> kv;
  CHECK(load_config_kv(path, kv));
  CHECK(kv.size() == 6);
  CHECK(kv["encoding"] == "pairs=0:1;aux=2");

  RunConfig cfg;
  std::string err;
  CHECK(apply_config(kv, cfg, err));
  CHECK(cfg.method == PermanentMethod::Glynn);
  CHECK(cfg.threads == 4);
  CHECK(cfg.format == TableFormat::Json);
  CHECK(cfg.tolerance == 1e-7);
  CHECK(cfg.verbose);
  CHECK(cfg.encoding == "pairs=0:1;aux=2");
  std::remove(path.c_str());

  CHECK(!load_config_kv(path + ".missing", kv));

  RunConfig d;
  CHECK(!apply_config({{"method", "gauss"}}, d, err) && err.find("gauss") != std::string::npos);
  CHECK(!apply_config({{"threads", "-1"}}, d, err));
  CHECK(!apply_config({{"threads", "2x"}}, d, err));
  CHECK(!apply_config({{"tolerance", "0"}}, d, err));
  CHECK(!apply_config({{"format", "xml"}}, d, err));
  CHECK(!apply_config({{"verbose", "maybe"}}, d, err));
  CHECK(!apply_config({{"colour", "red"}}, d, err) && err.find("colour") != std::string::npos);

  TableFormat f;
  CHECK(parse_format("csv", f) && f == TableFormat::Csv);
  CHECK(!parse_format("CSV ", f));

  if (fails==0) std::cout << "OK\n";
  return fails==0?0:1;
}
