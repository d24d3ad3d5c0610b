// SPDX-License-Identifier: MIT

#pragma once
#include "permanent.hpp"
#include <map>
#include <optional>
#include <string>

namespace linopt {

enum class TableFormat { Text, Csv, Json };

struct RunConfig {
  PermanentMethod method = PermanentMethod::Ryser;
  int threads = 0;
  TableFormat format = TableFormat::Text;
  double tolerance = 1e-9;
  bool verbose = false;
  std::string encoding; // empty: demo encoding
};

// key=value lines, '#' starts a comment line. Returns false if the file cannot be read.
bool load_config_kv(const std::string& path, std::map<std::string,std::string>& kv);

// Applies known keys onto cfg. Unknown keys or bad values set err and return false.
bool apply_config(const std::map<std::string,std::string>& kv, RunConfig& cfg, std::string& err);

bool parse_format(const std::string& s, TableFormat& out);

} // namespace linopt
