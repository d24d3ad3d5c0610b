// SPDX-License-Identifier: MIT

#include "linopt/config.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace linopt {

static std::string trim(const std::string& s){
  auto l = std::find_if(s.begin(), s.end(), [](unsigned char c){return !std::isspace(c);} );
  auto r = std::find_if(s.rbegin(), s.rend(), [](unsigned char c){return !std::isspace(c);} ).base();
  if (l>=r) return "";
  return std::string(l,r);
}

bool load_config_kv(const std::string& path, std::map<std::string,std::string>& kv){
  std::ifstream in(path);
  if(!in) return false;
  std::string line;
  while(std::getline(in,line)){
    line = trim(line);
    if(line.empty()||line[0]=='#') continue;
    auto p=line.find('=');
    if(p==std::string::npos) continue;
    kv[trim(line.substr(0,p))]=trim(line.substr(p+1));
  }
  return true;
}

bool parse_format(const std::string& s, TableFormat& out){
  if (s == "text") { out = TableFormat::Text; return true; }
  if (s == "csv")  { out = TableFormat::Csv;  return true; }
  if (s == "json") { out = TableFormat::Json; return true; }
  return false;
}

static bool parse_bool(const std::string& s, bool& out){
  if (s == "1" || s == "true" || s == "yes" || s == "on") { out = true; return true; }
  if (s == "0" || s == "false" || s == "no" || s == "off") { out = false; return true; }
  return false;
}

bool apply_config(const std::map<std::string,std::string>& kv, RunConfig& cfg, std::string& err){
  for (const auto& [k, v] : kv){
    if (k == "method") {
      if (!parse_method(v, cfg.method)) { err = "Unknown method '" + v + "'"; return false; }
    } else if (k == "threads") {
      try {
        std::size_t pos = 0;
        int t = std::stoi(v, &pos);
        if (pos != v.size() || t < 0) { err = "Invalid threads '" + v + "'"; return false; }
        cfg.threads = t;
      } catch (const std::exception&) { err = "Invalid threads '" + v + "'"; return false; }
    } else if (k == "format") {
      if (!parse_format(v, cfg.format)) { err = "Unknown format '" + v + "'"; return false; }
    } else if (k == "tolerance") {
      try {
        std::size_t pos = 0;
        double t = std::stod(v, &pos);
        if (pos != v.size() || !(t > 0.0)) { err = "Invalid tolerance '" + v + "'"; return false; }
        cfg.tolerance = t;
      } catch (const std::exception&) { err = "Invalid tolerance '" + v + "'"; return false; }
    } else if (k == "verbose") {
      if (!parse_bool(v, cfg.verbose)) { err = "Invalid verbose '" + v + "'"; return false; }
    } else if (k == "encoding") {
      cfg.encoding = v;
    } else {
      err = "Unknown config key '" + k + "'";
      return false;
    }
  }
  return true;
}

} // namespace linopt
