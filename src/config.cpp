// SPDX-License-Identifier: MIT

#include "qrem/config.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>

namespace qrem {

namespace {

std::string trim(const std::string& s){
  auto notspace = [](unsigned char ch){ return !std::isspace(ch); };
  auto l = std::find_if(s.begin(), s.end(), notspace);
  auto r = std::find_if(s.rbegin(), s.rend(), notspace).base();
  return l < r ? std::string(l, r) : std::string();
}

bool parse_size(const std::string& s, std::size_t& out){
  if (s.empty() || s[0] == '-') return false;
  try {
    std::size_t pos = 0;
    unsigned long long v = std::stoull(s, &pos, 10);
    if (pos != s.size()) return false;
    out = static_cast<std::size_t>(v);
    return true;
  } catch (const std::exception&) { return false; }
}

bool parse_double(const std::string& s, double& out){
  try {
    std::size_t pos = 0;
    double v = std::stod(s, &pos);
    if (pos != s.size() || !std::isfinite(v)) return false;
    out = v;
    return true;
  } catch (const std::exception&) { return false; }
}

bool parse_bool(const std::string& s, bool& out){
  if (s=="1" || s=="true" || s=="on" || s=="yes"){ out = true; return true; }
  if (s=="0" || s=="false" || s=="off" || s=="no"){ out = false; return true; }
  return false;
}

} // namespace

bool apply_option(MitigationOptions& opts, const std::string& key, const std::string& value, std::string& err){
  std::size_t n = 0;
  auto bad = [&](){ err = "Invalid value '" + value + "' for option " + key; return false; };
  if (key == "tol"){
    double v; if (!parse_double(value, v) || v <= 0.0) return bad();
    opts.tol = v;
  } else if (key == "max_iter"){
    if (!parse_size(value, n) || n == 0) return bad();
    opts.max_iter = n;
  } else if (key == "restart"){
    if (!parse_size(value, n) || n == 0) return bad();
    opts.restart = n;
  } else if (key == "expansion_distance"){
    if (!parse_size(value, n)) return bad();
    opts.expansion_distance = n;
  } else if (key == "max_working_set"){
    if (!parse_size(value, n) || n == 0) return bad();
    opts.max_working_set = n;
  } else if (key == "max_hamming_distance"){
    if (!parse_size(value, n)) return bad();
    opts.max_hamming_distance = n;
  } else if (key == "estimate_overhead"){
    if (!parse_bool(value, opts.estimate_overhead)) return bad();
  } else if (key == "threads"){
    if (!parse_size(value, n)) return bad();
    opts.threads = static_cast<unsigned>(n);
  } else if (key == "max_correlated_subset"){
    if (!parse_size(value, n) || n == 0) return bad();
    opts.max_correlated_subset = n;
  } else if (key == "log_level"){
    auto lvl = parse_log_level(value);
    if (!lvl) return bad();
    opts.log_level = lvl;
  } else {
    err = "Unknown option: " + key;
    return false;
  }
  return true;
}

std::optional<MitigationOptions> load_options_file(const std::string& path, std::string& err){
  std::ifstream in(path);
  if (!in){ err = "Cannot open options file: " + path; return std::nullopt; }
  MitigationOptions opts;
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(in, line)){
    ++lineno;
    line = trim(line);
    if (line.empty() || line[0] == '#') continue;
    auto p = line.find('=');
    if (p == std::string::npos){ err = "Expected key=value at line " + std::to_string(lineno); return std::nullopt; }
    std::string key = trim(line.substr(0, p)), e;
    if (!apply_option(opts, key, trim(line.substr(p+1)), e)){
      err = e + " at line " + std::to_string(lineno);
      return std::nullopt;
    }
  }
  // the log threshold is process-wide and applied on load
  if (opts.log_level) set_log_level(*opts.log_level);
  return opts;
}

} // namespace qrem
