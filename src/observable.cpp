// SPDX-License-Identifier: MIT

#include "qrem/observable.hpp"
#include "qrem/bitstring.hpp"
#include <algorithm>
#include <cmath>

namespace qrem {

void Observable::add_term_(std::string pattern, double coeff){
  pattern = normalize_key(pattern);
  if (pattern.empty()) throw Error(ErrorCode::InvalidArgument, "observable term is empty");
  if (nbits_ == 0) nbits_ = pattern.size();
  else if (pattern.size() != nbits_)
    throw Error(ErrorCode::InvalidLength, "observable term '" + pattern + "' has length " + std::to_string(pattern.size()) + ", expected " + std::to_string(nbits_));
  bool exact = true;
  for (char ch : pattern){
    if (ch == 'Z' || ch == 'I') exact = false;
    else if (ch != '0' && ch != '1')
      throw Error(ErrorCode::InvalidArgument, "observable term '" + pattern + "' uses a character outside {0,1,Z,I}");
  }
  if (exact) exact_[pattern] += coeff;
  else patterns_.emplace_back(std::move(pattern), coeff);
}

Observable Observable::from_weights(const std::map<std::string, double>& weights){
  return from_terms(std::vector<std::pair<std::string, double>>(weights.begin(), weights.end()));
}

Observable Observable::from_terms(const std::vector<std::pair<std::string, double>>& terms){
  if (terms.empty()) throw Error(ErrorCode::InvalidArgument, "observable has no terms");
  Observable o;
  for (const auto& [p, c] : terms) o.add_term_(p, c);
  double exact_max = 0.0, pattern_sum = 0.0;
  for (const auto& kv : o.exact_) exact_max = std::max(exact_max, std::fabs(kv.second));
  for (const auto& t : o.patterns_) pattern_sum += std::fabs(t.second);
  o.max_abs_ = exact_max + pattern_sum;
  return o;
}

Observable Observable::z_string(const std::string& pattern, double coeff){
  return from_terms({{pattern, coeff}});
}

Observable Observable::all_z(std::size_t nbits){
  return z_string(std::string(nbits, 'Z'));
}

Observable Observable::heavy_output(const std::map<std::string, double>& ideal){
  if (ideal.empty()) throw Error(ErrorCode::InvalidArgument, "heavy-output set of an empty distribution");
  std::vector<double> probs;
  probs.reserve(ideal.size());
  for (const auto& kv : ideal) probs.push_back(kv.second);
  std::sort(probs.begin(), probs.end());
  const std::size_t n = probs.size();
  const double median = n % 2 ? probs[n/2] : 0.5 * (probs[n/2 - 1] + probs[n/2]);
  std::map<std::string, double> weights;
  for (const auto& [key, p] : ideal) weights[key] = p > median ? 1.0 : 0.0;
  return from_weights(weights);
}

double Observable::weight(std::string_view key) const {
  if (key.size() != nbits_)
    throw Error(ErrorCode::InvalidLength, "key '" + std::string(key) + "' has length " + std::to_string(key.size()) + ", observable expects " + std::to_string(nbits_));
  double w = 0.0;
  if (!exact_.empty()){
    auto it = exact_.find(std::string(key));
    if (it != exact_.end()) w += it->second;
  }
  for (const auto& [pattern, coeff] : patterns_){
    double f = coeff;
    for (std::size_t i=0; i<nbits_ && f != 0.0; ++i){
      char p = pattern[i], b = key[i];
      if (p == 'Z'){ if (b == '1') f = -f; }
      else if (p != 'I' && p != b) f = 0.0;
    }
    w += f;
  }
  return w;
}

} // namespace qrem
