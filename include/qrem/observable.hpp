// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace qrem {

// Immutable diagonal observable: a weighted sum of terms over the alphabet
//   '0' projector on 0, '1' projector on 1, 'Z' sign (-1 on 1), 'I' identity.
// Same positional convention as counts keys (rightmost = position 0).
// Terms made only of 0/1 are exact-match projectors and are looked up directly.
class Observable {
  std::size_t nbits_ = 0;
  std::unordered_map<std::string, double> exact_;
  std::vector<std::pair<std::string, double>> patterns_;
  double max_abs_ = 0.0;

  Observable() = default;
  void add_term_(std::string pattern, double coeff);
public:
  // bitstring -> weight; absent keys weigh 0.
  static Observable from_weights(const std::map<std::string, double>& weights);
  static Observable from_terms(const std::vector<std::pair<std::string, double>>& terms);
  static Observable z_string(const std::string& pattern, double coeff = 1.0);
  static Observable all_z(std::size_t nbits);
  // Heavy-output projector: weight 1 on keys whose ideal probability exceeds
  // the median of `ideal`, 0 elsewhere.
  static Observable heavy_output(const std::map<std::string, double>& ideal);

  std::size_t num_bits() const { return nbits_; }
  // Bound on |weight(key)| over all keys; used by the standard-error bound.
  double max_abs_weight() const { return max_abs_; }

  // Throws InvalidLength if the key size differs from num_bits().
  double weight(std::string_view key) const;
};

} // namespace qrem
