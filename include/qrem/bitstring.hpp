// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace qrem {

// Removes register separators (spaces) from a counts key.
std::string normalize_key(std::string_view key);

inline std::size_t hamming_weight(BitIndex x){
  std::size_t w = 0;
  while (x){ x &= x - 1; ++w; }
  return w;
}

// Collect the bits of idx at the given positions into a dense local index
// (positions[b] -> bit b), and the inverse.
inline BitIndex gather_bits(BitIndex idx, const std::vector<std::size_t>& positions){
  BitIndex out = 0;
  for (std::size_t b=0; b<positions.size(); ++b) out |= ((idx >> positions[b]) & 1ULL) << b;
  return out;
}
inline BitIndex scatter_bits(BitIndex local, const std::vector<std::size_t>& positions){
  BitIndex out = 0;
  for (std::size_t b=0; b<positions.size(); ++b) out |= ((local >> b) & 1ULL) << positions[b];
  return out;
}

// Maps bitstrings over an ordered qubit subset to integers in [0, 2^k).
// Position i (rightmost character for i=0) belongs to qubits()[i].
class BitstringIndex {
  std::vector<std::size_t> qubits_;
  std::unordered_map<std::size_t, std::size_t> pos_;
public:
  explicit BitstringIndex(std::vector<std::size_t> qubits);

  std::size_t size() const { return qubits_.size(); }
  const std::vector<std::size_t>& qubits() const { return qubits_; }
  bool contains(std::size_t qubit) const { return pos_.count(qubit) != 0; }
  std::size_t position_of(std::size_t qubit) const;

  BitIndex encode(std::string_view bits) const;
  std::string decode(BitIndex idx) const;

  // Induced index/bitstring over sub_qubits (each must belong to this subset).
  BitIndex project(BitIndex idx, const std::vector<std::size_t>& sub_qubits) const;
  std::string project(std::string_view bits, const std::vector<std::size_t>& sub_qubits) const;
};

} // namespace qrem
