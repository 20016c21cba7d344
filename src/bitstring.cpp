// SPDX-License-Identifier: MIT

#include "qrem/bitstring.hpp"

namespace qrem {

std::string normalize_key(std::string_view key){
  std::string out; out.reserve(key.size());
  for (char ch : key) if (ch != ' ') out.push_back(ch);
  return out;
}

BitstringIndex::BitstringIndex(std::vector<std::size_t> qubits) : qubits_(std::move(qubits)) {
  if (qubits_.size() > kMaxSubsetBits)
    throw Error(ErrorCode::SubsetTooLarge, "subset of " + std::to_string(qubits_.size()) + " qubits exceeds " + std::to_string(kMaxSubsetBits) + " bits");
  for (std::size_t i=0; i<qubits_.size(); ++i){
    if (!pos_.emplace(qubits_[i], i).second)
      throw Error(ErrorCode::InvalidArgument, "qubit " + std::to_string(qubits_[i]) + " listed twice");
  }
}

std::size_t BitstringIndex::position_of(std::size_t qubit) const {
  auto it = pos_.find(qubit);
  if (it == pos_.end()) throw Error(ErrorCode::UnknownQubit, "qubit " + std::to_string(qubit) + " is not part of the subset");
  return it->second;
}

BitIndex BitstringIndex::encode(std::string_view bits) const {
  const std::size_t k = qubits_.size();
  if (bits.size() != k)
    throw Error(ErrorCode::InvalidLength, "bitstring '" + std::string(bits) + "' has length " + std::to_string(bits.size()) + ", expected " + std::to_string(k));
  BitIndex idx = 0;
  for (std::size_t i=0; i<k; ++i){
    char ch = bits[k-1-i];
    if (ch == '1') idx |= (1ULL << i);
    else if (ch != '0') throw Error(ErrorCode::InvalidArgument, "bitstring '" + std::string(bits) + "' contains a non-binary character");
  }
  return idx;
}

std::string BitstringIndex::decode(BitIndex idx) const {
  const std::size_t k = qubits_.size();
  std::string s(k, '0');
  for (std::size_t i=0; i<k; ++i) if ((idx >> i) & 1ULL) s[k-1-i] = '1';
  return s;
}

BitIndex BitstringIndex::project(BitIndex idx, const std::vector<std::size_t>& sub_qubits) const {
  BitIndex out = 0;
  for (std::size_t j=0; j<sub_qubits.size(); ++j){
    std::size_t p = position_of(sub_qubits[j]);
    out |= ((idx >> p) & 1ULL) << j;
  }
  return out;
}

std::string BitstringIndex::project(std::string_view bits, const std::vector<std::size_t>& sub_qubits) const {
  const std::size_t k = qubits_.size();
  if (bits.size() != k)
    throw Error(ErrorCode::InvalidLength, "bitstring '" + std::string(bits) + "' has length " + std::to_string(bits.size()) + ", expected " + std::to_string(k));
  const std::size_t m = sub_qubits.size();
  std::string out(m, '0');
  for (std::size_t j=0; j<m; ++j) out[m-1-j] = bits[k-1-position_of(sub_qubits[j])];
  return out;
}

} // namespace qrem
