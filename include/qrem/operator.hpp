// SPDX-License-Identifier: MIT

#pragma once
#include "calibration_matrix.hpp"
#include "types.hpp"
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace qrem {

// One tensor factor of the noise map: a calibration matrix acting on the
// subset positions listed in `positions` (matrix local bit b -> positions[b]).
struct NoiseFactor {
  std::shared_ptr<const CalibrationMatrix> matrix;
  std::vector<std::size_t> positions;
  BitIndex mask = 0;
};

class ReducedNoiseOperator;

// Explicit index set I the solver works on. Keys are sorted. trie_ holds the
// keys digit by digit in factor order (digit f = the key's local index in
// factor f); node 0 is the root and a child of a depth f+1 == #factors node
// is a key position rather than a node. Children are sorted by digit.
class WorkingSet {
  friend class ReducedNoiseOperator;
  std::vector<BitIndex> keys_;
  std::unordered_map<BitIndex, std::size_t> pos_;
  std::vector<std::vector<std::pair<BitIndex, std::size_t>>> trie_;
  std::size_t max_flips_ = kMaxSubsetBits;
  bool truncated_ = false;
public:
  std::size_t size() const { return keys_.size(); }
  const std::vector<BitIndex>& keys() const { return keys_; }
  bool contains(BitIndex k) const { return pos_.count(k) != 0; }
  std::size_t position(BitIndex k) const { return pos_.at(k); }
  bool truncated() const { return truncated_; }
  // Restricted applies drop entries whose input and output keys differ in more bits.
  std::size_t max_flips() const { return max_flips_; }

  std::vector<double> to_dense(const SparseVector& v) const;
  SparseVector to_sparse(const std::vector<double>& v) const;
};

// Matrix-free tensor product of calibration factors over an ordered qubit
// subset. Nothing of size 2^k is ever stored.
class ReducedNoiseOperator {
  std::vector<std::size_t> qubits_;
  std::vector<NoiseFactor> factors_;

  SparseVector apply_impl(const SparseVector& x, bool transpose) const;
  SparseVector apply_restricted(const SparseVector& x, const WorkingSet& ws, bool transpose) const {
    return ws.to_sparse(apply_dense(ws.to_dense(x), ws, transpose));
  }
public:
  ReducedNoiseOperator(std::vector<std::size_t> qubits, std::vector<NoiseFactor> factors);

  const std::vector<std::size_t>& qubits() const { return qubits_; }
  std::size_t num_bits() const { return qubits_.size(); }
  const std::vector<NoiseFactor>& factors() const { return factors_; }

  // Throws DimensionMismatch unless `declared` is exactly this operator's subset.
  void check_subset(const std::vector<std::size_t>& declared) const;

  // Full map: every output key reachable from the input support.
  SparseVector apply(const SparseVector& x) const { return apply_impl(x, false); }
  SparseVector apply_transpose(const SparseVector& x) const { return apply_impl(x, true); }

  // I x I block of the map, limited to entries within ws.max_flips() bit
  // flips; keys outside I are ignored on input and never produced. Each input
  // key walks the trie of I, so the cost follows |I|, not 2^k.
  SparseVector apply(const SparseVector& x, const WorkingSet& ws) const { return apply_restricted(x, ws, false); }
  SparseVector apply_transpose(const SparseVector& x, const WorkingSet& ws) const { return apply_restricted(x, ws, true); }
  std::vector<double> apply_dense(const std::vector<double>& x, const WorkingSet& ws, bool transpose = false) const;

  double diagonal(BitIndex k) const;

  // Expands `keys` by up to `distance` single-factor noise steps along nonzero
  // off-diagonal calibration entries, stopping once `max_size` keys are held.
  WorkingSet reachable_set(const std::vector<BitIndex>& keys, std::size_t distance, std::size_t max_size,
                           std::size_t max_flips = kMaxSubsetBits) const;
  WorkingSet make_working_set(std::vector<BitIndex> keys, std::size_t max_flips = kMaxSubsetBits) const;
};

} // namespace qrem
