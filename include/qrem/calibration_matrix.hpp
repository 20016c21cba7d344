// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include <vector>

namespace qrem {

// Column-stochastic assignment matrix for one qubit or one correlated group.
// at(i,j) = P(measure i | prepared j); local index bit b belongs to qubits[b].
struct CalibrationMatrix {
  enum class Kind { Independent, Correlated };

  Kind kind = Kind::Independent;
  std::vector<std::size_t> qubits;
  std::size_t dim = 0;          // 2^qubits.size()
  std::vector<double> data;     // row-major dim x dim

  double at(std::size_t i, std::size_t j) const { return data[i*dim + j]; }

  // Column j is the normalized counts of the run that prepared basis state j.
  // Keys are bitstrings over `qubits` (rightmost char = qubits[0]).
  static CalibrationMatrix from_counts(Kind kind, const std::vector<std::size_t>& qubits, const std::vector<Counts>& per_state);

  // Column-stochastic restriction to keep_qubits (a subset of qubits): absent
  // qubits are summed over on the measured side and averaged over on the
  // prepared side.
  CalibrationMatrix marginal(const std::vector<std::size_t>& keep_qubits) const;

  // Largest |column sum - 1|.
  double stochastic_error() const;
  double mean_diagonal() const;
};

} // namespace qrem
