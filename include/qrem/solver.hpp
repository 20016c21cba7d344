// SPDX-License-Identifier: MIT

#pragma once
#include "config.hpp"
#include "distribution.hpp"
#include "operator.hpp"
#include <functional>
#include <vector>

namespace qrem {

// Dense vectors over a WorkingSet; the operator is only reached through apply.
using LinearMap = std::function<std::vector<double>(const std::vector<double>&)>;

struct GmresResult {
  std::vector<double> x;
  std::size_t iterations = 0;
  double residual = 0.0;   // relative to ||b||
  bool converged = false;
  bool breakdown = false;  // singular least-squares system or non-finite values
};

// Restarted GMRES with right preconditioning by diag_inv (Jacobi).
// Stops at tol, at max_iter total iterations, or on breakdown; x always holds
// the residual-minimizing iterate reached so far.
GmresResult gmres(const LinearMap& A, const std::vector<double>& b, const std::vector<double>& diag_inv,
                  double tol, std::size_t max_iter, std::size_t restart);

// Solves (noise operator) x = (observed probabilities) on the working set
// around the observed keys, falling back to the raw distribution on numerical
// breakdown.
class IterativeCorrector {
  MitigationOptions opts_;
public:
  explicit IterativeCorrector(MitigationOptions opts = {}) : opts_(opts) {}
  const MitigationOptions& options() const { return opts_; }

  // `observed` is over `declared_qubits` (see BitstringIndex); throws
  // UncalibratedSubset if op covers fewer qubits, DimensionMismatch if it
  // covers different ones.
  QuasiDistribution solve(const ProbDistribution& observed, const ReducedNoiseOperator& op,
                          const std::vector<std::size_t>& declared_qubits) const;

  // ||A_I^-1||_1: exact column solves on small working sets, a Hager-Higham
  // estimate (solves with A and A^T) on larger ones.
  double estimate_inverse_norm1(const ReducedNoiseOperator& op, const WorkingSet& ws) const;
};

} // namespace qrem
