// SPDX-License-Identifier: MIT

#include "qrem/calibration_matrix.hpp"
#include "qrem/bitstring.hpp"
#include <algorithm>
#include <cmath>

namespace qrem {

CalibrationMatrix CalibrationMatrix::from_counts(Kind kind, const std::vector<std::size_t>& qubits, const std::vector<Counts>& per_state){
  BitstringIndex index(qubits);
  CalibrationMatrix m;
  m.kind = kind;
  m.qubits = qubits;
  m.dim = std::size_t(1) << qubits.size();
  if (per_state.size() != m.dim)
    throw Error(ErrorCode::DimensionMismatch, "expected " + std::to_string(m.dim) + " calibration runs, got " + std::to_string(per_state.size()));
  m.data.assign(m.dim*m.dim, 0.0);
  for (std::size_t j=0; j<m.dim; ++j){
    std::uint64_t total = 0;
    for (const auto& [key, n] : per_state[j]){
      BitIndex i = index.encode(normalize_key(key));
      m.data[i*m.dim + j] += double(n);
      total += n;
    }
    if (total == 0)
      throw Error(ErrorCode::InvalidArgument, "calibration run for state " + index.decode(j) + " has no shots");
    for (std::size_t i=0; i<m.dim; ++i) m.data[i*m.dim + j] /= double(total);
  }
  return m;
}

CalibrationMatrix CalibrationMatrix::marginal(const std::vector<std::size_t>& keep_qubits) const {
  BitstringIndex index(qubits);
  std::vector<std::size_t> keep_pos; keep_pos.reserve(keep_qubits.size());
  for (auto q : keep_qubits) keep_pos.push_back(index.position_of(q));
  CalibrationMatrix out;
  out.kind = kind;
  out.qubits = keep_qubits;
  out.dim = std::size_t(1) << keep_qubits.size();
  out.data.assign(out.dim*out.dim, 0.0);
  const double avg = double(out.dim) / double(dim);
  for (std::size_t i=0; i<dim; ++i){
    BitIndex li = gather_bits(i, keep_pos);
    for (std::size_t j=0; j<dim; ++j){
      BitIndex lj = gather_bits(j, keep_pos);
      out.data[li*out.dim + lj] += at(i,j) * avg;
    }
  }
  return out;
}

double CalibrationMatrix::stochastic_error() const {
  double worst = 0.0;
  for (std::size_t j=0; j<dim; ++j){
    double s = 0.0;
    for (std::size_t i=0; i<dim; ++i) s += at(i,j);
    worst = std::max(worst, std::fabs(s - 1.0));
  }
  return worst;
}

double CalibrationMatrix::mean_diagonal() const {
  if (dim == 0) return 0.0;
  double s = 0.0;
  for (std::size_t i=0; i<dim; ++i) s += at(i,i);
  return s / double(dim);
}

} // namespace qrem
