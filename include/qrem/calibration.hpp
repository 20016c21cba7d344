// SPDX-License-Identifier: MIT

#pragma once
#include "calibration_matrix.hpp"
#include "config.hpp"
#include "operator.hpp"
#include "types.hpp"
#include <array>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace qrem {

// Readout calibration for a device: independent 2x2 matrices per qubit and/or
// correlated 2^m x 2^m blocks for small qubit groups. Built once and shared
// read-only across correction calls; recalibration takes exclusive access.
class CalibrationModel {
  mutable std::shared_mutex mtx_;
  std::vector<std::shared_ptr<const CalibrationMatrix>> groups_;
  std::map<std::size_t, std::size_t> group_of_; // qubit -> groups_ index
  std::size_t max_correlated_;

  mutable std::mutex cache_mtx_;
  mutable std::map<std::vector<std::size_t>, std::shared_ptr<const ReducedNoiseOperator>> op_cache_;

  void install_(std::shared_ptr<const CalibrationMatrix> m);
  void invalidate_cache_();
  std::shared_ptr<const ReducedNoiseOperator> build_operator_(const std::vector<std::size_t>& qubits) const;

public:
  explicit CalibrationModel(std::size_t max_correlated_subset = kDefaultMaxCorrelatedSubset);
  explicit CalibrationModel(const MitigationOptions& opts) : CalibrationModel(opts.max_correlated_subset) {}
  CalibrationModel(const CalibrationModel&) = delete;
  CalibrationModel& operator=(const CalibrationModel&) = delete;

  std::size_t max_correlated_subset() const { return max_correlated_; }

  // qubit -> {counts after preparing |0>, counts after preparing |1>}.
  void calibrate_independent(const std::map<std::size_t, std::array<Counts, 2>>& per_qubit);

  // per_state[j] holds the counts of the run preparing basis state j, where
  // bit i of j is the prepared value of subset[i].
  void calibrate_correlated(const std::vector<std::size_t>& subset, const std::vector<Counts>& per_state);

  // Arbitrary prepared states (e.g. balanced calibration circuits): every run
  // is (prepared bitstring over qubits, measured counts over qubits).
  void calibrate_from_prepared(const std::vector<std::size_t>& qubits, const std::vector<std::pair<std::string, Counts>>& runs);

  // Operator for an ordered qubit subset; cached until the next recalibration.
  std::shared_ptr<const ReducedNoiseOperator> get_operator_for_subset(const std::vector<std::size_t>& qubits) const;

  bool is_calibrated(std::size_t qubit) const;
  std::vector<std::size_t> qubits() const;
  std::shared_ptr<const CalibrationMatrix> matrix_for(std::size_t qubit) const;
  double readout_fidelity(std::size_t qubit) const;
  void clear();

  bool save(const std::string& path) const;
  // Replaces the model contents only when the whole file validates.
  bool load(const std::string& path, std::string& err);
};

} // namespace qrem
