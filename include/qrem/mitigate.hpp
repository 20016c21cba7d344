// SPDX-License-Identifier: MIT

#pragma once
#include "calibration.hpp"
#include "config.hpp"
#include "distribution.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace qrem {

// Experiment counts plus the final measurement mapping: qubit_mapping[i] is
// the physical qubit read into classical bit i (rightmost key character).
struct CountsJob {
  Counts counts;
  std::vector<std::size_t> qubit_mapping;
};

// Per-item outcome of a batch: a distribution or the error that stopped it.
struct BatchItem {
  std::optional<QuasiDistribution> result;
  std::optional<ErrorCode> code;  // empty for non-qrem exceptions
  std::string error;
  bool ok() const { return result.has_value(); }
  // ErrorCode name, "Exception" for other failures, empty on success.
  std::string code_name() const;
};

// Readout-corrected quasi-distribution for one circuit.
QuasiDistribution correct(const Counts& counts, const std::vector<std::size_t>& qubit_mapping,
                          const CalibrationModel& calibration, const MitigationOptions& opts = {});

// Independent corrections spread over a worker pool; output order matches input.
std::vector<BatchItem> correct_batch(const std::vector<CountsJob>& jobs, const CalibrationModel& calibration,
                                     const MitigationOptions& opts = {});

} // namespace qrem
