// SPDX-License-Identifier: MIT

#pragma once
#include "log.hpp"
#include "types.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace qrem {

struct MitigationOptions {
  double tol = 1e-5;                    // relative residual target
  std::size_t max_iter = 25;            // total GMRES iterations across restarts
  std::size_t restart = 25;             // Krylov basis size before a restart
  std::size_t expansion_distance = 1;   // noise steps added around observed keys
  std::size_t max_working_set = std::size_t(1) << 18;
  std::size_t max_hamming_distance = 3; // bit flips kept per operator entry
  bool estimate_overhead = false;       // ||A^-1||_1^2 for standard deviations
  unsigned threads = 0;                 // batch workers, 0 = hardware concurrency
  std::size_t max_correlated_subset = kDefaultMaxCorrelatedSubset;
  // Process-wide threshold, applied by load_options_file, correct and
  // correct_batch when set; empty leaves the current level alone.
  std::optional<LogLevel> log_level;
};

// Sets one option from its textual form; false + err on an unknown key or bad value.
bool apply_option(MitigationOptions& opts, const std::string& key, const std::string& value, std::string& err);

// Reads "key=value" lines; blank lines and lines starting with '#' are skipped.
std::optional<MitigationOptions> load_options_file(const std::string& path, std::string& err);

} // namespace qrem
