// SPDX-License-Identifier: MIT

#pragma once
#include "observable.hpp"
#include "types.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace qrem {

struct ExpvalResult {
  double value = 0.0;
  double stddev = 0.0; // NaN when no estimate is available
};

// Normalized raw counts.
class ProbDistribution {
  std::map<std::string, double> probs_;
  std::uint64_t shots_ = 0;
public:
  ProbDistribution() = default;
  ProbDistribution(std::map<std::string, double> probs, std::uint64_t shots) : probs_(std::move(probs)), shots_(shots) {}
  // Throws InvalidArgument on zero total shots, InvalidLength on mixed key lengths.
  static ProbDistribution from_counts(const Counts& counts);

  const std::map<std::string, double>& values() const { return probs_; }
  std::uint64_t shots() const { return shots_; }
  std::size_t size() const { return probs_.size(); }
  double operator[](const std::string& key) const;
  double sum() const;

  double expval(const Observable& obs) const;
  // Shot-noise standard error sqrt((E[w^2] - E[w]^2) / shots).
  ExpvalResult expval_and_stddev(const Observable& obs) const;
};

enum class SolveStatus { Trivial, Converged, IterationCap, Degenerate };
const char* to_string(SolveStatus s);

struct SolveReport {
  SolveStatus status = SolveStatus::Trivial;
  std::size_t iterations = 0;
  double residual = 0.0;          // final relative residual on the working set
  std::size_t working_set = 0;
  bool working_set_truncated = false;
};

// Corrected distribution; entries may be negative, sum is 1 after a solve.
class QuasiDistribution {
  std::map<std::string, double> values_;
  std::uint64_t shots_ = 0;
  std::optional<double> overhead_;
  SolveReport report_;
public:
  QuasiDistribution() = default;
  QuasiDistribution(std::map<std::string, double> values, std::uint64_t shots, SolveReport report, std::optional<double> overhead = std::nullopt)
    : values_(std::move(values)), shots_(shots), overhead_(overhead), report_(report) {}

  const std::map<std::string, double>& values() const { return values_; }
  std::uint64_t shots() const { return shots_; }
  std::size_t size() const { return values_.size(); }
  const SolveReport& report() const { return report_; }
  double operator[](const std::string& key) const;

  // Estimated ||A^-1||_1^2 of the noise map on the solve's working set.
  std::optional<double> mitigation_overhead() const { return overhead_; }

  double sum() const;
  void renormalize();

  // Closest probability vector in L2: clips the most negative entries one at
  // a time, spreading their mass evenly over the entries still in play.
  ProbDistribution nearest_probability_distribution() const;

  double expval(const Observable& obs) const;
  // Upper bound sqrt(overhead / shots) * max|w|; approximate, not exact.
  double stddev_bound(const Observable& obs) const;
  ExpvalResult expval_and_stddev(const Observable& obs) const;
};

} // namespace qrem
