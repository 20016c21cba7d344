// SPDX-License-Identifier: MIT

#pragma once
#include "distribution.hpp"
#include "observable.hpp"
#include <vector>

namespace qrem {

inline double expval(const ProbDistribution& d, const Observable& o){ return d.expval(o); }
inline double expval(const QuasiDistribution& d, const Observable& o){ return d.expval(o); }

// Pairwise evaluation; a single observable is broadcast over every
// distribution. Any other size mismatch is a DimensionMismatch.
std::vector<double> expval(const std::vector<ProbDistribution>& dists, const std::vector<Observable>& obs);
std::vector<double> expval(const std::vector<QuasiDistribution>& dists, const std::vector<Observable>& obs);

std::vector<ExpvalResult> expval_and_stddev(const std::vector<ProbDistribution>& dists, const std::vector<Observable>& obs);
std::vector<ExpvalResult> expval_and_stddev(const std::vector<QuasiDistribution>& dists, const std::vector<Observable>& obs);

} // namespace qrem
