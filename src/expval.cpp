// SPDX-License-Identifier: MIT

#include "qrem/expval.hpp"
#include <exception>
#ifdef QREM_OPENMP
#include <omp.h>
#endif

namespace qrem {

namespace {

template <class Dist, class Out, class Fn>
std::vector<Out> for_each_pair(const std::vector<Dist>& dists, const std::vector<Observable>& obs, Fn fn){
  if (obs.empty() || (obs.size() != 1 && obs.size() != dists.size()))
    throw Error(ErrorCode::DimensionMismatch, std::to_string(dists.size()) + " distributions paired with " + std::to_string(obs.size()) + " observables");
  std::vector<Out> out(dists.size());
  std::vector<std::exception_ptr> errs(dists.size());
  const long n = static_cast<long>(dists.size());
#ifdef QREM_OPENMP
#pragma omp parallel for schedule(dynamic)
#endif
  for (long i = 0; i < n; ++i){
    // rethrown below; an exception may not cross the OpenMP region
    try {
      out[i] = fn(dists[i], obs.size() == 1 ? obs[0] : obs[i]);
    } catch (...){
      errs[i] = std::current_exception();
    }
  }
  for (const auto& e : errs) if (e) std::rethrow_exception(e);
  return out;
}

} // namespace

std::vector<double> expval(const std::vector<ProbDistribution>& dists, const std::vector<Observable>& obs){
  return for_each_pair<ProbDistribution, double>(dists, obs, [](const ProbDistribution& d, const Observable& o){ return d.expval(o); });
}

std::vector<double> expval(const std::vector<QuasiDistribution>& dists, const std::vector<Observable>& obs){
  return for_each_pair<QuasiDistribution, double>(dists, obs, [](const QuasiDistribution& d, const Observable& o){ return d.expval(o); });
}

std::vector<ExpvalResult> expval_and_stddev(const std::vector<ProbDistribution>& dists, const std::vector<Observable>& obs){
  return for_each_pair<ProbDistribution, ExpvalResult>(dists, obs, [](const ProbDistribution& d, const Observable& o){ return d.expval_and_stddev(o); });
}

std::vector<ExpvalResult> expval_and_stddev(const std::vector<QuasiDistribution>& dists, const std::vector<Observable>& obs){
  return for_each_pair<QuasiDistribution, ExpvalResult>(dists, obs, [](const QuasiDistribution& d, const Observable& o){ return d.expval_and_stddev(o); });
}

} // namespace qrem
