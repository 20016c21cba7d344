// SPDX-License-Identifier: MIT

#include "qrem/distribution.hpp"
#include "qrem/bitstring.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace qrem {

const char* to_string(SolveStatus s){
  switch(s){
    case SolveStatus::Trivial: return "trivial";
    case SolveStatus::Converged: return "converged";
    case SolveStatus::IterationCap: return "iteration-cap";
    case SolveStatus::Degenerate: return "degenerate";
  }
  return "?";
}

ProbDistribution ProbDistribution::from_counts(const Counts& counts){
  std::map<std::string, double> probs;
  std::uint64_t shots = 0;
  std::size_t width = 0;
  for (const auto& [raw, n] : counts){
    std::string key = normalize_key(raw);
    if (width == 0) width = key.size();
    else if (key.size() != width)
      throw Error(ErrorCode::InvalidLength, "counts key '" + key + "' has length " + std::to_string(key.size()) + ", expected " + std::to_string(width));
    if (n == 0) continue;
    probs[key] += double(n);
    shots += n;
  }
  if (shots == 0) throw Error(ErrorCode::InvalidArgument, "counts contain no shots");
  for (auto& kv : probs) kv.second /= double(shots);
  return ProbDistribution(std::move(probs), shots);
}

double ProbDistribution::operator[](const std::string& key) const {
  auto it = probs_.find(key);
  return it == probs_.end() ? 0.0 : it->second;
}

double ProbDistribution::sum() const {
  double s = 0.0;
  for (const auto& kv : probs_) s += kv.second;
  return s;
}

double ProbDistribution::expval(const Observable& obs) const {
  double e = 0.0;
  for (const auto& [key, p] : probs_) e += p * obs.weight(key);
  return e;
}

ExpvalResult ProbDistribution::expval_and_stddev(const Observable& obs) const {
  double e = 0.0, e2 = 0.0;
  for (const auto& [key, p] : probs_){
    double w = obs.weight(key);
    e += p * w;
    e2 += p * w * w;
  }
  ExpvalResult r;
  r.value = e;
  r.stddev = shots_ ? std::sqrt(std::max(0.0, e2 - e*e) / double(shots_)) : std::numeric_limits<double>::quiet_NaN();
  return r;
}

double QuasiDistribution::operator[](const std::string& key) const {
  auto it = values_.find(key);
  return it == values_.end() ? 0.0 : it->second;
}

double QuasiDistribution::sum() const {
  double s = 0.0;
  for (const auto& kv : values_) s += kv.second;
  return s;
}

void QuasiDistribution::renormalize(){
  double s = sum();
  if (s == 0.0 || !std::isfinite(s)) return;
  for (auto& kv : values_) kv.second /= s;
}

ProbDistribution QuasiDistribution::nearest_probability_distribution() const {
  std::vector<std::pair<std::string, double>> sorted(values_.begin(), values_.end());
  std::stable_sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b){ return a.second < b.second; });
  std::size_t remaining = sorted.size();
  double beta = 0.0;
  std::map<std::string, double> probs;
  for (const auto& [key, v] : sorted){
    if (remaining == 0) break;
    double shifted = v + beta / double(remaining);
    if (shifted < 0.0){
      beta += v;
      --remaining;
    } else {
      probs[key] = shifted;
    }
  }
  return ProbDistribution(std::move(probs), shots_);
}

double QuasiDistribution::expval(const Observable& obs) const {
  double e = 0.0;
  for (const auto& [key, v] : values_) e += v * obs.weight(key);
  return e;
}

double QuasiDistribution::stddev_bound(const Observable& obs) const {
  if (!overhead_ || shots_ == 0) return std::numeric_limits<double>::quiet_NaN();
  return std::sqrt(*overhead_ / double(shots_)) * obs.max_abs_weight();
}

ExpvalResult QuasiDistribution::expval_and_stddev(const Observable& obs) const {
  ExpvalResult r;
  r.value = expval(obs);
  r.stddev = stddev_bound(obs);
  return r;
}

} // namespace qrem
