// SPDX-License-Identifier: MIT

#include "qrem/operator.hpp"
#include "qrem/bitstring.hpp"
#include "qrem/log.hpp"
#include <algorithm>

namespace qrem {

std::vector<double> WorkingSet::to_dense(const SparseVector& v) const {
  std::vector<double> out(keys_.size(), 0.0);
  for (const auto& [k, val] : v){
    auto it = pos_.find(k);
    if (it != pos_.end()) out[it->second] = val;
  }
  return out;
}

SparseVector WorkingSet::to_sparse(const std::vector<double>& v) const {
  SparseVector out; out.reserve(keys_.size());
  for (std::size_t i=0; i<keys_.size() && i<v.size(); ++i) if (v[i] != 0.0) out[keys_[i]] = v[i];
  return out;
}

ReducedNoiseOperator::ReducedNoiseOperator(std::vector<std::size_t> qubits, std::vector<NoiseFactor> factors)
  : qubits_(std::move(qubits)), factors_(std::move(factors)) {
  if (qubits_.size() > kMaxSubsetBits)
    throw Error(ErrorCode::SubsetTooLarge, "operator subset exceeds " + std::to_string(kMaxSubsetBits) + " bits");
  BitIndex covered = 0;
  for (auto& f : factors_){
    if (!f.matrix || f.matrix->dim != (std::size_t(1) << f.positions.size()))
      throw Error(ErrorCode::DimensionMismatch, "noise factor size does not match its positions");
    f.mask = 0;
    for (auto p : f.positions){
      if (p >= qubits_.size() || ((covered >> p) & 1ULL))
        throw Error(ErrorCode::InvalidArgument, "noise factors must cover each subset position exactly once");
      covered |= (1ULL << p);
      f.mask |= (1ULL << p);
    }
  }
  if (hamming_weight(covered) != qubits_.size())
    throw Error(ErrorCode::UncalibratedSubset, "noise factors cover " + std::to_string(hamming_weight(covered)) + " of " + std::to_string(qubits_.size()) + " positions");
}

void ReducedNoiseOperator::check_subset(const std::vector<std::size_t>& declared) const {
  if (declared != qubits_)
    throw Error(ErrorCode::DimensionMismatch, "operator acts on " + std::to_string(qubits_.size()) + " qubits that do not match the declared subset of " + std::to_string(declared.size()));
}

SparseVector ReducedNoiseOperator::apply_impl(const SparseVector& x, bool transpose) const {
  SparseVector cur;
  cur.reserve(x.size());
  for (const auto& [k, v] : x) if (v != 0.0) cur[k] += v;
  for (const auto& fac : factors_){
    const auto& M = *fac.matrix;
    SparseVector next;
    next.reserve(cur.size() * 2);
    for (const auto& [k, v] : cur){
      const BitIndex jl = gather_bits(k, fac.positions);
      const BitIndex base = k & ~fac.mask;
      for (std::size_t il=0; il<M.dim; ++il){
        double a = transpose ? M.at(jl, il) : M.at(il, jl);
        if (a == 0.0) continue;
        next[base | scatter_bits(il, fac.positions)] += a * v;
      }
    }
    cur.swap(next);
  }
  return cur;
}

std::vector<double> ReducedNoiseOperator::apply_dense(const std::vector<double>& x, const WorkingSet& ws, bool transpose) const {
  if (x.size() != ws.size())
    throw Error(ErrorCode::DimensionMismatch, "vector of " + std::to_string(x.size()) + " entries for a working set of " + std::to_string(ws.size()));
  struct Frame { std::size_t node; std::size_t depth; double weight; std::size_t flips; };
  const std::size_t depth = factors_.size();
  std::vector<double> out(ws.size(), 0.0);
  std::vector<BitIndex> digits(depth);
  std::vector<Frame> stack;
  for (std::size_t j=0; j<ws.size(); ++j){
    if (x[j] == 0.0) continue;
    const BitIndex k = ws.keys_[j];
    for (std::size_t f=0; f<depth; ++f) digits[f] = gather_bits(k, factors_[f].positions);
    stack.push_back({0, 0, x[j], 0});
    while (!stack.empty()){
      const Frame fr = stack.back();
      stack.pop_back();
      if (fr.depth == depth){ out[fr.node] += fr.weight; continue; }
      const auto& M = *factors_[fr.depth].matrix;
      const BitIndex jl = digits[fr.depth];
      for (const auto& [il, child] : ws.trie_[fr.node]){
        const double a = transpose ? M.at(jl, il) : M.at(il, jl);
        if (a == 0.0) continue;
        const std::size_t flips = fr.flips + hamming_weight(il ^ jl);
        if (flips > ws.max_flips_) continue;
        stack.push_back({child, fr.depth + 1, fr.weight * a, flips});
      }
    }
  }
  return out;
}

double ReducedNoiseOperator::diagonal(BitIndex k) const {
  double d = 1.0;
  for (const auto& fac : factors_){
    BitIndex l = gather_bits(k, fac.positions);
    d *= fac.matrix->at(l, l);
  }
  return d;
}

WorkingSet ReducedNoiseOperator::make_working_set(std::vector<BitIndex> keys, std::size_t max_flips) const {
  std::sort(keys.begin(), keys.end());
  keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
  WorkingSet ws;
  ws.keys_ = std::move(keys);
  ws.max_flips_ = max_flips;
  ws.pos_.reserve(ws.keys_.size());
  for (std::size_t i=0; i<ws.keys_.size(); ++i) ws.pos_[ws.keys_[i]] = i;

  const std::size_t depth = factors_.size();
  ws.trie_.assign(1, {});
  for (std::size_t i=0; i<ws.keys_.size(); ++i){
    std::size_t node = 0;
    for (std::size_t f=0; f<depth; ++f){
      const BitIndex digit = gather_bits(ws.keys_[i], factors_[f].positions);
      auto& children = ws.trie_[node];
      auto it = std::lower_bound(children.begin(), children.end(), digit,
                                 [](const std::pair<BitIndex, std::size_t>& c, BitIndex d){ return c.first < d; });
      if (f + 1 == depth){ children.insert(it, {digit, i}); break; }
      if (it != children.end() && it->first == digit){ node = it->second; continue; }
      const std::size_t id = ws.trie_.size();
      children.insert(it, {digit, id});
      ws.trie_.emplace_back();
      node = id;
    }
  }
  return ws;
}

WorkingSet ReducedNoiseOperator::reachable_set(const std::vector<BitIndex>& keys, std::size_t distance, std::size_t max_size,
                                               std::size_t max_flips) const {
  std::vector<BitIndex> frontier(keys);
  std::sort(frontier.begin(), frontier.end());
  frontier.erase(std::unique(frontier.begin(), frontier.end()), frontier.end());
  std::unordered_set<BitIndex> seen(frontier.begin(), frontier.end());
  std::vector<BitIndex> all(frontier);
  bool full = seen.size() >= max_size;
  for (std::size_t step=0; step<distance && !frontier.empty() && !full; ++step){
    std::vector<BitIndex> next;
    for (auto k : frontier){
      for (const auto& fac : factors_){
        const auto& M = *fac.matrix;
        const BitIndex jl = gather_bits(k, fac.positions);
        const BitIndex base = k & ~fac.mask;
        for (std::size_t il=0; il<M.dim; ++il){
          if (il == jl) continue;
          if (M.at(il, jl) == 0.0 && M.at(jl, il) == 0.0) continue;
          BitIndex nk = base | scatter_bits(il, fac.positions);
          if (!seen.insert(nk).second) continue;
          next.push_back(nk);
          all.push_back(nk);
          if (seen.size() >= max_size){ full = true; break; }
        }
        if (full) break;
      }
      if (full) break;
    }
    frontier.swap(next);
  }
  WorkingSet ws = make_working_set(std::move(all), max_flips);
  if (full && distance > 0){
    ws.truncated_ = true;
    log_warn("working set capped at " + std::to_string(ws.size()) + " keys; support expansion truncated");
  }
  return ws;
}

} // namespace qrem
