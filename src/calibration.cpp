// SPDX-License-Identifier: MIT

#include "qrem/calibration.hpp"
#include "qrem/bitstring.hpp"
#include "qrem/log.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#include <set>

namespace qrem {

namespace {

constexpr char kCalMagic[8] = "QREMCAL";
constexpr std::uint32_t kCalVersion = 1;
// Written in the header flags in the writer's byte order; files are read back
// only on hosts with the same order.
constexpr std::uint32_t kByteOrderMark = 0x01020304u;
constexpr std::uint32_t kSwappedByteOrderMark = 0x04030201u;

struct CalHeader { char magic[8]; std::uint32_t version; std::uint32_t flags; std::uint64_t ngroups; };
struct GroupHeader { std::uint32_t kind; std::uint32_t nqubits; };

// Throws if m would split an existing group.
void check_overlap(const std::vector<std::shared_ptr<const CalibrationMatrix>>& groups,
                   const std::map<std::size_t, std::size_t>& group_of, const CalibrationMatrix& m){
  std::set<std::size_t> incoming(m.qubits.begin(), m.qubits.end());
  for (auto q : m.qubits){
    auto it = group_of.find(q);
    if (it == group_of.end()) continue;
    for (auto other : groups[it->second]->qubits){
      if (!incoming.count(other))
        throw Error(ErrorCode::InvalidArgument, "recalibrating qubit " + std::to_string(q) + " would split the correlated group containing qubit " + std::to_string(other));
    }
  }
}

} // namespace

CalibrationModel::CalibrationModel(std::size_t max_correlated_subset) : max_correlated_(max_correlated_subset) {}

void CalibrationModel::invalidate_cache_(){
  std::lock_guard<std::mutex> lk(cache_mtx_);
  op_cache_.clear();
}

void CalibrationModel::install_(std::shared_ptr<const CalibrationMatrix> m){
  std::set<std::size_t> replaced;
  for (auto q : m->qubits){
    auto it = group_of_.find(q);
    if (it != group_of_.end()) replaced.insert(it->second);
  }
  std::vector<std::shared_ptr<const CalibrationMatrix>> kept;
  kept.reserve(groups_.size() + 1);
  for (std::size_t g=0; g<groups_.size(); ++g) if (!replaced.count(g)) kept.push_back(groups_[g]);
  kept.push_back(std::move(m));
  groups_.swap(kept);
  group_of_.clear();
  for (std::size_t g=0; g<groups_.size(); ++g)
    for (auto q : groups_[g]->qubits) group_of_[q] = g;
}

void CalibrationModel::calibrate_independent(const std::map<std::size_t, std::array<Counts, 2>>& per_qubit){
  std::vector<std::shared_ptr<const CalibrationMatrix>> built;
  built.reserve(per_qubit.size());
  for (const auto& [q, runs] : per_qubit){
    built.push_back(std::make_shared<const CalibrationMatrix>(
      CalibrationMatrix::from_counts(CalibrationMatrix::Kind::Independent, {q}, {runs[0], runs[1]})));
  }
  std::unique_lock<std::shared_mutex> lk(mtx_);
  for (const auto& m : built) check_overlap(groups_, group_of_, *m);
  for (auto& m : built) install_(std::move(m));
  invalidate_cache_();
  log_debug("calibrated " + std::to_string(built.size()) + " independent qubits");
}

void CalibrationModel::calibrate_correlated(const std::vector<std::size_t>& subset, const std::vector<Counts>& per_state){
  if (subset.empty()) throw Error(ErrorCode::InvalidArgument, "correlated subset is empty");
  if (subset.size() > max_correlated_)
    throw Error(ErrorCode::SubsetTooLarge, "correlated subset of " + std::to_string(subset.size()) + " qubits exceeds the bound of " + std::to_string(max_correlated_));
  auto m = std::make_shared<const CalibrationMatrix>(
    CalibrationMatrix::from_counts(CalibrationMatrix::Kind::Correlated, subset, per_state));
  std::unique_lock<std::shared_mutex> lk(mtx_);
  check_overlap(groups_, group_of_, *m);
  install_(std::move(m));
  invalidate_cache_();
}

void CalibrationModel::calibrate_from_prepared(const std::vector<std::size_t>& qubits, const std::vector<std::pair<std::string, Counts>>& runs){
  BitstringIndex index(qubits);
  const std::size_t k = qubits.size();
  // tally[i][prepared][measured]
  std::vector<std::array<std::array<double, 2>, 2>> tally(k);
  for (const auto& [prep, counts] : runs){
    BitIndex p = index.encode(normalize_key(prep));
    for (const auto& [key, n] : counts){
      BitIndex meas = index.encode(normalize_key(key));
      for (std::size_t i=0; i<k; ++i) tally[i][(p >> i) & 1ULL][(meas >> i) & 1ULL] += double(n);
    }
  }
  std::vector<std::shared_ptr<const CalibrationMatrix>> built;
  built.reserve(k);
  for (std::size_t i=0; i<k; ++i){
    CalibrationMatrix m;
    m.kind = CalibrationMatrix::Kind::Independent;
    m.qubits = {qubits[i]};
    m.dim = 2;
    m.data.assign(4, 0.0);
    for (std::size_t j=0; j<2; ++j){
      double total = tally[i][j][0] + tally[i][j][1];
      if (total <= 0.0)
        throw Error(ErrorCode::UncalibratedQubit, "qubit " + std::to_string(qubits[i]) + " was never prepared in state " + std::to_string(j));
      m.data[0*2 + j] = tally[i][j][0] / total;
      m.data[1*2 + j] = tally[i][j][1] / total;
    }
    built.push_back(std::make_shared<const CalibrationMatrix>(std::move(m)));
  }
  std::unique_lock<std::shared_mutex> lk(mtx_);
  for (const auto& m : built) check_overlap(groups_, group_of_, *m);
  for (auto& m : built) install_(std::move(m));
  invalidate_cache_();
}

std::shared_ptr<const ReducedNoiseOperator> CalibrationModel::build_operator_(const std::vector<std::size_t>& qubits) const {
  BitstringIndex index(qubits);
  // groups in order of their first qubit in the subset
  std::vector<std::size_t> order;
  std::map<std::size_t, std::vector<std::size_t>> present;
  for (auto q : qubits){
    auto it = group_of_.find(q);
    if (it == group_of_.end()) throw Error(ErrorCode::UncalibratedQubit, "qubit " + std::to_string(q) + " has no calibration data");
    auto& list = present[it->second];
    if (list.empty()) order.push_back(it->second);
    list.push_back(q);
  }
  std::vector<NoiseFactor> factors;
  factors.reserve(order.size());
  for (auto g : order){
    const auto& group = groups_[g];
    const auto& here = present[g];
    NoiseFactor f;
    if (here.size() == group->qubits.size()){
      f.matrix = group;
    } else {
      std::vector<std::size_t> keep;
      for (auto q : group->qubits) if (std::find(here.begin(), here.end(), q) != here.end()) keep.push_back(q);
      f.matrix = std::make_shared<const CalibrationMatrix>(group->marginal(keep));
    }
    for (auto q : f.matrix->qubits) f.positions.push_back(index.position_of(q));
    factors.push_back(std::move(f));
  }
  return std::make_shared<const ReducedNoiseOperator>(qubits, std::move(factors));
}

std::shared_ptr<const ReducedNoiseOperator> CalibrationModel::get_operator_for_subset(const std::vector<std::size_t>& qubits) const {
  std::shared_lock<std::shared_mutex> lk(mtx_);
  {
    std::lock_guard<std::mutex> ck(cache_mtx_);
    auto it = op_cache_.find(qubits);
    if (it != op_cache_.end()) return it->second;
  }
  auto op = build_operator_(qubits);
  std::lock_guard<std::mutex> ck(cache_mtx_);
  op_cache_.emplace(qubits, op);
  return op;
}

bool CalibrationModel::is_calibrated(std::size_t qubit) const {
  std::shared_lock<std::shared_mutex> lk(mtx_);
  return group_of_.count(qubit) != 0;
}

std::vector<std::size_t> CalibrationModel::qubits() const {
  std::shared_lock<std::shared_mutex> lk(mtx_);
  std::vector<std::size_t> out;
  out.reserve(group_of_.size());
  for (const auto& kv : group_of_) out.push_back(kv.first);
  return out;
}

std::shared_ptr<const CalibrationMatrix> CalibrationModel::matrix_for(std::size_t qubit) const {
  std::shared_lock<std::shared_mutex> lk(mtx_);
  auto it = group_of_.find(qubit);
  if (it == group_of_.end()) throw Error(ErrorCode::UncalibratedQubit, "qubit " + std::to_string(qubit) + " has no calibration data");
  return groups_[it->second];
}

double CalibrationModel::readout_fidelity(std::size_t qubit) const {
  auto m = matrix_for(qubit);
  if (m->qubits.size() == 1) return m->mean_diagonal();
  return m->marginal({qubit}).mean_diagonal();
}

void CalibrationModel::clear(){
  std::unique_lock<std::shared_mutex> lk(mtx_);
  groups_.clear();
  group_of_.clear();
  invalidate_cache_();
}

bool CalibrationModel::save(const std::string& path) const {
  std::shared_lock<std::shared_mutex> lk(mtx_);
  CalHeader h; std::memcpy(h.magic, kCalMagic, 8); h.version = kCalVersion; h.flags = kByteOrderMark; h.ngroups = groups_.size();
  std::ofstream out(path, std::ios::binary);
  if (!out) return false;
  out.write(reinterpret_cast<const char*>(&h), sizeof(h));
  for (const auto& g : groups_){
    GroupHeader gh{ g->kind == CalibrationMatrix::Kind::Correlated ? 1u : 0u, static_cast<std::uint32_t>(g->qubits.size()) };
    out.write(reinterpret_cast<const char*>(&gh), sizeof(gh));
    for (auto q : g->qubits){ std::uint64_t v = q; out.write(reinterpret_cast<const char*>(&v), sizeof(v)); }
    out.write(reinterpret_cast<const char*>(g->data.data()), sizeof(double)*g->data.size());
  }
  return bool(out);
}

bool CalibrationModel::load(const std::string& path, std::string& err){
  std::ifstream in(path, std::ios::binary);
  if (!in){ err = "Cannot open calibration file: " + path; return false; }
  CalHeader h;
  in.read(reinterpret_cast<char*>(&h), sizeof(h));
  if (!in){ err = "Truncated calibration header"; return false; }
  if (std::memcmp(h.magic, kCalMagic, 7) != 0){ err = "Not a calibration file: " + path; return false; }
  if (h.flags == kSwappedByteOrderMark){ err = "Calibration file was written with a different byte order: " + path; return false; }
  if (h.flags != kByteOrderMark){ err = "Invalid calibration header flags"; return false; }
  if (h.version != kCalVersion){ err = "Unsupported calibration format version " + std::to_string(h.version); return false; }
  std::vector<std::shared_ptr<const CalibrationMatrix>> groups;
  std::set<std::size_t> seen;
  for (std::uint64_t g=0; g<h.ngroups; ++g){
    GroupHeader gh;
    in.read(reinterpret_cast<char*>(&gh), sizeof(gh));
    if (!in){ err = "Truncated group header"; return false; }
    if (gh.kind > 1 || gh.nqubits == 0 || (gh.kind == 0 && gh.nqubits != 1) || gh.nqubits > max_correlated_){
      err = "Invalid calibration group " + std::to_string(g); return false;
    }
    CalibrationMatrix m;
    m.kind = gh.kind == 1 ? CalibrationMatrix::Kind::Correlated : CalibrationMatrix::Kind::Independent;
    for (std::uint32_t i=0; i<gh.nqubits; ++i){
      std::uint64_t q = 0;
      in.read(reinterpret_cast<char*>(&q), sizeof(q));
      if (!in){ err = "Truncated qubit list"; return false; }
      if (!seen.insert(static_cast<std::size_t>(q)).second){ err = "Qubit " + std::to_string(q) + " calibrated twice"; return false; }
      m.qubits.push_back(static_cast<std::size_t>(q));
    }
    m.dim = std::size_t(1) << gh.nqubits;
    m.data.resize(m.dim*m.dim);
    in.read(reinterpret_cast<char*>(m.data.data()), sizeof(double)*m.data.size());
    if (!in){ err = "Truncated matrix data"; return false; }
    for (double v : m.data){
      if (!std::isfinite(v) || v < 0.0){ err = "Invalid matrix entry in group " + std::to_string(g); return false; }
    }
    if (m.stochastic_error() > 1e-9){ err = "Group " + std::to_string(g) + " is not column-stochastic"; return false; }
    groups.push_back(std::make_shared<const CalibrationMatrix>(std::move(m)));
  }
  std::unique_lock<std::shared_mutex> lk(mtx_);
  groups_.swap(groups);
  group_of_.clear();
  for (std::size_t g=0; g<groups_.size(); ++g)
    for (auto q : groups_[g]->qubits) group_of_[q] = g;
  invalidate_cache_();
  log_info("loaded calibration for " + std::to_string(group_of_.size()) + " qubits from " + path);
  return true;
}

} // namespace qrem
