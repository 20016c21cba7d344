// SPDX-License-Identifier: MIT

#include "qrem/bitstring.hpp"
#include "qrem/calibration.hpp"
#include "check.hpp"
#include <random>

using namespace qrem;

static double total(const SparseVector& v){
  double s = 0.0;
  for (const auto& kv : v) s += kv.second;
  return s;
}

int main(){
  std::mt19937_64 gen(7);
  CalibrationModel model;
  model.calibrate_independent({{0, qubit_runs(0.02, 0.06)}, {1, qubit_runs(0.01, 0.03)}, {4, qubit_runs(0.05, 0.08)}});
  std::vector<Counts> states = {
    Counts{{"00", 93}, {"01", 4}, {"10", 3}}, Counts{{"01", 90}, {"11", 6}, {"00", 4}},
    Counts{{"10", 91}, {"00", 7}, {"11", 2}}, Counts{{"11", 88}, {"10", 7}, {"01", 5}}};
  model.calibrate_correlated({2, 3}, states);
  const std::vector<std::size_t> subset = {0, 1, 2, 3, 4};
  auto op = model.get_operator_for_subset(subset);

  // column-stochastic map conserves total mass
  for (int trial=0; trial<10; ++trial){
    std::uniform_int_distribution<BitIndex> key(0, 31);
    std::uniform_real_distribution<double> val(-1.0, 1.0);
    SparseVector x;
    for (int i=0; i<6; ++i) x[key(gen)] += val(gen);
    EXPECT_NEAR(total(op->apply(x)), total(x), 1e-12);
  }

  // restricted apply equals the I x I block of the full map
  std::vector<BitIndex> keys = {0, 3, 5, 12, 17, 30};
  WorkingSet ws = op->make_working_set(keys);
  EXPECT_EQ(ws.size(), keys.size());
  for (std::size_t c=0; c<keys.size(); ++c){
    SparseVector e{{keys[c], 1.0}};
    SparseVector full = op->apply(e);
    SparseVector block = op->apply(e, ws);
    for (auto r : keys){
      double want = full.count(r) ? full.at(r) : 0.0;
      double got = block.count(r) ? block.at(r) : 0.0;
      EXPECT_NEAR(got, want, 1e-14);
    }
    for (const auto& kv : block) EXPECT_TRUE(ws.contains(kv.first));
    // diagonal agrees with the applied basis vector
    EXPECT_NEAR(op->diagonal(keys[c]), full.at(keys[c]), 1e-14);
  }

  // transpose: <y, A x> == <A^T y, x> on the working set
  {
    std::vector<double> xd = {0.3, -0.2, 0.5, 0.1, 0.0, 0.7};
    std::vector<double> yd = {-0.4, 0.6, 0.2, 0.9, -0.1, 0.05};
    auto ax = ws.to_dense(op->apply(ws.to_sparse(xd), ws));
    auto aty = ws.to_dense(op->apply_transpose(ws.to_sparse(yd), ws));
    double l = 0.0, r = 0.0;
    for (std::size_t i=0; i<ws.size(); ++i){ l += yd[i]*ax[i]; r += aty[i]*xd[i]; }
    EXPECT_NEAR(l, r, 1e-13);
  }

  // a flip budget keeps only entries within that Hamming distance
  {
    std::vector<BitIndex> all;
    for (BitIndex k=0; k<32; ++k) all.push_back(k);
    WorkingSet near = op->make_working_set(all, 1);
    EXPECT_EQ(near.max_flips(), 1u);
    for (BitIndex c=0; c<32; ++c){
      SparseVector full = op->apply(SparseVector{{c, 1.0}});
      SparseVector block = op->apply(SparseVector{{c, 1.0}}, near);
      SparseVector back = op->apply_transpose(SparseVector{{c, 1.0}}, near);
      for (BitIndex r=0; r<32; ++r){
        double want = (hamming_weight(r ^ c) <= 1 && full.count(r)) ? full.at(r) : 0.0;
        EXPECT_NEAR(block.count(r) ? block.at(r) : 0.0, want, 1e-14);
        SparseVector col = op->apply(SparseVector{{r, 1.0}});
        double want_t = (hamming_weight(r ^ c) <= 1 && col.count(c)) ? col.at(c) : 0.0;
        EXPECT_NEAR(back.count(r) ? back.at(r) : 0.0, want_t, 1e-14);
      }
    }
    EXPECT_THROW_CODE((void)op->apply_dense(std::vector<double>(3, 1.0), near), ErrorCode::DimensionMismatch);
  }

  // subset order is part of the operator's identity
  op->check_subset(subset);
  EXPECT_THROW_CODE(op->check_subset({1, 0, 2, 3, 4}), ErrorCode::DimensionMismatch);
  EXPECT_THROW_CODE(op->check_subset({0, 1, 2}), ErrorCode::DimensionMismatch);

  // support expansion follows nonzero off-diagonals only
  {
    CalibrationModel ideal;
    ideal.calibrate_independent({{0, qubit_runs(0.0, 0.0)}, {1, qubit_runs(0.0, 0.0)}, {2, qubit_runs(0.0, 0.0)}});
    auto iop = ideal.get_operator_for_subset({0, 1, 2});
    WorkingSet same = iop->reachable_set({1, 6}, 3, 1000);
    EXPECT_EQ(same.size(), 2u);
    EXPECT_TRUE(!same.truncated());

    WorkingSet one = op->reachable_set({0}, 1, 1000);
    // three single flips, plus "01" and "10" on the pair; "11" has no direct path from "00"
    EXPECT_EQ(one.size(), 1u + 3u + 2u);
    WorkingSet capped = op->reachable_set({0}, 5, 4);
    EXPECT_EQ(capped.size(), 4u);
    EXPECT_TRUE(capped.truncated());
    WorkingSet everything = op->reachable_set({0}, 5, 1000);
    EXPECT_EQ(everything.size(), 32u);
  }

  // factors must tile the subset exactly once
  {
    auto m = model.matrix_for(0);
    EXPECT_THROW_CODE((void)ReducedNoiseOperator({0, 1}, {NoiseFactor{m, {0}, 0}}), ErrorCode::UncalibratedSubset);
    EXPECT_THROW_CODE((void)ReducedNoiseOperator({0, 1}, {NoiseFactor{m, {0}, 0}, NoiseFactor{m, {0}, 0}}), ErrorCode::InvalidArgument);
    EXPECT_THROW_CODE((void)ReducedNoiseOperator({0, 1}, {NoiseFactor{m, {0, 1}, 0}}), ErrorCode::DimensionMismatch);
  }
  return TEST_RESULT();
}
