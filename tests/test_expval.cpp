// SPDX-License-Identifier: MIT

#include "qrem/expval.hpp"
#include "check.hpp"

using namespace qrem;

int main(){
  // projector on a single outcome
  {
    auto p = ProbDistribution::from_counts({{"000", 100}});
    EXPECT_EQ(expval(p, Observable::from_weights({{"000", 1.0}})), 1.0);
    EXPECT_EQ(expval(p, Observable::from_weights({{"001", 1.0}})), 0.0);
  }

  auto p = ProbDistribution::from_counts({{"00", 500}, {"01", 250}, {"11", 250}});
  // Z on the rightmost bit, identity on the left
  EXPECT_NEAR(expval(p, Observable::z_string("IZ")), 0.5 - 0.25 - 0.25, 1e-15);
  EXPECT_NEAR(expval(p, Observable::all_z(2)), 0.5 - 0.25 + 0.25, 1e-15);
  EXPECT_NEAR(expval(p, Observable::z_string("0Z", 2.0)), 2.0*(0.5 - 0.25), 1e-15);
  auto mixed = Observable::from_terms({{"ZZ", 0.5}, {"11", 1.0}, {"II", -0.25}});
  EXPECT_NEAR(mixed.weight("11"), 0.5 + 1.0 - 0.25, 1e-15);
  EXPECT_NEAR(mixed.max_abs_weight(), 1.75, 1e-15);

  {
    auto r = p.expval_and_stddev(Observable::all_z(2));
    EXPECT_NEAR(r.value, 0.5, 1e-15);
    EXPECT_NEAR(r.stddev, std::sqrt((1.0 - 0.25) / 1000.0), 1e-15);
  }

  EXPECT_THROW_CODE(expval(p, Observable::z_string("ZZZ")), ErrorCode::InvalidLength);
  EXPECT_THROW_CODE(Observable::z_string("ZX"), ErrorCode::InvalidArgument);
  EXPECT_THROW_CODE(Observable::from_terms({{"Z", 1.0}, {"ZZ", 1.0}}), ErrorCode::InvalidLength);
  EXPECT_THROW_CODE(Observable::from_weights({}), ErrorCode::InvalidArgument);

  // heavy outputs of an ideal distribution
  {
    auto heavy = Observable::heavy_output({{"00", 0.4}, {"01", 0.1}, {"10", 0.3}, {"11", 0.2}});
    EXPECT_EQ(heavy.weight("00"), 1.0);
    EXPECT_EQ(heavy.weight("10"), 1.0);
    EXPECT_EQ(heavy.weight("11"), 0.0);
    EXPECT_NEAR(expval(p, heavy), 0.5, 1e-15);
  }

  // batches: one observable is broadcast, otherwise pairwise
  {
    std::vector<ProbDistribution> dists = {
      ProbDistribution::from_counts({{"0", 10}}),
      ProbDistribution::from_counts({{"1", 10}}),
      ProbDistribution::from_counts({{"0", 5}, {"1", 5}})};
    auto zs = expval(dists, {Observable::z_string("Z")});
    EXPECT_EQ(zs.size(), 3u);
    EXPECT_NEAR(zs[0], 1.0, 0.0);
    EXPECT_NEAR(zs[1], -1.0, 0.0);
    EXPECT_NEAR(zs[2], 0.0, 1e-15);

    std::vector<Observable> obs = {Observable::z_string("Z"), Observable::z_string("Z", -1.0), Observable::from_weights({{"1", 3.0}})};
    auto pair = expval_and_stddev(dists, obs);
    EXPECT_NEAR(pair[1].value, 1.0, 0.0);
    EXPECT_NEAR(pair[2].value, 1.5, 1e-15);
    EXPECT_NEAR(pair[2].stddev, std::sqrt((4.5 - 2.25) / 10.0), 1e-15);

    std::vector<Observable> two(obs.begin(), obs.begin() + 2);
    EXPECT_THROW_CODE(expval(dists, two), ErrorCode::DimensionMismatch);

    std::vector<QuasiDistribution> quasi = {QuasiDistribution({{"0", 1.2}, {"1", -0.2}}, 100, SolveReport{}, 2.25)};
    auto qr = expval_and_stddev(quasi, {Observable::z_string("Z")});
    EXPECT_NEAR(qr[0].value, 1.4, 1e-15);
    EXPECT_NEAR(qr[0].stddev, 0.15, 1e-15);

    // a bad pairing surfaces with its own error code
    std::vector<Observable> wide = {Observable::z_string("ZZ")};
    EXPECT_THROW_CODE(expval(dists, wide), ErrorCode::InvalidLength);
  }
  return TEST_RESULT();
}
