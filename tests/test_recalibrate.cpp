// SPDX-License-Identifier: MIT

#include "qrem/mitigate.hpp"
#include "check.hpp"
#include <atomic>
#include <thread>

using namespace qrem;

static bool matches(const QuasiDistribution& q, const QuasiDistribution& ref){
  for (const auto& [k, v] : ref.values()) if (std::fabs(q[k] - v) > 1e-9) return false;
  return q.size() == ref.size();
}

int main(){
  set_log_level(LogLevel::Off);
  const std::map<std::size_t, std::array<Counts, 2>> mild = {{0, qubit_runs(0.1, 0.1)}, {1, qubit_runs(0.1, 0.1)}};
  const std::map<std::size_t, std::array<Counts, 2>> harsh = {{0, qubit_runs(0.2, 0.2)}, {1, qubit_runs(0.2, 0.2)}};
  const Counts counts = {{"00", 810}, {"01", 90}, {"10", 90}, {"11", 10}};
  const std::vector<std::size_t> mapping = {0, 1};

  CalibrationModel mild_model, harsh_model;
  mild_model.calibrate_independent(mild);
  harsh_model.calibrate_independent(harsh);
  const QuasiDistribution ref_mild = correct(counts, mapping, mild_model);
  const QuasiDistribution ref_harsh = correct(counts, mapping, harsh_model);
  EXPECT_NEAR(ref_mild["00"], 1.0, 1e-6);
  EXPECT_TRUE(!matches(ref_mild, ref_harsh));

  // readers see one calibration or the other, never a mix or a stale operator
  CalibrationModel model;
  model.calibrate_independent(mild);
  std::atomic<bool> done{false};
  std::atomic<int> bad{0}, reads{0};
  std::thread writer([&](){
    for (int i=0; i<=200; ++i) model.calibrate_independent(i % 2 == 0 ? harsh : mild);
    done = true;
  });
  std::vector<std::thread> readers;
  for (int t=0; t<4; ++t){
    readers.emplace_back([&](){
      int local = 0;
      while (!done || local < 20){
        QuasiDistribution q = correct(counts, mapping, model);
        if (std::fabs(q.sum() - 1.0) > 1e-9) ++bad;
        if (!matches(q, ref_mild) && !matches(q, ref_harsh)) ++bad;
        ++local;
      }
      reads += local;
    });
  }
  writer.join();
  for (auto& r : readers) r.join();
  EXPECT_EQ(bad.load(), 0);
  EXPECT_TRUE(reads.load() >= 80);

  // the last recalibration wins, including for subsets cached earlier
  auto op = model.get_operator_for_subset(mapping);
  EXPECT_NEAR(op->factors()[0].matrix->at(0, 0), 0.8, 1e-12);
  EXPECT_TRUE(matches(correct(counts, mapping, model), ref_harsh));
  model.calibrate_independent(mild);
  EXPECT_TRUE(model.get_operator_for_subset(mapping) != op);
  EXPECT_TRUE(matches(correct(counts, mapping, model), ref_mild));
  return TEST_RESULT();
}
