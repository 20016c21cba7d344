// SPDX-License-Identifier: MIT

#include "qrem/bitstring.hpp"
#include "qrem/calibration.hpp"
#include "qrem/mitigate.hpp"
#include "qrem/solver.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <random>

using namespace qrem;

int main(int argc, char** argv){
  std::size_t n = argc > 1 ? std::stoul(argv[1]) : 30;
  std::size_t nkeys = argc > 2 ? std::stoul(argv[2]) : 2000;
  if (n < 20) nkeys = std::min<std::size_t>(nkeys, std::size_t(1) << n);
  std::mt19937_64 gen(42);
  std::uniform_real_distribution<double> flip(0.005, 0.04);

  CalibrationModel model;
  std::map<std::size_t, std::array<Counts, 2>> runs;
  for (std::size_t q=0; q<n; ++q){
    const std::uint64_t shots = 100000;
    auto n01 = static_cast<std::uint64_t>(flip(gen) * double(shots));
    auto n10 = static_cast<std::uint64_t>(flip(gen) * double(shots));
    runs[q] = {Counts{{"0", shots - n01}, {"1", n01}}, Counts{{"0", n10}, {"1", shots - n10}}};
  }
  model.calibrate_independent(runs);
  std::vector<std::size_t> mapping(n);
  for (std::size_t q=0; q<n; ++q) mapping[q] = q;

  // a GHZ-like peak pair plus scattered noise
  BitstringIndex index(mapping);
  const BitIndex top = n >= 64 ? ~BitIndex(0) : (BitIndex(1) << n) - 1;
  std::uniform_int_distribution<BitIndex> key(0, top);
  std::uniform_int_distribution<std::uint64_t> cnt(1, 20);
  Counts counts;
  counts[index.decode(0)] = 40000;
  counts[index.decode(top)] = 40000;
  while (counts.size() < nkeys) counts[index.decode(key(gen))] += cnt(gen);

  auto op = model.get_operator_for_subset(mapping);
  std::vector<BitIndex> keys;
  for (const auto& kv : counts) keys.push_back(index.encode(kv.first));
  MitigationOptions opts;
  auto t0 = std::chrono::steady_clock::now();
  WorkingSet ws = op->reachable_set(keys, opts.expansion_distance, opts.max_working_set, opts.max_hamming_distance);
  auto t1 = std::chrono::steady_clock::now();
  std::vector<double> x(ws.size(), 1.0 / double(ws.size()));
  for (int rep=0; rep<10; ++rep) x = op->apply_dense(x, ws);
  auto t2 = std::chrono::steady_clock::now();

  auto q = correct(counts, mapping, model, opts);
  auto t3 = std::chrono::steady_clock::now();

  std::chrono::duration<double> dws = t1 - t0, dapply = t2 - t1, dsolve = t3 - t2;
  std::cout << "Qubits: " << n << ", observed keys: " << counts.size() << ", working set: " << ws.size() << "\n";
  std::cout << "Working set seconds: " << dws.count() << "\n";
  std::cout << "Restricted apply seconds (x10): " << dapply.count() << "\n";
  std::cout << "Correct seconds: " << dsolve.count() << " (" << to_string(q.report().status)
            << ", " << q.report().iterations << " iterations, residual " << q.report().residual << ")\n";
  return 0;
}
