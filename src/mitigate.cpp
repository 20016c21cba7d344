// SPDX-License-Identifier: MIT

#include "qrem/mitigate.hpp"
#include "qrem/log.hpp"
#include "qrem/solver.hpp"
#include <algorithm>
#include <thread>

namespace qrem {

std::string BatchItem::code_name() const {
  if (ok()) return {};
  return code ? to_string(*code) : "Exception";
}

QuasiDistribution correct(const Counts& counts, const std::vector<std::size_t>& qubit_mapping,
                          const CalibrationModel& calibration, const MitigationOptions& opts){
  if (opts.log_level) set_log_level(*opts.log_level);
  if (qubit_mapping.empty()) throw Error(ErrorCode::InvalidArgument, "qubit mapping is empty");
  ProbDistribution observed = ProbDistribution::from_counts(counts);
  const std::size_t width = observed.values().begin()->first.size();
  if (width != qubit_mapping.size())
    throw Error(ErrorCode::InvalidLength, "counts keys have " + std::to_string(width) + " bits but the mapping lists " + std::to_string(qubit_mapping.size()) + " qubits");
  auto op = calibration.get_operator_for_subset(qubit_mapping);
  IterativeCorrector corrector(opts);
  return corrector.solve(observed, *op, qubit_mapping);
}

std::vector<BatchItem> correct_batch(const std::vector<CountsJob>& jobs, const CalibrationModel& calibration,
                                     const MitigationOptions& opts){
  if (opts.log_level) set_log_level(*opts.log_level);
  std::vector<BatchItem> out(jobs.size());
  if (jobs.empty()) return out;
  unsigned threads = opts.threads ? opts.threads : std::max(1u, std::thread::hardware_concurrency());
  threads = static_cast<unsigned>(std::min<std::size_t>(threads, jobs.size()));

  auto worker = [&](unsigned t){
    std::size_t start = (jobs.size() * t) / threads;
    std::size_t end   = (jobs.size() * (t+1)) / threads;
    for (std::size_t i=start; i<end; ++i){
      try {
        out[i].result = correct(jobs[i].counts, jobs[i].qubit_mapping, calibration, opts);
      } catch (const Error& e){
        out[i].code = e.code();
        out[i].error = e.what();
      } catch (const std::exception& e){
        out[i].error = e.what();
      }
      if (!out[i].ok()) log_warn("batch item " + std::to_string(i) + " failed: " + out[i].error);
    }
  };

  std::vector<std::thread> pool; pool.reserve(threads);
  for (unsigned t=0; t<threads; ++t) pool.emplace_back(worker, t);
  for (auto& th : pool) th.join();
  return out;
}

} // namespace qrem
