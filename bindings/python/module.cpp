// SPDX-License-Identifier: MIT

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "qrem/expval.hpp"
#include "qrem/mitigate.hpp"

namespace py = pybind11;
using namespace qrem;

PYBIND11_MODULE(qrem_python, m){
  m.doc() = "Matrix-free readout error mitigation";
  py::register_exception<Error>(m, "QremError", PyExc_RuntimeError);

  py::class_<MitigationOptions>(m, "MitigationOptions")
    .def(py::init<>())
    .def_readwrite("tol", &MitigationOptions::tol)
    .def_readwrite("max_iter", &MitigationOptions::max_iter)
    .def_readwrite("restart", &MitigationOptions::restart)
    .def_readwrite("expansion_distance", &MitigationOptions::expansion_distance)
    .def_readwrite("max_working_set", &MitigationOptions::max_working_set)
    .def_readwrite("estimate_overhead", &MitigationOptions::estimate_overhead)
    .def_readwrite("threads", &MitigationOptions::threads)
    .def_readwrite("max_hamming_distance", &MitigationOptions::max_hamming_distance)
    .def_readwrite("max_correlated_subset", &MitigationOptions::max_correlated_subset)
    .def_property("log_level",
      [](const MitigationOptions& o) -> py::object {
        if (!o.log_level) return py::none();
        return py::str(to_string(*o.log_level));
      },
      [](MitigationOptions& o, const std::optional<std::string>& s){
        if (!s){ o.log_level.reset(); return; }
        auto lvl = parse_log_level(*s);
        if (!lvl) throw Error(ErrorCode::InvalidArgument, "unknown log level: " + *s);
        o.log_level = lvl;
      });
  m.def("load_options", [](const std::string& path){
    std::string err; auto o = load_options_file(path, err);
    if (!o) throw std::runtime_error(err);
    return *o;
  });

  py::class_<CalibrationModel>(m, "CalibrationModel")
    .def(py::init<std::size_t>(), py::arg("max_correlated_subset") = kDefaultMaxCorrelatedSubset)
    .def(py::init<const MitigationOptions&>())
    .def("calibrate_independent", &CalibrationModel::calibrate_independent, py::call_guard<py::gil_scoped_release>())
    .def("calibrate_correlated", &CalibrationModel::calibrate_correlated, py::call_guard<py::gil_scoped_release>())
    .def("calibrate_from_prepared", &CalibrationModel::calibrate_from_prepared, py::call_guard<py::gil_scoped_release>())
    .def("is_calibrated", &CalibrationModel::is_calibrated)
    .def("qubits", &CalibrationModel::qubits)
    .def("readout_fidelity", &CalibrationModel::readout_fidelity)
    .def("save", [](const CalibrationModel& c, const std::string& path){
      if (!c.save(path)) throw std::runtime_error("Cannot write calibration file: " + path);
    })
    .def("load", [](CalibrationModel& c, const std::string& path){
      std::string err;
      if (!c.load(path, err)) throw std::runtime_error(err);
    });

  py::class_<QuasiDistribution>(m, "QuasiDistribution")
    .def("values", &QuasiDistribution::values)
    .def("shots", &QuasiDistribution::shots)
    .def("__getitem__", &QuasiDistribution::operator[])
    .def("__len__", &QuasiDistribution::size)
    .def("status", [](const QuasiDistribution& q){ return std::string(to_string(q.report().status)); })
    .def("iterations", [](const QuasiDistribution& q){ return q.report().iterations; })
    .def("mitigation_overhead", &QuasiDistribution::mitigation_overhead)
    .def("nearest_probability_distribution", [](const QuasiDistribution& q){
      return q.nearest_probability_distribution().values();
    });

  m.def("correct", [](const Counts& counts, const std::vector<std::size_t>& mapping, const CalibrationModel& cal,
                      const MitigationOptions& opts){
    py::gil_scoped_release release;
    return correct(counts, mapping, cal, opts);
  }, py::arg("counts"), py::arg("qubit_mapping"), py::arg("calibration"), py::arg("options") = MitigationOptions{});

  // per item: QuasiDistribution, or (error code name, message)
  m.def("correct_batch", [](const std::vector<std::pair<Counts, std::vector<std::size_t>>>& items, const CalibrationModel& cal,
                            const MitigationOptions& opts){
    std::vector<CountsJob> jobs;
    jobs.reserve(items.size());
    for (const auto& [c, q] : items) jobs.push_back({c, q});
    std::vector<BatchItem> out;
    {
      py::gil_scoped_release release;
      out = correct_batch(jobs, cal, opts);
    }
    py::list res;
    for (auto& item : out){
      if (item.ok()) res.append(py::cast(std::move(*item.result)));
      else res.append(py::make_tuple(item.code_name(), item.error));
    }
    return res;
  }, py::arg("items"), py::arg("calibration"), py::arg("options") = MitigationOptions{});

  // terms over {0,1,Z,I} with coefficients
  m.def("expval", [](const Counts& counts, const std::vector<std::pair<std::string, double>>& terms){
    auto r = ProbDistribution::from_counts(counts).expval_and_stddev(Observable::from_terms(terms));
    return py::make_tuple(r.value, r.stddev);
  });
  m.def("expval", [](const QuasiDistribution& q, const std::vector<std::pair<std::string, double>>& terms){
    auto r = q.expval_and_stddev(Observable::from_terms(terms));
    return py::make_tuple(r.value, r.stddev);
  });
}
