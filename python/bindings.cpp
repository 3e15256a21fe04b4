// =============================================================================
// poppk - Python bindings
// =============================================================================
// Thin wrapper over the core: load a configuration, simulate a cohort and
// summarise it. Errors are raised as RuntimeError.
// =============================================================================

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>

#include "poppk/v1/core.hpp"

namespace py = pybind11;
using namespace poppk::v1;

// =============================================================================
// Helper: Convert Result to Python (raise exception on error)
// =============================================================================

template<typename T>
T unwrap_result(Result<T>&& result, const char* context) {
    if (!result) {
        throw std::runtime_error(std::string(context) + ": " + result.error().to_string());
    }
    return std::move(*result);
}

// =============================================================================
// Module Definition
// =============================================================================

PYBIND11_MODULE(_poppk, m) {
    m.doc() = "poppk population pharmacokinetics simulator (C++ extension)";
    m.attr("__version__") = poppk::kVersion;

    py::enum_<DoseRoute>(m, "DoseRoute", "Administration route")
        .value("Oral", DoseRoute::Oral)
        .value("IvBolus", DoseRoute::IvBolus)
        .value("IvInfusion", DoseRoute::IvInfusion);

    py::enum_<StreamMode>(m, "StreamMode", "Random stream layout")
        .value("Shared", StreamMode::Shared)
        .value("PerPatient", StreamMode::PerPatient);

    py::class_<Config>(m, "Config", "Validated simulation configuration")
        .def_property_readonly("compartments", [](const Config& c) { return c.model.compartments; })
        .def_property_readonly("route", [](const Config& c) { return c.dosing.route; })
        .def_property_readonly("time_points",
                               [](const Config& c) { return c.simulation.time_points; })
        .def_property_readonly("parameter_names", [](const Config& c) {
            std::vector<std::string> names;
            for (const auto& p : c.model.parameters) names.push_back(p.name);
            return names;
        });

    py::class_<Demographics>(m, "Demographics")
        .def_readonly("weight", &Demographics::weight)
        .def_readonly("age", &Demographics::age);

    py::class_<Observation>(m, "Observation")
        .def_readonly("time", &Observation::time)
        .def_readonly("concentration", &Observation::concentration)
        .def_readonly("predicted_concentration", &Observation::predicted_concentration);

    py::class_<PatientResult>(m, "PatientResult")
        .def_readonly("patient_id", &PatientResult::patient_id)
        .def_readonly("demographics", &PatientResult::demographics)
        .def_readonly("parameters", &PatientResult::parameters)
        .def_readonly("observations", &PatientResult::observations);

    py::class_<SummaryStatistic>(m, "SummaryStatistic")
        .def_readonly("mean", &SummaryStatistic::mean)
        .def_readonly("sd", &SummaryStatistic::sd)
        .def_readonly("count", &SummaryStatistic::count)
        .def_property_readonly("cv_percent", &SummaryStatistic::cv_percent);

    py::class_<PopulationSummary>(m, "PopulationSummary")
        .def_readonly("n_patients", &PopulationSummary::n_patients)
        .def_readonly("cl", &PopulationSummary::cl)
        .def_readonly("v", &PopulationSummary::v)
        .def_readonly("cmax", &PopulationSummary::cmax)
        .def_readonly("auc", &PopulationSummary::auc)
        .def_readonly("tmax", &PopulationSummary::tmax);

    m.def("load_config", [](const std::filesystem::path& path, bool strict) {
        parser::ConfigParser config_parser(parser::ConfigParserOptions{strict, {}});
        return unwrap_result(config_parser.load(path), "load_config");
    }, py::arg("path"), py::arg("strict") = true,
       "Load a JSON, YAML or control-stream configuration");

    m.def("simulate", [](const Config& config, std::size_t n_patients,
                         std::optional<std::uint64_t> seed, StreamMode stream_mode,
                         std::size_t threads) {
        PopulationOptions options;
        options.n_patients = n_patients;
        options.seed = seed;
        options.stream_mode = stream_mode;
        options.threads = threads;
        PopulationSimulator simulator(config, std::move(options));
        py::gil_scoped_release release;
        return unwrap_result(simulator.run(), "simulate").patients;
    }, py::arg("config"), py::arg("n_patients") = 100, py::arg("seed") = py::none(),
       py::arg("stream_mode") = StreamMode::Shared, py::arg("threads") = 1,
       "Simulate a cohort; returns a list of PatientResult");

    m.def("summarize", [](const std::vector<PatientResult>& results) {
        return summarize_population(results);
    }, py::arg("results"), "Population summary of simulated patients");
}
