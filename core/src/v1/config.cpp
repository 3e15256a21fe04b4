#include "poppk/v1/config.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace poppk::v1 {

namespace {

bool is_positive(Real v) {
    return std::isfinite(v) && v > 0.0;
}

bool is_non_negative(Real v) {
    return std::isfinite(v) && v >= 0.0;
}

std::string format_number(Real v) {
    std::ostringstream ss;
    ss << v;
    return ss.str();
}

Status validate_model(const Config& config) {
    const ModelConfig& model = config.model;
    if (model.compartments < 1 || model.compartments > 3) {
        return make_error(ErrorKind::InvalidModel,
                          "model.compartments must be 1, 2, or 3 (got " +
                              std::to_string(model.compartments) + ")");
    }

    std::vector<std::string> seen;
    for (const auto& param : model.parameters) {
        const auto canonical = canonical_parameter_name(model.compartments, param.name);
        if (!canonical) {
            return make_error(ErrorKind::InvalidModel,
                              "Unknown parameter for " + std::to_string(model.compartments) +
                                  "-compartment model: " + param.name);
        }
        if (std::find(seen.begin(), seen.end(), *canonical) != seen.end()) {
            return make_error(ErrorKind::InvalidModel,
                              "Parameter " + param.name + " is specified more than once");
        }
        seen.push_back(*canonical);

        const std::string path = "model.parameters." + param.name;
        if (!is_positive(param.theta)) {
            return make_error(ErrorKind::Validation,
                              "Parameter " + param.name + " must be positive (" + path +
                                  ".theta = " + format_number(param.theta) + ")");
        }
        if (param.omega && !is_non_negative(*param.omega)) {
            return make_error(ErrorKind::Validation,
                              path + ".omega must be a non-negative CV%");
        }
        if (param.bounds) {
            const auto [lo, hi] = *param.bounds;
            if (std::isnan(lo) || std::isnan(hi) || lo > hi) {
                return make_error(ErrorKind::Validation,
                                  path + ".bounds must satisfy lower <= upper");
            }
        }
    }

    for (const auto& name : required_parameters(model.compartments, config.dosing.route)) {
        const auto canonical = canonical_parameter_name(model.compartments, name);
        if (std::find(seen.begin(), seen.end(), *canonical) == seen.end()) {
            return make_error(ErrorKind::InvalidModel, "Missing required parameter: " + name);
        }
    }
    return std::nullopt;
}

Status validate_dosing(const DosingConfig& dosing) {
    if (!is_positive(dosing.amount)) {
        return make_error(ErrorKind::InvalidDosing, "Dose amount must be positive (dosing.amount)");
    }
    if (dosing.times.empty()) {
        return make_error(ErrorKind::InvalidDosing,
                          "At least one dosing time must be specified (dosing.times)");
    }
    for (std::size_t i = 0; i < dosing.times.size(); ++i) {
        if (!is_non_negative(dosing.times[i])) {
            return make_error(ErrorKind::InvalidDosing,
                              "dosing.times[" + std::to_string(i) + "] must be finite and >= 0");
        }
    }

    if (dosing.route == DoseRoute::IvInfusion) {
        const auto duration = dosing.duration();
        if (!duration || !is_positive(*duration)) {
            return make_error(ErrorKind::InvalidDosing,
                              "Infusion duration must be specified and positive "
                              "(dosing.additional.duration)");
        }
    }

    if (dosing.additional) {
        const auto& add = *dosing.additional;
        if (add.duration && !is_positive(*add.duration)) {
            return make_error(ErrorKind::InvalidDosing,
                              "dosing.additional.duration must be positive");
        }
        if (add.bioavailability &&
            (!is_positive(*add.bioavailability) || *add.bioavailability > 1.0)) {
            return make_error(ErrorKind::InvalidDosing,
                              "dosing.additional.bioavailability must be in (0, 1]");
        }
        if (add.lag_time && !is_non_negative(*add.lag_time)) {
            return make_error(ErrorKind::InvalidDosing,
                              "dosing.additional.lag_time must be >= 0");
        }
    }
    return std::nullopt;
}

Status validate_population(const Config& config) {
    const auto& demo = config.population.demographics;
    if (!std::isfinite(demo.weight_mean) || !is_non_negative(demo.weight_sd)) {
        return make_error(ErrorKind::Validation,
                          "population.demographics weight_mean must be finite and weight_sd >= 0");
    }
    if (!std::isfinite(demo.age_mean) || !is_non_negative(demo.age_sd)) {
        return make_error(ErrorKind::Validation,
                          "population.demographics age_mean must be finite and age_sd >= 0");
    }

    for (const auto& cov : config.population.covariates) {
        const std::string path = "population.covariates." + cov.key;
        const auto sep = cov.key.rfind('_');
        if (sep == std::string::npos || sep == 0 || sep + 1 == cov.key.size()) {
            return make_error(ErrorKind::Validation,
                              "Invalid covariate key format: " + cov.key +
                                  " (expected {PARAM}_{COV})");
        }
        const std::string param = cov.key.substr(0, sep);
        const std::string covariate = cov.key.substr(sep + 1);
        if (covariate != "WT" && covariate != "AGE") {
            return make_error(ErrorKind::Validation,
                              path + ": unsupported covariate '" + covariate +
                                  "' (expected WT or AGE)");
        }
        if (config.model.find(param) == nullptr) {
            return make_error(ErrorKind::Validation,
                              path + ": parameter '" + param + "' is not part of the model");
        }
        if (!std::isfinite(cov.effect) || !std::isfinite(cov.reference)) {
            return make_error(ErrorKind::Validation, path + ": effect and reference must be finite");
        }
        if (cov.model == CovariateModel::Power && cov.reference <= 0.0) {
            return make_error(ErrorKind::Validation,
                              path + ".reference must be positive for the power model");
        }
    }
    return std::nullopt;
}

Status validate_simulation(const SimulationConfig& sim) {
    if (sim.time_points.empty()) {
        return make_error(ErrorKind::Validation,
                          "At least one time point must be specified (simulation.time_points)");
    }
    for (std::size_t i = 0; i < sim.time_points.size(); ++i) {
        if (!std::isfinite(sim.time_points[i])) {
            return make_error(ErrorKind::Validation,
                              "simulation.time_points[" + std::to_string(i) + "] is not finite");
        }
        if (i > 0 && sim.time_points[i] < sim.time_points[i - 1]) {
            return make_error(ErrorKind::Validation,
                              "simulation.time_points must be non-decreasing (index " +
                                  std::to_string(i) + ")");
        }
    }

    const auto& em = sim.error_model;
    const bool needs_add = em.type != ErrorModelType::Proportional;
    const bool needs_prop = em.type != ErrorModelType::Additive;
    if (needs_add && (!em.sigma_add || !is_non_negative(*em.sigma_add))) {
        return make_error(ErrorKind::Validation,
                          std::string("simulation.error_model.sigma_add must be >= 0 for the ") +
                              to_string(em.type) + " error model");
    }
    if (needs_prop && (!em.sigma_prop || !is_non_negative(*em.sigma_prop))) {
        return make_error(ErrorKind::Validation,
                          std::string("simulation.error_model.sigma_prop must be >= 0 for the ") +
                              to_string(em.type) + " error model");
    }
    if (sim.tolerance && !is_positive(*sim.tolerance)) {
        return make_error(ErrorKind::Validation, "simulation.tolerance must be positive");
    }
    return std::nullopt;
}

}  // namespace

const ParameterConfig* ModelConfig::find(std::string_view name) const {
    auto it = std::find_if(parameters.begin(), parameters.end(),
                           [name](const ParameterConfig& p) { return p.name == name; });
    return it != parameters.end() ? &*it : nullptr;
}

ParameterConfig* ModelConfig::find(std::string_view name) {
    auto it = std::find_if(parameters.begin(), parameters.end(),
                           [name](const ParameterConfig& p) { return p.name == name; });
    return it != parameters.end() ? &*it : nullptr;
}

const CovariateConfig* PopulationConfig::find_covariate(std::string_view param,
                                                        std::string_view covariate) const {
    for (const auto& cov : covariates) {
        if (cov.key.size() == param.size() + covariate.size() + 1 &&
            cov.key.compare(0, param.size(), param) == 0 &&
            cov.key[param.size()] == '_' &&
            cov.key.compare(param.size() + 1, std::string::npos, covariate) == 0) {
            return &cov;
        }
    }
    return nullptr;
}

std::optional<std::string> canonical_parameter_name(int compartments, std::string_view name) {
    if (name == "CL" || name == "KA") return std::string(name);
    if (name == "V" || name == "V1") return std::string("V1");
    if (compartments >= 2) {
        if (name == "Q" || name == "Q2") return std::string("Q2");
        if (name == "V2") return std::string("V2");
    }
    if (compartments == 3) {
        if (name == "Q3") return std::string("Q3");
        if (name == "V3") return std::string("V3");
    }
    return std::nullopt;
}

std::vector<std::string> required_parameters(int compartments, DoseRoute route) {
    std::vector<std::string> names;
    switch (compartments) {
        case 1: names = {"CL", "V"}; break;
        case 2: names = {"CL", "V1", "Q", "V2"}; break;
        case 3: names = {"CL", "V1", "Q2", "V2", "Q3", "V3"}; break;
        default: break;
    }
    if (route == DoseRoute::Oral) {
        names.emplace_back("KA");
    }
    return names;
}

Status validate(const Config& config) {
    if (auto err = validate_model(config)) return err;
    if (auto err = validate_dosing(config.dosing)) return err;
    if (auto err = validate_population(config)) return err;
    if (auto err = validate_simulation(config.simulation)) return err;
    return std::nullopt;
}

}  // namespace poppk::v1
