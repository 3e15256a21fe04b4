#include "poppk/v1/individual.hpp"

#include "poppk/v1/variability.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace poppk::v1 {

namespace {

std::string patient_prefix(PatientId patient_id) {
    return "patient " + std::to_string(patient_id) + ": ";
}

Error with_patient(PatientId patient_id, Error error) {
    error.message = patient_prefix(patient_id) + error.message;
    return error;
}

}  // namespace

IndividualFactory::IndividualFactory(const Config& config) : config_(config) {}

Demographics IndividualFactory::sample_demographics(RandomStream& rng) const {
    const auto& demo = config_.population.demographics;
    Demographics out;
    out.weight = std::clamp(rng.normal(demo.weight_mean, demo.weight_sd), kMinWeight, kMaxWeight);
    out.age = std::clamp(rng.normal(demo.age_mean, demo.age_sd), kMinAge, kMaxAge);
    return out;
}

Real IndividualFactory::typical_value(const ParameterConfig& param,
                                      const Demographics& demographics) const {
    Real value = param.theta;
    const auto& population = config_.population;
    if (const auto* wt = population.find_covariate(param.name, "WT")) {
        value *= covariate_factor(demographics.weight, wt->reference, wt->effect, wt->model);
    }
    if (const auto* age = population.find_covariate(param.name, "AGE")) {
        value *= covariate_factor(demographics.age, age->reference, age->effect, age->model);
    }
    return value;
}

Result<Individual> IndividualFactory::create(PatientId patient_id, RandomStream& rng) const {
    const Demographics demographics = sample_demographics(rng);

    ParameterMap values;
    values.reserve(config_.model.parameters.size());
    for (const auto& param : config_.model.parameters) {
        Real value = typical_value(param, demographics);

        if (param.omega) {
            auto varied = sample_log_normal_iiv(value, *param.omega, rng);
            if (!varied) {
                return with_patient(patient_id, varied.error());
            }
            value = *varied;
        }

        if (param.bounds) {
            value = std::clamp(value, param.bounds->first, param.bounds->second);
        }

        if (!std::isfinite(value) || value <= 0.0) {
            return with_patient(patient_id,
                                Error{ErrorKind::Validation,
                                      "parameter " + param.name +
                                          " is not positive after covariates and IIV (" +
                                          std::to_string(value) + ")"});
        }
        values.emplace_back(param.name, value);
    }

    auto params = ModelParameters::from_map(config_.model.compartments, values);
    if (!params) {
        return with_patient(patient_id, params.error());
    }
    auto model = StructuralModel::create(config_.model.compartments, *params);
    if (!model) {
        return with_patient(patient_id, model.error());
    }

    return Individual{demographics, std::move(values), std::move(*model)};
}

}  // namespace poppk::v1
