#include "poppk/v1/variability.hpp"

#include <algorithm>
#include <cmath>

namespace poppk::v1 {

namespace {

bool valid_sd(Real sd) {
    return std::isfinite(sd) && sd >= 0.0;
}

Result<Real> invalid_sd(const char* what, Real sd) {
    return Result<Real>::failure(ErrorKind::Random,
                                 std::string("invalid ") + what + " standard deviation: " +
                                     std::to_string(sd));
}

Real clamp_observation(Real predicted, Real observed) {
    if (predicted <= 0.0 || !std::isfinite(observed)) {
        return 0.0;
    }
    return std::max(observed, 0.0);
}

}  // namespace

Result<Real> apply_log_normal_iiv(Real theta, Real cv_percent, RandomStream& rng) {
    if (cv_percent == 0.0) {
        return theta;
    }
    return sample_log_normal_iiv(theta, cv_percent, rng);
}

Result<Real> sample_log_normal_iiv(Real theta, Real cv_percent, RandomStream& rng) {
    const Real omega_sd = cv_percent / 100.0;
    if (!valid_sd(omega_sd)) {
        return invalid_sd("IIV", omega_sd);
    }
    const Real eta = rng.normal(0.0, omega_sd);
    return theta * std::exp(eta);
}

Result<Real> apply_additive_error(Real predicted, Real additive_sd, RandomStream& rng) {
    if (!valid_sd(additive_sd)) {
        return invalid_sd("additive error", additive_sd);
    }
    const Real eps = rng.normal(0.0, additive_sd);
    return clamp_observation(predicted, predicted + eps);
}

Result<Real> apply_proportional_error(Real predicted, Real proportional_sd, RandomStream& rng) {
    if (!valid_sd(proportional_sd)) {
        return invalid_sd("proportional error", proportional_sd);
    }
    const Real eps = rng.normal(0.0, proportional_sd);
    return clamp_observation(predicted, predicted * (1.0 + eps));
}

Result<Real> apply_combined_error(Real predicted, Real additive_sd, Real proportional_sd,
                                  RandomStream& rng) {
    if (!valid_sd(additive_sd)) {
        return invalid_sd("additive error", additive_sd);
    }
    if (!valid_sd(proportional_sd)) {
        return invalid_sd("proportional error", proportional_sd);
    }
    const Real eps_add = rng.normal(0.0, additive_sd);
    const Real eps_prop = rng.normal(0.0, proportional_sd);
    return clamp_observation(predicted, predicted * (1.0 + eps_prop) + eps_add);
}

Result<Real> apply_residual_error(Real predicted, const ErrorModelConfig& model,
                                  RandomStream& rng) {
    switch (model.type) {
        case ErrorModelType::Additive:
            return apply_additive_error(predicted, model.sigma_add.value_or(0.0), rng);
        case ErrorModelType::Proportional:
            return apply_proportional_error(predicted, model.sigma_prop.value_or(0.0), rng);
        case ErrorModelType::Combined:
            return apply_combined_error(predicted, model.sigma_add.value_or(0.0),
                                        model.sigma_prop.value_or(0.0), rng);
    }
    return Result<Real>::failure(ErrorKind::Simulation, "unknown residual error model");
}

Real covariate_factor(Real x, Real reference, Real effect, CovariateModel model) {
    switch (model) {
        case CovariateModel::Power:
            return std::pow(x / reference, effect);
        case CovariateModel::Exponential:
            return std::exp(effect * (x - reference));
        case CovariateModel::Linear:
            return 1.0 + effect * (x - reference);
    }
    return 1.0;
}

}  // namespace poppk::v1
