#pragma once

// =============================================================================
// poppk - Simulation configuration
// =============================================================================
// Immutable input to the population driver. Parsers (JSON, YAML, NONMEM
// control stream) build a Config and run validate() before handing it out.
// =============================================================================

#include "poppk/v1/error.hpp"
#include "poppk/v1/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace poppk::v1 {

// =============================================================================
// Model
// =============================================================================

struct ParameterConfig {
    std::string name;
    Real theta = 0.0;                           // Typical value
    std::optional<Real> omega;                  // IIV as CV%
    std::optional<std::pair<Real, Real>> bounds;
};

struct ModelConfig {
    int compartments = 1;
    // Insertion order is significant: it fixes the order of IIV draws.
    std::vector<ParameterConfig> parameters;

    [[nodiscard]] const ParameterConfig* find(std::string_view name) const;
    [[nodiscard]] ParameterConfig* find(std::string_view name);
};

// =============================================================================
// Dosing
// =============================================================================

struct AdditionalDosingParams {
    std::optional<Real> duration;         // Infusion length
    std::optional<Real> lag_time;         // Reserved, not applied
    std::optional<Real> bioavailability;  // Oral fraction absorbed
};

struct DosingConfig {
    DoseRoute route = DoseRoute::IvBolus;
    Real amount = 0.0;
    std::vector<Real> times;
    std::optional<AdditionalDosingParams> additional;

    [[nodiscard]] std::optional<Real> duration() const {
        return additional ? additional->duration : std::nullopt;
    }
    [[nodiscard]] Real bioavailability() const {
        return (additional && additional->bioavailability) ? *additional->bioavailability : 1.0;
    }
    [[nodiscard]] Real lag_time() const {
        return (additional && additional->lag_time) ? *additional->lag_time : 0.0;
    }
};

// =============================================================================
// Population
// =============================================================================

struct DemographicsConfig {
    Real weight_mean = 70.0;
    Real weight_sd = 15.0;
    Real age_mean = 45.0;
    Real age_sd = 12.0;
};

/// Covariate effect keyed "{PARAM}_{COV}", e.g. CL_WT
struct CovariateConfig {
    std::string key;
    Real effect = 0.0;
    Real reference = 70.0;
    CovariateModel model = CovariateModel::Power;
};

struct PopulationConfig {
    DemographicsConfig demographics;
    std::vector<CovariateConfig> covariates;

    [[nodiscard]] const CovariateConfig* find_covariate(std::string_view param,
                                                        std::string_view covariate) const;
};

// =============================================================================
// Simulation
// =============================================================================

struct ErrorModelConfig {
    ErrorModelType type = ErrorModelType::Proportional;
    std::optional<Real> sigma_add;   // SD of additive epsilon
    std::optional<Real> sigma_prop;  // SD of proportional epsilon

    [[nodiscard]] static ErrorModelConfig additive(Real sd) {
        return {ErrorModelType::Additive, sd, std::nullopt};
    }
    [[nodiscard]] static ErrorModelConfig proportional(Real sd) {
        return {ErrorModelType::Proportional, std::nullopt, sd};
    }
    [[nodiscard]] static ErrorModelConfig combined(Real add_sd, Real prop_sd) {
        return {ErrorModelType::Combined, add_sd, prop_sd};
    }
};

struct SimulationConfig {
    std::vector<Real> time_points;
    ErrorModelConfig error_model;
    IntegrationMethod integration_method = IntegrationMethod::Analytical;
    std::optional<Real> tolerance;
};

// =============================================================================
// Root
// =============================================================================

struct Config {
    ModelConfig model;
    DosingConfig dosing;
    PopulationConfig population;
    SimulationConfig simulation;
};

/// Canonical parameter name for a compartment count ("V" -> "V1" handling etc.)
/// Returns nullopt when the name is not a parameter of that model.
[[nodiscard]] std::optional<std::string> canonical_parameter_name(int compartments,
                                                                  std::string_view name);

/// Parameters a model needs (aliases resolved to the first spelling listed)
[[nodiscard]] std::vector<std::string> required_parameters(int compartments, DoseRoute route);

/// Check structural consistency of a configuration
[[nodiscard]] Status validate(const Config& config);

}  // namespace poppk::v1
