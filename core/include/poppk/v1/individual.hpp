#pragma once

// =============================================================================
// poppk - Individual factory
// =============================================================================
// Turns the population description into one virtual patient. The order of
// random draws is fixed:
//   1. weight, then age
//   2. for each configured parameter in configuration order, one draw when
//      omega is set, 0 included (covariate effects draw nothing)
// The population driver relies on this order for seeded reproducibility.
// =============================================================================

#include "poppk/v1/config.hpp"
#include "poppk/v1/error.hpp"
#include "poppk/v1/models/model_parameters.hpp"
#include "poppk/v1/random.hpp"
#include "poppk/v1/structural_model.hpp"

namespace poppk::v1 {

/// Physiological clamps applied to sampled demographics
inline constexpr Real kMinWeight = 30.0;
inline constexpr Real kMaxWeight = 200.0;
inline constexpr Real kMinAge = 18.0;
inline constexpr Real kMaxAge = 100.0;

struct Demographics {
    Real weight = 70.0;  // kg
    Real age = 45.0;     // years
};

/// A sampled patient: demographics, final parameter values and a configured model
struct Individual {
    Demographics demographics;
    ParameterMap parameters;  // Configured names, configuration order
    StructuralModel model;
};

class IndividualFactory {
public:
    /// `config` must outlive the factory and should already be validated
    explicit IndividualFactory(const Config& config);

    /// Sample one patient; `patient_id` only labels error messages
    [[nodiscard]] Result<Individual> create(PatientId patient_id, RandomStream& rng) const;

    [[nodiscard]] Demographics sample_demographics(RandomStream& rng) const;

    /// theta * covariate factors, before IIV and bounds
    [[nodiscard]] Real typical_value(const ParameterConfig& param,
                                     const Demographics& demographics) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    const Config& config_;
};

}  // namespace poppk::v1
