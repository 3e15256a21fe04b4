#pragma once

#include "poppk/v1/dosing.hpp"
#include "poppk/v1/error.hpp"
#include "poppk/v1/models/disposition.hpp"
#include "poppk/v1/models/model_parameters.hpp"

#include <array>
#include <span>
#include <string_view>

namespace poppk::v1 {

// =============================================================================
// Two-compartment mammillary model (ADVAN3 / ADVAN4)
// =============================================================================

/// Micro and hybrid rate constants of the two-compartment system
struct TwoCompartmentRates {
    Real k10 = 0.0;
    Real k12 = 0.0;
    Real k21 = 0.0;
    Real alpha = 0.0;  // Fast phase, alpha >= beta
    Real beta = 0.0;   // Terminal phase
};

/// Roots of lambda^2 - (k10 + k12 + k21) lambda + k10 k21 = 0
[[nodiscard]] TwoCompartmentRates two_compartment_rates(Real cl, Real v1, Real q, Real v2);

class TwoCompartmentModel {
public:
    static constexpr int compartments = 2;
    static constexpr std::array<std::string_view, 4> kParameterNames{"CL", "V1", "Q", "V2"};

    TwoCompartmentModel() = default;

    [[nodiscard]] Real concentration_at(Real t, std::span<const DoseEvent> history) const;

    /// CL, V1, Q2 and V2 must be positive; KA if given
    [[nodiscard]] Status set_parameters(const ModelParameters& params);

    [[nodiscard]] std::span<const std::string_view> parameter_names() const {
        return kParameterNames;
    }

    [[nodiscard]] const ModelParameters& parameters() const { return params_; }
    [[nodiscard]] const TwoCompartmentRates& rates() const { return rates_; }

    /// {A, alpha}, {B, beta} with A = (alpha - k21)/(alpha - beta), B = (k21 - beta)/(alpha - beta)
    [[nodiscard]] std::span<const ExponentialTerm> terms() const { return terms_; }

private:
    ModelParameters params_{};
    TwoCompartmentRates rates_{};
    std::array<ExponentialTerm, 2> terms_{};
};

}  // namespace poppk::v1
