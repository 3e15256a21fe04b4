#pragma once

#include "poppk/v1/dosing.hpp"
#include "poppk/v1/error.hpp"
#include "poppk/v1/models/disposition.hpp"
#include "poppk/v1/models/model_parameters.hpp"

#include <Eigen/Core>

#include <array>
#include <span>
#include <string_view>

namespace poppk::v1 {

// =============================================================================
// Three-compartment mammillary model (ADVAN11 / ADVAN12)
// =============================================================================
// The hybrid constants are the eigenvalues of the rate matrix. Writing the
// mass balance in concentrations gives V dc/dt = -M c with M symmetric, so
// S = V^-1/2 M V^-1/2 is symmetric positive definite with the same
// eigenvalues. For S = Q diag(lambda) Q^T the unit-bolus central
// concentration is (1/V1) sum_i Q(0,i)^2 exp(-lambda_i t), which gives the
// coefficients directly and guarantees A + B + C = 1.
// =============================================================================

struct ThreeCompartmentRates {
    Real k10 = 0.0;
    Real k12 = 0.0;
    Real k21 = 0.0;
    Real k13 = 0.0;
    Real k31 = 0.0;
    Real alpha = 0.0;  // alpha >= beta >= gamma
    Real beta = 0.0;
    Real gamma = 0.0;  // Terminal phase
};

/// Symmetrised rate matrix V^-1/2 M V^-1/2
[[nodiscard]] Eigen::Matrix3d symmetric_rate_matrix(Real cl, Real v1, Real q2, Real v2,
                                                    Real q3, Real v3);

class ThreeCompartmentModel {
public:
    static constexpr int compartments = 3;
    static constexpr std::array<std::string_view, 6> kParameterNames{"CL", "V1", "Q2",
                                                                     "V2", "Q3", "V3"};

    ThreeCompartmentModel() = default;

    [[nodiscard]] Real concentration_at(Real t, std::span<const DoseEvent> history) const;

    /// CL, V1, Q2, V2, Q3 and V3 must be positive; KA if given
    [[nodiscard]] Status set_parameters(const ModelParameters& params);

    [[nodiscard]] std::span<const std::string_view> parameter_names() const {
        return kParameterNames;
    }

    [[nodiscard]] const ModelParameters& parameters() const { return params_; }
    [[nodiscard]] const ThreeCompartmentRates& rates() const { return rates_; }

    /// {A, alpha}, {B, beta}, {C, gamma}
    [[nodiscard]] std::span<const ExponentialTerm> terms() const { return terms_; }

private:
    ModelParameters params_{};
    ThreeCompartmentRates rates_{};
    std::array<ExponentialTerm, 3> terms_{};
};

}  // namespace poppk::v1
