#pragma once

// =============================================================================
// poppk - Exponential-sum disposition
// =============================================================================
// Every linear mammillary model has a unit-bolus central concentration of the
// form
//     c(tau) = (1/V1) * sum_i A_i * exp(-lambda_i * tau),   sum_i A_i = 1
// The route responses below are convolutions of that impulse response and
// are shared by the 1-, 2- and 3-compartment models. Each model supplies its
// own (A_i, lambda_i) terms.
// =============================================================================

#include "poppk/v1/dosing.hpp"
#include "poppk/v1/types.hpp"

#include <optional>
#include <span>

namespace poppk::v1 {

/// One hybrid exponential phase
struct ExponentialTerm {
    Real coefficient = 0.0;  // A_i
    Real rate = 0.0;         // lambda_i (> 0)
};

/// |ka - lambda| at or below this uses the coincident-rate limit
inline constexpr Real kDegenerateRateGap = 1e-10;

/// sum A_i exp(-lambda_i tau)
[[nodiscard]] Real bolus_response(std::span<const ExponentialTerm> terms, Real tau);

/// Response to a unit-rate infusion of length `duration`, tau after its start
[[nodiscard]] Real infusion_response(std::span<const ExponentialTerm> terms, Real tau,
                                     Real duration);

/// Response to a unit oral dose absorbed with first-order rate `ka`
[[nodiscard]] Real oral_response(std::span<const ExponentialTerm> terms, Real ka, Real tau);

/// Superpose every dose in `history` with time <= t. Returns >= 0.
[[nodiscard]] Real superpose_doses(std::span<const ExponentialTerm> terms, Real central_volume,
                                   std::optional<Real> ka, Real t,
                                   std::span<const DoseEvent> history);

}  // namespace poppk::v1
