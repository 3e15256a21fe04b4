#pragma once

// =============================================================================
// poppk - Variability kernel
// =============================================================================
// Scalar transforms for inter-individual variability (IIV), covariate
// effects and residual error. Every function that draws takes the stream by
// reference and consumes a fixed number of standard-normal draws:
//   apply_log_normal_iiv      1 (0 when CV% == 0)
//   sample_log_normal_iiv     1
//   apply_additive_error      1
//   apply_proportional_error  1
//   apply_combined_error      2 (additive first, then proportional)
// =============================================================================

#include "poppk/v1/config.hpp"
#include "poppk/v1/error.hpp"
#include "poppk/v1/random.hpp"
#include "poppk/v1/types.hpp"

namespace poppk::v1 {

/// theta * exp(eta), eta ~ Normal(0, CV%/100)
[[nodiscard]] Result<Real> apply_log_normal_iiv(Real theta, Real cv_percent, RandomStream& rng);

/// Same transform, but always consumes its draw (CV% == 0 included); used by
/// the individual factory for every parameter with IIV configured
[[nodiscard]] Result<Real> sample_log_normal_iiv(Real theta, Real cv_percent, RandomStream& rng);

/// Y = F + eps, eps ~ Normal(0, sd); clamped to >= 0
[[nodiscard]] Result<Real> apply_additive_error(Real predicted, Real additive_sd, RandomStream& rng);

/// Y = F * (1 + eps), eps ~ Normal(0, sd); clamped to >= 0
[[nodiscard]] Result<Real> apply_proportional_error(Real predicted, Real proportional_sd,
                                                    RandomStream& rng);

/// Y = F * (1 + eps_prop) + eps_add; clamped to >= 0
[[nodiscard]] Result<Real> apply_combined_error(Real predicted, Real additive_sd,
                                                Real proportional_sd, RandomStream& rng);

/// Dispatch on the configured error model
[[nodiscard]] Result<Real> apply_residual_error(Real predicted, const ErrorModelConfig& model,
                                                RandomStream& rng);

/// Multiplicative covariate factor for value `x` relative to `reference`
[[nodiscard]] Real covariate_factor(Real x, Real reference, Real effect, CovariateModel model);

}  // namespace poppk::v1
