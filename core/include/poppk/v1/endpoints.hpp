#pragma once

// =============================================================================
// poppk - PK endpoints and population summary
// =============================================================================

#include "poppk/v1/population.hpp"

#include <span>
#include <vector>

namespace poppk::v1 {

/// Largest observed concentration (0 for an empty profile)
[[nodiscard]] Real cmax(std::span<const Observation> observations);

/// Trapezoidal area under the observed profile over the grid
[[nodiscard]] Real auc(std::span<const Observation> observations);

/// Earliest time at which the observed profile reaches cmax
[[nodiscard]] Real tmax(std::span<const Observation> observations);

struct IndividualEndpoints {
    PatientId patient_id = 0;
    Real weight = 0.0;
    Real age = 0.0;
    Real cmax = 0.0;
    Real auc = 0.0;
    Real tmax = 0.0;
};

[[nodiscard]] IndividualEndpoints compute_endpoints(const PatientResult& patient);

/// Mean and sample standard deviation (divisor N-1, 0 when N < 2)
struct SummaryStatistic {
    Real mean = 0.0;
    Real sd = 0.0;
    std::size_t count = 0;

    /// sd / mean * 100, 0 when the mean is 0
    [[nodiscard]] Real cv_percent() const { return mean != 0.0 ? sd / mean * 100.0 : 0.0; }
};

[[nodiscard]] SummaryStatistic summarize(std::span<const Real> values);

struct PopulationSummary {
    std::size_t n_patients = 0;
    SummaryStatistic cl;
    SummaryStatistic v;     // V, falling back to V1
    SummaryStatistic cmax;
    SummaryStatistic auc;
    SummaryStatistic tmax;
};

[[nodiscard]] PopulationSummary summarize_population(std::span<const PatientResult> patients);

}  // namespace poppk::v1
