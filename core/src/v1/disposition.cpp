#include "poppk/v1/models/disposition.hpp"

#include <algorithm>
#include <cmath>

namespace poppk::v1 {

namespace {

// (1 - exp(-rate * tau)) / rate without cancellation for small rate * tau
Real accumulated_fraction(Real rate, Real tau) {
    return -std::expm1(-rate * tau) / rate;
}

// (exp(-a tau) - exp(-b tau)) / (b - a), symmetric in a and b; all
// exponents stay non-positive so nothing overflows for large tau.
Real exponential_difference(Real a, Real b, Real tau) {
    const Real lo = std::min(a, b);
    const Real hi = std::max(a, b);
    const Real gap = hi - lo;
    if (gap <= kDegenerateRateGap) {
        return tau * std::exp(-lo * tau);
    }
    return std::exp(-lo * tau) * accumulated_fraction(gap, tau);
}

}  // namespace

Real bolus_response(std::span<const ExponentialTerm> terms, Real tau) {
    Real sum = 0.0;
    for (const auto& term : terms) {
        sum += term.coefficient * std::exp(-term.rate * tau);
    }
    return sum;
}

Real infusion_response(std::span<const ExponentialTerm> terms, Real tau, Real duration) {
    Real sum = 0.0;
    if (tau <= duration) {
        for (const auto& term : terms) {
            sum += term.coefficient * accumulated_fraction(term.rate, tau);
        }
        return sum;
    }
    // Each phase decays from its own end-of-infusion level
    for (const auto& term : terms) {
        sum += term.coefficient * accumulated_fraction(term.rate, duration) *
               std::exp(-term.rate * (tau - duration));
    }
    return sum;
}

Real oral_response(std::span<const ExponentialTerm> terms, Real ka, Real tau) {
    Real sum = 0.0;
    for (const auto& term : terms) {
        sum += term.coefficient * ka * exponential_difference(term.rate, ka, tau);
    }
    return sum;
}

Real superpose_doses(std::span<const ExponentialTerm> terms, Real central_volume,
                     std::optional<Real> ka, Real t, std::span<const DoseEvent> history) {
    Real concentration = 0.0;

    for (const auto& dose : history) {
        if (dose.time > t) {
            continue;
        }
        const Real tau = t - dose.time;

        switch (dose.route) {
            case DoseRoute::IvBolus:
                concentration += (dose.amount / central_volume) * bolus_response(terms, tau);
                break;
            case DoseRoute::IvInfusion:
                if (dose.duration && *dose.duration > 0.0) {
                    const Real rate = dose.amount / *dose.duration;
                    concentration += (rate / central_volume) *
                                     infusion_response(terms, tau, *dose.duration);
                } else {
                    concentration += (dose.amount / central_volume) * bolus_response(terms, tau);
                }
                break;
            case DoseRoute::Oral:
                if (ka && *ka > 0.0) {
                    concentration += (dose.amount * dose.bioavailability / central_volume) *
                                     oral_response(terms, *ka, tau);
                }
                break;
        }
    }

    // Guard against cancellation just below zero
    return std::max(concentration, 0.0);
}

}  // namespace poppk::v1
