#include "poppk/v1/models/two_compartment.hpp"

#include <algorithm>
#include <cmath>

namespace poppk::v1 {

TwoCompartmentRates two_compartment_rates(Real cl, Real v1, Real q, Real v2) {
    TwoCompartmentRates r;
    r.k10 = cl / v1;
    r.k12 = q / v1;
    r.k21 = q / v2;

    const Real a = r.k10 + r.k12 + r.k21;
    const Real b = r.k10 * r.k21;
    // a^2 - 4b = (k10 - k21)^2 + k12 (k12 + 2 k10 + 2 k21) > 0 for positive inputs
    const Real sqrt_disc = std::sqrt(std::max(a * a - 4.0 * b, 0.0));

    r.alpha = 0.5 * (a + sqrt_disc);
    // Vieta form avoids cancellation in (a - sqrt_disc) when beta << alpha
    r.beta = b / r.alpha;
    return r;
}

Status TwoCompartmentModel::set_parameters(const ModelParameters& params) {
    if (auto err = require_positive("CL", params.cl)) return err;
    if (auto err = require_positive("V1", params.v1)) return err;
    if (auto err = require_positive("Q", params.q2)) return err;
    if (auto err = require_positive("V2", params.v2)) return err;
    if (params.ka) {
        if (auto err = require_positive("KA", params.ka)) return err;
    }

    params_ = params;
    rates_ = two_compartment_rates(params.cl, params.v1, *params.q2, *params.v2);

    const Real spread = rates_.alpha - rates_.beta;
    terms_[0] = {(rates_.alpha - rates_.k21) / spread, rates_.alpha};
    terms_[1] = {(rates_.k21 - rates_.beta) / spread, rates_.beta};
    return std::nullopt;
}

Real TwoCompartmentModel::concentration_at(Real t, std::span<const DoseEvent> history) const {
    if (history.empty()) {
        return 0.0;
    }
    return superpose_doses(terms_, params_.v1, params_.ka, t, history);
}

}  // namespace poppk::v1
