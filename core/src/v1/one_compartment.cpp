#include "poppk/v1/models/one_compartment.hpp"

namespace poppk::v1 {

Status OneCompartmentModel::set_parameters(const ModelParameters& params) {
    if (auto err = require_positive("CL", params.cl)) return err;
    if (auto err = require_positive("V", params.v1)) return err;
    if (params.ka) {
        if (auto err = require_positive("KA", params.ka)) return err;
    }

    params_ = params;
    terms_[0] = {1.0, params.cl / params.v1};
    return std::nullopt;
}

Real OneCompartmentModel::concentration_at(Real t, std::span<const DoseEvent> history) const {
    if (history.empty()) {
        return 0.0;
    }
    return superpose_doses(terms_, params_.v1, params_.ka, t, history);
}

}  // namespace poppk::v1
