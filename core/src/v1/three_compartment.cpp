#include "poppk/v1/models/three_compartment.hpp"

#include <Eigen/Eigenvalues>

#include <cmath>

namespace poppk::v1 {

Eigen::Matrix3d symmetric_rate_matrix(Real cl, Real v1, Real q2, Real v2, Real q3, Real v3) {
    // Clearance matrix M: V dc/dt = -M c
    Eigen::Matrix3d m;
    m << cl + q2 + q3, -q2, -q3,
         -q2,           q2, 0.0,
         -q3,          0.0,  q3;

    const Eigen::Vector3d inv_sqrt_v(1.0 / std::sqrt(v1), 1.0 / std::sqrt(v2),
                                     1.0 / std::sqrt(v3));
    return inv_sqrt_v.asDiagonal() * m * inv_sqrt_v.asDiagonal();
}

Status ThreeCompartmentModel::set_parameters(const ModelParameters& params) {
    if (auto err = require_positive("CL", params.cl)) return err;
    if (auto err = require_positive("V1", params.v1)) return err;
    if (auto err = require_positive("Q2", params.q2)) return err;
    if (auto err = require_positive("V2", params.v2)) return err;
    if (auto err = require_positive("Q3", params.q3)) return err;
    if (auto err = require_positive("V3", params.v3)) return err;
    if (params.ka) {
        if (auto err = require_positive("KA", params.ka)) return err;
    }

    const Eigen::Matrix3d s = symmetric_rate_matrix(params.cl, params.v1, *params.q2,
                                                    *params.v2, *params.q3, *params.v3);
    Eigen::SelfAdjointEigenSolver<Eigen::Matrix3d> solver(s);
    if (solver.info() != Eigen::Success) {
        return make_error(ErrorKind::Simulation,
                          "eigen-decomposition of the 3-compartment rate matrix failed");
    }

    // Eigenvalues come back ascending: gamma, beta, alpha
    const Eigen::Vector3d& lambda = solver.eigenvalues();
    const Eigen::Matrix3d& q = solver.eigenvectors();
    if (!(lambda(0) > 0.0) || !std::isfinite(lambda(2))) {
        return make_error(ErrorKind::Simulation,
                          "3-compartment rate matrix is not positive definite");
    }

    params_ = params;
    rates_.k10 = params.cl / params.v1;
    rates_.k12 = *params.q2 / params.v1;
    rates_.k21 = *params.q2 / *params.v2;
    rates_.k13 = *params.q3 / params.v1;
    rates_.k31 = *params.q3 / *params.v3;
    rates_.alpha = lambda(2);
    rates_.beta = lambda(1);
    rates_.gamma = lambda(0);

    for (int i = 0; i < 3; ++i) {
        const int col = 2 - i;
        terms_[static_cast<std::size_t>(i)] = {q(0, col) * q(0, col), lambda(col)};
    }
    return std::nullopt;
}

Real ThreeCompartmentModel::concentration_at(Real t, std::span<const DoseEvent> history) const {
    if (history.empty()) {
        return 0.0;
    }
    return superpose_doses(terms_, params_.v1, params_.ka, t, history);
}

}  // namespace poppk::v1
