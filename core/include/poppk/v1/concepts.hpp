#pragma once

// =============================================================================
// poppk - Concepts for structural models
// =============================================================================

#include "poppk/v1/dosing.hpp"
#include "poppk/v1/error.hpp"
#include "poppk/v1/models/model_parameters.hpp"

#include <concepts>
#include <span>
#include <string_view>

namespace poppk::v1 {

/// Closed-form concentration calculator with a fixed compartment count
template<typename M>
concept StructuralModelType = requires(M model, const M& cmodel, Real t,
                                       std::span<const DoseEvent> history,
                                       const ModelParameters& params) {
    { M::compartments } -> std::convertible_to<int>;
    { cmodel.concentration_at(t, history) } -> std::convertible_to<Real>;
    { model.set_parameters(params) } -> std::same_as<Status>;
    { cmodel.parameter_names() } -> std::convertible_to<std::span<const std::string_view>>;
};

}  // namespace poppk::v1
