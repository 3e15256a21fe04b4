#pragma once

// =============================================================================
// poppk - Structural model dispatch
// =============================================================================
// The compartment family is closed, so models are stored by value in a
// std::variant and dispatched with std::visit.
// =============================================================================

#include "poppk/v1/concepts.hpp"
#include "poppk/v1/models/one_compartment.hpp"
#include "poppk/v1/models/three_compartment.hpp"
#include "poppk/v1/models/two_compartment.hpp"

#include <span>
#include <string_view>
#include <variant>

namespace poppk::v1 {

static_assert(StructuralModelType<OneCompartmentModel>);
static_assert(StructuralModelType<TwoCompartmentModel>);
static_assert(StructuralModelType<ThreeCompartmentModel>);

/// Variant holding all supported structural models
using ModelVariant = std::variant<
    OneCompartmentModel,
    TwoCompartmentModel,
    ThreeCompartmentModel
>;

class StructuralModel {
public:
    /// Empty model for the given compartment count (1, 2 or 3)
    [[nodiscard]] static Result<StructuralModel> create(int compartments);

    /// Model with parameters installed
    [[nodiscard]] static Result<StructuralModel> create(int compartments,
                                                        const ModelParameters& params);

    [[nodiscard]] Real concentration_at(Real t, std::span<const DoseEvent> history) const {
        return std::visit([&](const auto& m) { return m.concentration_at(t, history); }, model_);
    }

    [[nodiscard]] Status set_parameters(const ModelParameters& params) {
        return std::visit([&](auto& m) { return m.set_parameters(params); }, model_);
    }

    [[nodiscard]] std::span<const std::string_view> parameter_names() const {
        return std::visit([](const auto& m) { return m.parameter_names(); }, model_);
    }

    [[nodiscard]] const ModelParameters& parameters() const {
        return std::visit([](const auto& m) -> const ModelParameters& { return m.parameters(); },
                          model_);
    }

    [[nodiscard]] std::span<const ExponentialTerm> terms() const {
        return std::visit([](const auto& m) { return m.terms(); }, model_);
    }

    [[nodiscard]] int compartments() const {
        return std::visit([](const auto& m) { return std::decay_t<decltype(m)>::compartments; },
                          model_);
    }

    [[nodiscard]] const ModelVariant& variant() const { return model_; }

private:
    explicit StructuralModel(ModelVariant model) : model_(std::move(model)) {}

    ModelVariant model_;
};

}  // namespace poppk::v1
