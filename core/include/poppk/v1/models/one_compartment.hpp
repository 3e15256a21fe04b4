#pragma once

#include "poppk/v1/dosing.hpp"
#include "poppk/v1/error.hpp"
#include "poppk/v1/models/disposition.hpp"
#include "poppk/v1/models/model_parameters.hpp"

#include <array>
#include <span>
#include <string_view>

namespace poppk::v1 {

// =============================================================================
// One-compartment model (ADVAN1 / ADVAN2)
// =============================================================================

class OneCompartmentModel {
public:
    static constexpr int compartments = 1;
    static constexpr std::array<std::string_view, 2> kParameterNames{"CL", "V"};

    OneCompartmentModel() = default;

    /// Central concentration at `t` from every dose in `history` with time <= t
    [[nodiscard]] Real concentration_at(Real t, std::span<const DoseEvent> history) const;

    /// Install individual parameters; CL and V must be positive, KA if given
    [[nodiscard]] Status set_parameters(const ModelParameters& params);

    [[nodiscard]] std::span<const std::string_view> parameter_names() const {
        return kParameterNames;
    }

    [[nodiscard]] const ModelParameters& parameters() const { return params_; }

    /// k_e = CL / V
    [[nodiscard]] Real elimination_rate() const { return terms_[0].rate; }

    [[nodiscard]] std::span<const ExponentialTerm> terms() const { return terms_; }

private:
    ModelParameters params_{};
    std::array<ExponentialTerm, 1> terms_{};
};

}  // namespace poppk::v1
