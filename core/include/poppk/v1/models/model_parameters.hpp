#pragma once

#include "poppk/v1/error.hpp"
#include "poppk/v1/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace poppk::v1 {

/// Named parameter values in configuration order
using ParameterMap = std::vector<std::pair<std::string, Real>>;

[[nodiscard]] std::optional<Real> find_parameter(const ParameterMap& params, std::string_view name);

/// Fixed parameter struct used inside the structural models
struct ModelParameters {
    Real cl = 0.0;              // Clearance
    Real v1 = 0.0;              // Central volume
    std::optional<Real> ka;     // Absorption rate constant (oral only)
    std::optional<Real> q2;     // Inter-compartmental clearance 1<->2
    std::optional<Real> v2;     // Peripheral volume 2
    std::optional<Real> q3;     // Inter-compartmental clearance 1<->3
    std::optional<Real> v3;     // Peripheral volume 3

    /// Convert a name->value map once at the factory boundary. Aliases
    /// (V/V1, Q/Q2) are resolved for the given compartment count.
    [[nodiscard]] static Result<ModelParameters> from_map(int compartments,
                                                          const ParameterMap& values);
};

/// Fail unless `value` is present, finite and > 0
[[nodiscard]] Status require_positive(std::string_view name, std::optional<Real> value);

}  // namespace poppk::v1
