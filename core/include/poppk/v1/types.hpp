#pragma once

// =============================================================================
// poppk - Basic numeric types and enumerations
// =============================================================================

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace poppk::v1 {

using Real = double;
using PatientId = std::size_t;

/// Administration route of a dose
enum class DoseRoute {
    Oral,
    IvBolus,
    IvInfusion
};

/// Functional form of a covariate effect
enum class CovariateModel {
    Power,        // (x/ref)^effect
    Exponential,  // exp(effect * (x - ref))
    Linear        // 1 + effect * (x - ref)
};

/// Residual error model family
enum class ErrorModelType {
    Additive,
    Proportional,
    Combined
};

/// Integration method tag (only Analytical is evaluated; the others are reserved)
enum class IntegrationMethod {
    Analytical,
    Rk4,
    Euler
};

[[nodiscard]] inline constexpr const char* to_string(DoseRoute route) noexcept {
    switch (route) {
        case DoseRoute::Oral: return "oral";
        case DoseRoute::IvBolus: return "ivbolus";
        case DoseRoute::IvInfusion: return "ivinfusion";
        default: return "unknown";
    }
}

[[nodiscard]] inline constexpr const char* to_string(CovariateModel model) noexcept {
    switch (model) {
        case CovariateModel::Power: return "power";
        case CovariateModel::Exponential: return "exponential";
        case CovariateModel::Linear: return "linear";
        default: return "unknown";
    }
}

[[nodiscard]] inline constexpr const char* to_string(ErrorModelType type) noexcept {
    switch (type) {
        case ErrorModelType::Additive: return "additive";
        case ErrorModelType::Proportional: return "proportional";
        case ErrorModelType::Combined: return "combined";
        default: return "unknown";
    }
}

[[nodiscard]] inline constexpr const char* to_string(IntegrationMethod method) noexcept {
    switch (method) {
        case IntegrationMethod::Analytical: return "analytical";
        case IntegrationMethod::Rk4: return "rk4";
        case IntegrationMethod::Euler: return "euler";
        default: return "unknown";
    }
}

// Tag parsers expect lowercase input; callers normalise case first.

[[nodiscard]] inline std::optional<DoseRoute> parse_dose_route(std::string_view tag) {
    if (tag == "oral") return DoseRoute::Oral;
    if (tag == "ivbolus") return DoseRoute::IvBolus;
    if (tag == "ivinfusion") return DoseRoute::IvInfusion;
    return std::nullopt;
}

[[nodiscard]] inline std::optional<CovariateModel> parse_covariate_model(std::string_view tag) {
    if (tag == "power") return CovariateModel::Power;
    if (tag == "exponential") return CovariateModel::Exponential;
    if (tag == "linear") return CovariateModel::Linear;
    return std::nullopt;
}

[[nodiscard]] inline std::optional<ErrorModelType> parse_error_model_type(std::string_view tag) {
    if (tag == "additive") return ErrorModelType::Additive;
    if (tag == "proportional") return ErrorModelType::Proportional;
    if (tag == "combined") return ErrorModelType::Combined;
    return std::nullopt;
}

[[nodiscard]] inline std::optional<IntegrationMethod> parse_integration_method(std::string_view tag) {
    if (tag == "analytical") return IntegrationMethod::Analytical;
    if (tag == "rk4") return IntegrationMethod::Rk4;
    if (tag == "euler") return IntegrationMethod::Euler;
    return std::nullopt;
}

}  // namespace poppk::v1
