#include "poppk/v1/models/model_parameters.hpp"

#include "poppk/v1/config.hpp"

#include <cmath>

namespace poppk::v1 {

std::optional<Real> find_parameter(const ParameterMap& params, std::string_view name) {
    for (const auto& [key, value] : params) {
        if (key == name) {
            return value;
        }
    }
    return std::nullopt;
}

Status require_positive(std::string_view name, std::optional<Real> value) {
    if (!value) {
        return make_error(ErrorKind::InvalidModel,
                          "Missing required parameter: " + std::string(name));
    }
    if (!std::isfinite(*value) || *value <= 0.0) {
        return make_error(ErrorKind::Validation,
                          std::string(name) + " must be positive (got " +
                              std::to_string(*value) + ")");
    }
    return std::nullopt;
}

Result<ModelParameters> ModelParameters::from_map(int compartments, const ParameterMap& values) {
    if (compartments < 1 || compartments > 3) {
        return Result<ModelParameters>::failure(
            ErrorKind::InvalidModel,
            "Unsupported number of compartments: " + std::to_string(compartments));
    }

    ModelParameters params;
    bool has_cl = false;
    bool has_v1 = false;

    for (const auto& [name, value] : values) {
        const auto canonical = canonical_parameter_name(compartments, name);
        if (!canonical) {
            return Result<ModelParameters>::failure(
                ErrorKind::InvalidModel,
                "Unknown parameter for " + std::to_string(compartments) +
                    "-compartment model: " + name);
        }
        if (*canonical == "CL") {
            params.cl = value;
            has_cl = true;
        } else if (*canonical == "V1") {
            params.v1 = value;
            has_v1 = true;
        } else if (*canonical == "KA") {
            params.ka = value;
        } else if (*canonical == "Q2") {
            params.q2 = value;
        } else if (*canonical == "V2") {
            params.v2 = value;
        } else if (*canonical == "Q3") {
            params.q3 = value;
        } else if (*canonical == "V3") {
            params.v3 = value;
        }
    }

    if (!has_cl) {
        return Result<ModelParameters>::failure(ErrorKind::InvalidModel,
                                                "Missing required parameter: CL");
    }
    if (!has_v1) {
        return Result<ModelParameters>::failure(
            ErrorKind::InvalidModel,
            std::string("Missing required parameter: ") + (compartments == 1 ? "V" : "V1"));
    }
    return params;
}

}  // namespace poppk::v1
