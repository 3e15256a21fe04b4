#include "poppk/v1/structural_model.hpp"

#include <string>

namespace poppk::v1 {

Result<StructuralModel> StructuralModel::create(int compartments) {
    switch (compartments) {
        case 1: return StructuralModel(OneCompartmentModel{});
        case 2: return StructuralModel(TwoCompartmentModel{});
        case 3: return StructuralModel(ThreeCompartmentModel{});
        default:
            return Result<StructuralModel>::failure(
                ErrorKind::InvalidModel,
                "Unsupported number of compartments: " + std::to_string(compartments));
    }
}

Result<StructuralModel> StructuralModel::create(int compartments, const ModelParameters& params) {
    auto model = create(compartments);
    if (!model) {
        return model;
    }
    if (auto err = model->set_parameters(params)) {
        return *err;
    }
    return model;
}

}  // namespace poppk::v1
