#pragma once

// =============================================================================
// poppk - Population pharmacokinetics simulation core
// =============================================================================
// Main header. It provides:
// - Closed-form 1-, 2- and 3-compartment models (bolus, infusion, oral)
// - Individual factory (demographics, covariates, IIV, bounds)
// - Seeded population driver with optional per-patient streams
// - JSON / YAML / control-stream readers and CSV / JSON / Markdown writers
// =============================================================================

#include "poppk/v1/types.hpp"
#include "poppk/v1/error.hpp"
#include "poppk/v1/config.hpp"
#include "poppk/v1/random.hpp"
#include "poppk/v1/variability.hpp"
#include "poppk/v1/dosing.hpp"
#include "poppk/v1/models/model_parameters.hpp"
#include "poppk/v1/models/disposition.hpp"
#include "poppk/v1/models/one_compartment.hpp"
#include "poppk/v1/models/two_compartment.hpp"
#include "poppk/v1/models/three_compartment.hpp"
#include "poppk/v1/concepts.hpp"
#include "poppk/v1/structural_model.hpp"
#include "poppk/v1/individual.hpp"
#include "poppk/v1/population.hpp"
#include "poppk/v1/endpoints.hpp"
#include "poppk/v1/parser/control_stream.hpp"
#include "poppk/v1/parser/config_parser.hpp"
#include "poppk/v1/io/result_writer.hpp"

namespace poppk {

inline constexpr const char* kVersion = "0.1.0";

}  // namespace poppk
