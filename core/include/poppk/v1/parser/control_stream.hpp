#pragma once

// =============================================================================
// poppk - NONMEM-style control stream reader
// =============================================================================
// Supported records (names may be abbreviated to three letters):
//   $PROBLEM $INPUT $DATA $PK $ERROR $ESTIMATION $TABLE   ignored
//   $SUBROUTINES  ADVAN1 -> 1, ADVAN3 -> 2, ADVAN11 -> 3 compartments
//   $THETA        init | (init) | (lo, init) | (lo, init, hi) [FIX]
//   $OMEGA        diagonal variances, converted to CV%
//   $SIGMA        variances, converted to standard deviations
//   $DOSING $POPULATION $SIMULATION   KEY = value lines
// THETA and OMEGA entries map by position onto the parameter list of the
// selected model (CL, V, KA / CL, V1, Q, V2, KA / CL, V1, Q2, V2, Q3, V3, KA).
// =============================================================================

#include "poppk/v1/config.hpp"
#include "poppk/v1/error.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace poppk::v1::parser {

/// How an $OMEGA variance is turned into CV%
enum class OmegaConvention {
    SquareRoot,  // sqrt(omega^2) * 100
    Exact        // sqrt(exp(omega^2) - 1) * 100
};

struct ControlStreamOptions {
    OmegaConvention omega_convention = OmegaConvention::SquareRoot;
};

/// Defaults used when a record is absent
inline const std::vector<Real> kDefaultTimeGrid{0.0, 1.0, 2.0, 4.0, 8.0, 12.0, 24.0};
inline constexpr Real kDefaultProportionalSigma = 0.1;
inline constexpr Real kDefaultDoseAmount = 100.0;

/// Convert an $OMEGA variance to CV%
[[nodiscard]] Real omega_variance_to_cv(Real variance, OmegaConvention convention);

class ControlStreamParser {
public:
    explicit ControlStreamParser(ControlStreamOptions options = {});

    Result<Config> load(const std::filesystem::path& path);
    Result<Config> parse_string(const std::string& content);

    const std::vector<std::string>& errors() const { return errors_; }
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    ControlStreamOptions options_;
    std::vector<std::string> errors_;
    std::vector<std::string> warnings_;
};

}  // namespace poppk::v1::parser
