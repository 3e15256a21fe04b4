#pragma once

// =============================================================================
// poppk - Population driver
// =============================================================================
// Runs the individual factory for patients 1..N, evaluates each structural
// model on the time grid and applies residual error.
//
// Streams:
//   Shared      one stream for the whole run, single-threaded. Draw order is
//               weight, age, IIV per parameter, then residual error per grid
//               point, patient after patient.
//   PerPatient  patient i draws from its own stream seeded with
//               derive_patient_seed(seed, i). Results do not depend on the
//               thread count, but differ from Shared.
// =============================================================================

#include "poppk/v1/config.hpp"
#include "poppk/v1/dosing.hpp"
#include "poppk/v1/error.hpp"
#include "poppk/v1/individual.hpp"
#include "poppk/v1/random.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace poppk::v1 {

struct Observation {
    Real time = 0.0;
    Real concentration = 0.0;            // With residual error
    Real predicted_concentration = 0.0;  // Noise-free model output
};

struct PatientResult {
    PatientId patient_id = 0;
    Demographics demographics;
    ParameterMap parameters;
    std::vector<Observation> observations;
};

enum class StreamMode {
    Shared,
    PerPatient
};

[[nodiscard]] inline constexpr const char* to_string(StreamMode mode) noexcept {
    switch (mode) {
        case StreamMode::Shared: return "shared";
        case StreamMode::PerPatient: return "per-patient";
        default: return "unknown";
    }
}

/// Called after each patient completes (patient_id, n_patients)
using ProgressCallback = std::function<void(std::size_t, std::size_t)>;

struct PopulationOptions {
    std::size_t n_patients = 100;
    std::optional<std::uint64_t> seed;   // Entropy-seeded when absent
    StreamMode stream_mode = StreamMode::Shared;
    std::size_t threads = 1;             // > 1 requires PerPatient
    ProgressCallback progress;
};

struct PopulationRun {
    std::vector<PatientResult> patients;  // Ascending patient_id
    std::uint64_t seed = 0;               // Root seed actually used
    std::vector<std::string> warnings;
};

class PopulationSimulator {
public:
    /// `config` must outlive the simulator
    PopulationSimulator(const Config& config, PopulationOptions options = {});

    /// Validate the configuration and simulate the whole cohort.
    /// Any per-patient failure aborts the run.
    [[nodiscard]] Result<PopulationRun> run() const;

    /// One patient on the given stream
    [[nodiscard]] Result<PatientResult> simulate_patient(PatientId patient_id,
                                                         RandomStream& rng) const;

    [[nodiscard]] const DosingRegimen& regimen() const { return regimen_; }
    [[nodiscard]] const PopulationOptions& options() const { return options_; }

private:
    [[nodiscard]] Result<std::vector<PatientResult>> run_shared(std::uint64_t seed) const;
    [[nodiscard]] Result<std::vector<PatientResult>> run_per_patient(std::uint64_t seed) const;
    [[nodiscard]] std::vector<std::string> configuration_warnings() const;

    const Config& config_;
    PopulationOptions options_;
    DosingRegimen regimen_;
    IndividualFactory factory_;
};

/// Shared-stream run of `n_patients` patients
[[nodiscard]] Result<std::vector<PatientResult>> simulate_population(
    const Config& config, std::size_t n_patients, std::optional<std::uint64_t> seed);

}  // namespace poppk::v1
