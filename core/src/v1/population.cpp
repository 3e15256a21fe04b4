#include "poppk/v1/population.hpp"

#include "poppk/v1/variability.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

namespace poppk::v1 {

PopulationSimulator::PopulationSimulator(const Config& config, PopulationOptions options)
    : config_(config),
      options_(std::move(options)),
      regimen_(DosingRegimen::from_config(config.dosing)),
      factory_(config) {}

Result<PatientResult> PopulationSimulator::simulate_patient(PatientId patient_id,
                                                            RandomStream& rng) const {
    auto individual = factory_.create(patient_id, rng);
    if (!individual) {
        return individual.error();
    }

    PatientResult result;
    result.patient_id = patient_id;
    result.demographics = individual->demographics;
    result.parameters = std::move(individual->parameters);

    const auto& grid = config_.simulation.time_points;
    result.observations.reserve(grid.size());
    for (Real t : grid) {
        const Real predicted = individual->model.concentration_at(t, regimen_.events_before(t));
        auto observed = apply_residual_error(predicted, config_.simulation.error_model, rng);
        if (!observed) {
            Error err = observed.error();
            err.message = "patient " + std::to_string(patient_id) + ": " + err.message;
            return err;
        }
        result.observations.push_back({t, *observed, predicted});
    }
    return result;
}

Result<std::vector<PatientResult>> PopulationSimulator::run_shared(std::uint64_t seed) const {
    RandomStream rng(seed);
    std::vector<PatientResult> patients;
    patients.reserve(options_.n_patients);

    for (PatientId id = 1; id <= options_.n_patients; ++id) {
        auto patient = simulate_patient(id, rng);
        if (!patient) {
            return patient.error();
        }
        patients.push_back(std::move(*patient));
        if (options_.progress) {
            options_.progress(id, options_.n_patients);
        }
    }
    return patients;
}

Result<std::vector<PatientResult>> PopulationSimulator::run_per_patient(std::uint64_t seed) const {
    const std::size_t n = options_.n_patients;
    std::vector<std::optional<PatientResult>> slots(n);
    std::vector<std::optional<Error>> failures(n);

    std::atomic<std::size_t> next{0};
    std::atomic<std::size_t> completed{0};
    std::mutex progress_mutex;

    auto worker = [&]() {
        for (std::size_t index = next++; index < n; index = next++) {
            const PatientId id = index + 1;
            RandomStream rng(derive_patient_seed(seed, id));
            auto patient = simulate_patient(id, rng);
            if (!patient) {
                failures[index] = patient.error();
                continue;
            }
            slots[index] = std::move(*patient);
            const std::size_t done = ++completed;
            if (options_.progress) {
                std::lock_guard<std::mutex> lock(progress_mutex);
                options_.progress(done, n);
            }
        }
    };

    const std::size_t thread_count =
        std::clamp<std::size_t>(options_.threads, 1, std::max<std::size_t>(n, 1));
    if (thread_count == 1) {
        worker();
    } else {
        std::vector<std::thread> workers;
        workers.reserve(thread_count);
        for (std::size_t i = 0; i < thread_count; ++i) {
            workers.emplace_back(worker);
        }
        for (auto& w : workers) {
            w.join();
        }
    }

    // Every patient runs to completion; the lowest failing id is reported
    for (const auto& failure : failures) {
        if (failure) {
            return *failure;
        }
    }

    std::vector<PatientResult> patients;
    patients.reserve(n);
    for (auto& slot : slots) {
        patients.push_back(std::move(*slot));
    }
    return patients;
}

std::vector<std::string> PopulationSimulator::configuration_warnings() const {
    std::vector<std::string> warnings;
    const auto method = config_.simulation.integration_method;
    if (method != IntegrationMethod::Analytical) {
        warnings.push_back(std::string("integration method '") + to_string(method) +
                           "' is not implemented; using analytical solutions");
    }
    if (config_.dosing.lag_time() > 0.0) {
        warnings.push_back("dosing.additional.lag_time is reserved and ignored");
    }
    if (config_.dosing.route != DoseRoute::Oral && config_.dosing.additional &&
        config_.dosing.additional->bioavailability) {
        warnings.push_back("dosing.additional.bioavailability only applies to oral doses");
    }
    return warnings;
}

Result<PopulationRun> PopulationSimulator::run() const {
    if (auto err = validate(config_)) {
        return *err;
    }
    if (options_.stream_mode == StreamMode::Shared && options_.threads > 1) {
        return Result<PopulationRun>::failure(
            ErrorKind::Validation,
            "threads > 1 requires the per-patient stream mode");
    }

    PopulationRun run;
    run.seed = options_.seed ? *options_.seed : entropy_seed();
    run.warnings = configuration_warnings();

    auto patients = options_.stream_mode == StreamMode::Shared ? run_shared(run.seed)
                                                               : run_per_patient(run.seed);
    if (!patients) {
        return patients.error();
    }
    run.patients = std::move(*patients);
    return run;
}

Result<std::vector<PatientResult>> simulate_population(const Config& config,
                                                       std::size_t n_patients,
                                                       std::optional<std::uint64_t> seed) {
    PopulationOptions options;
    options.n_patients = n_patients;
    options.seed = seed;
    PopulationSimulator simulator(config, std::move(options));

    auto run = simulator.run();
    if (!run) {
        return run.error();
    }
    return std::move(run->patients);
}

}  // namespace poppk::v1
