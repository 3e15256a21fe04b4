#include <CLI/CLI.hpp>
#include <poppk/v1/core.hpp>

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace poppk::v1;

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitInvalidConfig = 2;

struct RunSettings {
    std::string config_file;
    std::string output_dir;
    std::size_t n_patients = 100;
    std::optional<std::uint64_t> seed;
    std::size_t threads = 1;
    StreamMode stream_mode = StreamMode::Shared;
    bool report = false;
    bool verbose = false;
    bool quiet = false;
};

int exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ParseJson:
        case ErrorKind::ParseYaml:
        case ErrorKind::ParseCsv:
        case ErrorKind::ParseControlStream:
        case ErrorKind::InvalidModel:
        case ErrorKind::InvalidDosing:
        case ErrorKind::Validation:
            return kExitInvalidConfig;
        default:
            return kExitFailure;
    }
}

void print_progress(std::size_t done, std::size_t total) {
    const int percent = total > 0 ? static_cast<int>(100.0 * static_cast<double>(done) /
                                                     static_cast<double>(total))
                                  : 100;
    std::cerr << "\rProgress: " << percent << "% (" << done << "/" << total << " patients)"
              << std::flush;
}

void print_warnings(const std::vector<std::string>& warnings) {
    for (const auto& warning : warnings) {
        std::cerr << "Warning: " << warning << std::endl;
    }
}

void print_config_summary(const Config& config, std::ostream& out) {
    out << "  Model: " << config.model.compartments << "-compartment" << std::endl;
    out << "  Route: " << to_string(config.dosing.route) << ", amount "
        << config.dosing.amount << ", " << config.dosing.times.size() << " dose(s)" << std::endl;
    out << "  Parameters:" << std::endl;
    for (const auto& param : config.model.parameters) {
        out << "    " << param.name << ": theta=" << param.theta;
        if (param.omega) out << " omega=" << *param.omega << "%";
        if (param.bounds) {
            out << " bounds=[" << param.bounds->first << ", " << param.bounds->second << "]";
        }
        out << std::endl;
    }
    if (!config.population.covariates.empty()) {
        out << "  Covariates:" << std::endl;
        for (const auto& cov : config.population.covariates) {
            out << "    " << cov.key << ": " << to_string(cov.model) << " effect=" << cov.effect
                << " reference=" << cov.reference << std::endl;
        }
    }
    const auto& em = config.simulation.error_model;
    out << "  Residual error: " << to_string(em.type);
    if (em.sigma_add) out << " sigma_add=" << *em.sigma_add;
    if (em.sigma_prop) out << " sigma_prop=" << *em.sigma_prop;
    out << std::endl;
    out << "  Time points: " << config.simulation.time_points.size() << std::endl;
}

/// Load a configuration, printing parser warnings; nullopt after printing the error
std::optional<Config> load_config(const std::string& path, bool quiet, int& exit_code) {
    parser::ConfigParser config_parser;
    auto result = config_parser.load(path);
    if (!quiet) {
        print_warnings(config_parser.warnings());
    }
    if (!result) {
        std::cerr << "Error: " << result.error().to_string() << std::endl;
        exit_code = exit_code_for(result.error().kind);
        return std::nullopt;
    }
    return std::move(*result);
}

int cmd_check(const std::string& config_file, bool verbose) {
    try {
        int exit_code = 0;
        auto config = load_config(config_file, false, exit_code);
        if (!config) {
            return exit_code;
        }

        if (verbose) {
            std::cout << "Configuration is valid." << std::endl;
            print_config_summary(*config, std::cout);
        } else {
            std::cout << "OK" << std::endl;
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitFailure;
    }
}

int cmd_run(const RunSettings& settings) {
    try {
        if (!settings.quiet) {
            std::cerr << "Reading configuration: " << settings.config_file << std::endl;
        }

        int exit_code = 0;
        auto config = load_config(settings.config_file, settings.quiet, exit_code);
        if (!config) {
            return exit_code;
        }

        if (settings.verbose) {
            std::cerr << "Configuration loaded:" << std::endl;
            print_config_summary(*config, std::cerr);
        }

        PopulationOptions options;
        options.n_patients = settings.n_patients;
        options.seed = settings.seed;
        options.stream_mode = settings.stream_mode;
        options.threads = settings.threads;
        if (!settings.quiet) {
            options.progress = print_progress;
        }

        if (!settings.quiet) {
            std::cerr << "Simulating " << settings.n_patients << " patients";
            if (settings.seed) {
                std::cerr << " (seed: " << *settings.seed << ")";
            } else {
                std::cerr << " (random seed)";
            }
            std::cerr << "..." << std::endl;
            if (settings.verbose) {
                std::cerr << "  Stream mode: " << to_string(settings.stream_mode) << std::endl;
                std::cerr << "  Threads: " << settings.threads << std::endl;
            }
        }

        const auto start = std::chrono::steady_clock::now();
        PopulationSimulator simulator(*config, std::move(options));
        auto run = simulator.run();
        if (!settings.quiet && settings.n_patients > 0) {
            std::cerr << std::endl;  // Newline after progress
        }
        if (!run) {
            std::cerr << "Error: " << run.error().to_string() << std::endl;
            return exit_code_for(run.error().kind);
        }
        const auto elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start).count();

        if (!settings.quiet) {
            print_warnings(run->warnings);
            std::cerr << "Simulation completed:" << std::endl;
            std::cerr << "  Patients: " << run->patients.size() << std::endl;
            if (settings.verbose) {
                std::cerr << "  Seed: " << run->seed << std::endl;
                std::cerr << "  Wall time: " << std::fixed << std::setprecision(3) << elapsed
                          << "s" << std::endl;
            }
            std::cerr << "Writing results to: " << settings.output_dir << std::endl;
        }

        io::ResultWriter writer(settings.output_dir, io::ResultWriterOptions{settings.report});
        const auto files = writer.write(*config, *run);

        if (settings.verbose) {
            for (const auto& file : files) {
                std::cerr << "  " << file.string() << std::endl;
            }
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitFailure;
    }
}

}  // namespace

int main(int argc, char** argv) {
    CLI::App app{"poppk - Population pharmacokinetics simulator"};
    app.set_version_flag("--version", std::string("poppk ") + poppk::kVersion);

    RunSettings settings;
    std::string stream_mode = "shared";
    bool check_only = false;

    app.add_option("-c,--config", settings.config_file,
                   "Configuration file (.json, .yaml, .yml, .ctl, .mod)")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("-o,--output", settings.output_dir, "Output directory");
    app.add_option("-p,--patients", settings.n_patients, "Number of patients to simulate")
        ->capture_default_str();
    app.add_option("-s,--seed", settings.seed, "Random seed for reproducibility");
    app.add_option("--threads", settings.threads, "Worker threads (per-patient streams only)")
        ->capture_default_str()
        ->check(CLI::PositiveNumber);
    app.add_option("--stream-mode", stream_mode, "Random stream layout")
        ->capture_default_str()
        ->check(CLI::IsMember({"shared", "per-patient"}));
    app.add_flag("--report", settings.report, "Also write simulation_report.md");
    app.add_flag("--check", check_only, "Validate the configuration and exit");
    app.add_flag("-v,--verbose", settings.verbose, "Verbose output");
    app.add_flag("-q,--quiet", settings.quiet, "Quiet mode (errors only)");

    CLI11_PARSE(app, argc, argv);

    if (check_only) {
        return cmd_check(settings.config_file, settings.verbose);
    }
    if (settings.output_dir.empty()) {
        std::cerr << "Error: --output is required unless --check is given" << std::endl;
        return kExitInvalidConfig;
    }

    settings.stream_mode = stream_mode == "per-patient" ? StreamMode::PerPatient
                                                        : StreamMode::Shared;
    if (settings.verbose && settings.quiet) {
        settings.quiet = false;
    }
    return cmd_run(settings);
}
