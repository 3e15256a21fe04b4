#include "poppk/v1/io/result_writer.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <charconv>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace poppk::v1::io {

namespace {

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open output file: " + path.string());
    }
    file << content;
    file.flush();
    if (!file) {
        throw std::runtime_error("Failed writing output file: " + path.string());
    }
}

constexpr const char* kStagingSuffix = ".tmp";

void remove_quietly(const std::vector<std::filesystem::path>& paths) {
    for (const auto& path : paths) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec)) {
            std::filesystem::remove(path, ec);
        }
    }
}

void write_statistic_row(std::ostringstream& out, const char* label,
                         const SummaryStatistic& stat) {
    out << "| " << label << " | " << format_number(stat.mean) << " | " << format_number(stat.sd)
        << " | " << format_number(stat.cv_percent()) << " |\n";
}

}  // namespace

std::string format_number(Real value) {
    std::array<char, 64> buffer{};
    const auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec != std::errc{}) {
        throw std::runtime_error("Cannot format number");
    }
    return std::string(buffer.data(), end);
}

std::string render_individual_csv(std::span<const PatientResult> patients) {
    std::ostringstream out;
    out << "PATIENT_ID,WEIGHT,AGE,CMAX,AUC,TMAX\n";
    for (const auto& patient : patients) {
        const auto e = compute_endpoints(patient);
        out << e.patient_id << ',' << format_number(e.weight) << ',' << format_number(e.age) << ','
            << format_number(e.cmax) << ',' << format_number(e.auc) << ','
            << format_number(e.tmax) << '\n';
    }
    return out.str();
}

std::string render_concentrations_csv(std::span<const PatientResult> patients) {
    std::ostringstream out;
    out << "PATIENT_ID,TIME,CONCENTRATION,PREDICTED_CONCENTRATION\n";
    for (const auto& patient : patients) {
        for (const auto& obs : patient.observations) {
            out << patient.patient_id << ',' << format_number(obs.time) << ','
                << format_number(obs.concentration) << ','
                << format_number(obs.predicted_concentration) << '\n';
        }
    }
    return out.str();
}

std::string render_parameters_csv(const Config& config, std::span<const PatientResult> patients) {
    std::ostringstream out;
    out << "PATIENT_ID";
    for (const auto& param : config.model.parameters) {
        out << ',' << param.name;
    }
    out << '\n';

    for (const auto& patient : patients) {
        out << patient.patient_id;
        for (const auto& param : config.model.parameters) {
            const auto value = find_parameter(patient.parameters, param.name);
            out << ',';
            if (value) out << format_number(*value);
        }
        out << '\n';
    }
    return out.str();
}

std::string render_summary_json(const PopulationSummary& summary) {
    nlohmann::ordered_json root;
    root["n_patients"] = summary.n_patients;
    root["parameters"] = {
        {"cl_mean", summary.cl.mean},
        {"cl_sd", summary.cl.sd},
        {"v_mean", summary.v.mean},
        {"v_sd", summary.v.sd},
    };
    root["pharmacokinetics"] = {
        {"cmax_mean", summary.cmax.mean},
        {"cmax_sd", summary.cmax.sd},
        {"auc_mean", summary.auc.mean},
        {"auc_sd", summary.auc.sd},
        {"tmax_mean", summary.tmax.mean},
        {"tmax_sd", summary.tmax.sd},
    };
    return root.dump(2) + "\n";
}

std::string render_report_markdown(const Config& config, const PopulationRun& run,
                                   const PopulationSummary& summary,
                                   std::span<const std::string> files) {
    std::ostringstream out;
    out << "# Population PK Simulation Report\n\n";

    out << "## Overview\n\n";
    out << "- Patients: " << summary.n_patients << "\n";
    out << "- Seed: " << run.seed << "\n";
    out << "- Model: " << config.model.compartments << "-compartment\n";
    out << "- Route: " << to_string(config.dosing.route) << "\n";
    out << "- Dose: " << format_number(config.dosing.amount) << " at";
    for (std::size_t i = 0; i < config.dosing.times.size(); ++i) {
        out << (i == 0 ? " " : ", ") << format_number(config.dosing.times[i]);
    }
    out << "\n";
    out << "- Residual error: " << to_string(config.simulation.error_model.type) << "\n\n";

    out << "## Time Grid\n\n";
    for (std::size_t i = 0; i < config.simulation.time_points.size(); ++i) {
        out << (i == 0 ? "" : ", ") << format_number(config.simulation.time_points[i]);
    }
    out << "\n\n";

    out << "## Summary Statistics\n\n";
    out << "| Quantity | Mean | SD | CV% |\n";
    out << "|---|---|---|---|\n";
    write_statistic_row(out, "CL", summary.cl);
    write_statistic_row(out, "V", summary.v);
    write_statistic_row(out, "Cmax", summary.cmax);
    write_statistic_row(out, "AUC", summary.auc);
    write_statistic_row(out, "Tmax", summary.tmax);
    out << "\n";

    if (!run.warnings.empty()) {
        out << "## Warnings\n\n";
        for (const auto& warning : run.warnings) {
            out << "- " << warning << "\n";
        }
        out << "\n";
    }

    out << "## Generated Files\n\n";
    for (const auto& file : files) {
        out << "- " << file << "\n";
    }
    return out.str();
}

ResultWriter::ResultWriter(std::filesystem::path output_dir, ResultWriterOptions options)
    : output_dir_(std::move(output_dir)), options_(options) {}

std::vector<std::filesystem::path> ResultWriter::write(const Config& config,
                                                       const PopulationRun& run) const {
    const auto summary = summarize_population(run.patients);

    std::vector<std::pair<std::string, std::string>> outputs;
    outputs.emplace_back(kIndividualDataFile, render_individual_csv(run.patients));
    outputs.emplace_back(kConcentrationsFile, render_concentrations_csv(run.patients));
    outputs.emplace_back(kParametersFile, render_parameters_csv(config, run.patients));
    outputs.emplace_back(kSummaryFile, render_summary_json(summary));
    if (options_.write_report) {
        std::vector<std::string> names;
        for (const auto& output : outputs) {
            names.push_back(output.first);
        }
        names.emplace_back(kReportFile);
        outputs.emplace_back(kReportFile, render_report_markdown(config, run, summary, names));
    }

    std::error_code ec;
    std::filesystem::create_directories(output_dir_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create output directory " + output_dir_.string() + ": " +
                                 ec.message());
    }

    // Stage every file first so a failure leaves no partial result set behind
    std::vector<std::filesystem::path> staged;
    std::vector<std::filesystem::path> written;
    staged.reserve(outputs.size());
    written.reserve(outputs.size());
    try {
        for (const auto& [name, content] : outputs) {
            staged.push_back(output_dir_ / (name + kStagingSuffix));
            write_file(staged.back(), content);
        }
        for (std::size_t i = 0; i < outputs.size(); ++i) {
            const auto path = output_dir_ / outputs[i].first;
            std::filesystem::rename(staged[i], path, ec);
            if (ec) {
                throw std::runtime_error("Cannot move output file into place: " + path.string() +
                                         ": " + ec.message());
            }
            written.push_back(path);
        }
    } catch (const std::runtime_error&) {
        remove_quietly(staged);
        remove_quietly(written);
        throw;
    }
    return written;
}

}  // namespace poppk::v1::io
