#pragma once

// =============================================================================
// poppk - Result serialisation
// =============================================================================
// Every file is rendered to a string first; the output directory is only
// touched once all renders have succeeded. Files are staged as `<name>.tmp`
// and renamed into place together; on any I/O failure the staged and already
// renamed files of the call are removed and std::runtime_error is thrown.
// =============================================================================

#include "poppk/v1/config.hpp"
#include "poppk/v1/endpoints.hpp"
#include "poppk/v1/population.hpp"

#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace poppk::v1::io {

inline constexpr const char* kIndividualDataFile = "individual_data.csv";
inline constexpr const char* kConcentrationsFile = "concentrations.csv";
inline constexpr const char* kParametersFile = "parameters.csv";
inline constexpr const char* kSummaryFile = "population_summary.json";
inline constexpr const char* kReportFile = "simulation_report.md";

/// Shortest text that reads back to the same double
[[nodiscard]] std::string format_number(Real value);

[[nodiscard]] std::string render_individual_csv(std::span<const PatientResult> patients);
[[nodiscard]] std::string render_concentrations_csv(std::span<const PatientResult> patients);
/// Columns follow the configured parameter order
[[nodiscard]] std::string render_parameters_csv(const Config& config,
                                                std::span<const PatientResult> patients);
[[nodiscard]] std::string render_summary_json(const PopulationSummary& summary);
[[nodiscard]] std::string render_report_markdown(const Config& config, const PopulationRun& run,
                                                 const PopulationSummary& summary,
                                                 std::span<const std::string> files);

struct ResultWriterOptions {
    bool write_report = false;
};

class ResultWriter {
public:
    explicit ResultWriter(std::filesystem::path output_dir, ResultWriterOptions options = {});

    /// Write every output file; returns the paths written
    std::vector<std::filesystem::path> write(const Config& config, const PopulationRun& run) const;

    [[nodiscard]] const std::filesystem::path& output_dir() const { return output_dir_; }

private:
    std::filesystem::path output_dir_;
    ResultWriterOptions options_;
};

}  // namespace poppk::v1::io
