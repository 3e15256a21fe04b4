#include <catch2/catch_test_macros.hpp>

#include "poppk/v1/io/result_writer.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace poppk::v1;
using namespace poppk::v1::io;

namespace {

Config make_config() {
    Config config;
    config.model.compartments = 1;
    config.model.parameters = {
        {"V", 10.0, 20.0, std::nullopt},
        {"CL", 2.0, 30.0, std::nullopt},
    };
    config.dosing.route = DoseRoute::IvBolus;
    config.dosing.amount = 100.0;
    config.dosing.times = {0.0, 12.0};
    config.simulation.time_points = {0.0, 1.5};
    config.simulation.error_model = ErrorModelConfig::proportional(0.1);
    return config;
}

PopulationRun make_run() {
    PopulationRun run;
    run.seed = 123;
    for (PatientId id = 1; id <= 2; ++id) {
        PatientResult patient;
        patient.patient_id = id;
        patient.demographics = {70.5, 40.0};
        patient.parameters = {{"V", 10.0 * static_cast<Real>(id)}, {"CL", 2.0}};
        patient.observations = {{0.0, 10.0, 10.0}, {1.5, 7.25, 7.5}};
        run.patients.push_back(patient);
    }
    return run;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

/// Fresh directory under the system temp path, removed at scope exit
class TempDir {
public:
    explicit TempDir(const std::string& name)
        : path_(std::filesystem::temp_directory_path() / name) {
        std::filesystem::remove_all(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace

TEST_CASE("v1 numbers are written in shortest round-trip form", "[v1][io]") {
    CHECK(format_number(2.0) == "2");
    CHECK(format_number(0.1) == "0.1");
    CHECK(format_number(70.5) == "70.5");
    CHECK(format_number(-3.25) == "-3.25");
    CHECK(std::stod(format_number(1.0 / 3.0)) == 1.0 / 3.0);
}

TEST_CASE("v1 individual and concentration tables", "[v1][io][csv]") {
    const auto run = make_run();

    const std::string individual = render_individual_csv(run.patients);
    CHECK(individual ==
          "PATIENT_ID,WEIGHT,AGE,CMAX,AUC,TMAX\n"
          "1,70.5,40,10,12.9375,0\n"
          "2,70.5,40,10,12.9375,0\n");

    const std::string concentrations = render_concentrations_csv(run.patients);
    CHECK(concentrations ==
          "PATIENT_ID,TIME,CONCENTRATION,PREDICTED_CONCENTRATION\n"
          "1,0,10,10\n"
          "1,1.5,7.25,7.5\n"
          "2,0,10,10\n"
          "2,1.5,7.25,7.5\n");

    CHECK(render_individual_csv({}) == "PATIENT_ID,WEIGHT,AGE,CMAX,AUC,TMAX\n");
}

TEST_CASE("v1 parameter table follows configuration order", "[v1][io][csv]") {
    const auto config = make_config();
    const auto run = make_run();
    CHECK(render_parameters_csv(config, run.patients) ==
          "PATIENT_ID,V,CL\n"
          "1,10,2\n"
          "2,20,2\n");
}

TEST_CASE("v1 summary document layout", "[v1][io][json]") {
    const auto run = make_run();
    const std::string json = render_summary_json(summarize_population(run.patients));

    CHECK(contains(json, "\"n_patients\": 2"));
    CHECK(contains(json, "\"parameters\""));
    CHECK(contains(json, "\"pharmacokinetics\""));
    CHECK(contains(json, "\"v_mean\": 15.0"));
    CHECK(contains(json, "\"cl_sd\": 0.0"));
    for (const char* key : {"cmax_mean", "cmax_sd", "auc_mean", "auc_sd", "tmax_mean",
                            "tmax_sd"}) {
        CHECK(contains(json, std::string("\"") + key + "\""));
    }
    // Keys stay in insertion order
    CHECK(json.find("cl_mean") < json.find("v_mean"));
    CHECK(json.find("\"parameters\"") < json.find("\"pharmacokinetics\""));
}

TEST_CASE("v1 markdown report", "[v1][io][report]") {
    const auto config = make_config();
    auto run = make_run();
    run.warnings.push_back("dosing.additional.lag_time is reserved and ignored");
    const std::vector<std::string> files{kIndividualDataFile, kReportFile};

    const std::string report =
        render_report_markdown(config, run, summarize_population(run.patients), files);
    CHECK(contains(report, "# Population PK Simulation Report"));
    CHECK(contains(report, "- Patients: 2"));
    CHECK(contains(report, "- Seed: 123"));
    CHECK(contains(report, "- Model: 1-compartment"));
    CHECK(contains(report, "- Dose: 100 at 0, 12"));
    CHECK(contains(report, "| V | 15 |"));
    CHECK(contains(report, "## Warnings"));
    CHECK(contains(report, "lag_time"));
    CHECK(contains(report, "- simulation_report.md"));
}

TEST_CASE("v1 result writer produces the output files", "[v1][io][writer]") {
    const auto config = make_config();
    const auto run = make_run();

    SECTION("default outputs") {
        TempDir dir("poppk_writer_test_default");
        const ResultWriter writer(dir.path() / "nested");
        const auto written = writer.write(config, run);

        REQUIRE(written.size() == 4);
        CHECK(written[0].filename() == kIndividualDataFile);
        CHECK(written[1].filename() == kConcentrationsFile);
        CHECK(written[2].filename() == kParametersFile);
        CHECK(written[3].filename() == kSummaryFile);
        for (const auto& path : written) {
            CHECK(std::filesystem::exists(path));
        }
        CHECK_FALSE(std::filesystem::exists(dir.path() / "nested" / kReportFile));
        CHECK(read_file(written[2]) == render_parameters_csv(config, run.patients));
    }

    SECTION("with report") {
        TempDir dir("poppk_writer_test_report");
        const ResultWriter writer(dir.path(), ResultWriterOptions{true});
        const auto written = writer.write(config, run);

        REQUIRE(written.size() == 5);
        CHECK(written.back().filename() == kReportFile);
        CHECK(contains(read_file(written.back()), "- concentrations.csv"));
    }

    SECTION("unwritable directory") {
        TempDir dir("poppk_writer_test_blocked");
        std::filesystem::create_directories(dir.path());
        const auto blocker = dir.path() / "file";
        std::ofstream(blocker) << "x";
        const ResultWriter writer(blocker / "out");
        CHECK_THROWS_AS(writer.write(config, run), std::runtime_error);
    }

    SECTION("failed write leaves no partial outputs") {
        TempDir dir("poppk_writer_test_partial");
        std::filesystem::create_directories(dir.path() / kParametersFile);
        const ResultWriter writer(dir.path());
        CHECK_THROWS_AS(writer.write(config, run), std::runtime_error);

        for (const char* name : {kIndividualDataFile, kConcentrationsFile, kSummaryFile}) {
            CHECK_FALSE(std::filesystem::exists(dir.path() / name));
            CHECK_FALSE(std::filesystem::exists(dir.path() / (std::string(name) + ".tmp")));
        }
        CHECK_FALSE(std::filesystem::exists(dir.path() / (std::string(kParametersFile) + ".tmp")));
        CHECK(std::filesystem::is_directory(dir.path() / kParametersFile));
    }
}
