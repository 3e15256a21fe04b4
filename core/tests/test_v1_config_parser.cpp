#include <catch2/catch_test_macros.hpp>

#include "poppk/v1/parser/config_parser.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace poppk::v1;
using namespace poppk::v1::parser;

namespace {

const char* kJsonConfig = R"({
  "model": {
    "compartments": 1,
    "parameters": {
      "CL": { "theta": 2.0, "omega": 30.0 },
      "V":  { "theta": 10.0, "omega": 20.0, "bounds": [2.0, 50.0] },
      "KA": { "theta": 1.0 }
    }
  },
  "dosing": {
    "route": "oral",
    "amount": 100.0,
    "times": [0.0, 12.0],
    "additional": { "bioavailability": 0.8 }
  },
  "population": {
    "demographics": { "weight_mean": 70.0, "weight_sd": 15.0, "age_mean": 45.0, "age_sd": 12.0 },
    "covariates": {
      "CL_WT": { "effect": 0.75, "reference": 70.0, "model": "power" },
      "V_AGE": { "effect": 0.01, "reference": 45.0, "model": "linear" }
    }
  },
  "simulation": {
    "time_points": [0, 1, 2, 4, 8, 12, 24],
    "error_model": { "type": "combined", "sigma_add": 0.05, "sigma_prop": 0.1 },
    "integration_method": "analytical"
  }
})";

const char* kYamlConfig = R"(
model:
  compartments: 2
  parameters:
    CL: { theta: 2.0, omega: 30 }
    V1: { theta: 10.0 }
    Q:  { theta: 1.0 }
    V2: { theta: 5.0, bounds: [1, 20] }
dosing:
  route: IVInfusion
  amount: 500
  times: [0, 24]
  additional:
    duration: 1.5
population:
  demographics:
    weight_mean: 80
    weight_sd: 10
    age_mean: 50
    age_sd: 8
simulation:
  time_points: [0, 0.5, 1, 2, 4, 8, 24]
  error_model:
    type: additive
    sigma_add: 0.2
  integration_method: analytical
  tolerance: 1e-6
)";

bool any_contains(const std::vector<std::string>& lines, const std::string& needle) {
    return std::any_of(lines.begin(), lines.end(), [&](const std::string& line) {
        return line.find(needle) != std::string::npos;
    });
}

std::string replace_once(std::string text, const std::string& from, const std::string& to) {
    const auto pos = text.find(from);
    REQUIRE(pos != std::string::npos);
    text.replace(pos, from.size(), to);
    return text;
}

/// Temporary file removed at scope exit
class TempFile {
public:
    TempFile(const std::string& name, const std::string& content)
        : path_(std::filesystem::temp_directory_path() / name) {
        std::ofstream out(path_);
        out << content;
    }
    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace

TEST_CASE("v1 JSON configuration loads", "[v1][parser][json]") {
    ConfigParser parser;
    auto result = parser.load_json_string(kJsonConfig);
    REQUIRE(result.has_value());
    CHECK(parser.errors().empty());

    const Config& config = *result;
    CHECK(config.model.compartments == 1);
    REQUIRE(config.model.parameters.size() == 3);
    // Insertion order is kept
    CHECK(config.model.parameters[0].name == "CL");
    CHECK(config.model.parameters[1].name == "V");
    CHECK(config.model.parameters[2].name == "KA");
    CHECK(config.model.parameters[0].omega == 30.0);
    REQUIRE(config.model.parameters[1].bounds.has_value());
    CHECK(config.model.parameters[1].bounds->second == 50.0);
    CHECK_FALSE(config.model.parameters[2].omega.has_value());

    CHECK(config.dosing.route == DoseRoute::Oral);
    CHECK(config.dosing.times == std::vector<Real>{0.0, 12.0});
    CHECK(config.dosing.bioavailability() == 0.8);

    REQUIRE(config.population.covariates.size() == 2);
    CHECK(config.population.covariates[1].model == CovariateModel::Linear);

    CHECK(config.simulation.time_points.size() == 7);
    CHECK(config.simulation.error_model.type == ErrorModelType::Combined);
    CHECK(config.simulation.error_model.sigma_add == 0.05);
    CHECK(config.simulation.integration_method == IntegrationMethod::Analytical);
}

TEST_CASE("v1 YAML configuration loads with the same schema", "[v1][parser][yaml]") {
    ConfigParser parser;
    auto result = parser.load_yaml_string(kYamlConfig);
    REQUIRE(result.has_value());

    const Config& config = *result;
    CHECK(config.model.compartments == 2);
    REQUIRE(config.model.parameters.size() == 4);
    CHECK(config.model.parameters[2].name == "Q");
    // Route tags are case-insensitive
    CHECK(config.dosing.route == DoseRoute::IvInfusion);
    CHECK(config.dosing.duration() == 1.5);
    CHECK(config.population.demographics.weight_mean == 80.0);
    CHECK(config.simulation.error_model.type == ErrorModelType::Additive);
    CHECK(config.simulation.tolerance == 1e-6);
}

TEST_CASE("v1 syntax errors map to the format's error kind", "[v1][parser]") {
    ConfigParser parser;

    auto json = parser.load_json_string("{ \"model\": ");
    REQUIRE_FALSE(json.has_value());
    CHECK(json.error().kind == ErrorKind::ParseJson);
    CHECK(any_contains(parser.errors(), "POPPK_CFG_E_SYNTAX"));

    auto yaml = parser.load_yaml_string("model: [1, 2");
    REQUIRE_FALSE(yaml.has_value());
    CHECK(yaml.error().kind == ErrorKind::ParseYaml);
}

TEST_CASE("v1 strict mode rejects unknown fields", "[v1][parser][strict]") {
    const std::string text = replace_once(kJsonConfig, "\"amount\": 100.0,",
                                          "\"amount\": 100.0, \"units\": \"mg\",");

    SECTION("strict") {
        ConfigParser parser;
        auto result = parser.load_json_string(text);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().kind == ErrorKind::ParseJson);
        CHECK(result.error().message.find("dosing.units") != std::string::npos);
        CHECK(any_contains(parser.errors(), "POPPK_CFG_E_UNKNOWN_FIELD"));
    }

    SECTION("non-strict") {
        ConfigParser parser(ConfigParserOptions{false, {}});
        auto result = parser.load_json_string(text);
        REQUIRE(result.has_value());
        CHECK(any_contains(parser.warnings(), "POPPK_CFG_W_UNKNOWN_FIELD"));
    }
}

TEST_CASE("v1 schema errors name the field", "[v1][parser]") {
    ConfigParser parser;

    SECTION("missing field") {
        auto result = parser.load_json_string(
            replace_once(kJsonConfig, "\"amount\": 100.0,", ""));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().message.find("dosing.amount") != std::string::npos);
        CHECK(any_contains(parser.errors(), "POPPK_CFG_E_MISSING_FIELD"));
    }

    SECTION("type mismatch") {
        auto result = parser.load_json_string(
            replace_once(kJsonConfig, "\"compartments\": 1", "\"compartments\": \"one\""));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().message.find("model.compartments") != std::string::npos);
        CHECK(any_contains(parser.errors(), "POPPK_CFG_E_TYPE_MISMATCH"));
    }

    SECTION("unsupported enum value") {
        auto result = parser.load_json_string(
            replace_once(kJsonConfig, "\"route\": \"oral\"", "\"route\": \"subcutaneous\""));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().message.find("subcutaneous") != std::string::npos);
        CHECK(any_contains(parser.errors(), "POPPK_CFG_E_UNSUPPORTED_VALUE"));
    }

    SECTION("malformed bounds") {
        auto result = parser.load_json_string(
            replace_once(kJsonConfig, "\"bounds\": [2.0, 50.0]", "\"bounds\": [2.0]"));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().message.find("model.parameters.V.bounds") != std::string::npos);
    }
}

TEST_CASE("v1 parsed configuration is validated", "[v1][parser][validation]") {
    ConfigParser parser;
    auto result = parser.load_json_string(
        replace_once(kJsonConfig, "\"KA\": { \"theta\": 1.0 }", "\"KA\": { \"theta\": -1.0 }"));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == ErrorKind::Validation);
    CHECK(result.error().message.find("KA") != std::string::npos);
    CHECK(any_contains(parser.errors(), "POPPK_CFG_E_VALIDATION"));
}

TEST_CASE("v1 legacy sigma field", "[v1][parser][legacy]") {
    const std::string error_model =
        "\"error_model\": { \"type\": \"combined\", \"sigma_add\": 0.05, \"sigma_prop\": 0.1 },";

    SECTION("alone it reads as a proportional model") {
        ConfigParser parser;
        auto result = parser.load_json_string(replace_once(kJsonConfig, error_model,
                                                           "\"sigma\": 0.2,"));
        REQUIRE(result.has_value());
        CHECK(result->simulation.error_model.type == ErrorModelType::Proportional);
        CHECK(result->simulation.error_model.sigma_prop == 0.2);
        CHECK(any_contains(parser.warnings(), "POPPK_CFG_W_DEPRECATED_FIELD"));
    }

    SECTION("error_model wins") {
        ConfigParser parser;
        auto result = parser.load_json_string(replace_once(kJsonConfig, error_model,
                                                           error_model + " \"sigma\": 0.2,"));
        REQUIRE(result.has_value());
        CHECK(result->simulation.error_model.type == ErrorModelType::Combined);
        CHECK(any_contains(parser.warnings(), "ignored"));
    }

    SECTION("neither is an error") {
        ConfigParser parser;
        auto result = parser.load_json_string(replace_once(kJsonConfig, error_model, ""));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().message.find("simulation.error_model") != std::string::npos);
    }
}

TEST_CASE("v1 config parser dispatches on the file extension", "[v1][parser][io]") {
    SECTION("json") {
        TempFile file("poppk_parser_test.json", kJsonConfig);
        ConfigParser parser;
        auto result = parser.load(file.path());
        REQUIRE(result.has_value());
        CHECK(result->model.compartments == 1);
    }

    SECTION("yml") {
        TempFile file("poppk_parser_test.yml", kYamlConfig);
        ConfigParser parser;
        auto result = parser.load(file.path());
        REQUIRE(result.has_value());
        CHECK(result->model.compartments == 2);
    }

    SECTION("control stream") {
        TempFile file("poppk_parser_test.ctl",
                      "$SUBROUTINES ADVAN1 TRANS2\n$THETA 2.0 10.0\n$OMEGA 0.09 0.04\n");
        ConfigParser parser;
        auto result = parser.load(file.path());
        REQUIRE(result.has_value());
        CHECK(result->model.parameters.size() == 2);
    }

    SECTION("unknown extension") {
        TempFile file("poppk_parser_test.txt", kJsonConfig);
        ConfigParser parser;
        auto result = parser.load(file.path());
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().kind == ErrorKind::Io);
    }

    SECTION("missing file") {
        ConfigParser parser;
        auto result = parser.load(std::filesystem::temp_directory_path() /
                                  "poppk_parser_test_missing.json");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().kind == ErrorKind::Io);
    }
}
