#include "poppk/v1/parser/config_parser.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <string_view>

namespace poppk::v1::parser {

namespace {

using Json = nlohmann::ordered_json;

constexpr const char* kDiagSyntax = "POPPK_CFG_E_SYNTAX";
constexpr const char* kDiagMissingField = "POPPK_CFG_E_MISSING_FIELD";
constexpr const char* kDiagTypeMismatch = "POPPK_CFG_E_TYPE_MISMATCH";
constexpr const char* kDiagUnknownField = "POPPK_CFG_E_UNKNOWN_FIELD";
constexpr const char* kDiagUnknownFieldIgnored = "POPPK_CFG_W_UNKNOWN_FIELD";
constexpr const char* kDiagUnsupportedValue = "POPPK_CFG_E_UNSUPPORTED_VALUE";
constexpr const char* kDiagDeprecatedField = "POPPK_CFG_W_DEPRECATED_FIELD";
constexpr const char* kDiagValidation = "POPPK_CFG_E_VALIDATION";

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string with_diag_code(const std::string& code, const std::string& message) {
    return "[" + code + "] " + message;
}

std::string join(const std::vector<std::string>& lines, std::string_view sep) {
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += sep;
        out += lines[i];
    }
    return out;
}

std::string json_node_class(const Json& node) {
    if (node.is_null()) return "null";
    if (node.is_boolean()) return "boolean";
    if (node.is_number()) return "number";
    if (node.is_string()) return "string";
    if (node.is_array()) return "sequence";
    if (node.is_object()) return "map";
    return "unknown";
}

// YAML scalars carry no type; plain scalars become numbers or booleans when
// they decode as such, quoted scalars stay strings.
Json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Map: {
            Json out = Json::object();
            for (const auto& it : node) {
                out[it.first.as<std::string>()] = yaml_to_json(it.second);
            }
            return out;
        }
        case YAML::NodeType::Sequence: {
            Json out = Json::array();
            for (const auto& item : node) {
                out.push_back(yaml_to_json(item));
            }
            return out;
        }
        case YAML::NodeType::Scalar: {
            if (node.Tag() == "!") {
                return node.Scalar();
            }
            long long as_int = 0;
            if (YAML::convert<long long>::decode(node, as_int)) {
                return as_int;
            }
            double as_double = 0.0;
            if (YAML::convert<double>::decode(node, as_double)) {
                return as_double;
            }
            bool as_bool = false;
            if (YAML::convert<bool>::decode(node, as_bool)) {
                return as_bool;
            }
            return node.Scalar();
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
        default:
            return nullptr;
    }
}

class SchemaReader {
public:
    SchemaReader(std::vector<std::string>& errors, std::vector<std::string>& warnings, bool strict)
        : errors_(errors), warnings_(warnings), strict_(strict) {}

    void error(const char* code, const std::string& message) {
        errors_.push_back(with_diag_code(code, message));
    }

    void warning(const char* code, const std::string& message) {
        warnings_.push_back(with_diag_code(code, message));
    }

    void type_mismatch(const std::string& path, const std::string& expected, const Json& received) {
        error(kDiagTypeMismatch, "Type mismatch at '" + path + "' (expected " + expected +
                                     ", got " + json_node_class(received) + ")");
    }

    void check_keys(const Json& node, std::initializer_list<std::string_view> allowed,
                    const std::string& context) {
        if (!node.is_object()) return;
        for (const auto& item : node.items()) {
            const std::string& key = item.key();
            if (std::find(allowed.begin(), allowed.end(), key) != allowed.end()) continue;
            const std::string path = context.empty() ? key : context + "." + key;
            if (strict_) {
                error(kDiagUnknownField, "Unknown field at '" + path + "'");
            } else {
                warning(kDiagUnknownFieldIgnored, "Ignoring unknown field at '" + path + "'");
            }
        }
    }

    /// Child `key` of `parent`, nullptr (with an error) when absent
    const Json* require(const Json& parent, const std::string& key, const std::string& path) {
        const Json* child = find(parent, key);
        if (!child) {
            error(kDiagMissingField, "Missing required field '" + path + "'");
        }
        return child;
    }

    /// Child `key` of `parent`, nullptr when absent or null
    const Json* find(const Json& parent, const std::string& key) const {
        if (!parent.is_object()) return nullptr;
        auto it = parent.find(key);
        if (it == parent.end() || it->is_null()) return nullptr;
        return &*it;
    }

    bool expect_object(const Json& node, const std::string& path) {
        if (node.is_object()) return true;
        type_mismatch(path, "map", node);
        return false;
    }

    std::optional<Real> number(const Json& node, const std::string& path) {
        if (!node.is_number()) {
            type_mismatch(path, "number", node);
            return std::nullopt;
        }
        return node.get<Real>();
    }

    std::optional<int> integer(const Json& node, const std::string& path) {
        if (!node.is_number_integer()) {
            type_mismatch(path, "integer", node);
            return std::nullopt;
        }
        return node.get<int>();
    }

    std::optional<std::string> string(const Json& node, const std::string& path) {
        if (!node.is_string()) {
            type_mismatch(path, "string", node);
            return std::nullopt;
        }
        return node.get<std::string>();
    }

    std::optional<std::vector<Real>> number_list(const Json& node, const std::string& path) {
        if (!node.is_array()) {
            type_mismatch(path, "sequence of numbers", node);
            return std::nullopt;
        }
        std::vector<Real> values;
        values.reserve(node.size());
        for (std::size_t i = 0; i < node.size(); ++i) {
            auto value = number(node[i], path + "[" + std::to_string(i) + "]");
            if (!value) return std::nullopt;
            values.push_back(*value);
        }
        return values;
    }

    /// Number stored into `out` when the child is present
    void optional_number(const Json& parent, const std::string& key, const std::string& path,
                         std::optional<Real>& out) {
        if (const Json* child = find(parent, key)) {
            out = number(*child, path);
        }
    }

    void required_number(const Json& parent, const std::string& key, const std::string& path,
                         Real& out) {
        if (const Json* child = require(parent, key, path)) {
            if (auto value = number(*child, path)) out = *value;
        }
    }

    template<typename Enum, typename ParseFn>
    std::optional<Enum> tag(const Json& node, const std::string& path, ParseFn parse,
                            const char* expected) {
        auto text = string(node, path);
        if (!text) return std::nullopt;
        auto value = parse(to_lower(*text));
        if (!value) {
            error(kDiagUnsupportedValue, "Unsupported value '" + *text + "' at '" + path +
                                             "' (expected " + expected + ")");
        }
        return value;
    }

private:
    std::vector<std::string>& errors_;
    std::vector<std::string>& warnings_;
    bool strict_;
};

void parse_model(SchemaReader& r, const Json& node, ModelConfig& model) {
    if (!r.expect_object(node, "model")) return;
    r.check_keys(node, {"compartments", "parameters"}, "model");

    if (const Json* comp = r.require(node, "compartments", "model.compartments")) {
        if (auto value = r.integer(*comp, "model.compartments")) model.compartments = *value;
    }

    const Json* params = r.require(node, "parameters", "model.parameters");
    if (!params || !r.expect_object(*params, "model.parameters")) return;

    for (const auto& item : params->items()) {
        const std::string path = "model.parameters." + item.key();
        const Json& entry = item.value();
        if (!r.expect_object(entry, path)) continue;
        r.check_keys(entry, {"theta", "omega", "bounds"}, path);

        ParameterConfig param;
        param.name = item.key();
        r.required_number(entry, "theta", path + ".theta", param.theta);
        r.optional_number(entry, "omega", path + ".omega", param.omega);

        if (const Json* bounds = r.find(entry, "bounds")) {
            auto values = r.number_list(*bounds, path + ".bounds");
            if (values && values->size() == 2) {
                param.bounds = std::make_pair((*values)[0], (*values)[1]);
            } else if (values) {
                r.type_mismatch(path + ".bounds", "[lower, upper]", *bounds);
            }
        }
        model.parameters.push_back(std::move(param));
    }
}

void parse_dosing(SchemaReader& r, const Json& node, DosingConfig& dosing) {
    if (!r.expect_object(node, "dosing")) return;
    r.check_keys(node, {"route", "amount", "times", "additional"}, "dosing");

    if (const Json* route = r.require(node, "route", "dosing.route")) {
        if (auto value = r.tag<DoseRoute>(*route, "dosing.route", parse_dose_route,
                                          "oral|ivbolus|ivinfusion")) {
            dosing.route = *value;
        }
    }
    r.required_number(node, "amount", "dosing.amount", dosing.amount);
    if (const Json* times = r.require(node, "times", "dosing.times")) {
        if (auto values = r.number_list(*times, "dosing.times")) dosing.times = std::move(*values);
    }

    if (const Json* additional = r.find(node, "additional")) {
        if (!r.expect_object(*additional, "dosing.additional")) return;
        r.check_keys(*additional, {"duration", "lag_time", "bioavailability"},
                     "dosing.additional");
        AdditionalDosingParams params;
        r.optional_number(*additional, "duration", "dosing.additional.duration", params.duration);
        r.optional_number(*additional, "lag_time", "dosing.additional.lag_time", params.lag_time);
        r.optional_number(*additional, "bioavailability", "dosing.additional.bioavailability",
                          params.bioavailability);
        dosing.additional = params;
    }
}

void parse_population(SchemaReader& r, const Json& node, PopulationConfig& population) {
    if (!r.expect_object(node, "population")) return;
    r.check_keys(node, {"demographics", "covariates"}, "population");

    if (const Json* demo = r.require(node, "demographics", "population.demographics")) {
        if (r.expect_object(*demo, "population.demographics")) {
            r.check_keys(*demo, {"weight_mean", "weight_sd", "age_mean", "age_sd"},
                         "population.demographics");
            auto& d = population.demographics;
            r.required_number(*demo, "weight_mean", "population.demographics.weight_mean",
                              d.weight_mean);
            r.required_number(*demo, "weight_sd", "population.demographics.weight_sd",
                              d.weight_sd);
            r.required_number(*demo, "age_mean", "population.demographics.age_mean", d.age_mean);
            r.required_number(*demo, "age_sd", "population.demographics.age_sd", d.age_sd);
        }
    }

    const Json* covariates = r.find(node, "covariates");
    if (!covariates || !r.expect_object(*covariates, "population.covariates")) return;

    for (const auto& item : covariates->items()) {
        const std::string path = "population.covariates." + item.key();
        const Json& entry = item.value();
        if (!r.expect_object(entry, path)) continue;
        r.check_keys(entry, {"effect", "reference", "model"}, path);

        CovariateConfig cov;
        cov.key = item.key();
        r.required_number(entry, "effect", path + ".effect", cov.effect);
        if (const Json* reference = r.find(entry, "reference")) {
            if (auto value = r.number(*reference, path + ".reference")) cov.reference = *value;
        }
        if (const Json* model = r.find(entry, "model")) {
            if (auto value = r.tag<CovariateModel>(*model, path + ".model",
                                                   parse_covariate_model,
                                                   "power|exponential|linear")) {
                cov.model = *value;
            }
        }
        population.covariates.push_back(std::move(cov));
    }
}

void parse_error_model(SchemaReader& r, const Json& node, ErrorModelConfig& error_model) {
    const std::string path = "simulation.error_model";
    if (!r.expect_object(node, path)) return;
    r.check_keys(node, {"type", "sigma_add", "sigma_prop"}, path);

    if (const Json* type = r.require(node, "type", path + ".type")) {
        if (auto value = r.tag<ErrorModelType>(*type, path + ".type", parse_error_model_type,
                                               "additive|proportional|combined")) {
            error_model.type = *value;
        }
    }
    r.optional_number(node, "sigma_add", path + ".sigma_add", error_model.sigma_add);
    r.optional_number(node, "sigma_prop", path + ".sigma_prop", error_model.sigma_prop);
}

void parse_simulation(SchemaReader& r, const Json& node, SimulationConfig& sim) {
    if (!r.expect_object(node, "simulation")) return;
    r.check_keys(node, {"time_points", "error_model", "sigma", "integration_method", "tolerance"},
                 "simulation");

    if (const Json* grid = r.require(node, "time_points", "simulation.time_points")) {
        if (auto values = r.number_list(*grid, "simulation.time_points")) {
            sim.time_points = std::move(*values);
        }
    }

    const Json* error_model = r.find(node, "error_model");
    const Json* legacy_sigma = r.find(node, "sigma");
    if (error_model) {
        parse_error_model(r, *error_model, sim.error_model);
        if (legacy_sigma) {
            r.warning(kDiagDeprecatedField,
                      "'simulation.sigma' is ignored because 'simulation.error_model' is set");
        }
    } else if (legacy_sigma) {
        if (auto sd = r.number(*legacy_sigma, "simulation.sigma")) {
            sim.error_model = ErrorModelConfig::proportional(*sd);
            r.warning(kDiagDeprecatedField,
                      "'simulation.sigma' is deprecated; use 'simulation.error_model' "
                      "(read as a proportional error model)");
        }
    } else {
        r.error(kDiagMissingField, "Missing required field 'simulation.error_model'");
    }

    if (const Json* method = r.require(node, "integration_method",
                                       "simulation.integration_method")) {
        if (auto value = r.tag<IntegrationMethod>(*method, "simulation.integration_method",
                                                  parse_integration_method,
                                                  "analytical|rk4|euler")) {
            sim.integration_method = *value;
        }
    }
    r.optional_number(node, "tolerance", "simulation.tolerance", sim.tolerance);
}

Config parse_document(SchemaReader& r, const Json& root) {
    Config config;
    if (!r.expect_object(root, "root")) return config;
    r.check_keys(root, {"model", "dosing", "population", "simulation"}, "");

    if (const Json* model = r.require(root, "model", "model")) parse_model(r, *model, config.model);
    if (const Json* dosing = r.require(root, "dosing", "dosing")) {
        parse_dosing(r, *dosing, config.dosing);
    }
    if (const Json* population = r.require(root, "population", "population")) {
        parse_population(r, *population, config.population);
    }
    if (const Json* simulation = r.require(root, "simulation", "simulation")) {
        parse_simulation(r, *simulation, config.simulation);
    }
    return config;
}

Result<Config> finish(const Json& root, ErrorKind kind, bool strict,
                      std::vector<std::string>& errors, std::vector<std::string>& warnings) {
    SchemaReader reader(errors, warnings, strict);
    Config config = parse_document(reader, root);
    if (!errors.empty()) {
        return Result<Config>::failure(kind, join(errors, "; "));
    }
    if (auto err = validate(config)) {
        errors.push_back(with_diag_code(kDiagValidation, err->message));
        return *err;
    }
    return config;
}

}  // namespace

ConfigParser::ConfigParser(ConfigParserOptions options)
    : options_(std::move(options)) {}

void ConfigParser::reset() {
    errors_.clear();
    warnings_.clear();
}

Result<Config> ConfigParser::load_json_string(const std::string& content) {
    reset();
    Json root;
    try {
        root = Json::parse(content);
    } catch (const Json::parse_error& e) {
        errors_.push_back(with_diag_code(kDiagSyntax, std::string("JSON parse error: ") + e.what()));
        return Result<Config>::failure(ErrorKind::ParseJson, e.what());
    }
    return finish(root, ErrorKind::ParseJson, options_.strict, errors_, warnings_);
}

Result<Config> ConfigParser::load_yaml_string(const std::string& content) {
    reset();
    Json root;
    try {
        root = yaml_to_json(YAML::Load(content));
    } catch (const YAML::Exception& e) {
        errors_.push_back(with_diag_code(kDiagSyntax, std::string("YAML parse error: ") + e.what()));
        return Result<Config>::failure(ErrorKind::ParseYaml, e.what());
    }
    return finish(root, ErrorKind::ParseYaml, options_.strict, errors_, warnings_);
}

Result<Config> ConfigParser::load(const std::filesystem::path& path) {
    reset();
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<Config>::failure(ErrorKind::Io,
                                       "Cannot open configuration file: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    const std::string ext = to_lower(path.extension().string());
    if (ext == ".json") {
        return load_json_string(buffer.str());
    }
    if (ext == ".yaml" || ext == ".yml") {
        return load_yaml_string(buffer.str());
    }
    if (ext == ".ctl" || ext == ".mod") {
        ControlStreamParser control(options_.control_stream);
        auto result = control.parse_string(buffer.str());
        errors_ = control.errors();
        warnings_ = control.warnings();
        return result;
    }
    return Result<Config>::failure(ErrorKind::Io,
                                   "Unsupported configuration format '" + ext + "' for " +
                                       path.string() + " (expected .json, .yaml, .yml, .ctl, .mod)");
}

}  // namespace poppk::v1::parser
