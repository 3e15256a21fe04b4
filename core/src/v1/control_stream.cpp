#include "poppk/v1/parser/control_stream.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <string_view>

namespace poppk::v1::parser {

namespace {

constexpr const char* kDiagRecordOrder = "POPPK_CTL_E_RECORD_ORDER";
constexpr const char* kDiagMissingRecord = "POPPK_CTL_E_MISSING_RECORD";
constexpr const char* kDiagDuplicateRecord = "POPPK_CTL_E_DUPLICATE_RECORD";
constexpr const char* kDiagUnsupportedAdvan = "POPPK_CTL_E_ADVAN_UNSUPPORTED";
constexpr const char* kDiagInvalidValue = "POPPK_CTL_E_VALUE_INVALID";
constexpr const char* kDiagUnsupportedValue = "POPPK_CTL_E_UNSUPPORTED_VALUE";
constexpr const char* kDiagExtraEntries = "POPPK_CTL_W_EXTRA_ENTRIES";
constexpr const char* kDiagRecordIgnored = "POPPK_CTL_W_RECORD_IGNORED";
constexpr const char* kDiagUnknownKey = "POPPK_CTL_W_UNKNOWN_KEY";
constexpr const char* kDiagValidation = "POPPK_CTL_E_VALIDATION";

enum class RecordType {
    Problem,
    Input,
    Data,
    Subroutines,
    Pk,
    Error,
    Estimation,
    Table,
    Theta,
    Omega,
    Sigma,
    Dosing,
    Population,
    Simulation,
    Unknown
};

struct RecordName {
    std::string_view name;
    RecordType type;
};

constexpr std::array<RecordName, 14> kRecordNames{{
    {"PROBLEM", RecordType::Problem},
    {"INPUT", RecordType::Input},
    {"DATA", RecordType::Data},
    {"SUBROUTINES", RecordType::Subroutines},
    {"PK", RecordType::Pk},
    {"ERROR", RecordType::Error},
    {"ESTIMATION", RecordType::Estimation},
    {"TABLE", RecordType::Table},
    {"THETA", RecordType::Theta},
    {"OMEGA", RecordType::Omega},
    {"SIGMA", RecordType::Sigma},
    {"DOSING", RecordType::Dosing},
    {"POPULATION", RecordType::Population},
    {"SIMULATION", RecordType::Simulation},
}};

struct Record {
    RecordType type = RecordType::Unknown;
    std::string name;                // As written, upper case
    std::size_t line_number = 0;     // Line of the '$' header
    std::vector<std::string> lines;  // Header remainder first, comments stripped
};

/// One $THETA / $OMEGA / $SIGMA initial-estimate entry
struct Estimate {
    std::vector<Real> values;
    bool fixed = false;
};

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(std::string_view s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && is_space(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && is_space(static_cast<unsigned char>(s[end - 1]))) --end;
    return std::string(s.substr(begin, end - begin));
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

/// Full-token decimal parse; trailing garbage is rejected
std::optional<Real> parse_real(const std::string& raw) {
    const std::string text = trim(raw);
    if (text.empty()) return std::nullopt;
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) return std::nullopt;
    return value;
}

RecordType record_type(const std::string& name) {
    for (const auto& record : kRecordNames) {
        if (name == record.name) return record.type;
        if (name.size() >= 3 && record.name.size() > name.size() &&
            record.name.substr(0, name.size()) == name) {
            return record.type;
        }
    }
    return RecordType::Unknown;
}

bool is_fix_token(const std::string& token) {
    const std::string upper = to_upper(token);
    return upper == "FIX" || upper == "FIXED";
}

std::vector<std::string> split_tokens(std::string_view text, std::string_view separators) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : text) {
        if (separators.find(c) != std::string_view::npos ||
            std::isspace(static_cast<unsigned char>(c)) != 0) {
            if (!current.empty()) tokens.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) tokens.push_back(std::move(current));
    return tokens;
}

/// Parameters addressed by THETA/OMEGA position for each compartment count
std::vector<std::string> positional_parameters(int compartments) {
    switch (compartments) {
        case 1: return {"CL", "V", "KA"};
        case 2: return {"CL", "V1", "Q", "V2", "KA"};
        case 3: return {"CL", "V1", "Q2", "V2", "Q3", "V3", "KA"};
        default: return {};
    }
}

std::optional<int> advan_compartments(const std::string& token) {
    if (token == "ADVAN1" || token == "ADVAN2") return 1;
    if (token == "ADVAN3" || token == "ADVAN4") return 2;
    if (token == "ADVAN11" || token == "ADVAN12") return 3;
    return std::nullopt;
}

/// Accumulates records into a Config
class StreamReader {
public:
    StreamReader(const ControlStreamOptions& options,
                 std::vector<std::string>& errors,
                 std::vector<std::string>& warnings)
        : options_(options), errors_(errors), warnings_(warnings) {
        config_.dosing.route = DoseRoute::IvBolus;
        config_.dosing.amount = kDefaultDoseAmount;
        config_.dosing.times = {0.0};
        config_.simulation.time_points = kDefaultTimeGrid;
    }

    /// false when reading cannot continue
    bool read(const std::vector<Record>& records) {
        for (const auto& record : records) {
            switch (record.type) {
                case RecordType::Subroutines:
                    read_subroutines(record);
                    break;
                case RecordType::Pk:
                case RecordType::Theta:
                case RecordType::Omega:
                    if (!compartments_) {
                        error(kDiagRecordOrder, "$SUBROUTINES must come before $" + record.name +
                                                    " (line " +
                                                    std::to_string(record.line_number) + ")");
                        return false;
                    }
                    if (record.type == RecordType::Theta) read_theta(record);
                    if (record.type == RecordType::Omega) read_omega(record);
                    break;
                case RecordType::Sigma:
                    read_sigma(record);
                    break;
                case RecordType::Dosing:
                    read_dosing(record);
                    break;
                case RecordType::Population:
                    read_population(record);
                    break;
                case RecordType::Simulation:
                    read_simulation(record);
                    break;
                case RecordType::Problem:
                case RecordType::Input:
                case RecordType::Data:
                case RecordType::Error:
                case RecordType::Estimation:
                case RecordType::Table:
                    break;
                case RecordType::Unknown:
                    warning(kDiagRecordIgnored, "Ignoring unsupported record $" + record.name +
                                                    " (line " +
                                                    std::to_string(record.line_number) + ")");
                    break;
            }
        }

        if (!compartments_) {
            error(kDiagMissingRecord, "Missing $SUBROUTINES record");
            return false;
        }
        config_.model.compartments = *compartments_;
        finish_covariates();
        finish_error_model();
        return errors_.empty();
    }

    Config take() { return std::move(config_); }

private:
    const ControlStreamOptions& options_;
    std::vector<std::string>& errors_;
    std::vector<std::string>& warnings_;

    Config config_;
    std::optional<int> compartments_;
    std::size_t theta_index_ = 0;
    std::size_t omega_index_ = 0;
    std::vector<Real> sigma_variances_;
    std::optional<ErrorModelType> error_model_type_;

    struct PendingCovariate {
        std::string key;
        std::optional<Real> effect;
        Real reference = 70.0;
        CovariateModel model = CovariateModel::Power;
    };
    std::vector<PendingCovariate> covariates_;

    void error(const char* code, const std::string& message) {
        errors_.push_back(with_diag_code(code, message));
    }

    void warning(const char* code, const std::string& message) {
        warnings_.push_back(with_diag_code(code, message));
    }

    static std::string where(const Record& record) {
        return "$" + record.name + " (line " + std::to_string(record.line_number) + ")";
    }

    void read_subroutines(const Record& record) {
        if (compartments_) {
            error(kDiagDuplicateRecord, "Duplicate $SUBROUTINES record at " + where(record));
            return;
        }
        for (const auto& line : record.lines) {
            for (const auto& token : split_tokens(to_upper(line), "=,")) {
                if (token.rfind("ADVAN", 0) != 0 || token == "ADVAN") continue;
                if (auto n = advan_compartments(token)) {
                    compartments_ = n;
                    return;
                }
                error(kDiagUnsupportedAdvan,
                      "Unsupported subroutine " + token + " in " + where(record) +
                          " (use ADVAN1/2, ADVAN3/4 or ADVAN11/12)");
                compartments_ = 1;
                return;
            }
        }
        error(kDiagUnsupportedAdvan, "No ADVAN subroutine given in " + where(record));
        compartments_ = 1;
    }

    std::optional<std::vector<Estimate>> read_estimates(const Record& record) {
        std::vector<Estimate> estimates;
        for (const auto& line : record.lines) {
            std::size_t i = 0;
            while (i < line.size()) {
                const char c = line[i];
                if (std::isspace(static_cast<unsigned char>(c)) != 0 || c == ',') {
                    ++i;
                    continue;
                }
                if (c == '(') {
                    const auto close = line.find(')', i);
                    if (close == std::string::npos) {
                        error(kDiagInvalidValue, "Unbalanced parenthesis in " + where(record));
                        return std::nullopt;
                    }
                    Estimate estimate;
                    for (const auto& token : split_tokens(line.substr(i + 1, close - i - 1), ",")) {
                        if (is_fix_token(token)) {
                            estimate.fixed = true;
                            continue;
                        }
                        auto value = parse_real(token);
                        if (!value) {
                            error(kDiagInvalidValue,
                                  "Invalid value '" + token + "' in " + where(record));
                            return std::nullopt;
                        }
                        estimate.values.push_back(*value);
                    }
                    estimates.push_back(std::move(estimate));
                    i = close + 1;
                    continue;
                }

                std::size_t end = i;
                while (end < line.size() && line[end] != ',' && line[end] != '(' &&
                       std::isspace(static_cast<unsigned char>(line[end])) == 0) {
                    ++end;
                }
                const std::string token = line.substr(i, end - i);
                i = end;
                const std::string upper = to_upper(token);
                if (is_fix_token(token)) {
                    if (!estimates.empty()) estimates.back().fixed = true;
                    continue;
                }
                if (upper.rfind("BLOCK", 0) == 0 || upper == "SAME") {
                    error(kDiagUnsupportedValue,
                          upper + " matrices are not supported in " + where(record) +
                              "; only diagonal entries are read");
                    return std::nullopt;
                }
                if (upper.rfind("DIAG", 0) == 0) {
                    // DIAGONAL(n) is the default layout; skip the optional size
                    if (i < line.size() && line[i] == '(') {
                        const auto close = line.find(')', i);
                        i = close == std::string::npos ? line.size() : close + 1;
                    }
                    continue;
                }
                auto value = parse_real(token);
                if (!value) {
                    error(kDiagInvalidValue, "Invalid value '" + token + "' in " + where(record));
                    return std::nullopt;
                }
                estimates.push_back(Estimate{{*value}, false});
            }
        }
        return estimates;
    }

    void read_theta(const Record& record) {
        auto estimates = read_estimates(record);
        if (!estimates) return;

        const auto names = positional_parameters(*compartments_);
        for (const auto& estimate : *estimates) {
            if (theta_index_ >= names.size()) {
                warning(kDiagExtraEntries, "Ignoring extra $THETA entries in " + where(record));
                return;
            }
            ParameterConfig param;
            param.name = names[theta_index_++];
            switch (estimate.values.size()) {
                case 1:
                    param.theta = estimate.values[0];
                    break;
                case 2:
                    param.theta = estimate.values[1];
                    param.bounds = std::make_pair(estimate.values[0],
                                                  std::numeric_limits<Real>::infinity());
                    break;
                case 3:
                    param.theta = estimate.values[1];
                    param.bounds = std::make_pair(estimate.values[0], estimate.values[2]);
                    break;
                default:
                    error(kDiagInvalidValue, "Invalid $THETA entry for " + param.name + " in " +
                                                 where(record) + " (expected init or (lo, init, hi))");
                    return;
            }
            config_.model.parameters.push_back(std::move(param));
        }
    }

    void read_omega(const Record& record) {
        auto estimates = read_estimates(record);
        if (!estimates) return;

        const auto names = positional_parameters(*compartments_);
        for (const auto& estimate : *estimates) {
            if (omega_index_ >= names.size()) {
                warning(kDiagExtraEntries, "Ignoring extra $OMEGA entries in " + where(record));
                return;
            }
            const std::string& name = names[omega_index_++];
            if (estimate.values.size() != 1 || estimate.values[0] < 0.0 ||
                !std::isfinite(estimate.values[0])) {
                error(kDiagInvalidValue, "Invalid $OMEGA variance for " + name + " in " +
                                             where(record));
                return;
            }
            ParameterConfig* param = config_.model.find(name);
            if (!param) {
                warning(kDiagExtraEntries, "$OMEGA entry for " + name +
                                               " has no matching $THETA; ignored");
                continue;
            }
            param->omega = omega_variance_to_cv(estimate.values[0], options_.omega_convention);
        }
    }

    void read_sigma(const Record& record) {
        auto estimates = read_estimates(record);
        if (!estimates) return;
        for (const auto& estimate : *estimates) {
            if (estimate.values.size() != 1 || estimate.values[0] < 0.0 ||
                !std::isfinite(estimate.values[0])) {
                error(kDiagInvalidValue, "Invalid $SIGMA variance in " + where(record));
                return;
            }
            sigma_variances_.push_back(estimate.values[0]);
        }
    }

    struct KeyValue {
        std::string key;    // Upper case
        std::string value;  // Trimmed
    };

    std::vector<KeyValue> read_key_values(const Record& record) {
        std::vector<KeyValue> entries;
        for (const auto& line : record.lines) {
            const auto eq = line.find('=');
            if (eq == std::string::npos) {
                error(kDiagInvalidValue,
                      "Expected KEY = value in " + where(record) + ": '" + line + "'");
                continue;
            }
            entries.push_back({to_upper(trim(std::string_view(line).substr(0, eq))),
                               trim(std::string_view(line).substr(eq + 1))});
        }
        return entries;
    }

    std::optional<Real> number_value(const KeyValue& kv, const Record& record) {
        auto value = parse_real(kv.value);
        if (!value) {
            error(kDiagInvalidValue, "Invalid numeric value for " + kv.key + " in " +
                                         where(record) + ": '" + kv.value + "'");
        }
        return value;
    }

    std::optional<std::vector<Real>> number_list(const KeyValue& kv, const Record& record) {
        std::vector<Real> values;
        for (const auto& token : split_tokens(kv.value, ",")) {
            auto value = parse_real(token);
            if (!value) {
                error(kDiagInvalidValue, "Invalid value '" + token + "' for " + kv.key + " in " +
                                             where(record));
                return std::nullopt;
            }
            values.push_back(*value);
        }
        if (values.empty()) {
            error(kDiagInvalidValue, kv.key + " needs at least one value in " + where(record));
            return std::nullopt;
        }
        return values;
    }

    AdditionalDosingParams& additional() {
        if (!config_.dosing.additional) config_.dosing.additional = AdditionalDosingParams{};
        return *config_.dosing.additional;
    }

    void read_dosing(const Record& record) {
        auto& dosing = config_.dosing;
        for (const auto& kv : read_key_values(record)) {
            if (kv.key == "ROUTE") {
                const std::string route = to_upper(kv.value);
                if (route == "ORAL") {
                    dosing.route = DoseRoute::Oral;
                } else if (route == "IVBOLUS" || route == "BOLUS") {
                    dosing.route = DoseRoute::IvBolus;
                } else if (route == "IVINFUSION" || route == "INFUSION") {
                    dosing.route = DoseRoute::IvInfusion;
                } else {
                    error(kDiagUnsupportedValue, "Unsupported ROUTE '" + kv.value + "' in " +
                                                     where(record) +
                                                     " (expected ORAL, IVBOLUS or IVINFUSION)");
                }
            } else if (kv.key == "AMOUNT") {
                if (auto v = number_value(kv, record)) dosing.amount = *v;
            } else if (kv.key == "TIMES") {
                if (auto v = number_list(kv, record)) dosing.times = std::move(*v);
            } else if (kv.key == "DURATION") {
                if (auto v = number_value(kv, record)) additional().duration = *v;
            } else if (kv.key == "BIOAVAILABILITY") {
                if (auto v = number_value(kv, record)) additional().bioavailability = *v;
            } else if (kv.key == "LAG_TIME") {
                if (auto v = number_value(kv, record)) additional().lag_time = *v;
            } else {
                warning(kDiagUnknownKey, "Ignoring unknown key " + kv.key + " in " + where(record));
            }
        }
    }

    PendingCovariate& covariate(const std::string& key) {
        for (auto& cov : covariates_) {
            if (cov.key == key) return cov;
        }
        covariates_.push_back(PendingCovariate{key, std::nullopt, 70.0, CovariateModel::Power});
        return covariates_.back();
    }

    void read_covariate(const KeyValue& kv, const Record& record) {
        // COV_{PARAM}_{COV}_{EFFECT|REFERENCE|MODEL}
        const auto last = kv.key.rfind('_');
        const std::string field = last == std::string::npos ? "" : kv.key.substr(last + 1);
        const std::string target = last == std::string::npos ? "" : kv.key.substr(4, last - 4);
        if (target.find('_') == std::string::npos ||
            (field != "EFFECT" && field != "REFERENCE" && field != "MODEL")) {
            error(kDiagInvalidValue, "Invalid covariate key format: " + kv.key + " in " +
                                         where(record) + " (expected COV_{PARAM}_{COV}_EFFECT)");
            return;
        }

        PendingCovariate& cov = covariate(target);
        if (field == "EFFECT") {
            if (auto v = number_value(kv, record)) cov.effect = *v;
        } else if (field == "REFERENCE") {
            if (auto v = number_value(kv, record)) cov.reference = *v;
        } else if (auto model = parse_covariate_model(to_lower(kv.value))) {
            cov.model = *model;
        } else {
            error(kDiagUnsupportedValue, "Unsupported covariate model '" + kv.value + "' for " +
                                             kv.key + " (expected POWER, EXPONENTIAL or LINEAR)");
        }
    }

    void read_population(const Record& record) {
        auto& demo = config_.population.demographics;
        for (const auto& kv : read_key_values(record)) {
            if (kv.key == "WEIGHT_MEAN") {
                if (auto v = number_value(kv, record)) demo.weight_mean = *v;
            } else if (kv.key == "WEIGHT_SD") {
                if (auto v = number_value(kv, record)) demo.weight_sd = *v;
            } else if (kv.key == "AGE_MEAN") {
                if (auto v = number_value(kv, record)) demo.age_mean = *v;
            } else if (kv.key == "AGE_SD") {
                if (auto v = number_value(kv, record)) demo.age_sd = *v;
            } else if (kv.key.rfind("COV_", 0) == 0) {
                read_covariate(kv, record);
            } else {
                warning(kDiagUnknownKey, "Ignoring unknown key " + kv.key + " in " + where(record));
            }
        }
    }

    void read_simulation(const Record& record) {
        auto& sim = config_.simulation;
        for (const auto& kv : read_key_values(record)) {
            if (kv.key == "TIME_POINTS") {
                if (auto v = number_list(kv, record)) sim.time_points = std::move(*v);
            } else if (kv.key == "METHOD") {
                if (auto method = parse_integration_method(to_lower(kv.value))) {
                    sim.integration_method = *method;
                } else {
                    error(kDiagUnsupportedValue, "Unsupported METHOD '" + kv.value + "' in " +
                                                     where(record));
                }
            } else if (kv.key == "ERROR_MODEL") {
                if (auto type = parse_error_model_type(to_lower(kv.value))) {
                    error_model_type_ = *type;
                } else {
                    error(kDiagUnsupportedValue, "Unsupported ERROR_MODEL '" + kv.value + "' in " +
                                                     where(record));
                }
            } else if (kv.key == "TOLERANCE") {
                if (auto v = number_value(kv, record)) sim.tolerance = *v;
            } else {
                warning(kDiagUnknownKey, "Ignoring unknown key " + kv.key + " in " + where(record));
            }
        }
    }

    void finish_covariates() {
        for (const auto& pending : covariates_) {
            if (!pending.effect) {
                error(kDiagInvalidValue, "Covariate COV_" + pending.key + " has no _EFFECT value");
                continue;
            }
            config_.population.covariates.push_back(
                CovariateConfig{pending.key, *pending.effect, pending.reference, pending.model});
        }
    }

    void finish_error_model() {
        const std::size_t n = sigma_variances_.size();
        if (n == 0) {
            if (error_model_type_ && *error_model_type_ != ErrorModelType::Proportional) {
                error(kDiagMissingRecord, std::string("ERROR_MODEL = ") +
                                              to_string(*error_model_type_) +
                                              " needs $SIGMA values");
                return;
            }
            config_.simulation.error_model =
                ErrorModelConfig::proportional(kDefaultProportionalSigma);
            return;
        }

        const ErrorModelType type = error_model_type_.value_or(
            n >= 2 ? ErrorModelType::Combined : ErrorModelType::Proportional);
        const std::size_t needed = type == ErrorModelType::Combined ? 2 : 1;
        if (n != needed) {
            error(kDiagInvalidValue, "The " + std::string(to_string(type)) +
                                         " error model takes " + std::to_string(needed) +
                                         " $SIGMA value(s), got " + std::to_string(n));
            return;
        }

        switch (type) {
            case ErrorModelType::Additive:
                config_.simulation.error_model =
                    ErrorModelConfig::additive(std::sqrt(sigma_variances_[0]));
                break;
            case ErrorModelType::Proportional:
                config_.simulation.error_model =
                    ErrorModelConfig::proportional(std::sqrt(sigma_variances_[0]));
                break;
            case ErrorModelType::Combined:
                config_.simulation.error_model = ErrorModelConfig::combined(
                    std::sqrt(sigma_variances_[1]), std::sqrt(sigma_variances_[0]));
                break;
        }
    }
};

std::vector<Record> split_records(const std::string& content, std::vector<std::string>& warnings) {
    std::vector<Record> records;
    std::istringstream stream(content);
    std::string raw;
    std::size_t line_number = 0;
    bool warned_preamble = false;

    while (std::getline(stream, raw)) {
        ++line_number;
        const auto comment = raw.find(';');
        const std::string line = trim(comment == std::string::npos
                                          ? std::string_view(raw)
                                          : std::string_view(raw).substr(0, comment));
        if (line.empty()) continue;

        if (line.front() == '$') {
            std::size_t end = 1;
            while (end < line.size() && std::isspace(static_cast<unsigned char>(line[end])) == 0) {
                ++end;
            }
            Record record;
            record.name = to_upper(line.substr(1, end - 1));
            record.type = record_type(record.name);
            record.line_number = line_number;
            const std::string rest = trim(std::string_view(line).substr(end));
            if (!rest.empty()) record.lines.push_back(rest);
            records.push_back(std::move(record));
            continue;
        }

        if (records.empty()) {
            if (!warned_preamble) {
                warnings.push_back(with_diag_code(kDiagRecordIgnored,
                                                  "Ignoring text before the first record (line " +
                                                      std::to_string(line_number) + ")"));
                warned_preamble = true;
            }
            continue;
        }
        records.back().lines.push_back(line);
    }
    return records;
}

}  // namespace

Real omega_variance_to_cv(Real variance, OmegaConvention convention) {
    switch (convention) {
        case OmegaConvention::Exact:
            return std::sqrt(std::expm1(variance)) * 100.0;
        case OmegaConvention::SquareRoot:
        default:
            return std::sqrt(variance) * 100.0;
    }
}

ControlStreamParser::ControlStreamParser(ControlStreamOptions options)
    : options_(options) {}

Result<Config> ControlStreamParser::load(const std::filesystem::path& path) {
    errors_.clear();
    warnings_.clear();
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<Config>::failure(ErrorKind::Io,
                                       "Cannot open control stream: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_string(buffer.str());
}

Result<Config> ControlStreamParser::parse_string(const std::string& content) {
    errors_.clear();
    warnings_.clear();

    const auto records = split_records(content, warnings_);
    StreamReader reader(options_, errors_, warnings_);
    if (!reader.read(records)) {
        return Result<Config>::failure(ErrorKind::ParseControlStream, join(errors_, "; "));
    }

    Config config = reader.take();
    if (auto err = validate(config)) {
        errors_.push_back(with_diag_code(kDiagValidation, err->message));
        return *err;
    }
    return config;
}

}  // namespace poppk::v1::parser
