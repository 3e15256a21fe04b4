#pragma once

#include "poppk/v1/config.hpp"
#include "poppk/v1/error.hpp"
#include "poppk/v1/parser/control_stream.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace poppk::v1::parser {

struct ConfigParserOptions {
    bool strict = true;                  // Fail on unknown fields
    ControlStreamOptions control_stream; // Used for .ctl / .mod inputs
};

/// Reads JSON and YAML configurations (same schema) and dispatches control
/// streams by extension. Diagnostics carry a [POPPK_CFG_*] code.
class ConfigParser {
public:
    explicit ConfigParser(ConfigParserOptions options = {});

    // Parse from file, format chosen by extension
    Result<Config> load(const std::filesystem::path& path);

    // Parse from string
    Result<Config> load_json_string(const std::string& content);
    Result<Config> load_yaml_string(const std::string& content);

    const std::vector<std::string>& errors() const { return errors_; }
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    ConfigParserOptions options_;
    std::vector<std::string> errors_;
    std::vector<std::string> warnings_;

    void reset();
};

}  // namespace poppk::v1::parser
