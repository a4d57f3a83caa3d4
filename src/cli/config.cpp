//! # Configuration Loading
//!
//! Line-oriented reader for the subset of TOML errlens needs: section headers,
//! `key = value`, `#` comments, double-quoted strings and booleans.

#include "cli/config.hpp"
#include "cli/diagnostic.hpp"

#include <fstream>
#include <sstream>

namespace errlens::cli {

bool ErrlensConfig::use_colors() const {
    switch (colors) {
    case ColorMode::Always:
        return true;
    case ColorMode::Never:
        return false;
    case ColorMode::Auto:
        return terminal_supports_colors();
    }
    return false;
}

classify::ErrorHandlerOptions ErrlensConfig::handler_options() const {
    classify::ErrorHandlerOptions options;
    options.colors = use_colors();
    options.policy = policy;
    return options;
}

// ============================================================================
// Parsing
// ============================================================================

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos)
        return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

static std::string strip_comment(const std::string& line) {
    bool in_string = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') {
            in_string = !in_string;
        } else if (line[i] == '#' && !in_string) {
            return line.substr(0, i);
        }
    }
    return line;
}

static bool unquote(std::string& value) {
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
        return true;
    }
    return false;
}

Result<ErrlensConfig> parse_config(const std::string& content) {
    ErrlensConfig config;

    std::istringstream input(content);
    std::string raw;
    int line_no = 0;
    bool in_section = false;

    auto bad_value = [&line_no](const std::string& key, const std::string& value) {
        return "line " + std::to_string(line_no) + ": invalid value '" + value + "' for '" + key +
               "'";
    };

    while (std::getline(input, raw)) {
        ++line_no;
        std::string line = trim(strip_comment(raw));
        if (line.empty())
            continue;

        if (line.front() == '[') {
            if (line.back() != ']') {
                return "line " + std::to_string(line_no) + ": unterminated section header";
            }
            in_section = (trim(line.substr(1, line.size() - 2)) == "errlens");
            continue;
        }

        if (!in_section)
            continue;

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            return "line " + std::to_string(line_no) + ": expected 'key = value'";
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        bool quoted = unquote(value);

        if (key == "colors") {
            if (value == "auto") {
                config.colors = ColorMode::Auto;
            } else if (value == "true" || value == "always") {
                config.colors = ColorMode::Always;
            } else if (value == "false" || value == "never") {
                config.colors = ColorMode::Never;
            } else {
                return bad_value(key, value);
            }
        } else if (key == "policy") {
            if (value == "stop-at-first-match") {
                config.policy = classify::DispatchPolicy::StopAtFirstMatch;
            } else if (value == "fall-through") {
                config.policy = classify::DispatchPolicy::FallThroughOnNoRewrite;
            } else {
                return bad_value(key, value);
            }
        } else if (key == "format") {
            if (value == "text") {
                config.format = OutputFormat::Text;
            } else if (value == "json") {
                config.format = OutputFormat::JSON;
            } else {
                return bad_value(key, value);
            }
        } else if (key == "log_level") {
            auto level = log::try_parse_level(value);
            if (!level) {
                return bad_value(key, value);
            }
            config.log_level = *level;
        } else if (key == "log_filter") {
            if (!quoted) {
                return bad_value(key, value);
            }
            config.log_filter = value;
        } else {
            ERRLENS_LOG_DEBUG("config", "ignoring unknown key '" << key << "' on line " << line_no);
        }
    }

    return config;
}

Result<ErrlensConfig> load_config(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        return "cannot open config file: " + path.string();
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto config = parse_config(buffer.str());
    if (is_err(config)) {
        return path.string() + ": " + unwrap_err(config);
    }

    ERRLENS_LOG_DEBUG("config", "loaded " << path.string());
    return config;
}

Result<ErrlensConfig> load_config_from_dir(const fs::path& dir) {
    fs::path config_path = dir / CONFIG_FILE_NAME;
    std::error_code ec;
    if (!fs::exists(config_path, ec)) {
        return ErrlensConfig{};
    }
    return load_config(config_path);
}

} // namespace errlens::cli
