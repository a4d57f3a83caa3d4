//! # Log Options
//!
//! | Option               | Effect                          |
//! |----------------------|---------------------------------|
//! | `--log-level=<lvl>`  | Global level                    |
//! | `--log-filter=<f>`   | Per-module levels               |
//! | `--log-file=<path>`  | Also append records to a file   |
//! | `--log-format=json`  | JSON lines instead of text      |
//! | `-v`, `-vv`, `-vvv`  | Info, Debug, Trace              |
//! | `--verbose`          | Same as `-v`                    |
//! | `-q`, `--quiet`      | Errors only                     |
//!
//! An explicit level (`--log-level`, `-q`) wins over `-v` flags.

#include "errlens/log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

namespace errlens::log {

namespace {

/// Value after `prefix` if `arg` starts with it.
std::optional<std::string_view> option_value(std::string_view arg, std::string_view prefix) {
    if (!arg.starts_with(prefix)) {
        return std::nullopt;
    }
    return arg.substr(prefix.size());
}

/// Number of 'v's in "-v", "-vv", ...; 0 for anything else.
int verbosity_count(std::string_view arg) {
    if (arg.size() < 2 || arg[0] != '-' || arg.find_first_not_of('v', 1) != std::string_view::npos)
        return 0;
    return static_cast<int>(arg.size() - 1);
}

LogLevel verbosity_level(int count) {
    if (count >= 3)
        return LogLevel::Trace;
    return count == 2 ? LogLevel::Debug : LogLevel::Info;
}

std::string read_env_log() {
#ifdef _WIN32
    char* buf = nullptr;
    size_t len = 0;
    std::string value;
    if (_dupenv_s(&buf, &len, "ERRLENS_LOG") == 0 && buf != nullptr) {
        value = buf;
        free(buf);
    }
    return value;
#else
    const char* value = std::getenv("ERRLENS_LOG");
    return value != nullptr ? std::string(value) : std::string();
#endif
}

} // namespace

bool is_log_option(std::string_view arg) {
    for (std::string_view prefix : {"--log-level=", "--log-filter=", "--log-file=", "--log-format="}) {
        if (arg.starts_with(prefix))
            return true;
    }
    return arg == "-q" || arg == "--quiet" || arg == "--verbose" || verbosity_count(arg) > 0;
}

LogConfig parse_log_options(int argc, char* argv[]) {
    LogConfig config;

    std::optional<LogLevel> explicit_level;
    bool has_filter = false;
    int verbosity = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (auto level = option_value(arg, "--log-level=")) {
            explicit_level = parse_level(*level);
        } else if (auto filter = option_value(arg, "--log-filter=")) {
            config.filter_spec = std::string(*filter);
            has_filter = true;
        } else if (auto file = option_value(arg, "--log-file=")) {
            config.log_file = std::string(*file);
        } else if (auto format = option_value(arg, "--log-format=")) {
            config.format = (*format == "json" || *format == "JSON") ? LogFormat::JSON
                                                                     : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            explicit_level = LogLevel::Error;
        } else if (arg == "--verbose") {
            verbosity = std::max(verbosity, 1);
        } else {
            verbosity = std::max(verbosity, verbosity_count(arg));
        }
    }

    if (explicit_level) {
        config.level = *explicit_level;
    } else if (verbosity > 0) {
        config.level = verbosity_level(verbosity);
    } else if (!has_filter) {
        std::string env = read_env_log();
        if (env.find_first_of("=,") != std::string::npos) {
            config.filter_spec = env;
        } else if (!env.empty()) {
            config.level = parse_level(env);
        }
    }

    return config;
}

} // namespace errlens::log
