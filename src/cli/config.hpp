//! # errlens Configuration
//!
//! Settings are read from the `[errlens]` section of `errlens.toml`:
//!
//! ```toml
//! [errlens]
//! colors = "auto"                # "auto", true, false
//! policy = "stop-at-first-match" # or "fall-through"
//! format = "text"                # or "json"
//! log_level = "warn"
//! log_filter = "classify=debug"
//! ```
//!
//! Missing file or section means defaults. Unknown keys are skipped.

#pragma once

#include "errlens/classify/error_handler.hpp"
#include "errlens/common.hpp"
#include "errlens/log/log.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace errlens::cli {

enum class ColorMode {
    Auto,   ///< Colors when stderr is a terminal
    Always,
    Never,
};

enum class OutputFormat {
    Text,
    JSON,
};

struct ErrlensConfig {
    ColorMode colors = ColorMode::Auto;
    classify::DispatchPolicy policy = classify::DispatchPolicy::StopAtFirstMatch;
    OutputFormat format = OutputFormat::Text;
    log::LogLevel log_level = log::LogLevel::Warn;
    std::string log_filter;

    /// Resolves ColorMode::Auto against the current terminal.
    [[nodiscard]] bool use_colors() const;

    /// Options for the classifier built from this config.
    [[nodiscard]] classify::ErrorHandlerOptions handler_options() const;
};

/// Name of the config file looked up by load_config_from_dir().
constexpr const char* CONFIG_FILE_NAME = "errlens.toml";

/// Parses config text. Errors name the offending line and key.
Result<ErrlensConfig> parse_config(const std::string& content);

/// Loads and parses `path`. A missing or unreadable file is an error.
Result<ErrlensConfig> load_config(const fs::path& path);

/// Loads `dir/errlens.toml`, or returns defaults if it does not exist.
Result<ErrlensConfig> load_config_from_dir(const fs::path& dir);

} // namespace errlens::cli
