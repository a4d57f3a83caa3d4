//! # Driver Implementation
//!
//! ```text
//! errlens_main()
//!   ├─ --help, -h      → print_usage()
//!   ├─ --version, -V   → print_version()
//!   ├─ load config     → --config=<file> or ./errlens.toml
//!   ├─ init logging    → CLI options, ERRLENS_LOG, then config
//!   └─ classify        → argv messages or stdin lines
//! ```

#include "cli/driver.hpp"
#include "cli/config.hpp"
#include "cli/diagnostic.hpp"
#include "errlens/classify/error_handler.hpp"
#include "errlens/common.hpp"
#include "errlens/log/log.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace errlens::cli {

static void print_usage(std::ostream& out) {
    out << "Usage: errlens [options] [message ...]\n\n"
        << "Rewrites CLI error messages into clearer ones. Without messages,\n"
        << "each line of standard input is classified.\n\n"
        << "Options:\n"
        << "  --config=<file>     Read settings from <file> (default: ./" << CONFIG_FILE_NAME
        << ")\n"
        << "  --json              Emit diagnostics as JSON lines\n"
        << "  --no-color          Disable ANSI colors\n"
        << "  --invalid-value=<v> Value the validator rejected, to locate bad characters\n"
        << "  --log-level=<lvl>   trace, debug, info, warn, error, off\n"
        << "  --log-filter=<spec> e.g. classify=debug,*=warn\n"
        << "  -v, -vv, -vvv       Increase log verbosity\n"
        << "  -h, --help          Show this help\n"
        << "  -V, --version       Show version\n";
}

static void print_version(std::ostream& out) {
    out << "errlens " << VERSION << "\n";
}

int errlens_main(int argc, char* argv[]) {
    return errlens_main(argc, argv, std::cin, std::cout, std::cerr);
}

int errlens_main(int argc, char* argv[], std::istream& in, std::ostream& out,
                 std::ostream& diag) {
    std::string config_path;
    bool json = false;
    bool no_color = false;
    bool has_log_option = false;
    classify::Metadata metadata;
    std::vector<std::string> messages;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(out);
            return 0;
        }
        if (arg == "--version" || arg == "-V") {
            print_version(out);
            return 0;
        }

        if (arg.starts_with("--config=")) {
            config_path = arg.substr(9);
        } else if (arg == "--json") {
            json = true;
        } else if (arg.starts_with("--invalid-value=")) {
            metadata[classify::RaisedError::kInvalidValueKey] = arg.substr(16);
        } else if (arg == "--no-color") {
            no_color = true;
        } else if (log::is_log_option(arg)) {
            has_log_option = true;
        } else {
            messages.push_back(std::move(arg));
        }
    }

    auto loaded = config_path.empty() ? load_config_from_dir(fs::current_path())
                                      : load_config(config_path);
    if (is_err(loaded)) {
        diag << "error: " << unwrap_err(loaded) << "\n";
        return 1;
    }
    ErrlensConfig config = unwrap(loaded);

    if (json) {
        config.format = OutputFormat::JSON;
    }
    if (no_color) {
        config.colors = ColorMode::Never;
    }

    // Precedence: CLI options, then ERRLENS_LOG, then the config file
    log::LogConfig log_config = log::parse_log_options(argc, argv);
    if (!has_log_option && std::getenv("ERRLENS_LOG") == nullptr) {
        log_config.level = config.log_level;
        log_config.filter_spec = config.log_filter;
    }
    log_config.colors = config.colors != ColorMode::Never;
    log::Logger::init(log_config);

    ERRLENS_LOG_DEBUG("driver", "dispatch policy " << classify::dispatch_policy_name(config.policy));

    classify::ErrorHandler handler(config.handler_options());

    ClassificationEmitter emitter(diag);
    emitter.set_json(config.format == OutputFormat::JSON);
    emitter.set_color_enabled(config.use_colors());

    auto process = [&](const std::string& message) {
        auto classified = handler.classify_record(message, metadata);
        if (!classified) {
            out << message << "\n";
            return;
        }
        out << classified->message << "\n";
        emitter.emit(*classified);
    };

    if (messages.empty()) {
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            process(line);
        }
    } else {
        for (const auto& message : messages) {
            process(message);
        }
    }

    ERRLENS_LOG_INFO("driver", "classified " << handler.error_count() << " error(s)");
    log::Logger::instance().flush();
    return 0;
}

} // namespace errlens::cli
