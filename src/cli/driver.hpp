//! # errlens Driver
//!
//! ```bash
//! errlens "Resource group 'demo' could not be found."
//! az group show -n demo 2>&1 | errlens --json
//! ```
//!
//! | Option            | Effect                                      |
//! |-------------------|---------------------------------------------|
//! | `--config=<file>` | Read settings from file instead of ./errlens.toml |
//! | `--json`          | Emit diagnostics as JSON lines              |
//! | `--no-color`      | Never use ANSI colors                       |
//! | `--invalid-value=<v>` | Rejected value, for character checks    |
//! | `--log-*`, `-v`   | Logging options                             |
//!
//! Each message argument, or each stdin line when none is given, is
//! classified. The rewritten text goes to stdout, the diagnostic to stderr.

#pragma once

#include <iosfwd>

namespace errlens::cli {

/// Returns 0 on success, 1 if the configuration cannot be loaded.
int errlens_main(int argc, char* argv[]);

/// Same as errlens_main() with explicit streams.
int errlens_main(int argc, char* argv[], std::istream& in, std::ostream& out,
                 std::ostream& diag);

} // namespace errlens::cli
