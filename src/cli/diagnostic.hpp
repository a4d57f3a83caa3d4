//! # Classification Rendering
//!
//! Prints classified errors for people (text) or tools (JSON lines).
//!
//! ## Text
//!
//! ```text
//! error[CharacterNotAllowed]: Character not allowed: !
//!   = note: was: validation error: Parameter 'resource_group_name' must conform ...
//!   = help: try `--resource-group sampleUXgroup`
//! ```
//!
//! ## JSON
//!
//! ```json
//! {"kind":"CharacterNotAllowed","label":"Character not allowed","message":"...",
//!  "overridden_message":"...","suggestion":{"value":"sampleUXgroup",
//!  "kind":"InvalidArgument","parameter":"--resource-group"}}
//! ```

#pragma once

#include "errlens/classify/error_handler.hpp"

#include <cstddef>
#include <iostream>
#include <string>

namespace errlens::cli {

// ============================================================================
// ANSI Color Codes
// ============================================================================

struct Colors {
    static constexpr const char* Reset = "\033[0m";
    static constexpr const char* Bold = "\033[1m";

    static constexpr const char* BrightRed = "\033[91m";
    static constexpr const char* BrightGreen = "\033[92m";
    static constexpr const char* BrightCyan = "\033[96m";
};

/// True if stderr is a terminal that understands ANSI codes.
bool terminal_supports_colors();

// ============================================================================
// Emitter
// ============================================================================

class ClassificationEmitter {
public:
    explicit ClassificationEmitter(std::ostream& out = std::cerr);

    void set_color_enabled(bool enabled) {
        use_colors_ = enabled;
    }
    void set_json(bool json) {
        json_ = json;
    }

    void emit(const classify::ClassifiedError& classified);

    size_t emitted_count() const {
        return emitted_count_;
    }

    static std::string escape_json_string(const std::string& s);

    /// Removes ANSI escape sequences, e.g. from a colored message.
    static std::string strip_ansi(const std::string& s);

private:
    std::ostream& out_;
    bool use_colors_ = false;
    bool json_ = false;
    size_t emitted_count_ = 0;

    const char* color(const char* code) const {
        return use_colors_ ? code : "";
    }

    void emit_text(const classify::ClassifiedError& classified);
    void emit_json(const classify::ClassifiedError& classified);
};

} // namespace errlens::cli
