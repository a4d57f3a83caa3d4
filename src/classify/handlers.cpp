//! # Error Handler Implementations
//!
//! ## Invalid Character Detection
//!
//! Validators reject a value with a message like
//!
//! ```text
//! Parameter 'resource_group_name' must conform to the following pattern: '^[-\w\._\(\)]+$'.
//! ```
//!
//! without saying which characters were wrong. With the anchors removed the
//! pattern matches every *valid* run inside the value; whatever no match covers
//! is invalid:
//!
//! ```text
//! value     s a m p l e U X ! ! g r o u p
//! matches   [---- valid ----]     [valid]
//! invalid                   ! !
//! ```
//!
//! The distinct invalid characters become the message, the value with all of
//! them deleted becomes the suggested correction. Characters are UTF-8
//! sequences, not bytes: `é` is reported and removed as a whole.

#include "errlens/classify/handlers.hpp"
#include "errlens/log/log.hpp"

#include <regex>
#include <set>
#include <utility>

namespace errlens::classify {

bool is_no_rewrite(const RewriteResult& result) {
    if (std::holds_alternative<NoRewrite>(result)) {
        return true;
    }
    if (const auto* message = std::get_if<std::string>(&result)) {
        return message->empty();
    }
    return false;
}

// ============================================================================
// Flag Tokens
// ============================================================================

std::vector<std::string> extract_flag_names(std::string_view message) {
    static const std::regex flag_regex(R"(--([a-z][a-zA-Z-]*))");

    std::string text(message);
    std::vector<std::string> names;

    for (auto it = std::sregex_iterator(text.begin(), text.end(), flag_regex);
         it != std::sregex_iterator(); ++it) {
        const auto& match = *it;
        auto pos = static_cast<size_t>(match.position(0));
        // `/--flag` is an alias of the flag before it, not a new one
        if (pos > 0 && text[pos - 1] == '/') {
            continue;
        }
        names.push_back(match.str(1));
    }

    return names;
}

std::string join_flag_names(const std::vector<std::string>& names) {
    std::string joined;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            joined += " and ";
        }
        joined += names[i];
    }
    return joined;
}

// ============================================================================
// Invalid Character Detection
// ============================================================================

std::string normalize_validation_pattern(std::string_view pattern) {
    std::string result;
    result.reserve(pattern.size());

    for (size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] == '\\' && i + 1 < pattern.size() && pattern[i + 1] == '\\') {
            result += '\\';
            ++i;
        } else {
            result += pattern[i];
        }
    }

    if (!result.empty() && result.front() == '^') {
        result.erase(0, 1);
    }
    if (!result.empty() && result.back() == '$' &&
        (result.size() < 2 || result[result.size() - 2] != '\\')) {
        result.pop_back();
    }

    return result;
}

namespace {

/// Byte length of the UTF-8 sequence starting at `pos`. Malformed or
/// truncated sequences count as a single byte.
size_t utf8_sequence_length(const std::string& text, size_t pos) {
    auto lead = static_cast<unsigned char>(text[pos]);
    size_t length = 1;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
    }

    if (pos + length > text.size()) {
        return 1;
    }
    for (size_t i = 1; i < length; ++i) {
        if ((static_cast<unsigned char>(text[pos + i]) & 0xC0) != 0x80) {
            return 1;
        }
    }
    return length;
}

} // namespace

Result<InvalidCharacters> find_invalid_characters(const std::string& value,
                                                  const std::string& pattern) {
    if (value.size() > MAX_SEARCH_LENGTH) {
        return "value of " + std::to_string(value.size()) + " bytes exceeds the search limit of " +
               std::to_string(MAX_SEARCH_LENGTH);
    }

    std::regex valid;
    try {
        valid = std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        return std::string("cannot compile validation pattern '") + pattern + "': " + e.what();
    }

    std::vector<bool> covered(value.size(), false);
    for (auto it = std::sregex_iterator(value.begin(), value.end(), valid);
         it != std::sregex_iterator(); ++it) {
        auto start = static_cast<size_t>(it->position(0));
        auto length = static_cast<size_t>(it->length(0));
        for (size_t i = start; i < start + length; ++i) {
            covered[i] = true;
        }
    }

    // A character is invalid if any of its bytes is uncovered
    std::set<std::string> invalid;
    InvalidCharacters result;
    for (size_t pos = 0; pos < value.size();) {
        size_t length = utf8_sequence_length(value, pos);
        bool uncovered = false;
        for (size_t i = pos; i < pos + length; ++i) {
            uncovered = uncovered || !covered[i];
        }
        if (uncovered) {
            auto [it, inserted] = invalid.insert(value.substr(pos, length));
            if (inserted) {
                result.distinct += *it;
            }
        }
        pos += length;
    }

    result.corrected.reserve(value.size());
    for (size_t pos = 0; pos < value.size();) {
        size_t length = utf8_sequence_length(value, pos);
        std::string character = value.substr(pos, length);
        if (invalid.count(character) == 0) {
            result.corrected += character;
        }
        pos += length;
    }

    return result;
}

// ============================================================================
// Handlers
// ============================================================================

RewriteResult handle_resource_not_found(const MatchGroups& match, std::string_view /*raw_message*/,
                                        const Metadata& /*metadata*/) {
    return match.group("invalid_resource_name") + " does not exist";
}

RewriteResult handle_character_not_allowed(const MatchGroups& match,
                                           std::string_view /*raw_message*/,
                                           const Metadata& metadata) {
    auto value_it = metadata.find(RaisedError::kInvalidValueKey);
    if (value_it == metadata.end()) {
        ERRLENS_LOG_TRACE("classify", "no " << RaisedError::kInvalidValueKey
                                            << " recorded, cannot locate invalid characters");
        return NoRewrite{};
    }

    std::string pattern = normalize_validation_pattern(match.group("regex"));
    auto found = find_invalid_characters(value_it->second, pattern);
    if (is_err(found)) {
        ERRLENS_LOG_WARN("classify", unwrap_err(found));
        return NoRewrite{};
    }

    auto& invalid = unwrap(found);
    if (invalid.distinct.empty()) {
        return NoRewrite{};
    }

    const std::string& parameter = match.group("parameter");
    SuggestedErrorCorrection correction(
        std::move(invalid.corrected), CorrectionKind::InvalidArgument,
        parameter.empty() ? std::nullopt : std::optional<std::string>(parameter));

    return MessageWithCorrection{std::move(invalid.distinct), std::move(correction)};
}

RewriteResult handle_command_not_found(const MatchGroups& match, std::string_view /*raw_message*/,
                                       const Metadata& /*metadata*/) {
    return match.group("command_group") + " " + match.group("subcommand");
}

RewriteResult handle_argument_required(const MatchGroups& /*match*/, std::string_view raw_message,
                                       const Metadata& /*metadata*/) {
    auto names = extract_flag_names(raw_message);
    if (names.empty()) {
        return NoRewrite{};
    }
    return join_flag_names(names);
}

RewriteResult handle_value_required(const MatchGroups& /*match*/, std::string_view raw_message,
                                    const Metadata& /*metadata*/) {
    auto names = extract_flag_names(raw_message);
    if (names.empty()) {
        return NoRewrite{};
    }
    return names.front();
}

} // namespace errlens::classify
