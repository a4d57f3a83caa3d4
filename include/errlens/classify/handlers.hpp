//! # Error Handlers
//!
//! One handler per recognised error kind. Every handler has the same shape:
//!
//! ```cpp
//! RewriteResult handler(const MatchGroups& match, std::string_view raw_message,
//!                       const Metadata& metadata);
//! ```
//!
//! and returns one of:
//!
//! | Alternative             | Meaning                                   |
//! |-------------------------|-------------------------------------------|
//! | `NoRewrite`             | No confident rewrite for this occurrence  |
//! | `std::string`           | Rewritten message                         |
//! | `MessageWithCorrection` | Rewritten message plus a suggested value  |
//!
//! Handlers are pure: no logging side effects beyond trace output, no state.

#ifndef ERRLENS_CLASSIFY_HANDLERS_HPP
#define ERRLENS_CLASSIFY_HANDLERS_HPP

#include "errlens/classify/correction.hpp"
#include "errlens/classify/error_kind.hpp"
#include "errlens/classify/raised_error.hpp"
#include "errlens/common.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace errlens::classify {

// ============================================================================
// Rewrite Result
// ============================================================================

struct NoRewrite {
    [[nodiscard]] auto operator==(const NoRewrite&) const -> bool = default;
};

struct MessageWithCorrection {
    std::string message;
    SuggestedErrorCorrection correction;

    [[nodiscard]] auto operator==(const MessageWithCorrection&) const -> bool = default;
};

using RewriteResult = std::variant<NoRewrite, std::string, MessageWithCorrection>;

/// True for NoRewrite and for an empty rewritten message.
[[nodiscard]] bool is_no_rewrite(const RewriteResult& result);

using ErrorHandlerFn =
    std::function<RewriteResult(const MatchGroups&, std::string_view, const Metadata&)>;

// ============================================================================
// Flag Tokens
// ============================================================================

/// Names of every `--flag` token in `message`, in order, without the dashes.
///
/// A flag starts with a lowercase letter followed by letters or hyphens. Tokens
/// directly preceded by `/` are skipped, so in `--name/-n/--resource-group/-g`
/// only `name` is returned.
std::vector<std::string> extract_flag_names(std::string_view message);

/// Joins names as "a", "a and b", "a and b and c".
std::string join_flag_names(const std::vector<std::string>& names);

// ============================================================================
// Invalid Character Detection
// ============================================================================

/// Prepares a validator-reported pattern for substring search: collapses
/// doubled backslashes left over from escaping and drops one leading `^` and
/// one trailing `$`.
std::string normalize_validation_pattern(std::string_view pattern);

struct InvalidCharacters {
    std::string distinct;  ///< Each offending character once, first-seen order (UTF-8)
    std::string corrected; ///< Value with every offending character removed
};

/// Finds the characters of `value` not covered by any match of `pattern`.
/// `pattern` is used as-is; run it through normalize_validation_pattern()
/// first. Multi-byte UTF-8 characters are treated as one character. Returns
/// an error if the pattern does not compile or `value` is longer than
/// MAX_SEARCH_LENGTH.
Result<InvalidCharacters> find_invalid_characters(const std::string& value,
                                                  const std::string& pattern);

// ============================================================================
// Handlers
// ============================================================================

/// "<invalid_resource_name> does not exist"
RewriteResult handle_resource_not_found(const MatchGroups& match, std::string_view raw_message,
                                        const Metadata& metadata);

/// Distinct invalid characters, with the cleaned value as a correction for
/// the reported parameter. Needs `_invalid_value` in the metadata.
RewriteResult handle_character_not_allowed(const MatchGroups& match, std::string_view raw_message,
                                           const Metadata& metadata);

/// "<command_group> <subcommand>"
RewriteResult handle_command_not_found(const MatchGroups& match, std::string_view raw_message,
                                       const Metadata& metadata);

/// Required flags joined with " and ".
RewriteResult handle_argument_required(const MatchGroups& match, std::string_view raw_message,
                                       const Metadata& metadata);

/// First flag in the message.
RewriteResult handle_value_required(const MatchGroups& match, std::string_view raw_message,
                                    const Metadata& metadata);

} // namespace errlens::classify

#endif // ERRLENS_CLASSIFY_HANDLERS_HPP
