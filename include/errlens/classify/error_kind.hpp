//! # Error Kinds
//!
//! An `ErrorKind` is one recognised shape of CLI error text: a display label
//! and a regular expression with named capture groups.
//!
//! ## Named Groups
//!
//! `std::regex` (ECMAScript) has no `(?<name>...)` syntax, so a kind carries a
//! name table alongside its pattern. Entry `i` names sub-match `i + 1`; an
//! empty entry leaves that group unnamed.
//!
//! ```cpp
//! ErrorKind kind(ErrorKindId::CommandNotFound, "Command not found",
//!                R"((['"])(.*)\1 is not in the \1(az\s.*)\1 command group)",
//!                {"quote", "subcommand", "command_group"});
//! if (auto match = kind.search(message)) {
//!     match->group("command_group");
//! }
//! ```
//!
//! ## Input Length
//!
//! libstdc++ matches `std::regex` with a recursive backtracking executor whose
//! depth grows with the input, so a search over a very long message exhausts
//! the stack. Text longer than `MAX_SEARCH_LENGTH` bytes is never searched:
//! `search` reports no match and the message passes through unchanged.

#ifndef ERRLENS_CLASSIFY_ERROR_KIND_HPP
#define ERRLENS_CLASSIFY_ERROR_KIND_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace errlens::classify {

enum class ErrorKindId {
    ArgumentRequired,
    CharacterNotAllowed,
    CommandNotFound,
    ResourceNotFound,
    ValueRequired,
    Custom, ///< Kinds registered by embedders
};

const char* kind_name(ErrorKindId id);

/// Longest text, in bytes, handed to a regex search.
constexpr size_t MAX_SEARCH_LENGTH = 4096;

// ============================================================================
// Match Groups
// ============================================================================

/// Result of searching a kind's pattern in a message.
class MatchGroups {
public:
    MatchGroups(std::string matched, size_t position, std::map<std::string, std::string> groups);

    /// Whole matched text.
    [[nodiscard]] auto str() const -> const std::string& {
        return matched_;
    }
    /// Offset of the match in the searched message.
    [[nodiscard]] auto position() const -> size_t {
        return position_;
    }

    /// Text captured by the named group; empty if the group did not take part.
    /// Throws std::out_of_range if the kind has no group called `name`.
    [[nodiscard]] auto group(const std::string& name) const -> const std::string&;

    [[nodiscard]] auto has_group(const std::string& name) const -> bool {
        return groups_.count(name) != 0;
    }

    [[nodiscard]] auto groups() const -> const std::map<std::string, std::string>& {
        return groups_;
    }

    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto operator==(const MatchGroups& other) const -> bool = default;

private:
    std::string matched_;
    size_t position_;
    std::map<std::string, std::string> groups_;
};

// ============================================================================
// Error Kind
// ============================================================================

class ErrorKind {
public:
    /// Throws std::invalid_argument if `label` is empty, `pattern` does not
    /// compile, or `group_names` names more groups than the pattern has.
    ErrorKind(ErrorKindId id, std::string label, std::string pattern,
              std::vector<std::string> group_names = {});

    [[nodiscard]] auto id() const -> ErrorKindId {
        return id_;
    }
    [[nodiscard]] auto label() const -> const std::string& {
        return label_;
    }
    [[nodiscard]] auto pattern_source() const -> const std::string& {
        return pattern_source_;
    }
    [[nodiscard]] auto pattern() const -> const std::regex& {
        return pattern_;
    }
    [[nodiscard]] auto group_names() const -> const std::vector<std::string>& {
        return group_names_;
    }

    /// Searches (does not anchor) the pattern anywhere in `message`. Messages
    /// longer than MAX_SEARCH_LENGTH never match.
    [[nodiscard]] auto search(const std::string& message) const -> std::optional<MatchGroups>;

    /// Kinds are equal when label and pattern are equal.
    [[nodiscard]] auto operator==(const ErrorKind& other) const -> bool {
        return label_ == other.label_ && pattern_source_ == other.pattern_source_;
    }

private:
    ErrorKindId id_;
    std::string label_;
    std::string pattern_source_;
    std::vector<std::string> group_names_;
    std::regex pattern_;
};

} // namespace errlens::classify

#endif // ERRLENS_CLASSIFY_ERROR_KIND_HPP
