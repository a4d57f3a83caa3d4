//! # Error Kind Registry
//!
//! Ordered list of (kind, handler) pairs. Order is dispatch priority: the
//! classifier tries entries front to back and the first pattern that matches
//! wins.
//!
//! ## Canonical Kinds
//!
//! | Order | Kind                | Label                   | Captures                            |
//! |-------|---------------------|-------------------------|-------------------------------------|
//! | 1     | ResourceNotFound    | "Resource not found"    | azure_resource, invalid_resource_name |
//! | 2     | CharacterNotAllowed | "Character not allowed" | parameter, regex                    |
//! | 3     | CommandNotFound     | "Command not found"     | quote, subcommand, command_group    |
//! | 4     | ArgumentRequired    | "Argument required"     |                                     |
//! | 5     | ValueRequired       | "Value Required"        | at_least                            |

#ifndef ERRLENS_CLASSIFY_REGISTRY_HPP
#define ERRLENS_CLASSIFY_REGISTRY_HPP

#include "errlens/classify/error_kind.hpp"
#include "errlens/classify/handlers.hpp"

#include <vector>

namespace errlens::classify {

struct RegisteredKind {
    ErrorKind kind;
    ErrorHandlerFn handler;
};

class ErrorKindRegistry {
public:
    ErrorKindRegistry() = default;

    /// The five built-in kinds, in dispatch order.
    static ErrorKindRegistry canonical();

    /// Appends a kind at the lowest priority. Throws std::invalid_argument if
    /// `handler` is empty.
    void add(ErrorKind kind, ErrorHandlerFn handler);

    /// First registered kind with this id, or nullptr.
    [[nodiscard]] auto find(ErrorKindId id) const -> const ErrorKind*;

    [[nodiscard]] auto entries() const -> const std::vector<RegisteredKind>& {
        return entries_;
    }
    [[nodiscard]] auto size() const -> size_t {
        return entries_.size();
    }
    [[nodiscard]] auto empty() const -> bool {
        return entries_.empty();
    }

private:
    std::vector<RegisteredKind> entries_;
};

} // namespace errlens::classify

#endif // ERRLENS_CLASSIFY_REGISTRY_HPP
