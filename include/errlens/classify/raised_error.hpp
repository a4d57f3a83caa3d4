//! # Raised Error Wrapper
//!
//! `RaisedError` is the exception-like input of the classifier: a message, the
//! positional arguments it was raised with, and free-form metadata attached by
//! whoever raised it (a validator records the rejected value under
//! `_invalid_value`).
//!
//! The original message is immutable. Classification never mutates a caller's
//! object; it returns a copy built with `with_message()`.

#ifndef ERRLENS_CLASSIFY_RAISED_ERROR_HPP
#define ERRLENS_CLASSIFY_RAISED_ERROR_HPP

#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace errlens::classify {

/// Out-of-band fields carried by a raised error.
using Metadata = std::unordered_map<std::string, std::string>;

class RaisedError {
public:
    /// Metadata key under which validators store the rejected value.
    static constexpr const char* kInvalidValueKey = "_invalid_value";

    explicit RaisedError(std::string message, Metadata metadata = {});
    RaisedError(std::string message, std::vector<std::string> args, Metadata metadata = {});

    /// Wraps a standard exception, using `what()` as the message.
    static RaisedError from_exception(const std::exception& error, Metadata metadata = {});

    [[nodiscard]] auto message() const -> const std::string& {
        return message_;
    }
    [[nodiscard]] auto original_message() const -> const std::string& {
        return original_message_;
    }
    [[nodiscard]] auto args() const -> const std::vector<std::string>& {
        return args_;
    }
    [[nodiscard]] auto metadata() const -> const Metadata& {
        return metadata_;
    }

    /// The value a validator rejected, if one was recorded.
    [[nodiscard]] auto invalid_value() const -> std::optional<std::string>;

    /// Copy with `message` as the message and first argument. Arguments past
    /// the first are kept. The original message is carried over unchanged.
    [[nodiscard]] auto with_message(std::string message) const -> RaisedError;

    /// True once with_message() produced a message different from the original.
    [[nodiscard]] auto is_rewritten() const -> bool {
        return message_ != original_message_;
    }

    /// String form of the error, i.e. its current message.
    [[nodiscard]] auto to_string() const -> std::string {
        return message_;
    }

private:
    std::string original_message_;
    std::string message_;
    std::vector<std::string> args_;
    Metadata metadata_;
};

} // namespace errlens::classify

#endif // ERRLENS_CLASSIFY_RAISED_ERROR_HPP
