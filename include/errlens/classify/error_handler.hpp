//! # Error Classifier
//!
//! `ErrorHandler` turns raw CLI error text into a clearer message:
//!
//! ```text
//! raw error
//!   -> search each registered pattern in order
//!   -> first match: run its handler
//!   -> "<Label>: <rewritten message>"
//!   -> remember as last error, return to caller
//! ```
//!
//! Unrecognised input is returned untouched and nothing is recorded.
//!
//! ## Ownership
//!
//! The host constructs one `ErrorHandler` and passes it by reference to every
//! call site. The last-error slot is shared by all callers of that instance and
//! is guarded by a mutex: concurrent callers each see a consistent record, and
//! the last writer wins. Callers that need the record of their own call should
//! use `analyze()` or the `ClassifiedError` returned through `classify_record()`.

#ifndef ERRLENS_CLASSIFY_ERROR_HANDLER_HPP
#define ERRLENS_CLASSIFY_ERROR_HANDLER_HPP

#include "errlens/classify/correction.hpp"
#include "errlens/classify/error_kind.hpp"
#include "errlens/classify/raised_error.hpp"
#include "errlens/classify/registry.hpp"

#include <cstddef>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace errlens::classify {

/// What happens when the first matching kind's handler declines to rewrite.
enum class DispatchPolicy {
    StopAtFirstMatch,      ///< Stop scanning; input is returned unchanged
    FallThroughOnNoRewrite ///< Keep trying the remaining kinds
};

const char* dispatch_policy_name(DispatchPolicy policy);

struct ErrorHandlerOptions {
    bool colors = false; ///< Emphasise the label with ANSI codes
    DispatchPolicy policy = DispatchPolicy::StopAtFirstMatch;
};

/// Record of one successful classification.
struct ClassifiedError {
    std::string message;            ///< Final, formatted message
    std::string overridden_message; ///< Message before rewriting
    std::optional<SuggestedErrorCorrection> suggested_fix;
    ErrorKind kind;
    MatchGroups match;

    [[nodiscard]] auto to_string() const -> std::string;
};

/// Formats "<label>: <message>". With colors the label is bold bright red.
std::string format_message(std::string_view label, std::string_view message, bool colors);

class ErrorHandler {
public:
    explicit ErrorHandler(ErrorHandlerOptions options = {},
                          ErrorKindRegistry registry = ErrorKindRegistry::canonical());

    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    /// Rewrites a plain message. Returns `message` itself when unrecognised.
    std::string classify(const std::string& message);

    /// Returns a copy of `error` carrying the rewritten message and first
    /// argument. The copy equals `error` when unrecognised.
    RaisedError classify(const RaisedError& error);

    /// Wraps `error` (message from what()) and classifies it.
    RaisedError classify(const std::exception& error, Metadata metadata = {});

    /// Classifies and returns the record of this call, if any.
    std::optional<ClassifiedError> classify_record(const std::string& message,
                                                   const Metadata& metadata = {});

    /// Computes the classification without recording it as last error.
    [[nodiscard]] auto analyze(const std::string& message, const Metadata& metadata = {}) const
        -> std::optional<ClassifiedError>;

    /// Most recent successful classification, or nullopt if none yet.
    [[nodiscard]] auto last_error() const -> std::optional<ClassifiedError>;

    /// Number of successful classifications so far.
    [[nodiscard]] auto error_count() const -> size_t;

    [[nodiscard]] auto registry() const -> const ErrorKindRegistry& {
        return registry_;
    }
    [[nodiscard]] auto options() const -> const ErrorHandlerOptions& {
        return options_;
    }

private:
    ErrorHandlerOptions options_;
    ErrorKindRegistry registry_;

    mutable std::mutex mutex_;
    std::optional<ClassifiedError> last_error_;
    size_t error_count_ = 0;

    void record(const ClassifiedError& classified);
};

} // namespace errlens::classify

#endif // ERRLENS_CLASSIFY_ERROR_HANDLER_HPP
