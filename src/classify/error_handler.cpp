//! # Error Classifier Implementation
//!
//! ## Dispatch
//!
//! ```text
//! for each (kind, handler) in registry order:
//!     match = kind.search(message)        // search, not anchored
//!     if no match: continue
//!     result = handler(match, message, metadata)
//!     if result rewrites: format, stop
//!     StopAtFirstMatch:       stop, nothing rewritten
//!     FallThroughOnNoRewrite: continue with the next kind
//! ```

#include "errlens/classify/error_handler.hpp"
#include "errlens/log/log.hpp"

#include <sstream>
#include <utility>

namespace errlens::classify {

namespace {

// Bright, red, label, normal intensity, ": message", reset
constexpr const char* kLabelStyle = "\033[1m\033[31m";
constexpr const char* kNormal = "\033[22m";
constexpr const char* kReset = "\033[0m";

} // namespace

const char* dispatch_policy_name(DispatchPolicy policy) {
    switch (policy) {
    case DispatchPolicy::StopAtFirstMatch:
        return "stop-at-first-match";
    case DispatchPolicy::FallThroughOnNoRewrite:
        return "fall-through";
    }
    return "unknown";
}

std::string format_message(std::string_view label, std::string_view message, bool colors) {
    std::string formatted;
    formatted.reserve(label.size() + message.size() + 24);

    if (colors) {
        formatted += kLabelStyle;
    }
    formatted += label;
    if (colors) {
        formatted += kNormal;
    }
    formatted += ": ";
    formatted += message;
    if (colors) {
        formatted += kReset;
    }
    return formatted;
}

std::string ClassifiedError::to_string() const {
    std::ostringstream oss;
    oss << "ClassifiedError(message='" << message << "', overridden_message='"
        << overridden_message << "', suggested_fix="
        << (suggested_fix ? suggested_fix->to_string() : std::string("None"))
        << ", kind=" << kind_name(kind.id()) << ", match=" << match.to_string() << ")";
    return oss.str();
}

// ============================================================================
// ErrorHandler
// ============================================================================

ErrorHandler::ErrorHandler(ErrorHandlerOptions options, ErrorKindRegistry registry)
    : options_(options), registry_(std::move(registry)) {}

std::optional<ClassifiedError> ErrorHandler::analyze(const std::string& message,
                                                     const Metadata& metadata) const {
    for (const auto& entry : registry_.entries()) {
        auto match = entry.kind.search(message);
        if (!match) {
            continue;
        }

        ERRLENS_LOG_DEBUG("classify", "message matches " << kind_name(entry.kind.id()));

        RewriteResult result = entry.handler(*match, message, metadata);
        if (is_no_rewrite(result)) {
            ERRLENS_LOG_TRACE("classify", "handler for " << kind_name(entry.kind.id())
                                                         << " produced no rewrite");
            if (options_.policy == DispatchPolicy::FallThroughOnNoRewrite) {
                continue;
            }
            return std::nullopt;
        }

        std::string rewritten;
        std::optional<SuggestedErrorCorrection> suggestion;
        if (auto* with_fix = std::get_if<MessageWithCorrection>(&result)) {
            rewritten = std::move(with_fix->message);
            suggestion = std::move(with_fix->correction);
        } else {
            rewritten = std::move(std::get<std::string>(result));
        }

        return ClassifiedError{format_message(entry.kind.label(), rewritten, options_.colors),
                               message, std::move(suggestion), entry.kind, std::move(*match)};
    }

    return std::nullopt;
}

std::optional<ClassifiedError> ErrorHandler::classify_record(const std::string& message,
                                                             const Metadata& metadata) {
    ERRLENS_LOG_DEBUG("classify", "classifying error: " << message);

    auto classified = analyze(message, metadata);
    if (classified) {
        record(*classified);
    }
    return classified;
}

std::string ErrorHandler::classify(const std::string& message) {
    auto classified = classify_record(message);
    if (!classified) {
        return message;
    }
    return classified->message;
}

RaisedError ErrorHandler::classify(const RaisedError& error) {
    auto classified = classify_record(error.message(), error.metadata());
    if (!classified) {
        return error;
    }
    return error.with_message(classified->message);
}

RaisedError ErrorHandler::classify(const std::exception& error, Metadata metadata) {
    return classify(RaisedError::from_exception(error, std::move(metadata)));
}

void ErrorHandler::record(const ClassifiedError& classified) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_error_ = classified;
    ++error_count_;
}

std::optional<ClassifiedError> ErrorHandler::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

size_t ErrorHandler::error_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_count_;
}

} // namespace errlens::classify
