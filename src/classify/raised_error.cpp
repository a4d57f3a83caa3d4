#include "errlens/classify/raised_error.hpp"

#include <utility>

namespace errlens::classify {

RaisedError::RaisedError(std::string message, Metadata metadata)
    : original_message_(message), message_(message), args_{std::move(message)},
      metadata_(std::move(metadata)) {}

RaisedError::RaisedError(std::string message, std::vector<std::string> args, Metadata metadata)
    : original_message_(message), message_(std::move(message)), args_(std::move(args)),
      metadata_(std::move(metadata)) {}

RaisedError RaisedError::from_exception(const std::exception& error, Metadata metadata) {
    return RaisedError(std::string(error.what()), std::move(metadata));
}

std::optional<std::string> RaisedError::invalid_value() const {
    auto it = metadata_.find(kInvalidValueKey);
    if (it == metadata_.end()) {
        return std::nullopt;
    }
    return it->second;
}

RaisedError RaisedError::with_message(std::string message) const {
    RaisedError copy = *this;
    if (copy.args_.empty()) {
        copy.args_.push_back(message);
    } else {
        copy.args_[0] = message;
    }
    copy.message_ = std::move(message);
    return copy;
}

} // namespace errlens::classify
