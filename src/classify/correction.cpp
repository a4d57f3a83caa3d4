#include "errlens/classify/correction.hpp"

#include <sstream>
#include <unordered_map>
#include <utility>

namespace errlens::classify {

const char* correction_kind_name(CorrectionKind kind) {
    switch (kind) {
    case CorrectionKind::InvalidArgument:
        return "InvalidArgument";
    }
    return "Unknown";
}

std::string normalize_parameter_name(std::string_view name) {
    static const std::unordered_map<std::string_view, std::string_view> flags = {
        {"resource_group_name", "--resource-group"},
        {"name", "--name"},
        {"location", "--location"},
        {"subscription", "--subscription"},
    };

    auto it = flags.find(name);
    if (it == flags.end()) {
        return std::string(name);
    }
    return std::string(it->second);
}

SuggestedErrorCorrection::SuggestedErrorCorrection(std::string suggestion, CorrectionKind kind,
                                                   std::optional<std::string> parameter)
    : suggestion_(std::move(suggestion)), kind_(kind) {
    if (parameter) {
        parameter_ = normalize_parameter_name(*parameter);
    }
}

std::string SuggestedErrorCorrection::to_string() const {
    std::ostringstream oss;
    oss << "SuggestedErrorCorrection(suggestion='" << suggestion_
        << "', kind=" << correction_kind_name(kind_) << ", parameter=";
    if (parameter_) {
        oss << "'" << *parameter_ << "'";
    } else {
        oss << "None";
    }
    oss << ")";
    return oss.str();
}

} // namespace errlens::classify
