#include "errlens/classify/error_kind.hpp"
#include "errlens/log/log.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace errlens::classify {

const char* kind_name(ErrorKindId id) {
    switch (id) {
    case ErrorKindId::ArgumentRequired:
        return "ArgumentRequired";
    case ErrorKindId::CharacterNotAllowed:
        return "CharacterNotAllowed";
    case ErrorKindId::CommandNotFound:
        return "CommandNotFound";
    case ErrorKindId::ResourceNotFound:
        return "ResourceNotFound";
    case ErrorKindId::ValueRequired:
        return "ValueRequired";
    case ErrorKindId::Custom:
        return "Custom";
    }
    return "Unknown";
}

// ============================================================================
// MatchGroups
// ============================================================================

MatchGroups::MatchGroups(std::string matched, size_t position,
                         std::map<std::string, std::string> groups)
    : matched_(std::move(matched)), position_(position), groups_(std::move(groups)) {}

const std::string& MatchGroups::group(const std::string& name) const {
    auto it = groups_.find(name);
    if (it == groups_.end()) {
        throw std::out_of_range("no capture group named '" + name + "'");
    }
    return it->second;
}

std::string MatchGroups::to_string() const {
    std::ostringstream oss;
    oss << "<match span=(" << position_ << ", " << position_ + matched_.size() << "), match='"
        << matched_ << "'";
    for (const auto& [name, text] : groups_) {
        oss << ", " << name << "='" << text << "'";
    }
    oss << ">";
    return oss.str();
}

// ============================================================================
// ErrorKind
// ============================================================================

static std::regex compile_pattern(const std::string& pattern) {
    try {
        return std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("expected pattern to be a valid regular expression, got '" +
                                    pattern + "': " + e.what());
    }
}

ErrorKind::ErrorKind(ErrorKindId id, std::string label, std::string pattern,
                     std::vector<std::string> group_names)
    : id_(id), label_(std::move(label)), pattern_source_(std::move(pattern)),
      group_names_(std::move(group_names)) {
    if (label_.empty()) {
        throw std::invalid_argument("expected label to be non-empty text");
    }
    pattern_ = compile_pattern(pattern_source_);

    if (group_names_.size() > pattern_.mark_count()) {
        throw std::invalid_argument("pattern '" + pattern_source_ + "' has " +
                                    std::to_string(pattern_.mark_count()) +
                                    " capture groups but " +
                                    std::to_string(group_names_.size()) + " names were given");
    }
}

std::optional<MatchGroups> ErrorKind::search(const std::string& message) const {
    if (message.size() > MAX_SEARCH_LENGTH) {
        ERRLENS_LOG_TRACE("classify", "message of " << message.size()
                                                    << " bytes exceeds search limit, skipping '"
                                                    << label_ << "'");
        return std::nullopt;
    }

    std::smatch match;
    if (!std::regex_search(message, match, pattern_)) {
        return std::nullopt;
    }

    std::map<std::string, std::string> groups;
    for (size_t i = 0; i < group_names_.size(); ++i) {
        const auto& name = group_names_[i];
        if (name.empty())
            continue;
        const auto& sub = match[i + 1];
        groups[name] = sub.matched ? sub.str() : std::string();
    }

    return MatchGroups(match.str(0), static_cast<size_t>(match.position(0)), std::move(groups));
}

} // namespace errlens::classify
