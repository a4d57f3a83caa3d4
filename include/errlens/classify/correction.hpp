//! # Suggested Error Corrections
//!
//! A `SuggestedErrorCorrection` proposes a replacement value for a parameter
//! the CLI rejected, e.g. `--resource-group sampleUXgroup` for a group name
//! that contained `!!`.
//!
//! ## Parameter Names
//!
//! Validators report internal field names. These are mapped to the flag the
//! user actually typed:
//!
//! | Field                 | Flag               |
//! |-----------------------|--------------------|
//! | `resource_group_name` | `--resource-group` |
//! | `name`                | `--name`           |
//! | `location`            | `--location`       |
//! | `subscription`        | `--subscription`   |
//!
//! Unknown names are kept verbatim.

#ifndef ERRLENS_CLASSIFY_CORRECTION_HPP
#define ERRLENS_CLASSIFY_CORRECTION_HPP

#include <optional>
#include <string>
#include <string_view>

namespace errlens::classify {

enum class CorrectionKind {
    InvalidArgument,
};

const char* correction_kind_name(CorrectionKind kind);

/// Maps an internal field name to its CLI flag spelling.
std::string normalize_parameter_name(std::string_view name);

class SuggestedErrorCorrection {
public:
    SuggestedErrorCorrection(std::string suggestion, CorrectionKind kind,
                             std::optional<std::string> parameter = std::nullopt);

    [[nodiscard]] auto suggestion() const -> const std::string& {
        return suggestion_;
    }
    [[nodiscard]] auto kind() const -> CorrectionKind {
        return kind_;
    }
    /// Normalised flag name, e.g. "--resource-group".
    [[nodiscard]] auto parameter() const -> const std::optional<std::string>& {
        return parameter_;
    }

    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto operator==(const SuggestedErrorCorrection& other) const -> bool = default;

private:
    std::string suggestion_;
    CorrectionKind kind_;
    std::optional<std::string> parameter_;
};

} // namespace errlens::classify

#endif // ERRLENS_CLASSIFY_CORRECTION_HPP
