#pragma once

#include "nullsafe/core/constants.hpp"

#include <cstdint>
#include <string_view>

namespace nullsafe::configuration {

/// Rendering style used by Maybe::ToString
enum class DisplayStyle : uint8_t {
    /// "unknown" / "definitely <value>"
    Descriptive = 0,

    /// "none" / "some(<value>)"
    Terse = 1
};

/// Configuration for the textual rendering of a Maybe
///
/// @example
/// ```cpp
/// auto config = DisplayConfig::Terse();
/// Maybe<int>::Definitely(5).ToString(config);   // "some(5)"
/// Maybe<int>::Unknown().ToString(config);       // "none"
/// ```
class DisplayConfig {
public:
    // =========================================================================
    // Factory Methods
    // =========================================================================

    [[nodiscard]] static constexpr DisplayConfig Descriptive() noexcept {
        return DisplayConfig(DisplayStyle::Descriptive);
    }

    [[nodiscard]] static constexpr DisplayConfig Terse() noexcept {
        return DisplayConfig(DisplayStyle::Terse);
    }

    /// Default configuration (Descriptive, as used by operator<< and fmt)
    [[nodiscard]] static constexpr DisplayConfig Default() noexcept {
        return Descriptive();
    }

    // =========================================================================
    // Labels
    // =========================================================================

    [[nodiscard]] constexpr std::string_view UnknownLabel() const noexcept {
        switch (style_) {
            case DisplayStyle::Descriptive:
                return DisplayConstants::DESCRIPTIVE_UNKNOWN;
            case DisplayStyle::Terse:
                return DisplayConstants::TERSE_UNKNOWN;
        }
        return DisplayConstants::DESCRIPTIVE_UNKNOWN; // Unreachable
    }

    [[nodiscard]] constexpr std::string_view KnownPrefix() const noexcept {
        switch (style_) {
            case DisplayStyle::Descriptive:
                return DisplayConstants::DESCRIPTIVE_KNOWN_PREFIX;
            case DisplayStyle::Terse:
                return DisplayConstants::TERSE_KNOWN_PREFIX;
        }
        return DisplayConstants::DESCRIPTIVE_KNOWN_PREFIX; // Unreachable
    }

    [[nodiscard]] constexpr std::string_view KnownSuffix() const noexcept {
        switch (style_) {
            case DisplayStyle::Descriptive:
                return DisplayConstants::DESCRIPTIVE_KNOWN_SUFFIX;
            case DisplayStyle::Terse:
                return DisplayConstants::TERSE_KNOWN_SUFFIX;
        }
        return DisplayConstants::DESCRIPTIVE_KNOWN_SUFFIX; // Unreachable
    }

    [[nodiscard]] constexpr DisplayStyle GetStyle() const noexcept {
        return style_;
    }

    [[nodiscard]] constexpr bool operator==(const DisplayConfig& other) const noexcept {
        return style_ == other.style_;
    }

    [[nodiscard]] constexpr bool operator!=(const DisplayConfig& other) const noexcept {
        return style_ != other.style_;
    }

private:
    explicit constexpr DisplayConfig(const DisplayStyle style) noexcept
        : style_(style) {}

    DisplayStyle style_;
};

} // namespace nullsafe::configuration
