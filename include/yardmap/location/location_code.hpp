/// @file location_code.hpp
/// @brief Location code parsing and formatting for yardmap_location
///
/// A location code ties a container to a physical coordinate:
/// ```
///   S07-R2-H3     stack 7, row 2, tier 3
///   s7r2t3        same position (case-insensitive, T is a legacy alias of H)
/// ```
/// Grammar: `S<digits>[sep]R<digits>[sep](H|T)<digits>` with optional
/// separators. Stack padding is not significant when parsing.

#pragma once

#include "fwd.hpp"

#include <yardmap/core/error.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace yardmap_location {

/// Largest value accepted for any coordinate
inline constexpr std::uint32_t k_max_coordinate = 9999;

/// Widest stack padding; k_max_coordinate has four digits
inline constexpr std::uint32_t k_max_stack_width = 4;

// =============================================================================
// LocationCode
// =============================================================================

/// @brief Parsed (stack, row, tier) coordinate
struct LocationCode {
    std::uint32_t stack{0};
    std::uint32_t row{0};
    std::uint32_t tier{0};

    bool operator==(const LocationCode&) const = default;
    bool operator!=(const LocationCode&) const = default;

    /// @brief All three coordinates are positive and in range
    [[nodiscard]] bool is_valid() const noexcept {
        return stack > 0 && row > 0 && tier > 0 &&
               stack <= k_max_coordinate && row <= k_max_coordinate && tier <= k_max_coordinate;
    }
};

/// @brief Output options for format_location_code
struct LocationFormat {
    std::uint32_t stack_width{2};   ///< Zero-pad the stack number to this many digits (at most k_max_stack_width)
    bool separators{true};          ///< Emit '-' between the parts
};

/// @brief Row override: row `row` holds at most `max_tiers` containers
struct RowTierLimit {
    std::uint32_t row{0};
    std::uint32_t max_tiers{0};

    bool operator==(const RowTierLimit&) const = default;
};

// =============================================================================
// Parsing / Formatting
// =============================================================================

/// @brief Parse a location code
/// Never throws; malformed input yields a LocationError.
[[nodiscard]] yardmap_core::Result<LocationCode> parse_location_code(std::string_view code);

/// @brief Check the grammar without keeping the result
[[nodiscard]] bool is_valid_location_code(std::string_view code);

/// @brief Format a coordinate as a canonical location code ("S07-R2-H3")
[[nodiscard]] std::string format_location_code(std::uint32_t stack, std::uint32_t row, std::uint32_t tier,
                                               const LocationFormat& format = {});

[[nodiscard]] inline std::string format_location_code(const LocationCode& code,
                                                      const LocationFormat& format = {}) {
    return format_location_code(code.stack, code.row, code.tier, format);
}

/// @brief Enumerate every location code of a stack, row by row
///
/// A row listed in `overrides` uses its own tier limit instead of `max_tiers`.
[[nodiscard]] std::vector<std::string> generate_stack_locations(
    std::uint32_t stack,
    std::uint32_t rows,
    std::uint32_t max_tiers,
    const std::vector<RowTierLimit>& overrides = {},
    const LocationFormat& format = {});

} // namespace yardmap_location
