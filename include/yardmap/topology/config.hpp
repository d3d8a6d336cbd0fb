/// @file config.hpp
/// @brief Resolver configuration for yardmap_topology module
///
/// Everything the resolver needs to know about the yard layout is passed in
/// explicitly through ResolverConfig. Use reference_yard() for the layout
/// with special stacks 1, 31, 101, 103 and the three pairing bands
/// [3,29], [33,55], [61,99].

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <yardmap/core/error.hpp>
#include <yardmap/location/location_code.hpp>

#include <map>
#include <set>
#include <vector>

namespace yardmap_topology {

// =============================================================================
// PairingBand
// =============================================================================

/// @brief Numeric band of stack numbers sharing one pairing pattern
///
/// First-of-pair numbers are `first_start + k * stride` for every k where
/// the partner `first + 2` still lies inside the band.
struct PairingBand {
    StackNumber lower{0};
    StackNumber upper{0};
    StackNumber first_start{0};
    StackNumber stride{4};

    bool operator==(const PairingBand&) const = default;

    [[nodiscard]] bool contains(StackNumber number) const noexcept {
        return number >= lower && number <= upper;
    }

    /// @brief Number opens a pair (its partner is number + 2)
    [[nodiscard]] bool is_first(StackNumber number) const noexcept {
        if (stride == 0 || number < first_start || number < lower) return false;
        if (number + 2 > upper) return false;
        return (number - first_start) % stride == 0;
    }

    /// @brief All first-of-pair numbers, ascending
    [[nodiscard]] std::vector<StackNumber> first_numbers() const;
};

// =============================================================================
// ResolverConfig
// =============================================================================

/// @brief Yard layout and defaults consumed by the resolver
struct ResolverConfig {
    std::set<StackNumber> special_stacks;
    std::vector<PairingBand> pairing_bands;
    std::uint32_t default_rows{6};
    std::uint32_t default_max_tiers{4};
    std::map<StackNumber, SizeClass> stack_size_overrides;
    yardmap_location::LocationFormat location_format;

    /// @brief Layout of the reference yard
    [[nodiscard]] static ResolverConfig reference_yard();

    /// @brief Size class after applying stack_size_overrides
    [[nodiscard]] SizeClass effective_size(const PhysicalStack& stack) const;

    /// @brief Special by flag or by configuration
    [[nodiscard]] bool is_special(const PhysicalStack& stack) const {
        return stack.is_special || special_stacks.count(stack.number) > 0;
    }

    /// @brief Check band shapes: strides above 2, in-band starts, no overlap
    [[nodiscard]] yardmap_core::Result<void> validate() const;
};

} // namespace yardmap_topology
