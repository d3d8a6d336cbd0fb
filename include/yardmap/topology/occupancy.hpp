/// @file occupancy.hpp
/// @brief Capacity and occupancy aggregation for yardmap_topology module

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "config.hpp"
#include "diagnostics.hpp"

#include <cstdint>
#include <vector>

namespace yardmap_topology {

/// @brief Slot count of a physical stack
///
/// Declared capacity when positive, else the sum of per-row tier overrides
/// for rows inside the stack, else rows * max_tiers. Zero geometry falls
/// back to the configured defaults.
[[nodiscard]] std::uint32_t capacity_of(const PhysicalStack& stack, const ResolverConfig& config);

/// @brief Tier limit of one row
[[nodiscard]] std::uint32_t max_tiers_for_row(const PhysicalStack& stack, std::uint32_t row,
                                              const ResolverConfig& config);

/// @brief Row count with the configured default applied
[[nodiscard]] std::uint32_t effective_rows(const PhysicalStack& stack, const ResolverConfig& config);

/// @brief Capacity of a virtual unit made of `a` and `b`
///
/// Both members are expected to share the same geometry. When they do not,
/// a GeometryMismatch is reported and the lower-numbered member's capacity is
/// used.
[[nodiscard]] std::uint32_t pair_capacity(const PhysicalStack& a, const PhysicalStack& b,
                                          const ResolverConfig& config, Diagnostics& diagnostics);

/// @brief Number of containers attributed to the unit
[[nodiscard]] inline std::uint32_t occupancy_of(const LogicalStorageUnit& unit) {
    return static_cast<std::uint32_t>(unit.slots.size());
}

/// @brief Set occupancy from slots and flag the unit when it exceeds capacity
void update_occupancy(LogicalStorageUnit& unit, Diagnostics& diagnostics);

/// @brief Yard-wide totals
struct CapacitySummary {
    std::uint64_t effective_capacity{0};    ///< Physical + virtual units, paired members excluded
    std::uint64_t individual_capacity{0};   ///< Every active physical stack on its own
    std::uint64_t occupancy{0};             ///< Every located container, inactive units included
    std::size_t physical_units{0};
    std::size_t virtual_units{0};
    std::size_t paired_members{0};
    std::size_t over_capacity_units{0};
    std::size_t unlocated_containers{0};

    [[nodiscard]] double utilization() const noexcept {
        return effective_capacity == 0 ? 0.0
             : static_cast<double>(occupancy) / static_cast<double>(effective_capacity);
    }
};

/// @brief Aggregate totals over resolved units
///
/// Inactive units contribute their occupancy but no capacity and no unit count.
[[nodiscard]] CapacitySummary summarize_capacity(const std::vector<LogicalStorageUnit>& units);

} // namespace yardmap_topology
