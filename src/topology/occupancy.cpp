/// @file occupancy.cpp
/// @brief Capacity and occupancy aggregation for yardmap_topology module

#include <yardmap/topology/occupancy.hpp>

#include <algorithm>
#include <limits>
#include <string>

namespace yardmap_topology {

std::uint32_t effective_rows(const PhysicalStack& stack, const ResolverConfig& config) {
    return stack.rows > 0 ? stack.rows : config.default_rows;
}

namespace {

std::uint32_t effective_tiers(const PhysicalStack& stack, const ResolverConfig& config) {
    return stack.max_tiers > 0 ? stack.max_tiers : config.default_max_tiers;
}

/// Clamp a 64-bit slot count to the capacity type
std::uint32_t saturate(std::uint64_t value) {
    constexpr std::uint64_t max = std::numeric_limits<std::uint32_t>::max();
    return static_cast<std::uint32_t>(std::min(value, max));
}

bool same_geometry(const PhysicalStack& a, const PhysicalStack& b, const ResolverConfig& config) {
    return effective_rows(a, config) == effective_rows(b, config) &&
           effective_tiers(a, config) == effective_tiers(b, config) &&
           a.row_tier_overrides == b.row_tier_overrides;
}

} // anonymous namespace

std::uint32_t capacity_of(const PhysicalStack& stack, const ResolverConfig& config) {
    if (stack.declared_capacity > 0) {
        return stack.declared_capacity;
    }

    std::uint32_t rows = effective_rows(stack, config);

    if (!stack.row_tier_overrides.empty()) {
        std::uint64_t capacity = 0;
        for (const auto& limit : stack.row_tier_overrides) {
            if (limit.row >= 1 && limit.row <= rows) {
                capacity += limit.max_tiers;
            }
        }
        return saturate(capacity);
    }

    return saturate(static_cast<std::uint64_t>(rows) * effective_tiers(stack, config));
}

std::uint32_t max_tiers_for_row(const PhysicalStack& stack, std::uint32_t row,
                                const ResolverConfig& config) {
    auto it = std::find_if(stack.row_tier_overrides.begin(), stack.row_tier_overrides.end(),
        [row](const RowTierLimit& limit) { return limit.row == row; });
    if (it != stack.row_tier_overrides.end()) {
        return it->max_tiers;
    }
    return effective_tiers(stack, config);
}

std::uint32_t pair_capacity(const PhysicalStack& a, const PhysicalStack& b,
                            const ResolverConfig& config, Diagnostics& diagnostics) {
    const PhysicalStack& lower = a.number <= b.number ? a : b;
    const PhysicalStack& upper = a.number <= b.number ? b : a;

    std::uint32_t lower_capacity = capacity_of(lower, config);
    std::uint32_t upper_capacity = capacity_of(upper, config);

    if (!same_geometry(lower, upper, config) || lower_capacity != upper_capacity) {
        diagnostics.warn(DiagnosticKind::GeometryMismatch,
            "Paired stacks " + std::to_string(lower.number) + " (capacity " +
            std::to_string(lower_capacity) + ") and " + std::to_string(upper.number) +
            " (capacity " + std::to_string(upper_capacity) + ") disagree on geometry; using stack " +
            std::to_string(lower.number),
            lower.number);
    }

    return lower_capacity;
}

void update_occupancy(LogicalStorageUnit& unit, Diagnostics& diagnostics) {
    unit.occupancy = occupancy_of(unit);
    unit.over_capacity = unit.occupancy > unit.capacity;

    if (unit.over_capacity) {
        diagnostics.warn(DiagnosticKind::OverCapacity,
            std::string(unit_kind_name(unit.kind)) + " unit " + std::to_string(unit.unit_number) +
            " holds " + std::to_string(unit.occupancy) + " containers for " +
            std::to_string(unit.capacity) + " slots",
            unit.unit_number);
    }
}

CapacitySummary summarize_capacity(const std::vector<LogicalStorageUnit>& units) {
    CapacitySummary summary;

    for (const auto& unit : units) {
        // Containers on an inactive stack are still located; only its capacity is withdrawn
        summary.occupancy += unit.occupancy;
        if (!unit.active) continue;

        if (unit.over_capacity) {
            ++summary.over_capacity_units;
        }

        switch (unit.kind) {
            case UnitKind::Physical:
                ++summary.physical_units;
                summary.effective_capacity += unit.capacity;
                summary.individual_capacity += unit.capacity;
                break;
            case UnitKind::PairedMember:
                ++summary.paired_members;
                summary.individual_capacity += unit.capacity;
                break;
            case UnitKind::Virtual:
                ++summary.virtual_units;
                summary.effective_capacity += unit.capacity;
                break;
        }
    }

    return summary;
}

} // namespace yardmap_topology
