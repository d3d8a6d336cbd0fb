/// @file resolver.hpp
/// @brief Stack topology & virtual location resolver
///
/// YardResolver turns a snapshot of stacks and containers into logical
/// storage units in one synchronous pass:
///
/// 1. duplicate stack numbers are reported (first occurrence wins)
/// 2. VirtualStackSynthesizer pairs adjacent 40ft stacks
/// 3. every stack and every pair becomes a LogicalStorageUnit
/// 4. ContainerClassifier attributes each container to exactly one unit,
///    or to the unlocated list
/// 5. occupancy, over-capacity flags and yard totals are computed
///
/// Nothing is thrown and nothing is shared between calls; findings are
/// returned in Resolution::diagnostics.

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "config.hpp"
#include "topology.hpp"
#include "synthesizer.hpp"
#include "occupancy.hpp"
#include "classifier.hpp"
#include "diagnostics.hpp"

#include <string>
#include <vector>

namespace yardmap_topology {

/// @brief Container that could not be attributed to any unit
struct UnlocatedContainer {
    std::string container_id;
    std::string location_code;
    DiagnosticKind reason{DiagnosticKind::ParseError};
    std::string detail;
};

/// @brief Output of one resolver run
struct Resolution {
    std::vector<LogicalStorageUnit> units;      ///< Ascending unit number, virtual after physical on ties
    std::vector<UnlocatedContainer> unlocated;
    Diagnostics diagnostics;
    CapacitySummary summary;

    /// @brief Unit with the given number (physical preferred on a clash)
    [[nodiscard]] const LogicalStorageUnit* find_unit(StackNumber unit_number) const;

    /// @brief Virtual unit with the given number
    [[nodiscard]] const LogicalStorageUnit* find_virtual_unit(StackNumber unit_number) const;

    [[nodiscard]] std::vector<const LogicalStorageUnit*> units_of_kind(UnitKind kind) const;

    /// @brief Unit holding the container, if it was located
    [[nodiscard]] const LogicalStorageUnit* unit_of_container(const std::string& container_id) const;
};

/// @brief Resolves logical storage units for one yard configuration
class YardResolver {
public:
    explicit YardResolver(ResolverConfig config);

    [[nodiscard]] const StackTopology& topology() const noexcept { return m_topology; }
    [[nodiscard]] const ResolverConfig& config() const noexcept { return m_topology.config(); }

    /// @brief Compute all logical units from scratch
    [[nodiscard]] Resolution resolve(const YardSnapshot& snapshot) const;

private:
    StackTopology m_topology;
};

} // namespace yardmap_topology
