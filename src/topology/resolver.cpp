/// @file resolver.cpp
/// @brief Stack topology & virtual location resolver

#include <yardmap/topology/resolver.hpp>
#include <yardmap/core/log.hpp>

#include <algorithm>
#include <map>
#include <set>
#include <tuple>
#include <string>
#include <utility>

namespace yardmap_topology {

// =============================================================================
// Resolution
// =============================================================================

const LogicalStorageUnit* Resolution::find_unit(StackNumber unit_number) const {
    auto it = std::find_if(units.begin(), units.end(),
        [unit_number](const LogicalStorageUnit& u) { return u.unit_number == unit_number; });
    return it != units.end() ? &*it : nullptr;
}

const LogicalStorageUnit* Resolution::find_virtual_unit(StackNumber unit_number) const {
    auto it = std::find_if(units.begin(), units.end(),
        [unit_number](const LogicalStorageUnit& u) {
            return u.unit_number == unit_number && u.is_virtual();
        });
    return it != units.end() ? &*it : nullptr;
}

std::vector<const LogicalStorageUnit*> Resolution::units_of_kind(UnitKind kind) const {
    std::vector<const LogicalStorageUnit*> result;
    for (const auto& unit : units) {
        if (unit.kind == kind) {
            result.push_back(&unit);
        }
    }
    return result;
}

const LogicalStorageUnit* Resolution::unit_of_container(const std::string& container_id) const {
    for (const auto& unit : units) {
        for (const auto& slot : unit.slots) {
            if (slot.container_id == container_id) {
                return &unit;
            }
        }
    }
    return nullptr;
}

// =============================================================================
// Helpers
// =============================================================================

namespace {

/// Keep the first stack of every number
std::vector<PhysicalStack> unique_stacks(const std::vector<PhysicalStack>& stacks,
                                         Diagnostics& diagnostics) {
    std::vector<PhysicalStack> result;
    std::set<StackNumber> seen;
    result.reserve(stacks.size());

    for (const auto& stack : stacks) {
        if (!seen.insert(stack.number).second) {
            diagnostics.warn(DiagnosticKind::DuplicateStack,
                "Stack " + std::to_string(stack.number) + " is listed more than once; keeping the first entry",
                stack.number);
            continue;
        }
        result.push_back(stack);
    }

    return result;
}

void report_position_conflicts(const LogicalStorageUnit& unit, Diagnostics& diagnostics) {
    std::map<std::pair<std::uint32_t, std::uint32_t>, const ContainerSlot*> positions;
    for (const auto& slot : unit.slots) {
        auto [it, inserted] = positions.emplace(std::make_pair(slot.row, slot.tier), &slot);
        if (!inserted) {
            diagnostics.warn(DiagnosticKind::PositionConflict,
                "Containers " + it->second->container_id + " and " + slot.container_id +
                " share row " + std::to_string(slot.row) + " tier " + std::to_string(slot.tier) +
                " of unit " + std::to_string(unit.unit_number),
                unit.unit_number, slot.container_id);
        }
    }
}

} // anonymous namespace

// =============================================================================
// YardResolver
// =============================================================================

YardResolver::YardResolver(ResolverConfig config)
    : m_topology(std::move(config)) {}

Resolution YardResolver::resolve(const YardSnapshot& snapshot) const {
    YARDMAP_LOG_SCOPE("YardResolver::resolve", "topology");

    const ResolverConfig& config = m_topology.config();
    Resolution resolution;
    Diagnostics& diagnostics = resolution.diagnostics;

    std::vector<PhysicalStack> stacks = unique_stacks(snapshot.stacks, diagnostics);

    VirtualStackSynthesizer synthesizer(m_topology);
    SynthesisResult synthesis = synthesizer.synthesize(stacks, diagnostics);

    // Units: physical stacks keyed by number, virtual units by virtual number
    std::map<StackNumber, LogicalStorageUnit> physical_units;
    std::map<StackNumber, LogicalStorageUnit> virtual_units;
    std::map<StackNumber, const PhysicalStack*> by_number;

    for (const auto& stack : stacks) {
        by_number.emplace(stack.number, &stack);

        LogicalStorageUnit unit;
        unit.unit_number = stack.number;
        unit.member_stack_numbers = {stack.number};
        unit.section_id = stack.section_id;
        unit.active = stack.is_active;
        unit.capacity = capacity_of(stack, config);

        if (const VirtualStackPair* pair = synthesis.find_by_member(stack.number)) {
            unit.kind = UnitKind::PairedMember;
            unit.paired_into = pair->virtual_number;
        }

        physical_units.emplace(stack.number, std::move(unit));
    }

    for (const auto& pair : synthesis.pairs) {
        const PhysicalStack& first = *by_number.at(pair.first);
        const PhysicalStack& second = *by_number.at(pair.second);

        LogicalStorageUnit unit;
        unit.unit_number = pair.virtual_number;
        unit.kind = UnitKind::Virtual;
        unit.origin = pair.origin;
        unit.member_stack_numbers = {pair.first, pair.second};
        unit.section_id = first.section_id;
        unit.active = true;
        unit.capacity = pair_capacity(first, second, config, diagnostics);

        virtual_units.emplace(pair.virtual_number, std::move(unit));
    }

    // Attribute containers
    ContainerClassifier classifier(m_topology, stacks, synthesis);
    for (const auto& container : snapshot.containers) {
        Classification c = classifier.classify(container, diagnostics);

        if (!c.located()) {
            resolution.unlocated.push_back(UnlocatedContainer{
                container.id,
                container.location_code,
                c.failure.value_or(DiagnosticKind::ParseError),
                c.failure_reason});
            continue;
        }

        auto& units = c.virtual_unit ? virtual_units : physical_units;
        LogicalStorageUnit& unit = units.at(*c.unit_number);
        unit.slots.push_back(ContainerSlot{container.id, c.location->row, c.location->tier, c.display_status});
    }

    // Finalize units
    resolution.units.reserve(physical_units.size() + virtual_units.size());
    for (auto* units : {&physical_units, &virtual_units}) {
        for (auto& [number, unit] : *units) {
            std::sort(unit.slots.begin(), unit.slots.end(),
                [](const ContainerSlot& a, const ContainerSlot& b) {
                    return std::tie(a.row, a.tier, a.container_id) < std::tie(b.row, b.tier, b.container_id);
                });
            report_position_conflicts(unit, diagnostics);
            update_occupancy(unit, diagnostics);
            resolution.units.push_back(std::move(unit));
        }
    }

    std::stable_sort(resolution.units.begin(), resolution.units.end(),
        [](const LogicalStorageUnit& a, const LogicalStorageUnit& b) {
            return a.unit_number < b.unit_number;
        });

    resolution.summary = summarize_capacity(resolution.units);
    resolution.summary.unlocated_containers = resolution.unlocated.size();

    yardmap_core::topology_logger()->debug(
        "Resolved {} units ({} virtual) for {} containers: {} unlocated, {} diagnostics",
        resolution.units.size(), resolution.summary.virtual_units, snapshot.containers.size(),
        resolution.unlocated.size(), diagnostics.size());

    return resolution;
}

} // namespace yardmap_topology
