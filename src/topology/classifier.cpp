/// @file classifier.cpp
/// @brief Container attribution for yardmap_topology module

#include <yardmap/topology/classifier.hpp>
#include <yardmap/topology/occupancy.hpp>

#include <string>

namespace yardmap_topology {

DisplayStatus display_status_of(const ContainerRecord& container) {
    if (container.damaged) {
        return DisplayStatus::Damaged;
    }
    if (container.status == ContainerStatus::Maintenance ||
        container.status == ContainerStatus::Cleaning) {
        return DisplayStatus::Maintenance;
    }
    return DisplayStatus::Occupied;
}

ContainerClassifier::ContainerClassifier(const StackTopology& topology,
                                         const std::vector<PhysicalStack>& stacks,
                                         const SynthesisResult& synthesis)
    : m_topology(topology)
    , m_synthesis(synthesis) {
    for (const auto& stack : stacks) {
        m_stacks.emplace(stack.number, &stack);
    }
}

Classification ContainerClassifier::classify(const ContainerRecord& container,
                                             Diagnostics& diagnostics) const {
    Classification result;
    result.container_id = container.id;
    result.display_status = display_status_of(container);

    auto parsed = yardmap_location::parse_location_code(container.location_code);
    if (!parsed) {
        result.failure = DiagnosticKind::ParseError;
        result.failure_reason = parsed.error().message();
        diagnostics.warn(DiagnosticKind::ParseError,
            "Container " + container.id + " is unlocated: " + result.failure_reason,
            std::nullopt, container.id);
        return result;
    }

    const auto& code = parsed.value();
    result.location = code;
    const ResolverConfig& config = m_topology.config();

    auto it = m_stacks.find(code.stack);
    if (it != m_stacks.end()) {
        const PhysicalStack& stack = *it->second;
        const VirtualStackPair* pair = m_synthesis.find_by_member(stack.number);

        if (container.size_class == SizeClass::Feet40 && pair != nullptr) {
            result.unit_number = pair->virtual_number;
            result.virtual_unit = true;
        } else {
            result.unit_number = stack.number;
        }

        if (container.size_class != config.effective_size(stack)) {
            diagnostics.warn(DiagnosticKind::SizeMismatch,
                std::string(size_class_name(container.size_class)) + " container " + container.id +
                " is on " + size_class_name(config.effective_size(stack)) + " stack " +
                std::to_string(stack.number),
                stack.number, container.id);
        }

        check_bounds(container, code, stack, diagnostics);
        return result;
    }

    if (const VirtualStackPair* pair = m_synthesis.find_by_virtual(code.stack)) {
        result.unit_number = pair->virtual_number;
        result.virtual_unit = true;

        if (container.size_class != SizeClass::Feet40) {
            diagnostics.warn(DiagnosticKind::SizeMismatch,
                "20ft container " + container.id + " is addressed to virtual stack " +
                std::to_string(pair->virtual_number),
                pair->virtual_number, container.id);
        }

        auto member = m_stacks.find(pair->first);
        if (member != m_stacks.end()) {
            check_bounds(container, code, *member->second, diagnostics);
        }
        return result;
    }

    result.failure = DiagnosticKind::UnknownStack;
    result.failure_reason = "stack " + std::to_string(code.stack) + " does not exist";
    diagnostics.warn(DiagnosticKind::UnknownStack,
        "Container " + container.id + " is unlocated: " + result.failure_reason,
        code.stack, container.id);
    return result;
}

void ContainerClassifier::check_bounds(const ContainerRecord& container,
                                       const yardmap_location::LocationCode& code,
                                       const PhysicalStack& stack,
                                       Diagnostics& diagnostics) const {
    const ResolverConfig& config = m_topology.config();
    std::uint32_t rows = effective_rows(stack, config);

    if (code.row > rows) {
        diagnostics.warn(DiagnosticKind::OutOfBounds,
            "Container " + container.id + " row " + std::to_string(code.row) +
            " exceeds the " + std::to_string(rows) + " rows of stack " + std::to_string(stack.number),
            stack.number, container.id);
        return;
    }

    std::uint32_t tiers = max_tiers_for_row(stack, code.row, config);
    if (code.tier > tiers) {
        diagnostics.warn(DiagnosticKind::OutOfBounds,
            "Container " + container.id + " tier " + std::to_string(code.tier) +
            " exceeds the " + std::to_string(tiers) + " tiers of stack " +
            std::to_string(stack.number) + " row " + std::to_string(code.row),
            stack.number, container.id);
    }
}

} // namespace yardmap_topology
