/// @file classifier.hpp
/// @brief Container attribution for yardmap_topology module

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "topology.hpp"
#include "synthesizer.hpp"
#include "diagnostics.hpp"

#include <yardmap/location/location_code.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace yardmap_topology {

/// @brief Where a container belongs
struct Classification {
    std::string container_id;
    std::optional<yardmap_location::LocationCode> location;
    std::optional<StackNumber> unit_number;     ///< Empty when unlocated
    bool virtual_unit{false};                   ///< unit_number names a virtual unit
    DisplayStatus display_status{DisplayStatus::Occupied};
    std::optional<DiagnosticKind> failure;      ///< ParseError or UnknownStack
    std::string failure_reason;

    [[nodiscard]] bool located() const noexcept { return unit_number.has_value(); }
};

/// @brief Slot status by priority: damaged, then maintenance/cleaning, then occupied
[[nodiscard]] DisplayStatus display_status_of(const ContainerRecord& container);

/// @brief Attributes containers to exactly one logical unit
///
/// 20ft containers belong to their physical stack. 40ft containers belong to
/// the virtual unit of their stack when it is paired, otherwise to the stack
/// itself. A code that names a virtual unit number directly resolves to that
/// virtual unit.
class ContainerClassifier {
public:
    ContainerClassifier(const StackTopology& topology,
                        const std::vector<PhysicalStack>& stacks,
                        const SynthesisResult& synthesis);

    /// @brief Classify one container; data-quality findings go to `diagnostics`
    [[nodiscard]] Classification classify(const ContainerRecord& container,
                                          Diagnostics& diagnostics) const;

private:
    void check_bounds(const ContainerRecord& container,
                      const yardmap_location::LocationCode& code,
                      const PhysicalStack& stack,
                      Diagnostics& diagnostics) const;

    const StackTopology& m_topology;
    const SynthesisResult& m_synthesis;
    std::map<StackNumber, const PhysicalStack*> m_stacks;
};

} // namespace yardmap_topology
