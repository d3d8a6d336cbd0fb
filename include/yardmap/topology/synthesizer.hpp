/// @file synthesizer.hpp
/// @brief Virtual stack synthesis for yardmap_topology module

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "topology.hpp"
#include "diagnostics.hpp"

#include <map>
#include <vector>

namespace yardmap_topology {

/// @brief Two adjacent 40ft stacks merged into one logical unit
struct VirtualStackPair {
    StackNumber virtual_number{0};
    StackNumber first{0};       ///< Lower member
    StackNumber second{0};      ///< Higher member
    PairOrigin origin{PairOrigin::Synthesized};

    bool operator==(const VirtualStackPair&) const = default;

    [[nodiscard]] bool contains(StackNumber number) const noexcept {
        return number == first || number == second;
    }
};

/// @brief Output of one synthesis pass
struct SynthesisResult {
    std::vector<VirtualStackPair> pairs;                    ///< Ascending by virtual number
    std::map<StackNumber, StackNumber> member_to_virtual;   ///< Member stack -> virtual number
    std::vector<StackNumber> unpaired;                      ///< Eligible 40ft stacks left alone

    [[nodiscard]] const VirtualStackPair* find_by_virtual(StackNumber virtual_number) const;
    [[nodiscard]] const VirtualStackPair* find_by_member(StackNumber stack) const;
};

/// @brief Builds the set of virtual 40ft units from the stack list
///
/// Persisted pairings act as a cache of the virtual unit number only: pair
/// membership always follows StackTopology. The result depends only on the
/// stack set, not on its order, so repeated runs yield identical pairs.
class VirtualStackSynthesizer {
public:
    explicit VirtualStackSynthesizer(const StackTopology& topology);

    /// @brief Pair every eligible stack; findings go to `diagnostics`
    ///
    /// When a stack number occurs more than once the first occurrence is used.
    [[nodiscard]] SynthesisResult synthesize(const std::vector<PhysicalStack>& stacks,
                                             Diagnostics& diagnostics) const;

private:
    const StackTopology& m_topology;
};

} // namespace yardmap_topology
