/// @file topology.hpp
/// @brief Stack adjacency rules for yardmap_topology module
///
/// Only odd stacks exist physically. A 40ft pair joins a first-of-pair stack
/// with the stack two numbers above it; the skipped number in between becomes
/// the identity of the virtual unit:
/// ```
///   band [3,29]:  3+5 -> 4,  7+9 -> 8,  ... 27+29 -> 28
///   band [33,55]: 33+35 -> 34, ...      53+55 -> 54
///   band [61,99]: 61+63 -> 62, ...      97+99 -> 98
/// ```
/// StackTopology is the single place these rules are evaluated.

#pragma once

#include "fwd.hpp"
#include "config.hpp"

#include <optional>

namespace yardmap_topology {

/// @brief Evaluates stack adjacency for one yard configuration
class StackTopology {
public:
    explicit StackTopology(ResolverConfig config);

    [[nodiscard]] const ResolverConfig& config() const noexcept { return m_config; }

    /// @brief Stack number is in the configured special set
    [[nodiscard]] bool is_special(StackNumber number) const;

    /// @brief Band containing the number, if any
    [[nodiscard]] const PairingBand* band_of(StackNumber number) const;

    /// @brief Number opens a pair in its band
    [[nodiscard]] bool is_first_of_pair(StackNumber number) const;

    /// @brief Number is a first-of-pair or the partner of one
    [[nodiscard]] bool is_pair_participant(StackNumber number) const;

    /// @brief Partner stack for 40ft pairing
    ///
    /// Undefined for special stacks, numbers outside every band and numbers
    /// that do not participate in a pair. adjacent_of(adjacent_of(n)) == n
    /// wherever both are defined.
    [[nodiscard]] std::optional<StackNumber> adjacent_of(StackNumber number) const;

    /// @brief Virtual unit number of a pair: the number skipped between them
    [[nodiscard]] static StackNumber virtual_number_for(StackNumber a, StackNumber b) noexcept;

    /// @brief Stack may be configured for 40ft containers
    [[nodiscard]] bool can_assign_40ft(const PhysicalStack& stack) const;

private:
    ResolverConfig m_config;
};

} // namespace yardmap_topology
