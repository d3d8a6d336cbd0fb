/// @file topology.cpp
/// @brief Stack adjacency rules for yardmap_topology module

#include <yardmap/topology/topology.hpp>

#include <algorithm>

namespace yardmap_topology {

StackTopology::StackTopology(ResolverConfig config)
    : m_config(std::move(config)) {}

bool StackTopology::is_special(StackNumber number) const {
    return m_config.special_stacks.count(number) > 0;
}

const PairingBand* StackTopology::band_of(StackNumber number) const {
    auto it = std::find_if(m_config.pairing_bands.begin(), m_config.pairing_bands.end(),
        [number](const PairingBand& band) { return band.contains(number); });
    return it != m_config.pairing_bands.end() ? &*it : nullptr;
}

bool StackTopology::is_first_of_pair(StackNumber number) const {
    if (is_special(number)) return false;
    const PairingBand* band = band_of(number);
    return band != nullptr && band->is_first(number);
}

bool StackTopology::is_pair_participant(StackNumber number) const {
    return adjacent_of(number).has_value();
}

std::optional<StackNumber> StackTopology::adjacent_of(StackNumber number) const {
    if (is_special(number)) {
        return std::nullopt;
    }

    const PairingBand* band = band_of(number);
    if (band == nullptr) {
        return std::nullopt;
    }

    std::optional<StackNumber> partner;
    if (band->is_first(number)) {
        partner = number + 2;
    } else if (number >= 2 && band->is_first(number - 2)) {
        partner = number - 2;
    }

    // A special partner cannot pair, and then neither can this stack
    if (partner && is_special(*partner)) {
        return std::nullopt;
    }
    return partner;
}

StackNumber StackTopology::virtual_number_for(StackNumber a, StackNumber b) noexcept {
    return std::min(a, b) + 1;
}

bool StackTopology::can_assign_40ft(const PhysicalStack& stack) const {
    if (m_config.is_special(stack)) return false;
    return adjacent_of(stack.number).has_value();
}

} // namespace yardmap_topology
