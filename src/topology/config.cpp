/// @file config.cpp
/// @brief Resolver configuration for yardmap_topology module

#include <yardmap/topology/config.hpp>

#include <algorithm>
#include <string>

namespace yardmap_topology {

std::vector<StackNumber> PairingBand::first_numbers() const {
    std::vector<StackNumber> result;
    if (stride == 0) {
        return result;
    }
    for (StackNumber n = first_start; n + 2 <= upper; n += stride) {
        if (n >= lower) {
            result.push_back(n);
        }
    }
    return result;
}

ResolverConfig ResolverConfig::reference_yard() {
    ResolverConfig config;
    config.special_stacks = {1, 31, 101, 103};
    config.pairing_bands = {
        PairingBand{3, 29, 3, 4},
        PairingBand{33, 55, 33, 4},
        PairingBand{61, 99, 61, 4},
    };
    return config;
}

SizeClass ResolverConfig::effective_size(const PhysicalStack& stack) const {
    auto it = stack_size_overrides.find(stack.number);
    if (it != stack_size_overrides.end()) {
        return it->second;
    }
    return stack.size_class;
}

yardmap_core::Result<void> ResolverConfig::validate() const {
    using yardmap_core::ConfigError;

    for (std::size_t i = 0; i < pairing_bands.size(); ++i) {
        const auto& band = pairing_bands[i];
        std::string field = "pairing_bands[" + std::to_string(i) + "]";

        if (band.lower > band.upper) {
            return yardmap_core::Err(ConfigError::invalid_value(field, "lower bound above upper bound"));
        }
        // A stride of 2 or less would make a partner the first number of the next pair
        if (band.stride <= 2) {
            return yardmap_core::Err(ConfigError::invalid_value(field, "stride must be greater than 2"));
        }
        if (band.first_start < band.lower || band.first_start + 2 > band.upper) {
            return yardmap_core::Err(ConfigError::invalid_value(field, "first pair does not fit in the band"));
        }

        for (std::size_t j = i + 1; j < pairing_bands.size(); ++j) {
            const auto& other = pairing_bands[j];
            if (band.lower <= other.upper && other.lower <= band.upper) {
                return yardmap_core::Err(ConfigError::invalid_value(field,
                    "overlaps pairing_bands[" + std::to_string(j) + "]"));
            }
        }
    }

    if (default_rows == 0 || default_max_tiers == 0) {
        return yardmap_core::Err(ConfigError::invalid_value("default_rows", "defaults must be positive"));
    }
    if (default_rows > yardmap_location::k_max_coordinate || default_max_tiers > yardmap_location::k_max_coordinate) {
        return yardmap_core::Err(ConfigError::invalid_value("default_rows",
            "defaults must not exceed " + std::to_string(yardmap_location::k_max_coordinate)));
    }

    if (location_format.stack_width > yardmap_location::k_max_stack_width) {
        return yardmap_core::Err(ConfigError::invalid_value("location_stack_width",
            "must not exceed " + std::to_string(yardmap_location::k_max_stack_width)));
    }

    return yardmap_core::Ok();
}

} // namespace yardmap_topology
