// yardmap_topology adjacency and configuration tests

#include <catch2/catch_test_macros.hpp>
#include <yardmap/topology/topology.hpp>
#include <yardmap/topology/config.hpp>

#include <variant>
#include <vector>

using namespace yardmap_topology;

namespace {

PhysicalStack stack_of(StackNumber number, SizeClass size = SizeClass::Feet40) {
    PhysicalStack stack;
    stack.number = number;
    stack.size_class = size;
    return stack;
}

} // anonymous namespace

// =============================================================================
// PairingBand
// =============================================================================

TEST_CASE("Pairing band first numbers", "[topology][config]") {
    SECTION("reference bands") {
        PairingBand low{3, 29, 3, 4};
        REQUIRE(low.first_numbers() == std::vector<StackNumber>{3, 7, 11, 15, 19, 23, 27});

        PairingBand mid{33, 55, 33, 4};
        REQUIRE(mid.first_numbers() == std::vector<StackNumber>{33, 37, 41, 45, 49, 53});

        PairingBand high{61, 99, 61, 4};
        REQUIRE(high.first_numbers().front() == 61);
        REQUIRE(high.first_numbers().back() == 97);
    }

    SECTION("partner must fit in the band") {
        PairingBand band{3, 28, 3, 4};
        REQUIRE_FALSE(band.is_first(27));
        REQUIRE(band.is_first(23));
    }

    SECTION("membership") {
        PairingBand band{33, 55, 33, 4};
        REQUIRE(band.contains(33));
        REQUIRE(band.contains(55));
        REQUIRE_FALSE(band.contains(56));
        REQUIRE_FALSE(band.is_first(35));
    }
}

// =============================================================================
// ResolverConfig
// =============================================================================

TEST_CASE("Reference yard configuration", "[topology][config]") {
    auto config = ResolverConfig::reference_yard();

    REQUIRE(config.special_stacks == std::set<StackNumber>{1, 31, 101, 103});
    REQUIRE(config.pairing_bands.size() == 3);
    REQUIRE(config.default_rows == 6);
    REQUIRE(config.default_max_tiers == 4);
    REQUIRE(config.validate().is_ok());
}

TEST_CASE("Configuration size overrides and special flags", "[topology][config]") {
    auto config = ResolverConfig::reference_yard();
    config.stack_size_overrides[7] = SizeClass::Feet40;

    REQUIRE(config.effective_size(stack_of(7, SizeClass::Feet20)) == SizeClass::Feet40);
    REQUIRE(config.effective_size(stack_of(9, SizeClass::Feet20)) == SizeClass::Feet20);

    auto flagged = stack_of(13);
    flagged.is_special = true;
    REQUIRE(config.is_special(flagged));
    REQUIRE(config.is_special(stack_of(31)));
    REQUIRE_FALSE(config.is_special(stack_of(13)));
}

TEST_CASE("Configuration validation", "[topology][config]") {
    auto config = ResolverConfig::reference_yard();

    SECTION("inverted band") {
        config.pairing_bands.push_back(PairingBand{120, 110, 120, 4});
        REQUIRE(config.validate().is_err());
    }

    SECTION("stride of two") {
        config.pairing_bands[0].stride = 2;
        auto result = config.validate();
        REQUIRE(result.is_err());
        REQUIRE(std::holds_alternative<yardmap_core::ConfigError>(result.error().variant()));
    }

    SECTION("first pair outside the band") {
        config.pairing_bands.push_back(PairingBand{110, 111, 110, 4});
        REQUIRE(config.validate().is_err());
    }

    SECTION("overlapping bands") {
        config.pairing_bands.push_back(PairingBand{25, 40, 25, 4});
        REQUIRE(config.validate().is_err());
    }

    SECTION("zero defaults") {
        config.default_rows = 0;
        REQUIRE(config.validate().is_err());
    }
}

// =============================================================================
// StackTopology
// =============================================================================

TEST_CASE("Special stacks never pair", "[topology][adjacency]") {
    StackTopology topology(ResolverConfig::reference_yard());

    for (StackNumber special : {1u, 31u, 101u, 103u}) {
        REQUIRE(topology.is_special(special));
        REQUIRE_FALSE(topology.adjacent_of(special).has_value());
        REQUIRE_FALSE(topology.is_pair_participant(special));
    }
}

TEST_CASE("Adjacency in the reference yard", "[topology][adjacency]") {
    StackTopology topology(ResolverConfig::reference_yard());

    SECTION("first of pair maps forward") {
        REQUIRE(topology.adjacent_of(3) == 5u);
        REQUIRE(topology.adjacent_of(33) == 35u);
        REQUIRE(topology.adjacent_of(61) == 63u);
        REQUIRE(topology.adjacent_of(97) == 99u);
    }

    SECTION("partner maps back") {
        REQUIRE(topology.adjacent_of(5) == 3u);
        REQUIRE(topology.adjacent_of(29) == 27u);
        REQUIRE(topology.adjacent_of(55) == 53u);
    }

    SECTION("non participants") {
        REQUIRE_FALSE(topology.adjacent_of(4).has_value());
        REQUIRE_FALSE(topology.adjacent_of(2).has_value());
        REQUIRE_FALSE(topology.adjacent_of(57).has_value());
        REQUIRE_FALSE(topology.adjacent_of(100).has_value());
        REQUIRE_FALSE(topology.adjacent_of(0).has_value());
    }

    SECTION("first of pair queries") {
        REQUIRE(topology.is_first_of_pair(7));
        REQUIRE_FALSE(topology.is_first_of_pair(9));
        REQUIRE(topology.is_pair_participant(9));
        REQUIRE(topology.band_of(45) == &topology.config().pairing_bands[1]);
        REQUIRE(topology.band_of(58) == nullptr);
    }
}

TEST_CASE("Adjacency is an involution", "[topology][adjacency]") {
    StackTopology topology(ResolverConfig::reference_yard());

    for (StackNumber n = 0; n <= 110; ++n) {
        auto partner = topology.adjacent_of(n);
        if (!partner) continue;

        auto back = topology.adjacent_of(*partner);
        REQUIRE(back.has_value());
        REQUIRE(*back == n);
        REQUIRE(*partner != n);
    }
}

TEST_CASE("Special partner removes the pair", "[topology][adjacency]") {
    auto config = ResolverConfig::reference_yard();
    config.special_stacks.insert(5);
    StackTopology topology(config);

    REQUIRE_FALSE(topology.adjacent_of(3).has_value());
    REQUIRE_FALSE(topology.adjacent_of(5).has_value());
    REQUIRE(topology.adjacent_of(7) == 9u);
}

TEST_CASE("Virtual number and 40ft eligibility", "[topology][adjacency]") {
    StackTopology topology(ResolverConfig::reference_yard());

    REQUIRE(StackTopology::virtual_number_for(3, 5) == 4);
    REQUIRE(StackTopology::virtual_number_for(5, 3) == 4);
    REQUIRE(StackTopology::virtual_number_for(61, 63) == 62);

    REQUIRE(topology.can_assign_40ft(stack_of(3)));
    REQUIRE_FALSE(topology.can_assign_40ft(stack_of(1)));
    REQUIRE_FALSE(topology.can_assign_40ft(stack_of(57)));

    auto flagged = stack_of(7);
    flagged.is_special = true;
    REQUIRE_FALSE(topology.can_assign_40ft(flagged));
}
