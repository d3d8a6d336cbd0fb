/// @file types.hpp
/// @brief Core records and enumerations for yardmap_topology module

#pragma once

#include "fwd.hpp"

#include <yardmap/location/location_code.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace yardmap_topology {

using yardmap_location::RowTierLimit;

// =============================================================================
// Enumerations
// =============================================================================

/// @brief Container length class a stack is declared for
enum class SizeClass : std::uint8_t {
    Feet20,
    Feet40,
};

/// @brief Depot status of a container
enum class ContainerStatus : std::uint8_t {
    InDepot,        ///< Stored in the yard
    GateIn,         ///< Gate-in in progress
    GateOut,        ///< Gate-out in progress
    Maintenance,    ///< Under maintenance
    Cleaning,       ///< Being cleaned
};

/// @brief Status shown for a slot, in increasing priority
enum class DisplayStatus : std::uint8_t {
    Occupied,
    Maintenance,
    Damaged,
};

/// @brief Role of a logical storage unit
enum class UnitKind : std::uint8_t {
    Physical,       ///< Standalone physical stack
    PairedMember,   ///< Physical stack merged into a virtual unit
    Virtual,        ///< Two physical stacks holding 40ft containers
};

/// @brief Where a virtual unit number came from
enum class PairOrigin : std::uint8_t {
    Persisted,      ///< Taken from a stored pairing record
    Synthesized,    ///< Derived from the topology (lower member + 1)
};

[[nodiscard]] const char* size_class_name(SizeClass size);
[[nodiscard]] std::optional<SizeClass> parse_size_class(std::string_view text);

[[nodiscard]] const char* container_status_name(ContainerStatus status);
[[nodiscard]] std::optional<ContainerStatus> parse_container_status(std::string_view text);

[[nodiscard]] const char* display_status_name(DisplayStatus status);
[[nodiscard]] const char* unit_kind_name(UnitKind kind);
[[nodiscard]] const char* pair_origin_name(PairOrigin origin);

// =============================================================================
// Input Records
// =============================================================================

/// @brief Stored pairing of a stack with its 40ft partner
struct PersistedPairing {
    StackNumber partner_number{0};
    StackNumber virtual_number{0};

    bool operator==(const PersistedPairing&) const = default;
};

/// @brief Physical storage stack as configured for the yard
struct PhysicalStack {
    StackNumber number{0};
    std::string section_id;
    std::uint32_t rows{0};
    std::uint32_t max_tiers{0};
    std::vector<RowTierLimit> row_tier_overrides;
    std::uint32_t declared_capacity{0};     ///< 0 when absent
    SizeClass size_class{SizeClass::Feet20};
    bool is_special{false};
    bool is_active{true};
    std::optional<PersistedPairing> persisted_pairing;
};

/// @brief Container as supplied by the host application
struct ContainerRecord {
    std::string id;
    SizeClass size_class{SizeClass::Feet20};
    ContainerStatus status{ContainerStatus::InDepot};
    bool damaged{false};
    std::string location_code;
};

/// @brief Immutable input of one resolver run
struct YardSnapshot {
    std::vector<PhysicalStack> stacks;
    std::vector<ContainerRecord> containers;
};

// =============================================================================
// Output Records
// =============================================================================

/// @brief Container attributed to a position of a logical unit
struct ContainerSlot {
    std::string container_id;
    std::uint32_t row{0};
    std::uint32_t tier{0};
    DisplayStatus display_status{DisplayStatus::Occupied};

    bool operator==(const ContainerSlot&) const = default;
};

/// @brief Storage unit seen by rendering and reporting collaborators
struct LogicalStorageUnit {
    StackNumber unit_number{0};
    UnitKind kind{UnitKind::Physical};
    std::optional<PairOrigin> origin;               ///< Set for virtual units
    std::vector<StackNumber> member_stack_numbers;  ///< Ascending
    std::optional<StackNumber> paired_into;         ///< Set for paired members
    std::string section_id;
    bool active{true};
    std::uint32_t capacity{0};
    std::uint32_t occupancy{0};
    bool over_capacity{false};
    std::vector<ContainerSlot> slots;

    [[nodiscard]] bool is_virtual() const noexcept { return kind == UnitKind::Virtual; }
    [[nodiscard]] std::uint32_t free_slots() const noexcept {
        return occupancy >= capacity ? 0 : capacity - occupancy;
    }
};

} // namespace yardmap_topology
