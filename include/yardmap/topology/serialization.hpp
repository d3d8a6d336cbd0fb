/// @file serialization.hpp
/// @brief JSON snapshot, configuration and resolution I/O
///
/// Snapshot document:
/// @code
/// { "stacks": [ { "number": 3, "section_id": "zone-a", "rows": 6, "max_tiers": 4,
///                 "size_class": "40ft",
///                 "persisted_pairing": { "partner_number": 5, "virtual_number": 4 } } ],
///   "containers": [ { "id": "MSCU1234567", "size_class": "40ft",
///                     "status": "in_depot", "location_code": "S03-R1-H1" } ] }
/// @endcode
///
/// Configuration document keys: special_stacks, pairing_bands, default_rows,
/// default_max_tiers, stack_size_overrides, location_stack_width. Absent keys
/// keep the reference yard values.

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "config.hpp"

#include <yardmap/core/error.hpp>

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <string>

namespace yardmap_topology {

// =============================================================================
// Snapshot
// =============================================================================

/// @brief Parse a snapshot document
[[nodiscard]] yardmap_core::Result<YardSnapshot> snapshot_from_json_string(
    const std::string& json_str,
    const std::filesystem::path& source_path = "<string>");

/// @brief Read and parse a snapshot file
[[nodiscard]] yardmap_core::Result<YardSnapshot> load_snapshot(const std::filesystem::path& path);

/// @brief Snapshot as a JSON document accepted by snapshot_from_json_string
[[nodiscard]] nlohmann::json snapshot_to_json(const YardSnapshot& snapshot);

// =============================================================================
// Configuration
// =============================================================================

/// @brief Parse and validate a resolver configuration document
[[nodiscard]] yardmap_core::Result<ResolverConfig> config_from_json_string(
    const std::string& json_str,
    const std::filesystem::path& source_path = "<string>");

/// @brief Read, parse and validate a resolver configuration file
[[nodiscard]] yardmap_core::Result<ResolverConfig> load_config(const std::filesystem::path& path);

// =============================================================================
// Resolution
// =============================================================================

/// @brief Units, unlocated containers, diagnostics and summary as JSON
///
/// Each slot carries the location code of its unit, formatted with `format`,
/// so 40ft containers of a pair are addressed by the virtual number.
[[nodiscard]] nlohmann::json resolution_to_json(const Resolution& resolution,
                                                const yardmap_location::LocationFormat& format = {});

} // namespace yardmap_topology
