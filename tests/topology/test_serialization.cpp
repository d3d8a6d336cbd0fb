// yardmap_topology JSON input/output tests

#include <catch2/catch_test_macros.hpp>
#include <yardmap/topology/serialization.hpp>
#include <yardmap/topology/resolver.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <variant>

using namespace yardmap_topology;
using yardmap_core::ConfigError;
using yardmap_core::ErrorCode;

namespace {

const char* k_snapshot = R"({
  "stacks": [
    { "number": 3, "section_id": "zone-a", "rows": 6, "max_tiers": 4, "size_class": "40ft",
      "persisted_pairing": { "partner_number": 5, "virtual_number": 4 } },
    { "number": 5, "section_id": "zone-a", "rows": 6, "max_tiers": 4, "size_class": "40ft" },
    { "number": 7, "section_id": "zone-a", "rows": 3, "max_tiers": 4,
      "row_tier_overrides": [ { "row": 1, "max_tiers": 2 } ], "is_active": false },
    { "number": 1, "is_special": true, "declared_capacity": 10 }
  ],
  "containers": [
    { "id": "MSCU1234567", "size_class": "40ft", "status": "in_depot", "location_code": "S03-R1-H1" },
    { "id": "TGHU7654321", "size_class": "20ft", "status": "maintenance", "damaged": true,
      "location_code": "S01-R1-H1" },
    { "id": "CAIU0000001", "location_code": "S99-RX-H1" }
  ]
})";

/// Temporary file removed on scope exit
class TempFile {
public:
    TempFile(const std::string& name, const std::string& contents)
        : m_path(std::filesystem::temp_directory_path() / name) {
        std::ofstream out(m_path);
        out << contents;
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

const ConfigError* config_error(const yardmap_core::Error& error) {
    return std::get_if<ConfigError>(&error.variant());
}

} // anonymous namespace

// =============================================================================
// Snapshot
// =============================================================================

TEST_CASE("Snapshot parsing", "[topology][serialization]") {
    auto result = snapshot_from_json_string(k_snapshot);
    REQUIRE(result.is_ok());
    const auto& snapshot = result.value();

    REQUIRE(snapshot.stacks.size() == 4);
    REQUIRE(snapshot.containers.size() == 3);

    SECTION("stack fields") {
        const auto& s3 = snapshot.stacks[0];
        REQUIRE(s3.number == 3);
        REQUIRE(s3.section_id == "zone-a");
        REQUIRE(s3.size_class == SizeClass::Feet40);
        REQUIRE(s3.persisted_pairing == PersistedPairing{5, 4});
        REQUIRE(s3.is_active);

        const auto& s7 = snapshot.stacks[2];
        REQUIRE(s7.row_tier_overrides == std::vector<RowTierLimit>{{1, 2}});
        REQUIRE_FALSE(s7.is_active);
        REQUIRE_FALSE(s7.persisted_pairing.has_value());

        const auto& s1 = snapshot.stacks[3];
        REQUIRE(s1.is_special);
        REQUIRE(s1.declared_capacity == 10);
        REQUIRE(s1.rows == 0);
        REQUIRE(s1.size_class == SizeClass::Feet20);
    }

    SECTION("container fields and defaults") {
        const auto& a = snapshot.containers[0];
        REQUIRE(a.id == "MSCU1234567");
        REQUIRE(a.size_class == SizeClass::Feet40);
        REQUIRE(a.status == ContainerStatus::InDepot);
        REQUIRE_FALSE(a.damaged);

        const auto& b = snapshot.containers[1];
        REQUIRE(b.status == ContainerStatus::Maintenance);
        REQUIRE(b.damaged);

        const auto& c = snapshot.containers[2];
        REQUIRE(c.size_class == SizeClass::Feet20);
        REQUIRE(c.location_code == "S99-RX-H1");
    }

    SECTION("written snapshot reads back the same") {
        auto reparsed = snapshot_from_json_string(snapshot_to_json(snapshot).dump());
        REQUIRE(reparsed.is_ok());
        REQUIRE(reparsed->stacks.size() == snapshot.stacks.size());
        for (std::size_t i = 0; i < snapshot.stacks.size(); ++i) {
            REQUIRE(reparsed->stacks[i].number == snapshot.stacks[i].number);
            REQUIRE(reparsed->stacks[i].row_tier_overrides == snapshot.stacks[i].row_tier_overrides);
            REQUIRE(reparsed->stacks[i].persisted_pairing == snapshot.stacks[i].persisted_pairing);
            REQUIRE(reparsed->stacks[i].is_active == snapshot.stacks[i].is_active);
        }
        REQUIRE(reparsed->containers.size() == snapshot.containers.size());
        REQUIRE(reparsed->containers[1].status == ContainerStatus::Maintenance);
    }
}

TEST_CASE("Snapshot parsing errors", "[topology][serialization]") {
    SECTION("malformed JSON") {
        auto result = snapshot_from_json_string("{ \"stacks\": [", "broken.json");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
        REQUIRE(config_error(result.error())->kind == ConfigError::Kind::Malformed);
        REQUIRE(result.error().context().at("source") == "broken.json");
    }

    SECTION("top level array") {
        auto result = snapshot_from_json_string("[]");
        REQUIRE(result.is_err());
        REQUIRE(config_error(result.error())->kind == ConfigError::Kind::Malformed);
    }

    SECTION("stack without number") {
        auto result = snapshot_from_json_string(R"({ "stacks": [ { "rows": 6 } ] })");
        REQUIRE(result.is_err());
        REQUIRE(config_error(result.error())->kind == ConfigError::Kind::MissingField);
        REQUIRE(config_error(result.error())->field == "stacks[0].number");
    }

    SECTION("negative geometry") {
        auto result = snapshot_from_json_string(R"({ "stacks": [ { "number": 3, "rows": -1 } ] })");
        REQUIRE(result.is_err());
        REQUIRE(config_error(result.error())->kind == ConfigError::Kind::InvalidValue);
    }

    SECTION("geometry beyond the addressable range") {
        auto result = snapshot_from_json_string(
            R"({ "stacks": [ { "number": 3, "rows": 6, "max_tiers": 4000000000 } ] })");
        REQUIRE(result.is_err());
        REQUIRE(config_error(result.error())->field == "stacks[0].max_tiers");
    }

    SECTION("unknown size class") {
        auto result = snapshot_from_json_string(R"({ "stacks": [ { "number": 3, "size_class": "45ft" } ] })");
        REQUIRE(result.is_err());
        REQUIRE(config_error(result.error())->field == "stacks[0].size_class");
    }

    SECTION("unknown container status") {
        auto result = snapshot_from_json_string(
            R"({ "containers": [ { "id": "A", "status": "lost", "location_code": "S03-R1-H1" } ] })");
        REQUIRE(result.is_err());
        REQUIRE(config_error(result.error())->field == "containers[0].status");
    }

    SECTION("container without id") {
        auto result = snapshot_from_json_string(R"({ "containers": [ { "location_code": "S03-R1-H1" } ] })");
        REQUIRE(result.is_err());
        REQUIRE(config_error(result.error())->kind == ConfigError::Kind::MissingField);
    }

    SECTION("pairing without virtual number") {
        auto result = snapshot_from_json_string(
            R"({ "stacks": [ { "number": 3, "persisted_pairing": { "partner_number": 5 } } ] })");
        REQUIRE(result.is_err());
        REQUIRE(config_error(result.error())->field == "stacks[0].persisted_pairing.virtual_number");
    }

    SECTION("empty document is an empty yard") {
        auto result = snapshot_from_json_string("{}");
        REQUIRE(result.is_ok());
        REQUIRE(result->stacks.empty());
        REQUIRE(result->containers.empty());
    }
}

TEST_CASE("Snapshot files", "[topology][serialization]") {
    SECTION("missing file") {
        auto result = load_snapshot(std::filesystem::temp_directory_path() / "yardmap_no_such_snapshot.json");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::NotFound);
    }

    SECTION("file on disk") {
        TempFile file("yardmap_test_snapshot.json", k_snapshot);
        auto result = load_snapshot(file.path());
        REQUIRE(result.is_ok());
        REQUIRE(result->stacks.size() == 4);
    }
}

// =============================================================================
// Configuration
// =============================================================================

TEST_CASE("Configuration parsing", "[topology][serialization]") {
    SECTION("empty document keeps the reference yard") {
        auto result = config_from_json_string("{}");
        REQUIRE(result.is_ok());
        auto reference = ResolverConfig::reference_yard();
        REQUIRE(result->special_stacks == reference.special_stacks);
        REQUIRE(result->pairing_bands == reference.pairing_bands);
        REQUIRE(result->default_rows == reference.default_rows);
    }

    SECTION("every key") {
        auto result = config_from_json_string(R"({
            "special_stacks": [2, 40],
            "pairing_bands": [ { "lower": 10, "upper": 30 }, { "lower": 41, "upper": 60, "first_start": 43, "stride": 6 } ],
            "default_rows": 8,
            "default_max_tiers": 5,
            "stack_size_overrides": { "11": "40ft", "13": "40" },
            "location_stack_width": 3
        })");
        REQUIRE(result.is_ok());
        const auto& config = result.value();
        REQUIRE(config.special_stacks == std::set<StackNumber>{2, 40});
        REQUIRE(config.pairing_bands.size() == 2);
        REQUIRE(config.pairing_bands[0] == PairingBand{10, 30, 10, 4});
        REQUIRE(config.pairing_bands[1] == PairingBand{41, 60, 43, 6});
        REQUIRE(config.default_rows == 8);
        REQUIRE(config.default_max_tiers == 5);
        REQUIRE(config.stack_size_overrides.at(11) == SizeClass::Feet40);
        REQUIRE(config.stack_size_overrides.at(13) == SizeClass::Feet40);
        REQUIRE(config.location_format.stack_width == 3);
    }

    SECTION("invalid band is rejected by validation") {
        auto result = config_from_json_string(R"({ "pairing_bands": [ { "lower": 10, "upper": 30, "stride": 2 } ] })");
        REQUIRE(result.is_err());
        REQUIRE(config_error(result.error())->kind == ConfigError::Kind::InvalidValue);
    }

    SECTION("bad override key") {
        auto result = config_from_json_string(R"({ "stack_size_overrides": { "eleven": "40ft" } })");
        REQUIRE(result.is_err());
        REQUIRE(config_error(result.error())->field == "stack_size_overrides.eleven");
    }

    SECTION("bad override value") {
        auto result = config_from_json_string(R"({ "stack_size_overrides": { "11": 40 } })");
        REQUIRE(result.is_err());
    }

    SECTION("zero default rows") {
        auto result = config_from_json_string(R"({ "default_rows": 0 })");
        REQUIRE(result.is_err());
        REQUIRE(config_error(result.error())->field == "config.default_rows");
    }

    SECTION("default geometry beyond the addressable range") {
        auto result = config_from_json_string(R"({ "default_rows": 10000 })");
        REQUIRE(result.is_err());
        REQUIRE(config_error(result.error())->field == "default_rows");
    }

    SECTION("stack width beyond four digits") {
        auto result = config_from_json_string(R"({ "location_stack_width": 5000000 })");
        REQUIRE(result.is_err());
        REQUIRE(config_error(result.error())->field == "location_stack_width");
    }

    SECTION("file on disk") {
        TempFile file("yardmap_test_config.json", R"({ "special_stacks": [1] })");
        auto result = load_config(file.path());
        REQUIRE(result.is_ok());
        REQUIRE(result->special_stacks == std::set<StackNumber>{1});
    }
}

// =============================================================================
// Resolution output
// =============================================================================

TEST_CASE("Resolution JSON", "[topology][serialization]") {
    auto snapshot = snapshot_from_json_string(k_snapshot);
    REQUIRE(snapshot.is_ok());

    YardResolver resolver(ResolverConfig::reference_yard());
    auto resolution = resolver.resolve(*snapshot);
    nlohmann::json j = resolution_to_json(resolution);

    REQUIRE(j["units"].is_array());
    REQUIRE(j["units"].size() == resolution.units.size());

    nlohmann::json virtual_unit;
    for (const auto& unit : j["units"]) {
        if (unit["kind"] == "virtual") {
            virtual_unit = unit;
        }
    }
    REQUIRE(virtual_unit["unit_number"] == 4);
    REQUIRE(virtual_unit["origin"] == "persisted");
    REQUIRE(virtual_unit["member_stacks"] == nlohmann::json::array({3, 5}));
    REQUIRE(virtual_unit["occupancy"] == 1);
    REQUIRE(virtual_unit["slots"][0]["container_id"] == "MSCU1234567");
    REQUIRE(virtual_unit["slots"][0]["location_code"] == "S04-R1-H1");

    REQUIRE(j["unlocated"].size() == 1);
    REQUIRE(j["unlocated"][0]["reason"] == "parse_error");
    REQUIRE(j["summary"]["unlocated_containers"] == 1);
    REQUIRE(j["summary"]["virtual_units"] == 1);
    REQUIRE(j["diagnostics"].size() == resolution.diagnostics.size());
}

TEST_CASE("Resolution JSON uses the configured location format", "[topology][serialization]") {
    auto snapshot = snapshot_from_json_string(k_snapshot);
    REQUIRE(snapshot.is_ok());

    auto config = config_from_json_string(R"({ "location_stack_width": 3 })");
    REQUIRE(config.is_ok());

    YardResolver resolver(*config);
    auto resolution = resolver.resolve(*snapshot);
    nlohmann::json j = resolution_to_json(resolution, resolver.config().location_format);

    for (const auto& unit : j["units"]) {
        if (unit["unit_number"] == 1) {
            REQUIRE(unit["slots"][0]["location_code"] == "S001-R1-H1");
        }
        if (unit["kind"] == "virtual") {
            REQUIRE(unit["slots"][0]["location_code"] == "S004-R1-H1");
        }
    }
}
