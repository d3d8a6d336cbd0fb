/// @file serialization.cpp
/// @brief JSON snapshot, configuration and resolution I/O

#include <yardmap/topology/serialization.hpp>
#include <yardmap/topology/resolver.hpp>
#include <yardmap/core/log.hpp>

#include <nlohmann/json.hpp>

#include <charconv>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>

namespace yardmap_topology {

using yardmap_core::ConfigError;

// =============================================================================
// JSON Parsing Helpers
// =============================================================================

namespace {

std::optional<std::uint32_t> as_uint32(const nlohmann::json& value) {
    constexpr auto max = std::numeric_limits<std::uint32_t>::max();
    if (value.is_number_unsigned()) {
        auto v = value.get<std::uint64_t>();
        if (v <= max) return static_cast<std::uint32_t>(v);
    } else if (value.is_number_integer()) {
        auto v = value.get<std::int64_t>();
        if (v >= 0 && static_cast<std::uint64_t>(v) <= max) return static_cast<std::uint32_t>(v);
    }
    return std::nullopt;
}

/// Reads optional or required fields of one object, keeping the first error
class FieldReader {
public:
    FieldReader(const nlohmann::json& object, std::string path)
        : m_object(object), m_path(std::move(path)) {}

    void read_uint(const char* key, std::uint32_t& out, bool required = false) {
        const nlohmann::json* value = find(key, required);
        if (!value) return;
        auto number = as_uint32(*value);
        if (!number) {
            fail(ConfigError::invalid_value(field(key), "expected a non-negative integer"));
            return;
        }
        out = *number;
    }

    void read_positive(const char* key, std::uint32_t& out, bool required = false) {
        std::uint32_t value = out;
        read_uint(key, value, required);
        if (ok() && m_object.contains(key) && value == 0) {
            fail(ConfigError::invalid_value(field(key), "must be positive"));
            return;
        }
        out = value;
    }

    /// Geometry value; no stack is deeper or taller than a location code can address
    void read_geometry(const char* key, std::uint32_t& out, bool required = false) {
        std::uint32_t value = out;
        read_uint(key, value, required);
        if (ok() && value > yardmap_location::k_max_coordinate) {
            fail(ConfigError::invalid_value(field(key),
                "must not exceed " + std::to_string(yardmap_location::k_max_coordinate)));
            return;
        }
        out = value;
    }

    void read_bool(const char* key, bool& out) {
        const nlohmann::json* value = find(key, false);
        if (!value) return;
        if (!value->is_boolean()) {
            fail(ConfigError::invalid_value(field(key), "expected true or false"));
            return;
        }
        out = value->get<bool>();
    }

    void read_string(const char* key, std::string& out, bool required = false) {
        const nlohmann::json* value = find(key, required);
        if (!value) return;
        if (!value->is_string()) {
            fail(ConfigError::invalid_value(field(key), "expected a string"));
            return;
        }
        out = value->get<std::string>();
    }

    template<typename Enum, typename Parse>
    void read_enum(const char* key, Enum& out, Parse parse, const char* expected) {
        std::string text;
        read_string(key, text);
        if (!ok() || text.empty()) return;
        auto parsed = parse(text);
        if (!parsed) {
            fail(ConfigError::invalid_value(field(key), "'" + text + "' is not one of " + expected));
            return;
        }
        out = *parsed;
    }

    [[nodiscard]] bool ok() const noexcept { return !m_error.has_value(); }
    [[nodiscard]] yardmap_core::Error error() const { return *m_error; }
    [[nodiscard]] std::string field(const char* key) const { return m_path + "." + key; }

    void fail(yardmap_core::Error error) {
        if (!m_error) m_error = std::move(error);
    }

private:
    const nlohmann::json* find(const char* key, bool required) {
        if (!ok()) return nullptr;
        if (!m_object.contains(key) || m_object[key].is_null()) {
            if (required) {
                fail(ConfigError::missing_field(field(key)));
            }
            return nullptr;
        }
        return &m_object[key];
    }

    const nlohmann::json& m_object;
    std::string m_path;
    std::optional<yardmap_core::Error> m_error;
};

yardmap_core::Result<std::string> read_file(const std::filesystem::path& path, const char* what) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return yardmap_core::Err<std::string>(
            yardmap_core::Error(yardmap_core::ErrorCode::NotFound,
                std::string(what) + " file not found: " + path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return yardmap_core::Err<std::string>(
            yardmap_core::Error(yardmap_core::ErrorCode::IOError,
                std::string("Failed to open ") + what + " file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return yardmap_core::Ok(buffer.str());
}

yardmap_core::Result<nlohmann::json> parse_document(const std::string& json_str,
                                                    const std::filesystem::path& source_path) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        yardmap_core::Error error(ConfigError::malformed(e.what()));
        error.with_context("source", source_path.string());
        return yardmap_core::Err<nlohmann::json>(std::move(error));
    }

    if (!j.is_object()) {
        yardmap_core::Error error(ConfigError::malformed("top level must be an object"));
        error.with_context("source", source_path.string());
        return yardmap_core::Err<nlohmann::json>(std::move(error));
    }

    return yardmap_core::Ok(std::move(j));
}

yardmap_core::Result<PhysicalStack> parse_stack(const nlohmann::json& j, const std::string& path) {
    if (!j.is_object()) {
        return yardmap_core::Err<PhysicalStack>(ConfigError::invalid_value(path, "expected an object"));
    }

    PhysicalStack stack;
    FieldReader reader(j, path);
    reader.read_positive("number", stack.number, true);
    reader.read_string("section_id", stack.section_id);
    reader.read_geometry("rows", stack.rows);
    reader.read_geometry("max_tiers", stack.max_tiers);
    reader.read_uint("declared_capacity", stack.declared_capacity);
    reader.read_enum("size_class", stack.size_class, parse_size_class, "20ft, 40ft");
    reader.read_bool("is_special", stack.is_special);
    reader.read_bool("is_active", stack.is_active);
    if (!reader.ok()) {
        return yardmap_core::Err<PhysicalStack>(reader.error());
    }

    if (j.contains("row_tier_overrides") && !j["row_tier_overrides"].is_null()) {
        const auto& overrides = j["row_tier_overrides"];
        if (!overrides.is_array()) {
            return yardmap_core::Err<PhysicalStack>(
                ConfigError::invalid_value(reader.field("row_tier_overrides"), "expected an array"));
        }
        for (std::size_t i = 0; i < overrides.size(); ++i) {
            std::string item_path = reader.field("row_tier_overrides") + "[" + std::to_string(i) + "]";
            if (!overrides[i].is_object()) {
                return yardmap_core::Err<PhysicalStack>(
                    ConfigError::invalid_value(item_path, "expected an object"));
            }
            RowTierLimit limit;
            FieldReader item(overrides[i], item_path);
            item.read_positive("row", limit.row, true);
            item.read_geometry("max_tiers", limit.max_tiers, true);
            if (!item.ok()) {
                return yardmap_core::Err<PhysicalStack>(item.error());
            }
            stack.row_tier_overrides.push_back(limit);
        }
    }

    if (j.contains("persisted_pairing") && !j["persisted_pairing"].is_null()) {
        const auto& pairing_json = j["persisted_pairing"];
        if (!pairing_json.is_object()) {
            return yardmap_core::Err<PhysicalStack>(
                ConfigError::invalid_value(reader.field("persisted_pairing"), "expected an object"));
        }
        PersistedPairing pairing;
        FieldReader item(pairing_json, reader.field("persisted_pairing"));
        item.read_positive("partner_number", pairing.partner_number, true);
        item.read_positive("virtual_number", pairing.virtual_number, true);
        if (!item.ok()) {
            return yardmap_core::Err<PhysicalStack>(item.error());
        }
        stack.persisted_pairing = pairing;
    }

    return yardmap_core::Ok(std::move(stack));
}

yardmap_core::Result<ContainerRecord> parse_container(const nlohmann::json& j, const std::string& path) {
    if (!j.is_object()) {
        return yardmap_core::Err<ContainerRecord>(ConfigError::invalid_value(path, "expected an object"));
    }

    ContainerRecord container;
    FieldReader reader(j, path);
    reader.read_string("id", container.id, true);
    reader.read_enum("size_class", container.size_class, parse_size_class, "20ft, 40ft");
    reader.read_enum("status", container.status, parse_container_status,
                     "in_depot, gate_in, gate_out, maintenance, cleaning");
    reader.read_bool("damaged", container.damaged);
    reader.read_string("location_code", container.location_code);
    if (!reader.ok()) {
        return yardmap_core::Err<ContainerRecord>(reader.error());
    }

    if (container.id.empty()) {
        return yardmap_core::Err<ContainerRecord>(
            ConfigError::invalid_value(reader.field("id"), "must not be empty"));
    }

    return yardmap_core::Ok(std::move(container));
}

/// Parse an array of records with `parse_item`
template<typename T, typename Parse>
yardmap_core::Result<std::vector<T>> parse_array(const nlohmann::json& j, const char* key, Parse parse_item) {
    std::vector<T> items;
    if (!j.contains(key) || j[key].is_null()) {
        return yardmap_core::Ok(std::move(items));
    }

    const auto& arr = j[key];
    if (!arr.is_array()) {
        return yardmap_core::Err<std::vector<T>>(ConfigError::invalid_value(key, "expected an array"));
    }

    items.reserve(arr.size());
    for (std::size_t i = 0; i < arr.size(); ++i) {
        auto item = parse_item(arr[i], std::string(key) + "[" + std::to_string(i) + "]");
        if (!item) {
            return yardmap_core::Err<std::vector<T>>(item.error());
        }
        items.push_back(std::move(*item));
    }

    return yardmap_core::Ok(std::move(items));
}

yardmap_core::Result<PairingBand> parse_band(const nlohmann::json& j, const std::string& path) {
    if (!j.is_object()) {
        return yardmap_core::Err<PairingBand>(ConfigError::invalid_value(path, "expected an object"));
    }

    PairingBand band;
    FieldReader reader(j, path);
    reader.read_positive("lower", band.lower, true);
    reader.read_positive("upper", band.upper, true);
    band.first_start = band.lower;
    reader.read_positive("first_start", band.first_start);
    reader.read_positive("stride", band.stride);
    if (!reader.ok()) {
        return yardmap_core::Err<PairingBand>(reader.error());
    }

    return yardmap_core::Ok(band);
}

yardmap_core::Result<std::uint32_t> parse_stack_number(const nlohmann::json& j, const std::string& path) {
    auto number = as_uint32(j);
    if (!number || *number == 0) {
        return yardmap_core::Err<std::uint32_t>(
            ConfigError::invalid_value(path, "expected a positive stack number"));
    }
    return yardmap_core::Ok(*number);
}

yardmap_core::Error with_source(yardmap_core::Error error, const std::filesystem::path& source_path) {
    error.with_context("source", source_path.string());
    return error;
}

} // anonymous namespace

// =============================================================================
// Snapshot
// =============================================================================

yardmap_core::Result<YardSnapshot> snapshot_from_json_string(
    const std::string& json_str,
    const std::filesystem::path& source_path) {

    auto document = parse_document(json_str, source_path);
    if (!document) {
        return yardmap_core::Err<YardSnapshot>(document.error());
    }
    const nlohmann::json& j = *document;

    YardSnapshot snapshot;

    auto stacks = parse_array<PhysicalStack>(j, "stacks", parse_stack);
    if (!stacks) {
        return yardmap_core::Err<YardSnapshot>(with_source(stacks.error(), source_path));
    }
    snapshot.stacks = std::move(*stacks);

    auto containers = parse_array<ContainerRecord>(j, "containers", parse_container);
    if (!containers) {
        return yardmap_core::Err<YardSnapshot>(with_source(containers.error(), source_path));
    }
    snapshot.containers = std::move(*containers);

    yardmap_core::topology_logger()->debug("Loaded snapshot from {}: {} stacks, {} containers",
        source_path.string(), snapshot.stacks.size(), snapshot.containers.size());

    return yardmap_core::Ok(std::move(snapshot));
}

yardmap_core::Result<YardSnapshot> load_snapshot(const std::filesystem::path& path) {
    return read_file(path, "Snapshot").and_then([&path](const std::string& contents) {
        return snapshot_from_json_string(contents, path);
    });
}

nlohmann::json snapshot_to_json(const YardSnapshot& snapshot) {
    nlohmann::json stacks = nlohmann::json::array();
    for (const auto& stack : snapshot.stacks) {
        nlohmann::json s;
        s["number"] = stack.number;
        s["section_id"] = stack.section_id;
        s["rows"] = stack.rows;
        s["max_tiers"] = stack.max_tiers;
        s["declared_capacity"] = stack.declared_capacity;
        s["size_class"] = size_class_name(stack.size_class);
        s["is_special"] = stack.is_special;
        s["is_active"] = stack.is_active;

        nlohmann::json overrides = nlohmann::json::array();
        for (const auto& limit : stack.row_tier_overrides) {
            overrides.push_back({{"row", limit.row}, {"max_tiers", limit.max_tiers}});
        }
        s["row_tier_overrides"] = std::move(overrides);

        if (stack.persisted_pairing) {
            s["persisted_pairing"] = {
                {"partner_number", stack.persisted_pairing->partner_number},
                {"virtual_number", stack.persisted_pairing->virtual_number},
            };
        } else {
            s["persisted_pairing"] = nullptr;
        }

        stacks.push_back(std::move(s));
    }

    nlohmann::json containers = nlohmann::json::array();
    for (const auto& container : snapshot.containers) {
        containers.push_back({
            {"id", container.id},
            {"size_class", size_class_name(container.size_class)},
            {"status", container_status_name(container.status)},
            {"damaged", container.damaged},
            {"location_code", container.location_code},
        });
    }

    return {{"stacks", std::move(stacks)}, {"containers", std::move(containers)}};
}

// =============================================================================
// Configuration
// =============================================================================

yardmap_core::Result<ResolverConfig> config_from_json_string(
    const std::string& json_str,
    const std::filesystem::path& source_path) {

    auto document = parse_document(json_str, source_path);
    if (!document) {
        return yardmap_core::Err<ResolverConfig>(document.error());
    }
    const nlohmann::json& j = *document;

    ResolverConfig config = ResolverConfig::reference_yard();

    if (j.contains("special_stacks") && !j["special_stacks"].is_null()) {
        auto numbers = parse_array<std::uint32_t>(j, "special_stacks", parse_stack_number);
        if (!numbers) {
            return yardmap_core::Err<ResolverConfig>(with_source(numbers.error(), source_path));
        }
        config.special_stacks = std::set<StackNumber>(numbers->begin(), numbers->end());
    }

    if (j.contains("pairing_bands") && !j["pairing_bands"].is_null()) {
        auto bands = parse_array<PairingBand>(j, "pairing_bands", parse_band);
        if (!bands) {
            return yardmap_core::Err<ResolverConfig>(with_source(bands.error(), source_path));
        }
        config.pairing_bands = std::move(*bands);
    }

    FieldReader reader(j, "config");
    reader.read_positive("default_rows", config.default_rows);
    reader.read_positive("default_max_tiers", config.default_max_tiers);
    reader.read_uint("location_stack_width", config.location_format.stack_width);
    if (!reader.ok()) {
        return yardmap_core::Err<ResolverConfig>(with_source(reader.error(), source_path));
    }

    if (j.contains("stack_size_overrides") && !j["stack_size_overrides"].is_null()) {
        const auto& overrides = j["stack_size_overrides"];
        if (!overrides.is_object()) {
            return yardmap_core::Err<ResolverConfig>(with_source(
                ConfigError::invalid_value("stack_size_overrides", "expected an object"), source_path));
        }

        config.stack_size_overrides.clear();
        for (const auto& [key, value] : overrides.items()) {
            std::string field = "stack_size_overrides." + key;

            StackNumber number = 0;
            auto [end, ec] = std::from_chars(key.data(), key.data() + key.size(), number);
            if (ec != std::errc() || end != key.data() + key.size() || number == 0) {
                return yardmap_core::Err<ResolverConfig>(with_source(
                    ConfigError::invalid_value(field, "key must be a positive stack number"), source_path));
            }

            std::optional<SizeClass> size;
            if (value.is_string()) {
                size = parse_size_class(value.get<std::string>());
            }
            if (!size) {
                return yardmap_core::Err<ResolverConfig>(with_source(
                    ConfigError::invalid_value(field, "expected \"20ft\" or \"40ft\""), source_path));
            }

            config.stack_size_overrides[number] = *size;
        }
    }

    auto valid = config.validate();
    if (!valid) {
        return yardmap_core::Err<ResolverConfig>(with_source(valid.error(), source_path));
    }

    yardmap_core::topology_logger()->debug("Loaded resolver config from {}: {} special stacks, {} pairing bands",
        source_path.string(), config.special_stacks.size(), config.pairing_bands.size());

    return yardmap_core::Ok(std::move(config));
}

yardmap_core::Result<ResolverConfig> load_config(const std::filesystem::path& path) {
    return read_file(path, "Config").and_then([&path](const std::string& contents) {
        return config_from_json_string(contents, path);
    });
}

// =============================================================================
// Resolution
// =============================================================================

nlohmann::json resolution_to_json(const Resolution& resolution, const yardmap_location::LocationFormat& format) {
    nlohmann::json units = nlohmann::json::array();
    for (const auto& unit : resolution.units) {
        nlohmann::json u;
        u["unit_number"] = unit.unit_number;
        u["kind"] = unit_kind_name(unit.kind);
        u["origin"] = unit.origin ? nlohmann::json(pair_origin_name(*unit.origin)) : nlohmann::json(nullptr);
        u["member_stacks"] = unit.member_stack_numbers;
        u["paired_into"] = unit.paired_into ? nlohmann::json(*unit.paired_into) : nlohmann::json(nullptr);
        u["section_id"] = unit.section_id;
        u["active"] = unit.active;
        u["capacity"] = unit.capacity;
        u["occupancy"] = unit.occupancy;
        u["free_slots"] = unit.free_slots();
        u["over_capacity"] = unit.over_capacity;

        nlohmann::json slots = nlohmann::json::array();
        for (const auto& slot : unit.slots) {
            slots.push_back({
                {"container_id", slot.container_id},
                {"location_code", yardmap_location::format_location_code(unit.unit_number, slot.row, slot.tier, format)},
                {"row", slot.row},
                {"tier", slot.tier},
                {"display_status", display_status_name(slot.display_status)},
            });
        }
        u["slots"] = std::move(slots);

        units.push_back(std::move(u));
    }

    nlohmann::json unlocated = nlohmann::json::array();
    for (const auto& container : resolution.unlocated) {
        unlocated.push_back({
            {"container_id", container.container_id},
            {"location_code", container.location_code},
            {"reason", diagnostic_kind_name(container.reason)},
            {"detail", container.detail},
        });
    }

    nlohmann::json diagnostics = nlohmann::json::array();
    for (const auto& diagnostic : resolution.diagnostics) {
        nlohmann::json d;
        d["severity"] = severity_name(diagnostic.severity);
        d["kind"] = diagnostic_kind_name(diagnostic.kind);
        d["message"] = diagnostic.message;
        if (diagnostic.stack_number) {
            d["stack_number"] = *diagnostic.stack_number;
        }
        if (diagnostic.container_id) {
            d["container_id"] = *diagnostic.container_id;
        }
        diagnostics.push_back(std::move(d));
    }

    const CapacitySummary& s = resolution.summary;
    nlohmann::json summary = {
        {"effective_capacity", s.effective_capacity},
        {"individual_capacity", s.individual_capacity},
        {"occupancy", s.occupancy},
        {"utilization", s.utilization()},
        {"physical_units", s.physical_units},
        {"virtual_units", s.virtual_units},
        {"paired_members", s.paired_members},
        {"over_capacity_units", s.over_capacity_units},
        {"unlocated_containers", s.unlocated_containers},
    };

    return {
        {"units", std::move(units)},
        {"unlocated", std::move(unlocated)},
        {"diagnostics", std::move(diagnostics)},
        {"summary", std::move(summary)},
    };
}

} // namespace yardmap_topology
