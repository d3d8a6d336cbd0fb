/// @file location_code.cpp
/// @brief Location code parser and formatter for yardmap_location

#include <yardmap/location/location_code.hpp>
#include <yardmap/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <iomanip>
#include <optional>

namespace yardmap_location {

namespace {

bool is_separator(char c) {
    return c == '-' || c == '_' || c == '.' || c == '/' ||
           std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

char upper(char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

/// Sequential reader over a trimmed location code
class CodeCursor {
public:
    explicit CodeCursor(std::string_view text) : m_text(text) {}

    [[nodiscard]] bool at_end() const { return m_pos >= m_text.size(); }

    void skip_separators() {
        while (!at_end() && is_separator(m_text[m_pos])) {
            ++m_pos;
        }
    }

    /// Consume one of the given marker letters (case-insensitive)
    bool consume_marker(std::string_view markers) {
        if (at_end()) return false;
        char c = upper(m_text[m_pos]);
        if (markers.find(c) == std::string_view::npos) return false;
        ++m_pos;
        return true;
    }

    /// Consume a run of digits; the value saturates just past k_max_coordinate
    bool consume_number(std::uint32_t& out) {
        std::size_t start = m_pos;
        std::uint64_t value = 0;
        while (!at_end() && is_digit(m_text[m_pos])) {
            value = value * 10 + static_cast<std::uint64_t>(m_text[m_pos] - '0');
            if (value > k_max_coordinate) {
                value = static_cast<std::uint64_t>(k_max_coordinate) + 1;
            }
            ++m_pos;
        }
        out = static_cast<std::uint32_t>(value);
        return m_pos > start;
    }

private:
    std::string_view m_text;
    std::size_t m_pos{0};
};

std::string_view trim(std::string_view text) {
    while (!text.empty() && is_separator(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_separator(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

yardmap_core::Result<LocationCode> fail(yardmap_core::LocationError err) {
    yardmap_core::location_logger()->trace("Rejected location code: {}", err.message);
    return yardmap_core::Err<LocationCode>(yardmap_core::Error(std::move(err)));
}

/// Range check for one coordinate
std::optional<yardmap_core::LocationError> check_coordinate(
    std::uint32_t value, const std::string& code, const char* field) {
    if (value == 0) {
        return yardmap_core::LocationError::non_positive(code, field);
    }
    if (value > k_max_coordinate) {
        return yardmap_core::LocationError::out_of_range(code, field);
    }
    return std::nullopt;
}

} // anonymous namespace

// =============================================================================
// Parsing
// =============================================================================

yardmap_core::Result<LocationCode> parse_location_code(std::string_view code) {
    using yardmap_core::LocationError;

    std::string_view body = trim(code);
    std::string input(code);

    if (body.empty()) {
        return fail(LocationError::empty());
    }

    CodeCursor cursor(body);
    LocationCode result;

    if (!cursor.consume_marker("S") || !cursor.consume_number(result.stack)) {
        return fail(LocationError::missing_stack(input));
    }

    cursor.skip_separators();
    if (!cursor.consume_marker("R") || !cursor.consume_number(result.row)) {
        return fail(LocationError::missing_row(input));
    }

    cursor.skip_separators();
    if (!cursor.consume_marker("HT") || !cursor.consume_number(result.tier)) {
        return fail(LocationError::missing_tier(input));
    }

    if (!cursor.at_end()) {
        return fail(LocationError::trailing_characters(input));
    }

    if (auto err = check_coordinate(result.stack, input, "stack")) {
        return fail(std::move(*err));
    }
    if (auto err = check_coordinate(result.row, input, "row")) {
        return fail(std::move(*err));
    }
    if (auto err = check_coordinate(result.tier, input, "tier")) {
        return fail(std::move(*err));
    }

    return yardmap_core::Ok(result);
}

bool is_valid_location_code(std::string_view code) {
    return parse_location_code(code).is_ok();
}

// =============================================================================
// Formatting
// =============================================================================

std::string format_location_code(std::uint32_t stack, std::uint32_t row, std::uint32_t tier,
                                 const LocationFormat& format) {
    std::ostringstream oss;
    std::uint32_t width = std::min(format.stack_width, k_max_stack_width);
    oss << 'S' << std::setw(static_cast<int>(width)) << std::setfill('0') << stack;
    if (format.separators) oss << '-';
    oss << 'R' << row;
    if (format.separators) oss << '-';
    oss << 'H' << tier;
    return oss.str();
}

std::vector<std::string> generate_stack_locations(
    std::uint32_t stack,
    std::uint32_t rows,
    std::uint32_t max_tiers,
    const std::vector<RowTierLimit>& overrides,
    const LocationFormat& format) {

    std::vector<std::string> locations;
    locations.reserve(static_cast<std::size_t>(rows) * max_tiers);

    for (std::uint32_t row = 1; row <= rows; ++row) {
        std::uint32_t tiers = max_tiers;
        auto it = std::find_if(overrides.begin(), overrides.end(),
            [row](const RowTierLimit& limit) { return limit.row == row; });
        if (it != overrides.end()) {
            tiers = it->max_tiers;
        }

        for (std::uint32_t tier = 1; tier <= tiers; ++tier) {
            locations.push_back(format_location_code(stack, row, tier, format));
        }
    }

    return locations;
}

} // namespace yardmap_location
