/// @file diagnostics.hpp
/// @brief Non-fatal findings collected during a resolver run

#pragma once

#include "fwd.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace yardmap_topology {

/// @brief How serious a finding is
enum class Severity : std::uint8_t {
    Info,
    Warning,
    Error,
};

/// @brief What was found
enum class DiagnosticKind : std::uint8_t {
    // Container could not be placed (container is unlocated)
    ParseError,
    UnknownStack,
    // Topology inconsistencies (deterministic tie-break applied)
    DuplicateStack,
    DuplicatePairing,
    PairingMismatch,
    VirtualNumberCollision,
    GeometryMismatch,
    // Configuration gap (stack exposed unpaired)
    ConfigurationGap,
    // Data quality (attribution unchanged)
    OverCapacity,
    OutOfBounds,
    SizeMismatch,
    PositionConflict,
};

[[nodiscard]] const char* severity_name(Severity severity);
[[nodiscard]] const char* diagnostic_kind_name(DiagnosticKind kind);

/// @brief One finding
struct Diagnostic {
    Severity severity{Severity::Warning};
    DiagnosticKind kind{DiagnosticKind::ParseError};
    std::string message;
    std::optional<StackNumber> stack_number;
    std::optional<std::string> container_id;
};

/// @brief Ordered collection of findings, returned with the resolution
class Diagnostics {
public:
    void add(Diagnostic diagnostic);

    void warn(DiagnosticKind kind, std::string message,
              std::optional<StackNumber> stack = std::nullopt,
              std::optional<std::string> container_id = std::nullopt);

    void error(DiagnosticKind kind, std::string message,
               std::optional<StackNumber> stack = std::nullopt,
               std::optional<std::string> container_id = std::nullopt);

    [[nodiscard]] const std::vector<Diagnostic>& entries() const noexcept { return m_entries; }
    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }

    [[nodiscard]] std::size_t count(DiagnosticKind kind) const;
    [[nodiscard]] bool has(DiagnosticKind kind) const { return count(kind) > 0; }
    [[nodiscard]] std::vector<Diagnostic> of_kind(DiagnosticKind kind) const;

    auto begin() const { return m_entries.begin(); }
    auto end() const { return m_entries.end(); }

private:
    std::vector<Diagnostic> m_entries;
};

} // namespace yardmap_topology
