/// @file diagnostics.cpp
/// @brief Diagnostic collection for yardmap_topology module

#include <yardmap/topology/diagnostics.hpp>
#include <yardmap/core/log.hpp>

#include <algorithm>
#include <iterator>

namespace yardmap_topology {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info: return "info";
        case Severity::Warning: return "warning";
        case Severity::Error: return "error";
    }
    return "warning";
}

const char* diagnostic_kind_name(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::ParseError: return "parse_error";
        case DiagnosticKind::UnknownStack: return "unknown_stack";
        case DiagnosticKind::DuplicateStack: return "duplicate_stack";
        case DiagnosticKind::DuplicatePairing: return "duplicate_pairing";
        case DiagnosticKind::PairingMismatch: return "pairing_mismatch";
        case DiagnosticKind::VirtualNumberCollision: return "virtual_number_collision";
        case DiagnosticKind::GeometryMismatch: return "geometry_mismatch";
        case DiagnosticKind::ConfigurationGap: return "configuration_gap";
        case DiagnosticKind::OverCapacity: return "over_capacity";
        case DiagnosticKind::OutOfBounds: return "out_of_bounds";
        case DiagnosticKind::SizeMismatch: return "size_mismatch";
        case DiagnosticKind::PositionConflict: return "position_conflict";
    }
    return "unknown";
}

void Diagnostics::add(Diagnostic diagnostic) {
    auto logger = yardmap_core::topology_logger();
    auto level = diagnostic.severity == Severity::Error ? spdlog::level::err
               : diagnostic.severity == Severity::Warning ? spdlog::level::warn
               : spdlog::level::info;
    logger->log(level, "[{}] {}", diagnostic_kind_name(diagnostic.kind), diagnostic.message);

    m_entries.push_back(std::move(diagnostic));
}

void Diagnostics::warn(DiagnosticKind kind, std::string message,
                       std::optional<StackNumber> stack,
                       std::optional<std::string> container_id) {
    add(Diagnostic{Severity::Warning, kind, std::move(message), stack, std::move(container_id)});
}

void Diagnostics::error(DiagnosticKind kind, std::string message,
                        std::optional<StackNumber> stack,
                        std::optional<std::string> container_id) {
    add(Diagnostic{Severity::Error, kind, std::move(message), stack, std::move(container_id)});
}

std::size_t Diagnostics::count(DiagnosticKind kind) const {
    return static_cast<std::size_t>(std::count_if(m_entries.begin(), m_entries.end(),
        [kind](const Diagnostic& d) { return d.kind == kind; }));
}

std::vector<Diagnostic> Diagnostics::of_kind(DiagnosticKind kind) const {
    std::vector<Diagnostic> result;
    std::copy_if(m_entries.begin(), m_entries.end(), std::back_inserter(result),
        [kind](const Diagnostic& d) { return d.kind == kind; });
    return result;
}

} // namespace yardmap_topology
