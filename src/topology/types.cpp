/// @file types.cpp
/// @brief Enumeration names for yardmap_topology module

#include <yardmap/topology/types.hpp>

#include <algorithm>
#include <cctype>

namespace yardmap_topology {

namespace {

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // anonymous namespace

const char* size_class_name(SizeClass size) {
    switch (size) {
        case SizeClass::Feet20: return "20ft";
        case SizeClass::Feet40: return "40ft";
    }
    return "20ft";
}

std::optional<SizeClass> parse_size_class(std::string_view text) {
    std::string value = lowercase(text);
    if (value == "20ft" || value == "20") return SizeClass::Feet20;
    if (value == "40ft" || value == "40") return SizeClass::Feet40;
    return std::nullopt;
}

const char* container_status_name(ContainerStatus status) {
    switch (status) {
        case ContainerStatus::InDepot: return "in_depot";
        case ContainerStatus::GateIn: return "gate_in";
        case ContainerStatus::GateOut: return "gate_out";
        case ContainerStatus::Maintenance: return "maintenance";
        case ContainerStatus::Cleaning: return "cleaning";
    }
    return "in_depot";
}

std::optional<ContainerStatus> parse_container_status(std::string_view text) {
    std::string value = lowercase(text);
    if (value == "in_depot") return ContainerStatus::InDepot;
    if (value == "gate_in") return ContainerStatus::GateIn;
    if (value == "gate_out") return ContainerStatus::GateOut;
    if (value == "maintenance") return ContainerStatus::Maintenance;
    if (value == "cleaning") return ContainerStatus::Cleaning;
    return std::nullopt;
}

const char* display_status_name(DisplayStatus status) {
    switch (status) {
        case DisplayStatus::Occupied: return "occupied";
        case DisplayStatus::Maintenance: return "maintenance";
        case DisplayStatus::Damaged: return "damaged";
    }
    return "occupied";
}

const char* unit_kind_name(UnitKind kind) {
    switch (kind) {
        case UnitKind::Physical: return "physical";
        case UnitKind::PairedMember: return "paired_member";
        case UnitKind::Virtual: return "virtual";
    }
    return "physical";
}

const char* pair_origin_name(PairOrigin origin) {
    switch (origin) {
        case PairOrigin::Persisted: return "persisted";
        case PairOrigin::Synthesized: return "synthesized";
    }
    return "synthesized";
}

} // namespace yardmap_topology
