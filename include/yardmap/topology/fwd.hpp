/// @file fwd.hpp
/// @brief Forward declarations for yardmap_topology module

#pragma once

#include <cstdint>

namespace yardmap_topology {

/// @brief Physical or virtual stack number (unique per yard)
using StackNumber = std::uint32_t;

// =============================================================================
// Forward Declarations - Records
// =============================================================================

struct PersistedPairing;
struct PhysicalStack;
struct ContainerRecord;
struct ContainerSlot;
struct LogicalStorageUnit;
struct YardSnapshot;

// =============================================================================
// Forward Declarations - Configuration & Diagnostics
// =============================================================================

struct PairingBand;
struct ResolverConfig;
struct Diagnostic;
class Diagnostics;

// =============================================================================
// Forward Declarations - Resolver
// =============================================================================

class StackTopology;
struct VirtualStackPair;
struct SynthesisResult;
class VirtualStackSynthesizer;
struct CapacitySummary;
struct Classification;
class ContainerClassifier;
struct UnlocatedContainer;
struct Resolution;
class YardResolver;

} // namespace yardmap_topology
