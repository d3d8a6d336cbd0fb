/// @file synthesizer.cpp
/// @brief Virtual stack synthesis for yardmap_topology module

#include <yardmap/topology/synthesizer.hpp>
#include <yardmap/core/log.hpp>

#include <algorithm>
#include <set>
#include <string>
#include <tuple>
#include <utility>

namespace yardmap_topology {

// =============================================================================
// SynthesisResult
// =============================================================================

const VirtualStackPair* SynthesisResult::find_by_virtual(StackNumber virtual_number) const {
    auto it = std::find_if(pairs.begin(), pairs.end(),
        [virtual_number](const VirtualStackPair& p) { return p.virtual_number == virtual_number; });
    return it != pairs.end() ? &*it : nullptr;
}

const VirtualStackPair* SynthesisResult::find_by_member(StackNumber stack) const {
    auto it = member_to_virtual.find(stack);
    if (it == member_to_virtual.end()) {
        return nullptr;
    }
    return find_by_virtual(it->second);
}

// =============================================================================
// Helpers
// =============================================================================

namespace {

/// Distinct persisted record: (lower member, higher member, virtual number)
using PairingRecord = std::tuple<StackNumber, StackNumber, StackNumber>;

std::string pair_label(StackNumber a, StackNumber b) {
    return std::to_string(a) + "+" + std::to_string(b);
}

/// First occurrence of every stack number
std::map<StackNumber, const PhysicalStack*> index_stacks(const std::vector<PhysicalStack>& stacks) {
    std::map<StackNumber, const PhysicalStack*> index;
    for (const auto& stack : stacks) {
        index.emplace(stack.number, &stack);
    }
    return index;
}

/// Reduce persisted pairings to the virtual number each adjacent pair should reuse
std::map<std::pair<StackNumber, StackNumber>, StackNumber> collect_persisted(
    const std::map<StackNumber, const PhysicalStack*>& index,
    const StackTopology& topology,
    Diagnostics& diagnostics) {

    std::set<PairingRecord> records;
    for (const auto& [number, stack] : index) {
        if (!stack->persisted_pairing) continue;
        const auto& pp = *stack->persisted_pairing;
        records.emplace(std::min(number, pp.partner_number),
                        std::max(number, pp.partner_number),
                        pp.virtual_number);
    }

    // Stack referenced by more than one distinct record
    std::map<StackNumber, std::size_t> references;
    for (const auto& [a, b, v] : records) {
        ++references[a];
        ++references[b];
    }
    for (const auto& [number, count] : references) {
        if (count > 1) {
            diagnostics.warn(DiagnosticKind::DuplicatePairing,
                "Stack " + std::to_string(number) + " appears in " + std::to_string(count) +
                " persisted pairings; the lowest virtual number wins",
                number);
        }
    }

    std::map<std::pair<StackNumber, StackNumber>, StackNumber> result;
    for (const auto& [a, b, v] : records) {
        auto partner = topology.adjacent_of(a);
        if (a == b || !partner || *partner != b) {
            diagnostics.warn(DiagnosticKind::PairingMismatch,
                "Persisted pairing " + pair_label(a, b) + " (virtual " + std::to_string(v) +
                ") does not match stack adjacency and is ignored",
                a);
            continue;
        }
        // Records are ordered, so the first hit per pair has the lowest virtual number
        result.emplace(std::make_pair(a, b), v);
    }

    return result;
}

/// Reason a partner stack cannot join a pair, empty when it can
std::string partner_problem(const PhysicalStack* partner, const ResolverConfig& config) {
    if (partner == nullptr) return "does not exist";
    if (!partner->is_active) return "is inactive";
    if (config.is_special(*partner)) return "is special";
    if (config.effective_size(*partner) != SizeClass::Feet40) return "is not declared 40ft";
    return {};
}

} // anonymous namespace

// =============================================================================
// VirtualStackSynthesizer
// =============================================================================

VirtualStackSynthesizer::VirtualStackSynthesizer(const StackTopology& topology)
    : m_topology(topology) {}

SynthesisResult VirtualStackSynthesizer::synthesize(const std::vector<PhysicalStack>& stacks,
                                                    Diagnostics& diagnostics) const {
    const ResolverConfig& config = m_topology.config();
    SynthesisResult result;

    auto index = index_stacks(stacks);
    auto persisted = collect_persisted(index, m_topology, diagnostics);

    // Pass 1: pair eligible stacks in ascending order
    std::set<StackNumber> processed;
    std::vector<std::pair<StackNumber, StackNumber>> members;

    for (const auto& [number, stack] : index) {
        if (!stack->is_active || config.is_special(*stack) ||
            config.effective_size(*stack) != SizeClass::Feet40) {
            continue;
        }
        if (processed.count(number) > 0) {
            continue;
        }

        auto partner_number = m_topology.adjacent_of(number);
        if (!partner_number) {
            diagnostics.warn(DiagnosticKind::ConfigurationGap,
                "40ft stack " + std::to_string(number) + " has no adjacent partner; exposed unpaired",
                number);
            result.unpaired.push_back(number);
            processed.insert(number);
            continue;
        }

        auto it = index.find(*partner_number);
        const PhysicalStack* partner = it != index.end() ? it->second : nullptr;
        std::string problem = partner_problem(partner, config);
        if (!problem.empty()) {
            diagnostics.warn(DiagnosticKind::ConfigurationGap,
                "40ft stack " + std::to_string(number) + ": partner stack " +
                std::to_string(*partner_number) + " " + problem + "; exposed unpaired",
                number);
            result.unpaired.push_back(number);
            processed.insert(number);
            continue;
        }

        processed.insert(number);
        processed.insert(*partner_number);
        members.emplace_back(std::min(number, *partner_number), std::max(number, *partner_number));
    }

    // Pass 2: every pair reserves its synthesized number, so a persisted number
    // can never take the number another pair falls back to
    std::set<StackNumber> physical;
    for (const auto& [number, stack] : index) {
        physical.insert(number);
    }
    std::map<StackNumber, std::pair<StackNumber, StackNumber>> reserved;
    for (const auto& [a, b] : members) {
        reserved.emplace(StackTopology::virtual_number_for(a, b), std::make_pair(a, b));
    }

    std::set<StackNumber> assigned;
    for (const auto& [a, b] : members) {
        VirtualStackPair pair;
        pair.first = a;
        pair.second = b;
        pair.virtual_number = StackTopology::virtual_number_for(a, b);
        pair.origin = PairOrigin::Synthesized;

        auto pit = persisted.find({a, b});
        if (pit != persisted.end()) {
            StackNumber v = pit->second;
            auto owner = reserved.find(v);
            std::string problem;
            if (v == 0) {
                problem = "is not a valid stack number";
            } else if (physical.count(v) > 0) {
                problem = "is also a physical stack number";
            } else if (owner != reserved.end() && owner->second != std::make_pair(a, b)) {
                problem = "is reserved by pair " + pair_label(owner->second.first, owner->second.second);
            } else if (assigned.count(v) > 0) {
                problem = "is already in use";
            }

            if (problem.empty()) {
                pair.virtual_number = v;
                pair.origin = PairOrigin::Persisted;
            } else {
                diagnostics.warn(DiagnosticKind::VirtualNumberCollision,
                    "Persisted virtual number " + std::to_string(v) + " of pair " + pair_label(a, b) +
                    " " + problem + "; using " + std::to_string(pair.virtual_number),
                    a);
            }
        }

        if (pair.origin == PairOrigin::Synthesized && physical.count(pair.virtual_number) > 0) {
            diagnostics.warn(DiagnosticKind::VirtualNumberCollision,
                "Virtual number " + std::to_string(pair.virtual_number) + " of pair " + pair_label(a, b) +
                " is also a physical stack number",
                a);
        }
        assigned.insert(pair.virtual_number);

        result.member_to_virtual[a] = pair.virtual_number;
        result.member_to_virtual[b] = pair.virtual_number;
        result.pairs.push_back(pair);
    }

    std::sort(result.pairs.begin(), result.pairs.end(),
        [](const VirtualStackPair& x, const VirtualStackPair& y) {
            return x.virtual_number < y.virtual_number;
        });

    yardmap_core::topology_logger()->debug(
        "Synthesized {} virtual stacks from {} stacks ({} unpaired 40ft)",
        result.pairs.size(), index.size(), result.unpaired.size());

    return result;
}

} // namespace yardmap_topology
