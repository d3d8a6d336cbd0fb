// yardmap_topology container classification tests

#include <catch2/catch_test_macros.hpp>
#include <yardmap/topology/classifier.hpp>
#include <yardmap/topology/config.hpp>

#include <string>
#include <vector>

using namespace yardmap_topology;

namespace {

PhysicalStack stack_of(StackNumber number, SizeClass size) {
    PhysicalStack stack;
    stack.number = number;
    stack.rows = 6;
    stack.max_tiers = 4;
    stack.size_class = size;
    return stack;
}

ContainerRecord container(const std::string& id, SizeClass size, const std::string& code) {
    ContainerRecord record;
    record.id = id;
    record.size_class = size;
    record.location_code = code;
    return record;
}

/// Stacks 3+5 paired (40ft), 7 standalone 20ft, 1 special 20ft
struct Fixture {
    StackTopology topology{ResolverConfig::reference_yard()};
    std::vector<PhysicalStack> stacks{
        stack_of(1, SizeClass::Feet20),
        stack_of(3, SizeClass::Feet40),
        stack_of(5, SizeClass::Feet40),
        stack_of(7, SizeClass::Feet20),
    };
    Diagnostics diagnostics;
    SynthesisResult synthesis = VirtualStackSynthesizer(topology).synthesize(stacks, diagnostics);
    ContainerClassifier classifier{topology, stacks, synthesis};
};

} // anonymous namespace

TEST_CASE("Display status priority", "[topology][classifier]") {
    ContainerRecord record = container("C1", SizeClass::Feet20, "S07-R1-H1");
    REQUIRE(display_status_of(record) == DisplayStatus::Occupied);

    record.status = ContainerStatus::Cleaning;
    REQUIRE(display_status_of(record) == DisplayStatus::Maintenance);

    record.status = ContainerStatus::Maintenance;
    REQUIRE(display_status_of(record) == DisplayStatus::Maintenance);

    record.damaged = true;
    REQUIRE(display_status_of(record) == DisplayStatus::Damaged);

    record.status = ContainerStatus::GateOut;
    REQUIRE(display_status_of(record) == DisplayStatus::Damaged);
}

TEST_CASE("Containers are attributed to one unit", "[topology][classifier]") {
    Fixture f;
    REQUIRE(f.synthesis.pairs.size() == 1);

    SECTION("20ft container on a standalone stack") {
        auto c = f.classifier.classify(container("C1", SizeClass::Feet20, "S07-R2-H3"), f.diagnostics);
        REQUIRE(c.located());
        REQUIRE(c.unit_number == 7u);
        REQUIRE_FALSE(c.virtual_unit);
        REQUIRE(c.location == yardmap_location::LocationCode{7, 2, 3});
        REQUIRE(f.diagnostics.empty());
    }

    SECTION("40ft container on a paired stack goes to the virtual unit") {
        auto a = f.classifier.classify(container("C2", SizeClass::Feet40, "S03-R1-H1"), f.diagnostics);
        auto b = f.classifier.classify(container("C3", SizeClass::Feet40, "s05r1t2"), f.diagnostics);
        REQUIRE(a.unit_number == 4u);
        REQUIRE(a.virtual_unit);
        REQUIRE(b.unit_number == 4u);
        REQUIRE(b.virtual_unit);
        REQUIRE(f.diagnostics.empty());
    }

    SECTION("20ft container on a paired stack keeps its physical stack") {
        auto c = f.classifier.classify(container("C4", SizeClass::Feet20, "S05-R1-H1"), f.diagnostics);
        REQUIRE(c.unit_number == 5u);
        REQUIRE_FALSE(c.virtual_unit);
        REQUIRE(f.diagnostics.count(DiagnosticKind::SizeMismatch) == 1);
    }

    SECTION("40ft container on a 20ft stack stays physical") {
        auto c = f.classifier.classify(container("C5", SizeClass::Feet40, "S07-R1-H1"), f.diagnostics);
        REQUIRE(c.unit_number == 7u);
        REQUIRE_FALSE(c.virtual_unit);
        REQUIRE(f.diagnostics.has(DiagnosticKind::SizeMismatch));
    }

    SECTION("special stack") {
        auto c = f.classifier.classify(container("C6", SizeClass::Feet20, "S01-R1-H1"), f.diagnostics);
        REQUIRE(c.unit_number == 1u);
        REQUIRE_FALSE(c.virtual_unit);
    }

    SECTION("code addressed to the virtual number") {
        auto c = f.classifier.classify(container("C7", SizeClass::Feet40, "S04-R1-H1"), f.diagnostics);
        REQUIRE(c.unit_number == 4u);
        REQUIRE(c.virtual_unit);
        REQUIRE(f.diagnostics.empty());
    }

    SECTION("20ft container addressed to the virtual number") {
        auto c = f.classifier.classify(container("C8", SizeClass::Feet20, "S04-R1-H1"), f.diagnostics);
        REQUIRE(c.unit_number == 4u);
        REQUIRE(f.diagnostics.has(DiagnosticKind::SizeMismatch));
    }
}

TEST_CASE("Unresolvable locations leave the container unlocated", "[topology][classifier]") {
    Fixture f;

    SECTION("malformed code") {
        auto c = f.classifier.classify(container("C1", SizeClass::Feet20, "S99-RX-H1"), f.diagnostics);
        REQUIRE_FALSE(c.located());
        REQUIRE_FALSE(c.location.has_value());
        REQUIRE(c.failure == DiagnosticKind::ParseError);
        REQUIRE_FALSE(c.failure_reason.empty());
        REQUIRE(f.diagnostics.count(DiagnosticKind::ParseError) == 1);
    }

    SECTION("empty code") {
        auto c = f.classifier.classify(container("C2", SizeClass::Feet20, ""), f.diagnostics);
        REQUIRE_FALSE(c.located());
        REQUIRE(c.failure == DiagnosticKind::ParseError);
    }

    SECTION("unknown stack") {
        auto c = f.classifier.classify(container("C3", SizeClass::Feet20, "S99-R1-H1"), f.diagnostics);
        REQUIRE_FALSE(c.located());
        REQUIRE(c.location.has_value());
        REQUIRE(c.failure == DiagnosticKind::UnknownStack);
        REQUIRE(f.diagnostics.has(DiagnosticKind::UnknownStack));
    }
}

TEST_CASE("Positions beyond the stack geometry are reported", "[topology][classifier]") {
    Fixture f;

    SECTION("row") {
        auto c = f.classifier.classify(container("C1", SizeClass::Feet20, "S07-R7-H1"), f.diagnostics);
        REQUIRE(c.unit_number == 7u);
        REQUIRE(f.diagnostics.count(DiagnosticKind::OutOfBounds) == 1);
    }

    SECTION("tier") {
        auto c = f.classifier.classify(container("C2", SizeClass::Feet40, "S03-R1-H5"), f.diagnostics);
        REQUIRE(c.unit_number == 4u);
        REQUIRE(f.diagnostics.count(DiagnosticKind::OutOfBounds) == 1);
    }

    SECTION("virtual address checks the lower member") {
        auto c = f.classifier.classify(container("C3", SizeClass::Feet40, "S04-R9-H1"), f.diagnostics);
        REQUIRE(c.located());
        REQUIRE(f.diagnostics.has(DiagnosticKind::OutOfBounds));
    }
}
