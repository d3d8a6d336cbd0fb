// yardmap_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <yardmap/core/log.hpp>

using namespace yardmap_core;

TEST_CASE("Log level parsing", "[core][log]") {
    SECTION("known names") {
        REQUIRE(parse_log_level("trace") == spdlog::level::trace);
        REQUIRE(parse_log_level("debug") == spdlog::level::debug);
        REQUIRE(parse_log_level("warning") == spdlog::level::warn);
        REQUIRE(parse_log_level("err") == spdlog::level::err);
        REQUIRE(parse_log_level("off") == spdlog::level::off);
    }

    SECTION("unknown name") {
        REQUIRE_FALSE(parse_log_level("verbose").has_value());
        REQUIRE_FALSE(parse_log_level("").has_value());
    }

    SECTION("aliases") {
        REQUIRE(parse_log_level("warn") == spdlog::level::warn);
        REQUIRE(parse_log_level("error") == spdlog::level::err);
        REQUIRE(parse_log_level("fatal") == spdlog::level::critical);
    }
}

TEST_CASE("Named loggers", "[core][log]") {
    SECTION("registry returns the same instance") {
        auto a = get_logger("yardmap_test");
        auto b = get_logger("yardmap_test");
        REQUIRE(a != nullptr);
        REQUIRE(a.get() == b.get());
        REQUIRE(a->name() == "yardmap_test");
    }

    SECTION("module loggers") {
        REQUIRE(core_logger()->name() == "yardmap_core");
        REQUIRE(location_logger()->name() == "location");
        REQUIRE(topology_logger()->name() == "topology");
    }
}

TEST_CASE("Logging configuration", "[core][log]") {
    LogConfig config;
    config.level = spdlog::level::trace;
    configure_logging(config);

    REQUIRE(topology_logger()->level() == spdlog::level::trace);
    REQUIRE(spdlog::default_logger()->name() == "yardmap_core");
    REQUIRE_NOTHROW(YARDMAP_LOG_WARN("warning through the default logger"));
    {
        YARDMAP_LOG_SCOPE("test scope", "topology");
        topology_logger()->debug("inside scope");
    }
    REQUIRE_NOTHROW(flush_all_loggers());

    config.level = spdlog::level::info;
    configure_logging(config);
    REQUIRE(topology_logger()->level() == spdlog::level::info);
}
