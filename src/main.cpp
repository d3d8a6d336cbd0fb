/// @file main.cpp
/// @brief yardmap_resolve - resolve a yard snapshot into logical storage units

#include <yardmap/core/log.hpp>
#include <yardmap/topology/resolver.hpp>
#include <yardmap/topology/serialization.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

namespace {

constexpr int k_exit_ok = 0;
constexpr int k_exit_bad_input = 1;
constexpr int k_exit_usage = 2;

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS] SNAPSHOT.json\n"
              << "\n"
              << "Arguments:\n"
              << "  SNAPSHOT.json         Stacks and containers to resolve\n"
              << "\n"
              << "Options:\n"
              << "  --config FILE         Resolver configuration (default: reference yard)\n"
              << "  --log-level LEVEL     trace, debug, info, warn, error, critical, off\n"
              << "  --compact             Print the resolution on a single line\n"
              << "  --help, -h            Show this help message\n"
              << "  --version, -v         Show version information\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " yard.json\n"
              << "  " << program_name << " --config depot.json --log-level debug yard.json\n";
}

void print_version() {
    std::cout << "yardmap_resolve 0.1.0\n";
}

} // anonymous namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    fs::path snapshot_path;
    fs::path config_path;
    std::string log_level = "info";
    bool compact = false;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return k_exit_ok;
        } else if (arg == "--version" || arg == "-v") {
            print_version();
            return k_exit_ok;
        } else if (arg == "--config" || arg == "--log-level") {
            if (i + 1 >= argc) {
                std::cerr << "Option " << arg << " requires a value\n";
                print_usage(argv[0]);
                return k_exit_usage;
            }
            if (arg == "--config") {
                config_path = argv[++i];
            } else {
                log_level = argv[++i];
            }
        } else if (arg == "--compact") {
            compact = true;
        } else if (!arg.empty() && arg[0] != '-') {
            if (!snapshot_path.empty()) {
                std::cerr << "Only one snapshot may be given\n";
                print_usage(argv[0]);
                return k_exit_usage;
            }
            snapshot_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return k_exit_usage;
        }
    }

    if (snapshot_path.empty()) {
        std::cerr << "Error: No snapshot specified.\n\n";
        print_usage(argv[0]);
        return k_exit_usage;
    }

    auto level = yardmap_core::parse_log_level(log_level);
    if (!level) {
        std::cerr << "Unknown log level: " << log_level << "\n";
        return k_exit_usage;
    }

    yardmap_core::LogConfig log_config;
    log_config.level = *level;
    yardmap_core::configure_logging(log_config);

    yardmap_topology::ResolverConfig config = yardmap_topology::ResolverConfig::reference_yard();
    if (!config_path.empty()) {
        auto loaded = yardmap_topology::load_config(config_path);
        if (!loaded) {
            YARDMAP_LOG_ERROR("Failed to load config: {}", yardmap_core::build_error_chain(loaded.error()));
            yardmap_core::shutdown_logging();
            return k_exit_bad_input;
        }
        config = std::move(*loaded);
        YARDMAP_LOG_INFO("Using resolver config {}", config_path.string());
    }

    YARDMAP_LOG_DEBUG("Loading snapshot {}", snapshot_path.string());
    auto snapshot = yardmap_topology::load_snapshot(snapshot_path);
    if (!snapshot) {
        YARDMAP_LOG_ERROR("Failed to load snapshot: {}", yardmap_core::build_error_chain(snapshot.error()));
        yardmap_core::shutdown_logging();
        return k_exit_bad_input;
    }

    yardmap_topology::YardResolver resolver(std::move(config));
    yardmap_topology::Resolution resolution = resolver.resolve(*snapshot);

    const auto& summary = resolution.summary;
    YARDMAP_LOG_INFO("Resolved {} units: {} physical, {} virtual, {} paired members",
                     resolution.units.size(), summary.physical_units, summary.virtual_units,
                     summary.paired_members);
    YARDMAP_LOG_INFO("Capacity {} (individual {}), occupancy {}, {} unlocated, {} diagnostics",
                     summary.effective_capacity, summary.individual_capacity, summary.occupancy,
                     summary.unlocated_containers, resolution.diagnostics.size());
    if (summary.unlocated_containers > 0) {
        YARDMAP_LOG_WARN("{} containers have no resolvable location", summary.unlocated_containers);
    }

    nlohmann::json output = yardmap_topology::resolution_to_json(resolution, resolver.config().location_format);
    std::cout << (compact ? output.dump() : output.dump(2)) << "\n";

    yardmap_core::shutdown_logging();
    return k_exit_ok;
}
