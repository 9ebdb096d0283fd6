// mda-summary - print a one-screen summary of each MDA file given
//
// Usage: mda-summary [--config=FILE] [--set=key=value] [--skim] FILE...
//
// Settings come from the optional config file (see mdaio/settings.hpp),
// then from --set overrides, e.g. --set=reader.max_rank=1. Files that fail
// to decode are reported and counted; the exit status is 1 if any failed.

#include <cstdlib>
#include <exception>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "mdaio/mdaio.hpp"

using namespace mdaio;

// =============================================================================
// Command-Line Parsing
// =============================================================================

struct arguments_t {
    std::string config_file;
    std::vector<std::string> overrides;
    bool skim = false;
    std::vector<std::string> files;
};

auto parse_arguments(int argc, char** argv) -> arguments_t {
    auto args = arguments_t{};
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.substr(0, 9) == "--config=") {
            args.config_file = arg.substr(9);
        } else if (arg.substr(0, 6) == "--set=") {
            args.overrides.push_back(arg.substr(6));
        } else if (arg == "--skim") {
            args.skim = true;
        } else if (arg.substr(0, 2) == "--") {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        } else {
            args.files.push_back(arg);
        }
    }
    return args;
}

void apply_override(settings_t& settings, const std::string& assignment) {
    auto eq = assignment.find('=');
    if (eq == std::string::npos) {
        throw std::runtime_error("expected key=value, got '" + assignment + "'");
    }
    set(settings, assignment.substr(0, eq), assignment.substr(eq + 1));
}

// =============================================================================
// Output
// =============================================================================

auto join(const std::vector<std::int32_t>& v) -> std::string {
    auto oss = std::ostringstream{};
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (i > 0) oss << " x ";
        oss << v[i];
    }
    return oss.str();
}

void print_summary(const mda::file_t& file) {
    const auto& scan = file.scan;
    std::cout << file.filename << "\n";
    std::cout << "  version:     " << file.version << "\n";
    std::cout << "  scan number: " << file.scan_number << "\n";
    std::cout << "  rank:        " << file.rank << "\n";
    std::cout << "  dimensions:  " << join(file.dimensions) << "\n";
    std::cout << "  acquired:    " << join(mda::acquired_dimensions(file)) << "\n";
    std::cout << "  name:        " << scan.name << "\n";
    std::cout << "  time:        " << scan.time << "\n";

    for (const auto& p : scan.positioners) {
        std::cout << "  " << p.field_name << " " << p.name;
        if (!p.unit.empty()) std::cout << " (" << p.unit << ")";
        std::cout << "\n";
    }
    for (const auto& d : scan.detectors) {
        std::cout << "  " << d.field_name << " " << d.name;
        if (!d.unit.empty()) std::cout << " (" << d.unit << ")";
        std::cout << "\n";
    }
    std::cout << "  extra PVs:   " << file.extra_pvs.size() << "\n";
}

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char** argv) {
    auto args = parse_arguments(argc, argv);
    if (args.files.empty()) {
        std::cerr << "Usage: " << argv[0] << " [--config=FILE] [--set=key=value] [--skim] FILE...\n";
        return 1;
    }

    auto settings = settings_t{};
    auto log = logger_t{std::cerr, log_level::info, "mda-summary"};
    try {
        if (!args.config_file.empty()) {
            load_config_file(args.config_file, settings);
        }
        for (const auto& assignment : args.overrides) {
            apply_override(settings, assignment);
        }
        if (args.skim) {
            settings.reader.read_data = false;
        }
        configure_logger(log, settings);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    auto reader = mda::reader_t{log, settings.reader};
    auto failures = 0;

    for (const auto& path : args.files) {
        try {
            print_summary(reader.read_file(path));
        } catch (const std::exception& e) {
            log.error(path + ": " + e.what());
            ++failures;
        }
    }

    if (failures > 0) {
        log.error(std::to_string(failures) + " of " + std::to_string(args.files.size()) + " files failed");
        return 1;
    }
    return 0;
}
