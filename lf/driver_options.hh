#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace litfix::driver {

/// Driver configuration parsed from the command line
struct DriverOptions {
    // ========================================================================
    // Input
    // ========================================================================

    std::vector<std::filesystem::path> input_paths;  // files or directories
    std::filesystem::path config_file;               // -c, --config

    // ========================================================================
    // Overrides of the configuration file
    // ========================================================================

    std::vector<std::string> extensions;             // --ext (replaces configured list)
    std::vector<std::string> exclude_dirs;           // --exclude (added to configured list)
    std::optional<std::string> backup_suffix;        // --backup-suffix

    // ========================================================================
    // Processing
    // ========================================================================

    std::size_t workers = 1;                         // -j
    bool dry_run = false;                            // -n, --dry-run

    // ========================================================================
    // Diagnostic Options
    // ========================================================================

    bool verbose = false;                            // -v, --verbose
    bool quiet = false;                              // -q, --quiet
};

/// Parse command-line arguments
/// Throws std::runtime_error on invalid arguments
DriverOptions parse_command_line(int argc, char** argv);

/// Print help message
void print_help(const char* program_name);

/// Print version information
void print_version();

}  // namespace litfix::driver
