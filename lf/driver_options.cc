#include "driver_options.hh"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace litfix::driver {

// ============================================================================
// Helper Functions
// ============================================================================

static bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

static std::string get_option_value(const char* arg, const char* prefix) {
    return arg + std::strlen(prefix);
}

// Accepts "-jN", "-j N", "--opt=value" and "--opt value"
static std::string take_value(int argc, char** argv, int& i, const char* prefix) {
    std::string value = get_option_value(argv[i], prefix);
    if (!value.empty() && value.front() == '=') {
        value.erase(0, 1);
    } else if (value.empty() && i + 1 < argc) {
        value = argv[++i];
    }
    if (value.empty()) {
        throw std::runtime_error(std::string("Option ") + prefix + " requires argument");
    }
    return value;
}

static std::size_t parse_worker_count(const std::string& value) {
    std::size_t consumed = 0;
    unsigned long count = 0;
    try {
        count = std::stoul(value, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid worker count: " + value);
    }
    if (consumed != value.size() || count == 0) {
        throw std::runtime_error("Invalid worker count: " + value);
    }
    return static_cast<std::size_t>(count);
}

// ============================================================================
// Main Parser
// ============================================================================

DriverOptions parse_command_line(int argc, char** argv) {
    DriverOptions opts;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        // Help options
        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_help(argv[0]);
            std::exit(0);
        }

        // Version
        if (std::strcmp(arg, "--version") == 0) {
            print_version();
            std::exit(0);
        }

        // Verbosity
        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            opts.verbose = true;
            continue;
        }

        if (std::strcmp(arg, "-q") == 0 || std::strcmp(arg, "--quiet") == 0) {
            opts.quiet = true;
            continue;
        }

        // Processing
        if (std::strcmp(arg, "-n") == 0 || std::strcmp(arg, "--dry-run") == 0) {
            opts.dry_run = true;
            continue;
        }

        if (starts_with(arg, "--config")) {
            opts.config_file = take_value(argc, argv, i, "--config");
            continue;
        }

        if (starts_with(arg, "-c")) {
            opts.config_file = take_value(argc, argv, i, "-c");
            continue;
        }

        if (starts_with(arg, "-j")) {
            opts.workers = parse_worker_count(take_value(argc, argv, i, "-j"));
            continue;
        }

        // File selection
        if (starts_with(arg, "--ext")) {
            std::string ext = take_value(argc, argv, i, "--ext");
            if (ext.front() != '.') {
                ext.insert(ext.begin(), '.');
            }
            opts.extensions.push_back(ext);
            continue;
        }

        if (starts_with(arg, "--exclude")) {
            opts.exclude_dirs.push_back(take_value(argc, argv, i, "--exclude"));
            continue;
        }

        if (starts_with(arg, "--backup-suffix")) {
            opts.backup_suffix = take_value(argc, argv, i, "--backup-suffix");
            continue;
        }

        // Unknown option starting with dash
        if (arg[0] == '-') {
            throw std::runtime_error(std::string("Unknown option: ") + arg);
        }

        // Input path
        opts.input_paths.push_back(arg);
    }

    // Validation
    if (opts.input_paths.empty()) {
        throw std::runtime_error("No input paths specified");
    }

    if (opts.config_file.empty()) {
        throw std::runtime_error("No rule configuration specified (use -c <file>)");
    }

    if (opts.quiet && opts.verbose) {
        throw std::runtime_error("Cannot specify both -q/--quiet and -v/--verbose");
    }

    return opts;
}

// ============================================================================
// Help and Info Functions
// ============================================================================

void print_help(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] -c <rules.yaml> <paths...>\n\n";

    std::cout << "Rewrites struct construction literals into helper calls plus field\n";
    std::cout << "assignments, following the rules in the configuration file.\n\n";

    std::cout << "Options:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  --version               Show version information\n";
    std::cout << "  -c, --config <file>     Rule configuration (YAML)\n";
    std::cout << "\n";

    std::cout << "Processing:\n";
    std::cout << "  -j <n>                  Number of worker threads (default: 1)\n";
    std::cout << "  -n, --dry-run           Report changes without backing up or writing\n";
    std::cout << "  --backup-suffix <s>     Suffix of backup copies (default: .bak)\n";
    std::cout << "\n";

    std::cout << "File selection:\n";
    std::cout << "  --ext <.x>              Only process files with this extension (repeatable)\n";
    std::cout << "  --exclude <dir>         Skip directories with this name (repeatable)\n";
    std::cout << "\n";

    std::cout << "Diagnostics:\n";
    std::cout << "  -v, --verbose           Verbose output\n";
    std::cout << "  -q, --quiet             Quiet mode (errors only)\n";
    std::cout << "\n";

    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " -c rules.yaml agent/storage\n";
    std::cout << "  " << program_name << " -n -j 4 -c rules.yaml --exclude testdata .\n";
}

void print_version() {
    std::cout << "litfix v0.1.0\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

}  // namespace litfix::driver
