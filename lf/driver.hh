#pragma once

#include "driver_options.hh"
#include "logger.hh"
#include <litfix/config/config_loader.hh>
#include <litfix/io/file_processor.hh>

namespace litfix::driver {

/// Command-line driver: loads the rules, collects files and rewrites them
class Driver {
public:
    explicit Driver(const DriverOptions& options, Logger& logger);

    /// Returns 0 when no file failed, 1 otherwise
    int run();

private:
    /// Configuration file with command-line overrides applied
    config::run_config load_config();

    /// Progress callback: one line per file plus its diagnostics
    void report_file(const io::file_report& report);

    void print_summary(const io::run_summary& summary);

    const DriverOptions& options_;
    Logger& logger_;
};

}  // namespace litfix::driver
