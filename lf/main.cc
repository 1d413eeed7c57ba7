#include <iostream>
#include <string>

#include "driver.hh"
#include "driver_options.hh"
#include "logger.hh"

int main(int argc, char* argv[]) {
    using namespace litfix::driver;

    try {
        // Parse command-line options (handles --help and --version)
        DriverOptions opts = parse_command_line(argc, argv);

        LogLevel log_level = LogLevel::Normal;
        if (opts.quiet) log_level = LogLevel::Quiet;
        if (opts.verbose) log_level = LogLevel::Verbose;

        Logger logger(log_level, ColorMode::Auto);

        Driver driver(opts, logger);
        return driver.run();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Try '" << argv[0] << " --help' for usage." << std::endl;
        return 1;
    }
}
