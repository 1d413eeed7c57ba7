#include "driver.hh"
#include <litfix/errors.hh>
#include <litfix/io/backup.hh>
#include <litfix/io/file_walker.hh>
#include <litfix/rewrite_engine.hh>
#include <algorithm>
#include <utility>

namespace litfix::driver {

Driver::Driver(const DriverOptions& options, Logger& logger)
    : options_(options)
    , logger_(logger)
{
}

int Driver::run() {
    try {
        config::run_config cfg = load_config();

        io::walk_options walk;
        walk.extensions = cfg.extensions;
        walk.exclude_dirs = cfg.exclude_dirs;

        std::vector<std::filesystem::path> files = io::collect_files(options_.input_paths, walk);
        logger_.verbose("Found " + std::to_string(files.size()) + " candidate file(s)");

        rewrite_engine engine(std::move(cfg.rules));
        io::suffix_backup_store backups(cfg.backup_suffix);

        io::process_options process;
        process.dry_run = options_.dry_run;
        process.workers = options_.workers;

        io::file_processor processor(engine, backups, process);
        io::run_result result = processor.run(files, [this](const io::file_report& report) {
            report_file(report);
        });

        print_summary(result.summary);
        return result.summary.files_failed == 0 ? 0 : 1;

    } catch (const config_error& e) {
        logger_.error(std::string("Configuration error: ") + e.what());
        return 1;
    } catch (const io_error& e) {
        logger_.error(e.what());
        return 1;
    } catch (const std::exception& e) {
        logger_.error(std::string("Error: ") + e.what());
        return 1;
    }
}

config::run_config Driver::load_config() {
    logger_.verbose("Loading rules: " + options_.config_file.string());

    config::ConfigLoader loader;
    config::run_config cfg = loader.load_from_file(options_.config_file.string());

    if (!options_.extensions.empty()) {
        cfg.extensions = options_.extensions;
    }
    for (const auto& dir : options_.exclude_dirs) {
        if (std::find(cfg.exclude_dirs.begin(), cfg.exclude_dirs.end(), dir) == cfg.exclude_dirs.end()) {
            cfg.exclude_dirs.push_back(dir);
        }
    }
    if (options_.backup_suffix) {
        if (options_.backup_suffix->empty()) {
            throw config_error("--backup-suffix", "must not be empty");
        }
        cfg.backup_suffix = *options_.backup_suffix;
    }

    logger_.verbose("Loaded " + std::to_string(cfg.rules.targets.size()) + " target(s)");
    return cfg;
}

void Driver::report_file(const io::file_report& report) {
    const std::string path = report.path.string();

    switch (report.status) {
        case io::file_status::rewritten: {
            std::string line = path + ": " + std::to_string(report.rewrite_count) + " literal(s) rewritten";
            if (options_.dry_run) {
                line += " (dry run)";
            }
            logger_.success(line);
            for (const auto& helper : report.inserted_helpers) {
                logger_.bullet("declared " + helper, LogLevel::Verbose);
            }
            break;
        }
        case io::file_status::unchanged:
        case io::file_status::skipped:
            logger_.verbose(path + ": " + io::to_string(report.status));
            break;
        case io::file_status::failed:
            // the reason is carried by the file's error diagnostic
            break;
    }

    for (const auto& diag : report.diagnostics) {
        logger_.report(diag);
    }
}

void Driver::print_summary(const io::run_summary& summary) {
    logger_.heading(options_.dry_run ? "Summary (dry run):" : "Summary:");
    logger_.bullet("files scanned:   " + std::to_string(summary.files_scanned));
    logger_.bullet("files changed:   " + std::to_string(summary.files_changed));
    logger_.bullet("files unchanged: " + std::to_string(summary.files_unchanged));
    logger_.bullet("files skipped:   " + std::to_string(summary.files_skipped));
    logger_.bullet("files failed:    " + std::to_string(summary.files_failed));
    logger_.bullet("literals rewritten: " + std::to_string(summary.total_rewrites));

    if (summary.warnings > 0) {
        logger_.warning("Total warnings: " + std::to_string(summary.warnings));
    }
    if (summary.files_failed > 0) {
        logger_.error("Total failed files: " + std::to_string(summary.files_failed));
    }
}

}  // namespace litfix::driver
