//
// File processor: read, rewrite, back up and write source files
//

#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include <litfix/diagnostics.hh>
#include <litfix/io/backup.hh>
#include <litfix/rewrite_engine.hh>

namespace litfix::io {

enum class file_status {
    skipped,     // no candidate literal in the file
    unchanged,   // candidates found, nothing rewritten
    rewritten,   // backed up and written (or would be, in a dry run)
    failed       // read, backup or write failed; file left as it was
};

const char* to_string(file_status status);

struct file_report {
    std::filesystem::path path;
    file_status status = file_status::skipped;
    std::size_t rewrite_count = 0;
    std::vector<std::string> inserted_helpers;
    std::vector<diagnostic> diagnostics;
    std::string failure;   // reason when status == failed
};

struct run_summary {
    std::size_t files_scanned = 0;
    std::size_t files_changed = 0;
    std::size_t files_unchanged = 0;
    std::size_t files_skipped = 0;
    std::size_t files_failed = 0;
    std::size_t total_rewrites = 0;
    std::size_t warnings = 0;
};

struct run_result {
    std::vector<file_report> files;   // in input order
    run_summary summary;
};

struct process_options {
    bool dry_run = false;       // report what would change; never back up or write
    std::size_t workers = 1;    // 0 or 1 processes files on the calling thread
};

/// Read a whole file. @throws io_error
std::string read_file(const std::filesystem::path& path);

/// Replace the contents of a file in one write. @throws io_error
void write_file(const std::filesystem::path& path, const std::string& content);

/**
 * Runs the rewrite engine over files.
 *
 * Each file is rewritten completely in memory; only when the new buffer
 * differs is the original handed to the backup store and the new buffer
 * written in a single write. A failing backup aborts that file's write.
 * Failures never stop the run.
 */
class file_processor {
public:
    /// Called once per finished file; calls are serialized across workers.
    using progress_callback = std::function<void(const file_report&)>;

    file_processor(const rewrite_engine& engine, backup_store& backups, process_options options = {});

    [[nodiscard]] file_report process(const std::filesystem::path& path) const;

    [[nodiscard]] run_result run(const std::vector<std::filesystem::path>& paths,
                                 const progress_callback& on_file = {}) const;

private:
    const rewrite_engine& engine_;
    backup_store& backups_;
    process_options options_;
};

run_summary summarize(const std::vector<file_report>& files);

} // namespace litfix::io
