//
// File processor implementation
//

#include <litfix/io/file_processor.hh>
#include <litfix/errors.hh>

#include <algorithm>
#include <atomic>
#include <exception>
#include <fstream>
#include <mutex>
#include <sstream>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

namespace litfix::io {

const char* to_string(file_status status) {
    switch (status) {
        case file_status::skipped:   return "skipped";
        case file_status::unchanged: return "unchanged";
        case file_status::rewritten: return "rewritten";
        case file_status::failed:    return "failed";
    }
    return "unknown";
}

std::string read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw io_error(path, "Cannot open file");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    if (file.bad()) {
        throw io_error(path, "Failed to read file");
    }
    return buffer.str();
}

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        throw io_error(path, "Failed to open file for writing");
    }

    ofs << content;
    ofs.flush();

    if (!ofs) {
        throw io_error(path, "Failed to write file");
    }
}

namespace {
    void mark_failed(file_report& report, const char* code, const std::string& reason) {
        report.status = file_status::failed;
        report.failure = reason;

        diagnostic d;
        d.level = diagnostic_level::error;
        d.code = code;
        d.message = reason;
        d.file = report.path.string();
        report.diagnostics.push_back(std::move(d));
    }
}

file_processor::file_processor(const rewrite_engine& engine, backup_store& backups, process_options options)
    : engine_(engine)
    , backups_(backups)
    , options_(options)
{
}

file_report file_processor::process(const fs::path& path) const {
    file_report report;
    report.path = path;

    std::string original;
    try {
        original = read_file(path);
    } catch (const io_error& e) {
        mark_failed(report, diag_codes::E_IO_FAILURE, e.what());
        return report;
    }

    buffer_rewrite result;
    try {
        result = engine_.rewrite_text(original, path.string());
    } catch (const litfix_error& e) {
        mark_failed(report, diag_codes::E_MALFORMED_LITERAL, std::string("Rewrite failed: ") + e.what());
        return report;
    }

    report.rewrite_count = result.rewrite_count;
    report.inserted_helpers = std::move(result.inserted_helpers);
    report.diagnostics = std::move(result.diagnostics);

    if (!result.had_candidates) {
        report.status = file_status::skipped;
        return report;
    }
    if (!result.changed() || result.text == original) {
        report.status = file_status::unchanged;
        return report;
    }
    if (options_.dry_run) {
        report.status = file_status::rewritten;
        return report;
    }

    try {
        backups_.save(path, original);
    } catch (const backup_error& e) {
        mark_failed(report, diag_codes::E_BACKUP_FAILURE, e.what());
        return report;
    }

    try {
        write_file(path, result.text);
    } catch (const io_error& e) {
        mark_failed(report, diag_codes::E_IO_FAILURE, e.what());
        return report;
    }

    report.status = file_status::rewritten;
    return report;
}

run_result file_processor::run(const std::vector<fs::path>& paths, const progress_callback& on_file) const {
    std::vector<file_report> reports(paths.size());

    std::mutex mutex;
    std::atomic<std::size_t> next{0};
    std::exception_ptr first_error;

    // Workers pull the next unprocessed index; reports and the callback are
    // serialized by the mutex so progress lines never interleave
    auto worker = [&] {
        while (true) {
            const std::size_t i = next.fetch_add(1);
            if (i >= paths.size()) {
                return;
            }

            try {
                file_report report = process(paths[i]);

                std::lock_guard<std::mutex> lock(mutex);
                if (on_file) {
                    on_file(report);
                }
                reports[i] = std::move(report);
            } catch (...) {
                std::lock_guard<std::mutex> lock(mutex);
                if (!first_error) {
                    first_error = std::current_exception();
                }
                return;
            }
        }
    };

    const std::size_t count = std::min(std::max<std::size_t>(options_.workers, 1), paths.size());
    if (count <= 1) {
        worker();
    } else {
        std::vector<std::thread> threads;
        threads.reserve(count);
        for (std::size_t t = 0; t < count; ++t) {
            threads.emplace_back(worker);
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }

    run_result result;
    result.summary = summarize(reports);
    result.files = std::move(reports);
    return result;
}

run_summary summarize(const std::vector<file_report>& files) {
    run_summary summary;
    summary.files_scanned = files.size();

    for (const auto& report : files) {
        switch (report.status) {
            case file_status::skipped:   ++summary.files_skipped; break;
            case file_status::unchanged: ++summary.files_unchanged; break;
            case file_status::rewritten: ++summary.files_changed; break;
            case file_status::failed:    ++summary.files_failed; break;
        }
        if (report.status != file_status::failed) {
            summary.total_rewrites += report.rewrite_count;
        }
        summary.warnings += count_level(report.diagnostics, diagnostic_level::warning);
    }
    return summary;
}

} // namespace litfix::io
