//
// File walker collaborator: expands command-line paths into source files
//

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace litfix::io {

struct walk_options {
    std::vector<std::string> extensions{".go"};               // with leading dot
    std::vector<std::string> exclude_dirs{".git", "vendor", "node_modules"};
};

/**
 * Collect candidate files under `roots`.
 *
 * Directories are walked recursively, skipping directories named in
 * `exclude_dirs`, files whose name contains ".min." and files whose
 * extension is not listed. A root that names a file is taken as-is.
 * The result is sorted and free of duplicates.
 *
 * @throws io_error if a root does not exist or a directory cannot be read
 */
std::vector<std::filesystem::path> collect_files(const std::vector<std::filesystem::path>& roots,
                                                 const walk_options& options);

} // namespace litfix::io
