//
// File walker implementation
//

#include <litfix/io/file_walker.hh>
#include <litfix/errors.hh>

#include <algorithm>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace litfix::io {

namespace {
    bool has_listed_extension(const fs::path& path, const std::vector<std::string>& extensions) {
        if (extensions.empty()) {
            return true;
        }
        const std::string ext = path.extension().string();
        return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
    }

    bool is_minified(const fs::path& path) {
        return path.filename().string().find(".min.") != std::string::npos;
    }

    bool is_excluded_dir(const fs::path& path, const std::vector<std::string>& excluded) {
        const std::string name = path.filename().string();
        return std::find(excluded.begin(), excluded.end(), name) != excluded.end();
    }

    void walk_directory(const fs::path& root, const walk_options& options, std::set<fs::path>& found) {
        std::error_code ec;
        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            throw io_error(root, "Cannot read directory (" + ec.message() + ")");
        }

        const fs::recursive_directory_iterator end;
        while (it != end) {
            const fs::directory_entry& entry = *it;

            const bool is_dir = entry.is_directory(ec);
            if (ec) {
                throw io_error(entry.path(), "Cannot stat (" + ec.message() + ")");
            }

            if (is_dir) {
                if (is_excluded_dir(entry.path(), options.exclude_dirs)) {
                    it.disable_recursion_pending();
                }
            } else {
                const bool is_file = entry.is_regular_file(ec);
                if (ec) {
                    throw io_error(entry.path(), "Cannot stat (" + ec.message() + ")");
                }
                if (is_file && !is_minified(entry.path()) &&
                    has_listed_extension(entry.path(), options.extensions)) {
                    found.insert(entry.path());
                }
            }

            it.increment(ec);
            if (ec) {
                throw io_error(root, "Cannot read directory (" + ec.message() + ")");
            }
        }
    }
}

std::vector<fs::path> collect_files(const std::vector<fs::path>& roots, const walk_options& options) {
    std::set<fs::path> found;

    for (const auto& root : roots) {
        std::error_code ec;
        const fs::file_status status = fs::status(root, ec);
        if (ec || !fs::exists(status)) {
            throw io_error(root, "No such file or directory");
        }

        if (fs::is_regular_file(status)) {
            found.insert(root);
        } else if (fs::is_directory(status)) {
            walk_directory(root, options, found);
        } else {
            throw io_error(root, "Not a regular file or directory");
        }
    }

    return {found.begin(), found.end()};
}

} // namespace litfix::io
