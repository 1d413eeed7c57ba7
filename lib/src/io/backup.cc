//
// Suffix backup store
//

#include <litfix/io/backup.hh>
#include <litfix/errors.hh>

#include <fstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace litfix::io {

suffix_backup_store::suffix_backup_store(std::string suffix)
    : suffix_(std::move(suffix))
{
    if (suffix_.empty()) {
        throw litfix_error("Backup suffix must not be empty");
    }
}

fs::path suffix_backup_store::backup_path(const fs::path& path) const {
    fs::path result = path;
    result += suffix_;
    return result;
}

void suffix_backup_store::save(const fs::path& path, const std::string& original) {
    const fs::path target = backup_path(path);

    std::error_code ec;
    const bool exists = fs::exists(target, ec);
    if (ec) {
        throw backup_error(target, "Cannot inspect backup location (" + ec.message() + ")");
    }
    if (exists) {
        return;
    }

    std::ofstream ofs(target, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        throw backup_error(target, "Failed to open backup for writing");
    }

    ofs << original;
    ofs.flush();

    if (!ofs) {
        throw backup_error(target, "Failed to write backup");
    }
}

} // namespace litfix::io
