//
// Backup collaborator: persists the original text of a file before the
// rewritten buffer replaces it
//

#pragma once

#include <filesystem>
#include <string>

namespace litfix::io {

class backup_store {
public:
    virtual ~backup_store() = default;

    /// Persist `original` as the recoverable copy of `path`.
    /// @throws backup_error if the copy cannot be written
    virtual void save(const std::filesystem::path& path, const std::string& original) = 0;
};

/// Writes `<path><suffix>` next to the file. An existing backup is kept, so
/// repeated runs never replace the oldest copy.
class suffix_backup_store : public backup_store {
public:
    explicit suffix_backup_store(std::string suffix = ".bak");

    void save(const std::filesystem::path& path, const std::string& original) override;

    [[nodiscard]] std::filesystem::path backup_path(const std::filesystem::path& path) const;

private:
    std::string suffix_;
};

} // namespace litfix::io
