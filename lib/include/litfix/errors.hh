//
// Exception types raised by litfix
//

#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>

namespace litfix {
    class litfix_error : public std::runtime_error {
        public:
            explicit litfix_error(const std::string& msg)
                : std::runtime_error(msg) {
            }
    };

    // Invalid rule configuration; key() names the offending entry,
    // e.g. "targets[0].rules[1].params[2]"
    class config_error : public litfix_error {
        public:
            config_error(const std::string& key, const std::string& msg)
                : litfix_error(build_message(key, msg)),
                  key_(key) {
            }

            [[nodiscard]] const std::string& key() const { return key_; }

        private:
            std::string key_;

            static std::string build_message(const std::string& key, const std::string& msg) {
                if (key.empty()) {
                    return msg;
                }
                return key + ": " + msg;
            }
    };

    class io_error : public litfix_error {
        public:
            io_error(const std::filesystem::path& path, const std::string& msg)
                : litfix_error(msg + ": " + path.string()),
                  path_(path) {
            }

            [[nodiscard]] const std::filesystem::path& path() const { return path_; }

        private:
            std::filesystem::path path_;
    };

    // The pre-rewrite copy could not be persisted; the file must not be written
    class backup_error : public io_error {
        public:
            backup_error(const std::filesystem::path& path, const std::string& msg)
                : io_error(path, msg) {
            }
    };
}
