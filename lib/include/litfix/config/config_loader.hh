//
// Rule configuration loader
//

#pragma once

#include <string>
#include <vector>

#include <litfix/rewrite_rule.hh>

// fkYAML uses versioned namespaces, so we need to include the header
#include <fkYAML/node.hpp>

namespace litfix::config {

/// Everything a run reads from the configuration file.
struct run_config {
    rule_set rules;
    std::vector<std::string> extensions{".go"};
    std::vector<std::string> exclude_dirs{".git", "vendor", "node_modules"};
    std::string backup_suffix = ".bak";
};

/**
 * Builds a run_config from a YAML rule file.
 *
 * Example file:
 *
 *   max_passes: 8
 *   targets:
 *     - prefix: "&Device"
 *       receiver: device
 *       rules:
 *         - helper: newTestDevice
 *           params: [Serial, IP, {field: IsSaved, default: "false"}, {value: "true"}]
 *           declaration: |
 *             func newTestDevice(serial, ip string, isSaved, visible bool) *Device { ... }
 *         - params: []            # explode: &Device{} plus one assignment per field
 *
 * A parameter is either a bare field name (required), a mapping
 * {field, default} (optional field) or a mapping {value} (constant argument).
 *
 * Example usage:
 *   ConfigLoader loader;
 *   run_config cfg = loader.load_from_file("litfix.yaml");
 *   rewrite_engine engine(cfg.rules);
 */
class ConfigLoader {
public:
    ConfigLoader();
    ~ConfigLoader();

    /**
     * Load configuration from a YAML file.
     *
     * @throws io_error if the file cannot be opened
     * @throws config_error for malformed YAML or invalid settings
     */
    run_config load_from_file(const std::string& path);

    /// Load configuration from YAML text. @throws config_error
    run_config load_from_string(const std::string& yaml);

    /// Load configuration from an already parsed YAML document. @throws config_error
    run_config load_from_yaml(const fkyaml::node& root);

private:
    rewrite_target parse_target(const fkyaml::node& node, const std::string& key);
    rewrite_rule parse_rule(const fkyaml::node& node, const std::string& key);
    rule_param parse_param(const fkyaml::node& node, const std::string& key);

    std::vector<std::string> parse_string_list(const fkyaml::node& node, const std::string& key);
};

} // namespace litfix::config
