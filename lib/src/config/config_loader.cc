#include <litfix/config/config_loader.hh>
#include <litfix/errors.hh>
#include <litfix/lexical.hh>

#include <cstdint>
#include <fstream>
#include <set>
#include <sstream>
#include <utility>

namespace litfix::config {

namespace {
    std::string key_at(const std::string& parent, const char* child) {
        return parent.empty() ? std::string(child) : parent + "." + child;
    }

    std::string index_at(const std::string& parent, std::size_t index) {
        return parent + "[" + std::to_string(index) + "]";
    }

    std::string require_string(const fkyaml::node& node, const std::string& key) {
        if (!node.is_string()) {
            throw config_error(key, "expected a string");
        }
        return node.get_value<std::string>();
    }

    // Argument text may be written as a YAML boolean or integer
    std::string scalar_text(const fkyaml::node& node, const std::string& key) {
        if (node.is_string()) {
            return node.get_value<std::string>();
        }
        if (node.is_boolean()) {
            return node.get_value<bool>() ? "true" : "false";
        }
        if (node.is_integer()) {
            return std::to_string(node.get_value<int64_t>());
        }
        throw config_error(key, "expected a string, boolean or integer");
    }

    std::string require_identifier(const fkyaml::node& node, const std::string& key) {
        std::string name = require_string(node, key);
        if (!lexical::is_identifier(name)) {
            throw config_error(key, "'" + name + "' is not an identifier");
        }
        return name;
    }
}

ConfigLoader::ConfigLoader() = default;

ConfigLoader::~ConfigLoader() = default;

run_config ConfigLoader::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw io_error(path, "Failed to open configuration");
    }

    fkyaml::node root;
    try {
        root = fkyaml::node::deserialize(file);
    } catch (const fkyaml::exception& e) {
        throw config_error(path, std::string("Failed to parse YAML: ") + e.what());
    }

    return load_from_yaml(root);
}

run_config ConfigLoader::load_from_string(const std::string& yaml) {
    std::istringstream stream(yaml);

    fkyaml::node root;
    try {
        root = fkyaml::node::deserialize(stream);
    } catch (const fkyaml::exception& e) {
        throw config_error("<string>", std::string("Failed to parse YAML: ") + e.what());
    }

    return load_from_yaml(root);
}

run_config ConfigLoader::load_from_yaml(const fkyaml::node& root) {
    if (!root.is_mapping()) {
        throw config_error("<root>", "configuration must be a mapping");
    }

    run_config cfg;

    if (root.contains("max_passes")) {
        const auto& node = root["max_passes"];
        if (!node.is_integer() || node.get_value<int64_t>() < 1) {
            throw config_error("max_passes", "must be a positive integer");
        }
        cfg.rules.max_passes = static_cast<std::size_t>(node.get_value<int64_t>());
    }

    if (root.contains("extensions")) {
        cfg.extensions = parse_string_list(root["extensions"], "extensions");
    }

    if (root.contains("exclude_dirs")) {
        cfg.exclude_dirs = parse_string_list(root["exclude_dirs"], "exclude_dirs");
    }

    if (root.contains("backup_suffix")) {
        cfg.backup_suffix = require_string(root["backup_suffix"], "backup_suffix");
        if (cfg.backup_suffix.empty()) {
            throw config_error("backup_suffix", "must not be empty");
        }
    }

    if (!root.contains("targets")) {
        throw config_error("targets", "missing");
    }
    const auto& targets = root["targets"];
    if (!targets.is_sequence()) {
        throw config_error("targets", "must be a sequence");
    }

    for (size_t i = 0; i < targets.size(); ++i) {
        cfg.rules.targets.push_back(parse_target(targets[i], index_at("targets", i)));
    }

    return cfg;
}

rewrite_target ConfigLoader::parse_target(const fkyaml::node& node, const std::string& key) {
    if (!node.is_mapping()) {
        throw config_error(key, "must be a mapping");
    }

    rewrite_target target;

    const std::string prefix_key = key_at(key, "prefix");
    if (!node.contains("prefix")) {
        throw config_error(prefix_key, "missing");
    }
    target.prefix = require_string(node["prefix"], prefix_key);
    if (target.prefix.empty()) {
        throw config_error(prefix_key, "must not be empty");
    }
    if (!lexical::is_ident_char(target.prefix.back())) {
        throw config_error(prefix_key, "must end with an identifier character");
    }

    if (node.contains("receiver")) {
        target.receiver = require_identifier(node["receiver"], key_at(key, "receiver"));
    }

    const std::string rules_key = key_at(key, "rules");
    if (!node.contains("rules")) {
        throw config_error(rules_key, "missing");
    }
    const auto& rules = node["rules"];
    if (!rules.is_sequence()) {
        throw config_error(rules_key, "must be a sequence");
    }

    for (size_t i = 0; i < rules.size(); ++i) {
        target.rules.push_back(parse_rule(rules[i], index_at(rules_key, i)));
    }

    return target;
}

rewrite_rule ConfigLoader::parse_rule(const fkyaml::node& node, const std::string& key) {
    if (!node.is_mapping()) {
        throw config_error(key, "must be a mapping");
    }

    rewrite_rule rule;

    if (node.contains("helper")) {
        const std::string helper_key = key_at(key, "helper");
        rule.helper = require_string(node["helper"], helper_key);
        if (!rule.helper.empty() && !lexical::is_identifier(rule.helper)) {
            throw config_error(helper_key, "'" + rule.helper + "' is not an identifier");
        }
    }

    const std::string params_key = key_at(key, "params");
    if (node.contains("params")) {
        const auto& params = node["params"];
        if (!params.is_sequence()) {
            throw config_error(params_key, "must be a sequence");
        }

        std::set<std::string> seen;
        for (size_t i = 0; i < params.size(); ++i) {
            const std::string param_key = index_at(params_key, i);
            rule_param param = parse_param(params[i], param_key);
            if (!param.is_constant() && !seen.insert(param.field).second) {
                throw config_error(param_key, "duplicate field '" + param.field + "'");
            }
            rule.params.push_back(std::move(param));
        }
    }

    if (rule.is_explode() && !rule.params.empty()) {
        throw config_error(params_key, "a rule without helper cannot take parameters");
    }

    if (node.contains("declaration")) {
        const std::string decl_key = key_at(key, "declaration");
        if (rule.is_explode()) {
            throw config_error(decl_key, "a rule without helper has nothing to declare");
        }
        rule.declaration = require_string(node["declaration"], decl_key);
    }

    if (node.contains("marker")) {
        rule.marker = require_string(node["marker"], key_at(key, "marker"));
    }

    return rule;
}

rule_param ConfigLoader::parse_param(const fkyaml::node& node, const std::string& key) {
    if (node.is_string()) {
        return rule_param::required(require_identifier(node, key));
    }

    if (!node.is_mapping()) {
        throw config_error(key, "expected a field name or a mapping");
    }

    const bool has_field = node.contains("field");
    const bool has_value = node.contains("value");

    if (has_field && has_value) {
        throw config_error(key, "'field' and 'value' are mutually exclusive");
    }

    if (has_value) {
        std::string text = scalar_text(node["value"], key_at(key, "value"));
        if (text.empty()) {
            throw config_error(key_at(key, "value"), "must not be empty");
        }
        return rule_param::constant(std::move(text));
    }

    if (!has_field) {
        throw config_error(key, "expected 'field' or 'value'");
    }

    std::string field = require_identifier(node["field"], key_at(key, "field"));
    if (node.contains("default")) {
        std::string text = scalar_text(node["default"], key_at(key, "default"));
        if (text.empty()) {
            throw config_error(key_at(key, "default"), "must not be empty");
        }
        return rule_param::optional(std::move(field), std::move(text));
    }
    return rule_param::required(std::move(field));
}

std::vector<std::string> ConfigLoader::parse_string_list(const fkyaml::node& node, const std::string& key) {
    if (!node.is_sequence()) {
        throw config_error(key, "must be a sequence");
    }

    std::vector<std::string> result;
    for (size_t i = 0; i < node.size(); ++i) {
        result.push_back(require_string(node[i], index_at(key, i)));
    }
    return result;
}

} // namespace litfix::config
