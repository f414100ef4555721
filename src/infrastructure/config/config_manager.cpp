// EN: Implementation of the ConfigManager class. Provides YAML configuration parsing and validation.
// FR: Implémentation de la classe ConfigManager. Fournit le parsing de configuration YAML et la validation.

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <regex>
#include <sstream>

#include <yaml-cpp/yaml.h>

namespace SHC {

namespace {

// EN: Environment variables honoured by loadEnvironmentOverrides, relative to the prefix.
// FR: Variables d'environnement prises en compte par loadEnvironmentOverrides, relatives au préfixe.
struct EnvOverride {
    const char* suffix;
    const char* section;
    const char* key;
};

constexpr EnvOverride ENV_OVERRIDES[] = {
    {"MASTER_SPREADSHEET_ID", "master", "spreadsheet_id"},
    {"DESTINATION_SPREADSHEET_ID", "destination", "spreadsheet_id"},
    {"LEDGER_PATH", "ledger", "path"},
    {"ACCESS_TOKEN", "sheets", "access_token"},
    {"LOG_LEVEL", "logging", "level"},
};

bool looksSecret(const std::string& key) {
    return key.find("token") != std::string::npos || key.find("secret") != std::string::npos;
}

} // namespace

std::string ConfigValue::toString() const {
    if (!value_) {
        return "<empty>";
    }

    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            std::string result = "[";
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) result += ", ";
                result += v[i];
            }
            result += "]";
            return result;
        }
    }, *value_);
}

void ConfigSection::set(const std::string& key, const ConfigValue& value) {
    values_[key] = value;
}

ConfigValue ConfigSection::get(const std::string& key) const {
    auto it = values_.find(key);
    return it != values_.end() ? it->second : ConfigValue();
}

bool ConfigSection::has(const std::string& key) const {
    return values_.find(key) != values_.end();
}

std::vector<std::string> ConfigSection::keys() const {
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& [key, _] : values_) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadFromFile(const std::string& filename) {
    if (!std::filesystem::exists(filename)) {
        LOG_ERROR("config", "Configuration file not found: " + filename);
        return false;
    }

    try {
        YAML::Node root = YAML::LoadFile(filename);
        if (!loadFromNode(root)) {
            LOG_ERROR("config", "Configuration root must be a mapping of sections: " + filename);
            return false;
        }
    } catch (const YAML::Exception& e) {
        LOG_ERROR("config", "Failed to load configuration: " + std::string(e.what()));
        return false;
    }

    LOG_INFO("config", "Configuration loaded from: " + filename);
    return true;
}

bool ConfigManager::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node root = YAML::Load(yaml_content);
        if (!loadFromNode(root)) {
            LOG_ERROR("config", "Configuration root must be a mapping of sections");
            return false;
        }
    } catch (const YAML::Exception& e) {
        LOG_ERROR("config", "Failed to load configuration from string: " + std::string(e.what()));
        return false;
    }

    LOG_DEBUG("config", "Configuration loaded from string");
    return true;
}

// EN: Convert a YAML document of the form { section: { key: value } } into sections.
// FR: Convertit un document YAML de la forme { section: { clé: valeur } } en sections.
bool ConfigManager::loadFromNode(const YAML::Node& root) {
    if (root.IsNull()) {
        std::lock_guard<std::mutex> lock(mutex_);
        sections_.clear();
        return true;
    }
    if (!root.IsMap()) {
        return false;
    }

    std::unordered_map<std::string, ConfigSection> loaded;
    for (const auto& section : root) {
        const std::string section_name = section.first.as<std::string>();
        ConfigSection config_section;

        if (section.second.IsMap()) {
            for (const auto& item : section.second) {
                config_section.set(item.first.as<std::string>(), parseYamlValue(item.second));
            }
        } else {
            config_section.set("value", parseYamlValue(section.second));
        }

        loaded[section_name] = config_section;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    sections_ = std::move(loaded);
    return true;
}

ConfigValue ConfigManager::parseYamlValue(const YAML::Node& node) {
    if (node.IsSequence()) {
        std::vector<std::string> array_value;
        for (const auto& item : node) {
            array_value.push_back(expandVariables(item.as<std::string>()));
        }
        return ConfigValue(array_value);
    }
    if (!node.IsScalar()) {
        return ConfigValue();
    }

    const std::string raw = node.as<std::string>();
    if (raw == "true" || raw == "false") {
        return ConfigValue(raw == "true");
    }

    // EN: Quoted scalars ("25") stay strings; plain scalars are tried as int then double.
    // FR: Les scalaires entre guillemets ("25") restent des chaînes ; les autres sont essayés en int puis double.
    if (node.Tag() != "!") {
        int int_value = 0;
        if (raw.find('.') == std::string::npos && YAML::convert<int>::decode(node, int_value)) {
            return ConfigValue(int_value);
        }
        double double_value = 0.0;
        if (YAML::convert<double>::decode(node, double_value)) {
            return ConfigValue(double_value);
        }
    }

    return ConfigValue(expandVariables(raw));
}

void ConfigManager::loadEnvironmentOverrides(const std::string& prefix) {
    for (const auto& override_entry : ENV_OVERRIDES) {
        const std::string variable = prefix + override_entry.suffix;
        const char* env_value = std::getenv(variable.c_str());
        if (!env_value || std::string(env_value).empty()) {
            continue;
        }

        set(override_entry.section, override_entry.key, ConfigValue(std::string(env_value)));
        LOG_INFO("config", "Environment override applied: " + std::string(override_entry.section) +
                 "." + override_entry.key + " (from " + variable + ")");
    }
}

void ConfigManager::addValidationRules(const std::vector<ValidationRule>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    validation_rules_.insert(validation_rules_.end(), rules.begin(), rules.end());
}

bool ConfigManager::validate(std::vector<std::string>& errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    errors.clear();

    for (const auto& rule : validation_rules_) {
        const size_t dot_pos = rule.key.find('.');
        const std::string section_name = (dot_pos != std::string::npos) ?
            rule.key.substr(0, dot_pos) : "default";
        const std::string key_name = (dot_pos != std::string::npos) ?
            rule.key.substr(dot_pos + 1) : rule.key;

        const ConfigValue value = lookup(section_name, key_name);
        const auto as_string = value.tryAs<std::string>();

        // EN: An empty string or an unexpanded ${VAR} counts as missing.
        // FR: Une chaîne vide ou un ${VAR} non étendu compte comme absent.
        const bool missing = !value.isValid() ||
            (as_string && (as_string->empty() || as_string->find("${") != std::string::npos));
        if (missing) {
            if (rule.required) {
                errors.push_back("Required configuration missing: " + rule.key);
            }
            continue;
        }

        std::string error;
        if (!validateValue(rule.key, value, rule, error)) {
            errors.push_back(error);
        }
    }

    return errors.empty();
}

ConfigValue ConfigManager::get(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup(section, key);
}

ConfigValue ConfigManager::lookup(const std::string& section, const std::string& key) const {
    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        return section_it->second.get(key);
    }
    return ConfigValue();
}

void ConfigManager::set(const std::string& section, const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section].set(key, value);
}

bool ConfigManager::has(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto section_it = sections_.find(section);
    return section_it != sections_.end() && section_it->second.has(key);
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.clear();
    validation_rules_.clear();
}

std::string ConfigManager::dump() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> names;
    for (const auto& [name, _] : sections_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());

    std::ostringstream oss;
    for (const auto& section_name : names) {
        const ConfigSection& section = sections_.at(section_name);
        oss << "[" << section_name << "]\n";
        for (const std::string& key : section.keys()) {
            oss << "  " << key << " = "
                << (looksSecret(key) ? std::string("***") : section.get(key).toString()) << "\n";
        }
    }
    return oss.str();
}

bool ConfigManager::validateValue(const std::string& key, const ConfigValue& value,
                                  const ValidationRule& rule, std::string& error) const {
    if (rule.type == "bool" && !value.tryAs<bool>()) {
        error = "Configuration " + key + " must be a boolean";
        return false;
    } else if (rule.type == "int" && !value.tryAs<int>()) {
        error = "Configuration " + key + " must be an integer";
        return false;
    } else if (rule.type == "double" && !value.tryAs<double>() && !value.tryAs<int>()) {
        error = "Configuration " + key + " must be a number";
        return false;
    } else if (rule.type == "string" && !value.tryAs<std::string>()) {
        error = "Configuration " + key + " must be a string";
        return false;
    } else if (rule.type == "array" && !value.tryAs<std::vector<std::string>>()) {
        error = "Configuration " + key + " must be an array";
        return false;
    }

    if ((rule.type == "int" || rule.type == "double") && (rule.min_value || rule.max_value)) {
        double numeric_value = 0.0;
        if (auto int_val = value.tryAs<int>()) {
            numeric_value = static_cast<double>(*int_val);
        } else if (auto double_val = value.tryAs<double>()) {
            numeric_value = *double_val;
        }

        if (rule.min_value && numeric_value < *rule.min_value) {
            error = "Configuration " + key + " must be >= " + ConfigValue(*rule.min_value).toString();
            return false;
        }
        if (rule.max_value && numeric_value > *rule.max_value) {
            error = "Configuration " + key + " must be <= " + ConfigValue(*rule.max_value).toString();
            return false;
        }
    }

    if (!rule.allowed_values.empty()) {
        const std::string str_value = value.toString();
        if (std::find(rule.allowed_values.begin(), rule.allowed_values.end(), str_value) ==
            rule.allowed_values.end()) {
            error = "Configuration " + key + " must be one of: ";
            for (size_t i = 0; i < rule.allowed_values.size(); ++i) {
                if (i > 0) error += ", ";
                error += rule.allowed_values[i];
            }
            return false;
        }
    }

    return true;
}

std::string ConfigManager::expandVariables(const std::string& value) {
    static const std::regex var_regex(R"(\$\{([^}]+)\})");

    std::string result;
    std::smatch match;
    std::string remaining = value;

    // EN: Unknown variables are left verbatim so validation can report them.
    // FR: Les variables inconnues sont laissées telles quelles pour que la validation les signale.
    while (std::regex_search(remaining, match, var_regex)) {
        result += match.prefix().str();
        const char* env_value = std::getenv(match[1].str().c_str());
        result += env_value ? std::string(env_value) : match[0].str();
        remaining = match.suffix().str();
    }
    result += remaining;
    return result;
}

} // namespace SHC
