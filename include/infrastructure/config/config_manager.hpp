// EN: YAML configuration store with typed values, environment expansion and validation rules.
// FR: Stockage de configuration YAML avec valeurs typées, expansion d'environnement et règles de validation.

#pragma once

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

// Forward declaration
namespace YAML { class Node; }

namespace SHC {

// EN: Type-safe configuration value wrapper supporting multiple data types.
// FR: Wrapper de valeur de configuration type-safe supportant plusieurs types de données.
class ConfigValue {
public:
    using ValueType = std::variant<bool, int, double, std::string, std::vector<std::string>>;

    ConfigValue() = default;

    template<typename T>
    ConfigValue(const T& value) : value_(ValueType(value)) {}

    ConfigValue(const char* value) : value_(ValueType(std::string(value))) {}

    // EN: Get value as specific type (throws if empty or type mismatch).
    // FR: Obtient la valeur comme type spécifique (lance exception si vide ou type incorrect).
    template<typename T>
    T as() const {
        if (!value_) {
            throw std::runtime_error("ConfigValue is empty");
        }
        const T* held = std::get_if<T>(&*value_);
        if (!held) {
            throw std::runtime_error("ConfigValue type mismatch");
        }
        return *held;
    }

    // EN: Try to get value as specific type (returns nullopt if empty or type mismatch).
    // FR: Tente d'obtenir la valeur comme type spécifique (retourne nullopt si vide ou type incorrect).
    template<typename T>
    std::optional<T> tryAs() const {
        if (!value_) {
            return std::nullopt;
        }
        const T* held = std::get_if<T>(&*value_);
        if (!held) {
            return std::nullopt;
        }
        return *held;
    }

    template<typename T>
    T asOrDefault(const T& default_value) const {
        auto result = tryAs<T>();
        return result ? *result : default_value;
    }

    bool isValid() const { return value_.has_value(); }

    // EN: Convert value to string representation.
    // FR: Convertit la valeur en représentation chaîne.
    std::string toString() const;

private:
    std::optional<ValueType> value_;
};

// EN: Configuration section containing key-value pairs.
// FR: Section de configuration contenant des paires clé-valeur.
class ConfigSection {
public:
    void set(const std::string& key, const ConfigValue& value);
    ConfigValue get(const std::string& key) const;
    bool has(const std::string& key) const;
    std::vector<std::string> keys() const;
    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

private:
    std::unordered_map<std::string, ConfigValue> values_;
};

// EN: Main configuration manager. Values are addressed as "section.key" in validation rules.
// FR: Gestionnaire de configuration principal. Les valeurs sont adressées "section.clé" dans les règles.
class ConfigManager {
public:
    // EN: Validation rule structure for configuration values.
    // FR: Structure de règle de validation pour les valeurs de configuration.
    struct ValidationRule {
        std::string key;
        std::string type; // "bool", "int", "double", "string", "array"
        bool required = false;
        std::optional<double> min_value;
        std::optional<double> max_value;
        std::vector<std::string> allowed_values;
        std::string description;
    };

    static ConfigManager& getInstance();

    // EN: Load configuration from YAML file (replaces current content).
    // FR: Charge la configuration depuis un fichier YAML (remplace le contenu courant).
    bool loadFromFile(const std::string& filename);

    // EN: Load configuration from YAML string (replaces current content).
    // FR: Charge la configuration depuis une chaîne YAML (remplace le contenu courant).
    bool loadFromString(const std::string& yaml_content);

    // EN: Apply SHC_* environment variable overrides on top of the loaded file.
    // FR: Applique les surcharges de variables d'environnement SHC_* au-dessus du fichier chargé.
    void loadEnvironmentOverrides(const std::string& prefix = "SHC_");

    void addValidationRules(const std::vector<ValidationRule>& rules);

    // EN: Validate current configuration against rules. Fills errors and returns false on failure.
    // FR: Valide la configuration actuelle contre les règles. Remplit errors et retourne false en cas d'échec.
    bool validate(std::vector<std::string>& errors) const;

    ConfigValue get(const std::string& section, const std::string& key) const;
    void set(const std::string& section, const std::string& key, const ConfigValue& value);
    bool has(const std::string& section, const std::string& key) const;

    // EN: Reset all configuration data and rules.
    // FR: Remet à zéro toutes les données de configuration et les règles.
    void reset();

    // EN: Dump current configuration as string for debugging. Keys named like secrets are masked.
    // FR: Vide la configuration en chaîne pour débogage. Les clés de type secret sont masquées.
    std::string dump() const;

private:
    ConfigManager() = default;
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    bool loadFromNode(const YAML::Node& root);
    ConfigValue lookup(const std::string& section, const std::string& key) const;

    bool validateValue(const std::string& key, const ConfigValue& value,
                       const ValidationRule& rule, std::string& error) const;

    // EN: Expand ${VAR} references in configuration strings.
    // FR: Étend les références ${VAR} dans les chaînes de configuration.
    static std::string expandVariables(const std::string& value);

    static ConfigValue parseYamlValue(const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConfigSection> sections_;
    std::vector<ValidationRule> validation_rules_;
};

} // namespace SHC
