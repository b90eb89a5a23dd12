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

namespace SSD {

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
        if (const T* v = std::get_if<T>(&*value_)) {
            return *v;
        }
        throw std::runtime_error("ConfigValue type mismatch");
    }

    // EN: Try to get value as specific type (returns nullopt if type mismatch).
    // FR: Tente d'obtenir la valeur comme type spécifique (retourne nullopt si type incorrect).
    template<typename T>
    std::optional<T> tryAs() const {
        if (!value_) {
            return std::nullopt;
        }
        if (const T* v = std::get_if<T>(&*value_)) {
            return *v;
        }
        return std::nullopt;
    }

    template<typename T>
    T asOrDefault(const T& default_value) const {
        auto result = tryAs<T>();
        return result ? *result : default_value;
    }

    bool isValid() const { return value_.has_value(); }

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
    void remove(const std::string& key);
    std::vector<std::string> keys() const;
    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

private:
    std::unordered_map<std::string, ConfigValue> values_;
};

// EN: Deployment configuration manager: YAML parsing, environment overrides and validation.
// FR: Gestionnaire de configuration du déploiement : parsing YAML, surcharges d'environnement et validation.
class ConfigManager {
public:
    // EN: Validation rule for one "section.key" entry.
    // FR: Règle de validation pour une entrée "section.key".
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

    // EN: Load configuration from a YAML file. Returns false (and logs) on I/O or parse errors.
    // FR: Charge la configuration depuis un fichier YAML. Retourne false (et journalise) en cas d'erreur.
    bool loadFromFile(const std::string& filename);
    bool loadFromString(const std::string& yaml_content);

    // EN: Apply SECTION_KEY overrides from the environment, e.g. SSD_STORAGE_SAS_TOKEN -> storage.sas_token.
    // FR: Applique les surcharges SECTION_KEY de l'environnement, ex. SSD_STORAGE_SAS_TOKEN -> storage.sas_token.
    size_t loadEnvironmentOverrides(const std::string& prefix = "SSD_");

    // EN: Apply a "section.key=value" override (CLI --set). The value is typed like a YAML scalar.
    // FR: Applique une surcharge "section.key=value" (CLI --set). La valeur est typée comme un scalaire YAML.
    bool applyOverride(const std::string& assignment);

    void addValidationRules(const std::vector<ValidationRule>& rules);
    bool validate(std::vector<std::string>& errors) const;

    ConfigValue get(const std::string& section, const std::string& key) const;
    void set(const std::string& section, const std::string& key, const ConfigValue& value);
    bool has(const std::string& section, const std::string& key) const;
    void remove(const std::string& section, const std::string& key);

    ConfigSection getSection(const std::string& section) const;
    std::vector<std::string> getSectionNames() const;

    // EN: Reset all configuration data and validation rules.
    // FR: Remet à zéro toutes les données de configuration et les règles de validation.
    void reset();

    std::string dump() const;

private:
    ConfigManager() = default;
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    bool loadNode(const YAML::Node& root);
    ConfigValue getUnlocked(const std::string& section, const std::string& key) const;
    bool validateValue(const std::string& key, const ConfigValue& value,
                       const ValidationRule& rule, std::string& error) const;
    std::string expandVariables(const std::string& value) const;
    ConfigValue parseYamlValue(const YAML::Node& node) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConfigSection> sections_;
    std::vector<ValidationRule> validation_rules_;
};

#define SSD_CONFIG_GET(section, key) SSD::ConfigManager::getInstance().get(section, key)
#define SSD_CONFIG_SET(section, key, value) SSD::ConfigManager::getInstance().set(section, key, SSD::ConfigValue(value))

} // namespace SSD
