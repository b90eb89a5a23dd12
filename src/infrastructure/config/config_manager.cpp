// EN: Implementation of the ConfigManager class. YAML parsing, environment overrides and validation.
// FR: Implémentation de la classe ConfigManager. Parsing YAML, surcharges d'environnement et validation.

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <regex>
#include <set>
#include <sstream>

extern char** environ;

namespace SSD {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool splitKey(const std::string& full_key, std::string& section, std::string& key) {
    auto dot = full_key.find('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == full_key.size()) {
        return false;
    }
    section = full_key.substr(0, dot);
    key = full_key.substr(dot + 1);
    return true;
}

bool isSecretKey(const std::string& key) {
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
            std::ostringstream ss;
            ss << v;
            return ss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            std::string result = "[";
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) result += ", ";
                result += v[i];
            }
            return result + "]";
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

void ConfigSection::remove(const std::string& key) {
    values_.erase(key);
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

// EN: Load configuration from YAML file. Existing sections are replaced.
// FR: Charge la configuration depuis un fichier YAML. Les sections existantes sont remplacées.
bool ConfigManager::loadFromFile(const std::string& filename) {
    if (!std::filesystem::exists(filename)) {
        SSD_LOG_ERROR("config", "Configuration file not found: " + filename);
        return false;
    }

    try {
        YAML::Node root = YAML::LoadFile(filename);
        if (!loadNode(root)) {
            SSD_LOG_ERROR("config", "Configuration root must be a map: " + filename);
            return false;
        }
    } catch (const std::exception& e) {
        SSD_LOG_ERROR("config", "Failed to parse configuration " + filename + ": " + e.what());
        return false;
    }

    SSD_LOG_INFO("config", "Configuration loaded from " + filename);
    return true;
}

bool ConfigManager::loadFromString(const std::string& yaml_content) {
    try {
        if (!loadNode(YAML::Load(yaml_content))) {
            SSD_LOG_ERROR("config", "Configuration root must be a map");
            return false;
        }
    } catch (const std::exception& e) {
        SSD_LOG_ERROR("config", std::string("Failed to parse configuration: ") + e.what());
        return false;
    }

    SSD_LOG_DEBUG("config", "Configuration loaded from string");
    return true;
}

bool ConfigManager::loadNode(const YAML::Node& root) {
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
            SSD_LOG_WARN("config", "Ignoring non-map section: " + section_name);
        }
        loaded[section_name] = config_section;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    sections_ = std::move(loaded);
    return true;
}

// EN: SSD_STORAGE_SAS_TOKEN maps to storage.sas_token. Only known sections are considered.
// FR: SSD_STORAGE_SAS_TOKEN correspond à storage.sas_token. Seules les sections connues sont prises en compte.
size_t ConfigManager::loadEnvironmentOverrides(const std::string& prefix) {
    std::set<std::string> known_sections;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, _] : sections_) {
            known_sections.insert(name);
        }
        for (const auto& rule : validation_rules_) {
            std::string section, key;
            if (splitKey(rule.key, section, key)) {
                known_sections.insert(section);
            }
        }
    }

    size_t applied = 0;
    for (char** env = environ; env && *env; ++env) {
        const std::string entry(*env);
        if (entry.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        const auto eq = entry.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        const std::string name = toLower(entry.substr(prefix.size(), eq - prefix.size()));
        const auto underscore = name.find('_');
        if (underscore == std::string::npos || underscore == 0 || underscore + 1 == name.size()) {
            continue;
        }
        const std::string section = name.substr(0, underscore);
        if (known_sections.count(section) == 0) {
            continue;
        }
        if (applyOverride(section + "." + name.substr(underscore + 1) + "=" + entry.substr(eq + 1))) {
            ++applied;
        }
    }

    if (applied > 0) {
        SSD_LOG_INFO("config", "Applied " + std::to_string(applied) + " environment override(s)");
    }
    return applied;
}

bool ConfigManager::applyOverride(const std::string& assignment) {
    const auto eq = assignment.find('=');
    std::string section, key;
    if (eq == std::string::npos || !splitKey(assignment.substr(0, eq), section, key)) {
        SSD_LOG_ERROR("config", "Invalid override (expected section.key=value): " + assignment);
        return false;
    }

    const std::string raw = assignment.substr(eq + 1);
    ConfigValue value;
    if (raw.empty()) {
        value = ConfigValue(std::string());
    } else {
        try {
            value = parseYamlValue(YAML::Load(raw));
        } catch (const std::exception&) {
            // EN: Not valid YAML: keep the raw text.
            // FR: YAML invalide : on garde le texte brut.
            value = ConfigValue(expandVariables(raw));
        }
    }

    set(section, key, value);
    SSD_LOG_DEBUG("config", "Override " + section + "." + key +
                  (isSecretKey(key) ? std::string(" (hidden)") : " = " + value.toString()));
    return true;
}

void ConfigManager::addValidationRules(const std::vector<ValidationRule>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& rule : rules) {
        auto existing = std::find_if(validation_rules_.begin(), validation_rules_.end(),
                                     [&](const ValidationRule& r) { return r.key == rule.key; });
        if (existing != validation_rules_.end()) {
            *existing = rule;
        } else {
            validation_rules_.push_back(rule);
        }
    }
}

bool ConfigManager::validate(std::vector<std::string>& errors) const {
    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto& rule : validation_rules_) {
        std::string section, key;
        if (!splitKey(rule.key, section, key)) {
            errors.push_back("Invalid validation rule key: " + rule.key);
            continue;
        }

        ConfigValue value = getUnlocked(section, key);
        if (!value.isValid()) {
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
    return getUnlocked(section, key);
}

ConfigValue ConfigManager::getUnlocked(const std::string& section, const std::string& key) const {
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

void ConfigManager::remove(const std::string& section, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        section_it->second.remove(key);
    }
}

ConfigSection ConfigManager::getSection(const std::string& section) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto section_it = sections_.find(section);
    return section_it != sections_.end() ? section_it->second : ConfigSection();
}

std::vector<std::string> ConfigManager::getSectionNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, _] : sections_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.clear();
    validation_rules_.clear();
}

// EN: Human-readable dump; secrets are masked.
// FR: Dump lisible ; les secrets sont masqués.
std::string ConfigManager::dump() const {
    std::ostringstream out;
    for (const auto& section_name : getSectionNames()) {
        const ConfigSection section = getSection(section_name);
        out << "[" << section_name << "]\n";
        for (const auto& key : section.keys()) {
            const ConfigValue value = section.get(key);
            out << "  " << key << " = ";
            if (isSecretKey(key) && !value.asOrDefault<std::string>("").empty()) {
                out << "****";
            } else {
                out << value.toString();
            }
            out << "\n";
        }
    }
    return out.str();
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

    if (rule.min_value || rule.max_value) {
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
        const std::string text = value.toString();
        if (std::find(rule.allowed_values.begin(), rule.allowed_values.end(), text) ==
            rule.allowed_values.end()) {
            error = "Configuration " + key + " has invalid value: " + text;
            return false;
        }
    }

    return true;
}

// EN: Expand ${VAR} references from the environment. Unset variables expand to an empty string.
// FR: Développe les références ${VAR} depuis l'environnement. Les variables absentes deviennent vides.
std::string ConfigManager::expandVariables(const std::string& value) const {
    static const std::regex var_regex(R"(\$\{([^}]+)\})");

    std::string result;
    auto begin = std::sregex_iterator(value.begin(), value.end(), var_regex);
    auto end = std::sregex_iterator();
    size_t last = 0;
    for (auto it = begin; it != end; ++it) {
        const auto& match = *it;
        result += value.substr(last, static_cast<size_t>(match.position()) - last);
        const char* env_value = std::getenv(match[1].str().c_str());
        if (env_value) {
            result += env_value;
        }
        last = static_cast<size_t>(match.position() + match.length());
    }
    result += value.substr(last);
    return result;
}

// EN: Quoted scalars stay strings; plain scalars are tried as bool, int, double then string.
// FR: Les scalaires entre guillemets restent des chaînes ; les autres sont essayés en bool, int, double puis chaîne.
ConfigValue ConfigManager::parseYamlValue(const YAML::Node& node) const {
    if (node.IsSequence()) {
        std::vector<std::string> items;
        for (const auto& item : node) {
            items.push_back(expandVariables(item.as<std::string>()));
        }
        return ConfigValue(items);
    }

    if (node.IsNull()) {
        return ConfigValue(std::string());
    }

    if (node.IsScalar()) {
        const std::string scalar = node.Scalar();
        if (node.Tag() != "!") {
            bool bool_value;
            if (YAML::convert<bool>::decode(node, bool_value) &&
                (scalar == "true" || scalar == "false" || scalar == "True" ||
                 scalar == "False" || scalar == "TRUE" || scalar == "FALSE")) {
                return ConfigValue(bool_value);
            }
            int int_value;
            if (YAML::convert<int>::decode(node, int_value)) {
                return ConfigValue(int_value);
            }
            double double_value;
            if (YAML::convert<double>::decode(node, double_value)) {
                return ConfigValue(double_value);
            }
        }
        return ConfigValue(expandVariables(scalar));
    }

    throw std::runtime_error("Unsupported configuration value (nested maps are not allowed)");
}

} // namespace SSD
