// EN: Mapping from ConfigManager sections to DeploymentSettings.
// FR: Correspondance entre les sections du ConfigManager et DeploymentSettings.

#include "orchestrator/deployment_settings.hpp"

#include <sstream>
#include <stdexcept>

namespace SSD {
namespace Orchestrator {

namespace {

std::string readString(const ConfigManager& config, const std::string& section, const std::string& key,
                       const std::string& fallback) {
    const ConfigValue value = config.get(section, key);
    if (!value.isValid()) {
        return fallback;
    }
    if (auto text = value.tryAs<std::string>()) {
        return *text;
    }
    if (value.tryAs<std::vector<std::string>>()) {
        throw std::invalid_argument(section + "." + key + " must be a string");
    }
    // EN: Scalars typed as numbers or booleans by YAML (e.g. api_version: 2021) are used as text.
    // FR: Les scalaires typés nombre ou booléen par YAML (ex. api_version: 2021) sont utilisés comme texte.
    return value.toString();
}

long readInteger(const ConfigManager& config, const std::string& section, const std::string& key,
                 long fallback, long minimum) {
    const ConfigValue value = config.get(section, key);
    if (!value.isValid()) {
        return fallback;
    }
    auto number = value.tryAs<int>();
    if (!number) {
        throw std::invalid_argument(section + "." + key + " must be an integer");
    }
    if (*number < minimum) {
        throw std::invalid_argument(section + "." + key + " must be >= " + std::to_string(minimum));
    }
    return *number;
}

CommandSpec readCommand(const ConfigManager& config, const std::string& section, const std::string& key,
                        const CommandSpec& fallback) {
    const ConfigValue value = config.get(section, key);
    if (!value.isValid()) {
        return fallback;
    }

    CommandSpec command;
    if (auto arguments = value.tryAs<std::vector<std::string>>()) {
        command.arguments = *arguments;
    } else if (auto line = value.tryAs<std::string>()) {
        std::istringstream stream(*line);
        std::string word;
        while (stream >> word) {
            command.arguments.push_back(word);
        }
    }
    if (command.arguments.empty()) {
        throw std::invalid_argument(section + "." + key + " must be a non-empty command");
    }
    return command;
}

} // namespace

DeploymentSettings DeploymentSettings::fromConfig(const ConfigManager& config) {
    DeploymentSettings settings;

    settings.site_directory = readString(config, "site", "directory", settings.site_directory.string());
    settings.output_directory = readString(config, "site", "output_directory", settings.output_directory);
    settings.install_command = readCommand(config, "site", "install_command", settings.install_command);
    settings.build_command = readCommand(config, "site", "build_command", settings.build_command);

    settings.storage_resource = readString(config, "storage", "endpoint_resource", settings.storage_resource);
    settings.storage_endpoint_output = readString(config, "storage", "endpoint_output", settings.storage_endpoint_output);
    settings.sas_token = readString(config, "storage", "sas_token", settings.sas_token);
    settings.container = readString(config, "storage", "container", settings.container);
    settings.index_document = readString(config, "storage", "index_document", settings.index_document);
    settings.error_document_404 = readString(config, "storage", "error_document_404", settings.error_document_404);
    settings.api_version = readString(config, "storage", "api_version", settings.api_version);

    settings.frontdoor_resource = readString(config, "frontdoor", "resource", settings.frontdoor_resource);
    settings.frontdoor_endpoint_output = readString(config, "frontdoor", "endpoint_output",
                                                    settings.frontdoor_endpoint_output);

    settings.outputs_file = readString(config, "provisioning", "outputs_file", settings.outputs_file.string());
    settings.resolve_timeout = std::chrono::seconds(
        readInteger(config, "provisioning", "resolve_timeout_seconds", settings.resolve_timeout.count(), 0));
    settings.poll_interval = std::chrono::milliseconds(
        readInteger(config, "provisioning", "poll_interval_ms", settings.poll_interval.count(), 10));

    settings.worker_threads = static_cast<size_t>(
        readInteger(config, "runtime", "worker_threads", static_cast<long>(settings.worker_threads), 1));
    settings.max_concurrent_uploads = static_cast<size_t>(
        readInteger(config, "runtime", "max_concurrent_uploads", static_cast<long>(settings.max_concurrent_uploads), 0));
    settings.http_connect_timeout_ms = readInteger(config, "runtime", "http_connect_timeout_ms",
                                                   settings.http_connect_timeout_ms, 0);
    settings.http_timeout_ms = readInteger(config, "runtime", "http_timeout_ms", settings.http_timeout_ms, 0);
    settings.max_retries = static_cast<int>(readInteger(config, "runtime", "max_retries", settings.max_retries, 0));

    settings.log_level = readString(config, "logging", "level", settings.log_level);
    settings.log_file = readString(config, "logging", "file", settings.log_file);

    if (settings.container.empty()) {
        throw std::invalid_argument("storage.container must not be empty");
    }
    if (settings.output_directory.empty()) {
        throw std::invalid_argument("site.output_directory must not be empty");
    }
    return settings;
}

std::vector<ConfigManager::ValidationRule> DeploymentSettings::validationRules() {
    std::vector<ConfigManager::ValidationRule> rules;

    ConfigManager::ValidationRule site_directory;
    site_directory.key = "site.directory";
    site_directory.type = "string";
    site_directory.required = true;
    site_directory.description = "Static site project directory";
    rules.push_back(site_directory);

    ConfigManager::ValidationRule outputs_file;
    outputs_file.key = "provisioning.outputs_file";
    outputs_file.type = "string";
    outputs_file.required = true;
    outputs_file.description = "Provisioning outputs document";
    rules.push_back(outputs_file);

    auto bounded = [&rules](const std::string& key, double min_value, double max_value) {
        ConfigManager::ValidationRule rule;
        rule.key = key;
        rule.type = "int";
        rule.min_value = min_value;
        rule.max_value = max_value;
        rules.push_back(rule);
    };
    bounded("provisioning.resolve_timeout_seconds", 0, 86400);
    bounded("provisioning.poll_interval_ms", 10, 60000);
    bounded("runtime.worker_threads", 1, 256);
    bounded("runtime.max_concurrent_uploads", 0, 10000);
    bounded("runtime.http_connect_timeout_ms", 0, 600000);
    bounded("runtime.http_timeout_ms", 0, 3600000);
    bounded("runtime.max_retries", 0, 20);

    ConfigManager::ValidationRule level;
    level.key = "logging.level";
    level.type = "string";
    level.allowed_values = {"DEBUG", "INFO", "WARN", "ERROR", "debug", "info", "warn", "error"};
    rules.push_back(level);

    return rules;
}

} // namespace Orchestrator
} // namespace SSD
