#pragma once

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/system/process_runner.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace SSD {
namespace Orchestrator {

// EN: Typed view of the deployment configuration. Every field has a default matching deploy.yaml.
// FR: Vue typée de la configuration du déploiement. Chaque champ a une valeur par défaut conforme à deploy.yaml.
struct DeploymentSettings {
    // site
    std::filesystem::path site_directory = "../static-site";
    std::string output_directory = "dist";
    CommandSpec install_command{{"npm", "install"}};
    CommandSpec build_command{{"npm", "run", "build"}};

    // storage
    std::string storage_resource = "deploy-storage";
    std::string storage_endpoint_output = "blobEndpoint";
    std::string sas_token;
    std::string container = "$web";
    std::string index_document = "index.html";
    std::string error_document_404 = "index.html";
    std::string api_version = "2021-08-06";

    // frontdoor
    std::string frontdoor_resource = "deploy-afd";
    std::string frontdoor_endpoint_output = "endpointUrl";

    // provisioning
    std::filesystem::path outputs_file = ".azure/outputs.json";
    std::chrono::seconds resolve_timeout{600};
    std::chrono::milliseconds poll_interval{500};

    // runtime
    size_t worker_threads = 8;
    size_t max_concurrent_uploads = 0;   // EN: 0 = all uploads in flight at once / FR: 0 = tous les envois en parallèle
    long http_connect_timeout_ms = 10000;
    long http_timeout_ms = 120000;
    int max_retries = 3;

    // logging
    std::string log_level = "INFO";
    std::string log_file;

    // EN: Build settings from the loaded configuration; missing keys keep their defaults.
    //     Throws std::invalid_argument when a present key has an unusable value.
    // FR: Construit les paramètres depuis la configuration chargée ; les clés absentes gardent leur défaut.
    //     Lève std::invalid_argument si une clé présente a une valeur inutilisable.
    static DeploymentSettings fromConfig(const ConfigManager& config);

    static std::vector<ConfigManager::ValidationRule> validationRules();
};

} // namespace Orchestrator
} // namespace SSD
