// EN: ssdctl entry point: loads the deployment configuration, wires the concrete adapters and runs the pipeline.
// FR: Point d'entrée de ssdctl : charge la configuration, assemble les adaptateurs concrets et lance le pipeline.

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/error_recovery.hpp"
#include "infrastructure/system/process_runner.hpp"
#include "infrastructure/system/signal_handler.hpp"
#include "infrastructure/threading/cancellation.hpp"
#include "infrastructure/threading/thread_pool.hpp"
#include "orchestrator/deployment_orchestrator.hpp"
#include "orchestrator/progress_sinks.hpp"
#include "provisioning/resource_output_resolver.hpp"
#include "storage/azure_blob_client.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

constexpr const char* kVersion = "1.0.0";

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCancelled = 130;

enum class CliCommand {
    NONE,
    DEPLOY,
    VALIDATE,
    HELP,
    VERSION
};

struct CliOptions {
    CliCommand command = CliCommand::NONE;
    std::string config_file = "deploy.yaml";
    std::vector<std::string> overrides;
    std::string log_level;
    std::string log_file;
    bool quiet = false;
};

void printUsage(std::ostream& out) {
    out << "Usage: ssdctl [OPTIONS] COMMAND" << std::endl;
    out << std::endl;
    out << "Commands:" << std::endl;
    out << "  deploy      Build the static site, configure storage and upload the files" << std::endl;
    out << "  validate    Load and validate the configuration only" << std::endl;
    out << std::endl;
    out << "Options:" << std::endl;
    out << "  --config FILE             Configuration file (default: deploy.yaml)" << std::endl;
    out << "  --set SECTION.KEY=VALUE   Override a configuration value (repeatable)" << std::endl;
    out << "  --log-level LEVEL         DEBUG, INFO, WARN or ERROR" << std::endl;
    out << "  --log-file FILE           Write NDJSON logs to FILE instead of stderr" << std::endl;
    out << "  --quiet                   Do not print progress to stdout" << std::endl;
    out << "  -h, --help                Show this help" << std::endl;
    out << "  -V, --version             Show version" << std::endl;
}

// EN: Returns false and prints the problem on invalid arguments.
// FR: Retourne false et affiche le problème si les arguments sont invalides.
bool parseArguments(int argc, char* argv[], CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            options.command = CliCommand::HELP;
            return true;
        }
        if (arg == "--version" || arg == "-V") {
            options.command = CliCommand::VERSION;
            return true;
        }

        if (arg == "--quiet" || arg == "-q") {
            options.quiet = true;
            continue;
        }

        if (arg == "--config" || arg == "--set" || arg == "--log-level" || arg == "--log-file") {
            if (i + 1 >= argc) {
                std::cerr << "ssdctl: option " << arg << " requires a value" << std::endl;
                return false;
            }
            const std::string value = argv[++i];
            if (arg == "--config") {
                options.config_file = value;
            } else if (arg == "--set") {
                options.overrides.push_back(value);
            } else if (arg == "--log-level") {
                options.log_level = value;
            } else {
                options.log_file = value;
            }
            continue;
        }

        if (!arg.empty() && arg[0] == '-') {
            std::cerr << "ssdctl: unknown option " << arg << std::endl;
            return false;
        }

        if (options.command != CliCommand::NONE) {
            std::cerr << "ssdctl: unexpected argument " << arg << std::endl;
            return false;
        }
        if (arg == "deploy") {
            options.command = CliCommand::DEPLOY;
        } else if (arg == "validate") {
            options.command = CliCommand::VALIDATE;
        } else {
            std::cerr << "ssdctl: unknown command " << arg << std::endl;
            return false;
        }
    }

    if (options.command == CliCommand::NONE) {
        std::cerr << "ssdctl: missing command" << std::endl;
        return false;
    }
    return true;
}

// EN: Load file, environment and --set layers (in that order) and validate the result.
// FR: Charge les couches fichier, environnement et --set (dans cet ordre) et valide le résultat.
bool loadConfiguration(const CliOptions& options, SSD::ConfigManager& config) {
    config.reset();
    config.addValidationRules(SSD::Orchestrator::DeploymentSettings::validationRules());

    if (!config.loadFromFile(options.config_file)) {
        std::cerr << "ssdctl: cannot load configuration " << options.config_file << std::endl;
        return false;
    }
    config.loadEnvironmentOverrides("SSD_");

    for (const auto& assignment : options.overrides) {
        if (!config.applyOverride(assignment)) {
            std::cerr << "ssdctl: invalid override " << assignment << std::endl;
            return false;
        }
    }

    std::vector<std::string> errors;
    if (!config.validate(errors)) {
        for (const auto& error : errors) {
            std::cerr << "ssdctl: " << error << std::endl;
        }
        return false;
    }
    return true;
}

bool configureLogger(const SSD::Orchestrator::DeploymentSettings& settings, const CliOptions& options) {
    auto& logger = SSD::Logger::getInstance();

    const std::string level_name = options.log_level.empty() ? settings.log_level : options.log_level;
    SSD::LogLevel level;
    if (!SSD::Logger::parseLevel(level_name, level)) {
        std::cerr << "ssdctl: unknown log level " << level_name << std::endl;
        return false;
    }
    logger.setLogLevel(level);

    const std::string log_file = options.log_file.empty() ? settings.log_file : options.log_file;
    if (!log_file.empty() && !logger.setOutputFile(log_file)) {
        std::cerr << "ssdctl: cannot open log file " << log_file << std::endl;
        return false;
    }

    logger.setCorrelationId(logger.generateCorrelationId());
    logger.addGlobalMetadata("tool", "ssdctl");
    return true;
}

int runDeployment(const SSD::Orchestrator::DeploymentSettings& settings, const CliOptions& options) {
    using namespace SSD;

    ThreadPoolConfig pool_config;
    pool_config.threads = settings.worker_threads;
    ThreadPool pool(pool_config);

    Provisioning::JsonOutputsResolverOptions resolver_options;
    resolver_options.outputs_file = settings.outputs_file;
    resolver_options.poll_interval = settings.poll_interval;
    resolver_options.timeout = settings.resolve_timeout;

    Storage::AzureBlobClientOptions storage_options;
    storage_options.sas_token = settings.sas_token;
    storage_options.api_version = settings.api_version;
    storage_options.http.connect_timeout_ms = settings.http_connect_timeout_ms;
    storage_options.http.timeout_ms = settings.http_timeout_ms;
    storage_options.retry.max_attempts = static_cast<size_t>(settings.max_retries) + 1;

    Orchestrator::DeploymentCollaborators collaborators;
    collaborators.command_runner = std::make_shared<PosixCommandRunner>(pool);
    collaborators.output_resolver = std::make_shared<Provisioning::JsonOutputsResolver>(resolver_options, pool);
    collaborators.storage_factory = Storage::AzureBlobStorageClient::factory(storage_options, pool);

    Orchestrator::ProgressReporter reporter;
    if (!options.quiet) {
        reporter.addSink(std::make_shared<Orchestrator::ConsoleProgressSink>(std::cout));
    }
    reporter.addSink(std::make_shared<Orchestrator::LoggerProgressSink>());

    CancellationSource cancellation;
    auto& signals = SignalHandler::getInstance();
    signals.initialize();
    signals.registerShutdownCallback("ssdctl-deploy", [&cancellation](int signal_number) {
        cancellation.cancel("Received signal " + std::to_string(signal_number));
    });

    int exit_code = kExitFailure;
    try {
        Orchestrator::DeploymentOrchestrator orchestrator(settings, collaborators, reporter);
        const Orchestrator::DeploymentOutcome outcome = orchestrator.deploy(cancellation.token());
        exit_code = outcome.success ? kExitSuccess : kExitFailure;
    } catch (const OperationCancelledError& e) {
        SSD_LOG_WARN("ssdctl", std::string("Deployment cancelled: ") + e.what());
        exit_code = kExitCancelled;
    } catch (const std::exception& e) {
        SSD_LOG_ERROR("ssdctl", std::string("Deployment aborted: ") + e.what());
        exit_code = kExitFailure;
    }

    signals.unregisterShutdownCallback("ssdctl-deploy");
    // EN: Cancel leftovers so pending work stops and the pool drains quickly.
    // FR: Annule le reste pour arrêter le travail en attente et vider le pool rapidement.
    cancellation.cancel("Deployment finished");
    pool.shutdown();
    Logger::getInstance().flush();
    return exit_code;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    if (!parseArguments(argc, argv, options)) {
        printUsage(std::cerr);
        return kExitUsage;
    }

    if (options.command == CliCommand::HELP) {
        printUsage(std::cout);
        return kExitSuccess;
    }
    if (options.command == CliCommand::VERSION) {
        std::cout << "ssdctl " << kVersion << std::endl;
        std::cout << "Build: " << __DATE__ << " " << __TIME__ << std::endl;
        return kExitSuccess;
    }

    auto& config = SSD::ConfigManager::getInstance();
    if (!loadConfiguration(options, config)) {
        return kExitUsage;
    }

    SSD::Orchestrator::DeploymentSettings settings;
    try {
        settings = SSD::Orchestrator::DeploymentSettings::fromConfig(config);
    } catch (const std::invalid_argument& e) {
        std::cerr << "ssdctl: " << e.what() << std::endl;
        return kExitUsage;
    }

    if (!configureLogger(settings, options)) {
        return kExitUsage;
    }

    if (options.command == CliCommand::VALIDATE) {
        std::cout << "Configuration " << options.config_file << " is valid" << std::endl;
        SSD_LOG_DEBUG("ssdctl", config.dump());
        return kExitSuccess;
    }

    return runDeployment(settings, options);
}
