// EN: Implementation of the deployment orchestrator.
// FR: Implémentation de l'orchestrateur de déploiement.

#include "orchestrator/deployment_orchestrator.hpp"
#include "infrastructure/logging/logger.hpp"
#include "storage/content_type.hpp"

#include <algorithm>
#include <stdexcept>

namespace SSD {
namespace Orchestrator {

namespace {

const std::string kStepName = "Deploying static site";

std::string trimTrailing(std::string text) {
    text.erase(text.find_last_not_of(" \t\r\n") + 1);
    return text;
}

bool isBlank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

DeploymentOrchestrator::DeploymentOrchestrator(DeploymentSettings settings,
                                               DeploymentCollaborators collaborators,
                                               ProgressReporter& reporter)
    : settings_(std::move(settings)), collaborators_(std::move(collaborators)), reporter_(reporter) {
    if (!collaborators_.command_runner || !collaborators_.output_resolver || !collaborators_.storage_factory) {
        throw std::invalid_argument("DeploymentOrchestrator requires a command runner, an output resolver "
                                    "and a storage client factory");
    }
}

DeploymentOutcome DeploymentOrchestrator::deploy(const CancellationToken& token) {
    SSD_LOG_INFO_META("orchestrator", "Starting static site deployment",
                      (std::unordered_map<std::string, std::string>{
                          {"site_directory", settings_.site_directory.string()},
                          {"container", settings_.container}}));

    StepHandle step = reporter_.createStep(kStepName);
    state_ = DeploymentState::RUNNING;

    try {
        if (auto result = tryBuildStaticSite(step, token); !result) {
            return failDeployment(step, result);
        }

        std::shared_ptr<Storage::IBlobStorageClient> client;
        if (auto result = tryConfigureStaticWebsite(step, token, client); !result) {
            return failDeployment(step, result);
        }

        if (auto result = tryUploadStaticFiles(step, *client, token); !result) {
            return failDeployment(step, result);
        }

        return finalize(step, token);
    } catch (const OperationCancelledError& e) {
        state_ = DeploymentState::FAILED;
        const std::string message = "Static site deployment cancelled: " + std::string(e.what());
        step.fail(message);
        reporter_.completePublish(message, false);
        SSD_LOG_ERROR_META("orchestrator", message,
                           (std::unordered_map<std::string, std::string>{
                               {"error_kind", errorKindToString(DeploymentErrorKind::CANCELLED)}}));
        throw;
    } catch (const std::exception& e) {
        state_ = DeploymentState::FAILED;
        const std::string message = "Static site deployment failed: " + std::string(e.what());
        step.fail(message);
        reporter_.completePublish(message, false);
        SSD_LOG_ERROR("orchestrator", message);
        throw;
    }
}

PhaseResult DeploymentOrchestrator::tryBuildStaticSite(StepHandle& step, const CancellationToken& token) {
    TaskHandle task = step.createTask("Building static site with npm");
    task.start();

    try {
        if (!std::filesystem::is_directory(settings_.site_directory)) {
            const std::string message = "Static site directory not found: " + settings_.site_directory.string();
            task.fail(message);
            return PhaseResult::failure(DeploymentErrorKind::NOT_FOUND, message);
        }

        for (const CommandSpec* command : {&settings_.install_command, &settings_.build_command}) {
            SSD_LOG_INFO("orchestrator", "Running " + command->display());
            auto pending = collaborators_.command_runner->run(*command, settings_.site_directory, token);
            const CommandResult result = awaitResult(pending, token);
            if (result.exit_code != 0) {
                const std::string message = command->display() + " failed with exit code " +
                                            std::to_string(result.exit_code) + ": " +
                                            trimTrailing(result.standard_error);
                task.fail(message);
                return PhaseResult::failure(DeploymentErrorKind::EXTERNAL_PROCESS_FAILURE, message);
            }
        }

        task.complete("Successfully built static site");
        return PhaseResult::success();
    } catch (const OperationCancelledError& e) {
        task.fail(std::string("Build cancelled: ") + e.what());
        throw;
    } catch (const std::exception& e) {
        const std::string message = std::string("Build failed: ") + e.what();
        task.fail(message);
        return PhaseResult::failure(DeploymentErrorKind::EXTERNAL_PROCESS_FAILURE, message);
    }
}

// EN: Read-modify-write: only the static website settings change.
// FR: Lecture-modification-écriture : seuls les paramètres du site statique changent.
PhaseResult DeploymentOrchestrator::tryConfigureStaticWebsite(StepHandle& step, const CancellationToken& token,
                                                              std::shared_ptr<Storage::IBlobStorageClient>& client) {
    TaskHandle task = step.createTask("Configuring static website service");
    task.start();

    try {
        const std::string output_id = settings_.storage_resource + "." + settings_.storage_endpoint_output;
        std::string endpoint;
        try {
            auto pending = collaborators_.output_resolver->getOutputValue(
                settings_.storage_resource, settings_.storage_endpoint_output, token);
            endpoint = awaitResult(pending, token);
        } catch (const OperationCancelledError&) {
            throw;
        } catch (const std::exception& e) {
            const std::string message = "Failed to resolve storage endpoint " + output_id + ": " + e.what();
            task.fail(message);
            return PhaseResult::failure(DeploymentErrorKind::DEPENDENCY_UNRESOLVED, message);
        }
        if (isBlank(endpoint)) {
            const std::string message = "Storage endpoint " + output_id + " is empty";
            task.fail(message);
            return PhaseResult::failure(DeploymentErrorKind::DEPENDENCY_UNRESOLVED, message);
        }

        client = collaborators_.storage_factory(endpoint);
        if (!client) {
            throw std::runtime_error("No storage client for endpoint " + endpoint);
        }

        auto pending_read = client->getServiceProperties(token);
        Storage::ServiceProperties properties = awaitResult(pending_read, token);

        properties.static_website.enabled = true;
        properties.static_website.index_document = settings_.index_document;
        properties.static_website.error_document_404_path = settings_.error_document_404;

        auto pending_write = client->setServiceProperties(properties, token);
        awaitResult(pending_write, token);

        task.complete("Successfully configured static website service");
        return PhaseResult::success();
    } catch (const OperationCancelledError& e) {
        task.fail(std::string("Static website configuration cancelled: ") + e.what());
        throw;
    } catch (const std::exception& e) {
        const std::string message = std::string("Failed to configure static website: ") + e.what();
        task.fail(message);
        return PhaseResult::failure(DeploymentErrorKind::REMOTE_OPERATION_FAILURE, message);
    }
}

// EN: Every upload of a window is issued before any is awaited; the first failure stops consumption.
//     Uploads already in flight run to completion before the phase returns.
// FR: Tous les envois d'une fenêtre sont lancés avant d'en attendre un ; le premier échec arrête la
//     consommation. Les envois déjà en cours vont à leur terme avant le retour de la phase.
PhaseResult DeploymentOrchestrator::tryUploadStaticFiles(StepHandle& step, Storage::IBlobStorageClient& client,
                                                         const CancellationToken& token) {
    TaskHandle task = step.createTask("Uploading static files to storage");
    task.start();

    try {
        try {
            auto pending = client.createContainerIfNotExists(settings_.container, token);
            if (awaitResult(pending, token)) {
                SSD_LOG_INFO("orchestrator", "Created container " + settings_.container);
            }
        } catch (const OperationCancelledError&) {
            throw;
        } catch (const std::exception& e) {
            const std::string message = std::string("Failed to upload files: ") + e.what();
            task.fail(message);
            return PhaseResult::failure(DeploymentErrorKind::REMOTE_OPERATION_FAILURE, message);
        }

        const std::filesystem::path output_directory = settings_.site_directory / settings_.output_directory;
        if (!std::filesystem::is_directory(output_directory)) {
            const std::string message = "Build output directory not found: " + output_directory.string();
            task.fail(message);
            return PhaseResult::failure(DeploymentErrorKind::NOT_FOUND, message);
        }

        const auto uploads = collectUploads(output_directory);
        SSD_LOG_INFO_META("orchestrator", "Uploading " + std::to_string(uploads.size()) + " files to static website",
                          (std::unordered_map<std::string, std::string>{
                              {"file_count", std::to_string(uploads.size())},
                              {"container", settings_.container}}));
        const size_t window = settings_.max_concurrent_uploads == 0
            ? std::max<size_t>(uploads.size(), 1)
            : settings_.max_concurrent_uploads;

        for (size_t begin = 0; begin < uploads.size(); begin += window) {
            const size_t end = std::min(begin + window, uploads.size());

            std::vector<std::pair<std::string, std::future<void>>> in_flight;
            in_flight.reserve(end - begin);
            for (size_t i = begin; i < end; ++i) {
                const auto& [file, blob_name] = uploads[i];
                in_flight.emplace_back(blob_name,
                                       client.uploadBlob(settings_.container, blob_name, file,
                                                         Storage::contentTypeForPath(file), token));
            }

            for (auto& [blob_name, pending] : in_flight) {
                try {
                    awaitResult(pending, token);
                } catch (const OperationCancelledError&) {
                    throw;
                } catch (const std::exception& e) {
                    const std::string message = "Failed to upload files: " + blob_name + ": " + e.what();
                    task.fail(message);
                    return PhaseResult::failure(DeploymentErrorKind::AGGREGATE_UPLOAD_FAILURE, message);
                }
            }
        }

        task.complete("Successfully uploaded " + std::to_string(uploads.size()) + " files to static website");
        return PhaseResult::success();
    } catch (const OperationCancelledError& e) {
        task.fail(std::string("Upload cancelled: ") + e.what());
        throw;
    } catch (const std::exception& e) {
        const std::string message = std::string("Failed to upload files: ") + e.what();
        task.fail(message);
        return PhaseResult::failure(DeploymentErrorKind::AGGREGATE_UPLOAD_FAILURE, message);
    }
}

DeploymentOutcome DeploymentOrchestrator::finalize(StepHandle& step, const CancellationToken& token) {
    if (!step.complete("Successfully deployed static site")) {
        throw std::logic_error("Deployment step could not be completed");
    }

    DeploymentOutcome outcome;
    const std::string output_id = settings_.frontdoor_resource + "." + settings_.frontdoor_endpoint_output;
    std::string endpoint;
    try {
        auto pending = collaborators_.output_resolver->getOutputValue(
            settings_.frontdoor_resource, settings_.frontdoor_endpoint_output, token);
        endpoint = awaitResult(pending, token);
    } catch (const OperationCancelledError&) {
        throw;
    } catch (const std::exception& e) {
        outcome.error = "Failed to resolve public endpoint " + output_id + ": " + e.what();
    }
    if (outcome.error.empty() && isBlank(endpoint)) {
        outcome.error = "Public endpoint " + output_id + " is empty";
    }

    if (!outcome.error.empty()) {
        state_ = DeploymentState::FAILED;
        outcome.error_kind = DeploymentErrorKind::DEPENDENCY_UNRESOLVED;
        reporter_.completePublish(outcome.error, false);
        SSD_LOG_ERROR("orchestrator", outcome.error);
        return outcome;
    }

    state_ = DeploymentState::COMPLETED;
    outcome.success = true;
    outcome.endpoint = endpoint;
    outcome.summary = "Static site deployed successfully! Access it at: " + endpoint;
    reporter_.completePublish(outcome.summary, true);
    SSD_LOG_INFO_META("orchestrator", outcome.summary,
                      (std::unordered_map<std::string, std::string>{{"endpoint", endpoint}}));
    return outcome;
}

DeploymentOutcome DeploymentOrchestrator::failDeployment(StepHandle& step, const PhaseResult& result) {
    state_ = DeploymentState::FAILED;
    step.fail(result.message);
    reporter_.completePublish(result.message, false);
    SSD_LOG_ERROR_META("orchestrator", result.message,
                       (std::unordered_map<std::string, std::string>{
                           {"error_kind", errorKindToString(result.kind)}}));

    DeploymentOutcome outcome;
    outcome.error_kind = result.kind;
    outcome.error = result.message;
    return outcome;
}

std::vector<std::pair<std::filesystem::path, std::string>>
DeploymentOrchestrator::collectUploads(const std::filesystem::path& output_directory) {
    std::vector<std::pair<std::filesystem::path, std::string>> uploads;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(output_directory)) {
        if (entry.is_regular_file()) {
            uploads.emplace_back(entry.path(),
                                 std::filesystem::relative(entry.path(), output_directory).generic_string());
        }
    }
    std::sort(uploads.begin(), uploads.end(),
              [](const auto& a, const auto& b) { return a.second < b.second; });
    return uploads;
}

} // namespace Orchestrator
} // namespace SSD
