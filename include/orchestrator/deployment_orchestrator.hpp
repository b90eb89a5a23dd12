// EN: Deployment orchestrator: build -> configure -> upload -> finalize, with fail-fast ordering
//     and one progress step per run.
// FR: Orchestrateur de déploiement : build -> configuration -> envoi -> finalisation, avec arrêt au
//     premier échec et une étape de progression par exécution.

#pragma once

#include "infrastructure/system/process_runner.hpp"
#include "infrastructure/threading/cancellation.hpp"
#include "orchestrator/deployment_errors.hpp"
#include "orchestrator/deployment_settings.hpp"
#include "orchestrator/progress_reporter.hpp"
#include "provisioning/resource_output_resolver.hpp"
#include "storage/blob_storage_client.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace SSD {
namespace Orchestrator {

enum class DeploymentState {
    PENDING = 0,
    RUNNING = 1,
    COMPLETED = 2,
    FAILED = 3
};

struct DeploymentOutcome {
    bool success = false;
    std::string summary;                          // EN: Success only / FR: Succès uniquement
    std::string endpoint;                         // EN: Public URL on success / FR: URL publique en cas de succès
    std::optional<DeploymentErrorKind> error_kind; // EN: Failure only / FR: Échec uniquement
    std::string error;
};

// EN: Capabilities the pipeline depends on.
// FR: Capacités dont dépend le pipeline.
struct DeploymentCollaborators {
    std::shared_ptr<ICommandRunner> command_runner;
    std::shared_ptr<Provisioning::IResourceOutputResolver> output_resolver;
    Storage::StorageClientFactory storage_factory;
};

class DeploymentOrchestrator {
public:
    DeploymentOrchestrator(DeploymentSettings settings, DeploymentCollaborators collaborators,
                           ProgressReporter& reporter);

    // EN: Run the pipeline once. Expected failures come back as a failed outcome; anything else
    //     (cancellation included) marks the step failed and propagates.
    // FR: Exécute le pipeline une fois. Les échecs attendus reviennent en résultat d'échec ; le reste
    //     (annulation comprise) marque l'étape en échec et se propage.
    DeploymentOutcome deploy(const CancellationToken& token);

    DeploymentState state() const { return state_; }

    // EN: Files under the build output, sorted, with their blob names ('/' separated relative paths).
    // FR: Fichiers de la sortie de build, triés, avec leur nom de blob (chemin relatif séparé par '/').
    static std::vector<std::pair<std::filesystem::path, std::string>>
    collectUploads(const std::filesystem::path& output_directory);

private:
    PhaseResult tryBuildStaticSite(StepHandle& step, const CancellationToken& token);
    PhaseResult tryConfigureStaticWebsite(StepHandle& step, const CancellationToken& token,
                                          std::shared_ptr<Storage::IBlobStorageClient>& client);
    PhaseResult tryUploadStaticFiles(StepHandle& step, Storage::IBlobStorageClient& client,
                                     const CancellationToken& token);
    DeploymentOutcome finalize(StepHandle& step, const CancellationToken& token);

    DeploymentOutcome failDeployment(StepHandle& step, const PhaseResult& result);

    DeploymentSettings settings_;
    DeploymentCollaborators collaborators_;
    ProgressReporter& reporter_;
    DeploymentState state_ = DeploymentState::PENDING;
};

} // namespace Orchestrator
} // namespace SSD
