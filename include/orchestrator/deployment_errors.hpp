// EN: Error vocabulary of the deployment pipeline.
// FR: Vocabulaire d'erreurs du pipeline de déploiement.

#pragma once

#include <string>

namespace SSD {
namespace Orchestrator {

enum class DeploymentErrorKind {
    NOT_FOUND = 0,                 // EN: Site or build output directory missing / FR: Répertoire du site ou de sortie absent
    EXTERNAL_PROCESS_FAILURE = 1,  // EN: Build tool exited non-zero / FR: L'outil de build a terminé en erreur
    DEPENDENCY_UNRESOLVED = 2,     // EN: Provisioning output absent or empty / FR: Sortie de provisionnement absente ou vide
    REMOTE_OPERATION_FAILURE = 3,  // EN: Storage service call failed / FR: Échec d'un appel au service de stockage
    AGGREGATE_UPLOAD_FAILURE = 4,  // EN: At least one upload failed / FR: Au moins un envoi a échoué
    CANCELLED = 5                  // EN: Cancellation reached the pipeline / FR: Une annulation a atteint le pipeline
};

std::string errorKindToString(DeploymentErrorKind kind);

// EN: Outcome of one phase: ok, or a classified failure that already went through progress reporting.
// FR: Résultat d'une phase : ok, ou un échec classifié déjà passé par le reporting de progression.
struct PhaseResult {
    bool ok = true;
    DeploymentErrorKind kind = DeploymentErrorKind::NOT_FOUND;
    std::string message;

    static PhaseResult success() { return PhaseResult{}; }
    static PhaseResult failure(DeploymentErrorKind kind, std::string message) {
        return PhaseResult{false, kind, std::move(message)};
    }

    explicit operator bool() const { return ok; }
};

} // namespace Orchestrator
} // namespace SSD
