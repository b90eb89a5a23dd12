#include "orchestrator/deployment_errors.hpp"

namespace SSD {
namespace Orchestrator {

std::string errorKindToString(DeploymentErrorKind kind) {
    switch (kind) {
        case DeploymentErrorKind::NOT_FOUND:                return "NOT_FOUND";
        case DeploymentErrorKind::EXTERNAL_PROCESS_FAILURE: return "EXTERNAL_PROCESS_FAILURE";
        case DeploymentErrorKind::DEPENDENCY_UNRESOLVED:    return "DEPENDENCY_UNRESOLVED";
        case DeploymentErrorKind::REMOTE_OPERATION_FAILURE: return "REMOTE_OPERATION_FAILURE";
        case DeploymentErrorKind::AGGREGATE_UPLOAD_FAILURE: return "AGGREGATE_UPLOAD_FAILURE";
        case DeploymentErrorKind::CANCELLED:                return "CANCELLED";
    }
    return "UNKNOWN";
}

} // namespace Orchestrator
} // namespace SSD
