#pragma once

#include "orchestrator/progress_reporter.hpp"

#include <mutex>
#include <ostream>

namespace SSD {
namespace Orchestrator {

// EN: Human-readable progress display for the CLI.
// FR: Affichage de progression lisible pour la CLI.
class ConsoleProgressSink : public IProgressSink {
public:
    explicit ConsoleProgressSink(std::ostream& out, bool show_timestamps = false);

    void onProgressEvent(const ProgressEvent& event) override;

    // EN: Single display line for an event (exposed for tests).
    // FR: Ligne d'affichage d'un événement (exposée pour les tests).
    static std::string formatEvent(const ProgressEvent& event);

private:
    std::ostream& out_;
    bool show_timestamps_;
    std::mutex mutex_;
};

// EN: Forwards every transition to the NDJSON logger with step/task metadata.
// FR: Transmet chaque transition au logger NDJSON avec les métadonnées d'étape/tâche.
class LoggerProgressSink : public IProgressSink {
public:
    void onProgressEvent(const ProgressEvent& event) override;
};

} // namespace Orchestrator
} // namespace SSD
