// EN: Console and logger progress sinks.
// FR: Sinks de progression console et logger.

#include "orchestrator/progress_sinks.hpp"
#include "infrastructure/logging/logger.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace SSD {
namespace Orchestrator {

ConsoleProgressSink::ConsoleProgressSink(std::ostream& out, bool show_timestamps)
    : out_(out), show_timestamps_(show_timestamps) {}

void ConsoleProgressSink::onProgressEvent(const ProgressEvent& event) {
    const std::string line = formatEvent(event);
    if (line.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (show_timestamps_) {
        const std::time_t time = std::chrono::system_clock::to_time_t(event.timestamp);
        std::tm local{};
        localtime_r(&time, &local);
        out_ << std::put_time(&local, "%H:%M:%S") << ' ';
    }
    out_ << line << std::endl;
}

std::string ConsoleProgressSink::formatEvent(const ProgressEvent& event) {
    switch (event.type) {
        case ProgressEventType::STEP_CREATED:
            return "==> " + event.step_name;
        case ProgressEventType::STEP_COMPLETED:
            return "==> " + (event.state == ProgressState::COMPLETED_WITH_WARNING ? std::string("[WARN] ")
                                                                                   : std::string("[OK] ")) +
                   event.message;
        case ProgressEventType::STEP_FAILED:
            return "==> [FAILED] " + event.message;
        case ProgressEventType::TASK_CREATED:
            return "  -> " + event.task_name;
        case ProgressEventType::TASK_COMPLETED:
            return "     [OK] " + event.message;
        case ProgressEventType::TASK_FAILED:
            return "     [FAILED] " + event.message;
        case ProgressEventType::PUBLISH_COMPLETED:
            return event.success ? event.message : "Deployment failed: " + event.message;
    }
    return {};
}

void LoggerProgressSink::onProgressEvent(const ProgressEvent& event) {
    std::unordered_map<std::string, std::string> metadata{
        {"event", progressEventTypeToString(event.type)},
        {"state", progressStateToString(event.state)}};
    if (!event.step_id.empty()) {
        metadata["step_id"] = event.step_id;
        metadata["step"] = event.step_name;
    }
    if (!event.task_id.empty()) {
        metadata["task_id"] = event.task_id;
        metadata["task"] = event.task_name;
    }

    std::string message;
    switch (event.type) {
        case ProgressEventType::STEP_CREATED: message = "Step started: " + event.step_name; break;
        case ProgressEventType::TASK_CREATED: message = "Task started: " + event.task_name; break;
        default: message = event.message; break;
    }

    const LogLevel level = event.success ? LogLevel::INFO : LogLevel::ERROR;
    Logger::getInstance().log(level, "progress", message, metadata);
}

} // namespace Orchestrator
} // namespace SSD
