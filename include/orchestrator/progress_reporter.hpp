// EN: Progress reporting for the deployment pipeline: steps own tasks, every transition is published
//     to registered sinks, and handles release their step/task when they go out of scope.
// FR: Reporting de progression du pipeline de déploiement : les étapes possèdent les tâches, chaque
//     transition est publiée aux sinks enregistrés et les handles libèrent leur étape/tâche en sortie de portée.

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace SSD {
namespace Orchestrator {

class ProgressReporter;
class PipelineStep;

enum class ProgressState {
    PENDING = 0,
    RUNNING = 1,
    COMPLETED = 2,
    COMPLETED_WITH_WARNING = 3,
    FAILED = 4
};

std::string progressStateToString(ProgressState state);
bool isTerminal(ProgressState state);

enum class ProgressEventType {
    STEP_CREATED,
    STEP_COMPLETED,
    STEP_FAILED,
    TASK_CREATED,
    TASK_COMPLETED,
    TASK_FAILED,
    PUBLISH_COMPLETED   // EN: Final deployment summary or error / FR: Résumé final ou erreur du déploiement
};

std::string progressEventTypeToString(ProgressEventType type);

struct ProgressEvent {
    ProgressEventType type;
    std::chrono::system_clock::time_point timestamp;
    std::string step_id;
    std::string step_name;
    std::string task_id;       // EN: Empty for step and publish events / FR: Vide pour les événements d'étape et de publication
    std::string task_name;
    ProgressState state = ProgressState::PENDING;
    std::string message;
    bool success = true;
};

// EN: Observer of progress transitions. Called outside the reporter lock, possibly from any thread.
// FR: Observateur des transitions de progression. Appelé hors du verrou du reporter, depuis n'importe quel thread.
class IProgressSink {
public:
    virtual ~IProgressSink() = default;
    virtual void onProgressEvent(const ProgressEvent& event) = 0;
};

// EN: Smallest reportable unit of work. Owned by its step.
// FR: Plus petite unité de travail rapportable. Possédée par son étape.
class PipelineTask {
public:
    PipelineTask(std::string id, std::string name, PipelineStep* step)
        : id_(std::move(id)), name_(std::move(name)), step_(step) {}

    const std::string& id() const { return id_; }
    const std::string& name() const { return name_; }
    const PipelineStep* step() const { return step_; }
    ProgressState state() const { return state_; }
    const std::string& message() const { return message_; }

private:
    friend class ProgressReporter;

    std::string id_;
    std::string name_;
    PipelineStep* step_;
    ProgressState state_ = ProgressState::PENDING;
    std::string message_;
};

// EN: Named unit of work owning its ordered tasks.
// FR: Unité de travail nommée possédant ses tâches ordonnées.
class PipelineStep {
public:
    PipelineStep(std::string id, std::string name) : id_(std::move(id)), name_(std::move(name)) {}

    const std::string& id() const { return id_; }
    const std::string& name() const { return name_; }
    ProgressState state() const { return state_; }
    const std::string& message() const { return message_; }
    const std::vector<std::unique_ptr<PipelineTask>>& tasks() const { return tasks_; }

private:
    friend class ProgressReporter;

    std::string id_;
    std::string name_;
    ProgressState state_ = ProgressState::RUNNING;
    std::string message_;
    std::vector<std::unique_ptr<PipelineTask>> tasks_;
};

// EN: Scoped handle on a task. Movable, not copyable. Destruction never changes the task state.
// FR: Handle à portée sur une tâche. Déplaçable, non copiable. La destruction ne change jamais l'état.
class TaskHandle {
public:
    TaskHandle() = default;
    ~TaskHandle();
    TaskHandle(TaskHandle&& other) noexcept;
    TaskHandle& operator=(TaskHandle&& other) noexcept;
    TaskHandle(const TaskHandle&) = delete;
    TaskHandle& operator=(const TaskHandle&) = delete;

    // EN: PENDING -> RUNNING when the work begins. No event, no effect on a started or finished task.
    // FR: PENDING -> RUNNING au début du travail. Pas d'événement, sans effet sur une tâche démarrée ou terminée.
    void start();
    void complete(const std::string& message);
    void fail(const std::string& message);

    ProgressState state() const;
    std::string message() const;
    const std::string& id() const;
    const std::string& name() const;
    bool valid() const { return reporter_ != nullptr; }

private:
    friend class ProgressReporter;
    TaskHandle(ProgressReporter* reporter, std::shared_ptr<PipelineStep> step, PipelineTask* task)
        : reporter_(reporter), step_(std::move(step)), task_(task) {}

    void release();
    const PipelineTask& checkedTask() const;

    ProgressReporter* reporter_ = nullptr;
    std::shared_ptr<PipelineStep> step_;
    PipelineTask* task_ = nullptr;
};

// EN: Scoped handle on a step. Movable, not copyable. Destruction never changes the step state.
// FR: Handle à portée sur une étape. Déplaçable, non copiable. La destruction ne change jamais l'état.
class StepHandle {
public:
    StepHandle() = default;
    ~StepHandle();
    StepHandle(StepHandle&& other) noexcept;
    StepHandle& operator=(StepHandle&& other) noexcept;
    StepHandle(const StepHandle&) = delete;
    StepHandle& operator=(const StepHandle&) = delete;

    // EN: Throws std::logic_error once the step is terminal.
    // FR: Lève std::logic_error une fois l'étape terminée.
    TaskHandle createTask(const std::string& name);

    // EN: Returns false (state unchanged) when the step failed or a task is not Completed.
    // FR: Retourne false (état inchangé) si l'étape a échoué ou si une tâche n'est pas Completed.
    bool complete(const std::string& message, ProgressState state = ProgressState::COMPLETED);
    void fail(const std::string& message);

    ProgressState state() const;
    std::string message() const;
    const std::string& id() const;
    const std::string& name() const;
    bool valid() const { return reporter_ != nullptr; }

private:
    friend class ProgressReporter;
    StepHandle(ProgressReporter* reporter, std::shared_ptr<PipelineStep> step)
        : reporter_(reporter), step_(std::move(step)) {}

    void release();

    ProgressReporter* reporter_ = nullptr;
    std::shared_ptr<PipelineStep> step_;
};

// EN: Creates and tracks steps and tasks, records their state and notifies sinks.
//     Must outlive every handle it hands out.
// FR: Crée et suit les étapes et tâches, enregistre leur état et notifie les sinks.
//     Doit survivre à tous les handles qu'il distribue.
class ProgressReporter {
public:
    ProgressReporter() = default;
    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    void addSink(std::shared_ptr<IProgressSink> sink);

    StepHandle createStep(const std::string& name);

    // EN: Final publish notification: deployment summary on success, error on failure.
    // FR: Notification de publication finale : résumé en cas de succès, erreur en cas d'échec.
    void completePublish(const std::string& message, bool success);

    size_t openStepCount() const;
    size_t openTaskCount() const;

private:
    friend class StepHandle;
    friend class TaskHandle;

    TaskHandle createTask(const std::shared_ptr<PipelineStep>& step, const std::string& name);
    bool completeStep(PipelineStep& step, const std::string& message, ProgressState state);
    void failStep(PipelineStep& step, const std::string& message);
    void startTask(PipelineTask& task);
    void finishTask(PipelineStep& step, PipelineTask& task, ProgressState state, const std::string& message);
    void releaseStep(const std::string& step_id);
    void releaseTask(const std::string& task_id);

    ProgressState stepState(const PipelineStep& step) const;
    std::string stepMessage(const PipelineStep& step) const;
    ProgressState taskState(const PipelineTask& task) const;
    std::string taskMessage(const PipelineTask& task) const;

    ProgressEvent makeEvent(ProgressEventType type, const PipelineStep& step, const PipelineTask* task) const;
    void publish(const ProgressEvent& event);

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<IProgressSink>> sinks_;
    std::set<std::string> open_steps_;
    std::set<std::string> open_tasks_;
    size_t next_step_id_ = 1;
    size_t next_task_id_ = 1;
};

} // namespace Orchestrator
} // namespace SSD
