// EN: Implementation of the progress reporter and its scoped handles.
// FR: Implémentation du reporter de progression et de ses handles à portée.

#include "orchestrator/progress_reporter.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace SSD {
namespace Orchestrator {

namespace {

const std::string kEmpty;

} // namespace

std::string progressStateToString(ProgressState state) {
    switch (state) {
        case ProgressState::PENDING:                return "PENDING";
        case ProgressState::RUNNING:                return "RUNNING";
        case ProgressState::COMPLETED:              return "COMPLETED";
        case ProgressState::COMPLETED_WITH_WARNING: return "COMPLETED_WITH_WARNING";
        case ProgressState::FAILED:                 return "FAILED";
    }
    return "UNKNOWN";
}

bool isTerminal(ProgressState state) {
    return state == ProgressState::COMPLETED || state == ProgressState::COMPLETED_WITH_WARNING ||
           state == ProgressState::FAILED;
}

std::string progressEventTypeToString(ProgressEventType type) {
    switch (type) {
        case ProgressEventType::STEP_CREATED:      return "STEP_CREATED";
        case ProgressEventType::STEP_COMPLETED:    return "STEP_COMPLETED";
        case ProgressEventType::STEP_FAILED:       return "STEP_FAILED";
        case ProgressEventType::TASK_CREATED:      return "TASK_CREATED";
        case ProgressEventType::TASK_COMPLETED:    return "TASK_COMPLETED";
        case ProgressEventType::TASK_FAILED:       return "TASK_FAILED";
        case ProgressEventType::PUBLISH_COMPLETED: return "PUBLISH_COMPLETED";
    }
    return "UNKNOWN";
}

// EN: TaskHandle implementation
// FR: Implémentation de TaskHandle
TaskHandle::~TaskHandle() {
    release();
}

TaskHandle::TaskHandle(TaskHandle&& other) noexcept
    : reporter_(other.reporter_), step_(std::move(other.step_)), task_(other.task_) {
    other.reporter_ = nullptr;
    other.task_ = nullptr;
}

TaskHandle& TaskHandle::operator=(TaskHandle&& other) noexcept {
    if (this != &other) {
        release();
        reporter_ = other.reporter_;
        step_ = std::move(other.step_);
        task_ = other.task_;
        other.reporter_ = nullptr;
        other.task_ = nullptr;
    }
    return *this;
}

void TaskHandle::start() {
    checkedTask();
    reporter_->startTask(*task_);
}

void TaskHandle::complete(const std::string& message) {
    checkedTask();
    reporter_->finishTask(*step_, *task_, ProgressState::COMPLETED, message);
}

void TaskHandle::fail(const std::string& message) {
    checkedTask();
    reporter_->finishTask(*step_, *task_, ProgressState::FAILED, message);
}

ProgressState TaskHandle::state() const {
    return reporter_->taskState(checkedTask());
}

std::string TaskHandle::message() const {
    return reporter_->taskMessage(checkedTask());
}

const std::string& TaskHandle::id() const {
    return task_ ? task_->id() : kEmpty;
}

const std::string& TaskHandle::name() const {
    return task_ ? task_->name() : kEmpty;
}

const PipelineTask& TaskHandle::checkedTask() const {
    if (!reporter_ || !task_) {
        throw std::logic_error("Operation on an empty task handle");
    }
    return *task_;
}

void TaskHandle::release() {
    if (reporter_ && task_) {
        reporter_->releaseTask(task_->id());
    }
    reporter_ = nullptr;
    task_ = nullptr;
    step_.reset();
}

// EN: StepHandle implementation
// FR: Implémentation de StepHandle
StepHandle::~StepHandle() {
    release();
}

StepHandle::StepHandle(StepHandle&& other) noexcept
    : reporter_(other.reporter_), step_(std::move(other.step_)) {
    other.reporter_ = nullptr;
}

StepHandle& StepHandle::operator=(StepHandle&& other) noexcept {
    if (this != &other) {
        release();
        reporter_ = other.reporter_;
        step_ = std::move(other.step_);
        other.reporter_ = nullptr;
    }
    return *this;
}

TaskHandle StepHandle::createTask(const std::string& name) {
    if (!reporter_ || !step_) {
        throw std::logic_error("Operation on an empty step handle");
    }
    return reporter_->createTask(step_, name);
}

bool StepHandle::complete(const std::string& message, ProgressState state) {
    if (!reporter_ || !step_) {
        throw std::logic_error("Operation on an empty step handle");
    }
    return reporter_->completeStep(*step_, message, state);
}

void StepHandle::fail(const std::string& message) {
    if (!reporter_ || !step_) {
        throw std::logic_error("Operation on an empty step handle");
    }
    reporter_->failStep(*step_, message);
}

ProgressState StepHandle::state() const {
    if (!reporter_ || !step_) {
        throw std::logic_error("Operation on an empty step handle");
    }
    return reporter_->stepState(*step_);
}

std::string StepHandle::message() const {
    if (!reporter_ || !step_) {
        throw std::logic_error("Operation on an empty step handle");
    }
    return reporter_->stepMessage(*step_);
}

const std::string& StepHandle::id() const {
    return step_ ? step_->id() : kEmpty;
}

const std::string& StepHandle::name() const {
    return step_ ? step_->name() : kEmpty;
}

void StepHandle::release() {
    if (reporter_ && step_) {
        reporter_->releaseStep(step_->id());
    }
    reporter_ = nullptr;
    step_.reset();
}

// EN: ProgressReporter implementation
// FR: Implémentation de ProgressReporter
void ProgressReporter::addSink(std::shared_ptr<IProgressSink> sink) {
    if (!sink) {
        throw std::invalid_argument("Progress sink must not be null");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

StepHandle ProgressReporter::createStep(const std::string& name) {
    std::shared_ptr<PipelineStep> step;
    ProgressEvent event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        step = std::make_shared<PipelineStep>("step-" + std::to_string(next_step_id_++), name);
        open_steps_.insert(step->id());
        event = makeEvent(ProgressEventType::STEP_CREATED, *step, nullptr);
    }
    publish(event);
    return StepHandle(this, step);
}

void ProgressReporter::completePublish(const std::string& message, bool success) {
    ProgressEvent event;
    event.type = ProgressEventType::PUBLISH_COMPLETED;
    event.timestamp = std::chrono::system_clock::now();
    event.state = success ? ProgressState::COMPLETED : ProgressState::FAILED;
    event.message = message;
    event.success = success;
    publish(event);
}

size_t ProgressReporter::openStepCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_steps_.size();
}

size_t ProgressReporter::openTaskCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_tasks_.size();
}

TaskHandle ProgressReporter::createTask(const std::shared_ptr<PipelineStep>& step, const std::string& name) {
    PipelineTask* task = nullptr;
    ProgressEvent event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (isTerminal(step->state_)) {
            throw std::logic_error("Cannot create task '" + name + "' in step '" + step->name_ +
                                   "' which is " + progressStateToString(step->state_));
        }
        step->tasks_.push_back(std::make_unique<PipelineTask>(
            "task-" + std::to_string(next_task_id_++), name, step.get()));
        task = step->tasks_.back().get();
        open_tasks_.insert(task->id());
        event = makeEvent(ProgressEventType::TASK_CREATED, *step, task);
    }
    publish(event);
    return TaskHandle(this, step, task);
}

bool ProgressReporter::completeStep(PipelineStep& step, const std::string& message, ProgressState state) {
    if (state != ProgressState::COMPLETED && state != ProgressState::COMPLETED_WITH_WARNING) {
        throw std::invalid_argument("Step completion state must be COMPLETED or COMPLETED_WITH_WARNING");
    }

    ProgressEvent event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (step.state_ == ProgressState::FAILED) {
            SSD_LOG_WARN("progress", "Refusing to complete failed step '" + step.name_ + "'");
            return false;
        }
        auto unfinished = std::find_if(step.tasks_.begin(), step.tasks_.end(), [](const auto& task) {
            return task->state_ != ProgressState::COMPLETED;
        });
        if (unfinished != step.tasks_.end()) {
            SSD_LOG_WARN("progress", "Refusing to complete step '" + step.name_ + "': task '" +
                         (*unfinished)->name_ + "' is " + progressStateToString((*unfinished)->state_));
            return false;
        }
        if (isTerminal(step.state_)) {
            SSD_LOG_WARN("progress", "Step '" + step.name_ + "' completed twice");
        }
        step.state_ = state;
        step.message_ = message;
        event = makeEvent(ProgressEventType::STEP_COMPLETED, step, nullptr);
    }
    publish(event);
    return true;
}

void ProgressReporter::failStep(PipelineStep& step, const std::string& message) {
    ProgressEvent event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (step.state_ == ProgressState::FAILED && !step.message_.empty()) {
            SSD_LOG_WARN("progress", "Step '" + step.name_ + "' failed twice");
        }
        step.state_ = ProgressState::FAILED;
        step.message_ = message;
        event = makeEvent(ProgressEventType::STEP_FAILED, step, nullptr);
    }
    publish(event);
}

void ProgressReporter::startTask(PipelineTask& task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (task.state_ == ProgressState::PENDING) {
        task.state_ = ProgressState::RUNNING;
    }
}

// EN: Last write wins; a task failure forces its step to FAILED.
// FR: La dernière écriture l'emporte ; l'échec d'une tâche force son étape à FAILED.
void ProgressReporter::finishTask(PipelineStep& step, PipelineTask& task, ProgressState state,
                                  const std::string& message) {
    ProgressEvent event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (isTerminal(task.state_)) {
            SSD_LOG_WARN("progress", "Task '" + task.name_ + "' finalized twice (" +
                         progressStateToString(task.state_) + " -> " + progressStateToString(state) + ")");
        }
        task.state_ = state;
        task.message_ = message;
        if (state == ProgressState::FAILED) {
            step.state_ = ProgressState::FAILED;
        }
        event = makeEvent(state == ProgressState::FAILED ? ProgressEventType::TASK_FAILED
                                                         : ProgressEventType::TASK_COMPLETED,
                          step, &task);
    }
    publish(event);
}

void ProgressReporter::releaseStep(const std::string& step_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    open_steps_.erase(step_id);
}

void ProgressReporter::releaseTask(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    open_tasks_.erase(task_id);
}

ProgressState ProgressReporter::stepState(const PipelineStep& step) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return step.state_;
}

std::string ProgressReporter::stepMessage(const PipelineStep& step) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return step.message_;
}

ProgressState ProgressReporter::taskState(const PipelineTask& task) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return task.state_;
}

std::string ProgressReporter::taskMessage(const PipelineTask& task) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return task.message_;
}

ProgressEvent ProgressReporter::makeEvent(ProgressEventType type, const PipelineStep& step,
                                          const PipelineTask* task) const {
    ProgressEvent event;
    event.type = type;
    event.timestamp = std::chrono::system_clock::now();
    event.step_id = step.id_;
    event.step_name = step.name_;
    if (task) {
        event.task_id = task->id_;
        event.task_name = task->name_;
        event.state = task->state_;
        event.message = task->message_;
    } else {
        event.state = step.state_;
        event.message = step.message_;
    }
    event.success = event.state != ProgressState::FAILED;
    return event;
}

void ProgressReporter::publish(const ProgressEvent& event) {
    std::vector<std::shared_ptr<IProgressSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks = sinks_;
    }
    for (const auto& sink : sinks) {
        sink->onProgressEvent(event);
    }
}

} // namespace Orchestrator
} // namespace SSD
