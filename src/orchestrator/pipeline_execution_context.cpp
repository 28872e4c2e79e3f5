// EN: Pipeline Execution Context implementation - per-run state, events and report building.
// FR: Implémentation du contexte d'exécution - état par run, événements et construction du rapport.

#include "orchestrator/pipeline_engine.hpp"

#include <filesystem>

namespace DPF {
namespace Orchestrator {

PipelineExecutionContext::PipelineExecutionContext(std::string run_id,
                                                   std::shared_ptr<const PipelineDefinition> definition,
                                                   RunParameters parameters,
                                                   const CancellationToken& parent_cancel,
                                                   std::string log_directory,
                                                   PipelineEventCallback event_callback,
                                                   std::string parent_run_id,
                                                   std::string parent_stage)
    : run_id_(std::move(run_id)),
      definition_(std::move(definition)),
      parameters_(std::move(parameters)),
      log_directory_(std::move(log_directory)),
      event_callback_(std::move(event_callback)),
      parent_run_id_(std::move(parent_run_id)),
      parent_stage_(std::move(parent_stage)),
      cancel_source_(parent_cancel) {
    stage_results_.reserve(definition_->stages.size());
    for (const auto& stage : definition_->stages) {
        PipelineStageResult result;
        result.stage_name = stage.name;
        stage_results_.push_back(result);
    }
}

void PipelineExecutionContext::updateStageResult(size_t index, const PipelineStageResult& result) {
    std::lock_guard<std::mutex> lock(results_mutex_);
    stage_results_.at(index) = result;
}

PipelineStageResult PipelineExecutionContext::getStageResult(size_t index) const {
    std::lock_guard<std::mutex> lock(results_mutex_);
    return stage_results_.at(index);
}

std::optional<PipelineStageResult> PipelineExecutionContext::getStageResult(const std::string& stage_name) const {
    std::lock_guard<std::mutex> lock(results_mutex_);
    for (const auto& result : stage_results_) {
        if (result.stage_name == stage_name) {
            return result;
        }
    }
    return std::nullopt;
}

std::vector<PipelineStageResult> PipelineExecutionContext::getAllStageResults() const {
    std::lock_guard<std::mutex> lock(results_mutex_);
    return stage_results_;
}

StageStatus PipelineExecutionContext::getStageStatus(size_t index) const {
    std::lock_guard<std::mutex> lock(results_mutex_);
    return stage_results_.at(index).status;
}

void PipelineExecutionContext::setStageStatus(size_t index, StageStatus status) {
    std::lock_guard<std::mutex> lock(results_mutex_);
    stage_results_.at(index).status = status;
}

bool PipelineExecutionContext::requestCancellation(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(results_mutex_);
        if (cancel_source_.isCancelled()) {
            return false;
        }
        cancelled_by_request_ = true;
        cancel_reason_ = reason;
    }
    LOG_WARN_META("engine", "Cancellation requested", (std::unordered_map<std::string, std::string>{
        {"run_id", run_id_}, {"reason", reason}}));
    return cancel_source_.cancel(reason);
}

void PipelineExecutionContext::emitEvent(PipelineEventType type, const std::string& stage_name,
                                         const std::string& message,
                                         const std::map<std::string, std::string>& metadata) const {
    if (!event_callback_) {
        return;
    }

    PipelineEvent event;
    event.type = type;
    event.timestamp = std::chrono::system_clock::now();
    event.run_id = run_id_;
    event.pipeline_name = definition_->name;
    event.stage_name = stage_name;
    event.message = message;
    event.metadata = metadata;

    try {
        event_callback_(event);
    } catch (const std::exception& e) {
        LOG_ERROR("engine", "Event callback threw: " + std::string(e.what()));
    }
}

std::string PipelineExecutionContext::stageOutputPath(const std::string& stage_name) const {
    if (log_directory_.empty()) {
        return "";
    }

    std::filesystem::path directory = std::filesystem::path(log_directory_) / run_id_;
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        LOG_WARN("engine", "Cannot create run log directory " + directory.string() + ": " + ec.message());
        return "";
    }
    return (directory / (stage_name + ".log")).string();
}

void PipelineExecutionContext::markStarted() {
    std::lock_guard<std::mutex> lock(results_mutex_);
    start_time_ = std::chrono::system_clock::now();
    steady_start_ = std::chrono::steady_clock::now();
}

void PipelineExecutionContext::markFinished() {
    std::lock_guard<std::mutex> lock(results_mutex_);
    end_time_ = std::chrono::system_clock::now();
    duration_ = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - steady_start_);
    finished_ = true;
}

RunStatus PipelineExecutionContext::computeRunStatus() const {
    std::lock_guard<std::mutex> lock(results_mutex_);

    bool failed = false;
    bool incomplete = false;
    for (const auto& result : stage_results_) {
        if (result.status == StageStatus::FAILED) {
            failed = true;
        } else if (result.status == StageStatus::CANCELLED &&
                   result.error_kind == StageErrorKind::ACTION_TIMEOUT) {
            failed = true;
        } else if (!result.satisfiesDependents()) {
            incomplete = true;
        }
    }

    if (failed) {
        return RunStatus::FAILED;
    }
    if (incomplete) {
        if (!finished_) {
            return RunStatus::RUNNING;
        }
        return RunStatus::CANCELLED;
    }
    return finished_ ? RunStatus::SUCCEEDED : RunStatus::RUNNING;
}

RunReport PipelineExecutionContext::buildReport() const {
    RunStatus status = computeRunStatus();

    std::lock_guard<std::mutex> lock(results_mutex_);
    RunReport report;
    report.run_id = run_id_;
    report.pipeline_name = definition_->name;
    report.parent_run_id = parent_run_id_;
    report.parent_stage = parent_stage_;
    report.status = status;
    report.parameters = parameters_;
    report.start_time = start_time_;
    report.end_time = finished_ ? end_time_ : std::chrono::system_clock::now();
    report.duration = finished_
        ? duration_
        : std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - steady_start_);
    report.stages = stage_results_;
    report.definition_checksum = definition_->checksum;
    report.cancelled_by_request = cancelled_by_request_;
    report.cancel_reason = cancelled_by_request_ ? cancel_reason_ : (isCancelled() ? getCancellationToken().reason() : "");
    return report;
}

} // namespace Orchestrator
} // namespace DPF
