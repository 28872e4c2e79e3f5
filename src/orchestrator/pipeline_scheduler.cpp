// EN: Pipeline Scheduler implementation - drives one run's graph to completion.
// FR: Implémentation de l'ordonnanceur - amène le graphe d'un run jusqu'à son terme.

#include "orchestrator/pipeline_engine.hpp"

#include <algorithm>

namespace DPF {
namespace Orchestrator {

namespace {

constexpr auto kWaitSlice = std::chrono::milliseconds(50);

bool isTerminal(StageStatus status) {
    return status != StageStatus::BLOCKED && status != StageStatus::READY && status != StageStatus::RUNNING;
}

PipelineEventType completionEvent(StageStatus status) {
    switch (status) {
        case StageStatus::SUCCEEDED: return PipelineEventType::STAGE_COMPLETED;
        case StageStatus::FAILED: return PipelineEventType::STAGE_FAILED;
        case StageStatus::CANCELLED: return PipelineEventType::STAGE_CANCELLED;
        default: return PipelineEventType::STAGE_SKIPPED;
    }
}

} // namespace

PipelineScheduler::PipelineScheduler(PipelineExecutionContext& context, PipelineEngine& engine, size_t max_parallelism)
    : context_(context),
      engine_(engine),
      resolver_(context.getDefinition()),
      order_(resolver_.getExecutionOrderIndices()) {
    size_t stage_count = std::max<size_t>(1, resolver_.size());
    max_parallelism_ = max_parallelism == 0 ? stage_count : std::min(max_parallelism, stage_count);

    ThreadPoolConfig pool_config;
    pool_config.thread_count = max_parallelism_;
    pool_config.name = "run-" + context_.getRunId();
    pool_ = std::make_unique<ThreadPool>(pool_config);
}

PipelineScheduler::~PipelineScheduler() {
    if (pool_) {
        pool_->shutdown();
    }
}

void PipelineScheduler::run() {
    propagate();
    dispatchReady();

    while (!allTerminal()) {
        {
            std::unique_lock<std::mutex> lock(completion_mutex_);
            completion_condition_.wait_for(lock, kWaitSlice, [this] { return !completions_.empty(); });
        }

        drainCompletions();
        propagate();
        dispatchReady();

        if (running_ == 0 && !allTerminal()) {
            // EN: Unreachable for a validated graph; settle leftovers instead of spinning.
            // FR: Inatteignable pour un graphe validé ; règle les restes plutôt que de boucler.
            bool ready_left = false;
            for (size_t index : order_) {
                if (context_.getStageStatus(index) == StageStatus::READY) {
                    ready_left = true;
                }
            }
            if (!ready_left) {
                LOG_ERROR("scheduler", "Run " + context_.getRunId() + " stalled, settling remaining stages");
                for (size_t index : order_) {
                    if (!isTerminal(context_.getStageStatus(index))) {
                        settleStage(index, StageStatus::CANCELLED, StageErrorKind::INTERNAL, "scheduler stalled");
                    }
                }
            }
        }
    }

    for (auto& future : futures_) {
        future.get();
    }
    futures_.clear();
}

// EN: One pass in topological order settles every stage whose predecessors are all terminal,
// EN: so skips cascade through the whole subtree at once.
// FR: Une passe en ordre topologique règle chaque étape dont les prédécesseurs sont terminaux,
// FR: les sauts se propagent donc à tout le sous-arbre d'un coup.
void PipelineScheduler::propagate() {
    const auto& definition = context_.getDefinition();
    const bool cancelled = context_.isCancelled();

    for (size_t index : order_) {
        StageStatus status = context_.getStageStatus(index);

        if (status == StageStatus::READY && cancelled) {
            settleStage(index, StageStatus::CANCELLED, StageErrorKind::RUN_CANCELLED,
                        "run cancelled before dispatch: " + context_.getCancellationToken().reason());
            continue;
        }
        if (status != StageStatus::BLOCKED) {
            continue;
        }

        bool all_satisfied = true;
        std::string blocking;
        for (size_t pred : resolver_.predecessorsOf(index)) {
            StageStatus pred_status = context_.getStageStatus(pred);
            if (pred_status == StageStatus::FAILED || pred_status == StageStatus::CANCELLED ||
                pred_status == StageStatus::SKIPPED_BY_UPSTREAM_FAILURE) {
                blocking = resolver_.nameOf(pred);
                break;
            }
            if (pred_status != StageStatus::SUCCEEDED && pred_status != StageStatus::SKIPPED_BY_CONDITION) {
                all_satisfied = false;
            }
        }

        if (!blocking.empty()) {
            settleStage(index, StageStatus::SKIPPED_BY_UPSTREAM_FAILURE, StageErrorKind::NONE,
                        "upstream stage '" + blocking + "' did not complete");
            continue;
        }
        if (!all_satisfied) {
            continue;
        }
        if (cancelled) {
            settleStage(index, StageStatus::CANCELLED, StageErrorKind::RUN_CANCELLED,
                        "run cancelled before dispatch: " + context_.getCancellationToken().reason());
            continue;
        }

        const auto& stage = definition.stages[index];
        if (!stage.shouldRun(context_.getParameters())) {
            settleStage(index, StageStatus::SKIPPED_BY_CONDITION, StageErrorKind::NONE,
                        "condition is false: " + stage.condition->source());
            continue;
        }

        context_.setStageStatus(index, StageStatus::READY);
        context_.emitEvent(PipelineEventType::STAGE_READY, stage.name);
    }
}

void PipelineScheduler::dispatchReady() {
    for (size_t index : order_) {
        if (running_ >= max_parallelism_) {
            return;
        }
        if (context_.getStageStatus(index) == StageStatus::READY) {
            dispatch(index);
        }
    }
}

void PipelineScheduler::dispatch(size_t index) {
    const StageSpec& stage = context_.getDefinition().stages[index];

    PipelineStageResult running;
    running.stage_name = stage.name;
    running.status = StageStatus::RUNNING;
    running.start_time = std::chrono::system_clock::now();
    context_.updateStageResult(index, running);

    ++running_;
    peak_running_ = std::max(peak_running_, running_);

    LOG_INFO_META("scheduler", "Stage started", (std::unordered_map<std::string, std::string>{
        {"run_id", context_.getRunId()}, {"stage", stage.name}, {"body", stage.describeBody()}}));
    context_.emitEvent(PipelineEventType::STAGE_STARTED, stage.name, stage.describeBody());

    futures_.push_back(pool_->submitNamed(stage.name, [this, index, &stage]() {
        PipelineTask task(stage, context_, engine_);
        PipelineStageResult result = task.execute();
        {
            std::lock_guard<std::mutex> lock(completion_mutex_);
            completions_.push_back({index, std::move(result)});
        }
        completion_condition_.notify_one();
    }));
}

bool PipelineScheduler::drainCompletions() {
    std::vector<Completion> completed;
    {
        std::lock_guard<std::mutex> lock(completion_mutex_);
        completed.swap(completions_);
    }

    for (auto& completion : completed) {
        --running_;
        finishStage(completion.index, std::move(completion.result));
    }
    return !completed.empty();
}

bool PipelineScheduler::allTerminal() const {
    for (size_t index : order_) {
        if (!isTerminal(context_.getStageStatus(index))) {
            return false;
        }
    }
    return true;
}

void PipelineScheduler::finishStage(size_t index, PipelineStageResult result) {
    context_.updateStageResult(index, result);

    std::unordered_map<std::string, std::string> metadata = {
        {"run_id", context_.getRunId()},
        {"stage", result.stage_name},
        {"status", PipelineUtils::statusToString(result.status)},
        {"duration", PipelineUtils::formatDuration(result.execution_time)}
    };
    if (result.error_kind != StageErrorKind::NONE) {
        metadata["error_kind"] = PipelineUtils::errorKindToString(result.error_kind);
        metadata["error"] = result.error_message;
    }
    if (result.status == StageStatus::SUCCEEDED) {
        LOG_INFO_META("scheduler", "Stage finished", metadata);
    } else {
        LOG_WARN_META("scheduler", "Stage finished", metadata);
    }

    context_.emitEvent(completionEvent(result.status), result.stage_name, result.error_message,
                       {{"status", PipelineUtils::statusToString(result.status)}});
}

void PipelineScheduler::settleStage(size_t index, StageStatus status, StageErrorKind kind, const std::string& message) {
    PipelineStageResult result = context_.getStageResult(index);
    result.status = status;
    result.error_kind = kind;
    result.error_message = message;
    result.start_time = std::chrono::system_clock::now();
    result.end_time = result.start_time;
    finishStage(index, result);
}

} // namespace Orchestrator
} // namespace DPF
