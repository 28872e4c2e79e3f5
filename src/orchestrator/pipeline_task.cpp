// EN: Pipeline Task implementation - the Stage Executor. Acquires the stage lock, runs the body
// EN: on its own thread under the stage timeout, and captures the outcome.
// FR: Implémentation de PipelineTask - l'exécuteur d'étape. Acquiert le verrou, exécute le corps
// FR: sur son propre thread sous le timeout d'étape, et capture le résultat.

#include "orchestrator/pipeline_engine.hpp"
#include "orchestrator/pipeline_errors.hpp"

#include <algorithm>
#include <thread>

namespace DPF {
namespace Orchestrator {

namespace {

constexpr auto kWaitSlice = std::chrono::milliseconds(50);
// EN: Extra time after the grace period so the command action can finish its SIGKILL.
// FR: Temps en plus du délai de grâce pour que l'action command termine son SIGKILL.
constexpr auto kAbandonMargin = std::chrono::milliseconds(500);

enum class Interrupt {
    NONE,
    TIMEOUT,
    CANCELLED
};

std::chrono::milliseconds elapsedSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

} // namespace

// EN: Shared between the executor and the body thread; outlives an abandoned body.
// FR: Partagé entre l'exécuteur et le thread du corps ; survit à un corps abandonné.
struct PipelineTask::BodyState {
    std::mutex mutex;
    std::condition_variable condition;
    bool done = false;
    ActionOutcome outcome;
    StageErrorKind failure_kind = StageErrorKind::ACTION_FAILURE;
    std::shared_ptr<const RunReport> sub_run;
};

PipelineTask::PipelineTask(const StageSpec& stage, PipelineExecutionContext& context, PipelineEngine& engine)
    : stage_(stage), context_(context), engine_(engine), cancel_source_(context.getCancellationToken()) {}

void PipelineTask::cancel(const std::string& reason) {
    cancel_source_.cancel(reason);
}

PipelineStageResult PipelineTask::execute() {
    PipelineStageResult result;
    result.stage_name = stage_.name;
    result.status = StageStatus::RUNNING;
    result.start_time = std::chrono::system_clock::now();
    updateStatus(StageStatus::RUNNING);

    try {
        result = executeInternal(std::move(result));
    } catch (const std::exception& e) {
        result.status = StageStatus::FAILED;
        result.error_kind = StageErrorKind::INTERNAL;
        result.error_message = e.what();
        LOG_ERROR_META("executor", "Stage execution error", (std::unordered_map<std::string, std::string>{
            {"run_id", context_.getRunId()}, {"stage", stage_.name}, {"error", e.what()}}));
    }

    result.end_time = std::chrono::system_clock::now();
    updateStatus(result.status);
    return result;
}

PipelineStageResult PipelineTask::executeInternal(PipelineStageResult result) {
    if (cancel_source_.isCancelled()) {
        result.status = StageStatus::CANCELLED;
        result.error_kind = StageErrorKind::RUN_CANCELLED;
        result.error_message = "run cancelled before start: " + cancel_source_.token().reason();
        return result;
    }

    LockToken lock;
    std::string lock_name;
    if (!stage_.resource_lock.empty()) {
        lock_name = PipelineUtils::expandParameters(stage_.resource_lock, context_.getParameters());
        auto timeout = stage_.lock_timeout.value_or(engine_.getConfig().default_lock_timeout);
        std::string holder = context_.getRunId() + "/" + stage_.name;

        context_.emitEvent(PipelineEventType::LOCK_WAITING, stage_.name, lock_name,
                           {{"lock", lock_name}, {"timeout", PipelineUtils::formatDuration(timeout)}});
        try {
            lock = engine_.getLockManager().acquire(lock_name, timeout, holder, cancel_source_.token());
        } catch (const LockAcquisitionTimeout& e) {
            result.status = StageStatus::FAILED;
            result.error_kind = StageErrorKind::LOCK_TIMEOUT;
            result.error_message = e.what();
            result.lock_wait_time = e.waited();
            return result;
        } catch (const LockAcquisitionCancelled& e) {
            result.status = StageStatus::CANCELLED;
            result.error_kind = StageErrorKind::RUN_CANCELLED;
            result.error_message = e.what();
            result.lock_wait_time = e.waited();
            return result;
        }

        result.lock_wait_time = lock.waited();
        context_.emitEvent(PipelineEventType::LOCK_ACQUIRED, stage_.name, lock_name,
                           {{"lock", lock_name}, {"waited", PipelineUtils::formatDuration(lock.waited())}});
    }

    runBody(result);

    if (lock.ownsLock()) {
        lock.release();
        context_.emitEvent(PipelineEventType::LOCK_RELEASED, stage_.name, lock_name, {{"lock", lock_name}});
    }
    return result;
}

void PipelineTask::runBody(PipelineStageResult& result) {
    auto body = prepareBody(result);
    if (!body) {
        return;
    }

    const auto timeout = stage_.timeout.value_or(engine_.getConfig().default_stage_timeout);
    const auto grace_period = engine_.getConfig().cancel_grace_period;
    const bool is_sub_pipeline = stage_.isSubPipeline();

    auto state = std::make_shared<BodyState>();
    const auto body_start = std::chrono::steady_clock::now();
    const auto deadline = body_start + timeout;

    std::thread worker([state, body]() {
        body(*state);
        {
            std::lock_guard<std::mutex> guard(state->mutex);
            state->done = true;
        }
        state->condition.notify_all();
    });

    Interrupt interrupt = Interrupt::NONE;
    bool abandoned = false;
    {
        std::unique_lock<std::mutex> lock(state->mutex);
        while (!state->done) {
            if (cancel_source_.isCancelled()) {
                interrupt = Interrupt::CANCELLED;
                break;
            }
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                interrupt = Interrupt::TIMEOUT;
                break;
            }
            auto slice = std::min<std::chrono::steady_clock::duration>(kWaitSlice, deadline - now);
            state->condition.wait_for(lock, slice);
        }

        if (interrupt == Interrupt::TIMEOUT) {
            lock.unlock();
            cancel_source_.cancel("stage timeout after " + PipelineUtils::formatDuration(timeout));
            lock.lock();
        }

        if (interrupt != Interrupt::NONE) {
            // EN: A child run ends on its own once cancelled; a plain action gets the grace period.
            // FR: Un run enfant se termine seul une fois annulé ; une action simple a le délai de grâce.
            if (is_sub_pipeline) {
                state->condition.wait(lock, [&state] { return state->done; });
            } else {
                abandoned = !state->condition.wait_for(lock, grace_period + kAbandonMargin, [&state] { return state->done; });
            }
        } else if (cancel_source_.isCancelled()) {
            interrupt = Interrupt::CANCELLED;
        }
    }

    if (abandoned) {
        LOG_WARN_META("executor", "Action ignored cancellation, abandoning it", (std::unordered_map<std::string, std::string>{
            {"run_id", context_.getRunId()}, {"stage", stage_.name},
            {"grace_period", PipelineUtils::formatDuration(grace_period)}}));
        worker.detach();
    } else {
        worker.join();
    }

    result.execution_time = elapsedSince(body_start);

    // EN: An abandoned body may still write its state; only a joined body is read.
    // FR: Un corps abandonné peut encore écrire son état ; seul un corps joint est lu.
    ActionOutcome outcome;
    StageErrorKind failure_kind = StageErrorKind::ACTION_FAILURE;
    std::shared_ptr<const RunReport> sub_run;
    if (!abandoned) {
        outcome = state->outcome;
        failure_kind = state->failure_kind;
        sub_run = state->sub_run;
    }

    if (interrupt == Interrupt::TIMEOUT) {
        result.status = StageStatus::CANCELLED;
        result.error_kind = StageErrorKind::ACTION_TIMEOUT;
        result.error_message = "stage exceeded timeout of " + PipelineUtils::formatDuration(timeout);
        if (abandoned) {
            result.error_message += "; action abandoned after grace period";
        }
        result.exit_code = abandoned ? -1 : outcome.exit_code;
        result.sub_run = sub_run;
        return;
    }

    if (interrupt == Interrupt::CANCELLED) {
        if (sub_run) {
            applySubRun(sub_run, result);
            if (result.status != StageStatus::SUCCEEDED) {
                result.status = StageStatus::CANCELLED;
                result.error_kind = StageErrorKind::RUN_CANCELLED;
            }
            return;
        }
        if (!abandoned && outcome.success) {
            result.status = StageStatus::SUCCEEDED;
            return;
        }
        result.status = StageStatus::CANCELLED;
        result.error_kind = StageErrorKind::RUN_CANCELLED;
        result.error_message = "run cancelled: " + cancel_source_.token().reason();
        if (abandoned) {
            result.error_message += "; action abandoned after grace period";
        }
        result.exit_code = abandoned ? -1 : outcome.exit_code;
        return;
    }

    if (sub_run) {
        applySubRun(sub_run, result);
        return;
    }

    result.exit_code = outcome.exit_code;
    if (outcome.success) {
        result.status = StageStatus::SUCCEEDED;
    } else {
        result.status = StageStatus::FAILED;
        result.error_kind = failure_kind;
        result.error_message = outcome.message.empty()
            ? "action failed with exit code " + std::to_string(outcome.exit_code)
            : outcome.message;
    }
}

std::function<void(PipelineTask::BodyState&)> PipelineTask::prepareBody(PipelineStageResult& result) {
    if (const auto* sub = std::get_if<SubPipelineStageBody>(&stage_.body)) {
        PipelineEngine* engine = &engine_;
        SubPipelineStageBody body = *sub;
        RunParameters parent_parameters = context_.getParameters();
        CancellationToken token = cancel_source_.token();
        std::string run_id = context_.getRunId();
        std::string stage_name = stage_.name;

        return [engine, body, parent_parameters, token, run_id, stage_name](BodyState& state) {
            try {
                SubPipelineInvoker invoker(*engine);
                auto report = std::make_shared<const RunReport>(
                    invoker.invoke(body, parent_parameters, token, run_id, stage_name));
                std::lock_guard<std::mutex> guard(state.mutex);
                state.sub_run = report;
                state.outcome = report->isSuccess()
                    ? ActionOutcome::succeeded()
                    : ActionOutcome::failed(report->exitCode(), "sub-pipeline " + report->pipeline_name + " " +
                                            PipelineUtils::runStatusToString(report->status));
            } catch (const std::exception& e) {
                std::lock_guard<std::mutex> guard(state.mutex);
                state.outcome = ActionOutcome::failed(1, std::string("sub-pipeline error: ") + e.what());
                state.failure_kind = StageErrorKind::INTERNAL;
            }
        };
    }

    const auto& action_body = std::get<ActionStageBody>(stage_.body);
    auto action = engine_.getActionRegistry().find(action_body.action);
    if (!action) {
        result.status = StageStatus::FAILED;
        result.error_kind = StageErrorKind::INTERNAL;
        result.error_message = "unknown action '" + action_body.action + "'";
        return {};
    }

    if (action_body.action == "command") {
        result.output_path = context_.stageOutputPath(stage_.name);
    }
    ActionContext action_context = buildActionContext(action_body, result.output_path);
    StageAction callable = *action;

    return [callable, action_context](BodyState& state) {
        ActionOutcome outcome;
        try {
            outcome = callable(action_context);
        } catch (const ActionFailure& e) {
            outcome = ActionOutcome::failed(e.exitCode(), e.what());
        } catch (const std::exception& e) {
            outcome = ActionOutcome::failed(1, e.what());
        }
        std::lock_guard<std::mutex> guard(state.mutex);
        state.outcome = outcome;
    };
}

ActionContext PipelineTask::buildActionContext(const ActionStageBody& body, const std::string& output_path) const {
    const auto& parameters = context_.getParameters();

    ActionContext action_context;
    action_context.run_id = context_.getRunId();
    action_context.pipeline_name = context_.getDefinition().name;
    action_context.stage_name = stage_.name;
    action_context.parameters = parameters;
    action_context.output_path = output_path;
    action_context.cancel = cancel_source_.token();
    action_context.cancel_grace_period = engine_.getConfig().cancel_grace_period;

    for (const auto& [name, value] : context_.getDefinition().environment) {
        action_context.environment[name] = PipelineUtils::expandParameters(value, parameters);
    }
    for (const auto& [name, value] : stage_.environment) {
        action_context.environment[name] = PipelineUtils::expandParameters(value, parameters);
    }
    for (const auto& [name, value] : body.arguments) {
        action_context.arguments[name] = PipelineUtils::expandParameters(value, parameters);
    }
    action_context.run = PipelineUtils::expandParameters(body.run, parameters);
    for (const auto& arg : body.command) {
        action_context.command.push_back(PipelineUtils::expandParameters(arg, parameters));
    }
    return action_context;
}

void PipelineTask::applySubRun(std::shared_ptr<const RunReport> report, PipelineStageResult& result) const {
    result.sub_run = report;
    result.exit_code = report->exitCode();

    switch (report->status) {
        case RunStatus::SUCCEEDED:
            result.status = StageStatus::SUCCEEDED;
            break;
        case RunStatus::CANCELLED:
            result.status = StageStatus::CANCELLED;
            result.error_kind = StageErrorKind::RUN_CANCELLED;
            result.error_message = "sub-pipeline '" + report->pipeline_name + "' was cancelled";
            break;
        default: {
            result.status = StageStatus::FAILED;
            result.error_kind = StageErrorKind::ACTION_FAILURE;
            result.error_message = "sub-pipeline '" + report->pipeline_name + "' failed";
            for (const auto& stage : report->stages) {
                if (stage.status == StageStatus::FAILED ||
                    (stage.status == StageStatus::CANCELLED && stage.error_kind == StageErrorKind::ACTION_TIMEOUT)) {
                    result.error_message += " at stage '" + stage.stage_name + "': " + stage.error_message;
                    break;
                }
            }
            break;
        }
    }
}

} // namespace Orchestrator
} // namespace DPF
