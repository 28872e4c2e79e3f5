#include "orchestrator/pipeline_engine.hpp"
#include "orchestrator/pipeline_errors.hpp"

#include <algorithm>
#include <deque>
#include <set>
#include <system_error>

namespace DPF {
namespace Orchestrator {

class PipelineEngine::PipelineEngineImpl {
public:
    PipelineEngineImpl(PipelineEngine& owner, const Config& config,
                       std::shared_ptr<ActionRegistry> actions,
                       std::shared_ptr<ResourceLockManager> locks)
        : owner_(owner),
          config_(config),
          actions_(actions ? std::move(actions) : ActionRegistry::createWithBuiltins()),
          locks_(locks ? std::move(locks)
                       : std::make_shared<ResourceLockManager>(std::make_shared<InProcessLockProvider>())) {
        stats_.engine_start_time = std::chrono::system_clock::now();
        if (config_.inject_runner_context) {
            runner_context_ = PipelineUtils::detectRunnerContext();
        }
    }

    void validate(const PipelineDefinition& definition) const {
        std::vector<std::string> problems;
        std::vector<const PipelineDefinition*> stack;
        collectProblems(definition, "", stack, problems);
        if (!problems.empty()) {
            throw DefinitionError(problems, definition.source_path.empty() ? definition.name : definition.source_path);
        }
    }

    RunReport execute(std::shared_ptr<const PipelineDefinition> definition,
                      const RunParameters& supplied,
                      const CancellationToken& parent_cancel,
                      const std::string& parent_run_id,
                      const std::string& parent_stage) {
        if (!definition) {
            throw std::invalid_argument("PipelineEngine::run requires a definition");
        }

        validate(*definition);
        RunParameters parameters = definition->bindParameters(supplied);
        for (const auto& [name, value] : runner_context_) {
            parameters.emplace(name, value);
        }

        const std::string run_id = PipelineUtils::generateRunId(definition->name);
        auto context = std::make_shared<PipelineExecutionContext>(
            run_id, definition, parameters, parent_cancel, config_.log_directory,
            [this](const PipelineEvent& event) { dispatchEvent(event); },
            parent_run_id, parent_stage);

        {
            std::lock_guard<std::mutex> lock(runs_mutex_);
            if (shutting_down_) {
                throw PipelineError("engine is shutting down");
            }
            active_runs_[run_id] = context;
        }

        // EN: The run leaves the active set on every exit path.
        // FR: Le run quitte l'ensemble actif sur tous les chemins de sortie.
        struct ActiveRunGuard {
            PipelineEngineImpl& impl;
            const std::string& run_id;
            ~ActiveRunGuard() {
                {
                    std::lock_guard<std::mutex> lock(impl.runs_mutex_);
                    impl.active_runs_.erase(run_id);
                }
                impl.runs_condition_.notify_all();
            }
        } guard{*this, run_id};

        std::unordered_map<std::string, std::string> metadata = {
            {"run_id", run_id},
            {"pipeline", definition->name},
            {"stages", std::to_string(definition->stages.size())}
        };
        if (!parent_run_id.empty()) {
            metadata["parent_run_id"] = parent_run_id;
            metadata["parent_stage"] = parent_stage;
        }
        LOG_INFO_META("engine", "Run started", metadata);

        context->markStarted();
        context->emitEvent(PipelineEventType::RUN_STARTED, "", definition->name);

        {
            PipelineScheduler scheduler(*context, owner_, config_.max_parallelism);
            scheduler.run();
        }

        context->markFinished();
        RunReport report = context->buildReport();

        metadata["status"] = PipelineUtils::runStatusToString(report.status);
        metadata["duration"] = PipelineUtils::formatDuration(report.duration);
        switch (report.status) {
            case RunStatus::SUCCEEDED:
                LOG_INFO_META("engine", "Run finished", metadata);
                context->emitEvent(PipelineEventType::RUN_COMPLETED, "", definition->name);
                break;
            case RunStatus::CANCELLED:
                LOG_WARN_META("engine", "Run finished", metadata);
                context->emitEvent(PipelineEventType::RUN_CANCELLED, "", report.cancel_reason);
                break;
            default:
                LOG_WARN_META("engine", "Run finished", metadata);
                context->emitEvent(PipelineEventType::RUN_FAILED, "", definition->name);
                break;
        }

        recordRun(report);
        return report;
    }

    bool cancelRun(const std::string& run_id, const std::string& reason) {
        std::shared_ptr<PipelineExecutionContext> context;
        {
            std::lock_guard<std::mutex> lock(runs_mutex_);
            auto it = active_runs_.find(run_id);
            if (it == active_runs_.end()) {
                return false;
            }
            context = it->second;
        }
        return context->requestCancellation(reason);
    }

    size_t cancelAll(const std::string& reason) {
        std::vector<std::shared_ptr<PipelineExecutionContext>> roots;
        {
            std::lock_guard<std::mutex> lock(runs_mutex_);
            for (const auto& [id, context] : active_runs_) {
                // EN: Child runs follow their parent through the linked cancellation token.
                // FR: Les runs enfants suivent leur parent via le token d'annulation lié.
                if (context->getParentRunId().empty()) {
                    roots.push_back(context);
                }
            }
        }

        size_t cancelled = 0;
        for (const auto& context : roots) {
            if (context->requestCancellation(reason)) {
                ++cancelled;
            }
        }
        return cancelled;
    }

    std::vector<std::string> getActiveRunIds() const {
        std::lock_guard<std::mutex> lock(runs_mutex_);
        std::vector<std::string> ids;
        for (const auto& [id, context] : active_runs_) {
            ids.push_back(id);
        }
        std::sort(ids.begin(), ids.end());
        return ids;
    }

    std::optional<RunReport> getRunReport(const std::string& run_id) const {
        std::lock_guard<std::mutex> lock(runs_mutex_);
        auto active = active_runs_.find(run_id);
        if (active != active_runs_.end()) {
            return active->second->buildReport();
        }
        for (const auto& report : history_) {
            if (auto found = findNested(report, run_id)) {
                return *found;
            }
        }
        return std::nullopt;
    }

    std::vector<RunReport> getRunHistory() const {
        std::lock_guard<std::mutex> lock(runs_mutex_);
        return std::vector<RunReport>(history_.begin(), history_.end());
    }

    void registerEventCallback(PipelineEventCallback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    EngineStatistics getEngineStatistics() const {
        std::lock_guard<std::mutex> lock(runs_mutex_);
        EngineStatistics stats = stats_;
        stats.active_runs = active_runs_.size();
        stats.engine_uptime = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now() - stats_.engine_start_time);
        return stats;
    }

    // EN: Account for a runAsync thread before it starts; false once shutdown began.
    // FR: Comptabilise un thread runAsync avant son démarrage ; faux une fois l'arrêt commencé.
    bool beginLaunch() {
        std::lock_guard<std::mutex> lock(runs_mutex_);
        if (shutting_down_) {
            return false;
        }
        ++pending_launches_;
        return true;
    }

    // EN: Last access to the engine from a runAsync thread. Notifying under the lock keeps
    //     shutdown() from returning before this thread is done with the engine.
    // FR: Dernier accès au moteur depuis un thread runAsync. Notifier sous le verrou empêche
    //     shutdown() de retourner avant que ce thread n'en ait fini avec le moteur.
    void endLaunch() {
        std::lock_guard<std::mutex> lock(runs_mutex_);
        --pending_launches_;
        runs_condition_.notify_all();
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(runs_mutex_);
            if (shutting_down_ && active_runs_.empty() && pending_launches_ == 0) {
                return;
            }
            shutting_down_ = true;
        }

        size_t cancelled = cancelAll("engine shutdown");
        if (cancelled > 0) {
            LOG_WARN("engine", "Shutdown cancelled " + std::to_string(cancelled) + " active run(s)");
        }

        // EN: A launch that has not registered its run yet is refused by execute() and still counted here.
        // FR: Un lancement qui n'a pas encore enregistré son run est refusé par execute() et reste compté ici.
        std::unique_lock<std::mutex> lock(runs_mutex_);
        runs_condition_.wait(lock, [this] { return active_runs_.empty() && pending_launches_ == 0; });
    }

    PipelineEngine& owner_;
    Config config_;
    std::shared_ptr<ActionRegistry> actions_;
    std::shared_ptr<ResourceLockManager> locks_;

private:
    void collectProblems(const PipelineDefinition& definition, const std::string& prefix,
                         std::vector<const PipelineDefinition*>& stack,
                         std::vector<std::string>& problems) const {
        if (std::find(stack.begin(), stack.end(), &definition) != stack.end()) {
            problems.push_back(prefix + "recursive pipeline reference to '" + definition.name + "'");
            return;
        }
        stack.push_back(&definition);

        if (definition.stages.empty()) {
            problems.push_back(prefix + "pipeline declares no stages");
        }

        PipelineDependencyResolver resolver(definition);
        for (const auto& problem : resolver.validate()) {
            problems.push_back(prefix + problem);
        }

        for (const auto& stage : definition.stages) {
            if (const auto* action = std::get_if<ActionStageBody>(&stage.body)) {
                if (!actions_->hasAction(action->action)) {
                    problems.push_back(prefix + "stage '" + stage.name + "': unknown action '" + action->action + "'");
                }
                continue;
            }

            const auto& sub = std::get<SubPipelineStageBody>(stage.body);
            for (const auto& problem : sub.bindingProblems(stage.name)) {
                problems.push_back(prefix + problem);
            }
            if (sub.definition) {
                collectProblems(*sub.definition, prefix + "in '" + sub.definition->name + "': ", stack, problems);
            }
        }

        stack.pop_back();
    }

    void dispatchEvent(const PipelineEvent& event) const {
        PipelineEventCallback callback;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            callback = callback_;
        }
        if (callback) {
            callback(event);
        }
    }

    void recordRun(const RunReport& report) {
        std::lock_guard<std::mutex> lock(runs_mutex_);

        for (const auto& stage : report.stages) {
            if (stage.status == StageStatus::SUCCEEDED || stage.status == StageStatus::FAILED ||
                (stage.status == StageStatus::CANCELLED && stage.execution_time.count() > 0)) {
                ++stats_.total_stages_executed;
            }
        }

        // EN: Child reports live inside their parent stage result, not in the history.
        // FR: Les rapports enfants vivent dans le résultat de l'étape parente, pas dans l'historique.
        if (!report.parent_run_id.empty()) {
            ++stats_.child_runs;
            return;
        }

        ++stats_.total_runs;
        stats_.total_run_time += report.duration;
        switch (report.status) {
            case RunStatus::SUCCEEDED: ++stats_.successful_runs; break;
            case RunStatus::CANCELLED: ++stats_.cancelled_runs; break;
            default: ++stats_.failed_runs; break;
        }

        history_.push_back(report);
        while (config_.max_run_history > 0 && history_.size() > config_.max_run_history) {
            history_.pop_front();
        }
    }

    static std::optional<RunReport> findNested(const RunReport& report, const std::string& run_id) {
        if (report.run_id == run_id) {
            return report;
        }
        for (const auto& stage : report.stages) {
            if (stage.sub_run) {
                if (auto found = findNested(*stage.sub_run, run_id)) {
                    return found;
                }
            }
        }
        return std::nullopt;
    }

    RunParameters runner_context_;

    mutable std::mutex runs_mutex_;
    std::condition_variable runs_condition_;
    std::unordered_map<std::string, std::shared_ptr<PipelineExecutionContext>> active_runs_;
    std::deque<RunReport> history_;
    EngineStatistics stats_;
    bool shutting_down_ = false;
    size_t pending_launches_ = 0;

    mutable std::mutex callback_mutex_;
    PipelineEventCallback callback_;
};

// EN: PipelineEngine public interface
// FR: Interface publique de PipelineEngine

PipelineEngine::PipelineEngine() : PipelineEngine(Config{}) {}

PipelineEngine::PipelineEngine(const Config& config,
                               std::shared_ptr<ActionRegistry> actions,
                               std::shared_ptr<ResourceLockManager> locks)
    : impl_(std::make_unique<PipelineEngineImpl>(*this, config, std::move(actions), std::move(locks))) {}

PipelineEngine::~PipelineEngine() {
    if (impl_) {
        impl_->shutdown();
    }
}

void PipelineEngine::validate(const PipelineDefinition& definition) const {
    impl_->validate(definition);
}

RunReport PipelineEngine::run(std::shared_ptr<const PipelineDefinition> definition, const RunParameters& parameters) {
    return impl_->execute(std::move(definition), parameters, CancellationToken(), "", "");
}

std::future<RunReport> PipelineEngine::runAsync(std::shared_ptr<const PipelineDefinition> definition,
                                                const RunParameters& parameters) {
    if (!impl_->beginLaunch()) {
        return std::async(std::launch::deferred, []() -> RunReport {
            throw PipelineError("engine is shutting down");
        });
    }

    PipelineEngineImpl* impl = impl_.get();
    try {
        return std::async(std::launch::async, [impl, definition, parameters]() {
            struct LaunchGuard {
                PipelineEngineImpl* impl;
                ~LaunchGuard() { impl->endLaunch(); }
            } guard{impl};
            return impl->execute(definition, parameters, CancellationToken(), "", "");
        });
    } catch (const std::system_error&) {
        impl->endLaunch();
        throw;
    }
}

RunReport PipelineEngine::runChild(std::shared_ptr<const PipelineDefinition> definition,
                                   const RunParameters& bound,
                                   const CancellationToken& parent_cancel,
                                   const std::string& parent_run_id,
                                   const std::string& parent_stage) {
    return impl_->execute(std::move(definition), bound, parent_cancel, parent_run_id, parent_stage);
}

bool PipelineEngine::cancelRun(const std::string& run_id, const std::string& reason) {
    return impl_->cancelRun(run_id, reason);
}

size_t PipelineEngine::cancelAll(const std::string& reason) {
    return impl_->cancelAll(reason);
}

std::vector<std::string> PipelineEngine::getActiveRunIds() const {
    return impl_->getActiveRunIds();
}

std::optional<RunReport> PipelineEngine::getRunReport(const std::string& run_id) const {
    return impl_->getRunReport(run_id);
}

std::vector<RunReport> PipelineEngine::getRunHistory() const {
    return impl_->getRunHistory();
}

void PipelineEngine::registerEventCallback(PipelineEventCallback callback) {
    impl_->registerEventCallback(std::move(callback));
}

void PipelineEngine::unregisterEventCallback() {
    impl_->registerEventCallback(nullptr);
}

PipelineEngine::EngineStatistics PipelineEngine::getEngineStatistics() const {
    return impl_->getEngineStatistics();
}

const PipelineEngine::Config& PipelineEngine::getConfig() const {
    return impl_->config_;
}

ActionRegistry& PipelineEngine::getActionRegistry() {
    return *impl_->actions_;
}

ResourceLockManager& PipelineEngine::getLockManager() {
    return *impl_->locks_;
}

void PipelineEngine::shutdown() {
    impl_->shutdown();
}

} // namespace Orchestrator
} // namespace DPF
