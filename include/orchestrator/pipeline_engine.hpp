#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "infrastructure/threading/thread_pool.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "orchestrator/action_registry.hpp"
#include "orchestrator/cancellation.hpp"
#include "orchestrator/pipeline_definition.hpp"
#include "orchestrator/resource_lock.hpp"

#include <nlohmann/json.hpp>

namespace DPF {
namespace Orchestrator {

// EN: Forward declarations
// FR: Déclarations avancées
class PipelineEngine;
class PipelineExecutionContext;
struct RunReport;

// EN: Status of one stage within a run
// FR: Statut d'une étape dans un run
enum class StageStatus {
    BLOCKED = 0,                        // EN: Waiting for predecessors / FR: En attente des prédécesseurs
    READY = 1,                          // EN: Predecessors satisfied, condition true / FR: Prédécesseurs satisfaits, condition vraie
    RUNNING = 2,                        // EN: Dispatched to the executor / FR: Confiée à l'exécuteur
    SUCCEEDED = 3,
    FAILED = 4,
    CANCELLED = 5,                      // EN: Stage timeout or run cancellation / FR: Timeout d'étape ou annulation du run
    SKIPPED_BY_CONDITION = 6,           // EN: Condition false, satisfies dependents / FR: Condition fausse, satisfait les dépendants
    SKIPPED_BY_UPSTREAM_FAILURE = 7     // EN: A predecessor did not complete / FR: Un prédécesseur n'a pas abouti
};

// EN: Overall status of a run
// FR: Statut global d'un run
enum class RunStatus {
    PENDING = 0,
    RUNNING = 1,
    SUCCEEDED = 2,
    FAILED = 3,
    CANCELLED = 4
};

// EN: Why a stage did not succeed
// FR: Pourquoi une étape n'a pas réussi
enum class StageErrorKind {
    NONE = 0,
    LOCK_TIMEOUT = 1,       // EN: Resource lock not acquired in time / FR: Verrou non acquis à temps
    ACTION_FAILURE = 2,     // EN: Action failed or threw / FR: L'action a échoué ou levé
    ACTION_TIMEOUT = 3,     // EN: Stage timeout expired / FR: Timeout de l'étape expiré
    RUN_CANCELLED = 4,      // EN: Run cancellation / FR: Annulation du run
    INTERNAL = 5            // EN: Orchestrator-side error / FR: Erreur côté orchestrateur
};

// EN: Result of a pipeline stage execution
// FR: Résultat de l'exécution d'une étape du pipeline
struct PipelineStageResult {
    std::string stage_name;
    StageStatus status = StageStatus::BLOCKED;
    StageErrorKind error_kind = StageErrorKind::NONE;
    std::string error_message;
    int exit_code = 0;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::chrono::milliseconds execution_time{0};    // EN: Body only, lock wait excluded / FR: Corps seul, attente de verrou exclue
    std::chrono::milliseconds lock_wait_time{0};
    std::string output_path;                        // EN: Stage log file / FR: Fichier de log de l'étape
    std::shared_ptr<const RunReport> sub_run;       // EN: Nested run of a `uses:` stage / FR: Run imbriqué d'une étape `uses:`

    // EN: Status helpers
    // FR: Assistants de statut
    bool isTerminal() const;
    bool isSuccess() const { return status == StageStatus::SUCCEEDED; }
    bool satisfiesDependents() const {
        return status == StageStatus::SUCCEEDED || status == StageStatus::SKIPPED_BY_CONDITION;
    }
    bool blocksDependents() const {
        return status == StageStatus::FAILED || status == StageStatus::CANCELLED ||
               status == StageStatus::SKIPPED_BY_UPSTREAM_FAILURE;
    }
};

// EN: Final (or snapshot) report of one run, nested for sub-pipelines.
// FR: Rapport final (ou instantané) d'un run, imbriqué pour les sous-pipelines.
struct RunReport {
    std::string run_id;
    std::string pipeline_name;
    std::string parent_run_id;                  // EN: Empty for top-level runs / FR: Vide pour les runs de premier niveau
    std::string parent_stage;
    RunStatus status = RunStatus::PENDING;
    RunParameters parameters;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::chrono::milliseconds duration{0};
    std::vector<PipelineStageResult> stages;    // EN: Definition order / FR: Ordre de définition
    uint32_t definition_checksum = 0;
    bool cancelled_by_request = false;
    std::string cancel_reason;

    const PipelineStageResult* findStage(const std::string& stage_name) const;
    size_t countStages(StageStatus status) const;
    bool isSuccess() const { return status == RunStatus::SUCCEEDED; }

    // EN: Process exit code: 0 succeeded, 1 failed, 2 cancelled.
    // FR: Code de sortie : 0 réussi, 1 échoué, 2 annulé.
    int exitCode() const;
};

// EN: Event types for run monitoring
// FR: Types d'événements pour le monitoring des runs
enum class PipelineEventType {
    RUN_STARTED,
    RUN_COMPLETED,
    RUN_FAILED,
    RUN_CANCELLED,
    STAGE_READY,
    STAGE_STARTED,
    STAGE_COMPLETED,
    STAGE_FAILED,
    STAGE_CANCELLED,
    STAGE_SKIPPED,
    LOCK_WAITING,
    LOCK_ACQUIRED,
    LOCK_RELEASED
};

// EN: Event data for run monitoring
// FR: Données d'événement pour le monitoring des runs
struct PipelineEvent {
    PipelineEventType type;
    std::chrono::system_clock::time_point timestamp;
    std::string run_id;
    std::string pipeline_name;
    std::string stage_name;
    std::string message;
    std::map<std::string, std::string> metadata;
};

// EN: Callback function type for run events. Called from scheduler and worker threads.
// FR: Type de fonction de rappel pour les événements. Appelée depuis les threads ordonnanceur et workers.
using PipelineEventCallback = std::function<void(const PipelineEvent&)>;

// EN: Dependency graph of a definition: arena of nodes with index-based edges.
// EN: Node i is stage i of the definition.
// FR: Graphe de dépendances d'une définition : arène de nœuds avec arêtes par indices.
// FR: Le nœud i est l'étape i de la définition.
class PipelineDependencyResolver {
public:
    explicit PipelineDependencyResolver(const PipelineDefinition& definition);

    // EN: Validation: duplicate or invalid names, dangling references, self-dependencies, cycles.
    // EN: Returns every problem found (empty = valid).
    // FR: Validation : noms dupliqués ou invalides, références pendantes, auto-dépendances, cycles.
    // FR: Retourne tous les problèmes trouvés (vide = valide).
    std::vector<std::string> validate() const;
    void validateOrThrow() const;

    bool hasCircularDependency() const;
    // EN: One cycle as a closed path of stage names (first == last), empty without cycle.
    // FR: Un cycle sous forme de chemin fermé (premier == dernier), vide sans cycle.
    std::vector<std::string> getCircularDependencies() const;

    // EN: Topological order, stable with respect to definition order. Throws DefinitionError on a cycle.
    // FR: Ordre topologique, stable par rapport à l'ordre de définition. Lève DefinitionError sur un cycle.
    std::vector<std::string> getExecutionOrder() const;
    std::vector<size_t> getExecutionOrderIndices() const;

    // EN: Groups of stages whose predecessors all belong to earlier groups.
    // FR: Groupes d'étapes dont tous les prédécesseurs appartiennent aux groupes précédents.
    std::vector<std::vector<std::string>> getExecutionLevels() const;

    std::vector<std::string> getDependents(const std::string& stage_name) const;
    std::vector<std::string> getDependencies(const std::string& stage_name) const;
    std::vector<std::string> getTransitiveDependents(const std::string& stage_name) const;

    std::optional<size_t> indexOf(const std::string& stage_name) const;
    const std::vector<size_t>& predecessorsOf(size_t index) const { return nodes_.at(index).predecessors; }
    const std::vector<size_t>& successorsOf(size_t index) const { return nodes_.at(index).successors; }
    const std::string& nameOf(size_t index) const { return nodes_.at(index).name; }
    size_t size() const { return nodes_.size(); }

private:
    struct Node {
        std::string name;
        std::vector<size_t> predecessors;
        std::vector<size_t> successors;
        std::vector<std::string> missing;   // EN: Dangling `needs` / FR: `needs` pendants
        bool self_dependency = false;
    };

    std::optional<std::vector<size_t>> topologicalSort() const;
    std::vector<size_t> findCycle() const;
    std::vector<std::string> namesOf(const std::vector<size_t>& indices) const;

    std::vector<Node> nodes_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<std::string> duplicates_;
};

// EN: State of one run: stage results, cancellation, events and log locations.
// FR: État d'un run : résultats d'étapes, annulation, événements et emplacements de logs.
class PipelineExecutionContext {
public:
    PipelineExecutionContext(std::string run_id,
                             std::shared_ptr<const PipelineDefinition> definition,
                             RunParameters parameters,
                             const CancellationToken& parent_cancel,
                             std::string log_directory,
                             PipelineEventCallback event_callback,
                             std::string parent_run_id = "",
                             std::string parent_stage = "");
    ~PipelineExecutionContext() = default;

    // EN: Context accessors
    // FR: Accesseurs de contexte
    const std::string& getRunId() const { return run_id_; }
    const PipelineDefinition& getDefinition() const { return *definition_; }
    const std::shared_ptr<const PipelineDefinition>& getDefinitionPtr() const { return definition_; }
    const RunParameters& getParameters() const { return parameters_; }
    const std::string& getParentRunId() const { return parent_run_id_; }
    const std::string& getParentStage() const { return parent_stage_; }

    // EN: State management
    // FR: Gestion d'état
    void updateStageResult(size_t index, const PipelineStageResult& result);
    PipelineStageResult getStageResult(size_t index) const;
    std::optional<PipelineStageResult> getStageResult(const std::string& stage_name) const;
    std::vector<PipelineStageResult> getAllStageResults() const;
    StageStatus getStageStatus(size_t index) const;
    void setStageStatus(size_t index, StageStatus status);

    // EN: Execution control. The token is also cancelled when the parent run is.
    // FR: Contrôle d'exécution. Le token est aussi annulé quand le run parent l'est.
    bool requestCancellation(const std::string& reason);
    bool isCancelled() const { return cancel_source_.isCancelled(); }
    bool wasCancelledByRequest() const { return cancelled_by_request_; }
    CancellationToken getCancellationToken() const { return cancel_source_.token(); }

    // EN: Event handling
    // FR: Gestion d'événements
    void emitEvent(PipelineEventType type, const std::string& stage_name = "",
                   const std::string& message = "",
                   const std::map<std::string, std::string>& metadata = {}) const;

    // EN: `<log_directory>/<run_id>/<stage>.log`, directory created on demand; empty when logs are disabled.
    // FR: `<log_directory>/<run_id>/<stage>.log`, répertoire créé à la demande ; vide si logs désactivés.
    std::string stageOutputPath(const std::string& stage_name) const;

    void markStarted();
    void markFinished();

    // EN: FAILED if a stage failed or timed out, CANCELLED if the run was cancelled
    // EN: (or a sub-run was) and nothing failed, otherwise SUCCEEDED.
    // FR: FAILED si une étape a échoué ou expiré, CANCELLED si le run (ou un sous-run) a été
    // FR: annulé sans échec, sinon SUCCEEDED.
    RunStatus computeRunStatus() const;
    RunReport buildReport() const;

private:
    std::string run_id_;
    std::shared_ptr<const PipelineDefinition> definition_;
    RunParameters parameters_;
    std::string log_directory_;
    PipelineEventCallback event_callback_;
    std::string parent_run_id_;
    std::string parent_stage_;

    CancellationSource cancel_source_;
    std::atomic<bool> cancelled_by_request_{false};
    std::string cancel_reason_;

    mutable std::mutex results_mutex_;
    std::vector<PipelineStageResult> stage_results_;
    std::chrono::system_clock::time_point start_time_;
    std::chrono::system_clock::time_point end_time_;
    std::chrono::steady_clock::time_point steady_start_;
    std::chrono::milliseconds duration_{0};
    bool finished_ = false;
};

// EN: Stage Executor: lock acquisition, body with timeout, outcome capture. One instance per dispatch.
// FR: Exécuteur d'étape : acquisition de verrou, corps avec timeout, capture du résultat. Une instance par dispatch.
class PipelineTask {
public:
    PipelineTask(const StageSpec& stage, PipelineExecutionContext& context, PipelineEngine& engine);
    ~PipelineTask() = default;

    // EN: Task execution. Never throws; every failure is captured in the result.
    // FR: Exécution de tâche. Ne lève jamais ; tout échec est capturé dans le résultat.
    PipelineStageResult execute();
    void cancel(const std::string& reason);
    bool isCancelled() const { return cancel_source_.isCancelled(); }

    // EN: Task information
    // FR: Informations de tâche
    const std::string& getName() const { return stage_.name; }
    const StageSpec& getStage() const { return stage_; }
    StageStatus getStatus() const { return status_.load(); }

private:
    struct BodyState;

    PipelineStageResult executeInternal(PipelineStageResult result);
    void runBody(PipelineStageResult& result);

    // EN: Build the body callable; returns an empty function (and fills `result`) when it cannot start.
    // FR: Construit l'appelable du corps ; retourne une fonction vide (et remplit `result`) s'il ne peut démarrer.
    std::function<void(BodyState&)> prepareBody(PipelineStageResult& result);
    ActionContext buildActionContext(const ActionStageBody& body, const std::string& output_path) const;
    void applySubRun(std::shared_ptr<const RunReport> report, PipelineStageResult& result) const;
    void updateStatus(StageStatus status) { status_.store(status); }

    const StageSpec& stage_;
    PipelineExecutionContext& context_;
    PipelineEngine& engine_;
    CancellationSource cancel_source_;
    std::atomic<StageStatus> status_{StageStatus::READY};
};

// EN: Dependency Graph Scheduler for one run. Drives stages to terminal states on the
// EN: calling thread and dispatches Ready stages to a worker pool owned by the run.
// FR: Ordonnanceur du graphe pour un run. Amène les étapes à un état terminal sur le thread
// FR: appelant et confie les étapes prêtes à un pool de workers propre au run.
class PipelineScheduler {
public:
    PipelineScheduler(PipelineExecutionContext& context, PipelineEngine& engine, size_t max_parallelism);
    ~PipelineScheduler();

    PipelineScheduler(const PipelineScheduler&) = delete;
    PipelineScheduler& operator=(const PipelineScheduler&) = delete;

    // EN: Blocks until every stage is terminal.
    // FR: Bloque jusqu'à ce que toutes les étapes soient terminales.
    void run();

    size_t getPeakConcurrency() const { return peak_running_; }

private:
    struct Completion {
        size_t index;
        PipelineStageResult result;
    };

    void propagate();
    void dispatchReady();
    void dispatch(size_t index);
    bool drainCompletions();
    bool allTerminal() const;
    void finishStage(size_t index, PipelineStageResult result);
    void settleStage(size_t index, StageStatus status, StageErrorKind kind, const std::string& message);

    PipelineExecutionContext& context_;
    PipelineEngine& engine_;
    PipelineDependencyResolver resolver_;
    std::vector<size_t> order_;
    size_t max_parallelism_;
    std::unique_ptr<ThreadPool> pool_;

    std::mutex completion_mutex_;
    std::condition_variable completion_condition_;
    std::vector<Completion> completions_;
    std::vector<std::future<void>> futures_;

    size_t running_ = 0;
    size_t peak_running_ = 0;
};

// EN: Sub-pipeline Invoker: runs a `uses:` body as an independent child run.
// FR: Invocateur de sous-pipeline : exécute un corps `uses:` comme run enfant indépendant.
class SubPipelineInvoker {
public:
    explicit SubPipelineInvoker(PipelineEngine& engine) : engine_(engine) {}

    // EN: Interpolate `${name}` in binding values from the parent's parameters only.
    // EN: References to unknown parameters are left untouched.
    // FR: Interpole `${nom}` dans les liaisons à partir des seuls paramètres du parent.
    // FR: Les références inconnues sont laissées telles quelles.
    static RunParameters bindParameters(const SubPipelineStageBody& body, const RunParameters& parent_parameters);

    // EN: Run the referenced definition to completion with the bound parameter set.
    // FR: Exécute la définition référencée jusqu'au bout avec les paramètres liés.
    RunReport invoke(const SubPipelineStageBody& body,
                     const RunParameters& parent_parameters,
                     const CancellationToken& cancel,
                     const std::string& parent_run_id,
                     const std::string& parent_stage);

private:
    PipelineEngine& engine_;
};

// EN: Run Controller: validates definitions, drives runs and keeps their history.
// FR: Contrôleur de runs : valide les définitions, pilote les runs et garde leur historique.
class PipelineEngine {
public:
    struct Config {
        size_t max_parallelism = 0;                                   // EN: 0 = number of stages / FR: 0 = nombre d'étapes
        std::chrono::milliseconds default_stage_timeout{std::chrono::hours(1)};
        std::chrono::milliseconds default_lock_timeout{std::chrono::minutes(30)};
        std::chrono::milliseconds cancel_grace_period{5000};          // EN: Before abandoning an action / FR: Avant d'abandonner une action
        std::string log_directory = ".dpf/runs";                      // EN: Empty = stage output not captured / FR: Vide = sortie non capturée
        size_t max_run_history = 100;
        bool inject_runner_context = true;                            // EN: Add runner.os/arch/host parameters / FR: Ajoute les paramètres runner.os/arch/host
    };

    PipelineEngine();
    explicit PipelineEngine(const Config& config,
                            std::shared_ptr<ActionRegistry> actions = nullptr,
                            std::shared_ptr<ResourceLockManager> locks = nullptr);
    ~PipelineEngine();

    PipelineEngine(const PipelineEngine&) = delete;
    PipelineEngine& operator=(const PipelineEngine&) = delete;

    // EN: Graph validation plus action lookup, recursively through sub-pipelines. Throws DefinitionError.
    // FR: Validation du graphe et des actions, récursivement dans les sous-pipelines. Lève DefinitionError.
    void validate(const PipelineDefinition& definition) const;

    // EN: Run execution. Throws DefinitionError before dispatching anything when the definition
    // EN: or the parameters are invalid.
    // FR: Exécution de run. Lève DefinitionError avant tout dispatch si la définition ou les
    // FR: paramètres sont invalides.
    RunReport run(std::shared_ptr<const PipelineDefinition> definition, const RunParameters& parameters = {});
    std::future<RunReport> runAsync(std::shared_ptr<const PipelineDefinition> definition,
                                    const RunParameters& parameters = {});

    // EN: Child run of a sub-pipeline stage; `bound` already holds the binding.
    // FR: Run enfant d'une étape sous-pipeline ; `bound` contient déjà la liaison.
    RunReport runChild(std::shared_ptr<const PipelineDefinition> definition,
                       const RunParameters& bound,
                       const CancellationToken& parent_cancel,
                       const std::string& parent_run_id,
                       const std::string& parent_stage);

    // EN: Run control
    // FR: Contrôle des runs
    bool cancelRun(const std::string& run_id, const std::string& reason = "cancelled by request");
    size_t cancelAll(const std::string& reason = "cancelled by request");
    std::vector<std::string> getActiveRunIds() const;

    // EN: Snapshot of an active run, or its final report from history.
    // FR: Instantané d'un run actif, ou son rapport final depuis l'historique.
    std::optional<RunReport> getRunReport(const std::string& run_id) const;
    std::vector<RunReport> getRunHistory() const;

    void registerEventCallback(PipelineEventCallback callback);
    void unregisterEventCallback();

    struct EngineStatistics {
        size_t total_runs = 0;
        size_t successful_runs = 0;
        size_t failed_runs = 0;
        size_t cancelled_runs = 0;
        size_t child_runs = 0;
        size_t active_runs = 0;
        size_t total_stages_executed = 0;
        std::chrono::milliseconds total_run_time{0};
        std::chrono::system_clock::time_point engine_start_time;
        std::chrono::milliseconds engine_uptime{0};
    };

    EngineStatistics getEngineStatistics() const;

    // EN: Collaborators
    // FR: Collaborateurs
    const Config& getConfig() const;
    ActionRegistry& getActionRegistry();
    ResourceLockManager& getLockManager();

    // EN: Cancel active runs, wait for them, and refuse new ones.
    // FR: Annule les runs actifs, les attend, et refuse les nouveaux.
    void shutdown();

private:
    // EN: Internal implementation
    // FR: Implémentation interne
    class PipelineEngineImpl;
    std::unique_ptr<PipelineEngineImpl> impl_;
};

// EN: Engine and lock settings derived from the configuration (engine.*, locks.*, logging.*, runs.*).
// FR: Réglages moteur et verrous dérivés de la configuration (engine.*, locks.*, logging.*, runs.*).
struct EngineSettings {
    PipelineEngine::Config engine;
    std::string lock_backend = "file";
    std::string lock_directory = ".dpf/locks";
    std::string log_level = "INFO";
    std::string log_file;

    static void registerDefaults(ConfigManager& config);
    static EngineSettings fromConfig(const ConfigManager& config);

    std::shared_ptr<ResourceLockManager> createLockManager() const;
};

// EN: Utility functions for pipeline management
// FR: Fonctions utilitaires pour la gestion de pipeline
namespace PipelineUtils {

    // EN: Validation helpers
    // FR: Assistants de validation
    bool isValidStageName(const std::string& name);

    // EN: Time and duration utilities
    // FR: Utilitaires de temps et de durée
    std::string formatDuration(std::chrono::milliseconds duration);
    std::string formatTimestamp(std::chrono::system_clock::time_point timestamp);
    // EN: `500ms`, `30s`, `10m`, `1h` or a bare integer in seconds.
    // FR: `500ms`, `30s`, `10m`, `1h` ou un entier nu en secondes.
    std::optional<std::chrono::milliseconds> parseDuration(const std::string& text);

    // EN: Status conversion utilities
    // FR: Utilitaires de conversion de statut
    std::string statusToString(StageStatus status);
    std::string runStatusToString(RunStatus status);
    std::string errorKindToString(StageErrorKind kind);
    std::string eventTypeToString(PipelineEventType type);

    // EN: Replace `${name}` with parameter values; unknown names are left as written.
    // FR: Remplace `${nom}` par les valeurs des paramètres ; les noms inconnus restent tels quels.
    std::string expandParameters(const std::string& text, const RunParameters& parameters);

    std::string generateRunId(const std::string& pipeline_name);

    // EN: runner.os, runner.arch and runner.host of the current machine.
    // FR: runner.os, runner.arch et runner.host de la machine courante.
    RunParameters detectRunnerContext();

    // EN: Reporting
    // FR: Rapports
    nlohmann::json runReportToJson(const RunReport& report);
    bool saveRunReport(const RunReport& report, const std::string& filepath);
    std::string formatRunSummary(const RunReport& report);
    std::string formatExecutionPlan(const PipelineDefinition& definition, const RunParameters& parameters);

    // EN: 0 succeeded, 1 failed, 2 cancelled (3 and 4 are used by dpfctl for definition and usage errors).
    // FR: 0 réussi, 1 échoué, 2 annulé (3 et 4 sont utilisés par dpfctl pour les erreurs de définition et d'usage).
    int exitCodeForStatus(RunStatus status);
}

} // namespace Orchestrator
} // namespace DPF
