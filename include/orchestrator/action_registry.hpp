#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "orchestrator/cancellation.hpp"
#include "orchestrator/condition_expression.hpp"

namespace DPF {
namespace Orchestrator {

// EN: Everything an action receives: identity, key/value bundle, arguments, cancellation and log path.
// FR: Tout ce qu'une action reçoit : identité, paramètres clé/valeur, arguments, annulation et chemin de log.
struct ActionContext {
    std::string run_id;
    std::string pipeline_name;
    std::string stage_name;
    RunParameters parameters;                           // EN: Bound run parameters / FR: Paramètres liés du run
    std::map<std::string, std::string> environment;     // EN: Pipeline + stage env, expanded / FR: Env pipeline + stage, étendu
    std::map<std::string, std::string> arguments;       // EN: `with:` arguments, expanded / FR: Arguments `with:`, étendus
    std::string run;                                    // EN: Shell command line (command action) / FR: Ligne shell (action command)
    std::vector<std::string> command;                   // EN: argv form (command action) / FR: Forme argv (action command)
    std::string output_path;                            // EN: Stage log file, empty = inherit / FR: Fichier de log, vide = hérité
    CancellationToken cancel;
    std::chrono::milliseconds cancel_grace_period{5000};
};

// EN: Result reported by an action. Non-success is recorded as ACTION_FAILURE without interpretation.
// FR: Résultat rapporté par une action. Un échec est enregistré en ACTION_FAILURE sans interprétation.
struct ActionOutcome {
    bool success = false;
    int exit_code = 0;
    std::string message;

    static ActionOutcome succeeded(const std::string& message = "") { return {true, 0, message}; }
    static ActionOutcome failed(int exit_code, const std::string& message) { return {false, exit_code, message}; }
};

// EN: Stage action collaborator. May also throw ActionFailure (or any std::exception) to fail.
// FR: Collaborateur action de stage. Peut aussi lever ActionFailure (ou toute std::exception) pour échouer.
using StageAction = std::function<ActionOutcome(const ActionContext&)>;

// EN: Named stage actions available to definitions (`action:` key; `run`/`command` use "command").
// FR: Actions de stage nommées disponibles pour les définitions (clé `action:` ; `run`/`command` utilisent "command").
class ActionRegistry {
public:
    ActionRegistry() = default;

    // EN: Registry preloaded with the built-in command, noop and sleep actions.
    // FR: Registre préchargé avec les actions intégrées command, noop et sleep.
    static std::shared_ptr<ActionRegistry> createWithBuiltins();

    void registerAction(const std::string& name, StageAction action);
    bool unregisterAction(const std::string& name);
    bool hasAction(const std::string& name) const;
    std::optional<StageAction> find(const std::string& name) const;
    std::vector<std::string> getActionNames() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, StageAction> actions_;
};

namespace BuiltinActions {

// EN: Spawn `/bin/sh -c <run>` or the argv list. Parameters and environment are exported,
// EN: stdout/stderr are appended to output_path, and cancellation sends SIGTERM then SIGKILL.
// FR: Lance `/bin/sh -c <run>` ou la liste argv. Paramètres et environnement sont exportés,
// FR: stdout/stderr sont ajoutés à output_path, et l'annulation envoie SIGTERM puis SIGKILL.
ActionOutcome command(const ActionContext& context);

ActionOutcome noop(const ActionContext& context);

// EN: Wait `with.duration` (e.g. 500ms, 2s), honouring cancellation.
// FR: Attend `with.duration` (ex. 500ms, 2s), en respectant l'annulation.
ActionOutcome sleep(const ActionContext& context);

// EN: Export name for a parameter: kept when a valid identifier, otherwise upper-cased with '_' separators.
// FR: Nom d'export d'un paramètre : conservé si identifiant valide, sinon majuscules avec séparateurs '_'.
std::string environmentName(const std::string& parameter);

} // namespace BuiltinActions

} // namespace Orchestrator
} // namespace DPF
