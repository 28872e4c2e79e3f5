#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "orchestrator/condition_expression.hpp"

// Forward declaration
namespace YAML { class Node; }

namespace DPF {
namespace Orchestrator {

struct PipelineDefinition;

// EN: Stage body running a named action (`run`/`command` are the "command" action).
// FR: Corps de stage exécutant une action nommée (`run`/`command` sont l'action "command").
struct ActionStageBody {
    std::string action = "command";
    std::string run;                                // EN: Shell command line / FR: Ligne de commande shell
    std::vector<std::string> command;               // EN: argv form / FR: Forme argv
    std::map<std::string, std::string> arguments;   // EN: `with:` arguments / FR: Arguments `with:`
};

// EN: Stage body invoking another pipeline definition with an explicit parameter binding.
// FR: Corps de stage invoquant une autre définition avec une liaison explicite de paramètres.
struct SubPipelineStageBody {
    std::string reference;                                  // EN: `uses:` value as written / FR: Valeur `uses:` telle qu'écrite
    std::map<std::string, std::string> bindings;            // EN: `with:` values, may contain ${name} / FR: Valeurs `with:`, peuvent contenir ${name}
    std::shared_ptr<const PipelineDefinition> definition;   // EN: Resolved at load time / FR: Résolue au chargement

    // EN: Bindings naming undeclared inputs, and required inputs left unbound.
    // FR: Liaisons vers des entrées non déclarées, et entrées requises non liées.
    std::vector<std::string> bindingProblems(const std::string& stage_name) const;
};

using StageBody = std::variant<ActionStageBody, SubPipelineStageBody>;

// EN: One declared stage of a pipeline.
// FR: Un stage déclaré d'un pipeline.
struct StageSpec {
    std::string name;
    std::vector<std::string> needs;                          // EN: Predecessor stage names / FR: Noms des stages prédécesseurs
    std::shared_ptr<const ConditionExpression> condition;    // EN: Null = always run / FR: Nul = toujours exécuté
    std::string resource_lock;                               // EN: Empty = no lock / FR: Vide = pas de verrou
    std::optional<std::chrono::milliseconds> lock_timeout;   // EN: Engine default when unset / FR: Défaut moteur si absent
    std::optional<std::chrono::milliseconds> timeout;        // EN: Engine default when unset / FR: Défaut moteur si absent
    std::map<std::string, std::string> environment;
    StageBody body;

    bool isSubPipeline() const { return std::holds_alternative<SubPipelineStageBody>(body); }

    // EN: Evaluate the condition against run parameters (true when there is none).
    // FR: Évalue la condition contre les paramètres du run (vrai s'il n'y en a pas).
    bool shouldRun(const RunParameters& parameters) const;

    // EN: Human-readable body summary for plans and logs.
    // FR: Résumé lisible du corps pour les plans et logs.
    std::string describeBody() const;
};

// EN: Declared pipeline input.
// FR: Entrée déclarée d'un pipeline.
struct PipelineInput {
    std::string name;
    bool required = false;
    std::optional<std::string> default_value;
    std::string description;
};

// EN: Immutable pipeline definition. Runs share it through std::shared_ptr<const PipelineDefinition>.
// FR: Définition de pipeline immuable. Les runs la partagent via std::shared_ptr<const PipelineDefinition>.
struct PipelineDefinition {
    std::string name;
    std::vector<PipelineInput> inputs;
    std::map<std::string, std::string> environment;
    std::vector<StageSpec> stages;
    std::string source_path;
    uint32_t checksum = 0;                          // EN: CRC-32 of the source document / FR: CRC-32 du document source

    const StageSpec* findStage(const std::string& stage_name) const;
    const PipelineInput* findInput(const std::string& input_name) const;

    // EN: Apply input defaults to supplied values. Throws DefinitionError listing missing required inputs.
    // EN: Supplied values for undeclared names are kept.
    // FR: Applique les défauts des entrées aux valeurs fournies. Lève DefinitionError listant les entrées requises manquantes.
    // FR: Les valeurs fournies pour des noms non déclarés sont conservées.
    RunParameters bindParameters(const RunParameters& supplied) const;

    // EN: Definitions reachable through `uses:` (transitively, each once).
    // FR: Définitions atteignables via `uses:` (transitivement, chacune une fois).
    std::vector<std::shared_ptr<const PipelineDefinition>> subPipelines() const;
};

// EN: Loads pipeline definitions from YAML (or JSON) documents, resolving `uses:` references
// EN: relative to the referencing file, then search paths, then registered names.
// EN: Every problem found is reported in one DefinitionError.
// FR: Charge des définitions depuis des documents YAML (ou JSON), en résolvant `uses:` relativement
// FR: au fichier appelant, puis aux chemins de recherche, puis aux noms enregistrés.
class PipelineDefinitionLoader {
public:
    explicit PipelineDefinitionLoader(std::vector<std::string> search_paths = {});

    std::shared_ptr<const PipelineDefinition> loadFile(const std::string& path);

    // EN: Load from text; `base_directory` resolves relative `uses:` references.
    // FR: Charge depuis un texte ; `base_directory` résout les références `uses:` relatives.
    std::shared_ptr<const PipelineDefinition> loadString(const std::string& content,
                                                         const std::string& base_directory = ".",
                                                         const std::string& source_name = "<string>");

    // EN: Make a definition available to `uses: <name>`.
    // FR: Rend une définition disponible pour `uses: <nom>`.
    void registerDefinition(const std::string& name, std::shared_ptr<const PipelineDefinition> definition);

    void addSearchPath(const std::string& path) { search_paths_.push_back(path); }
    void clearCache() { cache_.clear(); }

private:
    std::shared_ptr<const PipelineDefinition> parseDocument(const std::string& content,
                                                            const std::string& base_directory,
                                                            const std::string& source_name,
                                                            const std::string& default_name);

    void parseInputs(const YAML::Node& node, PipelineDefinition& definition, std::vector<std::string>& problems) const;
    void parseStage(const std::string& stage_name, const YAML::Node& node, const std::string& base_directory,
                    PipelineDefinition& definition, std::vector<std::string>& problems);
    void resolveSubPipeline(const std::string& stage_name, SubPipelineStageBody& body,
                            const std::string& base_directory, std::vector<std::string>& problems);

    std::optional<std::string> resolveReferencePath(const std::string& reference, const std::string& base_directory) const;

    std::vector<std::string> search_paths_;
    std::unordered_map<std::string, std::shared_ptr<const PipelineDefinition>> cache_;   // EN: By canonical path / FR: Par chemin canonique
    std::unordered_map<std::string, std::shared_ptr<const PipelineDefinition>> registered_;
    std::vector<std::string> loading_stack_;                                             // EN: Include chain for cycle detection / FR: Chaîne d'inclusion pour détecter les cycles
};

} // namespace Orchestrator
} // namespace DPF
