// EN: Pipeline definitions and their YAML loader. All problems of a document are collected
// EN: and reported together before anything runs.
// FR: Définitions de pipeline et leur chargeur YAML. Tous les problèmes d'un document sont
// FR: collectés et rapportés ensemble avant toute exécution.

#include "orchestrator/pipeline_definition.hpp"
#include "orchestrator/pipeline_engine.hpp"
#include "orchestrator/pipeline_errors.hpp"
#include "infrastructure/logging/logger.hpp"

#include <yaml-cpp/yaml.h>
#include <zlib.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace DPF {
namespace Orchestrator {

namespace fs = std::filesystem;

namespace {

const std::set<std::string> kTopLevelKeys = {"name", "description", "inputs", "env", "stages"};
const std::set<std::string> kStageKeys = {"name", "needs", "if", "lock", "lock_timeout", "timeout",
                                          "env", "run", "command", "action", "uses", "with"};
const std::set<std::string> kInputKeys = {"required", "default", "description"};

// EN: Text of a scalar node (empty for null); a sequence or mapping is reported and yields nullopt.
// FR: Texte d'un nœud scalaire (vide si nul) ; une séquence ou une table est signalée et donne nullopt.
std::optional<std::string> scalarOf(const YAML::Node& node, const std::string& where,
                                    std::vector<std::string>& problems) {
    if (node.IsNull()) {
        return std::string();
    }
    if (!node.IsScalar()) {
        problems.push_back(where + " must be a string");
        return std::nullopt;
    }
    return node.as<std::string>();
}

// EN: Mapping keys must be plain strings; complex keys are reported and skipped.
// FR: Les clés de table doivent être des chaînes simples ; les clés complexes sont signalées et ignorées.
std::optional<std::string> keyOf(const YAML::Node& key, const std::string& where,
                                 std::vector<std::string>& problems) {
    if (!key.IsScalar()) {
        problems.push_back(where + ": keys must be plain strings");
        return std::nullopt;
    }
    return key.as<std::string>();
}

// EN: Read a string map (`env:`, `with:`); non-scalar values are reported.
// FR: Lit une table de chaînes (`env:`, `with:`) ; les valeurs non scalaires sont signalées.
std::map<std::string, std::string> readStringMap(const YAML::Node& node, const std::string& where,
                                                 std::vector<std::string>& problems) {
    std::map<std::string, std::string> result;
    if (node.IsNull()) {
        return result;
    }
    if (!node.IsMap()) {
        problems.push_back(where + " must be a mapping");
        return result;
    }
    for (const auto& entry : node) {
        auto key = keyOf(entry.first, where, problems);
        if (!key) {
            continue;
        }
        if (!entry.second.IsScalar() && !entry.second.IsNull()) {
            problems.push_back(where + "." + *key + " must be a scalar value");
            continue;
        }
        result[*key] = entry.second.IsNull() ? std::string() : entry.second.as<std::string>();
    }
    return result;
}

std::vector<std::string> readStringList(const YAML::Node& node, const std::string& where,
                                        std::vector<std::string>& problems) {
    std::vector<std::string> result;
    if (node.IsNull()) {
        return result;
    }
    if (node.IsScalar()) {
        result.push_back(node.as<std::string>());
        return result;
    }
    if (!node.IsSequence()) {
        problems.push_back(where + " must be a string or a list of strings");
        return result;
    }
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            problems.push_back(where + " entries must be strings");
            continue;
        }
        result.push_back(item.as<std::string>());
    }
    return result;
}

std::optional<std::chrono::milliseconds> readDuration(const YAML::Node& node, const std::string& where,
                                                      std::vector<std::string>& problems) {
    if (!node.IsScalar()) {
        problems.push_back(where + " must be a duration such as 30s, 10m or 1h");
        return std::nullopt;
    }
    auto duration = PipelineUtils::parseDuration(node.as<std::string>());
    if (!duration) {
        problems.push_back(where + " has invalid duration '" + node.as<std::string>() + "'");
    }
    return duration;
}

uint32_t checksumOf(const std::string& content) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(content.data()), static_cast<uInt>(content.size()));
    return static_cast<uint32_t>(crc);
}

} // namespace

// ============================================================================
// EN: StageSpec / PipelineDefinition
// FR: StageSpec / PipelineDefinition
// ============================================================================

bool StageSpec::shouldRun(const RunParameters& parameters) const {
    return !condition || condition->evaluate(parameters);
}

std::string StageSpec::describeBody() const {
    if (const auto* sub = std::get_if<SubPipelineStageBody>(&body)) {
        return "uses " + sub->reference;
    }
    const auto& action = std::get<ActionStageBody>(body);
    if (!action.run.empty()) {
        return "run: " + action.run;
    }
    if (!action.command.empty()) {
        std::string text = "command:";
        for (const auto& arg : action.command) {
            text += " " + arg;
        }
        return text;
    }
    return "action: " + action.action;
}

const StageSpec* PipelineDefinition::findStage(const std::string& stage_name) const {
    auto it = std::find_if(stages.begin(), stages.end(),
                           [&](const StageSpec& stage) { return stage.name == stage_name; });
    return it == stages.end() ? nullptr : &*it;
}

const PipelineInput* PipelineDefinition::findInput(const std::string& input_name) const {
    auto it = std::find_if(inputs.begin(), inputs.end(),
                           [&](const PipelineInput& input) { return input.name == input_name; });
    return it == inputs.end() ? nullptr : &*it;
}

RunParameters PipelineDefinition::bindParameters(const RunParameters& supplied) const {
    RunParameters bound = supplied;
    std::vector<std::string> missing;

    for (const auto& input : inputs) {
        if (bound.count(input.name)) {
            continue;
        }
        if (input.default_value) {
            bound[input.name] = *input.default_value;
        } else if (input.required) {
            missing.push_back("missing required input '" + input.name + "'");
        }
    }

    if (!missing.empty()) {
        throw DefinitionError(missing, name);
    }
    return bound;
}

std::vector<std::string> SubPipelineStageBody::bindingProblems(const std::string& stage_name) const {
    std::vector<std::string> problems;
    const std::string where = "stage '" + stage_name + "'";
    if (!definition) {
        problems.push_back(where + ": unresolved pipeline reference '" + reference + "'");
        return problems;
    }

    for (const auto& [name, value] : bindings) {
        if (!definition->findInput(name)) {
            problems.push_back(where + ": '" + definition->name + "' declares no input '" + name + "'");
        }
    }
    for (const auto& input : definition->inputs) {
        if (input.required && !input.default_value && !bindings.count(input.name)) {
            problems.push_back(where + ": missing binding for required input '" + input.name +
                               "' of '" + definition->name + "'");
        }
    }
    return problems;
}

std::vector<std::shared_ptr<const PipelineDefinition>> PipelineDefinition::subPipelines() const {
    std::vector<std::shared_ptr<const PipelineDefinition>> result;
    std::set<const PipelineDefinition*> seen;
    std::vector<const PipelineDefinition*> pending = {this};

    while (!pending.empty()) {
        const PipelineDefinition* current = pending.back();
        pending.pop_back();
        for (const auto& stage : current->stages) {
            const auto* sub = std::get_if<SubPipelineStageBody>(&stage.body);
            if (!sub || !sub->definition || !seen.insert(sub->definition.get()).second) {
                continue;
            }
            result.push_back(sub->definition);
            pending.push_back(sub->definition.get());
        }
    }
    return result;
}

// ============================================================================
// EN: PipelineDefinitionLoader
// FR: PipelineDefinitionLoader
// ============================================================================

PipelineDefinitionLoader::PipelineDefinitionLoader(std::vector<std::string> search_paths)
    : search_paths_(std::move(search_paths)) {}

std::shared_ptr<const PipelineDefinition> PipelineDefinitionLoader::loadFile(const std::string& path) {
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(fs::path(path), ec);
    if (ec) {
        canonical = fs::absolute(fs::path(path));
    }
    const std::string key = canonical.string();

    auto in_stack = std::find(loading_stack_.begin(), loading_stack_.end(), key);
    if (in_stack != loading_stack_.end()) {
        std::string chain;
        for (auto it = in_stack; it != loading_stack_.end(); ++it) {
            chain += fs::path(*it).filename().string() + " -> ";
        }
        chain += canonical.filename().string();
        throw DefinitionError("recursive pipeline reference: " + chain, key);
    }

    if (auto cached = cache_.find(key); cached != cache_.end()) {
        return cached->second;
    }

    std::ifstream file(canonical);
    if (!file) {
        throw DefinitionError("cannot read pipeline file '" + path + "'", path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    // EN: Keep the include chain accurate even when parsing throws.
    // FR: Garde la chaîne d'inclusion exacte même si l'analyse lève.
    struct StackGuard {
        std::vector<std::string>& stack;
        ~StackGuard() { stack.pop_back(); }
    };
    loading_stack_.push_back(key);
    StackGuard guard{loading_stack_};

    auto definition = parseDocument(buffer.str(), canonical.parent_path().string(), key,
                                    canonical.stem().string());
    cache_[key] = definition;

    LOG_DEBUG("loader", "Loaded pipeline '" + definition->name + "' from " + key);
    return definition;
}

std::shared_ptr<const PipelineDefinition> PipelineDefinitionLoader::loadString(const std::string& content,
                                                                              const std::string& base_directory,
                                                                              const std::string& source_name) {
    return parseDocument(content, base_directory, source_name, "pipeline");
}

void PipelineDefinitionLoader::registerDefinition(const std::string& name,
                                                  std::shared_ptr<const PipelineDefinition> definition) {
    if (name.empty() || !definition) {
        throw std::invalid_argument("registerDefinition requires a name and a definition");
    }
    registered_[name] = std::move(definition);
}

std::shared_ptr<const PipelineDefinition> PipelineDefinitionLoader::parseDocument(const std::string& content,
                                                                                 const std::string& base_directory,
                                                                                 const std::string& source_name,
                                                                                 const std::string& default_name) {
    YAML::Node root;
    try {
        root = YAML::Load(content);
    } catch (const YAML::Exception& e) {
        throw DefinitionError(std::string("YAML parse error: ") + e.what(), source_name);
    }

    // EN: Every conversion below is guarded; a yaml-cpp error that still escapes is a definition problem.
    // FR: Chaque conversion ci-dessous est protégée ; une erreur yaml-cpp qui s'échappe reste un problème de définition.
    try {
        if (!root.IsMap()) {
            throw DefinitionError("document root must be a mapping", source_name);
        }

        auto definition = std::make_shared<PipelineDefinition>();
        definition->source_path = source_name;
        definition->checksum = checksumOf(content);
        std::vector<std::string> problems;

        for (const auto& entry : root) {
            auto key = keyOf(entry.first, "document", problems);
            if (key && !kTopLevelKeys.count(*key)) {
                LOG_WARN("loader", "Ignoring unknown key '" + *key + "' in " + source_name);
            }
        }

        definition->name = root["name"] && root["name"].IsScalar() ? root["name"].as<std::string>() : default_name;

        if (root["inputs"]) {
            parseInputs(root["inputs"], *definition, problems);
        }
        if (root["env"]) {
            definition->environment = readStringMap(root["env"], "env", problems);
        }

        YAML::Node stages = root["stages"];
        if (!stages || stages.IsNull() || stages.size() == 0) {
            problems.push_back("pipeline declares no stages");
        } else if (stages.IsMap()) {
            for (const auto& entry : stages) {
                if (auto stage_name = keyOf(entry.first, "stages", problems)) {
                    parseStage(*stage_name, entry.second, base_directory, *definition, problems);
                }
            }
        } else if (stages.IsSequence()) {
            size_t position = 0;
            for (const auto& item : stages) {
                ++position;
                if (!item.IsMap() || !item["name"] || !item["name"].IsScalar()) {
                    problems.push_back("stage #" + std::to_string(position) + " must be a mapping with a 'name'");
                    continue;
                }
                parseStage(item["name"].as<std::string>(), item, base_directory, *definition, problems);
            }
        } else {
            problems.push_back("'stages' must be a mapping or a sequence");
        }

        if (!definition->stages.empty()) {
            PipelineDependencyResolver resolver(*definition);
            auto graph_problems = resolver.validate();
            problems.insert(problems.end(), graph_problems.begin(), graph_problems.end());
        }

        if (!problems.empty()) {
            throw DefinitionError(problems, source_name);
        }
        return definition;
    } catch (const YAML::Exception& e) {
        throw DefinitionError(std::string("invalid document: ") + e.what(), source_name);
    }
}

void PipelineDefinitionLoader::parseInputs(const YAML::Node& node, PipelineDefinition& definition,
                                           std::vector<std::string>& problems) const {
    if (node.IsSequence()) {
        // EN: `inputs: [A, B]` declares required inputs without defaults.
        // FR: `inputs: [A, B]` déclare des entrées requises sans défaut.
        for (const auto& item : node) {
            if (!item.IsScalar()) {
                problems.push_back("inputs entries must be names");
                continue;
            }
            PipelineInput input;
            input.name = item.as<std::string>();
            input.required = true;
            definition.inputs.push_back(input);
        }
        return;
    }
    if (!node.IsMap()) {
        problems.push_back("'inputs' must be a mapping or a list of names");
        return;
    }

    for (const auto& entry : node) {
        auto input_name = keyOf(entry.first, "inputs", problems);
        if (!input_name) {
            continue;
        }
        PipelineInput input;
        input.name = *input_name;
        const YAML::Node& declaration = entry.second;
        const std::string where = "input '" + input.name + "'";

        if (declaration.IsScalar()) {
            input.default_value = declaration.as<std::string>();
        } else if (declaration.IsMap()) {
            for (const auto& field : declaration) {
                auto key = keyOf(field.first, where, problems);
                if (key && !kInputKeys.count(*key)) {
                    problems.push_back(where + ": unknown key '" + *key + "'");
                }
            }
            if (declaration["required"]) {
                try {
                    input.required = declaration["required"].as<bool>();
                } catch (const YAML::Exception&) {
                    problems.push_back(where + ": 'required' must be true or false");
                }
            }
            if (declaration["default"] && !declaration["default"].IsNull()) {
                if (auto value = scalarOf(declaration["default"], where + ".default", problems)) {
                    input.default_value = *value;
                }
            }
            if (declaration["description"]) {
                input.description = scalarOf(declaration["description"], where + ".description", problems)
                                        .value_or(std::string());
            }
        } else if (!declaration.IsNull()) {
            problems.push_back(where + " must be a default value or a mapping");
        }

        if (definition.findInput(input.name)) {
            problems.push_back("duplicate input '" + input.name + "'");
            continue;
        }
        definition.inputs.push_back(input);
    }
}

void PipelineDefinitionLoader::parseStage(const std::string& stage_name, const YAML::Node& node,
                                          const std::string& base_directory, PipelineDefinition& definition,
                                          std::vector<std::string>& problems) {
    const std::string where = "stage '" + stage_name + "'";
    if (!node.IsMap()) {
        problems.push_back(where + " must be a mapping");
        return;
    }

    StageSpec stage;
    stage.name = stage_name;

    for (const auto& entry : node) {
        auto key = keyOf(entry.first, where, problems);
        if (key && !kStageKeys.count(*key)) {
            problems.push_back(where + ": unknown key '" + *key + "'");
        }
    }

    if (node["name"]) {
        auto declared = scalarOf(node["name"], where + ".name", problems);
        if (declared && *declared != stage_name) {
            problems.push_back(where + ": 'name' does not match its key");
        }
    }
    if (node["needs"]) {
        stage.needs = readStringList(node["needs"], where + ".needs", problems);
    }
    if (node["if"]) {
        if (!node["if"].IsScalar()) {
            problems.push_back(where + ": 'if' must be an expression string");
        } else {
            try {
                stage.condition = std::make_shared<const ConditionExpression>(
                    ConditionExpression::parse(node["if"].as<std::string>()));
            } catch (const DefinitionError& e) {
                for (const auto& problem : e.problems()) {
                    problems.push_back(where + ": " + problem);
                }
            }
        }
    }
    if (node["lock"]) {
        if (auto lock = scalarOf(node["lock"], where + ".lock", problems)) {
            stage.resource_lock = *lock;
            if (stage.resource_lock.empty()) {
                problems.push_back(where + ": 'lock' must name a resource");
            }
        }
    }
    if (node["lock_timeout"]) {
        stage.lock_timeout = readDuration(node["lock_timeout"], where + ".lock_timeout", problems);
    }
    if (node["timeout"]) {
        stage.timeout = readDuration(node["timeout"], where + ".timeout", problems);
        if (stage.timeout && stage.timeout->count() <= 0) {
            problems.push_back(where + ": 'timeout' must be positive");
        }
    }
    if (node["env"]) {
        stage.environment = readStringMap(node["env"], where + ".env", problems);
    }

    int body_keys = (node["run"] ? 1 : 0) + (node["command"] ? 1 : 0) +
                    (node["action"] ? 1 : 0) + (node["uses"] ? 1 : 0);
    if (body_keys != 1) {
        problems.push_back(where + " must declare exactly one of 'run', 'command', 'action' or 'uses'");
        return;
    }

    std::map<std::string, std::string> with;
    if (node["with"]) {
        with = readStringMap(node["with"], where + ".with", problems);
    }

    if (node["uses"]) {
        SubPipelineStageBody body;
        auto reference = scalarOf(node["uses"], where + ".uses", problems);
        body.reference = reference.value_or(std::string());
        body.bindings = std::move(with);
        if (reference && body.reference.empty()) {
            problems.push_back(where + ": 'uses' must name a pipeline");
        } else if (reference) {
            resolveSubPipeline(stage_name, body, base_directory, problems);
        }
        stage.body = std::move(body);
    } else {
        ActionStageBody body;
        body.arguments = std::move(with);
        if (node["run"]) {
            auto run = scalarOf(node["run"], where + ".run", problems);
            body.run = run.value_or(std::string());
            if (run && body.run.empty()) {
                problems.push_back(where + ": 'run' must not be empty");
            }
        } else if (node["command"]) {
            body.command = readStringList(node["command"], where + ".command", problems);
            if (body.command.empty()) {
                problems.push_back(where + ": 'command' must not be empty");
            }
        } else {
            auto action = scalarOf(node["action"], where + ".action", problems);
            body.action = action.value_or(std::string());
            if (action && body.action.empty()) {
                problems.push_back(where + ": 'action' must name an action");
            }
        }
        stage.body = std::move(body);
    }

    definition.stages.push_back(std::move(stage));
}

void PipelineDefinitionLoader::resolveSubPipeline(const std::string& stage_name, SubPipelineStageBody& body,
                                                  const std::string& base_directory,
                                                  std::vector<std::string>& problems) {
    const std::string where = "stage '" + stage_name + "' uses '" + body.reference + "'";

    if (auto path = resolveReferencePath(body.reference, base_directory)) {
        try {
            body.definition = loadFile(*path);
        } catch (const DefinitionError& e) {
            for (const auto& problem : e.problems()) {
                problems.push_back(where + ": " + problem);
            }
            return;
        }
    } else if (auto it = registered_.find(body.reference); it != registered_.end()) {
        body.definition = it->second;
    } else {
        problems.push_back(where + ": pipeline not found");
        return;
    }

    auto binding_problems = body.bindingProblems(stage_name);
    problems.insert(problems.end(), binding_problems.begin(), binding_problems.end());
}

std::optional<std::string> PipelineDefinitionLoader::resolveReferencePath(const std::string& reference,
                                                                         const std::string& base_directory) const {
    std::error_code ec;
    fs::path candidate(reference);

    if (candidate.is_absolute()) {
        if (fs::is_regular_file(candidate, ec)) {
            return candidate.string();
        }
        return std::nullopt;
    }

    std::vector<fs::path> roots;
    roots.emplace_back(base_directory.empty() ? "." : base_directory);
    for (const auto& path : search_paths_) {
        roots.emplace_back(path);
    }

    for (const auto& root : roots) {
        fs::path full = root / candidate;
        if (fs::is_regular_file(full, ec)) {
            return full.string();
        }
    }
    return std::nullopt;
}

} // namespace Orchestrator
} // namespace DPF
