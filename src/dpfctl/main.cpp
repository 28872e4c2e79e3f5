// EN: dpfctl - command line front end of the DeployFlow orchestrator (run, validate, plan).
// FR: dpfctl - interface en ligne de commande de l'orchestrateur DeployFlow (run, validate, plan).

#include "infrastructure/cli/command_line.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/signal_handler.hpp"
#include "orchestrator/pipeline_definition.hpp"
#include "orchestrator/pipeline_engine.hpp"
#include "orchestrator/pipeline_errors.hpp"

#include <csignal>
#include <iostream>
#include <string>
#include <vector>

#ifndef DPF_VERSION
#define DPF_VERSION "1.0.0"
#endif

namespace {

using namespace DPF;
using namespace DPF::Orchestrator;

constexpr int kExitDefinitionError = 3;
constexpr int kExitUsageError = 4;

const char* kCommandsText =
    "  run       Load, validate and execute the pipeline\n"
    "  validate  Load and validate the pipeline without running it\n"
    "  plan      Print execution levels and condition outcomes (nothing runs)\n";

// EN: Apply logging.level / logging.file from the resolved configuration.
// FR: Applique logging.level / logging.file depuis la configuration résolue.
bool configureLogging(const EngineSettings& settings) {
    auto& logger = Logger::getInstance();
    auto level = Logger::parseLogLevel(settings.log_level);
    if (!level) {
        std::cerr << "dpfctl: invalid log level '" << settings.log_level << "'\n";
        return false;
    }
    logger.setLogLevel(*level);

    if (!settings.log_file.empty()) {
        if (!logger.setOutputFile(settings.log_file)) {
            std::cerr << "dpfctl: cannot open log file '" << settings.log_file << "'\n";
            return false;
        }
        logger.setConsoleOutput(false);
    }
    return true;
}

RunParameters withRunnerContext(RunParameters parameters) {
    for (const auto& [name, value] : PipelineUtils::detectRunnerContext()) {
        parameters.emplace(name, value);
    }
    return parameters;
}

void printPlan(const PipelineDefinition& definition, const RunParameters& parameters, bool inject_runner) {
    std::cout << PipelineUtils::formatExecutionPlan(definition, parameters);

    for (const auto& stage : definition.stages) {
        const auto* sub = std::get_if<SubPipelineStageBody>(&stage.body);
        if (!sub || !sub->definition) {
            continue;
        }
        RunParameters child = sub->definition->bindParameters(SubPipelineInvoker::bindParameters(*sub, parameters));
        if (inject_runner) {
            child = withRunnerContext(child);
        }
        std::cout << "\nStage " << stage.name << " uses:\n";
        printPlan(*sub->definition, child, inject_runner);
    }
}

int runCommand(const std::string& command,
               const std::shared_ptr<const PipelineDefinition>& definition,
               const RunParameters& parameters,
               const EngineSettings& settings,
               const std::optional<std::string>& report_path) {
    std::shared_ptr<ResourceLockManager> locks;
    try {
        locks = settings.createLockManager();
    } catch (const std::exception& e) {
        std::cerr << "dpfctl: cannot set up resource locks: " << e.what() << "\n";
        return kExitUsageError;
    }

    PipelineEngine engine(settings.engine, ActionRegistry::createWithBuiltins(), locks);

    try {
        engine.validate(*definition);

        if (command == "validate") {
            // EN: Throws DefinitionError when given parameters miss a required input.
            // FR: Lève DefinitionError si les paramètres donnés omettent une entrée requise.
            if (!parameters.empty()) {
                definition->bindParameters(parameters);
            }
            std::cout << "Pipeline '" << definition->name << "' is valid ("
                      << definition->stages.size() << " stages, "
                      << definition->subPipelines().size() << " sub-pipelines)\n";
            return 0;
        }

        if (command == "plan") {
            RunParameters bound = definition->bindParameters(parameters);
            if (settings.engine.inject_runner_context) {
                bound = withRunnerContext(bound);
            }
            printPlan(*definition, bound, settings.engine.inject_runner_context);
            return 0;
        }

        auto& signals = SignalHandler::getInstance();
        signals.initialize();
        signals.registerCleanupCallback("cancel-runs", [&engine]() {
            engine.cancelAll("interrupted by signal");
        });

        RunReport report = engine.run(definition, parameters);
        signals.unregisterCleanupCallback("cancel-runs");

        std::cout << PipelineUtils::formatRunSummary(report);
        if (report_path && !PipelineUtils::saveRunReport(report, *report_path)) {
            std::cerr << "dpfctl: could not write report to " << *report_path << "\n";
        }
        return report.exitCode();
    } catch (const DefinitionError& e) {
        SignalHandler::getInstance().unregisterCleanupCallback("cancel-runs");
        std::cerr << e.what() << "\n";
        return kExitDefinitionError;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    // EN: An inherited SIG_IGN for SIGCHLD makes waitpid lose child exit statuses.
    // FR: Un SIG_IGN hérité pour SIGCHLD fait perdre à waitpid le statut de sortie des enfants.
    std::signal(SIGCHLD, SIG_DFL);

    CLI::CommandLineParser parser("dpfctl");
    parser.addStandardOptions();
    parser.setVersionInfo(std::string("dpfctl ") + DPF_VERSION);
    parser.setUsage("dpfctl [options] <command> <pipeline-file>", kCommandsText);

    CLI::CliParseResult args = parser.parse(argc, argv);
    if (args.status == CLI::CliParseStatus::HELP_REQUESTED) {
        std::cout << args.help_text;
        return 0;
    }
    if (args.status == CLI::CliParseStatus::VERSION_REQUESTED) {
        std::cout << args.version_text << "\n";
        return 0;
    }
    if (!args.isSuccess()) {
        for (const auto& error : args.errors) {
            std::cerr << "dpfctl: " << error << "\n";
        }
        std::cerr << "Try 'dpfctl --help' for more information.\n";
        return kExitUsageError;
    }

    if (args.positional.size() != 2) {
        std::cerr << "dpfctl: expected <command> <pipeline-file>\n"
                  << "Try 'dpfctl --help' for more information.\n";
        return kExitUsageError;
    }
    const std::string& command = args.positional[0];
    const std::string& pipeline_file = args.positional[1];
    if (command != "run" && command != "validate" && command != "plan") {
        std::cerr << "dpfctl: unknown command '" << command << "'\n";
        return kExitUsageError;
    }

    auto& config = ConfigManager::getInstance();
    EngineSettings::registerDefaults(config);
    if (auto config_file = args.getValue("config")) {
        if (!config.loadFromFile(*config_file)) {
            std::cerr << "dpfctl: cannot load configuration '" << *config_file << "'\n";
            return kExitUsageError;
        }
    }
    config.loadEnvironmentOverrides("DPF_");
    parser.applyOverrides(args, config);

    std::vector<std::string> config_errors;
    if (!config.validate(config_errors)) {
        for (const auto& error : config_errors) {
            std::cerr << "dpfctl: configuration: " << error << "\n";
        }
        return kExitUsageError;
    }

    EngineSettings settings = EngineSettings::fromConfig(config);
    if (!configureLogging(settings)) {
        return kExitUsageError;
    }

    std::shared_ptr<const PipelineDefinition> definition;
    try {
        PipelineDefinitionLoader loader;
        definition = loader.loadFile(pipeline_file);
    } catch (const DefinitionError& e) {
        std::cerr << e.what() << "\n";
        return kExitDefinitionError;
    } catch (const std::exception& e) {
        std::cerr << "dpfctl: cannot load '" << pipeline_file << "': " << e.what() << "\n";
        return kExitDefinitionError;
    }

    try {
        return runCommand(command, definition, args.getKeyValues("param"), settings, args.getValue("report"));
    } catch (const std::exception& e) {
        LOG_ERROR("dpfctl", std::string("Fatal error: ") + e.what());
        std::cerr << "dpfctl: " << e.what() << "\n";
        return 1;
    }
}
