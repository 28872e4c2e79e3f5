// EN: Engine settings - configuration keys, defaults and validation rules for dpfctl.
// FR: Réglages du moteur - clés de configuration, défauts et règles de validation pour dpfctl.

#include "orchestrator/pipeline_engine.hpp"

namespace DPF {
namespace Orchestrator {

void EngineSettings::registerDefaults(ConfigManager& config) {
    config.setDefault("engine", "max_parallelism", 0);
    config.setDefault("engine", "default_stage_timeout_seconds", 3600);
    config.setDefault("engine", "cancel_grace_period_ms", 5000);
    config.setDefault("engine", "max_run_history", 100);
    config.setDefault("locks", "backend", "file");
    config.setDefault("locks", "directory", ".dpf/locks");
    config.setDefault("locks", "default_timeout_seconds", 1800);
    config.setDefault("logging", "level", "INFO");
    config.setDefault("logging", "file", "");
    config.setDefault("runs", "log_directory", ".dpf/runs");

    ConfigManager::ValidationRule parallelism;
    parallelism.key = "engine.max_parallelism";
    parallelism.type = "int";
    parallelism.min_value = 0;
    parallelism.description = "Maximum concurrently running stages per run (0 = unbounded)";

    ConfigManager::ValidationRule stage_timeout;
    stage_timeout.key = "engine.default_stage_timeout_seconds";
    stage_timeout.type = "int";
    stage_timeout.min_value = 1;
    stage_timeout.description = "Stage timeout when a stage declares none";

    ConfigManager::ValidationRule grace;
    grace.key = "engine.cancel_grace_period_ms";
    grace.type = "int";
    grace.min_value = 0;
    grace.description = "Time given to a cancelled action before it is abandoned";

    ConfigManager::ValidationRule history;
    history.key = "engine.max_run_history";
    history.type = "int";
    history.min_value = 0;

    ConfigManager::ValidationRule backend;
    backend.key = "locks.backend";
    backend.type = "string";
    backend.allowed_values = {"file", "memory"};
    backend.description = "Resource lock backend";

    ConfigManager::ValidationRule lock_timeout;
    lock_timeout.key = "locks.default_timeout_seconds";
    lock_timeout.type = "int";
    lock_timeout.min_value = 0;

    ConfigManager::ValidationRule level;
    level.key = "logging.level";
    level.type = "string";
    level.allowed_values = {"DEBUG", "INFO", "WARN", "WARNING", "ERROR"};

    config.addValidationRules({parallelism, stage_timeout, grace, history, backend, lock_timeout, level});
}

EngineSettings EngineSettings::fromConfig(const ConfigManager& config) {
    EngineSettings settings;

    int parallelism = config.get("engine.max_parallelism").asOrDefault<int>(0);
    settings.engine.max_parallelism = parallelism > 0 ? static_cast<size_t>(parallelism) : 0;
    settings.engine.default_stage_timeout = std::chrono::seconds(
        config.get("engine.default_stage_timeout_seconds").asOrDefault<int>(3600));
    settings.engine.cancel_grace_period = std::chrono::milliseconds(
        config.get("engine.cancel_grace_period_ms").asOrDefault<int>(5000));
    int history = config.get("engine.max_run_history").asOrDefault<int>(100);
    settings.engine.max_run_history = history > 0 ? static_cast<size_t>(history) : 0;
    settings.engine.default_lock_timeout = std::chrono::seconds(
        config.get("locks.default_timeout_seconds").asOrDefault<int>(1800));
    settings.engine.log_directory = config.get("runs.log_directory").asOrDefault<std::string>(".dpf/runs");

    settings.lock_backend = config.get("locks.backend").asOrDefault<std::string>("file");
    settings.lock_directory = config.get("locks.directory").asOrDefault<std::string>(".dpf/locks");
    settings.log_level = config.get("logging.level").asOrDefault<std::string>("INFO");
    settings.log_file = config.get("logging.file").asOrDefault<std::string>("");
    return settings;
}

std::shared_ptr<ResourceLockManager> EngineSettings::createLockManager() const {
    return std::make_shared<ResourceLockManager>(ResourceLockUtils::createProvider(lock_backend, lock_directory));
}

} // namespace Orchestrator
} // namespace DPF
