#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace DPF {
namespace Orchestrator {

// EN: Base class of all orchestration errors.
// FR: Classe de base de toutes les erreurs d'orchestration.
class PipelineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// EN: Invalid pipeline definition (cycle, dangling reference, bad condition, missing input...).
// EN: Always raised before any stage is dispatched; carries every problem found.
// FR: Définition de pipeline invalide (cycle, référence pendante, condition invalide, entrée manquante...).
// FR: Toujours levée avant tout dispatch de stage ; porte tous les problèmes trouvés.
class DefinitionError : public PipelineError {
public:
    explicit DefinitionError(const std::string& problem, const std::string& source = "");
    explicit DefinitionError(std::vector<std::string> problems, const std::string& source = "");

    const std::vector<std::string>& problems() const { return problems_; }
    const std::string& source() const { return source_; }

private:
    static std::string formatMessage(const std::vector<std::string>& problems, const std::string& source);

    std::vector<std::string> problems_;
    std::string source_;
};

// EN: A resource lock was not acquired before its timeout. The waiter holds nothing.
// FR: Un verrou de ressource n'a pas été acquis avant son timeout. L'attendant ne détient rien.
class LockAcquisitionTimeout : public PipelineError {
public:
    LockAcquisitionTimeout(const std::string& lock_name, std::chrono::milliseconds waited);

    const std::string& lockName() const { return lock_name_; }
    std::chrono::milliseconds waited() const { return waited_; }

private:
    std::string lock_name_;
    std::chrono::milliseconds waited_;
};

// EN: A lock wait was abandoned because the run (or stage) was cancelled.
// FR: Une attente de verrou a été abandonnée car le run (ou le stage) a été annulé.
class LockAcquisitionCancelled : public PipelineError {
public:
    LockAcquisitionCancelled(const std::string& lock_name, std::chrono::milliseconds waited);

    const std::string& lockName() const { return lock_name_; }
    std::chrono::milliseconds waited() const { return waited_; }

private:
    std::string lock_name_;
    std::chrono::milliseconds waited_;
};

// EN: Opaque failure raised by an action that prefers throwing over returning an outcome.
// FR: Échec opaque levé par une action qui préfère lever plutôt que retourner un résultat.
class ActionFailure : public PipelineError {
public:
    explicit ActionFailure(const std::string& message, int exit_code = 1)
        : PipelineError(message), exit_code_(exit_code) {}

    int exitCode() const { return exit_code_; }

private:
    int exit_code_;
};

} // namespace Orchestrator
} // namespace DPF
