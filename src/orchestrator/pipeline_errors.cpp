#include "orchestrator/pipeline_errors.hpp"

namespace DPF {
namespace Orchestrator {

DefinitionError::DefinitionError(const std::string& problem, const std::string& source)
    : DefinitionError(std::vector<std::string>{problem}, source) {}

DefinitionError::DefinitionError(std::vector<std::string> problems, const std::string& source)
    : PipelineError(formatMessage(problems, source)), problems_(std::move(problems)), source_(source) {}

std::string DefinitionError::formatMessage(const std::vector<std::string>& problems, const std::string& source) {
    std::string message = "Invalid pipeline definition";
    if (!source.empty()) {
        message += " (" + source + ")";
    }

    if (problems.size() == 1) {
        return message + ": " + problems.front();
    }

    message += ": " + std::to_string(problems.size()) + " problems";
    for (const auto& problem : problems) {
        message += "\n  - " + problem;
    }
    return message;
}

LockAcquisitionTimeout::LockAcquisitionTimeout(const std::string& lock_name, std::chrono::milliseconds waited)
    : PipelineError("Timed out after " + std::to_string(waited.count()) + "ms waiting for lock '" + lock_name + "'"),
      lock_name_(lock_name), waited_(waited) {}

LockAcquisitionCancelled::LockAcquisitionCancelled(const std::string& lock_name, std::chrono::milliseconds waited)
    : PipelineError("Cancelled after " + std::to_string(waited.count()) + "ms waiting for lock '" + lock_name + "'"),
      lock_name_(lock_name), waited_(waited) {}

} // namespace Orchestrator
} // namespace DPF
