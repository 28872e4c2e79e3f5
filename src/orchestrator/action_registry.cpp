#include "orchestrator/action_registry.hpp"
#include "orchestrator/pipeline_engine.hpp"
#include "orchestrator/pipeline_errors.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace DPF {
namespace Orchestrator {

std::shared_ptr<ActionRegistry> ActionRegistry::createWithBuiltins() {
    auto registry = std::make_shared<ActionRegistry>();
    registry->registerAction("command", &BuiltinActions::command);
    registry->registerAction("noop", &BuiltinActions::noop);
    registry->registerAction("sleep", &BuiltinActions::sleep);
    return registry;
}

void ActionRegistry::registerAction(const std::string& name, StageAction action) {
    if (name.empty() || !action) {
        throw std::invalid_argument("Action registration requires a name and a callable");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    actions_[name] = std::move(action);
}

bool ActionRegistry::unregisterAction(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return actions_.erase(name) > 0;
}

bool ActionRegistry::hasAction(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return actions_.find(name) != actions_.end();
}

std::optional<StageAction> ActionRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = actions_.find(name);
    if (it == actions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> ActionRegistry::getActionNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, action] : actions_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

namespace BuiltinActions {

ActionOutcome noop(const ActionContext& context) {
    return ActionOutcome::succeeded("noop " + context.stage_name);
}

ActionOutcome sleep(const ActionContext& context) {
    auto it = context.arguments.find("duration");
    if (it == context.arguments.end()) {
        throw ActionFailure("sleep action requires a 'duration' argument");
    }

    auto duration = PipelineUtils::parseDuration(it->second);
    if (!duration) {
        throw ActionFailure("sleep action: invalid duration '" + it->second + "'");
    }

    if (context.cancel.waitFor(*duration)) {
        return ActionOutcome::failed(130, "sleep interrupted: " + context.cancel.reason());
    }
    return ActionOutcome::succeeded("slept " + PipelineUtils::formatDuration(*duration));
}

std::string environmentName(const std::string& parameter) {
    bool valid = !parameter.empty() &&
                 (std::isalpha(static_cast<unsigned char>(parameter[0])) || parameter[0] == '_');
    for (char c : parameter) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            valid = false;
        }
    }
    if (valid) {
        return parameter;
    }

    std::string name;
    for (char c : parameter) {
        name += std::isalnum(static_cast<unsigned char>(c))
            ? static_cast<char>(std::toupper(static_cast<unsigned char>(c)))
            : '_';
    }
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name[0]))) {
        name = "_" + name;
    }
    return name;
}

} // namespace BuiltinActions

} // namespace Orchestrator
} // namespace DPF
