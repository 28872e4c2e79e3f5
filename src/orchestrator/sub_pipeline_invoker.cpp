#include "orchestrator/pipeline_engine.hpp"
#include "orchestrator/pipeline_errors.hpp"

namespace DPF {
namespace Orchestrator {

RunParameters SubPipelineInvoker::bindParameters(const SubPipelineStageBody& body,
                                                 const RunParameters& parent_parameters) {
    RunParameters bound;
    for (const auto& [name, value] : body.bindings) {
        bound[name] = PipelineUtils::expandParameters(value, parent_parameters);
    }
    return bound;
}

RunReport SubPipelineInvoker::invoke(const SubPipelineStageBody& body,
                                     const RunParameters& parent_parameters,
                                     const CancellationToken& cancel,
                                     const std::string& parent_run_id,
                                     const std::string& parent_stage) {
    if (!body.definition) {
        throw PipelineError("sub-pipeline '" + body.reference + "' is not resolved");
    }

    RunParameters bound = bindParameters(body, parent_parameters);

    std::unordered_map<std::string, std::string> metadata = {
        {"run_id", parent_run_id}, {"stage", parent_stage}, {"pipeline", body.definition->name}};
    for (const auto& [name, value] : bound) {
        metadata["with." + name] = value;
    }
    LOG_INFO_META("subpipeline", "Invoking sub-pipeline", metadata);

    return engine_.runChild(body.definition, bound, cancel, parent_run_id, parent_stage);
}

} // namespace Orchestrator
} // namespace DPF
