// EN: Pipeline Utils implementation - formatting, parsing and reporting helpers.
// FR: Implémentation Pipeline Utils - assistants de formatage, d'analyse et de rapport.

#include "orchestrator/pipeline_engine.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

#include <sys/utsname.h>

namespace DPF {
namespace Orchestrator {

// EN: Report helpers
// FR: Assistants de rapport

bool PipelineStageResult::isTerminal() const {
    return status != StageStatus::BLOCKED && status != StageStatus::READY && status != StageStatus::RUNNING;
}

const PipelineStageResult* RunReport::findStage(const std::string& stage_name) const {
    for (const auto& stage : stages) {
        if (stage.stage_name == stage_name) {
            return &stage;
        }
    }
    return nullptr;
}

size_t RunReport::countStages(StageStatus stage_status) const {
    return static_cast<size_t>(std::count_if(stages.begin(), stages.end(),
        [stage_status](const PipelineStageResult& stage) { return stage.status == stage_status; }));
}

int RunReport::exitCode() const {
    return PipelineUtils::exitCodeForStatus(status);
}

namespace PipelineUtils {

bool isValidStageName(const std::string& name) {
    return !name.empty() &&
           name.find_first_not_of("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_-") == std::string::npos;
}

std::string formatDuration(std::chrono::milliseconds duration) {
    auto ms = duration.count();
    if (ms < 0) {
        ms = 0;
    }
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    }

    std::ostringstream oss;
    if (ms < 60 * 1000) {
        oss << std::fixed << std::setprecision(1) << (static_cast<double>(ms) / 1000.0) << "s";
        return oss.str();
    }

    auto total_seconds = ms / 1000;
    auto hours = total_seconds / 3600;
    auto minutes = (total_seconds % 3600) / 60;
    auto seconds = total_seconds % 60;
    if (hours > 0) {
        oss << hours << "h " << std::setw(2) << std::setfill('0') << minutes << "m";
    } else {
        oss << minutes << "m " << std::setw(2) << std::setfill('0') << seconds << "s";
    }
    return oss.str();
}

std::string formatTimestamp(std::chrono::system_clock::time_point timestamp) {
    return Logger::timestampToISO8601(timestamp);
}

std::optional<std::chrono::milliseconds> parseDuration(const std::string& text) {
    std::string value = text;
    value.erase(0, value.find_first_not_of(" \t"));
    value.erase(value.find_last_not_of(" \t") + 1);

    size_t digits = 0;
    while (digits < value.size() && std::isdigit(static_cast<unsigned char>(value[digits]))) {
        ++digits;
    }
    if (digits == 0 || digits > 12) {
        return std::nullopt;
    }

    long long amount = std::stoll(value.substr(0, digits));
    std::string unit = value.substr(digits);

    if (unit.empty() || unit == "s") {
        return std::chrono::milliseconds(amount * 1000);
    }
    if (unit == "ms") {
        return std::chrono::milliseconds(amount);
    }
    if (unit == "m") {
        return std::chrono::milliseconds(amount * 60 * 1000);
    }
    if (unit == "h") {
        return std::chrono::milliseconds(amount * 3600 * 1000);
    }
    return std::nullopt;
}

std::string statusToString(StageStatus status) {
    switch (status) {
        case StageStatus::BLOCKED: return "BLOCKED";
        case StageStatus::READY: return "READY";
        case StageStatus::RUNNING: return "RUNNING";
        case StageStatus::SUCCEEDED: return "SUCCEEDED";
        case StageStatus::FAILED: return "FAILED";
        case StageStatus::CANCELLED: return "CANCELLED";
        case StageStatus::SKIPPED_BY_CONDITION: return "SKIPPED_BY_CONDITION";
        case StageStatus::SKIPPED_BY_UPSTREAM_FAILURE: return "SKIPPED_BY_UPSTREAM_FAILURE";
        default: return "UNKNOWN";
    }
}

std::string runStatusToString(RunStatus status) {
    switch (status) {
        case RunStatus::PENDING: return "PENDING";
        case RunStatus::RUNNING: return "RUNNING";
        case RunStatus::SUCCEEDED: return "SUCCEEDED";
        case RunStatus::FAILED: return "FAILED";
        case RunStatus::CANCELLED: return "CANCELLED";
        default: return "UNKNOWN";
    }
}

std::string errorKindToString(StageErrorKind kind) {
    switch (kind) {
        case StageErrorKind::NONE: return "NONE";
        case StageErrorKind::LOCK_TIMEOUT: return "LOCK_TIMEOUT";
        case StageErrorKind::ACTION_FAILURE: return "ACTION_FAILURE";
        case StageErrorKind::ACTION_TIMEOUT: return "ACTION_TIMEOUT";
        case StageErrorKind::RUN_CANCELLED: return "RUN_CANCELLED";
        case StageErrorKind::INTERNAL: return "INTERNAL";
        default: return "UNKNOWN";
    }
}

std::string eventTypeToString(PipelineEventType type) {
    switch (type) {
        case PipelineEventType::RUN_STARTED: return "RUN_STARTED";
        case PipelineEventType::RUN_COMPLETED: return "RUN_COMPLETED";
        case PipelineEventType::RUN_FAILED: return "RUN_FAILED";
        case PipelineEventType::RUN_CANCELLED: return "RUN_CANCELLED";
        case PipelineEventType::STAGE_READY: return "STAGE_READY";
        case PipelineEventType::STAGE_STARTED: return "STAGE_STARTED";
        case PipelineEventType::STAGE_COMPLETED: return "STAGE_COMPLETED";
        case PipelineEventType::STAGE_FAILED: return "STAGE_FAILED";
        case PipelineEventType::STAGE_CANCELLED: return "STAGE_CANCELLED";
        case PipelineEventType::STAGE_SKIPPED: return "STAGE_SKIPPED";
        case PipelineEventType::LOCK_WAITING: return "LOCK_WAITING";
        case PipelineEventType::LOCK_ACQUIRED: return "LOCK_ACQUIRED";
        case PipelineEventType::LOCK_RELEASED: return "LOCK_RELEASED";
        default: return "UNKNOWN";
    }
}

std::string expandParameters(const std::string& text, const RunParameters& parameters) {
    std::string result;
    result.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find("${", pos);
        if (open == std::string::npos) {
            result.append(text, pos, std::string::npos);
            break;
        }
        size_t close = text.find('}', open + 2);
        if (close == std::string::npos) {
            result.append(text, pos, std::string::npos);
            break;
        }

        result.append(text, pos, open - pos);
        std::string name = text.substr(open + 2, close - open - 2);
        name.erase(0, name.find_first_not_of(' '));
        name.erase(name.find_last_not_of(' ') + 1);

        auto it = parameters.find(name);
        if (it != parameters.end()) {
            result += it->second;
        } else {
            result.append(text, open, close - open + 1);
        }
        pos = close + 1;
    }
    return result;
}

std::string generateRunId(const std::string& pipeline_name) {
    thread_local std::mt19937 generator(std::random_device{}());
    std::uniform_int_distribution<uint32_t> distribution(0, 0xFFFFFF);

    std::string prefix;
    for (char c : pipeline_name) {
        prefix += std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' ? c : '-';
    }
    if (prefix.empty()) {
        prefix = "run";
    }

    auto time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&time_t, &utc);

    std::ostringstream oss;
    oss << prefix << "-" << std::put_time(&utc, "%Y%m%dT%H%M%S") << "-"
        << std::hex << std::setw(6) << std::setfill('0') << distribution(generator);
    return oss.str();
}

RunParameters detectRunnerContext() {
    RunParameters context;
    struct utsname info {};
    if (uname(&info) != 0) {
        LOG_WARN("engine", "uname failed, runner context not available");
        return context;
    }

    std::string system = info.sysname;
    if (system == "Darwin") {
        system = "macOS";
    }
    std::string machine = info.machine;
    if (machine == "x86_64" || machine == "amd64") {
        machine = "X64";
    } else if (machine == "aarch64" || machine == "arm64") {
        machine = "ARM64";
    }

    context["runner.os"] = system;
    context["runner.arch"] = machine;
    context["runner.host"] = info.nodename;
    return context;
}

nlohmann::json runReportToJson(const RunReport& report) {
    nlohmann::json json;
    json["run_id"] = report.run_id;
    json["pipeline"] = report.pipeline_name;
    if (!report.parent_run_id.empty()) {
        json["parent_run_id"] = report.parent_run_id;
        json["parent_stage"] = report.parent_stage;
    }
    json["status"] = runStatusToString(report.status);
    json["exit_code"] = report.exitCode();
    json["parameters"] = report.parameters;
    json["start_time"] = formatTimestamp(report.start_time);
    json["end_time"] = formatTimestamp(report.end_time);
    json["duration_ms"] = report.duration.count();
    json["definition_checksum"] = report.definition_checksum;
    if (report.cancelled_by_request || !report.cancel_reason.empty()) {
        json["cancel_reason"] = report.cancel_reason;
    }

    json["stages"] = nlohmann::json::array();
    for (const auto& stage : report.stages) {
        nlohmann::json entry;
        entry["name"] = stage.stage_name;
        entry["status"] = statusToString(stage.status);
        if (stage.error_kind != StageErrorKind::NONE) {
            entry["error_kind"] = errorKindToString(stage.error_kind);
        }
        if (!stage.error_message.empty()) {
            entry["message"] = stage.error_message;
        }
        entry["exit_code"] = stage.exit_code;
        entry["execution_ms"] = stage.execution_time.count();
        entry["lock_wait_ms"] = stage.lock_wait_time.count();
        if (stage.status != StageStatus::SKIPPED_BY_CONDITION &&
            stage.status != StageStatus::SKIPPED_BY_UPSTREAM_FAILURE && stage.isTerminal()) {
            entry["start_time"] = formatTimestamp(stage.start_time);
            entry["end_time"] = formatTimestamp(stage.end_time);
        }
        if (!stage.output_path.empty()) {
            entry["output"] = stage.output_path;
        }
        if (stage.sub_run) {
            entry["sub_run"] = runReportToJson(*stage.sub_run);
        }
        json["stages"].push_back(entry);
    }
    return json;
}

bool saveRunReport(const RunReport& report, const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file) {
        LOG_ERROR("engine", "Cannot write run report to " + filepath);
        return false;
    }
    file << runReportToJson(report).dump(2) << "\n";
    if (!file) {
        LOG_ERROR("engine", "Failed while writing run report to " + filepath);
        return false;
    }
    return true;
}

namespace {

void appendStageLines(std::ostringstream& out, const RunReport& report, const std::string& indent) {
    for (const auto& stage : report.stages) {
        out << indent << "  " << std::left << std::setw(24) << stage.stage_name
            << std::setw(30) << statusToString(stage.status)
            << std::setw(10) << formatDuration(stage.execution_time);
        if (stage.error_kind != StageErrorKind::NONE) {
            out << errorKindToString(stage.error_kind) << ": ";
        }
        out << stage.error_message << "\n";

        if (stage.sub_run) {
            out << indent << "    -> " << stage.sub_run->pipeline_name << " (" << stage.sub_run->run_id << "): "
                << runStatusToString(stage.sub_run->status) << "\n";
            appendStageLines(out, *stage.sub_run, indent + "    ");
        }
    }
}

} // namespace

std::string formatRunSummary(const RunReport& report) {
    std::ostringstream out;
    out << "Run " << report.run_id << " (" << report.pipeline_name << "): "
        << runStatusToString(report.status) << " in " << formatDuration(report.duration) << "\n";
    appendStageLines(out, report, "");
    return out.str();
}

std::string formatExecutionPlan(const PipelineDefinition& definition, const RunParameters& parameters) {
    PipelineDependencyResolver resolver(definition);
    std::ostringstream out;
    out << "Pipeline " << definition.name << " (" << definition.stages.size() << " stages)\n";

    auto levels = resolver.getExecutionLevels();
    for (size_t level = 0; level < levels.size(); ++level) {
        out << "Level " << (level + 1) << ":\n";
        for (const auto& name : levels[level]) {
            const StageSpec* stage = definition.findStage(name);
            out << "  - " << name << ": " << stage->describeBody();
            if (!stage->needs.empty()) {
                out << " [needs:";
                for (const auto& need : stage->needs) {
                    out << " " << need;
                }
                out << "]";
            }
            if (!stage->resource_lock.empty()) {
                out << " [lock: " << expandParameters(stage->resource_lock, parameters) << "]";
            }
            if (stage->condition) {
                out << " [if: " << stage->condition->source() << " => "
                    << (stage->shouldRun(parameters) ? "runs" : "skipped") << "]";
            }
            out << "\n";
        }
    }
    return out.str();
}

int exitCodeForStatus(RunStatus status) {
    switch (status) {
        case RunStatus::SUCCEEDED: return 0;
        case RunStatus::CANCELLED: return 2;
        default: return 1;
    }
}

} // namespace PipelineUtils

} // namespace Orchestrator
} // namespace DPF
