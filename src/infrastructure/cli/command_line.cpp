// EN: Implementation of the dpfctl command line parser.
// FR: Implémentation de l'analyseur de ligne de commande dpfctl.

#include "infrastructure/cli/command_line.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace DPF {
namespace CLI {

bool CliParseResult::has(const std::string& long_name) const {
    return values.find(long_name) != values.end();
}

std::optional<std::string> CliParseResult::getValue(const std::string& long_name) const {
    auto it = values.find(long_name);
    if (it == values.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.back();
}

std::vector<std::string> CliParseResult::getValues(const std::string& long_name) const {
    auto it = values.find(long_name);
    return it != values.end() ? it->second : std::vector<std::string>{};
}

std::map<std::string, std::string> CliParseResult::getKeyValues(const std::string& long_name) const {
    std::map<std::string, std::string> pairs;
    for (const auto& raw : getValues(long_name)) {
        if (auto kv = CommandLineUtils::parseKeyValue(raw)) {
            pairs[kv->first] = kv->second;
        }
    }
    return pairs;
}

CommandLineParser::CommandLineParser(std::string program_name)
    : program_name_(std::move(program_name)) {}

void CommandLineParser::addOption(const CliOptionDefinition& option_def) {
    if (option_def.long_name.empty()) {
        throw std::invalid_argument("CLI option requires a long name");
    }
    if (findOption(option_def.long_name)) {
        throw std::invalid_argument("Duplicate CLI option: --" + option_def.long_name);
    }
    if (option_def.short_name && findShortOption(*option_def.short_name)) {
        throw std::invalid_argument(std::string("Duplicate CLI short option: -") + *option_def.short_name);
    }
    options_.push_back(option_def);
}

void CommandLineParser::addStandardOptions() {
    CliOptionDefinition help;
    help.long_name = "help";
    help.short_name = 'h';
    help.type = CliOptionType::BOOLEAN;
    help.description = "Show this help and exit";
    addOption(help);

    CliOptionDefinition version;
    version.long_name = "version";
    version.type = CliOptionType::BOOLEAN;
    version.description = "Show version information and exit";
    addOption(version);

    CliOptionDefinition config;
    config.long_name = "config";
    config.short_name = 'c';
    config.value_name = "FILE";
    config.description = "Load engine configuration from a YAML file";
    addOption(config);

    CliOptionDefinition param;
    param.long_name = "param";
    param.short_name = 'p';
    param.type = CliOptionType::KEY_VALUE;
    param.value_name = "KEY=VALUE";
    param.description = "Bind a pipeline parameter (repeatable)";
    param.repeatable = true;
    addOption(param);

    CliOptionDefinition max_parallel;
    max_parallel.long_name = "max-parallel";
    max_parallel.short_name = 'j';
    max_parallel.type = CliOptionType::INTEGER;
    max_parallel.value_name = "N";
    max_parallel.description = "Maximum stages running at once (0 = unbounded)";
    max_parallel.config_path = "engine.max_parallelism";
    max_parallel.constraint = CliOptionConstraint::NON_NEGATIVE;
    addOption(max_parallel);

    CliOptionDefinition lock_backend;
    lock_backend.long_name = "lock-backend";
    lock_backend.value_name = "BACKEND";
    lock_backend.description = "Resource lock backend: file (cross-process) or memory";
    lock_backend.config_path = "locks.backend";
    lock_backend.constraint = CliOptionConstraint::ENUM_VALUES;
    lock_backend.enum_values = {"file", "memory"};
    addOption(lock_backend);

    CliOptionDefinition lock_dir;
    lock_dir.long_name = "lock-dir";
    lock_dir.value_name = "DIR";
    lock_dir.description = "Directory holding lock files for the file backend";
    lock_dir.config_path = "locks.directory";
    addOption(lock_dir);

    CliOptionDefinition run_log_dir;
    run_log_dir.long_name = "run-log-dir";
    run_log_dir.value_name = "DIR";
    run_log_dir.description = "Directory receiving per-stage output logs";
    run_log_dir.config_path = "runs.log_directory";
    addOption(run_log_dir);

    CliOptionDefinition log_level;
    log_level.long_name = "log-level";
    log_level.value_name = "LEVEL";
    log_level.description = "Log level: DEBUG, INFO, WARN or ERROR";
    log_level.config_path = "logging.level";
    log_level.constraint = CliOptionConstraint::ENUM_VALUES;
    log_level.enum_values = {"DEBUG", "INFO", "WARN", "ERROR"};
    addOption(log_level);

    CliOptionDefinition log_file;
    log_file.long_name = "log-file";
    log_file.value_name = "FILE";
    log_file.description = "Write NDJSON logs to FILE instead of stderr";
    log_file.config_path = "logging.file";
    addOption(log_file);

    CliOptionDefinition report;
    report.long_name = "report";
    report.value_name = "FILE";
    report.description = "Write the JSON run report to FILE";
    addOption(report);
}

void CommandLineParser::setUsage(const std::string& usage_line, const std::string& commands_text) {
    usage_line_ = usage_line;
    commands_text_ = commands_text;
}

CliParseResult CommandLineParser::parse(int argc, char* argv[]) const {
    std::vector<std::string> arguments;
    for (int i = 1; i < argc; ++i) {
        arguments.emplace_back(argv[i]);
    }
    return parse(arguments);
}

CliParseResult CommandLineParser::parse(const std::vector<std::string>& arguments) const {
    CliParseResult result;
    bool options_ended = false;

    for (size_t i = 0; i < arguments.size(); ++i) {
        const std::string& arg = arguments[i];

        if (options_ended || arg.size() < 2 || arg[0] != '-') {
            result.positional.push_back(arg);
            continue;
        }

        if (arg == "--") {
            options_ended = true;
            continue;
        }

        const CliOptionDefinition* option = nullptr;
        std::optional<std::string> inline_value;
        std::string display_name;

        if (arg.compare(0, 2, "--") == 0) {
            std::string name = arg.substr(2);
            size_t eq = name.find('=');
            if (eq != std::string::npos) {
                inline_value = name.substr(eq + 1);
                name = name.substr(0, eq);
            }
            option = findOption(name);
            display_name = "--" + name;
        } else {
            if (arg.size() > 2) {
                inline_value = arg.substr(2);
            }
            option = findShortOption(arg[1]);
            display_name = arg.substr(0, 2);
        }

        if (!option) {
            fail(result, CliParseStatus::INVALID_OPTION, "Unknown option: " + display_name);
            return result;
        }

        if (!option->repeatable && result.has(option->long_name)) {
            fail(result, CliParseStatus::DUPLICATE_OPTION, "Option given more than once: --" + option->long_name);
            return result;
        }

        if (option->type == CliOptionType::BOOLEAN) {
            if (inline_value) {
                fail(result, CliParseStatus::INVALID_VALUE, "Option --" + option->long_name + " takes no value");
                return result;
            }
            result.values[option->long_name].push_back("true");
            if (!option->config_path.empty()) {
                result.overrides[option->config_path] = ConfigValue(true);
            }
            continue;
        }

        std::string value;
        if (inline_value) {
            value = *inline_value;
        } else if (i + 1 < arguments.size()) {
            value = arguments[++i];
        } else {
            fail(result, CliParseStatus::MISSING_VALUE, "Option --" + option->long_name + " requires " +
                 option->value_name);
            return result;
        }

        if (!recordValue(*option, value, result)) {
            return result;
        }
    }

    // EN: Help and version win over any other outcome.
    // FR: L'aide et la version l'emportent sur tout autre résultat.
    if (result.has("help")) {
        result.status = CliParseStatus::HELP_REQUESTED;
        result.help_text = generateHelpText();
    } else if (result.has("version")) {
        result.status = CliParseStatus::VERSION_REQUESTED;
        result.version_text = version_text_.empty() ? program_name_ : version_text_;
    }

    return result;
}

bool CommandLineParser::recordValue(const CliOptionDefinition& option, const std::string& value,
                                    CliParseResult& result) const {
    const std::string name = "--" + option.long_name;

    switch (option.type) {
        case CliOptionType::INTEGER: {
            int parsed = 0;
            try {
                size_t consumed = 0;
                parsed = std::stoi(value, &consumed);
                if (consumed != value.size()) {
                    throw std::invalid_argument(value);
                }
            } catch (const std::logic_error&) {
                fail(result, CliParseStatus::INVALID_VALUE, name + " expects an integer, got '" + value + "'");
                return false;
            }

            if (option.constraint == CliOptionConstraint::POSITIVE && parsed <= 0) {
                fail(result, CliParseStatus::CONSTRAINT_VIOLATION, name + " must be positive");
                return false;
            }
            if (option.constraint == CliOptionConstraint::NON_NEGATIVE && parsed < 0) {
                fail(result, CliParseStatus::CONSTRAINT_VIOLATION, name + " must not be negative");
                return false;
            }
            if (!option.config_path.empty()) {
                result.overrides[option.config_path] = ConfigValue(parsed);
            }
            break;
        }
        case CliOptionType::KEY_VALUE:
            if (!CommandLineUtils::parseKeyValue(value)) {
                fail(result, CliParseStatus::INVALID_VALUE, name + " expects KEY=VALUE, got '" + value + "'");
                return false;
            }
            break;
        case CliOptionType::STRING:
            if (option.constraint == CliOptionConstraint::ENUM_VALUES &&
                option.enum_values.find(value) == option.enum_values.end()) {
                std::string allowed;
                for (const auto& v : option.enum_values) {
                    allowed += allowed.empty() ? v : ", " + v;
                }
                fail(result, CliParseStatus::CONSTRAINT_VIOLATION, name + " must be one of: " + allowed);
                return false;
            }
            if (!option.config_path.empty()) {
                result.overrides[option.config_path] = ConfigValue(value);
            }
            break;
        case CliOptionType::BOOLEAN:
            break;
    }

    result.values[option.long_name].push_back(value);
    return true;
}

void CommandLineParser::fail(CliParseResult& result, CliParseStatus status, const std::string& message) const {
    result.status = status;
    result.errors.push_back(message);
}

std::string CommandLineParser::generateHelpText() const {
    std::ostringstream help;
    help << "Usage: " << (usage_line_.empty() ? program_name_ + " [options]" : usage_line_) << "\n";

    if (!commands_text_.empty()) {
        help << "\nCommands:\n" << commands_text_;
        if (commands_text_.back() != '\n') {
            help << "\n";
        }
    }

    help << "\nOptions:\n";
    for (const auto& option : options_) {
        std::string flags = option.short_name ? std::string("-") + *option.short_name + ", " : "    ";
        flags += "--" + option.long_name;
        if (option.type != CliOptionType::BOOLEAN) {
            flags += " " + option.value_name;
        }

        help << "  " << flags;
        if (flags.size() < 28) {
            help << std::string(28 - flags.size(), ' ');
        } else {
            help << "\n" << std::string(30, ' ');
        }
        help << option.description << "\n";
    }

    return help.str();
}

size_t CommandLineParser::applyOverrides(const CliParseResult& result, ConfigManager& config) const {
    for (const auto& [path, value] : result.overrides) {
        config.set(path, value);
        LOG_DEBUG("cli", "Configuration override from command line: " + path + " = " + value.toString());
    }
    return result.overrides.size();
}

const CliOptionDefinition* CommandLineParser::findOption(const std::string& long_name) const {
    auto it = std::find_if(options_.begin(), options_.end(),
                           [&](const CliOptionDefinition& o) { return o.long_name == long_name; });
    return it != options_.end() ? &*it : nullptr;
}

const CliOptionDefinition* CommandLineParser::findShortOption(char short_name) const {
    auto it = std::find_if(options_.begin(), options_.end(),
                           [&](const CliOptionDefinition& o) { return o.short_name && *o.short_name == short_name; });
    return it != options_.end() ? &*it : nullptr;
}

namespace CommandLineUtils {

std::optional<std::pair<std::string, std::string>> parseKeyValue(const std::string& text) {
    size_t eq = text.find('=');
    if (eq == std::string::npos || eq == 0) {
        return std::nullopt;
    }
    return std::make_pair(text.substr(0, eq), text.substr(eq + 1));
}

std::string statusToString(CliParseStatus status) {
    switch (status) {
        case CliParseStatus::SUCCESS: return "SUCCESS";
        case CliParseStatus::HELP_REQUESTED: return "HELP_REQUESTED";
        case CliParseStatus::VERSION_REQUESTED: return "VERSION_REQUESTED";
        case CliParseStatus::INVALID_OPTION: return "INVALID_OPTION";
        case CliParseStatus::MISSING_VALUE: return "MISSING_VALUE";
        case CliParseStatus::INVALID_VALUE: return "INVALID_VALUE";
        case CliParseStatus::CONSTRAINT_VIOLATION: return "CONSTRAINT_VIOLATION";
        case CliParseStatus::DUPLICATE_OPTION: return "DUPLICATE_OPTION";
        default: return "UNKNOWN";
    }
}

} // namespace CommandLineUtils

} // namespace CLI
} // namespace DPF
