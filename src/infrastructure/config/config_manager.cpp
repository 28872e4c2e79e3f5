// EN: Implementation of the ConfigManager class. YAML configuration with defaults, overrides and validation.
// FR: Implémentation de la classe ConfigManager. Configuration YAML avec défauts, surcharges et validation.

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <regex>
#include <set>
#include <sstream>

namespace DPF {

std::string ConfigValue::typeName() const {
    if (!value_) {
        return "empty";
    }
    switch (value_->index()) {
        case 0: return "bool";
        case 1: return "int";
        case 2: return "double";
        case 3: return "string";
        default: return "array";
    }
}

std::string ConfigValue::toString() const {
    if (!value_) {
        return "<empty>";
    }

    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            std::string result = "[";
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) result += ", ";
                result += v[i];
            }
            result += "]";
            return result;
        }
    }, *value_);
}

// ConfigSection implementation
void ConfigSection::set(const std::string& key, const ConfigValue& value) {
    values_[key] = value;
}

ConfigValue ConfigSection::get(const std::string& key) const {
    auto it = values_.find(key);
    return it != values_.end() ? it->second : ConfigValue();
}

bool ConfigSection::has(const std::string& key) const {
    return values_.find(key) != values_.end();
}

void ConfigSection::remove(const std::string& key) {
    values_.erase(key);
}

std::vector<std::string> ConfigSection::keys() const {
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& [key, value] : values_) {
        result.push_back(key);
    }
    return result;
}

void ConfigSection::merge(const ConfigSection& other, bool overwrite) {
    for (const auto& [key, value] : other.values_) {
        if (overwrite || !has(key)) {
            values_[key] = value;
        }
    }
}

// ConfigManager implementation
ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadFromFile(const std::string& filename) {
    try {
        if (!std::filesystem::exists(filename)) {
            LOG_ERROR("config", "Configuration file not found: " + filename);
            return false;
        }

        YAML::Node yaml = YAML::LoadFile(filename);
        if (!loadYaml(yaml)) {
            LOG_ERROR("config", "Configuration root must be a mapping: " + filename);
            return false;
        }

        LOG_INFO("config", "Configuration loaded from: " + filename);
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("config", "Failed to load configuration: " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        if (!loadYaml(yaml)) {
            LOG_ERROR("config", "Configuration root must be a mapping");
            return false;
        }

        LOG_DEBUG("config", "Configuration loaded from string");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("config", "Failed to load configuration from string: " + std::string(e.what()));
        return false;
    }
}

// EN: Replace loaded sections with the YAML document. Scalars at top level go to the "default" section.
// FR: Remplace les sections chargées par le document YAML. Les scalaires de premier niveau vont dans "default".
bool ConfigManager::loadYaml(const YAML::Node& yaml) {
    if (yaml.IsNull()) {
        std::lock_guard<std::mutex> lock(mutex_);
        sections_.clear();
        return true;
    }
    if (!yaml.IsMap()) {
        return false;
    }

    std::map<std::string, ConfigSection> loaded;
    for (const auto& section : yaml) {
        std::string section_name = section.first.as<std::string>();

        if (section.second.IsMap()) {
            ConfigSection config_section;
            for (const auto& item : section.second) {
                config_section.set(item.first.as<std::string>(), parseYamlValue(item.second));
            }
            loaded[section_name].merge(config_section);
        } else {
            loaded["default"].set(section_name, parseYamlValue(section.second));
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    sections_ = std::move(loaded);
    return true;
}

ConfigValue ConfigManager::parseYamlValue(const YAML::Node& node) const {
    if (node.IsSequence()) {
        std::vector<std::string> array_value;
        for (const auto& item : node) {
            array_value.push_back(expandVariables(item.as<std::string>()));
        }
        return ConfigValue(array_value);
    }

    if (!node.IsScalar()) {
        return ConfigValue();
    }

    std::string str_val = node.as<std::string>();

    // EN: Quoted scalars are always strings.
    // FR: Les scalaires entre guillemets sont toujours des chaînes.
    if (node.Tag() == "!") {
        return ConfigValue(expandVariables(str_val));
    }

    if (str_val == "true" || str_val == "false") {
        return ConfigValue(str_val == "true");
    }

    if (str_val.find('.') == std::string::npos) {
        try {
            return ConfigValue(node.as<int>());
        } catch (const YAML::Exception&) {
            // EN: Not an int, continue. FR: Pas un int, on continue.
        }
    }

    try {
        return ConfigValue(node.as<double>());
    } catch (const YAML::Exception&) {
        // EN: Not a double, treat as string. FR: Pas un double, traité comme chaîne.
    }

    return ConfigValue(expandVariables(str_val));
}

size_t ConfigManager::loadEnvironmentOverrides(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);

    // EN: Known keys are the union of defaults, loaded values and validation rules.
    // FR: Les clés connues sont l'union des défauts, des valeurs chargées et des règles.
    std::set<std::pair<std::string, std::string>> known_keys;
    for (const auto* source : {&defaults_, &sections_}) {
        for (const auto& [section_name, section] : *source) {
            for (const auto& key : section.keys()) {
                known_keys.emplace(section_name, key);
            }
        }
    }
    for (const auto& rule : validation_rules_) {
        known_keys.insert(splitPath(rule.key));
    }

    size_t applied = 0;
    for (const auto& [section_name, key] : known_keys) {
        std::string env_name = environmentVariableName(prefix, section_name, key);
        const char* env_value = std::getenv(env_name.c_str());
        if (!env_value) {
            continue;
        }

        ConfigValue current = lookup(section_name, key);
        std::optional<ConfigValue> parsed = current.isValid()
            ? parseAs(env_value, current)
            : std::optional<ConfigValue>(ConfigValue(std::string(env_value)));

        if (!parsed) {
            LOG_WARN("config", "Ignoring environment override " + env_name + ": expected " +
                     current.typeName() + ", got '" + std::string(env_value) + "'");
            continue;
        }

        sections_[section_name].set(key, *parsed);
        ++applied;
        LOG_INFO("config", "Environment override applied: " + section_name + "." + key);
    }

    return applied;
}

void ConfigManager::setDefault(const std::string& section, const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    defaults_[section].set(key, value);
}

void ConfigManager::addValidationRules(const std::vector<ValidationRule>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    validation_rules_.insert(validation_rules_.end(), rules.begin(), rules.end());
}

bool ConfigManager::validate(std::vector<std::string>& errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    errors.clear();

    for (const auto& rule : validation_rules_) {
        auto [section_name, key_name] = splitPath(rule.key);
        ConfigValue value = lookup(section_name, key_name);

        if (!value.isValid()) {
            if (rule.required) {
                errors.push_back("Required configuration missing: " + rule.key);
            }
            continue;
        }

        std::string error;
        if (!validateValue(rule.key, value, rule, error)) {
            errors.push_back(error);
        }
    }

    return errors.empty();
}

// EN: Lookup without locking; callers hold mutex_.
// FR: Recherche sans verrou ; l'appelant détient mutex_.
ConfigValue ConfigManager::lookup(const std::string& section, const std::string& key) const {
    auto section_it = sections_.find(section);
    if (section_it != sections_.end() && section_it->second.has(key)) {
        return section_it->second.get(key);
    }

    auto default_it = defaults_.find(section);
    if (default_it != defaults_.end()) {
        return default_it->second.get(key);
    }

    return ConfigValue();
}

ConfigValue ConfigManager::get(const std::string& path) const {
    auto [section, key] = splitPath(path);
    return get(section, key);
}

ConfigValue ConfigManager::get(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup(section, key);
}

void ConfigManager::set(const std::string& path, const ConfigValue& value) {
    auto [section, key] = splitPath(path);
    set(section, key, value);
}

void ConfigManager::set(const std::string& section, const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section].set(key, value);
}

bool ConfigManager::has(const std::string& path) const {
    auto [section, key] = splitPath(path);
    return has(section, key);
}

bool ConfigManager::has(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup(section, key).isValid();
}

void ConfigManager::remove(const std::string& section, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sections_.find(section);
    if (it != sections_.end()) {
        it->second.remove(key);
    }
}

ConfigSection ConfigManager::getSection(const std::string& section) const {
    std::lock_guard<std::mutex> lock(mutex_);

    ConfigSection result;
    auto default_it = defaults_.find(section);
    if (default_it != defaults_.end()) {
        result.merge(default_it->second);
    }
    auto it = sections_.find(section);
    if (it != sections_.end()) {
        result.merge(it->second);
    }
    return result;
}

std::vector<std::string> ConfigManager::getSectionNames() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::set<std::string> names;
    for (const auto& [name, section] : defaults_) {
        names.insert(name);
    }
    for (const auto& [name, section] : sections_) {
        names.insert(name);
    }
    return std::vector<std::string>(names.begin(), names.end());
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.clear();
    defaults_.clear();
    validation_rules_.clear();
}

std::string ConfigManager::dump() const {
    std::vector<std::string> names = getSectionNames();

    std::ostringstream oss;
    for (const auto& name : names) {
        ConfigSection section = getSection(name);
        oss << "[" << name << "]\n";
        for (const auto& key : section.keys()) {
            oss << "  " << key << " = " << section.get(key).toString() << "\n";
        }
    }
    return oss.str();
}

std::pair<std::string, std::string> ConfigManager::splitPath(const std::string& path) {
    size_t dot_pos = path.find('.');
    if (dot_pos == std::string::npos) {
        return {"default", path};
    }
    return {path.substr(0, dot_pos), path.substr(dot_pos + 1)};
}

std::string ConfigManager::environmentVariableName(const std::string& prefix, const std::string& section,
                                                   const std::string& key) {
    std::string name = section + "_" + key;
    for (char& c : name) {
        c = std::isalnum(static_cast<unsigned char>(c))
            ? static_cast<char>(std::toupper(static_cast<unsigned char>(c)))
            : '_';
    }
    return prefix + name;
}

std::optional<ConfigValue> ConfigManager::parseAs(const std::string& text, const ConfigValue& like) {
    if (like.tryAs<bool>()) {
        std::string lower = text;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return ConfigValue(true);
        if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return ConfigValue(false);
        return std::nullopt;
    }

    if (like.tryAs<int>()) {
        try {
            size_t consumed = 0;
            int value = std::stoi(text, &consumed);
            if (consumed != text.size()) return std::nullopt;
            return ConfigValue(value);
        } catch (const std::logic_error&) {
            return std::nullopt;
        }
    }

    if (like.tryAs<double>()) {
        try {
            size_t consumed = 0;
            double value = std::stod(text, &consumed);
            if (consumed != text.size()) return std::nullopt;
            return ConfigValue(value);
        } catch (const std::logic_error&) {
            return std::nullopt;
        }
    }

    if (like.tryAs<std::vector<std::string>>()) {
        std::vector<std::string> items;
        std::stringstream ss(text);
        std::string item;
        while (std::getline(ss, item, ',')) {
            if (!item.empty()) items.push_back(item);
        }
        return ConfigValue(items);
    }

    return ConfigValue(text);
}

bool ConfigManager::validateValue(const std::string& key, const ConfigValue& value,
                                  const ValidationRule& rule, std::string& error) const {
    // Type validation
    if (rule.type == "bool" && !value.tryAs<bool>()) {
        error = "Configuration " + key + " must be a boolean";
        return false;
    } else if (rule.type == "int" && !value.tryAs<int>()) {
        error = "Configuration " + key + " must be an integer";
        return false;
    } else if (rule.type == "double" && !value.tryAs<double>() && !value.tryAs<int>()) {
        error = "Configuration " + key + " must be a number";
        return false;
    } else if (rule.type == "string" && !value.tryAs<std::string>()) {
        error = "Configuration " + key + " must be a string";
        return false;
    } else if (rule.type == "array" && !value.tryAs<std::vector<std::string>>()) {
        error = "Configuration " + key + " must be an array";
        return false;
    }

    // Range validation for numeric types
    if ((rule.type == "int" || rule.type == "double") &&
        (rule.min_value || rule.max_value)) {
        double numeric_value = 0.0;
        if (auto int_val = value.tryAs<int>()) {
            numeric_value = static_cast<double>(*int_val);
        } else if (auto double_val = value.tryAs<double>()) {
            numeric_value = *double_val;
        }

        if (rule.min_value && numeric_value < *rule.min_value) {
            error = "Configuration " + key + " must be >= " + ConfigValue(*rule.min_value).toString();
            return false;
        }
        if (rule.max_value && numeric_value > *rule.max_value) {
            error = "Configuration " + key + " must be <= " + ConfigValue(*rule.max_value).toString();
            return false;
        }
    }

    // Allowed values validation
    if (!rule.allowed_values.empty()) {
        std::string str_value = value.toString();
        if (std::find(rule.allowed_values.begin(), rule.allowed_values.end(), str_value) ==
            rule.allowed_values.end()) {
            error = "Configuration " + key + " must be one of: ";
            for (size_t i = 0; i < rule.allowed_values.size(); ++i) {
                if (i > 0) error += ", ";
                error += rule.allowed_values[i];
            }
            return false;
        }
    }

    return true;
}

std::string ConfigManager::expandVariables(const std::string& value) const {
    static const std::regex var_regex(R"(\$\{([A-Za-z_][A-Za-z0-9_]*)\})");

    std::string result;
    auto begin = std::sregex_iterator(value.begin(), value.end(), var_regex);
    auto end = std::sregex_iterator();
    size_t last = 0;

    for (auto it = begin; it != end; ++it) {
        const std::smatch& match = *it;
        result.append(value, last, static_cast<size_t>(match.position()) - last);

        const char* env_value = std::getenv(match[1].str().c_str());
        // EN: Leave unknown variables as-is. FR: Laisse les variables inconnues telles quelles.
        result += env_value ? std::string(env_value) : match.str();
        last = static_cast<size_t>(match.position() + match.length());
    }
    result.append(value, last, std::string::npos);
    return result;
}

} // namespace DPF
