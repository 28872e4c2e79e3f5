#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

// Forward declaration
namespace YAML { class Node; }

namespace DPF {

// EN: Type-safe configuration value wrapper supporting multiple data types.
// FR: Wrapper de valeur de configuration type-safe supportant plusieurs types de données.
class ConfigValue {
public:
    using ValueType = std::variant<bool, int, double, std::string, std::vector<std::string>>;

    ConfigValue() = default;
    ConfigValue(bool value) : value_(ValueType(value)) {}
    ConfigValue(int value) : value_(ValueType(value)) {}
    ConfigValue(double value) : value_(ValueType(value)) {}
    ConfigValue(const char* value) : value_(ValueType(std::string(value))) {}
    ConfigValue(const std::string& value) : value_(ValueType(value)) {}
    ConfigValue(const std::vector<std::string>& value) : value_(ValueType(value)) {}

    // EN: Get value as specific type (throws if empty or type mismatch).
    // FR: Obtient la valeur comme type spécifique (lance exception si vide ou type incorrect).
    template<typename T>
    T as() const {
        if (!value_) {
            throw std::runtime_error("ConfigValue is empty");
        }
        if (!std::holds_alternative<T>(*value_)) {
            throw std::runtime_error("ConfigValue type mismatch");
        }
        return std::get<T>(*value_);
    }

    // EN: Try to get value as specific type (returns nullopt if empty or type mismatch).
    // FR: Tente d'obtenir la valeur comme type spécifique (retourne nullopt si vide ou type incorrect).
    template<typename T>
    std::optional<T> tryAs() const {
        if (!value_ || !std::holds_alternative<T>(*value_)) {
            return std::nullopt;
        }
        return std::get<T>(*value_);
    }

    template<typename T>
    T asOrDefault(const T& default_value) const {
        auto result = tryAs<T>();
        return result ? *result : default_value;
    }

    // EN: Check if value is valid (not empty).
    // FR: Vérifie si la valeur est valide (non vide).
    bool isValid() const { return value_.has_value(); }

    // EN: Name of the held type: bool, int, double, string, array or empty.
    // FR: Nom du type contenu : bool, int, double, string, array ou empty.
    std::string typeName() const;

    std::string toString() const;

    bool operator==(const ConfigValue& other) const { return value_ == other.value_; }
    bool operator!=(const ConfigValue& other) const { return !(*this == other); }

private:
    std::optional<ValueType> value_;
};

// EN: Configuration section containing key-value pairs.
// FR: Section de configuration contenant des paires clé-valeur.
class ConfigSection {
public:
    ConfigSection() = default;

    void set(const std::string& key, const ConfigValue& value);
    ConfigValue get(const std::string& key) const;
    bool has(const std::string& key) const;
    void remove(const std::string& key);

    // EN: Keys in sorted order.
    // FR: Clés triées.
    std::vector<std::string> keys() const;

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    // EN: Merge another section into this one.
    // FR: Fusionne une autre section dans celle-ci.
    void merge(const ConfigSection& other, bool overwrite = true);

private:
    std::map<std::string, ConfigValue> values_;
};

// EN: Configuration manager with YAML parsing, defaults, environment overrides and validation.
// EN: Keys are addressed as (section, key) or as a dotted path "section.key".
// FR: Gestionnaire de configuration avec parsing YAML, valeurs par défaut, surcharges d'environnement et validation.
// FR: Les clés s'adressent en (section, clé) ou en chemin pointé "section.clé".
class ConfigManager {
public:
    // EN: Validation rule structure for configuration values.
    // FR: Structure de règle de validation pour les valeurs de configuration.
    struct ValidationRule {
        std::string key;   // EN: Dotted path / FR: Chemin pointé
        std::string type;  // "bool", "int", "double", "string", "array"
        bool required = false;
        std::optional<double> min_value;
        std::optional<double> max_value;
        std::vector<std::string> allowed_values;
        std::string description;
    };

    static ConfigManager& getInstance();

    // EN: Load configuration from YAML file. Values are layered over the registered defaults.
    // FR: Charge la configuration depuis un fichier YAML. Les valeurs se superposent aux défauts enregistrés.
    bool loadFromFile(const std::string& filename);
    bool loadFromString(const std::string& yaml_content);

    // EN: Apply <PREFIX><SECTION>_<KEY> environment variables for every known key. Returns the number applied.
    // FR: Applique les variables <PREFIX><SECTION>_<CLE> pour chaque clé connue. Retourne le nombre appliqué.
    size_t loadEnvironmentOverrides(const std::string& prefix = "DPF_");

    // EN: Register a default value, used when no loaded value exists for the key.
    // FR: Enregistre une valeur par défaut, utilisée si aucune valeur chargée n'existe.
    void setDefault(const std::string& section, const std::string& key, const ConfigValue& value);

    void addValidationRules(const std::vector<ValidationRule>& rules);
    bool validate(std::vector<std::string>& errors) const;

    ConfigValue get(const std::string& path) const;
    ConfigValue get(const std::string& section, const std::string& key) const;
    void set(const std::string& path, const ConfigValue& value);
    void set(const std::string& section, const std::string& key, const ConfigValue& value);
    bool has(const std::string& path) const;
    bool has(const std::string& section, const std::string& key) const;
    void remove(const std::string& section, const std::string& key);

    // EN: Get entire configuration section (defaults merged under loaded values).
    // FR: Obtient une section entière (défauts fusionnés sous les valeurs chargées).
    ConfigSection getSection(const std::string& section) const;
    std::vector<std::string> getSectionNames() const;

    // EN: Reset all configuration data, defaults and rules.
    // FR: Remet à zéro toutes les données, défauts et règles.
    void reset();

    std::string dump() const;

    // EN: Split "section.key" into its parts ("default" section when there is no dot).
    // FR: Découpe "section.clé" en ses parties (section "default" sans point).
    static std::pair<std::string, std::string> splitPath(const std::string& path);

    // EN: Environment variable name for a key, e.g. DPF_ENGINE_MAX_PARALLELISM.
    // FR: Nom de variable d'environnement pour une clé, ex. DPF_ENGINE_MAX_PARALLELISM.
    static std::string environmentVariableName(const std::string& prefix, const std::string& section,
                                               const std::string& key);

    // EN: Convert text into a value of the same type as `like` (nullopt when it does not parse).
    // FR: Convertit un texte en valeur du même type que `like` (nullopt si non analysable).
    static std::optional<ConfigValue> parseAs(const std::string& text, const ConfigValue& like);

private:
    ConfigManager() = default;
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    bool loadYaml(const YAML::Node& yaml);
    ConfigValue lookup(const std::string& section, const std::string& key) const;

    bool validateValue(const std::string& key, const ConfigValue& value,
                       const ValidationRule& rule, std::string& error) const;

    // EN: Expand ${VAR} environment references in configuration strings.
    // FR: Étend les références ${VAR} dans les chaînes de configuration.
    std::string expandVariables(const std::string& value) const;

    ConfigValue parseYamlValue(const YAML::Node& node) const;

    mutable std::mutex mutex_;
    std::map<std::string, ConfigSection> sections_;
    std::map<std::string, ConfigSection> defaults_;
    std::vector<ValidationRule> validation_rules_;
};

#define CONFIG_GET(path) DPF::ConfigManager::getInstance().get(path)
#define CONFIG_GET_SECTION(section, key) DPF::ConfigManager::getInstance().get(section, key)
#define CONFIG_SET(path, value) DPF::ConfigManager::getInstance().set(path, DPF::ConfigValue(value))

} // namespace DPF
