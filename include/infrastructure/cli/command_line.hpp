// EN: Command line parser for dpfctl - typed options, constraints, help text and configuration overrides
// FR: Analyseur de ligne de commande pour dpfctl - options typées, contraintes, aide et surcharges de configuration

#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "infrastructure/config/config_manager.hpp"

namespace DPF {
namespace CLI {

// EN: CLI option types
// FR: Types d'options CLI
enum class CliOptionType {
    BOOLEAN,        // EN: Flag without value / FR: Drapeau sans valeur
    INTEGER,        // EN: Integer value / FR: Valeur entière
    STRING,         // EN: String value / FR: Valeur chaîne
    KEY_VALUE       // EN: KEY=VALUE pair / FR: Paire CLE=VALEUR
};

// EN: CLI option value constraints
// FR: Contraintes de valeur d'option CLI
enum class CliOptionConstraint {
    NONE,           // EN: No constraints / FR: Aucune contrainte
    POSITIVE,       // EN: Must be positive (>0) / FR: Doit être positif (>0)
    NON_NEGATIVE,   // EN: Must be non-negative (>=0) / FR: Doit être non-négatif (>=0)
    ENUM_VALUES     // EN: Must be one of predefined values / FR: Doit être l'une des valeurs prédéfinies
};

// EN: CLI parsing result status
// FR: Statut de résultat d'analyse CLI
enum class CliParseStatus {
    SUCCESS,                // EN: Parsing completed successfully / FR: Analyse terminée avec succès
    HELP_REQUESTED,         // EN: Help was requested / FR: Aide demandée
    VERSION_REQUESTED,      // EN: Version was requested / FR: Version demandée
    INVALID_OPTION,         // EN: Unknown option provided / FR: Option inconnue fournie
    MISSING_VALUE,          // EN: Required value missing / FR: Valeur requise manquante
    INVALID_VALUE,          // EN: Invalid value format / FR: Format de valeur invalide
    CONSTRAINT_VIOLATION,   // EN: Value constraint violation / FR: Violation de contrainte de valeur
    DUPLICATE_OPTION        // EN: Non-repeatable option given twice / FR: Option non répétable donnée deux fois
};

// EN: CLI option definition structure
// FR: Structure de définition d'option CLI
struct CliOptionDefinition {
    std::string long_name;                          // EN: Long option name (--example) / FR: Nom d'option long (--exemple)
    std::optional<char> short_name;                 // EN: Short option name (-e) / FR: Nom d'option court (-e)
    CliOptionType type = CliOptionType::STRING;     // EN: Option value type / FR: Type de valeur d'option
    std::string description;                        // EN: Option description for help / FR: Description d'option pour l'aide
    std::string value_name = "VALUE";               // EN: Placeholder shown in help / FR: Espace réservé affiché dans l'aide
    std::string config_path;                        // EN: Configuration path overridden (e.g. "engine.max_parallelism") / FR: Chemin de configuration surchargé
    CliOptionConstraint constraint = CliOptionConstraint::NONE;
    std::set<std::string> enum_values;              // EN: Valid enum values / FR: Valeurs d'énumération valides
    bool repeatable = false;                        // EN: Can be specified multiple times / FR: Peut être spécifié plusieurs fois
};

// EN: CLI parsing result containing all parsed options and status
// FR: Résultat d'analyse CLI contenant toutes les options analysées et le statut
struct CliParseResult {
    CliParseStatus status = CliParseStatus::SUCCESS;
    std::map<std::string, std::vector<std::string>> values;  // EN: Raw values per long option name / FR: Valeurs brutes par nom d'option long
    std::vector<std::string> positional;                     // EN: Non-option arguments / FR: Arguments hors options
    std::vector<std::string> errors;
    std::map<std::string, ConfigValue> overrides;            // EN: Configuration path -> value / FR: Chemin de configuration -> valeur
    std::string help_text;
    std::string version_text;

    bool isSuccess() const { return status == CliParseStatus::SUCCESS; }
    bool has(const std::string& long_name) const;

    // EN: Last value given for an option.
    // FR: Dernière valeur donnée pour une option.
    std::optional<std::string> getValue(const std::string& long_name) const;
    std::vector<std::string> getValues(const std::string& long_name) const;

    // EN: KEY=VALUE option values as a map (later values win).
    // FR: Valeurs d'option CLE=VALEUR sous forme de map (les dernières gagnent).
    std::map<std::string, std::string> getKeyValues(const std::string& long_name) const;
};

// EN: Parser for dpfctl-style command lines: options anywhere, positional command and file.
// FR: Analyseur de lignes de commande style dpfctl : options partout, commande et fichier positionnels.
class CommandLineParser {
public:
    explicit CommandLineParser(std::string program_name = "dpfctl");

    void addOption(const CliOptionDefinition& option_def);

    // EN: Add the dpfctl option set (config, params, engine and lock overrides, logging, report).
    // FR: Ajoute les options dpfctl (config, paramètres, surcharges moteur et verrous, logs, rapport).
    void addStandardOptions();

    void setVersionInfo(const std::string& version_text) { version_text_ = version_text; }
    void setUsage(const std::string& usage_line, const std::string& commands_text);

    CliParseResult parse(int argc, char* argv[]) const;
    CliParseResult parse(const std::vector<std::string>& arguments) const;

    std::string generateHelpText() const;

    // EN: Copy the parsed overrides into the configuration. Returns the number applied.
    // FR: Copie les surcharges analysées dans la configuration. Retourne le nombre appliqué.
    size_t applyOverrides(const CliParseResult& result, ConfigManager& config) const;

    const CliOptionDefinition* findOption(const std::string& long_name) const;
    const CliOptionDefinition* findShortOption(char short_name) const;

private:
    // EN: Validate and record one option value; false on error (result updated).
    // FR: Valide et enregistre une valeur d'option ; false en cas d'erreur (résultat mis à jour).
    bool recordValue(const CliOptionDefinition& option, const std::string& value, CliParseResult& result) const;
    void fail(CliParseResult& result, CliParseStatus status, const std::string& message) const;

    std::string program_name_;
    std::string version_text_;
    std::string usage_line_;
    std::string commands_text_;
    std::vector<CliOptionDefinition> options_;
};

namespace CommandLineUtils {

// EN: Split "KEY=VALUE"; nullopt when there is no '=' or the key is empty.
// FR: Découpe "CLE=VALEUR" ; nullopt sans '=' ou avec une clé vide.
std::optional<std::pair<std::string, std::string>> parseKeyValue(const std::string& text);

std::string statusToString(CliParseStatus status);

} // namespace CommandLineUtils

} // namespace CLI
} // namespace DPF
