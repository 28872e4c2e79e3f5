#pragma once

#include <map>
#include <string>
#include <vector>

namespace DPF {
namespace Orchestrator {

// EN: Bound parameter values of a run (name -> value).
// FR: Valeurs de paramètres liées d'un run (nom -> valeur).
using RunParameters = std::map<std::string, std::string>;

// EN: Compiled stage condition, e.g. `runner.os != 'Windows' && PULUMI_PREVIEW == 'true'`.
// EN: Grammar: or := and ('||' and)* ; and := unary ('&&' unary)* ; unary := '!' unary | primary ;
// EN:          primary := '(' or ')' | operand (('==' | '!=') operand)? ;
// EN:          operand := identifier | 'string' | "string" | true | false | number.
// EN: Identifiers resolve against the run parameters (missing = empty string, `inputs.X` falls back to X).
// EN: A bare operand is true when non-empty and not "false" or "0". Evaluation is pure.
// FR: Condition de stage compilée. Les identifiants se résolvent contre les paramètres du run
// FR: (absent = chaîne vide). Un opérande seul est vrai s'il est non vide et ni "false" ni "0".
class ConditionExpression {
public:
    // EN: Compile an expression; throws DefinitionError describing the first syntax error.
    // FR: Compile une expression ; lève DefinitionError décrivant la première erreur de syntaxe.
    static ConditionExpression parse(const std::string& source);

    bool evaluate(const RunParameters& parameters) const;

    const std::string& source() const { return source_; }

    // EN: Parameter names the expression reads, in order of first appearance.
    // FR: Noms de paramètres lus par l'expression, par ordre de première apparition.
    std::vector<std::string> referencedIdentifiers() const;

    static bool isTruthy(const std::string& value);

private:
    enum class NodeKind {
        OR,
        AND,
        NOT,
        EQUAL,
        NOT_EQUAL,
        IDENTIFIER,
        LITERAL
    };

    struct Node {
        NodeKind kind;
        std::string text;             // EN: Identifier name or literal value / FR: Nom d'identifiant ou valeur littérale
        std::vector<size_t> children; // EN: Indices into nodes_ / FR: Indices dans nodes_
    };

    class Parser;

    ConditionExpression() = default;

    bool evaluateNode(size_t index, const RunParameters& parameters) const;
    std::string operandValue(size_t index, const RunParameters& parameters) const;

    std::string source_;
    std::vector<Node> nodes_;
    size_t root_ = 0;
};

} // namespace Orchestrator
} // namespace DPF
