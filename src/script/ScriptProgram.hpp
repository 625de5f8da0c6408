#pragma once

#include "GameVariables.hpp"
#include "../rpg/Shop.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Wildspirit {

enum class TokenType {
    String,
    Number,
    Identifier,
    Keyword,
    Operator,
    Punctuation
};

struct Token {
    TokenType type;
    std::string text;
    double number = 0.0;
    size_t line = 1;

    bool is(TokenType t, std::string_view value) const { return type == t && text == value; }
};

/**
 * Split NPC script source into tokens. Skips // and block comments.
 * Keywords (if, else, label, goto, end, true, false, null, and, or, not)
 * are case-insensitive and normalised to lowercase.
 */
std::vector<Token> tokenizeScript(std::string_view source);

/**
 * Condition/value expression tree, evaluated at run time so it sees the
 * latest variables, inventory and choice.
 */
struct Expr {
    enum class Kind {
        Literal,
        Variable,
        Call,
        Not,
        Binary
    };

    Kind kind = Kind::Literal;
    ScriptValue literal;
    std::string name;          // variable, function or operator
    std::vector<Expr> operands;
};

/**
 * One compiled statement. Control flow (if/else, goto) is lowered to jumps.
 */
struct Instruction {
    enum class Op {
        Message,
        Choice,
        SetVar,
        AddVar,
        AddGold,
        RemoveGold,
        AddItem,
        RemoveItem,
        PlaySound,
        OpenShop,
        Log,
        Jump,
        JumpIfFalse,
        End
    };

    Op op = Op::End;
    std::string text;
    std::vector<std::string> options;
    Expr value;
    double amount = 0.0;
    size_t target = 0;
    ShopRequest shop;
    size_t line = 0;
};

struct ScriptProgram {
    std::vector<Instruction> instructions;
    std::unordered_map<std::string, size_t> labels;
};

/**
 * Compile script source. Syntax errors are logged with their line number.
 * @return the program, or nullopt if the source doesn't compile
 */
std::optional<ScriptProgram> compileScript(std::string_view source);

} // namespace Wildspirit
