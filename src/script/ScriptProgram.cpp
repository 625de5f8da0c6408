#include "ScriptProgram.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace Wildspirit {

namespace {

constexpr std::array<std::string_view, 11> KEYWORDS = {
    "if", "else", "true", "false", "null", "and", "or", "not", "label", "goto", "end"
};

constexpr std::array<std::string_view, 6> TWO_CHAR_OPERATORS = {"==", "!=", ">=", "<=", "&&", "||"};
constexpr std::string_view PUNCTUATION = "(){};,:<>=+-*/%!";

std::string toLower(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool isIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

class ScriptSyntaxError : public std::runtime_error {
public:
    ScriptSyntaxError(size_t line, const std::string& message)
        : std::runtime_error(fmt::format("line {}: {}", line, message)) {}
};

/**
 * Recursive descent over the token list, emitting a flat instruction list.
 */
class ScriptCompiler {
public:
    explicit ScriptCompiler(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    ScriptProgram compile() {
        while (!atEnd()) {
            compileStatement();
        }
        emit({Instruction::Op::End});
        resolveGotos();
        return std::move(program_);
    }

private:
    const Token* peek(size_t offset = 0) const {
        size_t i = pos_ + offset;
        return i < tokens_.size() ? &tokens_[i] : nullptr;
    }

    bool atEnd() const { return pos_ >= tokens_.size(); }

    size_t currentLine() const {
        if (const Token* t = peek()) return t->line;
        return tokens_.empty() ? 1 : tokens_.back().line;
    }

    const Token& consume() {
        if (atEnd()) {
            throw ScriptSyntaxError(currentLine(), "unexpected end of script");
        }
        return tokens_[pos_++];
    }

    bool check(TokenType type, std::string_view value) const {
        const Token* t = peek();
        return t && t->is(type, value);
    }

    bool checkType(TokenType type) const {
        const Token* t = peek();
        return t && t->type == type;
    }

    bool accept(TokenType type, std::string_view value) {
        if (check(type, value)) {
            ++pos_;
            return true;
        }
        return false;
    }

    void expect(TokenType type, std::string_view value) {
        if (!accept(type, value)) {
            const Token* t = peek();
            throw ScriptSyntaxError(currentLine(),
                fmt::format("expected '{}' but found '{}'", value, t ? t->text : "end of script"));
        }
    }

    std::string expectString(std::string_view what) {
        const Token& t = consume();
        if (t.type != TokenType::String) {
            throw ScriptSyntaxError(t.line, fmt::format("{} must be a string", what));
        }
        return t.text;
    }

    // Variable names may be written quoted or bare
    std::string expectName(std::string_view what) {
        const Token& t = consume();
        if (t.type != TokenType::String && t.type != TokenType::Identifier) {
            throw ScriptSyntaxError(t.line, fmt::format("{} must be a name", what));
        }
        return t.text;
    }

    double expectNumber(std::string_view what) {
        const Token& t = consume();
        if (t.type != TokenType::Number) {
            throw ScriptSyntaxError(t.line, fmt::format("{} must be a number", what));
        }
        return t.number;
    }

    // Amounts that land in the inventory as int32
    int32_t expectWholeNumber(std::string_view what) {
        const Token& t = consume();
        if (t.type != TokenType::Number) {
            throw ScriptSyntaxError(t.line, fmt::format("{} must be a number", what));
        }
        if (t.number < static_cast<double>(std::numeric_limits<int32_t>::min())
            || t.number > static_cast<double>(std::numeric_limits<int32_t>::max())) {
            throw ScriptSyntaxError(t.line, fmt::format("{} {} is out of range", what, t.text));
        }
        return static_cast<int32_t>(t.number);
    }

    std::optional<double> optionalNumberArg() {
        if (accept(TokenType::Punctuation, ",")) {
            return expectNumber("amount");
        }
        return std::nullopt;
    }

    void endStatement() {
        accept(TokenType::Punctuation, ";");
    }

    size_t emit(Instruction instruction) {
        if (instruction.line == 0) instruction.line = currentLine();
        program_.instructions.push_back(std::move(instruction));
        return program_.instructions.size() - 1;
    }

    void patchJump(size_t index) {
        program_.instructions[index].target = program_.instructions.size();
    }

    void compileStatement() {
        const Token& token = *peek();

        if (token.type == TokenType::Keyword) {
            if (token.text == "if") {
                compileIf();
                return;
            }
            if (token.text == "label") {
                consume();
                std::string name = consume().text;
                accept(TokenType::Punctuation, ":");
                if (!program_.labels.emplace(name, program_.instructions.size()).second) {
                    throw ScriptSyntaxError(token.line, fmt::format("duplicate label '{}'", name));
                }
                return;
            }
            if (token.text == "goto") {
                consume();
                const Token& label = consume();
                size_t jump = emit({.op = Instruction::Op::Jump, .line = label.line});
                pendingGotos_.emplace_back(jump, label.text);
                endStatement();
                return;
            }
            if (token.text == "end") {
                consume();
                emit({.op = Instruction::Op::End, .line = token.line});
                endStatement();
                return;
            }
            throw ScriptSyntaxError(token.line, fmt::format("unexpected '{}'", token.text));
        }

        if (token.type == TokenType::Punctuation && token.text == ";") {
            consume();
            return;
        }

        if (token.type != TokenType::Identifier) {
            throw ScriptSyntaxError(token.line, fmt::format("unexpected '{}'", token.text));
        }

        consume();
        compileCommand(toLower(token.text), token.line);
        endStatement();
    }

    void compileCommand(const std::string& command, size_t line) {
        Instruction ins;
        ins.line = line;

        if (command == "message") {
            ins.op = Instruction::Op::Message;
            ins.text = expectString("message text");
        } else if (command == "choice") {
            ins.op = Instruction::Op::Choice;
            while (checkType(TokenType::String)) {
                ins.options.push_back(consume().text);
                if (!accept(TokenType::Punctuation, ",")) break;
            }
            if (ins.options.empty()) {
                throw ScriptSyntaxError(line, "choice needs at least one option");
            }
        } else if (command == "setvar") {
            ins.op = Instruction::Op::SetVar;
            ins.text = expectName("variable");
            expect(TokenType::Punctuation, ",");
            ins.value = parseUnary();
        } else if (command == "setflag" || command == "clearflag") {
            ins.op = Instruction::Op::SetVar;
            ins.text = expectName("flag");
            ins.value.kind = Expr::Kind::Literal;
            ins.value.literal = (command == "setflag");
        } else if (command == "incvar" || command == "decvar") {
            ins.op = Instruction::Op::AddVar;
            ins.text = expectName("variable");
            double amount = optionalNumberArg().value_or(1.0);
            ins.amount = command == "incvar" ? amount : -amount;
        } else if (command == "addgold" || command == "delgold") {
            ins.op = command == "addgold" ? Instruction::Op::AddGold : Instruction::Op::RemoveGold;
            ins.amount = expectWholeNumber("gold amount");
        } else if (command == "additem" || command == "delitem") {
            ins.op = command == "additem" ? Instruction::Op::AddItem : Instruction::Op::RemoveItem;
            ins.text = expectString("item id");
            ins.amount = accept(TokenType::Punctuation, ",") ? expectWholeNumber("item quantity") : 1;
        } else if (command == "playsound") {
            ins.op = Instruction::Op::PlaySound;
            ins.text = expectString("sound name");
        } else if (command == "log") {
            ins.op = Instruction::Op::Log;
            ins.text = expectString("log text");
        } else if (command == "shop") {
            ins.op = Instruction::Op::OpenShop;
            ins.shop = parseShop();
        } else {
            throw ScriptSyntaxError(line, fmt::format("unknown command '{}'", command));
        }

        emit(std::move(ins));
    }

    // shop "Name", "item", price[, stock], "item2", price2 ...
    ShopRequest parseShop() {
        ShopRequest shop;
        shop.shopName = expectString("shop name");

        while (accept(TokenType::Punctuation, ",")) {
            ShopItem item;
            item.itemId = expectString("shop item id");
            expect(TokenType::Punctuation, ",");
            item.price = expectWholeNumber("shop price");

            if (check(TokenType::Punctuation, ",") && peek(1) && peek(1)->type == TokenType::Number) {
                consume();
                item.stock = expectWholeNumber("shop stock");
            }
            shop.items.push_back(std::move(item));
        }
        return shop;
    }

    void compileBlock() {
        expect(TokenType::Punctuation, "{");
        while (!check(TokenType::Punctuation, "}")) {
            if (atEnd()) {
                throw ScriptSyntaxError(currentLine(), "unterminated block");
            }
            compileStatement();
        }
        consume();
    }

    void compileIf() {
        size_t line = consume().line;
        expect(TokenType::Punctuation, "(");
        Expr condition = parseExpression();
        expect(TokenType::Punctuation, ")");

        size_t skipThen = emit({.op = Instruction::Op::JumpIfFalse, .value = std::move(condition), .line = line});
        compileBlock();

        if (!check(TokenType::Keyword, "else")) {
            patchJump(skipThen);
            return;
        }

        size_t skipElse = emit({.op = Instruction::Op::Jump, .line = line});
        patchJump(skipThen);
        consume();

        if (check(TokenType::Keyword, "if")) {
            compileIf();
        } else {
            compileBlock();
        }
        patchJump(skipElse);
    }

    Expr parseExpression() {
        return parseOr();
    }

    Expr makeBinary(std::string op, Expr left, Expr right) {
        Expr e;
        e.kind = Expr::Kind::Binary;
        e.name = std::move(op);
        e.operands.push_back(std::move(left));
        e.operands.push_back(std::move(right));
        return e;
    }

    Expr parseOr() {
        Expr left = parseAnd();
        while (accept(TokenType::Operator, "||") || accept(TokenType::Keyword, "or")) {
            left = makeBinary("||", std::move(left), parseAnd());
        }
        return left;
    }

    Expr parseAnd() {
        Expr left = parseComparison();
        while (accept(TokenType::Operator, "&&") || accept(TokenType::Keyword, "and")) {
            left = makeBinary("&&", std::move(left), parseComparison());
        }
        return left;
    }

    Expr parseComparison() {
        Expr left = parseUnary();
        while (true) {
            const Token* t = peek();
            if (!t) break;
            bool comparison = (t->type == TokenType::Operator && t->text != "&&" && t->text != "||")
                || t->is(TokenType::Punctuation, "<") || t->is(TokenType::Punctuation, ">");
            if (!comparison) break;
            std::string op = consume().text;
            left = makeBinary(std::move(op), std::move(left), parseUnary());
        }
        return left;
    }

    Expr parseUnary() {
        if (accept(TokenType::Punctuation, "!") || accept(TokenType::Keyword, "not")) {
            Expr e;
            e.kind = Expr::Kind::Not;
            e.operands.push_back(parseUnary());
            return e;
        }
        return parsePrimary();
    }

    Expr parsePrimary() {
        const Token& token = consume();
        Expr e;

        switch (token.type) {
            case TokenType::Number:
                e.literal = token.number;
                return e;
            case TokenType::String:
                e.literal = token.text;
                return e;
            case TokenType::Keyword:
                if (token.text == "true" || token.text == "false") {
                    e.literal = (token.text == "true");
                    return e;
                }
                if (token.text == "null") {
                    return e;
                }
                break;
            case TokenType::Punctuation:
                if (token.text == "(") {
                    e = parseExpression();
                    expect(TokenType::Punctuation, ")");
                    return e;
                }
                break;
            case TokenType::Identifier:
                e.name = toLower(token.text);
                if (accept(TokenType::Punctuation, "(")) {
                    e.kind = Expr::Kind::Call;
                    while (!check(TokenType::Punctuation, ")")) {
                        e.operands.push_back(parseExpression());
                        if (!accept(TokenType::Punctuation, ",")) break;
                    }
                    expect(TokenType::Punctuation, ")");
                } else {
                    e.kind = Expr::Kind::Variable;
                    e.name = token.text;
                }
                return e;
            case TokenType::Operator:
                break;
        }
        throw ScriptSyntaxError(token.line, fmt::format("unexpected '{}' in expression", token.text));
    }

    void resolveGotos() {
        for (const auto& [index, label] : pendingGotos_) {
            auto it = program_.labels.find(label);
            if (it == program_.labels.end()) {
                throw ScriptSyntaxError(program_.instructions[index].line,
                                        fmt::format("unknown label '{}'", label));
            }
            program_.instructions[index].target = it->second;
        }
    }

    std::vector<Token> tokens_;
    size_t pos_ = 0;
    ScriptProgram program_;
    std::vector<std::pair<size_t, std::string>> pendingGotos_;
};

} // namespace

std::vector<Token> tokenizeScript(std::string_view source) {
    std::vector<Token> tokens;
    size_t line = 1;
    size_t i = 0;
    const size_t len = source.size();

    while (i < len) {
        char c = source[i];

        if (c == '\n') {
            ++line;
            ++i;
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }

        if (source.substr(i, 2) == "//") {
            while (i < len && source[i] != '\n') ++i;
            continue;
        }
        if (source.substr(i, 2) == "/*") {
            i += 2;
            while (i < len && source.substr(i, 2) != "*/") {
                if (source[i] == '\n') ++line;
                ++i;
            }
            i = std::min(len, i + 2);
            continue;
        }

        if (c == '"' || c == '\'') {
            const char quote = c;
            const size_t startLine = line;
            std::string text;
            ++i;
            while (i < len && source[i] != quote) {
                char ch = source[i];
                if (ch == '\\' && i + 1 < len) {
                    ++i;
                    switch (source[i]) {
                        case 'n': text += '\n'; break;
                        case 't': text += '\t'; break;
                        default: text += source[i]; break;
                    }
                } else {
                    if (ch == '\n') ++line;
                    text += ch;
                }
                ++i;
            }
            ++i;
            tokens.push_back({TokenType::String, std::move(text), 0.0, startLine});
            continue;
        }

        if (isDigit(c) || (c == '-' && i + 1 < len && isDigit(source[i + 1]))) {
            size_t start = i;
            if (c == '-') ++i;
            while (i < len && (isDigit(source[i]) || source[i] == '.')) ++i;
            std::string text(source.substr(start, i - start));
            tokens.push_back({TokenType::Number, text, std::strtod(text.c_str(), nullptr), line});
            continue;
        }

        if (isIdentStart(c)) {
            size_t start = i;
            while (i < len && isIdentChar(source[i])) ++i;
            std::string text(source.substr(start, i - start));
            std::string lower = toLower(text);
            if (std::find(KEYWORDS.begin(), KEYWORDS.end(), lower) != KEYWORDS.end()) {
                tokens.push_back({TokenType::Keyword, std::move(lower), 0.0, line});
            } else {
                tokens.push_back({TokenType::Identifier, std::move(text), 0.0, line});
            }
            continue;
        }

        std::string_view twoChar = source.substr(i, 2);
        if (std::find(TWO_CHAR_OPERATORS.begin(), TWO_CHAR_OPERATORS.end(), twoChar) != TWO_CHAR_OPERATORS.end()) {
            tokens.push_back({TokenType::Operator, std::string(twoChar), 0.0, line});
            i += 2;
            continue;
        }

        if (PUNCTUATION.find(c) != std::string_view::npos) {
            tokens.push_back({TokenType::Punctuation, std::string(1, c), 0.0, line});
            ++i;
            continue;
        }

        spdlog::warn("Script line {}: skipping unknown character '{}'", line, c);
        ++i;
    }

    return tokens;
}

std::optional<ScriptProgram> compileScript(std::string_view source) {
    try {
        ScriptCompiler compiler(tokenizeScript(source));
        return compiler.compile();
    } catch (const ScriptSyntaxError& e) {
        spdlog::error("Script error at {}", e.what());
        return std::nullopt;
    }
}

} // namespace Wildspirit
