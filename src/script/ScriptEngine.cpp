#include "ScriptEngine.hpp"
#include "../rpg/Inventory.hpp"
#include "../services/AudioService.hpp"
#include <algorithm>
#include <utility>
#include <spdlog/spdlog.h>

namespace Wildspirit {

ScriptEngine::ScriptEngine(ScriptContext context, uint32_t seed)
    : context_(context)
    , rng_(seed) {
}

bool ScriptEngine::start(std::string_view source) {
    stop();

    auto program = compileScript(source);
    if (!program) {
        return false;
    }

    program_ = std::move(*program);
    pc_ = 0;
    lastChoice_ = -1;
    running_ = true;
    ++startCount_;
    spdlog::debug("Script started ({} instructions)", program_.instructions.size());
    return true;
}

void ScriptEngine::stop() {
    running_ = false;
    awaitingChoice_ = false;
}

void ScriptEngine::submitChoice(int32_t index) {
    lastChoice_ = index;
    awaitingChoice_ = false;
}

ScriptStep ScriptEngine::next() {
    if (!running_) {
        return {};
    }

    // Advancing without an answer leaves lastChoice at -1
    awaitingChoice_ = false;

    size_t executed = 0;
    while (running_ && pc_ < program_.instructions.size()) {
        if (++executed > MAX_INSTRUCTIONS_PER_STEP) {
            spdlog::error("Script exceeded {} instructions without yielding, stopping", MAX_INSTRUCTIONS_PER_STEP);
            break;
        }

        const Instruction& ins = program_.instructions[pc_++];
        if (auto step = execute(ins)) {
            return std::move(*step);
        }
    }

    stop();
    return {};
}

std::optional<ScriptStep> ScriptEngine::execute(const Instruction& ins) {
    using Op = Instruction::Op;

    switch (ins.op) {
        case Op::Message:
            return ScriptStep{ScriptStep::Kind::ShowMessage, ins.text, {}, {}};

        case Op::Choice:
            awaitingChoice_ = true;
            lastChoice_ = -1;
            return ScriptStep{ScriptStep::Kind::ShowChoice, {}, ins.options, {}};

        case Op::OpenShop:
            spdlog::info("Script opens shop '{}' ({} items)", ins.shop.shopName, ins.shop.items.size());
            return ScriptStep{ScriptStep::Kind::OpenShop, {}, {}, ins.shop};

        case Op::SetVar:
            if (context_.variables) {
                context_.variables->set(ins.text, evaluate(ins.value));
            }
            break;

        case Op::AddVar:
            if (context_.variables) {
                context_.variables->increment(ins.text, ins.amount);
            }
            break;

        case Op::AddGold:
            if (context_.inventory && ins.amount > 0) {
                context_.inventory->addGold(toInt32(ins.amount));
            }
            break;

        case Op::RemoveGold:
            if (context_.inventory && ins.amount > 0) {
                // Clamp at zero when the player can't cover it
                int32_t amount = std::min(context_.inventory->getGold(), toInt32(ins.amount));
                context_.inventory->spendGold(amount);
            }
            break;

        case Op::AddItem:
            if (context_.inventory && !context_.inventory->addItem(ins.text, toInt32(ins.amount))) {
                spdlog::warn("Script failed to add item {}", ins.text);
            }
            break;

        case Op::RemoveItem:
            if (context_.inventory && !context_.inventory->removeItem(ins.text, toInt32(ins.amount))) {
                spdlog::warn("Script failed to remove item {}", ins.text);
            }
            break;

        case Op::PlaySound:
            if (context_.audio) {
                context_.audio->playEffect(ins.text);
            }
            break;

        case Op::Log:
            spdlog::info("[Script] {}", ins.text);
            break;

        case Op::Jump:
            pc_ = ins.target;
            break;

        case Op::JumpIfFalse:
            if (!isTruthy(evaluate(ins.value))) {
                pc_ = ins.target;
            }
            break;

        case Op::End:
            running_ = false;
            break;
    }
    return std::nullopt;
}

ScriptValue ScriptEngine::evaluate(const Expr& expr) {
    switch (expr.kind) {
        case Expr::Kind::Literal:
            return expr.literal;

        case Expr::Kind::Variable:
            if (expr.name == "choice") {
                return static_cast<double>(lastChoice_);
            }
            return context_.variables ? context_.variables->get(expr.name) : ScriptValue{};

        case Expr::Kind::Not:
            return !isTruthy(evaluate(expr.operands.front()));

        case Expr::Kind::Call: {
            std::vector<ScriptValue> args;
            args.reserve(expr.operands.size());
            for (const auto& operand : expr.operands) {
                args.push_back(evaluate(operand));
            }
            return callFunction(expr.name, args);
        }

        case Expr::Kind::Binary: {
            ScriptValue left = evaluate(expr.operands[0]);
            if (expr.name == "&&") {
                return isTruthy(left) ? isTruthy(evaluate(expr.operands[1])) : false;
            }
            if (expr.name == "||") {
                return isTruthy(left) ? true : isTruthy(evaluate(expr.operands[1]));
            }
            return compare(expr.name, left, evaluate(expr.operands[1]));
        }
    }
    return {};
}

ScriptValue ScriptEngine::callFunction(const std::string& name, const std::vector<ScriptValue>& args) {
    auto arg = [&args](size_t i) -> ScriptValue {
        return i < args.size() ? args[i] : ScriptValue{};
    };

    if (name == "hasitem") {
        int32_t qty = args.size() > 1 ? toInt32(args[1]) : 1;
        return context_.inventory ? context_.inventory->hasItem(toDisplayString(arg(0)), qty) : false;
    }
    if (name == "getitemqty") {
        return context_.inventory
            ? static_cast<double>(context_.inventory->getItemQuantity(toDisplayString(arg(0))))
            : 0.0;
    }
    if (name == "getvar") {
        return context_.variables ? context_.variables->get(toDisplayString(arg(0)), arg(1)) : arg(1);
    }
    if (name == "getgold") {
        return context_.inventory ? static_cast<double>(context_.inventory->getGold()) : 0.0;
    }
    if (name == "choice") {
        return static_cast<double>(lastChoice_);
    }
    if (name == "random") {
        int32_t lo = toInt32(arg(0));
        int32_t hi = toInt32(arg(1));
        if (hi < lo) std::swap(lo, hi);
        return static_cast<double>(std::uniform_int_distribution<int32_t>(lo, hi)(rng_));
    }

    spdlog::warn("Unknown script function: {}", name);
    return {};
}

bool ScriptEngine::compare(const std::string& op, const ScriptValue& left, const ScriptValue& right) const {
    if (op == "==" || op == "!=") {
        bool equal;
        if (std::holds_alternative<std::monostate>(left) || std::holds_alternative<std::monostate>(right)) {
            equal = left.index() == right.index();
        } else if (std::holds_alternative<std::string>(left) && std::holds_alternative<std::string>(right)) {
            equal = std::get<std::string>(left) == std::get<std::string>(right);
        } else {
            equal = toNumber(left) == toNumber(right);
        }
        return op == "==" ? equal : !equal;
    }

    double a = toNumber(left);
    double b = toNumber(right);
    if (op == ">=") return a >= b;
    if (op == "<=") return a <= b;
    if (op == ">") return a > b;
    if (op == "<") return a < b;

    spdlog::warn("Unknown script operator: {}", op);
    return false;
}

} // namespace Wildspirit
