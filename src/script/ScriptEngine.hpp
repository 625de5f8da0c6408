#pragma once

#include "ScriptProgram.hpp"
#include "GameVariables.hpp"
#include "../rpg/Shop.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace Wildspirit {

class Inventory;
class AudioService;

/**
 * What a running script needs from the game. Any pointer may be null;
 * the matching commands then do nothing and conditions read as empty.
 */
struct ScriptContext {
    GameVariables* variables = nullptr;
    Inventory* inventory = nullptr;
    AudioService* audio = nullptr;
};

/**
 * Something the dialogue box must show or do before the script can continue.
 */
struct ScriptStep {
    enum class Kind {
        ShowMessage,
        ShowChoice,
        OpenShop,
        Finished
    };

    Kind kind = Kind::Finished;
    std::string text;
    std::vector<std::string> choices;
    ShopRequest shop;
};

/**
 * Resumable NPC script runner.
 *
 * start() compiles the source; each next() call runs statements until the
 * script needs the player (message, choice, shop) or ends. The runner keeps
 * its position between calls, so the owner can be paused for any amount of
 * frames, or pushed over by another state, and continue where it left off.
 */
class ScriptEngine {
public:
    static constexpr size_t MAX_INSTRUCTIONS_PER_STEP = 10000;

    explicit ScriptEngine(ScriptContext context = {}, uint32_t seed = std::random_device{}());

    void setContext(ScriptContext context) { context_ = context; }

    /**
     * Compile and reset to the first statement.
     * @return false if the source has syntax errors (the engine stays stopped)
     */
    bool start(std::string_view source);

    /**
     * Run until the next step that needs the player.
     */
    ScriptStep next();

    /**
     * Record the option picked for the last ShowChoice (0-based). Read back
     * by `choice == N` conditions.
     */
    void submitChoice(int32_t index);

    void stop();

    bool isRunning() const { return running_; }
    bool isAwaitingChoice() const { return awaitingChoice_; }
    int32_t getLastChoice() const { return lastChoice_; }

    /**
     * Number of successful start() calls over the engine's lifetime.
     */
    uint32_t getStartCount() const { return startCount_; }

private:
    ScriptValue evaluate(const Expr& expr);
    ScriptValue callFunction(const std::string& name, const std::vector<ScriptValue>& args);
    bool compare(const std::string& op, const ScriptValue& left, const ScriptValue& right) const;

    // Runs one non-yielding instruction; returns a step if it yields
    std::optional<ScriptStep> execute(const Instruction& ins);

    ScriptContext context_;
    ScriptProgram program_;
    size_t pc_ = 0;
    bool running_ = false;
    bool awaitingChoice_ = false;
    int32_t lastChoice_ = -1;
    uint32_t startCount_ = 0;
    std::mt19937 rng_;
};

} // namespace Wildspirit
