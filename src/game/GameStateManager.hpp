#pragma once

#include "StateId.hpp"
#include "StateData.hpp"
#include "StateRegistry.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace Wildspirit {

class RenderSurface;
class Input;

/**
 * Manages game states and the overlay stack.
 *
 * changeState abandons the current state; pushState pauses it and keeps it
 * on the stack until the matching popState resumes it with
 * isResumingFromPause set. Only the current state receives input, update
 * and render calls.
 */
class GameStateManager {
public:
    GameStateManager() = default;

    GameStateManager(const GameStateManager&) = delete;
    GameStateManager& operator=(const GameStateManager&) = delete;

    void registerState(StateId id, std::unique_ptr<GameState> state);
    GameState* getState(StateId id) const { return registry_.find(id); }
    const StateRegistry& getRegistry() const { return registry_; }

    /**
     * Leave the current state and enter id. The stack is untouched.
     * Returns false (and changes nothing) if id isn't registered.
     */
    bool changeState(StateId id, StateData data = {});
    bool changeState(std::string_view tag, StateData data = {});

    /**
     * Pause the current state, remember it on the stack, and enter id.
     */
    bool pushState(StateId id, StateData data = {});
    bool pushState(std::string_view tag, StateData data = {});

    /**
     * Exit the current state and resume the one below it.
     * Returns false with a warning if the stack is empty.
     */
    bool popState();

    /**
     * Drop every stacked frame, top first, calling exit() on each frame's
     * state. The current state is left alone.
     */
    void clearStack();

    void handleInput(Input& input);
    void update(float deltaTime);
    void render(RenderSurface& surface);

    /**
     * Run callback after delaySeconds of update time, unless a state has been
     * entered in the meantime, in which case it's dropped.
     */
    void schedule(float delaySeconds, std::function<void()> callback);

    void requestQuit() { quitRequested_ = true; }
    bool shouldQuit() const { return quitRequested_; }

    std::optional<StateId> getCurrentState() const { return currentState_; }
    std::optional<StateId> getPreviousState() const { return previousState_; }
    bool isInState(StateId id) const { return currentState_ == id; }

    /**
     * True if id is the current state or anywhere on the stack.
     */
    bool isStateInStack(StateId id) const;

    size_t getStackDepth() const { return stateStack_.size(); }
    const StateData& getCurrentStateData() const { return currentStateData_; }
    uint64_t getEnterGeneration() const { return enterGeneration_; }
    size_t getPendingContinuationCount() const { return continuations_.size(); }

private:
    struct StackFrame {
        StateId state;
        StateData data;
    };

    struct ScheduledContinuation {
        float remaining;
        uint64_t generation;
        std::function<void()> callback;
    };

    void enterState(StateId id, StateData data);
    void exitCurrentState();
    GameState* current() const;
    void runDueContinuations(float deltaTime);

    StateRegistry registry_;

    std::optional<StateId> currentState_;
    std::optional<StateId> previousState_;
    StateData currentStateData_;
    std::vector<StackFrame> stateStack_;

    std::vector<ScheduledContinuation> continuations_;
    uint64_t enterGeneration_ = 0;
    bool quitRequested_ = false;
};

} // namespace Wildspirit
