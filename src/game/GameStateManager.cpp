#include "GameStateManager.hpp"
#include <algorithm>
#include <iterator>
#include <spdlog/spdlog.h>
#include <tracy/Tracy.hpp>

namespace Wildspirit {

void GameStateManager::registerState(StateId id, std::unique_ptr<GameState> state) {
    registry_.add(id, std::move(state));
}

bool GameStateManager::changeState(StateId id, StateData data) {
    if (!registry_.contains(id)) {
        spdlog::error("State {} does not exist", id);
        return false;
    }

    exitCurrentState();
    enterState(id, std::move(data));
    return true;
}

bool GameStateManager::changeState(std::string_view tag, StateData data) {
    auto id = stateIdFromString(tag);
    if (!id) {
        spdlog::error("State {} does not exist", tag);
        return false;
    }
    return changeState(*id, std::move(data));
}

bool GameStateManager::pushState(StateId id, StateData data) {
    if (!registry_.contains(id)) {
        spdlog::error("State {} does not exist", id);
        return false;
    }

    if (currentState_) {
        if (GameState* state = current()) {
            state->pause();
        }
        stateStack_.push_back({*currentState_, currentStateData_});
    } else {
        spdlog::warn("Pushing {} with no current state, nothing to return to", id);
    }

    enterState(id, std::move(data));
    return true;
}

bool GameStateManager::pushState(std::string_view tag, StateData data) {
    auto id = stateIdFromString(tag);
    if (!id) {
        spdlog::error("State {} does not exist", tag);
        return false;
    }
    return pushState(*id, std::move(data));
}

bool GameStateManager::popState() {
    if (stateStack_.empty()) {
        spdlog::warn("Cannot pop state: stack is empty");
        return false;
    }

    exitCurrentState();

    StackFrame frame = std::move(stateStack_.back());
    stateStack_.pop_back();

    enterState(frame.state, frame.data.asResumed());
    if (GameState* state = current()) {
        state->resume();
    }
    return true;
}

void GameStateManager::clearStack() {
    while (!stateStack_.empty()) {
        StackFrame frame = std::move(stateStack_.back());
        stateStack_.pop_back();
        if (GameState* state = registry_.find(frame.state)) {
            state->exit();
        }
    }
}

void GameStateManager::enterState(StateId id, StateData data) {
    previousState_ = currentState_;
    currentState_ = id;
    currentStateData_ = std::move(data);
    ++enterGeneration_;

    spdlog::info("Entered state: {}{}", id, currentStateData_.isResumingFromPause ? " (resumed)" : "");

    if (GameState* state = current()) {
        state->enter(currentStateData_);
    }
}

void GameStateManager::exitCurrentState() {
    if (GameState* state = current()) {
        state->exit();
    }
}

GameState* GameStateManager::current() const {
    return currentState_ ? registry_.find(*currentState_) : nullptr;
}

void GameStateManager::handleInput(Input& input) {
    if (GameState* state = current()) {
        state->handleInput(input);
    }
}

void GameStateManager::update(float deltaTime) {
    ZoneScoped;

    runDueContinuations(deltaTime);

    if (GameState* state = current()) {
        state->update(deltaTime);
    }
}

void GameStateManager::render(RenderSurface& surface) {
    if (GameState* state = current()) {
        state->render(surface);
    }
}

void GameStateManager::schedule(float delaySeconds, std::function<void()> callback) {
    continuations_.push_back({std::max(0.0f, delaySeconds), enterGeneration_, std::move(callback)});
}

void GameStateManager::runDueContinuations(float deltaTime) {
    if (continuations_.empty()) return;

    std::vector<ScheduledContinuation> due;
    for (auto& continuation : continuations_) {
        continuation.remaining -= deltaTime;
    }
    auto split = std::stable_partition(continuations_.begin(), continuations_.end(),
                                       [](const ScheduledContinuation& c) { return c.remaining > 0.0f; });
    std::move(split, continuations_.end(), std::back_inserter(due));
    continuations_.erase(split, continuations_.end());

    // Callbacks may schedule more work or change state; check the generation each time
    for (auto& continuation : due) {
        if (continuation.generation != enterGeneration_) {
            spdlog::debug("Dropped stale continuation (generation {} != {})",
                          continuation.generation, enterGeneration_);
            continue;
        }
        if (continuation.callback) {
            continuation.callback();
        }
    }
}

bool GameStateManager::isStateInStack(StateId id) const {
    if (currentState_ == id) return true;
    return std::any_of(stateStack_.begin(), stateStack_.end(),
                       [id](const StackFrame& frame) { return frame.state == id; });
}

} // namespace Wildspirit
