#include "DemoWorld.hpp"
#include "../core/RenderSurface.hpp"
#include "../script/GameVariables.hpp"
#include <fstream>
#include <iterator>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace Wildspirit {

namespace {

SpiritTemplate wild(std::string id, std::string name, Element element, int32_t level, BaseStats stats) {
    SpiritTemplate data;
    data.id = std::move(id);
    data.name = std::move(name);
    data.type1 = element;
    data.level = level;
    data.baseStats = stats;
    data.abilities = defaultAbilities(element);
    return data;
}

} // namespace

DemoWorld::DemoWorld(const GameVariables* variables)
    : variables_(variables) {
    populate();
}

void DemoWorld::populate() {
    interactables_.clear();
    roaming_.clear();

    DialogueRequest elder;
    elder.speaker = "Elder Maru";
    elder.messages = {"The meadow spirits have grown restless.", "Be careful out there."};
    interactables_.push_back({"elder", {StateId::Dialogue, StateData::withDialogue(std::move(elder))}});

    LootRequest chest;
    chest.title = "Old Chest";
    chest.items = {{"health_potion", 2}, {"old_key", 1}};
    chest.gold = 50;
    chest.sourceId = "chest_meadow";
    interactables_.push_back({"chest_meadow", {StateId::LootWindow, StateData::withLoot(std::move(chest))}});

    DialogueRequest merchant;
    merchant.speaker = "Merchant";
    merchant.messages = {"Sorry, I'm closed today."};
    interactables_.push_back({"merchant", {StateId::Dialogue, StateData::withDialogue(std::move(merchant))}});

    BattleRequest pebble;
    pebble.enemies = {wild("pebblit", "Pebblit", Element::Earth, 3, {45, 10, 12, 14, 8, 10, 8})};
    pebble.enemies.back().drops = {{"spirit_shard", 1}};
    pebble.triggerId = "wild_pebblit";
    roaming_.push_back({"wild_pebblit", std::move(pebble)});

    BattleRequest embers;
    embers.enemies = {wild("emberling", "Emberling", Element::Fire, 4, {40, 20, 14, 9, 16, 9, 14}),
                      wild("emberling", "Emberling", Element::Fire, 3, {40, 20, 14, 9, 16, 9, 14})};
    embers.triggerId = "wild_emberlings";
    roaming_.push_back({"wild_emberlings", std::move(embers)});

    BattleRequest guardian;
    guardian.enemies = {wild("grove_guardian", "Grove Guardian", Element::Earth, 8, {120, 40, 20, 18, 18, 16, 12})};
    guardian.isBoss = true;
    guardian.bgm = "boss";
    guardian.triggerId = "grove_guardian";
    roaming_.push_back({"grove_guardian", std::move(guardian)});

    facing_ = 0;
    encounterTimer_ = 0.0f;
    encounterDue_ = false;
}

void DemoWorld::reset() {
    std::vector<std::pair<std::string, std::optional<std::string>>> scripts;
    for (const auto& object : interactables_) {
        if (object.opens.data.dialogue) {
            scripts.emplace_back(object.id, object.opens.data.dialogue->script);
        }
    }

    populate();

    // Scripts come from disk; keep them across resets
    for (auto& object : interactables_) {
        for (const auto& [id, script] : scripts) {
            if (object.id == id && object.opens.data.dialogue) {
                object.opens.data.dialogue->script = script;
            }
        }
    }
}

bool DemoWorld::loadScript(const std::string& npcId, const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        spdlog::warn("NPC script not found: {}", filepath);
        return false;
    }
    std::string source((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    for (auto& object : interactables_) {
        if (object.id == npcId && object.opens.data.dialogue) {
            object.opens.data.dialogue->script = std::move(source);
            spdlog::debug("Attached script {} to {}", filepath, npcId);
            return true;
        }
    }
    spdlog::warn("No NPC '{}' to attach {} to", npcId, filepath);
    return false;
}

bool DemoWorld::isGone(const std::string& id, bool removed) const {
    if (removed) return true;
    return variables_ && (isTruthy(variables_->get("looted." + id)) || isTruthy(variables_->get("defeated." + id)));
}

bool DemoWorld::hasObject(const std::string& objectId) const {
    for (const auto& object : interactables_) {
        if (object.id == objectId) return !isGone(object.id, object.removed);
    }
    for (const auto& spirit : roaming_) {
        if (spirit.id == objectId) return !isGone(spirit.id, spirit.removed);
    }
    return false;
}

void DemoWorld::update(float deltaTime) {
    encounterTimer_ += deltaTime;
    if (encounterTimer_ >= ENCOUNTER_INTERVAL) {
        encounterTimer_ = 0.0f;
        encounterDue_ = true;
    }
}

void DemoWorld::render(RenderSurface& surface) {
    surface.fillRect(glm::vec2(0.0f),
                     glm::vec2(static_cast<float>(surface.getWidth()), static_cast<float>(surface.getHeight())),
                     glm::vec4(0.25f, 0.55f, 0.3f, 1.0f));

    std::vector<const Interactable*> present;
    for (const auto& object : interactables_) {
        if (!isGone(object.id, object.removed)) present.push_back(&object);
    }
    if (!present.empty()) {
        const Interactable* target = present[facing_ % present.size()];
        surface.drawText(fmt::format("Facing: {}", target->id),
                         glm::vec2(16.0f, static_cast<float>(surface.getHeight()) - 32.0f), 16.0f, Colors::White);
    }
}

std::optional<WorldTransition> DemoWorld::interact() {
    std::vector<Interactable*> present;
    for (auto& object : interactables_) {
        if (!isGone(object.id, object.removed)) present.push_back(&object);
    }
    if (present.empty()) return std::nullopt;

    Interactable* target = present[facing_ % present.size()];
    facing_ = (facing_ + 1) % present.size();
    spdlog::debug("Interacting with {}", target->id);
    return target->opens;
}

std::optional<BattleRequest> DemoWorld::pollEncounter() {
    if (!encounterDue_) return std::nullopt;
    encounterDue_ = false;

    for (const auto& spirit : roaming_) {
        if (!isGone(spirit.id, spirit.removed)) {
            spdlog::info("A wild spirit appears ({})", spirit.id);
            return spirit.encounter;
        }
    }
    return std::nullopt;
}

void DemoWorld::removeObject(const std::string& objectId) {
    for (auto& object : interactables_) {
        if (object.id == objectId) object.removed = true;
    }
    for (auto& spirit : roaming_) {
        if (spirit.id == objectId) spirit.removed = true;
    }
    spdlog::debug("Removed {} from the world", objectId);
}

} // namespace Wildspirit
