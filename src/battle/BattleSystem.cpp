#include "BattleSystem.hpp"
#include "../rpg/Party.hpp"
#include "../services/AudioService.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <fmt/format.h>
#include <magic_enum/magic_enum.hpp>
#include <spdlog/spdlog.h>
#include <tracy/Tracy.hpp>

namespace Wildspirit {

namespace {

// Rows: attacking element, columns: defending element (Fire, Water, Earth, Wind)
constexpr std::array<std::array<float, 4>, 4> TYPE_CHART = {{
    {0.5f, 0.5f, 2.0f, 1.0f},
    {2.0f, 0.5f, 1.0f, 0.5f},
    {0.5f, 1.0f, 0.5f, 2.0f},
    {1.0f, 2.0f, 0.5f, 0.5f}
}};

std::optional<size_t> chartIndex(Element element) {
    switch (element) {
        case Element::Fire: return 0;
        case Element::Water: return 1;
        case Element::Earth: return 2;
        case Element::Wind: return 3;
        case Element::None: break;
    }
    return std::nullopt;
}

std::string effectivenessSuffix(float effectiveness, const char* resisted) {
    if (effectiveness > 1.0f) return " (Super effective!)";
    if (effectiveness < 1.0f) return fmt::format(" ({})", resisted);
    return "";
}

SpiritTemplate standInSpirit() {
    SpiritTemplate data;
    data.id = "default_spirit";
    data.name = "Spirit";
    data.type1 = Element::Fire;
    data.baseStats = {100, 50, 20, 15, 18, 12, 25};
    data.abilities = defaultAbilities(data.type1);
    return data;
}

SpiritTemplate wildSpirit(size_t index) {
    SpiritTemplate data;
    data.id = fmt::format("enemy_{}", index);
    data.name = "Wild Spirit";
    data.level = 5;
    data.type1 = Element::Earth;
    data.baseStats = {80, 30, 18, 12, 15, 10, 20};
    data.expYield = 25;
    data.goldYield = 10;
    return data;
}

} // namespace

BattleSystem::BattleSystem(BattleTuning tuning, uint32_t seed)
    : tuning_(tuning)
    , rng_(seed) {
}

float BattleSystem::typeEffectiveness(Element attackType, Element defType1, Element defType2) {
    auto attack = chartIndex(attackType);
    auto def1 = chartIndex(defType1);
    if (!attack || !def1) return 1.0f;

    float effectiveness = TYPE_CHART[*attack][*def1];
    if (auto def2 = chartIndex(defType2)) {
        effectiveness *= TYPE_CHART[*attack][*def2];
    }
    return effectiveness;
}

void BattleSystem::startBattle(const BattleRequest& request, Party* party) {
    cleanup();

    party_ = party;
    active_ = true;
    isBoss_ = request.isBoss;
    canFlee_ = !isBoss_;
    canSeal_ = !isBoss_;
    triggerId_ = request.triggerId;

    std::vector<PartySpirit*> members;
    if (party_) {
        members = party_->getActiveParty();
    }

    playerParty_.reserve(std::max<size_t>(1, members.size()));
    if (members.empty()) {
        spdlog::warn("No spirits in party, fighting with a stand-in");
        playerParty_.push_back(createBattleSpirit(standInSpirit(), true));
    } else {
        for (PartySpirit* member : members) {
            playerParty_.push_back(createBattleSpirit(member->data, true, member->currentHp, member->currentMp));
        }
    }

    enemyParty_.reserve(std::max<size_t>(1, request.enemies.size()));
    if (request.enemies.empty()) {
        spdlog::warn("No enemies specified, spawning a wild spirit");
        enemyParty_.push_back(createBattleSpirit(wildSpirit(0), false));
    } else {
        for (const auto& enemy : request.enemies) {
            enemyParty_.push_back(createBattleSpirit(enemy, false));
        }
    }

    for (size_t i = 0; i < enemyParty_.size(); ++i) {
        // Duplicate species need distinct ids for targeting and logs
        enemyParty_[i].id = fmt::format("{}#{}", enemyParty_[i].id, i);
    }

    spdlog::info("Battle started: {} vs {}{}", playerParty_.size(), enemyParty_.size(),
                 isBoss_ ? " (boss)" : "");
}

BattleSpirit BattleSystem::createBattleSpirit(const SpiritTemplate& data, bool isPlayerOwned,
                                              std::optional<int32_t> currentHp,
                                              std::optional<int32_t> currentMp) {
    BattleSpirit spirit;
    spirit.id = data.id;
    spirit.name = data.name;
    spirit.level = data.level;
    spirit.type1 = data.type1;
    spirit.type2 = data.type2;
    spirit.isPlayerOwned = isPlayerOwned;

    spirit.maxHp = std::max(1, scaledStat(data.baseStats.hp, data.level));
    spirit.maxMp = scaledStat(data.baseStats.mp, data.level);
    spirit.currentHp = std::clamp(currentHp.value_or(spirit.maxHp), 0, spirit.maxHp);
    spirit.currentMp = std::clamp(currentMp.value_or(spirit.maxMp), 0, spirit.maxMp);
    spirit.attack = scaledStat(data.baseStats.attack, data.level);
    spirit.defense = scaledStat(data.baseStats.defense, data.level);
    spirit.magicAttack = scaledStat(data.baseStats.magicAttack, data.level);
    spirit.magicDefense = scaledStat(data.baseStats.magicDefense, data.level);
    spirit.speed = scaledStat(data.baseStats.speed, data.level);
    spirit.isAlive = spirit.currentHp > 0;

    if (data.initialAtb) {
        spirit.atb = std::clamp(*data.initialAtb, 0.0f, tuning_.atbMax);
    } else {
        std::uniform_real_distribution<float> dist(0.0f, tuning_.atbMax * tuning_.maxInitialAtbFraction);
        spirit.atb = dist(rng_);
    }

    spirit.abilities = data.abilities.empty() ? defaultAbilities(data.type1) : data.abilities;
    spirit.expYield = data.expYield > 0 ? data.expYield : data.level * 10;
    spirit.goldYield = data.goldYield > 0 ? data.goldYield : data.level * 5;
    spirit.source = data;
    return spirit;
}

void BattleSystem::update(float deltaTime) {
    ZoneScoped;

    if (!active_) return;

    if (checkBattleEnd()) {
        return;
    }

    // Settle the result in the same tick that decided it
    if (currentAction_) {
        processCurrentAction(deltaTime);
        checkBattleEnd();
        return;
    }

    updateAtb(deltaTime);
    if (checkBattleEnd()) {
        return;
    }

    if (!actionQueue_.empty()) {
        currentAction_ = std::move(actionQueue_.front());
        actionQueue_.pop_front();
        actionTimer_ = 0.0f;
    }
}

void BattleSystem::updateAtb(float deltaTime) {
    auto advance = [&](BattleSpirit& spirit) {
        if (!spirit.isAlive || spirit.isReady) return;

        if (spirit.isCasting) {
            // Gauge stays put while casting
            spirit.castTimer += deltaTime;
            if (spirit.castTimer >= spirit.castDuration) {
                completeCast(spirit);
            }
            return;
        }

        float gain = static_cast<float>(spirit.speed) * tuning_.atbSpeedMultiplier * deltaTime;
        spirit.atb = std::min(tuning_.atbMax, spirit.atb + std::max(0.0f, gain));

        if (spirit.atb >= tuning_.atbMax) {
            spirit.atb = tuning_.atbMax;
            spirit.isReady = true;
            if (spirit.isPlayerOwned) {
                playEffect("ready");
            } else {
                queueEnemyAction(spirit);
            }
        }
    };

    for (auto& spirit : playerParty_) advance(spirit);
    for (auto& spirit : enemyParty_) advance(spirit);
}

void BattleSystem::processCurrentAction(float deltaTime) {
    actionTimer_ += deltaTime;
    if (actionTimer_ >= tuning_.actionDuration) {
        PendingAction action = std::move(*currentAction_);
        currentAction_.reset();
        executeAction(action);
    }
}

BattleSpirit* BattleSystem::selectRandomTarget(std::vector<BattleSpirit>& side) {
    std::vector<BattleSpirit*> alive;
    for (auto& spirit : side) {
        if (spirit.isAlive) alive.push_back(&spirit);
    }
    if (alive.empty()) return nullptr;
    std::uniform_int_distribution<size_t> pick(0, alive.size() - 1);
    return alive[pick(rng_)];
}

void BattleSystem::queueEnemyAction(BattleSpirit& enemy) {
    PendingAction action;
    action.user = &enemy;

    std::vector<const Ability*> affordable;
    for (const auto& ability : enemy.abilities) {
        if (ability.id != "attack" && enemy.currentMp >= ability.mpCost) {
            affordable.push_back(&ability);
        }
    }

    if (!affordable.empty() && roll() < tuning_.enemyAbilityChance) {
        std::uniform_int_distribution<size_t> pick(0, affordable.size() - 1);
        const Ability& ability = *affordable[pick(rng_)];
        action.type = ActionType::Ability;
        action.ability = ability;
        action.target = ability.targetsAllies() ? selectRandomTarget(enemyParty_) : selectRandomTarget(playerParty_);
    } else {
        action.type = ActionType::Attack;
        action.target = selectRandomTarget(playerParty_);
    }

    enemy.isReady = false;
    enemy.atb = 0.0f;

    if (!action.target) {
        return;
    }
    actionQueue_.push_back(std::move(action));
}

bool BattleSystem::queuePlayerAction(const PendingAction& action) {
    BattleSpirit* user = action.user;
    if (!user || !user->isAlive || !user->isReady || !user->isPlayerOwned) {
        spdlog::warn("Cannot queue action - user not ready");
        return false;
    }
    if (action.type == ActionType::Ability && !action.ability) {
        spdlog::warn("Cannot queue ability action without an ability");
        return false;
    }

    actionQueue_.push_back(action);
    user->isReady = false;
    user->atb = 0.0f;
    return true;
}

void BattleSystem::executeAction(const PendingAction& action) {
    if (!action.user || !action.user->isAlive) return;
    BattleSpirit& user = *action.user;

    spdlog::debug("{} uses {}{}", user.name, magic_enum::enum_name(action.type),
                  action.ability ? fmt::format(": {}", action.ability->name) : "");

    switch (action.type) {
        case ActionType::Attack:
            if (onActionText) onActionText(user, "Attack");
            executeAttack(user, action.target);
            break;
        case ActionType::Ability:
            if (onActionText) onActionText(user, action.ability->name);
            executeAbility(user, action.target, *action.ability);
            break;
        case ActionType::Seal:
            if (onActionText) onActionText(user, "Seal");
            attemptSeal(action.target);
            break;
        case ActionType::Flee:
            if (onActionText) onActionText(user, "Flee");
            attemptFlee();
            break;
    }

    tickStatusEffects(user);
}

void BattleSystem::executeAttack(BattleSpirit& user, BattleSpirit* target) {
    if (!target || !target->isAlive) return;

    playEffect("strike");

    float effectiveness = typeEffectiveness(user.type1, target->type1, target->type2);
    float base = static_cast<float>(effectiveStat(user, "attack", user.attack)) * 2.0f;
    float defense = static_cast<float>(effectiveStat(*target, "defense", target->defense));
    int32_t damage = std::max(1, static_cast<int32_t>(std::floor((base - defense * 0.5f) * effectiveness)));

    applyDamage(*target, damage);
    log(fmt::format("{} attacks {} for {} dmg{}", user.name, target->name, damage,
                    effectivenessSuffix(effectiveness, "Not very effective")));
}

void BattleSystem::executeAbility(BattleSpirit& user, BattleSpirit* target, const Ability& ability) {
    if (user.currentMp < ability.mpCost) {
        log(fmt::format("{} doesn't have enough MP!", user.name));
        return;
    }

    if (startCast(user, target, ability)) {
        return;
    }

    user.currentMp -= ability.mpCost;
    if (ability.mpCost > 0) {
        playEffect("spell");
    }
    applyAbilityEffect(user, target, ability);
}

bool BattleSystem::startCast(BattleSpirit& user, BattleSpirit* target, const Ability& ability) {
    float castTime = ability.castTime.value_or(
        ability.mpCost > 0 ? 0.8f + static_cast<float>(ability.mpCost) / 20.0f : 0.0f);
    if (castTime <= 0.0f) {
        return false;
    }

    user.isCasting = true;
    user.castTimer = 0.0f;
    user.castDuration = castTime;
    user.pendingAbility = ability;
    user.pendingTarget = target;
    user.isReady = false;
    user.atb = 0.0f;

    playEffect("spell");
    log(fmt::format("{} is casting {}...", user.name, ability.name));
    return true;
}

void BattleSystem::completeCast(BattleSpirit& spirit) {
    spirit.isCasting = false;

    if (spirit.pendingAbility && spirit.isAlive) {
        const Ability& ability = *spirit.pendingAbility;
        if (spirit.currentMp >= ability.mpCost) {
            spirit.currentMp -= ability.mpCost;
            applyAbilityEffect(spirit, spirit.pendingTarget, ability);
        } else {
            log(fmt::format("{}'s cast fizzled - not enough MP!", spirit.name));
        }
    }

    spirit.pendingAbility.reset();
    spirit.pendingTarget = nullptr;
    spirit.castTimer = 0.0f;
    spirit.castDuration = 0.0f;
}

std::vector<BattleSpirit*> BattleSystem::resolveTargets(BattleSpirit& user, BattleSpirit* target,
                                                        const Ability& ability) {
    if (!ability.targetsGroup()) {
        if (target) return {target};
        return {};
    }

    bool userSide = ability.targetsAllies();
    bool targetPlayers = userSide == user.isPlayerOwned;
    std::vector<BattleSpirit*> targets;
    for (auto& spirit : targetPlayers ? playerParty_ : enemyParty_) {
        if (spirit.isAlive) targets.push_back(&spirit);
    }
    return targets;
}

void BattleSystem::applyAbilityEffect(BattleSpirit& user, BattleSpirit* target, const Ability& ability) {
    for (BattleSpirit* t : resolveTargets(user, target, ability)) {
        if (!t->isAlive) continue;

        switch (ability.type) {
            case AbilityType::Physical:
            case AbilityType::Magical: {
                const bool physical = ability.type == AbilityType::Physical;
                float atk = static_cast<float>(physical
                    ? effectiveStat(user, "attack", user.attack)
                    : effectiveStat(user, "magicAttack", user.magicAttack));
                float def = static_cast<float>(physical
                    ? effectiveStat(*t, "defense", t->defense)
                    : effectiveStat(*t, "magicDefense", t->magicDefense));
                float effectiveness = ability.element != Element::None
                    ? typeEffectiveness(ability.element, t->type1, t->type2)
                    : 1.0f;

                float base = atk * static_cast<float>(ability.power) / 20.0f;
                int32_t damage = std::max(1, static_cast<int32_t>(std::floor((base - def * 0.3f) * effectiveness)));
                applyDamage(*t, damage);
                log(fmt::format("{}'s {} hits {} for {} dmg{}", user.name, ability.name, t->name, damage,
                                effectivenessSuffix(effectiveness, "Resisted")));
                break;
            }
            case AbilityType::Supportive:
                if (ability.id == "heal" || !ability.buff) {
                    int32_t amount = static_cast<int32_t>(std::floor(
                        static_cast<float>(effectiveStat(user, "magicAttack", user.magicAttack))
                        * static_cast<float>(ability.power) / 20.0f));
                    applyHealing(*t, amount);
                    log(fmt::format("{}'s {} heals {} for {} HP", user.name, ability.name, t->name, amount));
                }
                if (ability.buff) {
                    t->statusEffects.push_back({StatusEffect::Kind::Buff, ability.buff->stat,
                                                ability.buff->amount, ability.buff->duration});
                    log(fmt::format("{}'s {} rises", t->name, ability.buff->stat));
                }
                break;
            case AbilityType::Curse:
                if (ability.debuff) {
                    t->statusEffects.push_back({StatusEffect::Kind::Debuff, ability.debuff->stat,
                                                ability.debuff->amount, ability.debuff->duration});
                    log(fmt::format("{}'s {} falls", t->name, ability.debuff->stat));
                }
                break;
        }
    }
}

void BattleSystem::applyDamage(BattleSpirit& target, int32_t amount) {
    target.currentHp = std::max(0, target.currentHp - amount);
    if (onDamage) onDamage(target, amount);

    if (target.currentHp > 0) return;

    target.isAlive = false;
    target.isReady = false;
    target.isCasting = false;
    target.pendingAbility.reset();
    log(fmt::format("{} has been defeated!", target.name));

    if (!target.isPlayerOwned) {
        rewards_.exp += target.expYield;
        rewards_.gold += target.goldYield;
        for (const auto& drop : target.source.drops) {
            rewards_.items.push_back(drop);
        }
    }
}

void BattleSystem::applyHealing(BattleSpirit& target, int32_t amount) {
    if (!target.isAlive) return;
    int32_t before = target.currentHp;
    target.currentHp = std::min(target.maxHp, target.currentHp + amount);
    if (onHeal) onHeal(target, target.currentHp - before);
}

void BattleSystem::attemptFlee() {
    if (!canFlee_) {
        log("Cannot flee from this battle!");
        return;
    }

    if (roll() < tuning_.fleeChance) {
        result_ = BattleResult::Fled;
        log("Successfully fled from battle!");
    } else {
        log("Failed to flee!");
    }
}

void BattleSystem::attemptSeal(BattleSpirit* target) {
    if (!canSeal_ || !target || !target->isAlive || target->isPlayerOwned) {
        log("Cannot seal this spirit!");
        return;
    }

    // Up to base + bonus at 1 HP
    float chance = tuning_.sealBaseChance + (1.0f - target->hpFraction()) * tuning_.sealMissingHpBonus;
    if (roll() < chance) {
        log(fmt::format("Successfully sealed {}!", target->name));
        if (party_) {
            party_->addToBox(target->source);
        }
        target->isAlive = false;
        target->isReady = false;
        target->isCasting = false;
        return;
    }

    log(fmt::format("Failed to seal {}!", target->name));
}

int32_t BattleSystem::effectiveStat(const BattleSpirit& spirit, const std::string& stat, int32_t base) const {
    int32_t value = base;
    for (const auto& effect : spirit.statusEffects) {
        if (effect.stat != stat) continue;
        value += effect.kind == StatusEffect::Kind::Buff ? effect.amount : -effect.amount;
    }
    return std::max(1, value);
}

void BattleSystem::tickStatusEffects(BattleSpirit& spirit) {
    for (auto& effect : spirit.statusEffects) {
        effect.turnsLeft--;
    }
    std::erase_if(spirit.statusEffects, [](const StatusEffect& e) { return e.turnsLeft <= 0; });
}

bool BattleSystem::checkBattleEnd() {
    if (result_ == BattleResult::Fled) {
        endBattle();
        return true;
    }

    auto anyAlive = [](const std::vector<BattleSpirit>& side) {
        return std::any_of(side.begin(), side.end(), [](const BattleSpirit& s) { return s.isAlive; });
    };

    if (!anyAlive(enemyParty_)) {
        result_ = BattleResult::Victory;
        endBattle();
        return true;
    }
    if (!anyAlive(playerParty_)) {
        result_ = BattleResult::Defeat;
        endBattle();
        return true;
    }
    return false;
}

void BattleSystem::endBattle() {
    spdlog::info("Battle ended: {}", magic_enum::enum_name(*result_));
    writeBackVitals();
    actionQueue_.clear();
    currentAction_.reset();
    active_ = false;
}

void BattleSystem::writeBackVitals() {
    if (!party_) return;
    for (const auto& spirit : playerParty_) {
        party_->updateVitals(spirit.id, spirit.currentHp, spirit.currentMp);
    }
}

void BattleSystem::cleanup() {
    active_ = false;
    party_ = nullptr;
    playerParty_.clear();
    enemyParty_.clear();
    actionQueue_.clear();
    currentAction_.reset();
    actionTimer_ = 0.0f;
    result_.reset();
    rewards_ = {};
    triggerId_.reset();
    isBoss_ = false;
    canFlee_ = true;
    canSeal_ = true;
}

std::vector<BattleSpirit*> BattleSystem::getReadyPlayerSpirits() {
    std::vector<BattleSpirit*> ready;
    for (auto& spirit : playerParty_) {
        if (spirit.isAlive && spirit.isReady) ready.push_back(&spirit);
    }
    return ready;
}

std::vector<BattleSpirit*> BattleSystem::getAlivePlayerSpirits() {
    std::vector<BattleSpirit*> alive;
    for (auto& spirit : playerParty_) {
        if (spirit.isAlive) alive.push_back(&spirit);
    }
    return alive;
}

std::vector<BattleSpirit*> BattleSystem::getAliveEnemies() {
    std::vector<BattleSpirit*> alive;
    for (auto& spirit : enemyParty_) {
        if (spirit.isAlive) alive.push_back(&spirit);
    }
    return alive;
}

void BattleSystem::log(const std::string& message) {
    spdlog::info("[Battle] {}", message);
    if (onLogEntry) onLogEntry(message);
}

void BattleSystem::playEffect(const std::string& name) {
    if (audio_) audio_->playEffect(name);
}

float BattleSystem::roll() {
    return std::uniform_real_distribution<float>(0.0f, 1.0f)(rng_);
}

} // namespace Wildspirit
