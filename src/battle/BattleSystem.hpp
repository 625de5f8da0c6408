#pragma once

#include "BattleTypes.hpp"
#include "BattleTuning.hpp"
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace Wildspirit {

class Party;
class AudioService;

/**
 * ATB combat simulation.
 *
 * Every living combatant fills its gauge at speed * atbSpeedMultiplier per
 * second. Full gauges mark player spirits ready (the UI then picks their
 * action) and make enemies queue an AI action. Queued actions run one at a
 * time, first in first out, each taking actionDuration seconds. Abilities
 * with an MP cost are cast first and pay their MP when the cast completes.
 */
class BattleSystem {
public:
    using DamageCallback = std::function<void(const BattleSpirit& target, int32_t amount)>;
    using HealCallback = std::function<void(const BattleSpirit& target, int32_t amount)>;
    using ActionTextCallback = std::function<void(const BattleSpirit& user, const std::string& text)>;
    using LogCallback = std::function<void(const std::string& message)>;

    explicit BattleSystem(BattleTuning tuning = {}, uint32_t seed = std::random_device{}());

    void setAudio(AudioService* audio) { audio_ = audio; }
    void setTuning(const BattleTuning& tuning) { tuning_ = tuning; }
    const BattleTuning& getTuning() const { return tuning_; }

    /**
     * Build both sides and reset result, rewards and the action queue.
     * With no party (or an empty one) a stand-in spirit fights.
     */
    void startBattle(const BattleRequest& request, Party* party);

    void update(float deltaTime);

    /**
     * Queue an action for a ready player spirit. Resets its gauge.
     * @return false if the user is missing, dead or not ready
     */
    bool queuePlayerAction(const PendingAction& action);

    std::vector<BattleSpirit*> getReadyPlayerSpirits();
    std::vector<BattleSpirit*> getAlivePlayerSpirits();
    std::vector<BattleSpirit*> getAliveEnemies();

    const std::vector<BattleSpirit>& getPlayerParty() const { return playerParty_; }
    const std::vector<BattleSpirit>& getEnemyParty() const { return enemyParty_; }

    bool isActive() const { return active_; }
    bool isBoss() const { return isBoss_; }
    bool canFlee() const { return canFlee_; }
    bool canSeal() const { return canSeal_; }
    const std::optional<BattleResult>& getResult() const { return result_; }
    const BattleRewards& getRewards() const { return rewards_; }
    const std::optional<std::string>& getTriggerId() const { return triggerId_; }

    bool hasCurrentAction() const { return currentAction_.has_value(); }
    size_t getQueuedActionCount() const { return actionQueue_.size(); }

    /**
     * Drop combatants, queue and result once the battle screen closes.
     */
    void cleanup();

    static float typeEffectiveness(Element attackType, Element defType1, Element defType2);

    DamageCallback onDamage;
    HealCallback onHeal;
    ActionTextCallback onActionText;
    LogCallback onLogEntry;

private:
    BattleSpirit createBattleSpirit(const SpiritTemplate& data, bool isPlayerOwned,
                                    std::optional<int32_t> currentHp = std::nullopt,
                                    std::optional<int32_t> currentMp = std::nullopt);

    void updateAtb(float deltaTime);
    void processCurrentAction(float deltaTime);
    void queueEnemyAction(BattleSpirit& enemy);
    BattleSpirit* selectRandomTarget(std::vector<BattleSpirit>& side);

    void executeAction(const PendingAction& action);
    void executeAttack(BattleSpirit& user, BattleSpirit* target);
    void executeAbility(BattleSpirit& user, BattleSpirit* target, const Ability& ability);
    bool startCast(BattleSpirit& user, BattleSpirit* target, const Ability& ability);
    void completeCast(BattleSpirit& spirit);
    void applyAbilityEffect(BattleSpirit& user, BattleSpirit* target, const Ability& ability);
    std::vector<BattleSpirit*> resolveTargets(BattleSpirit& user, BattleSpirit* target, const Ability& ability);

    void applyDamage(BattleSpirit& target, int32_t amount);
    void applyHealing(BattleSpirit& target, int32_t amount);
    void attemptFlee();
    void attemptSeal(BattleSpirit* target);

    int32_t effectiveStat(const BattleSpirit& spirit, const std::string& stat, int32_t base) const;
    void tickStatusEffects(BattleSpirit& spirit);

    bool checkBattleEnd();
    void endBattle();
    void writeBackVitals();

    void log(const std::string& message);
    void playEffect(const std::string& name);
    float roll();

    BattleTuning tuning_;
    std::mt19937 rng_;
    AudioService* audio_ = nullptr;
    Party* party_ = nullptr;

    bool active_ = false;
    bool isBoss_ = false;
    bool canFlee_ = true;
    bool canSeal_ = true;
    std::optional<std::string> triggerId_;

    std::vector<BattleSpirit> playerParty_;
    std::vector<BattleSpirit> enemyParty_;

    std::deque<PendingAction> actionQueue_;
    std::optional<PendingAction> currentAction_;
    float actionTimer_ = 0.0f;

    std::optional<BattleResult> result_;
    BattleRewards rewards_;
};

} // namespace Wildspirit
