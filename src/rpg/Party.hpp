#pragma once

#include "Spirit.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace Wildspirit {

struct LevelUp {
    std::string spiritId;
    std::string name;
    int32_t newLevel = 1;
};

/**
 * The player's spirits: up to four active battlers plus two on the bench,
 * and an unbounded storage box.
 */
class Party {
public:
    static constexpr size_t MAX_ACTIVE = 4;
    static constexpr size_t MAX_BENCH = 2;
    static constexpr size_t MAX_PARTY = MAX_ACTIVE + MAX_BENCH;

    /**
     * Add to the party, or to the box if the party is full.
     * @return true if the spirit joined the party
     */
    bool addSpirit(SpiritTemplate data);
    void addToBox(SpiritTemplate data);

    std::vector<PartySpirit*> getActiveParty();
    std::vector<const PartySpirit*> getActiveParty() const;
    const std::vector<PartySpirit>& getMembers() const { return members_; }
    const std::vector<PartySpirit>& getBox() const { return box_; }

    PartySpirit* findSpirit(const std::string& id);

    bool moveToBox(size_t partyIndex);
    bool moveToParty(size_t boxIndex);

    /**
     * Split exp evenly across the party. Levels up while exp >= floor(100 * level^1.5).
     */
    std::vector<LevelUp> awardExp(int32_t amount);

    void healAll();

    /**
     * Store vitals after a battle; values are clamped to the spirit's max.
     */
    void updateVitals(const std::string& id, int32_t hp, int32_t mp);

    /**
     * Replace every spirit, as when loading a save. Members past MAX_PARTY
     * overflow into the box.
     */
    void restore(std::vector<PartySpirit> members, std::vector<PartySpirit> box);

    bool empty() const { return members_.empty(); }
    void clear();

    static int32_t maxHp(const PartySpirit& spirit);
    static int32_t maxMp(const PartySpirit& spirit);
    static int32_t expToNextLevel(int32_t level);

private:
    std::vector<PartySpirit> members_;
    std::vector<PartySpirit> box_;
};

} // namespace Wildspirit
