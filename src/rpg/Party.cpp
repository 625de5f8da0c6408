#include "Party.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace Wildspirit {

bool Party::addSpirit(SpiritTemplate data) {
    if (data.abilities.empty()) {
        data.abilities = defaultAbilities(data.type1);
    }
    if (members_.size() < MAX_PARTY) {
        spdlog::info("Added {} to party", data.name);
        members_.push_back(PartySpirit{std::move(data)});
        return true;
    }
    spdlog::info("Party full, added {} to box", data.name);
    box_.push_back(PartySpirit{std::move(data)});
    return false;
}

void Party::addToBox(SpiritTemplate data) {
    spdlog::info("Added {} to box", data.name);
    box_.push_back(PartySpirit{std::move(data)});
}

std::vector<PartySpirit*> Party::getActiveParty() {
    std::vector<PartySpirit*> active;
    for (size_t i = 0; i < members_.size() && i < MAX_ACTIVE; ++i) {
        active.push_back(&members_[i]);
    }
    return active;
}

std::vector<const PartySpirit*> Party::getActiveParty() const {
    std::vector<const PartySpirit*> active;
    for (size_t i = 0; i < members_.size() && i < MAX_ACTIVE; ++i) {
        active.push_back(&members_[i]);
    }
    return active;
}

PartySpirit* Party::findSpirit(const std::string& id) {
    auto matches = [&id](const PartySpirit& s) { return s.data.id == id; };
    auto it = std::find_if(members_.begin(), members_.end(), matches);
    if (it != members_.end()) return &*it;
    it = std::find_if(box_.begin(), box_.end(), matches);
    return it != box_.end() ? &*it : nullptr;
}

bool Party::moveToBox(size_t partyIndex) {
    if (members_.size() <= 1) {
        spdlog::info("Cannot remove last party member");
        return false;
    }
    if (partyIndex >= members_.size()) return false;
    box_.push_back(std::move(members_[partyIndex]));
    members_.erase(members_.begin() + static_cast<std::ptrdiff_t>(partyIndex));
    return true;
}

bool Party::moveToParty(size_t boxIndex) {
    if (members_.size() >= MAX_PARTY) {
        spdlog::info("Party is full");
        return false;
    }
    if (boxIndex >= box_.size()) return false;
    members_.push_back(std::move(box_[boxIndex]));
    box_.erase(box_.begin() + static_cast<std::ptrdiff_t>(boxIndex));
    return true;
}

int32_t Party::expToNextLevel(int32_t level) {
    return static_cast<int32_t>(std::floor(100.0 * std::pow(static_cast<double>(std::max(1, level)), 1.5)));
}

std::vector<LevelUp> Party::awardExp(int32_t amount) {
    std::vector<LevelUp> levelUps;
    if (members_.empty() || amount <= 0) {
        return levelUps;
    }

    const int32_t expPerSpirit = amount / static_cast<int32_t>(members_.size());
    for (auto& spirit : members_) {
        spirit.exp += expPerSpirit;
        int32_t needed = expToNextLevel(spirit.data.level);
        while (spirit.exp >= needed) {
            spirit.exp -= needed;
            spirit.data.level++;
            levelUps.push_back({spirit.data.id, spirit.data.name, spirit.data.level});
            spdlog::info("{} leveled up to {}!", spirit.data.name, spirit.data.level);
            needed = expToNextLevel(spirit.data.level);
        }
    }
    return levelUps;
}

void Party::healAll() {
    for (auto& spirit : members_) {
        spirit.currentHp.reset();
        spirit.currentMp.reset();
    }
}

void Party::updateVitals(const std::string& id, int32_t hp, int32_t mp) {
    PartySpirit* spirit = findSpirit(id);
    if (!spirit) return;
    spirit->currentHp = std::clamp(hp, 0, maxHp(*spirit));
    spirit->currentMp = std::clamp(mp, 0, maxMp(*spirit));
}

void Party::restore(std::vector<PartySpirit> members, std::vector<PartySpirit> box) {
    members_ = std::move(members);
    box_ = std::move(box);
    while (members_.size() > MAX_PARTY) {
        box_.push_back(std::move(members_.back()));
        members_.pop_back();
    }
}

void Party::clear() {
    members_.clear();
    box_.clear();
}

int32_t Party::maxHp(const PartySpirit& spirit) {
    return scaledStat(spirit.data.baseStats.hp, spirit.data.level);
}

int32_t Party::maxMp(const PartySpirit& spirit) {
    return scaledStat(spirit.data.baseStats.mp, spirit.data.level);
}

} // namespace Wildspirit
