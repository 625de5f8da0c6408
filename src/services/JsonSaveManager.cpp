#include "JsonSaveManager.hpp"
#include "../game/GameSession.hpp"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>
#include <sstream>
#include <type_traits>
#include <fmt/format.h>
#include <magic_enum/magic_enum.hpp>
#include <simdjson.h>
#include <spdlog/spdlog.h>

namespace Wildspirit {

namespace {

std::string escapeJson(std::string_view text) {
    std::string result;
    result.reserve(text.size() + 2);
    result += '"';
    for (char c : text) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\t': result += "\\t"; break;
            case '\r': result += "\\r"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    result += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    result += c;
                }
        }
    }
    result += '"';
    return result;
}

int64_t nowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string writeValue(const ScriptValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, double>) {
            return fmt::format("{}", v);
        } else {
            return escapeJson(v);
        }
    }, value);
}

void writeSpirit(std::ostream& out, const PartySpirit& spirit) {
    const SpiritTemplate& data = spirit.data;
    const BaseStats& stats = data.baseStats;

    out << "    {\"id\": " << escapeJson(data.id)
        << ", \"name\": " << escapeJson(data.name)
        << ", \"level\": " << data.level
        << ", \"type1\": " << escapeJson(magic_enum::enum_name(data.type1))
        << ", \"type2\": " << escapeJson(magic_enum::enum_name(data.type2))
        << ", \"exp\": " << spirit.exp;
    if (spirit.currentHp) out << ", \"hp\": " << *spirit.currentHp;
    if (spirit.currentMp) out << ", \"mp\": " << *spirit.currentMp;
    out << ", \"stats\": [" << stats.hp << ", " << stats.mp << ", " << stats.attack << ", " << stats.defense
        << ", " << stats.magicAttack << ", " << stats.magicDefense << ", " << stats.speed << "]}";
}

std::optional<PartySpirit> readSpirit(simdjson::dom::object entry) {
    PartySpirit spirit;
    SpiritTemplate& data = spirit.data;

    std::string_view text;
    if (entry["id"].get(text)) return std::nullopt;
    data.id = std::string(text);
    if (!entry["name"].get(text)) data.name = std::string(text);
    if (!entry["type1"].get(text)) data.type1 = magic_enum::enum_cast<Element>(text).value_or(Element::Fire);
    if (!entry["type2"].get(text)) data.type2 = magic_enum::enum_cast<Element>(text).value_or(Element::None);

    int64_t number = 0;
    if (!entry["level"].get(number)) data.level = static_cast<int32_t>(std::max<int64_t>(1, number));
    if (!entry["exp"].get(number)) spirit.exp = static_cast<int32_t>(number);
    if (!entry["hp"].get(number)) spirit.currentHp = static_cast<int32_t>(number);
    if (!entry["mp"].get(number)) spirit.currentMp = static_cast<int32_t>(number);

    simdjson::dom::array stats;
    if (!entry["stats"].get(stats) && stats.size() == 7) {
        int32_t* fields[] = {&data.baseStats.hp, &data.baseStats.mp, &data.baseStats.attack,
                             &data.baseStats.defense, &data.baseStats.magicAttack,
                             &data.baseStats.magicDefense, &data.baseStats.speed};
        size_t i = 0;
        for (auto value : stats) {
            if (!value.get(number)) *fields[i] = static_cast<int32_t>(number);
            ++i;
        }
    }

    data.abilities = defaultAbilities(data.type1);
    return spirit;
}

std::vector<PartySpirit> readSpirits(simdjson::dom::element root, const char* key) {
    std::vector<PartySpirit> spirits;
    simdjson::dom::array array;
    if (root[key].get(array)) return spirits;

    for (auto value : array) {
        simdjson::dom::object entry;
        if (value.get(entry)) continue;
        if (auto spirit = readSpirit(entry)) {
            spirits.push_back(std::move(*spirit));
        } else {
            spdlog::warn("Skipping spirit without id in save");
        }
    }
    return spirits;
}

} // namespace

JsonSaveManager::JsonSaveManager(std::filesystem::path directory)
    : directory_(std::move(directory)) {
}

std::filesystem::path JsonSaveManager::pathFor(const std::string& id) const {
    return directory_ / (id + ".json");
}

std::optional<std::string> JsonSaveManager::readFile(const std::filesystem::path& path) const {
    std::ifstream file(path);
    if (!file.is_open()) return std::nullopt;
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

std::optional<SaveInfo> JsonSaveManager::readInfo(const std::filesystem::path& path) const {
    auto content = readFile(path);
    if (!content) return std::nullopt;

    simdjson::dom::parser parser;
    simdjson::dom::element doc;
    if (auto error = parser.parse(*content).get(doc)) {
        spdlog::warn("Corrupt save file {}: {}", path.string(), simdjson::error_message(error));
        return std::nullopt;
    }

    SaveInfo info;
    info.id = path.stem().string();

    std::string_view text;
    if (!doc["name"].get(text)) info.name = std::string(text);
    if (!doc["mapName"].get(text)) info.mapName = std::string(text);

    double playtime = 0.0;
    if (!doc["playtimeSeconds"].get(playtime)) info.playtimeSeconds = playtime;

    int64_t timestamp = 0;
    if (!doc["timestamp"].get(timestamp)) info.timestamp = timestamp;

    if (info.name.empty()) info.name = info.id;
    return info;
}

std::vector<SaveInfo> JsonSaveManager::getAllSaves() const {
    std::vector<SaveInfo> saves;

    std::error_code ec;
    if (!std::filesystem::is_directory(directory_, ec)) return saves;

    for (const auto& entry : std::filesystem::directory_iterator(directory_, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
        if (auto info = readInfo(entry.path())) {
            saves.push_back(std::move(*info));
        }
    }

    // Newest first
    std::sort(saves.begin(), saves.end(), [](const SaveInfo& a, const SaveInfo& b) {
        return a.timestamp != b.timestamp ? a.timestamp > b.timestamp : a.id > b.id;
    });
    return saves;
}

std::optional<SaveInfo> JsonSaveManager::getLatestSave() const {
    auto saves = getAllSaves();
    if (saves.empty()) return std::nullopt;
    return saves.front();
}

bool JsonSaveManager::hasSaves() const {
    return !getAllSaves().empty();
}

std::string JsonSaveManager::generateId() const {
    int64_t stamp = nowSeconds();
    std::string id = fmt::format("save_{}", stamp);
    for (int suffix = 1; std::filesystem::exists(pathFor(id)); ++suffix) {
        id = fmt::format("save_{}_{}", stamp, suffix);
    }
    return id;
}

std::optional<std::string> JsonSaveManager::saveGame(const GameSession& session,
                                                     const std::optional<std::string>& name,
                                                     const std::optional<std::string>& id) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        spdlog::error("Cannot create save directory {}: {}", directory_.string(), ec.message());
        return std::nullopt;
    }

    std::string slotId = id.value_or(generateId());
    int64_t timestamp = nowSeconds();
    std::string slotName = name.value_or(fmt::format("{} ({})", session.mapName, slotId));

    std::ostringstream out;
    out << "{\n";
    out << "  \"version\": " << SAVE_VERSION << ",\n";
    out << "  \"name\": " << escapeJson(slotName) << ",\n";
    out << "  \"timestamp\": " << timestamp << ",\n";
    out << "  \"mapName\": " << escapeJson(session.mapName) << ",\n";
    out << "  \"playtimeSeconds\": " << fmt::format("{}", session.playtimeSeconds) << ",\n";
    out << "  \"gold\": " << session.inventory.getGold() << ",\n";

    out << "  \"inventory\": [";
    const auto& slots = session.inventory.getSlots();
    for (size_t i = 0; i < slots.size(); ++i) {
        out << (i ? ", " : "") << "{\"id\": " << escapeJson(slots[i].itemId)
            << ", \"quantity\": " << slots[i].quantity << "}";
    }
    out << "],\n";

    out << "  \"variables\": {";
    size_t count = 0;
    for (const auto& [key, value] : session.variables.getAll()) {
        out << (count++ ? ", " : "") << escapeJson(key) << ": " << writeValue(value);
    }
    out << "},\n";

    auto writeSpirits = [&out](const char* key, const std::vector<PartySpirit>& spirits, bool last) {
        out << "  \"" << key << "\": [\n";
        for (size_t i = 0; i < spirits.size(); ++i) {
            writeSpirit(out, spirits[i]);
            out << (i + 1 < spirits.size() ? ",\n" : "\n");
        }
        out << "  ]" << (last ? "\n" : ",\n");
    };
    writeSpirits("party", session.party.getMembers(), false);
    writeSpirits("box", session.party.getBox(), true);
    out << "}\n";

    std::ofstream file(pathFor(slotId));
    if (!file.is_open()) {
        spdlog::error("Failed to open save file for writing: {}", pathFor(slotId).string());
        return std::nullopt;
    }
    file << out.str();
    if (!file.good()) {
        spdlog::error("Failed to write save file: {}", pathFor(slotId).string());
        return std::nullopt;
    }

    spdlog::debug("Wrote save {} ({})", slotId, slotName);
    return slotId;
}

bool JsonSaveManager::loadGame(const std::string& id, GameSession& session) {
    auto content = readFile(pathFor(id));
    if (!content) {
        spdlog::warn("Save {} not found", id);
        return false;
    }

    simdjson::dom::parser parser;
    simdjson::dom::element doc;
    if (auto error = parser.parse(*content).get(doc)) {
        spdlog::warn("Failed to parse save {}: {}", id, simdjson::error_message(error));
        return false;
    }

    int64_t version = 0;
    if (doc["version"].get(version) || version > SAVE_VERSION) {
        spdlog::warn("Save {} has unsupported version {}", id, version);
        return false;
    }

    session.reset();

    std::string_view text;
    if (!doc["mapName"].get(text)) session.mapName = std::string(text);

    double playtime = 0.0;
    if (!doc["playtimeSeconds"].get(playtime)) session.playtimeSeconds = playtime;

    int64_t gold = 0;
    if (!doc["gold"].get(gold)) session.inventory.addGold(static_cast<int32_t>(gold));

    simdjson::dom::array items;
    if (!doc["inventory"].get(items)) {
        for (auto value : items) {
            std::string_view itemId;
            int64_t quantity = 0;
            if (value["id"].get(itemId) || value["quantity"].get(quantity)) continue;
            if (!session.inventory.addItem(std::string(itemId), static_cast<int32_t>(quantity))) {
                spdlog::warn("Dropped saved item {} x{}", itemId, quantity);
            }
        }
    }

    simdjson::dom::object variables;
    if (!doc["variables"].get(variables)) {
        std::unordered_map<std::string, ScriptValue> values;
        for (auto [key, value] : variables) {
            bool flag = false;
            double number = 0.0;
            std::string_view str;
            if (!value.get(flag)) {
                values[std::string(key)] = flag;
            } else if (!value.get(number)) {
                values[std::string(key)] = number;
            } else if (!value.get(str)) {
                values[std::string(key)] = std::string(str);
            }
        }
        session.variables.loadFrom(std::move(values));
    }

    session.party.restore(readSpirits(doc, "party"), readSpirits(doc, "box"));
    session.started = true;

    spdlog::info("Loaded save {} ({} spirits, {}G)", id, session.party.getMembers().size(),
                 session.inventory.getGold());
    return true;
}

bool JsonSaveManager::deleteSave(const std::string& id) {
    std::error_code ec;
    bool removed = std::filesystem::remove(pathFor(id), ec);
    if (ec) {
        spdlog::warn("Failed to delete save {}: {}", id, ec.message());
        return false;
    }
    return removed;
}

} // namespace Wildspirit
