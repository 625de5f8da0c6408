#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <fmt/format.h>
#include <magic_enum/magic_enum.hpp>

namespace Wildspirit {

/**
 * Every mode the game can be in. Tags ("MAIN_MENU") are derived from the
 * enumerator names.
 */
enum class StateId {
    Loading,
    MainMenu,
    Playing,
    Paused,
    SaveLoad,
    Inventory,
    Dialogue,
    Shop,
    LootWindow,
    Settings,
    Battle
};

/**
 * Upper snake case tag for a state (StateId::SaveLoad -> "SAVE_LOAD").
 */
inline std::string stateIdToString(StateId id) {
    std::string result;
    auto name = magic_enum::enum_name(id);
    for (size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        if (c >= 'A' && c <= 'Z') {
            if (i > 0) result += '_';
            result += c;
        } else {
            result += static_cast<char>(c - 'a' + 'A');
        }
    }
    return result;
}

inline std::optional<StateId> stateIdFromString(std::string_view tag) {
    for (auto id : magic_enum::enum_values<StateId>()) {
        if (stateIdToString(id) == tag) {
            return id;
        }
    }
    return std::nullopt;
}

} // namespace Wildspirit

// fmt formatter for StateId
template <>
struct fmt::formatter<Wildspirit::StateId> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const Wildspirit::StateId& id, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", Wildspirit::stateIdToString(id));
    }
};
