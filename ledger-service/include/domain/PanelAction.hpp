#pragma once

#include <cstdint>
#include <string>

namespace ledger::domain {

enum class ActionType {
    OPEN_ROLE_PANEL,   ///< "role_panel:{id}" - показать планы панели
    BUY_ROLE_PLAN,     ///< "role_plan:{id}" - купить план
    CLAIM_REWARD       ///< "reward_claim:{id}" - получить награду
};

inline std::string toString(ActionType type) {
    switch (type) {
        case ActionType::OPEN_ROLE_PANEL: return "role_panel";
        case ActionType::BUY_ROLE_PLAN: return "role_plan";
        case ActionType::CLAIM_REWARD: return "reward_claim";
    }
    return "unknown";
}

/**
 * @brief Действие кнопки, восстановленное из её идентификатора
 */
struct Action {
    ActionType type = ActionType::OPEN_ROLE_PANEL;
    int64_t targetId = 0;

    std::string id() const { return toString(type) + ":" + std::to_string(targetId); }

    bool operator==(const Action& other) const {
        return type == other.type && targetId == other.targetId;
    }
};

} // namespace ledger::domain
