#pragma once

#include "domain/PanelAction.hpp"
#include "domain/LedgerErrors.hpp"
#include <cctype>
#include <string>

namespace ledger::application {

/**
 * @brief Разобрать идентификатор кнопки "{kind}:{id}"
 *
 * Чистая функция без ввода-вывода.
 * @throws InvalidState для неизвестного вида или нечислового id
 */
inline domain::Action resolveAction(const std::string& actionId) {
    auto colon = actionId.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == actionId.size()) {
        throw domain::InvalidState("Malformed action id: " + actionId);
    }

    auto kind = actionId.substr(0, colon);
    auto digits = actionId.substr(colon + 1);
    if (digits.size() > 18) {
        throw domain::InvalidState("Action target out of range: " + actionId);
    }
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw domain::InvalidState("Malformed action target: " + actionId);
        }
    }

    domain::Action action;
    action.targetId = std::stoll(digits);
    if (kind == "role_panel") {
        action.type = domain::ActionType::OPEN_ROLE_PANEL;
    } else if (kind == "role_plan") {
        action.type = domain::ActionType::BUY_ROLE_PLAN;
    } else if (kind == "reward_claim") {
        action.type = domain::ActionType::CLAIM_REWARD;
    } else {
        throw domain::InvalidState("Unknown action kind: " + kind);
    }
    return action;
}

} // namespace ledger::application
