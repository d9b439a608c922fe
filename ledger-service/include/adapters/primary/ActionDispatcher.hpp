#pragma once

#include "application/PanelActions.hpp"
#include "ports/input/IAutoRewardService.hpp"
#include "ports/input/IRoleShopService.hpp"
#include <iostream>
#include <memory>
#include <optional>
#include <vector>

namespace ledger::adapters::primary {

/**
 * @brief Результат нажатия кнопки
 *
 * Заполнено только поле, соответствующее action.type.
 */
struct ActionOutcome {
    domain::Action action;
    std::vector<domain::RolePlan> plans;
    std::optional<domain::RolePurchase> purchase;
    std::optional<ports::input::TransactionReceipt> reward;
};

/**
 * @brief Единая точка "выполнить действие по id" для UI хоста
 */
class ActionDispatcher {
public:
    ActionDispatcher(std::shared_ptr<ports::input::IRoleShopService> roleShop,
                     std::shared_ptr<ports::input::IAutoRewardService> rewards)
        : roleShop_(std::move(roleShop))
        , rewards_(std::move(rewards))
    {}

    ActionOutcome invoke(const std::string& actionId,
                         const domain::TenantId& tenantId,
                         const domain::UserId& userId) {
        ActionOutcome outcome;
        outcome.action = application::resolveAction(actionId);

        std::cout << "[ActionDispatcher] " << actionId << " by " << userId << " in " << tenantId << std::endl;

        switch (outcome.action.type) {
            case domain::ActionType::OPEN_ROLE_PANEL:
                outcome.plans = roleShop_->listPlans(tenantId, outcome.action.targetId);
                break;
            case domain::ActionType::BUY_ROLE_PLAN:
                outcome.purchase = roleShop_->purchase(tenantId, userId, outcome.action.targetId);
                break;
            case domain::ActionType::CLAIM_REWARD:
                outcome.reward = rewards_->claim(tenantId, outcome.action.targetId, userId);
                break;
        }
        return outcome;
    }

private:
    std::shared_ptr<ports::input::IRoleShopService> roleShop_;
    std::shared_ptr<ports::input::IAutoRewardService> rewards_;
};

} // namespace ledger::adapters::primary
