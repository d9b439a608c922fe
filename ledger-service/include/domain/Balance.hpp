#pragma once

#include "domain/Amount.hpp"
#include "domain/Types.hpp"

namespace ledger::domain {

/**
 * @brief Расхождение кэша балансов с суммой проводок
 */
struct BalanceMismatch {
    AccountId accountId = 0;
    AssetId assetId = 0;
    Amount cached;
    Amount replayed;
};

} // namespace ledger::domain
