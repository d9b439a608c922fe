#pragma once

#include <cstdint>
#include <string>

namespace ledger::domain {

using TenantId = std::string;   ///< id гильдии
using UserId = std::string;     ///< id пользователя платформы

using AssetId = int64_t;
using AccountId = int64_t;
using TransactionId = int64_t;
using EntryId = int64_t;

} // namespace ledger::domain
