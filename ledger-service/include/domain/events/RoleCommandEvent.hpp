#pragma once

#include "DomainEvent.hpp"
#include "domain/Types.hpp"

namespace ledger::domain {

/**
 * @brief Команда боту: выдать (role.grant) или снять (role.revoke) роль
 */
struct RoleCommandEvent : public DomainEvent {
    TenantId tenantId;
    UserId userId;
    std::string roleId;
    std::string reason;

    explicit RoleCommandEvent(bool grant) : DomainEvent(grant ? "role.grant" : "role.revoke") {}

    std::string toJson() const override;
};

} // namespace ledger::domain
