#pragma once

#include "domain/Types.hpp"
#include <string>
#include <vector>

namespace ledger::ports::output {

/**
 * @brief Роли участников на платформе гильдии
 *
 * Ядро не знает о платформе; выдача и снятие ролей - команды наружу.
 */
class IMemberDirectory {
public:
    virtual ~IMemberDirectory() = default;

    virtual std::vector<domain::UserId> membersWithRole(const domain::TenantId& tenantId,
                                                        const std::string& roleId) = 0;
    virtual void grantRole(const domain::TenantId& tenantId,
                           const domain::UserId& userId,
                           const std::string& roleId) = 0;
    virtual void revokeRole(const domain::TenantId& tenantId,
                            const domain::UserId& userId,
                            const std::string& roleId) = 0;
};

} // namespace ledger::ports::output
