#pragma once

#include "ports/output/IMemberDirectory.hpp"
#include <gmock/gmock.h>

namespace ledger::tests {

class MockMemberDirectory : public ports::output::IMemberDirectory {
public:
    MOCK_METHOD(std::vector<domain::UserId>, membersWithRole,
                (const domain::TenantId& tenantId, const std::string& roleId), (override));
    MOCK_METHOD(void, grantRole,
                (const domain::TenantId& tenantId, const domain::UserId& userId, const std::string& roleId),
                (override));
    MOCK_METHOD(void, revokeRole,
                (const domain::TenantId& tenantId, const domain::UserId& userId, const std::string& roleId),
                (override));
};

} // namespace ledger::tests
