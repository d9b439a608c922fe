#pragma once

#include "ports/output/IMemberDirectory.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "domain/events/RoleCommandEvent.hpp"
#include <ThreadSafeMap.hpp>
#include <iostream>
#include <memory>
#include <set>

namespace ledger::adapters::secondary {

/**
 * @brief Роли участников: снимок от хоста + команды через события
 *
 * Хост присылает составы ролей (setMembers); выдача и снятие
 * публикуются как role.grant / role.revoke, снимок обновляется сразу.
 */
class EventingMemberDirectory : public ports::output::IMemberDirectory {
public:
    explicit EventingMemberDirectory(std::shared_ptr<ports::output::IEventPublisher> publisher)
        : publisher_(std::move(publisher))
    {}

    void setMembers(const domain::TenantId& tenantId,
                    const std::string& roleId,
                    const std::vector<domain::UserId>& members) {
        members_.insert(key(tenantId, roleId),
                        std::make_shared<Members>(members.begin(), members.end()));
    }

    std::vector<domain::UserId> membersWithRole(const domain::TenantId& tenantId,
                                                const std::string& roleId) override {
        auto members = members_.find(key(tenantId, roleId));
        if (!members) {
            return {};
        }
        return {members->begin(), members->end()};
    }

    void grantRole(const domain::TenantId& tenantId,
                   const domain::UserId& userId,
                   const std::string& roleId) override {
        members_.update(key(tenantId, roleId), [&](Members& m) { m.insert(userId); });
        send(true, tenantId, userId, roleId);
    }

    void revokeRole(const domain::TenantId& tenantId,
                    const domain::UserId& userId,
                    const std::string& roleId) override {
        members_.update(key(tenantId, roleId), [&](Members& m) { m.erase(userId); });
        send(false, tenantId, userId, roleId);
    }

private:
    using Members = std::set<domain::UserId>;

    std::shared_ptr<ports::output::IEventPublisher> publisher_;
    ThreadSafeMap<std::string, Members> members_;

    static std::string key(const domain::TenantId& tenantId, const std::string& roleId) {
        return tenantId + "/" + roleId;
    }

    void send(bool grant, const domain::TenantId& tenantId,
              const domain::UserId& userId, const std::string& roleId) {
        domain::RoleCommandEvent event(grant);
        event.tenantId = tenantId;
        event.userId = userId;
        event.roleId = roleId;
        event.reason = grant ? "purchase" : "expired";
        publisher_->publish(event.eventType, event.toJson());
        std::cout << "[EventingMemberDirectory] " << event.eventType << " " << roleId
                  << " for " << userId << " in " << tenantId << std::endl;
    }
};

} // namespace ledger::adapters::secondary
