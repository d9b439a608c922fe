#pragma once

#include "domain/Betting.hpp"
#include <string>
#include <vector>

namespace ledger::ports::input {

/**
 * @brief Тотализатор со ставками через escrow
 */
class IBettingService {
public:
    virtual ~IBettingService() = default;

    /// @throws InvalidState, если у тенанта уже есть активное событие
    virtual int64_t createEvent(const domain::TenantId& tenantId,
                                const std::string& title,
                                const std::string& symbol) = 0;

    virtual void addPlayer(const domain::TenantId& tenantId, const domain::UserId& playerId) = 0;
    /// @throws InvalidState, если на игрока уже есть ставки
    virtual void removePlayer(const domain::TenantId& tenantId, const domain::UserId& playerId) = 0;

    /// Ставка в целых единицах; @throws InvalidAmount, NotFound, InsufficientBalance
    virtual domain::Bet placeBet(const domain::TenantId& tenantId,
                                 const domain::UserId& bettorId,
                                 const domain::UserId& targetId,
                                 const domain::Amount& stake) = 0;

    virtual std::vector<domain::PlayerOdds> odds(const domain::TenantId& tenantId) = 0;

    /// @throws InvalidState, если на победителя нет ставок
    virtual domain::SettlementResult settle(const domain::TenantId& tenantId,
                                            const domain::UserId& winnerId) = 0;

    /// Вернуть все ставки и закрыть событие; @return число возвращённых ставок
    virtual int cancel(const domain::TenantId& tenantId) = 0;
};

} // namespace ledger::ports::input
