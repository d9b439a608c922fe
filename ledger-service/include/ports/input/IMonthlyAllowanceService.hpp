#pragma once

#include "domain/MonthlyAllowance.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledger::ports::input {

class IMonthlyAllowanceService {
public:
    virtual ~IMonthlyAllowanceService() = default;

    virtual int64_t configure(const domain::TenantId& tenantId,
                              const std::string& roleId,
                              const std::string& symbol,
                              const domain::Amount& amount,
                              bool enabled = true) = 0;
    virtual std::vector<domain::AllowanceConfig> listConfigs(const domain::TenantId& tenantId) = 0;
    virtual void remove(const domain::TenantId& tenantId, int64_t configId) = 0;

    /// Выплатить за период "YYYY-MM" всем участникам всех включённых ролей
    virtual domain::AllowanceRunSummary runMonth(const std::string& yearMonth) = 0;

    /// runMonth за текущий месяц, если сегодня день выплаты
    virtual std::optional<domain::AllowanceRunSummary> runIfPayday(const domain::Timestamp& now,
                                                                   int payday) = 0;

    virtual std::vector<domain::AllowanceRecord> history(const domain::TenantId& tenantId,
                                                         const std::string& yearMonth) = 0;
};

} // namespace ledger::ports::input
