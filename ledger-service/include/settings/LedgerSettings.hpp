#pragma once

#include "domain/Amount.hpp"
#include "domain/VcEarning.hpp"
#include <cstdlib>
#include <iostream>
#include <string>

namespace ledger::settings {

/**
 * @brief Политики ядра
 *
 * ENV:
 * - LEDGER_MAX_RETRIES: повторы единицы работы при StorageConflict
 * - LEDGER_REFILL_QUANTUM: размер автопополнения казны (в целых единицах)
 * - LEDGER_MAX_REFILL_ROUNDS: сколько раз подряд можно пополнять казну для одной операции
 * - LEDGER_TZ_OFFSET_MINUTES: часовой пояс тенантов для дат и месяцев
 * - LEDGER_VC_FUNDING: treasury | mint
 */
class LedgerSettings {
public:
    LedgerSettings() {
        maxRetries_ = std::stoi(getEnvOrDefault("LEDGER_MAX_RETRIES", "5"));
        refillQuantum_ = domain::Amount::parse(getEnvOrDefault("LEDGER_REFILL_QUANTUM", "1000000000"));
        maxRefillRounds_ = std::stoi(getEnvOrDefault("LEDGER_MAX_REFILL_ROUNDS", "16"));
        tzOffsetMinutes_ = std::stoi(getEnvOrDefault("LEDGER_TZ_OFFSET_MINUTES", "540"));
        vcFunding_ = domain::parseVcFundingSource(getEnvOrDefault("LEDGER_VC_FUNDING", "treasury"));

        std::cout << "[LedgerSettings] retries=" << maxRetries_
                  << " refillQuantum=" << refillQuantum_
                  << " tzOffset=" << tzOffsetMinutes_
                  << " vcFunding=" << domain::toString(vcFunding_) << std::endl;
    }

    int getMaxRetries() const { return maxRetries_; }
    const domain::Amount& getRefillQuantum() const { return refillQuantum_; }
    int getMaxRefillRounds() const { return maxRefillRounds_; }
    int getTzOffsetMinutes() const { return tzOffsetMinutes_; }
    domain::VcFundingSource getVcFunding() const { return vcFunding_; }

    void setMaxRetries(int value) { maxRetries_ = value; }
    void setRefillQuantum(const domain::Amount& value) { refillQuantum_ = value; }
    void setVcFunding(domain::VcFundingSource value) { vcFunding_ = value; }

private:
    int maxRetries_;
    domain::Amount refillQuantum_;
    int maxRefillRounds_;
    int tzOffsetMinutes_;
    domain::VcFundingSource vcFunding_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace ledger::settings
