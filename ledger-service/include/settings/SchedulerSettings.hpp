#pragma once

#include <chrono>
#include <cstdlib>
#include <string>

namespace ledger::settings {

/**
 * @brief Интервалы фоновых задач
 */
class SchedulerSettings {
public:
    SchedulerSettings() {
        roleExpiryInterval_ = seconds("LEDGER_ROLE_EXPIRY_INTERVAL_SEC", "300");
        allowanceInterval_ = seconds("LEDGER_ALLOWANCE_INTERVAL_SEC", "3600");
        vcTickInterval_ = seconds("LEDGER_VC_TICK_INTERVAL_SEC", "60");
        vcCleanupInterval_ = seconds("LEDGER_VC_CLEANUP_INTERVAL_SEC", "86400");
        allowancePayday_ = std::stoi(getEnvOrDefault("LEDGER_ALLOWANCE_PAYDAY", "28"));
        vcRetentionDays_ = std::stoi(getEnvOrDefault("LEDGER_VC_RETENTION_DAYS", "7"));
        expiryBatch_ = std::stoi(getEnvOrDefault("LEDGER_EXPIRY_BATCH", "100"));
    }

    std::chrono::milliseconds getRoleExpiryInterval() const { return roleExpiryInterval_; }
    std::chrono::milliseconds getAllowanceInterval() const { return allowanceInterval_; }
    std::chrono::milliseconds getVcTickInterval() const { return vcTickInterval_; }
    std::chrono::milliseconds getVcCleanupInterval() const { return vcCleanupInterval_; }
    int getAllowancePayday() const { return allowancePayday_; }
    int getVcRetentionDays() const { return vcRetentionDays_; }
    int getExpiryBatch() const { return expiryBatch_; }

private:
    std::chrono::milliseconds roleExpiryInterval_;
    std::chrono::milliseconds allowanceInterval_;
    std::chrono::milliseconds vcTickInterval_;
    std::chrono::milliseconds vcCleanupInterval_;
    int allowancePayday_;
    int vcRetentionDays_;
    int expiryBatch_;

    static std::chrono::milliseconds seconds(const char* name, const char* defaultValue) {
        return std::chrono::seconds(std::stoll(getEnvOrDefault(name, defaultValue)));
    }

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace ledger::settings
