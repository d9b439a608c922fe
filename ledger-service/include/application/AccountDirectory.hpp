#pragma once

#include "ports/input/IAccountDirectory.hpp"
#include "ports/input/ILedger.hpp"
#include "domain/LedgerErrors.hpp"
#include <memory>

namespace ledger::application {

/**
 * @brief Справочник счетов
 *
 * Создание - insert-or-ignore по уникальному имени и повторное чтение,
 * так что параллельные вызовы получают одну и ту же строку.
 */
class AccountDirectory : public ports::input::IAccountDirectory {
public:
    explicit AccountDirectory(std::shared_ptr<ports::input::ILedger> ledger)
        : ledger_(std::move(ledger))
    {}

    void ensureSystemAccounts(const domain::TenantId& tenantId) override {
        static const domain::AccountType systemTypes[] = {
            domain::AccountType::TREASURY,
            domain::AccountType::BURN,
            domain::AccountType::MINT,
            domain::AccountType::BANK,
            domain::AccountType::ESCROW
        };

        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            for (auto type : systemTypes) {
                domain::Account account;
                account.tenantId = tenantId;
                account.name = domain::Account::systemName(type, tenantId);
                account.type = type;
                unit.session().accounts().insertAccountIgnore(account);
            }
        });
    }

    domain::AccountId ensureUserAccount(const domain::TenantId& tenantId,
                                        const domain::UserId& userId) override {
        domain::AccountId id = 0;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            id = unit.userAccount(tenantId, userId);
        });
        return id;
    }

    domain::AccountId accountIdByName(const domain::TenantId& tenantId,
                                      const std::string& logicalName) override {
        domain::AccountType type;
        try {
            type = domain::parseAccountType(logicalName);
        } catch (const std::invalid_argument&) {
            throw domain::AccountNotFound(logicalName + " in tenant " + tenantId);
        }
        if (type == domain::AccountType::USER) {
            throw domain::AccountNotFound("user accounts are resolved by ensureUserAccount");
        }

        domain::AccountId id = 0;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            id = unit.systemAccount(tenantId, type);
        });
        return id;
    }

private:
    std::shared_ptr<ports::input::ILedger> ledger_;
};

} // namespace ledger::application
