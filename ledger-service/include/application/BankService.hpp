#pragma once

#include "ports/input/IBankService.hpp"
#include "ports/input/ILedger.hpp"
#include "application/TransactionFactory.hpp"
#include "domain/LedgerErrors.hpp"
#include <iostream>
#include <memory>

namespace ledger::application {

/**
 * @brief Банк: вклады лежат на системном счёте bank:{tenant}
 *
 * Проводки и строка вклада пишутся в одной единице работы,
 * поэтому сумма вкладов всегда равна балансу счёта bank.
 */
class BankService : public ports::input::IBankService {
public:
    explicit BankService(std::shared_ptr<ports::input::ILedger> ledger)
        : ledger_(std::move(ledger))
    {}

    domain::BankTransaction deposit(const domain::TenantId& tenantId,
                                    const domain::UserId& userId,
                                    const std::string& symbol,
                                    const domain::Amount& amount) override {
        return book(tenantId, userId, symbol, amount, domain::BankOperation::DEPOSIT);
    }

    domain::BankTransaction withdraw(const domain::TenantId& tenantId,
                                     const domain::UserId& userId,
                                     const std::string& symbol,
                                     const domain::Amount& amount) override {
        return book(tenantId, userId, symbol, amount, domain::BankOperation::WITHDRAW);
    }

    domain::Amount balance(const domain::TenantId& tenantId,
                           const domain::UserId& userId,
                           const std::string& symbol) override {
        domain::Amount result;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            auto asset = unit.requireAsset(tenantId, symbol);
            auto account = unit.session().bank().findBankAccount(tenantId, userId, asset.id);
            result = account ? account->balance : domain::Amount();
        });
        return result;
    }

    std::vector<domain::BankTransaction> history(const domain::TenantId& tenantId,
                                                 const domain::UserId& userId,
                                                 const std::string& symbol,
                                                 int limit) override {
        std::vector<domain::BankTransaction> result;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            auto asset = unit.requireAsset(tenantId, symbol);
            result = unit.session().bank().listBankTransactions(tenantId, userId, asset.id, limit);
        });
        return result;
    }

    domain::BankReconciliation reconcile(const domain::TenantId& tenantId,
                                         const std::string& symbol) override {
        domain::BankReconciliation result;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            auto asset = unit.requireAsset(tenantId, symbol);
            auto bankId = unit.systemAccount(tenantId, domain::AccountType::BANK);
            result.assetId = asset.id;
            result.ledgerBalance = unit.balanceOf(bankId, asset.id);
            result.depositsTotal = unit.session().bank().totalBankDeposits(tenantId, asset.id);
        });

        if (!result.balanced()) {
            std::cerr << "[BankService] Reconciliation failed for " << symbol << " in " << tenantId
                      << ": ledger " << result.ledgerBalance << " vs deposits "
                      << result.depositsTotal << std::endl;
        }
        return result;
    }

private:
    std::shared_ptr<ports::input::ILedger> ledger_;

    domain::BankTransaction book(const domain::TenantId& tenantId,
                                 const domain::UserId& userId,
                                 const std::string& symbol,
                                 const domain::Amount& amount,
                                 domain::BankOperation operation) {
        const bool isDeposit = operation == domain::BankOperation::DEPOSIT;
        domain::BankTransaction record;

        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            auto asset = unit.requireAsset(tenantId, symbol);
            // Округление вниз: снять больше, чем лежит после округления, нельзя
            auto quantized = amount.quantize(asset.decimals, domain::RoundingMode::DOWN);
            if (!quantized.isPositive()) {
                throw domain::InvalidAmount(amount.toString() + " is not positive at " +
                                            std::to_string(asset.decimals) + " decimals");
            }

            auto walletId = unit.userAccount(tenantId, userId);
            auto bankId = unit.systemAccount(tenantId, domain::AccountType::BANK);

            auto savings = unit.session().bank().findBankAccount(tenantId, userId, asset.id);
            domain::BankAccount account;
            if (savings) {
                account = *savings;
            } else {
                account.tenantId = tenantId;
                account.userId = userId;
                account.assetId = asset.id;
            }
            if (!isDeposit && account.balance < quantized) {
                throw domain::InsufficientBalance(bankId, account.balance, quantized);
            }

            ports::input::TransactionRequest request;
            request.header.tenantId = tenantId;
            request.header.kind = isDeposit ? domain::kinds::BANK_DEPOSIT : domain::kinds::BANK_WITHDRAW;
            request.header.creatorId = userId;
            request.assetId = asset.id;
            if (isDeposit) {
                request.postings = {{walletId, -quantized}, {bankId, quantized}};
            } else {
                request.postings = {{bankId, -quantized}, {walletId, quantized}};
            }
            auto txId = TransactionFactory::postWithin(unit, request);

            account.balance = isDeposit ? account.balance + quantized : account.balance - quantized;
            account.updatedAt = unit.now();
            unit.session().bank().saveBankAccount(account);

            record = domain::BankTransaction();
            record.tenantId = tenantId;
            record.userId = userId;
            record.assetId = asset.id;
            record.operation = operation;
            record.amount = quantized;
            record.balanceAfter = account.balance;
            record.transactionId = txId;
            record.createdAt = unit.now();
            record.id = unit.session().bank().insertBankTransaction(record);
        });

        std::cout << "[BankService] " << domain::toString(operation) << " " << record.amount << " "
                  << symbol << " for " << userId << " in " << tenantId
                  << ", savings " << record.balanceAfter << std::endl;
        return record;
    }
};

} // namespace ledger::application
