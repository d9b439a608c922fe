#pragma once

#include "ports/input/ITransactionFactory.hpp"
#include "ports/input/ILedger.hpp"
#include "domain/LedgerErrors.hpp"
#include <iostream>
#include <map>
#include <memory>

namespace ledger::application {

/**
 * @brief Политика проведения экономических действий
 */
class TransactionFactory : public ports::input::ITransactionFactory {
public:
    explicit TransactionFactory(std::shared_ptr<ports::input::ILedger> ledger)
        : ledger_(std::move(ledger))
    {}

    ports::input::TransactionReceipt post(const ports::input::TransactionRequest& request) override {
        ports::input::TransactionReceipt receipt;
        try {
            ledger_->transact([&](ports::input::ILedgerUnit& unit) {
                receipt.transactionId = postWithin(unit, request);
            });
        } catch (const domain::DuplicateTransaction& e) {
            std::cout << "[TransactionFactory] Replayed " << request.header.kind
                      << " -> transaction " << e.existingId() << std::endl;
            receipt.transactionId = e.existingId();
            receipt.replayed = true;
        }
        return receipt;
    }

    /**
     * @brief Проведение внутри уже открытой единицы работы
     *
     * Используется подсистемами, которые пишут свои строки в той же единице.
     */
    static domain::TransactionId postWithin(ports::input::ILedgerUnit& unit,
                                            const ports::input::TransactionRequest& request) {
        auto txId = unit.newTransaction(request.header);

        std::map<domain::AccountId, domain::Amount> debits;
        for (const auto& p : request.postings) {
            if (p.amount.isNegative()) {
                debits[p.accountId] += -p.amount;
            }
        }
        for (const auto& [accountId, amount] : debits) {
            auto account = unit.requireAccount(accountId);
            if (account.type == domain::AccountType::TREASURY) {
                unit.ensureTreasuryCovers(accountId, request.assetId, amount);
            } else {
                unit.requireFunds(accountId, request.assetId, amount);
            }
        }

        for (const auto& p : request.postings) {
            unit.postEntry(txId, p.accountId, request.assetId, p.amount);
        }
        return txId;
    }

    ports::input::TransactionReceipt transfer(const domain::TenantId& tenantId,
                                              const domain::UserId& fromUser,
                                              const domain::UserId& toUser,
                                              const std::string& symbol,
                                              const domain::Amount& amount,
                                              const std::optional<std::string>& reference,
                                              const std::optional<std::string>& idempotencyKey) override {
        if (fromUser == toUser) {
            throw domain::InvalidState("Cannot transfer to self");
        }
        return postSimple(tenantId, symbol, amount, domain::RoundingMode::DOWN,
                          [&](ports::input::ILedgerUnit& unit, ports::input::TransactionRequest& request) {
                              request.header.kind = domain::kinds::TRANSFER;
                              request.header.creatorId = fromUser;
                              request.header.reference = reference;
                              request.header.idempotencyKey = idempotencyKey;
                              return std::make_pair(unit.userAccount(tenantId, fromUser),
                                                    unit.userAccount(tenantId, toUser));
                          });
    }

    ports::input::TransactionReceipt issue(const domain::TenantId& tenantId,
                                           const std::optional<domain::UserId>& creator,
                                           const domain::UserId& toUser,
                                           const std::string& symbol,
                                           const domain::Amount& amount,
                                           const std::optional<std::string>& idempotencyKey) override {
        return postSimple(tenantId, symbol, amount, domain::RoundingMode::HALF_EVEN,
                          [&](ports::input::ILedgerUnit& unit, ports::input::TransactionRequest& request) {
                              request.header.kind = domain::kinds::ISSUE;
                              request.header.creatorId = creator;
                              request.header.idempotencyKey = idempotencyKey;
                              return std::make_pair(unit.systemAccount(tenantId, domain::AccountType::TREASURY),
                                                    unit.userAccount(tenantId, toUser));
                          });
    }

    ports::input::TransactionReceipt burn(const domain::TenantId& tenantId,
                                          const domain::UserId& fromUser,
                                          const std::string& symbol,
                                          const domain::Amount& amount) override {
        return postSimple(tenantId, symbol, amount, domain::RoundingMode::DOWN,
                          [&](ports::input::ILedgerUnit& unit, ports::input::TransactionRequest& request) {
                              request.header.kind = domain::kinds::BURN;
                              request.header.creatorId = fromUser;
                              return std::make_pair(unit.userAccount(tenantId, fromUser),
                                                    unit.systemAccount(tenantId, domain::AccountType::BURN));
                          });
    }

private:
    std::shared_ptr<ports::input::ILedger> ledger_;

    /// from -> to одной суммой; resolve заполняет заголовок и возвращает (from, to)
    template <typename Resolve>
    ports::input::TransactionReceipt postSimple(const domain::TenantId& tenantId,
                                                const std::string& symbol,
                                                const domain::Amount& amount,
                                                domain::RoundingMode rounding,
                                                Resolve resolve) {
        ports::input::TransactionReceipt receipt;
        std::string kind;
        try {
            ledger_->transact([&](ports::input::ILedgerUnit& unit) {
                auto asset = unit.requireAsset(tenantId, symbol);
                auto quantized = amount.quantize(asset.decimals, rounding);
                if (!quantized.isPositive()) {
                    throw domain::InvalidAmount(amount.toString() + " is not positive at " +
                                                std::to_string(asset.decimals) + " decimals");
                }

                ports::input::TransactionRequest request;
                request.header.tenantId = tenantId;
                request.assetId = asset.id;
                auto [from, to] = resolve(unit, request);
                kind = request.header.kind;
                request.postings = {{from, -quantized}, {to, quantized}};

                receipt.transactionId = postWithin(unit, request);
            });
        } catch (const domain::DuplicateTransaction& e) {
            receipt.transactionId = e.existingId();
            receipt.replayed = true;
            return receipt;
        }

        std::cout << "[TransactionFactory] " << kind << " " << amount << " " << symbol
                  << " in tenant " << tenantId << " -> transaction " << receipt.transactionId << std::endl;
        return receipt;
    }
};

} // namespace ledger::application
