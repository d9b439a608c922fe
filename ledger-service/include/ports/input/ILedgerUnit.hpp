#pragma once

#include "domain/Account.hpp"
#include "domain/Asset.hpp"
#include "domain/Transaction.hpp"
#include "domain/events/DomainEvent.hpp"
#include "ports/output/IStorage.hpp"
#include <memory>

namespace ledger::ports::input {

/**
 * @brief Атомарная единица работы с журналом
 *
 * Всё, что сделано через единицу, фиксируется целиком или не фиксируется
 * вообще. Перед фиксацией каждая открытая транзакция обязана сходиться
 * в ноль по каждому активу.
 *
 * Единица может быть выполнена повторно (конфликт изоляции, пополнение
 * казны), поэтому код внутри неё не должен иметь внешних побочных эффектов.
 */
class ILedgerUnit {
public:
    virtual ~ILedgerUnit() = default;

    virtual output::IStorageSession& session() = 0;
    virtual const domain::Timestamp& now() const = 0;

    /// @throws DuplicateTransaction, если (kind, idempotencyKey) уже использован
    virtual domain::TransactionId newTransaction(const domain::TransactionHeader& header) = 0;

    /**
     * @brief Добавить проводку в транзакцию, открытую этой единицей
     *
     * Сумма должна быть уже квантована до точности актива.
     * @throws InvalidAmount, InvalidState, AccountNotFound, AssetNotFound
     */
    virtual void postEntry(domain::TransactionId txId,
                           domain::AccountId accountId,
                           domain::AssetId assetId,
                           const domain::Amount& amount) = 0;

    /// Баланс с учётом проводок этой единицы
    virtual domain::Amount balanceOf(domain::AccountId accountId, domain::AssetId assetId) = 0;

    /**
     * @brief Заблокировать счёт и проверить balance >= amount
     *
     * Для treasury/burn/mint проверка не выполняется.
     * @throws InsufficientBalance
     */
    virtual void requireFunds(domain::AccountId accountId, domain::AssetId assetId,
                              const domain::Amount& amount) = 0;

    /**
     * @brief Убедиться, что казны хватает на списание
     *
     * Если не хватает, единица прерывается, казна пополняется отдельной
     * зафиксированной транзакцией и единица выполняется заново.
     */
    virtual void ensureTreasuryCovers(domain::AccountId treasuryId, domain::AssetId assetId,
                                      const domain::Amount& amount) = 0;

    virtual domain::Asset requireAsset(domain::AssetId assetId) = 0;
    virtual domain::Asset requireAsset(const domain::TenantId& tenantId, const std::string& symbol) = 0;
    virtual domain::Account requireAccount(domain::AccountId accountId) = 0;

    /// @throws AccountNotFound, если системные счета тенанта не созданы
    virtual domain::AccountId systemAccount(const domain::TenantId& tenantId, domain::AccountType type) = 0;

    /// get-or-create счёта участника в этой же единице
    virtual domain::AccountId userAccount(const domain::TenantId& tenantId, const domain::UserId& userId) = 0;

    /// Событие уйдёт подписчикам только после фиксации
    virtual void emit(std::unique_ptr<domain::DomainEvent> event) = 0;
};

} // namespace ledger::ports::input
