#pragma once

#include "DomainEvent.hpp"
#include "domain/Transaction.hpp"
#include <vector>

namespace ledger::domain {

/**
 * @brief Событие: транзакция зафиксирована вместе с проводками
 */
struct TransactionCommittedEvent : public DomainEvent {
    TransactionId transactionId = 0;
    TransactionHeader header;
    std::vector<LedgerEntry> entries;

    TransactionCommittedEvent() : DomainEvent("transaction.committed") {}

    std::string toJson() const override;
};

} // namespace ledger::domain
