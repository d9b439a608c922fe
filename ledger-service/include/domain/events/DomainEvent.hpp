#pragma once

#include "domain/Timestamp.hpp"
#include "utils/IdGenerator.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Базовый класс доменных событий
 *
 * Публикуются только после фиксации единицы работы;
 * eventType служит ключом маршрутизации.
 */
struct DomainEvent {
    std::string eventId;
    std::string eventType;
    Timestamp timestamp;

    explicit DomainEvent(const std::string& type)
        : eventId(utils::IdGenerator::uuid()), eventType(type), timestamp(Timestamp::now()) {}

    virtual ~DomainEvent() = default;

    virtual std::string toJson() const = 0;
};

} // namespace ledger::domain
