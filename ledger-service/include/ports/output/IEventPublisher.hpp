#pragma once

#include <string>

namespace ledger::ports::output {

/**
 * @brief Публикация доменных событий
 *
 * Реализуется LogEventPublisher.
 */
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    /**
     * @param routingKey Тип события (например, "transaction.committed")
     * @param message JSON-сообщение
     */
    virtual void publish(const std::string& routingKey, const std::string& message) = 0;
};

} // namespace ledger::ports::output
