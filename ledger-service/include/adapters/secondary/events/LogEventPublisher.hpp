#pragma once

#include "ports/output/IEventPublisher.hpp"
#include <iostream>
#include <mutex>

namespace ledger::adapters::secondary {

/**
 * @brief Публикация событий строками JSON в stdout
 *
 * Хост (бот гильдии) читает поток и исполняет role.grant / role.revoke.
 */
class LogEventPublisher : public ports::output::IEventPublisher {
public:
    void publish(const std::string& routingKey, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "[Event] " << routingKey << " " << message << std::endl;
    }

private:
    std::mutex mutex_;
};

} // namespace ledger::adapters::secondary
