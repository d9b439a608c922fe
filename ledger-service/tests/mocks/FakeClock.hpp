#pragma once

#include "ports/output/IClock.hpp"
#include <mutex>

namespace ledger::tests {

/**
 * @brief Часы, которые двигает тест
 */
class FakeClock : public ports::output::IClock {
public:
    explicit FakeClock(domain::Timestamp start = domain::Timestamp::fromEpochSeconds(1767225600))
        : now_(start) {}

    domain::Timestamp now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void set(const domain::Timestamp& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = value;
    }

    void advanceHours(int64_t hours) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = now_.addHours(hours);
    }

    void advanceDays(int64_t days) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = now_.addDays(days);
    }

private:
    mutable std::mutex mutex_;
    domain::Timestamp now_;
};

} // namespace ledger::tests
