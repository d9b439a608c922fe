#pragma once

#include "ports/output/IClock.hpp"

namespace ledger::adapters::secondary {

class SystemClock : public ports::output::IClock {
public:
    domain::Timestamp now() const override {
        return domain::Timestamp::now();
    }
};

} // namespace ledger::adapters::secondary
