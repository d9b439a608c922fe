#pragma once

#include "domain/Timestamp.hpp"

namespace ledger::ports::output {

class IClock {
public:
    virtual ~IClock() = default;
    virtual domain::Timestamp now() const = 0;
};

} // namespace ledger::ports::output
