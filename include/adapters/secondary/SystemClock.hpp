#pragma once

#include "ports/output/IClock.hpp"

namespace penny::adapters::secondary {

/**
 * @brief Системные часы (UTC)
 */
class SystemClock : public ports::output::IClock {
public:
    domain::Timestamp now() const override {
        return domain::Timestamp::now();
    }
};

} // namespace penny::adapters::secondary
