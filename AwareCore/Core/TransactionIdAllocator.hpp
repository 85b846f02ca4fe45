#pragma once

#include <cstdint>

#include "../Common/Identifiers.hpp"

namespace AWR::Core {

// Hands out HAL transaction IDs. Only one command is in flight at a time, so a
// plain rotating counter is enough to correlate responses.
class TransactionIdAllocator {
public:
    TransactionIdAllocator() = default;

    void Reset() noexcept;

    /**
     * \brief Next transaction ID.
     *
     * Rotates 1, 2, ... 0xFFFF, 1, ... and never returns kTransactionIdIgnore,
     * which marks requests whose response nobody waits for.
     */
    TransactionId Next() noexcept;

    [[nodiscard]] TransactionId Last() const noexcept { return last_; }

private:
    TransactionId last_{kTransactionIdIgnore};
};

} // namespace AWR::Core
