#include "TransactionIdAllocator.hpp"

#include "../Logging/Logging.hpp"
#include "../Logging/LogConfig.hpp"

namespace AWR::Core {

void TransactionIdAllocator::Reset() noexcept {
    last_ = kTransactionIdIgnore;
}

TransactionId TransactionIdAllocator::Next() noexcept {
    auto next = static_cast<TransactionId>(last_ + 1);
    if (next == kTransactionIdIgnore) {
        next = static_cast<TransactionId>(kTransactionIdIgnore + 1);
        AWR_LOG_V3(Core, "TransactionIdAllocator: wrapped");
    }
    last_ = next;
    return next;
}

} // namespace AWR::Core
