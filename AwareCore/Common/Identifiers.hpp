#pragma once

#include <cstdint>

namespace AWR {

// Host-assigned identifiers. All are process-lifetime monotonic values.
using ClientId = int32_t;
using SessionId = int32_t;
using PeerId = int32_t;

// Hardware-assigned identifiers.
using PubSubId = uint8_t;
using InstanceId = int32_t;
using NdpId = int32_t;
using PairingId = int32_t;
using BootstrappingId = int32_t;

// 16-bit HAL transaction correlation ID. 0 is never issued.
using TransactionId = uint16_t;
inline constexpr TransactionId kTransactionIdIgnore = 0;

} // namespace AWR
