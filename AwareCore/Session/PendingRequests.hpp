#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "../Common/Identifiers.hpp"
#include "../Hal/HalTypes.hpp"

namespace AWR::Session {

struct PairingRecord {
    ClientId clientId{0};
    SessionId sessionId{0};
    PeerId peerId{0};
    std::string alias;
    Hal::PairingRequestType requestType{Hal::PairingRequestType::kSetup};
};

struct BootstrappingRecord {
    ClientId clientId{0};
    SessionId sessionId{0};
    PeerId peerId{0};
    uint32_t method{0};
    // Set on the re-initiation that follows a COMEBACK response.
    bool isComeback{false};
};

/**
 * \brief Requests accepted by the HAL that still wait for their confirm.
 *
 * Keyed by the hardware-assigned request ID. Each record is consumed exactly once,
 * either by the confirm notification or by the synthesized timeout failure.
 */
template <typename Key, typename Record>
class PendingRequestTable {
public:
    void Add(const Key& key, Record record) { records_.insert_or_assign(key, std::move(record)); }

    std::optional<Record> Take(const Key& key) {
        auto it = records_.find(key);
        if (it == records_.end()) {
            return std::nullopt;
        }
        Record record = std::move(it->second);
        records_.erase(it);
        return record;
    }

    [[nodiscard]] const Record* Find(const Key& key) const {
        auto it = records_.find(key);
        return it == records_.end() ? nullptr : &it->second;
    }

    [[nodiscard]] size_t Size() const noexcept { return records_.size(); }
    void Clear() { records_.clear(); }

private:
    std::map<Key, Record> records_;
};

using PairingRequests = PendingRequestTable<PairingId, PairingRecord>;
using BootstrappingRequests = PendingRequestTable<BootstrappingId, BootstrappingRecord>;

} // namespace AWR::Session
