#pragma once

#include <atomic>
#include <map>
#include <optional>
#include <vector>

#include "../Common/Identifiers.hpp"
#include "../Common/MacAddress.hpp"

namespace AWR::Session {

struct PeerRecord {
    InstanceId instanceId{0};
    MacAddress mac{};
};

// Per-session map of peer handles to (instance ID, MAC) pairs.
// Handles come from one process-wide counter so they are never reused across sessions.
class PeerRegistry {
public:
    static constexpr PeerId kFirstPeerId = 100;

    PeerRegistry() = default;
    ~PeerRegistry() = default;

    // Existing handle only when both instance ID and MAC match; otherwise a new one.
    PeerId GetPeerIdOrAddIfNew(InstanceId instanceId, const MacAddress& mac);

    PeerRecord* Find(PeerId peerId);
    const PeerRecord* Find(PeerId peerId) const;

    // Removes the first peer (lowest handle) with this instance ID.
    std::optional<PeerId> RemoveFirstByInstanceId(InstanceId instanceId);

    [[nodiscard]] std::vector<PeerId> PeerIds() const;
    [[nodiscard]] size_t Size() const { return peers_.size(); }
    void Clear();

    // Host tests only: restart the global handle counter.
    static void ResetPeerIdCounter(PeerId next = kFirstPeerId);

private:
    std::map<PeerId, PeerRecord> peers_;

    static std::atomic<PeerId> nextPeerId_;
};

} // namespace AWR::Session
