#include "PeerRegistry.hpp"

#include "../Logging/Logging.hpp"

namespace AWR::Session {

std::atomic<PeerId> PeerRegistry::nextPeerId_{PeerRegistry::kFirstPeerId};

PeerId PeerRegistry::GetPeerIdOrAddIfNew(InstanceId instanceId, const MacAddress& mac) {
    for (const auto& [peerId, record] : peers_) {
        if (record.instanceId == instanceId && record.mac == mac) {
            return peerId;
        }
    }

    const PeerId peerId = nextPeerId_.fetch_add(1, std::memory_order_relaxed);
    peers_.emplace(peerId, PeerRecord{instanceId, mac});
    AWR_LOG_PEER_DETAIL("PeerRegistry: new peerId=%d instanceId=%d", peerId, instanceId);
    return peerId;
}

PeerRecord* PeerRegistry::Find(PeerId peerId) {
    auto it = peers_.find(peerId);
    return it != peers_.end() ? &it->second : nullptr;
}

const PeerRecord* PeerRegistry::Find(PeerId peerId) const {
    auto it = peers_.find(peerId);
    return it != peers_.end() ? &it->second : nullptr;
}

std::optional<PeerId> PeerRegistry::RemoveFirstByInstanceId(InstanceId instanceId) {
    for (auto it = peers_.begin(); it != peers_.end(); ++it) {
        if (it->second.instanceId == instanceId) {
            const PeerId peerId = it->first;
            peers_.erase(it);
            return peerId;
        }
    }
    return std::nullopt;
}

std::vector<PeerId> PeerRegistry::PeerIds() const {
    std::vector<PeerId> ids;
    ids.reserve(peers_.size());
    for (const auto& [peerId, record] : peers_) {
        ids.push_back(peerId);
    }
    return ids;
}

void PeerRegistry::Clear() {
    peers_.clear();
}

void PeerRegistry::ResetPeerIdCounter(PeerId next) {
    nextPeerId_.store(next, std::memory_order_relaxed);
}

} // namespace AWR::Session
