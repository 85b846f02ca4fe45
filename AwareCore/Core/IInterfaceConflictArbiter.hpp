#pragma once

#include <cstdint>
#include <string_view>

#include "../Session/ClientState.hpp"

namespace AWR::Core {

enum class ConflictDecision : uint8_t {
    kExecute,      // no conflict, run the attach now
    kWaitForUser,  // a prompt is pending; park the attach until it is answered
    kAbort,        // conflict cannot be resolved; fail the attach
};

[[nodiscard]] constexpr std::string_view ToString(ConflictDecision decision) noexcept {
    switch (decision) {
        case ConflictDecision::kExecute:     return "Execute";
        case ConflictDecision::kWaitForUser: return "WaitForUser";
        case ConflictDecision::kAbort:       return "Abort";
    }
    return "Unknown";
}

/**
 * @brief Decides whether bringing up the Aware interface may tear down another one.
 *
 * Consulted for every attach that is not an offload attach. A kWaitForUser decision
 * is later answered through AwareStateManager::ResolveInterfaceConflict().
 */
class IInterfaceConflictArbiter {
public:
    virtual ~IInterfaceConflictArbiter() = default;

    virtual ConflictDecision Decide(const Session::ClientIdentity& requestor) = 0;

    // The parked attach was dropped (aware went down, or it was replayed).
    virtual void Reset() = 0;
};

} // namespace AWR::Core
