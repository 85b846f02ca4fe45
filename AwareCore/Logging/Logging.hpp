#pragma once

#include <os/log.h>
#include <atomic>
#include <chrono>
#include <cstdint>

// Compile-time detail switches for the two chattiest paths.
#ifndef AWR_DEBUG_SEND_QUEUE
#define AWR_DEBUG_SEND_QUEUE 0
#endif

#ifndef AWR_DEBUG_PEERS
#define AWR_DEBUG_PEERS 1
#endif

namespace AWR {

// One unified-log category per subsystem. Each has its own runtime verbosity.
enum class LogCategory : uint8_t {
    Core,       // command dispatch and the dispatch state machine
    Session,    // clients, discovery sessions, peers, pairing, bootstrapping
    Hal,        // interface lifetime and HAL plumbing
    DataPath,   // data interfaces and NDPs
    Transport,  // follow-on message queue
    Config,     // configuration, capabilities, properties
    kCount,
};

// 0 always, 1 one-line summaries, 2 bookkeeping, 3 every command and payload.
inline constexpr uint8_t kMaxLogVerbosity = 3;

} // namespace AWR

namespace AWR::Logging {
os_log_t Core();
os_log_t Session();
os_log_t Hal();
os_log_t DataPath();
os_log_t Transport();
os_log_t Config();
} // namespace AWR::Logging

namespace AWR::LogDetail {
inline uint64_t NowNs() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count());
}

// Per call site throttle state for AWR_LOG_RL.
struct RlState {
    std::atomic<uint64_t> last_ns{0};
    std::atomic<uint64_t> suppressed{0};
};
} // namespace AWR::LogDetail

#define AWR_LOG(cat, fmt, ...) \
    os_log(AWR::Logging::cat(), "[%{public}s] " fmt, #cat, ##__VA_ARGS__)

#define AWR_LOG_TYPE(cat, os_type, fmt, ...) \
    os_log_with_type(AWR::Logging::cat(), os_type, "[%{public}s] " fmt, #cat, ##__VA_ARGS__)

#define AWR_LOG_INFO(cat, fmt, ...)  AWR_LOG_TYPE(cat, OS_LOG_TYPE_INFO,  fmt, ##__VA_ARGS__)
#define AWR_LOG_ERROR(cat, fmt, ...) AWR_LOG_TYPE(cat, OS_LOG_TYPE_ERROR, fmt, ##__VA_ARGS__)
#define AWR_LOG_FAULT(cat, fmt, ...) AWR_LOG_TYPE(cat, OS_LOG_TYPE_FAULT, fmt, ##__VA_ARGS__)

// At most one line per `interval_ms` for `key`; the next line reports how many were dropped.
#define AWR_LOG_RL(cat, key, interval_ms, os_type, fmt, ...)                                   \
    do {                                                                                        \
        static AWR::LogDetail::RlState _s;                                                      \
        const uint64_t _now = AWR::LogDetail::NowNs();                                          \
        const uint64_t _intv = (uint64_t)(interval_ms) * 1000000ull;                            \
        uint64_t _last = _s.last_ns.load(std::memory_order_relaxed);                            \
        if (_now - _last >= _intv || _last == 0) {                                              \
            _s.last_ns.store(_now, std::memory_order_relaxed);                                  \
            const uint64_t _lost = _s.suppressed.exchange(0, std::memory_order_relaxed);        \
            os_log_with_type(AWR::Logging::cat(), os_type,                                      \
                "[%{public}s][%{public}s] " fmt " (suppressed=%llu)", #cat, key,                \
                ##__VA_ARGS__, (unsigned long long)_lost);                                      \
        } else {                                                                                \
            _s.suppressed.fetch_add(1, std::memory_order_relaxed);                              \
        }                                                                                       \
    } while (0)

#ifndef __FILE_NAME__
#define __FILE_NAME__ __FILE__
#endif

// Command dispatch line in k=v form, correlated by transaction ID.
#define AWR_LOG_KV(cat, cmdName, txid, fmt, ...)                                               \
    os_log(AWR::Logging::cat(), "[%{public}s] %{public}s:%d cmd=%{public}s txid=%u " fmt,      \
           #cat, __FILE_NAME__, __LINE__, cmdName, (unsigned)(txid), ##__VA_ARGS__)

#if AWR_DEBUG_SEND_QUEUE
#define AWR_LOG_SEND_QUEUE(fmt, ...) AWR_LOG_TYPE(Transport, OS_LOG_TYPE_DEBUG, fmt, ##__VA_ARGS__)
#else
#define AWR_LOG_SEND_QUEUE(fmt, ...)
#endif

#if AWR_DEBUG_PEERS
#define AWR_LOG_PEER_DETAIL(fmt, ...) AWR_LOG_TYPE(Session, OS_LOG_TYPE_DEBUG, fmt, ##__VA_ARGS__)
#else
#define AWR_LOG_PEER_DETAIL(fmt, ...)
#endif

// ============================================================================
// Verbosity-gated logging
// ============================================================================
//
//   AWR_LOG_V0(Core, "Command timed out");         always
//   AWR_LOG_V1(Core, "Connect clientId=%d", id);   one-line summaries (default)
//   AWR_LOG_V2(DataPath, "CreateAllInterfaces");   bookkeeping and transitions
//   AWR_LOG_V3(Core, "Dispatch txid=%u", txid);    every dispatched command
//   AWR_LOG_HEX(Transport, "len=%zu", n);          payload traces
//
// Levels come from the Aware<Category>Verbosity properties (see LogConfig).

namespace AWR {
class LogConfig;
}

#define AWR_LOG_AT(level, category, fmt, ...)                                                  \
    do {                                                                                        \
        if (AWR::LogConfig::Shared().GetVerbosity(AWR::LogCategory::category) >= (level)) {    \
            AWR_LOG(category, fmt, ##__VA_ARGS__);                                              \
        }                                                                                       \
    } while (0)

#define AWR_LOG_V0(category, fmt, ...) AWR_LOG(category, fmt, ##__VA_ARGS__)
#define AWR_LOG_V1(category, fmt, ...) AWR_LOG_AT(1, category, fmt, ##__VA_ARGS__)
#define AWR_LOG_V2(category, fmt, ...) AWR_LOG_AT(2, category, fmt, ##__VA_ARGS__)
#define AWR_LOG_V3(category, fmt, ...) AWR_LOG_AT(3, category, fmt, ##__VA_ARGS__)

// Payload traces: the hex-dump switch, or the category at its highest level.
#define AWR_LOG_HEX(category, fmt, ...)                                                        \
    do {                                                                                        \
        if (AWR::LogConfig::Shared().IsHexDumpsEnabled() ||                                     \
            AWR::LogConfig::Shared().GetVerbosity(AWR::LogCategory::category) >=                \
                AWR::kMaxLogVerbosity) {                                                        \
            AWR_LOG(category, fmt, ##__VA_ARGS__);                                              \
        }                                                                                       \
    } while (0)
