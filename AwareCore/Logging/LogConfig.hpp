//
// LogConfig.hpp
// AwareCore
//
// Per-category log verbosity, read from service properties
//

#ifndef AWR_LOGGING_LOGCONFIG_HPP
#define AWR_LOGGING_LOGCONFIG_HPP

#include <stdint.h>
#include <array>
#include <atomic>

#include "../Config/PropertyMap.hpp"
#include "Logging.hpp"

namespace AWR {

/**
 * @brief Runtime verbosity per log category
 *
 * Each LogCategory reads its level (0-3) from Aware<Category>Verbosity, e.g.
 * AwareCoreVerbosity or AwareTransportVerbosity. AwareEnableHexDumps forces
 * payload traces on regardless of level.
 *
 * Thread-safe singleton; levels may change at runtime.
 */
class LogConfig {
public:
    static LogConfig& Shared();

    /**
     * @brief Initialize from service properties
     *
     * Must be called once before the event loop starts. Later calls are ignored.
     */
    void Initialize(const Config::PropertyMap& properties);

    uint8_t GetVerbosity(LogCategory category) const;
    bool IsHexDumpsEnabled() const;

    // Out of range levels are clamped to kMaxLogVerbosity.
    void SetVerbosity(LogCategory category, int64_t level);
    void SetHexDumps(bool enable);

    static const char* CategoryName(LogCategory category);

private:
    LogConfig();
    ~LogConfig() = default;

    LogConfig(const LogConfig&) = delete;
    LogConfig& operator=(const LogConfig&) = delete;

    static uint8_t DefaultLevel(LogCategory category);
    static uint8_t ClampLevel(int64_t level);

    static constexpr size_t kCategoryCount = static_cast<size_t>(LogCategory::kCount);

    std::array<std::atomic<uint8_t>, kCategoryCount> levels_;
    std::atomic<bool> enableHexDumps_{false};
    std::atomic<bool> initialized_{false};
};

} // namespace AWR

#endif // AWR_LOGGING_LOGCONFIG_HPP
