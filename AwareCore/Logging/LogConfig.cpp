//
// LogConfig.cpp
// AwareCore
//

#include "LogConfig.hpp"

#include <string>

namespace AWR {

namespace {

size_t Index(LogCategory category) {
    return static_cast<size_t>(category);
}

} // namespace

LogConfig& LogConfig::Shared() {
    static LogConfig instance;
    return instance;
}

LogConfig::LogConfig() {
    for (size_t i = 0; i < kCategoryCount; ++i) {
        levels_[i].store(DefaultLevel(static_cast<LogCategory>(i)));
    }
}

const char* LogConfig::CategoryName(LogCategory category) {
    switch (category) {
        case LogCategory::Core:      return "Core";
        case LogCategory::Session:   return "Session";
        case LogCategory::Hal:       return "Hal";
        case LogCategory::DataPath:  return "DataPath";
        case LogCategory::Transport: return "Transport";
        case LogCategory::Config:    return "Config";
        case LogCategory::kCount:    break;
    }
    return "Unknown";
}

// The follow-on queue is chatty; it stays quiet unless asked for.
uint8_t LogConfig::DefaultLevel(LogCategory category) {
    return category == LogCategory::Transport ? 0 : 1;
}

void LogConfig::Initialize(const Config::PropertyMap& properties) {
    if (initialized_.exchange(true)) {
        AWR_LOG(Config, "LogConfig already initialized, skipping");
        return;
    }

    for (size_t i = 0; i < kCategoryCount; ++i) {
        const auto category = static_cast<LogCategory>(i);
        const std::string key = std::string("Aware") + CategoryName(category) + "Verbosity";
        if (auto value = Config::FindProperty(properties, key)) {
            levels_[i].store(ClampLevel(*value), std::memory_order_relaxed);
        }
    }
    if (auto value = Config::FindProperty(properties, "AwareEnableHexDumps")) {
        enableHexDumps_.store(*value != 0, std::memory_order_relaxed);
    }

    AWR_LOG_INFO(Config,
                 "LogConfig initialized: Core=%u Session=%u Hal=%u DataPath=%u Transport=%u "
                 "Config=%u HexDumps=%d",
                 GetVerbosity(LogCategory::Core), GetVerbosity(LogCategory::Session),
                 GetVerbosity(LogCategory::Hal), GetVerbosity(LogCategory::DataPath),
                 GetVerbosity(LogCategory::Transport), GetVerbosity(LogCategory::Config),
                 IsHexDumpsEnabled());
}

uint8_t LogConfig::GetVerbosity(LogCategory category) const {
    if (category >= LogCategory::kCount) {
        return 0;
    }
    return levels_[Index(category)].load(std::memory_order_relaxed);
}

bool LogConfig::IsHexDumpsEnabled() const {
    return enableHexDumps_.load(std::memory_order_relaxed);
}

void LogConfig::SetVerbosity(LogCategory category, int64_t level) {
    if (category >= LogCategory::kCount) {
        return;
    }
    const uint8_t clamped = ClampLevel(level);
    levels_[Index(category)].store(clamped, std::memory_order_relaxed);
    AWR_LOG_INFO(Config, "%{public}s verbosity changed to %u", CategoryName(category), clamped);
}

void LogConfig::SetHexDumps(bool enable) {
    enableHexDumps_.store(enable, std::memory_order_relaxed);
    AWR_LOG_INFO(Config, "Hex dumps %{public}s", enable ? "enabled" : "disabled");
}

uint8_t LogConfig::ClampLevel(int64_t level) {
    if (level < 0) {
        return 0;
    }
    if (level > kMaxLogVerbosity) {
        return kMaxLogVerbosity;
    }
    return static_cast<uint8_t>(level);
}

} // namespace AWR
