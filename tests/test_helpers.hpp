// EN: Shared helpers for CK-Workflow unit tests
// FR: Utilitaires partagés pour les tests unitaires CK-Workflow

#pragma once

#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/time_utils.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace CKW::Testing {

// EN: Captures every log entry while alive and silences the console.
// FR: Capture chaque entrée de log pendant sa durée de vie et coupe la console.
class LogCapture {
public:
    explicit LogCapture(LogLevel level = LogLevel::DEBUG) {
        auto& logger = Logger::getInstance();
        previous_level_ = logger.getLogLevel();
        logger.setLogLevel(level);
        logger.setConsoleOutput(false);
        logger.setEntryObserver([this](const Logger::LogEntry& entry) {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_.push_back(entry);
        });
    }

    ~LogCapture() {
        auto& logger = Logger::getInstance();
        logger.setEntryObserver(nullptr);
        logger.setLogLevel(previous_level_);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::vector<Logger::LogEntry> entries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    size_t count(LogLevel level, const std::string& module = "") const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(), [&](const Logger::LogEntry& e) {
            return e.level == level && (module.empty() || e.module == module);
        }));
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<Logger::LogEntry> entries_;
    LogLevel previous_level_ = LogLevel::INFO;
};

// EN: Manually advanced clock for components taking an injectable clock.
// FR: Horloge avancée manuellement pour les composants à horloge injectable.
class ManualClock {
public:
    explicit ManualClock(TimePoint start = TimeUtils::fromUnixMicros(1700000000000000LL)) : now_(start) {}

    TimePoint now() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    template<typename Duration>
    void advance(Duration d) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += std::chrono::duration_cast<TimePoint::duration>(d);
    }

    auto callable() {
        return [this]() { return now(); };
    }

private:
    mutable std::mutex mutex_;
    TimePoint now_;
};

} // namespace CKW::Testing
