#pragma once

#include <atomic>
#include <string>
#include <chrono>
#include <limits>
#include <unordered_map>
#include <vector>
#include <mutex>
#include <sstream>

namespace opgraph {
namespace server {

/**
 * Profiler - aggregates timings per named operation
 *
 * Names used by the engine: "resolve", "execute", "unit:<KIND>".
 */
class Profiler {
public:
    struct Stats {
        size_t count = 0;
        double totalMs = 0.0;
        double minMs = std::numeric_limits<double>::max();
        double maxMs = 0.0;

        double avgMs() const { return count > 0 ? totalMs / count : 0.0; }
    };

    static Profiler& instance();

    // Enable/disable profiling
    void setEnabled(bool enabled) { m_enabled = enabled; }
    bool isEnabled() const { return m_enabled; }

    // Start a timer, returns a timer ID
    size_t start(const std::string& name);

    // Stop a timer and record the duration
    double stop(size_t timerId);

    // Record a duration measured elsewhere
    void record(const std::string& name, double durationMs);

    // Get stats for a specific operation
    Stats getStats(const std::string& name) const;

    // Reset all stats
    void reset();

    // Format stats as string
    std::string formatStats() const;

private:
    Profiler() = default;
    Profiler(const Profiler&) = delete;
    Profiler& operator=(const Profiler&) = delete;

    void addSample(const std::string& name, double durationMs);

    struct Timer {
        std::string name;
        std::chrono::steady_clock::time_point start;
    };

    std::atomic<bool> m_enabled{true};
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Stats> m_stats;
    std::unordered_map<size_t, Timer> m_activeTimers;
    size_t m_nextTimerId = 0;
};

/**
 * RAII Scoped timer - automatically stops when destroyed
 */
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& name)
        : m_timerId(Profiler::instance().start(name))
    {}

    ~ScopedTimer() {
        stop();
    }

    double stop() {
        if (!m_stopped) {
            m_stopped = true;
            m_duration = Profiler::instance().stop(m_timerId);
        }
        return m_duration;
    }

    double duration() const { return m_duration; }

private:
    size_t m_timerId;
    bool m_stopped = false;
    double m_duration = 0.0;
};

// Convenience macros
#define PROFILE_CONCAT_INNER(a, b) a##b
#define PROFILE_CONCAT(a, b) PROFILE_CONCAT_INNER(a, b)
#define PROFILE_SCOPE(name) opgraph::server::ScopedTimer PROFILE_CONCAT(_profiler_, __LINE__)(name)

} // namespace server
} // namespace opgraph
