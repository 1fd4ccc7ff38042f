/**
 * Performance Counters - Lightweight instrumentation of the write path
 *
 * Usage:
 *   // Timed operations
 *   {
 *     CSVSPLIT_SCOPED_TIMER("buffer_cache_drain");
 *     // ... code to measure ...
 *   }
 *
 *   // Counter increments
 *   CSVSPLIT_INCREMENT_COUNTER("bytes_submitted", len);
 *
 *   // Print report
 *   PerformanceCounters::instance().print_report(std::cout);
 */

#ifndef CSVSPLIT_PERFORMANCE_COUNTERS_HPP
#define CSVSPLIT_PERFORMANCE_COUNTERS_HPP

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <mutex>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace csvsplit {

class PerformanceCounters {
public:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::microseconds;

    static PerformanceCounters& instance() {
        static PerformanceCounters inst;
        return inst;
    }

    void add_duration(const std::string& name, Duration elapsed) {
        std::lock_guard<std::mutex> lock(mutex_);
        durations_[name] += static_cast<uint64_t>(elapsed.count());
        counts_[name]++;
    }

    void increment(const std::string& name, uint64_t value = 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[name] += value;
    }

    void print_report(std::ostream& out) const {
        std::lock_guard<std::mutex> lock(mutex_);

        out << "\n" << std::string(78, '=') << "\n";
        out << "Write Path Counters\n";
        out << std::string(78, '=') << "\n";

        if (!durations_.empty()) {
            out << std::left << std::setw(40) << "Timer"
                << std::right << std::setw(12) << "Total (ms)"
                << std::setw(10) << "Calls"
                << std::setw(12) << "Avg (us)" << "\n";
            out << std::string(78, '-') << "\n";

            std::vector<std::pair<std::string, uint64_t>> sorted(durations_.begin(), durations_.end());
            std::sort(sorted.begin(), sorted.end(),
                      [](const auto& a, const auto& b) { return a.second > b.second; });

            for (const auto& [name, total_us] : sorted) {
                uint64_t calls = counts_.at(name);
                out << std::left << std::setw(40) << name
                    << std::right << std::setw(12) << std::fixed << std::setprecision(3)
                    << static_cast<double>(total_us) / 1000.0
                    << std::setw(10) << calls
                    << std::setw(12) << (calls > 0 ? total_us / calls : 0) << "\n";
            }
            out << "\n";
        }

        if (!counters_.empty()) {
            out << std::left << std::setw(50) << "Counter"
                << std::right << std::setw(20) << "Value" << "\n";
            out << std::string(78, '-') << "\n";

            std::vector<std::pair<std::string, uint64_t>> sorted(counters_.begin(), counters_.end());
            std::sort(sorted.begin(), sorted.end());

            for (const auto& [name, value] : sorted) {
                out << std::left << std::setw(50) << name
                    << std::right << std::setw(20) << value << "\n";
            }
            out << "\n";
        }
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        durations_.clear();
        counts_.clear();
        counters_.clear();
    }

    uint64_t get_counter(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counters_.find(name);
        return (it != counters_.end()) ? it->second : 0;
    }

    uint64_t get_count(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(name);
        return (it != counts_.end()) ? it->second : 0;
    }

private:
    PerformanceCounters() = default;

    PerformanceCounters(const PerformanceCounters&) = delete;
    PerformanceCounters& operator=(const PerformanceCounters&) = delete;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, uint64_t> durations_;  // microseconds
    std::unordered_map<std::string, uint64_t> counts_;     // number of calls
    std::unordered_map<std::string, uint64_t> counters_;
};

/**
 * RAII timer - records the time between construction and destruction.
 */
class ScopedTimer {
public:
    explicit ScopedTimer(const char* name)
        : name_(name), start_(PerformanceCounters::Clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::duration_cast<PerformanceCounters::Duration>(
            PerformanceCounters::Clock::now() - start_);
        PerformanceCounters::instance().add_duration(name_, elapsed);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    const char* name_;
    PerformanceCounters::Clock::time_point start_;
};

#define CSVSPLIT_CONCAT_INNER(a, b) a##b
#define CSVSPLIT_CONCAT(a, b) CSVSPLIT_CONCAT_INNER(a, b)

/**
 * Define CSVSPLIT_ENABLE_PERF_COUNTERS to enable, otherwise no-op
 */
#ifdef CSVSPLIT_ENABLE_PERF_COUNTERS
    #define CSVSPLIT_SCOPED_TIMER(name) ::csvsplit::ScopedTimer CSVSPLIT_CONCAT(perf_timer_, __LINE__)(name)
    #define CSVSPLIT_INCREMENT_COUNTER(name, value) ::csvsplit::PerformanceCounters::instance().increment(name, value)
#else
    #define CSVSPLIT_SCOPED_TIMER(name) do {} while (0)
    #define CSVSPLIT_INCREMENT_COUNTER(name, value) do {} while (0)
#endif

}  // namespace csvsplit

#endif  // CSVSPLIT_PERFORMANCE_COUNTERS_HPP
