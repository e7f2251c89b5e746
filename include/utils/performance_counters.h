#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace fix_order_entry::utils
{
    /**
     * @brief Thread-safe counter for tracking numeric metrics
     *
     * Uses atomic operations so the worker and caller threads never contend.
     */
    class AtomicCounter
    {
    public:
        AtomicCounter() : value_(0) {}
        explicit AtomicCounter(uint64_t initial) : value_(initial) {}

        uint64_t increment() noexcept { return ++value_; }
        uint64_t add(uint64_t delta) noexcept { return value_ += delta; }

        uint64_t get() const noexcept { return value_.load(); }
        uint64_t reset() noexcept { return value_.exchange(0); }

    private:
        std::atomic<uint64_t> value_;
    };

    /**
     * @brief Central registry for named counters
     *
     * Singleton; counters are created on first use and live for the process.
     */
    class PerformanceCounters
    {
    public:
        static PerformanceCounters &getInstance();

        AtomicCounter &getCounter(const std::string &name);
        void incrementCounter(const std::string &name, uint64_t delta = 1);
        uint64_t getCounterValue(const std::string &name);

        // Reporting
        void printReport(const std::string &title = "Performance Counters") const;
        std::unordered_map<std::string, uint64_t> getAllCounters() const;

        void reset();

    private:
        PerformanceCounters() = default;

        mutable std::mutex counters_mutex_;
        std::unordered_map<std::string, std::unique_ptr<AtomicCounter>> counters_;
    };

// Convenience macros for easy metric tracking
#define PERF_COUNTER_INC(name) \
    fix_order_entry::utils::PerformanceCounters::getInstance().incrementCounter(name)

#define PERF_COUNTER_ADD(name, delta) \
    fix_order_entry::utils::PerformanceCounters::getInstance().incrementCounter(name, delta)

    // Predefined metric names for consistency
    namespace metrics
    {
        // Order metrics
        constexpr const char *ORDERS_BUILT = "orders.built";
        constexpr const char *ORDERS_REJECTED = "orders.rejected";

        // Network metrics
        constexpr const char *BYTES_SENT = "network.bytes_sent";
        constexpr const char *BYTES_RECEIVED = "network.bytes_received";
        constexpr const char *MESSAGES_SENT = "network.messages_sent";
        constexpr const char *MESSAGES_RECEIVED = "network.messages_received";
        constexpr const char *CONNECTION_REFUSED = "network.connection_refused";
        constexpr const char *CONNECTION_ERRORS = "network.connection_errors";
        constexpr const char *READ_TIMEOUTS = "network.read_timeouts";
        constexpr const char *PEER_CLOSED = "network.peer_closed";
    }

} // namespace fix_order_entry::utils
