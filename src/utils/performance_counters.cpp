#include "utils/performance_counters.h"
#include "utils/logger.h"
#include <algorithm>
#include <sstream>
#include <vector>

namespace fix_order_entry::utils
{
    PerformanceCounters &PerformanceCounters::getInstance()
    {
        static PerformanceCounters instance;
        return instance;
    }

    AtomicCounter &PerformanceCounters::getCounter(const std::string &name)
    {
        std::lock_guard<std::mutex> lock(counters_mutex_);
        auto it = counters_.find(name);
        if (it == counters_.end())
        {
            auto [inserted_it, success] = counters_.emplace(name, std::make_unique<AtomicCounter>());
            (void)success;
            return *inserted_it->second;
        }
        return *it->second;
    }

    void PerformanceCounters::incrementCounter(const std::string &name, uint64_t delta)
    {
        getCounter(name).add(delta);
    }

    uint64_t PerformanceCounters::getCounterValue(const std::string &name)
    {
        std::lock_guard<std::mutex> lock(counters_mutex_);
        auto it = counters_.find(name);
        return (it != counters_.end()) ? it->second->get() : 0;
    }

    std::unordered_map<std::string, uint64_t> PerformanceCounters::getAllCounters() const
    {
        std::lock_guard<std::mutex> lock(counters_mutex_);
        std::unordered_map<std::string, uint64_t> result;
        for (const auto &entry : counters_)
        {
            result[entry.first] = entry.second->get();
        }
        return result;
    }

    void PerformanceCounters::printReport(const std::string &title) const
    {
        auto counters = getAllCounters();

        std::vector<std::string> names;
        names.reserve(counters.size());
        for (const auto &entry : counters)
        {
            names.push_back(entry.first);
        }
        std::sort(names.begin(), names.end());

        std::ostringstream oss;
        oss << "=== " << title << " ===";
        for (const auto &name : names)
        {
            oss << "\n  " << name << ": " << counters[name];
        }
        LOG_INFO(oss.str());
    }

    void PerformanceCounters::reset()
    {
        std::lock_guard<std::mutex> lock(counters_mutex_);
        for (auto &entry : counters_)
        {
            entry.second->reset();
        }
    }

} // namespace fix_order_entry::utils
